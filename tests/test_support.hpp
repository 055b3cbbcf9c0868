#pragma once

#include <stencil/git.hpp>
#include <stencil/http.hpp>
#include <stencil/log.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

// Fresh directory under /tmp, removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = fs::temp_directory_path() /
                ("stencil_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline std::string descriptor_json(const std::string& name,
                                   const std::string& project_type,
                                   const std::string& version = "1.0.0") {
    return "{\"name\": \"" + name + "\", \"version\": \"" + version +
           "\", \"project_type\": \"" + project_type + "\"}";
}

// <root>/<name>/template.json plus one content file
inline fs::path write_template(const fs::path& root, const std::string& name,
                               const std::string& project_type,
                               const std::string& version = "1.0.0") {
    fs::path dir = root / name;
    write_file(dir / "template.json", descriptor_json(name, project_type, version));
    write_file(dir / "README.md", "# " + name + "\n");
    return dir;
}

// gzip'd tarball of the contents of `dir`, built with the system tar
inline std::string make_tarball(const fs::path& dir, const fs::path& scratch) {
    fs::path out = scratch / "bundle.tar.gz";
    auto r = stencil::run_command({"tar", "-czf", out.string(), "-C", dir.string(), "."});
    if (r.is_err() || r.value().exit_code != 0) return "";
    return read_file(out);
}

// One ustar member: a regular file (type '0') or a hard link (type '1') to `link`
inline std::string tar_member(const std::string& name, const std::string& content,
                              char type = '0', const std::string& link = "") {
    std::string header(512, '\0');
    auto put = [&header](size_t offset, size_t width, const std::string& value) {
        header.replace(offset, std::min(width, value.size()), value.substr(0, width));
    };
    auto octal = [](unsigned long long v, int digits) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%0*llo", digits, v);
        return std::string(buf);
    };

    put(0, 100, name);
    put(100, 8, octal(0644, 7));
    put(108, 8, octal(0, 7));
    put(116, 8, octal(0, 7));
    put(124, 12, octal(content.size(), 11));
    put(136, 12, octal(1700000000, 11));
    put(148, 8, std::string(8, ' '));
    header[156] = type;
    put(157, 100, link);
    put(257, 6, std::string("ustar", 6));
    put(263, 2, "00");

    unsigned sum = 0;
    for (unsigned char c : header) sum += c;
    put(148, 8, octal(sum, 6) + std::string(1, '\0') + " ");

    std::string out = header + content;
    out.append((512 - content.size() % 512) % 512, '\0');
    return out;
}

// Uncompressed tar from ustar members
inline std::string tar_archive(const std::vector<std::string>& members) {
    std::string out;
    for (const auto& m : members) out += m;
    out.append(1024, '\0');
    return out;
}

inline bool have_tool(const std::string& tool) {
    auto r = stencil::run_command({"sh", "-c", "command -v " + tool});
    return r.is_ok() && r.value().exit_code == 0;
}

// Collects log records for the lifetime of the object
class LogCapture {
public:
    explicit LogCapture(stencil::log::Level level = stencil::log::Trace)
        : saved_level_(stencil::log::get_level()) {
        stencil::log::set_level(level);
        stencil::log::set_sink([this](stencil::log::Level lvl, const std::string& msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.emplace_back(lvl, msg);
        });
    }
    ~LogCapture() {
        stencil::log::set_sink({});
        stencil::log::set_level(saved_level_);
    }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::pair<stencil::log::Level, std::string>> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t count(stencil::log::Level lvl, const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : records_) {
            if (r.first == lvl && r.second.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

private:
    stencil::log::Level saved_level_;
    mutable std::mutex mutex_;
    std::vector<std::pair<stencil::log::Level, std::string>> records_;
};

// Canned responses keyed by URL; unknown URLs fail like an unreachable host
class FakeHttpClient : public stencil::HttpClient {
public:
    struct Request {
        std::string url;
        stencil::HttpHeaders headers;
        std::optional<stencil::HttpAuth> auth;
    };

    void respond(const std::string& url, int status, std::string body) {
        responses_[url] = stencil::HttpResponse{status, std::move(body)};
    }

    stencil::Result<stencil::HttpResponse> get(const std::string& url,
                                               const stencil::HttpHeaders& headers,
                                               const std::optional<stencil::HttpAuth>& auth) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({url, headers, auth});
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            return stencil::StencilError{stencil::StencilError::SourceUnavailable,
                "could not resolve host for " + url};
        }
        return stencil::Result<stencil::HttpResponse>::ok(it->second);
    }

    size_t count(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.url == url) ++n;
        }
        return n;
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, stencil::HttpResponse> responses_;
    std::vector<Request> requests_;
};
