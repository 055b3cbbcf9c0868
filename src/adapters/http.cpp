#include <stencil/adapters/http.hpp>
#include <stencil/archive.hpp>
#include <stencil/git.hpp>
#include <stencil/log.hpp>
#include <stencil/sha256.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace stencil {

static std::string read_marker(const fs::path& dir) {
    std::ifstream in(dir / kSourceMarker);
    if (!in.is_open()) return "";
    std::string line;
    std::getline(in, line);
    return line;
}

static Status write_marker(const fs::path& dir, const std::string& value) {
    std::ofstream out(dir / kSourceMarker);
    if (!out.is_open()) {
        return StencilError{StencilError::IO,
            "cannot write " + (dir / kSourceMarker).string()};
    }
    out << value << "\n";
    return ok_status();
}

HttpAdapter::HttpAdapter(std::string cache_dir, std::shared_ptr<HttpClient> client)
    : cache_dir_(std::move(cache_dir)), client_(std::move(client)) {}

std::string HttpAdapter::extract_path(const HttpSource& source) const {
    std::string suffix = "latest";
    if (source.checksum) {
        auto parsed = parse_checksum(*source.checksum);
        if (parsed.is_ok()) suffix = parsed.value().substr(0, 16);
    }
    return (fs::path(cache_dir_) / "http" /
            (sha256_hex(source.url).substr(0, 16) + "-" + suffix)).string();
}

Result<std::string> HttpAdapter::materialize(const HttpSource& source) {
    std::optional<std::string> expected;
    if (source.checksum) {
        auto parsed = parse_checksum(*source.checksum);
        if (parsed.is_err()) return std::move(parsed).error();
        expected = std::move(parsed).value();
    }

    std::string dir = extract_path(source);
    auto guard = locks_.lock(dir);

    std::error_code ec;
    if (expected && fs::is_directory(dir, ec) && read_marker(dir) == *expected) {
        stencil::log::debug("reusing verified archive %s", dir.c_str());
        return Result<std::string>::ok(archive_root(dir).string());
    }

    stencil::log::info("downloading %s", redact_url(source.url).c_str());
    auto response = client_->get(source.url, {}, source.auth);
    if (response.is_err()) return std::move(response).error();
    if (!response.value().ok()) {
        return StencilError{StencilError::SourceUnavailable,
            "GET " + redact_url(source.url) + " returned HTTP " +
            std::to_string(response.value().status_code)};
    }

    const std::string& body = response.value().body;
    std::string actual = sha256_hex(body);
    if (expected && actual != *expected) {
        return StencilError{StencilError::Integrity,
            "checksum mismatch for " + redact_url(source.url) +
            ": expected " + *expected + ", got " + actual,
            "the archive changed upstream or was corrupted in transit"};
    }

    fs::create_directories(fs::path(dir).parent_path(), ec);
    auto staging = make_staging_dir(dir);
    if (staging.is_err()) return std::move(staging).error();

    auto extracted = extract_archive(body, staging.value());
    if (extracted.is_ok()) extracted = write_marker(staging.value(), actual);
    if (extracted.is_err()) {
        fs::remove_all(staging.value(), ec);
        return std::move(extracted).error();
    }
    STENCIL_TRY(commit_staging_dir(staging.value(), dir));

    return Result<std::string>::ok(archive_root(dir).string());
}

static Result<const HttpSource*> as_http(const TemplateSource& source) {
    const auto* http = std::get_if<HttpSource>(&source);
    if (!http) {
        return StencilError{StencilError::InvalidArg,
            "http adapter given a " +
            std::string(source_kind_name(source_kind(source))) + " source"};
    }
    return Result<const HttpSource*>::ok(http);
}

Result<std::vector<TemplateMetadata>> HttpAdapter::fetch_list(const TemplateSource& source) {
    auto http = as_http(source);
    if (http.is_err()) return std::move(http).error();
    return list_from_root(materialize(*http.value()));
}

Result<FetchedTemplate> HttpAdapter::fetch_one(const TemplateSource& source,
                                               const std::string& template_name) {
    auto http = as_http(source);
    if (http.is_err()) return std::move(http).error();

    auto root = materialize(*http.value());
    if (root.is_err()) return std::move(root).error();
    return find_template(root.value(), template_name);
}

} // namespace stencil
