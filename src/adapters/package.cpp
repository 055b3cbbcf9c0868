#include <stencil/adapters/package.hpp>
#include <stencil/archive.hpp>
#include <stencil/log.hpp>
#include <stencil/sha256.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using nlohmann::json;

namespace stencil {

namespace {

// 1.2.3 and friends; anything else ("latest", "next") is a dist-tag
bool is_exact_version(const std::string& v) {
    return !v.empty() && std::isdigit(static_cast<unsigned char>(v[0]));
}

std::string base64_encode(const Sha256::Digest& digest) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    size_t i = 0;
    for (; i + 2 < digest.size(); i += 3) {
        uint32_t n = (uint32_t(digest[i]) << 16) | (uint32_t(digest[i + 1]) << 8) | digest[i + 2];
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += table[n & 63];
    }
    size_t rest = digest.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(digest[i]) << 16;
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(digest[i]) << 16) | (uint32_t(digest[i + 1]) << 8);
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

// The sha256 entry of an SRI string such as "sha512-... sha256-...", if any
std::optional<std::string> sha256_integrity(const std::string& integrity) {
    std::istringstream in(integrity);
    std::string token;
    while (in >> token) {
        if (token.compare(0, 7, "sha256-") == 0) return token.substr(7);
    }
    return std::nullopt;
}

std::string sanitize(const std::string& package) {
    std::string out;
    for (char c : package) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') {
            out += c;
        } else if (c == '/') {
            out += "__";
        }
    }
    return out;
}

std::string read_marker(const fs::path& dir) {
    std::ifstream in(dir / kSourceMarker);
    std::string line;
    if (in.is_open()) std::getline(in, line);
    return line;
}

} // namespace

Result<PackageDist> parse_package_document(const std::string& json_str,
                                           const std::string& package) {
    json doc;
    try {
        doc = json::parse(json_str);
    } catch (const json::parse_error& e) {
        return StencilError{StencilError::SourceUnavailable,
            "registry returned malformed JSON for '" + package + "': " + e.what()};
    }

    PackageDist dist;
    if (!doc.is_object() || !doc.contains("version") || !doc["version"].is_string()) {
        return StencilError{StencilError::SourceUnavailable,
            "registry document for '" + package + "' has no version"};
    }
    dist.version = doc["version"].get<std::string>();

    auto it = doc.find("dist");
    if (it == doc.end() || !it->is_object() ||
        !it->contains("tarball") || !(*it)["tarball"].is_string()) {
        return StencilError{StencilError::SourceUnavailable,
            "registry document for '" + package + "@" + dist.version + "' has no tarball"};
    }
    dist.tarball = (*it)["tarball"].get<std::string>();
    if (it->contains("integrity") && (*it)["integrity"].is_string()) {
        dist.integrity = (*it)["integrity"].get<std::string>();
    }
    return Result<PackageDist>::ok(std::move(dist));
}

PackageAdapter::PackageAdapter(std::string cache_dir, std::shared_ptr<HttpClient> client)
    : cache_dir_(std::move(cache_dir)), client_(std::move(client)) {}

std::string PackageAdapter::document_url(const PackageRegistrySource& source) {
    std::string registry = source.registry_url.value_or(kDefaultPackageRegistry);
    while (!registry.empty() && registry.back() == '/') registry.pop_back();

    std::string escaped = source.package;
    auto slash = escaped.find('/');
    if (!escaped.empty() && escaped[0] == '@' && slash != std::string::npos) {
        escaped.replace(slash, 1, "%2F");
    }
    return registry + "/" + escaped + "/" + source.version;
}

std::string PackageAdapter::extract_path(const std::string& package,
                                         const std::string& version) const {
    return (fs::path(cache_dir_) / "packages" / (sanitize(package) + "-" + version)).string();
}

Result<std::string> PackageAdapter::install(const PackageRegistrySource& source,
                                            const PackageDist& dist) {
    std::string dir = extract_path(source.package, dist.version);
    auto guard = locks_.lock(dir);

    std::error_code ec;
    if (fs::is_directory(dir, ec) && read_marker(dir) == dist.version) {
        stencil::log::debug("reusing %s@%s", source.package.c_str(), dist.version.c_str());
        return Result<std::string>::ok(archive_root(dir).string());
    }

    stencil::log::info("downloading %s@%s", source.package.c_str(), dist.version.c_str());
    auto response = client_->get(dist.tarball);
    if (response.is_err()) return std::move(response).error();
    if (!response.value().ok()) {
        return StencilError{StencilError::SourceUnavailable,
            "tarball download for " + source.package + "@" + dist.version +
            " returned HTTP " + std::to_string(response.value().status_code)};
    }
    const std::string& body = response.value().body;

    if (auto want = sha256_integrity(dist.integrity)) {
        Sha256 ctx;
        ctx.update(body);
        std::string got = base64_encode(ctx.finish());
        if (got != *want) {
            return StencilError{StencilError::Integrity,
                "integrity mismatch for " + source.package + "@" + dist.version +
                ": expected sha256-" + *want + ", got sha256-" + got};
        }
    }

    fs::create_directories(fs::path(dir).parent_path(), ec);
    auto staging = make_staging_dir(dir);
    if (staging.is_err()) return std::move(staging).error();

    auto extracted = extract_archive(body, staging.value());
    if (extracted.is_ok()) {
        std::ofstream marker(staging.value() / kSourceMarker);
        marker << dist.version << "\n";
        if (!marker) {
            extracted = StencilError{StencilError::IO, "cannot write package marker"};
        }
    }
    if (extracted.is_err()) {
        fs::remove_all(staging.value(), ec);
        return std::move(extracted).error();
    }
    STENCIL_TRY(commit_staging_dir(staging.value(), dir));

    return Result<std::string>::ok(archive_root(dir).string());
}

Result<std::string> PackageAdapter::materialize(const PackageRegistrySource& source) {
    if (is_exact_version(source.version)) {
        std::string dir = extract_path(source.package, source.version);
        std::error_code ec;
        auto guard = locks_.lock(dir);
        if (fs::is_directory(dir, ec) && read_marker(dir) == source.version) {
            stencil::log::debug("reusing %s@%s", source.package.c_str(), source.version.c_str());
            return Result<std::string>::ok(archive_root(dir).string());
        }
    }

    std::string url = document_url(source);
    auto response = client_->get(url, {{"Accept", "application/json"}});
    if (response.is_err()) return std::move(response).error();

    int status = response.value().status_code;
    if (status == 404) {
        return StencilError{StencilError::SourceUnavailable,
            "package " + source.package + "@" + source.version + " not found in registry"};
    }
    if (!response.value().ok()) {
        return StencilError{StencilError::SourceUnavailable,
            "registry lookup " + url + " returned HTTP " + std::to_string(status)};
    }

    auto dist = parse_package_document(response.value().body, source.package);
    if (dist.is_err()) return std::move(dist).error();

    if (is_exact_version(source.version) && dist.value().version != source.version) {
        return StencilError{StencilError::SourceUnavailable,
            "registry answered " + source.package + "@" + dist.value().version +
            " for requested version " + source.version};
    }

    return install(source, dist.value());
}

static Result<const PackageRegistrySource*> as_package(const TemplateSource& source) {
    const auto* pkg = std::get_if<PackageRegistrySource>(&source);
    if (!pkg) {
        return StencilError{StencilError::InvalidArg,
            "package adapter given a " +
            std::string(source_kind_name(source_kind(source))) + " source"};
    }
    return Result<const PackageRegistrySource*>::ok(pkg);
}

Result<std::vector<TemplateMetadata>> PackageAdapter::fetch_list(const TemplateSource& source) {
    auto pkg = as_package(source);
    if (pkg.is_err()) return std::move(pkg).error();
    return list_from_root(materialize(*pkg.value()));
}

Result<FetchedTemplate> PackageAdapter::fetch_one(const TemplateSource& source,
                                                  const std::string& template_name) {
    auto pkg = as_package(source);
    if (pkg.is_err()) return std::move(pkg).error();

    auto root = materialize(*pkg.value());
    if (root.is_err()) return std::move(root).error();
    return find_template(root.value(), template_name);
}

} // namespace stencil
