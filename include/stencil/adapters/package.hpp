#pragma once

#include <stencil/adapter.hpp>
#include <stencil/http.hpp>

namespace stencil {

inline constexpr const char* kDefaultPackageRegistry = "https://registry.npmjs.org";

// A package version as reported by an npm-compatible registry
struct PackageDist {
    std::string version;
    std::string tarball;
    std::string integrity;  // may be empty
};

// Parse the JSON document served at <registry>/<package>/<version>
Result<PackageDist> parse_package_document(const std::string& json_str,
                                           const std::string& package);

// Package tarballs from an npm-compatible registry, extracted under
// <cache_dir>/packages/<package>-<version>. An exact version already on disk
// is reused without contacting the registry; dist-tags are always re-resolved.
class PackageAdapter : public SourceAdapter {
public:
    PackageAdapter(std::string cache_dir, std::shared_ptr<HttpClient> client);

    SourceKind kind() const override { return SourceKind::PackageRegistry; }

    Result<std::vector<TemplateMetadata>> fetch_list(const TemplateSource& source) override;

    Result<FetchedTemplate> fetch_one(const TemplateSource& source,
                                      const std::string& template_name) override;

    // <registry>/<escaped package>/<version>
    static std::string document_url(const PackageRegistrySource& source);

    std::string extract_path(const std::string& package, const std::string& version) const;

    Result<std::string> materialize(const PackageRegistrySource& source);

private:
    Result<std::string> install(const PackageRegistrySource& source,
                                const PackageDist& dist);

    std::string cache_dir_;
    std::shared_ptr<HttpClient> client_;
    PathLocks locks_;
};

} // namespace stencil
