#pragma once

#include <stencil/result.hpp>
#include <stencil/source.hpp>
#include <stencil/template.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stencil {

struct RegistryConfig;

// Materializes templates from one kind of source.
//
// fetch_list returns every template the source offers; fetch_one returns the
// on-disk location and metadata of one named template. Errors:
//   SourceUnavailable   source unreachable (network, auth, missing root)
//   TemplateNotFound    source reachable but has no such template
//   TemplateProcessing  descriptor missing or malformed
//   Integrity           downloaded content failed verification
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    virtual SourceKind kind() const = 0;

    virtual Result<std::vector<TemplateMetadata>> fetch_list(const TemplateSource& source) = 0;

    virtual Result<FetchedTemplate> fetch_one(const TemplateSource& source,
                                              const std::string& template_name) = 0;
};

// One adapter per source kind
class AdapterSet {
public:
    // Replaces any adapter already registered for the same kind
    void add(std::unique_ptr<SourceAdapter> adapter);

    SourceAdapter* find(SourceKind kind) const;

    // Local, Git, Http and PackageRegistry adapters rooted at config.cache_dir
    static AdapterSet defaults(const RegistryConfig& config);

private:
    std::unordered_map<SourceKind, std::unique_ptr<SourceAdapter>> adapters_;
};

// Serializes work on one cache directory across threads
class PathLocks {
public:
    std::unique_lock<std::mutex> lock(const std::string& path);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

// Shared by the remote adapters: a materialized root turned into list/one results
Result<std::vector<TemplateMetadata>> list_from_root(Result<std::string> root);

} // namespace stencil
