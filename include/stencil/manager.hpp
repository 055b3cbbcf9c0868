#pragma once

#include <stencil/adapter.hpp>
#include <stencil/cache.hpp>
#include <stencil/config.hpp>
#include <stencil/result.hpp>
#include <stencil/template.hpp>

#include <future>
#include <optional>
#include <string>
#include <vector>

namespace stencil {

struct ResolvedTemplate {
    std::string path;
    TemplateMetadata metadata;
    std::string registry;     // entry that produced it
    bool from_cache = false;
};

// Resolves (project_type, template_name) against the configured registry
// entries in priority order, caching successful resolutions.
//
// The manager is safe to use from several threads. Futures returned by the
// *_async methods reference the manager, which must outlive them and must not
// be moved while any is pending.
class TemplateManager {
public:
    // In-memory cache only. `clock` is forwarded to the cache store.
    TemplateManager(RegistryConfig config, AdapterSet adapters,
                    CacheStore::Clock clock = {});

    TemplateManager(TemplateManager&&) = default;
    TemplateManager& operator=(TemplateManager&&) = default;

    // Validates the config, builds the default adapters and, when
    // persist_cache is set, opens <cache_dir>/index.db
    static Result<TemplateManager> open(RegistryConfig config);

    // Metadata from every enabled entry, optionally filtered by project type.
    // Entries that fail are skipped with a warning.
    Result<std::vector<TemplateMetadata>> list_templates(
        const std::optional<std::string>& project_type = std::nullopt);

    // First entry (by priority) that yields a matching template wins.
    // SourceUnavailable and TemplateNotFound move on to the next entry; other
    // errors abort. Exhaustion is TemplateNotFound.
    Result<ResolvedTemplate> resolve(const std::string& project_type,
                                     const std::string& template_name);

    std::future<Result<ResolvedTemplate>> resolve_async(std::string project_type,
                                                        std::string template_name);

    std::future<Result<std::vector<TemplateMetadata>>> list_templates_async(
        std::optional<std::string> project_type = std::nullopt);

    Status invalidate(const std::string& project_type, const std::string& template_name);
    Status clear_cache();

    const RegistryConfig& config() const { return config_; }
    CacheStore& cache() { return cache_; }

private:
    Result<FetchedTemplate> attempt(const RegistryEntry& entry,
                                    const std::string& project_type,
                                    const std::string& template_name);

    RegistryConfig config_;
    AdapterSet adapters_;
    CacheStore cache_;
};

} // namespace stencil
