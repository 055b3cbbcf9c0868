#include <stencil/manager.hpp>
#include <stencil/log.hpp>

#include <algorithm>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace stencil {

static std::chrono::seconds ttl_from(uint64_t seconds) {
    constexpr uint64_t max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return std::chrono::seconds(static_cast<int64_t>(std::min(seconds, max)));
}

TemplateManager::TemplateManager(RegistryConfig config, AdapterSet adapters,
                                 CacheStore::Clock clock)
    : config_(std::move(config)),
      adapters_(std::move(adapters)),
      cache_(ttl_from(config_.cache_ttl_seconds), std::move(clock)) {}

Result<TemplateManager> TemplateManager::open(RegistryConfig config) {
    STENCIL_TRY(config.validate());

    AdapterSet adapters = AdapterSet::defaults(config);
    TemplateManager manager(std::move(config), std::move(adapters));

    if (manager.config_.persist_cache) {
        std::error_code ec;
        fs::create_directories(manager.config_.cache_dir, ec);
        if (ec) {
            return StencilError{StencilError::IO,
                "cannot create cache directory " + manager.config_.cache_dir + ": " + ec.message()};
        }
        auto db = (fs::path(manager.config_.cache_dir) / "index.db").string();
        STENCIL_TRY(manager.cache_.open_index(db));
    }

    return Result<TemplateManager>::ok(std::move(manager));
}

// ---------------------------------------------------------------------------
// list_templates()
// ---------------------------------------------------------------------------

Result<std::vector<TemplateMetadata>> TemplateManager::list_templates(
    const std::optional<std::string>& project_type)
{
    std::vector<TemplateMetadata> out;

    for (const RegistryEntry* entry : config_.active_entries()) {
        SourceAdapter* adapter = adapters_.find(source_kind(entry->source));
        if (!adapter) {
            log::warn("registry '%s': no adapter for %s sources",
                      entry->name.c_str(), source_kind_name(source_kind(entry->source)));
            continue;
        }

        auto listed = adapter->fetch_list(entry->source);
        if (listed.is_err()) {
            log::warn("registry '%s' skipped: %s",
                      entry->name.c_str(), listed.error().message.c_str());
            continue;
        }

        for (auto& meta : listed.value()) {
            if (project_type && meta.project_type != *project_type) continue;
            out.push_back(std::move(meta));
        }
    }

    return Result<std::vector<TemplateMetadata>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<FetchedTemplate> TemplateManager::attempt(const RegistryEntry& entry,
                                                 const std::string& project_type,
                                                 const std::string& template_name)
{
    SourceAdapter* adapter = adapters_.find(source_kind(entry.source));
    if (!adapter) {
        return StencilError{StencilError::SourceUnavailable,
            std::string("no adapter for ") +
            source_kind_name(source_kind(entry.source)) + " sources"};
    }

    auto fetched = adapter->fetch_one(entry.source, template_name);
    if (fetched.is_err()) return fetched;

    if (fetched.value().metadata.project_type != project_type) {
        return StencilError{StencilError::TemplateNotFound,
            "template '" + template_name + "' is a " +
            fetched.value().metadata.project_type + " template, not " + project_type};
    }
    return fetched;
}

Result<ResolvedTemplate> TemplateManager::resolve(const std::string& project_type,
                                                  const std::string& template_name)
{
    std::string key = CacheStore::make_key(project_type, template_name);

    if (auto hit = cache_.get(key)) {
        std::error_code ec;
        if (fs::is_directory(hit->resolved_path, ec)) {
            log::debug("cache hit for %s", key.c_str());
            ResolvedTemplate resolved;
            resolved.path = std::move(hit->resolved_path);
            resolved.metadata = std::move(hit->metadata);
            resolved.from_cache = true;
            return Result<ResolvedTemplate>::ok(std::move(resolved));
        }
        log::debug("cached path for %s is gone, resolving again", key.c_str());
    }

    for (const RegistryEntry* entry : config_.active_entries()) {
        log::debug("trying registry '%s'", entry->name.c_str());

        auto fetched = attempt(*entry, project_type, template_name);
        if (fetched.is_err()) {
            const StencilError& err = fetched.error();
            if (!err.is_recoverable()) return std::move(fetched).error();
            log::warn("registry '%s' failed for %s: %s",
                      entry->name.c_str(), key.c_str(), err.message.c_str());
            continue;
        }

        log::info("resolved %s from registry '%s'", key.c_str(), entry->name.c_str());

        CacheEntry cached;
        cached.metadata = fetched.value().metadata;
        cached.resolved_path = fetched.value().path;
        cached.cached_at = cache_.now();
        auto stored = cache_.put(key, std::move(cached));
        if (stored.is_err()) {
            log::warn("could not persist cache entry for %s: %s",
                      key.c_str(), stored.error().message.c_str());
        }

        ResolvedTemplate resolved;
        resolved.path = std::move(fetched.value().path);
        resolved.metadata = std::move(fetched.value().metadata);
        resolved.registry = entry->name;
        return Result<ResolvedTemplate>::ok(std::move(resolved));
    }

    return StencilError{StencilError::TemplateNotFound,
        "template not found: " + key,
        "run `list` to see the templates each registry offers"};
}

std::future<Result<ResolvedTemplate>> TemplateManager::resolve_async(
    std::string project_type, std::string template_name)
{
    return std::async(std::launch::async,
        [this, type = std::move(project_type), name = std::move(template_name)]() {
            return resolve(type, name);
        });
}

std::future<Result<std::vector<TemplateMetadata>>> TemplateManager::list_templates_async(
    std::optional<std::string> project_type)
{
    return std::async(std::launch::async,
        [this, type = std::move(project_type)]() {
            return list_templates(type);
        });
}

Status TemplateManager::invalidate(const std::string& project_type,
                                   const std::string& template_name) {
    return cache_.remove(CacheStore::make_key(project_type, template_name));
}

Status TemplateManager::clear_cache() {
    return cache_.clear();
}

} // namespace stencil
