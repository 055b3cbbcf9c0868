#pragma once

#include <stencil/result.hpp>
#include <stencil/source.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stencil {

struct RegistryEntry {
    std::string name;        // unique within a config
    TemplateSource source;
    bool enabled = true;
    uint32_t priority = 0;   // lower is tried first
};

// Process-wide registry configuration, read-only once loaded
struct RegistryConfig {
    std::vector<RegistryEntry> entries;
    std::string cache_dir = "./.template_cache";
    uint64_t cache_ttl_seconds = 3600;
    int fetch_timeout_seconds = 300;  // Git/Http transport timeout
    bool persist_cache = true;        // keep the cache index in <cache_dir>/index.db

    // Single enabled local entry at ./templates
    static RegistryConfig defaults();

    // Parse from TOML. Relative paths resolve against `base_dir` when given.
    static Result<RegistryConfig> parse(const std::string& toml_str,
                                        const std::filesystem::path& base_dir = {});

    // Load a TOML file; relative paths resolve against its directory
    static Result<RegistryConfig> load(const std::filesystem::path& path);

    // Duplicate names and invalid source descriptors
    Status validate() const;

    // Enabled entries in ascending priority; ties keep declaration order
    std::vector<const RegistryEntry*> active_entries() const;
};

// ~/.stencil/registry.toml (empty when HOME is unset)
std::string global_config_path();

// <dir>/stencil.toml, else the global config, else RegistryConfig::defaults()
Result<RegistryConfig> discover_config(const std::filesystem::path& dir);

} // namespace stencil
