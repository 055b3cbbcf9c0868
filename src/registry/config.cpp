#include <stencil/config.hpp>
#include <stencil/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace stencil {

static StencilError config_error(const std::string& msg, const std::string& hint = "") {
    return StencilError{StencilError::Configuration, msg, hint};
}

static std::string resolve_path(const std::string& raw, const fs::path& base_dir) {
    fs::path p(raw);
    if (p.is_absolute() || base_dir.empty()) return raw;
    return (base_dir / p).lexically_normal().string();
}

static std::optional<std::string> opt_string(const toml::table& tbl, const char* key) {
    if (auto v = tbl[key].value<std::string>()) return std::string(*v);
    return std::nullopt;
}

static Result<std::string> required_string(const toml::table& tbl, const char* key,
                                           const std::string& entry) {
    auto v = opt_string(tbl, key);
    if (!v) {
        return config_error("registry '" + entry + "' is missing '" + key + "'");
    }
    return Result<std::string>::ok(std::move(*v));
}

static Result<TemplateSource> parse_source(const toml::table& tbl,
                                           const std::string& entry,
                                           const fs::path& base_dir) {
    auto type = opt_string(tbl, "type");
    if (!type) {
        return config_error("registry '" + entry + "' has no 'type'",
                            "one of: local, git, http, npm");
    }

    if (*type == "local") {
        auto path = required_string(tbl, "path", entry);
        STENCIL_TRY(path);
        return Result<TemplateSource>::ok(LocalSource{resolve_path(path.value(), base_dir)});
    }

    if (*type == "git") {
        GitSource src;
        auto url = required_string(tbl, "url", entry);
        STENCIL_TRY(url);
        src.url = std::move(url).value();
        src.branch = opt_string(tbl, "branch");
        src.subfolder = opt_string(tbl, "subfolder");
        if (auto auth = tbl["auth"].as_table()) {
            GitAuth a;
            a.username = opt_string(*auth, "username");
            a.token = opt_string(*auth, "token");
            src.auth = std::move(a);
        }
        return Result<TemplateSource>::ok(std::move(src));
    }

    if (*type == "http") {
        HttpSource src;
        auto url = required_string(tbl, "url", entry);
        STENCIL_TRY(url);
        src.url = std::move(url).value();
        src.checksum = opt_string(tbl, "checksum");
        if (auto auth = tbl["auth"].as_table()) {
            HttpAuth a;
            a.bearer_token = opt_string(*auth, "bearer-token");
            auto user = opt_string(*auth, "basic-user");
            auto pass = opt_string(*auth, "basic-password");
            if (user || pass) {
                if (!user) {
                    return config_error("registry '" + entry + "' auth has basic-password without basic-user");
                }
                a.basic_auth = std::make_pair(*user, pass.value_or(""));
            }
            src.auth = std::move(a);
        }
        return Result<TemplateSource>::ok(std::move(src));
    }

    if (*type == "npm" || *type == "package") {
        PackageRegistrySource src;
        auto package = required_string(tbl, "package", entry);
        STENCIL_TRY(package);
        src.package = std::move(package).value();
        src.version = opt_string(tbl, "version").value_or("latest");
        src.registry_url = opt_string(tbl, "registry");
        return Result<TemplateSource>::ok(std::move(src));
    }

    return config_error("registry '" + entry + "' has unknown type '" + *type + "'",
                        "one of: local, git, http, npm");
}

RegistryConfig RegistryConfig::defaults() {
    RegistryConfig cfg;
    cfg.entries.push_back(RegistryEntry{"local", LocalSource{"./templates"}, true, 0});
    return cfg;
}

Result<RegistryConfig> RegistryConfig::parse(const std::string& toml_str,
                                             const fs::path& base_dir) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StencilError{StencilError::Parse,
            std::string("registry config TOML parse error: ") + e.what()};
    }

    RegistryConfig cfg;

    if (auto v = doc["cache-dir"].value<std::string>()) {
        cfg.cache_dir = resolve_path(std::string(*v), base_dir);
    } else {
        cfg.cache_dir = resolve_path(cfg.cache_dir, base_dir);
    }

    if (auto v = doc["cache-ttl"].value<int64_t>()) {
        if (*v < 0) return config_error("cache-ttl must not be negative");
        cfg.cache_ttl_seconds = static_cast<uint64_t>(*v);
    }

    if (auto v = doc["fetch-timeout"].value<int64_t>()) {
        if (*v <= 0) return config_error("fetch-timeout must be positive");
        cfg.fetch_timeout_seconds = static_cast<int>(*v);
    }

    if (auto v = doc["persist-cache"].value<bool>()) {
        cfg.persist_cache = *v;
    }

    if (auto registries = doc["registry"].as_array()) {
        size_t index = 0;
        for (const auto& node : *registries) {
            ++index;
            auto tbl = node.as_table();
            if (!tbl) {
                return config_error("[[registry]] #" + std::to_string(index) + " is not a table");
            }

            RegistryEntry entry;
            auto name = opt_string(*tbl, "name");
            if (!name || name->empty()) {
                return config_error("[[registry]] #" + std::to_string(index) + " has no name");
            }
            entry.name = *name;

            auto source = parse_source(*tbl, entry.name, base_dir);
            STENCIL_TRY(source);
            entry.source = std::move(source).value();

            if (auto v = (*tbl)["enabled"].value<bool>()) entry.enabled = *v;
            if (auto v = (*tbl)["priority"].value<int64_t>()) {
                if (*v < 0 || *v > static_cast<int64_t>(UINT32_MAX)) {
                    return config_error("registry '" + entry.name + "' has out-of-range priority");
                }
                entry.priority = static_cast<uint32_t>(*v);
            }

            cfg.entries.push_back(std::move(entry));
        }
    } else if (doc.contains("registry")) {
        return config_error("'registry' must be an array of tables",
                            "declare entries with [[registry]]");
    }

    STENCIL_TRY(cfg.validate());
    return Result<RegistryConfig>::ok(std::move(cfg));
}

Result<RegistryConfig> RegistryConfig::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StencilError{StencilError::IO,
            "cannot open registry config: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    fs::path base = fs::absolute(path).parent_path();
    return RegistryConfig::parse(ss.str(), base);
}

Status RegistryConfig::validate() const {
    std::unordered_set<std::string> names;
    for (const auto& entry : entries) {
        if (!names.insert(entry.name).second) {
            return config_error("duplicate registry name '" + entry.name + "'");
        }
        auto st = validate_source(entry.source);
        if (st.is_err()) {
            auto err = std::move(st).error();
            err.message = "registry '" + entry.name + "': " + err.message;
            return err;
        }
    }
    if (cache_dir.empty()) {
        return config_error("cache-dir must not be empty");
    }
    return ok_status();
}

std::vector<const RegistryEntry*> RegistryConfig::active_entries() const {
    std::vector<const RegistryEntry*> out;
    for (const auto& entry : entries) {
        if (entry.enabled) out.push_back(&entry);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const RegistryEntry* a, const RegistryEntry* b) {
                         return a->priority < b->priority;
                     });
    return out;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.stencil/registry.toml";
}

Result<RegistryConfig> discover_config(const fs::path& dir) {
    std::error_code ec;
    fs::path local = dir / "stencil.toml";
    if (fs::is_regular_file(local, ec)) {
        stencil::log::debug("using registry config %s", local.string().c_str());
        return RegistryConfig::load(local);
    }

    std::string global = global_config_path();
    if (!global.empty() && fs::is_regular_file(global, ec)) {
        stencil::log::debug("using registry config %s", global.c_str());
        return RegistryConfig::load(global);
    }

    stencil::log::debug("no registry config found, using defaults");
    return Result<RegistryConfig>::ok(RegistryConfig::defaults());
}

} // namespace stencil
