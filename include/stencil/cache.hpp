#pragma once

#include <stencil/result.hpp>
#include <stencil/template.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace stencil {

struct CacheEntry {
    TemplateMetadata metadata;
    std::string resolved_path;
    std::chrono::system_clock::time_point cached_at;
};

// Keyed store of resolved templates with lazy TTL expiry.
//
// Readers run concurrently; writers are serialized. An entry goes from absent
// to fully populated in one step and is replaced wholesale on put. With an
// index open, puts are written through to SQLite and memory misses fall back
// to the index, so resolutions survive across processes.
class CacheStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // An empty clock means std::chrono::system_clock::now
    explicit CacheStore(std::chrono::seconds ttl, Clock clock = {});
    ~CacheStore();
    CacheStore(CacheStore&&) noexcept;
    CacheStore& operator=(CacheStore&&) noexcept;

    // "<project_type>:<template_name>"
    static std::string make_key(const std::string& project_type,
                                const std::string& template_name);

    // Persistent index lifecycle
    Status open_index(const std::string& db_path);
    void close_index();
    bool has_index() const;

    // Absent or expired -> nullopt
    std::optional<CacheEntry> get(const std::string& key);

    // Unconditional overwrite. The in-memory entry is replaced even when the
    // index write fails; the failure is returned.
    Status put(const std::string& key, CacheEntry entry);

    // elapsed(cached_at) > ttl; a clock reading before cached_at is expired
    bool is_expired(const CacheEntry& entry) const;

    Status remove(const std::string& key);
    Status clear();

    // Drop expired entries from memory and index; returns how many keys went
    Result<size_t> prune();

    // Entries held in memory
    size_t size() const;

    std::chrono::system_clock::time_point now() const;
    std::chrono::seconds ttl() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace stencil
