#include <stencil/cache.hpp>
#include <stencil/log.hpp>
#include <sqlite3.h>

#include <filesystem>
#include <limits>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;
using std::chrono::system_clock;

namespace stencil {

static const std::string SCHEMA_VERSION = "1";

static int64_t to_millis(system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

static system_clock::time_point from_millis(int64_t ms) {
    return system_clock::time_point(
        std::chrono::duration_cast<system_clock::duration>(std::chrono::milliseconds(ms)));
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct CacheStore::Impl {
    std::chrono::seconds ttl;
    Clock clock;

    mutable std::shared_mutex mem_mutex;
    std::unordered_map<std::string, CacheEntry> entries;

    std::mutex db_mutex;
    sqlite3* db = nullptr;

    using Stmt = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

    ~Impl() { close(); }

    void close() {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return StencilError(StencilError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Result<Stmt> prepare(const char* sql) {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
        if (rc != SQLITE_OK) {
            if (raw) sqlite3_finalize(raw);
            return StencilError(StencilError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return Result<Stmt>::ok(Stmt(raw, sqlite3_finalize));
    }

    Status init_schema() {
        STENCIL_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS cache_entry ("
            "  key TEXT PRIMARY KEY,"
            "  resolved_path TEXT NOT NULL,"
            "  metadata TEXT NOT NULL,"
            "  cached_at INTEGER NOT NULL"
            ");"
        ));

        std::optional<std::string> stored;
        {
            auto stmt = prepare("SELECT value FROM schema_info WHERE key='version'");
            if (stmt.is_err()) return std::move(stmt).error();
            if (sqlite3_step(stmt.value().get()) == SQLITE_ROW) {
                const char* ver = reinterpret_cast<const char*>(
                    sqlite3_column_text(stmt.value().get(), 0));
                stored = ver ? ver : "";
            }
        }
        if (stored) {
            if (*stored == SCHEMA_VERSION) return ok_status();
            // Version mismatch: rows cannot be trusted
            STENCIL_TRY(exec("DELETE FROM cache_entry;"));
        }

        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    Status setup() {
        STENCIL_TRY(exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
            "PRAGMA busy_timeout=5000;"
        ));
        return init_schema();
    }

    Result<std::optional<CacheEntry>> load_row(const std::string& key) {
        auto stmt = prepare(
            "SELECT resolved_path, metadata, cached_at FROM cache_entry WHERE key=?");
        if (stmt.is_err()) return std::move(stmt).error();
        sqlite3_stmt* s = stmt.value().get();
        sqlite3_bind_text(s, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(s);
        if (rc == SQLITE_DONE) {
            return Result<std::optional<CacheEntry>>::ok(std::nullopt);
        }
        if (rc != SQLITE_ROW) {
            return StencilError(StencilError::IO,
                std::string("SQLite lookup failed: ") + sqlite3_errmsg(db));
        }

        const char* path = reinterpret_cast<const char*>(sqlite3_column_text(s, 0));
        const char* meta_json = reinterpret_cast<const char*>(sqlite3_column_text(s, 1));
        auto meta = TemplateMetadata::parse(meta_json ? meta_json : "", "cache index");
        STENCIL_TRY(meta);

        CacheEntry entry;
        entry.resolved_path = path ? path : "";
        entry.metadata = std::move(meta).value();
        entry.cached_at = from_millis(sqlite3_column_int64(s, 2));
        return Result<std::optional<CacheEntry>>::ok(std::move(entry));
    }

    Status store_row(const std::string& key, const CacheEntry& entry) {
        auto stmt = prepare(
            "INSERT OR REPLACE INTO cache_entry (key, resolved_path, metadata, cached_at) "
            "VALUES (?, ?, ?, ?)");
        if (stmt.is_err()) return std::move(stmt).error();
        sqlite3_stmt* s = stmt.value().get();
        std::string meta_json = entry.metadata.to_json();
        sqlite3_bind_text(s, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 2, entry.resolved_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 3, meta_json.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(s, 4, to_millis(entry.cached_at));

        if (sqlite3_step(s) != SQLITE_DONE) {
            return StencilError(StencilError::IO,
                std::string("Failed to store cache entry: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status delete_row(const std::string& key) {
        auto stmt = prepare("DELETE FROM cache_entry WHERE key=?");
        if (stmt.is_err()) return std::move(stmt).error();
        sqlite3_bind_text(stmt.value().get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
            return StencilError(StencilError::IO,
                std::string("Failed to remove cache entry: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// CacheStore public interface
// ---------------------------------------------------------------------------

CacheStore::CacheStore(std::chrono::seconds ttl, Clock clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->ttl = ttl;
    impl_->clock = clock ? std::move(clock) : Clock([] { return system_clock::now(); });
}

CacheStore::~CacheStore() = default;
CacheStore::CacheStore(CacheStore&&) noexcept = default;
CacheStore& CacheStore::operator=(CacheStore&&) noexcept = default;

std::string CacheStore::make_key(const std::string& project_type,
                                 const std::string& template_name) {
    return project_type + ":" + template_name;
}

Status CacheStore::open_index(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(impl_->db_mutex);
    impl_->close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return StencilError(StencilError::IO,
                "Failed to create cache directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc == SQLITE_OK && impl_->setup().is_ok()) {
        return ok_status();
    }

    // Corrupt or foreign file: delete and retry once
    std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
    impl_->close();
    std::error_code ec;
    fs::remove(db_path, ec);
    fs::remove(db_path + "-wal", ec);
    fs::remove(db_path + "-shm", ec);
    stencil::log::warn("cache index %s unusable (%s), recreating",
                       db_path.c_str(), err_msg.c_str());

    rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->close();
        return StencilError(StencilError::IO,
            "Failed to open cache index: " + db_path);
    }
    auto st = impl_->setup();
    if (st.is_err()) {
        impl_->close();
        return st;
    }
    return ok_status();
}

void CacheStore::close_index() {
    std::lock_guard<std::mutex> lock(impl_->db_mutex);
    impl_->close();
}

bool CacheStore::has_index() const {
    std::lock_guard<std::mutex> lock(impl_->db_mutex);
    return impl_->db != nullptr;
}

std::optional<CacheEntry> CacheStore::get(const std::string& key) {
    {
        std::shared_lock<std::shared_mutex> lock(impl_->mem_mutex);
        auto it = impl_->entries.find(key);
        if (it != impl_->entries.end()) {
            if (is_expired(it->second)) return std::nullopt;
            return it->second;
        }
    }

    std::optional<CacheEntry> loaded;
    {
        std::lock_guard<std::mutex> lock(impl_->db_mutex);
        if (!impl_->db) return std::nullopt;
        auto row = impl_->load_row(key);
        if (row.is_err()) {
            stencil::log::warn("cache index lookup for '%s' failed: %s",
                               key.c_str(), row.error().message.c_str());
            return std::nullopt;
        }
        loaded = std::move(row).value();
    }

    if (!loaded || is_expired(*loaded)) return std::nullopt;

    // Promote, unless a concurrent put already landed a newer entry
    std::unique_lock<std::shared_mutex> lock(impl_->mem_mutex);
    auto [it, inserted] = impl_->entries.emplace(key, *loaded);
    if (!inserted && is_expired(it->second)) return std::nullopt;
    return it->second;
}

Status CacheStore::put(const std::string& key, CacheEntry entry) {
    {
        std::lock_guard<std::mutex> lock(impl_->db_mutex);
        if (impl_->db) {
            auto st = impl_->store_row(key, entry);
            if (st.is_err()) {
                std::unique_lock<std::shared_mutex> mem_lock(impl_->mem_mutex);
                impl_->entries[key] = std::move(entry);
                return st;
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(impl_->mem_mutex);
    impl_->entries[key] = std::move(entry);
    return ok_status();
}

bool CacheStore::is_expired(const CacheEntry& entry) const {
    auto current = now();
    if (current < entry.cached_at) return true;
    // Compare in whole seconds; converting ttl to the clock's period overflows
    auto elapsed = current - entry.cached_at;
    auto whole = std::chrono::duration_cast<std::chrono::seconds>(elapsed);
    if (whole != impl_->ttl) return whole > impl_->ttl;
    return elapsed > whole;
}

Status CacheStore::remove(const std::string& key) {
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mem_mutex);
        impl_->entries.erase(key);
    }
    std::lock_guard<std::mutex> lock(impl_->db_mutex);
    if (impl_->db) return impl_->delete_row(key);
    return ok_status();
}

Status CacheStore::clear() {
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mem_mutex);
        impl_->entries.clear();
    }
    std::lock_guard<std::mutex> lock(impl_->db_mutex);
    if (impl_->db) return impl_->exec("DELETE FROM cache_entry;");
    return ok_status();
}

Result<size_t> CacheStore::prune() {
    std::unordered_set<std::string> removed;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mem_mutex);
        for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
            if (is_expired(it->second)) {
                removed.insert(it->first);
                it = impl_->entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::lock_guard<std::mutex> lock(impl_->db_mutex);
    if (impl_->db) {
        int64_t current = to_millis(now());
        int64_t ttl_s = impl_->ttl.count();
        int64_t cutoff = ttl_s > current / 1000
            ? std::numeric_limits<int64_t>::min()
            : current - ttl_s * 1000;

        auto select = impl_->prepare(
            "SELECT key FROM cache_entry WHERE cached_at < ? OR cached_at > ?");
        if (select.is_err()) return std::move(select).error();
        sqlite3_bind_int64(select.value().get(), 1, cutoff);
        sqlite3_bind_int64(select.value().get(), 2, current);
        while (sqlite3_step(select.value().get()) == SQLITE_ROW) {
            const char* key = reinterpret_cast<const char*>(
                sqlite3_column_text(select.value().get(), 0));
            if (key) removed.insert(key);
        }

        auto del = impl_->prepare(
            "DELETE FROM cache_entry WHERE cached_at < ? OR cached_at > ?");
        if (del.is_err()) return std::move(del).error();
        sqlite3_bind_int64(del.value().get(), 1, cutoff);
        sqlite3_bind_int64(del.value().get(), 2, current);
        if (sqlite3_step(del.value().get()) != SQLITE_DONE) {
            return StencilError(StencilError::IO,
                std::string("Failed to prune cache index: ") + sqlite3_errmsg(impl_->db));
        }
    }

    return Result<size_t>::ok(removed.size());
}

size_t CacheStore::size() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mem_mutex);
    return impl_->entries.size();
}

system_clock::time_point CacheStore::now() const {
    return impl_->clock();
}

std::chrono::seconds CacheStore::ttl() const {
    return impl_->ttl;
}

} // namespace stencil
