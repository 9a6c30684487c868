#include "cache/FingerprintCache.hpp"
#include "cache/FindingCodec.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <sqlite3.h>

namespace fs = std::filesystem;

namespace debtscan::cache {

namespace {

// Only these codes mean the file itself is unusable; BUSY, LOCKED and
// READONLY come from other processes and leave the store intact
bool is_damage_code(int rc) {
    rc &= 0xff;
    return rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB;
}

}  // namespace

// One SQLite handle plus its prepared statements. Used by one thread at a time.
struct FingerprintCache::Connection {
    sqlite3* db = nullptr;
    sqlite3_stmt* stmt_get = nullptr;
    sqlite3_stmt* stmt_fresh = nullptr;
    sqlite3_stmt* stmt_put = nullptr;
    sqlite3_stmt* stmt_count = nullptr;
    int last_rc = SQLITE_OK;  // most recent failure code

    ~Connection() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_get);
        fin(stmt_fresh);
        fin(stmt_put);
        fin(stmt_count);
        if (db) sqlite3_close(db);
    }

    std::string last_error() const {
        return db ? sqlite3_errmsg(db) : "no connection";
    }

    bool exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            last_rc = rc;
            util::Logger::error(std::string("FingerprintCache: SQL failed: ") +
                                (errmsg ? errmsg : "unknown"));
            sqlite3_free(errmsg);
            return false;
        }
        return true;
    }

    bool prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return true;
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            last_rc = rc;
            util::Logger::error("FingerprintCache: Prepare failed: " + last_error());
            out = nullptr;
            return false;
        }
        return true;
    }

    bool prepare_all() {
        return prepare("SELECT mtime_ns, size, schema, findings, checksum "
                       "FROM entries WHERE path = ?1", stmt_get) &&
               prepare("SELECT mtime_ns, size, schema FROM entries WHERE path = ?1", stmt_fresh) &&
               prepare("INSERT OR REPLACE INTO entries "
                       "(path, mtime_ns, size, schema, findings, checksum) "
                       "VALUES (?1, ?2, ?3, ?4, ?5, ?6)", stmt_put) &&
               prepare("SELECT COUNT(*) FROM entries", stmt_count);
    }
};

// ---------------------------------------------------------------------------
// Lease
// ---------------------------------------------------------------------------

FingerprintCache::Lease::Lease(const FingerprintCache& owner, std::unique_ptr<Connection> conn,
                               uint64_t generation)
    : owner_(&owner), conn_(std::move(conn)), generation_(generation) {}

FingerprintCache::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_), conn_(std::move(other.conn_)), generation_(other.generation_) {}

FingerprintCache::Lease::~Lease() {
    if (conn_ && owner_) {
        std::lock_guard<std::mutex> lock(owner_->pool_mutex_);
        // A handle from before close() may point at another database
        if (owner_->opened_ && owner_->generation_ == generation_) {
            owner_->idle_.push_back(std::move(conn_));
        }
    }
}

// ---------------------------------------------------------------------------
// FingerprintCache
// ---------------------------------------------------------------------------

FingerprintCache::FingerprintCache() = default;

FingerprintCache::~FingerprintCache() {
    close();
}

fs::path FingerprintCache::default_path() {
    return util::Platform::get_cache_directory() / "cache.db";
}

std::unique_ptr<FingerprintCache::Connection> FingerprintCache::open_connection(
    const fs::path& path, int* failure_code) const {
    auto conn = std::make_unique<Connection>();
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &conn->db, flags, nullptr);
    if (rc != SQLITE_OK) {
        util::Logger::error("FingerprintCache: Cannot open " + path.string() + ": " +
                            conn->last_error());
        if (failure_code) *failure_code = rc;
        return nullptr;
    }
    sqlite3_busy_timeout(conn->db, busy_timeout_ms_);
    // journal_mode is stored in the file; synchronous is per connection
    if (!conn->exec("PRAGMA synchronous=NORMAL;")) {
        if (failure_code) *failure_code = conn->last_rc;
        return nullptr;
    }
    return conn;
}

bool FingerprintCache::initialize_store(Connection& conn) {
    // WAL keeps committed rows intact across a killed process
    if (!conn.exec("PRAGMA journal_mode=WAL;")) {
        return false;
    }

    {
        sqlite3_stmt* check = nullptr;
        int rc = sqlite3_prepare_v2(conn.db, "PRAGMA quick_check", -1, &check, nullptr);
        if (rc != SQLITE_OK) {
            conn.last_rc = rc;
            return false;
        }
        rc = sqlite3_step(check);
        bool healthy = false;
        if (rc == SQLITE_ROW) {
            const unsigned char* verdict = sqlite3_column_text(check, 0);
            healthy = verdict && std::string(reinterpret_cast<const char*>(verdict)) == "ok";
        }
        sqlite3_finalize(check);
        if (!healthy) {
            // A verdict other than "ok" is damage; a failed step keeps its own code
            conn.last_rc = rc == SQLITE_ROW ? SQLITE_CORRUPT : rc;
            util::Logger::warn("FingerprintCache: Integrity check failed");
            return false;
        }
    }

    if (!conn.exec("CREATE TABLE IF NOT EXISTS schema_info ("
                   "  key TEXT PRIMARY KEY,"
                   "  value TEXT NOT NULL);"
                   "CREATE TABLE IF NOT EXISTS entries ("
                   "  path TEXT PRIMARY KEY,"
                   "  mtime_ns INTEGER NOT NULL,"
                   "  size INTEGER NOT NULL,"
                   "  schema TEXT NOT NULL,"
                   "  findings BLOB NOT NULL,"
                   "  checksum TEXT NOT NULL);")) {
        return false;
    }

    std::optional<std::string> stored_version;
    {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(conn.db, "SELECT value FROM schema_info WHERE key = 'version'",
                                    -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            conn.last_rc = rc;
            return false;
        }
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char* text = sqlite3_column_text(stmt, 0);
            stored_version = text ? reinterpret_cast<const char*>(text) : "";
        }
        sqlite3_finalize(stmt);
    }

    if (stored_version && *stored_version == schema_version_) {
        return true;
    }

    if (stored_version) {
        util::Logger::warn("FingerprintCache: Schema version changed (" + *stored_version +
                           " -> " + schema_version_ + "), discarding all entries");
        invalidated_on_open_ = true;
    }

    sqlite3_stmt* stmt = nullptr;
    if (!conn.exec("BEGIN IMMEDIATE")) return false;
    bool ok = conn.exec("DELETE FROM entries");
    if (ok) {
        int rc = sqlite3_prepare_v2(conn.db,
            "INSERT OR REPLACE INTO schema_info (key, value) VALUES ('version', ?1)",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK) {
            sqlite3_bind_text(stmt, 1, schema_version_.c_str(), -1, SQLITE_TRANSIENT);
            rc = sqlite3_step(stmt);
        }
        ok = rc == SQLITE_DONE;
        if (!ok) conn.last_rc = rc;
    }
    if (stmt) sqlite3_finalize(stmt);

    if (!ok) {
        const int failure = conn.last_rc;
        if (!conn.exec("ROLLBACK")) {
            util::Logger::warn("FingerprintCache: Rollback failed: " + conn.last_error());
        }
        conn.last_rc = failure;
        return false;
    }
    return conn.exec("COMMIT");
}

void FingerprintCache::remove_database_files() const {
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm"}) {
        fs::remove(db_path_.string() + suffix, ec);
    }
}

bool FingerprintCache::open(const fs::path& db_path, const std::string& schema_version) {
    close();
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        db_path_ = db_path;
        schema_version_ = schema_version;
    }
    invalidated_on_open_ = false;

    std::error_code ec;
    if (db_path_.has_parent_path()) {
        fs::create_directories(db_path_.parent_path(), ec);
        if (ec) {
            util::Logger::error("FingerprintCache: Cannot create " +
                                db_path_.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    int failure = SQLITE_OK;
    auto conn = open_connection(db_path_, &failure);
    if (conn && initialize_store(*conn) && conn->prepare_all()) {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_.push_back(std::move(conn));
        opened_ = true;
        util::Logger::info("FingerprintCache: Opened " + db_path_.string());
        return true;
    }
    if (conn) {
        failure = conn->last_rc;
    }
    conn.reset();

    if (!is_damage_code(failure)) {
        util::Logger::warn("FingerprintCache: Store at " + db_path_.string() + " unavailable (" +
                           sqlite3_errstr(failure) + "), continuing without cache");
        return false;
    }

    // Unreadable or damaged store: start over with an empty one
    util::Logger::warn("FingerprintCache: Recreating damaged store at " + db_path_.string());
    remove_database_files();
    invalidated_on_open_ = true;

    conn = open_connection(db_path_);
    if (!conn || !initialize_store(*conn) || !conn->prepare_all()) {
        util::Logger::error("FingerprintCache: Could not recreate store at " + db_path_.string());
        return false;
    }

    std::lock_guard<std::mutex> lock(pool_mutex_);
    idle_.push_back(std::move(conn));
    opened_ = true;
    return true;
}

void FingerprintCache::close() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    idle_.clear();
    opened_ = false;
    generation_++;
}

bool FingerprintCache::is_open() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return opened_;
}

FingerprintCache::Lease FingerprintCache::acquire() const {
    fs::path path;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!opened_) {
            return Lease(*this, nullptr, generation_);
        }
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return Lease(*this, std::move(conn), generation_);
        }
        path = db_path_;
        generation = generation_;
    }

    // Pool exhausted: another worker gets its own handle
    auto conn = open_connection(path);
    if (conn && !conn->prepare_all()) {
        conn.reset();
    }
    return Lease(*this, std::move(conn), generation);
}

void FingerprintCache::invalidate_store(const std::string& reason) const {
    util::Logger::error("FingerprintCache: " + reason + ", invalidating all entries");
    auto conn = acquire();
    if (conn) {
        conn->exec("DELETE FROM entries");
    }
}

std::optional<CacheEntry> FingerprintCache::get(const std::string& path) const {
    auto conn = acquire();
    if (!conn) return std::nullopt;

    sqlite3_stmt* stmt = conn->stmt_get;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        if (rc != SQLITE_DONE) {
            util::Logger::warn("FingerprintCache: Lookup failed for " + path + ": " +
                               conn->last_error());
        }
        sqlite3_reset(stmt);
        return std::nullopt;
    }

    CacheEntry entry;
    entry.fingerprint.mtime_ns = sqlite3_column_int64(stmt, 0);
    entry.fingerprint.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
    if (const unsigned char* schema = sqlite3_column_text(stmt, 2)) {
        entry.schema_version = reinterpret_cast<const char*>(schema);
    }

    std::string blob;
    if (const void* data = sqlite3_column_blob(stmt, 3)) {
        blob.assign(static_cast<const char*>(data), static_cast<size_t>(sqlite3_column_bytes(stmt, 3)));
    }
    std::string stored_checksum;
    if (const unsigned char* sum = sqlite3_column_text(stmt, 4)) {
        stored_checksum = reinterpret_cast<const char*>(sum);
    }
    sqlite3_reset(stmt);

    if (FindingCodec::checksum(blob) != stored_checksum) {
        invalidate_store("Checksum mismatch for " + path);
        return std::nullopt;
    }

    auto findings = FindingCodec::decode(blob);
    if (!findings) {
        invalidate_store("Undecodable entry for " + path);
        return std::nullopt;
    }

    entry.findings = std::move(*findings);
    return entry;
}

bool FingerprintCache::put(const std::string& path,
                           const model::FileFingerprint& fingerprint,
                           const std::vector<model::FindingRecord>& findings) {
    auto conn = acquire();
    if (!conn) return false;

    std::string blob = FindingCodec::encode(findings);
    std::string sum = FindingCodec::checksum(blob);

    sqlite3_stmt* stmt = conn->stmt_put;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, fingerprint.mtime_ns);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(fingerprint.size));
    sqlite3_bind_text(stmt, 4, schema_version_.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 5, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, sum.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        util::Logger::warn("FingerprintCache: Store failed for " + path + ": " + conn->last_error());
        return false;
    }
    return true;
}

bool FingerprintCache::is_fresh(const std::string& path, const model::FileFingerprint& fingerprint) const {
    auto conn = acquire();
    if (!conn) return false;

    sqlite3_stmt* stmt = conn->stmt_fresh;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);

    bool fresh = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        model::FileFingerprint stored;
        stored.mtime_ns = sqlite3_column_int64(stmt, 0);
        stored.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        const unsigned char* schema = sqlite3_column_text(stmt, 2);
        fresh = stored == fingerprint && schema &&
                schema_version_ == reinterpret_cast<const char*>(schema);
    }
    sqlite3_reset(stmt);
    return fresh;
}

bool FingerprintCache::clear() {
    auto conn = acquire();
    if (!conn) return false;
    if (!conn->exec("DELETE FROM entries")) return false;
    util::Logger::info("FingerprintCache: Cleared " + db_path_.string());
    return true;
}

size_t FingerprintCache::size() const {
    auto conn = acquire();
    if (!conn) return 0;

    sqlite3_stmt* stmt = conn->stmt_count;
    sqlite3_reset(stmt);
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_reset(stmt);
    return count;
}

}  // namespace debtscan::cache
