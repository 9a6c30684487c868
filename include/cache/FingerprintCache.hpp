#pragma once

#include "model/Finding.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace debtscan::cache {

struct CacheEntry {
    model::FileFingerprint fingerprint;
    std::vector<model::FindingRecord> findings;
    std::string schema_version;
};

/**
 * FingerprintCache: durable path -> (fingerprint, findings) store.
 *
 * Backed by SQLite in WAL mode. Each entry is one row holding the
 * fingerprint, the schema version, the encoded findings and a SHA-256 of
 * the encoding; a put is a single-row upsert, so a reader sees either the
 * complete previous entry or the complete new one.
 *
 * Invalidation is whole-store: a schema version different from the one the
 * store was written with, a failed integrity check at open, or a row whose
 * checksum does not match all leave the cache cold instead of failing.
 * A store that is merely busy or read-only is left alone and open() fails.
 *
 * Safe to share between scan workers. Connections are pooled internally;
 * callers never see a lock.
 */
class FingerprintCache {
public:
    static constexpr const char* CURRENT_SCHEMA_VERSION = "1";

    FingerprintCache();
    ~FingerprintCache();

    FingerprintCache(const FingerprintCache&) = delete;
    FingerprintCache& operator=(const FingerprintCache&) = delete;

    // <cache dir>/cache.db
    static std::filesystem::path default_path();

    [[nodiscard]] bool open(const std::filesystem::path& db_path,
                            const std::string& schema_version = CURRENT_SCHEMA_VERSION);
    void close();
    bool is_open() const;

    // Applies to connections opened afterwards
    void set_busy_timeout(std::chrono::milliseconds timeout) { busy_timeout_ms_ = static_cast<int>(timeout.count()); }

    [[nodiscard]] std::optional<CacheEntry> get(const std::string& path) const;
    bool put(const std::string& path,
             const model::FileFingerprint& fingerprint,
             const std::vector<model::FindingRecord>& findings);
    [[nodiscard]] bool is_fresh(const std::string& path, const model::FileFingerprint& fingerprint) const;
    bool clear();

    size_t size() const;

    // True when open() found a mismatched schema version or a damaged store
    bool was_invalidated_on_open() const { return invalidated_on_open_; }
    const std::string& schema_version() const { return schema_version_; }
    const std::filesystem::path& db_path() const { return db_path_; }

private:
    struct Connection;

    // Returns the connection to the pool when destroyed, unless the cache
    // was closed or reopened since the connection was handed out
    class Lease {
    public:
        Lease(const FingerprintCache& owner, std::unique_ptr<Connection> conn, uint64_t generation);
        ~Lease();
        Lease(Lease&&) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Connection* operator->() const { return conn_.get(); }
        explicit operator bool() const { return conn_ != nullptr; }

    private:
        const FingerprintCache* owner_;
        std::unique_ptr<Connection> conn_;
        uint64_t generation_;
    };

    Lease acquire() const;
    std::unique_ptr<Connection> open_connection(const std::filesystem::path& path,
                                                int* failure_code = nullptr) const;
    bool initialize_store(Connection& conn);
    void invalidate_store(const std::string& reason) const;
    void remove_database_files() const;

    std::filesystem::path db_path_;
    std::string schema_version_;
    bool invalidated_on_open_ = false;
    bool opened_ = false;
    uint64_t generation_ = 0;  // bumped by close(); guarded by pool_mutex_

    mutable std::mutex pool_mutex_;
    mutable std::vector<std::unique_ptr<Connection>> idle_;

    static constexpr int DEFAULT_BUSY_TIMEOUT_MS = 10000;
    int busy_timeout_ms_ = DEFAULT_BUSY_TIMEOUT_MS;
};

}  // namespace debtscan::cache
