#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "ingest/errors.hpp"

namespace mdingest {

// Document store backend
enum class StoreSystem { POSTGRESQL, MEMORY };

inline const char* store_system_str(StoreSystem s) {
    switch (s) {
        case StoreSystem::POSTGRESQL: return "postgresql";
        case StoreSystem::MEMORY:     return "memory";
    }
    return "??";
}

inline StoreSystem parse_store_system(const std::string& s) {
    if (s == "postgresql") return StoreSystem::POSTGRESQL;
    if (s == "memory") return StoreSystem::MEMORY;
    throw ConfigError("unknown store system '" + s + "' (postgresql, memory)");
}

// Where chunk progress is persisted between runs
enum class ProgressBackend { FILE, REDIS, NONE };

inline const char* progress_backend_str(ProgressBackend b) {
    switch (b) {
        case ProgressBackend::FILE:  return "file";
        case ProgressBackend::REDIS: return "redis";
        case ProgressBackend::NONE:  return "none";
    }
    return "??";
}

inline ProgressBackend parse_progress_backend(const std::string& s) {
    if (s == "file") return ProgressBackend::FILE;
    if (s == "redis") return ProgressBackend::REDIS;
    if (s == "none") return ProgressBackend::NONE;
    throw ConfigError("unknown progress backend '" + s + "' (file, redis, none)");
}

// Connection info for the document store
struct StoreConnection {
    StoreSystem system = StoreSystem::POSTGRESQL;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user = "postgres";
    std::string password;
    std::string database = "postgres";
    std::string schema = "md_ingest";   // All collections live here
};

struct ProgressConfig {
    ProgressBackend backend = ProgressBackend::FILE;
    std::string path;                   // Empty: <input>.progress.jsonl
    std::string redis_host = "localhost";
    uint16_t redis_port = 6379;
    std::string redis_password;
    std::string key_prefix = "md-ingest:progress:";
};

// [A-Za-z_][A-Za-z0-9_]* -- schema names are spliced into SQL text
inline bool is_sql_identifier(const std::string& s) {
    if (s.empty() || s.size() > 63) return false;
    auto alpha = [](char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_'; };
    if (!alpha(s[0])) return false;
    for (char c : s) {
        if (!alpha(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

// Full ingestion configuration
struct IngestConfig {
    // Chunking
    uint64_t chunk_size_bytes = 10ull * 1024 * 1024;
    uint64_t max_boundary_search_bytes = 10000;

    // Workers (0 = derived, see effective_*)
    unsigned workers = 0;
    unsigned queue_depth = 0;

    // Writing and deduplication
    size_t batch_size = 1000;
    int retry_limit = 2;
    int retry_backoff_ms = 100;
    size_t dedup_cache_entries = 100000;

    StoreConnection store;
    ProgressConfig progress;

    // Behavior
    bool resume = true;
    bool reset_collections = false;
    bool dry_run = false;
    std::string report_path;
    std::string log_level = "info";

    [[nodiscard]] unsigned effective_workers() const {
        if (workers > 0) return workers;
        unsigned hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 1;
    }

    [[nodiscard]] unsigned effective_queue_depth() const {
        return queue_depth > 0 ? queue_depth : 2 * effective_workers();
    }

    [[nodiscard]] std::string progress_path_for(const std::string& input) const {
        return progress.path.empty() ? input + ".progress.jsonl" : progress.path;
    }

    void validate() const;

    static IngestConfig from_json(const nlohmann::json& j);
    static IngestConfig from_file(const std::string& path);
};

inline void IngestConfig::validate() const {
    if (chunk_size_bytes == 0)
        throw ConfigError("chunk_size_bytes must be greater than 0");
    if (max_boundary_search_bytes == 0)
        throw ConfigError("max_boundary_search_bytes must be greater than 0");
    if (batch_size == 0)
        throw ConfigError("batch_size must be greater than 0");
    if (retry_limit < 0)
        throw ConfigError("retry_limit must not be negative");
    if (retry_backoff_ms < 0)
        throw ConfigError("retry_backoff_ms must not be negative");
    if (store.system == StoreSystem::POSTGRESQL) {
        if (store.host.empty()) throw ConfigError("store.host must not be empty");
        if (store.port == 0) throw ConfigError("store.port must not be 0");
        if (!is_sql_identifier(store.schema))
            throw ConfigError("store.schema '" + store.schema + "' is not an SQL identifier");
    }
    if (progress.backend == ProgressBackend::REDIS) {
#ifndef MDINGEST_HAS_HIREDIS
        throw ConfigError("progress.backend 'redis' requires a build with hiredis");
#endif
        if (progress.redis_host.empty() || progress.redis_port == 0)
            throw ConfigError("progress.redis_host/redis_port must be set");
    }
    if (log_level != "debug" && log_level != "info" &&
        log_level != "warn" && log_level != "error")
        throw ConfigError("log_level '" + log_level + "' (debug, info, warn, error)");
}

inline IngestConfig IngestConfig::from_json(const nlohmann::json& j) {
    IngestConfig cfg;
    try {
        cfg.chunk_size_bytes = j.value("chunk_size_bytes", cfg.chunk_size_bytes);
        cfg.max_boundary_search_bytes =
            j.value("max_boundary_search_bytes", cfg.max_boundary_search_bytes);
        cfg.workers = j.value("workers", cfg.workers);
        cfg.queue_depth = j.value("queue_depth", cfg.queue_depth);
        cfg.batch_size = j.value("batch_size", cfg.batch_size);
        cfg.retry_limit = j.value("retry_limit", cfg.retry_limit);
        cfg.retry_backoff_ms = j.value("retry_backoff_ms", cfg.retry_backoff_ms);
        cfg.dedup_cache_entries = j.value("dedup_cache_entries", cfg.dedup_cache_entries);
        cfg.resume = j.value("resume", cfg.resume);
        cfg.reset_collections = j.value("reset_collections", cfg.reset_collections);
        cfg.report_path = j.value("report_path", cfg.report_path);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("store")) {
            const auto& s = j["store"];
            cfg.store.system = parse_store_system(
                s.value("system", std::string(store_system_str(cfg.store.system))));
            cfg.store.host = s.value("host", cfg.store.host);
            cfg.store.port = s.value("port", cfg.store.port);
            cfg.store.user = s.value("user", cfg.store.user);
            cfg.store.password = s.value("password", cfg.store.password);
            cfg.store.database = s.value("database", cfg.store.database);
            cfg.store.schema = s.value("schema", cfg.store.schema);
        }

        if (j.contains("progress")) {
            const auto& p = j["progress"];
            cfg.progress.backend = parse_progress_backend(
                p.value("backend", std::string(progress_backend_str(cfg.progress.backend))));
            cfg.progress.path = p.value("path", cfg.progress.path);
            cfg.progress.redis_host = p.value("redis_host", cfg.progress.redis_host);
            cfg.progress.redis_port = p.value("redis_port", cfg.progress.redis_port);
            cfg.progress.redis_password = p.value("redis_password", cfg.progress.redis_password);
            cfg.progress.key_prefix = p.value("key_prefix", cfg.progress.key_prefix);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return cfg;
}

inline IngestConfig IngestConfig::from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open config file " + path);

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigError(path + ": top level must be a JSON object");
    return from_json(j);
}

} // namespace mdingest
