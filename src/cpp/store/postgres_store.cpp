#include "postgres_store.hpp"
#include "../utils/timer.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace mdingest {

namespace {

// JSONB text of a document; invalid UTF-8 is replaced rather than thrown
std::string dump_document(const nlohmann::json& doc) {
    return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// First line of a libpq error message
std::string first_line(const char* msg) {
    std::string s = msg ? msg : "";
    auto nl = s.find('\n');
    if (nl != std::string::npos) s.resize(nl);
    return s;
}

// Conninfo value: single-quoted, with backslash and quote escaped
std::string conninfo_value(const std::string& v) {
    std::string out = "'";
    for (char c : v) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // namespace

std::string PostgresStore::build_conninfo(const StoreConnection& conn) {
    return "host=" + conninfo_value(conn.host) +
           " port=" + std::to_string(conn.port) +
           " dbname=" + conninfo_value(conn.database) +
           " user=" + conninfo_value(conn.user) +
           " password=" + conninfo_value(conn.password) +
           " connect_timeout=10 application_name=md-ingest";
}

bool PostgresStore::connect(const StoreConnection& conn) {
    conn_info_ = conn;
    schema_ = conn.schema;

    conn_ = PQconnectdb(build_conninfo(conn).c_str());
    if (PQstatus(conn_) != CONNECTION_OK) {
        LOG_ERR("[%s] Connection failed: %s", system_name(), PQerrorMessage(conn_));
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }

    LOG_INF("[%s] Connected to %s:%u/%s (server %s, schema %s)",
        system_name(), conn.host.c_str(), conn.port, conn.database.c_str(),
        PQparameterStatus(conn_, "server_version"), schema_.c_str());
    return true;
}

void PostgresStore::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresStore::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresStore::reconnect(const StoreConnection& conn) {
    if (conn_) {
        // PQreset reuses existing connection parameters -- faster than full reconnect
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) {
            LOG_INF("[%s] PQreset successful (server %s)",
                system_name(), PQparameterStatus(conn_, "server_version"));
            return true;
        }
        LOG_WRN("[%s] PQreset failed: %s -- falling back to full reconnect",
            system_name(), PQerrorMessage(conn_));
    }
    disconnect();
    return connect(conn);
}

bool PostgresStore::exec(const char* sql) {
    if (!conn_) return false;
    PGresult* res = PQexec(conn_, sql);
    bool ok = (PQresultStatus(res) == PGRES_COMMAND_OK ||
               PQresultStatus(res) == PGRES_TUPLES_OK);
    if (!ok) {
        LOG_ERR("[%s] SQL error: %s\n  SQL: %s", system_name(), PQerrorMessage(conn_), sql);
    }
    PQclear(res);
    return ok;
}

PGresult* PostgresStore::exec_params(const std::string& sql, int n, const char* const* values) {
    if (!is_connected() && !ensure_connected(3, 200)) return nullptr;

    PGresult* res = PQexecParams(conn_, sql.c_str(), n, nullptr, values, nullptr, nullptr, 0);
    ExecStatusType st = PQresultStatus(res);
    if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK && !is_connected()) {
        PQclear(res);
        if (!ensure_connected(3, 200)) return nullptr;
        res = PQexecParams(conn_, sql.c_str(), n, nullptr, values, nullptr, nullptr, 0);
    }
    return res;
}

// --- Collections ---

bool PostgresStore::create_collections() {
    LOG_INF("[%s] Creating collections in schema %s", system_name(), schema_.c_str());

    char sql[1024];
    std::snprintf(sql, sizeof(sql), "CREATE SCHEMA IF NOT EXISTS %s", schema_.c_str());
    if (!exec(sql)) return false;

    // Entity collections: unique index on content_hash is what makes
    // concurrent get-or-create safe
    for (EntityKind kind : ALL_ENTITY_KINDS) {
        const char* name = collection_for(kind);
        std::snprintf(sql, sizeof(sql),
            "CREATE TABLE IF NOT EXISTS %s.%s ("
            "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),"
            "  content_hash TEXT NOT NULL,"
            "  doc JSONB NOT NULL,"
            "  inserted_at TIMESTAMPTZ DEFAULT now(),"
            "  CONSTRAINT %s_content_hash_key UNIQUE (content_hash)"
            ")", schema_.c_str(), name, name);
        if (!exec(sql)) return false;
    }

    std::snprintf(sql, sizeof(sql),
        "CREATE TABLE IF NOT EXISTS %s.%s ("
        "  id TEXT PRIMARY KEY,"
        "  chunk_id TEXT NOT NULL,"
        "  question_type TEXT NOT NULL,"
        "  doc JSONB NOT NULL,"
        "  inserted_at TIMESTAMPTZ DEFAULT now()"
        ")", schema_.c_str(), collection::QUESTIONS);
    if (!exec(sql)) return false;

    std::snprintf(sql, sizeof(sql),
        "CREATE INDEX IF NOT EXISTS questions_question_type_idx "
        "ON %s.%s (question_type)", schema_.c_str(), collection::QUESTIONS);
    return exec(sql);
}

bool PostgresStore::drop_collections() {
    LOG_WRN("[%s] DROPPING schema %s (all ingested data will be lost!)",
        system_name(), schema_.c_str());

    char sql[256];
    std::snprintf(sql, sizeof(sql), "DROP SCHEMA IF EXISTS %s CASCADE", schema_.c_str());
    return exec(sql);
}

// --- Entities ---

LookupResult PostgresStore::find_entity(EntityKind kind, const std::string& content_hash) {
    LookupResult r;
    std::string sql = "SELECT id::text FROM " + table(collection_for(kind)) +
                      " WHERE content_hash = $1";
    const char* values[1] = {content_hash.c_str()};

    PGresult* res = exec_params(sql, 1, values);
    if (!res) {
        r.error = "not connected";
        return r;
    }
    if (PQresultStatus(res) != PGRES_TUPLES_OK) {
        r.error = first_line(PQerrorMessage(conn_));
        LOG_ERR("[%s] Lookup in %s failed: %s",
            system_name(), collection_for(kind), r.error.c_str());
    } else if (PQntuples(res) > 0) {
        r.found = true;
        r.id = PQgetvalue(res, 0, 0);
    }
    PQclear(res);
    return r;
}

InsertOutcome PostgresStore::insert_entity(const CanonicalEntity& entity) {
    InsertOutcome out;
    std::string sql = "INSERT INTO " + table(collection_for(entity.kind)) +
                      " (content_hash, doc) VALUES ($1, $2::jsonb)"
                      " ON CONFLICT (content_hash) DO NOTHING RETURNING id::text";
    std::string doc = dump_document(entity.to_document());
    const char* values[2] = {entity.content_hash.c_str(), doc.c_str()};

    PGresult* res = exec_params(sql, 2, values);
    if (!res) {
        out.error = "not connected";
        return out;
    }
    if (PQresultStatus(res) != PGRES_TUPLES_OK) {
        out.error = first_line(PQerrorMessage(conn_));
        LOG_ERR("[%s] Insert into %s failed: %s",
            system_name(), collection_for(entity.kind), out.error.c_str());
    } else if (PQntuples(res) == 1) {
        out.status = InsertStatus::INSERTED;
        out.id = PQgetvalue(res, 0, 0);
    } else {
        // DO NOTHING fired: another writer owns this content_hash
        out.status = InsertStatus::CONFLICT;
    }
    PQclear(res);
    return out;
}

// --- Questions ---

BulkWriteResult PostgresStore::insert_questions(const std::vector<FinalizedQuestionRecord>& batch) {
    BulkWriteResult result;
    if (batch.empty()) return result;

    Timer timer;
    timer.start();

    if (!is_connected() && !ensure_connected(3, 200)) {
        result.error = "not connected";
        return result;
    }

    const size_t rows_per_stmt = MAX_PARAMS / QUESTION_PARAMS;
    for (size_t begin = 0; begin < batch.size(); begin += rows_per_stmt) {
        size_t end = std::min(batch.size(), begin + rows_per_stmt);
        std::string error;
        if (!insert_question_rows(batch, begin, end, result, error)) {
            LOG_WRN("[%s] Multi-row insert of %zu questions failed (%s), "
                    "retrying row by row", system_name(), end - begin, error.c_str());
            if (!is_connected() && !ensure_connected(3, 200)) {
                for (size_t i = begin; i < end; ++i) result.rejected.push_back({i, error});
                continue;
            }
            insert_question_rows_isolated(batch, begin, end, result);
        }
    }

    timer.stop();
    result.duration_ns = timer.elapsed_ns();
    LOG_DBG("[%s] Wrote %zu questions: %lld inserted, %lld duplicates, %zu rejected, %lld ms",
        system_name(), batch.size(), static_cast<long long>(result.inserted),
        static_cast<long long>(result.duplicates), result.rejected.size(),
        static_cast<long long>(timer.elapsed_ms()));
    return result;
}

bool PostgresStore::insert_question_rows(const std::vector<FinalizedQuestionRecord>& batch,
                                         size_t begin, size_t end, BulkWriteResult& result,
                                         std::string& error) {
    const size_t rows = end - begin;
    std::vector<std::string> docs;
    docs.reserve(rows);
    std::vector<const char*> values;
    values.reserve(rows * QUESTION_PARAMS);

    std::string sql = "INSERT INTO " + table(collection::QUESTIONS) +
                      " (id, chunk_id, question_type, doc) VALUES ";
    char tuple[96];
    for (size_t r = 0; r < rows; ++r) {
        const auto& q = batch[begin + r];
        docs.push_back(dump_document(q.to_document()));
        size_t p = r * QUESTION_PARAMS;
        std::snprintf(tuple, sizeof(tuple), "%s($%zu, $%zu, $%zu, $%zu::jsonb)",
            r == 0 ? "" : ", ", p + 1, p + 2, p + 3, p + 4);
        sql += tuple;
    }
    sql += " ON CONFLICT (id) DO NOTHING RETURNING id";

    for (size_t r = 0; r < rows; ++r) {
        const auto& q = batch[begin + r];
        values.push_back(q.id.c_str());
        values.push_back(q.chunk_id.c_str());
        values.push_back(q.question_type.c_str());
        values.push_back(docs[r].c_str());
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    bool ok = PQresultStatus(res) == PGRES_TUPLES_OK;
    if (ok) {
        int64_t inserted = PQntuples(res);
        result.inserted += inserted;
        result.duplicates += static_cast<int64_t>(rows) - inserted;
    } else {
        error = first_line(PQerrorMessage(conn_));
    }
    PQclear(res);
    return ok;
}

void PostgresStore::insert_question_rows_isolated(const std::vector<FinalizedQuestionRecord>& batch,
                                                  size_t begin, size_t end,
                                                  BulkWriteResult& result) {
    std::string sql = "INSERT INTO " + table(collection::QUESTIONS) +
                      " (id, chunk_id, question_type, doc) VALUES ($1, $2, $3, $4::jsonb)"
                      " ON CONFLICT (id) DO NOTHING RETURNING id";

    if (!exec("BEGIN")) {
        for (size_t i = begin; i < end; ++i)
            result.rejected.push_back({i, "cannot open transaction"});
        return;
    }

    int64_t inserted = 0;
    int64_t duplicates = 0;
    std::vector<RecordRejection> rejected;
    for (size_t i = begin; i < end; ++i) {
        const auto& q = batch[i];
        std::string doc = dump_document(q.to_document());
        const char* values[4] = {q.id.c_str(), q.chunk_id.c_str(),
                                 q.question_type.c_str(), doc.c_str()};

        exec("SAVEPOINT row_insert");
        PGresult* res = PQexecParams(conn_, sql.c_str(), 4, nullptr, values,
                                     nullptr, nullptr, 0);
        if (PQresultStatus(res) == PGRES_TUPLES_OK) {
            if (PQntuples(res) == 1) ++inserted;
            else ++duplicates;
            exec("RELEASE SAVEPOINT row_insert");
        } else {
            std::string reason = first_line(PQerrorMessage(conn_));
            LOG_ERR("[%s] Question %s rejected: %s",
                system_name(), q.id.c_str(), reason.c_str());
            rejected.push_back({i, reason});
            exec("ROLLBACK TO SAVEPOINT row_insert");
        }
        PQclear(res);
    }

    if (exec("COMMIT")) {
        result.inserted += inserted;
        result.duplicates += duplicates;
        for (auto& r : rejected) result.rejected.push_back(std::move(r));
    } else {
        exec("ROLLBACK");
        for (size_t i = begin; i < end; ++i)
            result.rejected.push_back({i, "transaction commit failed"});
    }
}

int64_t PostgresStore::count(const std::string& collection) {
    bool known = collection == collection::QUESTIONS;
    for (EntityKind k : ALL_ENTITY_KINDS) known = known || collection == collection_for(k);
    if (!known || !conn_) return -1;

    std::string sql = "SELECT count(*) FROM " + table(collection.c_str());
    PGresult* res = PQexec(conn_, sql.c_str());
    if (PQresultStatus(res) != PGRES_TUPLES_OK) {
        LOG_ERR("[%s] Query error: %s", system_name(), PQerrorMessage(conn_));
        PQclear(res);
        return -1;
    }
    int64_t n = PQntuples(res) > 0 ? std::strtoll(PQgetvalue(res, 0, 0), nullptr, 10) : 0;
    PQclear(res);
    return n;
}

} // namespace mdingest
