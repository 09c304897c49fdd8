#include "redis_progress_store.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

#ifdef MDINGEST_HAS_HIREDIS
#include <hiredis/hiredis.h>
#endif

namespace mdingest {

bool RedisProgressStore::connect(const std::string& host, uint16_t port,
                                 const std::string& password) {
#ifdef MDINGEST_HAS_HIREDIS
    struct timeval timeout = {10, 0};
    auto* c = redisConnectWithTimeout(host.c_str(), port, timeout);
    if (!c || c->err) {
        LOG_ERR("[redis] Connection failed: %s", c ? c->errstr : "null context");
        if (c) redisFree(c);
        return false;
    }
    ctx_ = c;

    if (!password.empty()) {
        auto* auth = static_cast<redisReply*>(redisCommand(c, "AUTH %s", password.c_str()));
        if (!auth || auth->type == REDIS_REPLY_ERROR) {
            LOG_ERR("[redis] AUTH failed: %s", auth ? auth->str : "null");
            if (auth) freeReplyObject(auth);
            disconnect();
            return false;
        }
        freeReplyObject(auth);
    }

    auto* reply = static_cast<redisReply*>(redisCommand(c, "PING"));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
        LOG_ERR("[redis] PING failed: %s", reply ? reply->str : "null");
        if (reply) freeReplyObject(reply);
        disconnect();
        return false;
    }
    freeReplyObject(reply);

    LOG_INF("[redis] Connected to %s:%u (progress key-prefix: %s)",
        host.c_str(), port, prefix_.c_str());
    return true;
#else
    LOG_ERR("[redis] hiredis not available, Redis progress store disabled");
    (void)host;
    (void)port;
    (void)password;
    return false;
#endif
}

void RedisProgressStore::disconnect() {
#ifdef MDINGEST_HAS_HIREDIS
    if (ctx_) {
        redisFree(static_cast<redisContext*>(ctx_));
        ctx_ = nullptr;
    }
#endif
}

bool RedisProgressStore::load(const std::string& run_key, std::vector<ChunkProgress>& out) {
    out.clear();
#ifdef MDINGEST_HAS_HIREDIS
    if (!ctx_) return false;
    auto* c = static_cast<redisContext*>(ctx_);
    const std::string current_key = prefix_ + "current";

    auto* cur = static_cast<redisReply*>(redisCommand(c, "GET %s", current_key.c_str()));
    if (!cur || cur->type == REDIS_REPLY_ERROR) {
        LOG_ERR("[redis] GET %s failed: %s", current_key.c_str(), cur ? cur->str : "null");
        if (cur) freeReplyObject(cur);
        return false;
    }
    if (cur->type == REDIS_REPLY_STRING) {
        std::string previous(cur->str, cur->len);
        if (previous != run_key) {
            LOG_WRN("[redis] Saved progress belongs to another run (file or chunking "
                    "changed), discarding it");
            std::string old_key = prefix_ + previous;
            auto* del = static_cast<redisReply*>(redisCommand(c, "DEL %s", old_key.c_str()));
            if (del) freeReplyObject(del);
        }
    }
    freeReplyObject(cur);

    const std::string key = prefix_ + run_key;
    auto* reply = static_cast<redisReply*>(redisCommand(c, "HGETALL %s", key.c_str()));
    if (!reply || reply->type != REDIS_REPLY_ARRAY) {
        LOG_ERR("[redis] HGETALL %s failed: %s", key.c_str(),
            reply && reply->type == REDIS_REPLY_ERROR ? reply->str : "unexpected reply");
        if (reply) freeReplyObject(reply);
        return false;
    }

    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        auto* value = reply->element[i + 1];
        auto j = nlohmann::json::parse(std::string(value->str, value->len), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            LOG_WRN("[redis] Ignoring malformed entry for chunk %s", reply->element[i]->str);
            continue;
        }
        try {
            out.push_back(ChunkProgress::from_json(j));
        } catch (const nlohmann::json::exception& e) {
            LOG_WRN("[redis] Ignoring malformed entry for chunk %s: %s",
                reply->element[i]->str, e.what());
        }
    }
    freeReplyObject(reply);

    std::sort(out.begin(), out.end(), [](const ChunkProgress& a, const ChunkProgress& b) {
        return a.range.start < b.range.start;
    });
    LOG_INF("[redis] Loaded %zu chunk entries from %s", out.size(), key.c_str());
    return true;
#else
    (void)run_key;
    return false;
#endif
}

bool RedisProgressStore::reset(const std::string& run_key,
                               const std::vector<ChunkProgress>& entries) {
#ifdef MDINGEST_HAS_HIREDIS
    if (!ctx_) return false;
    auto* c = static_cast<redisContext*>(ctx_);
    hash_key_ = prefix_ + run_key;

    auto* del = static_cast<redisReply*>(redisCommand(c, "DEL %s", hash_key_.c_str()));
    if (!del || del->type == REDIS_REPLY_ERROR) {
        LOG_ERR("[redis] DEL %s failed", hash_key_.c_str());
        if (del) freeReplyObject(del);
        return false;
    }
    freeReplyObject(del);

    const std::string current_key = prefix_ + "current";
    auto* set = static_cast<redisReply*>(
        redisCommand(c, "SET %s %s", current_key.c_str(), run_key.c_str()));
    if (set) freeReplyObject(set);

    bool ok = true;
    for (const auto& e : entries) ok = save(e) && ok;
    return ok;
#else
    (void)run_key;
    (void)entries;
    return false;
#endif
}

bool RedisProgressStore::save(const ChunkProgress& entry) {
#ifdef MDINGEST_HAS_HIREDIS
    if (!ctx_ || hash_key_.empty()) return false;
    auto* c = static_cast<redisContext*>(ctx_);
    std::string value = entry.to_json().dump();

    auto* reply = static_cast<redisReply*>(
        redisCommand(c, "HSET %s %s %b", hash_key_.c_str(), entry.chunk_id.c_str(),
                     value.data(), value.size()));
    bool ok = reply && reply->type != REDIS_REPLY_ERROR;
    if (!ok) LOG_ERR("[redis] HSET %s failed: %s", hash_key_.c_str(),
                     reply ? reply->str : (c->err ? c->errstr : "null"));
    if (reply) freeReplyObject(reply);
    return ok;
#else
    (void)entry;
    return false;
#endif
}

} // namespace mdingest
