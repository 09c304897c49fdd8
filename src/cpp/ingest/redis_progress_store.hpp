#pragma once
#include <cstdint>
#include <string>
#include "progress_store.hpp"

namespace mdingest {

// Redis progress store -- one hash per run:
//   <prefix><run_key>  field = chunk id, value = JSON entry
//   <prefix>current    run key of the last started run
// Requires a build with hiredis (MDINGEST_HAS_HIREDIS).
class RedisProgressStore : public ProgressStore {
public:
    explicit RedisProgressStore(std::string key_prefix) : prefix_(std::move(key_prefix)) {}
    ~RedisProgressStore() override { disconnect(); }

    RedisProgressStore(const RedisProgressStore&) = delete;
    RedisProgressStore& operator=(const RedisProgressStore&) = delete;

    bool connect(const std::string& host, uint16_t port, const std::string& password);
    void disconnect();

    bool load(const std::string& run_key, std::vector<ChunkProgress>& out) override;
    bool reset(const std::string& run_key, const std::vector<ChunkProgress>& entries) override;
    bool save(const ChunkProgress& entry) override;

    [[nodiscard]] const char* name() const override { return "redis"; }

private:
    std::string prefix_;
    std::string hash_key_;      // Hash of the current run, set by reset()
    void* ctx_ = nullptr;       // redisContext*
};

} // namespace mdingest
