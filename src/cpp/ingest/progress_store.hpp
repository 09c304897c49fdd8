#pragma once
// Persistence behind ProgressTracker. Calls are serialized by the tracker;
// implementations need not be thread-safe. Failures are reported as false
// and logged, never thrown.
#include <string>
#include <vector>
#include "records.hpp"

namespace mdingest {

class ProgressStore {
public:
    virtual ~ProgressStore() = default;

    // Saved entries of run_key. State of a different run is discarded with a
    // warning and yields an empty list. False only on a read error.
    virtual bool load(const std::string& run_key, std::vector<ChunkProgress>& out) = 0;

    // Starts a run: replaces whatever is stored with exactly these entries
    virtual bool reset(const std::string& run_key, const std::vector<ChunkProgress>& entries) = 0;

    // Records one transition of the current run
    virtual bool save(const ChunkProgress& entry) = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

// Resume disabled
class NullProgressStore : public ProgressStore {
public:
    bool load(const std::string&, std::vector<ChunkProgress>& out) override {
        out.clear();
        return true;
    }
    bool reset(const std::string&, const std::vector<ChunkProgress>&) override { return true; }
    bool save(const ChunkProgress&) override { return true; }

    [[nodiscard]] const char* name() const override { return "none"; }
};

} // namespace mdingest
