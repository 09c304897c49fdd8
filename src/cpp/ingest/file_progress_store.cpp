#include "file_progress_store.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>

namespace mdingest {
namespace fs = std::filesystem;

bool FileProgressStore::load(const std::string& run_key, std::vector<ChunkProgress>& out) {
    out.clear();
    if (!fs::exists(path_)) {
        LOG_INF("[progress] No saved progress at %s", path_.c_str());
        return true;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        LOG_ERR("[progress] Cannot read %s", path_.c_str());
        return false;
    }

    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        if (!line.empty()) lines.push_back(std::move(line));
    }
    if (in.bad()) {
        LOG_ERR("[progress] Read error on %s", path_.c_str());
        return false;
    }
    if (lines.empty()) return true;

    auto header = nlohmann::json::parse(lines[0], nullptr, false);
    if (header.is_discarded() || !header.is_object() || !header.contains("run_key")) {
        LOG_WRN("[progress] %s has no valid header, ignoring saved progress", path_.c_str());
        return true;
    }
    std::string saved_key = header.value("run_key", "");
    if (saved_key != run_key) {
        LOG_WRN("[progress] %s belongs to another run (file or chunking changed), "
                "discarding saved progress", path_.c_str());
        return true;
    }

    std::map<std::string, ChunkProgress> latest;
    for (size_t i = 1; i < lines.size(); ++i) {
        auto j = nlohmann::json::parse(lines[i], nullptr, false);
        bool ok = !j.is_discarded() && j.is_object();
        if (ok) {
            try {
                ChunkProgress p = ChunkProgress::from_json(j);
                latest[p.chunk_id] = std::move(p);
            } catch (const nlohmann::json::exception&) {
                ok = false;
            }
        }
        if (!ok) {
            if (i + 1 == lines.size())
                LOG_WRN("[progress] Ignoring torn last entry in %s", path_.c_str());
            else
                LOG_WRN("[progress] Ignoring malformed entry on line %zu of %s",
                    i + 1, path_.c_str());
        }
    }

    for (auto& [id, p] : latest) out.push_back(std::move(p));
    std::sort(out.begin(), out.end(), [](const ChunkProgress& a, const ChunkProgress& b) {
        return a.range.start < b.range.start;
    });
    LOG_INF("[progress] Loaded %zu chunk entries from %s", out.size(), path_.c_str());
    return true;
}

bool FileProgressStore::reset(const std::string& run_key,
                              const std::vector<ChunkProgress>& entries) {
    if (out_.is_open()) out_.close();

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            LOG_ERR("[progress] Failed to write %s", tmp.c_str());
            return false;
        }
        nlohmann::json header = {{"run_key", run_key}, {"created_at", utc_timestamp()}};
        f << header.dump() << '\n';
        for (const auto& e : entries) f << e.to_json().dump() << '\n';
        f.flush();
        if (!f.good()) {
            LOG_ERR("[progress] Failed to write %s", tmp.c_str());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        LOG_ERR("[progress] Cannot replace %s: %s", path_.c_str(), ec.message().c_str());
        return false;
    }

    out_.open(path_, std::ios::app);
    if (!out_.is_open()) {
        LOG_ERR("[progress] Cannot append to %s", path_.c_str());
        return false;
    }
    LOG_DBG("[progress] Compacted %s (%zu entries)", path_.c_str(), entries.size());
    return true;
}

bool FileProgressStore::save(const ChunkProgress& entry) {
    if (!out_.is_open()) return false;
    out_ << entry.to_json().dump() << '\n';
    out_.flush();
    return out_.good();
}

} // namespace mdingest
