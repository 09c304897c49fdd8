#pragma once
// =============================================================================
// Record types flowing through the ingestion pipeline
//
//   ByteRange               -- chunk of the source file (FileChunker)
//   RawQuestionRecord       -- parser output, sub-entities still as payloads
//   CanonicalEntity         -- deduplicated option / image / formula
//   FinalizedQuestionRecord -- sub-entities replaced by canonical ids
//   ChunkProgress           -- per-chunk state for retry and resume
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mdingest {

// Half-open [start, end) byte offsets into the source file
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] uint64_t size() const { return end - start; }

    // Stable chunk identifier, also the key in the progress store
    [[nodiscard]] std::string id() const {
        return std::to_string(start) + "-" + std::to_string(end);
    }

    bool operator==(const ByteRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const ByteRange& o) const { return !(*this == o); }
};

inline void to_json(nlohmann::json& j, const ByteRange& r) {
    j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

inline void from_json(const nlohmann::json& j, ByteRange& r) {
    r.start = j.at("start").get<uint64_t>();
    r.end = j.at("end").get<uint64_t>();
}

// Question type tags produced by the default parser
namespace question_type {
    inline constexpr const char* MULTIPLE_CHOICE = "multiple_choice";
    inline constexpr const char* TRUE_FALSE      = "true_false";
    inline constexpr const char* FILL_IN_BLANK   = "fill_in_blank";
    inline constexpr const char* SUBJECTIVE      = "subjective";
}

struct RawImage {
    std::string url;
    std::string alt;
};

struct RawQuestionRecord {
    std::string content;
    std::string question_type;
    std::vector<std::string> options;
    std::optional<std::string> answer;
    std::optional<std::string> explanation;
    std::vector<RawImage> images;
    std::vector<std::string> formulas;
};

enum class EntityKind { OPTION, IMAGE, FORMULA };

inline constexpr EntityKind ALL_ENTITY_KINDS[] = {
    EntityKind::OPTION, EntityKind::IMAGE, EntityKind::FORMULA
};

inline const char* entity_kind_str(EntityKind k) {
    switch (k) {
        case EntityKind::OPTION:  return "option";
        case EntityKind::IMAGE:   return "image";
        case EntityKind::FORMULA: return "formula";
    }
    return "??";
}

// Store collection names
namespace collection {
    inline constexpr const char* QUESTIONS = "questions";
    inline constexpr const char* OPTIONS   = "options";
    inline constexpr const char* IMAGES    = "images";
    inline constexpr const char* FORMULAS  = "formulas";
}

inline const char* collection_for(EntityKind k) {
    switch (k) {
        case EntityKind::OPTION:  return collection::OPTIONS;
        case EntityKind::IMAGE:   return collection::IMAGES;
        case EntityKind::FORMULA: return collection::FORMULAS;
    }
    return "??";
}

// Deduplicated sub-entity. payload is the hashed field (option text, image
// URL, formula source); alt is stored for images but not hashed.
struct CanonicalEntity {
    std::string id;             // Assigned by the store
    EntityKind kind = EntityKind::OPTION;
    std::string payload;
    std::string alt;
    std::string content_hash;

    nlohmann::json to_document() const;
};

struct FinalizedQuestionRecord {
    std::string id;             // Stable: source key + chunk + position
    std::string chunk_id;
    uint32_t position = 0;      // Index within the chunk, parser order
    std::string content;
    std::string question_type;
    std::vector<std::string> option_ids;
    std::optional<std::string> answer;
    std::optional<std::string> explanation;
    std::vector<std::string> image_ids;
    std::vector<std::string> formula_ids;
    std::string content_hash;   // Digest of content, for failure reports

    nlohmann::json to_document() const;
};

enum class ChunkStatus { PENDING, IN_FLIGHT, DONE, FAILED };

inline const char* chunk_status_str(ChunkStatus s) {
    switch (s) {
        case ChunkStatus::PENDING:   return "pending";
        case ChunkStatus::IN_FLIGHT: return "in_flight";
        case ChunkStatus::DONE:      return "done";
        case ChunkStatus::FAILED:    return "failed";
    }
    return "??";
}

inline ChunkStatus parse_chunk_status(const std::string& s) {
    if (s == "in_flight") return ChunkStatus::IN_FLIGHT;
    if (s == "done")      return ChunkStatus::DONE;
    if (s == "failed")    return ChunkStatus::FAILED;
    return ChunkStatus::PENDING;
}

struct ChunkProgress {
    std::string chunk_id;
    ByteRange range;
    ChunkStatus status = ChunkStatus::PENDING;
    int attempts = 0;
    std::string reason;         // Last failure reason, empty otherwise
    std::string updated_at;

    nlohmann::json to_json() const;
    static ChunkProgress from_json(const nlohmann::json& j);
};

// A record the store rejected, or whose sub-entities could not be resolved
struct WriteFailure {
    std::string record_id;
    std::string chunk_id;
    std::string content_hash;
    std::string reason;
};

inline void to_json(nlohmann::json& j, const WriteFailure& f) {
    j = nlohmann::json{
        {"record_id", f.record_id},
        {"chunk_id", f.chunk_id},
        {"content_hash", f.content_hash},
        {"reason", f.reason}
    };
}

} // namespace mdingest
