#include "records.hpp"

namespace mdingest {

nlohmann::json CanonicalEntity::to_document() const {
    nlohmann::json doc = {{"content_hash", content_hash}};
    switch (kind) {
        case EntityKind::OPTION:
            doc["content"] = payload;
            break;
        case EntityKind::IMAGE:
            doc["url"] = payload;
            doc["alt"] = alt;
            break;
        case EntityKind::FORMULA:
            doc["formula"] = payload;
            break;
    }
    return doc;
}

nlohmann::json FinalizedQuestionRecord::to_document() const {
    nlohmann::json doc = {
        {"id", id},
        {"chunk_id", chunk_id},
        {"position", position},
        {"content", content},
        {"question_type", question_type},
        {"options", option_ids},
        {"images", image_ids},
        {"formulas", formula_ids},
        {"content_hash", content_hash}
    };
    doc["answer"] = answer ? nlohmann::json(*answer) : nlohmann::json(nullptr);
    doc["explanation"] = explanation ? nlohmann::json(*explanation) : nlohmann::json(nullptr);
    return doc;
}

nlohmann::json ChunkProgress::to_json() const {
    nlohmann::json j = {
        {"chunk_id", chunk_id},
        {"range", range},
        {"status", chunk_status_str(status)},
        {"attempts", attempts},
        {"updated_at", updated_at}
    };
    if (!reason.empty()) j["reason"] = reason;
    return j;
}

ChunkProgress ChunkProgress::from_json(const nlohmann::json& j) {
    ChunkProgress p;
    p.chunk_id = j.at("chunk_id").get<std::string>();
    p.range = j.at("range").get<ByteRange>();
    p.status = parse_chunk_status(j.value("status", "pending"));
    p.attempts = j.value("attempts", 0);
    p.reason = j.value("reason", "");
    p.updated_at = j.value("updated_at", "");
    return p;
}

} // namespace mdingest
