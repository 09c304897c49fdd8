#pragma once
// Content digests and stable identities (SHA-256, lowercase hex).
//   content_digest(kind, payload) -- dedup key of a canonical entity
//   record_digest(raw)            -- every field of a parsed question
//   question_id(...)              -- stable across re-runs of the same file
//                                    and chunking configuration; an edited
//                                    question gets a new id
#include <cstdint>
#include <string>
#include <string_view>
#include "records.hpp"

namespace mdingest {

// Digest of the hashed payload field. Kinds live in separate collections,
// so the kind does not enter the digest.
std::string content_digest(EntityKind kind, std::string_view payload);

// Digest of question text, carried in failure reports for replay
std::string text_digest(std::string_view text);

// Identity of a source file: canonical path and size
std::string source_key(const std::string& canonical_path, uint64_t file_size);

// Digest over content, type, options, answer, explanation, images, formulas
std::string record_digest(const RawQuestionRecord& raw);

// 32 hex chars derived from source key, chunk range, position in the chunk
// and the record digest
std::string question_id(const std::string& source_key, const ByteRange& chunk,
                        uint32_t position, const std::string& record_hash);

} // namespace mdingest
