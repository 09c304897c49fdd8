#include "content_key.hpp"
#include "../utils/sha256.hpp"

namespace mdingest {

std::string content_digest(EntityKind /*kind*/, std::string_view payload) {
    return SHA256::hash_hex(payload);
}

std::string text_digest(std::string_view text) {
    return SHA256::hash_hex(text);
}

std::string source_key(const std::string& canonical_path, uint64_t file_size) {
    SHA256 ctx;
    ctx.update(canonical_path);
    ctx.update("\n");
    ctx.update(std::to_string(file_size));
    return SHA256::to_hex(ctx.finalize());
}

namespace {

// Length-prefixed so that field boundaries cannot shift between fields
void update_field(SHA256& ctx, std::string_view field) {
    ctx.update(std::to_string(field.size()));
    ctx.update(":");
    ctx.update(field);
}

} // namespace

std::string record_digest(const RawQuestionRecord& raw) {
    SHA256 ctx;
    update_field(ctx, raw.content);
    update_field(ctx, raw.question_type);
    ctx.update(std::to_string(raw.options.size()));
    for (const auto& o : raw.options) update_field(ctx, o);
    ctx.update(raw.answer ? "a" : "-");
    update_field(ctx, raw.answer.value_or(""));
    ctx.update(raw.explanation ? "e" : "-");
    update_field(ctx, raw.explanation.value_or(""));
    ctx.update(std::to_string(raw.images.size()));
    for (const auto& img : raw.images) {
        update_field(ctx, img.url);
        update_field(ctx, img.alt);
    }
    ctx.update(std::to_string(raw.formulas.size()));
    for (const auto& f : raw.formulas) update_field(ctx, f);
    return SHA256::to_hex(ctx.finalize());
}

std::string question_id(const std::string& source_key, const ByteRange& chunk,
                        uint32_t position, const std::string& record_hash) {
    SHA256 ctx;
    ctx.update(source_key);
    ctx.update("|");
    ctx.update(chunk.id());
    ctx.update("|");
    ctx.update(std::to_string(position));
    ctx.update("|");
    ctx.update(record_hash);
    return SHA256::to_hex(ctx.finalize()).substr(0, 32);
}

} // namespace mdingest
