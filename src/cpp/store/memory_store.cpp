#include "memory_store.hpp"
#include "../utils/timer.hpp"

namespace mdingest {

bool MemoryStore::connect(const StoreConnection& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    conn_info_ = conn;
    connected_ = true;
    LOG_DBG("[memory] Connected (in-process store)");
    return true;
}

void MemoryStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
}

bool MemoryStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MemoryStore::create_collections() {
    LOG_DBG("[memory] Collections are implicit");
    return true;
}

bool MemoryStore::drop_collections() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& c : entities_) {
        c.by_hash.clear();
        c.next_id = 0;
    }
    questions_.clear();
    question_order_.clear();
    LOG_WRN("[memory] Dropped all collections");
    return true;
}

LookupResult MemoryStore::find_entity(EntityKind kind, const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    LookupResult r;
    if (!connected_) {
        r.error = "not connected";
        return r;
    }
    const auto& c = collection_of(kind);
    auto it = c.by_hash.find(content_hash);
    if (it != c.by_hash.end()) {
        r.found = true;
        r.id = it->second.id;
    }
    return r;
}

InsertOutcome MemoryStore::insert_entity(const CanonicalEntity& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    InsertOutcome out;
    if (!connected_) {
        out.error = "not connected";
        return out;
    }
    if (entity.content_hash.empty()) {
        out.error = "empty content_hash";
        return out;
    }

    auto& c = collection_of(entity.kind);
    if (c.by_hash.count(entity.content_hash)) {
        out.status = InsertStatus::CONFLICT;
        return out;
    }

    CanonicalEntity stored = entity;
    stored.id = std::string(entity_kind_str(entity.kind)) + "-" + std::to_string(++c.next_id);
    out.status = InsertStatus::INSERTED;
    out.id = stored.id;
    c.by_hash.emplace(entity.content_hash, std::move(stored));
    return out;
}

std::string MemoryStore::check_question(const FinalizedQuestionRecord& q) const {
    if (q.id.empty()) return "missing id";
    if (q.content.empty() && q.option_ids.empty()) return "empty question document";
    return "";
}

BulkWriteResult MemoryStore::insert_questions(const std::vector<FinalizedQuestionRecord>& batch) {
    BulkWriteResult result;
    Timer timer;
    timer.start();

    // Validation runs outside the lock; subclasses may be slow on purpose
    std::vector<std::string> reasons(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) reasons[i] = check_question(batch[i]);

    std::lock_guard<std::mutex> lock(mutex_);
    ++bulk_write_calls_;
    if (!connected_) {
        result.error = "not connected";
        return result;
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        if (!reasons[i].empty()) {
            result.rejected.push_back({i, reasons[i]});
            continue;
        }
        const auto& q = batch[i];
        if (questions_.count(q.id)) {
            ++result.duplicates;
            continue;
        }
        questions_.emplace(q.id, q);
        question_order_.push_back(q.id);
        ++result.inserted;
    }

    timer.stop();
    result.duration_ns = timer.elapsed_ns();
    return result;
}

int64_t MemoryStore::count(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (collection == collection::QUESTIONS) return static_cast<int64_t>(questions_.size());
    for (EntityKind k : ALL_ENTITY_KINDS) {
        if (collection == collection_for(k))
            return static_cast<int64_t>(collection_of(k).by_hash.size());
    }
    return -1;
}

std::vector<CanonicalEntity> MemoryStore::entities(EntityKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CanonicalEntity> out;
    for (const auto& [hash, e] : collection_of(kind).by_hash) out.push_back(e);
    return out;
}

std::optional<FinalizedQuestionRecord> MemoryStore::question(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = questions_.find(id);
    if (it == questions_.end()) return std::nullopt;
    return it->second;
}

std::vector<FinalizedQuestionRecord> MemoryStore::questions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FinalizedQuestionRecord> out;
    out.reserve(question_order_.size());
    for (const auto& id : question_order_) out.push_back(questions_.at(id));
    return out;
}

int64_t MemoryStore::bulk_write_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bulk_write_calls_;
}

} // namespace mdingest
