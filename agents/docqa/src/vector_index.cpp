#include "../include/vector_index.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <stdexcept>

VectorIndex::VectorIndex(std::string model_version) : model_version_(std::move(model_version)) {}

void VectorIndex::add(const Chunk& chunk, const Embedding& embedding) {
    if (chunk.chunk_id.empty()) throw std::invalid_argument("VectorIndex::add chunk_id is empty");
    if (chunk.chunk_id != embedding.chunk_id) {
        throw std::invalid_argument("VectorIndex::add embedding for " + embedding.chunk_id + " given with chunk " + chunk.chunk_id);
    }
    if (embedding.vector.empty()) throw std::invalid_argument("VectorIndex::add empty vector");

    if (!model_version_.empty() && embedding.model_version != model_version_) {
        throw DocqaError("VectorIndex::add model version " + embedding.model_version +
                         " does not match collection model " + model_version_);
    }
    if (entries_.empty()) {
        model_version_ = embedding.model_version;
        dimensions_ = (int)embedding.vector.size();
    } else {
        if ((int)embedding.vector.size() != dimensions_) {
            throw std::invalid_argument("VectorIndex::add dimension mismatch: " + std::to_string(embedding.vector.size()) +
                                        " vs " + std::to_string(dimensions_));
        }
    }

    Entry e{chunk, embedding.vector};
    normalize_l2(e.vector);
    entries_[chunk.chunk_id] = std::move(e);
}

std::vector<SearchHit> VectorIndex::search(const std::vector<float>& query, int k) const {
    if (k <= 0 || entries_.empty()) return {};
    if ((int)query.size() != dimensions_) {
        throw std::invalid_argument("VectorIndex::search dimension mismatch: " + std::to_string(query.size()) +
                                    " vs " + std::to_string(dimensions_));
    }
    std::vector<float> q = query;
    normalize_l2(q);

    struct Scored {
        const Entry* entry;
        float score;
    };
    std::vector<Scored> scored;
    scored.reserve(entries_.size());
    for (auto& kv : entries_) {
        const auto& v = kv.second.vector;
        double dot = 0.0;
        for (size_t i = 0; i < v.size(); ++i) dot += (double)v[i] * (double)q[i];
        scored.push_back({&kv.second, (float)dot});
    }

    auto better = [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.entry->chunk.sequence_index != b.entry->chunk.sequence_index) {
            return a.entry->chunk.sequence_index < b.entry->chunk.sequence_index;
        }
        return a.entry->chunk.chunk_id < b.entry->chunk.chunk_id;
    };
    const std::size_t top = std::min<std::size_t>((std::size_t)k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + top, scored.end(), better);

    std::vector<SearchHit> out;
    out.reserve(top);
    for (std::size_t i = 0; i < top; ++i) out.push_back({scored[i].entry->chunk.chunk_id, scored[i].score});
    return out;
}

std::size_t VectorIndex::remove_document(const std::string& document_id) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.chunk.document_id == document_id) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void VectorIndex::clear() {
    entries_.clear();
    model_version_.clear();
    dimensions_ = 0;
}

const Chunk* VectorIndex::find(const std::string& chunk_id) const {
    auto it = entries_.find(chunk_id);
    return it == entries_.end() ? nullptr : &it->second.chunk;
}

const std::vector<float>* VectorIndex::vector(const std::string& chunk_id) const {
    auto it = entries_.find(chunk_id);
    return it == entries_.end() ? nullptr : &it->second.vector;
}

static bool chunk_order(const Chunk& a, const Chunk& b) {
    if (a.document_id != b.document_id) return a.document_id < b.document_id;
    return a.sequence_index < b.sequence_index;
}

std::vector<Chunk> VectorIndex::chunks() const {
    std::vector<Chunk> out;
    out.reserve(entries_.size());
    for (auto& kv : entries_) out.push_back(kv.second.chunk);
    std::sort(out.begin(), out.end(), chunk_order);
    return out;
}

std::vector<Chunk> VectorIndex::chunks_of(const std::string& document_id) const {
    std::vector<Chunk> out;
    for (auto& kv : entries_) {
        if (kv.second.chunk.document_id == document_id) out.push_back(kv.second.chunk);
    }
    std::sort(out.begin(), out.end(), chunk_order);
    return out;
}
