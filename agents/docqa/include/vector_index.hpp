#pragma once
#include "types.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

struct SearchHit {
    std::string chunk_id;
    float score{0.0f};
};

// Exact nearest-neighbour index over the chunks of one collection.
// Vectors are stored unit-normalized, so search is a dot product (cosine).
class VectorIndex {
public:
    VectorIndex() = default;
    explicit VectorIndex(std::string model_version);

    // Inserts or overwrites by chunk_id. An index with no model yet adopts
    // the embedding's model version; one constructed or filled for a model
    // rejects any other, even while empty. The first vector fixes the dimension.
    void add(const Chunk& chunk, const Embedding& embedding);

    // Cosine similarity, descending. Ties: ascending sequence_index, then chunk_id.
    std::vector<SearchHit> search(const std::vector<float>& query, int k) const;

    std::size_t remove_document(const std::string& document_id);
    // Drops chunks, model version and dimension.
    void clear();

    const Chunk* find(const std::string& chunk_id) const;
    const std::vector<float>* vector(const std::string& chunk_id) const;
    // Ordered by document_id, then sequence_index.
    std::vector<Chunk> chunks() const;
    std::vector<Chunk> chunks_of(const std::string& document_id) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    int dimensions() const { return dimensions_; }
    const std::string& model_version() const { return model_version_; }

private:
    struct Entry {
        Chunk chunk;
        std::vector<float> vector;
    };

    std::string model_version_;
    int dimensions_{0};
    std::unordered_map<std::string, Entry> entries_;
};
