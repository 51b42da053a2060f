#pragma once
#include "collection_registry.hpp"
#include "config.hpp"
#include "embedding.hpp"
#include "types.hpp"
#include <string>
#include <vector>

struct RetrievalOptions {
    int k{5};
    float score_threshold{0.0f};
    SearchType search_type{SearchType::similarity};
    int fetch_k{10};
    float mmr_lambda{0.5f};
};

RetrievalOptions retrieval_options(const RetrievalConfig& cfg);

// Maximal marginal relevance over `candidates` (best first, scores are query
// similarity). Picks up to k, trading relevance (lambda) against similarity
// to the picks so far.
std::vector<SearchHit> mmr_rerank(const VectorIndex& index, const std::vector<SearchHit>& candidates,
                                  int k, float lambda);

class Retriever {
public:
    Retriever(CollectionRegistry& registry, EmbeddingClient& embedder, EmbeddingConfig embed_cfg,
              RetrievalConfig cfg);

    std::vector<RetrievedChunk> retrieve(const std::string& collection_id, const std::string& query_text,
                                         int k, float score_threshold,
                                         const CancellationToken* cancel = nullptr);

    // On an already acquired collection. An empty index returns nothing
    // without calling the embedding service.
    std::vector<RetrievedChunk> retrieve(const Collection& collection, const std::string& query_text,
                                         const RetrievalOptions& opts,
                                         const CancellationToken* cancel = nullptr);

    const RetrievalConfig& config() const { return cfg_; }

private:
    CollectionRegistry& registry_;
    EmbeddingClient& embedder_;
    EmbeddingConfig embed_cfg_;
    RetrievalConfig cfg_;
};
