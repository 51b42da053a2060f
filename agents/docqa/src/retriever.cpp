#include "../include/retriever.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

RetrievalOptions retrieval_options(const RetrievalConfig& cfg) {
    RetrievalOptions o;
    o.k = cfg.k;
    o.score_threshold = cfg.score_threshold;
    o.search_type = cfg.search_type;
    o.fetch_k = cfg.fetch_k;
    o.mmr_lambda = cfg.mmr_lambda;
    return o;
}

std::vector<SearchHit> mmr_rerank(const VectorIndex& index, const std::vector<SearchHit>& candidates,
                                  int k, float lambda) {
    std::vector<SearchHit> picked;
    if (k <= 0) return picked;
    std::vector<bool> used(candidates.size(), false);
    std::vector<const std::vector<float>*> vecs;
    vecs.reserve(candidates.size());
    for (auto& c : candidates) vecs.push_back(index.vector(c.chunk_id));

    while ((int)picked.size() < k && picked.size() < candidates.size()) {
        int best = -1;
        double best_score = -std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (used[i] || !vecs[i]) continue;
            double redundancy = 0.0;
            bool first = true;
            for (size_t j = 0; j < candidates.size(); ++j) {
                if (!used[j] || !vecs[j]) continue;
                double sim = cosine_similarity(*vecs[i], *vecs[j]);
                if (first || sim > redundancy) redundancy = sim;
                first = false;
            }
            double score = lambda * candidates[i].score - (1.0 - lambda) * redundancy;
            // strict > keeps the earlier (better ranked) candidate on ties
            if (score > best_score) {
                best_score = score;
                best = (int)i;
            }
        }
        if (best < 0) break;
        used[(size_t)best] = true;
        picked.push_back(candidates[(size_t)best]);
    }
    return picked;
}

Retriever::Retriever(CollectionRegistry& registry, EmbeddingClient& embedder, EmbeddingConfig embed_cfg,
                     RetrievalConfig cfg)
    : registry_(registry), embedder_(embedder), embed_cfg_(std::move(embed_cfg)), cfg_(std::move(cfg)) {}

std::vector<RetrievedChunk> Retriever::retrieve(const std::string& collection_id, const std::string& query_text,
                                                int k, float score_threshold, const CancellationToken* cancel) {
    auto collection = registry_.acquire(collection_id, cancel);
    RetrievalOptions opts = retrieval_options(cfg_);
    opts.k = k;
    opts.score_threshold = score_threshold;
    return retrieve(*collection, query_text, opts, cancel);
}

std::vector<RetrievedChunk> Retriever::retrieve(const Collection& collection, const std::string& query_text,
                                                const RetrievalOptions& opts, const CancellationToken* cancel) {
    if (opts.k <= 0) throw std::invalid_argument("retrieve: k must be positive");
    if (collection.index.empty()) return {};

    const std::string model = embedder_.model_version();
    if (model != collection.index.model_version()) {
        throw DocqaError("collection " + collection.collection_id + " was embedded with " +
                         collection.index.model_version() + ", query embedder is " + model);
    }
    auto vectors = embed_texts(embedder_, {query_text}, 1, embed_cfg_.retry, cancel);
    const std::vector<float>& q = vectors.at(0);

    std::vector<SearchHit> hits;
    if (opts.search_type == SearchType::mmr) {
        int fetch = std::max(opts.k, opts.fetch_k);
        auto candidates = collection.index.search(q, fetch);
        // threshold applies to relevance, before diversity picking
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&](const SearchHit& h){ return h.score < opts.score_threshold; }),
                         candidates.end());
        hits = mmr_rerank(collection.index, candidates, opts.k, opts.mmr_lambda);
    } else {
        hits = collection.index.search(q, opts.k);
        hits.erase(std::remove_if(hits.begin(), hits.end(),
                                  [&](const SearchHit& h){ return h.score < opts.score_threshold; }),
                   hits.end());
    }

    std::vector<RetrievedChunk> out;
    out.reserve(hits.size());
    for (auto& h : hits) {
        const Chunk* c = collection.index.find(h.chunk_id);
        if (c) out.push_back(RetrievedChunk{*c, h.score});
    }
    log_debug("retrieve", collection.collection_id + ": " + std::to_string(out.size()) + " chunk(s) for query (" +
                          to_string(opts.search_type) + ")");
    return out;
}
