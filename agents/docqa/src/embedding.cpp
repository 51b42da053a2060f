#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

OllamaEmbeddingClient::OllamaEmbeddingClient(EmbeddingConfig cfg) : cfg_(std::move(cfg)) {}

std::string OllamaEmbeddingClient::model_version() const {
    return "ollama:" + cfg_.embed_model;
}

std::vector<std::vector<float>> OllamaEmbeddingClient::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    json body = {
        {"model", cfg_.embed_model},
        {"input", texts}
    };
    HttpResponse r;
    try {
        r = http_post_json(join_url(cfg_.ollama_url, "/api/embed"), body.dump(), cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw EmbeddingUnavailable(e.what());
    }
    if (!is_success_status(r.status)) {
        std::string msg = "embedding failed: status " + std::to_string(r.status) + " " + r.body.substr(0, 200);
        if (is_transient_status(r.status)) throw EmbeddingUnavailable(msg);
        throw DocqaError(msg);
    }
    std::vector<std::vector<float>> out;
    try {
        auto data = json::parse(r.body);
        for (auto& row : data.at("embeddings")) {
            std::vector<float> vec;
            vec.reserve(row.size());
            for (auto& v : row) vec.push_back(v.get<float>());
            out.push_back(std::move(vec));
        }
    } catch (const json::exception& e) {
        throw EmbeddingUnavailable(std::string("malformed embedding response: ") + e.what());
    }
    return out;
}

std::vector<std::vector<float>> embed_texts(EmbeddingClient& client, const std::vector<std::string>& texts,
                                            int batch_size, const RetryPolicy& retry,
                                            const CancellationToken* cancel) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    const std::size_t step = static_cast<std::size_t>(std::max(1, batch_size));
    std::size_t dim = 0;
    for (std::size_t begin = 0; begin < texts.size(); begin += step) {
        const std::size_t end = std::min(texts.size(), begin + step);
        std::vector<std::string> batch(texts.begin() + begin, texts.begin() + end);
        const std::string what = "embed batch " + std::to_string(begin / step + 1) + " (" + std::to_string(batch.size()) + " texts)";
        auto vectors = with_retry<EmbeddingUnavailable>(retry, "embed", what, [&]{
            auto v = client.embed(batch);
            if (v.size() != batch.size()) {
                throw EmbeddingUnavailable("embedding service returned " + std::to_string(v.size()) +
                                           " vectors for " + std::to_string(batch.size()) + " texts");
            }
            return v;
        }, cancel);
        for (auto& v : vectors) {
            if (v.empty()) throw DocqaError("embedding service returned an empty vector");
            if (dim == 0) dim = v.size();
            if (v.size() != dim) {
                throw DocqaError("embedding dimension changed within one request: " + std::to_string(dim) +
                                 " vs " + std::to_string(v.size()));
            }
            out.push_back(std::move(v));
        }
    }
    log_debug("embed", "embedded " + std::to_string(texts.size()) + " texts in " +
                       std::to_string((texts.size() + step - 1) / step) + " batch(es)");
    return out;
}

std::vector<Embedding> embed_chunks(EmbeddingClient& client, const std::vector<Chunk>& chunks,
                                    const EmbeddingConfig& cfg, const CancellationToken* cancel) {
    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (auto& c : chunks) texts.push_back(c.text);
    auto vectors = embed_texts(client, texts, cfg.batch_size, cfg.retry, cancel);
    const std::string version = client.model_version();
    std::vector<Embedding> out;
    out.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        out.push_back(Embedding{chunks[i].chunk_id, std::move(vectors[i]), version});
    }
    return out;
}
