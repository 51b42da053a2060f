#pragma once
#include "config.hpp"
#include "retry.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// External embedding service. One vector per input, same order.
// Throws EmbeddingUnavailable on quota, network or timeout failures.
class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;
    // Identifies the model; embeddings from different versions never mix.
    virtual std::string model_version() const = 0;
};

// Ollama /api/embed ({"model", "input": [...]} -> {"embeddings": [[...]]}).
class OllamaEmbeddingClient : public EmbeddingClient {
public:
    explicit OllamaEmbeddingClient(EmbeddingConfig cfg);

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;
    std::string model_version() const override;

private:
    EmbeddingConfig cfg_;
};

// Splits texts into batches of batch_size, retries each batch on
// EmbeddingUnavailable and checks count and dimension of the result.
std::vector<std::vector<float>> embed_texts(EmbeddingClient& client, const std::vector<std::string>& texts,
                                            int batch_size, const RetryPolicy& retry,
                                            const CancellationToken* cancel = nullptr);

std::vector<Embedding> embed_chunks(EmbeddingClient& client, const std::vector<Chunk>& chunks,
                                    const EmbeddingConfig& cfg, const CancellationToken* cancel = nullptr);
