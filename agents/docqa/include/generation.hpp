#pragma once
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

struct ContextPassage {
    int number{0}; // 1-based label shown to the model as [n]
    std::string chunk_id;
    std::string text;
};

struct GenerationRequest {
    std::string instruction;
    std::string question;
    std::vector<ContextPassage> passages;
};

struct GenerationResponse {
    std::string text;
    std::optional<std::vector<int>> used_passages; // passage numbers, when the service reports them
    bool no_answer{false};
};

// External generation service.
// Throws GenerationUnavailable (transient) or GenerationRejected.
class GenerationClient {
public:
    virtual ~GenerationClient() = default;
    virtual GenerationResponse generate(const GenerationRequest& request) = 0;
};

// Ollama /api/chat in JSON mode. The model is asked for
// {"found": bool, "answer": string, "sources": [n, ...]}.
class OllamaGenerationClient : public GenerationClient {
public:
    explicit OllamaGenerationClient(GenerationConfig cfg);
    GenerationResponse generate(const GenerationRequest& request) override;

private:
    GenerationConfig cfg_;
};

std::string render_user_prompt(const GenerationRequest& request);

// Reads the model's JSON reply; plain text is kept as the answer.
GenerationResponse parse_generation_output(const std::string& content);
