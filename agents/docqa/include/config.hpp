#pragma once
#include "retry.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct ChunkingConfig {
    int target_size{1000};
    int overlap{200};
};

struct EmbeddingConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"nomic-embed-text"};
    int batch_size{32};
    int timeout_ms{60000};
    RetryPolicy retry{};
};

struct GenerationConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    float temperature{0.1f};
    int max_tokens{1000};
    int timeout_ms{240000};
    RetryPolicy retry{};
};

enum class SearchType {
    similarity,
    mmr, // maximal marginal relevance
};

struct RetrievalConfig {
    int k{5};
    int fetch_k{10};
    float score_threshold{0.0f};
    SearchType search_type{SearchType::mmr};
    float mmr_lambda{0.5f};
};

struct SynthesisConfig {
    int max_context_chars{8000};
    std::string not_found_text{"The answer could not be found in the document."};
};

struct StorageConfig {
    std::string blob_db_path{"./data/blobs.db"};
    std::string session_db_path{"./data/sessions.db"};
    std::string key_prefix{"collections/"};
    int busy_timeout_ms{5000};
};

struct SyncConfig {
    int max_conflict_retries{3};
    RetryPolicy retry{3, 200, 2.0, 2000};
};

struct IngestConfig {
    std::uint64_t max_document_bytes{50ull * 1024 * 1024};
};

struct ServerConfig {
    int port{8080};
    int threads{4};
};

struct Config {
    ChunkingConfig chunking;
    EmbeddingConfig embedding;
    GenerationConfig generation;
    RetrievalConfig retrieval;
    SynthesisConfig synthesis;
    StorageConfig storage;
    SyncConfig sync;
    IngestConfig ingest;
    ServerConfig server;
    std::string log_level{"info"};
};

SearchType parse_search_type(const std::string& name);
const char* to_string(SearchType type);

// Defaults overlaid by OLLAMA_URL, DOCQA_* environment variables.
Config load_config_from_env();
// Overlays the fields present in a JSON config file.
void load_config_file(Config& cfg, const std::filesystem::path& path);

std::vector<std::string> config_problems(const Config& cfg);
// Throws ConfigError naming every invalid field.
void validate_config(const Config& cfg);
std::string describe_config(const Config& cfg);
