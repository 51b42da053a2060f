#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

SearchType parse_search_type(const std::string& name) {
    if (name == "similarity") return SearchType::similarity;
    if (name == "mmr") return SearchType::mmr;
    throw ConfigError("unknown search type: " + name);
}

const char* to_string(SearchType type) {
    return type == SearchType::mmr ? "mmr" : "similarity";
}

static float getenv_float_or(const char* key, float def) {
    std::string v = getenv_or(key, "");
    if (v.empty()) return def;
    try {
        return std::stof(v);
    } catch (const std::exception&) {
        throw ConfigError(std::string(key) + " is not a number: " + v);
    }
}

static int env_int(const char* key, int def) {
    try {
        return getenv_int_or(key, def);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

Config load_config_from_env() {
    Config cfg;
    const std::string ollama = getenv_or("OLLAMA_URL", cfg.embedding.ollama_url);
    cfg.embedding.ollama_url = getenv_or("DOCQA_EMBED_URL", ollama);
    cfg.embedding.embed_model = getenv_or("DOCQA_EMBED_MODEL", cfg.embedding.embed_model);
    cfg.embedding.batch_size = env_int("DOCQA_EMBED_BATCH", cfg.embedding.batch_size);
    cfg.embedding.timeout_ms = env_int("DOCQA_EMBED_TIMEOUT_MS", cfg.embedding.timeout_ms);

    cfg.generation.ollama_url = getenv_or("DOCQA_LLM_URL", ollama);
    cfg.generation.llm_model = getenv_or("DOCQA_LLM_MODEL", cfg.generation.llm_model);
    cfg.generation.temperature = getenv_float_or("DOCQA_TEMPERATURE", cfg.generation.temperature);
    cfg.generation.max_tokens = env_int("DOCQA_MAX_TOKENS", cfg.generation.max_tokens);
    cfg.generation.timeout_ms = env_int("DOCQA_LLM_TIMEOUT_MS", cfg.generation.timeout_ms);

    cfg.chunking.target_size = env_int("DOCQA_CHUNK_SIZE", cfg.chunking.target_size);
    cfg.chunking.overlap = env_int("DOCQA_CHUNK_OVERLAP", cfg.chunking.overlap);

    cfg.retrieval.k = env_int("DOCQA_TOP_K", cfg.retrieval.k);
    cfg.retrieval.fetch_k = env_int("DOCQA_FETCH_K", cfg.retrieval.fetch_k);
    cfg.retrieval.score_threshold = getenv_float_or("DOCQA_SCORE_THRESHOLD", cfg.retrieval.score_threshold);
    cfg.retrieval.search_type = parse_search_type(getenv_or("DOCQA_SEARCH_TYPE", to_string(cfg.retrieval.search_type)));

    cfg.storage.blob_db_path = getenv_or("DOCQA_BLOB_DB", cfg.storage.blob_db_path);
    cfg.storage.session_db_path = getenv_or("DOCQA_SESSION_DB", cfg.storage.session_db_path);
    cfg.storage.key_prefix = getenv_or("DOCQA_KEY_PREFIX", cfg.storage.key_prefix);

    cfg.server.port = env_int("DOCQA_PORT", cfg.server.port);
    cfg.server.threads = env_int("DOCQA_THREADS", cfg.server.threads);
    cfg.log_level = getenv_or("DOCQA_LOG_LEVEL", cfg.log_level);
    return cfg;
}

static void read_retry(const json& j, RetryPolicy& r) {
    if (!j.is_object()) return;
    r.max_attempts = j.value("max_attempts", r.max_attempts);
    r.initial_backoff_ms = j.value("initial_backoff_ms", r.initial_backoff_ms);
    r.multiplier = j.value("multiplier", r.multiplier);
    r.max_backoff_ms = j.value("max_backoff_ms", r.max_backoff_ms);
}

static const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) return empty;
    return *it;
}

void load_config_file(Config& cfg, const std::filesystem::path& path) {
    json root;
    try {
        root = json::parse(read_text_file(path));
    } catch (const json::exception& e) {
        throw ConfigError("invalid config file " + path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
    if (!root.is_object()) throw ConfigError("config file must hold a JSON object: " + path.string());

    try {
        const json& ch = section(root, "chunking");
        cfg.chunking.target_size = ch.value("target_size", cfg.chunking.target_size);
        cfg.chunking.overlap = ch.value("overlap", cfg.chunking.overlap);

        const json& em = section(root, "embedding");
        cfg.embedding.ollama_url = em.value("url", cfg.embedding.ollama_url);
        cfg.embedding.embed_model = em.value("model", cfg.embedding.embed_model);
        cfg.embedding.batch_size = em.value("batch_size", cfg.embedding.batch_size);
        cfg.embedding.timeout_ms = em.value("timeout_ms", cfg.embedding.timeout_ms);
        if (em.contains("retry")) read_retry(em["retry"], cfg.embedding.retry);

        const json& ge = section(root, "generation");
        cfg.generation.ollama_url = ge.value("url", cfg.generation.ollama_url);
        cfg.generation.llm_model = ge.value("model", cfg.generation.llm_model);
        cfg.generation.temperature = ge.value("temperature", cfg.generation.temperature);
        cfg.generation.max_tokens = ge.value("max_tokens", cfg.generation.max_tokens);
        cfg.generation.timeout_ms = ge.value("timeout_ms", cfg.generation.timeout_ms);
        if (ge.contains("retry")) read_retry(ge["retry"], cfg.generation.retry);

        const json& re = section(root, "retrieval");
        cfg.retrieval.k = re.value("k", cfg.retrieval.k);
        cfg.retrieval.fetch_k = re.value("fetch_k", cfg.retrieval.fetch_k);
        cfg.retrieval.score_threshold = re.value("score_threshold", cfg.retrieval.score_threshold);
        if (re.contains("search_type")) cfg.retrieval.search_type = parse_search_type(re["search_type"].get<std::string>());
        cfg.retrieval.mmr_lambda = re.value("mmr_lambda", cfg.retrieval.mmr_lambda);

        const json& sy = section(root, "synthesis");
        cfg.synthesis.max_context_chars = sy.value("max_context_chars", cfg.synthesis.max_context_chars);
        cfg.synthesis.not_found_text = sy.value("not_found_text", cfg.synthesis.not_found_text);

        const json& st = section(root, "storage");
        cfg.storage.blob_db_path = st.value("blob_db", cfg.storage.blob_db_path);
        cfg.storage.session_db_path = st.value("session_db", cfg.storage.session_db_path);
        cfg.storage.key_prefix = st.value("key_prefix", cfg.storage.key_prefix);
        cfg.storage.busy_timeout_ms = st.value("busy_timeout_ms", cfg.storage.busy_timeout_ms);

        const json& sn = section(root, "sync");
        cfg.sync.max_conflict_retries = sn.value("max_conflict_retries", cfg.sync.max_conflict_retries);
        if (sn.contains("retry")) read_retry(sn["retry"], cfg.sync.retry);

        const json& in = section(root, "ingest");
        cfg.ingest.max_document_bytes = in.value("max_document_bytes", cfg.ingest.max_document_bytes);

        const json& sv = section(root, "server");
        cfg.server.port = sv.value("port", cfg.server.port);
        cfg.server.threads = sv.value("threads", cfg.server.threads);

        cfg.log_level = root.value("log_level", cfg.log_level);
    } catch (const json::exception& e) {
        throw ConfigError("invalid config file " + path.string() + ": " + e.what());
    }
}

static void check_retry(std::vector<std::string>& out, const std::string& name, const RetryPolicy& r) {
    if (r.max_attempts < 1) out.push_back(name + ".max_attempts must be >= 1");
    if (r.initial_backoff_ms < 0) out.push_back(name + ".initial_backoff_ms must be >= 0");
    if (r.multiplier < 1.0) out.push_back(name + ".multiplier must be >= 1");
    if (r.max_backoff_ms < r.initial_backoff_ms) out.push_back(name + ".max_backoff_ms must be >= initial_backoff_ms");
}

std::vector<std::string> config_problems(const Config& cfg) {
    std::vector<std::string> out;
    if (cfg.chunking.target_size <= 0) out.push_back("chunking.target_size must be > 0");
    if (cfg.chunking.overlap < 0) out.push_back("chunking.overlap must be >= 0");
    if (cfg.chunking.overlap >= cfg.chunking.target_size) out.push_back("chunking.overlap must be < chunking.target_size");

    if (cfg.embedding.ollama_url.empty()) out.push_back("embedding.url is required");
    if (cfg.embedding.embed_model.empty()) out.push_back("embedding.model is required");
    if (cfg.embedding.batch_size <= 0) out.push_back("embedding.batch_size must be > 0");
    if (cfg.embedding.timeout_ms <= 0) out.push_back("embedding.timeout_ms must be > 0");
    check_retry(out, "embedding.retry", cfg.embedding.retry);

    if (cfg.generation.ollama_url.empty()) out.push_back("generation.url is required");
    if (cfg.generation.llm_model.empty()) out.push_back("generation.model is required");
    if (cfg.generation.temperature < 0.0f || cfg.generation.temperature > 2.0f) out.push_back("generation.temperature must be within [0, 2]");
    if (cfg.generation.max_tokens <= 0) out.push_back("generation.max_tokens must be > 0");
    if (cfg.generation.timeout_ms <= 0) out.push_back("generation.timeout_ms must be > 0");
    check_retry(out, "generation.retry", cfg.generation.retry);

    if (cfg.retrieval.k <= 0) out.push_back("retrieval.k must be > 0");
    if (cfg.retrieval.fetch_k < cfg.retrieval.k) out.push_back("retrieval.fetch_k must be >= retrieval.k");
    if (cfg.retrieval.score_threshold < -1.0f || cfg.retrieval.score_threshold > 1.0f) out.push_back("retrieval.score_threshold must be within [-1, 1]");
    if (cfg.retrieval.mmr_lambda < 0.0f || cfg.retrieval.mmr_lambda > 1.0f) out.push_back("retrieval.mmr_lambda must be within [0, 1]");

    if (cfg.synthesis.max_context_chars <= 0) out.push_back("synthesis.max_context_chars must be > 0");
    if (cfg.synthesis.not_found_text.empty()) out.push_back("synthesis.not_found_text is required");

    if (cfg.storage.blob_db_path.empty()) out.push_back("storage.blob_db is required");
    if (cfg.storage.session_db_path.empty()) out.push_back("storage.session_db is required");
    if (cfg.storage.busy_timeout_ms < 0) out.push_back("storage.busy_timeout_ms must be >= 0");

    if (cfg.sync.max_conflict_retries < 0) out.push_back("sync.max_conflict_retries must be >= 0");
    check_retry(out, "sync.retry", cfg.sync.retry);

    if (cfg.ingest.max_document_bytes == 0) out.push_back("ingest.max_document_bytes must be > 0");
    if (cfg.server.port <= 0 || cfg.server.port > 65535) out.push_back("server.port must be within [1, 65535]");
    if (cfg.server.threads <= 0) out.push_back("server.threads must be > 0");
    return out;
}

void validate_config(const Config& cfg) {
    auto problems = config_problems(cfg);
    if (problems.empty()) return;
    std::string msg = "invalid configuration:";
    for (auto& p : problems) msg += "\n  - " + p;
    throw ConfigError(msg);
}

std::string describe_config(const Config& cfg) {
    std::ostringstream os;
    os << "embed=" << cfg.embedding.embed_model << "@" << cfg.embedding.ollama_url
       << " llm=" << cfg.generation.llm_model << "@" << cfg.generation.ollama_url
       << " chunk=" << cfg.chunking.target_size << "/" << cfg.chunking.overlap
       << " k=" << cfg.retrieval.k << " search=" << to_string(cfg.retrieval.search_type)
       << " blob_db=" << cfg.storage.blob_db_path
       << " session_db=" << cfg.storage.session_db_path;
    return os.str();
}
