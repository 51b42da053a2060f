#include "../include/blob_store.hpp"
#include "../include/config.hpp"
#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "../include/generation.hpp"
#include "../include/log.hpp"
#include "../include/orchestrator.hpp"
#include "../include/session_store.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <iostream>
#include <map>

static void usage() {
    std::cerr << "docqa_cli usage:\n"
              << "  create-collection\n"
              << "  ingest --file <path> [--document-id <id>] [--collection <id>]\n"
              << "  ask --collection <id> --user <id> --question \"...\" [--session <id>] [--top-k N]\n"
              << "  documents --collection <id>\n"
              << "  sessions --user <id> [--limit N]\n"
              << "  turns --session <id> [--user <id>]\n"
              << "  delete-session --session <id> [--user <id>]\n"
              << "  delete-collection --collection <id>\n"
              << "common flags: [--config <file.json>] [--ollama <url>] [--embed-model <name>] [--llm <name>]\n"
              << "              [--blob-db <file>] [--session-db <file>] [--log-level debug|info|warn|error]\n";
}

// --flag value pairs after the command; bare flags map to "1".
static std::map<std::string, std::string> parse_flags(int argc, char** argv) {
    std::map<std::string, std::string> out;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) throw std::invalid_argument("unexpected argument: " + a);
        std::string key = a.substr(2);
        if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) out[key] = argv[++i];
        else out[key] = "1";
    }
    return out;
}

static std::string flag(const std::map<std::string, std::string>& f, const std::string& key, const std::string& def = "") {
    auto it = f.find(key);
    return it == f.end() ? def : it->second;
}

static std::string required(const std::map<std::string, std::string>& f, const std::string& key) {
    std::string v = flag(f, key);
    if (v.empty()) throw std::invalid_argument("--" + key + " is required");
    return v;
}

static Config build_config(const std::map<std::string, std::string>& f) {
    Config cfg = load_config_from_env();
    std::string file = flag(f, "config", getenv_or("DOCQA_CONFIG", ""));
    if (!file.empty()) load_config_file(cfg, file);
    if (f.count("ollama")) cfg.embedding.ollama_url = cfg.generation.ollama_url = f.at("ollama");
    if (f.count("embed-model")) cfg.embedding.embed_model = f.at("embed-model");
    if (f.count("llm")) cfg.generation.llm_model = f.at("llm");
    if (f.count("blob-db")) cfg.storage.blob_db_path = f.at("blob-db");
    if (f.count("session-db")) cfg.storage.session_db_path = f.at("session-db");
    if (f.count("top-k")) cfg.retrieval.k = std::stoi(f.at("top-k"));
    if (f.count("log-level")) cfg.log_level = f.at("log-level");
    validate_config(cfg);
    return cfg;
}

static void print_turn(const Turn& t) {
    std::cout << "#" << t.sequence_index << " [" << to_string(t.outcome) << "] " << format_timestamp(t.timestamp) << "\n"
              << "Q: " << t.question << "\n"
              << "A: " << t.answer << "\n";
    if (!t.citations.empty()) {
        std::cout << "Sources:";
        for (auto& c : t.citations) std::cout << " " << c;
        std::cout << "\n";
    }
}

static bool known_command(const std::string& cmd) {
    static const char* cmds[] = {"create-collection", "ingest", "ask", "documents", "sessions",
                                 "turns", "delete-session", "delete-collection"};
    for (auto* c : cmds) if (cmd == c) return true;
    return false;
}

static int run(const std::string& cmd, const std::map<std::string, std::string>& f) {
    Config cfg = build_config(f);
    set_log_level(parse_log_level(cfg.log_level));

    OllamaEmbeddingClient embedder(cfg.embedding);
    OllamaGenerationClient generator(cfg.generation);
    SqliteBlobStore blobs(cfg.storage.blob_db_path, cfg.storage.busy_timeout_ms);
    SessionStore sessions(cfg.storage.session_db_path, cfg.storage.busy_timeout_ms);
    Orchestrator docqa(cfg, embedder, generator, blobs, sessions);

    if (cmd == "create-collection") {
        std::cout << docqa.create_collection() << "\n";
        return 0;
    }
    if (cmd == "ingest") {
        std::filesystem::path file = required(f, "file");
        Document doc;
        doc.text = read_text_file(file);
        doc.source_name = file.filename().string();
        doc.document_id = flag(f, "document-id", doc.source_name);
        auto r = docqa.ingest(doc, flag(f, "collection"));
        std::cout << "[OK] " << (r.unchanged ? "Unchanged" : "Ingested") << " " << r.document_id
                  << " into collection " << r.collection_id << " v" << r.version
                  << " (" << r.chunk_count << " chunks)\n";
        return 0;
    }
    if (cmd == "ask") {
        auto r = docqa.ask(required(f, "collection"), flag(f, "session"), required(f, "user"), required(f, "question"));
        if (r.status == AskStatus::no_document_context) {
            std::cout << "No document has been ingested into this collection yet.\n";
            return 3;
        }
        const Turn& t = *r.turn;
        std::cout << "\n==== Answer ====\n\n" << t.answer << "\n\n";
        std::cout << "==== Sources ====\n";
        int i = 1;
        for (auto& c : t.citations) std::cout << "[" << i++ << "] " << c << "\n";
        std::cout << "\nsession: " << r.session_id << " (turn " << t.sequence_index << ", " << to_string(t.outcome) << ")\n";
        return 0;
    }
    if (cmd == "documents") {
        for (auto& d : docqa.list_documents(required(f, "collection"))) {
            std::cout << d.document_id << "\t" << d.source_name << "\t" << d.byte_size << " bytes\t"
                      << d.chunk_count << " chunks\t" << format_timestamp(d.ingested_at) << "\n";
        }
        return 0;
    }
    if (cmd == "sessions") {
        int limit = std::stoi(flag(f, "limit", "50"));
        for (auto& s : docqa.list_sessions(required(f, "user"), limit)) {
            std::cout << s.session_id << "\t" << s.collection_id << "\t" << s.turn_count << " turns\t"
                      << format_timestamp(s.created_at) << "\n";
        }
        return 0;
    }
    if (cmd == "turns") {
        for (auto& t : docqa.list_turns(required(f, "session"), flag(f, "user"))) print_turn(t);
        return 0;
    }
    if (cmd == "delete-session") {
        bool removed = docqa.delete_session(required(f, "session"), flag(f, "user"));
        std::cout << (removed ? "[OK] Deleted" : "[OK] Nothing to delete") << "\n";
        return 0;
    }
    if (cmd == "delete-collection") {
        bool removed = docqa.delete_collection(required(f, "collection"));
        std::cout << (removed ? "[OK] Deleted" : "[OK] Nothing to delete") << "\n";
        return 0;
    }
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h" || cmd == "help") { usage(); return 0; }
    if (!known_command(cmd)) { usage(); return 1; }
    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 1;
    try {
        rc = run(cmd, parse_flags(argc, argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
