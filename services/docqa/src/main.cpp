#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <vector>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <curl/curl.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "blob_store.hpp"
#include "config.hpp"
#include "embedding.hpp"
#include "errors.hpp"
#include "generation.hpp"
#include "log.hpp"
#include "orchestrator.hpp"
#include "session_store.hpp"
#include "util.hpp"

using json = nlohmann::json;

// libmicrohttpd 0.9.71 changed callback returns from int to enum MHD_Result.
#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MhdResult;
#else
typedef int MhdResult;
#endif

static std::unique_ptr<Orchestrator> g_docqa;
static std::size_t g_max_body_bytes = 0;
static volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    bool too_large{false};
};

static MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult send_json(struct MHD_Connection* conn, unsigned int status, const json& body) {
    return send_response(conn, status, body.dump());
}

static MhdResult send_error(struct MHD_Connection* conn, unsigned int status, const std::string& message) {
    return send_json(conn, status, json{{"error", message}});
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static std::string header(struct MHD_Connection* conn, const char* name) {
    const char* v = MHD_lookup_connection_value(conn, MHD_HEADER_KIND, name);
    return v ? std::string(v) : std::string();
}

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

static json turn_json(const Turn& t) {
    return json{
        {"session_id", t.session_id},
        {"sequence_index", t.sequence_index},
        {"question", t.question},
        {"answer", t.answer},
        {"citations", t.citations},
        {"outcome", to_string(t.outcome)},
        {"timestamp", format_timestamp(t.timestamp)}
    };
}

static json session_json(const ChatSession& s) {
    return json{
        {"session_id", s.session_id},
        {"user_id", s.user_id},
        {"collection_id", s.collection_id},
        {"created_at", format_timestamp(s.created_at)},
        {"turn_count", s.turn_count}
    };
}

static json document_json(const DocumentRecord& d) {
    return json{
        {"document_id", d.document_id},
        {"source_name", d.source_name},
        {"sha256", d.sha256},
        {"byte_size", d.byte_size},
        {"chunk_count", d.chunk_count},
        {"ingested_at", format_timestamp(d.ingested_at)}
    };
}

static unsigned int status_for(const std::exception& e) {
    if (dynamic_cast<const std::invalid_argument*>(&e) || dynamic_cast<const json::exception*>(&e)) return MHD_HTTP_BAD_REQUEST;
    if (dynamic_cast<const IngestionFailed*>(&e)) return MHD_HTTP_UNPROCESSABLE_ENTITY;
    if (dynamic_cast<const StaleVersion*>(&e) || dynamic_cast<const SessionConflict*>(&e)) return MHD_HTTP_CONFLICT;
    if (dynamic_cast<const EmbeddingUnavailable*>(&e) || dynamic_cast<const GenerationUnavailable*>(&e) ||
        dynamic_cast<const BlobUnavailable*>(&e) || dynamic_cast<const StorageBusy*>(&e)) {
        return MHD_HTTP_SERVICE_UNAVAILABLE;
    }
    if (dynamic_cast<const GenerationRejected*>(&e)) return MHD_HTTP_BAD_GATEWAY;
    return MHD_HTTP_INTERNAL_SERVER_ERROR;
}

static std::string required_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        throw std::invalid_argument(std::string(key) + " is required");
    }
    return j[key].get<std::string>();
}

static MhdResult route(struct MHD_Connection* connection, ConnInfo* ci) {
    const std::string& m = ci->method;
    auto parts = split_path(ci->url);

    if (m == "GET" && ci->url == "/health") {
        return send_json(connection, MHD_HTTP_OK, json{{"status", "ok"}});
    }
    if (m == "POST" && ci->url == "/collections") {
        return send_json(connection, MHD_HTTP_CREATED, json{{"collection_id", g_docqa->create_collection()}});
    }
    if (m == "POST" && ci->url == "/ingest") {
        auto j = json::parse(ci->body);
        Document doc;
        doc.document_id = required_field(j, "document_id");
        doc.text = j.value("text", std::string());
        doc.source_name = j.value("source_name", doc.document_id);
        auto r = g_docqa->ingest(doc, j.value("collection_id", std::string()));
        return send_json(connection, MHD_HTTP_OK, json{
            {"collection_id", r.collection_id},
            {"document_id", r.document_id},
            {"version", r.version},
            {"chunk_count", r.chunk_count},
            {"unchanged", r.unchanged}
        });
    }
    if (m == "POST" && ci->url == "/ask") {
        std::string user = header(connection, "X-User-Id");
        if (user.empty()) return send_error(connection, MHD_HTTP_UNAUTHORIZED, "X-User-Id header required");
        auto j = json::parse(ci->body);
        auto r = g_docqa->ask(required_field(j, "collection_id"), j.value("session_id", std::string()), user,
                              required_field(j, "question"));
        if (r.status == AskStatus::no_document_context) {
            return send_json(connection, MHD_HTTP_OK, json{{"status", "no_document_context"}});
        }
        json out = turn_json(*r.turn);
        out["status"] = "answered";
        out["language"] = r.language_hint;
        return send_json(connection, MHD_HTTP_OK, out);
    }
    if (parts.size() == 3 && parts[0] == "collections" && parts[2] == "documents" && m == "GET") {
        json arr = json::array();
        for (auto& d : g_docqa->list_documents(parts[1])) arr.push_back(document_json(d));
        return send_json(connection, MHD_HTTP_OK, json{{"collection_id", parts[1]}, {"documents", arr}});
    }
    if (parts.size() == 2 && parts[0] == "collections" && m == "DELETE") {
        bool removed = g_docqa->delete_collection(parts[1]);
        return send_json(connection, MHD_HTTP_OK, json{{"deleted", removed}});
    }
    if (parts.size() == 1 && parts[0] == "sessions" && m == "GET") {
        auto q = parse_query(connection);
        std::string user = q.count("user_id") ? q["user_id"] : header(connection, "X-User-Id");
        if (user.empty()) return send_error(connection, MHD_HTTP_BAD_REQUEST, "user_id query parameter required");
        int limit = q.count("limit") ? std::stoi(q["limit"]) : 50;
        json arr = json::array();
        for (auto& s : g_docqa->list_sessions(user, limit)) arr.push_back(session_json(s));
        return send_json(connection, MHD_HTTP_OK, json{{"sessions", arr}});
    }
    if (parts.size() == 3 && parts[0] == "sessions" && parts[2] == "turns" && m == "GET") {
        json arr = json::array();
        for (auto& t : g_docqa->list_turns(parts[1], header(connection, "X-User-Id"))) arr.push_back(turn_json(t));
        return send_json(connection, MHD_HTTP_OK, json{{"session_id", parts[1]}, {"turns", arr}});
    }
    if (parts.size() == 2 && parts[0] == "sessions" && m == "DELETE") {
        bool removed = g_docqa->delete_session(parts[1], header(connection, "X-User-Id"));
        return send_json(connection, MHD_HTTP_OK, json{{"deleted", removed}});
    }
    return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        if (ci->body.size() + *upload_data_size > g_max_body_bytes) ci->too_large = true;
        else ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }
    if (ci->too_large) {
        return send_error(connection, MHD_HTTP_PAYLOAD_TOO_LARGE, "request body exceeds " + std::to_string(g_max_body_bytes) + " bytes");
    }

    try {
        return route(connection, ci);
    } catch (const std::exception& e) {
        unsigned int status = status_for(e);
        if (status >= 500) log_error("http", ci->method + " " + ci->url + ": " + e.what());
        else log_warn("http", ci->method + " " + ci->url + ": " + e.what());
        return send_error(connection, status, e.what());
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = load_config_from_env();
        std::string file = getenv_or("DOCQA_CONFIG", "");
        if (argc > 2 && std::string(argv[1]) == "--config") file = argv[2];
        if (!file.empty()) load_config_file(cfg, file);
        validate_config(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[docqa] " << e.what() << std::endl;
        return 1;
    }
    set_log_level(parse_log_level(cfg.log_level));
    log_info("docqa", describe_config(cfg));

    curl_global_init(CURL_GLOBAL_DEFAULT);
    OllamaEmbeddingClient embedder(cfg.embedding);
    OllamaGenerationClient generator(cfg.generation);
    std::unique_ptr<SqliteBlobStore> blobs;
    std::unique_ptr<SessionStore> sessions;
    try {
        blobs = std::make_unique<SqliteBlobStore>(cfg.storage.blob_db_path, cfg.storage.busy_timeout_ms);
        sessions = std::make_unique<SessionStore>(cfg.storage.session_db_path, cfg.storage.busy_timeout_ms);
    } catch (const std::exception& e) {
        std::cerr << "[docqa] " << e.what() << std::endl;
        curl_global_cleanup();
        return 1;
    }
    g_docqa = std::make_unique<Orchestrator>(cfg, embedder, generator, *blobs, *sessions);
    // JSON escaping can double the size of the document text
    g_max_body_bytes = (std::size_t)cfg.ingest.max_document_bytes * 2 + 64 * 1024;

    std::cout << "[docqa] Starting HTTP server on port " << cfg.server.port << "...\n";
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)cfg.server.port,
                                            nullptr, nullptr, &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_THREAD_POOL_SIZE, (unsigned int)cfg.server.threads,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[docqa] Failed to start HTTP server" << std::endl;
        g_docqa.reset();
        curl_global_cleanup();
        return 1;
    }
    std::signal(SIGTERM, [](int){ g_stop = 1; });
    std::signal(SIGINT, [](int){ g_stop = 1; });
    while (!g_stop) pause();
    std::cout << "[docqa] Stopping\n";
    MHD_stop_daemon(d);
    g_docqa.reset();
    curl_global_cleanup();
    return 0;
}
