#pragma once
#include "blob_store.hpp"
#include "collection_registry.hpp"
#include "config.hpp"
#include "embedding.hpp"
#include "generation.hpp"
#include "retriever.hpp"
#include "session_store.hpp"
#include "sync_manager.hpp"
#include "synthesizer.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct IngestReport {
    std::string collection_id;
    std::string document_id;
    std::uint64_t version{0};
    int chunk_count{0};
    bool unchanged{false}; // same content and model already stored
};

enum class AskStatus {
    answered,
    no_document_context, // nothing ingested into the collection yet
};

struct AskResult {
    AskStatus status{AskStatus::answered};
    std::string session_id;
    std::string language_hint;
    std::optional<Turn> turn;
};

class Orchestrator {
public:
    Orchestrator(const Config& cfg, EmbeddingClient& embedder, GenerationClient& generator,
                 BlobStore& blobs, SessionStore& sessions);

    std::string create_collection();
    // Collection used when ingest is called without one.
    static std::string collection_id_for_document(const std::string& document_id);

    // Replaces any earlier version of the document in the collection.
    // Throws IngestionFailed (nothing stored), StaleVersion when concurrent
    // writers kept winning, Cancelled.
    IngestReport ingest(const Document& doc, const std::string& collection_id = "",
                        const CancellationToken* cancel = nullptr);

    // An empty session_id starts a new session.
    AskResult ask(const std::string& collection_id, const std::string& session_id, const std::string& user_id,
                  const std::string& question, const CancellationToken* cancel = nullptr);

    std::vector<ChatSession> list_sessions(const std::string& user_id, int limit = 50);
    // A non-empty user_id must own the session (SessionConflict otherwise).
    std::vector<Turn> list_turns(const std::string& session_id, const std::string& user_id = "");
    bool delete_session(const std::string& session_id, const std::string& user_id = "");
    // Snapshot, cached index and every session bound to the collection.
    bool delete_collection(const std::string& collection_id);
    std::vector<DocumentRecord> list_documents(const std::string& collection_id);

    const Config& config() const { return cfg_; }

private:
    // Copy of the latest collection -> mutate -> persist at version + 1 ->
    // publish, retried on StaleVersion. `mutate` returning false means
    // there is nothing to write. Caller holds the writer lock.
    std::shared_ptr<const Collection> commit(const std::string& collection_id,
                                             const std::function<bool(Collection&)>& mutate,
                                             const CancellationToken* cancel);
    void reembed_all(Collection& collection, const CancellationToken* cancel);
    std::shared_ptr<const Collection> migrate_model(const std::string& collection_id, const CancellationToken* cancel);
    void check_owner(const std::string& session_id, const std::string& user_id);

    Config cfg_;
    EmbeddingClient& embedder_;
    SessionStore& sessions_;
    SyncManager sync_;
    CollectionRegistry registry_;
    Retriever retriever_;
    AnswerSynthesizer synthesizer_;
};
