#include "../include/orchestrator.hpp"
#include "../include/chunker.hpp"
#include "../include/errors.hpp"
#include "../include/language.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>

Orchestrator::Orchestrator(const Config& cfg, EmbeddingClient& embedder, GenerationClient& generator,
                           BlobStore& blobs, SessionStore& sessions)
    : cfg_(cfg),
      embedder_(embedder),
      sessions_(sessions),
      sync_(blobs, cfg.storage, cfg.sync),
      registry_(sync_),
      retriever_(registry_, embedder, cfg.embedding, cfg.retrieval),
      synthesizer_(generator, cfg.generation, cfg.synthesis) {}

std::string Orchestrator::create_collection() {
    std::string id = gen_id();
    log_info("docqa", "created collection " + id);
    return id;
}

std::string Orchestrator::collection_id_for_document(const std::string& document_id) {
    return "doc-" + sha256_hex(document_id).substr(0, 32);
}

std::shared_ptr<const Collection> Orchestrator::commit(const std::string& collection_id,
                                                       const std::function<bool(Collection&)>& mutate,
                                                       const CancellationToken* cancel) {
    const int attempts = std::max(0, cfg_.sync.max_conflict_retries) + 1;
    for (int attempt = 1;; ++attempt) {
        check_cancel(cancel, "commit " + collection_id);
        auto base = registry_.acquire(collection_id, cancel);
        Collection working = *base;
        if (!mutate(working)) return base;
        try {
            sync_.persist(working, base->version + 1, cancel);
        } catch (const StaleVersion& e) {
            if (attempt >= attempts) {
                log_error("docqa", std::string("giving up on ") + collection_id + ": " + e.what());
                throw;
            }
            log_warn("docqa", std::string(e.what()) + "; reloading (attempt " + std::to_string(attempt) + "/" +
                              std::to_string(attempts) + ")");
            continue;
        }
        auto published = std::make_shared<const Collection>(working);
        registry_.update(std::move(working));
        return published;
    }
}

void Orchestrator::reembed_all(Collection& collection, const CancellationToken* cancel) {
    const std::string old_model = collection.index.model_version();
    auto chunks = collection.index.chunks();
    log_warn("docqa", "re-embedding " + std::to_string(chunks.size()) + " chunk(s) of " + collection.collection_id +
                      ": model changed from " + old_model + " to " + embedder_.model_version());
    auto embeddings = embed_chunks(embedder_, chunks, cfg_.embedding, cancel);
    VectorIndex rebuilt;
    for (size_t i = 0; i < chunks.size(); ++i) rebuilt.add(chunks[i], embeddings[i]);
    collection.index = std::move(rebuilt);
}

std::shared_ptr<const Collection> Orchestrator::migrate_model(const std::string& collection_id,
                                                              const CancellationToken* cancel) {
    auto lock = registry_.writer_lock(collection_id);
    const std::string model = embedder_.model_version();
    return commit(collection_id, [&](Collection& c) {
        if (c.index.empty() || c.index.model_version() == model) return false;
        reembed_all(c, cancel);
        return true;
    }, cancel);
}

IngestReport Orchestrator::ingest(const Document& doc, const std::string& collection_id,
                                  const CancellationToken* cancel) {
    if (doc.document_id.empty()) throw std::invalid_argument("document_id is empty");
    if (is_blank(doc.text)) throw IngestionFailed("document " + doc.document_id + " has no text content");
    if (doc.text.size() > cfg_.ingest.max_document_bytes) {
        throw IngestionFailed("document " + doc.document_id + " is " + std::to_string(doc.text.size()) +
                              " bytes, limit is " + std::to_string(cfg_.ingest.max_document_bytes));
    }
    if (!is_valid_utf8(doc.text)) throw IngestionFailed("document " + doc.document_id + " is not valid UTF-8");
    check_cancel(cancel, "ingest " + doc.document_id);

    IngestReport report;
    report.collection_id = collection_id.empty() ? collection_id_for_document(doc.document_id) : collection_id;
    report.document_id = doc.document_id;
    const std::string sha = sha256_hex(doc.text);
    const std::string model = embedder_.model_version();

    auto already_stored = [&](const Collection& c) {
        auto it = c.documents.find(doc.document_id);
        return it != c.documents.end() && it->second.sha256 == sha && c.index.model_version() == model;
    };
    {
        auto current = registry_.acquire(report.collection_id, cancel);
        if (already_stored(*current)) {
            report.version = current->version;
            report.chunk_count = current->documents.at(doc.document_id).chunk_count;
            report.unchanged = true;
            log_info("docqa", "ingest " + doc.document_id + ": unchanged, collection " + report.collection_id +
                              " stays at v" + std::to_string(report.version));
            return report;
        }
    }

    std::vector<Chunk> chunks = chunk_document(doc, cfg_.chunking);
    if (chunks.empty()) throw IngestionFailed("document " + doc.document_id + " produced no chunks");

    std::vector<Embedding> embeddings;
    try {
        embeddings = embed_chunks(embedder_, chunks, cfg_.embedding, cancel);
    } catch (const Cancelled&) {
        throw;
    } catch (const DocqaError& e) {
        throw IngestionFailed("embedding " + doc.document_id + " failed: " + e.what());
    }

    auto lock = registry_.writer_lock(report.collection_id);
    auto published = commit(report.collection_id, [&](Collection& c) {
        if (already_stored(c)) {
            report.unchanged = true;
            return false;
        }
        if (!c.index.empty() && c.index.model_version() != model) {
            try {
                reembed_all(c, cancel);
            } catch (const Cancelled&) {
                throw;
            } catch (const DocqaError& e) {
                throw IngestionFailed("re-embedding collection " + report.collection_id + " failed: " + e.what());
            }
        }
        std::size_t dropped = c.index.remove_document(doc.document_id);
        if (dropped > 0) log_info("docqa", "replacing " + std::to_string(dropped) + " chunk(s) of " + doc.document_id);
        for (size_t i = 0; i < chunks.size(); ++i) c.index.add(chunks[i], embeddings[i]);

        DocumentRecord rec;
        rec.document_id = doc.document_id;
        rec.source_name = doc.source_name;
        rec.sha256 = sha;
        rec.byte_size = doc.text.size();
        rec.chunk_count = (int)chunks.size();
        rec.ingested_at = now_ms();
        c.documents[doc.document_id] = rec;
        return true;
    }, cancel);

    report.version = published->version;
    report.chunk_count = report.unchanged ? published->documents.at(doc.document_id).chunk_count : (int)chunks.size();
    log_info("docqa", "ingested " + doc.document_id + " into " + report.collection_id + " v" +
                      std::to_string(report.version) + " (" + std::to_string(report.chunk_count) + " chunks)");
    return report;
}

AskResult Orchestrator::ask(const std::string& collection_id, const std::string& session_id,
                            const std::string& user_id, const std::string& question,
                            const CancellationToken* cancel) {
    if (collection_id.empty()) throw std::invalid_argument("collection_id is empty");
    if (user_id.empty()) throw std::invalid_argument("user_id is empty");
    if (is_blank(question)) throw std::invalid_argument("question is empty");
    check_cancel(cancel, "ask");

    AskResult result;
    auto collection = registry_.acquire(collection_id, cancel);
    if (collection->version == 0 || collection->index.empty()) {
        result.status = AskStatus::no_document_context;
        result.session_id = session_id;
        log_info("docqa", "ask on " + collection_id + ": no document context");
        return result;
    }
    if (collection->index.model_version() != embedder_.model_version()) {
        collection = migrate_model(collection_id, cancel);
    }

    result.session_id = session_id.empty() ? gen_id() : session_id;
    // Fail before spending a generation call; record_turn checks again.
    if (auto existing = sessions_.find_session(result.session_id)) {
        if (existing->user_id != user_id) {
            throw SessionConflict("session " + result.session_id + " belongs to another user");
        }
        if (existing->collection_id != collection_id) {
            throw SessionConflict("session " + result.session_id + " is bound to collection " +
                                  existing->collection_id);
        }
    }
    result.language_hint = detect_language_hint(question);

    auto retrieved = retriever_.retrieve(*collection, question, retrieval_options(cfg_.retrieval), cancel);
    Answer answer = synthesizer_.synthesize(question, retrieved, result.language_hint, cancel);
    check_cancel(cancel, "ask");

    result.turn = sessions_.record_turn(result.session_id, user_id, collection_id, question, answer.text,
                                        answer.citations, answer.outcome);
    log_info("docqa", "session " + result.session_id + " turn " + std::to_string(result.turn->sequence_index) +
                      ": " + to_string(answer.outcome) + " (" + std::to_string(answer.citations.size()) + " citation(s))");
    return result;
}

void Orchestrator::check_owner(const std::string& session_id, const std::string& user_id) {
    if (user_id.empty()) return;
    auto s = sessions_.find_session(session_id);
    if (s && s->user_id != user_id) throw SessionConflict("session " + session_id + " belongs to another user");
}

std::vector<ChatSession> Orchestrator::list_sessions(const std::string& user_id, int limit) {
    if (user_id.empty()) throw std::invalid_argument("user_id is empty");
    return sessions_.list_sessions(user_id, limit);
}

std::vector<Turn> Orchestrator::list_turns(const std::string& session_id, const std::string& user_id) {
    check_owner(session_id, user_id);
    return sessions_.list_turns(session_id);
}

bool Orchestrator::delete_session(const std::string& session_id, const std::string& user_id) {
    check_owner(session_id, user_id);
    return sessions_.delete_session(session_id);
}

bool Orchestrator::delete_collection(const std::string& collection_id) {
    if (collection_id.empty()) throw std::invalid_argument("collection_id is empty");
    auto lock = registry_.writer_lock(collection_id);
    bool removed = sync_.remove(collection_id);
    registry_.invalidate(collection_id);
    int sessions = sessions_.delete_sessions_for_collection(collection_id);
    log_info("docqa", "deleted collection " + collection_id + " (" + std::to_string(sessions) + " session(s))");
    return removed || sessions > 0;
}

std::vector<DocumentRecord> Orchestrator::list_documents(const std::string& collection_id) {
    auto collection = registry_.acquire(collection_id);
    std::vector<DocumentRecord> out;
    for (auto& kv : collection->documents) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), [](const DocumentRecord& a, const DocumentRecord& b) {
        if (a.ingested_at != b.ingested_at) return a.ingested_at < b.ingested_at;
        return a.document_id < b.document_id;
    });
    return out;
}
