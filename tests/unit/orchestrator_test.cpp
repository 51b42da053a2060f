#include "errors.hpp"
#include "orchestrator.hpp"

#include "../fakes.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using docqa_tests::ExtractAfter;
using docqa_tests::FakeEmbeddingClient;
using docqa_tests::Require;
using docqa_tests::RequireThrows;
using docqa_tests::ScriptedGenerationClient;
using docqa_tests::TempDir;

// Exactly `width` bytes: `head` followed by filler words.
std::string Paragraph(const std::string& head, std::size_t width = 78) {
    std::string out = head;
    const std::string filler = " lorem ipsum dolor sit amet consectetur adipiscing";
    while (out.size() < width) out += filler;
    return out.substr(0, width);
}

// Five 78-byte paragraphs; with 100/10 chunking the fourth paragraph sits
// wholly inside chunk 3 and nowhere else.
std::string HandbookText(const std::string& deadline = "30 September 2025") {
    std::vector<std::string> paras = {
        Paragraph("Welcome to our handbook."),
        Paragraph("Office hours run from nine to five."),
        Paragraph("Parking permits come from reception."),
        Paragraph("Submission deadline: " + deadline + "."),
        Paragraph("Expenses are reimbursed monthly."),
    };
    std::string text;
    for (std::size_t i = 0; i < paras.size(); ++i) {
        if (i) text += "\n\n";
        text += paras[i];
    }
    return text;
}

Document MakeDoc(const std::string& id, const std::string& text) {
    Document d;
    d.document_id = id;
    d.text = text;
    d.source_name = id + ".txt";
    return d;
}

Config HandbookConfig(const TempDir& dir) {
    Config cfg = docqa_tests::TestConfig(dir);
    cfg.chunking.target_size = 100;
    cfg.chunking.overlap = 10;
    return cfg;
}

struct Fixture {
    TempDir dir;
    Config cfg{HandbookConfig(dir)};
    FakeEmbeddingClient embedder{};
    ScriptedGenerationClient generator{[](const GenerationRequest& req) { return ExtractAfter(req, "deadline:"); }};
    SqliteBlobStore blobs{cfg.storage.blob_db_path, cfg.storage.busy_timeout_ms};
    SessionStore sessions{cfg.storage.session_db_path, cfg.storage.busy_timeout_ms};
    Orchestrator docqa{cfg, embedder, generator, blobs, sessions};

    // Independent view on the durable state.
    Collection Stored(const std::string& collection_id) {
        SyncManager sync(blobs, cfg.storage, cfg.sync);
        return sync.restore(collection_id);
    }
};

void ScenarioDeadlineQuestion() {
    docqa_tests::Log("scenario: deadline question answered with citation");
    Fixture f;
    const std::string cid = f.docqa.create_collection();
    const std::string text = HandbookText();
    auto report = f.docqa.ingest(MakeDoc("handbook", text), cid);
    Require(report.collection_id == cid && report.version == 1, "first ingest creates version 1");
    Require(report.chunk_count == 5 && !report.unchanged, "five chunks stored");

    auto result = f.docqa.ask(cid, "", "alice", "What is the deadline?");
    Require(result.status == AskStatus::answered, "answered");
    Require(!result.session_id.empty(), "new session id assigned");
    Require(result.language_hint == "English", "English question");
    Require(result.turn.has_value(), "turn recorded");
    const Turn& t = *result.turn;
    Require(t.outcome == AnswerOutcome::answered, "answered outcome");
    Require(t.answer.find("30 September 2025") != std::string::npos, "answer carries the deadline");
    Require(t.citations.size() == 1 && t.citations[0] == "handbook#3", "cites the chunk holding the deadline");
    Require(t.sequence_index == 0, "first turn of the session");

    // every citation points into the document's own text
    Collection stored = f.Stored(cid);
    for (const auto& id : t.citations) {
        const Chunk* c = stored.index.find(id);
        Require(c != nullptr, "cited chunk exists");
        Require(c->document_id == "handbook", "cited chunk belongs to the document");
        Require(c->char_end <= text.size() && text.substr(c->char_start, c->char_end - c->char_start) == c->text,
                "cited range matches the document text");
    }

    auto follow = f.docqa.ask(cid, result.session_id, "alice", "What is the deadline?");
    Require(follow.turn && follow.turn->sequence_index == 1, "same session continues");
    RequireThrows<SessionConflict>([&] { f.docqa.ask(cid, result.session_id, "bob", "What is the deadline?"); },
                                   "another user cannot reuse the session");
    auto turns = f.docqa.list_turns(result.session_id, "alice");
    Require(turns.size() == 2, "two turns in history");
    RequireThrows<SessionConflict>([&] { f.docqa.list_turns(result.session_id, "bob"); },
                                   "history hidden from other users");
}

void ScenarioNoDocumentContext() {
    docqa_tests::Log("scenario: no document context");
    Fixture f;
    const std::string cid = f.docqa.create_collection();
    auto result = f.docqa.ask(cid, "", "alice", "What is the deadline?");
    Require(result.status == AskStatus::no_document_context, "nothing ingested yet");
    Require(!result.turn.has_value(), "no turn recorded");
    Require(f.generator.calls() == 0 && f.embedder.calls() == 0, "no external calls");
    Require(f.docqa.list_sessions("alice").empty(), "no session created");
}

void ScenarioReingest() {
    docqa_tests::Log("scenario: re-ingest");
    Fixture f;
    auto first = f.docqa.ingest(MakeDoc("handbook", HandbookText()));
    Require(first.collection_id == Orchestrator::collection_id_for_document("handbook"), "derived collection id");
    const int embed_calls = f.embedder.calls();

    auto again = f.docqa.ingest(MakeDoc("handbook", HandbookText()));
    Require(again.unchanged && again.version == 1, "identical content leaves the version alone");
    Require(f.embedder.calls() == embed_calls, "identical content is not re-embedded");
    Require(f.Stored(first.collection_id).index.size() == 5, "no duplicate chunks");

    auto changed = f.docqa.ingest(MakeDoc("handbook", "Submission deadline: 1 March 2026."));
    Require(!changed.unchanged && changed.version == 2 && changed.chunk_count == 1, "new content replaces the old");
    Collection stored = f.Stored(first.collection_id);
    Require(stored.index.size() == 1 && stored.index.find("handbook#3") == nullptr, "old chunks purged");

    auto result = f.docqa.ask(first.collection_id, "", "alice", "What is the deadline?");
    Require(result.turn && result.turn->answer.find("1 March 2026") != std::string::npos, "answers from the new text");

    auto docs = f.docqa.list_documents(first.collection_id);
    Require(docs.size() == 1 && docs[0].chunk_count == 1 && docs[0].source_name == "handbook.txt", "manifest updated");
}

void ScenarioRejectedDocuments() {
    docqa_tests::Log("scenario: rejected documents");
    Fixture f;
    RequireThrows<IngestionFailed>([&] { f.docqa.ingest(MakeDoc("blank", "  \n\t ")); }, "blank text rejected");
    RequireThrows<std::invalid_argument>([&] { f.docqa.ingest(MakeDoc("", "text")); }, "missing id rejected");
    f.cfg.ingest.max_document_bytes = 10;
    Orchestrator small(f.cfg, f.embedder, f.generator, f.blobs, f.sessions);
    RequireThrows<IngestionFailed>([&] { small.ingest(MakeDoc("big", HandbookText())); }, "oversized text rejected");
    RequireThrows<IngestionFailed>([&] { f.docqa.ingest(MakeDoc("latin1", "caf\xE9 menu")); },
                                   "invalid UTF-8 rejected");
    RequireThrows<IngestionFailed>([&] { f.docqa.ingest(MakeDoc("stray", "tail \x80 byte")); },
                                   "stray continuation byte rejected");
    Require(f.embedder.calls() == 0, "rejected documents never reach the embedder");
}

void ScenarioEmbeddingFailureKeepsLastVersion() {
    docqa_tests::Log("scenario: embedding failure keeps last version");
    Fixture f;
    const std::string cid = f.docqa.create_collection();
    f.docqa.ingest(MakeDoc("handbook", HandbookText()), cid);

    f.embedder.fail_always(true);
    RequireThrows<IngestionFailed>([&] { f.docqa.ingest(MakeDoc("handbook", HandbookText("2 January 2026")), cid); },
                                   "persistent embedding outage fails the ingest");
    f.embedder.fail_always(false);

    Collection stored = f.Stored(cid);
    Require(stored.version == 1 && stored.index.size() == 5, "previous version untouched");
    auto result = f.docqa.ask(cid, "", "alice", "What is the deadline?");
    Require(result.turn && result.turn->answer.find("30 September 2025") != std::string::npos,
            "questions still answered from the old version");

    f.embedder.fail_next(2);
    auto retried = f.docqa.ingest(MakeDoc("handbook", HandbookText("2 January 2026")), cid);
    Require(retried.version == 2, "transient failures absorbed by retry");
}

void ScenarioCancellation() {
    docqa_tests::Log("scenario: cancellation");
    Fixture f;
    const std::string cid = f.docqa.create_collection();
    CancellationToken cancel;
    f.embedder.on_embed([&] { cancel.cancel(); });
    RequireThrows<Cancelled>([&] { f.docqa.ingest(MakeDoc("handbook", HandbookText()), cid, &cancel); },
                             "cancelled ingest stops");
    Require(f.Stored(cid).version == 0, "cancelled ingest persisted nothing");

    f.embedder.on_embed(nullptr);
    f.docqa.ingest(MakeDoc("handbook", HandbookText()), cid);
    CancellationToken stop;
    stop.cancel();
    RequireThrows<Cancelled>([&] { f.docqa.ask(cid, "s-cancel", "alice", "What is the deadline?", &stop); },
                             "cancelled ask stops");
    Require(f.docqa.list_turns("s-cancel").empty(), "cancelled ask recorded no turn");
}

void ScenarioFailedAskLeavesNoSession() {
    docqa_tests::Log("scenario: failed ask leaves no session");
    Fixture f;
    const std::string cid = f.docqa.create_collection();
    f.docqa.ingest(MakeDoc("handbook", HandbookText()), cid);
    f.generator.fail_next(10);
    RequireThrows<GenerationUnavailable>([&] { f.docqa.ask(cid, "s-fail", "alice", "What is the deadline?"); },
                                         "generation outage surfaces");
    Require(!f.sessions.find_session("s-fail").has_value(), "no session without a turn");
    Require(f.docqa.list_sessions("alice").empty(), "nothing listed for the user");

    f.generator.fail_next(0);
    auto ok = f.docqa.ask(cid, "s-fail", "alice", "What is the deadline?");
    Require(ok.turn && ok.turn->sequence_index == 0, "session created with its first turn");
    Require(f.sessions.find_session("s-fail")->turn_count == 1, "one turn recorded");
}

void ScenarioModelChangeReembeds() {
    docqa_tests::Log("scenario: model change re-embeds");
    Fixture f;
    const std::string cid = f.docqa.create_collection();
    f.docqa.ingest(MakeDoc("handbook", HandbookText()), cid);
    const int embedded = f.embedder.texts_embedded();

    f.embedder.set_model_version("fake:hash-v2");
    auto result = f.docqa.ask(cid, "", "alice", "What is the deadline?");
    Require(result.turn && result.turn->citations.size() == 1, "answered after migration");
    Require(f.embedder.texts_embedded() == embedded + 5 + 1, "all chunks re-embedded plus the query");

    Collection stored = f.Stored(cid);
    Require(stored.version == 2 && stored.index.model_version() == "fake:hash-v2", "migrated snapshot persisted");
    Require(stored.index.size() == 5, "no chunk lost in migration");

    f.embedder.set_model_version("fake:hash-v3");
    auto report = f.docqa.ingest(MakeDoc("notes", "Parking is free on weekends."), cid);
    Collection after = f.Stored(cid);
    Require(report.version == 3 && after.index.model_version() == "fake:hash-v3", "ingest migrates too");
    Require(after.index.size() == 6, "old and new documents share one model");
}

void ScenarioConcurrentIngestAcrossInstances() {
    docqa_tests::Log("scenario: concurrent ingest across instances");
    TempDir dir;
    Config cfg = HandbookConfig(dir);
    cfg.sync.max_conflict_retries = 10;
    const std::string cid = "shared";
    // create both files up front so the instances only open them
    SqliteBlobStore blobs(cfg.storage.blob_db_path, cfg.storage.busy_timeout_ms);
    SessionStore warm_sessions(cfg.storage.session_db_path, cfg.storage.busy_timeout_ms);

    std::vector<std::thread> threads;
    std::vector<std::string> errors(2);
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&, i] {
            // each thread is its own instance with its own handles
            FakeEmbeddingClient embedder;
            ScriptedGenerationClient generator([](const GenerationRequest& req) { return ExtractAfter(req, "deadline:"); });
            SqliteBlobStore blobs(cfg.storage.blob_db_path, cfg.storage.busy_timeout_ms);
            SessionStore sessions(cfg.storage.session_db_path, cfg.storage.busy_timeout_ms);
            Orchestrator docqa(cfg, embedder, generator, blobs, sessions);
            try {
                for (int n = 0; n < 3; ++n) {
                    const std::string id = "doc" + std::to_string(i) + "-" + std::to_string(n);
                    docqa.ingest(MakeDoc(id, "Note " + id + " mentions topic " + std::to_string(n) + "."), cid);
                }
            } catch (const std::exception& e) {
                errors[(std::size_t)i] = e.what();
            }
        });
    }
    for (auto& th : threads) th.join();
    Require(errors[0].empty() && errors[1].empty(), "conflicting writers retried to success");

    SyncManager sync(blobs, cfg.storage, cfg.sync);
    Collection stored = sync.restore(cid);
    Require(stored.documents.size() == 6 && stored.index.size() == 6, "no write lost");
    Require(stored.version == 6, "one version per successful write");
}

void ScenarioDeleteAndRecreateAcrossInstances() {
    docqa_tests::Log("scenario: delete and re-create across instances");
    Fixture f;
    const std::string cid = "shared";
    f.docqa.ingest(MakeDoc("old1", "Old note one about parking."), cid);
    f.docqa.ingest(MakeDoc("old2", "Old note two about lunch."), cid);
    Require(f.docqa.list_documents(cid).size() == 2, "first instance caches two documents");

    // second instance on the same files
    FakeEmbeddingClient embedder;
    ScriptedGenerationClient generator([](const GenerationRequest& req) { return ExtractAfter(req, "deadline:"); });
    SqliteBlobStore blobs(f.cfg.storage.blob_db_path, f.cfg.storage.busy_timeout_ms);
    SessionStore sessions(f.cfg.storage.session_db_path, f.cfg.storage.busy_timeout_ms);
    Orchestrator other(f.cfg, embedder, generator, blobs, sessions);
    Require(other.delete_collection(cid), "second instance deletes");
    Require(other.ingest(MakeDoc("new", "New note about the deadline."), cid).version == 1, "re-created at v1");

    auto docs = f.docqa.list_documents(cid);
    Require(docs.size() == 1 && docs[0].document_id == "new", "first instance sees the re-created collection");

    f.docqa.ingest(MakeDoc("another", "Another note about rooms."), cid);
    Collection stored = f.Stored(cid);
    Require(stored.version == 2, "write continues the new collection's versions");
    Require(stored.documents.size() == 2 && stored.documents.count("new") && stored.documents.count("another"),
            "re-created document kept");
    Require(!stored.documents.count("old1") && !stored.documents.count("old2"), "deleted documents stay deleted");
    Require(stored.index.chunks_of("old1").empty(), "no chunk of a deleted document");
}

void ScenarioDeleteCollection() {
    docqa_tests::Log("scenario: delete collection");
    Fixture f;
    const std::string cid = f.docqa.create_collection();
    f.docqa.ingest(MakeDoc("handbook", HandbookText()), cid);
    auto result = f.docqa.ask(cid, "", "alice", "What is the deadline?");
    Require(f.docqa.list_sessions("alice").size() == 1, "session listed");

    Require(f.docqa.delete_collection(cid), "collection deleted");
    Require(f.docqa.list_sessions("alice").empty(), "bound sessions deleted");
    Require(f.docqa.list_turns(result.session_id).empty(), "turns deleted");
    Require(f.Stored(cid).version == 0, "snapshot deleted");
    auto after = f.docqa.ask(cid, "", "alice", "What is the deadline?");
    Require(after.status == AskStatus::no_document_context, "deleted collection has no context");
    Require(!f.docqa.delete_collection(cid), "second delete finds nothing");

    RequireThrows<std::invalid_argument>([&] { f.docqa.ask(cid, "", "", "q"); }, "user id required");
    RequireThrows<std::invalid_argument>([&] { f.docqa.ask(cid, "", "alice", "   "); }, "question required");
}

}  // namespace

int main() {
    try {
        docqa_tests::Log("orchestrator_test: start");
        ScenarioDeadlineQuestion();
        ScenarioNoDocumentContext();
        ScenarioReingest();
        ScenarioRejectedDocuments();
        ScenarioEmbeddingFailureKeepsLastVersion();
        ScenarioCancellation();
        ScenarioFailedAskLeavesNoSession();
        ScenarioModelChangeReembeds();
        ScenarioConcurrentIngestAcrossInstances();
        ScenarioDeleteAndRecreateAcrossInstances();
        ScenarioDeleteCollection();
        docqa_tests::Log("orchestrator_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        docqa_tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
