#include "../include/session_store.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/sqlite_util.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>

using json = nlohmann::json;

static std::string encode_citations(const std::vector<std::string>& citations) {
    return json(citations).dump();
}

static std::vector<std::string> decode_citations(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) throw StorageError("turn citations are not a JSON array: " + text);
    std::vector<std::string> out;
    for (auto& c : j) {
        if (c.is_string()) out.push_back(c.get<std::string>());
    }
    return out;
}

static ChatSession read_session(Statement& st) {
    ChatSession s;
    s.session_id = st.column_text(0);
    s.user_id = st.column_text(1);
    s.collection_id = st.column_text(2);
    s.created_at = st.column_int64(3);
    s.turn_count = (int)st.column_int64(4);
    return s;
}

static const char* kSelectSession =
    "SELECT s.session_id, s.user_id, s.collection_id, s.created_at, "
    "(SELECT COUNT(*) FROM turns t WHERE t.session_id = s.session_id) "
    "FROM sessions s WHERE s.session_id = ?;";

SessionStore::SessionStore(const std::string& db_path, int busy_timeout_ms) {
    db_ = open_database(db_path, busy_timeout_ms);
    try {
        init();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SessionStore::~SessionStore() {
    if (db_) sqlite3_close(db_);
}

void SessionStore::init() {
    exec_sql(db_, "CREATE TABLE IF NOT EXISTS sessions (\n"
                  "  session_id TEXT PRIMARY KEY,\n"
                  "  user_id TEXT NOT NULL,\n"
                  "  collection_id TEXT NOT NULL,\n"
                  "  created_at INTEGER NOT NULL\n"
                  ");");
    exec_sql(db_, "CREATE TABLE IF NOT EXISTS turns (\n"
                  "  session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE,\n"
                  "  seq INTEGER NOT NULL,\n"
                  "  question TEXT NOT NULL,\n"
                  "  answer TEXT NOT NULL,\n"
                  "  citations TEXT NOT NULL,\n"
                  "  outcome TEXT NOT NULL,\n"
                  "  created_at INTEGER NOT NULL,\n"
                  "  PRIMARY KEY (session_id, seq)\n"
                  ");");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_sessions_user ON sessions(user_id, created_at);");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_sessions_collection ON sessions(collection_id);");
}

ChatSession SessionStore::ensure_session_locked(const std::string& session_id, const std::string& user_id,
                                                const std::string& collection_id) {
    if (session_id.empty()) throw std::invalid_argument("session_id is empty");
    std::optional<ChatSession> existing;
    {
        Statement st(db_, kSelectSession);
        st.bind_text(1, session_id);
        if (st.step()) existing = read_session(st);
    }
    if (existing) {
        if (existing->user_id != user_id) {
            throw SessionConflict("session " + session_id + " belongs to another user");
        }
        if (existing->collection_id != collection_id) {
            throw SessionConflict("session " + session_id + " is bound to collection " + existing->collection_id);
        }
        return *existing;
    }
    ChatSession s;
    s.session_id = session_id;
    s.user_id = user_id;
    s.collection_id = collection_id;
    s.created_at = now_ms();
    {
        Statement st(db_, "INSERT INTO sessions (session_id, user_id, collection_id, created_at) VALUES (?, ?, ?, ?);");
        st.bind_text(1, s.session_id);
        st.bind_text(2, s.user_id);
        st.bind_text(3, s.collection_id);
        st.bind_int64(4, s.created_at);
        st.step();
    }
    log_debug("sessions", "created session " + session_id + " for user " + user_id);
    return s;
}

// Caller holds db_mu_ and an open transaction, so the MAX(seq) read and the
// insert cannot interleave with another writer.
Turn SessionStore::insert_turn_locked(const std::string& session_id, const std::string& question,
                                      const std::string& answer, const std::vector<std::string>& citations,
                                      AnswerOutcome outcome) {
    Turn t;
    t.session_id = session_id;
    {
        Statement st(db_, "SELECT COALESCE(MAX(seq), -1) + 1 FROM turns WHERE session_id = ?;");
        st.bind_text(1, session_id);
        if (st.step()) t.sequence_index = (int)st.column_int64(0);
    }
    t.question = question;
    t.answer = answer;
    t.citations = citations;
    t.outcome = outcome;
    t.timestamp = now_ms();
    {
        Statement st(db_, "INSERT INTO turns (session_id, seq, question, answer, citations, outcome, created_at) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?);");
        st.bind_text(1, t.session_id);
        st.bind_int64(2, t.sequence_index);
        st.bind_text(3, t.question);
        st.bind_text(4, t.answer);
        st.bind_text(5, encode_citations(t.citations));
        st.bind_text(6, to_string(t.outcome));
        st.bind_int64(7, t.timestamp);
        st.step();
    }
    return t;
}

ChatSession SessionStore::ensure_session(const std::string& session_id, const std::string& user_id,
                                         const std::string& collection_id) {
    if (session_id.empty()) throw std::invalid_argument("session_id is empty");
    std::lock_guard<std::mutex> lk(db_mu_);
    Transaction tx(db_);
    ChatSession s = ensure_session_locked(session_id, user_id, collection_id);
    tx.commit();
    return s;
}

std::optional<ChatSession> SessionStore::find_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(db_mu_);
    Statement st(db_, kSelectSession);
    st.bind_text(1, session_id);
    if (!st.step()) return std::nullopt;
    return read_session(st);
}

Turn SessionStore::append_turn(const std::string& session_id, const std::string& question, const std::string& answer,
                               const std::vector<std::string>& citations, AnswerOutcome outcome) {
    std::lock_guard<std::mutex> lk(db_mu_);
    Transaction tx(db_);
    {
        Statement st(db_, "SELECT 1 FROM sessions WHERE session_id = ?;");
        st.bind_text(1, session_id);
        if (!st.step()) throw StorageError("append_turn: unknown session " + session_id);
    }
    Turn t = insert_turn_locked(session_id, question, answer, citations, outcome);
    tx.commit();
    return t;
}

Turn SessionStore::record_turn(const std::string& session_id, const std::string& user_id,
                               const std::string& collection_id, const std::string& question,
                               const std::string& answer, const std::vector<std::string>& citations,
                               AnswerOutcome outcome) {
    if (session_id.empty()) throw std::invalid_argument("session_id is empty");
    std::lock_guard<std::mutex> lk(db_mu_);
    Transaction tx(db_);
    ensure_session_locked(session_id, user_id, collection_id);
    Turn t = insert_turn_locked(session_id, question, answer, citations, outcome);
    tx.commit();
    return t;
}

std::vector<Turn> SessionStore::list_turns(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(db_mu_);
    Statement st(db_, "SELECT seq, question, answer, citations, outcome, created_at FROM turns "
                      "WHERE session_id = ? ORDER BY seq ASC;");
    st.bind_text(1, session_id);
    std::vector<Turn> out;
    while (st.step()) {
        Turn t;
        t.session_id = session_id;
        t.sequence_index = (int)st.column_int64(0);
        t.question = st.column_text(1);
        t.answer = st.column_text(2);
        t.citations = decode_citations(st.column_text(3));
        t.outcome = answer_outcome_from_string(st.column_text(4));
        t.timestamp = st.column_int64(5);
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<ChatSession> SessionStore::list_sessions(const std::string& user_id, int limit) {
    std::lock_guard<std::mutex> lk(db_mu_);
    Statement st(db_, "SELECT s.session_id, s.user_id, s.collection_id, s.created_at, "
                      "(SELECT COUNT(*) FROM turns t WHERE t.session_id = s.session_id) "
                      "FROM sessions s WHERE s.user_id = ? ORDER BY s.created_at DESC, s.rowid DESC LIMIT ?;");
    st.bind_text(1, user_id);
    st.bind_int64(2, limit > 0 ? limit : -1);
    std::vector<ChatSession> out;
    while (st.step()) out.push_back(read_session(st));
    return out;
}

bool SessionStore::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(db_mu_);
    Transaction tx(db_);
    {
        Statement st(db_, "DELETE FROM turns WHERE session_id = ?;");
        st.bind_text(1, session_id);
        st.step();
    }
    bool removed = false;
    {
        Statement st(db_, "DELETE FROM sessions WHERE session_id = ?;");
        st.bind_text(1, session_id);
        st.step();
        removed = sqlite3_changes(db_) > 0;
    }
    tx.commit();
    if (removed) log_info("sessions", "deleted session " + session_id);
    return removed;
}

int SessionStore::delete_sessions_for_collection(const std::string& collection_id) {
    std::lock_guard<std::mutex> lk(db_mu_);
    Transaction tx(db_);
    {
        Statement st(db_, "DELETE FROM turns WHERE session_id IN "
                          "(SELECT session_id FROM sessions WHERE collection_id = ?);");
        st.bind_text(1, collection_id);
        st.step();
    }
    int removed = 0;
    {
        Statement st(db_, "DELETE FROM sessions WHERE collection_id = ?;");
        st.bind_text(1, collection_id);
        st.step();
        removed = sqlite3_changes(db_);
    }
    tx.commit();
    if (removed > 0) log_info("sessions", "deleted " + std::to_string(removed) + " session(s) of collection " + collection_id);
    return removed;
}
