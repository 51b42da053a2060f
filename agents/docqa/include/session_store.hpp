#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

// Chat sessions and their append-only turn log, in one SQLite file.
class SessionStore {
public:
    SessionStore(const std::string& db_path, int busy_timeout_ms);
    ~SessionStore();
    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Creates the session on first use. Throws SessionConflict when it
    // exists for another user or collection.
    ChatSession ensure_session(const std::string& session_id, const std::string& user_id,
                               const std::string& collection_id);
    std::optional<ChatSession> find_session(const std::string& session_id);

    // Assigns the next sequence_index for the session.
    Turn append_turn(const std::string& session_id, const std::string& question, const std::string& answer,
                     const std::vector<std::string>& citations, AnswerOutcome outcome);
    // ensure_session and append_turn in one transaction: a session never
    // exists without its first turn.
    Turn record_turn(const std::string& session_id, const std::string& user_id, const std::string& collection_id,
                     const std::string& question, const std::string& answer,
                     const std::vector<std::string>& citations, AnswerOutcome outcome);

    std::vector<Turn> list_turns(const std::string& session_id);
    // Newest first.
    std::vector<ChatSession> list_sessions(const std::string& user_id, int limit = 50);

    bool delete_session(const std::string& session_id);
    int delete_sessions_for_collection(const std::string& collection_id);

private:
    void init();
    ChatSession ensure_session_locked(const std::string& session_id, const std::string& user_id,
                                      const std::string& collection_id);
    Turn insert_turn_locked(const std::string& session_id, const std::string& question, const std::string& answer,
                            const std::vector<std::string>& citations, AnswerOutcome outcome);

    sqlite3* db_{nullptr};
    std::mutex db_mu_;
};
