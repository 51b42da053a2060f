#include "../include/blob_store.hpp"
#include "../include/errors.hpp"
#include "../include/sqlite_util.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sqlite3.h>

using json = nlohmann::json;

static std::string encode_metadata(const std::map<std::string, std::string>& metadata) {
    json j = json::object();
    for (auto& kv : metadata) j[kv.first] = kv.second;
    return j.dump();
}

static std::map<std::string, std::string> decode_metadata(const std::string& text) {
    std::map<std::string, std::string> out;
    if (text.empty()) return out;
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw StorageError("blob metadata is not a JSON object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

// Lock contention on the shared file is transient for callers of a blob store.
template <typename Fn>
static auto blob_call(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const StorageBusy& e) {
        throw BlobUnavailable(what + ": " + e.what());
    }
}

SqliteBlobStore::SqliteBlobStore(const std::string& db_path, int busy_timeout_ms) {
    db_ = open_database(db_path, busy_timeout_ms);
    try {
        init();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteBlobStore::~SqliteBlobStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteBlobStore::init() {
    exec_sql(db_, "CREATE TABLE IF NOT EXISTS blobs (\n"
                  "  key TEXT PRIMARY KEY,\n"
                  "  generation INTEGER NOT NULL,\n"
                  "  data BLOB NOT NULL,\n"
                  "  metadata TEXT NOT NULL DEFAULT '{}',\n"
                  "  updated_at INTEGER NOT NULL\n"
                  ");");
    // Last generation handed out per key, kept across removes so a
    // re-created key never repeats a generation an old reader saw.
    exec_sql(db_, "CREATE TABLE IF NOT EXISTS blob_generations (\n"
                  "  key TEXT PRIMARY KEY,\n"
                  "  last INTEGER NOT NULL\n"
                  ");");
}

std::optional<BlobObject> SqliteBlobStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    return blob_call("get " + key, [&]() -> std::optional<BlobObject> {
        Statement st(db_, "SELECT generation, metadata, data FROM blobs WHERE key = ?;");
        st.bind_text(1, key);
        if (!st.step()) return std::nullopt;
        BlobObject obj;
        obj.info.generation = st.column_int64(0);
        obj.info.metadata = decode_metadata(st.column_text(1));
        obj.data = st.column_blob(2);
        obj.info.size = obj.data.size();
        return obj;
    });
}

std::optional<BlobInfo> SqliteBlobStore::stat(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    return blob_call("stat " + key, [&]() -> std::optional<BlobInfo> {
        Statement st(db_, "SELECT generation, metadata, length(data) FROM blobs WHERE key = ?;");
        st.bind_text(1, key);
        if (!st.step()) return std::nullopt;
        BlobInfo info;
        info.generation = st.column_int64(0);
        info.metadata = decode_metadata(st.column_text(1));
        info.size = (std::uint64_t)st.column_int64(2);
        return info;
    });
}

std::int64_t SqliteBlobStore::put(const std::string& key, const std::string& data,
                                  const std::map<std::string, std::string>& metadata,
                                  const BlobPrecondition& precondition) {
    std::lock_guard<std::mutex> lk(mu_);
    return blob_call("put " + key, [&]() -> std::int64_t {
        Transaction tx(db_);
        std::int64_t current = 0;
        {
            Statement st(db_, "SELECT generation FROM blobs WHERE key = ?;");
            st.bind_text(1, key);
            if (st.step()) current = st.column_int64(0);
        }
        if (precondition.if_generation_match && *precondition.if_generation_match != current) {
            throw PreconditionFailed("blob " + key + " is at generation " + std::to_string(current) +
                                     ", expected " + std::to_string(*precondition.if_generation_match));
        }
        std::int64_t last = current;
        {
            Statement st(db_, "SELECT last FROM blob_generations WHERE key = ?;");
            st.bind_text(1, key);
            if (st.step()) last = std::max(last, st.column_int64(0));
        }
        const std::int64_t next = last + 1;
        {
            Statement st(db_, "INSERT OR REPLACE INTO blob_generations (key, last) VALUES (?, ?);");
            st.bind_text(1, key);
            st.bind_int64(2, next);
            st.step();
        }
        {
            Statement st(db_, "INSERT OR REPLACE INTO blobs (key, generation, data, metadata, updated_at) "
                              "VALUES (?, ?, ?, ?, ?);");
            st.bind_text(1, key);
            st.bind_int64(2, next);
            st.bind_blob(3, data);
            st.bind_text(4, encode_metadata(metadata));
            st.bind_int64(5, now_ms());
            st.step();
        }
        tx.commit();
        return next;
    });
}

bool SqliteBlobStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    return blob_call("remove " + key, [&]() -> bool {
        Statement st(db_, "DELETE FROM blobs WHERE key = ?;");
        st.bind_text(1, key);
        st.step();
        return sqlite3_changes(db_) > 0;
    });
}

std::vector<std::string> SqliteBlobStore::list(const std::string& prefix) {
    std::lock_guard<std::mutex> lk(mu_);
    return blob_call("list " + prefix, [&]() -> std::vector<std::string> {
        Statement st(db_, "SELECT key FROM blobs WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key;");
        st.bind_text(1, prefix);
        std::vector<std::string> keys;
        while (st.step()) keys.push_back(st.column_text(0));
        return keys;
    });
}
