#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

struct BlobInfo {
    std::int64_t generation{0}; // bumped on every successful write, starts at 1, never reused for a key
    std::map<std::string, std::string> metadata;
    std::uint64_t size{0};
};

struct BlobObject {
    BlobInfo info;
    std::string data;
};

// Conditional write. if_generation_match == 0 means "must not exist yet".
struct BlobPrecondition {
    std::optional<std::int64_t> if_generation_match;
};

// Durable object storage with generation preconditions, the shape of
// GCS/S3 conditional writes. Throws BlobUnavailable on transient failures
// and PreconditionFailed when a precondition does not hold.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual std::optional<BlobObject> get(const std::string& key) = 0;
    // Generation and metadata only, no payload.
    virtual std::optional<BlobInfo> stat(const std::string& key) = 0;
    // Returns the new generation.
    virtual std::int64_t put(const std::string& key, const std::string& data,
                             const std::map<std::string, std::string>& metadata,
                             const BlobPrecondition& precondition = {}) = 0;
    // Returns false when the key did not exist.
    virtual bool remove(const std::string& key) = 0;
    virtual std::vector<std::string> list(const std::string& prefix) = 0;
};

// Reference implementation on a shared SQLite file. Every conditional write
// runs inside BEGIN IMMEDIATE, so processes sharing the file see one winner.
class SqliteBlobStore : public BlobStore {
public:
    SqliteBlobStore(const std::string& db_path, int busy_timeout_ms);
    ~SqliteBlobStore() override;
    SqliteBlobStore(const SqliteBlobStore&) = delete;
    SqliteBlobStore& operator=(const SqliteBlobStore&) = delete;

    std::optional<BlobObject> get(const std::string& key) override;
    std::optional<BlobInfo> stat(const std::string& key) override;
    std::int64_t put(const std::string& key, const std::string& data,
                     const std::map<std::string, std::string>& metadata,
                     const BlobPrecondition& precondition = {}) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix) override;

private:
    void init();

    std::mutex mu_;
    sqlite3* db_{nullptr};
};
