#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

struct DocqaError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConfigError : DocqaError {
    using DocqaError::DocqaError;
};

// Chunking or embedding failed for good; the caller has to upload again.
struct IngestionFailed : DocqaError {
    using DocqaError::DocqaError;
};

// Transient: quota, timeout, 5xx. Retried by the owning component.
struct EmbeddingUnavailable : DocqaError {
    using DocqaError::DocqaError;
};

struct GenerationUnavailable : DocqaError {
    using DocqaError::DocqaError;
};

// The generation service refused the request (content filter, bad request).
struct GenerationRejected : DocqaError {
    using DocqaError::DocqaError;
};

struct BlobUnavailable : DocqaError {
    using DocqaError::DocqaError;
};

struct PreconditionFailed : DocqaError {
    using DocqaError::DocqaError;
};

struct SnapshotCorrupt : DocqaError {
    using DocqaError::DocqaError;
};

struct StorageError : DocqaError {
    using DocqaError::DocqaError;
};

// SQLITE_BUSY / SQLITE_LOCKED still reported after the busy timeout.
struct StorageBusy : StorageError {
    using StorageError::StorageError;
};

struct SessionConflict : DocqaError {
    using DocqaError::DocqaError;
};

struct Cancelled : DocqaError {
    using DocqaError::DocqaError;
};

class StaleVersion : public DocqaError {
public:
    StaleVersion(const std::string& collection_id, std::uint64_t stored, std::uint64_t attempted)
        : DocqaError("stale version for collection " + collection_id + ": stored " + std::to_string(stored) +
                     ", attempted " + std::to_string(attempted)),
          collection_id_(collection_id), stored_(stored), attempted_(attempted) {}

    const std::string& collection_id() const { return collection_id_; }
    std::uint64_t stored_version() const { return stored_; }
    std::uint64_t attempted_version() const { return attempted_; }

private:
    std::string collection_id_;
    std::uint64_t stored_{0};
    std::uint64_t attempted_{0};
};
