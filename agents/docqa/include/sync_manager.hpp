#pragma once
#include "blob_store.hpp"
#include "config.hpp"
#include "retry.hpp"
#include "types.hpp"
#include "vector_index.hpp"
#include <cstdint>
#include <map>
#include <string>

// Unit of persistence: the index for one collection plus its document manifest.
struct Collection {
    std::string collection_id;
    std::uint64_t version{0};             // 0 = never persisted
    std::uint64_t last_synced_version{0}; // version known to be durable
    // Stamped on first persist and kept until the collection is deleted, so
    // a re-created collection is never mistaken for the one it replaced.
    std::string incarnation;
    VectorIndex index;
    std::map<std::string, DocumentRecord> documents; // by document_id
};

// CBOR snapshot tagged with `version`. decode_snapshot throws
// SnapshotCorrupt on anything unreadable or failing its checksum.
std::string encode_snapshot(const Collection& collection, std::uint64_t version);
Collection decode_snapshot(const std::string& bytes);

struct StoredState {
    std::uint64_t version{0}; // 0 = nothing stored
    std::string incarnation;
};

// Mirrors collections to and from a BlobStore. Writes are version checked:
// a snapshot only replaces one with a strictly lower version of the same
// incarnation.
class SyncManager {
public:
    SyncManager(BlobStore& blobs, StorageConfig storage, SyncConfig sync);

    // Latest snapshot, or an empty collection at version 0.
    Collection restore(const std::string& collection_id, const CancellationToken* cancel = nullptr);

    // Throws StaleVersion when `version` is not above the stored version,
    // when the collection was read from an incarnation that has since been
    // deleted or replaced, and when another writer wins the race between
    // check and write. A collection without an incarnation is checked by
    // version alone.
    void persist(Collection& collection, std::uint64_t version, const CancellationToken* cancel = nullptr);

    // Returns false when there was nothing to delete.
    bool remove(const std::string& collection_id);

    // Read blob metadata only.
    std::uint64_t stored_version(const std::string& collection_id);
    StoredState stored_state(const std::string& collection_id);

    std::string snapshot_key(const std::string& collection_id) const;

private:
    BlobStore& blobs_;
    StorageConfig storage_;
    SyncConfig sync_;
};
