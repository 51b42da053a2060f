#pragma once
#include "sync_manager.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Per-instance cache of restored collections. Entries are immutable
// snapshots; writers copy, mutate, persist, then publish with update().
class CollectionRegistry {
public:
    explicit CollectionRegistry(SyncManager& sync);

    // Cached snapshot, refreshed whenever the durable copy differs from it:
    // a newer version, a delete, or a re-created collection.
    // A collection that was never persisted comes back empty and uncached.
    std::shared_ptr<const Collection> acquire(const std::string& collection_id,
                                              const CancellationToken* cancel = nullptr);

    // Publishes a persisted collection. An older version of the same
    // incarnation never replaces a newer one.
    void update(Collection collection);
    void invalidate(const std::string& collection_id);

    // Held while one writer of a collection copies, mutates and persists it.
    class WriterLock {
    public:
        WriterLock(CollectionRegistry& owner, std::string collection_id, std::shared_ptr<std::mutex> m);
        ~WriterLock();
        WriterLock(const WriterLock&) = delete;
        WriterLock& operator=(const WriterLock&) = delete;

    private:
        CollectionRegistry& owner_;
        std::string collection_id_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    // Serializes writers of one collection within this instance. The
    // per-collection mutex is dropped once its last holder releases it.
    WriterLock writer_lock(const std::string& collection_id);

    std::size_t cached_count();
    std::size_t writer_count();

private:
    void release_writer(const std::string& collection_id, const std::shared_ptr<std::mutex>& m);

    SyncManager& sync_;
    std::mutex mu_;
    std::map<std::string, std::shared_ptr<const Collection>> cache_;
    std::map<std::string, std::shared_ptr<std::mutex>> writers_;
};
