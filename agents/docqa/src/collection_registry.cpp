#include "../include/collection_registry.hpp"
#include "../include/log.hpp"

CollectionRegistry::CollectionRegistry(SyncManager& sync) : sync_(sync) {}

std::shared_ptr<const Collection> CollectionRegistry::acquire(const std::string& collection_id,
                                                              const CancellationToken* cancel) {
    std::shared_ptr<const Collection> cached;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = cache_.find(collection_id);
        if (it != cache_.end()) cached = it->second;
    }

    // Another instance may have persisted, deleted or re-created since we
    // cached; the stat is cheap.
    const StoredState stored = sync_.stored_state(collection_id);
    if (cached && (stored.version != cached->version || stored.incarnation != cached->incarnation)) {
        log_debug("registry", "dropping " + collection_id + " v" + std::to_string(cached->version) +
                              ", durable copy is v" + std::to_string(stored.version));
        invalidate(collection_id);
        cached.reset();
    }
    if (cached) return cached;

    auto fresh = std::make_shared<const Collection>(sync_.restore(collection_id, cancel));
    if (fresh->version == 0) return fresh;

    std::lock_guard<std::mutex> lk(mu_);
    auto& slot = cache_[collection_id];
    if (!slot || slot->incarnation != fresh->incarnation || slot->version < fresh->version) {
        slot = fresh;
        log_debug("registry", "cached " + collection_id + " v" + std::to_string(fresh->version));
    }
    return slot;
}

void CollectionRegistry::update(Collection collection) {
    auto next = std::make_shared<const Collection>(std::move(collection));
    std::lock_guard<std::mutex> lk(mu_);
    auto& slot = cache_[next->collection_id];
    if (!slot || slot->incarnation != next->incarnation || slot->version <= next->version) slot = next;
}

void CollectionRegistry::invalidate(const std::string& collection_id) {
    std::lock_guard<std::mutex> lk(mu_);
    cache_.erase(collection_id);
}

CollectionRegistry::WriterLock::WriterLock(CollectionRegistry& owner, std::string collection_id,
                                           std::shared_ptr<std::mutex> m)
    : owner_(owner), collection_id_(std::move(collection_id)), mutex_(std::move(m)), lock_(*mutex_) {}

CollectionRegistry::WriterLock::~WriterLock() {
    lock_.unlock();
    owner_.release_writer(collection_id_, mutex_);
}

CollectionRegistry::WriterLock CollectionRegistry::writer_lock(const std::string& collection_id) {
    std::shared_ptr<std::mutex> m;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& slot = writers_[collection_id];
        if (!slot) slot = std::make_shared<std::mutex>();
        m = slot;
    }
    return WriterLock(*this, collection_id, std::move(m));
}

void CollectionRegistry::release_writer(const std::string& collection_id, const std::shared_ptr<std::mutex>& m) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = writers_.find(collection_id);
    // copies are only taken under mu_, so nobody else holds or waits on it
    if (it != writers_.end() && it->second == m && m.use_count() == 2) writers_.erase(it);
}

std::size_t CollectionRegistry::cached_count() {
    std::lock_guard<std::mutex> lk(mu_);
    return cache_.size();
}

std::size_t CollectionRegistry::writer_count() {
    std::lock_guard<std::mutex> lk(mu_);
    return writers_.size();
}
