#include "../include/sync_manager.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <cstring>

using json = nlohmann::json;

static const char* kSnapshotFormat = "docqa.snapshot";
static const int kSnapshotFormatVersion = 1;

static json vector_to_binary(const std::vector<float>& v) {
    std::vector<std::uint8_t> bytes(v.size() * sizeof(float));
    if (!v.empty()) std::memcpy(bytes.data(), v.data(), bytes.size());
    return json::binary(std::move(bytes));
}

static std::vector<float> vector_from_binary(const json& j, int dimensions) {
    if (!j.is_binary()) throw SnapshotCorrupt("snapshot vector is not a byte string");
    const auto& bytes = j.get_binary();
    if (bytes.size() != (size_t)dimensions * sizeof(float)) {
        throw SnapshotCorrupt("snapshot vector has " + std::to_string(bytes.size()) + " bytes, expected " +
                              std::to_string((size_t)dimensions * sizeof(float)));
    }
    std::vector<float> v((size_t)dimensions);
    std::memcpy(v.data(), bytes.data(), bytes.size());
    return v;
}

// Covers chunks, vectors and the manifest.
static std::string payload_checksum(const json& chunks, const json& documents) {
    std::vector<std::uint8_t> cbor = json::to_cbor(chunks);
    std::vector<std::uint8_t> docs = json::to_cbor(documents);
    cbor.insert(cbor.end(), docs.begin(), docs.end());
    return sha256_hex(std::string(cbor.begin(), cbor.end()));
}

std::string encode_snapshot(const Collection& collection, std::uint64_t version) {
    json documents = json::array();
    for (auto& kv : collection.documents) {
        const DocumentRecord& d = kv.second;
        documents.push_back({
            {"document_id", d.document_id},
            {"source_name", d.source_name},
            {"sha256", d.sha256},
            {"byte_size", d.byte_size},
            {"chunk_count", d.chunk_count},
            {"ingested_at", d.ingested_at}
        });
    }
    json chunks = json::array();
    for (auto& c : collection.index.chunks()) {
        const std::vector<float>* v = collection.index.vector(c.chunk_id);
        chunks.push_back({
            {"chunk_id", c.chunk_id},
            {"document_id", c.document_id},
            {"seq", c.sequence_index},
            {"text", c.text},
            {"start", c.char_start},
            {"end", c.char_end},
            {"vector", vector_to_binary(v ? *v : std::vector<float>{})}
        });
    }
    json snap = {
        {"format", kSnapshotFormat},
        {"format_version", kSnapshotFormatVersion},
        {"collection_id", collection.collection_id},
        {"version", version},
        {"model_version", collection.index.model_version()},
        {"dimensions", collection.index.dimensions()},
        {"checksum", payload_checksum(chunks, documents)},
        {"documents", documents},
        {"chunks", std::move(chunks)}
    };
    std::vector<std::uint8_t> cbor = json::to_cbor(snap);
    return std::string(cbor.begin(), cbor.end());
}

Collection decode_snapshot(const std::string& bytes) {
    json snap;
    try {
        snap = json::from_cbor(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
    } catch (const json::exception& e) {
        throw SnapshotCorrupt(std::string("snapshot is not valid CBOR: ") + e.what());
    }
    try {
        if (snap.value("format", std::string()) != kSnapshotFormat) throw SnapshotCorrupt("unknown snapshot format");
        if (snap.value("format_version", 0) != kSnapshotFormatVersion) {
            throw SnapshotCorrupt("unsupported snapshot format version " + std::to_string(snap.value("format_version", 0)));
        }
        const json& chunks = snap.at("chunks");
        if (payload_checksum(chunks, snap.at("documents")) != snap.at("checksum").get<std::string>()) {
            throw SnapshotCorrupt("snapshot checksum mismatch");
        }

        Collection c;
        c.collection_id = snap.at("collection_id").get<std::string>();
        c.version = snap.at("version").get<std::uint64_t>();
        c.last_synced_version = c.version;
        const std::string model = snap.at("model_version").get<std::string>();
        const int dims = snap.at("dimensions").get<int>();
        c.index = VectorIndex(model);

        for (auto& d : snap.at("documents")) {
            DocumentRecord r;
            r.document_id = d.at("document_id").get<std::string>();
            r.source_name = d.value("source_name", std::string());
            r.sha256 = d.value("sha256", std::string());
            r.byte_size = d.value("byte_size", (std::uint64_t)0);
            r.chunk_count = d.value("chunk_count", 0);
            r.ingested_at = d.value("ingested_at", (std::int64_t)0);
            c.documents[r.document_id] = r;
        }
        for (auto& j : chunks) {
            Chunk ch;
            ch.chunk_id = j.at("chunk_id").get<std::string>();
            ch.document_id = j.at("document_id").get<std::string>();
            ch.sequence_index = j.at("seq").get<int>();
            ch.text = j.at("text").get<std::string>();
            ch.char_start = j.at("start").get<std::size_t>();
            ch.char_end = j.at("end").get<std::size_t>();
            c.index.add(ch, Embedding{ch.chunk_id, vector_from_binary(j.at("vector"), dims), model});
        }
        return c;
    } catch (const json::exception& e) {
        throw SnapshotCorrupt(std::string("snapshot field error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw SnapshotCorrupt(std::string("snapshot index error: ") + e.what());
    }
}

static std::uint64_t version_from_info(const std::string& key, const BlobInfo& info) {
    auto it = info.metadata.find("version");
    if (it == info.metadata.end()) throw SnapshotCorrupt("blob " + key + " has no version metadata");
    const std::string& v = it->second;
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
        throw SnapshotCorrupt("blob " + key + " has bad version metadata: " + v);
    }
    return std::stoull(v);
}

static std::string incarnation_from_info(const BlobInfo& info) {
    auto it = info.metadata.find("incarnation");
    return it == info.metadata.end() ? std::string() : it->second;
}

SyncManager::SyncManager(BlobStore& blobs, StorageConfig storage, SyncConfig sync)
    : blobs_(blobs), storage_(std::move(storage)), sync_(std::move(sync)) {}

std::string SyncManager::snapshot_key(const std::string& collection_id) const {
    return storage_.key_prefix + collection_id + "/index.snapshot";
}

Collection SyncManager::restore(const std::string& collection_id, const CancellationToken* cancel) {
    const std::string key = snapshot_key(collection_id);
    auto obj = with_retry<BlobUnavailable>(sync_.retry, "sync", "restore " + collection_id,
                                           [&]{ return blobs_.get(key); }, cancel);
    if (!obj) {
        Collection empty;
        empty.collection_id = collection_id;
        return empty;
    }
    Collection c = decode_snapshot(obj->data);
    if (c.collection_id != collection_id) {
        throw SnapshotCorrupt("snapshot at " + key + " belongs to collection " + c.collection_id);
    }
    c.incarnation = incarnation_from_info(obj->info);
    log_debug("sync", "restored " + collection_id + " v" + std::to_string(c.version) + " (" +
                      std::to_string(c.index.size()) + " chunks)");
    return c;
}

std::uint64_t SyncManager::stored_version(const std::string& collection_id) {
    return stored_state(collection_id).version;
}

StoredState SyncManager::stored_state(const std::string& collection_id) {
    const std::string key = snapshot_key(collection_id);
    auto info = with_retry<BlobUnavailable>(sync_.retry, "sync", "stat " + collection_id,
                                            [&]{ return blobs_.stat(key); });
    StoredState state;
    if (info) {
        state.version = version_from_info(key, *info);
        state.incarnation = incarnation_from_info(*info);
    }
    return state;
}

void SyncManager::persist(Collection& collection, std::uint64_t version, const CancellationToken* cancel) {
    check_cancel(cancel, "persist " + collection.collection_id);
    const std::string key = snapshot_key(collection.collection_id);
    const std::string bytes = encode_snapshot(collection, version);
    std::map<std::string, std::string> metadata{
        {"version", std::to_string(version)},
        {"model_version", collection.index.model_version()},
        {"chunk_count", std::to_string(collection.index.size())},
        {"sha256", sha256_hex(bytes)}
    };
    const std::string fresh_incarnation = gen_id();

    std::string incarnation;
    with_retry<BlobUnavailable>(sync_.retry, "sync", "persist " + collection.collection_id, [&]{
        auto info = blobs_.stat(key);
        const std::uint64_t stored = info ? version_from_info(key, *info) : 0;
        if (!collection.incarnation.empty()) {
            // read from a snapshot that was deleted, or deleted and re-created
            if (!info || incarnation_from_info(*info) != collection.incarnation) {
                log_warn("sync", collection.collection_id + " was replaced since incarnation " +
                                 collection.incarnation + " was read");
                throw StaleVersion(collection.collection_id, stored, version);
            }
        }
        if (version <= stored) throw StaleVersion(collection.collection_id, stored, version);
        incarnation = info ? incarnation_from_info(*info) : fresh_incarnation;
        if (incarnation.empty()) incarnation = fresh_incarnation;
        metadata["incarnation"] = incarnation;
        BlobPrecondition pre;
        pre.if_generation_match = info ? info->generation : 0;
        try {
            blobs_.put(key, bytes, metadata, pre);
        } catch (const PreconditionFailed&) {
            auto now = blobs_.stat(key);
            throw StaleVersion(collection.collection_id, now ? version_from_info(key, *now) : 0, version);
        }
    }, cancel);

    collection.version = version;
    collection.incarnation = incarnation;
    collection.last_synced_version = version;
    log_info("sync", "persisted " + collection.collection_id + " v" + std::to_string(version) + " (" +
                     std::to_string(collection.index.size()) + " chunks, " + std::to_string(bytes.size()) + " bytes)");
}

bool SyncManager::remove(const std::string& collection_id) {
    const std::string key = snapshot_key(collection_id);
    bool removed = with_retry<BlobUnavailable>(sync_.retry, "sync", "remove " + collection_id,
                                               [&]{ return blobs_.remove(key); });
    if (removed) log_info("sync", "removed snapshot for " + collection_id);
    return removed;
}
