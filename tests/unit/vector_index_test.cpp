#include "errors.hpp"
#include "vector_index.hpp"

#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using docqa_tests::Require;
using docqa_tests::RequireThrows;

const char* kModel = "test-model";

Chunk MakeChunk(const std::string& doc, int seq) {
    Chunk c;
    c.document_id = doc;
    c.sequence_index = seq;
    c.chunk_id = make_chunk_id(doc, seq);
    c.text = doc + " part " + std::to_string(seq);
    c.char_start = static_cast<std::size_t>(seq) * 10;
    c.char_end = c.char_start + 12;
    return c;
}

void Add(VectorIndex& index, const std::string& doc, int seq, std::vector<float> v, const std::string& model = kModel) {
    Chunk c = MakeChunk(doc, seq);
    index.add(c, Embedding{c.chunk_id, std::move(v), model});
}

void ScenarioExactMatchRanksFirst() {
    docqa_tests::Log("scenario: exact match ranks first");
    VectorIndex index;
    Add(index, "a", 0, {1.0f, 0.0f, 0.0f});
    Add(index, "a", 1, {0.0f, 1.0f, 0.0f});
    Add(index, "a", 2, {0.6f, 0.8f, 0.0f});
    Require(index.size() == 3, "three chunks indexed");
    Require(index.dimensions() == 3, "dimension adopted from first embedding");
    Require(index.model_version() == kModel, "model adopted from first embedding");

    auto hits = index.search({0.0f, 2.0f, 0.0f}, 2);
    Require(hits.size() == 2, "k caps the result");
    Require(hits[0].chunk_id == "a#1", "identical direction ranks first");
    Require(std::fabs(hits[0].score - 1.0f) < 1e-5f, "cosine of identical direction is 1");
    Require(hits[1].chunk_id == "a#2", "next closest second");
}

void ScenarioTiesBreakBySequence() {
    docqa_tests::Log("scenario: ties break by sequence");
    VectorIndex index;
    Add(index, "d", 4, {1.0f, 1.0f});
    Add(index, "d", 1, {1.0f, 1.0f});
    Add(index, "d", 2, {1.0f, 1.0f});
    auto hits = index.search({1.0f, 1.0f}, 3);
    Require(hits[0].chunk_id == "d#1" && hits[1].chunk_id == "d#2" && hits[2].chunk_id == "d#4",
            "equal scores ordered by sequence_index");
}

void ScenarioOverwriteAndRemoveDocument() {
    docqa_tests::Log("scenario: overwrite and remove document");
    VectorIndex index;
    Add(index, "a", 0, {1.0f, 0.0f});
    Add(index, "a", 0, {0.0f, 1.0f});
    Require(index.size() == 1, "same chunk_id overwrites");
    Add(index, "a", 1, {1.0f, 1.0f});
    Add(index, "b", 0, {1.0f, 0.0f});
    Require(index.chunks_of("a").size() == 2, "two chunks for a");

    Require(index.remove_document("a") == 2, "remove_document reports purged count");
    Require(index.size() == 1 && index.find("b#0") != nullptr, "other documents untouched");
    Require(index.find("a#1") == nullptr, "purged chunks are gone");
    Require(index.remove_document("missing") == 0, "unknown document removes nothing");
}

void ScenarioModelAndDimensionGuards() {
    docqa_tests::Log("scenario: model and dimension guards");
    VectorIndex index;
    Add(index, "a", 0, {1.0f, 0.0f});
    RequireThrows<DocqaError>([&] { Add(index, "a", 1, {1.0f, 0.0f}, "other-model"); },
                              "mixing model versions must throw");
    RequireThrows<std::invalid_argument>([&] { Add(index, "a", 1, {1.0f, 0.0f, 0.0f}); },
                                         "dimension mismatch must throw");
    RequireThrows<std::invalid_argument>([&] { index.search({1.0f}, 1); }, "query dimension mismatch must throw");
    Require(index.size() == 1, "rejected embeddings are not stored");

    index.clear();
    Add(index, "a", 0, {1.0f, 0.0f, 0.0f}, "other-model");
    Require(index.model_version() == "other-model", "cleared index adopts a new model");

    VectorIndex pinned(kModel);
    RequireThrows<DocqaError>([&] { Add(pinned, "a", 0, {1.0f, 0.0f}, "other-model"); },
                              "index built for a model rejects another while empty");
    Require(pinned.empty() && pinned.model_version() == kModel, "pinned model kept after rejection");
    Add(pinned, "a", 0, {1.0f, 0.0f});
    pinned.clear();
    Require(pinned.model_version().empty() && pinned.dimensions() == 0, "clear resets model and dimension");
}

void ScenarioChunksOrdered() {
    docqa_tests::Log("scenario: chunks ordered");
    VectorIndex index;
    Add(index, "b", 1, {1.0f});
    Add(index, "a", 2, {1.0f});
    Add(index, "b", 0, {1.0f});
    Add(index, "a", 0, {1.0f});
    auto chunks = index.chunks();
    Require(chunks.size() == 4, "all chunks listed");
    Require(chunks[0].chunk_id == "a#0" && chunks[1].chunk_id == "a#2" && chunks[2].chunk_id == "b#0" &&
                chunks[3].chunk_id == "b#1",
            "ordered by document then sequence");
    Require(index.search({1.0f}, 0).empty(), "k = 0 returns nothing");
    Require(VectorIndex().search({1.0f}, 3).empty(), "empty index returns nothing");
}

}  // namespace

int main() {
    try {
        docqa_tests::Log("vector_index_test: start");
        ScenarioExactMatchRanksFirst();
        ScenarioTiesBreakBySequence();
        ScenarioOverwriteAndRemoveDocument();
        ScenarioModelAndDimensionGuards();
        ScenarioChunksOrdered();
        docqa_tests::Log("vector_index_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        docqa_tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
