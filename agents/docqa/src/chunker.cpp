#include "../include/chunker.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <stdexcept>

static const char* kSeparators[] = {"\n\n", "\n", " "};

static std::size_t find_split(const std::string& text, std::size_t start, std::size_t limit, std::size_t overlap,
                              std::size_t target) {
    const std::size_t lower = start + std::max(overlap + 1, target / 2);
    for (const char* sep : kSeparators) {
        const std::string s(sep);
        if (limit < start + s.size()) continue;
        std::size_t pos = text.rfind(s, limit - s.size());
        if (pos == std::string::npos || pos < start) continue;
        std::size_t cut = pos + s.size();
        if (cut >= lower && cut <= limit) return cut;
    }
    // No separator: hard cut, kept off the middle of a multi-byte character.
    std::size_t cut = utf8_floor(text, limit);
    if (cut <= start + overlap) cut = utf8_ceil(text, limit);
    return cut;
}

std::vector<Chunk> chunk_text(const std::string& text, int target_size, int overlap) {
    if (target_size <= 0) throw std::invalid_argument("chunk target_size must be > 0");
    if (overlap < 0 || overlap >= target_size) throw std::invalid_argument("chunk overlap must be within [0, target_size)");

    const std::size_t n = text.size();
    const std::size_t target = static_cast<std::size_t>(target_size);
    const std::size_t ov = static_cast<std::size_t>(overlap);

    std::vector<Chunk> chunks;
    std::size_t start = 0;
    int seq = 0;
    while (start < n) {
        std::size_t limit = start + target;
        std::size_t end = limit >= n ? n : find_split(text, start, limit, ov, target);

        Chunk c;
        c.sequence_index = seq++;
        c.char_start = start;
        c.char_end = end;
        c.text = text.substr(start, end - start);
        chunks.push_back(std::move(c));

        if (end >= n) break;
        std::size_t next = utf8_ceil(text, end - ov);
        // stray continuation bytes can push the boundary past end
        if (next <= start || next > end) next = end;
        start = next;
    }
    return chunks;
}

std::vector<Chunk> chunk_document(const Document& doc, const ChunkingConfig& cfg) {
    auto chunks = chunk_text(doc.text, cfg.target_size, cfg.overlap);
    for (auto& c : chunks) {
        c.document_id = doc.document_id;
        c.chunk_id = make_chunk_id(doc.document_id, c.sequence_index);
    }
    return chunks;
}
