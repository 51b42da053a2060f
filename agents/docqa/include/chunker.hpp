#pragma once
#include "config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Sliding windows of at most target_size bytes; consecutive windows share
// exactly `overlap` bytes (rounded to a UTF-8 boundary). Window ends prefer a
// paragraph break, then a line break, then a space in the upper half of the
// window. Returned chunks carry offsets and sequence numbers but no ids.
std::vector<Chunk> chunk_text(const std::string& text, int target_size, int overlap);

// Same as chunk_text, with document_id and chunk_id filled in.
std::vector<Chunk> chunk_document(const Document& doc, const ChunkingConfig& cfg);
