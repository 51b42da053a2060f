#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Document {
    std::string document_id;
    std::string text;        // extracted UTF-8 text
    std::string source_name; // original filename, informational
};

struct Chunk {
    std::string chunk_id;
    std::string document_id;
    int sequence_index{0};
    std::string text;
    std::size_t char_start{0}; // byte offsets into the extracted text, [start, end)
    std::size_t char_end{0};
};

struct Embedding {
    std::string chunk_id;
    std::vector<float> vector;
    std::string model_version;
};

struct RetrievedChunk {
    Chunk chunk;
    float score{0.0f};
};

struct DocumentRecord {
    std::string document_id;
    std::string source_name;
    std::string sha256;
    std::uint64_t byte_size{0};
    int chunk_count{0};
    std::int64_t ingested_at{0};
};

enum class AnswerOutcome {
    answered,
    not_found,
    insufficient_context,
};

struct ChatSession {
    std::string session_id;
    std::string user_id;
    std::string collection_id;
    std::int64_t created_at{0};
    int turn_count{0};
};

struct Turn {
    std::string session_id;
    int sequence_index{0};
    std::string question;
    std::string answer;
    std::vector<std::string> citations; // chunk ids in order of use
    AnswerOutcome outcome{AnswerOutcome::answered};
    std::int64_t timestamp{0};
};

inline std::string make_chunk_id(const std::string& document_id, int sequence_index) {
    return document_id + "#" + std::to_string(sequence_index);
}

inline const char* to_string(AnswerOutcome o) {
    switch (o) {
    case AnswerOutcome::answered: return "answered";
    case AnswerOutcome::not_found: return "not_found";
    case AnswerOutcome::insufficient_context: return "insufficient_context";
    }
    return "answered";
}

inline AnswerOutcome answer_outcome_from_string(const std::string& s) {
    if (s == "not_found") return AnswerOutcome::not_found;
    if (s == "insufficient_context") return AnswerOutcome::insufficient_context;
    return AnswerOutcome::answered;
}
