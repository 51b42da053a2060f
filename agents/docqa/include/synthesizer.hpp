#pragma once
#include "config.hpp"
#include "generation.hpp"
#include "retry.hpp"
#include "types.hpp"
#include <string>
#include <vector>

struct Answer {
    AnswerOutcome outcome{AnswerOutcome::answered};
    std::string text;
    std::vector<std::string> citations; // chunk ids, order of first use
    std::vector<std::string> used_chunks; // chunk ids sent as context
    std::string language_hint;
};

// Labels retrieved chunks [1..n] by descending score and cuts the list to
// max_chars. A chunk that does not fit is truncated on a UTF-8 boundary and
// ends the context.
std::vector<ContextPassage> build_context(const std::vector<RetrievedChunk>& retrieved, int max_chars);

std::string build_instruction(const std::string& language_hint);

// [n] markers in order of first appearance, duplicates dropped.
std::vector<int> parse_citation_markers(const std::string& text);

class AnswerSynthesizer {
public:
    AnswerSynthesizer(GenerationClient& client, GenerationConfig gen_cfg, SynthesisConfig cfg);

    // An empty `retrieved` gives insufficient_context without calling the
    // generation service. Throws GenerationUnavailable once retries run out,
    // GenerationRejected immediately.
    Answer synthesize(const std::string& question, const std::vector<RetrievedChunk>& retrieved,
                      const std::string& language_hint, const CancellationToken* cancel = nullptr);

private:
    GenerationClient& client_;
    GenerationConfig gen_cfg_;
    SynthesisConfig cfg_;
};
