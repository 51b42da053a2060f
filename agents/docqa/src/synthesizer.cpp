#include "../include/synthesizer.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <set>

std::vector<ContextPassage> build_context(const std::vector<RetrievedChunk>& retrieved, int max_chars) {
    std::vector<RetrievedChunk> ordered = retrieved;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const RetrievedChunk& a, const RetrievedChunk& b){ return a.score > b.score; });

    std::vector<ContextPassage> out;
    std::size_t budget = max_chars > 0 ? (std::size_t)max_chars : 0;
    for (auto& r : ordered) {
        if (budget == 0) break;
        ContextPassage p;
        p.number = (int)out.size() + 1;
        p.chunk_id = r.chunk.chunk_id;
        if (r.chunk.text.size() <= budget) {
            p.text = r.chunk.text;
            budget -= p.text.size();
        } else {
            p.text = truncate_utf8(r.chunk.text, budget);
            budget = 0;
        }
        if (p.text.empty()) break;
        out.push_back(std::move(p));
    }
    return out;
}

std::string build_instruction(const std::string& language_hint) {
    return "You are an assistant that answers questions about a document. "
           "Answer only from the numbered context passages provided by the user. "
           "Do not use outside knowledge. "
           "Answer in " + language_hint + ". "
           "Respond with a JSON object: {\"found\": true|false, \"answer\": \"...\", \"sources\": [n, ...]} "
           "where sources lists the passage numbers you used. "
           "If the context does not contain the answer, respond with {\"found\": false, \"answer\": \"\", \"sources\": []}.";
}

std::vector<int> parse_citation_markers(const std::string& text) {
    std::vector<int> out;
    std::set<int> seen;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '[') continue;
        size_t j = i + 1;
        int n = 0;
        int digits = 0;
        while (j < text.size() && std::isdigit((unsigned char)text[j]) && digits < 6) {
            n = n * 10 + (text[j] - '0');
            ++j;
            ++digits;
        }
        if (digits > 0 && j < text.size() && text[j] == ']' && seen.insert(n).second) out.push_back(n);
    }
    return out;
}

AnswerSynthesizer::AnswerSynthesizer(GenerationClient& client, GenerationConfig gen_cfg, SynthesisConfig cfg)
    : client_(client), gen_cfg_(std::move(gen_cfg)), cfg_(std::move(cfg)) {}

Answer AnswerSynthesizer::synthesize(const std::string& question, const std::vector<RetrievedChunk>& retrieved,
                                     const std::string& language_hint, const CancellationToken* cancel) {
    Answer a;
    a.language_hint = language_hint;
    if (retrieved.empty()) {
        a.outcome = AnswerOutcome::insufficient_context;
        a.text = cfg_.not_found_text;
        return a;
    }

    GenerationRequest req;
    req.instruction = build_instruction(language_hint);
    req.question = question;
    req.passages = build_context(retrieved, cfg_.max_context_chars);
    for (auto& p : req.passages) a.used_chunks.push_back(p.chunk_id);

    GenerationResponse resp = with_retry<GenerationUnavailable>(gen_cfg_.retry, "synth", "generate answer",
                                                                [&]{ return client_.generate(req); }, cancel);

    if (resp.no_answer || is_blank(resp.text)) {
        a.outcome = AnswerOutcome::not_found;
        a.text = cfg_.not_found_text;
        log_info("synth", "no answer in " + std::to_string(req.passages.size()) + " passage(s)");
        return a;
    }

    a.outcome = AnswerOutcome::answered;
    a.text = resp.text;

    std::vector<int> labels;
    if (resp.used_passages && !resp.used_passages->empty()) labels = *resp.used_passages;
    else labels = parse_citation_markers(resp.text);

    std::set<std::string> seen;
    for (int n : labels) {
        if (n < 1 || n > (int)req.passages.size()) continue;
        const std::string& id = req.passages[(size_t)n - 1].chunk_id;
        if (seen.insert(id).second) a.citations.push_back(id);
    }
    if (a.citations.empty()) a.citations = a.used_chunks;
    return a;
}
