#include "errors.hpp"
#include "generation.hpp"
#include "language.hpp"
#include "synthesizer.hpp"

#include "../fakes.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace {

using docqa_tests::ExtractAfter;
using docqa_tests::Require;
using docqa_tests::RequireThrows;
using docqa_tests::ScriptedGenerationClient;

RetrievedChunk Retrieved(const std::string& id, const std::string& text, float score) {
    RetrievedChunk r;
    r.chunk.chunk_id = id;
    r.chunk.document_id = "doc";
    r.chunk.text = text;
    r.score = score;
    return r;
}

GenerationConfig FastGeneration() {
    GenerationConfig g;
    g.retry = RetryPolicy{3, 1, 2.0, 4};
    return g;
}

const std::vector<RetrievedChunk> kRetrieved = {
    Retrieved("doc#1", "Office hours run from nine to five.", 0.4f),
    Retrieved("doc#3", "The submission deadline: 30 September 2025. Late entries are refused.", 0.9f),
    Retrieved("doc#0", "Invoices are paid monthly.", 0.2f),
};

void ScenarioBuildContext() {
    docqa_tests::Log("scenario: build context");
    auto passages = build_context(kRetrieved, 8000);
    Require(passages.size() == 3, "every chunk fits");
    Require(passages[0].number == 1 && passages[0].chunk_id == "doc#3", "highest score labelled 1");
    Require(passages[1].chunk_id == "doc#1" && passages[2].chunk_id == "doc#0", "descending score order");

    auto cut = build_context(kRetrieved, 80);
    Require(cut.size() == 2, "budget ends the context");
    Require(cut[1].text.size() == 80 - kRetrieved[1].chunk.text.size(), "last passage truncated to the budget");

    std::vector<RetrievedChunk> utf8 = {Retrieved("u#0", "\xc3\xa9\xc3\xa9\xc3\xa9", 1.0f)};
    auto partial = build_context(utf8, 3);
    Require(partial.size() == 1 && partial[0].text == "\xc3\xa9", "truncation keeps whole code points");
}

void ScenarioCitationMarkers() {
    docqa_tests::Log("scenario: citation markers");
    auto m = parse_citation_markers("See [2] and [1], also [2] and [x] or [10]");
    Require(m.size() == 3 && m[0] == 2 && m[1] == 1 && m[2] == 10, "markers in first-use order, deduplicated");
    Require(parse_citation_markers("no markers [] here").empty(), "empty brackets ignored");
}

void ScenarioAnsweredWithSources() {
    docqa_tests::Log("scenario: answered with sources");
    ScriptedGenerationClient gen([](const GenerationRequest& req) { return ExtractAfter(req, "deadline:"); });
    AnswerSynthesizer synth(gen, FastGeneration(), SynthesisConfig{});
    auto a = synth.synthesize("What is the deadline?", kRetrieved, "English");
    Require(a.outcome == AnswerOutcome::answered, "answered");
    Require(a.text.find("30 September 2025") != std::string::npos, "answer extracted from passage");
    Require(a.citations.size() == 1 && a.citations[0] == "doc#3", "cites the passage it used");
    Require(a.used_chunks.size() == 3, "all passages sent");
    Require(a.language_hint == "English", "language hint kept");
    Require(gen.last_request().question == "What is the deadline?", "question forwarded");
    Require(gen.last_request().instruction.find("Answer in English") != std::string::npos,
            "instruction names the answer language");
}

void ScenarioCitationFallbacks() {
    docqa_tests::Log("scenario: citation fallbacks");
    ScriptedGenerationClient markers([](const GenerationRequest&) {
        GenerationResponse r;
        r.text = "Office hours are nine to five [2], see also [7].";
        return r;
    });
    AnswerSynthesizer a1(markers, FastGeneration(), SynthesisConfig{});
    auto withMarkers = a1.synthesize("When is the office open?", kRetrieved, "English");
    Require(withMarkers.citations.size() == 1 && withMarkers.citations[0] == "doc#1",
            "inline markers map to chunks, out-of-range labels dropped");

    ScriptedGenerationClient bare([](const GenerationRequest&) {
        GenerationResponse r;
        r.text = "Nine to five.";
        return r;
    });
    AnswerSynthesizer a2(bare, FastGeneration(), SynthesisConfig{});
    auto noMarkers = a2.synthesize("When is the office open?", kRetrieved, "English");
    Require(noMarkers.citations == noMarkers.used_chunks, "no attribution cites every passage sent");
}

void ScenarioNotFoundAndInsufficientContext() {
    docqa_tests::Log("scenario: not found and insufficient context");
    ScriptedGenerationClient gen([](const GenerationRequest& req) { return ExtractAfter(req, "no such marker"); });
    SynthesisConfig cfg;
    AnswerSynthesizer synth(gen, FastGeneration(), cfg);
    auto nf = synth.synthesize("Who is the CEO?", kRetrieved, "English");
    Require(nf.outcome == AnswerOutcome::not_found, "model reports no answer");
    Require(nf.text == cfg.not_found_text && nf.citations.empty(), "not-found text without citations");

    auto empty = synth.synthesize("Who is the CEO?", {}, "English");
    Require(empty.outcome == AnswerOutcome::insufficient_context, "nothing retrieved");
    Require(gen.calls() == 1, "no generation call without context");
}

void ScenarioRetryAndReject() {
    docqa_tests::Log("scenario: retry and reject");
    ScriptedGenerationClient gen([](const GenerationRequest& req) { return ExtractAfter(req, "deadline:"); });
    AnswerSynthesizer synth(gen, FastGeneration(), SynthesisConfig{});
    gen.fail_next(2);
    auto a = synth.synthesize("What is the deadline?", kRetrieved, "English");
    Require(a.outcome == AnswerOutcome::answered && gen.calls() == 3, "transient failures retried");

    gen.fail_next(5);
    RequireThrows<GenerationUnavailable>([&] { synth.synthesize("What is the deadline?", kRetrieved, "English"); },
                                         "exhausted retries surface GenerationUnavailable");

    gen.fail_next(0);
    gen.reject(true);
    const int before = gen.calls();
    RequireThrows<GenerationRejected>([&] { synth.synthesize("What is the deadline?", kRetrieved, "English"); },
                                      "rejection is not retried");
    Require(gen.calls() == before + 1, "single attempt on rejection");

    CancellationToken cancel;
    cancel.cancel();
    gen.reject(false);
    RequireThrows<Cancelled>([&] { synth.synthesize("What is the deadline?", kRetrieved, "English", &cancel); },
                             "cancelled before the call");
}

void ScenarioParseGenerationOutput() {
    docqa_tests::Log("scenario: parse generation output");
    auto r = parse_generation_output("{\"found\": true, \"answer\": \" 30 September \", \"sources\": [1, \"[3]\"]}");
    Require(!r.no_answer && r.text == "30 September", "answer trimmed");
    Require(r.used_passages && r.used_passages->size() == 2 && (*r.used_passages)[1] == 3, "sources parsed");

    auto nf = parse_generation_output("```json\n{\"found\": false, \"answer\": \"\", \"sources\": []}\n```");
    Require(nf.no_answer, "fenced JSON with found=false");

    auto plain = parse_generation_output("  just text [1]  ");
    Require(plain.text == "just text [1]" && !plain.used_passages, "plain text kept as answer");
}

void ScenarioLanguageHint() {
    docqa_tests::Log("scenario: language hint");
    Require(detect_language_hint("What is the deadline?") == "English", "English");
    Require(detect_language_hint("Wann ist die Frist?") == "German", "German");
    Require(detect_language_hint("\xc2\xbf" "Cu\xc3\xa1l es la fecha l\xc3\xadmite?") == "Spanish", "Spanish");
    Require(detect_language_hint("Quelle est la date limite ?") == "French", "French");
    Require(detect_language_hint("\xd0\x9a\xd0\xbe\xd0\xb3\xd0\xb4\xd0\xb0 \xd1\x81\xd1\x80\xd0\xbe\xd0\xba?") == "Russian",
            "Cyrillic");
    Require(detect_language_hint("\xe7\xb7\xa0\xe3\x82\x81\xe5\x88\x87\xe3\x82\x8a\xe3\x81\xaf\xe3\x81\x84\xe3\x81\xa4?") ==
                "Japanese",
            "kana marks Japanese");
    Require(detect_language_hint("\xe6\x88\xaa\xe6\xad\xa2\xe6\x97\xa5\xe6\x9c\x9f") == "Chinese", "Han only");
    Require(detect_language_hint("12345 ???") == "English", "nothing scores");
}

}  // namespace

int main() {
    try {
        docqa_tests::Log("synthesizer_test: start");
        ScenarioBuildContext();
        ScenarioCitationMarkers();
        ScenarioAnsweredWithSources();
        ScenarioCitationFallbacks();
        ScenarioNotFoundAndInsufficientContext();
        ScenarioRetryAndReject();
        ScenarioParseGenerationOutput();
        ScenarioLanguageHint();
        docqa_tests::Log("synthesizer_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        docqa_tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
