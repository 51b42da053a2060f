#include "../include/generation.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>

using json = nlohmann::json;

static std::string extract_first_json_object(const std::string& text) {
    size_t start = text.find('{');
    if (start == std::string::npos) return "";
    int depth = 0;
    bool in_string = false;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') ++i;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '{') depth++;
        else if (c == '}') {
            if (--depth == 0) return text.substr(start, i - start + 1);
        }
    }
    return "";
}

OllamaGenerationClient::OllamaGenerationClient(GenerationConfig cfg) : cfg_(std::move(cfg)) {}

std::string render_user_prompt(const GenerationRequest& request) {
    std::string ctx;
    for (auto& p : request.passages) {
        ctx += "[" + std::to_string(p.number) + "]\n---\n" + p.text + "\n\n";
    }
    return std::string("Question: ") + request.question + "\n\nContext:\n" + ctx;
}

GenerationResponse parse_generation_output(const std::string& content) {
    GenerationResponse out;
    std::string raw = extract_first_json_object(content);
    if (raw.empty()) {
        out.text = trim(content);
        return out;
    }
    try {
        auto j = json::parse(raw);
        out.text = trim(j.value("answer", std::string()));
        out.no_answer = !j.value("found", true);
        if (j.contains("sources") && j["sources"].is_array()) {
            std::vector<int> used;
            for (auto& s : j["sources"]) {
                if (s.is_number_integer()) used.push_back(s.get<int>());
                else if (s.is_string()) {
                    // "[2]" or "2"; anything else is not a passage label
                    std::string label = s.get<std::string>();
                    auto digits = label.find_first_of("0123456789");
                    if (digits != std::string::npos) used.push_back(std::atoi(label.c_str() + digits));
                }
            }
            out.used_passages = std::move(used);
        }
    } catch (const json::exception&) {
        out = GenerationResponse{};
        out.text = trim(content);
    }
    return out;
}

GenerationResponse OllamaGenerationClient::generate(const GenerationRequest& request) {
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"format", "json"},
        {"options", {
            {"temperature", cfg_.temperature},
            {"num_predict", cfg_.max_tokens}
        }},
        {"messages", json::array({
            json{{"role","system"},{"content",request.instruction}},
            json{{"role","user"},{"content",render_user_prompt(request)}}
        })}
    };
    HttpResponse r;
    try {
        r = http_post_json(join_url(cfg_.ollama_url, "/api/chat"), body.dump(), cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw GenerationUnavailable(e.what());
    }
    if (!is_success_status(r.status)) {
        std::string msg = "chat failed: status " + std::to_string(r.status) + " " + r.body.substr(0, 200);
        if (is_transient_status(r.status)) throw GenerationUnavailable(msg);
        throw GenerationRejected(msg);
    }
    std::string content;
    try {
        auto data = json::parse(r.body);
        if (data.contains("message")) content = data["message"].value("content", std::string());
    } catch (const json::exception& e) {
        throw GenerationUnavailable(std::string("malformed chat response: ") + e.what());
    }
    return parse_generation_output(content);
}
