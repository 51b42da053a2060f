#include "../include/language.hpp"
#include <cctype>
#include <map>
#include <set>
#include <vector>

// Decodes one code point at `i` and advances; invalid bytes yield U+FFFD.
static char32_t next_code_point(const std::string& s, size_t& i) {
    unsigned char c = (unsigned char)s[i];
    int len = 1;
    char32_t cp = c;
    if (c >= 0xF0) { len = 4; cp = c & 0x07; }
    else if (c >= 0xE0) { len = 3; cp = c & 0x0F; }
    else if (c >= 0xC0) { len = 2; cp = c & 0x1F; }
    else if (c >= 0x80) { ++i; return 0xFFFD; }
    if (i + len > s.size()) { i = s.size(); return 0xFFFD; }
    for (int k = 1; k < len; ++k) {
        unsigned char cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) { ++i; return 0xFFFD; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    i += len;
    return cp;
}

struct ScriptRange {
    char32_t lo;
    char32_t hi;
    const char* language;
};

static const ScriptRange kScripts[] = {
    {0x0400, 0x04FF, "Russian"},
    {0x0370, 0x03FF, "Greek"},
    {0x0600, 0x06FF, "Arabic"},
    {0x0590, 0x05FF, "Hebrew"},
    {0x0900, 0x097F, "Hindi"},
    {0x0E00, 0x0E7F, "Thai"},
    {0xAC00, 0xD7AF, "Korean"},
    {0x3040, 0x30FF, "Japanese"},
    {0x4E00, 0x9FFF, "Chinese"},
};

static const std::map<std::string, std::set<std::string>>& stop_words() {
    static const std::map<std::string, std::set<std::string>> words = {
        {"English", {"the", "is", "what", "which", "who", "when", "where", "how", "of", "and", "does", "are", "in", "to", "a"}},
        {"Spanish", {"el", "la", "los", "las", "que", "qué", "es", "de", "y", "cuál", "cuándo", "dónde", "cómo", "por", "una"}},
        {"French", {"le", "la", "les", "est", "quel", "quelle", "quand", "où", "comment", "de", "du", "des", "et", "une", "qui"}},
        {"German", {"der", "die", "das", "ist", "was", "wann", "wo", "wie", "und", "ein", "eine", "nicht", "welche", "den", "mit"}},
        {"Portuguese", {"o", "os", "as", "é", "qual", "quando", "onde", "como", "de", "do", "da", "e", "uma", "não", "que"}},
        {"Italian", {"il", "lo", "gli", "è", "qual", "quale", "quando", "dove", "come", "di", "del", "della", "e", "una", "che"}},
        {"Dutch", {"de", "het", "een", "is", "wat", "wanneer", "waar", "hoe", "van", "en", "niet", "welke", "zijn", "met", "op"}},
    };
    return words;
}

static std::vector<std::string> lower_words(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    for (char ch : text) {
        unsigned char c = (unsigned char)ch;
        // bytes >= 0x80 belong to accented letters, keep them inside the word
        if (std::isalnum(c) || c >= 0x80) {
            cur.push_back((char)std::tolower(c));
        } else if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string detect_language_hint(const std::string& text) {
    std::map<std::string, int> script_counts;
    int latin = 0;
    for (size_t i = 0; i < text.size();) {
        char32_t cp = next_code_point(text, i);
        if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= 0x00C0 && cp <= 0x024F)) {
            ++latin;
            continue;
        }
        for (auto& r : kScripts) {
            if (cp >= r.lo && cp <= r.hi) {
                script_counts[r.language]++;
                break;
            }
        }
    }
    // Kana marks Japanese even when mixed with Han characters.
    if (script_counts.count("Japanese")) return "Japanese";
    std::string best_script;
    int best_count = 0;
    for (auto& kv : script_counts) {
        if (kv.second > best_count) {
            best_count = kv.second;
            best_script = kv.first;
        }
    }
    if (best_count > latin) return best_script;

    std::map<std::string, int> scores;
    for (auto& w : lower_words(text)) {
        for (auto& kv : stop_words()) {
            if (kv.second.count(w)) scores[kv.first]++;
        }
    }
    std::string best = "English";
    int best_score = 0;
    for (auto& kv : scores) {
        // English wins ties
        if (kv.second > best_score || (kv.second == best_score && kv.first == "English")) {
            best_score = kv.second;
            best = kv.first;
        }
    }
    return best;
}
