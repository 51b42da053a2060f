#pragma once
#include <string>

// Best guess at the language of a question, as an English language name
// ("English", "Russian", ...), used to steer the answer language.
// Falls back to "English" when nothing scores.
std::string detect_language_hint(const std::string& text);
