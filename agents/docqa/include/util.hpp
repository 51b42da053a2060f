#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);

std::string sha256_hex(const std::string& data);
std::string read_text_file(const std::filesystem::path& p);

// 32 hex chars from a 128-bit random value.
std::string gen_id();

std::int64_t now_ms();
std::string format_timestamp(std::int64_t epoch_ms);

std::string trim(const std::string& s);
bool is_blank(const std::string& s);

// Byte offsets moved onto UTF-8 sequence boundaries.
std::size_t utf8_floor(const std::string& s, std::size_t pos);
std::size_t utf8_ceil(const std::string& s, std::size_t pos);
std::string truncate_utf8(const std::string& s, std::size_t max_bytes);
// Rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(const std::string& s);

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
void normalize_l2(std::vector<float>& v);
