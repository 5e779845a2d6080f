#pragma once

#include <string>
#include <vector>

namespace chartok {
namespace text {

// Code point classification (Unicode general categories via ICU)
bool is_whitespace(char32_t cp);
bool is_control(char32_t cp);
bool is_punctuation(char32_t cp);
bool is_chinese_char(char32_t cp);

// UTF-8 <-> code points. Ill-formed sequences are skipped.
std::u32string decode_utf8(const std::string &input);
std::string encode_utf8(const std::u32string &input);
bool is_valid_utf8(const std::string &input);

// Same bytes as input with every ill-formed sequence removed
std::string sanitize_utf8(const std::string &input);

// Drops NUL, U+FFFD and control characters; maps whitespace to ' '
std::string clean(const std::string &input);

// Surrounds every CJK ideograph with spaces
std::string isolate_chinese_chars(const std::string &input);

std::string normalize_nfc(const std::string &input);
std::string to_lower(const std::string &input);

// NFD followed by removal of nonspacing marks (no recomposition)
std::string strip_accents(const std::string &input);

// Splits on runs of whitespace; leading/trailing whitespace is ignored
std::vector<std::string> whitespace_split(const std::string &input);

// Every punctuation character becomes its own piece
std::vector<std::string> split_on_punctuation(const std::string &input);

} // namespace text
} // namespace chartok
