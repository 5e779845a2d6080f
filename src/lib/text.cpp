#include "text.hpp"
#include <cstdint>
#include <stdexcept>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

namespace chartok {
namespace text {

namespace {

// Closed intervals of the CJK Unified Ideographs blocks and extensions
struct CodePointRange {
    char32_t first;
    char32_t last;
};

constexpr CodePointRange kChineseRanges[] = {
    {0x4E00, 0x9FFF},   {0x3400, 0x4DBF},   {0x20000, 0x2A6DF},
    {0x2A700, 0x2B73F}, {0x2B740, 0x2B81F}, {0x2B820, 0x2CEAF},
    {0xF900, 0xFAFF},   {0x2F800, 0x2FA1F},
};

uint32_t category_mask(char32_t cp) {
    return U_GET_GC_MASK(static_cast<UChar32>(cp));
}

icu::UnicodeString to_unicode(const std::string &input) {
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(input.data(), static_cast<int32_t>(input.size())));
}

std::string from_unicode(const icu::UnicodeString &input) {
    std::string result;
    input.toUTF8String(result);
    return result;
}

const icu::Normalizer2 &nfc_instance() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *normalizer =
        icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || normalizer == nullptr) {
        throw std::runtime_error(std::string("Failed to load NFC data: ") +
                                 u_errorName(status));
    }
    return *normalizer;
}

const icu::Normalizer2 &nfd_instance() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *normalizer =
        icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || normalizer == nullptr) {
        throw std::runtime_error(std::string("Failed to load NFD data: ") +
                                 u_errorName(status));
    }
    return *normalizer;
}

void append_utf8(std::string &out, char32_t cp) {
    char buf[U8_MAX_LENGTH];
    int32_t len = 0;
    U8_APPEND_UNSAFE(buf, len, static_cast<UChar32>(cp));
    out.append(buf, static_cast<size_t>(len));
}

} // namespace

bool is_whitespace(char32_t cp) {
    // Tab, newline and carriage return are technically control characters
    // but we treat them as whitespace.
    if (cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r') {
        return true;
    }
    return (category_mask(cp) & U_GC_ZS_MASK) != 0;
}

bool is_control(char32_t cp) {
    if (cp == U'\t' || cp == U'\n' || cp == U'\r') {
        return false;
    }
    return (category_mask(cp) & U_GC_C_MASK) != 0;
}

bool is_punctuation(char32_t cp) {
    // All non-letter/number ASCII is punctuation, even characters such as
    // "^", "$" and "`" that are not in the Unicode P* categories.
    if ((cp >= 33 && cp <= 47) || (cp >= 58 && cp <= 64) ||
        (cp >= 91 && cp <= 96) || (cp >= 123 && cp <= 126)) {
        return true;
    }
    return (category_mask(cp) & U_GC_P_MASK) != 0;
}

bool is_chinese_char(char32_t cp) {
    for (const auto &range : kChineseRanges) {
        if (cp >= range.first && cp <= range.last) return true;
    }
    return false;
}

std::u32string decode_utf8(const std::string &input) {
    std::u32string result;
    result.reserve(input.size());

    const auto *s = reinterpret_cast<const uint8_t *>(input.data());
    const int32_t length = static_cast<int32_t>(input.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 cp;
        U8_NEXT(s, i, length, cp);
        if (cp < 0) continue; // ill-formed sequence
        result.push_back(static_cast<char32_t>(cp));
    }
    return result;
}

std::string encode_utf8(const std::u32string &input) {
    std::string result;
    result.reserve(input.size());
    for (char32_t cp : input) {
        append_utf8(result, cp);
    }
    return result;
}

bool is_valid_utf8(const std::string &input) {
    const auto *s = reinterpret_cast<const uint8_t *>(input.data());
    const int32_t length = static_cast<int32_t>(input.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 cp;
        U8_NEXT(s, i, length, cp);
        if (cp < 0) return false;
    }
    return true;
}

std::string sanitize_utf8(const std::string &input) {
    if (is_valid_utf8(input)) return input;
    return encode_utf8(decode_utf8(input));
}

std::string clean(const std::string &input) {
    std::string result;
    result.reserve(input.size());
    for (char32_t cp : decode_utf8(input)) {
        if (cp == 0 || cp == 0xFFFD || is_control(cp)) {
            continue;
        }
        if (is_whitespace(cp)) {
            result += ' ';
        } else {
            append_utf8(result, cp);
        }
    }
    return result;
}

std::string isolate_chinese_chars(const std::string &input) {
    std::string result;
    result.reserve(input.size() + input.size() / 2);
    for (char32_t cp : decode_utf8(input)) {
        if (is_chinese_char(cp)) {
            result += ' ';
            append_utf8(result, cp);
            result += ' ';
        } else {
            append_utf8(result, cp);
        }
    }
    return result;
}

std::string normalize_nfc(const std::string &input) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString normalized =
        nfc_instance().normalize(to_unicode(input), status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFC normalization failed: ") +
                                 u_errorName(status));
    }
    return from_unicode(normalized);
}

std::string to_lower(const std::string &input) {
    icu::UnicodeString s = to_unicode(input);
    s.toLower(icu::Locale::getRoot());
    return from_unicode(s);
}

std::string strip_accents(const std::string &input) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString decomposed =
        nfd_instance().normalize(to_unicode(input), status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFD normalization failed: ") +
                                 u_errorName(status));
    }

    std::string result;
    result.reserve(input.size());
    for (int32_t i = 0; i < decomposed.length();) {
        UChar32 cp = decomposed.char32At(i);
        i += U16_LENGTH(cp);
        if ((U_GET_GC_MASK(cp) & U_GC_MN_MASK) != 0) {
            continue;
        }
        append_utf8(result, static_cast<char32_t>(cp));
    }
    return result;
}

std::vector<std::string> whitespace_split(const std::string &input) {
    std::vector<std::string> tokens;
    std::string current;
    for (char32_t cp : decode_utf8(input)) {
        // White_Space property plus the ASCII separators U+001C..U+001F
        bool space = u_isUWhiteSpace(static_cast<UChar32>(cp)) ||
                     (cp >= 0x1C && cp <= 0x1F);
        if (space) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            append_utf8(current, cp);
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::vector<std::string> split_on_punctuation(const std::string &input) {
    std::vector<std::string> pieces;
    bool start_new_word = true;
    for (char32_t cp : decode_utf8(input)) {
        if (is_punctuation(cp)) {
            pieces.emplace_back();
            append_utf8(pieces.back(), cp);
            start_new_word = true;
        } else {
            if (start_new_word) {
                pieces.emplace_back();
            }
            start_new_word = false;
            append_utf8(pieces.back(), cp);
        }
    }
    return pieces;
}

} // namespace text
} // namespace chartok
