#include "segmenter.hpp"
#include "text.hpp"
#include <utility>

namespace chartok {

Segmenter::Segmenter(SegmenterOptions options) : options_(std::move(options)) {}

bool Segmenter::is_protected(const std::string &token,
                             const NeverSplit &extra_never_split) const {
    return options_.never_split.contains(token) ||
           extra_never_split.contains(token);
}

std::string Segmenter::normalize_token(const std::string &token) const {
    if (options_.do_lower_case) {
        std::string lowered = text::to_lower(token);
        if (options_.strip_accents.value_or(true)) {
            return text::strip_accents(lowered);
        }
        return lowered;
    }
    if (options_.strip_accents.value_or(false)) {
        return text::strip_accents(token);
    }
    return token;
}

std::vector<std::string>
Segmenter::segment(const std::string &text,
                   const NeverSplit &extra_never_split) const {
    std::string cleaned = text::clean(text);
    if (options_.tokenize_chinese_chars) {
        cleaned = text::isolate_chinese_chars(cleaned);
    }
    // Same character with different code point sequences -> one form
    const std::string normalized = text::normalize_nfc(cleaned);

    std::string joined;
    joined.reserve(normalized.size() * 2);
    auto append_piece = [&joined](const std::string &piece) {
        if (!joined.empty()) joined += ' ';
        joined += piece;
    };

    for (const auto &token : text::whitespace_split(normalized)) {
        if (is_protected(token, extra_never_split)) {
            append_piece(token);
            continue;
        }
        const std::string word = normalize_token(token);
        if (!options_.do_split_on_punc ||
            is_protected(word, extra_never_split)) {
            append_piece(word);
            continue;
        }
        for (const auto &piece : text::split_on_punctuation(word)) {
            append_piece(piece);
        }
    }

    return text::whitespace_split(joined);
}

std::vector<std::string> whitespace_tokenize(const std::string &text) {
    return text::whitespace_split(text);
}

} // namespace chartok
