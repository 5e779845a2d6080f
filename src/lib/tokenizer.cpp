#include "tokenizer.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace chartok {

namespace {

const char *kMlmVocabFile = "mlm_vocab.txt";
const char *kConfigFile = "tokenizer_config.json";
// Continuation prefix of WordPiece-style subwords
const char *kContinuationMarker = " ##";

SegmenterOptions segmenter_options(const Options &options) {
    SegmenterOptions result;
    result.do_lower_case = options.do_lower_case;
    result.tokenize_chinese_chars = options.tokenize_chinese_chars;
    result.strip_accents = options.strip_accents;
    result.do_split_on_punc = options.do_split_on_punc;
    result.never_split.insert(options.never_split.begin(),
                              options.never_split.end());
    return result;
}

MlmVocabulary load_mlm_vocab(const Options &options) {
    if (options.mlm_vocab_file.empty()) return {};
    return MlmVocabulary::load(options.mlm_vocab_file);
}

std::string prefixed(const std::string &prefix, const std::string &name) {
    return prefix.empty() ? name : prefix + "-" + name;
}

} // namespace

Tokenizer::Tokenizer(Options options)
    : Tokenizer(options, load_mlm_vocab(options)) {}

Tokenizer::Tokenizer(Options options, MlmVocabulary mlm_vocab)
    : options_(std::move(options)), encoder_(options_.max_word_length),
      segmenter_(segmenter_options(options_)),
      mlm_vocab_(std::move(mlm_vocab)) {
    const SpecialTokens &st = options_.special_tokens;
    for (const std::string *s :
         {&st.unk, &st.sep, &st.pad, &st.cls, &st.mask}) {
        if (!s->empty()) special_strings_.insert(*s);
    }
    unk_ids_ = encoder_.encode_word(st.unk);
}

// Segmentation of text that holds no protected special token
std::vector<std::string>
Tokenizer::tokenize_piece(const std::string &piece) const {
    if (!options_.do_basic_tokenize) {
        return whitespace_tokenize(piece);
    }
    if (options_.split_special_tokens) {
        return segmenter_.segment(piece);
    }
    return segmenter_.segment(piece, special_strings_);
}

std::vector<std::string> Tokenizer::tokenize(const std::string &text) const {
    if (options_.split_special_tokens || special_strings_.empty()) {
        return tokenize_piece(text);
    }

    // Pre-scan text once to find all special token positions
    struct SpecialMatch {
        size_t pos;
        size_t len;
    };
    std::vector<SpecialMatch> matches;

    for (const auto &token_str : special_strings_) {
        size_t search_pos = 0;
        while ((search_pos = text.find(token_str, search_pos)) !=
               std::string::npos) {
            matches.push_back({search_pos, token_str.length()});
            search_pos += token_str.length();
        }
    }

    // Sort by position, longer match first on ties
    std::sort(matches.begin(), matches.end(),
              [](const SpecialMatch &a, const SpecialMatch &b) {
                  if (a.pos != b.pos) return a.pos < b.pos;
                  return a.len > b.len;
              });

    // Remove overlapping matches (keep first occurrence)
    if (!matches.empty()) {
        std::vector<SpecialMatch> filtered;
        filtered.reserve(matches.size());
        filtered.push_back(matches[0]);
        for (size_t i = 1; i < matches.size(); ++i) {
            if (matches[i].pos >= filtered.back().pos + filtered.back().len) {
                filtered.push_back(matches[i]);
            }
        }
        matches = std::move(filtered);
    }

    std::vector<std::string> result;
    size_t pos = 0;
    auto append_segment = [&](const std::string &piece) {
        std::vector<std::string> words = tokenize_piece(piece);
        result.insert(result.end(), std::make_move_iterator(words.begin()),
                      std::make_move_iterator(words.end()));
    };

    for (const auto &match : matches) {
        if (match.pos > pos) {
            append_segment(text.substr(pos, match.pos - pos));
        }
        result.push_back(text.substr(match.pos, match.len));
        pos = match.pos + match.len;
    }
    if (pos < text.length()) {
        append_segment(text.substr(pos));
    }

    return result;
}

Token Tokenizer::to_token(const std::string &token) const {
    const SpecialTokens &st = options_.special_tokens;
    if (!st.cls.empty() && token == st.cls) return SpecialTag::Cls;
    if (!st.sep.empty() && token == st.sep) return SpecialTag::Sep;
    if (!st.mask.empty() && token == st.mask) return SpecialTag::Mask;
    if (!st.pad.empty() && token == st.pad) return SpecialTag::Pad;
    return token;
}

std::string Tokenizer::to_string(const Token &token) const {
    if (const auto *word = std::get_if<std::string>(&token)) {
        return *word;
    }
    const SpecialTokens &st = options_.special_tokens;
    switch (std::get<SpecialTag>(token)) {
    case SpecialTag::Cls:
        return st.cls;
    case SpecialTag::Sep:
        return st.sep;
    case SpecialTag::Mask:
        return st.mask;
    case SpecialTag::Pad:
        break;
    }
    return st.pad;
}

CharacterIds Tokenizer::encode_token(const std::string &token,
                                     bool *truncated) const {
    return encoder_.encode(to_token(token), truncated);
}

CharacterIds Tokenizer::encode_token(const Token &token,
                                     bool *truncated) const {
    return encoder_.encode(token, truncated);
}

std::string Tokenizer::decode_ids(const CharacterIds &ids) const {
    return to_string(encoder_.decode(ids));
}

Sequence
Tokenizer::convert_tokens_to_ids(const std::vector<std::string> &tokens,
                                 size_t *num_truncated) const {
    Sequence ids;
    ids.reserve(tokens.size());
    size_t truncated_count = 0;
    for (const auto &token : tokens) {
        bool truncated = false;
        ids.push_back(encode_token(token, &truncated));
        if (truncated) ++truncated_count;
    }
    if (num_truncated) *num_truncated = truncated_count;
    return ids;
}

std::vector<std::string>
Tokenizer::convert_ids_to_tokens(const Sequence &ids,
                                 bool skip_special_tokens) const {
    std::vector<std::string> tokens;
    tokens.reserve(ids.size());
    for (const auto &word : ids) {
        if (skip_special_tokens && is_special_ids(word)) continue;
        tokens.push_back(decode_ids(word));
    }
    return tokens;
}

std::string Tokenizer::convert_tokens_to_string(
    const std::vector<std::string> &tokens) const {
    std::string joined;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += tokens[i];
    }

    const std::string marker = kContinuationMarker;
    std::string merged;
    merged.reserve(joined.size());
    size_t pos = 0;
    size_t found = 0;
    while ((found = joined.find(marker, pos)) != std::string::npos) {
        merged.append(joined, pos, found - pos);
        pos = found + marker.size();
    }
    merged.append(joined, pos, std::string::npos);

    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
               c == '\f';
    };
    size_t begin = 0;
    size_t end = merged.size();
    while (begin < end && is_space(merged[begin])) ++begin;
    while (end > begin && is_space(merged[end - 1])) --end;
    return merged.substr(begin, end - begin);
}

Sequence Tokenizer::build_inputs(const Sequence &a) const {
    Sequence result;
    result.reserve(a.size() + 2);
    result.push_back(encoder_.special(SpecialTag::Cls));
    result.insert(result.end(), a.begin(), a.end());
    result.push_back(encoder_.special(SpecialTag::Sep));
    return result;
}

Sequence Tokenizer::build_inputs(const Sequence &a, const Sequence &b) const {
    Sequence result = build_inputs(a);
    result.reserve(result.size() + b.size() + 1);
    result.insert(result.end(), b.begin(), b.end());
    result.push_back(encoder_.special(SpecialTag::Sep));
    return result;
}

bool Tokenizer::is_special_ids(const CharacterIds &ids) const {
    return encoder_.is_special(ids) || ids == unk_ids_;
}

std::vector<int>
Tokenizer::special_tokens_mask(const Sequence &a,
                               bool already_has_special_tokens) const {
    std::vector<int> mask;
    if (already_has_special_tokens) {
        mask.reserve(a.size());
        for (const auto &word : a) {
            mask.push_back(is_special_ids(word) ? 1 : 0);
        }
        return mask;
    }
    mask.reserve(a.size() + 2);
    mask.push_back(1);
    mask.insert(mask.end(), a.size(), 0);
    mask.push_back(1);
    return mask;
}

std::vector<int>
Tokenizer::special_tokens_mask(const Sequence &a, const Sequence &b,
                               bool already_has_special_tokens) const {
    if (already_has_special_tokens) {
        throw std::invalid_argument(
            "You should not supply a second sequence if the provided sequence "
            "of ids is already formatted with special tokens for the model.");
    }
    std::vector<int> mask = special_tokens_mask(a, false);
    mask.insert(mask.end(), b.size(), 0);
    mask.push_back(1);
    return mask;
}

std::vector<int> Tokenizer::token_type_ids(const Sequence &a) const {
    return std::vector<int>(a.size() + 2, 0);
}

std::vector<int> Tokenizer::token_type_ids(const Sequence &a,
                                           const Sequence &b) const {
    std::vector<int> ids = token_type_ids(a);
    ids.insert(ids.end(), b.size() + 1, 1);
    return ids;
}

Encoding Tokenizer::assemble(Sequence a, std::optional<Sequence> b,
                             const EncodeOptions &encode_options) const {
    Encoding encoding;

    const size_t num_special =
        encode_options.add_special_tokens ? (b ? 3 : 2) : 0;
    const size_t max_length = encode_options.max_length;

    if (encode_options.truncation && max_length > 0) {
        // Longest first: drop from the end of the longer sequence
        while (a.size() + (b ? b->size() : 0) + num_special > max_length) {
            if (b && b->size() >= a.size() && !b->empty()) {
                b->pop_back();
            } else if (!a.empty()) {
                a.pop_back();
            } else {
                std::cerr << "Warning: max_length " << max_length
                          << " is too short for the special tokens alone"
                          << std::endl;
                break;
            }
            ++encoding.num_overflowing_words;
        }
    }

    if (encode_options.add_special_tokens) {
        if (b) {
            encoding.input_ids = build_inputs(a, *b);
            encoding.token_type_ids = token_type_ids(a, *b);
            encoding.special_tokens_mask = special_tokens_mask(a, *b);
        } else {
            encoding.input_ids = build_inputs(a);
            encoding.token_type_ids = token_type_ids(a);
            encoding.special_tokens_mask = special_tokens_mask(a);
        }
    } else {
        encoding.input_ids = a;
        encoding.token_type_ids.assign(a.size(), 0);
        if (b) {
            encoding.input_ids.insert(encoding.input_ids.end(), b->begin(),
                                      b->end());
            encoding.token_type_ids.insert(encoding.token_type_ids.end(),
                                           b->size(), 1);
        }
        encoding.special_tokens_mask.assign(encoding.input_ids.size(), 0);
    }
    encoding.attention_mask.assign(encoding.input_ids.size(), 1);

    if (encode_options.pad_to_max_length &&
        encoding.input_ids.size() < max_length) {
        const size_t missing = max_length - encoding.input_ids.size();
        encoding.input_ids.insert(encoding.input_ids.end(), missing,
                                  encoder_.special(SpecialTag::Pad));
        encoding.token_type_ids.insert(encoding.token_type_ids.end(), missing,
                                       0);
        encoding.special_tokens_mask.insert(
            encoding.special_tokens_mask.end(), missing, 1);
        encoding.attention_mask.insert(encoding.attention_mask.end(), missing,
                                       0);
    }
    return encoding;
}

Encoding Tokenizer::encode(const std::string &text,
                           const EncodeOptions &encode_options) const {
    size_t truncated = 0;
    Sequence a = convert_tokens_to_ids(tokenize(text), &truncated);
    Encoding encoding = assemble(std::move(a), std::nullopt, encode_options);
    encoding.num_truncated_words = truncated;
    return encoding;
}

Encoding Tokenizer::encode(const std::string &text, const std::string &pair,
                           const EncodeOptions &encode_options) const {
    size_t truncated_a = 0;
    size_t truncated_b = 0;
    Sequence a = convert_tokens_to_ids(tokenize(text), &truncated_a);
    Sequence b = convert_tokens_to_ids(tokenize(pair), &truncated_b);
    Encoding encoding = assemble(std::move(a), std::move(b), encode_options);
    encoding.num_truncated_words = truncated_a + truncated_b;
    return encoding;
}

std::string Tokenizer::decode(const Sequence &ids,
                              bool skip_special_tokens) const {
    return convert_tokens_to_string(
        convert_ids_to_tokens(ids, skip_special_tokens));
}

std::optional<int>
Tokenizer::convert_mlm_token_to_id(const std::string &token) const {
    if (auto index = mlm_vocab_.id(token)) return index;
    return mlm_vocab_.id(options_.special_tokens.unk);
}

std::string Tokenizer::convert_mlm_id_to_token(int index) const {
    return mlm_vocab_.token(index).value_or(options_.special_tokens.unk);
}

std::string
Tokenizer::save_mlm_vocabulary(const std::string &directory_or_file,
                               const std::string &prefix) const {
    std::string vocab_file;
    if (std::filesystem::is_directory(directory_or_file)) {
        vocab_file = (std::filesystem::path(directory_or_file) /
                      prefixed(prefix, kMlmVocabFile))
                         .string();
    } else {
        vocab_file = prefixed(prefix, directory_or_file);
    }
    mlm_vocab_.save(vocab_file);
    return vocab_file;
}

std::vector<std::string>
Tokenizer::save_vocabulary(const std::string &directory,
                           const std::string &prefix) const {
    std::cerr << "Warning: no token vocabulary to save (characters are "
                 "encoded from their bytes), skipping "
              << (std::filesystem::path(directory) /
                  prefixed(prefix, "vocab.txt"))
                     .string()
              << std::endl;
    return {};
}

std::vector<std::string>
Tokenizer::save_pretrained(const std::string &directory) const {
    std::filesystem::create_directories(directory);

    const std::string config_file =
        (std::filesystem::path(directory) / kConfigFile).string();
    std::ofstream os(config_file);
    if (!os.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " +
                                 config_file);
    }
    os << options_to_json(options_).dump(2) << '\n';
    if (!os) {
        throw std::runtime_error("Failed to write to " + config_file);
    }

    std::vector<std::string> files = {config_file};
    std::vector<std::string> vocab_files = save_vocabulary(directory);
    files.insert(files.end(), vocab_files.begin(), vocab_files.end());
    files.push_back(save_mlm_vocabulary(directory));
    return files;
}

Tokenizer Tokenizer::from_pretrained(const std::string &directory) {
    const std::filesystem::path dir(directory);
    const std::string config_file = (dir / kConfigFile).string();
    std::ifstream is(config_file);
    if (!is.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " +
                                 config_file);
    }

    nlohmann::json json;
    try {
        is >> json;
    } catch (const nlohmann::json::exception &e) {
        throw ConfigurationError("Failed to parse " + config_file + ": " +
                                 e.what());
    }

    Options options = options_from_json(json);
    const std::filesystem::path vocab_file = dir / kMlmVocabFile;
    if (std::filesystem::exists(vocab_file)) {
        options.mlm_vocab_file = vocab_file.string();
    }
    return Tokenizer(std::move(options));
}

std::string visualize(const std::vector<std::string> &words,
                      const Tokenizer &tokenizer) {
    std::string result;
    for (const auto &word : words) {
        const CharacterIds ids = tokenizer.encode_token(word);

        // Generate color
        unsigned int hash_val = 2166136261U;
        for (CharacterId id : ids) {
            hash_val = (hash_val ^ id) * 16777619U;
        }
        hash_val ^= hash_val >> 16;
        hash_val *= 0x85ebca6bU;
        hash_val ^= hash_val >> 13;
        hash_val *= 0xc2b2ae35U;
        hash_val ^= hash_val >> 16;
        int r = (hash_val >> 16) & 0xFF;
        int g = (hash_val >> 8) & 0xFF;
        int b = hash_val & 0xFF;
        // Adjust to pastel: blend with white
        double factor = 0.6;
        r = static_cast<int>(r * factor + 255 * (1 - factor));
        g = static_cast<int>(g * factor + 255 * (1 - factor));
        b = static_cast<int>(b * factor + 255 * (1 - factor));
        result += "\x1b[48;2;" + std::to_string(r) + ";" + std::to_string(g) +
                  ";" + std::to_string(b) + "m";
        result += "\x1b[38;2;0;0;0m";

        result += word;
        result += "\x1b[0m ";
    }
    if (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

void save(const Tokenizer &tokenizer, const std::string &filename) {
    std::ofstream os(filename, std::ios::binary);
    if (!os.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " +
                                 filename);
    }

    const Options &options = tokenizer.options();
    cereal::BinaryOutputArchive archive(os);
    const uint64_t max_word_length = options.max_word_length;
    archive(max_word_length);
    archive(options.do_lower_case, options.do_basic_tokenize,
            options.tokenize_chinese_chars, options.do_split_on_punc,
            options.split_special_tokens);
    archive(options.never_split);

    // strip_accents: 0 = unset, 1 = false, 2 = true
    uint8_t strip_accents = 0;
    if (options.strip_accents) strip_accents = *options.strip_accents ? 2 : 1;
    archive(strip_accents);

    const SpecialTokens &st = options.special_tokens;
    archive(st.unk, st.sep, st.pad, st.cls, st.mask);

    // Save MLM vocabulary entries sorted by index
    archive(tokenizer.mlm_vocab().entries());
}

Tokenizer load(const std::string &filename) {
    std::ifstream is(filename, std::ios::binary);
    if (!is.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " +
                                 filename);
    }

    Options options;
    cereal::BinaryInputArchive archive(is);
    uint64_t max_word_length = 0;
    archive(max_word_length);
    options.max_word_length = static_cast<size_t>(max_word_length);
    archive(options.do_lower_case, options.do_basic_tokenize,
            options.tokenize_chinese_chars, options.do_split_on_punc,
            options.split_special_tokens);
    archive(options.never_split);

    uint8_t strip_accents = 0;
    archive(strip_accents);
    if (strip_accents != 0) options.strip_accents = strip_accents == 2;

    SpecialTokens &st = options.special_tokens;
    archive(st.unk, st.sep, st.pad, st.cls, st.mask);

    std::vector<MlmVocabulary::Entry> entries;
    archive(entries);
    MlmVocabulary mlm_vocab;
    for (const auto &[token, index] : entries) {
        mlm_vocab.insert(token, index);
    }

    return Tokenizer(std::move(options), std::move(mlm_vocab));
}

} // namespace chartok
