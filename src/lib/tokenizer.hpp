#pragma once

#include "character_ids.hpp"
#include "segmenter.hpp"
#include "vocab.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chartok {

// Sequence of words, each encoded as one CharacterIds array
using Sequence = std::vector<CharacterIds>;

struct SpecialTokens {
    std::string unk = "[UNK]";
    std::string sep = "[SEP]";
    std::string pad = "[PAD]";
    std::string cls = "[CLS]";
    std::string mask = "[MASK]";
};

struct Options {
    // Maximum number of UTF-8 bytes per word, BOW/EOW included
    size_t max_word_length = kDefaultMaxWordLength;
    bool do_lower_case = true;
    bool do_basic_tokenize = true;
    std::vector<std::string> never_split;
    bool tokenize_chinese_chars = true;
    // Unset: strip accents whenever do_lower_case is set
    std::optional<bool> strip_accents;
    bool do_split_on_punc = true;
    // When set, special token strings in the text are segmented like
    // ordinary text
    bool split_special_tokens = false;
    SpecialTokens special_tokens;
    // Word-level vocabulary for the MLM head; empty = none
    std::string mlm_vocab_file;
};

struct EncodeOptions {
    bool add_special_tokens = true;
    // 0 disables truncation and padding
    size_t max_length = 0;
    bool truncation = false;
    bool pad_to_max_length = false;
};

// Model-ready input for one text or text pair
struct Encoding {
    Sequence input_ids;
    std::vector<int> token_type_ids;
    std::vector<int> special_tokens_mask;
    std::vector<int> attention_mask;
    // Words cut at max_word_length bytes
    size_t num_truncated_words = 0;
    // Words dropped to fit max_length
    size_t num_overflowing_words = 0;
};

class Tokenizer {
  public:
    // Throws ConfigurationError or MissingFile
    explicit Tokenizer(Options options = {});
    Tokenizer(Options options, MlmVocabulary mlm_vocab);

    // Text -> words. Special token strings are kept whole unless
    // split_special_tokens is set.
    std::vector<std::string> tokenize(const std::string &text) const;

    // The configured CLS/SEP/MASK/PAD strings become tags; anything else
    // (including the unknown token) is ordinary text
    Token to_token(const std::string &token) const;
    std::string to_string(const Token &token) const;

    CharacterIds encode_token(const std::string &token,
                              bool *truncated = nullptr) const;
    CharacterIds encode_token(const Token &token,
                              bool *truncated = nullptr) const;
    std::string decode_ids(const CharacterIds &ids) const;

    Sequence convert_tokens_to_ids(const std::vector<std::string> &tokens,
                                   size_t *num_truncated = nullptr) const;
    std::vector<std::string>
    convert_ids_to_tokens(const Sequence &ids,
                          bool skip_special_tokens = false) const;
    std::string
    convert_tokens_to_string(const std::vector<std::string> &tokens) const;

    // [CLS] a [SEP] / [CLS] a [SEP] b [SEP]
    Sequence build_inputs(const Sequence &a) const;
    Sequence build_inputs(const Sequence &a, const Sequence &b) const;

    // 1 for special tokens, 0 for sequence tokens
    std::vector<int>
    special_tokens_mask(const Sequence &a,
                        bool already_has_special_tokens = false) const;
    std::vector<int>
    special_tokens_mask(const Sequence &a, const Sequence &b,
                        bool already_has_special_tokens = false) const;

    std::vector<int> token_type_ids(const Sequence &a) const;
    std::vector<int> token_type_ids(const Sequence &a,
                                    const Sequence &b) const;

    Encoding encode(const std::string &text,
                    const EncodeOptions &encode_options = {}) const;
    Encoding encode(const std::string &text, const std::string &pair,
                    const EncodeOptions &encode_options = {}) const;
    std::string decode(const Sequence &ids,
                       bool skip_special_tokens = false) const;

    // CLS/SEP/MASK/PAD arrays plus the encoding of the unknown token
    bool is_special_ids(const CharacterIds &ids) const;

    // MLM vocabulary
    size_t mlm_vocab_size() const { return mlm_vocab_.size(); }
    std::optional<int> convert_mlm_token_to_id(const std::string &token) const;
    std::string convert_mlm_id_to_token(int index) const;
    std::string save_mlm_vocabulary(const std::string &directory_or_file,
                                    const std::string &prefix = "") const;

    // There is no token vocabulary to save: warns and returns no files
    std::vector<std::string>
    save_vocabulary(const std::string &directory,
                    const std::string &prefix = "") const;

    // tokenizer_config.json + mlm_vocab.txt
    std::vector<std::string> save_pretrained(const std::string &directory) const;
    static Tokenizer from_pretrained(const std::string &directory);

    const Options &options() const { return options_; }
    const CharacterEncoder &encoder() const { return encoder_; }
    const Segmenter &segmenter() const { return segmenter_; }
    const MlmVocabulary &mlm_vocab() const { return mlm_vocab_; }
    size_t max_word_length() const { return encoder_.max_word_length(); }

  private:
    std::vector<std::string> tokenize_piece(const std::string &piece) const;
    Encoding assemble(Sequence a, std::optional<Sequence> b,
                      const EncodeOptions &encode_options) const;

    Options options_;
    CharacterEncoder encoder_;
    Segmenter segmenter_;
    MlmVocabulary mlm_vocab_;
    NeverSplit special_strings_;
    CharacterIds unk_ids_;
};

// Words on coloured backgrounds, the colour derived from each word's ids
std::string visualize(const std::vector<std::string> &words,
                      const Tokenizer &tokenizer);

// Binary snapshot of the options and MLM vocabulary
void save(const Tokenizer &tokenizer, const std::string &filename);
Tokenizer load(const std::string &filename);

} // namespace chartok
