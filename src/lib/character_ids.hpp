#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace chartok {

using CharacterId = uint32_t;
// One word as model input: exactly max_word_length ids
using CharacterIds = std::vector<CharacterId>;

enum class SpecialTag { Cls, Sep, Mask, Pad };

// A word to encode: ordinary text or one of the special markers
using Token = std::variant<std::string, SpecialTag>;

// Reserved character ids, before the +1 shift.
// 0-255 are the raw UTF-8 byte values.
constexpr CharacterId kBeginOfTextCharacter = 256; // CLS
constexpr CharacterId kEndOfTextCharacter = 257;   // SEP
constexpr CharacterId kBeginOfWordCharacter = 258;
constexpr CharacterId kEndOfWordCharacter = 259;
constexpr CharacterId kPadCharacter = 260;
constexpr CharacterId kMaskCharacter = 261;

constexpr size_t kMinWordLength = 3;
constexpr size_t kDefaultMaxWordLength = 50;

// Maps words to fixed-width arrays of byte ids and back.
//
// Every id is shifted by +1 on the way out so that the all-zero array can be
// used as sequence padding; decode() undoes the shift exactly once.
class CharacterEncoder {
  public:
    // Throws ConfigurationError if max_word_length < 3
    explicit CharacterEncoder(size_t max_word_length = kDefaultMaxWordLength);

    // Words longer than max_word_length - 2 bytes are truncated; *truncated
    // is set when that happens.
    CharacterIds encode(const Token &token, bool *truncated = nullptr) const;
    CharacterIds encode_word(const std::string &word,
                             bool *truncated = nullptr) const;
    const CharacterIds &special(SpecialTag tag) const;

    // Throws LengthMismatch or InvalidByteSequence
    Token decode(const CharacterIds &ids) const;

    // Matches one of the CLS/SEP/MASK/PAD arrays
    bool is_special(const CharacterIds &ids) const;

    size_t max_word_length() const { return max_word_length_; }

  private:
    CharacterIds make_special(CharacterId marker) const;

    size_t max_word_length_;
    CharacterIds cls_ids_;
    CharacterIds sep_ids_;
    CharacterIds mask_ids_;
    CharacterIds pad_ids_;
};

} // namespace chartok
