#include "character_ids.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <algorithm>

namespace chartok {

CharacterEncoder::CharacterEncoder(size_t max_word_length)
    : max_word_length_(max_word_length) {
    if (max_word_length < kMinWordLength) {
        throw ConfigurationError("maximum word length has to be at least " +
                                 std::to_string(kMinWordLength) + ", got " +
                                 std::to_string(max_word_length));
    }
    cls_ids_ = make_special(kBeginOfTextCharacter);
    sep_ids_ = make_special(kEndOfTextCharacter);
    mask_ids_ = make_special(kMaskCharacter);
    // Already post-shift: the unshifted pad identity would be -1
    pad_ids_.assign(max_word_length_, 0);
}

// BOW, marker, EOW, then PAD characters; shifted by +1
CharacterIds CharacterEncoder::make_special(CharacterId marker) const {
    CharacterIds ids(max_word_length_, kPadCharacter);
    ids[0] = kBeginOfWordCharacter;
    ids[1] = marker;
    ids[2] = kEndOfWordCharacter;
    for (auto &id : ids) {
        id += 1;
    }
    return ids;
}

const CharacterIds &CharacterEncoder::special(SpecialTag tag) const {
    switch (tag) {
    case SpecialTag::Cls:
        return cls_ids_;
    case SpecialTag::Sep:
        return sep_ids_;
    case SpecialTag::Mask:
        return mask_ids_;
    case SpecialTag::Pad:
        break;
    }
    return pad_ids_;
}

CharacterIds CharacterEncoder::encode(const Token &token,
                                      bool *truncated) const {
    if (const auto *tag = std::get_if<SpecialTag>(&token)) {
        if (truncated) *truncated = false;
        return special(*tag);
    }
    return encode_word(std::get<std::string>(token), truncated);
}

CharacterIds CharacterEncoder::encode_word(const std::string &word,
                                           bool *truncated) const {
    const std::string bytes = text::sanitize_utf8(word);
    const size_t capacity = max_word_length_ - 2;
    const size_t length = std::min(bytes.size(), capacity);
    if (truncated) *truncated = bytes.size() > capacity;

    CharacterIds ids(max_word_length_, kPadCharacter);
    ids[0] = kBeginOfWordCharacter;
    for (size_t k = 0; k < length; ++k) {
        ids[k + 1] = static_cast<unsigned char>(bytes[k]);
    }
    ids[length + 1] = kEndOfWordCharacter;

    for (auto &id : ids) {
        id += 1;
    }
    return ids;
}

bool CharacterEncoder::is_special(const CharacterIds &ids) const {
    return ids == cls_ids_ || ids == sep_ids_ || ids == mask_ids_ ||
           ids == pad_ids_;
}

Token CharacterEncoder::decode(const CharacterIds &ids) const {
    if (ids.size() != max_word_length_) {
        throw LengthMismatch(max_word_length_, ids.size());
    }

    // Comparing the shifted arrays is the same as comparing unshifted forms
    if (ids == cls_ids_) return SpecialTag::Cls;
    if (ids == sep_ids_) return SpecialTag::Sep;
    if (ids == mask_ids_) return SpecialTag::Mask;
    if (ids == pad_ids_) return SpecialTag::Pad;

    std::string bytes;
    bytes.reserve(max_word_length_);
    for (size_t k = 0; k < ids.size(); ++k) {
        if (ids[k] == 0) {
            throw InvalidByteSequence("padding id inside a word at position " +
                                      std::to_string(k));
        }
        const CharacterId id = ids[k] - 1;
        if (id == kBeginOfWordCharacter || id == kEndOfWordCharacter ||
            id == kPadCharacter) {
            continue;
        }
        if (id > 255) {
            throw InvalidByteSequence("character id " + std::to_string(id) +
                                      " at position " + std::to_string(k) +
                                      " is not a byte value");
        }
        bytes.push_back(static_cast<char>(id));
    }

    if (!text::is_valid_utf8(bytes)) {
        throw InvalidByteSequence("character ids do not form valid UTF-8");
    }
    return bytes;
}

} // namespace chartok
