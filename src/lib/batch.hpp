#pragma once

#include "tokenizer.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chartok {

struct BatchOptions {
    // Throw BatchError on the first failing item instead of reporting it
    bool strict = false;
    // 0 = hardware concurrency
    size_t num_threads = 0;
};

// Outcome for one element of a batch, in input order
template <typename T> struct BatchResult {
    size_t index = 0;
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }
};

std::vector<BatchResult<Encoding>>
batch_encode(const Tokenizer &tokenizer, const std::vector<std::string> &texts,
             const EncodeOptions &encode_options = {},
             const BatchOptions &batch_options = {});

// Pre-segmented words per item, no special tokens added
std::vector<BatchResult<Sequence>>
batch_encode_tokens(const Tokenizer &tokenizer,
                    const std::vector<std::vector<std::string>> &tokens,
                    const BatchOptions &batch_options = {});

std::vector<BatchResult<std::string>>
batch_decode_ids(const Tokenizer &tokenizer, const Sequence &words,
                 const BatchOptions &batch_options = {});

// Number of items that failed
template <typename T>
size_t count_failures(const std::vector<BatchResult<T>> &results) {
    size_t failures = 0;
    for (const auto &result : results) {
        if (!result.ok()) ++failures;
    }
    return failures;
}

} // namespace chartok
