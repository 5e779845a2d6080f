#include "batch.hpp"
#include "errors.hpp"
#include "threading.hpp"
#include <exception>
#include <iostream>

namespace chartok {

namespace {

// Runs fn on every index, capturing per-item failures
template <typename T, typename Fn>
std::vector<BatchResult<T>> run_batch(size_t count,
                                      const BatchOptions &batch_options,
                                      Fn fn) {
    std::vector<BatchResult<T>> results(count);
    threading::parallel_for(count, batch_options.num_threads, [&](size_t i) {
        results[i].index = i;
        try {
            results[i].value = fn(i);
        } catch (const std::exception &e) {
            results[i].error = e.what();
        }
    });

    if (batch_options.strict) {
        for (const auto &result : results) {
            if (!result.ok()) {
                throw BatchError(result.index, result.error);
            }
        }
    }
    return results;
}

} // namespace

std::vector<BatchResult<Encoding>>
batch_encode(const Tokenizer &tokenizer, const std::vector<std::string> &texts,
             const EncodeOptions &encode_options,
             const BatchOptions &batch_options) {
    auto results = run_batch<Encoding>(
        texts.size(), batch_options,
        [&](size_t i) { return tokenizer.encode(texts[i], encode_options); });

    size_t truncated = 0;
    for (const auto &result : results) {
        if (result.ok()) truncated += result.value->num_truncated_words;
    }
    if (truncated > 0) {
        std::cerr << "Warning: " << truncated << " words longer than "
                  << tokenizer.max_word_length() - 2
                  << " bytes were truncated" << std::endl;
    }
    return results;
}

std::vector<BatchResult<Sequence>>
batch_encode_tokens(const Tokenizer &tokenizer,
                    const std::vector<std::vector<std::string>> &tokens,
                    const BatchOptions &batch_options) {
    return run_batch<Sequence>(
        tokens.size(), batch_options,
        [&](size_t i) { return tokenizer.convert_tokens_to_ids(tokens[i]); });
}

std::vector<BatchResult<std::string>>
batch_decode_ids(const Tokenizer &tokenizer, const Sequence &words,
                 const BatchOptions &batch_options) {
    return run_batch<std::string>(
        words.size(), batch_options,
        [&](size_t i) { return tokenizer.decode_ids(words[i]); });
}

} // namespace chartok
