#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chartok {

// Invalid tokenizer options (e.g. max_word_length < 3) or a malformed
// configuration file.
struct ConfigurationError : std::invalid_argument {
    explicit ConfigurationError(const std::string &what)
        : std::invalid_argument(what) {}
};

// A vocabulary file that was asked for does not exist.
struct MissingFile : std::runtime_error {
    std::string path;

    explicit MissingFile(const std::string &p)
        : std::runtime_error("Can't find a vocabulary file at path '" + p +
                             "'"),
          path(p) {}
};

// Character id array whose length differs from max_word_length.
struct LengthMismatch : std::invalid_argument {
    size_t expected;
    size_t actual;

    LengthMismatch(size_t e, size_t a)
        : std::invalid_argument("Got a character sequence of length " +
                                std::to_string(a) +
                                " while max_word_length=" + std::to_string(e)),
          expected(e), actual(a) {}
};

// Decoded bytes are not valid UTF-8.
struct InvalidByteSequence : std::runtime_error {
    explicit InvalidByteSequence(const std::string &what)
        : std::runtime_error(what) {}
};

// Raised by strict batch operations; index is the first failing element.
struct BatchError : std::runtime_error {
    size_t index;

    BatchError(size_t i, const std::string &what)
        : std::runtime_error("Batch item " + std::to_string(i) +
                             " failed: " + what),
          index(i) {}
};

} // namespace chartok
