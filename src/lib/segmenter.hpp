#pragma once

#include <absl/container/flat_hash_set.h>
#include <optional>
#include <string>
#include <vector>

namespace chartok {

using NeverSplit = absl::flat_hash_set<std::string>;

struct SegmenterOptions {
    bool do_lower_case = true;
    bool tokenize_chinese_chars = true;
    // Unset: follows do_lower_case
    std::optional<bool> strip_accents;
    bool do_split_on_punc = true;
    NeverSplit never_split;
};

// Basic word segmentation: cleanup, CJK isolation, NFC, casing/accents and
// punctuation splitting. Stateless after construction.
class Segmenter {
  public:
    Segmenter() = default;
    explicit Segmenter(SegmenterOptions options);

    // extra_never_split is merged with options().never_split for this call
    std::vector<std::string>
    segment(const std::string &text,
            const NeverSplit &extra_never_split = {}) const;

    const SegmenterOptions &options() const { return options_; }

  private:
    bool is_protected(const std::string &token,
                      const NeverSplit &extra_never_split) const;
    std::string normalize_token(const std::string &token) const;

    SegmenterOptions options_;
};

// Runs basic whitespace cleanup and splitting only
std::vector<std::string> whitespace_tokenize(const std::string &text);

} // namespace chartok
