#pragma once

#include <absl/container/flat_hash_map.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chartok {

// Word-level vocabulary used only to label the masked language modelling
// objective. It never produces model input.
class MlmVocabulary {
  public:
    using Entry = std::pair<std::string, int>;

    MlmVocabulary() = default;

    // One token per line, line number = index. Throws MissingFile.
    static MlmVocabulary load(const std::string &path);

    // Writes the tokens sorted by index; gaps in the indices only warn
    void save(const std::string &path) const;

    // A token that is already present is re-assigned to index
    void insert(const std::string &token, int index);

    std::optional<int> id(const std::string &token) const;
    std::optional<std::string> token(int index) const;

    // Sorted by index
    std::vector<Entry> entries() const;

    size_t size() const { return token_to_id_.size(); }
    bool empty() const { return token_to_id_.empty(); }

  private:
    absl::flat_hash_map<std::string, int> token_to_id_;
    absl::flat_hash_map<int, std::string> id_to_token_;
};

} // namespace chartok
