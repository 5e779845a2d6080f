#include "vocab.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chartok {

MlmVocabulary MlmVocabulary::load(const std::string &path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw MissingFile(path);
    }
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + path + " for reading");
    }

    MlmVocabulary vocab;
    std::string line;
    int index = 0;
    // Empty lines are tokens too: the line number is the index
    while (std::getline(file, line)) {
        vocab.insert(line, index++);
    }
    return vocab;
}

void MlmVocabulary::save(const std::string &path) const {
    std::ofstream file(path, std::ios::out | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }

    int index = 0;
    for (const auto &[token, token_index] : entries()) {
        if (index != token_index) {
            std::cerr << "Warning: saving MLM vocabulary to " << path
                      << ": vocabulary indices are not consecutive (expected "
                      << index << ", got " << token_index
                      << "). Please check that the vocabulary is not "
                         "corrupted!"
                      << std::endl;
            index = token_index;
        }
        file << token << '\n';
        ++index;
    }
    if (!file) {
        throw std::runtime_error("Failed to write to " + path);
    }
}

void MlmVocabulary::insert(const std::string &token, int index) {
    auto it = token_to_id_.find(token);
    if (it != token_to_id_.end()) {
        auto reverse = id_to_token_.find(it->second);
        if (reverse != id_to_token_.end() && reverse->second == token) {
            id_to_token_.erase(reverse);
        }
    }
    token_to_id_[token] = index;
    id_to_token_[index] = token;
}

std::optional<int> MlmVocabulary::id(const std::string &token) const {
    auto it = token_to_id_.find(token);
    if (it == token_to_id_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> MlmVocabulary::token(int index) const {
    auto it = id_to_token_.find(index);
    if (it == id_to_token_.end()) return std::nullopt;
    return it->second;
}

std::vector<MlmVocabulary::Entry> MlmVocabulary::entries() const {
    std::vector<Entry> sorted(token_to_id_.begin(), token_to_id_.end());
    std::sort(sorted.begin(), sorted.end(),
              [](const Entry &a, const Entry &b) {
                  if (a.second != b.second) return a.second < b.second;
                  return a.first < b.first;
              });
    return sorted;
}

} // namespace chartok
