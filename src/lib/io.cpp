#include "io.hpp"
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace chartok {
namespace io {

std::string read_file(const std::string &path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

void save_ids(const std::vector<CharacterIds> &words,
              const std::string &filename) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + filename + " for writing");
    }

    std::vector<uint16_t> flat;
    for (const auto &word : words) {
        for (CharacterId id : word) {
            if (id > UINT16_MAX) {
                throw std::out_of_range("Character id " + std::to_string(id) +
                                        " does not fit in 16 bits");
            }
            flat.push_back(static_cast<uint16_t>(id));
        }
    }
    file.write(reinterpret_cast<const char *>(flat.data()),
               static_cast<std::streamsize>(flat.size() * sizeof(uint16_t)));
    if (!file) {
        throw std::runtime_error("Failed to write to " + filename);
    }
}

std::vector<CharacterIds> load_ids(const std::string &filename,
                                   size_t max_word_length) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + filename + " for reading");
    }

    file.seekg(0, std::ios::end);
    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    const size_t word_bytes = max_word_length * sizeof(uint16_t);
    if (word_bytes == 0 || static_cast<size_t>(size) % word_bytes != 0) {
        throw std::runtime_error("Invalid character id file size: " +
                                 filename);
    }

    std::vector<uint16_t> flat(static_cast<size_t>(size) / sizeof(uint16_t));
    file.read(reinterpret_cast<char *>(flat.data()), size);
    if (!file) {
        throw std::runtime_error("Failed to read from " + filename);
    }

    std::vector<CharacterIds> words;
    words.reserve(flat.size() / max_word_length);
    for (size_t start = 0; start < flat.size(); start += max_word_length) {
        words.emplace_back(flat.begin() + start,
                           flat.begin() + start + max_word_length);
    }
    return words;
}

} // namespace io
} // namespace chartok
