#pragma once

#include "character_ids.hpp"
#include <string>
#include <vector>

namespace chartok {
namespace io {

std::string read_file(const std::string &path);

// Words flattened to uint16_t, max_word_length values per word
void save_ids(const std::vector<CharacterIds> &words,
              const std::string &filename);
std::vector<CharacterIds> load_ids(const std::string &filename,
                                   size_t max_word_length);

} // namespace io
} // namespace chartok
