#pragma once

#include "tokenizer.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <yaml-cpp/yaml.h>

namespace chartok {

// Keys mirror the Options field names; special token strings use
// unk_token/sep_token/pad_token/cls_token/mask_token. Missing keys keep their
// defaults, values of the wrong type raise ConfigurationError.
Options options_from_yaml(const YAML::Node &node);

// Reads the given section of a params.yaml style file
Options load_options(const std::string &path,
                     const std::string &section = "tokenizer");

// tokenizer_config.json representation (mlm_vocab_file is not stored)
nlohmann::json options_to_json(const Options &options);
Options options_from_json(const nlohmann::json &json);

} // namespace chartok
