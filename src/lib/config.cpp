#include "config.hpp"
#include "errors.hpp"
#include <cstdint>
#include <string>

namespace chartok {

namespace {

template <typename T>
void read_yaml(const YAML::Node &node, const char *key, T &out) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return;
    try {
        out = value.as<T>();
    } catch (const YAML::Exception &e) {
        throw ConfigurationError(std::string("Invalid value for '") + key +
                                 "': " + e.what());
    }
}

template <typename T>
void read_json(const nlohmann::json &json, const char *key, T &out) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception &e) {
        throw ConfigurationError(std::string("Invalid value for '") + key +
                                 "': " + e.what());
    }
}

// Negative or too small lengths are rejected before they reach size_t
size_t checked_word_length(int64_t length) {
    if (length < static_cast<int64_t>(kMinWordLength)) {
        throw ConfigurationError("Invalid value for 'max_word_length': " +
                                 std::to_string(length) +
                                 " (must be at least " +
                                 std::to_string(kMinWordLength) + ")");
    }
    return static_cast<size_t>(length);
}

} // namespace

Options options_from_yaml(const YAML::Node &node) {
    Options options;
    if (!node || node.IsNull()) return options;
    if (!node.IsMap()) {
        throw ConfigurationError("tokenizer configuration must be a map");
    }

    int64_t max_word_length = static_cast<int64_t>(options.max_word_length);
    read_yaml(node, "max_word_length", max_word_length);
    options.max_word_length = checked_word_length(max_word_length);
    read_yaml(node, "do_lower_case", options.do_lower_case);
    read_yaml(node, "do_basic_tokenize", options.do_basic_tokenize);
    read_yaml(node, "never_split", options.never_split);
    read_yaml(node, "tokenize_chinese_chars", options.tokenize_chinese_chars);
    read_yaml(node, "do_split_on_punc", options.do_split_on_punc);
    read_yaml(node, "split_special_tokens", options.split_special_tokens);
    read_yaml(node, "unk_token", options.special_tokens.unk);
    read_yaml(node, "sep_token", options.special_tokens.sep);
    read_yaml(node, "pad_token", options.special_tokens.pad);
    read_yaml(node, "cls_token", options.special_tokens.cls);
    read_yaml(node, "mask_token", options.special_tokens.mask);
    read_yaml(node, "mlm_vocab_file", options.mlm_vocab_file);

    bool strip_accents = false;
    const YAML::Node strip = node["strip_accents"];
    if (strip && !strip.IsNull()) {
        read_yaml(node, "strip_accents", strip_accents);
        options.strip_accents = strip_accents;
    }
    return options;
}

Options load_options(const std::string &path, const std::string &section) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        throw ConfigurationError("Failed to load " + path + ": " + e.what());
    }
    const YAML::Node &root = config;
    return options_from_yaml(root[section]);
}

nlohmann::json options_to_json(const Options &options) {
    nlohmann::json json;
    json["tokenizer_class"] = "chartok";
    json["max_word_length"] = options.max_word_length;
    json["do_lower_case"] = options.do_lower_case;
    json["do_basic_tokenize"] = options.do_basic_tokenize;
    json["never_split"] = options.never_split;
    json["tokenize_chinese_chars"] = options.tokenize_chinese_chars;
    if (options.strip_accents) {
        json["strip_accents"] = *options.strip_accents;
    } else {
        json["strip_accents"] = nullptr;
    }
    json["do_split_on_punc"] = options.do_split_on_punc;
    json["split_special_tokens"] = options.split_special_tokens;
    json["unk_token"] = options.special_tokens.unk;
    json["sep_token"] = options.special_tokens.sep;
    json["pad_token"] = options.special_tokens.pad;
    json["cls_token"] = options.special_tokens.cls;
    json["mask_token"] = options.special_tokens.mask;
    return json;
}

Options options_from_json(const nlohmann::json &json) {
    if (!json.is_object()) {
        throw ConfigurationError("tokenizer configuration must be an object");
    }
    Options options;
    int64_t max_word_length = static_cast<int64_t>(options.max_word_length);
    read_json(json, "max_word_length", max_word_length);
    options.max_word_length = checked_word_length(max_word_length);
    read_json(json, "do_lower_case", options.do_lower_case);
    read_json(json, "do_basic_tokenize", options.do_basic_tokenize);
    read_json(json, "never_split", options.never_split);
    read_json(json, "tokenize_chinese_chars", options.tokenize_chinese_chars);
    read_json(json, "do_split_on_punc", options.do_split_on_punc);
    read_json(json, "split_special_tokens", options.split_special_tokens);
    read_json(json, "unk_token", options.special_tokens.unk);
    read_json(json, "sep_token", options.special_tokens.sep);
    read_json(json, "pad_token", options.special_tokens.pad);
    read_json(json, "cls_token", options.special_tokens.cls);
    read_json(json, "mask_token", options.special_tokens.mask);

    auto strip = json.find("strip_accents");
    if (strip != json.end() && !strip->is_null()) {
        bool value = false;
        read_json(json, "strip_accents", value);
        options.strip_accents = value;
    }
    return options;
}

} // namespace chartok
