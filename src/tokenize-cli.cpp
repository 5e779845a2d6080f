#include "lib/batch.hpp"
#include "lib/config.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace {

void print_ids(const chartok::CharacterIds &ids) {
    std::cout << "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) std::cout << ",";
        std::cout << ids[i];
    }
    std::cout << "]";
}

void print_mask(const char *name, const std::vector<int> &values) {
    std::cout << name << ": ";
    for (int v : values) std::cout << v;
    std::cout << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <text to tokenize...>"
                  << std::endl;
        std::cerr << "Example: " << argv[0] << " \"Hello world!\"" << std::endl;
        return 1;
    }

    try {
        // Load tokenizer from params.yaml
        YAML::Node config = YAML::LoadFile("params.yaml");
        chartok::Tokenizer tok(
            chartok::options_from_yaml(config["tokenizer"]));

        // Concatenate all arguments (skip program name at argv[0])
        std::string input;
        for (int i = 1; i < argc; ++i) {
            if (i > 1) input += " ";
            input += argv[i];
        }

        auto words = tok.tokenize(input);
        std::cout << chartok::visualize(words, tok) << std::endl;
        std::cout << "\nWords: " << words.size() << std::endl;

        chartok::Encoding encoding = tok.encode(input);
        // A row that fails to decode is printed with a placeholder
        chartok::BatchOptions batch_options;
        batch_options.num_threads = 1;
        auto decoded =
            chartok::batch_decode_ids(tok, encoding.input_ids, batch_options);
        for (size_t i = 0; i < encoding.input_ids.size(); ++i) {
            if (decoded[i].ok()) {
                std::cout << *decoded[i].value << "\t";
            } else {
                std::cout << "<word " << i << " undecodable>\t";
                std::cerr << "Warning: word " << i
                          << " could not be decoded: " << decoded[i].error
                          << std::endl;
            }
            print_ids(encoding.input_ids[i]);
            std::cout << std::endl;
        }
        print_mask("token_type_ids", encoding.token_type_ids);
        print_mask("special_tokens_mask", encoding.special_tokens_mask);
        if (encoding.num_truncated_words > 0) {
            std::cerr << "Warning: " << encoding.num_truncated_words
                      << " words truncated to " << tok.max_word_length() - 2
                      << " bytes" << std::endl;
        }

        const YAML::Node tokenize = config["tokenize"];
        const YAML::Node ids_file =
            tokenize.IsMap() ? tokenize["ids_file"] : YAML::Node();
        if (ids_file && !ids_file.IsNull()) {
            const std::filesystem::path path = ids_file.as<std::string>();
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            chartok::io::save_ids(encoding.input_ids, path.string());
            std::cout << "Character ids saved to " << path.string()
                      << std::endl;
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
