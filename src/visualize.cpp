#include "lib/config.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file...>" << std::endl;
        return 1;
    }

    try {
        chartok::Tokenizer tok(chartok::load_options("params.yaml"));

        for (int i = 1; i < argc; ++i) {
            const std::string path = argv[i];
            std::string content = chartok::io::read_file(path);
            auto words = tok.tokenize(content);

            size_t truncated = 0;
            tok.convert_tokens_to_ids(words, &truncated);

            std::cout << "File: " << path << std::endl << std::endl;
            std::cout << chartok::visualize(words, tok) << std::endl;
            std::cout << "Used a total of " << words.size() << " words ("
                      << truncated << " truncated)" << std::endl
                      << std::endl;
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Processed all files." << std::endl;
    return 0;
}
