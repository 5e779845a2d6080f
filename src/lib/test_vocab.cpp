#include "errors.hpp"
#include "vocab.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

using chartok::MlmVocabulary;

namespace {

void write_lines(const std::string &path, const std::string &contents) {
    std::ofstream file(path, std::ios::binary);
    file << contents;
}

std::string read_all(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    const std::string path = "/tmp/chartok_test_mlm_vocab.txt";

    // Line number is the index
    {
        write_lines(path, "[PAD]\n[UNK]\nthe\ncat\n");
        MlmVocabulary vocab = MlmVocabulary::load(path);
        assert(vocab.size() == 4);
        assert(vocab.id("[PAD]") == 0);
        assert(vocab.id("the") == 2);
        assert(vocab.id("cat") == 3);
        assert(!vocab.id("dog").has_value());
        assert(vocab.token(1) == std::string("[UNK]"));
        assert(!vocab.token(4).has_value());
    }

    // Empty lines still take up an index
    {
        write_lines(path, "a\n\nb\n");
        MlmVocabulary vocab = MlmVocabulary::load(path);
        assert(vocab.id("a") == 0);
        assert(vocab.id("") == 1);
        assert(vocab.id("b") == 2);
    }

    // Missing file
    {
        bool caught = false;
        try {
            MlmVocabulary::load("/tmp/chartok_no_such_vocab.txt");
        } catch (const chartok::MissingFile &e) {
            caught = true;
            assert(e.path == "/tmp/chartok_no_such_vocab.txt");
        }
        assert(caught);
    }

    // Save writes in index order
    {
        MlmVocabulary vocab;
        vocab.insert("c", 2);
        vocab.insert("a", 0);
        vocab.insert("b", 1);
        vocab.save(path);
        assert(read_all(path) == "a\nb\nc\n");

        MlmVocabulary reloaded = MlmVocabulary::load(path);
        assert(reloaded.entries() == vocab.entries());
    }

    // Gaps warn but still write every token
    {
        MlmVocabulary vocab;
        vocab.insert("a", 0);
        vocab.insert("b", 5);
        vocab.save(path);
        assert(read_all(path) == "a\nb\n");
    }

    // Re-inserting a token moves it
    {
        MlmVocabulary vocab;
        vocab.insert("x", 0);
        vocab.insert("x", 3);
        assert(vocab.size() == 1);
        assert(vocab.id("x") == 3);
        assert(!vocab.token(0).has_value());
        assert(vocab.token(3) == std::string("x"));
    }

    {
        MlmVocabulary vocab;
        assert(vocab.empty());
        assert(vocab.entries().empty());
    }

    std::remove(path.c_str());
    return 0;
}
