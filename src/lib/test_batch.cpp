#include "batch.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "threading.hpp"
#include <atomic>
#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using namespace chartok;

int main() {
    // Thread pool
    {
        std::atomic<int> counter{0};
        {
            threading::ThreadPool pool(4);
            assert(pool.thread_count() == 4);
            for (int i = 0; i < 100; ++i) {
                pool.enqueue([&counter]() { ++counter; });
            }
            pool.wait();
            assert(counter == 100);
        }
    }
    {
        std::vector<int> seen(1000, 0);
        threading::parallel_for(seen.size(), 8,
                                [&seen](size_t i) { seen[i] += 1; });
        for (int v : seen) assert(v == 1);

        // Inline path
        threading::parallel_for(seen.size(), 1,
                                [&seen](size_t i) { seen[i] += 1; });
        for (int v : seen) assert(v == 2);

        threading::parallel_for(0, 4, [](size_t) { assert(false); });
    }

    // batch_encode keeps input order and matches single encodes
    {
        Tokenizer tok;
        std::vector<std::string> texts = {"Hello world", "", "a中b",
                                          "[CLS] x [SEP]", "don't"};
        BatchOptions batch_options;
        batch_options.num_threads = 3;
        auto results = batch_encode(tok, texts, {}, batch_options);
        assert(results.size() == texts.size());
        assert(count_failures(results) == 0);
        for (size_t i = 0; i < texts.size(); ++i) {
            assert(results[i].index == i);
            assert(results[i].ok());
            assert(results[i].value->input_ids ==
                   tok.encode(texts[i]).input_ids);
        }
    }

    {
        Options options;
        options.max_word_length = 8;
        Tokenizer tok(options);
        std::vector<std::vector<std::string>> tokens = {
            {"hi", "[SEP]"}, {}, {"a", "b", "c"}};
        auto results = batch_encode_tokens(tok, tokens);
        assert(results.size() == 3);
        assert(count_failures(results) == 0);
        assert(results[0].value->size() == 2);
        assert((*results[0].value)[0] ==
               CharacterIds({259, 105, 106, 260, 261, 261, 261, 261}));
        assert((*results[0].value)[1] ==
               tok.encoder().special(SpecialTag::Sep));
        assert(results[1].value->empty());
        assert(results[2].value->size() == 3);
    }

    // Lenient decode reports failures per item
    {
        Options options;
        options.max_word_length = 5;
        Tokenizer tok(options);
        Sequence words = {tok.encode_token(std::string("ab")), CharacterIds(4, 261),
                          tok.encode_token(std::string("[MASK]")),
                          CharacterIds{259, 0x80 + 1, 260, 261, 261}};
        BatchOptions batch_options;
        batch_options.num_threads = 2;
        auto results = batch_decode_ids(tok, words, batch_options);
        assert(results.size() == 4);
        assert(count_failures(results) == 2);
        assert(*results[0].value == "ab");
        assert(!results[1].ok());
        assert(!results[1].error.empty());
        assert(*results[2].value == "[MASK]");
        assert(!results[3].ok());
    }

    // A word cut inside a multi-byte character fails alone
    {
        Tokenizer tok;
        std::string text = "x";
        for (int i = 0; i < 24; ++i) text += "д";
        text += " ok";
        Encoding encoding = tok.encode(text);
        assert(encoding.num_truncated_words == 1);
        assert(encoding.input_ids.size() == 4);

        BatchOptions batch_options;
        batch_options.num_threads = 1;
        auto results =
            batch_decode_ids(tok, encoding.input_ids, batch_options);
        assert(count_failures(results) == 1);
        assert(*results[0].value == "[CLS]");
        assert(!results[1].ok());
        assert(results[1].index == 1);
        assert(!results[1].error.empty());
        assert(*results[2].value == "ok");
        assert(*results[3].value == "[SEP]");
    }

    // Strict mode throws on the first failing index
    {
        Options options;
        options.max_word_length = 5;
        Tokenizer tok(options);
        Sequence words = {tok.encode_token(std::string("ab")), tok.encode_token(std::string("cd")),
                          CharacterIds(6, 261), CharacterIds(2, 261)};
        BatchOptions batch_options;
        batch_options.strict = true;
        bool caught = false;
        try {
            batch_decode_ids(tok, words, batch_options);
        } catch (const BatchError &e) {
            caught = true;
            assert(e.index == 2);
        }
        assert(caught);
    }

    // Binary id files
    {
        const std::string path = "/tmp/chartok_test_ids.bin";
        Options options;
        options.max_word_length = 6;
        Tokenizer tok(options);
        Sequence words = tok.encode("hello there").input_ids;
        io::save_ids(words, path);
        Sequence loaded = io::load_ids(path, 6);
        assert(loaded == words);

        bool caught = false;
        try {
            io::load_ids(path, 7);
        } catch (const std::runtime_error &) {
            caught = true;
        }
        assert(caught);
        std::remove(path.c_str());
    }
    {
        bool caught = false;
        try {
            io::save_ids({CharacterIds{70000}}, "/tmp/chartok_test_big.bin");
        } catch (const std::out_of_range &) {
            caught = true;
        }
        assert(caught);
        std::remove("/tmp/chartok_test_big.bin");
    }
    {
        bool caught = false;
        try {
            io::read_file("/tmp/chartok_no_such_file.txt");
        } catch (const std::runtime_error &) {
            caught = true;
        }
        assert(caught);
    }
    return 0;
}
