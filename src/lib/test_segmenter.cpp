#include "segmenter.hpp"
#include <cassert>

using chartok::Segmenter;
using chartok::SegmenterOptions;

int main() {
    // Defaults: lower case, strip accents, split punctuation
    {
        Segmenter segmenter;
        auto words = segmenter.segment("Hello, World!");
        assert(words.size() == 4);
        assert(words[0] == "hello");
        assert(words[1] == ",");
        assert(words[2] == "world");
        assert(words[3] == "!");
    }
    {
        Segmenter segmenter;
        auto words = segmenter.segment("don't stop");
        assert(words.size() == 4);
        assert(words[0] == "don");
        assert(words[1] == "'");
        assert(words[2] == "t");
        assert(words[3] == "stop");
    }
    {
        Segmenter segmenter;
        auto words = segmenter.segment("a中b");
        assert(words.size() == 3);
        assert(words[0] == "a");
        assert(words[1] == "中");
        assert(words[2] == "b");
    }
    {
        Segmenter segmenter;
        auto words = segmenter.segment("Héllo  Wörld");
        assert(words.size() == 2);
        assert(words[0] == "hello");
        assert(words[1] == "world");
    }
    {
        Segmenter segmenter;
        assert(segmenter.segment("").empty());
        assert(segmenter.segment(" \t\n ").empty());
        assert(segmenter.segment("\x01\x02").empty());
    }

    // Decomposed input is composed before casing
    {
        SegmenterOptions options;
        options.do_lower_case = false;
        Segmenter segmenter(options);
        auto words = segmenter.segment("Cafe\xCC\x81");
        assert(words.size() == 1);
        assert(words[0] == "Caf\xC3\xA9");
    }

    // Accents follow do_lower_case unless set explicitly
    {
        SegmenterOptions options;
        options.strip_accents = false;
        Segmenter segmenter(options);
        auto words = segmenter.segment("Héllo");
        assert(words.size() == 1);
        assert(words[0] == "héllo");
    }
    {
        SegmenterOptions options;
        options.do_lower_case = false;
        options.strip_accents = true;
        Segmenter segmenter(options);
        auto words = segmenter.segment("Héllo");
        assert(words.size() == 1);
        assert(words[0] == "Hello");
    }

    // Chinese isolation can be disabled
    {
        SegmenterOptions options;
        options.tokenize_chinese_chars = false;
        Segmenter segmenter(options);
        auto words = segmenter.segment("a中b");
        assert(words.size() == 1);
        assert(words[0] == "a中b");
    }

    // Punctuation splitting can be disabled
    {
        SegmenterOptions options;
        options.do_split_on_punc = false;
        Segmenter segmenter(options);
        auto words = segmenter.segment("don't stop");
        assert(words.size() == 2);
        assert(words[0] == "don't");
        assert(words[1] == "stop");
    }

    // never_split tokens are neither lowered nor split
    {
        SegmenterOptions options;
        options.never_split.insert("[FOO]");
        Segmenter segmenter(options);
        auto words = segmenter.segment("x [FOO] y");
        assert(words.size() == 3);
        assert(words[0] == "x");
        assert(words[1] == "[FOO]");
        assert(words[2] == "y");
    }
    {
        Segmenter segmenter;
        chartok::NeverSplit extra = {"[MASK]"};
        auto words = segmenter.segment("the [MASK] sat", extra);
        assert(words.size() == 3);
        assert(words[1] == "[MASK]");

        auto split = segmenter.segment("the [MASK] sat");
        assert(split.size() == 5);
        assert(split[1] == "[");
        assert(split[2] == "mask");
        assert(split[3] == "]");
    }

    // Segmenting joined output is a fixed point
    {
        Segmenter segmenter;
        auto words = segmenter.segment("Ça va? Très bien, merci. 你好!");
        std::string joined;
        for (const auto &w : words) {
            if (!joined.empty()) joined += ' ';
            joined += w;
        }
        assert(segmenter.segment(joined) == words);
        for (const auto &w : words) {
            assert(!w.empty());
            assert(w.find(' ') == std::string::npos);
        }
    }

    {
        auto words = chartok::whitespace_tokenize("  Hello,  World ");
        assert(words.size() == 2);
        assert(words[0] == "Hello,");
        assert(words[1] == "World");
    }
    return 0;
}
