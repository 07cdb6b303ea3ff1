#include <gtest/gtest.h>
#include "extraction/fingerprint.hpp"
#include "extraction/snippet_windower.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <stdexcept>

using namespace vibescore;

namespace {

std::string repeat(const std::string& s, size_t n) {
    std::string out;
    for (size_t i = 0; i < n; i++) out += s;
    return out;
}

bool isValidUtf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c >> 5) == 0x6) len = 2;
        else if ((c >> 4) == 0xE) len = 3;
        else if ((c >> 3) == 0x1E) len = 4;
        if (len == 0 || i + len > s.size()) return false;
        for (size_t k = 1; k < len; k++) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

std::vector<std::string> numberedBlock(size_t n) {
    std::vector<std::string> block;
    for (size_t i = 0; i < n; i++) block.push_back("statement_" + std::to_string(i) + "();");
    return block;
}

} // namespace

// ─── Snippet Windower Tests ────────────────────────────────────

TEST(WindowerTest, WindowLengthFormula) {
    SnippetWindower w;
    EXPECT_EQ(w.windowLength(4), 4);    // floor(2.8) raised to the minimum
    EXPECT_EQ(w.windowLength(5), 4);
    EXPECT_EQ(w.windowLength(6), 4);
    EXPECT_EQ(w.windowLength(10), 7);
    EXPECT_EQ(w.windowLength(17), 11);
    EXPECT_EQ(w.windowLength(18), 12);
    EXPECT_EQ(w.windowLength(20), 12);
    EXPECT_EQ(w.windowLength(500), 12);
}

TEST(WindowerTest, RejectsShortBlocks) {
    SnippetWindower w;
    EXPECT_THROW(w.windowLength(3), std::invalid_argument);
    RandomSource rng(1);
    EXPECT_THROW(w.window(numberedBlock(2), rng), std::invalid_argument);
}

TEST(WindowerTest, WindowIsContiguousAndInBounds) {
    SnippetWindower w;
    RandomSource rng(42);
    auto block = numberedBlock(30);

    for (int trial = 0; trial < 50; trial++) {
        auto win = w.window(block, rng);
        ASSERT_EQ(win.size(), 12);

        auto it = std::find(block.begin(), block.end(), win.front());
        ASSERT_NE(it, block.end());
        size_t start = static_cast<size_t>(it - block.begin());
        ASSERT_LE(start + win.size(), block.size());
        for (size_t i = 0; i < win.size(); i++) {
            EXPECT_EQ(win[i], block[start + i]);
        }
    }
}

TEST(WindowerTest, MinimumBlockIsTakenWhole) {
    SnippetWindower w;
    RandomSource rng(7);
    auto block = numberedBlock(4);
    EXPECT_EQ(w.window(block, rng), block);
}

TEST(WindowerTest, SameSeedSameWindow) {
    SnippetWindower w;
    auto block = numberedBlock(40);
    RandomSource a(99), b(99);
    EXPECT_EQ(w.window(block, a), w.window(block, b));
}

// ─── Fingerprint Tests ─────────────────────────────────────────

TEST(FingerprintTest, NormalisesWhitespace) {
    EXPECT_EQ(fingerprint({"  int  x = 1;", "\treturn x;  "}), "int x = 1; return x;");
    EXPECT_EQ(fingerprint({"a   b"}), fingerprint({"a b"}));
}

TEST(FingerprintTest, TruncatesToLength) {
    std::string longLine(500, 'x');
    EXPECT_EQ(fingerprint({longLine}).size(), 200);
    EXPECT_EQ(fingerprint({longLine}, 16).size(), 16);
    EXPECT_EQ(fingerprint({"short"}), "short");
}

TEST(FingerprintTest, TruncatesByCharacter) {
    std::string euros = repeat("€", 300);
    std::string fp = fingerprint({euros});
    EXPECT_EQ(text::utf8Length(fp), 200);
    EXPECT_EQ(fp.size(), 600);
    EXPECT_TRUE(isValidUtf8(fp));

    std::string commented = fingerprint({"// " + repeat("€", 100)}, 16);
    EXPECT_EQ(commented, "// " + repeat("€", 13));
    EXPECT_TRUE(isValidUtf8(commented));

    // under the limit in characters even though over it in bytes
    std::string cjk = repeat("注释", 60);
    EXPECT_EQ(fingerprint({cjk}), cjk);
}

TEST(FingerprintTest, EmptyInput) {
    EXPECT_EQ(fingerprint({}), "");
    EXPECT_EQ(fingerprint({"   ", ""}), "");
}
