// Tests for UTF-8 decoding and text normalization

#include <engram/memory/normalizer.hpp>
#include <engram/memory/lexical.hpp>
#include "test_helpers.hpp"

using namespace engram;

void test_utf8_decode() {
    printf("Testing UTF-8 decoding...\n");

    // "aé海😀"
    std::vector<uint32_t> cps = utf8_decode("a\xC3\xA9\xE6\xB5\xB7\xF0\x9F\x98\x80");
    TEST_ASSERT(cps.size() == 4, "Four code points");
    TEST_ASSERT(cps[0] == 'a' && cps[1] == 0xE9 && cps[2] == 0x6D77 && cps[3] == 0x1F600,
                "One to four byte sequences decode");

    // 0xF8..0xFF never start a sequence
    cps = utf8_decode("\xF8\x80\x80\x80");
    TEST_ASSERT(cps.size() == 4, "Invalid lead byte is not a sequence");
    TEST_ASSERT(cps[0] == 0xF8 && cps[1] == 0x80, "Invalid bytes pass through");
    cps = utf8_decode("\xFF\xBF");
    TEST_ASSERT(cps.size() == 2 && cps[0] == 0xFF, "0xFF passes through");

    // Truncated sequence
    cps = utf8_decode("\xE6\xB5");
    TEST_ASSERT(cps.size() == 2 && cps[0] == 0xE6, "Truncated sequence passes through");

    printf("  PASS\n");
}

void test_normalize_text() {
    printf("Testing text normalization...\n");

    // Fullwidth ASCII folds and lower-cases
    TEST_ASSERT(normalize_text("\xEF\xBC\xA1\xEF\xBD\x82\xEF\xBD\x83") == "abc", "Fullwidth Abc");
    TEST_ASSERT(normalize_text("Sunset HARBOR") == "sunset harbor", "Lower case");

    // サ-バ -> サーバ
    TEST_ASSERT(normalize_text("\xE3\x82\xB5-\xE3\x83\x90") ==
                "\xE3\x82\xB5\xE3\x83\xBC\xE3\x83\x90", "Hyphen after kana is a prolonged mark");
    TEST_ASSERT(normalize_text("well-known") == "well-known", "Hyphen between letters is kept");

    // ヴァイオリン -> バイオリン
    TEST_ASSERT(normalize_text("\xE3\x83\xB4\xE3\x82\xA1\xE3\x82\xA4\xE3\x82\xAA"
                               "\xE3\x83\xAA\xE3\x83\xB3") ==
                "\xE3\x83\x90\xE3\x82\xA4\xE3\x82\xAA\xE3\x83\xAA\xE3\x83\xB3",
                "Katakana v-sound folds to b-sound");

    // ウィンドウズ -> ウインドウズ
    TEST_ASSERT(normalize_text("\xE3\x82\xA6\xE3\x82\xA3\xE3\x83\xB3\xE3\x83\x89"
                               "\xE3\x82\xA6\xE3\x82\xBA") ==
                "\xE3\x82\xA6\xE3\x82\xA4\xE3\x83\xB3\xE3\x83\x89\xE3\x82\xA6\xE3\x82\xBA",
                "Small kana become full size");

    // キッテ keeps its sokuon
    TEST_ASSERT(normalize_text("\xE3\x82\xAD\xE3\x83\x83\xE3\x83\x86") ==
                "\xE3\x82\xAD\xE3\x83\x83\xE3\x83\x86", "Sokuon is kept");

    // Halfwidth ｶﾒﾗ -> カメラ
    TEST_ASSERT(normalize_text("\xEF\xBD\xB6\xEF\xBE\x92\xEF\xBE\x97") ==
                "\xE3\x82\xAB\xE3\x83\xA1\xE3\x83\xA9", "Halfwidth kana widen");

    TEST_ASSERT(normalize_text("").empty(), "Empty stays empty");

    printf("  PASS\n");
}

void test_variants_match_lexically() {
    printf("Testing spelling variants in the lexical index...\n");

    LexicalIndex index;
    // カメラを買った / unrelated
    index.add("camera", "\xE3\x82\xAB\xE3\x83\xA1\xE3\x83\xA9\xE3\x82\x92"
                        "\xE8\xB2\xB7\xE3\x81\xA3\xE3\x81\x9F");
    index.add("other", "tax paperwork");

    // Halfwidth ｶﾒﾗ finds the fullwidth document
    std::vector<std::pair<std::string, double> > top =
        index.search("\xEF\xBD\xB6\xEF\xBE\x92\xEF\xBE\x97", 5);
    TEST_ASSERT(top.size() == 1 && top[0].first == "camera", "Halfwidth query matches");

    // サーバ stored, サ-バ queried
    index.add("server", "\xE3\x82\xB5\xE3\x83\xBC\xE3\x83\x90");
    top = index.search("\xE3\x82\xB5-\xE3\x83\x90", 5);
    TEST_ASSERT(!top.empty() && top[0].first == "server", "Dash spelling matches");

    TEST_ASSERT(index.search("\xEF\xBC\xB4\xEF\xBC\xA1\xEF\xBC\xB8", 5).size() == 1,
                "Fullwidth TAX matches tax");

    printf("  PASS\n");
}

int main() {
    printf("=== Text Tests ===\n\n");
    test::quiet_logs();

    test_utf8_decode();
    test_normalize_text();
    test_variants_match_lexically();

    printf("\n=== All text tests passed ===\n");
    return 0;
}
