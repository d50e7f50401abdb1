/**
 * @file test_text_utils.cpp
 * @brief Unit tests for accent stripping, title case and pig latin
 */

#include <gtest/gtest.h>
#include "text_normalize.hpp"
#include "case_transform.hpp"
#include "utils.hpp"

using namespace duckdb::brkit;

// ============================================================================
// remove_accents
// ============================================================================

TEST(RemoveAccentsTest, PortugueseNames) {
    EXPECT_EQ(remove_accents("João da Silva"), "Joao da Silva");
    EXPECT_EQ(remove_accents("Conceição"), "Conceicao");
    EXPECT_EQ(remove_accents("ÁGUA ÉPOCA ÍNDIO ÓCULOS ÚTIL"), "AGUA EPOCA INDIO OCULOS UTIL");
}

TEST(RemoveAccentsTest, FullTable) {
    EXPECT_EQ(remove_accents("áàãâä éèêë íìîï óòõôö úùûü çñ"), "aaaaa eeee iiii ooooo uuuu cn");
    EXPECT_EQ(remove_accents("ÁÀÃÂÄ ÉÈÊË ÍÌÎÏ ÓÒÕÔÖ ÚÙÛÜ ÇÑ"), "AAAAA EEEE IIII OOOOO UUUU CN");
}

TEST(RemoveAccentsTest, OtherCharactersAreKept) {
    EXPECT_EQ(remove_accents("plain ascii 123"), "plain ascii 123");
    EXPECT_EQ(remove_accents("straße"), "straße");
    EXPECT_EQ(remove_accents("å ø æ"), "å ø æ");
    EXPECT_EQ(remove_accents("€ 😀"), "€ 😀");
    EXPECT_EQ(remove_accents(""), "");
}

TEST(RemoveAccentsTest, TruncatedSequenceIsKept) {
    std::string truncated = "ab\xC3";
    EXPECT_EQ(remove_accents(truncated), truncated);
}

// ============================================================================
// to_title_case
// ============================================================================

TEST(TitleCaseTest, CapitalizesEachWord) {
    EXPECT_EQ(to_title_case("hello world"), "Hello World");
    EXPECT_EQ(to_title_case("MARIA da silva"), "Maria Da Silva");
}

TEST(TitleCaseTest, CollapsesWhitespace) {
    EXPECT_EQ(to_title_case("  maria   JOSÉ "), "Maria José");
    EXPECT_EQ(to_title_case("a\tb\nc"), "A B C");
    EXPECT_EQ(to_title_case("   "), "");
    EXPECT_EQ(to_title_case(""), "");
}

TEST(TitleCaseTest, HandlesLatinLetters) {
    EXPECT_EQ(to_title_case("JOÃO CONCEIÇÃO"), "João Conceição");
    EXPECT_EQ(to_title_case("érica"), "Érica");
    EXPECT_EQ(to_title_case("ÇÃO"), "Ção");
}

TEST(TitleCaseTest, SplitsOnUnicodeWhitespace) {
    // U+00A0 no-break space, U+2003 em space, U+3000 ideographic space
    EXPECT_EQ(to_title_case("MARIA\xC2\xA0JOSÉ"), "Maria José");
    EXPECT_EQ(to_title_case("ana\xE2\x80\x83paula"), "Ana Paula");
    EXPECT_EQ(to_title_case("\xE3\x80\x80x\xE3\x80\x80"), "X");
}

TEST(TitleCaseTest, MapsCaseBeyondLatin1) {
    EXPECT_EQ(to_title_case("ŻÓŁW"), "Żółw");
    EXPECT_EQ(to_title_case("МОСКВА"), "Москва");
}

TEST(TitleCaseTest, GreekFinalSigma) {
    EXPECT_EQ(to_title_case("ΟΔΟΣ"), "Οδο\xCF\x82");
    EXPECT_EQ(to_title_case("ΑΣ"), "Α\xCF\x83");
    EXPECT_EQ(to_title_case("ΣΟΦΙΑ"), "Σοφια");
}

TEST(TitleCaseTest, MalformedBytesAreKept) {
    EXPECT_EQ(to_title_case("ab\xC3"), "Ab\xC3");
    EXPECT_EQ(to_title_case("\x80" "AB"), "\x80" "ab");
}

TEST(TitleCaseTest, PunctuationStaysInsideWords) {
    EXPECT_EQ(to_title_case("d'ávila-SOUZA"), "D'ávila-souza");
    EXPECT_EQ(to_title_case("123abc"), "123abc");
}

// ============================================================================
// to_pig_latin
// ============================================================================

TEST(PigLatinTest, MovesFirstCharacter) {
    EXPECT_EQ(to_pig_latin("hello"), "ellohay");
    EXPECT_EQ(to_pig_latin("a"), "aay");
    EXPECT_EQ(to_pig_latin("hello world"), "ello worldhay");
}

TEST(PigLatinTest, EmptyStaysEmpty) {
    EXPECT_EQ(to_pig_latin(""), "");
}

TEST(PigLatinTest, MultiByteFirstCharacter) {
    EXPECT_EQ(to_pig_latin("água"), "guaáay");
}

// ============================================================================
// utils
// ============================================================================

TEST(UtilsTest, SplitWhitespace) {
    auto words = split_whitespace("  one two\t three  ");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "one");
    EXPECT_EQ(words[2], "three");
    EXPECT_TRUE(split_whitespace("").empty());

    words = split_whitespace("um\xC2\xA0" "dois");
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[1], "dois");
}

TEST(UtilsTest, UnicodeWhitespace) {
    for (int32_t cp : {0x09, 0x0A, 0x0D, 0x20, 0x85, 0xA0, 0x1680, 0x2000, 0x200A, 0x2028, 0x202F, 0x3000}) {
        EXPECT_TRUE(is_unicode_whitespace(cp)) << cp;
    }
    for (int32_t cp : {0x41, 0x5F, 0xE9, 0x200B, 0xFEFF}) {
        EXPECT_FALSE(is_unicode_whitespace(cp)) << cp;
    }
}

TEST(UtilsTest, Utf8Decode) {
    size_t len = 0;
    EXPECT_EQ(utf8_decode("a", 0, len), 0x61);
    EXPECT_EQ(len, 1u);
    EXPECT_EQ(utf8_decode("xé", 1, len), 0xE9);
    EXPECT_EQ(len, 2u);
    EXPECT_EQ(utf8_decode("€", 0, len), 0x20AC);
    EXPECT_EQ(len, 3u);

    EXPECT_EQ(utf8_decode("\xC3", 0, len), -1);
    EXPECT_EQ(len, 1u);
    EXPECT_EQ(utf8_decode("\xC3" "A", 0, len), -1);
    EXPECT_EQ(len, 1u);

    std::string out;
    utf8_append(out, 0x017B);
    EXPECT_EQ(out, "Ż");
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trim("  a b  "), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(UtilsTest, Utf8CharLength) {
    EXPECT_EQ(utf8_char_length('a'), 1u);
    EXPECT_EQ(utf8_char_length(0xC3), 2u);
    EXPECT_EQ(utf8_char_length(0xE2), 3u);
    EXPECT_EQ(utf8_char_length(0xF0), 4u);
}
