#include <gtest/gtest.h>
#include <langlint/language_detector.hpp>

using namespace langlint;

TEST(LanguageDetectorTest, DetectsCjkScripts) {
    EXPECT_EQ(LanguageDetector::detect("这是中文注释"), "zh-CN");
    EXPECT_EQ(LanguageDetector::detect("これは日本語のコメントです"), "ja");
    EXPECT_EQ(LanguageDetector::detect("이것은 한국어 주석입니다"), "ko");
}

TEST(LanguageDetectorTest, DetectsOtherScripts) {
    EXPECT_EQ(LanguageDetector::detect("Это комментарий на русском языке"), "ru");
    EXPECT_EQ(LanguageDetector::detect("Αυτό είναι ένα σχόλιο"), "el");
    EXPECT_EQ(LanguageDetector::detect("นี่คือความคิดเห็น"), "th");
}

TEST(LanguageDetectorTest, DetectsLatinLanguages) {
    EXPECT_EQ(LanguageDetector::detect("This function returns the number of items in the list"), "en");
    EXPECT_EQ(LanguageDetector::detect("Cette fonction retourne la liste des éléments"), "fr");
    EXPECT_EQ(LanguageDetector::detect("Diese Funktion gibt die Anzahl der Elemente zurück"), "de");
}

TEST(LanguageDetectorTest, RejectsShortOrSymbolicText) {
    EXPECT_FALSE(LanguageDetector::detect("ab").has_value());
    EXPECT_FALSE(LanguageDetector::detect("  x  ").has_value());
    EXPECT_FALSE(LanguageDetector::detect("12345 == 67").has_value());
    EXPECT_FALSE(LanguageDetector::detect("").has_value());
}

TEST(LanguageDetectorTest, MixedScriptsAreNotConfident) {
    auto detection = LanguageDetector::classify("Hello 世界");
    ASSERT_TRUE(detection.has_value());
    EXPECT_LE(detection->confidence, LanguageDetector::MIN_CONFIDENCE);
    EXPECT_FALSE(LanguageDetector::detect("Hello 世界").has_value());
}

TEST(LanguageDetectorTest, IsDeterministic) {
    const char* text = "Cette fonction retourne la liste des éléments";
    EXPECT_EQ(LanguageDetector::detect(text), LanguageDetector::detect(text));
}
