/**
 * Phonemizer tests: hint check, bare vowel substitution, VCV and fallback
 */

#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../phonemizer.hpp"
#include "fake_singer.hpp"

using otosub::FakeSinger;
using otosub::Note;
using otosub::SubstitutorPhonemizer;

class PhonemizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        singer = std::make_shared<FakeSinger>();
        phonemizer.setSinger(singer);
    }

    static Note makeNote(const std::string& lyric,
                         std::optional<std::string> hint = std::nullopt) {
        Note note;
        note.lyric = lyric;
        note.phoneticHint = hint;
        return note;
    }

    std::string resolve(const Note& note,
                        const std::optional<Note>& prev = std::nullopt) {
        auto result = phonemizer.process(note, prev);
        EXPECT_EQ(result.phonemes.size(), 1);
        return result.phonemes.empty() ? std::string() : result.phonemes[0].alias;
    }

    std::shared_ptr<FakeSinger> singer;
    SubstitutorPhonemizer phonemizer;
};

TEST_F(PhonemizerTest, HintWithMatchWins) {
    singer->add("ka");
    singer->add("a な");
    singer->add("- な");

    EXPECT_EQ(resolve(makeNote("な", std::string("ka"))), "ka");
    EXPECT_EQ(resolve(makeNote("な", std::string("ka")), makeNote("さ")), "ka");
}

TEST_F(PhonemizerTest, HintMissFallsThrough) {
    singer->add("- な");

    EXPECT_EQ(resolve(makeNote("な", std::string("zzz"))), "- な");
}

TEST_F(PhonemizerTest, EmptyHintIsIgnored) {
    singer->add("- な");

    EXPECT_EQ(resolve(makeNote("な", std::string(""))), "- な");
    EXPECT_EQ(singer->probes.front().alias, "- な");
}

TEST_F(PhonemizerTest, HintIsNormalized) {
    singer->add("が");

    // か + combining voiced sound mark
    EXPECT_EQ(resolve(makeNote("た", std::string("\u304B\u3099"))), "が");
}

TEST_F(PhonemizerTest, VcvAlias) {
    singer->add("a な");
    singer->add("- な");

    EXPECT_EQ(resolve(makeNote("な"), makeNote("ゃ")), "a な");
}

// Defaults miss, so the lyric is substituted before VCV candidates are built
TEST_F(PhonemizerTest, VcvOnlyDictionarySubstitutesFirst) {
    singer->add("a な");

    EXPECT_EQ(resolve(makeNote("な"), makeNote("ゃ")), "あ");
}

TEST_F(PhonemizerTest, VcvPreferredOverInitialAlias) {
    singer->add("a な");
    singer->add("- な");

    EXPECT_EQ(resolve(makeNote("な"), makeNote("か")), "a な");
    EXPECT_EQ(resolve(makeNote("な")), "- な");
}

TEST_F(PhonemizerTest, VcvFallsBackToPlainForms) {
    singer->add("な");
    singer->add("- な");

    // "* な" is missing; the bare lyric comes before "- な"
    EXPECT_EQ(resolve(makeNote("な"), makeNote("か")), "な");
}

TEST_F(PhonemizerTest, UnknownPreviousVowelUsesDefaults) {
    singer->add("- な");
    singer->add("* な");

    EXPECT_EQ(resolve(makeNote("な"), makeNote("っ")), "- な");
}

TEST_F(PhonemizerTest, InitialAliasWithoutNeighbour) {
    singer->add("- か");
    singer->add("か");

    EXPECT_EQ(resolve(makeNote("か")), "- か");
}

TEST_F(PhonemizerTest, LyricIsNormalized) {
    singer->add("が");

    // か + combining voiced sound mark
    EXPECT_EQ(resolve(makeNote("\u304B\u3099")), "が");
}

// Missing syllable is sung on its vowel
TEST_F(PhonemizerTest, BareVowelSubstitution) {
    singer->add("- あ");

    EXPECT_EQ(resolve(makeNote("か")), "- あ");
}

TEST_F(PhonemizerTest, BareVowelSubstitutionWithVcv) {
    singer->add("a あ");
    singer->add("- あ");

    EXPECT_EQ(resolve(makeNote("か"), makeNote("さ")), "a あ");
}

TEST_F(PhonemizerTest, NoSubstitutionWhenSyllableExists) {
    singer->add("か");
    singer->add("- あ");

    EXPECT_EQ(resolve(makeNote("か")), "か");
}

// Substitution is decided on the defaults only, not the VCV forms
TEST_F(PhonemizerTest, SubstitutionIgnoresVcvForms) {
    singer->add("a か");

    EXPECT_EQ(resolve(makeNote("か"), makeNote("さ")), "あ");
}

TEST_F(PhonemizerTest, TotalMissEmitsSubstitutedLyric) {
    EXPECT_EQ(resolve(makeNote("か")), "あ");
    EXPECT_EQ(resolve(makeNote("ぴょ")), "お");
    EXPECT_EQ(resolve(makeNote("あ")), "あ");
}

TEST_F(PhonemizerTest, TotalMissEmitsLyric) {
    EXPECT_EQ(resolve(makeNote("ン")), "ン");
    EXPECT_EQ(resolve(makeNote("っ")), "っ");
    EXPECT_EQ(resolve(makeNote("R")), "R");
}

TEST_F(PhonemizerTest, EmptyLyric) {
    std::string alias;
    EXPECT_NO_THROW(alias = resolve(makeNote("")));
    EXPECT_EQ(alias, "");

    std::vector<std::string> expected = {"- ", "", "- ", ""};
    EXPECT_EQ(singer->probedAliases(), expected);
}

TEST_F(PhonemizerTest, EmptyLyricMatch) {
    singer->add("- ");

    EXPECT_EQ(resolve(makeNote("")), "- ");
}

TEST_F(PhonemizerTest, VoiceColorTieBreak) {
    singer->add("a な", std::string("power"));
    singer->add("な", std::string("normal"));

    Note note = makeNote("な");
    otosub::PhonemeAttributes attr;
    attr.voiceColor = "normal";
    note.phonemeAttributes.push_back(attr);

    EXPECT_EQ(resolve(note, makeNote("か")), "な");
}

TEST_F(PhonemizerTest, AlternateAndToneShift) {
    singer->add("- な2");
    singer->add("- な");
    singer->onlyTone = 67;

    Note note = makeNote("な");
    note.tone = 60;
    otosub::PhonemeAttributes attr;
    attr.toneShift = 7;
    attr.alternate = "2";
    note.phonemeAttributes.push_back(attr);

    EXPECT_EQ(resolve(note), "- な2");
}

TEST_F(PhonemizerTest, Idempotent) {
    singer->add("a な");
    singer->add("- な");

    Note prev = makeNote("か");
    EXPECT_EQ(resolve(makeNote("な"), prev), resolve(makeNote("な"), prev));
}

TEST_F(PhonemizerTest, UsesFirstNoteOfGroup) {
    singer->add("- な");
    singer->add("- か");

    std::vector<Note> notes = {makeNote("な"), makeNote("か")};
    auto result = phonemizer.process(notes, std::nullopt);

    ASSERT_EQ(result.phonemes.size(), 1);
    EXPECT_EQ(result.phonemes[0].alias, "- な");
}

TEST_F(PhonemizerTest, EmptyGroupThrows) {
    std::vector<Note> notes;
    EXPECT_THROW(phonemizer.process(notes, std::nullopt), std::invalid_argument);
}

TEST(PhonemizerNoSingerTest, PassesThroughLyric) {
    SubstitutorPhonemizer phonemizer;

    Note note;
    note.lyric = "\u304B\u3099";
    auto result = phonemizer.process(note, std::nullopt);

    ASSERT_EQ(result.phonemes.size(), 1);
    EXPECT_EQ(result.phonemes[0].alias, "が");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
