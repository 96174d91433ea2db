/**
 * Tests for the command-line note input: text phrases, JSON lines, classify
 */

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "../note_input.hpp"
#include "fake_singer.hpp"

using json = nlohmann::json;
using otosub::FakeSinger;
using otosub::JsonNoteReader;
using otosub::NoteDefaults;

class NoteInputTest : public ::testing::Test {
protected:
    void SetUp() override {
        singer = std::make_shared<FakeSinger>();
        singer->add("- さ");
        singer->add("- か");
        singer->add("a か");
        singer->add("- あ");
        singer->add("a あ");
        phonemizer.setSinger(singer);
    }

    std::string textLine(const std::string& line,
                         const NoteDefaults& defaults = NoteDefaults()) {
        std::ostringstream out;
        otosub::resolveTextLine(phonemizer, line, defaults, out);
        return out.str();
    }

    std::shared_ptr<FakeSinger> singer;
    otosub::SubstitutorPhonemizer phonemizer;
};

// Each lyric is the previous neighbour of the next one on the line
TEST_F(NoteInputTest, TextLineChainsNeighbours) {
    EXPECT_EQ(textLine("さ か た"), "- さ a か a あ\n");
}

TEST_F(NoteInputTest, TextLinesAreIndependent) {
    EXPECT_EQ(textLine("さ"), "- さ\n");
    EXPECT_EQ(textLine("か"), "- か\n");
}

TEST_F(NoteInputTest, EmptyTextLine) {
    EXPECT_EQ(textLine(""), "\n");
    EXPECT_EQ(textLine("   "), "\n");
}

TEST_F(NoteInputTest, TextLineUsesDefaults) {
    NoteDefaults defaults;
    defaults.tone = 67;
    defaults.voiceColor = "power";

    textLine("か", defaults);

    ASSERT_FALSE(singer->probes.empty());
    for (const auto& probe : singer->probes) {
        EXPECT_EQ(probe.tone, 67);
        EXPECT_EQ(probe.color, "power");
    }
}

TEST_F(NoteInputTest, JsonLinesChainNeighbours) {
    JsonNoteReader reader(phonemizer, NoteDefaults());
    std::ostringstream out;

    EXPECT_TRUE(reader.resolveLine(R"({"lyric": "さ"})", out));
    EXPECT_TRUE(reader.resolveLine(R"({"lyric": "か"})", out));

    EXPECT_EQ(out.str(), "- さ\na か\n");
}

TEST_F(NoteInputTest, JsonResetDropsNeighbour) {
    JsonNoteReader reader(phonemizer, NoteDefaults());
    std::ostringstream out;

    reader.resolveLine(R"({"lyric": "さ"})", out);
    EXPECT_TRUE(reader.resolveLine(R"({"lyric": "か", "reset": true})", out));

    EXPECT_EQ(out.str(), "- さ\n- か\n");
}

TEST_F(NoteInputTest, MalformedJsonLineIsSkipped) {
    JsonNoteReader reader(phonemizer, NoteDefaults());
    std::ostringstream out;

    reader.resolveLine(R"({"lyric": "さ"})", out);
    EXPECT_FALSE(reader.resolveLine("not json", out));

    // Context was cleared by the bad line
    EXPECT_TRUE(reader.resolveLine(R"({"lyric": "か"})", out));

    EXPECT_EQ(out.str(), "- さ\n- か\n");
}

TEST_F(NoteInputTest, InvalidNoteLines) {
    JsonNoteReader reader(phonemizer, NoteDefaults());
    std::ostringstream out;

    EXPECT_FALSE(reader.resolveLine(R"({"tone": 60})", out));
    EXPECT_FALSE(reader.resolveLine(R"({"lyric": 5})", out));
    EXPECT_FALSE(reader.resolveLine("[1, 2]", out));
    EXPECT_EQ(out.str(), "");
}

// Blank lines are ignored without clearing the context
TEST_F(NoteInputTest, EmptyJsonLineKeepsNeighbour) {
    JsonNoteReader reader(phonemizer, NoteDefaults());
    std::ostringstream out;

    reader.resolveLine(R"({"lyric": "さ"})", out);
    EXPECT_FALSE(reader.resolveLine("", out));
    reader.resolveLine(R"({"lyric": "か"})", out);

    EXPECT_EQ(out.str(), "- さ\na か\n");
}

TEST(ParseNoteLineTest, AllFields) {
    auto note = otosub::parseNoteLine(
        json::parse(R"({"lyric": "か", "hint": "ka", "tone": 64,
                        "color": "soft", "tone_shift": -2, "alternate": "2"})"),
        NoteDefaults());

    EXPECT_EQ(note.lyric, "か");
    EXPECT_EQ(note.phoneticHint, "ka");
    EXPECT_EQ(note.tone, 64);
    ASSERT_EQ(note.phonemeAttributes.size(), 1);
    EXPECT_EQ(note.phonemeAttributes[0].voiceColor, "soft");
    EXPECT_EQ(note.phonemeAttributes[0].toneShift, -2);
    EXPECT_EQ(note.phonemeAttributes[0].alternate, "2");
}

TEST(ParseNoteLineTest, Defaults) {
    NoteDefaults defaults;
    defaults.tone = 55;
    defaults.voiceColor = "power";

    auto note = otosub::parseNoteLine(json::parse(R"({"lyric": "か"})"), defaults);

    EXPECT_EQ(note.tone, 55);
    EXPECT_FALSE(note.phoneticHint.has_value());
    ASSERT_EQ(note.phonemeAttributes.size(), 1);
    EXPECT_EQ(note.phonemeAttributes[0].voiceColor, "power");
    EXPECT_EQ(note.phonemeAttributes[0].toneShift, 0);
    EXPECT_FALSE(note.phonemeAttributes[0].alternate.has_value());
}

TEST(ClassifyLineTest, VowelAndConsonant) {
    std::ostringstream out;
    otosub::classifyLine("か きゃ ン x", out);

    EXPECT_EQ(out.str(), "か\ta\tk\nきゃ\ta\tk\nン\tN\t-\nx\t-\t-\n");
}

TEST(ClassifyLineTest, NormalizesLyric) {
    std::ostringstream out;
    // か + combining voiced sound mark
    otosub::classifyLine("\u304B\u3099", out);

    EXPECT_EQ(out.str(), "が\ta\tg\n");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
