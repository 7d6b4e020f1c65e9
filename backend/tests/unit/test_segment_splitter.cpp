#include "segmentation/segment_splitter.hpp"
#include "fixtures/segment_builder.hpp"
#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <map>

using namespace overlapseg::segmentation;
using overlapseg::utils::ConfigurationException;
using overlapseg::utils::InvalidSegmentException;
using ::testing::UnorderedElementsAre;

namespace {

constexpr double kTolerance = 1e-6;

bool flagOf(const RecordingSegment& segment, const std::string& speaker) {
    return segment.metadata.at(kContinuationKey).at(speaker).get<bool>();
}

std::vector<std::string> flagSpeakers(const RecordingSegment& segment) {
    std::vector<std::string> speakers;
    for (const auto& item : segment.metadata.at(kContinuationKey).items()) {
        speakers.push_back(item.key());
    }
    return speakers;
}

UtteranceSpan utteranceFromWords(const std::string& id, const std::string& speaker, std::vector<Word> words) {
    UtteranceSpan utterance;
    utterance.id = id;
    utterance.speaker_id = speaker;
    utterance.start = words.front().start;
    utterance.duration = words.back().end() - utterance.start;
    for (const auto& word : words) {
        utterance.text += (utterance.text.empty() ? "" : " ") + word.symbol;
    }
    utterance.alignment = std::move(words);
    return utterance;
}

std::map<std::string, int> wordCounts(const std::vector<RecordingSegment>& segments) {
    std::map<std::string, int> counts;
    for (const auto& segment : segments) {
        for (const auto& utterance : segment.utterances) {
            if (!utterance.alignment) {
                continue;
            }
            for (const auto& word : *utterance.alignment) {
                ++counts[word.symbol];
            }
        }
    }
    return counts;
}

} // anonymous namespace

class SegmentSplitterTest : public ::testing::Test {
protected:
    SegmentSplitter splitter{SplitterOptions()};
};

// Segments already within max_len come back untouched
TEST_F(SegmentSplitterTest, ShortSegmentIsReturnedUnchanged) {
    RecordingSegment segment = fixtures::makeSegment("short", 20.0, {
        fixtures::makeAlignedUtterance("u1", "A", 0.0, {"hi", "there"}, 1.0, 0.5),
    });

    auto output = splitter.split(segment);
    ASSERT_EQ(output.size(), 1u);
    EXPECT_EQ(output[0].id, "short");
    EXPECT_EQ(output[0].utterances[0].id, "u1");
    EXPECT_FALSE(output[0].metadata.contains(kContinuationKey));
}

TEST_F(SegmentSplitterTest, EmptySegmentYieldsNothing) {
    RecordingSegment segment = fixtures::makeSegment("empty", 120.0, {});
    EXPECT_TRUE(splitter.split(segment).empty());
}

// 45s cut: A talks 0-40s, B 35-44s
TEST_F(SegmentSplitterTest, LongTurnIsContinuedInNextSegment) {
    UtteranceSpan a = fixtures::makeAlignedUtterance("A", "A", 0.0, fixtures::numberedWords("w", 8), 5.0, 4.5);
    a.duration = 40.0;
    UtteranceSpan b = fixtures::makeAlignedUtterance("B", "B", 35.0, fixtures::numberedWords("b", 3), 3.0, 3.0);
    RecordingSegment segment = fixtures::makeSegment("cut", 45.0, {a, b}, 100.0);
    segment.metadata["corpus"] = "ami";

    auto output = splitter.split(segment);
    ASSERT_EQ(output.size(), 2u);

    const auto& first = output[0];
    EXPECT_EQ(first.id, "cut-0");
    EXPECT_DOUBLE_EQ(first.start_in_recording, 100.0);
    EXPECT_DOUBLE_EQ(first.duration, 29.5);
    ASSERT_EQ(first.utterances.size(), 1u);
    EXPECT_EQ(first.utterances[0].id, "A-0-0");
    EXPECT_EQ(first.utterances[0].text, "w1 w2 w3 w4 w5 w6");
    EXPECT_TRUE(flagOf(first, "A"));
    EXPECT_EQ(first.metadata.at("corpus"), "ami");
    EXPECT_EQ(first.attributes.at("recording_id"), "cut-rec");

    const auto& second = output[1];
    EXPECT_EQ(second.id, "cut-1");
    EXPECT_DOUBLE_EQ(second.start_in_recording, 129.5);
    EXPECT_DOUBLE_EQ(second.duration, 14.5);
    ASSERT_EQ(second.utterances.size(), 2u);
    EXPECT_EQ(second.utterances[0].speaker_id, "A");
    // The rest of a split utterance gets its own id
    EXPECT_EQ(second.utterances[0].id, "A-0-0_cont1");
    EXPECT_NE(second.utterances[0].id, first.utterances[0].id);
    EXPECT_EQ(second.utterances[0].text, "w7 w8");
    EXPECT_DOUBLE_EQ(second.utterances[0].start, 0.0);
    EXPECT_DOUBLE_EQ(second.utterances[0].alignment->front().start, 0.5);
    EXPECT_EQ(second.utterances[1].speaker_id, "B");
    EXPECT_EQ(second.utterances[1].text, "b1 b2 b3");
    EXPECT_DOUBLE_EQ(second.utterances[1].start, 5.5);
    EXPECT_FALSE(flagOf(second, "A"));
    EXPECT_FALSE(flagOf(second, "B"));
}

// An overflowing utterance without alignment moves whole into the next segment
TEST_F(SegmentSplitterTest, UnalignedOverflowIsDeferred) {
    UtteranceSpan a = fixtures::makeAlignedUtterance("A", "A", 0.0, fixtures::numberedWords("a", 5), 2.0, 2.0);
    UtteranceSpan c = fixtures::makeUnalignedUtterance("C", "C", 20.0, 15.0, "hello world");
    RecordingSegment segment = fixtures::makeSegment("cut", 40.0, {a, c});

    auto output = splitter.split(segment);
    ASSERT_EQ(output.size(), 2u);

    ASSERT_EQ(output[0].utterances.size(), 1u);
    EXPECT_EQ(output[0].utterances[0].speaker_id, "A");
    EXPECT_DOUBLE_EQ(output[0].duration, 10.0);

    ASSERT_EQ(output[1].utterances.size(), 1u);
    const auto& deferred = output[1].utterances[0];
    EXPECT_EQ(deferred.speaker_id, "C");
    EXPECT_EQ(deferred.text, "hello world");
    EXPECT_DOUBLE_EQ(deferred.start, 0.0);
    EXPECT_DOUBLE_EQ(deferred.duration, 15.0);
    EXPECT_FALSE(deferred.alignment.has_value());
    EXPECT_DOUBLE_EQ(output[1].start_in_recording, 20.0);
    EXPECT_FALSE(flagOf(output[1], "C"));
}

// After a rollback the other speaker's overlapping words are carried along
TEST_F(SegmentSplitterTest, RollbackCarriesOverlap) {
    UtteranceSpan a = fixtures::makeAlignedUtterance("A", "spkA", 0.0, fixtures::numberedWords("a", 4), 5.0, 4.0);
    UtteranceSpan b = fixtures::makeAlignedUtterance("B", "spkB", 15.0, fixtures::numberedWords("b", 4), 5.0, 4.0);
    RecordingSegment segment = fixtures::makeSegment("cut", 40.0, {a, b});

    auto output = splitter.split(segment);
    ASSERT_EQ(output.size(), 2u);

    const auto& first = output[0];
    EXPECT_DOUBLE_EQ(first.duration, 29.0);
    ASSERT_EQ(first.utterances.size(), 2u);
    EXPECT_EQ(first.utterances[1].text, "b1 b2 b3");
    EXPECT_FALSE(flagOf(first, "spkA"));
    EXPECT_TRUE(flagOf(first, "spkB"));

    const auto& second = output[1];
    EXPECT_DOUBLE_EQ(second.start_in_recording, 15.0);
    EXPECT_DOUBLE_EQ(second.duration, 19.0);
    ASSERT_EQ(second.utterances.size(), 2u);
    EXPECT_EQ(second.utterances[0].id, "B-1-0");
    EXPECT_EQ(second.utterances[0].text, "b1 b2 b3 b4");
    EXPECT_EQ(second.utterances[1].id, "A-0-1_ovl");
    EXPECT_EQ(second.utterances[1].text, "a4");
    EXPECT_DOUBLE_EQ(second.utterances[1].start, 0.0);
    EXPECT_DOUBLE_EQ(second.utterances[1].duration, 4.0);
    EXPECT_THAT(flagSpeakers(second), UnorderedElementsAre("spkA", "spkB"));
}

TEST_F(SegmentSplitterTest, OverlapCarryCanBeDisabled) {
    SplitterOptions options;
    options.carry_overlaps = false;
    SegmentSplitter plain(options);

    UtteranceSpan a = fixtures::makeAlignedUtterance("A", "spkA", 0.0, fixtures::numberedWords("a", 4), 5.0, 4.0);
    UtteranceSpan b = fixtures::makeAlignedUtterance("B", "spkB", 15.0, fixtures::numberedWords("b", 4), 5.0, 4.0);
    auto output = plain.split(fixtures::makeSegment("cut", 40.0, {a, b}));

    ASSERT_EQ(output.size(), 2u);
    ASSERT_EQ(output[1].utterances.size(), 1u);
    EXPECT_EQ(output[1].utterances[0].speaker_id, "spkB");
}

// A seed that cannot fit at all is dropped and scanning goes on
TEST_F(SegmentSplitterTest, UnalignedLongSeedIsDropped) {
    UtteranceSpan a = fixtures::makeUnalignedUtterance("A", "A", 0.0, 45.0, "endless monologue");
    UtteranceSpan b = fixtures::makeAlignedUtterance("B", "B", 44.0, {"ok", "sure"}, 2.0, 2.0);
    auto output = splitter.split(fixtures::makeSegment("cut", 50.0, {a, b}));

    ASSERT_EQ(output.size(), 1u);
    EXPECT_EQ(output[0].id, "cut-0");
    ASSERT_EQ(output[0].utterances.size(), 1u);
    EXPECT_EQ(output[0].utterances[0].speaker_id, "B");
    EXPECT_DOUBLE_EQ(output[0].start_in_recording, 44.0);
    EXPECT_DOUBLE_EQ(output[0].duration, 4.0);
}

// A single monologue is cut into consecutive word-exact pieces
TEST_F(SegmentSplitterTest, MonologueIsSplitRepeatedly) {
    UtteranceSpan a = fixtures::makeAlignedUtterance("A", "A", 0.0, fixtures::numberedWords("w", 100), 1.0, 0.9);
    auto output = splitter.split(fixtures::makeSegment("mono", 100.0, {a}));

    ASSERT_EQ(output.size(), 4u);
    size_t words = 0;
    for (size_t i = 0; i < output.size(); ++i) {
        ASSERT_EQ(output[i].utterances.size(), 1u);
        words += output[i].utterances[0].alignment->size();
        EXPECT_EQ(flagOf(output[i], "A"), i + 1 < output.size());
        EXPECT_LE(output[i].duration, 30.0);
    }
    EXPECT_EQ(words, 100u);
}

// A long seed overflows together with turns that started before its cut
// point; each of them goes on from its own last kept word
TEST_F(SegmentSplitterTest, EveryOverflowingTurnContinues) {
    UtteranceSpan a = fixtures::makeAlignedUtterance("A", "spkA", 0.0, fixtures::numberedWords("a", 35), 1.0, 1.0);
    UtteranceSpan b = utteranceFromWords("B", "spkB", {
        Word("b1", 25.0, 1.0), Word("b2", 26.0, 1.5), Word("b3", 27.5, 1.0),
        Word("b4", 28.5, 2.0), Word("b5", 30.5, 1.5),
    });
    UtteranceSpan c = fixtures::makeAlignedUtterance("C", "spkA", 26.0, fixtures::numberedWords("c", 6), 1.0, 1.0);

    auto output = splitter.split(fixtures::makeSegment("cut", 36.0, {a, b, c}));
    ASSERT_EQ(output.size(), 2u);

    const auto& first = output[0];
    EXPECT_DOUBLE_EQ(first.duration, 29.0);
    ASSERT_EQ(first.utterances.size(), 3u);
    EXPECT_EQ(first.utterances[1].text, "b1 b2 b3");
    EXPECT_EQ(first.utterances[2].text, "c1 c2 c3");
    EXPECT_TRUE(flagOf(first, "spkA"));
    EXPECT_TRUE(flagOf(first, "spkB"));

    const auto& second = output[1];
    EXPECT_DOUBLE_EQ(second.start_in_recording, 28.5);
    EXPECT_DOUBLE_EQ(second.duration, 6.5);
    ASSERT_EQ(second.utterances.size(), 3u);
    EXPECT_EQ(second.utterances[0].id, "B-1-0_cont1");
    EXPECT_EQ(second.utterances[0].text, "b4 b5");
    EXPECT_EQ(second.utterances[1].id, "A-0-1_cont1");
    EXPECT_EQ(second.utterances[1].text, "a30 a31 a32 a33 a34 a35");
    EXPECT_EQ(second.utterances[2].id, "C-2-2_cont1");
    EXPECT_EQ(second.utterances[2].text, "c4 c5 c6");
    EXPECT_FALSE(flagOf(second, "spkA"));
    EXPECT_FALSE(flagOf(second, "spkB"));

    auto counts = wordCounts(output);
    EXPECT_EQ(counts.size(), 46u);
    for (const auto& kv : counts) {
        EXPECT_EQ(kv.second, 1) << kv.first;
    }
}

// A leading word longer than the window is dropped, the rest goes on
TEST_F(SegmentSplitterTest, OverlongWordIsSkipped) {
    UtteranceSpan a = utteranceFromWords("A", "A", {
        Word("drone", 0.0, 35.0), Word("ok", 35.0, 1.0), Word("bye", 36.0, 1.0),
    });
    auto& handler = overlapseg::utils::ErrorHandler::getInstance();
    handler.clearErrorHistory();

    auto output = splitter.split(fixtures::makeSegment("cut", 40.0, {a}));
    ASSERT_EQ(output.size(), 1u);
    ASSERT_EQ(output[0].utterances.size(), 1u);
    EXPECT_EQ(output[0].utterances[0].text, "ok bye");
    EXPECT_EQ(output[0].utterances[0].id, "A-0-0_cont1");
    EXPECT_DOUBLE_EQ(output[0].start_in_recording, 35.0);
    EXPECT_EQ(handler.getErrorCount(overlapseg::utils::ErrorCategory::SEGMENTATION), 1u);
    handler.clearErrorHistory();
}

TEST_F(SegmentSplitterTest, InvalidInputThrows) {
    RecordingSegment segment = fixtures::makeSegment("bad", 40.0, {
        fixtures::makeUnalignedUtterance("u", "A", -5.0, 10.0, "x"),
    });
    EXPECT_THROW(splitter.split(segment), InvalidSegmentException);
}

TEST_F(SegmentSplitterTest, RejectsNonPositiveMaxLength) {
    SplitterOptions options;
    options.max_len = 0.0;
    EXPECT_THROW(SegmentSplitter{options}, ConfigurationException);
}

class SegmentSplitterPropertyTest : public ::testing::TestWithParam<uint32_t> {
protected:
    SegmentSplitter splitter{SplitterOptions()};
};

// Bounds, containment and word integrity on generated conversations
TEST_P(SegmentSplitterPropertyTest, OutputsRespectBounds) {
    fixtures::ConversationScenario scenario;
    scenario.seed = GetParam();
    RecordingSegment input = fixtures::generateConversation("conv", scenario);
    ASSERT_GT(input.duration, 30.0);

    auto output = splitter.split(input);
    ASSERT_GE(output.size(), 2u);

    for (const auto& segment : output) {
        EXPECT_LE(segment.duration, 30.0 + kBoundaryEpsilon);
        EXPECT_GE(segment.start_in_recording, input.start_in_recording);

        for (const auto& utterance : segment.utterances) {
            EXPECT_GE(utterance.start, 0.0);
            EXPECT_LE(utterance.end(), segment.duration + kBoundaryEpsilon);

            const double abs_start = segment.start_in_recording - input.start_in_recording + utterance.start;
            const double abs_end = abs_start + utterance.duration;

            // Inside an input utterance of the same speaker
            bool contained = false;
            for (const auto& source : input.utterances) {
                if (source.speaker_id == utterance.speaker_id &&
                    source.start <= abs_start + kTolerance && abs_end <= source.end() + kTolerance) {
                    contained = true;
                    break;
                }
            }
            EXPECT_TRUE(contained) << utterance.id << " [" << abs_start << ", " << abs_end << "]";

            // Words are never cut: each one exists in the input
            ASSERT_TRUE(utterance.alignment.has_value());
            for (const auto& word : *utterance.alignment) {
                const double word_start = segment.start_in_recording - input.start_in_recording + word.start;
                bool found = false;
                for (const auto& source : input.utterances) {
                    for (const auto& original : *source.alignment) {
                        if (original.symbol == word.symbol &&
                            std::abs(original.start - word_start) < kTolerance &&
                            std::abs(original.duration - word.duration) < kTolerance) {
                            found = true;
                        }
                    }
                }
                EXPECT_TRUE(found) << word.symbol;
            }
        }
    }
}

// Re-splitting an output is a no-op
TEST_P(SegmentSplitterPropertyTest, OutputsAreFixedPoints) {
    fixtures::ConversationScenario scenario;
    scenario.seed = GetParam();
    auto output = splitter.split(fixtures::generateConversation("conv", scenario));

    for (const auto& segment : output) {
        auto again = splitter.split(segment);
        ASSERT_EQ(again.size(), 1u);
        EXPECT_EQ(again[0].id, segment.id);
        EXPECT_EQ(again[0].utterances.size(), segment.utterances.size());
    }
}

// Every input word ends up in some output segment
TEST_P(SegmentSplitterPropertyTest, WordsAreNeverLost) {
    fixtures::ConversationScenario scenario;
    scenario.seed = GetParam();
    RecordingSegment input = fixtures::generateConversation("conv", scenario);
    auto output = splitter.split(input);

    std::map<std::string, std::vector<double>> emitted;
    for (const auto& segment : output) {
        const double offset = segment.start_in_recording - input.start_in_recording;
        for (const auto& utterance : segment.utterances) {
            for (const auto& word : *utterance.alignment) {
                emitted[word.symbol].push_back(offset + word.start);
            }
        }
    }

    for (const auto& utterance : input.utterances) {
        for (const auto& word : *utterance.alignment) {
            auto it = emitted.find(word.symbol);
            ASSERT_NE(it, emitted.end()) << utterance.id << " lost " << word.symbol;
            bool at_same_time = false;
            for (double start : it->second) {
                at_same_time = at_same_time || std::abs(start - word.start) < kTolerance;
            }
            EXPECT_TRUE(at_same_time) << word.symbol;
        }
    }
}

// Long turns overflow as seeds and next to other speakers
TEST_P(SegmentSplitterPropertyTest, LongTurnsKeepTheirWords) {
    fixtures::ConversationScenario scenario;
    scenario.seed = GetParam();
    scenario.utterances = 20;
    scenario.max_words = 90;
    scenario.max_overlap = 6.0;
    RecordingSegment input = fixtures::generateConversation("long", scenario);

    auto counts = wordCounts(splitter.split(input));
    for (const auto& utterance : input.utterances) {
        for (const auto& word : *utterance.alignment) {
            EXPECT_GE(counts[word.symbol], 1) << utterance.id << " lost " << word.symbol;
        }
    }
}

INSTANTIATE_TEST_SUITE_P(GeneratedConversations, SegmentSplitterPropertyTest,
                         ::testing::Values(1u, 7u, 42u, 1234u, 99999u));
