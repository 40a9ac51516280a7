#include "turn_rules.h"

#include <gtest/gtest.h>

#include <climits>
#include <pthread.h>

#include <functional>
#include <string>
#include <vector>

namespace {
// 规则的栈占用不能随文本长度增长，在小栈线程上跑长文本
constexpr size_t kRuleStackBytes = 64 * 1024;

void runOnSmallStack(const std::function<void()> &fn) {
  pthread_attr_t attr;
  ASSERT_EQ(pthread_attr_init(&attr), 0);
  size_t stack = kRuleStackBytes;
  if (stack < (size_t)PTHREAD_STACK_MIN) {
    stack = (size_t)PTHREAD_STACK_MIN;
  }
  ASSERT_EQ(pthread_attr_setstacksize(&attr, stack), 0);

  pthread_t thread;
  auto entry = [](void *arg) -> void * {
    (*static_cast<const std::function<void()> *>(arg))();
    return nullptr;
  };
  ASSERT_EQ(pthread_create(&thread, &attr, entry,
                           const_cast<std::function<void()> *>(&fn)),
            0);
  pthread_attr_destroy(&attr);
  ASSERT_EQ(pthread_join(thread, nullptr), 0);
}

std::string repeatUntil(const std::string &sentence, size_t minChars) {
  std::string out;
  while (out.size() < minChars) {
    out += sentence;
  }
  return out;
}
} // namespace

TEST(TurnRulesTest, TrimAndCountWords) {
  EXPECT_EQ(trimText("  hello world \n"), "hello world");
  EXPECT_EQ(trimText("   "), "");
  EXPECT_EQ(countWords(""), 0);
  EXPECT_EQ(countWords("  one  two\tthree\n"), 3);
}

TEST(TurnRulesTest, LongUtterancesAutoSendRegardlessOfPunctuation) {
  const std::vector<std::string> texts = {
      "I went to the market this morning and bought some apples pears "
      "grapes and fresh bread",
      "I went to the market this morning and bought some apples pears "
      "grapes and fresh bread.",
      "We spent the whole weekend hiking in the mountains with our friends "
      "from college last year",
      "Could you walk me through the steps needed to configure the router "
      "for my home office?",
  };
  for (const auto &text : texts) {
    ASSERT_GE(countWords(text), 15) << text;
    EXPECT_TRUE(shouldAutoSend(text)) << text;
  }
}

TEST(TurnRulesTest, TrailingIncompleteFragmentsBlockAutoSend) {
  const std::vector<std::string> texts = {
      "I would like to talk about the project timeline and",
      "When we get to the meeting room tomorrow morning I am",
      "If the weather is nice this weekend then I can",
      "There are a lot of things I wanted to ask you about",
      "We have been going over the numbers for the quarter but",
      "I have been working on this problem for hours and still",
  };
  for (const auto &text : texts) {
    ASSERT_GE(countWords(text), 8) << text;
    EXPECT_FALSE(shouldAutoSend(text)) << text;
  }
}

TEST(TurnRulesTest, AutoSendGateThresholds) {
  // < 8 words never passes
  EXPECT_FALSE(shouldAutoSend("What time is it now?"));
  EXPECT_FALSE(shouldAutoSend(""));
  EXPECT_FALSE(shouldAutoSend("I am"));

  // 8-9 words need a trailing question mark
  EXPECT_TRUE(shouldAutoSend("Do you know where I left my keys?"));
  EXPECT_FALSE(shouldAutoSend("I left my keys somewhere in the kitchen."));

  // 10-14 words need a natural ending
  EXPECT_TRUE(
      shouldAutoSend("I left my keys somewhere in the kitchen this morning."));
  EXPECT_TRUE(
      shouldAutoSend("I think the plan we discussed yesterday is exactly right"));
  EXPECT_FALSE(
      shouldAutoSend("I left my keys somewhere in the kitchen this morning"));
}

TEST(TurnRulesTest, NaturalBreakDetection) {
  EXPECT_TRUE(isNaturalBreak("what are your thoughts?", "what are your thoughts?"));
  EXPECT_TRUE(isNaturalBreak("that is all.", "that is all."));
  EXPECT_TRUE(isNaturalBreak("okay thanks", "okay thanks"));
  EXPECT_TRUE(isNaturalBreak("goodbye", "goodbye"));
  EXPECT_TRUE(isNaturalBreak("morning everyone", "hello there and good morning everyone"));
  EXPECT_TRUE(isNaturalBreak("the weather tomorrow",
                             "can you tell me about the weather tomorrow"));
  EXPECT_FALSE(isNaturalBreak("and then we went", "so we left early and then we went"));
}

TEST(TurnRulesTest, EndOfTurnScoreFactors) {
  // 10 词问句，静音达到阈值：40 + 25 + 15 = 80
  EndOfTurnScore s = analyzeEndOfTurn(
      "How are you doing today and what are your thoughts?", 5000, 5000);
  EXPECT_EQ(s.factors.wordCount, 10);
  EXPECT_TRUE(s.factors.hasPunctuation);
  EXPECT_FALSE(s.factors.hasIncompletePattern);
  EXPECT_DOUBLE_EQ(s.factors.silenceScore, 1.0);
  EXPECT_DOUBLE_EQ(s.value, 80.0);
  EXPECT_TRUE(s.isEndOfTurn);
  EXPECT_DOUBLE_EQ(s.confidence, 0.8);

  // 短且未完结：0 - 25 - 15 -> 截断为 0
  s = analyzeEndOfTurn("I am", 0, 5000);
  EXPECT_TRUE(s.factors.hasIncompletePattern);
  EXPECT_DOUBLE_EQ(s.value, 0.0);
  EXPECT_FALSE(s.isEndOfTurn);
}

TEST(TurnRulesTest, SilenceFactorIsCapped) {
  const EndOfTurnScore s = analyzeEndOfTurn("okay", 60000, 5000);
  EXPECT_DOUBLE_EQ(s.factors.silenceScore, 2.0);
  // 80 + 20 (complete) - 15 (short)
  EXPECT_DOUBLE_EQ(s.value, 85.0);
}

TEST(TurnRulesTest, TrailingCommaPenalty) {
  const EndOfTurnScore comma = analyzeEndOfTurn("well one two three four,", 0, 5000);
  const EndOfTurnScore plain = analyzeEndOfTurn("well one two three four", 0, 5000);
  EXPECT_DOUBLE_EQ(plain.value, 0.0);
  EXPECT_DOUBLE_EQ(comma.value, 0.0);

  const EndOfTurnScore longer =
      analyzeEndOfTurn("well one two three four five,", 5000, 5000);
  EXPECT_DOUBLE_EQ(longer.value, 30.0);
}

TEST(TurnRulesTest, ScoreIsClampedTo100) {
  const EndOfTurnScore s = analyzeEndOfTurn(
      "I think you know we covered everything on the agenda today and that's "
      "all, thank you so much for your time, okay?",
      20000, 5000);
  EXPECT_DOUBLE_EQ(s.value, 100.0);
}

TEST(TurnRulesTest, CountdownMultiplierIsMonotonic) {
  EXPECT_DOUBLE_EQ(countdownMultiplier(0.95), 0.7);
  EXPECT_DOUBLE_EQ(countdownMultiplier(0.7), 0.85);
  EXPECT_DOUBLE_EQ(countdownMultiplier(0.3), 1.2);

  double previous = countdownMultiplier(0.0);
  for (int i = 1; i <= 100; i++) {
    const double m = countdownMultiplier(i / 100.0);
    EXPECT_LE(m, previous) << "confidence " << i / 100.0;
    previous = m;
  }
}

TEST(TurnRulesTest, CountdownSecondsRoundsUp) {
  EXPECT_EQ(countdownSeconds(0), 0);
  EXPECT_EQ(countdownSeconds(1), 1);
  EXPECT_EQ(countdownSeconds(3500), 4);
  EXPECT_EQ(countdownSeconds(4250), 5);
  EXPECT_EQ(countdownSeconds(6000), 6);
}

TEST(TurnRulesTest, PhrasesMatchWholeWordsOnly) {
  // "brand" 不算以 and 结尾，"Hindi" 不算 hi 开头
  EXPECT_FALSE(analyzeEndOfTurn("we picked a brand", 0, 5000)
                   .factors.hasIncompletePattern);
  EXPECT_TRUE(analyzeEndOfTurn("we picked a brand and", 0, 5000)
                  .factors.hasIncompletePattern);
  EXPECT_FALSE(isNaturalBreak("is spoken widely", "Hindi is spoken widely"));
  EXPECT_TRUE(isNaturalBreak("there", "Hi there"));

  // 大小写不敏感，标点后不算完结短语
  EXPECT_TRUE(analyzeEndOfTurn("Thank You", 0, 5000).factors.hasCompletePattern);
  EXPECT_FALSE(analyzeEndOfTurn("thank you.", 0, 5000).factors.hasCompletePattern);
}

TEST(TurnRulesTest, NaturalFlowMarkers) {
  // 1 个静音因子之外：40 + 10 (flow) - 15 (short)
  EXPECT_DOUBLE_EQ(analyzeEndOfTurn("basically yeah", 5000, 5000).value, 35.0);
  EXPECT_DOUBLE_EQ(analyzeEndOfTurn("that's about it", 5000, 5000).value, 35.0);
  // "it" 必须出现在 that's 之后
  EXPECT_DOUBLE_EQ(analyzeEndOfTurn("it thats", 5000, 5000).value, 25.0);
}

TEST(TurnRulesTest, RequestOpenerNeedsEnoughContent) {
  EXPECT_TRUE(isNaturalBreak("the lights", "please turn on the lights"));
  EXPECT_FALSE(isNaturalBreak("turn", "please turn"));
}

TEST(TurnRulesTest, LongTranscriptFitsDecisionLoopStack) {
  const std::string text = repeatUntil(
      "I think we should hello basically talk about that's what I mean and ",
      1000);
  ASSERT_GE(text.size(), 1000u);

  bool gate = true;
  bool naturalBreak = false;
  EndOfTurnScore score;
  runOnSmallStack([&]() {
    gate = shouldAutoSend(text);
    naturalBreak = isNaturalBreak("and", "hello " + text);
    score = analyzeEndOfTurn(text, 5000, 5000);
  });

  EXPECT_FALSE(gate); // 以 and 结尾
  EXPECT_TRUE(naturalBreak);
  EXPECT_TRUE(score.factors.hasIncompletePattern);
  EXPECT_GE(score.factors.wordCount, 15);
  // 40 - 25 + 15 + 10
  EXPECT_DOUBLE_EQ(score.value, 40.0);
}
