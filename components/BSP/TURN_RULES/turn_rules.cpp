#include "turn_rules.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <iterator>

namespace {
// 规则表全部是小写短语；文本先转小写，再逐表做前缀 / 后缀 / 包含检查。
// 只做线性扫描，栈占用与文本长度无关

bool isWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string toLower(const std::string &text) {
  std::string out(text);
  for (char &c : out) {
    c = (char)std::tolower(static_cast<unsigned char>(c));
  }
  return out;
}

bool endsWithAny(const std::string &text, const char *chars) {
  if (text.empty()) {
    return false;
  }
  return std::strchr(chars, text.back()) != nullptr;
}

// 以 phrase 结尾，且 phrase 前是词边界
bool endsWithPhrase(const std::string &lower, const char *phrase) {
  const size_t n = std::strlen(phrase);
  if (n == 0 || lower.size() < n) {
    return false;
  }
  const size_t start = lower.size() - n;
  if (lower.compare(start, n, phrase) != 0) {
    return false;
  }
  return start == 0 || !isWordChar(lower[start - 1]);
}

// 以 phrase 开头，且 phrase 后是词边界；返回 phrase 后的位置，不匹配返回 npos
size_t startsWithPhrase(const std::string &lower, const char *phrase) {
  const size_t n = std::strlen(phrase);
  if (n == 0 || lower.compare(0, n, phrase) != 0) {
    return std::string::npos;
  }
  if (n < lower.size() && isWordChar(lower[n])) {
    return std::string::npos;
  }
  return n;
}

// 第一次以完整词出现的位置之后；没有返回 npos
size_t findPhrase(const std::string &lower, const char *phrase) {
  const size_t n = std::strlen(phrase);
  size_t pos = lower.find(phrase);
  while (pos != std::string::npos) {
    const bool leftOk = pos == 0 || !isWordChar(lower[pos - 1]);
    const bool rightOk =
        pos + n >= lower.size() || !isWordChar(lower[pos + n]);
    if (leftOk && rightOk) {
      return pos + n;
    }
    pos = lower.find(phrase, pos + 1);
  }
  return std::string::npos;
}

template <size_t N>
bool endsWithAnyPhrase(const std::string &lower, const char *const (&table)[N]) {
  return std::any_of(std::begin(table), std::end(table),
                     [&lower](const char *p) { return endsWithPhrase(lower, p); });
}

template <size_t N>
bool containsAnyPhrase(const std::string &lower, const char *const (&table)[N]) {
  return std::any_of(std::begin(table), std::end(table), [&lower](const char *p) {
    return findPhrase(lower, p) != std::string::npos;
  });
}

// ---- 共用词表 ----

const char *const kTrailingConnectives[] = {
    "and",   "but",     "or",       "if",     "when",   "then",  "so",
    "because", "since", "while",    "although", "though", "unless", "until",
    "where", "after",   "before",   "with",   "without", "about", "for",
    "of",    "in",      "on",       "at",     "by",     "to",    "from",
    "up",    "down",    "out",      "off",
};

const char *const kToBePhrases[] = {
    "i am",  "i'm",   "you are", "you're",   "he is",    "she is",
    "it is", "we are", "they are", "there is", "there are",
};

const char *const kModalPhrases[] = {
    "i can",    "you can",    "he can",    "she can",    "we can",
    "they can", "i should",   "you should", "we should", "they should",
    "i will",   "you will",   "we will",   "they will",
};

// ---- 评分用规则表 ----

const char *const kCompletePhrases[] = {
    "thank you", "thanks",  "that's all", "perfect",  "exactly",
    "right",     "correct", "done",       "finished", "goodbye",
    "bye",       "see you", "talk to you later", "yes", "no",
    "okay",      "alright", "sure",       "absolutely", "definitely",
};

const char *const kFlowMarkers[] = {
    "you know",  "i think", "i believe", "in my opinion",
    "basically", "essentially", "overall", "in conclusion",
};

const char *const kThatsWords[] = {"that's", "thats"};

const char *const kThatsEndings[] = {
    "it", "all", "right", "correct", "good", "what i mean",
};

// ---- 自动发送门限规则表 ----

const char *const kTrailingFillers[] = {
    "now",       "still",     "really",     "just",     "only",
    "even",      "also",      "very",       "quite",    "actually",
    "basically", "literally", "definitely", "probably", "maybe",
    "perhaps",
};

// 单独结尾时仍意犹未尽的词
const char *const kOpenEndWords[] = {
    "code",    "did",     "not",      "you",     "me",       "getting",
    "making",  "trying",  "going",    "working", "talking",  "saying",
    "thinking", "looking", "still",   "chopping", "resisting",
};

const char *const kNaturalEndingWords[] = {
    "thanks",     "thank you", "that's all", "done",      "finished",
    "complete",   "exactly",   "right",      "correct",   "absolutely",
    "definitely", "certainly", "perfect",    "excellent", "great",
    "okay",       "alright",
};

// ---- 立即发送（自然断点）规则表 ----

const char *const kConversationEnders[] = {
    "thanks",   "thank you", "that's all", "goodbye", "bye",  "see you",
    "done",     "finished",  "period",     "end",     "stop",
};

const char *const kGreetingOpeners[] = {
    "hello", "hi", "hey", "good morning", "good afternoon", "good evening",
};

const char *const kRequestOpeners[] = {
    "please",  "can you", "could you", "would you",
    "tell me", "show me", "explain",   "help me",
};

// 请求类开头后至少还要有这么多字符
constexpr size_t kRequestTailChars = 10;

bool hasIncompleteEnding(const std::string &lower) {
  return endsWithAnyPhrase(lower, kTrailingConnectives) ||
         endsWithAnyPhrase(lower, kToBePhrases) ||
         endsWithAnyPhrase(lower, kModalPhrases);
}

bool hasNaturalFlow(const std::string &lower) {
  if (containsAnyPhrase(lower, kFlowMarkers)) {
    return true;
  }
  // "that's ... it / all / right ..." 结尾
  size_t after = std::string::npos;
  for (const char *word : kThatsWords) {
    after = std::min(after, findPhrase(lower, word));
  }
  if (after == std::string::npos) {
    return false;
  }
  for (const char *ending : kThatsEndings) {
    const size_t n = std::strlen(ending);
    if (endsWithPhrase(lower, ending) && lower.size() - n >= after) {
      return true;
    }
  }
  return false;
}

bool isStandaloneOpener(const std::string &lower) {
  for (const char *opener : kGreetingOpeners) {
    if (startsWithPhrase(lower, opener) != std::string::npos) {
      return true;
    }
  }
  for (const char *opener : kRequestOpeners) {
    const size_t after = startsWithPhrase(lower, opener);
    if (after != std::string::npos && lower.size() - after >= kRequestTailChars) {
      return true;
    }
  }
  return false;
}
} // namespace

std::string trimText(const std::string &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end &&
         std::isspace(static_cast<unsigned char>(text[begin]))) {
    begin++;
  }
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    end--;
  }
  return text.substr(begin, end - begin);
}

int countWords(const std::string &text) {
  int words = 0;
  bool inWord = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      inWord = false;
    } else if (!inWord) {
      inWord = true;
      words++;
    }
  }
  return words;
}

EndOfTurnScore analyzeEndOfTurn(const std::string &text, int64_t silenceMs,
                                int64_t thresholdMs) {
  const std::string trimmed = trimText(text);
  EndOfTurnScore result;
  EndOfTurnFactors &f = result.factors;

  f.wordCount = countWords(trimmed);
  f.hasPunctuation = endsWithAny(trimmed, ".!?");
  const std::string lower = toLower(trimmed);
  f.hasCompletePattern = endsWithAnyPhrase(lower, kCompletePhrases);
  f.hasIncompletePattern = hasIncompleteEnding(lower);

  if (thresholdMs <= 0) {
    f.silenceScore = 2.0;
  } else {
    double ratio = (double)std::max<int64_t>(0, silenceMs) / (double)thresholdMs;
    f.silenceScore = std::min(ratio, 2.0);
  }

  double score = f.silenceScore * 40.0;

  if (f.hasPunctuation) {
    score += 25.0;
  } else if (endsWithAny(trimmed, ",;:")) {
    score -= 10.0;
  }

  if (f.hasCompletePattern) {
    score += 20.0;
  }
  if (f.hasIncompletePattern) {
    score -= 25.0;
  }

  if (f.wordCount >= 15) {
    score += 15.0;
  } else if (f.wordCount < 5) {
    score -= 15.0;
  }

  if (!trimmed.empty() && trimmed.back() == '?' && f.wordCount >= 5) {
    score += 15.0;
  }

  if (hasNaturalFlow(lower)) {
    score += 10.0;
  }

  result.value = std::max(0.0, std::min(100.0, score));
  result.isEndOfTurn = result.value >= kEndOfTurnThreshold;
  result.confidence = result.value / 100.0;
  return result;
}

bool shouldAutoSend(const std::string &text) {
  const std::string trimmed = trimText(text);
  if (trimmed.empty()) {
    return false;
  }

  const int words = countWords(trimmed);
  if (words < kMinAutoSendWords) {
    return false;
  }

  const std::string lower = toLower(trimmed);
  if (hasIncompleteEnding(lower) ||
      endsWithAnyPhrase(lower, kTrailingFillers) ||
      endsWithAnyPhrase(lower, kOpenEndWords)) {
    return false;
  }

  const bool naturalEnding = endsWithAny(trimmed, ".!?") ||
                             endsWithAnyPhrase(lower, kNaturalEndingWords);

  if (words >= 15) {
    return true;
  }
  if (words >= 10 && naturalEnding) {
    return true;
  }
  return trimmed.back() == '?';
}

bool isNaturalBreak(const std::string &fragment, const std::string &fullText) {
  const std::string piece = trimText(fragment);
  const std::string full = trimText(fullText);

  if (endsWithAny(piece, "?.!")) {
    return true;
  }
  if (endsWithAnyPhrase(toLower(piece), kConversationEnders)) {
    return true;
  }
  return isStandaloneOpener(toLower(full));
}

double countdownMultiplier(double confidence) {
  if (confidence > 0.8) {
    return 0.7;
  }
  if (confidence > 0.6) {
    return 0.85;
  }
  return 1.2;
}

int countdownSeconds(uint32_t durationMs) {
  return (int)((durationMs + 999) / 1000);
}
