#include "transcript_protocol.h"

#include "cJSON.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

namespace {
struct JsonDeleter {
  void operator()(cJSON *p) const { cJSON_Delete(p); }
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

JsonPtr parseJson(const char *data, size_t len) {
  if (data == nullptr || len == 0) {
    return nullptr;
  }
  return JsonPtr(cJSON_ParseWithLength(data, len));
}

std::string getString(const cJSON *obj, const char *key,
                      const char *fallback = "") {
  const cJSON *item = cJSON_GetObjectItem(obj, key);
  if (cJSON_IsString(item) && item->valuestring != nullptr) {
    return item->valuestring;
  }
  return fallback;
}

// 数值缺失或为 0 时取 fallback
double getNumberOr(const cJSON *obj, const char *key, double fallback) {
  const cJSON *item = cJSON_GetObjectItem(obj, key);
  if (cJSON_IsNumber(item) && item->valuedouble != 0.0) {
    return item->valuedouble;
  }
  return fallback;
}

bool hasKey(const cJSON *obj, const char *key) {
  return cJSON_HasObjectItem(obj, key) != 0;
}

SafetyCategory readCategory(const cJSON *obj, const char *key) {
  SafetyCategory cat;
  const cJSON *item = cJSON_GetObjectItem(obj, key);
  if (!cJSON_IsObject(item)) {
    return cat;
  }
  cat.detected = cJSON_IsTrue(cJSON_GetObjectItem(item, "detected"));
  cat.confidence = (float)getNumberOr(item, "confidence", 0.0);
  return cat;
}

void summarizeSafety(ContentSafetyResult &r) {
  const std::pair<const char *, const SafetyCategory *> categories[] = {
      {"violence", &r.violence},         {"hate_speech", &r.hateSpeech},
      {"profanity", &r.profanity},       {"harassment", &r.harassment},
      {"self_harm", &r.selfHarm},        {"sexual_content", &r.sexualContent},
  };

  int highConfidence = 0;
  r.flaggedCategories.clear();
  for (const auto &[name, cat] : categories) {
    if (!cat->detected) {
      continue;
    }
    r.flaggedCategories.emplace_back(name);
    if (cat->confidence > 0.7f) {
      highConfidence++;
    }
  }

  if (highConfidence > 0) {
    r.riskLevel = RiskLevel::High;
  } else if (r.flaggedCategories.size() > 1) {
    r.riskLevel = RiskLevel::Medium;
  } else {
    r.riskLevel = RiskLevel::Low;
  }
}

Sentiment parseSentiment(const std::string &s) {
  if (s == "POSITIVE") {
    return Sentiment::Positive;
  }
  if (s == "NEGATIVE") {
    return Sentiment::Negative;
  }
  return Sentiment::Neutral;
}

void parseSpeakerLabels(const cJSON *root, std::vector<SpeakerLabel> &out) {
  const cJSON *labels = cJSON_GetObjectItem(root, "speaker_labels");
  if (!cJSON_IsArray(labels)) {
    labels = cJSON_GetObjectItem(root, "labels");
  }
  if (!cJSON_IsArray(labels)) {
    return;
  }

  const cJSON *label = nullptr;
  cJSON_ArrayForEach(label, labels) {
    if (!cJSON_IsObject(label)) {
      continue;
    }
    SpeakerLabel sl;
    std::string speaker = getString(label, "speaker");
    if (!speaker.empty()) {
      sl.speaker = speaker;
    }
    sl.startTime = getNumberOr(label, "start", 0.0);
    sl.endTime = getNumberOr(label, "end", 0.0);
    sl.confidence = (float)getNumberOr(label, "confidence", 0.0);
    sl.text = getString(label, "text");
    out.push_back(std::move(sl));
  }
}

bool isUnreserved(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
         c == '~';
}

std::string percentEncode(const std::string &in) {
  std::string out;
  out.reserve(in.size());
  for (char c : in) {
    if (isUnreserved(c)) {
      out.push_back(c);
    } else {
      char buf[4];
      snprintf(buf, sizeof(buf), "%%%02X", (unsigned)(uint8_t)c);
      out.append(buf);
    }
  }
  return out;
}
} // namespace

std::string buildStreamingUrl(const StreamingOptions &options,
                              const std::string &token) {
  std::string url = options.base_url;
  url += "?sample_rate=" + std::to_string(options.sample_rate);
  url += "&encoding=" + options.encoding;
  if (options.sentiment_analysis) {
    url += "&sentiment_analysis=true";
  }
  if (options.speaker_labels) {
    url += "&speaker_labels=true";
  }
  if (options.content_safety) {
    url += "&content_safety_detection=true";
  }
  url += "&token=" + percentEncode(token);
  return url;
}

bool parseInboundMessage(const char *data, size_t len, int64_t nowMs,
                         InboundMessage &out) {
  JsonPtr root = parseJson(data, len);
  if (!root || !cJSON_IsObject(root.get())) {
    return false;
  }
  const cJSON *obj = root.get();

  out = InboundMessage{};
  out.rawType = getString(obj, "type");
  const std::string &type = out.rawType;

  if (type == "Begin") {
    out.type = InboundType::Begin;
    out.sessionId = getString(obj, "id");
  } else if (type == "sentiment") {
    out.type = InboundType::Sentiment;
    out.sentiment.sentiment = parseSentiment(getString(obj, "sentiment"));
    out.sentiment.confidence = (float)getNumberOr(obj, "confidence", 0.0);
    out.sentiment.timestampMs = nowMs;
  } else if (type == "speaker_labels" || hasKey(obj, "speaker_labels")) {
    out.type = InboundType::SpeakerLabels;
    parseSpeakerLabels(obj, out.speakerLabels);
  } else if (type == "content_safety" || hasKey(obj, "content_safety")) {
    out.type = InboundType::ContentSafety;
    const cJSON *safety = cJSON_GetObjectItem(obj, "content_safety");
    if (!cJSON_IsObject(safety)) {
      safety = obj;
    }
    ContentSafetyResult &r = out.contentSafety;
    r.violence = readCategory(safety, "violence");
    r.hateSpeech = readCategory(safety, "hate_speech");
    r.profanity = readCategory(safety, "profanity");
    r.harassment = readCategory(safety, "harassment");
    r.selfHarm = readCategory(safety, "self_harm");
    r.sexualContent = readCategory(safety, "sexual_content");
    r.timestampMs = nowMs;
    summarizeSafety(r);
  } else if (hasKey(obj, "transcript")) {
    out.type = InboundType::Transcript;
    TranscriptEvent &t = out.transcript;
    t.text = getString(obj, "transcript");
    t.isFinal = cJSON_IsTrue(cJSON_GetObjectItem(obj, "end_of_turn"));
    t.confidence = (float)getNumberOr(obj, "confidence", 0.5);
    std::string speaker = getString(obj, "speaker");
    if (!speaker.empty()) {
      t.speakerId = speaker;
    }
    const cJSON *order = cJSON_GetObjectItem(obj, "turn_order");
    if (cJSON_IsNumber(order)) {
      t.turnOrder = order->valueint;
    }
    t.timestampMs = nowMs;
  } else if (type == "Error" || hasKey(obj, "error")) {
    out.type = InboundType::Error;
    out.errorMessage = getString(obj, "error", "Unknown error");
  } else {
    out.type = InboundType::Ignored;
  }
  return true;
}

CloseFrame parseCloseFrame(const uint8_t *payload, size_t len) {
  CloseFrame frame;
  if (payload == nullptr || len < 2) {
    return frame;
  }
  frame.code = ((int)payload[0] << 8) | (int)payload[1];
  if (len > 2) {
    frame.reason.assign(reinterpret_cast<const char *>(payload + 2), len - 2);
  }
  return frame;
}

CloseFrame settleLocalClose(bool alreadyClosed, bool frameSeen,
                            const CloseFrame &recorded) {
  if (alreadyClosed || frameSeen) {
    return recorded;
  }
  CloseFrame frame;
  frame.code = kCloseNormal;
  frame.reason = "normal";
  return frame;
}

CloseDescription describeClose(int code, const std::string &reason) {
  CloseDescription d;
  d.code = code;
  d.reason = reason;
  d.isError = true;

  switch (code) {
  case 4001:
    d.kind = LinkErrorKind::InvalidCredential;
    d.message = "Invalid AssemblyAI API key. Please check your configuration.";
    break;
  case 4002:
    d.kind = LinkErrorKind::QuotaExceeded;
    d.message = "AssemblyAI quota exceeded. Please check your account.";
    break;
  case 3005:
    d.kind = LinkErrorKind::InvalidAudio;
    d.message =
        "Invalid audio data sent to AssemblyAI. Microphone may have issues.";
    break;
  case 4008:
    d.kind = LinkErrorKind::SessionTimeout;
    d.message = "AssemblyAI session timeout. Please try again.";
    break;
  case kCloseNormal:
  case kCloseGoingAway:
    d.isError = false;
    d.kind = LinkErrorKind::None;
    break;
  default:
    if (code >= 4000) {
      d.kind = LinkErrorKind::Protocol;
      d.message = "AssemblyAI error (" + std::to_string(code) +
                  "): " + (reason.empty() ? "Unknown error" : reason);
    } else {
      d.kind = LinkErrorKind::Disconnected;
      d.message = "Speech recognition service disconnected unexpectedly.";
    }
    break;
  }
  return d;
}

CloseDescription describeNetworkFailure() {
  CloseDescription d;
  d.isError = true;
  d.kind = LinkErrorKind::Network;
  d.code = kCloseAbnormal;
  d.message = "Speech recognition connection error. Please try again.";
  return d;
}

std::string buildTerminateMessage() {
  JsonPtr root(cJSON_CreateObject());
  if (!root) {
    return "{\"type\":\"Terminate\"}";
  }
  cJSON_AddStringToObject(root.get(), "type", "Terminate");
  char *str = cJSON_PrintUnformatted(root.get());
  if (str == nullptr) {
    return "{\"type\":\"Terminate\"}";
  }
  std::string msg(str);
  cJSON_free(str);
  return msg;
}

bool parseSpeechTokenResponse(const char *body, size_t len,
                              std::string &apiKey) {
  JsonPtr root = parseJson(body, len);
  if (!root || !cJSON_IsObject(root.get())) {
    return false;
  }
  apiKey = getString(root.get(), "apiKey");
  return !apiKey.empty();
}

std::string parseErrorField(const char *body, size_t len) {
  JsonPtr root = parseJson(body, len);
  if (!root || !cJSON_IsObject(root.get())) {
    return "";
  }
  return getString(root.get(), "error");
}

const char *GetLinkErrorKindName(LinkErrorKind kind) {
  switch (kind) {
  case LinkErrorKind::None:              return "None";
  case LinkErrorKind::InvalidCredential: return "InvalidCredential";
  case LinkErrorKind::QuotaExceeded:     return "QuotaExceeded";
  case LinkErrorKind::InvalidAudio:      return "InvalidAudio";
  case LinkErrorKind::SessionTimeout:    return "SessionTimeout";
  case LinkErrorKind::Protocol:          return "Protocol";
  case LinkErrorKind::Disconnected:      return "Disconnected";
  case LinkErrorKind::Network:           return "Network";
  default:                               return "Invalid";
  }
}
