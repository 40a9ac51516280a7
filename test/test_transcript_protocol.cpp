#include "transcript_protocol.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <string>

namespace {
bool parse(const std::string &json, InboundMessage &out, int64_t nowMs = 42) {
  return parseInboundMessage(json.data(), json.size(), nowMs, out);
}
} // namespace

TEST(TranscriptProtocolTest, BuildsStreamingUrl) {
  StreamingOptions options;
  EXPECT_EQ(buildStreamingUrl(options, "a b+c"),
            "wss://streaming.assemblyai.com/v3/ws?sample_rate=16000"
            "&encoding=pcm_s16le&sentiment_analysis=true&speaker_labels=true"
            "&token=a%20b%2Bc");

  options.content_safety = true;
  options.sentiment_analysis = false;
  options.speaker_labels = false;
  EXPECT_EQ(buildStreamingUrl(options, "tok-1_2.3~"),
            "wss://streaming.assemblyai.com/v3/ws?sample_rate=16000"
            "&encoding=pcm_s16le&content_safety_detection=true"
            "&token=tok-1_2.3~");
}

TEST(TranscriptProtocolTest, ParsesBegin) {
  InboundMessage msg;
  ASSERT_TRUE(parse(R"({"type":"Begin","id":"sess-1","expires_at":123})", msg));
  EXPECT_EQ(msg.type, InboundType::Begin);
  EXPECT_EQ(msg.sessionId, "sess-1");
}

TEST(TranscriptProtocolTest, ParsesPartialTranscript) {
  InboundMessage msg;
  ASSERT_TRUE(parse(
      R"({"type":"Turn","transcript":"hello wor","end_of_turn":false,"confidence":0.8})",
      msg));
  EXPECT_EQ(msg.type, InboundType::Transcript);
  EXPECT_EQ(msg.transcript.text, "hello wor");
  EXPECT_FALSE(msg.transcript.isFinal);
  EXPECT_FLOAT_EQ(msg.transcript.confidence, 0.8f);
  EXPECT_FALSE(msg.transcript.speakerId.has_value());
  EXPECT_EQ(msg.transcript.timestampMs, 42);
}

TEST(TranscriptProtocolTest, ParsesFinalTranscriptDefaults) {
  InboundMessage msg;
  ASSERT_TRUE(parse(
      R"({"transcript":"Hi there.","end_of_turn":true,"speaker":"A","turn_order":3})",
      msg));
  EXPECT_EQ(msg.type, InboundType::Transcript);
  EXPECT_TRUE(msg.transcript.isFinal);
  EXPECT_FLOAT_EQ(msg.transcript.confidence, 0.5f);
  ASSERT_TRUE(msg.transcript.speakerId.has_value());
  EXPECT_EQ(*msg.transcript.speakerId, "A");
  EXPECT_EQ(msg.transcript.turnOrder, 3);

  ASSERT_TRUE(parse(R"({"transcript":"x","end_of_turn":true,"confidence":0})", msg));
  EXPECT_FLOAT_EQ(msg.transcript.confidence, 0.5f);
}

TEST(TranscriptProtocolTest, ParsesSentiment) {
  InboundMessage msg;
  ASSERT_TRUE(parse(R"({"type":"sentiment","sentiment":"NEGATIVE","confidence":0.75})", msg));
  EXPECT_EQ(msg.type, InboundType::Sentiment);
  EXPECT_EQ(msg.sentiment.sentiment, Sentiment::Negative);
  EXPECT_FLOAT_EQ(msg.sentiment.confidence, 0.75f);

  ASSERT_TRUE(parse(R"({"type":"sentiment","sentiment":"meh"})", msg));
  EXPECT_EQ(msg.sentiment.sentiment, Sentiment::Neutral);
  EXPECT_FLOAT_EQ(msg.sentiment.confidence, 0.0f);
}

TEST(TranscriptProtocolTest, ParsesSpeakerLabels) {
  InboundMessage msg;
  ASSERT_TRUE(parse(R"({"type":"speaker_labels","labels":[
      {"speaker":"A","start":0.5,"end":1.25,"confidence":0.8,"text":"hi"},
      {}]})",
                    msg));
  EXPECT_EQ(msg.type, InboundType::SpeakerLabels);
  ASSERT_EQ(msg.speakerLabels.size(), 2u);
  EXPECT_EQ(msg.speakerLabels[0].speaker, "A");
  EXPECT_DOUBLE_EQ(msg.speakerLabels[0].startTime, 0.5);
  EXPECT_DOUBLE_EQ(msg.speakerLabels[0].endTime, 1.25);
  EXPECT_EQ(msg.speakerLabels[0].text, "hi");
  EXPECT_EQ(msg.speakerLabels[1].speaker, "Unknown");
  EXPECT_EQ(msg.speakerLabels[1].text, "");

  // 没有 type，只有 speaker_labels 字段
  ASSERT_TRUE(parse(R"({"speaker_labels":[{"speaker":"B"}]})", msg));
  EXPECT_EQ(msg.type, InboundType::SpeakerLabels);
  ASSERT_EQ(msg.speakerLabels.size(), 1u);
  EXPECT_EQ(msg.speakerLabels[0].speaker, "B");
}

TEST(TranscriptProtocolTest, ContentSafetyRiskLevels) {
  InboundMessage msg;
  ASSERT_TRUE(parse(R"({"content_safety":{
      "violence":{"detected":true,"confidence":0.9},
      "profanity":{"detected":true,"confidence":0.5}}})",
                    msg));
  EXPECT_EQ(msg.type, InboundType::ContentSafety);
  EXPECT_EQ(msg.contentSafety.riskLevel, RiskLevel::High);
  ASSERT_EQ(msg.contentSafety.flaggedCategories.size(), 2u);
  EXPECT_EQ(msg.contentSafety.flaggedCategories[0], "violence");
  EXPECT_EQ(msg.contentSafety.flaggedCategories[1], "profanity");
  EXPECT_FALSE(msg.contentSafety.hateSpeech.detected);

  ASSERT_TRUE(parse(R"({"type":"content_safety",
      "harassment":{"detected":true,"confidence":0.4},
      "self_harm":{"detected":true,"confidence":0.6}})",
                    msg));
  EXPECT_EQ(msg.contentSafety.riskLevel, RiskLevel::Medium);

  ASSERT_TRUE(parse(R"({"type":"content_safety",
      "sexual_content":{"detected":true,"confidence":0.7}})",
                    msg));
  EXPECT_EQ(msg.contentSafety.riskLevel, RiskLevel::Low);
  EXPECT_EQ(msg.contentSafety.flaggedCategories.size(), 1u);

  ASSERT_TRUE(parse(R"({"type":"content_safety"})", msg));
  EXPECT_EQ(msg.contentSafety.riskLevel, RiskLevel::Low);
  EXPECT_TRUE(msg.contentSafety.flaggedCategories.empty());
}

TEST(TranscriptProtocolTest, ParsesErrors) {
  InboundMessage msg;
  ASSERT_TRUE(parse(R"({"type":"Error","error":"Audio too fast"})", msg));
  EXPECT_EQ(msg.type, InboundType::Error);
  EXPECT_EQ(msg.errorMessage, "Audio too fast");

  ASSERT_TRUE(parse(R"({"error":"bad request"})", msg));
  EXPECT_EQ(msg.type, InboundType::Error);

  ASSERT_TRUE(parse(R"({"type":"Error"})", msg));
  EXPECT_EQ(msg.errorMessage, "Unknown error");
}

TEST(TranscriptProtocolTest, UnknownTypesAreIgnored) {
  InboundMessage msg;
  ASSERT_TRUE(parse(R"({"type":"Termination","audio_duration_seconds":12})", msg));
  EXPECT_EQ(msg.type, InboundType::Ignored);
  EXPECT_EQ(msg.rawType, "Termination");
}

TEST(TranscriptProtocolTest, RejectsMalformedPayloads) {
  InboundMessage msg;
  EXPECT_FALSE(parse("not json", msg));
  EXPECT_FALSE(parse("[1,2,3]", msg));
  EXPECT_FALSE(parse("", msg));
  EXPECT_FALSE(parse(R"({"transcript": )", msg));
}

TEST(TranscriptProtocolTest, ParsesCloseFrame) {
  const uint8_t payload[] = {0x0F, 0xA1, 'b', 'a', 'd'};
  CloseFrame frame = parseCloseFrame(payload, sizeof(payload));
  EXPECT_EQ(frame.code, 4001);
  EXPECT_EQ(frame.reason, "bad");

  const uint8_t codeOnly[] = {0x03, 0xE8};
  frame = parseCloseFrame(codeOnly, sizeof(codeOnly));
  EXPECT_EQ(frame.code, kCloseNormal);
  EXPECT_EQ(frame.reason, "");

  frame = parseCloseFrame(payload, 1);
  EXPECT_EQ(frame.code, kCloseNoStatus);
  frame = parseCloseFrame(nullptr, 0);
  EXPECT_EQ(frame.code, kCloseNoStatus);
}

TEST(TranscriptProtocolTest, LocalCloseRecordsNormalClosure) {
  CloseFrame untouched;
  CloseFrame frame = settleLocalClose(false, false, untouched);
  EXPECT_EQ(frame.code, kCloseNormal);
  EXPECT_EQ(frame.reason, "normal");
}

TEST(TranscriptProtocolTest, LocalCloseKeepsEarlierOutcome) {
  // 网络故障之后再 close()
  CloseFrame failed;
  failed.code = kCloseAbnormal;
  CloseFrame frame = settleLocalClose(true, false, failed);
  EXPECT_EQ(frame.code, kCloseAbnormal);
  EXPECT_EQ(frame.reason, "");

  // 对端已发关闭帧，连接还没走到 Closed
  CloseFrame server;
  server.code = 4008;
  server.reason = "timeout";
  frame = settleLocalClose(false, true, server);
  EXPECT_EQ(frame.code, 4008);
  EXPECT_EQ(frame.reason, "timeout");
}

TEST(TranscriptProtocolTest, InvalidCredentialMessage) {
  const CloseDescription d = describeClose(4001, "");
  EXPECT_TRUE(d.isError);
  EXPECT_EQ(d.kind, LinkErrorKind::InvalidCredential);
  EXPECT_EQ(d.message, "Invalid AssemblyAI API key. Please check your configuration.");
}

TEST(TranscriptProtocolTest, MapsCloseCodes) {
  EXPECT_EQ(describeClose(4002, "").message,
            "AssemblyAI quota exceeded. Please check your account.");
  EXPECT_EQ(describeClose(3005, "").message,
            "Invalid audio data sent to AssemblyAI. Microphone may have issues.");
  EXPECT_EQ(describeClose(4008, "").message,
            "AssemblyAI session timeout. Please try again.");

  EXPECT_FALSE(describeClose(1000, "").isError);
  EXPECT_FALSE(describeClose(1001, "going away").isError);

  CloseDescription d = describeClose(4100, "custom reason");
  EXPECT_EQ(d.kind, LinkErrorKind::Protocol);
  EXPECT_EQ(d.message, "AssemblyAI error (4100): custom reason");
  EXPECT_EQ(describeClose(4100, "").message, "AssemblyAI error (4100): Unknown error");

  d = describeClose(1011, "internal");
  EXPECT_TRUE(d.isError);
  EXPECT_EQ(d.kind, LinkErrorKind::Disconnected);
  EXPECT_EQ(d.message, "Speech recognition service disconnected unexpectedly.");
}

TEST(TranscriptProtocolTest, NetworkFailure) {
  const CloseDescription d = describeNetworkFailure();
  EXPECT_TRUE(d.isError);
  EXPECT_EQ(d.kind, LinkErrorKind::Network);
  EXPECT_EQ(d.code, kCloseAbnormal);
  EXPECT_EQ(d.message, "Speech recognition connection error. Please try again.");
}

TEST(TranscriptProtocolTest, TerminateMessage) {
  EXPECT_EQ(buildTerminateMessage(), R"({"type":"Terminate"})");
}

TEST(TranscriptProtocolTest, SpeechTokenResponses) {
  std::string key;
  const std::string ok = R"({"apiKey":"temp-123"})";
  EXPECT_TRUE(parseSpeechTokenResponse(ok.data(), ok.size(), key));
  EXPECT_EQ(key, "temp-123");

  const std::string missing = R"({"token":"x"})";
  EXPECT_FALSE(parseSpeechTokenResponse(missing.data(), missing.size(), key));

  const std::string err = R"({"error":"Server misconfigured"})";
  EXPECT_EQ(parseErrorField(err.data(), err.size()), "Server misconfigured");
  EXPECT_EQ(parseErrorField("oops", 4), "");
}
