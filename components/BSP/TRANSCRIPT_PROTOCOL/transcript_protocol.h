#pragma once

#include "transcript_events.h"

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief 流式转写连接参数（拼接到 URL query）
 */
struct StreamingOptions {
  std::string base_url = "wss://streaming.assemblyai.com/v3/ws";
  int sample_rate = 16000;
  std::string encoding = "pcm_s16le";
  bool sentiment_analysis = true;
  bool speaker_labels = true;
  bool content_safety = false;
};

/**
 * @brief 连接关闭 / 出错的分类
 */
enum class LinkErrorKind {
  None,              ///< 1000/1001 正常关闭
  InvalidCredential, ///< 4001
  QuotaExceeded,     ///< 4002
  InvalidAudio,      ///< 3005
  SessionTimeout,    ///< 4008
  Protocol,          ///< 其它 >= 4000
  Disconnected,      ///< 其它关闭码
  Network,           ///< 传输层错误，无关闭帧
};

struct CloseFrame {
  int code = 1005; ///< RFC 6455: no status received
  std::string reason;
};

struct CloseDescription {
  bool isError = false;
  LinkErrorKind kind = LinkErrorKind::None;
  int code = 1000;
  std::string reason;
  std::string message; ///< 面向用户的错误文案
};

static constexpr int kCloseNormal = 1000;
static constexpr int kCloseGoingAway = 1001;
static constexpr int kCloseNoStatus = 1005;
static constexpr int kCloseAbnormal = 1006;

/**
 * @brief 拼接流式转写 WebSocket URL
 * @param options 采样率 / 编码 / 功能开关
 * @param token   会话凭证（会做 percent-encode）
 */
std::string buildStreamingUrl(const StreamingOptions &options,
                              const std::string &token);

/**
 * @brief 解析一条下行 JSON 文本消息
 *
 * 按 type 字段或 transcript 字段的存在性分类；未知类型归为 Ignored。
 *
 * @return false: 非 JSON 或不是对象（调用方记录日志后丢弃）
 */
bool parseInboundMessage(const char *data, size_t len, int64_t nowMs,
                         InboundMessage &out);

/**
 * @brief 解析关闭帧负载：2 字节大端状态码 + UTF-8 原因
 */
CloseFrame parseCloseFrame(const uint8_t *payload, size_t len);

/**
 * @brief 本地 close() 结束后连接记录的关闭码
 *
 * 连接已经结束（对端关闭帧或网络故障）或已收到关闭帧时保留原记录，
 * 否则为 1000 "normal"。
 *
 * @param alreadyClosed 调用 close() 前连接是否已处于 Closed
 * @param frameSeen     是否收到过对端关闭帧
 * @param recorded      当前记录的关闭码与原因
 */
CloseFrame settleLocalClose(bool alreadyClosed, bool frameSeen,
                            const CloseFrame &recorded);

/**
 * @brief 将关闭码映射为错误分类与文案
 */
CloseDescription describeClose(int code, const std::string &reason);

/**
 * @brief 传输层故障（无关闭帧）的描述
 */
CloseDescription describeNetworkFailure();

/**
 * @brief 主动结束会话前发送的消息
 */
std::string buildTerminateMessage();

/**
 * @brief 解析 token 接口响应 {"apiKey": "..."}
 * @return false: 非 JSON 或缺少 apiKey
 */
bool parseSpeechTokenResponse(const char *body, size_t len,
                              std::string &apiKey);

/**
 * @brief 读取错误响应中的 {"error": "..."}，没有则返回空串
 */
std::string parseErrorField(const char *body, size_t len);

const char *GetLinkErrorKindName(LinkErrorKind kind);
