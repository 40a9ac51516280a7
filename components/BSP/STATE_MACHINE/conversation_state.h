#ifndef _CONVERSATION_STATE_H_
#define _CONVERSATION_STATE_H_

/**
 * @brief 会话状态枚举
 *
 * 连续对话会话的生命周期，用于状态机管理
 */
enum ConversationState {
    kConversationStateIdle = 0,    ///< 未启动
    kConversationStateStarting,    ///< 启动中（麦克风 / token / 连接）
    kConversationStateListening,   ///< 正在聆听
    kConversationStateMuted,       ///< 静音（仍在采集，不做发送决策）
    kConversationStateStopped,     ///< 已停止，资源已释放
    kConversationStateError        ///< 出错，等待清理
};

/**
 * @brief 会话错误分类
 */
enum ConversationErrorKind {
    kConversationErrorDevice = 0,  ///< 麦克风不可用
    kConversationErrorToken,       ///< 获取凭证失败
    kConversationErrorProtocol,    ///< 服务端关闭码 / 错误消息
    kConversationErrorNetwork      ///< 连接层故障
};

/**
 * @brief 获取状态名称字符串
 * @param state 会话状态
 * @return 状态名称
 */
inline const char* GetConversationStateName(ConversationState state) {
    switch (state) {
        case kConversationStateIdle:      return "Idle";
        case kConversationStateStarting:  return "Starting";
        case kConversationStateListening: return "Listening";
        case kConversationStateMuted:     return "Muted";
        case kConversationStateStopped:   return "Stopped";
        case kConversationStateError:     return "Error";
        default:                          return "Invalid";
    }
}

inline const char* GetConversationErrorKindName(ConversationErrorKind kind) {
    switch (kind) {
        case kConversationErrorDevice:   return "Device";
        case kConversationErrorToken:    return "Token";
        case kConversationErrorProtocol: return "Protocol";
        case kConversationErrorNetwork:  return "Network";
        default:                         return "Invalid";
    }
}

#endif // _CONVERSATION_STATE_H_
