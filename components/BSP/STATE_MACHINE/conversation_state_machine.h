#ifndef _CONVERSATION_STATE_MACHINE_H_
#define _CONVERSATION_STATE_MACHINE_H_

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

#include "conversation_state.h"

/**
 * @brief 会话状态机
 *
 * 每个 ConversationController 持有一个实例，校验状态转换并通知监听器
 *
 * @example
 *   ConversationStateMachine sm;
 *   sm.addStateChangeListener([](ConversationState old, ConversationState new_state) {
 *       ESP_LOGI("SM", "State: %s -> %s",
 *                GetConversationStateName(old), GetConversationStateName(new_state));
 *   });
 *   sm.transitionTo(kConversationStateStarting);
 */
class ConversationStateMachine {
public:
    ConversationStateMachine() = default;
    ~ConversationStateMachine() = default;

    // 禁止拷贝
    ConversationStateMachine(const ConversationStateMachine&) = delete;
    ConversationStateMachine& operator=(const ConversationStateMachine&) = delete;

    /**
     * @brief 获取当前状态
     */
    ConversationState getState() const { return current_state_.load(); }

    /**
     * @brief 是否处于会话中（Starting / Listening / Muted）
     */
    bool isActive() const;

    /**
     * @brief 尝试转换到新状态
     * @param new_state 目标状态
     * @return true 转换成功, false 转换无效
     */
    bool transitionTo(ConversationState new_state);

    /**
     * @brief 检查是否可以转换到目标状态
     */
    bool canTransitionTo(ConversationState target) const;

    /**
     * @brief 状态变化回调类型
     * 参数: (旧状态, 新状态)
     */
    using StateCallback = std::function<void(ConversationState, ConversationState)>;

    /**
     * @brief 添加状态变化监听器
     * @param callback 回调函数
     * @return 监听器ID，用于移除
     */
    int addStateChangeListener(StateCallback callback);

    /**
     * @brief 移除状态变化监听器
     * @param listener_id 监听器ID
     */
    void removeStateChangeListener(int listener_id);

    /**
     * @brief 重置状态机到 Idle（不通知监听器）
     */
    void reset();

    static bool isValidTransition(ConversationState from, ConversationState to);

private:
    std::atomic<ConversationState> current_state_{kConversationStateIdle};
    std::vector<std::pair<int, StateCallback>> listeners_;
    int next_listener_id_{0};
    mutable std::mutex mutex_;
};

#endif // _CONVERSATION_STATE_MACHINE_H_
