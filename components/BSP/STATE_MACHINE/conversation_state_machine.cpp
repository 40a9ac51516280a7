#include "conversation_state_machine.h"
#include <algorithm>

bool ConversationStateMachine::isActive() const {
    ConversationState s = current_state_.load();
    return s == kConversationStateStarting ||
           s == kConversationStateListening ||
           s == kConversationStateMuted;
}

bool ConversationStateMachine::transitionTo(ConversationState new_state) {
    std::unique_lock<std::mutex> lock(mutex_);

    ConversationState old_state = current_state_.load();

    if (old_state == new_state) {
        return true; // 已经在目标状态
    }

    if (!isValidTransition(old_state, new_state)) {
        return false;
    }

    current_state_.store(new_state);

    // 拷贝后在锁外通知，监听器里可以再次调用状态机
    auto listeners_copy = listeners_;
    lock.unlock();

    for (const auto& [id, callback] : listeners_copy) {
        if (callback) {
            callback(old_state, new_state);
        }
    }

    return true;
}

bool ConversationStateMachine::canTransitionTo(ConversationState target) const {
    return isValidTransition(current_state_.load(), target);
}

bool ConversationStateMachine::isValidTransition(ConversationState from, ConversationState to) {
    switch (from) {
        case kConversationStateIdle:
        case kConversationStateStopped:
            return to == kConversationStateStarting;

        case kConversationStateStarting:
            return to == kConversationStateListening ||
                   to == kConversationStateStopped ||
                   to == kConversationStateError;

        case kConversationStateListening:
            return to == kConversationStateMuted ||
                   to == kConversationStateStopped ||
                   to == kConversationStateError;

        case kConversationStateMuted:
            return to == kConversationStateListening ||
                   to == kConversationStateStopped ||
                   to == kConversationStateError;

        case kConversationStateError:
            // 清理完成后进入 Stopped，或直接重新启动
            return to == kConversationStateStopped ||
                   to == kConversationStateStarting;

        default:
            return false;
    }
}

int ConversationStateMachine::addStateChangeListener(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(callback));
    return id;
}

void ConversationStateMachine::removeStateChangeListener(int listener_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [listener_id](const auto& pair) {
                           return pair.first == listener_id;
                       }),
        listeners_.end());
}

void ConversationStateMachine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_state_.store(kConversationStateIdle);
}
