/**
 * @file agent_executor.cpp
 * @brief CallbackAgentExecutor implementation.
 */

#include "executor/agent_executor.hpp"

#include <chrono>
#include <stdexcept>

namespace task_swarm {

CallbackAgentExecutor::CallbackAgentExecutor(Callback callback)
    : callback_(std::move(callback)) {
    if (!callback_) {
        throw std::invalid_argument("CallbackAgentExecutor requires a callable");
    }
}

ExecutionResult CallbackAgentExecutor::execute(const Task& task, std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    auto result = callback_(task, stop);

    result.task_id = task.id;
    if (result.duration == Duration{0}) {
        result.duration = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start);
    }
    return result;
}

}  // namespace task_swarm
