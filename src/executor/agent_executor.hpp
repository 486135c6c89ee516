/**
 * @file agent_executor.hpp
 * @brief The seam between the orchestrator and whatever actually performs
 *        a task.
 */

#pragma once

#include "core/task.hpp"
#include "core/types.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace task_swarm {

struct ExecutionResult {
    TaskId task_id;
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    Duration duration{0};
};

/**
 * @brief Runs one task to completion.
 *
 * Implementations are called concurrently from pool threads and should
 * return promptly once @p stop is requested. Throwing is allowed; the
 * orchestrator turns an exception into a failed result.
 */
class IAgentExecutor {
public:
    virtual ~IAgentExecutor() = default;

    virtual ExecutionResult execute(const Task& task, std::stop_token stop) = 0;
};

/**
 * @brief Adapts any callable to IAgentExecutor.
 */
class CallbackAgentExecutor final : public IAgentExecutor {
public:
    using Callback = std::function<ExecutionResult(const Task&, std::stop_token)>;

    explicit CallbackAgentExecutor(Callback callback);

    ExecutionResult execute(const Task& task, std::stop_token stop) override;

private:
    Callback callback_;
};

}  // namespace task_swarm
