/**
 * @file id.hpp
 * @brief Task id generation.
 */

#pragma once

#include "core/types.hpp"

namespace task_swarm {

/// Time-ordered, UUID-shaped id: 48-bit millisecond timestamp followed by
/// 80 random bits, formatted 8-4-4-4-12.
[[nodiscard]] TaskId generate_task_id();

}  // namespace task_swarm
