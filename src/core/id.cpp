/**
 * @file id.cpp
 * @brief Task id generation.
 */

#include "core/id.hpp"

#include <chrono>
#include <cstdio>
#include <random>

namespace task_swarm {

TaskId generate_task_id() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    thread_local std::uniform_int_distribution<uint64_t> dis;

    const auto now_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    const uint64_t hi = dis(gen);
    const uint64_t lo = dis(gen);

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>((now_ms >> 16) & 0xffffffffULL),
                  static_cast<unsigned>(now_ms & 0xffffULL),
                  static_cast<unsigned>(0x7000 | (hi & 0x0fffULL)),
                  static_cast<unsigned>(0x8000 | ((hi >> 12) & 0x3fffULL)),
                  static_cast<unsigned long long>(lo & 0xffffffffffffULL));
    return TaskId{buf};
}

}  // namespace task_swarm
