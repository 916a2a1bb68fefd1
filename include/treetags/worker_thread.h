#pragma once

#include <cstddef>
#include <functional>

namespace treetags {

inline constexpr std::size_t kWorkerStackMultiplier = 8;
inline constexpr std::size_t kFallbackStackSize = 8 * 1024 * 1024;

// Stack size the platform gives a new thread, or kFallbackStackSize when it
// reports none.
std::size_t DefaultThreadStackSize();
std::size_t WorkerStackSize();

// Runs body(worker_index) on count POSIX threads created with
// WorkerStackSize() bytes of stack and joins them. An exception escaping a
// body is rethrown here after every thread has finished.
void RunOnWorkerThreads(std::size_t count,
                        const std::function<void(std::size_t)> &body);

} // namespace treetags
