#pragma once

#include "daemon/process_handle.hpp"

#include <chrono>
#include <mutex>
#include <optional>

/// The one record of "is a worker alive, and since when".
/// worker and started_at are only touched with mutex held, and are always
/// both set or both empty.
struct SupervisorState {
    std::mutex mutex;
    std::optional<ProcessHandle> worker;
    std::optional<std::chrono::steady_clock::time_point> started_at;
};
