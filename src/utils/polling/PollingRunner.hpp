#pragma once

#include "PollingTask.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace utils
{

struct PollingResult
{
    enum class Status
    {
        Matched,
        Timeout,
        Canceled,
        Error
    };

    Status status = Status::Canceled;
    std::string error_message;
    size_t ticks = 0;
    std::chrono::milliseconds elapsed{ 0 };
};

const char* ToString(PollingResult::Status status);

/**
 * @brief Drives an IPollingTask on the calling thread.
 *
 * Tick n is due at start + n * interval, so a slow Evaluate() does not shift the schedule.
 * Waits are sliced so a cancel request is noticed within kCancelCheckSlice.
 */
class PollingRunner
{
public:
    static constexpr std::chrono::milliseconds kCancelCheckSlice{ 50 };

    PollingResult Run(IPollingTask& task, const std::atomic<bool>& cancel_token) const;
};

} // namespace utils
