#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace utils
{

enum class TerminationMode
{
    FirstMatch, // stop on the first Match decision
    Continuous  // keep ticking until canceled, timed out or failed
};

// Read by the runner before every tick, so a task may change it between ticks
struct PollingSchedule
{
    std::chrono::milliseconds interval{ 1000 };
    std::optional<std::chrono::milliseconds> timeout;
    TerminationMode mode = TerminationMode::Continuous;
};

struct TickContext
{
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point now;
    size_t tick_count = 0;
};

struct TaskDecision
{
    enum class Status
    {
        Continue,
        Match,
        Error
    };

    Status status = Status::Continue;
    std::string error_message;

    static TaskDecision Continue() { return {}; }
    static TaskDecision Match() { return { Status::Match, {} }; }
    static TaskDecision Error(std::string message) { return { Status::Error, std::move(message) }; }
};

class IPollingTask
{
public:
    virtual ~IPollingTask() = default;

    virtual std::string_view Name() const = 0;
    virtual PollingSchedule Schedule() const = 0;
    virtual TaskDecision Evaluate(const TickContext& ctx) = 0;
};

} // namespace utils
