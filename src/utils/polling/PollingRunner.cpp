#include "PollingRunner.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <thread>

namespace utils
{

const char* ToString(PollingResult::Status status)
{
    switch (status)
    {
    case PollingResult::Status::Matched:
        return "matched";
    case PollingResult::Status::Timeout:
        return "timeout";
    case PollingResult::Status::Canceled:
        return "canceled";
    case PollingResult::Status::Error:
        return "error";
    }
    return "unknown";
}

PollingResult PollingRunner::Run(IPollingTask& task, const std::atomic<bool>& cancel_token) const
{
    using Clock = std::chrono::steady_clock;

    PollingResult result;
    TickContext ctx;
    ctx.start_time = Clock::now();
    Clock::time_point due = ctx.start_time;

    for (;;)
    {
        if (cancel_token.load())
        {
            result.status = PollingResult::Status::Canceled;
            break;
        }

        const PollingSchedule schedule = task.Schedule();
        ctx.now = Clock::now();

        if (schedule.timeout && ctx.now - ctx.start_time >= *schedule.timeout)
        {
            result.status = PollingResult::Status::Timeout;
            break;
        }

        if (ctx.now < due)
        {
            std::this_thread::sleep_for(std::min<Clock::duration>(due - ctx.now, kCancelCheckSlice));
            continue;
        }

        TaskDecision decision = task.Evaluate(ctx);
        ++ctx.tick_count;
        // The interval may change between ticks; each deadline builds on the previous one
        due += schedule.interval;
        if (due <= ctx.now)
            due = ctx.now + schedule.interval;

        if (decision.status == TaskDecision::Status::Error)
        {
            result.status = PollingResult::Status::Error;
            result.error_message = std::move(decision.error_message);
            break;
        }
        if (decision.status == TaskDecision::Status::Match && schedule.mode == TerminationMode::FirstMatch)
        {
            result.status = PollingResult::Status::Matched;
            break;
        }
    }

    result.ticks = ctx.tick_count;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - ctx.start_time);
    PLOG_DEBUG << task.Name() << " finished: " << ToString(result.status) << " after " << result.ticks << " ticks";
    return result;
}

} // namespace utils
