#include "MemoryTrimmer.hpp"
#include "ErrorReporter.hpp"
#include "polling/PollingRunner.hpp"

#include <plog/Log.h>

#include <exception>

namespace utils
{

namespace
{

// Clears the in-progress flag on every exit path
class ActiveTrimGuard
{
public:
    explicit ActiveTrimGuard(std::atomic<bool>& flag)
        : flag_(flag)
    {
        bool expected = false;
        acquired_ = flag_.compare_exchange_strong(expected, true);
    }

    ~ActiveTrimGuard()
    {
        if (acquired_)
            flag_.store(false);
    }

    ActiveTrimGuard(const ActiveTrimGuard&) = delete;
    ActiveTrimGuard& operator=(const ActiveTrimGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::atomic<bool>& flag_;
    bool acquired_ = false;
};

} // namespace

MemoryTrimmer::MemoryTrimmer(MemoryTrimmerConfig config, std::shared_ptr<IProcessMemory> memory)
    : memory_(std::move(memory))
    , config_(config)
{
}

MemoryTrimmer::~MemoryTrimmer() { Stop(); }

bool MemoryTrimmer::Start()
{
    if (!memory_)
    {
        ErrorReporter::ReportError(ErrorCategory::Memory, "Memory trimmer has no process memory probe");
        return false;
    }

    if (!Config().enabled)
    {
        PLOG_INFO << "Memory trimmer disabled by configuration";
        return false;
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true))
        return false;

    cancel_.store(false);
    worker_ = std::thread([this]() {
        PollingRunner runner;
        auto result = runner.Run(*this, cancel_);
        if (result.status == PollingResult::Status::Error)
        {
            ErrorReporter::ReportError(ErrorCategory::Memory, "Memory trimmer stopped unexpectedly",
                                       result.error_message);
        }
        PLOG_DEBUG << "Memory trimmer loop exited after " << result.ticks << " ticks";
    });

    PLOG_INFO << "Memory trimmer started, interval " << Schedule().interval.count() << " ms";
    return true;
}

void MemoryTrimmer::Stop()
{
    cancel_.store(true);
    if (worker_.joinable())
    {
        worker_.join();
    }
    running_.store(false);
}

PollingSchedule MemoryTrimmer::Schedule() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return PollingSchedule{ config_.poll_interval, std::nullopt, TerminationMode::Continuous };
}

void MemoryTrimmer::UpdateConfig(const MemoryTrimmerConfig& config)
{
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

MemoryTrimmerConfig MemoryTrimmer::Config() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

int64_t MemoryTrimmer::LastWorkingSetMB() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_working_set_mb_;
}

TaskDecision MemoryTrimmer::Evaluate(const TickContext& ctx)
{
    try
    {
        CheckOnce(ctx.now);
    }
    catch (const std::exception& ex)
    {
        // A failed tick must not end the monitoring loop
        ErrorReporter::ReportError(ErrorCategory::Memory, "Memory check failed", ex.what());
    }
    return TaskDecision::Continue();
}

bool MemoryTrimmer::CheckOnce(Clock::time_point now)
{
    if (!memory_)
        return false;

    auto current = memory_->WorkingSetMB();
    if (!current)
        return false;

    bool needs_trim = false;
    bool interval_elapsed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const int64_t last = last_working_set_mb_;

        if (*current > config_.high_threshold_mb)
        {
            needs_trim = true;
        }
        else if (*current > config_.medium_threshold_mb && last > 0 &&
                 static_cast<double>(*current) > static_cast<double>(last) * config_.growth_factor)
        {
            needs_trim = true;
        }

        interval_elapsed = !last_trim_time_ || (now - *last_trim_time_) >= config_.min_trim_interval;
        last_working_set_mb_ = *current;
    }

    PLOG_VERBOSE << "Working set " << *current << " MB, needs_trim=" << needs_trim;

    if (!needs_trim || !interval_elapsed || trim_active_.load())
        return false;

    return PerformTrim(now);
}

bool MemoryTrimmer::PerformTrim(Clock::time_point now)
{
    ActiveTrimGuard guard(trim_active_);
    if (!guard.acquired())
        return false;

    const MemoryTrimmerConfig cfg = Config();

    auto before = memory_->WorkingSetMB();
    memory_->Collect(false);

    if (cfg.settle_delay.count() > 0)
        std::this_thread::sleep_for(cfg.settle_delay);
    auto after = memory_->WorkingSetMB();

    if (before && after && *after > cfg.high_threshold_mb && (*before - *after) < cfg.min_gc_gain_mb)
    {
        PLOG_INFO << "Collect freed " << (*before - *after) << " MB, emptying working set";
        memory_->EmptyWorkingSet();
        if (cfg.settle_delay.count() > 0)
            std::this_thread::sleep_for(cfg.settle_delay);
    }

    RecordTrim(now);
    PLOG_INFO << "Memory trimmed: " << before.value_or(-1) << " MB -> " << after.value_or(-1) << " MB";
    return true;
}

bool MemoryTrimmer::ReduceMemory(bool aggressive)
{
    if (!memory_)
        return false;

    ActiveTrimGuard guard(trim_active_);
    if (!guard.acquired())
    {
        PLOG_DEBUG << "ReduceMemory skipped, trim already in progress";
        return false;
    }

    try
    {
        if (aggressive)
        {
            memory_->Collect(true);
            memory_->Collect(true);
            memory_->EmptyWorkingSet();
        }
        else
        {
            memory_->Collect(false);
            memory_->EmptyWorkingSet();
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Memory, "Manual memory reduction failed", ex.what());
        return false;
    }

    RecordTrim(Clock::now());
    PLOG_INFO << "Manual memory reduction done (aggressive=" << aggressive << ")";
    return true;
}

void MemoryTrimmer::RecordTrim(Clock::time_point now)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_trim_time_ = now;
    }
    ++trim_count_;
}

} // namespace utils
