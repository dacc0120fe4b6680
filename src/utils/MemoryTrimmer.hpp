#pragma once

#include "ProcessMemory.hpp"
#include "polling/PollingTask.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace utils
{

struct MemoryTrimmerConfig
{
    bool enabled = true;
    std::chrono::milliseconds poll_interval{ 30000 };
    std::chrono::milliseconds min_trim_interval{ 60000 };
    int64_t medium_threshold_mb = 200;
    int64_t high_threshold_mb = 350;
    // Above the medium threshold, trim when usage grew by more than this factor since the last sample
    double growth_factor = 1.5;
    // A collect that frees less than this while still above the high threshold escalates
    int64_t min_gc_gain_mb = 20;
    std::chrono::milliseconds settle_delay{ 100 };
};

/**
 * @brief Background working-set trimmer.
 *
 * Samples the resident set every poll_interval on its own thread and asks the allocator to
 * return memory when usage is above the high threshold, or above the medium threshold after
 * a sudden growth. Trims are rate limited by min_trim_interval and never overlap; a manual
 * ReduceMemory() issued while one is running is skipped.
 *
 * Example:
 * @code
 * MemoryTrimmer trimmer(config, CreatePlatformProcessMemory());
 * trimmer.Start();
 * ...
 * trimmer.ReduceMemory(true); // e.g. after closing a large window
 * @endcode
 */
class MemoryTrimmer : public IPollingTask
{
public:
    using Clock = std::chrono::steady_clock;

    MemoryTrimmer(MemoryTrimmerConfig config, std::shared_ptr<IProcessMemory> memory);
    ~MemoryTrimmer() override;

    MemoryTrimmer(const MemoryTrimmer&) = delete;
    MemoryTrimmer& operator=(const MemoryTrimmer&) = delete;

    // Spawns the polling thread. Returns false if already running or disabled by config.
    bool Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

    // One threshold evaluation at the given time. Returns true if a trim was performed.
    bool CheckOnce(Clock::time_point now);

    // Manual trigger. Returns false when skipped because another trim is in progress.
    bool ReduceMemory(bool aggressive = false);

    void UpdateConfig(const MemoryTrimmerConfig& config);
    MemoryTrimmerConfig Config() const;

    int64_t LastWorkingSetMB() const;
    size_t TrimCount() const { return trim_count_.load(); }

    std::string_view Name() const override { return "MemoryTrimmer"; }
    PollingSchedule Schedule() const override;
    TaskDecision Evaluate(const TickContext& ctx) override;

private:
    bool PerformTrim(Clock::time_point now);
    void RecordTrim(Clock::time_point now);

    std::shared_ptr<IProcessMemory> memory_;

    mutable std::mutex mutex_;
    MemoryTrimmerConfig config_;
    int64_t last_working_set_mb_ = 0;
    std::optional<Clock::time_point> last_trim_time_;

    std::atomic<bool> trim_active_{ false };
    std::atomic<size_t> trim_count_{ 0 };

    std::atomic<bool> cancel_{ false };
    std::atomic<bool> running_{ false };
    std::thread worker_;
};

} // namespace utils
