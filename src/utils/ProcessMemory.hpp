#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace utils
{

// Footprint probe and reduction hooks for the current process
class IProcessMemory
{
public:
    virtual ~IProcessMemory() = default;

    // Resident set size in MiB, nullopt when it cannot be sampled
    virtual std::optional<int64_t> WorkingSetMB() = 0;

    // Hand free heap back to the OS; aggressive releases without keeping a pad
    virtual void Collect(bool aggressive) = 0;

    // Release every free page the allocator holds
    virtual void EmptyWorkingSet() = 0;
};

class LinuxProcessMemory : public IProcessMemory
{
public:
    // Top-of-heap slack kept by a non-aggressive Collect()
    static constexpr size_t kCollectPadBytes = 4 * 1024 * 1024;

    std::optional<int64_t> WorkingSetMB() override;
    void Collect(bool aggressive) override;
    void EmptyWorkingSet() override;
};

std::unique_ptr<IProcessMemory> CreatePlatformProcessMemory();

} // namespace utils
