#include "ProcessMemory.hpp"

#include <plog/Log.h>

#include <fstream>
#include <malloc.h>
#include <unistd.h>

namespace utils
{

std::optional<int64_t> LinuxProcessMemory::WorkingSetMB()
{
    std::ifstream statm("/proc/self/statm");
    if (!statm)
    {
        PLOG_WARNING << "Failed to open /proc/self/statm";
        return std::nullopt;
    }

    // Fields are in pages: size resident shared text lib data dt
    int64_t size_pages = 0;
    int64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages))
    {
        PLOG_WARNING << "Unexpected /proc/self/statm format";
        return std::nullopt;
    }

    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0)
    {
        PLOG_WARNING << "sysconf(_SC_PAGESIZE) failed";
        return std::nullopt;
    }

    return resident_pages * static_cast<int64_t>(page_size) / (1024 * 1024);
}

void LinuxProcessMemory::Collect(bool aggressive)
{
    int released = malloc_trim(aggressive ? 0 : kCollectPadBytes);
    PLOG_DEBUG << "malloc_trim(" << (aggressive ? "0" : "pad") << ") released=" << released;
}

void LinuxProcessMemory::EmptyWorkingSet()
{
    int released = malloc_trim(0);
    PLOG_DEBUG << "EmptyWorkingSet released=" << released;
}

std::unique_ptr<IProcessMemory> CreatePlatformProcessMemory()
{
    return std::make_unique<LinuxProcessMemory>();
}

} // namespace utils
