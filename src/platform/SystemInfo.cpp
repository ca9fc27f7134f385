#include "SystemInfo.hpp"

#include <plog/Log.h>

#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace platform
{

std::size_t DetectLogicalCores()
{
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores > 0)
        return cores;

#ifndef _WIN32
    long online = sysconf(_SC_NPROCESSORS_ONLN);
    if (online > 0)
        return static_cast<std::size_t>(online);
#endif

    return 0;
}

std::size_t ResolveWorkerCount(long long configured)
{
    if (configured > 0)
        return static_cast<std::size_t>(configured);

    std::size_t detected = DetectLogicalCores();
    if (detected == 0)
    {
        PLOG_WARNING << "Could not detect logical core count, using " << tasks::kDefaultWorkerCount << " workers";
        return tasks::kDefaultWorkerCount;
    }

    PLOG_DEBUG << "Detected " << detected << " logical cores";
    return detected;
}

} // namespace platform
