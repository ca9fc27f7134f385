#pragma once

#include "../tasks/WorkerPool.hpp"

#include <cstddef>

namespace platform
{

// Number of logical cores the OS reports, or 0 if it cannot tell
std::size_t DetectLogicalCores();

// configured > 0 wins; otherwise detected cores, then tasks::kDefaultWorkerCount
std::size_t ResolveWorkerCount(long long configured);

} // namespace platform
