#include "jobs/JobSystem.h"

#include <algorithm> // std::max

namespace geosphere::jobs {

namespace {
// hardware_concurrency() may report 0 on exotic platforms.
std::size_t WorkerThreads() noexcept
{
    return std::max<std::size_t>(1, JobSystem::Concurrency());
}
} // namespace

// -----------------------------------------------------------------------------
// Singleton boilerplate
// -----------------------------------------------------------------------------

JobSystem& JobSystem::Instance()
{
    static JobSystem instance;
    return instance;
}

JobSystem::JobSystem() : _executor(WorkerThreads()) {}

JobSystem::~JobSystem()
{
    _executor.wait_for_all();
}

} // namespace geosphere::jobs
