#include <esgate/utilities/os.h>

#include <thread>

#include <sched.h>

namespace esgate {

int
detect_cpu_count()
{
    // Prefer the affinity mask, since containers and taskset can restrict us
    // to fewer CPUs than the machine has.
    cpu_set_t cpus;
    CPU_ZERO(&cpus);
    if (sched_getaffinity(0, sizeof(cpus), &cpus) == 0)
    {
        int count = CPU_COUNT(&cpus);
        if (count > 0)
            return count;
    }
    auto hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? int(hardware) : 1;
}

} // namespace esgate
