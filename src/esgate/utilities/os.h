#ifndef ESGATE_UTILITIES_OS_H
#define ESGATE_UTILITIES_OS_H

// This file defines queries about the machine we're running on.

namespace esgate {

// Get the number of CPUs available to this process (at least 1).
int
detect_cpu_count();

} // namespace esgate

#endif
