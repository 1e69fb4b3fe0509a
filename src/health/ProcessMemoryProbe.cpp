/**
 * ProcessMemoryProbe.cpp - Resident memory of this process (Linux)
 */

#include "gideon/health/HealthMonitor.hpp"

#include <fstream>
#include <iostream>
#include <malloc.h>
#include <unistd.h>

namespace gideon::health {

std::optional<std::size_t> ProcessMemoryProbe::residentBytes() {
    std::ifstream statm("/proc/self/statm");
    std::size_t total_pages = 0;
    std::size_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        std::cerr << "[HealthMonitor] Cannot read /proc/self/statm" << std::endl;
        return std::nullopt;
    }
    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return std::nullopt;
    }
    return resident_pages * static_cast<std::size_t>(page_size);
}

void ProcessMemoryProbe::reclaim() {
    malloc_trim(0);
}

} // namespace gideon::health
