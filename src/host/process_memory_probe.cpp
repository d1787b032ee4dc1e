#include "host/process_memory_probe.hpp"

#include <fstream>

#ifdef __linux__
#include <malloc.h>
#include <unistd.h>
#endif

namespace framegov {

bool ProcessMemoryProbe::readResidentBytes(uint64_t& out_bytes, std::string& error) {
#ifdef __linux__
    std::ifstream ifs("/proc/self/statm");
    if (!ifs.is_open()) {
        error = "failed to open /proc/self/statm";
        return false;
    }
    unsigned long long size_pages = 0;
    unsigned long long resident_pages = 0;
    ifs >> size_pages >> resident_pages;
    if (ifs.fail()) {
        error = "failed to parse /proc/self/statm";
        return false;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        error = "sysconf(_SC_PAGESIZE) failed";
        return false;
    }
    out_bytes = static_cast<uint64_t>(resident_pages) * static_cast<uint64_t>(page_size);
    error.clear();
    return true;
#else
    (void)out_bytes;
    error = "process memory probe requires Linux";
    return false;
#endif
}

void ProcessMemoryProbe::currentUsageBytes(UsageCallback done) {
    uint64_t bytes = 0;
    std::string error;
    const bool ok = readResidentBytes(bytes, error);
    if (done) {
        done(ok, bytes, error);
    }
}

bool MallocTrimReclaimer::reclaim(std::string& error) {
    invocations_++;
#if defined(__linux__) && defined(__GLIBC__)
    (void)malloc_trim(0);
    error.clear();
    return true;
#else
    error = "malloc_trim unavailable on this platform";
    return false;
#endif
}

}  // namespace framegov
