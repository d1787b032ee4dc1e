#pragma once

#include "governor/collaborators.hpp"

#include <cstdint>
#include <string>

namespace framegov {

// Resident set size of the current process, read from /proc/self/statm.
class ProcessMemoryProbe : public MemoryProbe {
public:
    void currentUsageBytes(UsageCallback done) override;

    static bool readResidentBytes(uint64_t& out_bytes, std::string& error);
};

// Returns free heap pages to the OS with malloc_trim where glibc provides it.
class MallocTrimReclaimer : public MemoryReclaimer {
public:
    bool reclaim(std::string& error) override;

    uint64_t invocations() const { return invocations_; }

private:
    uint64_t invocations_{0};
};

}  // namespace framegov
