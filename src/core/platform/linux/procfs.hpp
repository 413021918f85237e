#pragma once

#include <cstdint>
#include <optional>

namespace procfs {

struct ProcStat {
    char state = '?';
    uint64_t start_time = 0;
};

// Parses /proc/<pid>/stat. Empty if the process does not exist.
std::optional<ProcStat> read_stat(int pid);

} // namespace procfs
