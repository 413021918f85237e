#include "platform/linux/procfs.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <string>

namespace procfs {

std::optional<ProcStat> read_stat(int pid) {
    if (pid <= 0) return std::nullopt;

    std::ifstream f(std::format("/proc/{}/stat", pid));
    if (!f.is_open()) return std::nullopt;
    std::string line;
    std::getline(f, line);

    // comm (field 2) is parenthesised and may contain spaces; fields after
    // the last ')' are space separated, starting with state (field 3).
    auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos) return std::nullopt;

    std::istringstream rest(line.substr(close_paren + 1));
    ProcStat st;
    rest >> st.state;

    // Skip fields 4..21 to reach starttime (field 22).
    std::string skip;
    for (int field = 4; field <= 21; field++) {
        if (!(rest >> skip)) return std::nullopt;
    }
    if (!(rest >> st.start_time)) return std::nullopt;
    return st;
}

} // namespace procfs
