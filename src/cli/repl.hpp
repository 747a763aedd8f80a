#pragma once

#include <functional>
#include <istream>
#include <ostream>
#include <string>

#include "agent/agent_loop.hpp"
#include "utils/logging.hpp"

namespace clerk::cli {

// "exit" or "quit" in any case, after trimming.
bool IsExitCommand(const std::string& line);

void PrintBanner(std::ostream& out);

// Reads user lines from `in` until exit/quit, end of input or `interrupted()`
// turning true, printing each turn's reply to `out`. Blank lines are skipped.
// Returns the process exit status.
int RunRepl(
    clerk::agent::AgentLoop& agent,
    clerk::utils::Logger& logger,
    std::istream& in,
    std::ostream& out,
    const std::function<bool()>& interrupted = {});

}  // namespace clerk::cli
