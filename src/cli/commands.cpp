#include <csignal>
#include <iostream>
#include <string>

#include "agent/agent_loop.hpp"
#include "agent/tools/tool_registry.hpp"
#include "cli/cli_args.hpp"
#include "cli/repl.hpp"
#include "config/config_loader.hpp"
#include "providers/llm_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

// No SA_RESTART, so a blocked read on stdin returns and the loop can exit.
void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

}  // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "clerk";
    const auto parsed = clerk::cli::ParseCliArgs(argc, argv);
    if (!parsed.ok) {
        std::cerr << "Error: " << parsed.error << "\n\n" << clerk::cli::Usage(program);
        return 2;
    }
    if (parsed.options.show_help) {
        std::cout << clerk::cli::Usage(program);
        return 0;
    }

    auto config = clerk::config::LoadConfig(parsed.options.config_path.value_or(""));
    clerk::cli::ApplyCliOverrides(parsed.options, config);
    if (config.provider.api_key.empty()) {
        std::cerr << "Error: provide an API key with --api-key or the ANTHROPIC_API_KEY environment variable"
                  << std::endl;
        return 1;
    }

    clerk::utils::LogConfig log_config{};
    log_config.path = config.logging.file;
    if (!clerk::utils::ParseLogLevel(config.logging.level, log_config.min_level)) {
        std::cerr << "[log] unknown level '" << config.logging.level << "', using INFO" << std::endl;
    }
    clerk::utils::Logger logger(log_config);
    if (!logger.IsOpen()) {
        std::cerr << "[log] could not open " << logger.Config().path << ", logging disabled" << std::endl;
    }

    auto provider = clerk::providers::CreateProvider(config, &logger);
    auto tools = clerk::agent::tools::BuildDefaultToolRegistry();
    clerk::agent::AgentLoop agent(*provider, tools, config.agent, logger);

    logger.Log({clerk::utils::LogLevel::kInfo,
                "Session started",
                {{"model", config.agent.model},
                 {"tools", clerk::utils::Join(tools.List(), ",")}}});

    InstallSignalHandlers();
    clerk::cli::PrintBanner(std::cout);
    return clerk::cli::RunRepl(agent, logger, std::cin, std::cout, [] { return g_signal != 0; });
}
