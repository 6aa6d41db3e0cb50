// LIQUIDSTAKE Reward Claimer - Main Entry Point
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Periodically claims validator rewards through liquidstaked on a cron
// schedule. Configuration comes from the environment (RPC_ENDPOINT,
// CONTRACT_ADDRESS, ADMIN_MNEMONIC, CLAIM_CRON_SCHEDULE, LOG_LEVEL, LOG_FILE),
// an optional config file and -key=value arguments.

#include "liquidstake/claimer/reward_claimer.h"
#include "liquidstake/util/config.h"
#include "liquidstake/util/logging.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace liquidstake {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "LIQUIDSTAKE Reward Claimer";

static std::atomic<bool> g_stop{false};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop.store(true);
    }
}

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: reward-claimer [options]\n\n";
    std::cout << "Options (environment variable in parentheses):\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -conf=FILE                 Optional config file\n";
    std::cout << "  -rpcendpoint=URL           Daemon endpoint (RPC_ENDPOINT, default: "
              << claimer::DEFAULT_RPC_ENDPOINT << ")\n";
    std::cout << "  -contractaddress=ADDR      Pool address (CONTRACT_ADDRESS)\n";
    std::cout << "  -adminmnemonic=WORDS       Admin mnemonic (ADMIN_MNEMONIC)\n";
    std::cout << "  -claimschedule=CRON        Claim schedule, UTC (CLAIM_CRON_SCHEDULE, default: \""
              << claimer::DEFAULT_CLAIM_SCHEDULE << "\")\n";
    std::cout << "  -rpcuser=USER              RPC username (RPC_USER)\n";
    std::cout << "  -rpcpassword=PASS          RPC password (RPC_PASSWORD)\n";
    std::cout << "  -loglevel=LEVEL            Log level (LOG_LEVEL, default: info)\n";
    std::cout << "  -logfile=FILE              Log file (LOG_FILE, default: "
              << claimer::DEFAULT_LOG_FILE << ")\n";
    std::cout << "\n";
}

void SetupLogging(const util::ConfigManager& cfg) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        cfg.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    logger.SetLevel(level);

    util::LogFormatOptions layout;
    layout.format = util::LogFormat::Compact;

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = level;
    consoleConfig.useStderr = true;
    consoleConfig.layout = layout;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    std::string logFile = cfg.GetPath(util::ConfigKeys::LOGFILE, claimer::DEFAULT_LOG_FILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.append = true;
        fileConfig.level = level;
        fileConfig.layout = layout;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (!fileSink->IsOpen()) {
            std::cerr << "Warning: cannot open log file " << logFile << "\n";
        } else {
            logger.AddSink(fileSink);
        }
    }
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager cfg;

    util::ConfigParseResult result = cfg.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.Describe() << "\n";
        return 1;
    }
    if (cfg.GetBool("help", false) || cfg.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }

    cfg.LoadEnvironment(claimer::ClaimerEnvironment());

    std::string confPath = cfg.GetPath(util::ConfigKeys::CONF, "");
    if (!confPath.empty()) {
        result = cfg.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error reading config file: " << result.Describe() << "\n";
            return 1;
        }
    }

    SetupLogging(cfg);

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    claimer::ClaimerConfig config = claimer::ClaimerConfig::FromConfig(cfg);
    std::unique_ptr<claimer::RewardClaimer> rewardClaimer;
    try {
        rewardClaimer = std::make_unique<claimer::RewardClaimer>(config);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::CLAIMER) << e.what();
        util::Logger::Instance().Shutdown();
        return 1;
    }

    LOG_INFO(util::LogCategory::CLAIMER) << "Claiming as " << rewardClaimer->AdminAddress().ToHex()
                                         << " via " << config.rpcEndpoint;

    rewardClaimer->Run(g_stop);

    util::Logger::Instance().Shutdown();
    return 0;
}

} // namespace liquidstake

int main(int argc, char* argv[]) {
    try {
        return liquidstake::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
