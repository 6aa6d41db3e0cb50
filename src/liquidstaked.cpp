// LIQUIDSTAKE Daemon - Main Entry Point
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// liquidstaked hosts one liquid staking pool on a simulated ledger and
// validator, serves the pool's entry points over JSON-RPC and keeps its
// state in LevelDB (or in memory with -dbbackend=memory).

#include "liquidstake/core/hex.h"
#include "liquidstake/core/types.h"
#include "liquidstake/db/leveldb.h"
#include "liquidstake/db/memorydb.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/rpc/commands.h"
#include "liquidstake/rpc/server.h"
#include "liquidstake/staking/liquid_staking.h"
#include "liquidstake/staking/validator_service.h"
#include "liquidstake/store/state_store.h"
#include "liquidstake/util/config.h"
#include "liquidstake/util/logging.h"
#include "liquidstake/util/time.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace liquidstake {

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "LIQUIDSTAKE Daemon";

constexpr const char* DATADIR_NAME = ".liquidstake";
constexpr const char* CONFIG_FILENAME = "liquidstake.conf";
constexpr const char* LOG_FILENAME = "debug.log";
constexpr const char* STATE_DIRNAME = "state";
constexpr const char* COOKIE_FILENAME = ".cookie";
constexpr uint16_t DEFAULT_RPC_PORT = 8645;
constexpr int DEFAULT_DB_CACHE_MB = 8;

struct DaemonConfig {
    std::filesystem::path dataDir;

    std::string rpcBind{"127.0.0.1"};
    uint16_t rpcPort{DEFAULT_RPC_PORT};
    std::string rpcUser;
    std::string rpcPassword;

    bool memoryBackend{false};
    int dbCacheMb{DEFAULT_DB_CACHE_MB};

    staking::ServiceConfig service;
    /// Initializes the pool on first start when set
    std::optional<ValidatorId> bootstrapValidator;
    std::vector<Byte> bootstrapOperator;

    std::string logLevel{"info"};
    std::string logFile;
    bool printToConsole{true};
};

std::atomic<bool> g_stopRequested{false};

void OnTerminate(int) {
    g_stopRequested.store(true);
}

std::filesystem::path DefaultDataDir() {
    std::string home = util::ConfigManager::ExpandTilde("~");
    return std::filesystem::path(home == "~" ? "." : home) / DATADIR_NAME;
}

struct HelpLine {
    const char* option;
    const char* text;
};

const HelpLine HELP[] = {
    {nullptr, "Options"},
    {"-help", "Show this help message"},
    {"-version", "Show version information"},
    {"-conf=FILE", "Config file (default: <datadir>/liquidstake.conf)"},
    {"-datadir=DIR", "Data directory (default: ~/.liquidstake)"},
    {nullptr, "RPC"},
    {"-rpcbind=ADDR", "Bind address (default: 127.0.0.1)"},
    {"-rpcport=PORT", "Port (default: 8645)"},
    {"-rpcuser=USER", "User name (default: cookie authentication)"},
    {"-rpcpassword=PASS", "Password"},
    {nullptr, "Storage"},
    {"-dbbackend=leveldb|memory", "State database (default: leveldb)"},
    {"-dbcache=MB", "LevelDB block cache (default: 8)"},
    {nullptr, "Pool"},
    {"-admin=ADDR", "Pool administrator (required)"},
    {"-validator=ADDR", "Initialize the pool with this validator on first start"},
    {"-validatoroperator=HEX", "Operator key of that validator"},
    {"-rewardinterval=SECONDS", "Reward claim interval (default: 86400, min: 3600)"},
    {"-mevrecipient=ADDR", "MEV share recipient (default: admin)"},
    {"-treasury=ADDR", "Protocol fee recipient (default: admin)"},
    {nullptr, "Logging"},
    {"-loglevel=LEVEL", "trace, debug, info, warn or error (default: info)"},
    {"-logfile=FILE", "Log file (default: <datadir>/debug.log)"},
    {"-printtoconsole=0|1", "Log to stdout (default: 1)"},
};

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\nUsage: liquidstaked [options]\n";
    for (const HelpLine& line : HELP) {
        if (line.option == nullptr) {
            std::cout << "\n" << line.text << ":\n";
        } else {
            std::cout << "  " << util::FixedWidth(line.option, 27) << line.text << "\n";
        }
    }
}

std::optional<Address> ReadAddress(const util::ConfigManager& cfg, const char* key) {
    std::string hex = cfg.GetString(key, "");
    if (hex.empty()) {
        return std::nullopt;
    }
    try {
        return Address::FromHex(hex);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error(std::string("-") + key + " is not an address: " + hex);
    }
}

/// Fill config from settings; throws std::runtime_error on a bad value
void ReadSettings(const util::ConfigManager& cfg, DaemonConfig& config) {
    namespace keys = util::ConfigKeys;

    config.rpcBind = cfg.GetString(keys::RPCBIND, config.rpcBind);
    int64_t port = cfg.GetInt(keys::RPCPORT, DEFAULT_RPC_PORT);
    if (port < 1 || port > 65535) {
        throw std::runtime_error("-rpcport out of range: " + std::to_string(port));
    }
    config.rpcPort = static_cast<uint16_t>(port);
    config.rpcUser = cfg.GetString(keys::RPCUSER, "");
    config.rpcPassword = cfg.GetString(keys::RPCPASSWORD, "");

    std::string backend = cfg.GetString(keys::DBBACKEND, "leveldb");
    if (backend != "leveldb" && backend != "memory") {
        throw std::runtime_error("-dbbackend must be leveldb or memory, not " + backend);
    }
    config.memoryBackend = backend == "memory";
    config.dbCacheMb = static_cast<int>(cfg.GetInt(keys::DBCACHE, DEFAULT_DB_CACHE_MB));

    std::optional<Address> admin = ReadAddress(cfg, keys::ADMIN);
    if (!admin) {
        throw std::runtime_error("-admin=<address> is required");
    }
    config.service.admin = *admin;
    config.service.rewardClaimInterval =
        cfg.GetInt(keys::REWARDINTERVAL, staking::DEFAULT_REWARD_CLAIM_INTERVAL);
    config.service.mevRecipient = ReadAddress(cfg, keys::MEVRECIPIENT);
    config.service.treasury = ReadAddress(cfg, keys::TREASURY);

    config.bootstrapValidator = ReadAddress(cfg, keys::VALIDATOR);
    std::string operatorHex = cfg.GetString(keys::VALIDATOROPERATOR, "");
    if (!operatorHex.empty() && !IsValidHex(operatorHex)) {
        throw std::runtime_error("-validatoroperator is not hex: " + operatorHex);
    }
    config.bootstrapOperator = HexToBytes(operatorHex);

    config.logLevel = cfg.GetString(keys::LOGLEVEL, config.logLevel);
    config.logFile = cfg.GetPath(keys::LOGFILE, (config.dataDir / LOG_FILENAME).string());
    config.printToConsole = cfg.GetBool(keys::PRINTTOCONSOLE, true);
}

/// @return exit code when the process should stop here
std::optional<int> LoadConfiguration(int argc, char* argv[], DaemonConfig& config) {
    util::ConfigManager cfg;
    util::ConfigParseResult parsed = cfg.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.Describe() << "\n";
        return 1;
    }
    if (cfg.GetBool("help", false) || cfg.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (cfg.GetBool("version", false)) {
        std::cout << CLIENT_NAME << " v" << VERSION << "\n";
        return 0;
    }

    config.dataDir = cfg.GetPath(util::ConfigKeys::DATADIR, DefaultDataDir().string());
    std::error_code ec;
    std::filesystem::create_directories(config.dataDir, ec);
    if (ec || !std::filesystem::is_directory(config.dataDir)) {
        std::cerr << "Error: cannot use data directory " << config.dataDir.string() << "\n";
        return 1;
    }

    std::string confPath =
        cfg.GetPath(util::ConfigKeys::CONF, (config.dataDir / CONFIG_FILENAME).string());
    if (std::filesystem::exists(confPath, ec)) {
        parsed = cfg.ParseFile(confPath);
        if (!parsed.success) {
            std::cerr << "Error in config file: " << parsed.Describe() << "\n";
            return 1;
        }
    }

    try {
        ReadSettings(cfg, config);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return std::nullopt;
}

void ConfigureLogging(const DaemonConfig& config) {
    util::Logger& logger = util::Logger::Instance();
    logger.ClearSinks();
    util::LogLevel level = util::LogLevelFromString(config.logLevel);
    logger.SetLevel(std::min(level, util::LogLevel::Debug));

    if (config.printToConsole) {
        util::ConsoleSink::Config console;
        console.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(console));
    }
    if (!config.logFile.empty()) {
        util::FileSink::Config file;
        file.path = config.logFile;
        file.level = util::LogLevel::Debug;
        auto sink = std::make_shared<util::FileSink>(file);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            std::cerr << "Warning: cannot open log file " << config.logFile << "\n";
        }
    }
}

// ============================================================================
// Daemon
// ============================================================================

/// Owns every component; members are torn down in reverse order of start
class Daemon {
public:
    explicit Daemon(const DaemonConfig& config) : config_(config) {}

    ~Daemon() { Stop(); }

    bool Start() {
        return OpenDatabase() && LoadPool() && StartRPC();
    }

    void Run() {
        while (!g_stopRequested.load()) {
            util::SleepInterruptible(std::chrono::seconds(1), g_stopRequested);
        }
    }

    void Stop() {
        if (server_) {
            LOG_INFO(util::LogCategory::RPC) << "Stopping RPC server";
            server_->Stop();
            server_.reset();
        }
        commands_.reset();

        if (loaded_) {
            db::Status status = store_->Commit(*service_, *ledger_, *validator_);
            if (!status.ok()) {
                LOG_ERROR(util::LogCategory::DB) << "Final commit failed: " << status.ToString();
            }
            loaded_ = false;
        }
        service_.reset();
        validator_.reset();
        ledger_.reset();
        store_.reset();
        database_.reset();
    }

private:
    bool OpenDatabase() {
        if (config_.memoryBackend) {
            LOG_WARN(util::LogCategory::DB) << "In-memory state is lost on exit";
            database_ = std::make_unique<db::MemoryDatabase>();
            return true;
        }

        db::OpenOptions options;
        options.cacheSize = static_cast<size_t>(config_.dbCacheMb) << 20;
        std::filesystem::path path = config_.dataDir / STATE_DIRNAME;
        std::unique_ptr<db::LevelDBDatabase> opened;
        db::Status status = db::LevelDBDatabase::Open(path, options, &opened);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Cannot open " << path.string() << ": "
                                             << status.ToString();
            return false;
        }
        database_ = std::move(opened);
        return true;
    }

    bool LoadPool() {
        ledger_ = std::make_unique<ledger::InMemoryLedger>();
        validator_ = std::make_unique<staking::SimulatedValidator>(
            *ledger_, staking::SimulatedValidator::DefaultReserveAccount());
        service_ = std::make_unique<staking::LiquidStakingService>(config_.service, *ledger_,
                                                                   *validator_);
        store_ = std::make_unique<store::StateStore>(*database_);

        db::Status status = store_->Load(*service_, *ledger_, *validator_);
        if (status.IsNotFound()) {
            LOG_INFO(util::LogCategory::DB) << "No stored state, starting empty";
        } else if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Cannot load stored state: " << status.ToString();
            return false;
        }
        loaded_ = true;

        if (!service_->IsInitialized() && config_.bootstrapValidator) {
            Status init = service_->Initialize(config_.service.admin,
                                               *config_.bootstrapValidator,
                                               config_.bootstrapOperator);
            if (!init.ok()) {
                LOG_ERROR(util::LogCategory::STAKING) << "Pool bootstrap failed: "
                                                      << init.ToString();
                return false;
            }
            db::Status committed = store_->Commit(*service_, *ledger_, *validator_);
            if (!committed.ok()) {
                LOG_ERROR(util::LogCategory::DB) << "Cannot store bootstrapped pool: "
                                                 << committed.ToString();
                return false;
            }
        }

        if (service_->IsInitialized()) {
            LOG_INFO(util::LogCategory::STAKING) << "Pool ready";
        } else {
            LOG_INFO(util::LogCategory::STAKING) << "Pool not initialized, waiting for the "
                                                 << "administrator to call initialize";
        }
        return true;
    }

    bool StartRPC() {
        rpc::RPCServerConfig rpcConfig;
        rpcConfig.bindAddress = config_.rpcBind;
        rpcConfig.port = config_.rpcPort;
        rpcConfig.rpcUser = config_.rpcUser;
        rpcConfig.rpcPassword = config_.rpcPassword;

        if (rpcConfig.rpcUser.empty()) {
            std::string cookie = (config_.dataDir / COOKIE_FILENAME).string();
            std::optional<std::string> password = rpc::GenerateRPCCookie(cookie);
            if (!password) {
                LOG_ERROR(util::LogCategory::RPC) << "Cannot write cookie file " << cookie;
                return false;
            }
            rpcConfig.rpcUser = "__cookie__";
            rpcConfig.rpcPassword = *password;
        }

        server_ = std::make_unique<rpc::RPCServer>(rpcConfig);
        commands_ = std::make_unique<rpc::RPCCommandTable>(*service_, *ledger_, *validator_,
                                                           store_.get());
        commands_->SetShutdownCallback([] { g_stopRequested.store(true); });
        commands_->RegisterCommands(*server_);

        std::string endpoint = config_.rpcBind + ":" + std::to_string(config_.rpcPort);
        if (!server_->Start()) {
            LOG_ERROR(util::LogCategory::RPC) << "Cannot listen on " << endpoint;
            return false;
        }
        LOG_INFO(util::LogCategory::RPC) << "JSON-RPC on " << endpoint;
        return true;
    }

    const DaemonConfig& config_;
    std::unique_ptr<db::Database> database_;
    std::unique_ptr<store::StateStore> store_;
    std::unique_ptr<ledger::InMemoryLedger> ledger_;
    std::unique_ptr<staking::SimulatedValidator> validator_;
    std::unique_ptr<staking::LiquidStakingService> service_;
    std::unique_ptr<rpc::RPCCommandTable> commands_;
    std::unique_ptr<rpc::RPCServer> server_;
    bool loaded_{false};
};

int Run(int argc, char* argv[]) {
    DaemonConfig config;
    if (std::optional<int> exitCode = LoadConfiguration(argc, argv, config)) {
        return *exitCode;
    }

    ConfigureLogging(config);
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION
                                         << ", data in " << config.dataDir.string()
                                         << ", admin " << config.service.admin.ToHex();

    std::signal(SIGINT, OnTerminate);
    std::signal(SIGTERM, OnTerminate);
    std::signal(SIGPIPE, SIG_IGN);

    int exitCode = 0;
    {
        Daemon daemon(config);
        if (daemon.Start()) {
            daemon.Run();
        } else {
            exitCode = 1;
        }
        LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down";
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Stopped";
    util::Logger::Instance().Shutdown();
    return exitCode;
}

} // namespace

} // namespace liquidstake

int main(int argc, char* argv[]) {
    try {
        return liquidstake::Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
