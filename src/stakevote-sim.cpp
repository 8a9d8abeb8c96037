// STAKEVOTE Simulator - Main Entry Point
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// stakevote-sim runs a voting scenario script against the reference ledger
// and the voting engine. It provides:
// - Configuration from stakevote.conf and the command line
// - Console and file logging
// - Optional persistence of engine and ledger state in the datadir
// - Event output for every committed engine operation

#include <stakevote/core/types.h>
#include <stakevote/ledger/ledger.h>
#include <stakevote/sim/scenario.h>
#include <stakevote/util/config.h>
#include <stakevote/util/logging.h>
#include <stakevote/util/time.h>
#include <stakevote/voting/engine.h>
#include <stakevote/voting/store.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

namespace stakevote {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "STAKEVOTE Simulator";

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: stakevote-sim [options] <scenario-file|->\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  --conf=FILE                Config file path (default: <datadir>/stakevote.conf)\n";
    std::cout << "  --datadir=DIR              Data directory path (default: ~/.stakevote)\n";
    std::cout << "  --time=T                   Initial clock, unix seconds or ISO 8601 (default: now)\n";
    std::cout << "\nEngine Options:\n";
    std::cout << "  --engine.admin=HEX         Admin address (required)\n";
    std::cout << "  --engine.custody=HEX       Custody account (required)\n";
    std::cout << "  --engine.persist=0/1       Keep state in the datadir (default: 1)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  --debug=CATEGORIES         Comma list: voting,ledger,db,config,sim (default: all)\n";
    std::cout << "  --loglevel=LEVEL           Log level: trace, debug, info, warn, error\n";
    std::cout << "  --printtoconsole=0/1       Print log to console (default: 1)\n";
    std::cout << "  --logfile=NAME             Log file inside datadir, empty disables\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 STAKEVOTE Developers\n";
    std::cout << "MIT License\n";
}

/// Merge the config file under the command-line options
bool LoadConfigFile(util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    const bool explicitConf = config.HasKey(CONF);
    std::filesystem::path confPath = config.GetPath(CONF);
    if (confPath.empty()) {
        confPath = std::filesystem::path(config.GetDataDir()) / util::DEFAULT_CONFIG_FILENAME;
    }

    std::error_code ec;
    if (!std::filesystem::exists(confPath, ec)) {
        if (explicitConf) {
            std::cerr << "Error: config file not found: " << confPath.string() << "\n";
            return false;
        }
        return true;
    }

    util::ConfigParseResult result = config.ParseFile(confPath.string(), false);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }
    for (const auto& warning : result.warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
    return true;
}

// ============================================================================
// Initialization
// ============================================================================

bool SetupLogging(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevel::Info;
    std::string levelName = config.GetString(LOGLEVEL, "info");
    if (!util::ParseLogLevel(levelName, level)) {
        std::cerr << "Error: unknown log level: " << levelName << "\n";
        return false;
    }
    logger.SetLevel(level);

    if (config.GetBool(PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useColors = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetString(LOGFILE, util::DEFAULT_LOG_FILENAME);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = (std::filesystem::path(config.GetDataDir()) / logFile).string();
        fileConfig.level = util::LogLevel::Debug;  // Always log debug to file
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << fileConfig.path << "\n";
        }
    }

    logger.EnableCategories(config.GetString(DEBUG, "all"));
    return true;
}

bool InitializeDataDir(const std::string& dataDir) {
    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec && !std::filesystem::is_directory(dataDir)) {
        std::cerr << "Error: Cannot create data directory: " << dataDir
                  << " (" << ec.message() << ")\n";
        return false;
    }
    return true;
}

/// Open the state store and load the voting state and the ledger from it
std::shared_ptr<voting::VotingStore> OpenStore(const std::string& dataDir,
                                               voting::VotingState& state,
                                               ledger::TokenLedger& ledger) {
    auto [status, store] = voting::VotingStore::Open(std::filesystem::path(dataDir) / "state");
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open state store: " << status.ToString();
        return nullptr;
    }

    status = store->Load(state);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot load voting state: " << status.ToString();
        return nullptr;
    }
    ledger::LedgerSnapshot snapshot;
    status = store->LoadLedger(snapshot);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot load ledger: " << status.ToString();
        return nullptr;
    }

    ledger.Restore(snapshot);
    return std::shared_ptr<voting::VotingStore>(std::move(store));
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    using namespace util::ConfigKeys;

    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    if (config.HasKey("help") || config.HasKey("h")) {
        PrintHelp();
        return 0;
    }
    if (config.HasKey("version") || config.HasKey("v")) {
        PrintVersion();
        return 0;
    }
    if (config.GetPositionalArgs().size() != 1) {
        PrintHelp();
        return 1;
    }

    const std::string dataDir = config.GetDataDir();
    if (!InitializeDataDir(dataDir) || !LoadConfigFile(config) || !SetupLogging(config)) {
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";
    LOG_INFO(util::LogCategory::DEFAULT) << "Data directory: " << dataDir;

    std::string error;
    auto engineConfig = voting::LoadEngineConfig(config, &error);
    if (!engineConfig) {
        LOG_ERROR(util::LogCategory::CONFIG) << error;
        return 1;
    }

    Timestamp start = util::GetTime();
    if (config.HasKey("time")) {
        const std::string value = config.GetString("time", "");
        auto parsedTime = util::ParseISO8601(value);
        auto seconds = config.TryGetInt("time");
        if (seconds) {
            start = *seconds;
        } else if (parsedTime) {
            start = *parsedTime;
        } else {
            LOG_ERROR(util::LogCategory::CONFIG) << "Invalid --time value: " << value;
            return 1;
        }
    }

    auto ledger = std::make_shared<ledger::TokenLedger>(engineConfig->custody);
    std::shared_ptr<voting::VotingStore> store;
    voting::VotingState state;

    if (engineConfig->persist) {
        store = OpenStore(dataDir, state, *ledger);
        if (!store) {
            return 1;
        }
    }

    auto engine = std::make_shared<voting::VotingEngine>(engineConfig->admin, ledger, store);
    if (!engine->Restore(state)) {
        return 1;
    }

    engine->Subscribe([](const voting::VotingEvent& event) {
        std::cout << "event: " << event.ToString() << "\n";
    });

    sim::ScenarioRunner runner(ledger, engine, store, start);
    const std::string& script = config.GetPositionalArgs()[0];

    sim::RunResult result;
    if (script == "-") {
        result = runner.Run(std::cin, &std::cout);
    } else {
        result = runner.RunFile(script, &std::cout);
    }

    if (result.success) {
        LOG_INFO(util::LogCategory::SIM) << "Scenario passed: " << result.message;
    } else {
        LOG_ERROR(util::LogCategory::SIM) << "Scenario failed: " << result.message;
    }
    std::cout << (result.success ? "PASS" : "FAIL") << ": " << result.message << "\n";

    util::Logger::Instance().Flush();
    return result.success ? 0 : 1;
}

} // namespace stakevote

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return stakevote::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
