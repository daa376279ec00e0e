// FORESIGHT - Transition Replay Tool
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Applies a transition script (see foresight/market/replay.h) to a market
// store, prints each outcome and the final journal digest. With an on-disk
// store the reference ledger is kept beside the market state, so a later run
// continues where the previous one stopped.

#include "foresight/db/database.h"
#include "foresight/market/controller.h"
#include "foresight/market/ledger.h"
#include "foresight/market/params.h"
#include "foresight/market/replay.h"
#include "foresight/market/store.h"
#include "foresight/util/config.h"
#include "foresight/util/logging.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace foresight {

namespace {

const char* const STATE_DIRNAME = "market";

// ============================================================================
// Setup
// ============================================================================

void PrintUsage() {
    std::cout << "Usage: foresight-replay [options] <script>\n\n"
              << "Options:\n"
              << "  -datadir=<dir>        Data directory (default: ~/.foresight)\n"
              << "  -conf=<file>          Configuration file\n"
              << "  -memdb                Keep state in memory\n"
              << "  -dbcache=<n>          LevelDB block cache in MB\n"
              << "  -dbsync               fsync every committed transition\n"
              << "  -owner=<principal>    Market owner (hex or name)\n"
              << "  -minstake=<amount>    Minimum stake\n"
              << "  -feepercent=<n>       Protocol fee percentage\n"
              << "  -expectdigest=<hex>   Fail unless the final digest matches\n"
              << "  -loglevel=<level>     trace, debug, info, warn, error, off\n"
              << "  -debug=<categories>   Restrict logging to categories\n"
              << "  -printtoconsole       Log to the console\n"
              << "  -logfile=<path>       Log to a file\n"
              << "\nSample configuration:\n\n"
              << util::ConfigManager::GenerateSampleConfig();
}

bool SetupLogging(const util::ConfigManager& config) {
    util::LogSettings settings;
    settings.level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    settings.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);
    settings.logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    settings.categories = config.GetList(util::ConfigKeys::DEBUG);
    return util::ConfigureLogging(settings);
}

std::unique_ptr<db::Database> OpenState(const util::ConfigManager& config) {
    if (config.GetBool(util::ConfigKeys::MEMDB, false)) {
        LOG_INFO(util::LogCategory::REPLAY) << "Using in-memory state";
        return db::OpenMemoryDatabase();
    }

    std::filesystem::path dataDir = config.GetPath(util::ConfigKeys::DATADIR,
                                                   config.GetDataDir());
    std::filesystem::path statePath = dataDir / STATE_DIRNAME;

    db::Options options;
    options.block_cache_size = static_cast<size_t>(
        config.GetUInt(util::ConfigKeys::DBCACHE, 8)) * 1024 * 1024;

    auto [status, database] = db::OpenDatabase(statePath, options);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::REPLAY) << "Cannot open " << statePath.string() << ": "
                                             << status.ToString();
        return nullptr;
    }
    LOG_INFO(util::LogCategory::REPLAY) << "State directory: " << statePath.string();
    return std::move(database);
}

} // namespace

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager& config = util::GetConfig();

    auto configResult = util::InitConfig(argc, argv);
    if (!configResult.success) {
        std::cerr << "Error: " << configResult.Describe() << std::endl;
        return 1;
    }
    if (config.GetBool(util::ConfigKeys::HELP, false)) {
        PrintUsage();
        return 0;
    }

    if (!SetupLogging(config)) {
        std::cerr << "Error: cannot open log file "
                  << config.GetPath(util::ConfigKeys::LOGFILE) << std::endl;
        return 1;
    }
    for (const auto& warning : configResult.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    std::string scriptPath = config.GetPath(util::ConfigKeys::SCRIPT);
    if (!config.GetPositional().empty()) {
        scriptPath = config.GetPositional().front();
    }
    if (scriptPath.empty()) {
        PrintUsage();
        return 1;
    }

    if (auto owner = config.TryGetString(util::ConfigKeys::OWNER)) {
        config.Set(util::ConfigKeys::OWNER, market::ParsePrincipal(*owner).ToHex());
    }

    market::MarketParams params;
    std::string error;
    if (!market::LoadMarketParams(config, params, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    auto database = OpenState(config);
    if (!database) {
        std::cerr << "Error: cannot open market state" << std::endl;
        return 1;
    }

    db::WriteOptions writeOptions;
    writeOptions.sync = config.GetBool(util::ConfigKeys::DBSYNC, false);

    auto ledger = std::make_shared<market::MemoryLedger>();
    auto store = std::make_unique<market::MarketStore>(std::move(database), writeOptions);
    market::MarketStore* ledgerStore = nullptr;
    if (!config.GetBool(util::ConfigKeys::MEMDB, false)) {
        ledgerStore = store.get();
        db::Status status = market::LoadLedger(*ledgerStore, *ledger);
        if (!status.ok()) {
            std::cerr << "Error: cannot restore ledger: " << status.ToString() << std::endl;
            return 1;
        }
    }

    market::RoundController controller(std::move(store), ledger, params);
    market::MarketError initResult = controller.Initialize();
    if (initResult != market::MarketError::OK) {
        std::cerr << "Error: cannot initialize market: "
                  << market::MarketErrorToString(initResult) << std::endl;
        return 1;
    }

    std::ifstream script(scriptPath);
    if (!script) {
        std::cerr << "Error: cannot read script " << scriptPath << std::endl;
        return 1;
    }

    market::ScriptReplayer replayer(controller, *ledger, std::cout, ledgerStore);
    {
        util::ScopedLogTimer timer(util::LogCategory::REPLAY, "replay " + scriptPath);
        if (!replayer.Run(script, scriptPath, error)) {
            std::cerr << error << std::endl;
            return static_cast<int>(market::ReplayStatus::ScriptError);
        }
    }

    market::ReplayStatus result =
        replayer.Finish(config.GetString(util::ConfigKeys::EXPECTDIGEST, ""));
    if (result == market::ReplayStatus::DigestMismatch) {
        std::cerr << "Error: digest mismatch" << std::endl;
        return static_cast<int>(result);
    }

    util::Logger::Instance().Shutdown();
    return 0;
}

} // namespace foresight

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return foresight::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
