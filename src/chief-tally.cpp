// CHIEFTALLY CLI - Governance Tally
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// The chief-tally tool replays the chief's vote history from an Ethereum
// node and prints the weighted ranking of proposals.

#include <chieftally/chief/pipeline.h>
#include <chieftally/chief/report.h>
#include <chieftally/chief/settings.h>
#include <chieftally/db/leveldb.h>
#include <chieftally/eth/explorer.h>
#include <chieftally/eth/node.h>
#include <chieftally/rpc/client.h>
#include <chieftally/util/config.h>
#include <chieftally/util/logging.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

namespace chieftally {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "chief-tally";

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: chief-tally [options]\n\n";
    std::cout << "Replays the governance contract's vote history and ranks proposals\n";
    std::cout << "by the deposits of their current supporters.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path (default: ~/.chieftally/chieftally.conf)\n";
    std::cout << "\nNetwork Options:\n";
    std::cout << "  --rpcurl=URL               Ethereum node JSON-RPC endpoint (default: http://127.0.0.1:8545)\n";
    std::cout << "  --explorerurl=URL          Etherscan-compatible API (default: http://api.etherscan.io/api)\n";
    std::cout << "  --explorerkey=KEY          Explorer API key\n";
    std::cout << "  --timeout=SECONDS          Socket timeout, 0 for none (default: 0)\n";
    std::cout << "  --retries=N                Extra attempts after a transport failure (default: 0)\n";
    std::cout << "\nContract Options:\n";
    std::cout << "  --chief=ADDRESS            Governance contract (default: 0x9eF05f7F6deB616fd37aC3c959a2dDD25A54E4F5)\n";
    std::cout << "  --fromblock=N              First block to scan (default: 7705361)\n";
    std::cout << "\nExecution Options:\n";
    std::cout << "  --workers=N                Concurrent lookups per phase (default: 10)\n";
    std::cout << "  --cachedir=DIR             Interface and slate cache (default: ~/.chieftally/cache)\n";
    std::cout << "  --maxspells=N              Decode spells of the top N proposals, 0 for all (default: 0)\n";
    std::cout << "\nOutput Options:\n";
    std::cout << "  --json                     Machine-readable output\n";
    std::cout << "  --color, --nocolor         Force ANSI colors on or off\n";
    std::cout << "  --debug                    Verbose logging\n";
    std::cout << "  --quiet                    Only log warnings and errors\n";
    std::cout << "  --logfile=FILE             Also write the log to FILE\n";
    std::cout << "\nExamples:\n";
    std::cout << "  chief-tally\n";
    std::cout << "  chief-tally --json --rpcurl=http://localhost:8545\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 CHIEFTALLY Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

struct CommandLine {
    bool showHelp{false};
    bool showVersion{false};
    std::string configFile;
};

/// Store command-line values in the config as overrides
bool ParseCommandLine(int argc, char* argv[], CommandLine& cmd, util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"rpcurl", required_argument, nullptr, 1001},
        {"explorerurl", required_argument, nullptr, 1002},
        {"explorerkey", required_argument, nullptr, 1003},
        {"chief", required_argument, nullptr, 1004},
        {"fromblock", required_argument, nullptr, 1005},
        {"workers", required_argument, nullptr, 1006},
        {"cachedir", required_argument, nullptr, 1007},
        {"timeout", required_argument, nullptr, 1008},
        {"retries", required_argument, nullptr, 1009},
        {"maxspells", required_argument, nullptr, 1010},
        {"json", no_argument, nullptr, 1011},
        {"color", no_argument, nullptr, 1012},
        {"nocolor", no_argument, nullptr, 1013},
        {"debug", no_argument, nullptr, 1014},
        {"quiet", no_argument, nullptr, 1015},
        {"logfile", required_argument, nullptr, 1016},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    // Reset getopt
    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvc:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                cmd.showHelp = true;
                return true;
            case 'v':
                cmd.showVersion = true;
                return true;
            case 'c':
                cmd.configFile = optarg;
                break;
            case 1001: config.Set(RPCURL, optarg); break;
            case 1002: config.Set(EXPLORERURL, optarg); break;
            case 1003: config.Set(EXPLORERKEY, optarg); break;
            case 1004: config.Set(CHIEF, optarg); break;
            case 1005: config.Set(FROMBLOCK, optarg); break;
            case 1006: config.Set(WORKERS, optarg); break;
            case 1007: config.Set(CACHEDIR, optarg); break;
            case 1008: config.Set(TIMEOUT, optarg); break;
            case 1009: config.Set(RETRIES, optarg); break;
            case 1010: config.Set(MAXSPELLS, optarg); break;
            case 1011: config.Set(JSON, "1"); break;
            case 1012: config.Set(COLOR, "1"); break;
            case 1013: config.Set(COLOR, "0"); break;
            case 1014: config.Set(DEBUG, "1"); break;
            case 1015: config.Set(QUIET, "1"); break;
            case 1016: config.Set(LOGFILE, optarg); break;
            case '?':
            default:
                return false;
        }
    }

    if (optind < argc) {
        std::cerr << "Error: unexpected argument '" << argv[optind] << "'\n";
        return false;
    }
    return true;
}

/// Read the config file; a missing default file is not an error
bool LoadConfigFile(const CommandLine& cmd, util::ConfigManager& config) {
    std::string path = cmd.configFile;
    bool explicitFile = !path.empty();
    if (!explicitFile) {
        path = util::ConfigManager::GetDefaultDataDir() + "/" + util::DEFAULT_CONFIG_FILENAME;
        std::ifstream probe(path);
        if (!probe.good()) return true;
    }

    util::ConfigParseResult result = config.ParseFile(path);
    if (!result.success) {
        std::cerr << "Error reading config";
        if (!result.errorFile.empty()) std::cerr << " " << result.errorFile;
        if (result.errorLine > 0) std::cerr << ":" << result.errorLine;
        std::cerr << ": " << result.errorMessage << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Logging Setup
// ============================================================================

void SetupLogging(const chief::Settings& settings) {
    util::LogLevel level = util::LogLevel::Info;
    if (settings.debug) {
        level = util::LogLevel::Debug;
    } else if (settings.quiet) {
        level = util::LogLevel::Warn;
    }

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(level);

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = level;
    consoleConfig.showCategory = settings.debug;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    if (!settings.logFile.empty()) {
        auto fileSink = std::make_shared<util::FileSink>(settings.logFile, util::LogLevel::Debug);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
            if (!settings.debug) logger.SetLevel(util::LogLevel::Debug);
        } else {
            LOG_WARN(util::LogCategory::DEFAULT) << "Cannot open log file " << settings.logFile;
        }
    }
}

// ============================================================================
// Cache Store
// ============================================================================

std::unique_ptr<db::Database> OpenCache(const std::string& cacheDir) {
    if (!cacheDir.empty()) {
        auto [status, database] = db::OpenDatabase(cacheDir);
        if (status.ok()) {
            return std::move(database);
        }
        LOG_WARN(util::LogCategory::DB) << "Cache disabled: " << status.ToString();
    }
    return std::make_unique<db::MemoryDatabase>();
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    CommandLine cmd;

    if (!ParseCommandLine(argc, argv, cmd, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }

    if (cmd.showHelp) {
        PrintHelp();
        return 0;
    }

    if (cmd.showVersion) {
        PrintVersion();
        return 0;
    }

    if (!LoadConfigFile(cmd, config)) {
        return 1;
    }
    chief::RegisterSettings(config);
    chief::Settings settings = chief::LoadSettings(config);

    SetupLogging(settings);
    LOG_DEBUG(util::LogCategory::DEFAULT) << "Node " << settings.rpcUrl << ", chief "
                                          << settings.chief.ToChecksumHex() << " from block "
                                          << settings.fromBlock;

    rpc::RPCClientConfig rpcConfig;
    rpcConfig.url = settings.rpcUrl;
    rpcConfig.timeoutSeconds = settings.timeoutSeconds;
    rpcConfig.retries = settings.retries;
    rpc::RPCClient rpcClient(rpcConfig);
    eth::RPCNodeClient node(rpcClient);

    eth::EtherscanFetcher::Config explorerConfig;
    explorerConfig.url = settings.explorerUrl;
    explorerConfig.apiKey = settings.explorerKey;
    explorerConfig.timeoutSeconds = settings.timeoutSeconds;
    explorerConfig.retries = settings.retries;
    eth::EtherscanFetcher explorer(explorerConfig);

    std::unique_ptr<db::Database> cache = OpenCache(settings.cacheDir);
    eth::InterfaceCache interfaces(*cache, explorer);
    chief::SlateCache slates(*cache);

    chief::PipelineOptions options;
    options.chief = settings.chief;
    options.fromBlock = settings.fromBlock;
    options.workers = settings.workers;
    options.maxSpells = settings.maxSpells;

    chief::Report report;
    try {
        report = chief::Pipeline(node, interfaces, slates, options).Run();
    } catch (const chief::ChiefError& e) {
        LOG_ERROR(util::LogCategory::CHIEF) << e.what();
        util::Logger::Instance().Flush();
        return 1;
    }
    LOG_DEBUG(util::LogCategory::RPC) << rpcClient.GetTotalCalls() << " RPC calls, "
                                      << rpcClient.GetTotalErrors() << " errors";

    if (settings.json) {
        std::cout << chief::RenderJSON(report);
    } else {
        bool color = settings.color.value_or(isatty(fileno(stdout)) != 0);
        std::cout << chief::RenderText(report, color);
    }
    std::cout.flush();
    util::Logger::Instance().Flush();
    return 0;
}

} // namespace cli
} // namespace chieftally

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return chieftally::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
