// CHAMA CLI - Scenario Runner
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// The chama-cli tool creates a savings group from a configuration file and
// replays a script of member and admin actions against it on a simulated
// clock, printing every result and emitted event.

#include <chama/core/types.h>
#include <chama/crypto/sha256.h>
#include <chama/db/database.h>
#include <chama/group/config.h>
#include <chama/group/events.h>
#include <chama/group/registry.h>
#include <chama/group/transfer.h>
#include <chama/util/config.h>
#include <chama/util/logging.h>
#include <chama/util/time.h>

#ifdef CHAMA_USE_LEVELDB
#include <chama/db/leveldb.h>
#endif

#include <fstream>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace chama {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "CHAMA CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string configFile;
    std::string scriptFile;
    std::string journalDir;
    std::string creator{"creator"};
    std::string startTime;
    std::string logLevel{"warn"};
    std::string logFile;
    std::vector<std::string> overrides;
    bool quiet{false};
    bool showHelp{false};
    bool showVersion{false};
};

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: chama-cli -c <config> [options] [script]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Group configuration file\n";
    std::cout << "  -o, --set=SECTION.KEY=VAL  Override a configuration value\n";
    std::cout << "  --creator=ACCOUNT          Account that creates the group (default: creator)\n";
    std::cout << "  --start=TIME               Simulated start time, ISO-8601 (default: now)\n";
    std::cout << "  --journal=DIR              Persist events to a LevelDB journal\n";
    std::cout << "  --loglevel=LEVEL           trace|debug|info|warn|error|off (default: warn)\n";
    std::cout << "  --logfile=FILE             Also write logs to FILE\n";
    std::cout << "  -q, --quiet                Do not print events\n";
    std::cout << "\nScript commands (one per line, # starts a comment, a leading ! expects failure):\n";
    std::cout << "  join <who>                       approve <admin> <who>\n";
    std::cout << "  contribute <who> [value]         leave <who>\n";
    std::cout << "  punish <admin> <who> <action> [reason]\n";
    std::cout << "  cancel <admin> <who>             payfine <who> [value]\n";
    std::cout << "  queue <creator> <who>...         payout <admin>\n";
    std::cout << "  propose <who> <type> <target> [description]\n";
    std::cout << "  vote <who> <id> <yes|no>         execute <admin> <id>\n";
    std::cout << "  check <admin> <who>              emergency <admin>\n";
    std::cout << "  pause <admin>                    unpause <admin>\n";
    std::cout << "  advance <duration>               fund <who> <amount>\n";
    std::cout << "  addadmin <creator> <who>         removeadmin <creator> <who>\n";
    std::cout << "  transfer <creator> <who>         show [who]\n";
    std::cout << "  claim <who>\n";
    std::cout << "\nAccounts are labels or 0x-prefixed addresses.\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 CHAMA Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"set", required_argument, nullptr, 'o'},
        {"quiet", no_argument, nullptr, 'q'},
        {"creator", required_argument, nullptr, 1001},
        {"start", required_argument, nullptr, 1002},
        {"journal", required_argument, nullptr, 1003},
        {"loglevel", required_argument, nullptr, 1004},
        {"logfile", required_argument, nullptr, 1005},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvc:o:q", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'o':
                config.overrides.push_back(optarg);
                break;
            case 'q':
                config.quiet = true;
                break;
            case 1001:  // --creator
                config.creator = optarg;
                break;
            case 1002:  // --start
                config.startTime = optarg;
                break;
            case 1003:  // --journal
                config.journalDir = optarg;
                break;
            case 1004:  // --loglevel
                config.logLevel = optarg;
                break;
            case 1005:  // --logfile
                config.logFile = optarg;
                break;
            case '?':
            default:
                return false;
        }
    }

    if (optind < argc) {
        config.scriptFile = argv[optind++];
    }
    return optind == argc;
}

void SetupLogging(const CLIConfig& config) {
    auto& logger = util::Logger::Instance();
    util::LogLevel level = util::LogLevelFromString(config.logLevel);
    logger.SetLevel(level);

    util::ConsoleSink::Config console;
    console.level = level;
    console.showTimestamp = false;
    logger.AddSink(std::make_shared<util::ConsoleSink>(console));

    if (!config.logFile.empty()) {
        auto file = std::make_shared<util::FileSink>(config.logFile);
        if (file->IsOpen()) {
            logger.AddSink(file);
        } else {
            LOG_WARN(util::LogCategory::CLI) << "Cannot open log file " << config.logFile;
        }
    }
}

// ============================================================================
// Scenario
// ============================================================================

/// Everything a script runs against
class Scenario {
public:
    Scenario(const Address& owner, const group::EngineSettings& settings)
        : registry_(owner, ledger_, &util::GetTime, settings) {}

    bool OpenJournal(const std::string& dir);
    bool CreateGroup(const std::string& creator, const group::GroupParams& params);

    /// Execute one script line; false if the outcome differed from the expectation
    bool RunLine(const std::string& line, int lineNum);

    /// Check the event chain and report its size
    bool Finish();

    void SetQuiet(bool quiet) { quiet_ = quiet; }

private:
    group::Status Dispatch(const std::string& command, const std::vector<std::string>& args);
    void Show(const std::vector<std::string>& args) const;
    Address Asset() const { return engine_->GetParams().contributionToken; }

    group::LedgerTransfer ledger_;
    group::GroupRegistry registry_;
    std::shared_ptr<group::GroupEngine> engine_;
    std::unique_ptr<db::Database> db_;
    std::unique_ptr<group::EventJournal> journal_;
    bool quiet_{false};
};

bool Scenario::OpenJournal(const std::string& dir) {
    if (dir.empty()) {
        db_ = std::make_unique<db::MemoryDatabase>();
    } else {
#ifdef CHAMA_USE_LEVELDB
        auto [status, database] = db::OpenDatabase(dir);
        if (!status.ok()) {
            std::cerr << "Error: cannot open journal " << dir << ": " << status.ToString() << "\n";
            return false;
        }
        db_ = std::move(database);
#else
        std::cerr << "Error: --journal requires a build with LevelDB\n";
        return false;
#endif
    }

    journal_ = std::make_unique<group::EventJournal>(*db_);
    db::Status s = journal_->Open();
    if (!s.ok()) {
        std::cerr << "Error: journal: " << s.ToString() << "\n";
        return false;
    }

    auto sink = journal_->Sink();
    registry_.SetEventCallback([this, sink](const group::GroupEvent& ev) {
        sink(ev);
        if (!quiet_) std::cout << "  event " << ev.ToString() << "\n";
    });
    return true;
}

bool Scenario::CreateGroup(const std::string& creator, const group::GroupParams& params) {
    auto [status, engine] = registry_.CreateGroup(group::ParseAccount(creator), params);
    if (!status.ok()) {
        std::cerr << "Error: cannot create group: " << status.ToString() << "\n";
        return false;
    }
    engine_ = engine;
    std::cout << "Created group \"" << params.rules.name << "\" at "
              << engine_->GetAddress().ToString() << "\n";
    return true;
}

group::Status Scenario::Dispatch(const std::string& command,
                                 const std::vector<std::string>& args) {
    auto need = [&](size_t n) {
        return args.size() >= n ? group::Status::Ok()
                                : group::Status::Precondition("Missing arguments for " + command);
    };
    auto rest = [&](size_t from) {
        std::string out;
        for (size_t i = from; i < args.size(); ++i) {
            if (!out.empty()) out += " ";
            out += args[i];
        }
        return out;
    };
    auto amountArg = [&](size_t index, Amount fallback) -> std::optional<Amount> {
        if (args.size() <= index) return fallback;
        return ParseAmount(args[index]);
    };

    group::Status s = need(1);
    if (command == "advance") {
        if (!s.ok()) return s;
        auto seconds = util::ParseDuration(args[0]);
        if (!seconds) return group::Status::Precondition("Invalid duration " + args[0]);
        util::AdvanceMockTime(*seconds);
        return group::Status::Ok();
    }
    if (command == "show") {
        Show(args);
        return group::Status::Ok();
    }
    if (!s.ok()) return s;

    const Address actor = group::ParseAccount(args[0]);
    group::GroupEngine& g = *engine_;

    if (command == "join") return g.Join(actor);
    if (command == "leave") return g.Leave(actor);
    if (command == "payout") return g.ProcessRotationPayout(actor);
    if (command == "pause") return g.Pause(actor);
    if (command == "unpause") return g.Unpause(actor);
    if (command == "emergency") return g.EmergencyWithdraw(actor);
    if (command == "claim") return g.ClaimEmergencyShare(actor);

    if (command == "fund") {
        if (!(s = need(2)).ok()) return s;
        auto amount = ParseAmount(args[1]);
        if (!amount) return group::Status::ValueMismatch("Invalid amount " + args[1]);
        ledger_.Credit(actor, Asset(), *amount);
        return group::Status::Ok();
    }
    if (command == "contribute") {
        Amount fallback = g.GetParams().IsTokenBased() ? 0 : g.GetRules().contributionAmount;
        auto value = amountArg(1, fallback);
        if (!value) return group::Status::ValueMismatch("Invalid amount " + args[1]);
        return g.Contribute(actor, *value);
    }
    if (command == "payfine") {
        Amount fallback = 0;
        if (!g.GetParams().IsTokenBased()) {
            auto p = g.GetPunishmentDetails(actor);
            fallback = p ? p->fineAmount : 0;
        }
        auto value = amountArg(1, fallback);
        if (!value) return group::Status::ValueMismatch("Invalid amount " + args[1]);
        return g.PayFine(actor, *value);
    }

    if (!(s = need(2)).ok()) return s;
    const Address subject = group::ParseAccount(args[1]);

    if (command == "approve") return g.ApproveJoin(actor, subject);
    if (command == "cancel") return g.CancelPunishment(actor, subject);
    if (command == "check") return g.CheckMissedContributions(actor, subject);
    if (command == "addadmin") return g.AddAdmin(actor, subject);
    if (command == "removeadmin") return g.RemoveAdmin(actor, subject);
    if (command == "transfer") return g.TransferCreator(actor, subject);

    if (command == "queue") {
        std::vector<Address> queue;
        for (size_t i = 1; i < args.size(); ++i) {
            queue.push_back(group::ParseAccount(args[i]));
        }
        return g.SetPayoutQueue(actor, queue);
    }
    if (command == "execute" || command == "vote") {
        uint64_t id = 0;
        try {
            id = std::stoull(args[1]);
        } catch (const std::exception&) {
            return group::Status::Precondition("Invalid proposal id " + args[1]);
        }
        if (command == "execute") return g.ExecuteProposal(actor, id);
        if (!(s = need(3)).ok()) return s;
        return g.VoteOnProposal(actor, id, args[2] == "yes" || args[2] == "for");
    }

    if (!(s = need(3)).ok()) return s;
    if (command == "punish") {
        auto action = group::ParsePunishmentAction(args[2]);
        if (!action) return group::Status::Precondition("Unknown punishment " + args[2]);
        return g.PunishMember(actor, group::ParseAccount(args[1]), *action, rest(3));
    }
    if (command == "propose") {
        auto type = group::ParseProposalType(args[1]);
        if (!type) return group::Status::Precondition("Unknown proposal type " + args[1]);
        uint64_t id = 0;
        s = g.CreateProposal(actor, *type, group::ParseAccount(args[2]), 0, rest(3), &id);
        if (s.ok()) std::cout << "  proposal " << id << "\n";
        return s;
    }

    return group::Status::Precondition("Unknown command " + command);
}

void Scenario::Show(const std::vector<std::string>& args) const {
    const group::GroupEngine& g = *engine_;
    if (!args.empty()) {
        const Address who = group::ParseAccount(args[0]);
        auto m = g.GetMemberDetails(who);
        std::cout << "  " << args[0] << " " << who.ToString() << "\n";
        std::cout << "    balance:     " << FormatAmount(ledger_.Balance(who, g.GetParams().contributionToken)) << "\n";
        if (!m) {
            std::cout << "    not a member\n";
            return;
        }
        std::cout << "    active:      " << (m->isActive ? "yes" : "no") << "\n";
        std::cout << "    contributed: " << FormatAmount(m->totalContributed) << "\n";
        std::cout << "    missed:      " << m->missedContributions << "\n";
        if (Amount owed = g.GetOwedShare(who); owed > 0) {
            std::cout << "    owed:        " << FormatAmount(owed) << "\n";
        }
        if (auto p = g.GetPunishmentDetails(who); p && p->isActive) {
            std::cout << "    punishment:  " << group::PunishmentActionToString(p->action)
                      << " (" << p->reason << ")\n";
        }
        auto history = g.GetMemberPayoutHistory(who);
        std::cout << "    payouts:     " << history.size() << "\n";
        return;
    }

    std::cout << "  " << g.GetRules().name << " at " << util::FormatISO8601(util::GetTime())
              << " period " << g.GetCurrentPeriod() << "\n";
    std::cout << "    members:     " << g.GetActiveMemberCount() << " active / "
              << g.GetMemberCount() << " joined / " << g.GetRules().maxMembers << " max\n";
    std::cout << "    pool:        " << FormatAmount(g.GetTotalFunds()) << "\n";
    std::cout << "    window:      " << (g.IsContributionWindowOpen() ? "open" : "closed") << "\n";
    std::cout << "    state:       " << (g.IsActive() ? "active" : "inactive")
              << (g.IsPaused() ? ", paused" : "") << "\n";
}

bool Scenario::RunLine(const std::string& rawLine, int lineNum) {
    std::string line = rawLine.substr(0, rawLine.find('#'));
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) tokens.push_back(token);
    if (tokens.empty()) return true;

    bool expectFailure = false;
    if (tokens[0][0] == '!') {
        expectFailure = true;
        tokens[0] = tokens[0].substr(1);
        if (tokens[0].empty()) tokens.erase(tokens.begin());
        if (tokens.empty()) return true;
    }

    const std::string command = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    std::cout << lineNum << "> " << (expectFailure ? "!" : "") << command;
    for (const auto& a : args) std::cout << " " << a;
    std::cout << "\n";

    group::Status s = Dispatch(command, args);
    if (s.ok()) {
        std::cout << "  ok\n";
    } else {
        std::cout << "  error: " << s.ToString() << "\n";
    }

    if (s.ok() == expectFailure) {
        LOG_ERROR(util::LogCategory::CLI) << "Line " << lineNum << ": expected "
                                          << (expectFailure ? "failure" : "success");
        return false;
    }
    return true;
}

bool Scenario::Finish() {
    db::Status s = journal_->Verify();
    if (!s.ok()) {
        std::cerr << "Error: journal verification failed: " << s.ToString() << "\n";
        return false;
    }
    std::cout << "Journal: " << journal_->Size() << " events, head "
              << journal_->LastHash().ToHex() << "\n";
    return true;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }
    if (config.showHelp) {
        PrintHelp();
        return 0;
    }
    if (config.showVersion) {
        PrintVersion();
        return 0;
    }
    if (config.configFile.empty()) {
        std::cerr << "Error: No configuration file specified.\n";
        std::cerr << "Use 'chama-cli --help' for usage information.\n";
        return 1;
    }

    SetupLogging(config);

    // Simulated clock
    util::EnableMockTime();
    if (!config.startTime.empty()) {
        auto start = util::ParseISO8601(config.startTime);
        if (!start) {
            std::cerr << "Error: invalid start time " << config.startTime << "\n";
            return 1;
        }
        util::SetMockTime(*start);
    }

    util::ConfigManager settingsFile;
    util::ConfigParseResult parsed = settingsFile.ParseFile(config.configFile);
    for (const auto& ov : config.overrides) {
        if (!parsed.success) break;
        parsed = settingsFile.ParseOverride(ov);
    }
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    for (const auto& warning : parsed.warnings) {
        LOG_WARN(util::LogCategory::CLI) << warning;
    }

    group::EngineSettings settings;
    group::GroupParams params;
    parsed = group::LoadEngineSettings(settingsFile, settings);
    if (parsed.success) {
        parsed = group::LoadGroupParams(settingsFile, util::GetTime(), params);
    }
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    Scenario scenario(AddressFromLabel("registry"), settings);
    scenario.SetQuiet(config.quiet);
    if (!scenario.OpenJournal(config.journalDir)) return 1;
    if (!scenario.CreateGroup(config.creator, params)) return 1;

    std::ifstream scriptFile;
    std::istream* script = &std::cin;
    if (!config.scriptFile.empty()) {
        scriptFile.open(config.scriptFile);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: cannot open script " << config.scriptFile << "\n";
            return 1;
        }
        script = &scriptFile;
    }

    int failures = 0;
    int lineNum = 0;
    std::string line;
    while (std::getline(*script, line)) {
        ++lineNum;
        if (!scenario.RunLine(line, lineNum)) ++failures;
    }

    if (!scenario.Finish()) return 1;
    util::Logger::Instance().Flush();

    if (failures > 0) {
        std::cerr << failures << " line(s) did not behave as expected\n";
        return 2;
    }
    return 0;
}

} // namespace cli
} // namespace chama

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return chama::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
