// ZKVOTE CLI - Command Line Interface
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// The zkvote-cli tool operates a local ballot store directly: it creates
// proposals, records cast votes, opens them and finalizes results.

#include "zkvote/ballot/balance.h"
#include "zkvote/ballot/clock.h"
#include "zkvote/ballot/commitment.h"
#include "zkvote/ballot/engine.h"
#include "zkvote/ballot/proof_format.h"
#include "zkvote/ballot/verifier.h"
#include "zkvote/core/hex.h"
#include "zkvote/util/config.h"
#include "zkvote/util/logging.h"
#include "zkvote/util/time.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace zkvote {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ZKVOTE CLI";

/// Exit code for a rejected ballot operation
constexpr int EXIT_REJECTED = 2;

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: zkvote-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path\n";
    std::cout << "  -datadir=DIR               Data directory path\n";
    std::cout << "  -inmemory                  Keep the ballot store in memory\n";
    std::cout << "  -dbcache=MB                Store cache size (default: 8)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error\n";
    std::cout << "  -debug=CATEGORY            Enable debug output for a category\n";
    std::cout << "  -printtoconsole            Log to the console\n";
    std::cout << "  -logfile=FILE              Log file (default: <datadir>/debug.log)\n";
    std::cout << "\nVerifier Options:\n";
    std::cout << "  -verifier=command          Run an external proof verifier (default)\n";
    std::cout << "  -verifiercmd=PROGRAM       Verifier program, run as\n";
    std::cout << "                             PROGRAM verify <vk> <proof> <witness>\n";
    std::cout << "  -verifierkey=FILE          Verification key\n";
    std::cout << "  -verifier=structural       Check proof shape only (needs -skipzkverify)\n";
    std::cout << "  -balance=ACCT:CRED:AMOUNT  Credential balance, may be repeated\n";
    std::cout << "\nCommands:\n";
    std::cout << "  create <creator> <id> <title> <credential> <threshold> <period> <option>...\n";
    std::cout << "                             Create a proposal; period like 3600, 90m or 2d\n";
    std::cout << "  cast <voter> <id> <nullifier> <commitment> <proof-file> <witness-file>\n";
    std::cout << "                             Cast a vote backed by an eligibility proof\n";
    std::cout << "  reveal <revealer> <id> <nullifier> <choice> <secret>\n";
    std::cout << "                             Open a cast vote after voting ended\n";
    std::cout << "  finalize <authority> <id>  Freeze the results of a proposal\n";
    std::cout << "  show <id>                  Show a proposal and its results\n";
    std::cout << "  list                       List all proposals\n";
    std::cout << "  votes <id>                 List the votes of a proposal\n";
    std::cout << "  commit <choice> <secret> <id> [threshold]\n";
    std::cout << "                             Compute a commitment, nullifier and witness\n";
    std::cout << "\nAccounts, credentials, nullifiers, commitments and secrets are\n";
    std::cout << "64-character hex strings.\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 ZKVOTE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Helpers
// ============================================================================

uint64_t ParseU64(const std::string& str, const char* what) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + str);
    }
    try {
        return std::stoull(str);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(what) + " out of range: " + str);
    }
}

uint8_t ParseChoice(const std::string& str) {
    uint64_t value = ParseU64(str, "choice");
    if (value > 255) {
        throw std::invalid_argument("Choice out of range: " + str);
    }
    return static_cast<uint8_t>(value);
}

std::vector<Byte> ReadFileBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + path);
    }
    return std::vector<Byte>((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw std::invalid_argument(std::string("Usage: zkvote-cli ") + usage);
    }
}

// ============================================================================
// Output
// ============================================================================

void PrintProposal(const ballot::Proposal& proposal, Timestamp now) {
    std::cout << "id:          " << proposal.id << "\n";
    std::cout << "title:       " << proposal.title << "\n";
    std::cout << "creator:     " << proposal.creator.ToHex() << "\n";
    std::cout << "credential:  " << proposal.credentialRef.ToHex() << "\n";
    std::cout << "threshold:   " << proposal.minThreshold << "\n";
    std::cout << "start:       " << util::FormatISO8601(proposal.startTime) << "\n";
    std::cout << "end:         " << util::FormatISO8601(proposal.endTime) << "\n";
    std::cout << "phase:       " << ballot::ProposalPhaseToString(proposal.GetPhase(now)) << "\n";
    std::cout << "votes cast:  " << proposal.voteCount << "\n";
}

void PrintResults(const ballot::Proposal& proposal, const ballot::Results& results) {
    std::cout << "results" << (results.isFinalized ? " (final)" : "") << ":\n";
    for (size_t i = 0; i < proposal.options.size(); ++i) {
        uint64_t tally = i < results.tallies.size() ? results.tallies[i] : 0;
        std::cout << "  [" << i << "] " << proposal.options[i] << ": " << tally << "\n";
    }
    std::cout << "  revealed: " << results.TotalRevealed() << " of "
              << proposal.voteCount << "\n";
}

void PrintError(const ballot::BallotFailure& failure) {
    std::cerr << "error code: " << ballot::BallotErrorToString(failure.error) << "\n";
    std::cerr << "error message:\n" << failure.message << "\n";
}

// ============================================================================
// Setup
// ============================================================================

bool LoadConfig(util::ConfigManager& config) {
    std::string confPath = config.GetPath(util::ConfigKeys::CONF, "");
    bool explicitConf = !confPath.empty();
    if (!explicitConf) {
        confPath = (std::filesystem::path(config.GetDataDir()) /
                    util::DEFAULT_CONFIG_FILENAME).string();
    }

    std::error_code ec;
    if (!std::filesystem::exists(confPath, ec)) {
        if (explicitConf) {
            std::cerr << "Error: Config file not found: " << confPath << "\n";
            return false;
        }
        return true;
    }

    util::ConfigParseResult result = config.ParseFile(confPath, false);
    if (!result.success) {
        std::cerr << "Error: " << result.errorFile << ":" << result.errorLine
                  << ": " << result.errorMessage << "\n";
        return false;
    }
    return true;
}

std::shared_ptr<ballot::MemoryBalanceSource> LoadBalances(const util::ConfigManager& config) {
    auto balances = std::make_shared<ballot::MemoryBalanceSource>();
    for (const auto& entry : config.GetList(util::ConfigKeys::BALANCE)) {
        auto parsed = ballot::ParseBalanceEntry(entry);
        if (!parsed) {
            throw std::invalid_argument("Invalid balance entry: " + entry);
        }
        balances->SetBalance(parsed->account, parsed->credential, parsed->amount);
    }
    return balances;
}

std::unique_ptr<ballot::BallotEngine> OpenEngine(const util::ConfigManager& config) {
    std::string error;
    std::unique_ptr<ballot::Verifier> verifier = ballot::MakeVerifierFromConfig(config, error);
    if (!verifier) {
        throw std::runtime_error(error);
    }

    std::unique_ptr<db::Database> database = ballot::OpenBallotDatabase(config, error);
    if (!database) {
        throw std::runtime_error(error);
    }

    return std::make_unique<ballot::BallotEngine>(
        std::move(database),
        std::make_shared<ballot::SystemClock>(),
        std::shared_ptr<ballot::Verifier>(std::move(verifier)),
        LoadBalances(config));
}

// ============================================================================
// Commands
// ============================================================================

int CommandCreate(ballot::BallotEngine& engine, const std::vector<std::string>& args) {
    RequireArgs(args, 8,
                "create <creator> <id> <title> <credential> <threshold> <period> <option>...");

    ballot::ProposalRequest request;
    request.creator = AccountId::FromHex(args[1]);
    request.id = ParseU64(args[2], "proposal id");
    request.title = args[3];
    request.credentialRef = CredentialRef::FromHex(args[4]);
    request.minThreshold = ParseU64(args[5], "threshold");

    auto period = util::ParseDuration(args[6]);
    if (!period) {
        throw std::invalid_argument("Invalid voting period: " + args[6]);
    }
    request.votingPeriod = *period;
    request.options.assign(args.begin() + 7, args.end());

    auto result = engine.CreateProposal(request);
    if (!result) {
        PrintError(result.failure());
        return EXIT_REJECTED;
    }
    PrintProposal(result->proposal, engine.GetClock().Now());
    return 0;
}

int CommandCast(ballot::BallotEngine& engine, const std::vector<std::string>& args) {
    RequireArgs(args, 7,
                "cast <voter> <id> <nullifier> <commitment> <proof-file> <witness-file>");

    ballot::CastRequest request;
    request.voter = AccountId::FromHex(args[1]);
    request.proposalId = ParseU64(args[2], "proposal id");
    request.nullifier = Nullifier::FromHex(args[3]);
    request.commitment = VoteCommitment::FromHex(args[4]);
    request.proof = ReadFileBytes(args[5]);
    request.witness = ReadFileBytes(args[6]);

    auto result = engine.CastVote(request);
    if (!result) {
        PrintError(result.failure());
        return EXIT_REJECTED;
    }
    std::cout << result->ToString() << "\n";
    return 0;
}

int CommandReveal(ballot::BallotEngine& engine, const std::vector<std::string>& args) {
    RequireArgs(args, 6, "reveal <revealer> <id> <nullifier> <choice> <secret>");

    ballot::RevealRequest request;
    request.revealer = AccountId::FromHex(args[1]);
    request.proposalId = ParseU64(args[2], "proposal id");
    request.nullifier = Nullifier::FromHex(args[3]);
    request.choice = ParseChoice(args[4]);
    request.secret = VoterSecret::FromHex(args[5]);

    auto result = engine.RevealVote(request);
    if (!result) {
        PrintError(result.failure());
        return EXIT_REJECTED;
    }
    std::cout << result->ToString() << "\n";
    return 0;
}

int CommandFinalize(ballot::BallotEngine& engine, const std::vector<std::string>& args) {
    RequireArgs(args, 3, "finalize <authority> <id>");

    auto result = engine.FinalizeProposal(AccountId::FromHex(args[1]),
                                          ParseU64(args[2], "proposal id"));
    if (!result) {
        PrintError(result.failure());
        return EXIT_REJECTED;
    }
    PrintResults(result->proposal, result->results);
    return 0;
}

int CommandShow(ballot::BallotEngine& engine, const std::vector<std::string>& args) {
    RequireArgs(args, 2, "show <id>");

    ProposalId id = ParseU64(args[1], "proposal id");
    auto proposal = engine.GetProposal(id);
    if (!proposal) {
        std::cerr << "error: proposal " << id << " not found\n";
        return EXIT_REJECTED;
    }
    PrintProposal(*proposal, engine.GetClock().Now());

    auto results = engine.GetResults(id);
    if (results) {
        PrintResults(*proposal, *results);
    }
    return 0;
}

int CommandList(ballot::BallotEngine& engine) {
    auto result = engine.ListProposals();
    if (!result) {
        PrintError(result.failure());
        return EXIT_REJECTED;
    }
    Timestamp now = engine.GetClock().Now();
    for (const auto& proposal : *result) {
        std::cout << proposal.id << "  "
                  << ballot::ProposalPhaseToString(proposal.GetPhase(now)) << "  "
                  << proposal.voteCount << " votes  " << proposal.title << "\n";
    }
    return 0;
}

int CommandVotes(ballot::BallotEngine& engine, const std::vector<std::string>& args) {
    RequireArgs(args, 2, "votes <id>");

    auto result = engine.ListVotes(ParseU64(args[1], "proposal id"));
    if (!result) {
        PrintError(result.failure());
        return EXIT_REJECTED;
    }
    for (const auto& vote : *result) {
        std::cout << vote.ToString() << "\n";
    }
    return 0;
}

/// Local helper for voters preparing a ballot; touches no store
int CommandCommit(const std::vector<std::string>& args) {
    RequireArgs(args, 4, "commit <choice> <secret> <id> [threshold]");

    uint8_t choice = ParseChoice(args[1]);
    VoterSecret secret = VoterSecret::FromHex(args[2]);
    ProposalId id = ParseU64(args[3], "proposal id");
    uint64_t threshold = args.size() > 4 ? ParseU64(args[4], "threshold") : 0;

    VoteCommitment commitment = ballot::ComputeVoteCommitment(choice, secret, id);
    Nullifier nullifier = ballot::DeriveNullifier(secret, id);
    ballot::PublicWitness witness = ballot::EncodePublicWitness(
        ballot::MakePublicInputs(threshold, id, commitment, nullifier));

    std::cout << "commitment: " << commitment.ToHex() << "\n";
    std::cout << "nullifier:  " << nullifier.ToHex() << "\n";
    std::cout << "witness:    " << BytesToHex(witness) << "\n";
    return 0;
}

int ExecuteCommand(const util::ConfigManager& config) {
    const std::vector<std::string>& args = config.GetPositional();
    const std::string& method = args.front();

    if (method == "commit") {
        return CommandCommit(args);
    }

    static const char* const kStoreCommands[] = {
        "create", "cast", "reveal", "finalize", "show", "list", "votes"};
    bool known = false;
    for (const char* name : kStoreCommands) {
        known = known || method == name;
    }
    if (!known) {
        std::cerr << "Error: Unknown command: " << method << "\n";
        std::cerr << "Use 'zkvote-cli -help' for usage information.\n";
        return 1;
    }

    std::unique_ptr<ballot::BallotEngine> engine = OpenEngine(config);

    if (method == "create") return CommandCreate(*engine, args);
    if (method == "cast") return CommandCast(*engine, args);
    if (method == "reveal") return CommandReveal(*engine, args);
    if (method == "finalize") return CommandFinalize(*engine, args);
    if (method == "show") return CommandShow(*engine, args);
    if (method == "list") return CommandList(*engine);
    return CommandVotes(*engine, args);
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error parsing command line: " << parsed.errorMessage << "\n";
        std::cerr << "Use -help for usage.\n";
        return 1;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    if (config.GetPositional().empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'zkvote-cli -help' for usage information.\n";
        return 1;
    }

    if (!LoadConfig(config)) {
        return 1;
    }

    // Command output goes to stdout, so logs default to the data directory
    config.SetDefault(util::ConfigKeys::PRINTTOCONSOLE, "0");
    if (!config.GetBool(util::ConfigKeys::INMEMORY, false)) {
        std::error_code ec;
        std::filesystem::create_directories(config.GetDataDir(), ec);
        if (ec) {
            std::cerr << "Error: Cannot create data directory " << config.GetDataDir()
                      << ": " << ec.message() << "\n";
            return 1;
        }
        config.SetDefault(util::ConfigKeys::LOGFILE,
                          (std::filesystem::path(config.GetDataDir()) / "debug.log").string());
    }
    util::InitLoggingFromConfig(config);

    LOG_DEBUG(util::LogCategory::DEFAULT) << "zkvote-cli " << VERSION << " command "
                                          << config.GetPositional().front();

    int rc = ExecuteCommand(config);
    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace cli
} // namespace zkvote

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return zkvote::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
