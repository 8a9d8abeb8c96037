// STAKEVOTE - Scenario Runner
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// Drives a ledger and a voting engine from a line-oriented script with a
// simulated clock. Used by stakevote-sim and by the tests.
//
// Commands:
//   time <unix-seconds|ISO8601|+N[s|m|h|d|w]>
//   alias <name> <hex>
//   mint <addr> <amount>
//   approve <addr> <amount>
//   create <start> <duration> <name> [description...]
//   vote <addr> <project> <amount>
//   finalize <project> [caller]
//   unstake <addr> <project>
//   expect balance <addr> <value>
//   expect stake <project> <addr> <value>
//   expect unstakeable <project> <addr> <value>
//   expect winner <project> <addr>
//   expect total <addr> <value>
//   expect votes <project> <value>
//   show <project>
//
// A leading '!' asserts that the command fails. '#' starts a comment.

#ifndef STAKEVOTE_SIM_SCENARIO_H
#define STAKEVOTE_SIM_SCENARIO_H

#include "stakevote/core/types.h"
#include "stakevote/ledger/ledger.h"
#include "stakevote/voting/engine.h"
#include "stakevote/voting/store.h"

#include <filesystem>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stakevote {
namespace sim {

/// Outcome of one script line
struct StepResult {
    /// Line behaved as written (including an expected failure)
    bool ok{true};

    /// Engine outcome for engine commands, OK otherwise
    voting::VoteError error{voting::VoteError::OK};

    /// Line could not be parsed; a '!' prefix does not excuse it
    bool malformed{false};

    std::string message;
};

/// Outcome of a whole script
struct RunResult {
    bool success{true};

    /// Commands executed (comments and blank lines excluded)
    size_t commands{0};

    /// 1-based line of the first failure, 0 on success
    size_t failedLine{0};

    std::string message;
};

class ScenarioRunner {
public:
    /**
     * @param ledger Reference ledger whose custody account the engine uses
     * @param engine Engine under test
     * @param store Optional, and the engine's own store; mint and approve
     *              save the ledger to it, votes and withdrawals are committed
     *              by the engine
     * @param startTime Initial simulated clock
     */
    ScenarioRunner(std::shared_ptr<ledger::TokenLedger> ledger,
                   std::shared_ptr<voting::VotingEngine> engine,
                   std::shared_ptr<voting::VotingStore> store = nullptr,
                   Timestamp startTime = 0);

    /// Run a single line
    StepResult Execute(const std::string& line);

    /**
     * Run every line of a script, stopping at the first failure.
     * @param out If set, each command and its result is echoed here
     */
    RunResult Run(std::istream& in, std::ostream* out = nullptr);

    RunResult RunFile(const std::filesystem::path& path, std::ostream* out = nullptr);

    Timestamp GetTime() const { return now_; }
    void SetTime(Timestamp now) { now_ = now; }

    /// Bind name so that "@name" resolves to addr
    void SetAlias(const std::string& name, const Address& addr);

    /// Parse "@alias" or 40 hex characters
    std::optional<Address> ResolveAddress(const std::string& token) const;

    ledger::TokenLedger& GetLedger() { return *ledger_; }
    voting::VotingEngine& GetEngine() { return *engine_; }

private:
    using Args = std::vector<std::string>;

    StepResult DoTime(const Args& args);
    StepResult DoAlias(const Args& args);
    StepResult DoMint(const Args& args);
    StepResult DoApprove(const Args& args);
    StepResult DoCreate(const Args& args);
    StepResult DoVote(const Args& args);
    StepResult DoFinalize(const Args& args);
    StepResult DoUnstake(const Args& args);
    StepResult DoExpect(const Args& args);
    StepResult DoShow(const Args& args);

    /// Absolute time, ISO 8601 or "+duration" relative to the clock
    std::optional<Timestamp> ParseTime(const std::string& token) const;

    bool SaveLedger(StepResult& result);

    std::shared_ptr<ledger::TokenLedger> ledger_;
    std::shared_ptr<voting::VotingEngine> engine_;
    std::shared_ptr<voting::VotingStore> store_;
    Timestamp now_;
    std::map<std::string, Address> aliases_;
};

} // namespace sim
} // namespace stakevote

#endif // STAKEVOTE_SIM_SCENARIO_H
