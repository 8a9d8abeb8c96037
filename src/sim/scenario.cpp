// STAKEVOTE - Scenario Runner Implementation
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include "stakevote/sim/scenario.h"
#include "stakevote/util/logging.h"
#include "stakevote/util/time.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>

namespace stakevote {
namespace sim {

using voting::VoteError;
using voting::VoteErrorToString;

namespace {

/// Split a line into whitespace-separated tokens, dropping any '#' comment
std::vector<std::string> Tokenize(const std::string& line) {
    std::string content = line.substr(0, line.find('#'));
    std::istringstream ss(content);
    std::vector<std::string> tokens;
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool ParseInt64(const std::string& str, int64_t& out) {
    if (str.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(str.c_str(), &end, 10);
    if (errno != 0 || end != str.c_str() + str.size()) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

bool ParseProjectId(const std::string& str, ProjectId& out) {
    if (str.empty() || str[0] == '-' || str[0] == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(str.c_str(), &end, 10);
    if (errno != 0 || end != str.c_str() + str.size()) {
        return false;
    }
    out = static_cast<ProjectId>(value);
    return true;
}

StepResult Malformed(const std::string& message) {
    StepResult result;
    result.ok = false;
    result.malformed = true;
    result.message = message;
    return result;
}

StepResult FromVoteError(VoteError error, const std::string& what) {
    StepResult result;
    result.ok = error == VoteError::OK;
    result.error = error;
    result.message = what + ": " + VoteErrorToString(error);
    return result;
}

std::string Join(const std::vector<std::string>& parts, size_t from) {
    std::string out;
    for (size_t i = from; i < parts.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += parts[i];
    }
    return out;
}

} // namespace

ScenarioRunner::ScenarioRunner(std::shared_ptr<ledger::TokenLedger> ledger,
                               std::shared_ptr<voting::VotingEngine> engine,
                               std::shared_ptr<voting::VotingStore> store,
                               Timestamp startTime)
    : ledger_(std::move(ledger))
    , engine_(std::move(engine))
    , store_(std::move(store))
    , now_(startTime) {}

// ============================================================================
// Script Execution
// ============================================================================

StepResult ScenarioRunner::Execute(const std::string& line) {
    Args args = Tokenize(line);
    if (args.empty()) {
        return StepResult();
    }

    bool expectFailure = false;
    if (args[0][0] == '!') {
        expectFailure = true;
        args[0].erase(0, 1);
        if (args[0].empty()) {
            args.erase(args.begin());
        }
        if (args.empty()) {
            return Malformed("'!' without a command");
        }
    }

    const std::string command = args[0];
    LOG_DEBUG(util::LogCategory::SIM) << "[" << util::FormatISO8601(now_) << "] "
                                      << Join(args, 0);

    StepResult result;
    if (command == "time") {
        result = DoTime(args);
    } else if (command == "alias") {
        result = DoAlias(args);
    } else if (command == "mint") {
        result = DoMint(args);
    } else if (command == "approve") {
        result = DoApprove(args);
    } else if (command == "create") {
        result = DoCreate(args);
    } else if (command == "vote") {
        result = DoVote(args);
    } else if (command == "finalize") {
        result = DoFinalize(args);
    } else if (command == "unstake") {
        result = DoUnstake(args);
    } else if (command == "expect") {
        if (expectFailure) {
            return Malformed("'!' cannot be applied to expect");
        }
        result = DoExpect(args);
    } else if (command == "show") {
        result = DoShow(args);
    } else {
        return Malformed("unknown command '" + command + "'");
    }

    if (!expectFailure || result.malformed) {
        return result;
    }
    if (result.ok) {
        result.ok = false;
        result.message = "expected failure, got " + result.message;
    } else {
        result.ok = true;
        result.message = "failed as expected, " + result.message;
    }
    return result;
}

RunResult ScenarioRunner::Run(std::istream& in, std::ostream* out) {
    RunResult run;
    std::string line;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (Tokenize(line).empty()) {
            continue;
        }
        ++run.commands;

        StepResult step = Execute(line);
        if (out) {
            *out << Join(Tokenize(line), 0) << "  -> " << step.message << "\n";
        }
        if (!step.ok) {
            run.success = false;
            run.failedLine = lineNo;
            run.message = "line " + std::to_string(lineNo) + ": " + step.message;
            LOG_WARN(util::LogCategory::SIM) << "Scenario stopped at " << run.message;
            return run;
        }
    }

    run.message = std::to_string(run.commands) + " commands passed";
    return run;
}

RunResult ScenarioRunner::RunFile(const std::filesystem::path& path, std::ostream* out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        RunResult run;
        run.success = false;
        run.message = "cannot open scenario " + path.string();
        return run;
    }
    LOG_INFO(util::LogCategory::SIM) << "Running scenario " << path.string();
    return Run(file, out);
}

// ============================================================================
// Helpers
// ============================================================================

void ScenarioRunner::SetAlias(const std::string& name, const Address& addr) {
    aliases_[name] = addr;
}

std::optional<Address> ScenarioRunner::ResolveAddress(const std::string& token) const {
    if (!token.empty() && token[0] == '@') {
        auto it = aliases_.find(token.substr(1));
        if (it == aliases_.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    Address addr;
    if (!Address::TryParseHex(token, addr)) {
        return std::nullopt;
    }
    return addr;
}

std::optional<Timestamp> ScenarioRunner::ParseTime(const std::string& token) const {
    if (!token.empty() && token[0] == '+') {
        auto delta = util::ParseDuration(token.substr(1));
        if (!delta || now_ > std::numeric_limits<Timestamp>::max() - *delta) {
            return std::nullopt;
        }
        return now_ + *delta;
    }
    int64_t absolute = 0;
    if (ParseInt64(token, absolute)) {
        return absolute;
    }
    return util::ParseISO8601(token);
}

bool ScenarioRunner::SaveLedger(StepResult& result) {
    if (!store_) {
        return true;
    }
    db::Status s = store_->SaveLedger(ledger_->Export());
    if (!s.ok()) {
        result.ok = false;
        result.error = VoteError::StorageError;
        result.message += " (ledger not saved: " + s.ToString() + ")";
        return false;
    }
    return true;
}

// ============================================================================
// Commands
// ============================================================================

StepResult ScenarioRunner::DoTime(const Args& args) {
    if (args.size() != 2) {
        return Malformed("usage: time <unix-seconds|ISO8601|+duration>");
    }
    auto when = ParseTime(args[1]);
    if (!when) {
        return Malformed("bad time '" + args[1] + "'");
    }
    now_ = *when;

    StepResult result;
    result.message = "clock " + util::FormatISO8601(now_);
    return result;
}

StepResult ScenarioRunner::DoAlias(const Args& args) {
    if (args.size() != 3 || args[1].empty() || args[1][0] == '@') {
        return Malformed("usage: alias <name> <hex>");
    }
    Address addr;
    if (!Address::TryParseHex(args[2], addr)) {
        return Malformed("bad address '" + args[2] + "'");
    }
    SetAlias(args[1], addr);

    StepResult result;
    result.message = "@" + args[1] + " = " + addr.ToShortString();
    return result;
}

StepResult ScenarioRunner::DoMint(const Args& args) {
    if (args.size() != 3) {
        return Malformed("usage: mint <addr> <amount>");
    }
    auto to = ResolveAddress(args[1]);
    int64_t amount = 0;
    if (!to || !ParseInt64(args[2], amount)) {
        return Malformed("bad mint arguments");
    }

    StepResult result;
    result.ok = ledger_->Mint(*to, amount);
    result.message = result.ok ? "minted " + std::to_string(amount) : "mint rejected";
    SaveLedger(result);
    return result;
}

StepResult ScenarioRunner::DoApprove(const Args& args) {
    if (args.size() != 3) {
        return Malformed("usage: approve <addr> <amount>");
    }
    auto owner = ResolveAddress(args[1]);
    int64_t amount = 0;
    if (!owner || !ParseInt64(args[2], amount)) {
        return Malformed("bad approve arguments");
    }

    StepResult result;
    result.ok = ledger_->Approve(*owner, ledger_->GetCustody(), amount);
    result.message = result.ok ? "allowance " + std::to_string(amount) : "approve rejected";
    SaveLedger(result);
    return result;
}

StepResult ScenarioRunner::DoCreate(const Args& args) {
    if (args.size() < 4) {
        return Malformed("usage: create <start> <duration> <name> [description...]");
    }
    auto start = ParseTime(args[1]);
    auto duration = util::ParseDuration(args[2]);
    if (!start || !duration) {
        return Malformed("bad create schedule");
    }

    ProjectId id = 0;
    VoteError err = engine_->CreateProject(engine_->GetAdmin(), args[3], Join(args, 4),
                                           *start, *duration, now_, &id);
    StepResult result = FromVoteError(err, "create");
    if (result.ok) {
        result.message += " project " + std::to_string(id);
    }
    return result;
}

StepResult ScenarioRunner::DoVote(const Args& args) {
    if (args.size() != 4) {
        return Malformed("usage: vote <addr> <project> <amount>");
    }
    auto voter = ResolveAddress(args[1]);
    ProjectId id = 0;
    int64_t amount = 0;
    if (!voter || !ParseProjectId(args[2], id) || !ParseInt64(args[3], amount)) {
        return Malformed("bad vote arguments");
    }

    // The engine commits the ledger in the same batch as the stake
    return FromVoteError(engine_->Vote(*voter, id, amount, now_), "vote");
}

StepResult ScenarioRunner::DoFinalize(const Args& args) {
    if (args.size() != 2 && args.size() != 3) {
        return Malformed("usage: finalize <project> [caller]");
    }
    ProjectId id = 0;
    if (!ParseProjectId(args[1], id)) {
        return Malformed("bad project id '" + args[1] + "'");
    }
    Address caller = engine_->GetAdmin();
    if (args.size() == 3) {
        auto addr = ResolveAddress(args[2]);
        if (!addr) {
            return Malformed("bad address '" + args[2] + "'");
        }
        caller = *addr;
    }

    StepResult result = FromVoteError(engine_->FinalizeProject(caller, id, now_), "finalize");
    if (result.ok) {
        auto project = engine_->GetProject(id);
        if (project) {
            result.message += " winner " + project->winner.ToShortString();
        }
    }
    return result;
}

StepResult ScenarioRunner::DoUnstake(const Args& args) {
    if (args.size() != 3) {
        return Malformed("usage: unstake <addr> <project>");
    }
    auto voter = ResolveAddress(args[1]);
    ProjectId id = 0;
    if (!voter || !ParseProjectId(args[2], id)) {
        return Malformed("bad unstake arguments");
    }

    Amount payout = 0;
    StepResult result = FromVoteError(engine_->UnstakeTokens(*voter, id, now_, &payout),
                                      "unstake");
    if (result.ok) {
        result.message += " payout " + std::to_string(payout);
    }
    return result;
}

StepResult ScenarioRunner::DoExpect(const Args& args) {
    if (args.size() < 2) {
        return Malformed("usage: expect <balance|stake|unstakeable|winner|total|votes> ...");
    }
    const std::string& what = args[1];

    auto compare = [](int64_t actual, int64_t expected) {
        StepResult result;
        result.ok = actual == expected;
        result.message = result.ok ? "ok " + std::to_string(actual)
                                   : "expected " + std::to_string(expected) +
                                     ", got " + std::to_string(actual);
        return result;
    };

    if (what == "balance" || what == "total") {
        auto addr = args.size() == 4 ? ResolveAddress(args[2]) : std::nullopt;
        int64_t expected = 0;
        if (!addr || !ParseInt64(args[3], expected)) {
            return Malformed("usage: expect " + what + " <addr> <value>");
        }
        Amount actual = what == "balance" ? ledger_->BalanceOf(*addr)
                                          : engine_->GetTotalStaked(*addr);
        return compare(actual, expected);
    }

    if (what == "stake" || what == "unstakeable") {
        ProjectId id = 0;
        auto addr = args.size() == 5 ? ResolveAddress(args[3]) : std::nullopt;
        int64_t expected = 0;
        if (!addr || !ParseProjectId(args[2], id) || !ParseInt64(args[4], expected)) {
            return Malformed("usage: expect " + what + " <project> <addr> <value>");
        }
        Amount actual = 0;
        if (what == "stake") {
            auto stake = engine_->GetStake(id, *addr);
            actual = stake ? stake->amount : 0;
        } else {
            actual = engine_->GetUnstakeableBalance(id, *addr, now_);
        }
        return compare(actual, expected);
    }

    if (what == "votes") {
        ProjectId id = 0;
        int64_t expected = 0;
        if (args.size() != 4 || !ParseProjectId(args[2], id) || !ParseInt64(args[3], expected)) {
            return Malformed("usage: expect votes <project> <value>");
        }
        auto project = engine_->GetProject(id);
        return compare(project ? project->totalVotes : 0, expected);
    }

    if (what == "winner") {
        ProjectId id = 0;
        auto addr = args.size() == 4 ? ResolveAddress(args[3]) : std::nullopt;
        if (!addr || !ParseProjectId(args[2], id)) {
            return Malformed("usage: expect winner <project> <addr>");
        }
        StepResult result;
        auto project = engine_->GetProject(id);
        if (!project || !project->isFinalized) {
            result.ok = false;
            result.message = "project " + args[2] + " has no winner";
        } else if (project->winner != *addr) {
            result.ok = false;
            result.message = "expected winner " + addr->ToShortString() +
                             ", got " + project->winner.ToShortString();
        } else {
            result.message = "ok winner " + addr->ToShortString();
        }
        return result;
    }

    return Malformed("unknown expectation '" + what + "'");
}

StepResult ScenarioRunner::DoShow(const Args& args) {
    ProjectId id = 0;
    if (args.size() != 2 || !ParseProjectId(args[1], id)) {
        return Malformed("usage: show <project>");
    }
    VoteError err = VoteError::OK;
    auto project = engine_->GetProject(id, &err);
    if (!project) {
        return FromVoteError(err, "show");
    }

    StepResult result;
    result.message = project->ToString() + " status " +
                     voting::ProjectStatusToString(project->GetStatus(now_));
    return result;
}

} // namespace sim
} // namespace stakevote
