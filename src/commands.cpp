#include "commands.hpp"
#include "checkout.hpp"
#include "commit.hpp"
#include "config.hpp"
#include "index_store.hpp"
#include "log_store.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace svcs {

namespace {

Result handleHelp(const StoreContext&, const std::vector<std::string>&) {
    return Result::Ok(helpText());
}

Result handleConfig(const StoreContext& ctx, const std::vector<std::string>& args) {
    switch (args.size()) {
        case 0: {
            const Config config = loadConfig(ctx);
            if (config.userName.empty()) {
                return Result::Ok("Please, tell me who you are.");
            }
            return Result::Ok("The username is " + config.userName + ".");
        }
        case 1:
            saveConfig(ctx, Config{args[0]});
            return Result::Ok("The username is " + args[0] + ".");
        default:
            return Result::InvalidArguments();
    }
}

Result handleAdd(const StoreContext& ctx, const std::vector<std::string>& args) {
    IndexStore index(ctx);
    switch (args.size()) {
        case 0: {
            const auto names = index.trackedNames();
            if (names.empty()) {
                return Result::Ok("Add a file to the index.");
            }
            std::string listing = "Tracked files:";
            for (const auto& name : names) listing += '\n' + name;
            return Result::Ok(listing);
        }
        case 1:
            return index.trackFile(args[0]);
        default:
            return Result::InvalidArguments();
    }
}

Result handleLog(const StoreContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Result::InvalidArguments();
    }
    const std::string entries = LogStore(ctx).allEntries();
    return Result::Ok(entries.empty() ? "No commits yet." : entries);
}

Result handleCommit(const StoreContext& ctx, const std::vector<std::string>& args) {
    switch (args.size()) {
        case 0:
            return Result::MessageMissing("Message was not passed.");
        case 1:
            return CommitStore(ctx).commit(args[0]);
        default:
            return Result::InvalidArguments();
    }
}

Result handleCheckout(const StoreContext& ctx, const std::vector<std::string>& args) {
    switch (args.size()) {
        case 0:
            return Result::MessageMissing("Commit id was not passed.");
        case 1:
            return checkout(ctx, args[0]);
        default:
            return Result::InvalidArguments();
    }
}

}

// Rows are in CommandKind order; execute() indexes by kind.
const std::vector<CommandSpec>& commandTable() {
    static const std::vector<CommandSpec> table = {
        {CommandKind::Help,     "--help",   "Show commands",            handleHelp},
        {CommandKind::Config,   "config",   "Get and set a username.",  handleConfig},
        {CommandKind::Add,      "add",      "Add a file to the index.", handleAdd},
        {CommandKind::Log,      "log",      "Show commit logs.",        handleLog},
        {CommandKind::Commit,   "commit",   "Save changes.",            handleCommit},
        {CommandKind::Checkout, "checkout", "Restore a file.",          handleCheckout},
    };
    return table;
}

std::optional<CommandKind> parseCommand(const std::string& word) {
    const auto& table = commandTable();
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const CommandSpec& spec) { return spec.word == word; });
    if (it == table.end()) return std::nullopt;
    return it->kind;
}

std::string helpText() {
    std::ostringstream out;
    out << "These are SVCS commands:";
    for (const auto& spec : commandTable()) {
        if (spec.kind == CommandKind::Help) continue;
        out << '\n' << std::left << std::setw(11) << spec.word << spec.description;
    }
    return out.str();
}

Result execute(CommandKind kind, const StoreContext& ctx, const std::vector<std::string>& args) {
    return commandTable()[static_cast<size_t>(kind)].handler(ctx, args);
}

Result run(const std::vector<std::string>& commandLine, const fs::path& workDir) {
    if (commandLine.empty()) {
        return Result::Ok(helpText());
    }

    const auto kind = parseCommand(commandLine.front());
    if (!kind) {
        return Result::UnknownCommand(commandLine.front());
    }

    const StoreContext ctx = StoreContext::open(workDir);
    const std::vector<std::string> args(commandLine.begin() + 1, commandLine.end());
    return execute(*kind, ctx, args);
}

}
