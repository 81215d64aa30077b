#pragma once
#include "result.hpp"
#include "store_context.hpp"
#include <optional>
#include <string>
#include <vector>

namespace svcs {

enum class CommandKind {
    Help,
    Config,
    Add,
    Log,
    Commit,
    Checkout
};

using CommandHandler = Result (*)(const StoreContext& ctx, const std::vector<std::string>& args);

struct CommandSpec {
    CommandKind    kind;
    std::string    word;          // as typed on the command line
    std::string    description;   // shown by --help
    CommandHandler handler;
};

// Every command, in the order --help lists them (also CommandKind order).
const std::vector<CommandSpec>& commandTable();

std::optional<CommandKind> parseCommand(const std::string& word);

std::string helpText();

// Runs the handler registered for kind. Argument count errors come back
// as InvalidArguments, never as exceptions.
Result execute(CommandKind kind, const StoreContext& ctx, const std::vector<std::string>& args);

/**
 * Runs a whole command line (without the program name) against workDir.
 * No command prints help; an unknown command is rejected before the
 * store is opened, so nothing is created on disk.
 */
Result run(const std::vector<std::string>& commandLine, const fs::path& workDir = ".");

}
