#pragma once
#include <string>

namespace svcs {

enum class Status {
    Ok,
    Created,
    Restored,
    NothingToCommit,
    MessageMissing,
    NotFound,
    InvalidArguments,
    UnknownCommand
};

/**
 * Outcome of a command: a status and the single line shown to the user.
 */
struct Result {
    Status status;
    std::string message;

    Result(Status s, const std::string& m) : status(s), message(m) {}

    bool ok() const {
        return status == Status::Ok || status == Status::Created || status == Status::Restored;
    }

    static Result Ok(const std::string& message) {
        return Result(Status::Ok, message);
    }

    static Result Created(const std::string& message) {
        return Result(Status::Created, message);
    }

    static Result Restored(const std::string& message) {
        return Result(Status::Restored, message);
    }

    static Result NothingToCommit() {
        return Result(Status::NothingToCommit, "Nothing to commit.");
    }

    static Result MessageMissing(const std::string& message) {
        return Result(Status::MessageMissing, message);
    }

    static Result NotFound(const std::string& message) {
        return Result(Status::NotFound, message);
    }

    static Result InvalidArguments() {
        return Result(Status::InvalidArguments, "Too many arguments for the inputted command.");
    }

    static Result UnknownCommand(const std::string& command) {
        return Result(Status::UnknownCommand, "'" + command + "' is not a SVCS command.");
    }
};

}
