#include "log_store.hpp"
#include "utils/file_utils.hpp"

#include <stdexcept>

namespace svcs {

std::string LogEntry::format() const {
    return "commit " + identifier + '\n' +
           "Author: " + author + '\n' +
           message + '\n' +
           '\n';
}

LogStore::LogStore(const StoreContext& ctx) : ctx_(ctx) {}

std::string LogStore::allEntries() const {
    return utils::FileUtils::readFile(ctx_.logFile);
}

bool LogStore::latestIs(const std::string& identifier) const {
    const std::string log    = allEntries();
    const std::string header = "commit " + identifier;
    if (log.rfind(header, 0) != 0) return false;

    // header must be the whole first line
    return log.size() == header.size() || log[header.size()] == '\n' || log[header.size()] == '\r';
}

void LogStore::prepend(const LogEntry& entry) {
    const std::string updated = utils::FileUtils::trimEnd(entry.format() + allEntries());
    if (!utils::FileUtils::writeFile(ctx_.logFile, updated)) {
        throw std::runtime_error("Failed to write " + ctx_.logFile.string());
    }
}

}
