#pragma once
#include "store_context.hpp"
#include <string>

namespace svcs {

struct LogEntry {
    std::string identifier;
    std::string author;
    std::string message;

    // "commit <id>\nAuthor: <name>\n<message>\n\n"
    std::string format() const;
};

/**
 * Newest-first text ledger of commits in vcs/log.txt.
 * Entries are only ever prepended; nothing is reordered or removed.
 */
class LogStore {
public:
    explicit LogStore(const StoreContext& ctx);

    std::string allEntries() const;

    // True when the most recent entry records this identifier.
    bool latestIs(const std::string& identifier) const;

    void prepend(const LogEntry& entry);

private:
    const StoreContext& ctx_;
};

}
