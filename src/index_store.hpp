#pragma once
#include "content_hasher.hpp"
#include "result.hpp"
#include "store_context.hpp"
#include <optional>
#include <string>
#include <vector>

namespace svcs {

/**
 * The tracked file list, persisted one entry per line in vcs/index.txt
 * in the order files were first added.
 *
 * Entries whose file has disappeared from the working directory are
 * skipped when reading and dropped the next time the index is rewritten.
 */
class IndexStore {
public:
    explicit IndexStore(const StoreContext& ctx);

    // Listed entries that still resolve to regular files, in index order.
    std::vector<std::string> trackedNames() const;

    // Same set as trackedNames(), with contents loaded. Files that can't
    // be read are left out with a warning on stderr.
    std::vector<TrackedFile> currentTrackedFiles() const;

    /**
     * Adds path to the index unless already listed, then rewrites the index.
     * @return Ok when tracked (or already tracked), NotFound otherwise
     */
    Result trackFile(const std::string& path);

private:
    const StoreContext& ctx_;

    // Index entry for a user path: relative to the working directory,
    // normalized, '/'-separated. Empty when it points outside of it
    // or into the store itself.
    std::optional<std::string> toEntry(const std::string& path) const;

    // Entry lies under vcs/; the store never snapshots its own files.
    bool insideStore(const std::string& entry) const;

    void writeIndex(const std::vector<std::string>& names);
};

}
