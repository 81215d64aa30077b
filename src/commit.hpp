#pragma once
#include "content_hasher.hpp"
#include "result.hpp"
#include "store_context.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace svcs {

// Writes files into <dir>.partial and renames it to dir once every file is
// in place, so dir is either complete or absent. Rethrows I/O errors after
// removing the staging directory.
void writeSnapshot(const std::filesystem::path& dir, const std::vector<TrackedFile>& files);

/**
 * Content-addressed snapshots under vcs/commits/<identifier>/.
 *
 * A commit is skipped when nothing is tracked or when the latest log
 * entry already carries the identifier of the current tracked set. Only
 * the latest entry is compared: recommitting an older snapshot logs it
 * again but reuses its existing directory.
 */
class CommitStore {
public:
    explicit CommitStore(const StoreContext& ctx);

    // Created or NothingToCommit.
    Result commit(const std::string& message);

private:
    const StoreContext& ctx_;
};

}
