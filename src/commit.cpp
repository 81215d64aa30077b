#include "commit.hpp"
#include "config.hpp"
#include "index_store.hpp"
#include "log_store.hpp"
#include "utils/file_utils.hpp"

#include <filesystem>
#include <stdexcept>

namespace svcs {

void writeSnapshot(const std::filesystem::path& dir, const std::vector<TrackedFile>& files)
{
    std::filesystem::path staging = dir;
    staging += ".partial";
    std::filesystem::remove_all(staging);   // leftover of an interrupted commit

    try {
        std::filesystem::create_directories(staging);
        for (const auto& f : files) {
            const std::filesystem::path target = staging / f.name;
            std::filesystem::create_directories(target.parent_path());
            if (!utils::FileUtils::writeFile(target, f.content)) {
                throw std::runtime_error("Failed to write " + target.string());
            }
        }
        std::filesystem::rename(staging, dir);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove_all(staging, ec);
        throw;
    }
}

CommitStore::CommitStore(const StoreContext& ctx) : ctx_(ctx) {}

Result CommitStore::commit(const std::string& message)
{
    const std::vector<TrackedFile> files = IndexStore(ctx_).currentTrackedFiles();
    const std::string identifier         = computeIdentifier(files);

    LogStore log(ctx_);
    if (files.empty() || log.latestIs(identifier)) {
        return Result::NothingToCommit();
    }

    const std::filesystem::path dir = ctx_.commitDir(identifier);
    if (!std::filesystem::exists(dir)) {
        writeSnapshot(dir, files);
    }

    log.prepend(LogEntry{identifier, loadConfig(ctx_).userName, message});

    return Result::Created("Changes are committed.");
}

}
