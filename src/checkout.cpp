#include "checkout.hpp"
#include "utils/file_utils.hpp"

#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace svcs {

namespace {

// A single directory name below commits/, nothing that walks out of it.
bool isPlainName(const std::string& identifier)
{
    if (identifier.empty() || identifier == "." || identifier == "..") return false;
    return identifier.find('/') == std::string::npos && identifier.find('\\') == std::string::npos;
}

// A file can be written at workDir/name unless a directory sits at the
// target or a regular file sits where one of its parent directories goes.
bool canRestore(const std::filesystem::path& workDir, const std::string& name)
{
    std::filesystem::path current = workDir;
    const std::filesystem::path relative(name);
    for (auto it = relative.begin(); it != relative.end(); ++it) {
        current /= *it;
        std::error_code ec;
        const auto status = std::filesystem::status(current, ec);
        if (!std::filesystem::exists(status)) return true;

        const bool last = std::next(it) == relative.end();
        if (last ? std::filesystem::is_directory(status) : !std::filesystem::is_directory(status))
            return false;
    }
    return true;
}

}

Result checkout(const StoreContext& ctx, const std::string& identifier)
{
    const std::filesystem::path dir = ctx.commitDir(identifier);
    if (!isPlainName(identifier) || !utils::FileUtils::directoryExists(dir)) {
        return Result::NotFound("Commit does not exist.");
    }

    const std::vector<std::string> names = utils::FileUtils::getFilesInDirectory(dir);
    for (const auto& name : names) {
        if (!canRestore(ctx.workDir, name))
            throw std::runtime_error("Cannot restore '" + name + "': path is blocked in the working directory");
    }

    for (const auto& name : names)
        utils::FileUtils::copyFile(dir / name, ctx.workDir / name, true);

    return Result::Restored("Switched to commit " + identifier + ".");
}

}
