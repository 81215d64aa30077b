#pragma once
#include <filesystem>
#include <string>

namespace svcs {

namespace fs = std::filesystem;

/**
 * Resolved locations of the on-disk store, built once per invocation
 * and handed to every operation.
 *
 *   <workDir>/vcs/config.txt
 *   <workDir>/vcs/index.txt
 *   <workDir>/vcs/log.txt
 *   <workDir>/vcs/commits/<identifier>/...
 */
struct StoreContext {
    fs::path workDir;
    fs::path vcsDir;
    fs::path configFile;
    fs::path indexFile;
    fs::path logFile;
    fs::path commitsDir;

    // Resolves the layout under workDir and creates whatever is missing.
    static StoreContext open(const fs::path& workDir = ".");

    fs::path commitDir(const std::string& identifier) const;
};

}
