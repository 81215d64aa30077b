#include "store_context.hpp"

#include <fstream>
#include <stdexcept>

namespace svcs {

namespace {

const char* const VCS_DIR_NAME     = "vcs";
const char* const COMMITS_DIR_NAME = "commits";
const char* const CONFIG_FILE_NAME = "config.txt";
const char* const INDEX_FILE_NAME  = "index.txt";
const char* const LOG_FILE_NAME    = "log.txt";

void touch(const fs::path& file) {
    if (fs::exists(file)) return;
    std::ofstream out(file);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create " + file.string());
    }
}

}

StoreContext StoreContext::open(const fs::path& workDir) {
    StoreContext ctx;
    ctx.workDir    = fs::absolute(workDir).lexically_normal();
    if (!ctx.workDir.has_filename()) ctx.workDir = ctx.workDir.parent_path();   // "dir/." -> "dir"
    ctx.vcsDir     = ctx.workDir / VCS_DIR_NAME;
    ctx.configFile = ctx.vcsDir / CONFIG_FILE_NAME;
    ctx.indexFile  = ctx.vcsDir / INDEX_FILE_NAME;
    ctx.logFile    = ctx.vcsDir / LOG_FILE_NAME;
    ctx.commitsDir = ctx.vcsDir / COMMITS_DIR_NAME;

    fs::create_directories(ctx.commitsDir);
    touch(ctx.configFile);
    touch(ctx.indexFile);
    touch(ctx.logFile);

    return ctx;
}

fs::path StoreContext::commitDir(const std::string& identifier) const {
    return commitsDir / identifier;
}

}
