#include "config.hpp"
#include "utils/file_utils.hpp"

#include <stdexcept>

namespace svcs {

Config loadConfig(const StoreContext& ctx) {
    Config config;
    const auto lines = utils::FileUtils::readLines(ctx.configFile);
    if (!lines.empty()) {
        config.userName = lines.front();
    }
    return config;
}

void saveConfig(const StoreContext& ctx, const Config& config) {
    if (!utils::FileUtils::writeFile(ctx.configFile, config.userName)) {
        throw std::runtime_error("Failed to write " + ctx.configFile.string());
    }
}

}
