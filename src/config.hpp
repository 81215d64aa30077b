#pragma once
#include "store_context.hpp"
#include <string>

namespace svcs {

struct Config {
    std::string userName;   // empty until set
};

Config loadConfig(const StoreContext& ctx);
void   saveConfig(const StoreContext& ctx, const Config& config);

}
