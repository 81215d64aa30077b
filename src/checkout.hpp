#pragma once
#include "result.hpp"
#include "store_context.hpp"
#include <string>

namespace svcs {

// Copies every file of vcs/commits/<identifier>/ over the working directory.
// The identifier is looked up literally; Restored or NotFound. Throws
// std::runtime_error, before writing anything, when a directory occupies a
// target path or a file occupies one of its parent directories.
Result checkout(const StoreContext& ctx, const std::string& identifier);

}
