#include "index_store.hpp"
#include "utils/file_utils.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace svcs {

IndexStore::IndexStore(const StoreContext& ctx) : ctx_(ctx) {}

std::vector<std::string> IndexStore::trackedNames() const {
    std::vector<std::string> names;
    for (const auto& line : utils::FileUtils::readLines(ctx_.indexFile)) {
        if (line.empty() || insideStore(line)) continue;
        if (!utils::FileUtils::fileExists(ctx_.workDir / line)) continue;
        names.push_back(line);
    }
    return names;
}

std::vector<TrackedFile> IndexStore::currentTrackedFiles() const {
    std::vector<TrackedFile> files;
    for (const auto& name : trackedNames()) {
        TrackedFile f;
        f.name = name;
        f.path = ctx_.workDir / name;
        try {
            f.content = utils::FileUtils::readFile(f.path);
        } catch (const std::exception& e) {
            std::cerr << "Warning: skipping " << name << ": " << e.what() << std::endl;
            continue;
        }
        files.push_back(std::move(f));
    }
    return files;
}

Result IndexStore::trackFile(const std::string& path) {
    const auto entry = toEntry(path);
    if (!entry || !utils::FileUtils::fileExists(ctx_.workDir / *entry)) {
        return Result::NotFound("Can't find '" + path + "'.");
    }

    auto names = trackedNames();
    if (std::find(names.begin(), names.end(), *entry) == names.end()) {
        names.push_back(*entry);
    }
    writeIndex(names);

    return Result::Ok("The file '" + path + "' is tracked.");
}

std::optional<std::string> IndexStore::toEntry(const std::string& path) const {
    if (path.empty()) return std::nullopt;

    std::filesystem::path candidate(path);
    if (candidate.is_relative()) {
        candidate = ctx_.workDir / candidate;
    }
    const auto relative = candidate.lexically_normal().lexically_relative(ctx_.workDir);
    if (relative.empty() || relative == ".") return std::nullopt;
    if (*relative.begin() == "..") return std::nullopt;

    const std::string entry = relative.generic_string();
    if (insideStore(entry)) return std::nullopt;
    return entry;
}

bool IndexStore::insideStore(const std::string& entry) const {
    const auto path = std::filesystem::path(entry).lexically_normal();
    return !path.empty() && *path.begin() == ctx_.vcsDir.filename();
}

void IndexStore::writeIndex(const std::vector<std::string>& names) {
    std::string content;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) content += '\n';
        content += names[i];
    }
    if (!utils::FileUtils::writeFile(ctx_.indexFile, content)) {
        throw std::runtime_error("Failed to write " + ctx_.indexFile.string());
    }
}

}
