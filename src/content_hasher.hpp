#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace svcs {

/* ---------- data structures ---------- */
struct TrackedFile {
    std::string           name;     // entry as listed in the index
    std::filesystem::path path;     // resolved location in the working directory
    std::string           content;  // raw bytes
};

/* ---------- hashing ---------- */
// SHA-256 over name + content of every file, in the given order.
std::string computeIdentifier(const std::vector<TrackedFile>& files);

}
