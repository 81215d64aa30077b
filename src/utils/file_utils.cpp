#include "file_utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace svcs::utils {

std::string FileUtils::readFile(const std::filesystem::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool FileUtils::writeFile(const std::filesystem::path& filePath, const std::string& content) {
    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

bool FileUtils::fileExists(const std::filesystem::path& filePath) {
    std::error_code ec;
    return std::filesystem::is_regular_file(filePath, ec);
}

bool FileUtils::directoryExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

void FileUtils::copyFile(const std::filesystem::path& from, const std::filesystem::path& to,
                         bool overwrite) {
    if (to.has_parent_path()) {
        std::filesystem::create_directories(to.parent_path());
    }
    auto options = overwrite ? std::filesystem::copy_options::overwrite_existing
                             : std::filesystem::copy_options::none;
    std::filesystem::copy_file(from, to, options);
}

std::vector<std::string> FileUtils::readLines(const std::filesystem::path& filePath) {
    std::istringstream in(readFile(filePath));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> FileUtils::getFilesInDirectory(const std::filesystem::path& directory) {
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(directory)) {
        if (!entry.is_regular_file()) continue;
        files.push_back(entry.path().lexically_relative(directory).generic_string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string FileUtils::trimEnd(const std::string& text) {
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return last == std::string::npos ? std::string() : text.substr(0, last + 1);
}

}
