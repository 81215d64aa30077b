#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace svcs::utils {

class FileUtils {
public:
    // Whole file as raw bytes; throws std::runtime_error if it can't be opened.
    static std::string readFile(const std::filesystem::path& filePath);

    static bool writeFile(const std::filesystem::path& filePath, const std::string& content);

    static bool fileExists(const std::filesystem::path& filePath);

    static bool directoryExists(const std::filesystem::path& path);

    // Copies a regular file, creating parent directories of the target.
    static void copyFile(const std::filesystem::path& from, const std::filesystem::path& to,
                         bool overwrite);

    static std::vector<std::string> readLines(const std::filesystem::path& filePath);

    // Regular files below directory, relative to it, '/'-separated and sorted.
    static std::vector<std::string> getFilesInDirectory(const std::filesystem::path& directory);

    static std::string trimEnd(const std::string& text);
};

}
