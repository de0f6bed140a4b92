#ifndef DIFFEO_UTILS_FILES_HPP
#define DIFFEO_UTILS_FILES_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace Diffeo::Utils::Files {
    inline bool has_extension(const std::filesystem::path& path, const std::string& extension)
    {
        auto ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return ext == extension;
    }

    // Sorted regular files with the given lower-case extension.
    inline std::vector<std::filesystem::path> collect(const std::filesystem::path& directory,
                                                      const std::string& extension = ".png",
                                                      bool recursive = false)
    {
        namespace fs = std::filesystem;
        if (!fs::exists(directory) || !fs::is_directory(directory)) {
            throw std::runtime_error("Folder not found: " + directory.string());
        }

        std::vector<fs::path> files;
        const auto add_if_supported = [&](const fs::directory_entry& entry) {
            if (entry.is_regular_file() && has_extension(entry.path(), extension)) {
                files.push_back(entry.path());
            }
        };
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(directory)) {
                add_if_supported(entry);
            }
        } else {
            for (const auto& entry : fs::directory_iterator(directory)) {
                add_if_supported(entry);
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    // Removes a folder with its contents and recreates it empty.
    inline void recreate_directory(const std::filesystem::path& directory)
    {
        if (directory.empty()) {
            throw std::invalid_argument("recreate_directory requires a non-empty path.");
        }
        std::filesystem::remove_all(directory);
        std::filesystem::create_directories(directory);
    }
}

#endif // DIFFEO_UTILS_FILES_HPP
