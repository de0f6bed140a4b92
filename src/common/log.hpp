#ifndef DIFFEO_COMMON_LOG_HPP
#define DIFFEO_COMMON_LOG_HPP
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "../utils/terminal.hpp"

namespace Diffeo::Common::Log {
    // Append-only text log. Every line goes to the file; lines are echoed to the console stream when one is set.
    class MetricLog {
    public:
        MetricLog() = default;

        explicit MetricLog(std::filesystem::path path, std::ostream* console = &std::cout)
            : path_(std::move(path)), console_(console)
        {
            if (!path_.empty() && path_.has_parent_path()) {
                std::filesystem::create_directories(path_.parent_path());
            }
        }

        void write(const std::string& line, bool to_console = true, std::string_view color = {}) const
        {
            if (!path_.empty()) {
                std::ofstream file(path_, std::ios::app);
                if (!file) {
                    throw std::runtime_error("Failed to open metric log '" + path_.string() + "' for appending.");
                }
                file << Utils::Terminal::StripColor(line) << '\n';
            }
            if (to_console && console_ != nullptr) {
                if (!color.empty()) {
                    *console_ << Utils::Terminal::ApplyColor(line, color) << std::endl;
                } else {
                    *console_ << line << std::endl;
                }
            }
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
        [[nodiscard]] std::ostream* console() const noexcept { return console_; }

    private:
        std::filesystem::path path_{};
        std::ostream* console_{nullptr};
    };
}

#endif // DIFFEO_COMMON_LOG_HPP
