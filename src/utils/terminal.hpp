#ifndef DIFFEO_UTILS_TERMINAL_HPP
#define DIFFEO_UTILS_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace Diffeo::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kYellow        = "\033[33m";
        inline constexpr std::string_view kBrightCyan    = "\033[96m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kPlusMinus = "±";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Strips SGR sequences so colored console lines can be mirrored into plain log files.
    inline std::string StripColor(std::string_view s) {
        std::string out; out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\033' && i + 1 < s.size() && s[i + 1] == '[') {
                std::size_t j = i + 2;
                while (j < s.size() && s[j] != 'm' && s[j] != 'K') {
                    ++j;
                }
                i = j;
                continue;
            }
            out.push_back(s[i]);
        }
        return out;
    }
}

#endif // DIFFEO_UTILS_TERMINAL_HPP
