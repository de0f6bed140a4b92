#ifndef DIFFEO_STITCH_PATCH_NAME_HPP
#define DIFFEO_STITCH_PATCH_NAME_HPP
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <regex>
#include <stdexcept>
#include <string>

namespace Diffeo::Stitch::Details {
    // "<base>_H{row}_W{col}.png", offsets may be negative.
    struct PatchName {
        std::string base_id{};
        std::int64_t row_offset{0};
        std::int64_t col_offset{0};
    };

    inline PatchName parse_patch_name(const std::filesystem::path& path)
    {
        static const std::regex kOffsetPattern{R"(H(-?\d+)_W(-?\d+))"};
        const auto stem = path.stem().string();

        const auto begin = std::sregex_iterator(stem.begin(), stem.end(), kOffsetPattern);
        const auto end = std::sregex_iterator();
        const auto matches = std::distance(begin, end);
        if (matches != 1) {
            throw std::invalid_argument("Patch file '" + path.filename().string()
                                        + "' must carry exactly one H{row}_W{col} offset, found "
                                        + std::to_string(matches) + ".");
        }

        const std::smatch& match = *begin;
        PatchName name;
        try {
            name.row_offset = std::stoll(match[1].str());
            name.col_offset = std::stoll(match[2].str());
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Patch offset out of range in '" + path.filename().string() + "'.");
        }

        auto cut = static_cast<std::size_t>(match.position(0));
        if (cut > 0 && stem[cut - 1] == '_') {
            --cut;
        }
        name.base_id = stem.substr(0, cut) + stem.substr(static_cast<std::size_t>(match.position(0) + match.length(0)));
        return name;
    }
}

#endif // DIFFEO_STITCH_PATCH_NAME_HPP
