#ifndef DIFFEO_ORIENTATION_DIHEDRAL_HPP
#define DIFFEO_ORIENTATION_DIHEDRAL_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Diffeo::Orientation::Details {
    // One element of the dihedral group of order 8.
    // Applied as: mirror the width axis (if flip), then rotate by quarter_turns * 90 degrees
    // counter-clockwise in the (H, W) plane.
    struct FlipRotation {
        bool flip{false};
        int quarter_turns{0};

        friend constexpr bool operator==(const FlipRotation&, const FlipRotation&) = default;
    };

    [[nodiscard]] constexpr FlipRotation inverse(FlipRotation element) noexcept {
        // Every reflection of the square is an involution; rotations invert by turning back.
        if (element.flip) {
            return element;
        }
        return FlipRotation{false, (4 - element.quarter_turns % 4) % 4};
    }

    // Enumeration order is the tie-break order of the matcher.
    inline constexpr std::array<FlipRotation, 8> kDihedralGroup{{
        {false, 0}, {false, 1}, {false, 2}, {false, 3},
        {true, 0},  {true, 1},  {true, 2},  {true, 3},
    }};

    inline constexpr std::array<FlipRotation, 8> kDihedralInverses = [] {
        std::array<FlipRotation, 8> inverses{};
        for (std::size_t index = 0; index < kDihedralGroup.size(); ++index) {
            inverses[index] = inverse(kDihedralGroup[index]);
        }
        return inverses;
    }();

    inline std::string to_string(FlipRotation element) {
        return std::string(element.flip ? "flip+" : "") + "rot" + std::to_string(90 * element.quarter_turns);
    }

    // Works on any tensor of rank >= 2; the last two axes are (H, W).
    [[nodiscard]] inline torch::Tensor apply(const torch::Tensor& image, FlipRotation element) {
        if (!image.defined() || image.dim() < 2) {
            throw std::invalid_argument("Flip/rotation requires a tensor with at least two spatial axes.");
        }
        const auto rank = image.dim();
        const auto turns = ((element.quarter_turns % 4) + 4) % 4;
        if (turns % 2 == 1 && image.size(rank - 2) != image.size(rank - 1)) {
            throw std::invalid_argument("Quarter-turn rotations require square images.");
        }

        auto transformed = element.flip ? image.flip({rank - 1}) : image;
        if (turns != 0) {
            transformed = torch::rot90(transformed, turns, {rank - 2, rank - 1});
        }
        return transformed;
    }

    // One element per batch entry of a [B, C, H, W] tensor.
    [[nodiscard]] inline torch::Tensor apply_batch(const torch::Tensor& images, const std::vector<FlipRotation>& elements) {
        if (!images.defined() || images.dim() != 4) {
            throw std::invalid_argument("Batched flip/rotation expects a [B, C, H, W] tensor.");
        }
        if (static_cast<int64_t>(elements.size()) != images.size(0)) {
            throw std::invalid_argument("Batched flip/rotation needs exactly one transform per batch element.");
        }
        std::vector<torch::Tensor> transformed;
        transformed.reserve(elements.size());
        for (std::size_t index = 0; index < elements.size(); ++index) {
            transformed.push_back(apply(images[static_cast<int64_t>(index)], elements[index]));
        }
        return torch::stack(transformed, 0);
    }
}

#endif // DIFFEO_ORIENTATION_DIHEDRAL_HPP
