#ifndef DIFFEO_ORIENTATION_MATCHER_HPP
#define DIFFEO_ORIENTATION_MATCHER_HPP

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "dihedral.hpp"
#include "ncc.hpp"

namespace Diffeo::Orientation::Details {
    struct Alignment {
        std::vector<FlipRotation> forward{};  // moving -> fixed
        std::vector<FlipRotation> reverse{};  // fixed -> moving
        std::vector<std::size_t> candidate{}; // index into kDihedralGroup
        torch::Tensor scores;                 // [8, B]
    };

    // Exhaustive search over kDihedralGroup. Gradient-free.
    // Ties keep the earliest candidate in enumeration order.
    [[nodiscard]] inline Alignment best_alignment(const torch::Tensor& fixed,
                                                  const torch::Tensor& moving,
                                                  const NCCOptions& options = {}) {
        if (!fixed.defined() || !moving.defined() || fixed.sizes() != moving.sizes()) {
            throw std::invalid_argument("Orientation matching requires fixed and moving images of identical shape.");
        }
        if (fixed.dim() != 4) {
            throw std::invalid_argument("Orientation matching expects [B, C, H, W] images.");
        }

        torch::NoGradGuard no_grad;
        std::vector<torch::Tensor> candidate_scores;
        candidate_scores.reserve(kDihedralGroup.size());
        for (const auto& element : kDihedralGroup) {
            candidate_scores.push_back(ncc_peak(fixed, apply(moving, element), options));
        }

        Alignment alignment;
        alignment.scores = torch::stack(candidate_scores, 0).to(torch::kCPU, torch::kDouble).contiguous();
        const auto batch = fixed.size(0);
        auto accessor = alignment.scores.accessor<double, 2>();

        alignment.forward.reserve(static_cast<std::size_t>(batch));
        alignment.reverse.reserve(static_cast<std::size_t>(batch));
        alignment.candidate.reserve(static_cast<std::size_t>(batch));
        for (int64_t b = 0; b < batch; ++b) {
            std::size_t best = 0;
            double best_score = -std::numeric_limits<double>::infinity();
            for (std::size_t index = 0; index < kDihedralGroup.size(); ++index) {
                const double score = accessor[static_cast<int64_t>(index)][b];
                if (score > best_score) {
                    best_score = score;
                    best = index;
                }
            }
            alignment.candidate.push_back(best);
            alignment.forward.push_back(kDihedralGroup[best]);
            alignment.reverse.push_back(kDihedralInverses[best]);
        }
        return alignment;
    }
}

#endif // DIFFEO_ORIENTATION_MATCHER_HPP
