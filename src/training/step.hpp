#ifndef DIFFEO_TRAINING_STEP_HPP
#define DIFFEO_TRAINING_STEP_HPP
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../data/data.hpp"
#include "../label/label.hpp"
#include "../model/model.hpp"
#include "../orientation/orientation.hpp"
#include "../warp/warp.hpp"

namespace Diffeo::Training {
    enum class PairingMode {
        Weak,   // both views come from the same sample
        Strong, // the annotated view is drawn from another sample of the batch
    };

    struct Views {
        torch::Tensor unannotated_images;
        torch::Tensor annotated_images;
        Label::Normalized unannotated_labels;
        Label::Normalized annotated_labels;
    };

    struct Registration {
        torch::Tensor forward_field;
        torch::Tensor reverse_field;
        torch::Tensor warped;    // U2A
        torch::Tensor cycled;    // U2A2U
        torch::Tensor projected; // A2U label
    };

    inline void seed_everything(std::uint64_t seed)
    {
        torch::manual_seed(seed);
        if (torch::cuda::is_available()) {
            torch::cuda::manual_seed_all(seed);
        }
    }

    [[nodiscard]] inline std::vector<std::int64_t> permutation(std::int64_t size, std::mt19937_64& generator)
    {
        std::vector<std::int64_t> order(static_cast<std::size_t>(size));
        std::iota(order.begin(), order.end(), std::int64_t{0});
        std::shuffle(order.begin(), order.end(), generator);
        return order;
    }

    [[nodiscard]] inline Views split_views(const Data::PairBatch& batch,
                                           PairingMode mode,
                                           std::mt19937_64& generator,
                                           const torch::Device& device)
    {
        Data::Details::validate(batch);
        auto images = batch.images;
        auto labels = batch.labels;

        torch::Tensor annotated_images = images.select(1, Data::kAnnotatedView);
        torch::Tensor annotated_labels = labels.select(1, Data::kAnnotatedView);
        if (mode == PairingMode::Strong) {
            const auto order = torch::tensor(permutation(images.size(0), generator), torch::kLong);
            annotated_images = images.index_select(0, order).select(1, Data::kAnnotatedView);
            annotated_labels = labels.index_select(0, order).select(1, Data::kAnnotatedView);
        }

        auto [annotated, unannotated] = Label::classify_pair(annotated_labels, labels.select(1, Data::kUnannotatedView));

        Views views;
        views.unannotated_images = images.select(1, Data::kUnannotatedView).to(device, torch::kFloat32);
        views.annotated_images = annotated_images.to(device, torch::kFloat32);
        views.unannotated_labels = {unannotated.kind, unannotated.tensor.to(device)};
        views.annotated_labels = {annotated.kind, annotated.tensor.to(device)};
        return views;
    }

    // Brings the annotated view into the unannotated frame before registration.
    inline void prealign(Views& views, const Orientation::NCCOptions& options = {})
    {
        const auto alignment = Orientation::BestAlignment(views.unannotated_images, views.annotated_images, options);
        views.annotated_images = Orientation::Apply(views.annotated_images, alignment.forward);
        views.annotated_labels.tensor = Orientation::Apply(views.annotated_labels.tensor, alignment.forward);
    }

    // One forward pass: predict both fields, warp U onto A and back, project the annotated label onto U.
    [[nodiscard]] inline Registration register_pair(Model::PredictorImpl& predictor,
                                                    const torch::Tensor& annotated_images,
                                                    const torch::Tensor& unannotated_images,
                                                    const torch::Tensor& annotated_labels,
                                                    Label::Kind kind)
    {
        const auto prediction = predictor.predict(torch::cat({annotated_images, unannotated_images}, 1));
        auto fields = Warp::Split(prediction);

        Registration result;
        result.warped = Warp::Apply(unannotated_images, fields.forward);
        result.cycled = Warp::Apply(result.warped, fields.reverse);
        result.projected = Warp::Apply(annotated_labels, fields.reverse);
        if (kind == Label::Kind::Binary) {
            result.projected = Label::threshold(result.projected);
        }
        result.forward_field = std::move(fields.forward);
        result.reverse_field = std::move(fields.reverse);
        return result;
    }
}

#endif // DIFFEO_TRAINING_STEP_HPP
