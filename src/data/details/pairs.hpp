#ifndef DIFFEO_DATA_PAIRS_HPP
#define DIFFEO_DATA_PAIRS_HPP
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Diffeo::Data::Details {
    inline constexpr std::int64_t kUnannotatedView = 0;
    inline constexpr std::int64_t kAnnotatedView = 1;
    inline constexpr std::int64_t kViewCount = 2;

    // images [B, 2, C, H, W], labels [B, 2, ...]; view 0 is unannotated, view 1 annotated.
    struct PairBatch {
        std::vector<std::string> identifiers{};
        std::vector<std::string> identifiers2{};
        torch::Tensor images{};
        torch::Tensor labels{};
    };

    inline void validate(const PairBatch& batch)
    {
        if (!batch.images.defined() || !batch.labels.defined()) {
            throw std::invalid_argument("Pair batches require defined images and labels.");
        }
        if (batch.images.dim() != 5) {
            std::ostringstream message;
            message << "Pair batch images must be [B, 2, C, H, W], got " << batch.images.sizes();
            throw std::invalid_argument(message.str());
        }
        if (batch.images.size(1) != kViewCount || batch.labels.dim() < 2 || batch.labels.size(1) != kViewCount) {
            std::ostringstream message;
            message << "Pair batches must carry exactly " << kViewCount << " views per sample, got images "
                    << batch.images.sizes() << " and labels " << batch.labels.sizes();
            throw std::invalid_argument(message.str());
        }
        if (batch.labels.size(0) != batch.images.size(0)) {
            throw std::invalid_argument("Pair batch images and labels disagree on the batch size.");
        }
    }

    class PairLoader {
    public:
        virtual ~PairLoader() = default;
        virtual void reset() = 0;
        virtual std::optional<PairBatch> next() = 0;
        [[nodiscard]] virtual std::int64_t batches() const = 0;
        [[nodiscard]] virtual std::int64_t samples() const = 0;
    };

    // Serves batches out of tensors already held in memory.
    class TensorPairLoader final : public PairLoader {
    public:
        TensorPairLoader(torch::Tensor images,
                         torch::Tensor labels,
                         std::vector<std::string> identifiers,
                         std::vector<std::string> identifiers2,
                         std::int64_t batch_size,
                         bool shuffle = false,
                         std::uint64_t seed = 0)
            : images_(std::move(images)),
              labels_(std::move(labels)),
              identifiers_(std::move(identifiers)),
              identifiers2_(std::move(identifiers2)),
              batch_size_(batch_size),
              shuffle_(shuffle),
              generator_(seed)
        {
            if (batch_size_ <= 0) {
                throw std::invalid_argument("TensorPairLoader requires a positive batch size.");
            }
            validate(PairBatch{{}, {}, images_, labels_});
            const auto count = static_cast<std::size_t>(images_.size(0));
            if (identifiers_.empty()) {
                identifiers_.resize(count);
            }
            if (identifiers2_.empty()) {
                identifiers2_.resize(count);
            }
            if (identifiers_.size() != count || identifiers2_.size() != count) {
                throw std::invalid_argument("TensorPairLoader identifiers must match the number of samples.");
            }
            order_.resize(count);
            reset();
        }

        void reset() override
        {
            std::iota(order_.begin(), order_.end(), std::int64_t{0});
            if (shuffle_) {
                std::shuffle(order_.begin(), order_.end(), generator_);
            }
            cursor_ = 0;
        }

        std::optional<PairBatch> next() override
        {
            if (cursor_ >= order_.size()) {
                return std::nullopt;
            }
            const auto end = std::min(order_.size(), cursor_ + static_cast<std::size_t>(batch_size_));
            std::vector<std::int64_t> picked(order_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                                             order_.begin() + static_cast<std::ptrdiff_t>(end));
            cursor_ = end;

            const auto index = torch::tensor(picked, torch::kLong);
            PairBatch batch;
            batch.images = images_.index_select(0, index);
            batch.labels = labels_.index_select(0, index);
            for (const auto position : picked) {
                batch.identifiers.push_back(identifiers_[static_cast<std::size_t>(position)]);
                batch.identifiers2.push_back(identifiers2_[static_cast<std::size_t>(position)]);
            }
            return batch;
        }

        [[nodiscard]] std::int64_t batches() const override
        {
            return (samples() + batch_size_ - 1) / batch_size_;
        }

        [[nodiscard]] std::int64_t samples() const override { return images_.size(0); }

    private:
        torch::Tensor images_{};
        torch::Tensor labels_{};
        std::vector<std::string> identifiers_{};
        std::vector<std::string> identifiers2_{};
        std::int64_t batch_size_{1};
        bool shuffle_{false};
        std::mt19937_64 generator_;
        std::vector<std::int64_t> order_{};
        std::size_t cursor_{0};
    };

    // closest_* come from the annotated reference patch matched to each test patch.
    struct InferenceBatch {
        torch::Tensor closest_images{};
        torch::Tensor test_images{};
        torch::Tensor closest_labels{};
        std::optional<torch::Tensor> test_labels{};
        std::vector<std::string> test_paths{};
    };

    inline void validate(const InferenceBatch& batch)
    {
        if (!batch.closest_images.defined() || !batch.test_images.defined() || !batch.closest_labels.defined()) {
            throw std::invalid_argument("Inference batches require closest images, test images and closest labels.");
        }
        if (batch.closest_images.sizes() != batch.test_images.sizes()) {
            throw std::invalid_argument("Closest and test images must share the same shape.");
        }
        const auto count = batch.test_images.size(0);
        if (batch.closest_labels.size(0) != count || static_cast<std::int64_t>(batch.test_paths.size()) != count) {
            throw std::invalid_argument("Inference batch members disagree on the batch size.");
        }
        if (batch.test_labels && batch.test_labels->size(0) != count) {
            throw std::invalid_argument("Inference batch test labels disagree on the batch size.");
        }
    }

    class InferenceLoader {
    public:
        virtual ~InferenceLoader() = default;
        virtual void reset() = 0;
        virtual std::optional<InferenceBatch> next() = 0;
        [[nodiscard]] virtual std::int64_t batches() const = 0;
        [[nodiscard]] virtual bool has_test_labels() const = 0;
    };

    class TensorInferenceLoader final : public InferenceLoader {
    public:
        TensorInferenceLoader(torch::Tensor closest_images,
                              torch::Tensor test_images,
                              torch::Tensor closest_labels,
                              std::optional<torch::Tensor> test_labels,
                              std::vector<std::string> test_paths,
                              std::int64_t batch_size)
            : all_{std::move(closest_images), std::move(test_images), std::move(closest_labels),
                   std::move(test_labels), std::move(test_paths)},
              batch_size_(batch_size)
        {
            if (batch_size_ <= 0) {
                throw std::invalid_argument("TensorInferenceLoader requires a positive batch size.");
            }
            validate(all_);
        }

        void reset() override { cursor_ = 0; }

        std::optional<InferenceBatch> next() override
        {
            const auto total = all_.test_images.size(0);
            if (cursor_ >= total) {
                return std::nullopt;
            }
            const auto length = std::min(batch_size_, total - cursor_);
            InferenceBatch batch;
            batch.closest_images = all_.closest_images.narrow(0, cursor_, length);
            batch.test_images = all_.test_images.narrow(0, cursor_, length);
            batch.closest_labels = all_.closest_labels.narrow(0, cursor_, length);
            if (all_.test_labels) {
                batch.test_labels = all_.test_labels->narrow(0, cursor_, length);
            }
            batch.test_paths.assign(all_.test_paths.begin() + cursor_, all_.test_paths.begin() + cursor_ + length);
            cursor_ += length;
            return batch;
        }

        [[nodiscard]] std::int64_t batches() const override
        {
            return (all_.test_images.size(0) + batch_size_ - 1) / batch_size_;
        }

        [[nodiscard]] bool has_test_labels() const override { return all_.test_labels.has_value(); }

    private:
        InferenceBatch all_{};
        std::int64_t batch_size_{1};
        std::int64_t cursor_{0};
    };
}

#endif // DIFFEO_DATA_PAIRS_HPP
