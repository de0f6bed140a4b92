#ifndef DIFFEO_MODEL_REGISTRY_HPP
#define DIFFEO_MODEL_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "details/predictor.hpp"
#include "details/unet.hpp"

namespace Diffeo::Model::Details {
    using Constructor = std::function<Predictor(const PredictorOptions&)>;

    // Finite mapping from configuration tags to predictor constructors.
    class Registry {
    public:
        Registry() = default;

        void add(std::string tag, Constructor constructor)
        {
            if (tag.empty()) {
                throw std::invalid_argument("Model tags must be non-empty.");
            }
            if (!constructor) {
                throw std::invalid_argument("Model '" + tag + "' was registered without a constructor.");
            }
            if (!constructors_.emplace(tag, std::move(constructor)).second) {
                throw std::invalid_argument("Model '" + tag + "' is already registered.");
            }
        }

        [[nodiscard]] bool contains(const std::string& tag) const { return constructors_.count(tag) > 0; }

        void validate(const std::string& tag) const
        {
            if (!contains(tag)) {
                throw std::invalid_argument("`DiffeoMappingNet_model`: " + tag + " is an unsupported model.");
            }
        }

        [[nodiscard]] Predictor create(const std::string& tag, const PredictorOptions& options = {}) const
        {
            validate(tag);
            auto predictor = constructors_.at(tag)(options);
            if (!predictor) {
                throw std::runtime_error("Constructor for model '" + tag + "' returned no predictor.");
            }
            return predictor;
        }

        [[nodiscard]] std::vector<std::string> tags() const
        {
            std::vector<std::string> names;
            names.reserve(constructors_.size());
            for (const auto& entry : constructors_) {
                names.push_back(entry.first);
            }
            return names;
        }

    private:
        std::map<std::string, Constructor> constructors_{};
    };

    inline Registry default_registry()
    {
        Registry registry;
        registry.add(UNetImpl::kTag, [](const PredictorOptions& options) -> Predictor {
            return std::make_shared<UNetImpl>(options);
        });
        return registry;
    }
}

#endif // DIFFEO_MODEL_REGISTRY_HPP
