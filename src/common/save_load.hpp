#ifndef DIFFEO_COMMON_SAVE_LOAD_HPP
#define DIFFEO_COMMON_SAVE_LOAD_HPP
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <torch/torch.h>

#include "../model/model.hpp"

namespace Diffeo::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        // Module::save nests one archive per submodule, so "encoder_0.conv_0.weight" is read level by level.
        inline void read_nested(torch::serialize::InputArchive& archive, const std::string& key,
                                torch::Tensor& tensor, bool is_buffer)
        {
            const auto dot = key.find('.');
            if (dot == std::string::npos) {
                archive.read(key, tensor, is_buffer);
                return;
            }
            torch::serialize::InputArchive child;
            archive.read(key.substr(0, dot), child);
            read_nested(child, key.substr(dot + 1), tensor, is_buffer);
        }

        inline std::string format_tensor_shape(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << tensor.sizes();
            return stream.str();
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }

    inline PropertyTree serialize_predictor_options(const Model::PredictorOptions& options)
    {
        PropertyTree tree;
        tree.put("in_channels", options.in_channels);
        tree.put("out_channels", options.out_channels);
        tree.put("num_filters", options.num_filters);
        tree.put("depth", options.depth);
        return tree;
    }

    inline Model::PredictorOptions deserialize_predictor_options(const PropertyTree& tree, const std::string& context)
    {
        Model::PredictorOptions options;
        options.in_channels = Detail::get_numeric<std::int64_t>(tree, "in_channels", context);
        options.out_channels = Detail::get_numeric<std::int64_t>(tree, "out_channels", context);
        options.num_filters = Detail::get_numeric<std::int64_t>(tree, "num_filters", context);
        options.depth = Detail::get_numeric<std::int64_t>(tree, "depth", context);
        return options;
    }

    // The descriptor sits beside the weights as "<checkpoint>.json".
    inline std::filesystem::path descriptor_path(const std::filesystem::path& checkpoint)
    {
        auto path = checkpoint;
        path += ".json";
        return path;
    }

    // Overwrites any previous checkpoint at the same path.
    inline void save_checkpoint(Model::PredictorImpl& predictor, const std::filesystem::path& checkpoint)
    {
        if (checkpoint.empty()) {
            throw std::invalid_argument("save_checkpoint requires a non-empty path.");
        }
        if (checkpoint.has_parent_path()) {
            std::filesystem::create_directories(checkpoint.parent_path());
        }

        PropertyTree descriptor;
        descriptor.put("model", predictor.tag());
        descriptor.add_child("options", serialize_predictor_options(predictor.options()));
        try {
            write_json_file(descriptor_path(checkpoint), descriptor);
        } catch (const std::exception& error) {
            throw std::runtime_error(std::string("Failed to write model description to '")
                                     + descriptor_path(checkpoint).string() + "': " + error.what());
        }

        torch::serialize::OutputArchive archive;
        predictor.save(archive);
        archive.save_to(checkpoint.string());
    }

    inline void load_checkpoint(Model::PredictorImpl& predictor, const std::filesystem::path& checkpoint)
    {
        namespace fs = std::filesystem;
        if (!fs::exists(checkpoint)) {
            throw std::runtime_error(std::string("Parameter archive not found at '") + checkpoint.string() + "'.");
        }

        const auto json_path = descriptor_path(checkpoint);
        if (fs::exists(json_path)) {
            const auto descriptor = read_json_file(json_path);
            const auto tag = Detail::get_string(descriptor, "model", json_path.string());
            if (tag != predictor.tag()) {
                throw std::runtime_error("Checkpoint '" + checkpoint.string() + "' holds a " + tag
                                         + " model, cannot load it into " + predictor.tag() + ".");
            }
        }

        torch::serialize::InputArchive archive;
        try {
            archive.load_from(checkpoint.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to open parameter archive '") + checkpoint.string()
                                     + "': " + error.what());
        }

        for (const auto& item : predictor.named_parameters(/*recurse=*/true)) {
            torch::Tensor stored;
            try {
                Detail::read_nested(archive, item.key(), stored, /*is_buffer=*/false);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Checkpoint is missing parameter '" + item.key() + "': " + error.what());
            }
            if (stored.sizes() != item.value().sizes()) {
                throw std::runtime_error("Parameter '" + item.key() + "' shape mismatch: expected "
                                         + Detail::format_tensor_shape(item.value()) + " but found "
                                         + Detail::format_tensor_shape(stored) + ".");
            }
        }

        for (const auto& item : predictor.named_buffers(/*recurse=*/true)) {
            if (!item.value().defined()) {
                continue;
            }
            torch::Tensor stored;
            try {
                Detail::read_nested(archive, item.key(), stored, /*is_buffer=*/true);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Checkpoint is missing buffer '" + item.key() + "': " + error.what());
            }
            if (stored.sizes() != item.value().sizes()) {
                throw std::runtime_error("Buffer '" + item.key() + "' shape mismatch: expected "
                                         + Detail::format_tensor_shape(item.value()) + " but found "
                                         + Detail::format_tensor_shape(stored) + ".");
            }
        }

        try {
            predictor.load(archive);
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to load parameters from '") + checkpoint.string() + "': " + error.what());
        }
    }

    // Rebuilds the predictor named in the descriptor and restores its weights.
    inline Model::Predictor restore_checkpoint(const Model::Registry& registry, const std::filesystem::path& checkpoint)
    {
        const auto json_path = descriptor_path(checkpoint);
        if (!std::filesystem::exists(json_path)) {
            throw std::runtime_error(std::string("Model description not found at '") + json_path.string() + "'.");
        }
        const auto descriptor = read_json_file(json_path);
        const auto options_node = descriptor.get_child_optional("options");
        if (!options_node) {
            throw std::runtime_error("Model description '" + json_path.string() + "' is missing the 'options' entry.");
        }
        auto predictor = registry.create(Detail::get_string(descriptor, "model", json_path.string()),
                                         deserialize_predictor_options(*options_node, json_path.string()));
        load_checkpoint(*predictor, checkpoint);
        return predictor;
    }
}
#endif // DIFFEO_COMMON_SAVE_LOAD_HPP
