#ifndef DIFFEO_COMMON_CONFIG_HPP
#define DIFFEO_COMMON_CONFIG_HPP
#include <array>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "save_load.hpp"

namespace Diffeo::Common::Config {
    using PropertyTree = boost::property_tree::ptree;

    enum class Mode { Train, Test, Infer };

    inline std::string to_string(Mode mode)
    {
        switch (mode) {
            case Mode::Train: return "train";
            case Mode::Test: return "test";
            case Mode::Infer: return "infer";
        }
        throw std::invalid_argument("Unknown run mode.");
    }

    inline Mode mode_from_string(const std::string& value)
    {
        if (value == "train") return Mode::Train;
        if (value == "test") return Mode::Test;
        if (value == "infer") return Mode::Infer;
        throw std::invalid_argument("Run mode must be one of train|test|infer, got '" + value + "'.");
    }

    struct RunConfig {
        Mode mode{Mode::Train};
        std::string device{"cpu"};
        std::array<std::int64_t, 2> target_dim{32, 32};
        std::uint64_t random_seed{1};

        std::string dataset_path{"$ROOT/data/"};
        std::string model_save_folder{"$ROOT/checkpoints/"};
        std::string output_save_folder{"$ROOT/results/"};
        std::string groundtruth_folder{};
        std::vector<std::string> eval_file_ids{};

        std::string model{"UNet"};
        std::string dataset_name{"A28+axis"};
        double percentage{100.0};
        std::string organ{"None"};
        std::int64_t depth{4};
        std::string latent_loss{"SimCLR"};

        double learning_rate{1e-3};
        bool strong{false};
        std::int64_t patience{50};
        std::int64_t max_epochs{50};
        std::int64_t batch_size{8};
        std::int64_t num_filters{32};
        std::int64_t plots_per_epoch{2};

        std::array<std::int64_t, 2> canvas_size{1000, 1000};
        std::int64_t patch_size{32};
    };

    inline void validate(const RunConfig& config)
    {
        if (config.target_dim[0] <= 0 || config.target_dim[1] <= 0) {
            throw std::invalid_argument("target_dim must be strictly positive.");
        }
        if (config.canvas_size[0] <= 0 || config.canvas_size[1] <= 0 || config.patch_size <= 0) {
            throw std::invalid_argument("canvas_size and patch_size must be strictly positive.");
        }
        if (config.batch_size <= 0 || config.max_epochs < 0 || config.patience < 0) {
            throw std::invalid_argument("batch_size must be positive, max_epochs and patience non-negative.");
        }
        if (!(config.learning_rate > 0.0)) {
            throw std::invalid_argument("learning_rate must be strictly positive.");
        }
        if (config.plots_per_epoch < 0) {
            throw std::invalid_argument("plots_per_epoch must be non-negative.");
        }
        if (config.percentage < 0.0 || config.percentage > 100.0) {
            throw std::invalid_argument("percentage must lie in [0, 100].");
        }
    }

    // Replaces every "$ROOT" occurrence in a path-like option.
    inline std::string expand_root(std::string value, const std::string& root)
    {
        static const std::string kToken{"$ROOT"};
        for (auto position = value.find(kToken); position != std::string::npos; position = value.find(kToken, position)) {
            value.replace(position, kToken.size(), root);
            position += root.size();
        }
        return value;
    }

    inline void expand_root(RunConfig& config, const std::string& root)
    {
        config.dataset_path = expand_root(config.dataset_path, root);
        config.model_save_folder = expand_root(config.model_save_folder, root);
        config.output_save_folder = expand_root(config.output_save_folder, root);
        config.groundtruth_folder = expand_root(config.groundtruth_folder, root);
    }

    inline std::string run_name(const RunConfig& config)
    {
        std::ostringstream name;
        name << "dataset-" << config.dataset_name
             << "_fewShot-" << std::fixed << std::setprecision(1) << config.percentage << '%'
             << "_organ-" << config.organ
             << "_depth-" << config.depth
             << "_latentLoss-" << config.latent_loss
             << "_seed" << config.random_seed;
        return name.str();
    }

    inline std::filesystem::path checkpoint_path(const RunConfig& config)
    {
        return std::filesystem::path(config.model_save_folder) / run_name(config) / "DiffeoMappingNet.ckpt";
    }

    inline std::filesystem::path output_save_path(const RunConfig& config)
    {
        return std::filesystem::path(config.output_save_folder) / run_name(config) / "DiffeoMappingNet";
    }

    inline std::filesystem::path log_path(const RunConfig& config)
    {
        return std::filesystem::path(config.output_save_folder) / run_name(config) / "DiffeoMappingNet_log.txt";
    }

    inline std::filesystem::path prediction_folder(const RunConfig& config)
    {
        return std::filesystem::path(config.output_save_folder) / run_name(config) / "pred_patches";
    }

    namespace Detail {
        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    throw std::runtime_error("Invalid array element in " + context);
                }
            }
            return values;
        }

        inline std::array<std::int64_t, 2> read_pair(const PropertyTree& tree, const std::string& key,
                                                     std::array<std::int64_t, 2> fallback)
        {
            const auto node = tree.get_child_optional(key);
            if (!node) {
                return fallback;
            }
            const auto values = read_array<std::int64_t>(*node, key);
            if (values.size() != 2) {
                throw std::runtime_error("Config field '" + key + "' must hold exactly two integers.");
            }
            return {values[0], values[1]};
        }
    }

    inline PropertyTree serialize(const RunConfig& config)
    {
        PropertyTree tree;
        tree.put("mode", to_string(config.mode));
        tree.put("device", config.device);
        tree.add_child("target_dim", Detail::write_array(std::vector<std::int64_t>{config.target_dim[0], config.target_dim[1]}));
        tree.put("random_seed", config.random_seed);
        tree.put("dataset_path", config.dataset_path);
        tree.put("model_save_folder", config.model_save_folder);
        tree.put("output_save_folder", config.output_save_folder);
        tree.put("groundtruth_folder", config.groundtruth_folder);
        tree.add_child("eval_file_ids", Detail::write_array(config.eval_file_ids));
        tree.put("DiffeoMappingNet_model", config.model);
        tree.put("dataset_name", config.dataset_name);
        tree.put("percentage", config.percentage);
        tree.put("organ", config.organ);
        tree.put("depth", config.depth);
        tree.put("latent_loss", config.latent_loss);
        tree.put("learning_rate", config.learning_rate);
        tree.put("strong", config.strong);
        tree.put("patience", config.patience);
        tree.put("max_epochs", config.max_epochs);
        tree.put("batch_size", config.batch_size);
        tree.put("num_filters", config.num_filters);
        tree.put("n_plot_per_epoch", config.plots_per_epoch);
        tree.add_child("canvas_size", Detail::write_array(std::vector<std::int64_t>{config.canvas_size[0], config.canvas_size[1]}));
        tree.put("patch_size", config.patch_size);
        return tree;
    }

    // Missing keys keep their defaults; present keys must parse.
    inline RunConfig deserialize(const PropertyTree& tree, const std::string& context)
    {
        RunConfig config;
        try {
            if (const auto mode = tree.get_optional<std::string>("mode")) {
                config.mode = mode_from_string(*mode);
            }
            config.device = tree.get("device", config.device);
            config.target_dim = Detail::read_pair(tree, "target_dim", config.target_dim);
            config.random_seed = tree.get("random_seed", config.random_seed);
            config.dataset_path = tree.get("dataset_path", config.dataset_path);
            config.model_save_folder = tree.get("model_save_folder", config.model_save_folder);
            config.output_save_folder = tree.get("output_save_folder", config.output_save_folder);
            config.groundtruth_folder = tree.get("groundtruth_folder", config.groundtruth_folder);
            if (const auto ids = tree.get_child_optional("eval_file_ids")) {
                config.eval_file_ids = Detail::read_array<std::string>(*ids, context + " eval_file_ids");
            }
            config.model = tree.get("DiffeoMappingNet_model", config.model);
            config.dataset_name = tree.get("dataset_name", config.dataset_name);
            config.percentage = tree.get("percentage", config.percentage);
            config.organ = tree.get("organ", config.organ);
            config.depth = tree.get("depth", config.depth);
            config.latent_loss = tree.get("latent_loss", config.latent_loss);
            config.learning_rate = tree.get("learning_rate", config.learning_rate);
            config.strong = tree.get("strong", config.strong);
            config.patience = tree.get("patience", config.patience);
            config.max_epochs = tree.get("max_epochs", config.max_epochs);
            config.batch_size = tree.get("batch_size", config.batch_size);
            config.num_filters = tree.get("num_filters", config.num_filters);
            config.plots_per_epoch = tree.get("n_plot_per_epoch", config.plots_per_epoch);
            config.canvas_size = Detail::read_pair(tree, "canvas_size", config.canvas_size);
            config.patch_size = tree.get("patch_size", config.patch_size);
        } catch (const boost::property_tree::ptree_error& error) {
            throw std::runtime_error("Malformed run configuration in " + context + ": " + error.what());
        }
        validate(config);
        return config;
    }

    inline RunConfig load_config(const std::filesystem::path& path, const std::string& root)
    {
        PropertyTree tree;
        try {
            tree = SaveLoad::read_json_file(path);
        } catch (const boost::property_tree::ptree_error& error) {
            throw std::runtime_error("Failed to read run configuration from '" + path.string() + "': " + error.what());
        }
        auto config = deserialize(tree, path.string());
        expand_root(config, root);
        return config;
    }

    inline void save_config(const RunConfig& config, const std::filesystem::path& path)
    {
        SaveLoad::write_json_file(path, serialize(config));
    }

    // One "key: value" line per option, as written at the top of the metric log.
    inline void describe(const RunConfig& config, std::ostream& stream)
    {
        for (const auto& entry : serialize(config)) {
            if (entry.second.empty()) {
                stream << entry.first << ": " << entry.second.data() << '\n';
                continue;
            }
            stream << entry.first << ": [";
            bool first = true;
            for (const auto& element : entry.second) {
                stream << (first ? "" : ", ") << element.second.data();
                first = false;
            }
            stream << "]\n";
        }
    }
}

#endif // DIFFEO_COMMON_CONFIG_HPP
