// Stitch-and-evaluate entry point.
// -----------------------------------------------------------------------------
//  diffeo_stitch_eval <config.json> [root]
//  - Loads the run configuration ("$ROOT" expands to [root], default: working dir).
//  - Stitches the run's pred_patches folder onto full-size canvases.
//  - Evaluates the stitched maps against groundtruth_folder when one is set.

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "../include/Diffeo.h"

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: " << argv[0] << " <config.json> [root]" << std::endl;
        return 2;
    }

    try {
        const auto root = argc == 3 ? std::string(argv[2]) : std::filesystem::current_path().string();
        const auto config = Diffeo::Common::Config::load_config(argv[1], root);
        const auto log = Diffeo::Run::OpenLog(config);
        const auto options = Diffeo::Run::InferenceOptionsFor(config, log);

        const auto stitched = Diffeo::Stitch::Run(options.prediction_folder, options.stitch);

        if (options.groundtruth_folder.empty()) {
            std::cout << Diffeo::Utils::Terminal::ApplyColor("No groundtruth_folder configured, skipping evaluation.",
                                                             Diffeo::Utils::Terminal::Colors::kYellow)
                      << std::endl;
            return 0;
        }

        auto evaluation = options.evaluation;
        evaluation.print_summary = true;
        const auto report = Diffeo::Evaluation::EvaluateFolders(stitched.output_folder, options.groundtruth_folder, evaluation);
        for (std::size_t index = 0; index < report.order.size(); ++index) {
            log.write("[Eval] Stitched " + Diffeo::Metric::Details::name_of(report.order[index]) + ": "
                      + std::to_string(report.mean[index]), /*to_console=*/false);
        }
    } catch (const std::exception& error) {
        std::cerr << Diffeo::Utils::Terminal::ApplyColor(error.what(), Diffeo::Utils::Terminal::Colors::kRed) << std::endl;
        return 1;
    }
    return 0;
}
