//
// main.cpp - Command line entry for dataloader checks, segmentation figures and result tables
//

#include <torch/torch.h>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include "utils/config.hpp"
#include "utils/dataloaders.hpp"
#include "utils/mvtec_dataset.hpp"
#include "utils/prediction_store.hpp"
#include "utils/reproducibility.hpp"
#include "utils/results.hpp"
#include "utils/storage.hpp"
#include "utils/visualization.hpp"

enum class RunMode {
    LOADERS,
    RENDER,
    SUMMARIZE,
    UNKNOWN
};

struct CommandLineArgs {
    RunMode mode = RunMode::UNKNOWN;
    std::vector<std::string> positional;
    bool valid = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage:" << std::endl;
    std::cerr << "  " << program << " loaders <data_root> <run_name> <class> [class...]" << std::endl;
    std::cerr << "  " << program << " render <data_root> <class> <predictions.h5> [output_dir]" << std::endl;
    std::cerr << "  " << program << " summarize <root> <project> <group> <run_name> <name=v1,v2,v3,v4,v5> [...]" << std::endl;
}

CommandLineArgs parse_command_line(int argc, char* argv[]) {
    CommandLineArgs args;

    if (argc < 2) {
        print_usage(argv[0]);
        return args;
    }

    std::string mode_str = argv[1];
    size_t required = 0;
    if (mode_str == "loaders") {
        args.mode = RunMode::LOADERS;
        required = 3;
    } else if (mode_str == "render") {
        args.mode = RunMode::RENDER;
        required = 3;
    } else if (mode_str == "summarize") {
        args.mode = RunMode::SUMMARIZE;
        required = 5;
    } else {
        std::cerr << "Invalid mode '" << mode_str << "'. Use 'loaders', 'render' or 'summarize'." << std::endl;
        return args;
    }

    for (int i = 2; i < argc; ++i) {
        args.positional.emplace_back(argv[i]);
    }
    if (args.positional.size() < required) {
        print_usage(argv[0]);
        return args;
    }

    args.valid = true;
    return args;
}

torch::Device get_device() {
    if (torch::cuda::is_available()) {
        std::cout << "CUDA is available. Primary GPU: cuda:0" << std::endl;
        return select_device({0});
    }
    std::cout << "CUDA not available, falling back to CPU." << std::endl;
    return select_device({});
}

int run_loaders(const CommandLineArgs& args, const torch::Device& device) {
    const std::string& data_root = args.positional[0];
    const std::string& run_name = args.positional[1];
    std::vector<std::string> classes(args.positional.begin() + 2, args.positional.end());

    auto dataloaders = build_dataloaders(run_name, data_root, classes);

    for (auto& bundle : dataloaders) {
        size_t train_batches = 0;
        size_t train_samples = 0;
        for (auto& batch : bundle.train) {
            auto images = batch.image.to(device, /*non_blocking=*/true);
            train_samples += static_cast<size_t>(images.size(0));
            ++train_batches;
        }

        size_t test_batches = 0;
        size_t test_samples = 0;
        int64_t test_anomalous = 0;
        for (auto& batch : bundle.test) {
            auto images = batch.image.to(device, /*non_blocking=*/true);
            test_samples += static_cast<size_t>(images.size(0));
            test_anomalous += batch.is_anomaly.sum().item<int64_t>();
            ++test_batches;
        }

        std::cout << bundle.train.name << ": "
                  << train_batches << " train batches (" << train_samples << " samples, shuffled), "
                  << test_batches << " test batches (" << test_samples << " samples, "
                  << test_anomalous << " anomalous)" << std::endl;
    }
    return 0;
}

int run_render(const CommandLineArgs& args) {
    const std::string& data_root = args.positional[0];
    const std::string& classname = args.positional[1];
    const std::string& predictions_path = args.positional[2];
    std::string output_dir = args.positional.size() > 3 ? args.positional[3] : Config::DEFAULT_OUTPUT_DIR;

    MVTecDataset test_dataset(data_root, classname, DatasetSplit::TEST,
                              Config::DEFAULT_IMAGE_SIZE, Config::DEFAULT_IMAGE_SIZE);
    auto predictions = load_predictions(predictions_path);

    if (predictions.size() != test_dataset.size().value()) {
        std::cerr << "Prediction count " << predictions.size() << " does not match "
                  << test_dataset.size().value() << " test samples of " << classname << std::endl;
        return -1;
    }

    render_dataset_segmentations(output_dir, test_dataset, predictions.segmentations, predictions.scores);
    return 0;
}

int run_summarize(const CommandLineArgs& args) {
    std::vector<std::string> row_names;
    std::vector<std::vector<double>> results;
    for (size_t i = 4; i < args.positional.size(); ++i) {
        try {
            auto [name, row] = parse_result_row(args.positional[i]);
            if (row.size() != Config::metric_column_names().size()) {
                std::cerr << "Row " << name << " has " << row.size() << " values, expected "
                          << Config::metric_column_names().size() << std::endl;
                return -1;
            }
            row_names.push_back(std::move(name));
            results.push_back(std::move(row));
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << std::endl;
            return -1;
        }
    }

    // Only allocate a run folder once every row is valid
    auto results_path = create_storage_folder(args.positional[0], args.positional[1],
                                              args.positional[2], args.positional[3], "iterate");

    auto mean_metrics = store_results(results_path, results, row_names);

    std::cout << "\nResults stored in " << results_path << std::endl;
    for (const auto& [key, value] : mean_metrics) {
        std::cout << "  " << key << ": " << std::fixed << std::setprecision(4) << value << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto args = parse_command_line(argc, argv);
    if (!args.valid) {
        return -1;
    }

    // Before anything shuffles or augments
    fix_seeds(Config::SEED, true, torch::cuda::is_available());

    try {
        switch (args.mode) {
            case RunMode::LOADERS: {
                torch::Device device = get_device();
                return run_loaders(args, device);
            }
            case RunMode::RENDER:
                return run_render(args);
            case RunMode::SUMMARIZE:
                return run_summarize(args);
            default:
                std::cerr << "Unknown mode" << std::endl;
                return -1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return -1;
    }
}
