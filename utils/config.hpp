//
// config.hpp - Shared defaults for dataset transforms, loaders and results
//

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Config {
    // ImageNet statistics used by the MVTec image transform
    constexpr std::array<double, 3> NORMALIZE_MEAN = {0.485, 0.456, 0.406};
    constexpr std::array<double, 3> NORMALIZE_STD = {0.229, 0.224, 0.225};

    constexpr int64_t DEFAULT_RESIZE = 256;
    constexpr int64_t DEFAULT_IMAGE_SIZE = 224;
    constexpr int64_t DEFAULT_BATCH_SIZE = 32;
    constexpr size_t DEFAULT_NUM_WORKERS = 2;

    // Batches each loader worker may have in flight
    constexpr size_t PREFETCH_FACTOR = 2;

    constexpr uint64_t SEED = 0;

    // Figure panels are 3x3 units at 100 px per unit
    constexpr int PANEL_UNITS = 3;
    constexpr int PIXELS_PER_UNIT = 100;
    constexpr int DEFAULT_SAVE_DEPTH = 4;

    constexpr const char* RESULTS_FILENAME = "results.csv";
    constexpr const char* DEFAULT_OUTPUT_DIR = "outputs";

    inline const std::vector<std::string>& metric_column_names() {
        static const std::vector<std::string> names = {
            "Instance AUROC",
            "Full Pixel AUROC",
            "Full PRO",
            "Anomaly Pixel AUROC",
            "Anomaly PRO"
        };
        return names;
    }
}

#endif //CONFIG_HPP
