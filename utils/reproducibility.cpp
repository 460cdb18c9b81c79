//
// reproducibility.cpp - Seeding of std, OpenCV, torch and CUDA generators
//

#include "reproducibility.hpp"

#include <opencv2/core.hpp>
#include <iostream>

std::mt19937_64& global_rng() {
    static std::mt19937_64 rng(std::mt19937_64::default_seed);
    return rng;
}

void fix_seeds(uint64_t seed, bool with_torch, bool with_cuda) {
    global_rng().seed(seed);
    cv::theRNG() = cv::RNG(seed);

    if (with_torch) {
        torch::manual_seed(seed);
    }

    if (with_cuda) {
        if (torch::cuda::is_available()) {
            torch::cuda::manual_seed(seed);
            torch::cuda::manual_seed_all(seed);
        } else {
            std::cerr << "Warning: CUDA seeding requested but CUDA is not available" << std::endl;
        }
        torch::globalContext().setDeterministicCuDNN(true);
        torch::globalContext().setBenchmarkCuDNN(false);
    }
}

torch::Device select_device(const std::vector<int>& gpu_ids) {
    if (!gpu_ids.empty()) {
        return torch::Device(torch::kCUDA, static_cast<c10::DeviceIndex>(gpu_ids.front()));
    }
    return torch::kCPU;
}
