//
// reconstruct.cpp - Reconstruction strategies for the segmentation renderer
//

#include "reconstruct.hpp"
#include "mvtec_dataset.hpp"

#include <stdexcept>

torch::Tensor IdentityReconstruct::apply(const cv::Mat& rgb) const {
    return mat_to_chw_tensor(rgb);
}

TensorReconstruct::TensorReconstruct(Transform transform)
    : transform_(std::move(transform)) {
    if (!transform_) {
        throw std::invalid_argument("TensorReconstruct needs a transform");
    }
}

torch::Tensor TensorReconstruct::apply(const cv::Mat& rgb) const {
    return transform_(rgb).detach().to(torch::kCPU).contiguous();
}

DenormalizeReconstruct::DenormalizeReconstruct(Transform normalize, std::vector<double> mean, std::vector<double> stdev)
    : normalize_(std::move(normalize)) {
    if (!normalize_) {
        throw std::invalid_argument("DenormalizeReconstruct needs a transform");
    }
    if (mean.empty() || mean.size() != stdev.size()) {
        throw std::invalid_argument("Normalization mean and std must have the same non-zero length");
    }
    mean_ = torch::tensor(mean, torch::kFloat32).view({-1, 1, 1});
    std_ = torch::tensor(stdev, torch::kFloat32).view({-1, 1, 1});
}

torch::Tensor DenormalizeReconstruct::apply(const cv::Mat& rgb) const {
    return denormalize(normalize_(rgb));
}

torch::Tensor DenormalizeReconstruct::denormalize(const torch::Tensor& normalized) const {
    auto image = normalized.detach().to(torch::kCPU).to(torch::kFloat32);
    auto restored = (image * std_ + mean_) * 255.0;
    return torch::clamp(restored, 0, 255).to(torch::kUInt8);
}
