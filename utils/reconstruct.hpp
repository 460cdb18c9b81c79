//
// reconstruct.hpp - Turning loaded images and masks back into displayable arrays
//

#ifndef RECONSTRUCT_HPP
#define RECONSTRUCT_HPP

#include <torch/torch.h>
#include <opencv2/core.hpp>
#include <array>
#include <functional>
#include <vector>

// Maps an RGB uint8 image (HWC, as loaded from disk) to a channel-first
// [C, H, W] tensor that the renderer can draw.
class ReconstructTransform {
public:
    virtual ~ReconstructTransform() = default;
    virtual torch::Tensor apply(const cv::Mat& rgb) const = 0;
};

// Pixels as loaded, uint8 [3, H, W]
class IdentityReconstruct : public ReconstructTransform {
public:
    torch::Tensor apply(const cv::Mat& rgb) const override;
};

// Runs a dataset transform (e.g. MVTecDataset::transform_mask) and hands the
// resulting tensor over unchanged, detached and on the CPU.
class TensorReconstruct : public ReconstructTransform {
public:
    using Transform = std::function<torch::Tensor(const cv::Mat&)>;

    explicit TensorReconstruct(Transform transform);

    torch::Tensor apply(const cv::Mat& rgb) const override;

private:
    Transform transform_;
};

// Runs the normalizing dataset transform, then undoes the normalization:
// clip((x * std + mean) * 255, 0, 255) as uint8 [C, H, W].
class DenormalizeReconstruct : public ReconstructTransform {
public:
    using Transform = std::function<torch::Tensor(const cv::Mat&)>;

    DenormalizeReconstruct(Transform normalize, std::vector<double> mean, std::vector<double> stdev);

    torch::Tensor apply(const cv::Mat& rgb) const override;

    // The inverse normalization on its own, for tensors that are already normalized
    torch::Tensor denormalize(const torch::Tensor& normalized) const;

private:
    Transform normalize_;
    torch::Tensor mean_;
    torch::Tensor std_;
};

#endif //RECONSTRUCT_HPP
