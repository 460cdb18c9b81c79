//
// data_augmentation.hpp - Training-time augmentation for RGB inspection images
//

#ifndef DATA_AUGMENTATION_HPP
#define DATA_AUGMENTATION_HPP

#include <torch/torch.h>
#include <torch/data/transforms.h>
#include <cmath>
#include <memory>
#include <vector>

// All transforms take a [C, H, W] float image in [0, 1] and draw from the torch
// generator, so fix_seeds(seed, true, ...) makes them repeatable.

struct RandomFlip : public torch::data::transforms::TensorTransform<torch::Tensor> {
    float probability;

    explicit RandomFlip(float p = 0.5) : probability(p) {}

    torch::Tensor operator()(torch::Tensor input) override {
        if (torch::rand({1}).item<float>() < probability) {
            input = torch::flip(input, {-1});
        }
        return input;
    }
};

struct RandomRotate : public torch::data::transforms::TensorTransform<torch::Tensor> {
    float max_angle;

    explicit RandomRotate(float max_angle_degrees = 10.0) : max_angle(max_angle_degrees) {}

    torch::Tensor operator()(torch::Tensor input) override {
        float angle = (torch::rand({1}).item<float>() - 0.5f) * 2.0f * max_angle;
        float angle_rad = angle * static_cast<float>(M_PI) / 180.0f;

        auto cos_val = std::cos(angle_rad);
        auto sin_val = std::sin(angle_rad);

        auto theta = torch::tensor({
            {cos_val, -sin_val, 0.0f},
            {sin_val, cos_val, 0.0f}
        }, torch::kFloat32).unsqueeze(0);

        auto batched = input.unsqueeze(0);
        auto grid = torch::nn::functional::affine_grid(theta,
            {1, batched.size(1), batched.size(2), batched.size(3)},
            torch::nn::functional::AffineGridFuncOptions().align_corners(false));

        // Border padding keeps the corners from turning black
        auto rotated = torch::nn::functional::grid_sample(batched, grid,
            torch::nn::functional::GridSampleFuncOptions()
            .mode(torch::kBilinear)
            .padding_mode(torch::kBorder)
            .align_corners(false));

        return rotated.squeeze(0);
    }
};

struct RandomIntensity : public torch::data::transforms::TensorTransform<torch::Tensor> {
    float brightness_range;
    float contrast_range;

    RandomIntensity(float brightness = 0.1, float contrast = 0.1)
        : brightness_range(brightness), contrast_range(contrast) {}

    torch::Tensor operator()(torch::Tensor input) override {
        float brightness_factor = 1.0f + (torch::rand({1}).item<float>() - 0.5f) * 2.0f * brightness_range;
        float contrast_factor = 1.0f + (torch::rand({1}).item<float>() - 0.5f) * 2.0f * contrast_range;

        input = input * brightness_factor;
        auto mean_val = torch::mean(input);
        input = (input - mean_val) * contrast_factor + mean_val;

        return torch::clamp(input, 0.0, 1.0);
    }
};

class ImageAugmentation {
public:
    std::vector<std::unique_ptr<torch::data::transforms::TensorTransform<torch::Tensor>>> transforms;

    ImageAugmentation() {
        transforms.push_back(std::make_unique<RandomFlip>(0.5));
        transforms.push_back(std::make_unique<RandomRotate>(10.0));
        transforms.push_back(std::make_unique<RandomIntensity>(0.1, 0.1));
    }

    torch::Tensor apply(torch::Tensor input) const {
        for (const auto& transform : transforms) {
            input = (*transform)(input);
        }
        return input;
    }
};

#endif //DATA_AUGMENTATION_HPP
