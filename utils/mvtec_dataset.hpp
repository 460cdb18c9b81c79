// =============================================================================
// mvtec_dataset.hpp - MVTec AD style dataset (per class, train/val/test)
// =============================================================================

#pragma once

#include <torch/torch.h>
#include <torch/data/datasets/base.h>
#include <torch/data/transforms/base.h>
#include <opencv2/core.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>

#include "utils/config.hpp"

enum class DatasetSplit {
    TRAIN,
    VAL,
    TEST
};

std::string split_name(DatasetSplit split);

struct SampleRecord {
    std::string classname;
    std::string anomaly;                    // "good" or the defect type
    std::string image_path;
    std::optional<std::string> mask_path;   // only anomalous test images have one
    bool is_anomalous;
};

struct MVTecSample {
    torch::Tensor image;    // [3, H, W], normalized
    torch::Tensor mask;     // [1, H, W] in [0, 1]
    int64_t is_anomaly = 0;
    std::string classname;
    std::string anomaly;
    std::string image_name; // last four path segments joined by '/'
    std::string image_path;
};

struct MVTecBatch {
    torch::Tensor image;        // [B, 3, H, W]
    torch::Tensor mask;         // [B, 1, H, W]
    torch::Tensor is_anomaly;   // [B], kLong
    std::vector<std::string> classnames;
    std::vector<std::string> anomalies;
    std::vector<std::string> image_names;
    std::vector<std::string> image_paths;

    size_t size() const { return image_paths.size(); }
};

class MVTecDataset : public torch::data::datasets::Dataset<MVTecDataset, MVTecSample> {
public:
    MVTecDataset(const std::string& source,
                 const std::string& classname,
                 DatasetSplit split = DatasetSplit::TRAIN,
                 int64_t resize = Config::DEFAULT_RESIZE,
                 int64_t imagesize = Config::DEFAULT_IMAGE_SIZE,
                 bool augment = false,
                 double train_val_split = 1.0);

    MVTecSample get(size_t index) override;
    torch::optional<size_t> size() const override;

    const std::vector<SampleRecord>& records() const { return records_; }
    const std::string& classname() const { return classname_; }
    DatasetSplit split() const { return split_; }

    // RGB uint8 image -> normalized [3, imagesize, imagesize] float tensor
    torch::Tensor transform_img(const cv::Mat& rgb) const;
    // RGB or gray uint8 mask -> [C, imagesize, imagesize] float tensor in [0, 1]
    torch::Tensor transform_mask(const cv::Mat& mask) const;

    const std::array<double, 3>& transform_mean() const { return transform_mean_; }
    const std::array<double, 3>& transform_std() const { return transform_std_; }

private:
    void load_samples();

    torch::Tensor resize_shorter_side(const torch::Tensor& tensor, bool is_mask) const;
    torch::Tensor center_crop(const torch::Tensor& tensor) const;
    torch::Tensor normalize(const torch::Tensor& image) const;
    torch::Tensor augment_image(torch::Tensor image) const;

    std::string source_;
    std::string classname_;
    DatasetSplit split_;
    int64_t resize_;
    int64_t imagesize_;
    bool augment_;
    double train_val_split_;

    std::array<double, 3> transform_mean_;
    std::array<double, 3> transform_std_;

    std::vector<SampleRecord> records_;
};

// Joins the '/'-separated segments of path with separator. depth > 0 keeps the
// last depth segments, depth <= 0 drops the first -depth and keeps the rest.
std::string join_path_segments(const std::string& path, int depth, const std::string& separator);

// Loads an image from disk as 8-bit RGB, throws std::runtime_error if unreadable
cv::Mat load_rgb_image(const std::string& path);

// HWC uint8 cv::Mat -> CHW tensor of the same dtype (owning copy)
torch::Tensor mat_to_chw_tensor(const cv::Mat& mat);

// Stacks a vector of samples into one batch; pins host memory when asked and CUDA is present
struct CollateSamples : public torch::data::transforms::BatchTransform<std::vector<MVTecSample>, MVTecBatch> {
    explicit CollateSamples(bool pin_memory = true) : pin_memory_(pin_memory) {}

    MVTecBatch apply_batch(std::vector<MVTecSample> samples) override;

private:
    bool pin_memory_;
};
