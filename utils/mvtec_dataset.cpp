// =============================================================================
// mvtec_dataset.cpp - MVTec AD directory scan, transforms and batch collation
// =============================================================================

#include "mvtec_dataset.hpp"
#include "data_augmentation.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

bool is_image_file(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tif" || ext == ".tiff";
}

std::vector<std::string> sorted_subdirectories(const fs::path& root) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.is_directory()) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> sorted_images(const fs::path& root) {
    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.is_regular_file() && is_image_file(entry.path())) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

std::string split_name(DatasetSplit split) {
    switch (split) {
        case DatasetSplit::TRAIN: return "train";
        case DatasetSplit::VAL: return "val";
        case DatasetSplit::TEST: return "test";
    }
    return "unknown";
}

std::string join_path_segments(const std::string& path, int depth, const std::string& separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = path.find('/', start);
        parts.push_back(path.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }

    size_t count = parts.size();
    size_t first = 0;
    if (depth > 0) {
        first = count > static_cast<size_t>(depth) ? count - static_cast<size_t>(depth) : 0;
    } else {
        first = std::min(count, static_cast<size_t>(-static_cast<int64_t>(depth)));
    }

    std::string joined;
    for (size_t i = first; i < count; ++i) {
        if (i > first) joined += separator;
        joined += parts[i];
    }
    return joined;
}

cv::Mat load_rgb_image(const std::string& path) {
    cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR);
    if (bgr.empty()) {
        throw std::runtime_error("Failed to read image " + path);
    }
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return rgb;
}

torch::Tensor mat_to_chw_tensor(const cv::Mat& mat) {
    if (mat.depth() != CV_8U) {
        throw std::runtime_error("Expected an 8-bit image");
    }
    cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
    auto tensor = torch::from_blob(contiguous.data,
                                   {contiguous.rows, contiguous.cols, contiguous.channels()},
                                   torch::kUInt8).clone();
    return tensor.permute({2, 0, 1}).contiguous();
}

MVTecDataset::MVTecDataset(const std::string& source,
                           const std::string& classname,
                           DatasetSplit split,
                           int64_t resize,
                           int64_t imagesize,
                           bool augment,
                           double train_val_split)
    : source_(source), classname_(classname), split_(split), resize_(resize),
      imagesize_(imagesize), augment_(augment), train_val_split_(train_val_split),
      transform_mean_(Config::NORMALIZE_MEAN), transform_std_(Config::NORMALIZE_STD) {

    if (resize_ <= 0 || imagesize_ <= 0) {
        throw std::runtime_error("Resize and image size must be positive");
    }
    if (train_val_split_ <= 0.0 || train_val_split_ > 1.0) {
        throw std::runtime_error("train_val_split must be in (0, 1]");
    }

    load_samples();
    std::cout << "Loaded " << records_.size() << " samples for "
              << (split_ == DatasetSplit::TRAIN ? "training" : (split_ == DatasetSplit::VAL ? "validation" : "testing"))
              << " (" << classname_ << ")" << std::endl;
}

void MVTecDataset::load_samples() {
    records_.clear();

    fs::path class_path = fs::path(source_) / classname_;
    if (!fs::is_directory(class_path)) {
        throw std::runtime_error("MVTec class path does not exist: " + class_path.string());
    }

    // Validation images are carved out of the training folder
    fs::path split_path = class_path / (split_ == DatasetSplit::TEST ? "test" : "train");
    fs::path mask_root = class_path / "ground_truth";
    if (!fs::is_directory(split_path)) {
        throw std::runtime_error("MVTec split path does not exist: " + split_path.string());
    }

    for (const auto& anomaly : sorted_subdirectories(split_path)) {
        auto image_paths = sorted_images(split_path / anomaly);

        if (split_ != DatasetSplit::TEST && train_val_split_ < 1.0) {
            auto split_idx = static_cast<size_t>(image_paths.size() * train_val_split_);
            if (split_ == DatasetSplit::TRAIN) {
                image_paths.erase(image_paths.begin() + split_idx, image_paths.end());
            } else {
                image_paths.erase(image_paths.begin(), image_paths.begin() + split_idx);
            }
        }

        for (const auto& image_path : image_paths) {
            SampleRecord record;
            record.classname = classname_;
            record.anomaly = anomaly;
            record.image_path = image_path;
            record.is_anomalous = anomaly != "good";

            if (split_ == DatasetSplit::TEST && record.is_anomalous) {
                fs::path mask_path = mask_root / anomaly / (fs::path(image_path).stem().string() + "_mask.png");
                if (!fs::exists(mask_path)) {
                    throw std::runtime_error("Missing ground truth mask " + mask_path.string());
                }
                record.mask_path = mask_path.string();
            }

            records_.push_back(std::move(record));
        }
    }

    if (records_.empty()) {
        throw std::runtime_error("No " + split_name(split_) + " samples found for class " + classname_ +
                                 " in " + source_);
    }
}

MVTecSample MVTecDataset::get(size_t index) {
    const auto& record = records_.at(index);

    auto image = mat_to_chw_tensor(load_rgb_image(record.image_path)).to(torch::kFloat32) / 255.0;
    image = center_crop(resize_shorter_side(image, false));
    if (augment_ && split_ == DatasetSplit::TRAIN) {
        image = augment_image(image);
    }
    image = normalize(image);

    torch::Tensor mask;
    if (split_ == DatasetSplit::TEST && record.mask_path) {
        cv::Mat raw_mask = cv::imread(*record.mask_path, cv::IMREAD_GRAYSCALE);
        if (raw_mask.empty()) {
            throw std::runtime_error("Failed to read mask " + *record.mask_path);
        }
        mask = transform_mask(raw_mask);
    } else {
        mask = torch::zeros({1, image.size(1), image.size(2)}, torch::kFloat32);
    }

    MVTecSample sample;
    sample.image = image;
    sample.mask = mask;
    sample.is_anomaly = record.is_anomalous ? 1 : 0;
    sample.classname = record.classname;
    sample.anomaly = record.anomaly;
    sample.image_name = join_path_segments(record.image_path, 4, "/");
    sample.image_path = record.image_path;
    return sample;
}

torch::optional<size_t> MVTecDataset::size() const {
    return records_.size();
}

torch::Tensor MVTecDataset::transform_img(const cv::Mat& rgb) const {
    auto image = mat_to_chw_tensor(rgb).to(torch::kFloat32) / 255.0;
    return normalize(center_crop(resize_shorter_side(image, false)));
}

torch::Tensor MVTecDataset::normalize(const torch::Tensor& image) const {
    auto mean = torch::tensor(std::vector<double>(transform_mean_.begin(), transform_mean_.end()),
                              torch::kFloat32).view({-1, 1, 1});
    auto stdev = torch::tensor(std::vector<double>(transform_std_.begin(), transform_std_.end()),
                               torch::kFloat32).view({-1, 1, 1});
    return (image - mean) / stdev;
}

torch::Tensor MVTecDataset::transform_mask(const cv::Mat& mask) const {
    auto tensor = mat_to_chw_tensor(mask).to(torch::kFloat32) / 255.0;
    return center_crop(resize_shorter_side(tensor, true));
}

torch::Tensor MVTecDataset::resize_shorter_side(const torch::Tensor& tensor, bool is_mask) const {
    int64_t height = tensor.size(-2);
    int64_t width = tensor.size(-1);

    int64_t target_h = resize_;
    int64_t target_w = resize_;
    if (height <= width) {
        target_w = static_cast<int64_t>(resize_ * width / height);
    } else {
        target_h = static_cast<int64_t>(resize_ * height / width);
    }
    if (target_h == height && target_w == width) {
        return tensor;
    }

    auto input = tensor.unsqueeze(0);
    torch::Tensor resized;
    if (is_mask) {
        resized = torch::nn::functional::interpolate(
            input,
            torch::nn::functional::InterpolateFuncOptions()
                .size(std::vector<int64_t>{target_h, target_w})
                .mode(torch::kNearest)
        );
    } else {
        resized = torch::nn::functional::interpolate(
            input,
            torch::nn::functional::InterpolateFuncOptions()
                .size(std::vector<int64_t>{target_h, target_w})
                .mode(torch::kBilinear)
                .align_corners(false)
        );
    }
    return resized.squeeze(0);
}

torch::Tensor MVTecDataset::center_crop(const torch::Tensor& tensor) const {
    auto input = tensor;
    int64_t height = input.size(-2);
    int64_t width = input.size(-1);

    // Zero-pad first when the crop is larger than the image
    if (height < imagesize_ || width < imagesize_) {
        int64_t pad_h = std::max<int64_t>(imagesize_ - height, 0);
        int64_t pad_w = std::max<int64_t>(imagesize_ - width, 0);
        input = torch::constant_pad_nd(input, {pad_w / 2, (pad_w + 1) / 2, pad_h / 2, (pad_h + 1) / 2}, 0);
        height = input.size(-2);
        width = input.size(-1);
    }

    auto top = static_cast<int64_t>(std::round((height - imagesize_) / 2.0));
    auto left = static_cast<int64_t>(std::round((width - imagesize_) / 2.0));
    return input.narrow(-2, top, imagesize_).narrow(-1, left, imagesize_).contiguous();
}

torch::Tensor MVTecDataset::augment_image(torch::Tensor image) const {
    static const ImageAugmentation augmentation;
    return augmentation.apply(std::move(image));
}

MVTecBatch CollateSamples::apply_batch(std::vector<MVTecSample> samples) {
    MVTecBatch batch;
    std::vector<torch::Tensor> images;
    std::vector<torch::Tensor> masks;
    std::vector<int64_t> labels;
    images.reserve(samples.size());
    masks.reserve(samples.size());
    labels.reserve(samples.size());

    for (auto& sample : samples) {
        images.push_back(std::move(sample.image));
        masks.push_back(std::move(sample.mask));
        labels.push_back(sample.is_anomaly);
        batch.classnames.push_back(std::move(sample.classname));
        batch.anomalies.push_back(std::move(sample.anomaly));
        batch.image_names.push_back(std::move(sample.image_name));
        batch.image_paths.push_back(std::move(sample.image_path));
    }

    batch.image = torch::stack(images);
    batch.mask = torch::stack(masks);
    batch.is_anomaly = torch::tensor(labels, torch::kLong);

    if (pin_memory_ && torch::cuda::is_available()) {
        batch.image = batch.image.pin_memory();
        batch.mask = batch.mask.pin_memory();
        batch.is_anomaly = batch.is_anomaly.pin_memory();
    }
    return batch;
}
