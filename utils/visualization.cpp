//
// visualization.cpp - Segmentation comparison figures
//

#include "visualization.hpp"
#include "errors.hpp"
#include "mvtec_dataset.hpp"

#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

std::string segmentation_savename(const std::string& image_path, int path_depth) {
    return join_path_segments(image_path, path_depth, "_");
}

torch::Tensor as_segmentation_field(const torch::Tensor& segmentation) {
    auto field = segmentation.detach().to(torch::kCPU).to(torch::kFloat32);
    while (field.dim() > 2 && field.size(0) == 1) {
        field = field.squeeze(0);
    }
    while (field.dim() > 2 && field.size(-1) == 1) {
        field = field.squeeze(-1);
    }
    if (field.dim() != 2) {
        std::ostringstream message;
        message << "Segmentation map must reduce to 2D, got shape " << segmentation.sizes();
        throw ShapeMismatchError(message.str());
    }
    return field.contiguous();
}

SegmentationVisualizer::SegmentationVisualizer(const std::string& output_dir)
    : output_dir_(output_dir), panel_size_(Config::PANEL_UNITS * Config::PIXELS_PER_UNIT) {
    fs::create_directories(output_dir_);
}

cv::Mat SegmentationVisualizer::tensor_to_cv(const torch::Tensor& chw) {
    auto tensor = chw.detach().to(torch::kCPU);
    if (tensor.dim() == 2) {
        tensor = tensor.unsqueeze(0);
    }
    if (tensor.dim() != 3 || (tensor.size(0) != 1 && tensor.size(0) != 3)) {
        std::ostringstream message;
        message << "Expected a [1|3, H, W] tensor, got shape " << chw.sizes();
        throw std::runtime_error(message.str());
    }

    if (tensor.scalar_type() != torch::kUInt8) {
        tensor = (tensor.to(torch::kFloat32).clamp(0.0, 1.0) * 255.0).round().to(torch::kUInt8);
    }

    auto hwc = tensor.permute({1, 2, 0}).contiguous();
    int channels = static_cast<int>(hwc.size(2));
    cv::Mat view(static_cast<int>(hwc.size(0)), static_cast<int>(hwc.size(1)),
                 CV_8UC(channels), hwc.data_ptr<uint8_t>());

    cv::Mat bgr;
    if (channels == 1) {
        cv::cvtColor(view, bgr, cv::COLOR_GRAY2BGR);
    } else {
        cv::cvtColor(view, bgr, cv::COLOR_RGB2BGR);
    }
    return bgr;
}

cv::Mat SegmentationVisualizer::colorize_segmentation(const torch::Tensor& field) {
    auto values = as_segmentation_field(field);

    float min_val = values.min().item<float>();
    float max_val = values.max().item<float>();
    torch::Tensor scaled;
    if (max_val - min_val > 0) {
        scaled = (values - min_val) / (max_val - min_val);
    } else {
        scaled = torch::zeros_like(values);
    }
    auto bytes = (scaled * 255.0).round().clamp(0, 255).to(torch::kUInt8).contiguous();

    cv::Mat gray(static_cast<int>(bytes.size(0)), static_cast<int>(bytes.size(1)), CV_8UC1, bytes.data_ptr<uint8_t>());
    cv::Mat colored;
    cv::applyColorMap(gray, colored, cv::COLORMAP_VIRIDIS);
    return colored;
}

cv::Mat SegmentationVisualizer::fit_panel(const cv::Mat& image, const std::string& title) const {
    cv::Mat panel(panel_size_, panel_size_, CV_8UC3, cv::Scalar(255, 255, 255));

    int area = panel_size_ - TITLE_HEIGHT;
    double scale = std::min(static_cast<double>(area) / image.cols, static_cast<double>(area) / image.rows);
    int width = std::max(1, static_cast<int>(image.cols * scale));
    int height = std::max(1, static_cast<int>(image.rows * scale));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, height), 0, 0,
               scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);

    int x = (panel_size_ - width) / 2;
    int y = TITLE_HEIGHT + (area - height) / 2;
    resized.copyTo(panel(cv::Rect(x, y, width, height)));

    int baseline = 0;
    cv::Size text_size = cv::getTextSize(title, TITLE_FONT, TITLE_SCALE, TITLE_THICKNESS, &baseline);
    cv::putText(panel, title,
                cv::Point(std::max(0, (panel_size_ - text_size.width) / 2), TITLE_HEIGHT - baseline - 4),
                TITLE_FONT, TITLE_SCALE, cv::Scalar(40, 40, 40), TITLE_THICKNESS, cv::LINE_AA);
    return panel;
}

cv::Mat SegmentationVisualizer::compose_figure(const std::vector<cv::Mat>& panels,
                                               const std::vector<std::string>& titles) const {
    std::vector<cv::Mat> fitted;
    fitted.reserve(panels.size());
    for (size_t i = 0; i < panels.size(); ++i) {
        fitted.push_back(fit_panel(panels[i], i < titles.size() ? titles[i] : std::string()));
    }

    cv::Mat figure;
    cv::hconcat(fitted, figure);
    return figure;
}

void SegmentationVisualizer::save_figure(const std::string& filename, const cv::Mat& figure) const {
    if (filename.empty()) {
        throw std::runtime_error("Empty figure name");
    }
    fs::path target = fs::path(output_dir_) / filename;
    if (target.extension().empty()) {
        target += ".png";
    }
    if (!cv::imwrite(target.string(), figure)) {
        throw std::runtime_error("Failed to write " + target.string());
    }
}

void render_segmentations(const std::string& out_dir,
                          const std::vector<std::string>& image_paths,
                          const std::vector<torch::Tensor>& segmentation_maps,
                          const std::optional<std::vector<float>>& anomaly_scores,
                          const std::optional<std::vector<std::optional<std::string>>>& mask_paths,
                          const ReconstructTransform& image_reconstruct,
                          const ReconstructTransform& mask_reconstruct,
                          int path_depth) {
    const size_t total = image_paths.size();
    if (segmentation_maps.size() != total) {
        throw ShapeMismatchError("Got " + std::to_string(segmentation_maps.size()) +
                                 " segmentation maps for " + std::to_string(total) + " images");
    }
    if (anomaly_scores && anomaly_scores->size() != total) {
        throw ShapeMismatchError("Got " + std::to_string(anomaly_scores->size()) +
                                 " anomaly scores for " + std::to_string(total) + " images");
    }
    if (mask_paths && mask_paths->size() != total) {
        throw ShapeMismatchError("Got " + std::to_string(mask_paths->size()) +
                                 " mask paths for " + std::to_string(total) + " images");
    }

    const bool masks_provided = mask_paths.has_value();
    SegmentationVisualizer visualizer(out_dir);

    size_t written = 0;
    for (size_t idx = 0; idx < total; ++idx) {
        const auto& image_path = image_paths[idx];
        try {
            auto image = image_reconstruct.apply(load_rgb_image(image_path));

            std::vector<cv::Mat> panels;
            std::vector<std::string> titles;
            panels.push_back(SegmentationVisualizer::tensor_to_cv(image));
            titles.emplace_back("Image");

            if (masks_provided) {
                const auto& mask_path = (*mask_paths)[idx];
                torch::Tensor mask = mask_path ? mask_reconstruct.apply(load_rgb_image(*mask_path))
                                               : torch::zeros_like(image);
                panels.push_back(SegmentationVisualizer::tensor_to_cv(mask));
                titles.emplace_back("Ground Truth");
            }

            panels.push_back(SegmentationVisualizer::colorize_segmentation(segmentation_maps[idx]));
            std::ostringstream title;
            title << "Segmentation";
            if (anomaly_scores) {
                title << " (" << std::fixed << std::setprecision(3) << (*anomaly_scores)[idx] << ")";
            }
            titles.push_back(title.str());

            visualizer.save_figure(segmentation_savename(image_path, path_depth),
                                   visualizer.compose_figure(panels, titles));
            ++written;
        } catch (const std::exception& e) {
            std::cerr << "\nWarning: skipping segmentation image for " << image_path << ": " << e.what() << std::endl;
        }

        if ((idx + 1) % 10 == 0 || idx + 1 == total) {
            std::cout << "  Generating segmentation images " << idx + 1 << "/" << total << "\r" << std::flush;
        }
    }
    std::cout << std::endl;
    std::cout << "Wrote " << written << "/" << total << " segmentation images to " << out_dir << std::endl;
}

void render_dataset_segmentations(const std::string& out_dir,
                                  const MVTecDataset& dataset,
                                  const std::vector<torch::Tensor>& segmentation_maps,
                                  const std::optional<std::vector<float>>& anomaly_scores) {
    std::vector<std::string> image_paths;
    std::vector<std::optional<std::string>> mask_paths;
    for (const auto& record : dataset.records()) {
        image_paths.push_back(record.image_path);
        mask_paths.push_back(record.mask_path);
    }

    DenormalizeReconstruct image_reconstruct(
        [&dataset](const cv::Mat& rgb) { return dataset.transform_img(rgb); },
        std::vector<double>(dataset.transform_mean().begin(), dataset.transform_mean().end()),
        std::vector<double>(dataset.transform_std().begin(), dataset.transform_std().end()));
    TensorReconstruct mask_reconstruct(
        [&dataset](const cv::Mat& rgb) { return dataset.transform_mask(rgb); });

    render_segmentations(out_dir, image_paths, segmentation_maps, anomaly_scores, mask_paths,
                         image_reconstruct, mask_reconstruct);
}
