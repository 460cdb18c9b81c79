//
// visualization.hpp - Image / ground truth / anomaly map comparison figures
//

#ifndef VISUALIZATION_HPP
#define VISUALIZATION_HPP

#include <torch/torch.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <optional>
#include <string>
#include <vector>

#include "utils/config.hpp"
#include "utils/reconstruct.hpp"

class MVTecDataset;

// Writes one PNG per sample under out_dir: [image | segmentation] or, when
// mask_paths is given, [image | mask | segmentation]. Index i of every
// sequence describes the same sample. A nullopt entry in mask_paths draws an
// empty mask for that sample.
//
// Sequence lengths are checked before anything touches the disk and throw
// ShapeMismatchError. A sample that fails to load or write is reported on
// std::cerr and skipped; the remaining samples are still rendered.
void render_segmentations(const std::string& out_dir,
                          const std::vector<std::string>& image_paths,
                          const std::vector<torch::Tensor>& segmentation_maps,
                          const std::optional<std::vector<float>>& anomaly_scores,
                          const std::optional<std::vector<std::optional<std::string>>>& mask_paths,
                          const ReconstructTransform& image_reconstruct,
                          const ReconstructTransform& mask_reconstruct,
                          int path_depth = Config::DEFAULT_SAVE_DEPTH);

// Same as above with paths, masks and the inverse normalization taken from the dataset
void render_dataset_segmentations(const std::string& out_dir,
                                  const MVTecDataset& dataset,
                                  const std::vector<torch::Tensor>& segmentation_maps,
                                  const std::optional<std::vector<float>>& anomaly_scores = std::nullopt);

// Last path_depth '/'-separated segments of image_path joined by '_'.
// A path_depth of 0 keeps the whole path, a negative one drops that many leading segments.
std::string segmentation_savename(const std::string& image_path, int path_depth);

// Drops singleton dimensions until a [H, W] float field is left
torch::Tensor as_segmentation_field(const torch::Tensor& segmentation);

class SegmentationVisualizer {
public:
    explicit SegmentationVisualizer(const std::string& output_dir);

    // chw: [C, H, W] with C of 1 or 3, uint8 or float in [0, 1]. Returns BGR.
    static cv::Mat tensor_to_cv(const torch::Tensor& chw);

    // Min-max scaled and mapped through viridis. Returns BGR.
    static cv::Mat colorize_segmentation(const torch::Tensor& field);

    cv::Mat compose_figure(const std::vector<cv::Mat>& panels, const std::vector<std::string>& titles) const;

    void save_figure(const std::string& filename, const cv::Mat& figure) const;

    const std::string& output_dir() const { return output_dir_; }

private:
    cv::Mat fit_panel(const cv::Mat& image, const std::string& title) const;

    std::string output_dir_;
    int panel_size_;

    const int TITLE_FONT = cv::FONT_HERSHEY_SIMPLEX;
    const double TITLE_SCALE = 0.5;
    const int TITLE_THICKNESS = 1;
    const int TITLE_HEIGHT = 24;
};

#endif //VISUALIZATION_HPP
