// =============================================================================
// prediction_store.hpp - Anomaly maps and scores exchanged through HDF5
// =============================================================================

#pragma once

#include <torch/torch.h>
#include <string>
#include <vector>

// File layout:
//   "segmentations"  float32 [N, H, W]  per-pixel anomaly map of each sample
//   "scores"         float32 [N]        image-level anomaly score
// Sample i belongs to record i of the TEST split it was computed on.
struct Predictions {
    std::vector<torch::Tensor> segmentations;
    std::vector<float> scores;

    size_t size() const { return scores.size(); }
};

void save_predictions(const std::string& path, const Predictions& predictions);

Predictions load_predictions(const std::string& path);
