// =============================================================================
// prediction_store.cpp - HDF5 read/write of model predictions
// =============================================================================

#include "prediction_store.hpp"
#include "errors.hpp"
#include "visualization.hpp"

#include <H5Cpp.h>
#include <iostream>
#include <stdexcept>

void save_predictions(const std::string& path, const Predictions& predictions) {
    if (predictions.segmentations.size() != predictions.scores.size()) {
        throw ShapeMismatchError("Got " + std::to_string(predictions.segmentations.size()) +
                                 " segmentations for " + std::to_string(predictions.scores.size()) + " scores");
    }
    if (predictions.scores.empty()) {
        throw std::runtime_error("No predictions to save");
    }

    std::vector<torch::Tensor> fields;
    fields.reserve(predictions.segmentations.size());
    for (const auto& segmentation : predictions.segmentations) {
        fields.push_back(as_segmentation_field(segmentation));
    }
    // All maps of one file share one resolution
    auto stacked = torch::stack(fields).contiguous();

    try {
        H5::H5File file(path, H5F_ACC_TRUNC);

        hsize_t seg_dims[3] = {static_cast<hsize_t>(stacked.size(0)),
                               static_cast<hsize_t>(stacked.size(1)),
                               static_cast<hsize_t>(stacked.size(2))};
        H5::DataSpace seg_space(3, seg_dims);
        H5::DataSet seg_dataset = file.createDataSet("segmentations", H5::PredType::NATIVE_FLOAT, seg_space);
        seg_dataset.write(stacked.data_ptr<float>(), H5::PredType::NATIVE_FLOAT);

        hsize_t score_dims[1] = {static_cast<hsize_t>(predictions.scores.size())};
        H5::DataSpace score_space(1, score_dims);
        H5::DataSet score_dataset = file.createDataSet("scores", H5::PredType::NATIVE_FLOAT, score_space);
        score_dataset.write(predictions.scores.data(), H5::PredType::NATIVE_FLOAT);

        file.close();
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to write H5 file " + path + ": " + e.getCDetailMsg());
    }
}

Predictions load_predictions(const std::string& path) {
    try {
        H5::H5File file(path, H5F_ACC_RDONLY);

        if (!H5Lexists(file.getId(), "segmentations", H5P_DEFAULT) ||
            !H5Lexists(file.getId(), "scores", H5P_DEFAULT)) {
            throw std::runtime_error("H5 file " + path + " needs 'segmentations' and 'scores' datasets");
        }

        H5::DataSet seg_dataset = file.openDataSet("segmentations");
        H5::DataSpace seg_space = seg_dataset.getSpace();
        if (seg_space.getSimpleExtentNdims() != 3) {
            throw ShapeMismatchError("'segmentations' in " + path + " must be [N, H, W]");
        }
        hsize_t seg_dims[3];
        seg_space.getSimpleExtentDims(seg_dims);

        std::vector<float> seg_data(seg_dims[0] * seg_dims[1] * seg_dims[2]);
        seg_dataset.read(seg_data.data(), H5::PredType::NATIVE_FLOAT);

        H5::DataSet score_dataset = file.openDataSet("scores");
        H5::DataSpace score_space = score_dataset.getSpace();
        if (score_space.getSimpleExtentNdims() != 1) {
            throw ShapeMismatchError("'scores' in " + path + " must be [N]");
        }
        hsize_t score_dims[1];
        score_space.getSimpleExtentDims(score_dims);
        if (score_dims[0] != seg_dims[0]) {
            throw ShapeMismatchError("H5 file " + path + " has " + std::to_string(seg_dims[0]) +
                                     " segmentations but " + std::to_string(score_dims[0]) + " scores");
        }

        Predictions predictions;
        predictions.scores.resize(score_dims[0]);
        score_dataset.read(predictions.scores.data(), H5::PredType::NATIVE_FLOAT);

        file.close();

        auto all_maps = torch::from_blob(seg_data.data(),
                                         {static_cast<int64_t>(seg_dims[0]),
                                          static_cast<int64_t>(seg_dims[1]),
                                          static_cast<int64_t>(seg_dims[2])},
                                         torch::kFloat32).clone();
        for (int64_t i = 0; i < all_maps.size(0); ++i) {
            predictions.segmentations.push_back(all_maps[i]);
        }

        std::cout << "Loaded " << predictions.size() << " predictions ("
                  << seg_dims[1] << "x" << seg_dims[2] << " maps) from " << path << std::endl;
        return predictions;

    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to load H5 file " + path + ": " + e.getCDetailMsg());
    }
}
