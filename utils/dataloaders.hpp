//
// dataloaders.hpp - Per-class train/test loader bundles over MVTec datasets
//

#ifndef DATALOADERS_HPP
#define DATALOADERS_HPP

#include <torch/torch.h>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "utils/config.hpp"
#include "utils/mvtec_dataset.hpp"

using SharedMVTecDataset = torch::data::datasets::SharedBatchDataset<MVTecDataset>;
using CollatedMVTecDataset = torch::data::datasets::MapDataset<SharedMVTecDataset, CollateSamples>;

template <typename Sampler>
using MVTecLoader = torch::data::StatelessDataLoader<CollatedMVTecDataset, Sampler>;

// A loader together with what it was built from. The dataset is shared with
// the loader's workers, which only read from it.
template <typename Sampler>
struct Dataloader {
    std::string name;
    DatasetSplit split;
    size_t batch_size;
    bool shuffle;
    size_t worker_count;
    std::shared_ptr<MVTecDataset> dataset;
    std::unique_ptr<MVTecLoader<Sampler>> loader;

    // A new pass may only start once the previous one is exhausted
    auto begin() { return loader->begin(); }
    auto end() { return loader->end(); }
};

using TrainDataloader = Dataloader<torch::data::samplers::RandomSampler>;
using TestDataloader = Dataloader<torch::data::samplers::SequentialSampler>;

struct DataloaderBundle {
    TrainDataloader train;
    TestDataloader test;
};

// One bundle per subdataset, in the order given. TRAIN loaders are shuffled
// and optionally augmented, TEST loaders are sequential and never augmented.
// Both carry the name "<name>_<subdataset>". Errors from building a dataset
// (missing class folder, no images) reach the caller unchanged.
std::vector<DataloaderBundle> build_dataloaders(const std::string& name,
                                                const std::string& data_path,
                                                const std::vector<std::string>& subdatasets,
                                                double train_val_split = 1.0,
                                                int64_t batch_size = Config::DEFAULT_BATCH_SIZE,
                                                int64_t resize = Config::DEFAULT_IMAGE_SIZE,
                                                int64_t image_size = Config::DEFAULT_IMAGE_SIZE,
                                                size_t num_workers = Config::DEFAULT_NUM_WORKERS,
                                                bool augment = true);

// Options shared by both loaders of a bundle: prefetch of PREFETCH_FACTOR batches per worker
torch::data::DataLoaderOptions make_loader_options(int64_t batch_size, size_t num_workers);

template <typename Sampler>
Dataloader<Sampler> make_dataloader(const std::string& name,
                                    std::shared_ptr<MVTecDataset> dataset,
                                    int64_t batch_size,
                                    size_t num_workers) {
    Dataloader<Sampler> dataloader;
    dataloader.name = name;
    dataloader.split = dataset->split();
    dataloader.batch_size = static_cast<size_t>(batch_size);
    dataloader.shuffle = std::is_same_v<Sampler, torch::data::samplers::RandomSampler>;
    dataloader.worker_count = num_workers;
    dataloader.dataset = dataset;

    auto collated = SharedMVTecDataset(dataset).map(CollateSamples(true));
    dataloader.loader = torch::data::make_data_loader<Sampler>(
        std::move(collated), make_loader_options(batch_size, num_workers));
    return dataloader;
}

#endif //DATALOADERS_HPP
