//
// dataloaders.cpp - Loader bundle construction
//

#include "dataloaders.hpp"

#include <iostream>
#include <stdexcept>

torch::data::DataLoaderOptions make_loader_options(int64_t batch_size, size_t num_workers) {
    if (batch_size <= 0) {
        throw std::invalid_argument("Batch size must be greater than 0");
    }

    auto options = torch::data::DataLoaderOptions()
        .batch_size(static_cast<size_t>(batch_size))
        .workers(num_workers);
    if (num_workers > 0) {
        options.max_jobs(Config::PREFETCH_FACTOR * num_workers);
    }
    return options;
}

std::vector<DataloaderBundle> build_dataloaders(const std::string& name,
                                                const std::string& data_path,
                                                const std::vector<std::string>& subdatasets,
                                                double train_val_split,
                                                int64_t batch_size,
                                                int64_t resize,
                                                int64_t image_size,
                                                size_t num_workers,
                                                bool augment) {
    std::vector<DataloaderBundle> dataloaders;
    dataloaders.reserve(subdatasets.size());

    for (const auto& subdataset : subdatasets) {
        auto train_dataset = std::make_shared<MVTecDataset>(
            data_path, subdataset, DatasetSplit::TRAIN, resize,
            Config::DEFAULT_IMAGE_SIZE, augment, train_val_split);

        auto test_dataset = std::make_shared<MVTecDataset>(
            data_path, subdataset, DatasetSplit::TEST, resize,
            image_size, false, train_val_split);

        const std::string loader_name = name + "_" + subdataset;

        DataloaderBundle bundle{
            make_dataloader<torch::data::samplers::RandomSampler>(loader_name, train_dataset, batch_size, num_workers),
            make_dataloader<torch::data::samplers::SequentialSampler>(loader_name, test_dataset, batch_size, num_workers)
        };

        std::cout << "Dataloaders ready for " << loader_name << ": "
                  << train_dataset->size().value() << " train / "
                  << test_dataset->size().value() << " test samples" << std::endl;

        dataloaders.push_back(std::move(bundle));
    }

    return dataloaders;
}
