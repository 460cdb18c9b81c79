#include "test_helpers.hpp"
#include "utils/dataloaders.hpp"
#include "utils/mvtec_dataset.hpp"
#include "utils/reproducibility.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace {

template <typename Loader>
std::vector<std::string> one_pass(Loader& dataloader) {
    std::vector<std::string> paths;
    for (auto& batch : dataloader) {
        paths.insert(paths.end(), batch.image_paths.begin(), batch.image_paths.end());
    }
    return paths;
}

template <typename Loader>
std::map<std::string, torch::Tensor> images_by_path(Loader& dataloader) {
    std::map<std::string, torch::Tensor> images;
    for (auto& batch : dataloader) {
        for (size_t i = 0; i < batch.size(); ++i) {
            images[batch.image_paths[i]] = batch.image[static_cast<int64_t>(i)].clone();
        }
    }
    return images;
}

std::vector<std::string> record_paths(const MVTecDataset& dataset) {
    std::vector<std::string> paths;
    for (const auto& record : dataset.records()) {
        paths.push_back(record.image_path);
    }
    return paths;
}

} // namespace

class DataloaderFactoryTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        data_root_ = (root_ / "mvtec").string();
        write_mvtec_class(data_root_, "bottle");
        write_mvtec_class(data_root_, "cable", 6, 2, 1);
        write_mvtec_class(data_root_, "screw", 4, 1, 3);
    }

    std::string data_root_;
};

TEST_F(DataloaderFactoryTest, OneNamedBundlePerSubdatasetInOrder) {
    std::vector<std::string> classes = {"screw", "bottle", "cable"};

    auto bundles = build_dataloaders("run", data_root_, classes, 1.0, 4, 32, 32, 0, false);

    ASSERT_EQ(bundles.size(), classes.size());
    for (size_t i = 0; i < classes.size(); ++i) {
        EXPECT_EQ(bundles[i].train.name, "run_" + classes[i]);
        EXPECT_EQ(bundles[i].test.name, "run_" + classes[i]);
        EXPECT_EQ(bundles[i].train.dataset->classname(), classes[i]);
        EXPECT_EQ(bundles[i].test.dataset->classname(), classes[i]);
        EXPECT_EQ(bundles[i].train.split, DatasetSplit::TRAIN);
        EXPECT_EQ(bundles[i].test.split, DatasetSplit::TEST);
        EXPECT_TRUE(bundles[i].train.shuffle);
        EXPECT_FALSE(bundles[i].test.shuffle);
        EXPECT_EQ(bundles[i].train.batch_size, 4u);
        EXPECT_EQ(bundles[i].train.worker_count, 0u);
    }
}

TEST_F(DataloaderFactoryTest, BundlesNeverShareDatasets) {
    auto bundles = build_dataloaders("run", data_root_, {"bottle", "bottle", "cable"}, 1.0, 4, 32, 32, 0, false);

    std::set<const MVTecDataset*> seen;
    for (const auto& bundle : bundles) {
        EXPECT_TRUE(seen.insert(bundle.train.dataset.get()).second);
        EXPECT_TRUE(seen.insert(bundle.test.dataset.get()).second);
    }
    EXPECT_EQ(seen.size(), 6u);
}

TEST_F(DataloaderFactoryTest, TrainPassesAreReshuffled) {
    fix_seeds(0, true, false);
    auto bundles = build_dataloaders("run", data_root_, {"bottle"}, 1.0, 4, 32, 32, 0, false);
    auto& train = bundles.front().train;

    auto first = one_pass(train);
    auto expected = record_paths(*train.dataset);
    ASSERT_EQ(first.size(), expected.size());

    bool reordered = false;
    for (int pass = 0; pass < 5; ++pass) {
        auto next = one_pass(train);
        auto sorted_next = next;
        std::sort(sorted_next.begin(), sorted_next.end());
        EXPECT_EQ(sorted_next, expected);
        reordered = reordered || next != first;
    }
    EXPECT_TRUE(reordered);
}

TEST_F(DataloaderFactoryTest, TestPassesKeepRecordOrder) {
    auto bundles = build_dataloaders("run", data_root_, {"bottle"}, 1.0, 2, 32, 32, 2, false);
    auto& test = bundles.front().test;
    auto expected = record_paths(*test.dataset);

    EXPECT_EQ(one_pass(test), expected);
    EXPECT_EQ(one_pass(test), expected);
}

TEST_F(DataloaderFactoryTest, AugmentationOnlyTouchesTrainSplit) {
    fix_seeds(7, true, false);
    auto bundles = build_dataloaders("run", data_root_, {"cable"}, 1.0, 4, 32, 32, 0, true);
    auto& bundle = bundles.front();

    auto train_first = images_by_path(bundle.train);
    auto train_second = images_by_path(bundle.train);
    ASSERT_EQ(train_first.size(), 6u);
    ASSERT_EQ(train_second.size(), train_first.size());
    for (const auto& [path, image] : train_first) {
        ASSERT_EQ(train_second.count(path), 1u) << path;
        EXPECT_FALSE(torch::equal(train_second.at(path), image)) << path;
    }

    auto test_first = images_by_path(bundle.test);
    auto test_second = images_by_path(bundle.test);
    ASSERT_EQ(test_first.size(), 3u);
    for (const auto& [path, image] : test_first) {
        EXPECT_TRUE(torch::equal(test_second.at(path), image)) << path;
    }
}

TEST_F(DataloaderFactoryTest, TestBatchesCarryMasksAndLabels) {
    auto bundles = build_dataloaders("run", data_root_, {"bottle"}, 1.0, 8, 32, 24, 0, false);

    size_t batches = 0;
    for (auto& batch : bundles.front().test) {
        ASSERT_EQ(batch.image.sizes().vec(), std::vector<int64_t>({5, 3, 24, 24}));
        ASSERT_EQ(batch.mask.sizes().vec(), std::vector<int64_t>({5, 1, 24, 24}));
        EXPECT_EQ(batch.is_anomaly.sum().item<int64_t>(), 2);
        // Good images come without a mask
        EXPECT_EQ(batch.mask[0].max().item<float>(), 0.0f);
        EXPECT_GT(batch.mask[4].max().item<float>(), 0.0f);
        EXPECT_EQ(batch.image_names[4], "bottle/test/crack/001.png");
        ++batches;
    }
    EXPECT_EQ(batches, 1u);
}

TEST_F(DataloaderFactoryTest, MissingSubdatasetPropagates) {
    EXPECT_THROW(build_dataloaders("run", data_root_, {"bottle", "zipper"}), std::runtime_error);
}

TEST_F(DataloaderFactoryTest, TrainValSplitPartitionsTrainingImages) {
    MVTecDataset train(data_root_, "bottle", DatasetSplit::TRAIN, 32, 32, false, 0.75);
    MVTecDataset val(data_root_, "bottle", DatasetSplit::VAL, 32, 32, false, 0.75);

    ASSERT_EQ(train.size().value(), 9u);
    ASSERT_EQ(val.size().value(), 3u);

    auto train_paths = record_paths(train);
    auto val_paths = record_paths(val);
    EXPECT_EQ(fs::path(train_paths.back()).filename(), "008.png");
    EXPECT_EQ(fs::path(val_paths.front()).filename(), "009.png");
    for (const auto& path : val_paths) {
        EXPECT_EQ(std::find(train_paths.begin(), train_paths.end(), path), train_paths.end());
    }
}

TEST_F(DataloaderFactoryTest, LoaderOptionsPrefetchTwoBatchesPerWorker) {
    auto options = make_loader_options(8, 3);
    EXPECT_EQ(options.batch_size(), 8u);
    EXPECT_EQ(options.workers(), 3u);
    ASSERT_TRUE(options.max_jobs().has_value());
    EXPECT_EQ(options.max_jobs().value(), 6u);

    EXPECT_THROW(make_loader_options(0, 1), std::invalid_argument);
}
