#include "test_helpers.hpp"
#include "utils/errors.hpp"
#include "utils/mvtec_dataset.hpp"
#include "utils/reconstruct.hpp"
#include "utils/visualization.hpp"

#include <torch/torch.h>

namespace {

size_t count_files(const fs::path& dir) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++count;
    }
    return count;
}

} // namespace

using RenderSegmentationsTest = TempDirTest;

TEST(SegmentationSavenameTest, JoinsLastSegments) {
    EXPECT_EQ(segmentation_savename("/data/mvtec/bottle/test/crack/000.png", 4), "bottle_test_crack_000.png");
    EXPECT_EQ(segmentation_savename("/data/mvtec/bottle/test/crack/000.png", 2), "crack_000.png");
    EXPECT_EQ(segmentation_savename("crack/000.png", 4), "crack_000.png");
}

TEST(SegmentationSavenameTest, NonPositiveDepthSlicesFromTheFront) {
    EXPECT_EQ(segmentation_savename("/data/mvtec/bottle/test/crack/000.png", 0),
              "_data_mvtec_bottle_test_crack_000.png");
    EXPECT_EQ(segmentation_savename("/data/mvtec/bottle/test/crack/000.png", -3), "bottle_test_crack_000.png");
    EXPECT_EQ(segmentation_savename("crack/000.png", -5), "");
}

TEST(SegmentationFieldTest, SqueezesSingletonDimensions) {
    EXPECT_EQ(as_segmentation_field(torch::rand({1, 1, 5, 6})).sizes(), torch::IntArrayRef({5, 6}));
    EXPECT_EQ(as_segmentation_field(torch::rand({5, 6, 1})).sizes(), torch::IntArrayRef({5, 6}));
    EXPECT_EQ(as_segmentation_field(torch::rand({5, 6}).to(torch::kFloat64)).scalar_type(), torch::kFloat32);
    EXPECT_THROW(as_segmentation_field(torch::rand({2, 5, 6})), ShapeMismatchError);
}

TEST_F(RenderSegmentationsTest, TwoPanelsWithoutMasks) {
    std::vector<std::string> images = {
        write_test_image(root_ / "data" / "bottle" / "test" / "good" / "000.png", 1),
        write_test_image(root_ / "data" / "bottle" / "test" / "good" / "001.png", 2)
    };
    std::vector<torch::Tensor> maps = {torch::rand({32, 32}), torch::rand({1, 32, 32})};
    fs::path out = root_ / "figures";

    IdentityReconstruct identity;
    render_segmentations(out.string(), images, maps, std::nullopt, std::nullopt, identity, identity);

    ASSERT_EQ(count_files(out), 2u);
    cv::Mat figure = cv::imread((out / "bottle_test_good_000.png").string());
    ASSERT_FALSE(figure.empty());
    EXPECT_EQ(figure.cols, 600);
    EXPECT_EQ(figure.rows, 300);
}

TEST_F(RenderSegmentationsTest, ThreePanelsWithMissingMaskEntry) {
    fs::path data = root_ / "data" / "bottle" / "test";
    std::vector<std::string> images = {
        write_test_image(data / "good" / "000.png", 1),
        write_test_image(data / "crack" / "000.png", 2)
    };
    std::vector<std::optional<std::string>> masks = {
        std::nullopt,
        write_test_image(root_ / "data" / "bottle" / "ground_truth" / "crack" / "000_mask.png", 3)
    };
    std::vector<float> scores = {0.1f, 0.9f};
    std::vector<torch::Tensor> maps = {torch::zeros({16, 16}), torch::rand({16, 16})};
    fs::path out = root_ / "figures";

    IdentityReconstruct identity;
    TensorReconstruct mask_transform([](const cv::Mat& rgb) {
        return mat_to_chw_tensor(rgb).to(torch::kFloat32) / 255.0;
    });
    render_segmentations(out.string(), images, maps, scores, masks, identity, mask_transform);

    ASSERT_EQ(count_files(out), 2u);
    for (const auto& name : {"bottle_test_good_000.png", "bottle_test_crack_000.png"}) {
        cv::Mat figure = cv::imread((out / name).string());
        ASSERT_FALSE(figure.empty()) << name;
        EXPECT_EQ(figure.cols, 900);
        EXPECT_EQ(figure.rows, 300);
    }
}

TEST_F(RenderSegmentationsTest, UnreadableSampleIsSkipped) {
    std::vector<std::string> images = {
        write_test_image(root_ / "a" / "000.png", 1),
        (root_ / "a" / "missing.png").string(),
        write_test_image(root_ / "a" / "002.png", 2)
    };
    std::vector<torch::Tensor> maps = {torch::rand({8, 8}), torch::rand({8, 8}), torch::rand({8, 8})};
    fs::path out = root_ / "figures";

    IdentityReconstruct identity;
    EXPECT_NO_THROW(render_segmentations(out.string(), images, maps, std::nullopt, std::nullopt,
                                         identity, identity, 2));

    EXPECT_EQ(count_files(out), 2u);
    EXPECT_TRUE(fs::exists(out / "a_000.png"));
    EXPECT_TRUE(fs::exists(out / "a_002.png"));
}

TEST_F(RenderSegmentationsTest, ZeroDepthKeepsOneFilePerSample) {
    std::vector<std::string> images = {
        write_test_image(root_ / "a" / "000.png", 1),
        write_test_image(root_ / "b" / "000.png", 2)
    };
    std::vector<torch::Tensor> maps = {torch::rand({8, 8}), torch::rand({8, 8})};
    fs::path out = root_ / "figures";

    IdentityReconstruct identity;
    render_segmentations(out.string(), images, maps, std::nullopt, std::nullopt, identity, identity, 0);

    EXPECT_EQ(count_files(out), 2u);
    EXPECT_FALSE(fs::exists(out / ".png"));
    EXPECT_TRUE(fs::exists(out / segmentation_savename(images[0], 0)));
    EXPECT_TRUE(fs::exists(out / segmentation_savename(images[1], 0)));
}

TEST_F(RenderSegmentationsTest, MismatchedLengthsThrowBeforeWriting) {
    std::vector<std::string> images = {write_test_image(root_ / "a" / "000.png", 1)};
    std::vector<torch::Tensor> maps = {torch::rand({8, 8}), torch::rand({8, 8})};
    fs::path out = root_ / "figures";

    IdentityReconstruct identity;
    EXPECT_THROW(render_segmentations(out.string(), images, maps, std::nullopt, std::nullopt, identity, identity),
                 ShapeMismatchError);
    EXPECT_THROW(render_segmentations(out.string(), images, {torch::rand({8, 8})}, std::vector<float>{0.1f, 0.2f},
                                      std::nullopt, identity, identity),
                 ShapeMismatchError);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(RenderSegmentationsTest, DatasetRenderUsesRecordsAndMasks) {
    write_mvtec_class(root_ / "mvtec", "bottle", 2, 2, 2);
    MVTecDataset dataset((root_ / "mvtec").string(), "bottle", DatasetSplit::TEST, 16, 16);
    std::vector<torch::Tensor> maps(dataset.size().value(), torch::rand({16, 16}));
    fs::path out = root_ / "figures";

    render_dataset_segmentations(out.string(), dataset, maps, std::vector<float>(maps.size(), 0.5f));

    EXPECT_EQ(count_files(out), dataset.size().value());
    cv::Mat figure = cv::imread((out / "bottle_test_crack_001.png").string());
    ASSERT_FALSE(figure.empty());
    EXPECT_EQ(figure.cols, 900);
}

TEST(TensorToCvTest, ConvertsRgbToBgr) {
    auto rgb = torch::zeros({3, 2, 2}, torch::kUInt8);
    rgb[0].fill_(255);

    cv::Mat bgr = SegmentationVisualizer::tensor_to_cv(rgb);

    ASSERT_EQ(bgr.type(), CV_8UC3);
    EXPECT_EQ(bgr.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 255));
}
