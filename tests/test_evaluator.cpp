#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <cmath>
#include <fstream>

#include "checkpoint.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "model.hpp"
#include "test_helpers.hpp"
#include "trainer.hpp"

namespace fs = std::filesystem;

class EvaluatorTest : public ::testing::Test {
protected:
    TempDir dir;
    RunConfig config = tiny_config(dir, HidingScheme::UDH);
    CheckpointStore store{config.paths.checkpoint_dir};

    // Untrained networks are enough to exercise the evaluation mechanics.
    CheckpointId save_run(const RunConfig& run_config, uint64_t seed = 1) {
        auto nets = make_networks(run_config, seed);
        return store.save(run_config.experiment_name(), 1, *nets.hiding, *nets.revealing, nullptr, run_config);
    }

    SourceFactory synthetic(uint64_t seed = 21) const {
        size_t batches = static_cast<size_t>(config.test.num_batches);
        return [batches, seed](const BatchLayout& layout) -> std::unique_ptr<BatchSource> {
            return std::make_unique<SyntheticBatchSource>(layout, batches, seed);
        };
    }
};

static void expect_finite_slice(const SliceMetrics& slice) {
    EXPECT_GT(slice.samples, 0);
    EXPECT_TRUE(std::isfinite(slice.hiding_distortion));
    EXPECT_TRUE(std::isfinite(slice.reveal_error));
    EXPECT_GE(slice.hiding_distortion, 0.0);
    EXPECT_GE(slice.reveal_error, 0.0);
    for (const auto& metrics : {slice.hiding_metrics, slice.reveal_metrics}) {
        for (const auto& entry : metrics) {
            EXPECT_TRUE(std::isfinite(entry.second)) << entry.first;
            EXPECT_GE(entry.second, 0.0) << entry.first;
        }
    }
}

TEST_F(EvaluatorTest, TrainedUdhRunProducesFiniteMetrics) {
    config.data.image_size = 128;
    config.model.num_downs = 5;
    config.model.norm = NormMode::Batch;
    config.training.loss = LossKind::L2;
    config.training.beta = 0.75;
    config.training.batches_per_epoch = 1;
    config.test.batch_size = 40;
    config.test.num_batches = 1;
    config.test.metrics = {"apd", "psnr", "ssim"};
    config.test.save_images = true;

    auto context = quiet_context(config);
    {
        Trainer trainer(config, context, make_networks(config, context.seed), store);
        SyntheticBatchSource train(BatchLayout::training(config), 1, 3);
        trainer.run(train);
    }

    Evaluator evaluator(config, context, store);
    SyntheticBatchSource test(BatchLayout::evaluation(config, {1, 1}), 1, 9);
    auto report = evaluator.evaluate(store.resolve(config.experiment_name()), test, {1, 1});

    EXPECT_EQ(report.scheme, HidingScheme::UDH);
    EXPECT_EQ(report.epoch, 1);
    ASSERT_EQ(report.per_capacity_slice.size(), 1u);
    const auto& slice = report.per_capacity_slice.at({1, 1});
    EXPECT_EQ(slice.samples, 40);
    expect_finite_slice(slice);
    EXPECT_LE(slice.hiding_metrics.at("ssim"), 1.0 + 1e-9);
    EXPECT_DOUBLE_EQ(report.hiding_distortion, slice.hiding_distortion);

    // Containers are written as images, so they are quantised from [0, 1].
    auto container = cv::imread((fs::path(config.paths.output_dir) / config.experiment_name() / "epoch_1" /
                                 "1secret_1cover" / "containers" / "container_0_0.png").string());
    ASSERT_FALSE(container.empty());
    EXPECT_EQ(container.rows, 128);
}

TEST_F(EvaluatorTest, SameSeedGivesIdenticalReports) {
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);

    auto first = evaluator.sweep(id, synthetic(), {});
    auto second = evaluator.sweep(id, synthetic(), {});
    EXPECT_EQ(first.to_json().dump(), second.to_json().dump());
}

TEST_F(EvaluatorTest, SweepEvaluatesSmallerSecretCountsWithBlankSlots) {
    config.capacity.num_secret = 2;
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);

    auto report = evaluator.sweep(id, synthetic(), {{1, 1}, {2, 1}});
    ASSERT_EQ(report.per_capacity_slice.size(), 2u);
    EXPECT_EQ(report.trained_capacity, (CapacityConfig{2, 1}));

    const auto& partial = report.per_capacity_slice.at({1, 1});
    const auto& full = report.per_capacity_slice.at({2, 1});
    expect_finite_slice(partial);
    expect_finite_slice(full);
    EXPECT_EQ(partial.samples, config.test.batch_size * config.test.num_batches);
    EXPECT_DOUBLE_EQ(report.reveal_error, full.reveal_error);

    auto j = report.to_json();
    EXPECT_EQ(j["slices"].size(), 2u);
    EXPECT_EQ(j["run_tag"], config.experiment_name());
}

TEST_F(EvaluatorTest, EmptySweepEvaluatesTrainedCapacity) {
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);

    auto report = evaluator.sweep(id, synthetic(), {});
    ASSERT_EQ(report.per_capacity_slice.size(), 1u);
    EXPECT_EQ(report.per_capacity_slice.begin()->first, (CapacityConfig{1, 1}));
}

TEST_F(EvaluatorTest, CapacitiesBeyondTheTrainedNetworksAreRejected) {
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);

    EXPECT_THROW(evaluator.sweep(id, synthetic(), {{2, 1}}), ConfigurationError);
    EXPECT_THROW(evaluator.sweep(id, synthetic(), {{1, 2}}), ConfigurationError);
}

TEST_F(EvaluatorTest, SourceLayoutMustMatchCapacity) {
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);

    auto layout = BatchLayout::evaluation(config, {1, 1});
    layout.image_size = 32;
    SyntheticBatchSource source(layout, 1, 1);
    EXPECT_THROW(evaluator.evaluate(id, source, {1, 1}), ConfigurationError);
}

TEST_F(EvaluatorTest, CompareReportsBothSchemes) {
    auto udh = save_run(config);
    auto ddh_config = tiny_config(dir, HidingScheme::DDH);
    auto ddh = save_run(ddh_config);

    Evaluator evaluator(config, quiet_context(config), store);
    auto comparison = evaluator.compare(udh, ddh, synthetic(), {});
    ASSERT_TRUE(comparison.udh.has_value());
    ASSERT_TRUE(comparison.ddh.has_value());
    EXPECT_EQ(comparison.udh->scheme, HidingScheme::UDH);
    EXPECT_EQ(comparison.ddh->scheme, HidingScheme::DDH);

    auto j = comparison.to_json();
    EXPECT_TRUE(j.contains("udh"));
    EXPECT_TRUE(j.contains("ddh"));

    auto only_udh = evaluator.compare(udh, std::nullopt, synthetic(), {});
    EXPECT_FALSE(only_udh.ddh.has_value());

    EXPECT_THROW(evaluator.compare(ddh, udh, synthetic(), {}), ConfigurationError);
    EXPECT_THROW(evaluator.compare(std::nullopt, std::nullopt, synthetic(), {}), ConfigurationError);
}

TEST_F(EvaluatorTest, MissingCheckpointIsReported) {
    Evaluator evaluator(config, quiet_context(config), store);
    EXPECT_THROW(store.resolve("ghost"), CheckpointNotFound);

    CheckpointId ghost{"ghost", 1, (dir.path / "ghost.pt").string()};
    SyntheticBatchSource source(BatchLayout::evaluation(config, {1, 1}), 1, 1);
    EXPECT_THROW(evaluator.evaluate(ghost, source, {1, 1}), CheckpointNotFound);
}

TEST_F(EvaluatorTest, SavesResultGridWhenEnabled) {
    config.test.save_images = true;
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);
    evaluator.sweep(id, synthetic(), {});

    auto slice_dir = fs::path(config.paths.output_dir) / id.run_tag / "epoch_1" / "1secret_1cover";
    EXPECT_TRUE(fs::is_regular_file(slice_dir / "result_pics.png"));
    EXPECT_TRUE(fs::is_regular_file(slice_dir / "containers" / "container_0_0.png"));
    EXPECT_TRUE(fs::is_regular_file(slice_dir / "containers" / "container_1_0.png"));
}

TEST_F(EvaluatorTest, RevealsSecretsFromContainerFiles) {
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);

    auto container_path = (dir.path / "container.png").string();
    cv::imwrite(container_path, cv::Mat(24, 24, CV_8UC3, cv::Scalar(30, 90, 200)));

    auto out_dir = (dir.path / "revealed").string();
    auto written = evaluator.reveal_images(id, {container_path}, out_dir);
    ASSERT_EQ(written.size(), 1u);

    auto revealed = cv::imread(written[0]);
    ASSERT_FALSE(revealed.empty());
    EXPECT_EQ(revealed.rows, config.data.image_size);

    EXPECT_THROW(evaluator.reveal_images(id, {container_path, container_path}, out_dir), ConfigurationError);
    EXPECT_THROW(evaluator.reveal_images(id, {(dir.path / "none.png").string()}, out_dir), StegoError);
}

TEST_F(EvaluatorTest, UnknownMetricIsRejected) {
    config.test.metrics = {"psnr", "lpips"};
    EXPECT_THROW(Evaluator(config, quiet_context(config), store), ConfigurationError);

    auto registry = MetricRegistry::with_defaults();
    registry.add("lpips", [](const torch::Tensor&, const torch::Tensor&) { return 0.0; });
    EXPECT_NO_THROW(Evaluator(config, quiet_context(config), store, registry));
}

TEST_F(EvaluatorTest, WritesReportAsJson) {
    auto id = save_run(config);
    Evaluator evaluator(config, quiet_context(config), store);
    auto comparison = evaluator.compare(id, std::nullopt, synthetic(), {});

    auto path = (dir.path / "out" / "report.json").string();
    Evaluator::write_report(comparison.to_json(), path);

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    auto j = nlohmann::json::parse(file);
    EXPECT_EQ(j["udh"]["epoch"], 1);
    EXPECT_EQ(j["udh"]["slices"][0]["samples"], config.test.batch_size * config.test.num_batches);
}

TEST_F(EvaluatorTest, ReducedCapacitySliceScoresOnlyActiveSlots) {
    config.capacity.num_secret = 2;
    config.test.num_batches = 1;
    auto id = save_run(config, 3);
    auto context = quiet_context(config);
    Evaluator evaluator(config, context, store);

    auto report = evaluator.sweep(id, synthetic(21), {{1, 1}});
    const auto& slice = report.per_capacity_slice.at({1, 1});

    // Same checkpoint, same held-out batch, scored by hand on the first slot.
    SyntheticBatchSource source(BatchLayout::evaluation(config, {1, 1}), 1, 21);
    source.reset(context.seed);
    auto batch = source.next();
    ASSERT_TRUE(batch.has_value());

    auto nets = make_networks(config, 3);
    nets.eval();
    torch::NoGradGuard no_grad;
    auto cover = pack_bundle(batch->cover, 1);
    auto secret = pad_bundle(batch->secret, 1, 2);
    auto revealed = unpack_bundle(nets.revealing->decode(nets.hiding->encode(cover, secret)), 2);
    auto first_slot = revealed.reshape({-1, 2, revealed.size(1), revealed.size(2), revealed.size(3)}).select(1, 0);

    double expected = torch::mse_loss(first_slot, batch->secret).item<double>();
    EXPECT_NEAR(slice.reveal_error, expected, 1e-5);
    EXPECT_EQ(slice.samples, config.test.batch_size);
}

TEST_F(EvaluatorTest, MissingLoggerIsRejected) {
    RunContext context{torch::kCPU, 7, nullptr};
    EXPECT_THROW(std::make_unique<Evaluator>(config, context, store), ConfigurationError);
}

TEST_F(EvaluatorTest, UnsupportedSecretChannelsAreRejected) {
    config.data.channels_secret = 2;
    EXPECT_THROW(config.validate(), ConfigurationError);
    EXPECT_THROW(make_networks(config, 1), ConfigurationError);
}
