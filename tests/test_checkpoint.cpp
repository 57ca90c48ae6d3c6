#include <gtest/gtest.h>
#include <cmath>
#include <fstream>

#include "checkpoint.hpp"
#include "errors.hpp"
#include "model.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

class CheckpointStoreTest : public ::testing::Test {
protected:
    TempDir dir;
    RunConfig config = tiny_config(dir, HidingScheme::UDH);

    StegoNetworks networks(uint64_t seed) const { return make_networks(config, seed); }
};

TEST_F(CheckpointStoreTest, LoadRestoresSavedParameters) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto saved = networks(1);
    auto id = store.save("run", 3, *saved.hiding, *saved.revealing, nullptr, config);

    EXPECT_EQ(id.run_tag, "run");
    EXPECT_EQ(id.epoch, 3);
    EXPECT_EQ(id.str(), "run@3");
    EXPECT_TRUE(fs::is_regular_file(id.path));

    auto restored = networks(2);
    ASSERT_FALSE(same_tensors(snapshot(*saved.hiding), snapshot(*restored.hiding)));
    store.load(id, *restored.hiding, *restored.revealing);

    EXPECT_TRUE(same_tensors(snapshot(*saved.hiding), snapshot(*restored.hiding)));
    EXPECT_TRUE(same_tensors(snapshot(*saved.revealing), snapshot(*restored.revealing)));
}

TEST_F(CheckpointStoreTest, ResolveLatestAndSpecificEpoch) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto nets = networks(1);
    for (int epoch : {1, 2, 3}) {
        store.save("run", epoch, *nets.hiding, *nets.revealing, nullptr, config);
    }

    EXPECT_EQ(store.list("run"), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(store.resolve("run", CheckpointSelector::latest()).epoch, 3);
    EXPECT_EQ(store.resolve("run@2").epoch, 2);
    EXPECT_EQ(store.resolve("run").epoch, 3);
    EXPECT_EQ(store.resolve("run@2").path, store.resolve("run", CheckpointSelector::at_epoch(2)).path);
}

TEST_F(CheckpointStoreTest, MissingCheckpointsAreReported) {
    CheckpointStore store(config.paths.checkpoint_dir);
    EXPECT_THROW(store.resolve("never_trained"), CheckpointNotFound);

    auto nets = networks(1);
    store.save("run", 1, *nets.hiding, *nets.revealing, nullptr, config);
    EXPECT_THROW(store.resolve("run@9"), CheckpointNotFound);

    CheckpointId stale{"run", 5, (dir.path / "nowhere.pt").string()};
    EXPECT_THROW(store.load(stale, *nets.hiding, *nets.revealing), CheckpointNotFound);

    EXPECT_THROW(store.resolve("run@x"), ConfigurationError);
}

TEST_F(CheckpointStoreTest, NoTemporaryFilesRemain) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto nets = networks(1);
    store.save("run", 1, *nets.hiding, *nets.revealing, nullptr, config);
    store.save("run", 2, *nets.hiding, *nets.revealing, nullptr, config);

    for (const auto& entry : fs::recursive_directory_iterator(config.paths.checkpoint_dir)) {
        EXPECT_NE(entry.path().extension().string(), ".tmp") << entry.path().string();
    }
    EXPECT_TRUE(fs::is_regular_file(fs::path(config.paths.checkpoint_dir) / "run" / "manifest.json"));
}

TEST_F(CheckpointStoreTest, KeepLastPrunesOldestSnapshots) {
    CheckpointStore store(config.paths.checkpoint_dir, 2);
    auto nets = networks(1);
    std::vector<CheckpointId> ids;
    for (int epoch = 1; epoch <= 4; epoch++) {
        ids.push_back(store.save("run", epoch, *nets.hiding, *nets.revealing, nullptr, config));
    }

    EXPECT_EQ(store.list("run"), (std::vector<int>{3, 4}));
    EXPECT_FALSE(fs::exists(ids[0].path));
    EXPECT_FALSE(fs::exists(ids[1].path));
    EXPECT_TRUE(fs::exists(ids[3].path));
    EXPECT_THROW(store.resolve("run@1"), CheckpointNotFound);
}

TEST_F(CheckpointStoreTest, SavingAnEpochTwiceReplacesIt) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto first = networks(1);
    auto second = networks(2);
    store.save("run", 1, *first.hiding, *first.revealing, nullptr, config);
    auto id = store.save("run", 1, *second.hiding, *second.revealing, nullptr, config);

    EXPECT_EQ(store.list("run"), (std::vector<int>{1}));
    auto restored = networks(3);
    store.load(id, *restored.hiding, *restored.revealing);
    EXPECT_TRUE(same_tensors(snapshot(*second.hiding), snapshot(*restored.hiding)));
}

TEST_F(CheckpointStoreTest, RunTagsAreIndependent) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto a = networks(1);
    auto b = networks(2);
    store.save("run_a", 1, *a.hiding, *a.revealing, nullptr, config);
    store.save("run_b", 5, *b.hiding, *b.revealing, nullptr, config);

    EXPECT_EQ(store.list("run_a"), (std::vector<int>{1}));
    EXPECT_EQ(store.list("run_b"), (std::vector<int>{5}));

    auto restored = networks(3);
    store.load(store.resolve("run_a"), *restored.hiding, *restored.revealing);
    EXPECT_TRUE(same_tensors(snapshot(*a.hiding), snapshot(*restored.hiding)));
}

TEST_F(CheckpointStoreTest, InvalidRunTagIsRejected) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto nets = networks(1);
    for (const char* tag : {"", "a/b", "..", "x@y"}) {
        EXPECT_THROW(store.save(tag, 1, *nets.hiding, *nets.revealing, nullptr, config), ConfigurationError) << tag;
    }
    EXPECT_THROW(CheckpointStore(config.paths.checkpoint_dir, -1), ConfigurationError);
}

TEST_F(CheckpointStoreTest, ConfigTravelsWithSnapshot) {
    CheckpointStore store(config.paths.checkpoint_dir);
    config.capacity.num_training = 2;
    config.training.beta = 0.5;
    auto nets = networks(1);
    auto id = store.save("run", 1, *nets.hiding, *nets.revealing, nullptr, config);

    auto stored = store.read_config(id);
    EXPECT_EQ(stored.to_json(), config.to_json());
}

TEST_F(CheckpointStoreTest, OptimizerStateIsRestored) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto nets = networks(1);
    torch::optim::Adam optimizer(nets.parameters(), torch::optim::AdamOptions(1e-3));

    auto loss = nets.revealing->decode(nets.hiding->encode(torch::rand({2, 3, 16, 16}), torch::rand({2, 3, 16, 16})))
                    .mean();
    loss.backward();
    optimizer.step();
    auto id = store.save("run", 1, *nets.hiding, *nets.revealing, &optimizer, config);

    auto restored_nets = networks(2);
    torch::optim::Adam restored(restored_nets.parameters(), torch::optim::AdamOptions(1e-3));
    store.load(id, *restored_nets.hiding, *restored_nets.revealing, &restored);

    auto& state = restored.state();
    EXPECT_FALSE(state.empty());
    EXPECT_EQ(state.size(), optimizer.state().size());

    // Snapshots written without an optimizer cannot resume one.
    auto bare = store.save("run", 2, *nets.hiding, *nets.revealing, nullptr, config);
    EXPECT_THROW(store.load(bare, *restored_nets.hiding, *restored_nets.revealing, &restored), StegoError);
}

TEST_F(CheckpointStoreTest, MalformedReferencesAreConfigurationErrors) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto nets = networks(1);
    store.save("run", 1, *nets.hiding, *nets.revealing, nullptr, config);

    EXPECT_THROW(store.resolve("run@99999999999"), ConfigurationError);
    EXPECT_THROW(store.resolve("run@\xC3\xA9"), ConfigurationError);
    EXPECT_THROW(store.resolve("run@"), ConfigurationError);
    EXPECT_THROW(store.resolve("run@-1"), ConfigurationError);
    EXPECT_EQ(store.resolve("run@000000001").epoch, 1);
}

TEST_F(CheckpointStoreTest, ManifestWithoutEpochListIsCorrupt) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto run_dir = fs::path(config.paths.checkpoint_dir) / "run";
    fs::create_directories(run_dir);

    std::ofstream(run_dir / "manifest.json") << R"({"run_tag": "run"})";
    EXPECT_THROW(store.list("run"), StegoError);

    std::ofstream(run_dir / "manifest.json", std::ios::trunc) << R"({"epochs": ["one"]})";
    EXPECT_THROW(store.list("run"), StegoError);
    EXPECT_THROW(store.resolve("run"), StegoError);
}

TEST_F(CheckpointStoreTest, PlateauStateTravelsWithSnapshot) {
    CheckpointStore store(config.paths.checkpoint_dir);
    auto nets = networks(1);
    PlateauState saved{0.125, 3};
    auto id = store.save("run", 1, *nets.hiding, *nets.revealing, nullptr, config, &saved);

    PlateauState restored;
    store.load(id, *nets.hiding, *nets.revealing, nullptr, torch::kCPU, &restored);
    EXPECT_DOUBLE_EQ(restored.best_loss, 0.125);
    EXPECT_EQ(restored.bad_epochs, 3);

    // Snapshots without plateau state leave the caller's state alone.
    auto bare = store.save("run", 2, *nets.hiding, *nets.revealing, nullptr, config);
    PlateauState untouched;
    store.load(bare, *nets.hiding, *nets.revealing, nullptr, torch::kCPU, &untouched);
    EXPECT_TRUE(std::isinf(untouched.best_loss));
    EXPECT_EQ(untouched.bad_epochs, 0);
}
