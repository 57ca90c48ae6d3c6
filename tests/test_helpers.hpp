#pragma once

#include <torch/torch.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "data.hpp"
#include "util.hpp"

struct TempDir {
    std::filesystem::path path;

    TempDir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("deephiding_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }
};

// Small enough to train on the CPU in a test.
inline RunConfig tiny_config(const TempDir& dir, HidingScheme scheme = HidingScheme::UDH) {
    RunConfig config;
    config.data.image_size = 16;
    config.model.scheme = scheme;
    config.model.num_downs = 2;
    config.model.base_filters = 4;
    config.model.reveal_filters = 4;
    config.training.batch_size_secret = 2;
    config.training.epochs = 1;
    config.training.log_frequency = 1;
    config.training.seed = 7;
    config.test.batch_size = 2;
    config.test.num_batches = 2;
    config.test.metrics = {"apd", "psnr"};
    config.test.save_images = false;
    config.paths.checkpoint_dir = (dir.path / "checkpoints").string();
    config.paths.log_dir = "";
    config.paths.output_dir = (dir.path / "results").string();
    config.run_tag = std::string("tiny_") + to_string(scheme);
    return config;
}

inline RunContext quiet_context(const RunConfig& config) {
    return RunContext::create(config, std::make_shared<Logger>("", true));
}

// Serves a fixed list of batches and counts how many were handed out.
class ScriptedSource : public BatchSource {
    BatchLayout batch_layout;
    std::vector<StegoBatch> batches;
    size_t cursor = 0;

public:
    int served = 0;
    std::function<void(int)> on_serve;

    ScriptedSource(const BatchLayout& layout, std::vector<StegoBatch> batches)
        : batch_layout(layout), batches(std::move(batches)) {}

    void reset(uint64_t) override { cursor = 0; }
    std::optional<StegoBatch> next() override {
        if (cursor >= batches.size()) return std::nullopt;
        served++;
        auto batch = batches[cursor++];
        if (on_serve) on_serve(served);
        return batch;
    }
    size_t batches_per_epoch() const override { return batches.size(); }
    const BatchLayout& layout() const override { return batch_layout; }
};

inline std::vector<torch::Tensor> snapshot(const torch::nn::Module& module) {
    std::vector<torch::Tensor> copies;
    for (const auto& p : module.parameters()) copies.push_back(p.detach().clone());
    return copies;
}

inline bool same_tensors(const std::vector<torch::Tensor>& a, const std::vector<torch::Tensor>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (!torch::equal(a[i], b[i])) return false;
    }
    return true;
}
