#pragma once

#include <torch/torch.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "model.hpp"
#include "util.hpp"

struct CheckpointId {
    std::string run_tag;
    int epoch = -1;
    std::string path;

    // "<run_tag>@<epoch>", accepted back by CheckpointStore::resolve.
    std::string str() const { return run_tag + "@" + std::to_string(epoch); }
};

// Reduce-on-plateau bookkeeping carried across a resume.
struct PlateauState {
    double best_loss = std::numeric_limits<double>::infinity();
    int bad_epochs = 0;
};

struct CheckpointSelector {
    int epoch = -1;

    static CheckpointSelector latest() { return {}; }
    static CheckpointSelector at_epoch(int epoch) { return {epoch}; }
    bool is_latest() const { return epoch < 0; }
};

// Snapshots live in <root>/<run_tag>/epoch_NNNN.pt, listed by
// <root>/<run_tag>/manifest.json. Both are written to a temporary file and
// renamed into place, so readers only ever see complete files.
class CheckpointStore {
    std::filesystem::path root;
    int keep_last;
    std::shared_ptr<Logger> logger;

    std::filesystem::path run_dir(const std::string& run_tag) const;
    std::filesystem::path manifest_path(const std::string& run_tag) const;
    std::filesystem::path snapshot_path(const std::string& run_tag, int epoch) const;
    nlohmann::json read_manifest(const std::string& run_tag) const;
    void write_manifest(const std::string& run_tag, const nlohmann::json& manifest) const;
    void prune(const std::string& run_tag, nlohmann::json& manifest) const;
    void open(const CheckpointId& id, torch::serialize::InputArchive& archive,
              torch::Device device = torch::kCPU) const;

public:
    explicit CheckpointStore(const std::string& root, int keep_last = 0, std::shared_ptr<Logger> logger = nullptr);

    CheckpointId save(const std::string& run_tag, int epoch, HidingNetwork& hiding, RevealingNetwork& revealing,
                      torch::optim::Optimizer* optimizer, const RunConfig& config,
                      const PlateauState* plateau = nullptr);

    // Restores parameters and buffers in place. The optimizer state is
    // restored when `optimizer` is given, the plateau state when `plateau`
    // is given and the snapshot carries one.
    void load(const CheckpointId& id, HidingNetwork& hiding, RevealingNetwork& revealing,
              torch::optim::Optimizer* optimizer = nullptr, torch::Device device = torch::kCPU,
              PlateauState* plateau = nullptr) const;

    CheckpointId resolve(const std::string& run_tag, CheckpointSelector selector) const;
    // Accepts "<run_tag>" (latest) or "<run_tag>@<epoch>".
    CheckpointId resolve(const std::string& reference) const;

    std::vector<int> list(const std::string& run_tag) const;
    RunConfig read_config(const CheckpointId& id) const;
    const std::filesystem::path& directory() const { return root; }
};
