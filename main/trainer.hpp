#pragma once

#include <torch/torch.h>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint.hpp"
#include "data.hpp"
#include "loss.hpp"
#include "model.hpp"
#include "util.hpp"

enum class TrainerState { Init, LoadOrInitParameters, EpochLoop, Terminal };
enum class TerminalReason { None, Converged, EpochLimitReached, Stopped };

std::string to_string(TerminalReason reason);

// One encode/decode pass over packed bundles.
struct StegoPass {
    torch::Tensor cover;      // [B*nt, nc*Cc, H, W]
    torch::Tensor secret;     // secret bundle repeated per training copy, [B*nt, ns*Cs, H, W]
    torch::Tensor container;
    torch::Tensor revealed;
    LossTerms terms;
};

StegoPass forward_pass(StegoNetworks& nets, const torch::Tensor& cover_bundle, const torch::Tensor& secret_bundle,
                       const LossComposer& composer);

struct BatchStats {
    double loss = 0.0, hiding = 0.0, reveal = 0.0;
    double diff_h = 0.0, diff_r = 0.0;   // average pixel discrepancy, 0..255

    void accumulate(const BatchStats& other);
    BatchStats averaged(int count) const;
};

struct EpochSummary {
    int epoch = 0;
    int batches = 0;
    BatchStats train;
    std::optional<BatchStats> validation;
    double learning_rate = 0.0;
};

struct TrainingSummary {
    TerminalReason reason = TerminalReason::None;
    int first_epoch = 1;
    int last_epoch = 0;
    std::vector<EpochSummary> history;
    std::optional<CheckpointId> last_checkpoint;
};

// Init -> LoadOrInitParameters -> EpochLoop -> Terminal(converged | epoch limit | stopped).
class Trainer {
    RunConfig config;
    RunContext context;
    StegoNetworks nets;
    CheckpointStore& store;
    LossComposer composer;
    std::unique_ptr<torch::optim::Adam> optimizer;

    TrainerState state = TrainerState::Init;
    std::atomic<bool> stop_requested{false};
    PlateauState plateau;

    void check_layout(const BatchLayout& layout, const std::string& name, bool check_batch_size) const;
    int load_or_init();
    BatchStats validate(BatchSource& source);
    void update_learning_rate(double monitored_loss);
    CheckpointId checkpoint(int epoch);

public:
    Trainer(const RunConfig& config, RunContext context, StegoNetworks nets, CheckpointStore& store);

    TrainingSummary run(BatchSource& train, BatchSource* val = nullptr);

    // Applies one optimizer update. Throws NumericalDivergence without
    // touching the parameters when the loss or a gradient is not finite.
    BatchStats train_step(const StegoBatch& batch, int epoch, int batch_index);

    // Safe to call from another thread; honoured between batches.
    void request_stop() { stop_requested = true; }

    TrainerState current_state() const { return state; }
    double learning_rate() const;
    const PlateauState& plateau_state() const { return plateau; }
    StegoNetworks& networks() { return nets; }
};
