#pragma once

#include <torch/torch.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

enum class HidingScheme { UDH, DDH };
enum class NormMode { Batch, Instance, None };
enum class LossKind { L2, L1 };
enum class LossWeighting { Convex, Additive };

std::string to_string(HidingScheme scheme);
std::string to_string(NormMode mode);
std::string to_string(LossKind kind);
std::string to_string(LossWeighting weighting);

HidingScheme parse_scheme(const std::string& value);
NormMode parse_norm(const std::string& value);
LossKind parse_loss(const std::string& value);
LossWeighting parse_weighting(const std::string& value);

struct CapacityConfig {
    int num_secret = 1;
    int num_cover = 1;

    bool operator==(const CapacityConfig& other) const {
        return num_secret == other.num_secret && num_cover == other.num_cover;
    }
    bool operator<(const CapacityConfig& other) const {
        return std::make_pair(num_secret, num_cover) < std::make_pair(other.num_secret, other.num_cover);
    }
    std::string label() const;
};

struct RunConfig {
    struct Data {
        std::string train_path, val_path, test_path;
        int image_size = 128;
        int channels_cover = 3, channels_secret = 3;
        bool augment = false;
    } data;

    struct Capacity {
        int num_secret = 1, num_cover = 1, num_training = 1;
    } capacity;

    struct Model {
        HidingScheme scheme = HidingScheme::UDH;
        NormMode norm = NormMode::Batch;
        int num_downs = 5;
        int base_filters = 64;
        int reveal_filters = 64;
    } model;

    struct Training {
        int batch_size_secret = 44;
        int epochs = 1;
        int batches_per_epoch = 0;
        double learning_rate = 1e-3, adam_beta1 = 0.5;
        double beta = 0.75;
        LossKind loss = LossKind::L2;
        LossWeighting weighting = LossWeighting::Convex;
        double gradient_clip = 0.0;
        double lr_decay_factor = 0.2;
        int lr_patience = 5;
        double target_loss = 0.0;
        int checkpoint_every = 1;
        int keep_last = 0;
        int log_frequency = 50;
        uint64_t seed = 1234;
        bool resume = false;
    } training;

    struct Test {
        std::string udh_checkpoint, ddh_checkpoint;
        int batch_size = 40;
        int num_batches = 1;
        std::vector<CapacityConfig> capacity_sweep;
        std::vector<std::string> metrics{"apd", "psnr", "ssim"};
        bool save_images = true;
    } test;

    struct Paths {
        std::string checkpoint_dir = "checkpoints", log_dir = "logs", output_dir = "results";
    } paths;

    std::string run_tag;
    std::string remark = "main";
    std::string device = "cpu";

    static RunConfig load(const std::string& config_path);
    static RunConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Throws ConfigurationError naming the first offending field.
    void validate() const;

    // runTag when set, otherwise a name encoding the experiment parameters.
    std::string experiment_name() const;

    CapacityConfig trained_capacity() const { return {capacity.num_secret, capacity.num_cover}; }

    int hiding_input_channels() const;
    int hiding_output_channels() const { return data.channels_cover * capacity.num_cover; }
    int reveal_output_channels() const { return data.channels_secret * capacity.num_secret; }
};

class Logger {
    std::string log_dir;
    std::ofstream log_file;
    bool quiet;

    void write(const std::string& level, const std::string& message);

public:
    explicit Logger(const std::string& log_dir, bool quiet = false);
    void log_training(int epoch, int batch, int num_batches, double loss, double hiding, double reveal);
    void log_epoch(int epoch, double loss, double hiding, double reveal, double diff_h, double diff_r);
    void log_validation(int epoch, double loss, double diff_h, double diff_r);
    void log_info(const std::string& message);
    void log_error(const std::string& message);
};

// Explicit execution context handed to every component.
struct RunContext {
    torch::Device device;
    uint64_t seed;
    std::shared_ptr<Logger> logger;

    // A null logger is replaced by a quiet one that writes nowhere.
    static RunContext create(const RunConfig& config, std::shared_ptr<Logger> logger);
};
