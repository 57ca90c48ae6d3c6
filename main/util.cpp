#include "util.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string to_string(HidingScheme scheme) {
    return scheme == HidingScheme::UDH ? "udh" : "ddh";
}

std::string to_string(NormMode mode) {
    switch (mode) {
        case NormMode::Batch: return "batch";
        case NormMode::Instance: return "instance";
        case NormMode::None: return "none";
    }
    return "none";
}

std::string to_string(LossKind kind) {
    return kind == LossKind::L2 ? "l2" : "l1";
}

std::string to_string(LossWeighting weighting) {
    return weighting == LossWeighting::Convex ? "convex" : "additive";
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

HidingScheme parse_scheme(const std::string& value) {
    auto v = lowercase(value);
    if (v == "udh") return HidingScheme::UDH;
    if (v == "ddh") return HidingScheme::DDH;
    throw ConfigurationError("model.scheme: unknown hiding scheme '" + value + "'");
}

NormMode parse_norm(const std::string& value) {
    auto v = lowercase(value);
    if (v == "batch") return NormMode::Batch;
    if (v == "instance") return NormMode::Instance;
    if (v == "none") return NormMode::None;
    throw ConfigurationError("model.norm: unknown normalization mode '" + value + "'");
}

LossKind parse_loss(const std::string& value) {
    auto v = lowercase(value);
    if (v == "l2" || v == "mse") return LossKind::L2;
    if (v == "l1") return LossKind::L1;
    throw ConfigurationError("training.loss: unknown loss kind '" + value + "'");
}

LossWeighting parse_weighting(const std::string& value) {
    auto v = lowercase(value);
    if (v == "convex") return LossWeighting::Convex;
    if (v == "additive") return LossWeighting::Additive;
    throw ConfigurationError("training.weighting: unknown loss weighting '" + value + "'");
}

std::string CapacityConfig::label() const {
    return std::to_string(num_secret) + "secret_" + std::to_string(num_cover) + "cover";
}

RunConfig RunConfig::load(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file: " + config_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("malformed config file " + config_path + ": " + e.what());
    }

    return from_json(j);
}

RunConfig RunConfig::from_json(const nlohmann::json& j) {
    RunConfig config;
    const nlohmann::json empty = nlohmann::json::object();
    auto section = [&](const char* name) -> const nlohmann::json& {
        return j.contains(name) ? j.at(name) : empty;
    };

    try {
        const auto& data = section("data");
        config.data.train_path = data.value("train_path", config.data.train_path);
        config.data.val_path = data.value("val_path", config.data.val_path);
        config.data.test_path = data.value("test_path", config.data.test_path);
        config.data.image_size = data.value("image_size", config.data.image_size);
        config.data.channels_cover = data.value("channels_cover", config.data.channels_cover);
        config.data.channels_secret = data.value("channels_secret", config.data.channels_secret);
        config.data.augment = data.value("augment", config.data.augment);

        const auto& capacity = section("capacity");
        config.capacity.num_secret = capacity.value("num_secret", config.capacity.num_secret);
        config.capacity.num_cover = capacity.value("num_cover", config.capacity.num_cover);
        config.capacity.num_training = capacity.value("num_training", config.capacity.num_training);

        const auto& model = section("model");
        config.model.scheme = parse_scheme(model.value("scheme", to_string(config.model.scheme)));
        config.model.norm = parse_norm(model.value("norm", to_string(config.model.norm)));
        config.model.num_downs = model.value("num_downs", config.model.num_downs);
        config.model.base_filters = model.value("base_filters", config.model.base_filters);
        config.model.reveal_filters = model.value("reveal_filters", config.model.reveal_filters);

        const auto& training = section("training");
        config.training.batch_size_secret = training.value("batch_size_secret", config.training.batch_size_secret);
        config.training.epochs = training.value("epochs", config.training.epochs);
        config.training.batches_per_epoch = training.value("batches_per_epoch", config.training.batches_per_epoch);
        config.training.learning_rate = training.value("learning_rate", config.training.learning_rate);
        config.training.adam_beta1 = training.value("adam_beta1", config.training.adam_beta1);
        config.training.beta = training.value("beta", config.training.beta);
        config.training.loss = parse_loss(training.value("loss", to_string(config.training.loss)));
        config.training.weighting = parse_weighting(training.value("weighting", to_string(config.training.weighting)));
        config.training.gradient_clip = training.value("gradient_clip", config.training.gradient_clip);
        config.training.lr_decay_factor = training.value("lr_decay_factor", config.training.lr_decay_factor);
        config.training.lr_patience = training.value("lr_patience", config.training.lr_patience);
        config.training.target_loss = training.value("target_loss", config.training.target_loss);
        config.training.checkpoint_every = training.value("checkpoint_every", config.training.checkpoint_every);
        config.training.keep_last = training.value("keep_last", config.training.keep_last);
        config.training.log_frequency = training.value("log_frequency", config.training.log_frequency);
        config.training.seed = training.value("seed", config.training.seed);
        config.training.resume = training.value("resume", config.training.resume);

        const auto& test = section("test");
        config.test.udh_checkpoint = test.value("udh_checkpoint", config.test.udh_checkpoint);
        config.test.ddh_checkpoint = test.value("ddh_checkpoint", config.test.ddh_checkpoint);
        config.test.batch_size = test.value("batch_size", config.test.batch_size);
        config.test.num_batches = test.value("num_batches", config.test.num_batches);
        config.test.metrics = test.value("metrics", config.test.metrics);
        config.test.save_images = test.value("save_images", config.test.save_images);
        if (test.contains("capacity_sweep")) {
            for (const auto& entry : test.at("capacity_sweep")) {
                config.test.capacity_sweep.push_back({entry.at(0).get<int>(), entry.at(1).get<int>()});
            }
        }

        const auto& paths = section("paths");
        config.paths.checkpoint_dir = paths.value("checkpoint_dir", config.paths.checkpoint_dir);
        config.paths.log_dir = paths.value("log_dir", config.paths.log_dir);
        config.paths.output_dir = paths.value("output_dir", config.paths.output_dir);

        config.run_tag = j.value("run_tag", config.run_tag);
        config.remark = j.value("remark", config.remark);
        config.device = j.value("device", config.device);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("invalid config value: ") + e.what());
    }

    return config;
}

nlohmann::json RunConfig::to_json() const {
    nlohmann::json j;

    j["data"] = {
        {"train_path", data.train_path}, {"val_path", data.val_path}, {"test_path", data.test_path},
        {"image_size", data.image_size}, {"channels_cover", data.channels_cover},
        {"channels_secret", data.channels_secret}, {"augment", data.augment}};

    j["capacity"] = {
        {"num_secret", capacity.num_secret}, {"num_cover", capacity.num_cover},
        {"num_training", capacity.num_training}};

    j["model"] = {
        {"scheme", to_string(model.scheme)}, {"norm", to_string(model.norm)},
        {"num_downs", model.num_downs}, {"base_filters", model.base_filters},
        {"reveal_filters", model.reveal_filters}};

    j["training"] = {
        {"batch_size_secret", training.batch_size_secret}, {"epochs", training.epochs},
        {"batches_per_epoch", training.batches_per_epoch},
        {"learning_rate", training.learning_rate}, {"adam_beta1", training.adam_beta1},
        {"beta", training.beta}, {"loss", to_string(training.loss)},
        {"weighting", to_string(training.weighting)}, {"gradient_clip", training.gradient_clip},
        {"lr_decay_factor", training.lr_decay_factor}, {"lr_patience", training.lr_patience},
        {"target_loss", training.target_loss}, {"checkpoint_every", training.checkpoint_every},
        {"keep_last", training.keep_last}, {"log_frequency", training.log_frequency},
        {"seed", training.seed}, {"resume", training.resume}};

    nlohmann::json sweep = nlohmann::json::array();
    for (const auto& c : test.capacity_sweep) {
        sweep.push_back({c.num_secret, c.num_cover});
    }
    j["test"] = {
        {"udh_checkpoint", test.udh_checkpoint}, {"ddh_checkpoint", test.ddh_checkpoint},
        {"batch_size", test.batch_size}, {"num_batches", test.num_batches},
        {"capacity_sweep", sweep}, {"metrics", test.metrics}, {"save_images", test.save_images}};

    j["paths"] = {
        {"checkpoint_dir", paths.checkpoint_dir}, {"log_dir", paths.log_dir},
        {"output_dir", paths.output_dir}};

    j["run_tag"] = run_tag;
    j["remark"] = remark;
    j["device"] = device;
    return j;
}

static void require(bool condition, const std::string& field, const std::string& rule) {
    if (!condition) {
        throw ConfigurationError(field + " " + rule);
    }
}

void RunConfig::validate() const {
    require(data.image_size > 0, "data.image_size", "must be positive");
    require(data.channels_cover == 1 || data.channels_cover == 3, "data.channels_cover", "must be 1 or 3");
    require(data.channels_secret == 1 || data.channels_secret == 3, "data.channels_secret", "must be 1 or 3");

    require(capacity.num_secret > 0, "capacity.num_secret", "must be positive");
    require(capacity.num_cover > 0, "capacity.num_cover", "must be positive");
    require(capacity.num_training > 0, "capacity.num_training", "must be positive");

    require(model.num_downs > 0 && model.num_downs < 16, "model.num_downs", "must be in [1, 15]");
    require(data.image_size % (1 << model.num_downs) == 0, "data.image_size",
            "must be divisible by 2^model.num_downs (" + std::to_string(1 << model.num_downs) + ")");
    require(model.base_filters > 0, "model.base_filters", "must be positive");
    require(model.reveal_filters > 0, "model.reveal_filters", "must be positive");

    require(training.batch_size_secret > 0, "training.batch_size_secret", "must be positive");
    require(training.epochs > 0, "training.epochs", "must be positive");
    require(training.batches_per_epoch >= 0, "training.batches_per_epoch", "must not be negative");
    require(std::isfinite(training.beta) && training.beta >= 0.0 && training.beta <= 1.0,
            "training.beta", "must be in [0, 1]");
    require(std::isfinite(training.learning_rate) && training.learning_rate > 0.0,
            "training.learning_rate", "must be positive");
    require(training.adam_beta1 >= 0.0 && training.adam_beta1 < 1.0, "training.adam_beta1", "must be in [0, 1)");
    require(training.gradient_clip >= 0.0, "training.gradient_clip", "must not be negative");
    require(training.lr_decay_factor > 0.0 && training.lr_decay_factor <= 1.0,
            "training.lr_decay_factor", "must be in (0, 1]");
    require(training.lr_patience >= 0, "training.lr_patience", "must not be negative");
    require(training.target_loss >= 0.0, "training.target_loss", "must not be negative");
    require(training.checkpoint_every > 0, "training.checkpoint_every", "must be positive");
    require(training.keep_last >= 0, "training.keep_last", "must not be negative");
    require(training.log_frequency > 0, "training.log_frequency", "must be positive");

    require(test.batch_size > 0, "test.batch_size", "must be positive");
    require(test.num_batches > 0, "test.num_batches", "must be positive");
    for (const auto& c : test.capacity_sweep) {
        require(c.num_secret > 0 && c.num_cover > 0, "test.capacity_sweep", "entries must be positive");
    }

    require(device == "cpu" || device == "cuda", "device", "must be 'cpu' or 'cuda'");
    require(experiment_name().find_first_of("/\\@") == std::string::npos,
            "run_tag", "must not contain '/', '\\' or '@'");
}

std::string RunConfig::experiment_name() const {
    if (!run_tag.empty()) return run_tag;

    std::stringstream ss;
    ss << data.image_size << "_" << capacity.num_secret << "_" << capacity.num_cover << "_"
       << training.batch_size_secret << "_" << capacity.num_training << "_"
       << to_string(model.norm) << "_" << to_string(training.loss) << "_" << training.beta << "_"
       << capacity.num_secret << "colorIn" << capacity.num_cover << "color";
    if (!remark.empty()) ss << "_" << remark;
    ss << "_" << to_string(model.scheme);
    return ss.str();
}

int RunConfig::hiding_input_channels() const {
    int secret_channels = data.channels_secret * capacity.num_secret;
    if (model.scheme == HidingScheme::DDH) {
        return secret_channels + hiding_output_channels();
    }
    return secret_channels;
}

Logger::Logger(const std::string& log_dir, bool quiet) : log_dir(log_dir), quiet(quiet) {
    if (!log_dir.empty()) {
        std::filesystem::create_directories(log_dir);
        log_file.open(log_dir + "/training.log", std::ios::app);
    }
}

void Logger::write(const std::string& level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S") << "] ";
    if (!level.empty()) ss << level << " ";
    ss << message;

    if (!quiet) {
        (level == "ERROR" ? std::cerr : std::cout) << ss.str() << std::endl;
    }
    if (log_file.is_open()) {
        log_file << ss.str() << std::endl;
        log_file.flush();
    }
}

void Logger::log_training(int epoch, int batch, int num_batches, double loss, double hiding, double reveal) {
    std::stringstream ss;
    ss << "Epoch " << epoch << " [" << batch << "/" << num_batches << "]";
    ss << " - Loss: " << std::fixed << std::setprecision(6) << loss;
    ss << ", H: " << hiding << ", R: " << reveal;
    write("", ss.str());
}

void Logger::log_epoch(int epoch, double loss, double hiding, double reveal, double diff_h, double diff_r) {
    std::stringstream ss;
    ss << "Epoch " << epoch << " - Train Loss: " << std::fixed << std::setprecision(6) << loss;
    ss << ", H: " << hiding << ", R: " << reveal;
    ss << ", APD-H: " << std::setprecision(4) << diff_h << ", APD-R: " << diff_r;
    write("", ss.str());
}

void Logger::log_validation(int epoch, double loss, double diff_h, double diff_r) {
    std::stringstream ss;
    ss << "Epoch " << epoch << " - Val Loss: " << std::fixed << std::setprecision(6) << loss;
    ss << ", APD-H: " << std::setprecision(4) << diff_h << ", APD-R: " << diff_r;
    write("", ss.str());
}

void Logger::log_info(const std::string& message) {
    write("", message);
}

void Logger::log_error(const std::string& message) {
    write("ERROR", message);
}

RunContext RunContext::create(const RunConfig& config, std::shared_ptr<Logger> logger) {
    if (!logger) {
        logger = std::make_shared<Logger>("", true);
    }
    torch::Device device = torch::kCPU;
    if (config.device == "cuda") {
        if (torch::cuda::is_available()) {
            device = torch::kCUDA;
        } else {
            logger->log_info("CUDA requested but not available, falling back to CPU");
        }
    }
    return {device, config.training.seed, std::move(logger)};
}
