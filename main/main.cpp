#include <torch/torch.h>
#include <cxxopts.hpp>
#include <iostream>
#include <memory>
#include <filesystem>

#include "checkpoint.hpp"
#include "data.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "model.hpp"
#include "trainer.hpp"
#include "util.hpp"

void train_model(const RunConfig& config) {
    auto logger = std::make_shared<Logger>(
        (std::filesystem::path(config.paths.log_dir) / config.experiment_name()).string());
    auto context = RunContext::create(config, logger);
    logger->log_info("Using device: " + context.device.str());
    logger->log_info("Config: " + config.to_json().dump());

    size_t max_batches = static_cast<size_t>(config.training.batches_per_epoch);
    auto train_source = make_batch_source(config.data.train_path, BatchLayout::training(config),
                                          config.data.augment, config.training.seed, max_batches);
    std::unique_ptr<BatchSource> val_source;
    if (!config.data.val_path.empty()) {
        val_source = make_batch_source(config.data.val_path, BatchLayout::training(config), false,
                                       config.training.seed + 1, 0);
    }

    CheckpointStore store(config.paths.checkpoint_dir, config.training.keep_last, logger);
    Trainer trainer(config, context, make_networks(config, context.seed), store);

    auto summary = trainer.run(*train_source, val_source.get());
    if (summary.last_checkpoint) {
        logger->log_info("Last checkpoint: " + summary.last_checkpoint->str());
    }
}

void evaluate_model(const RunConfig& config) {
    auto logger = std::make_shared<Logger>((std::filesystem::path(config.paths.log_dir) / "test").string());
    auto context = RunContext::create(config, logger);

    CheckpointStore store(config.paths.checkpoint_dir, 0, logger);
    std::optional<CheckpointId> udh, ddh;
    if (!config.test.udh_checkpoint.empty()) udh = store.resolve(config.test.udh_checkpoint);
    if (!config.test.ddh_checkpoint.empty()) ddh = store.resolve(config.test.ddh_checkpoint);

    SourceFactory make_source = [&](const BatchLayout& layout) {
        return make_batch_source(config.data.test_path, layout, false, config.training.seed,
                                 static_cast<size_t>(config.test.num_batches));
    };

    Evaluator evaluator(config, context, store);
    auto comparison = evaluator.compare(udh, ddh, make_source, config.test.capacity_sweep);

    auto report_path = (std::filesystem::path(config.paths.output_dir) / "report.json").string();
    Evaluator::write_report(comparison.to_json(), report_path);
    logger->log_info("Report written to " + report_path);
    std::cout << comparison.to_json().dump(2) << std::endl;
}

void reveal_mode(const RunConfig& config, const std::vector<std::string>& container_paths) {
    auto logger = std::make_shared<Logger>("");
    auto context = RunContext::create(config, logger);

    std::string reference = !config.test.udh_checkpoint.empty() ? config.test.udh_checkpoint : config.test.ddh_checkpoint;
    if (reference.empty()) {
        throw ConfigurationError("--reveal needs --test-udh or --test-ddh to select a checkpoint");
    }

    CheckpointStore store(config.paths.checkpoint_dir, 0, logger);
    Evaluator evaluator(config, context, store);
    auto output_dir = (std::filesystem::path(config.paths.output_dir) / "revealed").string();
    for (const auto& path : evaluator.reveal_images(store.resolve(reference), container_paths, output_dir)) {
        std::cout << "Revealed: " << path << std::endl;
    }
}

static void apply_overrides(RunConfig& config, const cxxopts::ParseResult& result) {
    if (result.count("image-size")) config.data.image_size = result["image-size"].as<int>();
    if (result.count("bs-secret")) config.training.batch_size_secret = result["bs-secret"].as<int>();
    if (result.count("num-training")) config.capacity.num_training = result["num-training"].as<int>();
    if (result.count("num-secret")) config.capacity.num_secret = result["num-secret"].as<int>();
    if (result.count("num-cover")) config.capacity.num_cover = result["num-cover"].as<int>();
    if (result.count("channel-cover")) config.data.channels_cover = result["channel-cover"].as<int>();
    if (result.count("channel-secret")) config.data.channels_secret = result["channel-secret"].as<int>();
    if (result.count("norm")) config.model.norm = parse_norm(result["norm"].as<std::string>());
    if (result.count("loss")) config.training.loss = parse_loss(result["loss"].as<std::string>());
    if (result.count("beta")) config.training.beta = result["beta"].as<double>();
    if (result.count("scheme")) config.model.scheme = parse_scheme(result["scheme"].as<std::string>());
    if (result.count("epochs")) config.training.epochs = result["epochs"].as<int>();
    if (result.count("remark")) config.remark = result["remark"].as<std::string>();
    if (result.count("run-tag")) config.run_tag = result["run-tag"].as<std::string>();
    if (result.count("resume")) config.training.resume = true;
    if (result.count("test-udh")) config.test.udh_checkpoint = result["test-udh"].as<std::string>();
    if (result.count("test-ddh")) config.test.ddh_checkpoint = result["test-ddh"].as<std::string>();
}

int main(int argc, char** argv) {
    cxxopts::Options options("deephiding", "Universal and dependent deep hiding of images in images");

    options.add_options()
        ("t,train", "Training mode")
        ("e,test", "Evaluate the UDH and/or DDH checkpoints")
        ("r,reveal", "Reveal secrets from container images", cxxopts::value<std::vector<std::string>>())
        ("c,config", "Config file path", cxxopts::value<std::string>()->default_value("configs.json"))
        ("image-size", "Image size", cxxopts::value<int>())
        ("bs-secret", "Secret batch size", cxxopts::value<int>())
        ("num-training", "Cover bundles per secret bundle", cxxopts::value<int>())
        ("num-secret", "Secrets per container", cxxopts::value<int>())
        ("num-cover", "Covers per container", cxxopts::value<int>())
        ("channel-cover", "Cover channels", cxxopts::value<int>())
        ("channel-secret", "Secret channels", cxxopts::value<int>())
        ("norm", "batch | instance | none", cxxopts::value<std::string>())
        ("loss", "l2 | l1", cxxopts::value<std::string>())
        ("beta", "Reveal loss weight in [0, 1]", cxxopts::value<double>())
        ("scheme", "udh | ddh", cxxopts::value<std::string>())
        ("epochs", "Training epochs", cxxopts::value<int>())
        ("remark", "Remark appended to the run name", cxxopts::value<std::string>())
        ("run-tag", "Explicit run tag", cxxopts::value<std::string>())
        ("resume", "Resume from the latest checkpoint of the run")
        ("test-udh", "UDH checkpoint, <run_tag>[@<epoch>]", cxxopts::value<std::string>())
        ("test-ddh", "DDH checkpoint, <run_tag>[@<epoch>]", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        RunConfig config = RunConfig::load(result["config"].as<std::string>());
        apply_overrides(config, result);
        config.validate();

        if (result.count("train")) {
            train_model(config);
        } else if (result.count("test")) {
            evaluate_model(config);
        } else if (result.count("reveal")) {
            reveal_mode(config, result["reveal"].as<std::vector<std::string>>());
        } else {
            std::cout << "Please specify --train, --test or --reveal <container_image>" << std::endl;
            std::cout << options.help() << std::endl;
            return 1;
        }
    } catch (const StegoError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
