#include "checkpoint.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

CheckpointStore::CheckpointStore(const std::string& root, int keep_last, std::shared_ptr<Logger> logger)
    : root(root), keep_last(keep_last), logger(std::move(logger)) {
    if (keep_last < 0) {
        throw ConfigurationError("training.keep_last must not be negative");
    }
}

fs::path CheckpointStore::run_dir(const std::string& run_tag) const {
    if (run_tag.empty() || run_tag.find_first_of("/\\@") != std::string::npos || run_tag == "." || run_tag == "..") {
        throw ConfigurationError("invalid run tag '" + run_tag + "'");
    }
    return root / run_tag;
}

fs::path CheckpointStore::manifest_path(const std::string& run_tag) const {
    return run_dir(run_tag) / "manifest.json";
}

fs::path CheckpointStore::snapshot_path(const std::string& run_tag, int epoch) const {
    std::stringstream ss;
    ss << "epoch_" << std::setw(4) << std::setfill('0') << epoch << ".pt";
    return run_dir(run_tag) / ss.str();
}

nlohmann::json CheckpointStore::read_manifest(const std::string& run_tag) const {
    auto path = manifest_path(run_tag);
    std::ifstream file(path);
    if (!file.is_open()) {
        return {{"run_tag", run_tag}, {"epochs", nlohmann::json::array()}};
    }

    nlohmann::json manifest;
    try {
        file >> manifest;
    } catch (const nlohmann::json::exception& e) {
        throw StegoError("corrupt checkpoint manifest " + path.string() + ": " + e.what());
    }
    if (!manifest.is_object() || !manifest.contains("epochs") || !manifest["epochs"].is_array()) {
        throw StegoError("corrupt checkpoint manifest " + path.string() + ": no epoch list");
    }
    try {
        manifest["epochs"].get<std::vector<int>>();
    } catch (const nlohmann::json::exception& e) {
        throw StegoError("corrupt checkpoint manifest " + path.string() + ": " + e.what());
    }
    return manifest;
}

void CheckpointStore::write_manifest(const std::string& run_tag, const nlohmann::json& manifest) const {
    auto path = manifest_path(run_tag);
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw StegoError("cannot write checkpoint manifest " + tmp.string());
        }
        file << manifest.dump(2);
        file.flush();
        if (!file) {
            throw StegoError("failed writing checkpoint manifest " + tmp.string());
        }
    }
    fs::rename(tmp, path);
}

CheckpointId CheckpointStore::save(const std::string& run_tag, int epoch, HidingNetwork& hiding,
                                   RevealingNetwork& revealing, torch::optim::Optimizer* optimizer,
                                   const RunConfig& config, const PlateauState* plateau) {
    fs::create_directories(run_dir(run_tag));

    torch::serialize::OutputArchive archive;
    archive.write("run_tag", c10::IValue(run_tag));
    archive.write("epoch", c10::IValue(static_cast<int64_t>(epoch)));
    archive.write("config", c10::IValue(config.to_json().dump()));

    torch::serialize::OutputArchive hiding_archive;
    hiding.save(hiding_archive);
    archive.write("hiding", hiding_archive);

    torch::serialize::OutputArchive revealing_archive;
    revealing.save(revealing_archive);
    archive.write("revealing", revealing_archive);

    if (optimizer) {
        torch::serialize::OutputArchive optimizer_archive;
        optimizer->save(optimizer_archive);
        archive.write("optimizer", optimizer_archive);
    }
    if (plateau) {
        archive.write("plateau_best_loss", c10::IValue(plateau->best_loss));
        archive.write("plateau_bad_epochs", c10::IValue(static_cast<int64_t>(plateau->bad_epochs)));
    }

    auto path = snapshot_path(run_tag, epoch);
    auto tmp = path;
    tmp += ".tmp";
    archive.save_to(tmp.string());
    fs::rename(tmp, path);

    auto manifest = read_manifest(run_tag);
    manifest["scheme"] = to_string(hiding.scheme());
    std::vector<int> epochs = manifest["epochs"].get<std::vector<int>>();
    if (std::find(epochs.begin(), epochs.end(), epoch) == epochs.end()) {
        epochs.push_back(epoch);
        std::sort(epochs.begin(), epochs.end());
    }
    manifest["epochs"] = epochs;
    prune(run_tag, manifest);

    if (logger) {
        logger->log_info("Checkpoint saved: " + path.string());
    }
    return {run_tag, epoch, path.string()};
}

void CheckpointStore::prune(const std::string& run_tag, nlohmann::json& manifest) const {
    std::vector<int> epochs = manifest["epochs"].get<std::vector<int>>();
    std::vector<int> removed;
    if (keep_last > 0 && epochs.size() > static_cast<size_t>(keep_last)) {
        removed.assign(epochs.begin(), epochs.end() - keep_last);
        epochs.erase(epochs.begin(), epochs.end() - keep_last);
    }
    manifest["epochs"] = epochs;

    // The manifest stops referencing a snapshot before the file goes away.
    write_manifest(run_tag, manifest);
    for (int epoch : removed) {
        std::error_code ec;
        fs::remove(snapshot_path(run_tag, epoch), ec);
        if (ec && logger) {
            logger->log_error("Could not remove old checkpoint for epoch " + std::to_string(epoch) + ": " + ec.message());
        }
    }
}

std::vector<int> CheckpointStore::list(const std::string& run_tag) const {
    return read_manifest(run_tag)["epochs"].get<std::vector<int>>();
}

CheckpointId CheckpointStore::resolve(const std::string& run_tag, CheckpointSelector selector) const {
    auto epochs = list(run_tag);
    if (epochs.empty()) {
        throw CheckpointNotFound("no checkpoints for run '" + run_tag + "' in " + root.string());
    }

    int epoch = selector.is_latest() ? *std::max_element(epochs.begin(), epochs.end()) : selector.epoch;
    if (std::find(epochs.begin(), epochs.end(), epoch) == epochs.end()) {
        throw CheckpointNotFound("run '" + run_tag + "' has no checkpoint for epoch " + std::to_string(epoch));
    }
    return {run_tag, epoch, snapshot_path(run_tag, epoch).string()};
}

CheckpointId CheckpointStore::resolve(const std::string& reference) const {
    auto at = reference.rfind('@');
    if (at == std::string::npos) {
        return resolve(reference, CheckpointSelector::latest());
    }

    std::string tag = reference.substr(0, at);
    std::string epoch_text = reference.substr(at + 1);
    auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
    // Nine digits always fit in an int.
    if (epoch_text.empty() || epoch_text.size() > 9 ||
        !std::all_of(epoch_text.begin(), epoch_text.end(), is_digit)) {
        throw ConfigurationError("invalid checkpoint reference '" + reference + "', expected <run_tag>[@<epoch>]");
    }
    return resolve(tag, CheckpointSelector::at_epoch(std::stoi(epoch_text)));
}

void CheckpointStore::open(const CheckpointId& id, torch::serialize::InputArchive& archive,
                           torch::Device device) const {
    if (id.path.empty() || !fs::is_regular_file(id.path)) {
        throw CheckpointNotFound(id.str() + " (" + id.path + ")");
    }
    try {
        archive.load_from(id.path, device);
    } catch (const c10::Error& e) {
        throw StegoError("cannot read checkpoint " + id.str() + ": " + e.what_without_backtrace());
    }
}

void CheckpointStore::load(const CheckpointId& id, HidingNetwork& hiding, RevealingNetwork& revealing,
                           torch::optim::Optimizer* optimizer, torch::Device device, PlateauState* plateau) const {
    torch::serialize::InputArchive archive;
    open(id, archive, device);

    try {
        torch::serialize::InputArchive hiding_archive;
        archive.read("hiding", hiding_archive);
        hiding.load(hiding_archive);

        torch::serialize::InputArchive revealing_archive;
        archive.read("revealing", revealing_archive);
        revealing.load(revealing_archive);

        if (optimizer) {
            torch::serialize::InputArchive optimizer_archive;
            if (!archive.try_read("optimizer", optimizer_archive)) {
                throw StegoError("checkpoint " + id.str() + " has no optimizer state");
            }
            optimizer->load(optimizer_archive);
        }

        c10::IValue best_loss, bad_epochs;
        if (plateau && archive.try_read("plateau_best_loss", best_loss) &&
            archive.try_read("plateau_bad_epochs", bad_epochs)) {
            plateau->best_loss = best_loss.toDouble();
            plateau->bad_epochs = static_cast<int>(bad_epochs.toInt());
        }
    } catch (const c10::Error& e) {
        throw StegoError("checkpoint " + id.str() + " does not match the networks: " + e.what_without_backtrace());
    }
}

RunConfig CheckpointStore::read_config(const CheckpointId& id) const {
    torch::serialize::InputArchive archive;
    open(id, archive);

    c10::IValue config;
    if (!archive.try_read("config", config) || !config.isString()) {
        throw StegoError("checkpoint " + id.str() + " carries no run configuration");
    }
    try {
        return RunConfig::from_json(nlohmann::json::parse(config.toStringRef()));
    } catch (const nlohmann::json::exception& e) {
        throw StegoError("checkpoint " + id.str() + " has a malformed configuration: " + e.what());
    }
}
