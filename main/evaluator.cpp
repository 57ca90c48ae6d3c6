#include "evaluator.hpp"
#include "errors.hpp"
#include "loss.hpp"
#include "trainer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <opencv2/opencv.hpp>

nlohmann::json SliceMetrics::to_json() const {
    return {{"num_secret", capacity.num_secret},
            {"num_cover", capacity.num_cover},
            {"samples", samples},
            {"hiding_distortion", hiding_distortion},
            {"reveal_error", reveal_error},
            {"hiding_metrics", hiding_metrics},
            {"reveal_metrics", reveal_metrics}};
}

nlohmann::json MetricReport::to_json() const {
    nlohmann::json slices = nlohmann::json::array();
    for (const auto& entry : per_capacity_slice) {
        slices.push_back(entry.second.to_json());
    }
    return {{"run_tag", run_tag},
            {"epoch", epoch},
            {"scheme", to_string(scheme)},
            {"trained_capacity", {trained_capacity.num_secret, trained_capacity.num_cover}},
            {"hiding_distortion", hiding_distortion},
            {"reveal_error", reveal_error},
            {"slices", slices}};
}

nlohmann::json ComparisonReport::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (udh) j["udh"] = udh->to_json();
    if (ddh) j["ddh"] = ddh->to_json();
    return j;
}

Evaluator::Evaluator(const RunConfig& config, RunContext context, const CheckpointStore& store,
                     MetricRegistry registry)
    : config(config), context(std::move(context)), store(store), registry(std::move(registry)) {
    if (!this->context.logger) {
        throw ConfigurationError("evaluator needs a logger in its run context");
    }
    for (const auto& name : this->config.test.metrics) {
        if (!this->registry.contains(name)) {
            throw ConfigurationError("test.metrics: unknown metric '" + name + "'");
        }
    }
    if (this->config.test.batch_size <= 0 || this->config.test.num_batches <= 0) {
        throw ConfigurationError("test.batch_size and test.num_batches must be positive");
    }
}

Evaluator::LoadedRun Evaluator::load(const CheckpointId& id) const {
    auto trained = store.read_config(id);
    auto nets = make_networks(trained, context.seed);
    store.load(id, *nets.hiding, *nets.revealing, nullptr, context.device);
    nets.to(context.device);
    nets.eval();
    context.logger->log_info("Loaded " + to_string(trained.model.scheme) + " checkpoint " + id.str());
    return {id, trained, nets};
}

std::string Evaluator::artifact_dir(const LoadedRun& run, const CapacityConfig& capacity) const {
    if (!config.test.save_images || config.paths.output_dir.empty()) return "";
    return (std::filesystem::path(config.paths.output_dir) / run.id.run_tag /
            ("epoch_" + std::to_string(run.id.epoch)) / capacity.label()).string();
}

// [B*n, C, H, W] with n slots per sample -> [B, k, C, H, W] restricted to the first k slots.
static torch::Tensor active_slots(const torch::Tensor& images, int slots, int active) {
    auto b = images.size(0) / slots;
    return images.reshape({b, slots, images.size(1), images.size(2), images.size(3)})
        .narrow(1, 0, active)
        .reshape({b * active, images.size(1), images.size(2), images.size(3)});
}

SliceMetrics Evaluator::evaluate_slice(LoadedRun& run, BatchSource& source, const CapacityConfig& capacity,
                                       const std::string& out_dir) {
    const auto& trained = run.trained;
    int slots = trained.capacity.num_secret;
    int covers = trained.capacity.num_cover;

    if (capacity.num_cover != covers || capacity.num_secret > slots) {
        throw ConfigurationError("capacity " + capacity.label() + " cannot be evaluated with " + run.id.str() +
                                 ", trained for " + trained.trained_capacity().label());
    }
    const auto& layout = source.layout();
    if (layout.num_secret != capacity.num_secret || layout.num_cover != capacity.num_cover ||
        layout.num_training != 1 || layout.channels_cover != trained.data.channels_cover ||
        layout.channels_secret != trained.data.channels_secret || layout.image_size != trained.data.image_size) {
        throw ConfigurationError("test source layout does not match capacity " + capacity.label() +
                                 " of run " + run.id.run_tag);
    }

    torch::NoGradGuard no_grad;
    run.nets.eval();
    LossComposer composer(trained);

    SliceMetrics slice;
    slice.capacity = capacity;
    for (const auto& name : config.test.metrics) {
        slice.hiding_metrics[name] = 0.0;
        slice.reveal_metrics[name] = 0.0;
    }

    source.reset(context.seed);
    int batch_index = 0;
    while (batch_index < config.test.num_batches) {
        auto batch = source.next();
        if (!batch) break;
        batch_index++;
        validate_batch(*batch, layout, batch_index);

        auto cover = pack_bundle(batch->cover.to(context.device), covers);
        auto secret = pad_bundle(batch->secret.to(context.device), capacity.num_secret, slots);
        auto pass = forward_pass(run.nets, cover, secret, composer);

        auto cover_images = unpack_bundle(pass.cover, covers);
        auto container_images = unpack_bundle(pass.container, covers);
        auto secret_images = active_slots(unpack_bundle(pass.secret, slots), slots, capacity.num_secret);
        auto revealed_images = active_slots(unpack_bundle(pass.revealed, slots), slots, capacity.num_secret);

        int samples = static_cast<int>(cover.size(0));
        slice.samples += samples;
        slice.hiding_distortion += samples * image_distance(pass.container, pass.cover, trained.training.loss).item<double>();
        slice.reveal_error += samples * image_distance(revealed_images, secret_images, trained.training.loss).item<double>();
        for (const auto& name : config.test.metrics) {
            slice.hiding_metrics[name] += samples * registry.compute(name, cover_images, container_images);
            slice.reveal_metrics[name] += samples * registry.compute(name, secret_images, revealed_images);
        }

        if (batch_index == 1 && !out_dir.empty()) {
            save_artifacts(cover_images, container_images, secret_images, revealed_images,
                           covers, capacity.num_secret, out_dir);
        }
    }

    if (slice.samples == 0) {
        throw StegoError("test source produced no batches for capacity " + capacity.label());
    }
    slice.hiding_distortion /= slice.samples;
    slice.reveal_error /= slice.samples;
    for (auto& entry : slice.hiding_metrics) entry.second /= slice.samples;
    for (auto& entry : slice.reveal_metrics) entry.second /= slice.samples;

    context.logger->log_info("Capacity " + capacity.label() + ": hiding " + std::to_string(slice.hiding_distortion) +
                             ", reveal " + std::to_string(slice.reveal_error) + " over " +
                             std::to_string(slice.samples) + " samples");
    return slice;
}

static torch::Tensor as_rgb(const torch::Tensor& image) {
    return image.size(0) == 1 ? image.repeat({3, 1, 1}) : image;
}

void Evaluator::save_artifacts(const torch::Tensor& cover, const torch::Tensor& container, const torch::Tensor& secret,
                               const torch::Tensor& revealed, int num_cover, int active, const std::string& dir) const {
    std::filesystem::create_directories(dir);
    std::filesystem::create_directories(std::filesystem::path(dir) / "containers");

    int64_t samples = std::min<int64_t>(cover.size(0) / num_cover, 8);
    std::vector<torch::Tensor> rows;
    for (int64_t b = 0; b < samples; b++) {
        std::vector<torch::Tensor> columns;
        for (int i = 0; i < num_cover; i++) columns.push_back(as_rgb(cover[b * num_cover + i]));
        for (int i = 0; i < num_cover; i++) columns.push_back(as_rgb(container[b * num_cover + i]));
        for (int i = 0; i < num_cover; i++) {
            auto residual = (container[b * num_cover + i] - cover[b * num_cover + i]).abs() * 10;
            columns.push_back(as_rgb(residual.clamp(0, 1)));
        }
        for (int i = 0; i < active; i++) columns.push_back(as_rgb(secret[b * active + i]));
        for (int i = 0; i < active; i++) columns.push_back(as_rgb(revealed[b * active + i]));
        rows.push_back(torch::cat(columns, 2));

        for (int i = 0; i < num_cover; i++) {
            auto path = std::filesystem::path(dir) / "containers" /
                        ("container_" + std::to_string(b) + "_" + std::to_string(i) + ".png");
            cv::imwrite(path.string(), tensor_to_mat(container[b * num_cover + i]));
        }
    }

    auto grid_path = (std::filesystem::path(dir) / "result_pics.png").string();
    if (!cv::imwrite(grid_path, tensor_to_mat(torch::cat(rows, 1)))) {
        throw StegoError("failed to write " + grid_path);
    }
}

MetricReport Evaluator::evaluate(const CheckpointId& id, BatchSource& test, const CapacityConfig& capacity) {
    auto run = load(id);

    MetricReport report;
    report.run_tag = id.run_tag;
    report.epoch = id.epoch;
    report.scheme = run.trained.model.scheme;
    report.trained_capacity = run.trained.trained_capacity();

    auto slice = evaluate_slice(run, test, capacity, artifact_dir(run, capacity));
    report.hiding_distortion = slice.hiding_distortion;
    report.reveal_error = slice.reveal_error;
    report.per_capacity_slice[capacity] = slice;
    return report;
}

MetricReport Evaluator::sweep(const CheckpointId& id, const SourceFactory& make_source,
                              const std::vector<CapacityConfig>& capacities) {
    auto run = load(id);

    MetricReport report;
    report.run_tag = id.run_tag;
    report.epoch = id.epoch;
    report.scheme = run.trained.model.scheme;
    report.trained_capacity = run.trained.trained_capacity();

    auto slices = capacities.empty() ? std::vector<CapacityConfig>{report.trained_capacity} : capacities;
    for (const auto& capacity : slices) {
        auto source = make_source(BatchLayout::evaluation(run.trained, capacity));
        auto slice = evaluate_slice(run, *source, capacity, artifact_dir(run, capacity));
        report.per_capacity_slice[capacity] = slice;
    }

    auto headline = report.per_capacity_slice.find(report.trained_capacity);
    const auto& chosen = headline != report.per_capacity_slice.end() ? headline->second
                                                                     : report.per_capacity_slice.begin()->second;
    report.hiding_distortion = chosen.hiding_distortion;
    report.reveal_error = chosen.reveal_error;
    return report;
}

ComparisonReport Evaluator::compare(const std::optional<CheckpointId>& udh, const std::optional<CheckpointId>& ddh,
                                    const SourceFactory& make_source, const std::vector<CapacityConfig>& capacities) {
    if (!udh && !ddh) {
        throw ConfigurationError("test.udh_checkpoint or test.ddh_checkpoint must be set");
    }

    ComparisonReport comparison;
    if (udh) {
        comparison.udh = sweep(*udh, make_source, capacities);
        if (comparison.udh->scheme != HidingScheme::UDH) {
            throw ConfigurationError("test.udh_checkpoint " + udh->str() + " was trained with the ddh scheme");
        }
    }
    if (ddh) {
        comparison.ddh = sweep(*ddh, make_source, capacities);
        if (comparison.ddh->scheme != HidingScheme::DDH) {
            throw ConfigurationError("test.ddh_checkpoint " + ddh->str() + " was trained with the udh scheme");
        }
    }
    return comparison;
}

std::vector<std::string> Evaluator::reveal_images(const CheckpointId& id, const std::vector<std::string>& container_paths,
                                                  const std::string& output_dir) {
    auto run = load(id);
    const auto& trained = run.trained;

    if (static_cast<int>(container_paths.size()) != trained.capacity.num_cover) {
        throw ConfigurationError("run " + id.run_tag + " expects " + std::to_string(trained.capacity.num_cover) +
                                 " container images, got " + std::to_string(container_paths.size()));
    }

    std::vector<torch::Tensor> slots;
    for (const auto& path : container_paths) {
        int flag = trained.data.channels_cover == 1 ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR;
        cv::Mat image = cv::imread(path, flag);
        if (image.empty()) {
            throw StegoError("Failed to load image: " + path);
        }
        cv::resize(image, image, cv::Size(trained.data.image_size, trained.data.image_size), 0, 0, cv::INTER_AREA);
        slots.push_back(mat_to_tensor(image));
    }

    torch::NoGradGuard no_grad;
    auto container = pack_bundle(torch::stack(slots).to(context.device), trained.capacity.num_cover);
    auto revealed = unpack_bundle(run.nets.revealing->decode(container), trained.capacity.num_secret);

    std::filesystem::create_directories(output_dir);
    std::vector<std::string> written;
    for (int64_t i = 0; i < revealed.size(0); i++) {
        auto path = (std::filesystem::path(output_dir) / ("revealed_" + std::to_string(i) + ".png")).string();
        if (!cv::imwrite(path, tensor_to_mat(revealed[i]))) {
            throw StegoError("failed to write " + path);
        }
        written.push_back(path);
    }
    return written;
}

void Evaluator::write_report(const nlohmann::json& report, const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw StegoError("cannot write report " + path);
    }
    file << report.dump(2) << std::endl;
}
