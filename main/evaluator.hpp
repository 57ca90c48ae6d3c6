#pragma once

#include <torch/torch.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint.hpp"
#include "data.hpp"
#include "metrics.hpp"
#include "model.hpp"
#include "util.hpp"

struct SliceMetrics {
    CapacityConfig capacity;
    int samples = 0;
    double hiding_distortion = 0.0;   // training distance, container vs cover
    double reveal_error = 0.0;        // training distance, revealed vs secret, active slots only
    std::map<std::string, double> hiding_metrics, reveal_metrics;

    nlohmann::json to_json() const;
};

struct MetricReport {
    std::string run_tag;
    int epoch = -1;
    HidingScheme scheme = HidingScheme::UDH;
    CapacityConfig trained_capacity;
    double hiding_distortion = 0.0;
    double reveal_error = 0.0;
    std::map<CapacityConfig, SliceMetrics> per_capacity_slice;

    nlohmann::json to_json() const;
};

struct ComparisonReport {
    std::optional<MetricReport> udh, ddh;

    nlohmann::json to_json() const;
};

// Builds the held-out source for one capacity slice.
using SourceFactory = std::function<std::unique_ptr<BatchSource>(const BatchLayout&)>;

class Evaluator {
    RunConfig config;
    RunContext context;
    const CheckpointStore& store;
    MetricRegistry registry;

    struct LoadedRun {
        CheckpointId id;
        RunConfig trained;
        StegoNetworks nets;
    };

    LoadedRun load(const CheckpointId& id) const;
    SliceMetrics evaluate_slice(LoadedRun& run, BatchSource& source, const CapacityConfig& capacity,
                                const std::string& artifact_dir);
    void save_artifacts(const torch::Tensor& cover, const torch::Tensor& container, const torch::Tensor& secret,
                        const torch::Tensor& revealed, int num_cover, int active, const std::string& dir) const;
    std::string artifact_dir(const LoadedRun& run, const CapacityConfig& capacity) const;

public:
    Evaluator(const RunConfig& config, RunContext context, const CheckpointStore& store,
              MetricRegistry registry = MetricRegistry::with_defaults());

    MetricReport evaluate(const CheckpointId& id, BatchSource& test, const CapacityConfig& capacity);

    // One slice per capacity. An empty list evaluates the trained capacity only.
    MetricReport sweep(const CheckpointId& id, const SourceFactory& make_source,
                       const std::vector<CapacityConfig>& capacities);

    ComparisonReport compare(const std::optional<CheckpointId>& udh, const std::optional<CheckpointId>& ddh,
                             const SourceFactory& make_source, const std::vector<CapacityConfig>& capacities);

    // Decodes container images read from disk, one per cover slot, and writes
    // the revealed secrets as PNG files. Returns the written paths.
    std::vector<std::string> reveal_images(const CheckpointId& id, const std::vector<std::string>& container_paths,
                                           const std::string& output_dir);

    static void write_report(const nlohmann::json& report, const std::string& path);
};
