#pragma once

#include <torch/torch.h>
#include <functional>
#include <map>
#include <string>
#include <vector>

// All metrics take image batches [N, C, H, W] with pixels in [0, 1]
// and return the mean over the batch.
class Metrics {
public:
    static double mean_absolute_error(const torch::Tensor& reference, const torch::Tensor& candidate);
    static double mean_squared_error(const torch::Tensor& reference, const torch::Tensor& candidate);
    // Mean absolute pixel difference on the 0..255 scale.
    static double average_pixel_discrepancy(const torch::Tensor& reference, const torch::Tensor& candidate);
    static double psnr(const torch::Tensor& reference, const torch::Tensor& candidate);
    static double ssim(const torch::Tensor& reference, const torch::Tensor& candidate);
};

using MetricFn = std::function<double(const torch::Tensor&, const torch::Tensor&)>;

class MetricRegistry {
    std::map<std::string, MetricFn> metrics;

public:
    // l1, l2, apd, psnr, ssim
    static MetricRegistry with_defaults();

    void add(const std::string& name, MetricFn fn);
    bool contains(const std::string& name) const;
    double compute(const std::string& name, const torch::Tensor& reference, const torch::Tensor& candidate) const;
    std::vector<std::string> names() const;
};
