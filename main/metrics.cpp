#include "metrics.hpp"
#include "data.hpp"
#include "errors.hpp"
#include <opencv2/opencv.hpp>
#include <cmath>
#include <sstream>

static void check_pair(const torch::Tensor& reference, const torch::Tensor& candidate) {
    if (reference.sizes() != candidate.sizes() || reference.dim() != 4) {
        std::stringstream ss;
        ss << "metric inputs must be equal-shaped [N, C, H, W] batches, got "
           << reference.sizes() << " and " << candidate.sizes();
        throw ShapeMismatch(ss.str());
    }
}

double Metrics::mean_absolute_error(const torch::Tensor& reference, const torch::Tensor& candidate) {
    check_pair(reference, candidate);
    auto diff = reference.detach().to(torch::kCPU, torch::kDouble) - candidate.detach().to(torch::kCPU, torch::kDouble);
    return diff.abs().mean().item<double>();
}

double Metrics::mean_squared_error(const torch::Tensor& reference, const torch::Tensor& candidate) {
    check_pair(reference, candidate);
    auto diff = reference.detach().to(torch::kCPU, torch::kDouble) - candidate.detach().to(torch::kCPU, torch::kDouble);
    return diff.pow(2).mean().item<double>();
}

double Metrics::average_pixel_discrepancy(const torch::Tensor& reference, const torch::Tensor& candidate) {
    return mean_absolute_error(reference, candidate) * 255.0;
}

double Metrics::psnr(const torch::Tensor& reference, const torch::Tensor& candidate) {
    check_pair(reference, candidate);
    auto diff = reference.detach().to(torch::kCPU, torch::kDouble) - candidate.detach().to(torch::kCPU, torch::kDouble);
    auto per_image = diff.pow(2).flatten(1).mean(1);

    double total = 0.0;
    int64_t n = per_image.size(0);
    for (int64_t i = 0; i < n; i++) {
        double mse = per_image[i].item<double>();
        total += mse <= 1e-10 ? 100.0 : 10.0 * std::log10(1.0 / mse);
    }
    return n > 0 ? total / n : 0.0;
}

static double ssim_single_channel(const cv::Mat& img1, const cv::Mat& img2) {
    const double C1 = 6.5025, C2 = 58.5225;

    cv::Mat I1, I2;
    img1.convertTo(I1, CV_32F);
    img2.convertTo(I2, CV_32F);

    cv::Mat I1_2 = I1.mul(I1);
    cv::Mat I2_2 = I2.mul(I2);
    cv::Mat I1_I2 = I1.mul(I2);

    cv::Mat mu1, mu2;
    cv::GaussianBlur(I1, mu1, cv::Size(11, 11), 1.5);
    cv::GaussianBlur(I2, mu2, cv::Size(11, 11), 1.5);

    cv::Mat mu1_2 = mu1.mul(mu1);
    cv::Mat mu2_2 = mu2.mul(mu2);
    cv::Mat mu1_mu2 = mu1.mul(mu2);

    cv::Mat sigma1_2, sigma2_2, sigma12;
    cv::GaussianBlur(I1_2, sigma1_2, cv::Size(11, 11), 1.5);
    sigma1_2 -= mu1_2;
    cv::GaussianBlur(I2_2, sigma2_2, cv::Size(11, 11), 1.5);
    sigma2_2 -= mu2_2;
    cv::GaussianBlur(I1_I2, sigma12, cv::Size(11, 11), 1.5);
    sigma12 -= mu1_mu2;

    cv::Mat t1 = 2 * mu1_mu2 + C1;
    cv::Mat t2 = 2 * sigma12 + C2;
    cv::Mat t3 = t1.mul(t2);

    cv::Mat t4 = mu1_2 + mu2_2 + C1;
    cv::Mat t5 = sigma1_2 + sigma2_2 + C2;
    cv::Mat t6 = t4.mul(t5);

    cv::Mat ssim_map;
    cv::divide(t3, t6, ssim_map);
    return cv::mean(ssim_map).val[0];
}

double Metrics::ssim(const torch::Tensor& reference, const torch::Tensor& candidate) {
    check_pair(reference, candidate);

    double total = 0.0;
    int64_t n = reference.size(0);
    for (int64_t i = 0; i < n; i++) {
        std::vector<cv::Mat> ch1, ch2;
        cv::split(tensor_to_mat(reference[i]), ch1);
        cv::split(tensor_to_mat(candidate[i]), ch2);

        double image_total = 0.0;
        for (size_t c = 0; c < ch1.size(); c++) {
            image_total += ssim_single_channel(ch1[c], ch2[c]);
        }
        total += image_total / ch1.size();
    }
    return n > 0 ? total / n : 0.0;
}

MetricRegistry MetricRegistry::with_defaults() {
    MetricRegistry registry;
    registry.add("l1", Metrics::mean_absolute_error);
    registry.add("l2", Metrics::mean_squared_error);
    registry.add("apd", Metrics::average_pixel_discrepancy);
    registry.add("psnr", Metrics::psnr);
    registry.add("ssim", Metrics::ssim);
    return registry;
}

void MetricRegistry::add(const std::string& name, MetricFn fn) {
    metrics[name] = std::move(fn);
}

bool MetricRegistry::contains(const std::string& name) const {
    return metrics.count(name) > 0;
}

double MetricRegistry::compute(const std::string& name, const torch::Tensor& reference,
                               const torch::Tensor& candidate) const {
    auto it = metrics.find(name);
    if (it == metrics.end()) {
        throw ConfigurationError("test.metrics: unknown metric '" + name + "'");
    }
    return it->second(reference, candidate);
}

std::vector<std::string> MetricRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& entry : metrics) {
        result.push_back(entry.first);
    }
    return result;
}
