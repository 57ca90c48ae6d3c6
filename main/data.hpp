#pragma once

#include <torch/torch.h>
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <filesystem>

#include "util.hpp"

struct ImageFolderDataset : torch::data::Dataset<ImageFolderDataset> {
    std::vector<std::string> image_paths;
    int image_size, channels;
    bool augment;
    std::mt19937 gen;

    ImageFolderDataset(const std::string& root_dir, int image_size, int channels,
                       bool augment = false, uint64_t seed = 0);

    torch::data::Example<> get(size_t index) override;
    torch::optional<size_t> size() const override;
    void reseed(uint64_t seed) { gen.seed(static_cast<std::mt19937::result_type>(seed)); }

private:
    void load_data(const std::string& root_dir);
};

// 3-channel mats are BGR, as OpenCV reads and writes them. Tensors are RGB in [0, 1].
torch::Tensor mat_to_tensor(const cv::Mat& mat);
cv::Mat tensor_to_mat(const torch::Tensor& tensor);

// [B*n, C, H, W] -> [B, n*C, H, W]; slot i of sample b is image b*n + i.
torch::Tensor pack_bundle(const torch::Tensor& images, int count);
// [B, n*C, H, W] -> [B*n, C, H, W], inverse of pack_bundle.
torch::Tensor unpack_bundle(const torch::Tensor& bundle, int count);
// Packs `active` images per sample and fills the remaining slots up to `total` with zeros.
torch::Tensor pad_bundle(const torch::Tensor& images, int active, int total);

// Images needed per step for one capacity configuration.
struct BatchLayout {
    int batch_size = 1;
    int num_secret = 1, num_cover = 1, num_training = 1;
    int channels_cover = 3, channels_secret = 3;
    int image_size = 128;

    int64_t secrets_per_batch() const { return int64_t(batch_size) * num_secret; }
    int64_t covers_per_batch() const { return int64_t(batch_size) * num_training * num_cover; }

    static BatchLayout training(const RunConfig& config);
    static BatchLayout evaluation(const RunConfig& config, const CapacityConfig& capacity);
};

struct StegoBatch {
    torch::Tensor cover;    // [B * num_training * num_cover, Cc, H, W]
    torch::Tensor secret;   // [B * num_secret, Cs, H, W]
};

// Throws ShapeMismatch naming the batch index and the offending tensor.
void validate_batch(const StegoBatch& batch, const BatchLayout& layout, int batch_index);

class BatchSource {
public:
    virtual ~BatchSource() = default;

    // Restarts iteration; the order of batches depends only on `epoch` and the source seed.
    virtual void reset(uint64_t epoch) = 0;
    virtual std::optional<StegoBatch> next() = 0;
    virtual size_t batches_per_epoch() const = 0;
    virtual const BatchLayout& layout() const = 0;
};

// Covers and secrets drawn from image folders with independent seeded shuffles.
class FolderBatchSource : public BatchSource {
    std::shared_ptr<ImageFolderDataset> covers, secrets;
    BatchLayout batch_layout;
    uint64_t seed;
    size_t max_batches;
    size_t num_batches = 0;
    size_t cursor = 0;
    std::vector<size_t> cover_order, secret_order;

    torch::Tensor load(ImageFolderDataset& dataset, const std::vector<size_t>& order, int64_t offset, int64_t count);

public:
    FolderBatchSource(std::shared_ptr<ImageFolderDataset> covers, std::shared_ptr<ImageFolderDataset> secrets,
                      const BatchLayout& layout, uint64_t seed, size_t max_batches = 0);

    void reset(uint64_t epoch) override;
    std::optional<StegoBatch> next() override;
    size_t batches_per_epoch() const override { return num_batches; }
    const BatchLayout& layout() const override { return batch_layout; }
};

// Smooth pseudo-images generated from a seed; used when no dataset folder is configured.
class SyntheticBatchSource : public BatchSource {
    BatchLayout batch_layout;
    uint64_t seed;
    size_t num_batches;
    size_t cursor = 0;
    uint64_t epoch = 0;

    torch::Tensor generate(int64_t count, int channels, uint64_t stream) const;

public:
    SyntheticBatchSource(const BatchLayout& layout, size_t num_batches, uint64_t seed);

    void reset(uint64_t epoch) override;
    std::optional<StegoBatch> next() override;
    size_t batches_per_epoch() const override { return num_batches; }
    const BatchLayout& layout() const override { return batch_layout; }
};

// Folder source when `path` is set, synthetic otherwise.
std::unique_ptr<BatchSource> make_batch_source(const std::string& path, const BatchLayout& layout,
                                               bool augment, uint64_t seed, size_t max_batches);
