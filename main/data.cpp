#include "data.hpp"
#include "errors.hpp"
#include <ATen/CPUGeneratorImpl.h>
#include <algorithm>
#include <cctype>
#include <numeric>
#include <sstream>

ImageFolderDataset::ImageFolderDataset(const std::string& root_dir, int image_size, int channels,
                                       bool augment, uint64_t seed)
    : image_size(image_size), channels(channels), augment(augment),
      gen(static_cast<std::mt19937::result_type>(seed)) {
    if (channels != 1 && channels != 3) {
        throw ConfigurationError("image folders support 1 or 3 channels, got " + std::to_string(channels));
    }
    if (!std::filesystem::is_directory(root_dir)) {
        throw ConfigurationError("image folder does not exist: " + root_dir);
    }
    load_data(root_dir);
    if (image_paths.empty()) {
        throw ConfigurationError("image folder contains no images: " + root_dir);
    }
}

void ImageFolderDataset::load_data(const std::string& root_dir) {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root_dir)) {
        if (entry.is_regular_file()) {
            std::string ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });

            if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp") {
                image_paths.push_back(entry.path().string());
            }
        }
    }
    // Directory iteration order is unspecified.
    std::sort(image_paths.begin(), image_paths.end());
}

torch::data::Example<> ImageFolderDataset::get(size_t index) {
    int flag = channels == 1 ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR;
    cv::Mat image = cv::imread(image_paths[index], flag);
    if (image.empty()) {
        throw StegoError("Failed to load image: " + image_paths[index]);
    }

    cv::resize(image, image, cv::Size(image_size, image_size), 0, 0, cv::INTER_AREA);

    if (augment && std::uniform_int_distribution<int>(0, 1)(gen) == 1) {
        cv::flip(image, image, 1);
    }

    return {mat_to_tensor(image), torch::tensor(static_cast<int64_t>(index), torch::kLong)};
}

torch::optional<size_t> ImageFolderDataset::size() const {
    return image_paths.size();
}

torch::Tensor mat_to_tensor(const cv::Mat& mat) {
    cv::Mat rgb;
    if (mat.channels() == 3) {
        cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
    } else {
        rgb = mat;
    }

    cv::Mat float_mat;
    rgb.convertTo(float_mat, CV_32F, 1.0/255.0);

    auto tensor = torch::from_blob(float_mat.data, {1, rgb.rows, rgb.cols, rgb.channels()}, torch::kFloat);
    tensor = tensor.permute({0, 3, 1, 2}).clone();
    return tensor.squeeze(0);
}

cv::Mat tensor_to_mat(const torch::Tensor& tensor) {
    auto cpu_tensor = tensor.detach().to(torch::kCPU, torch::kFloat);
    if (cpu_tensor.dim() == 4) cpu_tensor = cpu_tensor.squeeze(0);

    if (cpu_tensor.dim() != 3 || (cpu_tensor.size(0) != 1 && cpu_tensor.size(0) != 3)) {
        std::stringstream ss;
        ss << "cannot convert tensor of shape " << tensor.sizes() << " to an image, expected 1 or 3 channels";
        throw ShapeMismatch(ss.str());
    }

    int channels = static_cast<int>(cpu_tensor.size(0));
    cpu_tensor = cpu_tensor.permute({1, 2, 0}).contiguous();
    cpu_tensor = (cpu_tensor * 255).round();
    cpu_tensor = cpu_tensor.clamp(0, 255).to(torch::kUInt8);

    cv::Mat mat(cpu_tensor.size(0), cpu_tensor.size(1), channels == 1 ? CV_8UC1 : CV_8UC3,
                cpu_tensor.data_ptr<uint8_t>());
    cv::Mat out = mat.clone();
    if (channels == 3) {
        cv::cvtColor(out, out, cv::COLOR_RGB2BGR);
    }
    return out;
}

torch::Tensor pack_bundle(const torch::Tensor& images, int count) {
    if (images.dim() != 4 || images.size(0) % count != 0) {
        throw ShapeMismatch("cannot pack " + std::to_string(images.dim() == 4 ? images.size(0) : -1) +
                            " images into bundles of " + std::to_string(count));
    }
    auto b = images.size(0) / count;
    return images.reshape({b, count * images.size(1), images.size(2), images.size(3)});
}

torch::Tensor unpack_bundle(const torch::Tensor& bundle, int count) {
    if (bundle.dim() != 4 || bundle.size(1) % count != 0) {
        throw ShapeMismatch("cannot unpack bundle with " + std::to_string(bundle.dim() == 4 ? bundle.size(1) : -1) +
                            " channels into " + std::to_string(count) + " slots");
    }
    auto c = bundle.size(1) / count;
    return bundle.reshape({bundle.size(0) * count, c, bundle.size(2), bundle.size(3)});
}

torch::Tensor pad_bundle(const torch::Tensor& images, int active, int total) {
    if (active > total) {
        throw ShapeMismatch(std::to_string(active) + " active slots exceed bundle size " + std::to_string(total));
    }
    auto bundle = pack_bundle(images, active);
    if (active == total) return bundle;

    auto c = images.size(1);
    auto blank = torch::zeros({bundle.size(0), (total - active) * c, bundle.size(2), bundle.size(3)},
                              bundle.options());
    return torch::cat({bundle, blank}, 1);
}

BatchLayout BatchLayout::training(const RunConfig& config) {
    BatchLayout layout;
    layout.batch_size = config.training.batch_size_secret;
    layout.num_secret = config.capacity.num_secret;
    layout.num_cover = config.capacity.num_cover;
    layout.num_training = config.capacity.num_training;
    layout.channels_cover = config.data.channels_cover;
    layout.channels_secret = config.data.channels_secret;
    layout.image_size = config.data.image_size;
    return layout;
}

BatchLayout BatchLayout::evaluation(const RunConfig& config, const CapacityConfig& capacity) {
    BatchLayout layout = training(config);
    layout.batch_size = config.test.batch_size;
    layout.num_secret = capacity.num_secret;
    layout.num_cover = capacity.num_cover;
    layout.num_training = 1;
    return layout;
}

static void check_images(const torch::Tensor& images, const std::string& name, int64_t count, int channels,
                         int image_size, int batch_index) {
    auto where = name + " of batch " + std::to_string(batch_index);
    if (!images.defined() || images.dim() != 4) {
        throw ShapeMismatch(where + " must be a 4-d tensor");
    }
    if (images.size(0) != count || images.size(1) != channels ||
        images.size(2) != image_size || images.size(3) != image_size) {
        std::stringstream ss;
        ss << where << " has shape " << images.sizes() << ", expected ["
           << count << ", " << channels << ", " << image_size << ", " << image_size << "]";
        throw ShapeMismatch(ss.str());
    }
}

void validate_batch(const StegoBatch& batch, const BatchLayout& layout, int batch_index) {
    check_images(batch.cover, "cover", layout.covers_per_batch(), layout.channels_cover,
                 layout.image_size, batch_index);
    check_images(batch.secret, "secret", layout.secrets_per_batch(), layout.channels_secret,
                 layout.image_size, batch_index);
}

FolderBatchSource::FolderBatchSource(std::shared_ptr<ImageFolderDataset> covers,
                                     std::shared_ptr<ImageFolderDataset> secrets,
                                     const BatchLayout& layout, uint64_t seed, size_t max_batches)
    : covers(std::move(covers)), secrets(std::move(secrets)), batch_layout(layout),
      seed(seed), max_batches(max_batches) {
    if (this->covers->channels != layout.channels_cover || this->secrets->channels != layout.channels_secret) {
        throw ShapeMismatch("dataset channels do not match the batch layout");
    }

    size_t cover_batches = this->covers->size().value() / layout.covers_per_batch();
    size_t secret_batches = this->secrets->size().value() / layout.secrets_per_batch();
    num_batches = std::min(cover_batches, secret_batches);
    if (max_batches > 0) num_batches = std::min(num_batches, max_batches);
    if (num_batches == 0) {
        throw ConfigurationError("dataset too small for one batch of " + std::to_string(layout.covers_per_batch()) +
                                 " covers and " + std::to_string(layout.secrets_per_batch()) + " secrets");
    }
    reset(0);
}

void FolderBatchSource::reset(uint64_t epoch) {
    std::mt19937_64 rng(seed + epoch);

    cover_order.resize(covers->size().value());
    std::iota(cover_order.begin(), cover_order.end(), 0);
    std::shuffle(cover_order.begin(), cover_order.end(), rng);

    secret_order.resize(secrets->size().value());
    std::iota(secret_order.begin(), secret_order.end(), 0);
    std::shuffle(secret_order.begin(), secret_order.end(), rng);

    covers->reseed(seed + epoch);
    if (secrets != covers) secrets->reseed(seed + epoch + 1);
    cursor = 0;
}

torch::Tensor FolderBatchSource::load(ImageFolderDataset& dataset, const std::vector<size_t>& order,
                                      int64_t offset, int64_t count) {
    std::vector<torch::Tensor> images;
    images.reserve(count);
    for (int64_t i = 0; i < count; i++) {
        images.push_back(dataset.get(order[offset + i]).data);
    }
    return torch::stack(images);
}

std::optional<StegoBatch> FolderBatchSource::next() {
    if (cursor >= num_batches) return std::nullopt;

    StegoBatch batch;
    batch.cover = load(*covers, cover_order, static_cast<int64_t>(cursor) * batch_layout.covers_per_batch(), batch_layout.covers_per_batch());
    batch.secret = load(*secrets, secret_order, static_cast<int64_t>(cursor) * batch_layout.secrets_per_batch(), batch_layout.secrets_per_batch());
    cursor++;
    return batch;
}

SyntheticBatchSource::SyntheticBatchSource(const BatchLayout& layout, size_t num_batches, uint64_t seed)
    : batch_layout(layout), seed(seed), num_batches(num_batches) {
    if (num_batches == 0) {
        throw ConfigurationError("synthetic source needs at least one batch");
    }
}

void SyntheticBatchSource::reset(uint64_t epoch) {
    this->epoch = epoch;
    cursor = 0;
}

torch::Tensor SyntheticBatchSource::generate(int64_t count, int channels, uint64_t stream) const {
    uint64_t s = seed + 0x9E3779B97F4A7C15ULL * (epoch * 1000003ULL + cursor * 2 + stream + 1);
    auto gen = at::detail::createCPUGenerator(s);

    int64_t low = std::min<int64_t>(8, batch_layout.image_size);
    auto coarse = torch::rand({count, static_cast<int64_t>(channels), low, low}, gen, torch::kFloat);
    return torch::nn::functional::interpolate(
        coarse, torch::nn::functional::InterpolateFuncOptions()
                    .size(std::vector<int64_t>{batch_layout.image_size, batch_layout.image_size})
                    .mode(torch::kBilinear)
                    .align_corners(false));
}

std::optional<StegoBatch> SyntheticBatchSource::next() {
    if (cursor >= num_batches) return std::nullopt;

    StegoBatch batch;
    batch.cover = generate(batch_layout.covers_per_batch(), batch_layout.channels_cover, 0);
    batch.secret = generate(batch_layout.secrets_per_batch(), batch_layout.channels_secret, 1);
    cursor++;
    return batch;
}

std::unique_ptr<BatchSource> make_batch_source(const std::string& path, const BatchLayout& layout,
                                               bool augment, uint64_t seed, size_t max_batches) {
    if (path.empty()) {
        return std::make_unique<SyntheticBatchSource>(layout, std::max<size_t>(1, max_batches), seed);
    }

    if (layout.channels_cover == layout.channels_secret) {
        auto dataset = std::make_shared<ImageFolderDataset>(path, layout.image_size, layout.channels_cover, augment, seed);
        return std::make_unique<FolderBatchSource>(dataset, dataset, layout, seed, max_batches);
    }

    auto covers = std::make_shared<ImageFolderDataset>(path, layout.image_size, layout.channels_cover, augment, seed);
    auto secrets = std::make_shared<ImageFolderDataset>(path, layout.image_size, layout.channels_secret, augment, seed + 1);
    return std::make_unique<FolderBatchSource>(covers, secrets, layout, seed, max_batches);
}
