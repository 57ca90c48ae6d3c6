#include "model.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

static void append_norm(torch::nn::Sequential& seq, int channels, NormMode norm) {
    switch (norm) {
        case NormMode::Batch:
            seq->push_back(torch::nn::BatchNorm2d(channels));
            break;
        case NormMode::Instance:
            seq->push_back(torch::nn::InstanceNorm2d(torch::nn::InstanceNorm2dOptions(channels)));
            break;
        case NormMode::None:
            break;
    }
}

static int level_filters(int ngf, int level) {
    return ngf * std::min(1 << level, 8);
}

UnetGenerator::UnetGenerator(int input_nc, int output_nc, int num_downs, int ngf, NormMode norm)
    : num_downs(num_downs) {
    // Batch norm carries its own shift.
    bool use_bias = norm != NormMode::Batch;

    for (int k = 0; k < num_downs; k++) {
        int in_ch = k == 0 ? input_nc : level_filters(ngf, k - 1);
        int out_ch = level_filters(ngf, k);
        bool outermost = k == 0, innermost = k == num_downs - 1;

        torch::nn::Sequential block;
        if (!outermost) {
            block->push_back(torch::nn::LeakyReLU(torch::nn::LeakyReLUOptions().negative_slope(0.2)));
        }
        block->push_back(torch::nn::Conv2d(
            torch::nn::Conv2dOptions(in_ch, out_ch, 4).stride(2).padding(1).bias(use_bias)));
        if (!outermost && !innermost) {
            append_norm(block, out_ch, norm);
        }
        down.push_back(register_module("down" + std::to_string(k), block));
    }

    up.resize(num_downs);
    for (int k = num_downs - 1; k >= 0; k--) {
        int in_ch = k == num_downs - 1 ? level_filters(ngf, k) : 2 * level_filters(ngf, k);
        int out_ch = k == 0 ? output_nc : level_filters(ngf, k - 1);

        torch::nn::Sequential block;
        block->push_back(torch::nn::ReLU());
        block->push_back(torch::nn::ConvTranspose2d(
            torch::nn::ConvTranspose2dOptions(in_ch, out_ch, 4).stride(2).padding(1).bias(k == 0 || use_bias)));
        if (k > 0) {
            append_norm(block, out_ch, norm);
        }
        up[k] = register_module("up" + std::to_string(k), block);
    }
}

torch::Tensor UnetGenerator::forward(torch::Tensor x) {
    std::vector<torch::Tensor> skips;
    skips.reserve(num_downs);
    for (int k = 0; k < num_downs; k++) {
        x = down[k]->forward(x);
        skips.push_back(x);
    }

    for (int k = num_downs - 1; k >= 0; k--) {
        if (k < num_downs - 1) {
            x = torch::cat({x, skips[k]}, 1);
        }
        x = up[k]->forward(x);
    }
    return x;
}

RevealNet::RevealNet(int input_nc, int output_nc, int nhf, NormMode norm) {
    bool use_bias = norm != NormMode::Batch;
    std::vector<int> widths = {input_nc, nhf, nhf * 2, nhf * 4, nhf * 2, nhf};

    torch::nn::Sequential seq;
    for (size_t i = 0; i + 1 < widths.size(); i++) {
        seq->push_back(torch::nn::Conv2d(
            torch::nn::Conv2dOptions(widths[i], widths[i + 1], 3).stride(1).padding(1).bias(use_bias)));
        append_norm(seq, widths[i + 1], norm);
        seq->push_back(torch::nn::ReLU());
    }
    seq->push_back(torch::nn::Conv2d(torch::nn::Conv2dOptions(nhf, output_nc, 3).stride(1).padding(1)));

    layers = register_module("layers", seq);
}

torch::Tensor RevealNet::forward(torch::Tensor x) {
    return layers->forward(x);
}

static std::string describe(const torch::Tensor& t) {
    std::stringstream ss;
    ss << t.sizes();
    return ss.str();
}

int64_t HidingNetwork::check_inputs(const torch::Tensor& cover, const torch::Tensor& secret) const {
    if (cover.dim() != 4 || secret.dim() != 4) {
        throw ShapeMismatch("cover and secret bundles must be 4-d, got " + describe(cover) + " and " + describe(secret));
    }
    if (cover.size(1) != cover_channels) {
        throw ShapeMismatch("cover bundle has " + std::to_string(cover.size(1)) + " channels, expected " +
                            std::to_string(cover_channels));
    }
    if (secret.size(1) != secret_channels) {
        throw ShapeMismatch("secret bundle has " + std::to_string(secret.size(1)) + " channels, expected " +
                            std::to_string(secret_channels));
    }
    if (cover.size(2) != secret.size(2) || cover.size(3) != secret.size(3)) {
        throw ShapeMismatch("cover " + describe(cover) + " and secret " + describe(secret) + " differ in size");
    }
    if (secret.size(0) == 0 || cover.size(0) % secret.size(0) != 0) {
        throw ShapeMismatch(std::to_string(cover.size(0)) + " cover bundles cannot be split evenly across " +
                            std::to_string(secret.size(0)) + " secret bundles");
    }
    return cover.size(0) / secret.size(0);
}

UDHEncoder::UDHEncoder(int cover_channels, int secret_channels, int num_downs, int ngf, NormMode norm)
    : HidingNetwork(cover_channels, secret_channels) {
    unet = register_module("unet", std::make_shared<UnetGenerator>(secret_channels, cover_channels, num_downs, ngf, norm));
}

torch::Tensor UDHEncoder::residual(const torch::Tensor& secret) {
    if (secret.dim() != 4 || secret.size(1) != secret_channels) {
        throw ShapeMismatch("secret bundle " + describe(secret) + " does not have " +
                            std::to_string(secret_channels) + " channels");
    }
    return torch::tanh(unet->forward(secret));
}

torch::Tensor UDHEncoder::encode(const torch::Tensor& cover, const torch::Tensor& secret) {
    auto copies = check_inputs(cover, secret);
    auto r = residual(secret);
    if (copies > 1) {
        r = r.repeat({copies, 1, 1, 1});
    }
    return torch::clamp(cover + r, 0.0, 1.0);
}

DDHEncoder::DDHEncoder(int cover_channels, int secret_channels, int num_downs, int ngf, NormMode norm)
    : HidingNetwork(cover_channels, secret_channels) {
    unet = register_module("unet", std::make_shared<UnetGenerator>(cover_channels + secret_channels, cover_channels,
                                                                   num_downs, ngf, norm));
}

torch::Tensor DDHEncoder::encode(const torch::Tensor& cover, const torch::Tensor& secret) {
    auto copies = check_inputs(cover, secret);
    auto s = copies > 1 ? secret.repeat({copies, 1, 1, 1}) : secret;
    return torch::sigmoid(unet->forward(torch::cat({cover, s}, 1)));
}

RevealingNetwork::RevealingNetwork(int container_channels, int secret_channels, int nhf, NormMode norm)
    : container_channels(container_channels), secret_channels(secret_channels) {
    net = register_module("net", std::make_shared<RevealNet>(container_channels, secret_channels, nhf, norm));
}

torch::Tensor RevealingNetwork::decode(const torch::Tensor& container) {
    if (container.dim() != 4 || container.size(1) != container_channels) {
        throw ShapeMismatch("container " + describe(container) + " does not have " +
                            std::to_string(container_channels) + " channels");
    }
    return torch::sigmoid(net->forward(container));
}

std::vector<torch::Tensor> StegoNetworks::parameters() const {
    auto params = hiding->parameters();
    auto reveal_params = revealing->parameters();
    params.insert(params.end(), reveal_params.begin(), reveal_params.end());
    return params;
}

void StegoNetworks::train(bool on) {
    hiding->train(on);
    revealing->train(on);
}

void StegoNetworks::to(torch::Device device) {
    hiding->to(device);
    revealing->to(device);
}

void init_weights(torch::nn::Module& module) {
    torch::NoGradGuard no_grad;
    for (auto& m : module.modules(/*include_self=*/true)) {
        if (auto* conv = m->as<torch::nn::Conv2d>()) {
            conv->weight.normal_(0.0, 0.02);
            if (conv->bias.defined()) conv->bias.zero_();
        } else if (auto* deconv = m->as<torch::nn::ConvTranspose2d>()) {
            deconv->weight.normal_(0.0, 0.02);
            if (deconv->bias.defined()) deconv->bias.zero_();
        } else if (auto* bn = m->as<torch::nn::BatchNorm2d>()) {
            bn->weight.normal_(1.0, 0.02);
            bn->bias.zero_();
        }
    }
}

StegoNetworks make_networks(const RunConfig& config, uint64_t seed) {
    config.validate();
    torch::manual_seed(seed);

    int cover_channels = config.hiding_output_channels();
    int secret_channels = config.reveal_output_channels();

    StegoNetworks nets;
    if (config.model.scheme == HidingScheme::UDH) {
        nets.hiding = std::make_shared<UDHEncoder>(cover_channels, secret_channels, config.model.num_downs,
                                                   config.model.base_filters, config.model.norm);
    } else {
        nets.hiding = std::make_shared<DDHEncoder>(cover_channels, secret_channels, config.model.num_downs,
                                                   config.model.base_filters, config.model.norm);
    }
    nets.revealing = std::make_shared<RevealingNetwork>(cover_channels, secret_channels,
                                                        config.model.reveal_filters, config.model.norm);

    init_weights(*nets.hiding);
    init_weights(*nets.revealing);
    return nets;
}
