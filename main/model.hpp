#pragma once

#include <torch/torch.h>
#include <memory>
#include <vector>

#include "util.hpp"

// Encoder/decoder U-Net. Each level halves the resolution; the decoder
// concatenates the matching encoder activation before upsampling.
struct UnetGenerator : torch::nn::Module {
    std::vector<torch::nn::Sequential> down, up;
    int num_downs;

    UnetGenerator(int input_nc, int output_nc, int num_downs, int ngf, NormMode norm);
    torch::Tensor forward(torch::Tensor x);
};

struct RevealNet : torch::nn::Module {
    torch::nn::Sequential layers{nullptr};

    RevealNet(int input_nc, int output_nc, int nhf, NormMode norm);
    torch::Tensor forward(torch::Tensor x);
};

// Hides a secret bundle [B, ns*Cs, H, W] in cover bundles [B*nt, nc*Cc, H, W].
// The result has the cover bundle's shape and lies in [0, 1].
struct HidingNetwork : torch::nn::Module {
    int cover_channels, secret_channels;

    HidingNetwork(int cover_channels, int secret_channels)
        : cover_channels(cover_channels), secret_channels(secret_channels) {}
    virtual ~HidingNetwork() = default;

    virtual torch::Tensor encode(const torch::Tensor& cover, const torch::Tensor& secret) = 0;
    virtual HidingScheme scheme() const = 0;

protected:
    // Returns the number of cover bundles per secret bundle.
    int64_t check_inputs(const torch::Tensor& cover, const torch::Tensor& secret) const;
};

struct UDHEncoder : HidingNetwork {
    std::shared_ptr<UnetGenerator> unet;

    UDHEncoder(int cover_channels, int secret_channels, int num_downs, int ngf, NormMode norm);

    // Cover-independent perturbation in [-1, 1] with the cover bundle's channel count.
    torch::Tensor residual(const torch::Tensor& secret);
    torch::Tensor encode(const torch::Tensor& cover, const torch::Tensor& secret) override;
    HidingScheme scheme() const override { return HidingScheme::UDH; }
};

struct DDHEncoder : HidingNetwork {
    std::shared_ptr<UnetGenerator> unet;

    DDHEncoder(int cover_channels, int secret_channels, int num_downs, int ngf, NormMode norm);

    torch::Tensor encode(const torch::Tensor& cover, const torch::Tensor& secret) override;
    HidingScheme scheme() const override { return HidingScheme::DDH; }
};

struct RevealingNetwork : torch::nn::Module {
    std::shared_ptr<RevealNet> net;
    int container_channels, secret_channels;

    RevealingNetwork(int container_channels, int secret_channels, int nhf, NormMode norm);

    // [N, nc*Cc, H, W] -> [N, ns*Cs, H, W], slots in encode-time order.
    torch::Tensor decode(const torch::Tensor& container);
};

struct StegoNetworks {
    std::shared_ptr<HidingNetwork> hiding;
    std::shared_ptr<RevealingNetwork> revealing;

    std::vector<torch::Tensor> parameters() const;
    void train(bool on = true);
    void eval() { train(false); }
    void to(torch::Device device);
};

// Builds the hiding network for the configured scheme and its revealing
// network, initialised deterministically from `seed`.
StegoNetworks make_networks(const RunConfig& config, uint64_t seed);

void init_weights(torch::nn::Module& module);
