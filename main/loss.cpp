#include "loss.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

torch::Tensor image_distance(const torch::Tensor& a, const torch::Tensor& b, LossKind kind) {
    if (a.sizes() != b.sizes()) {
        std::stringstream ss;
        ss << "cannot compare tensors of shape " << a.sizes() << " and " << b.sizes();
        throw ShapeMismatch(ss.str());
    }
    switch (kind) {
        case LossKind::L1:
            return torch::nn::functional::l1_loss(a, b);
        case LossKind::L2:
            return torch::nn::functional::mse_loss(a, b);
    }
    return torch::nn::functional::mse_loss(a, b);
}

LossComposer::LossComposer(double beta, LossKind kind, LossWeighting weighting)
    : beta(beta), kind(kind), weighting(weighting) {
    if (!std::isfinite(beta) || beta < 0.0 || beta > 1.0) {
        throw ConfigurationError("training.beta must be in [0, 1], got " + std::to_string(beta));
    }
}

LossComposer::LossComposer(const RunConfig& config)
    : LossComposer(config.training.beta, config.training.loss, config.training.weighting) {}

LossTerms LossComposer::compose(const torch::Tensor& cover, const torch::Tensor& container,
                                const torch::Tensor& secret, const torch::Tensor& revealed) const {
    LossTerms terms;
    terms.hiding = image_distance(container, cover, kind);
    terms.reveal = image_distance(revealed, secret, kind);
    terms.total = hiding_weight() * terms.hiding + reveal_weight() * terms.reveal;
    return terms;
}
