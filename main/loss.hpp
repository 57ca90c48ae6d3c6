#pragma once

#include <torch/torch.h>

#include "util.hpp"

struct LossTerms {
    torch::Tensor hiding;   // distance(cover, container)
    torch::Tensor reveal;   // distance(secret, revealed)
    torch::Tensor total;
};

// Mean distance between two image tensors of identical shape.
torch::Tensor image_distance(const torch::Tensor& a, const torch::Tensor& b, LossKind kind);

class LossComposer {
    double beta;
    LossKind kind;
    LossWeighting weighting;

public:
    LossComposer(double beta, LossKind kind, LossWeighting weighting = LossWeighting::Convex);
    explicit LossComposer(const RunConfig& config);

    // convex:   (1 - beta) * hiding + beta * reveal
    // additive: hiding + beta * reveal
    LossTerms compose(const torch::Tensor& cover, const torch::Tensor& container,
                      const torch::Tensor& secret, const torch::Tensor& revealed) const;

    double hiding_weight() const { return weighting == LossWeighting::Convex ? 1.0 - beta : 1.0; }
    double reveal_weight() const { return beta; }
    LossKind loss_kind() const { return kind; }
};
