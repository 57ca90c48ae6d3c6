#pragma once

#include <stdexcept>
#include <string>

struct StegoError : std::runtime_error {
    explicit StegoError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid RunConfig. Raised before any training step.
struct ConfigurationError : StegoError {
    explicit ConfigurationError(const std::string& message)
        : StegoError("configuration error: " + message) {}
};

struct NumericalDivergence : StegoError {
    NumericalDivergence(int epoch, int batch, const std::string& what)
        : StegoError("numerical divergence at epoch " + std::to_string(epoch) +
                     ", batch " + std::to_string(batch) + ": " + what),
          epoch(epoch), batch(batch) {}

    int epoch;
    int batch;
};

struct CheckpointNotFound : StegoError {
    explicit CheckpointNotFound(const std::string& message)
        : StegoError("checkpoint not found: " + message) {}
};

struct ShapeMismatch : StegoError {
    explicit ShapeMismatch(const std::string& message)
        : StegoError("shape mismatch: " + message) {}
};
