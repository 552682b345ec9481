#pragma once

#include <torch/nn/module.h>

#include <cstdint>
#include <optional>

namespace rnnsearch::model {

/**
 * \brief Initialises every parameter of the module tree in place.
 *
 * Recurrent transition matrices (`state_to_state`, and each square block of `state_to_gates`) are
 * orthogonal. Biases and learned initial states are zero. All other weights, including embedding
 * tables, are drawn from N(0, weight_scale^2).
 *
 * \param seed When given, initialisation is reproducible and independent of torch's global generator.
 */
void initialize_parameters(torch::nn::Module& module,
                           float weight_scale,
                           const std::optional<uint64_t>& seed);

}  // namespace rnnsearch::model
