#pragma once

#include "nn/Fork.h"

#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/linear.h>
#include <torch/nn/pimpl.h>

#include <cstdint>

namespace rnnsearch::nn {

/**
 * \brief Gated recurrent unit with reset and update gates.
 *
 *   gates  = gate_inputs + h_prev * state_to_gates      (update | reset)
 *   cand   = tanh(inputs + (h_prev .* reset) * state_to_state)
 *   h      = update .* cand + (1 - update) .* h_prev
 *
 * Where a mask is given, items with mask 0 keep h_prev unchanged. This is how padded positions are
 * kept out of the recurrence in both scan directions.
 */
struct GatedRecurrentImpl : torch::nn::Module {
    GatedRecurrentImpl(int64_t dim, bool learned_initial_state);

    // inputs: [B, dim], gate_inputs: [B, 2 * dim], states: [B, dim], mask: [B] or undefined.
    at::Tensor step(const at::Tensor &inputs,
                    const at::Tensor &gate_inputs,
                    const at::Tensor &states,
                    const at::Tensor &mask);

    /**
     * \brief Runs the recurrence over a whole sequence.
     * \param inputs Time-major candidate inputs, [T, B, dim].
     * \param gate_inputs Time-major gate inputs, [T, B, 2 * dim].
     * \param mask Time-major mask, [T, B]. May be undefined.
     * \param initial_states [B, dim]. If undefined, the learned initial state is used.
     * \param reverse Scan from T - 1 down to 0. Outputs stay aligned with input positions.
     * \returns States for every position, [T, B, dim].
     */
    at::Tensor forward(const at::Tensor &inputs,
                       const at::Tensor &gate_inputs,
                       const at::Tensor &mask,
                       const at::Tensor &initial_states,
                       bool reverse);

    // Orthogonal transition matrices (each gate block separately), zero initial state.
    void reset_parameters();

    // The learned initial state broadcast over the batch.
    at::Tensor initial_states(int64_t batch_size) const;

    const int64_t dim;
    at::Tensor state_to_state, state_to_gates, initial_state;
};

TORCH_MODULE(GatedRecurrent);

/**
 * \brief Decoder transition: a gated recurrent cell whose step-0 state is computed from the
 *          encoder representation instead of being a constant.
 *
 * h_0 = tanh(W * representation[0, :, backward_slice] + b), where the backward slice is the
 * second half of the feature axis (the reverse-direction encoder states at the first position).
 */
struct GRUInitialStateImpl : torch::nn::Module {
    GRUInitialStateImpl(int64_t dim, int64_t attended_state_dim);

    // representation: [T, B, 2 * attended_state_dim] -> [B, dim]
    at::Tensor initial_states(const at::Tensor &representation);

    at::Tensor step(const RecurrentInputs &inputs, const at::Tensor &states, const at::Tensor &mask);

    const int64_t dim, attended_state_dim;
    GatedRecurrent transition{nullptr};
    torch::nn::Linear initializer{nullptr};
};

TORCH_MODULE(GRUInitialState);

}  // namespace rnnsearch::nn
