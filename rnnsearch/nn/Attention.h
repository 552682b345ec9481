#pragma once

#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/linear.h>
#include <torch/nn/pimpl.h>

#include <cstdint>

namespace rnnsearch::nn {

struct AttentionOutput {
    at::Tensor context;  // [B, attended_dim], the glimpse
    at::Tensor weights;  // [T, B]
};

/**
 * \brief Content-based attention over a time-major sequence.
 *
 *   energy[t, b] = v^T tanh(W_s * state[b] + W_a * attended[t, b] + b_a)
 *   weights      = masked softmax of energies over t
 *   context[b]   = sum_t weights[t, b] * attended[t, b]
 *
 * Masked positions get exactly zero weight. Every batch item needs at least one unmasked position;
 * a fully masked item throws DegenerateInputError.
 */
struct SequenceContentAttentionImpl : torch::nn::Module {
    SequenceContentAttentionImpl(int64_t state_dim, int64_t attended_dim, int64_t match_dim);

    // Projection of the attended sequence that does not depend on the decoder state.
    // attended: [T, B, attended_dim] -> [T, B, match_dim]
    at::Tensor preprocess(const at::Tensor &attended);

    /**
     * \param state Decoder state, [B, state_dim].
     * \param attended Time-major sequence, [T, B, attended_dim].
     * \param mask Time-major mask, [T, B].
     * \param preprocessed Optional result of preprocess(attended), reused across decoder steps.
     */
    AttentionOutput forward(const at::Tensor &state,
                            const at::Tensor &attended,
                            const at::Tensor &mask,
                            const at::Tensor &preprocessed = {});

    const int64_t state_dim, attended_dim, match_dim;
    torch::nn::Linear state_transformer{nullptr}, attended_transformer{nullptr},
            energy_computer{nullptr};
};

TORCH_MODULE(SequenceContentAttention);

/**
 * \brief Softmax over dim 0 restricted to positions where mask != 0.
 * \param energies [T, B]
 * \param mask [T, B]
 * \throws DegenerateInputError if any column of the mask is all zeros.
 */
at::Tensor masked_softmax(const at::Tensor &energies, const at::Tensor &mask);

}  // namespace rnnsearch::nn
