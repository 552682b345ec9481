#pragma once

#include "nn/Attention.h"
#include "nn/Fork.h"
#include "nn/GatedRecurrent.h"
#include "nn/Readout.h"

#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/pimpl.h>

#include <cstdint>
#include <optional>

namespace rnnsearch::model {

struct GenerationOptions {
    nn::EmitOptions emit;
    // Seed for sampling. Without it, torch's default generator is used.
    std::optional<uint64_t> seed;
};

struct GenerationResult {
    at::Tensor outputs;  // [steps, B] int64, steps = 2 * source_length
    at::Tensor costs;    // [steps, B] negative log-likelihood of each emitted token
    at::Tensor weights;  // [steps, T_src, B] attention weights of each step
};

/**
 * \brief Attention decoder (RNNsearch): a gated recurrent transition with a learned initial state,
 *          content attention over the encoder representation, and a maxout readout.
 *
 * Per step t, with s_{t-1} the previous state and y_{t-1} the previous token:
 *   glimpse_t = attend(s_{t-1}, representation)
 *   logits_t  = readout(s_{t-1}, glimpse_t, embed(y_{t-1}))     (embed(none) = 0 for t = 0)
 *   s_t       = gru(s_{t-1}, fork(embed(y_t)) + distribute(glimpse_t))
 */
class DecoderImpl : public torch::nn::Module {
public:
    DecoderImpl(int64_t vocab_size,
                int64_t embedding_dim,
                int64_t state_dim,
                int64_t encoder_state_dim);

    /**
     * \brief Teacher-forced negative log-likelihood of every target token.
     * \param representation [T_src, B, 2 * encoder_state_dim]
     * \param source_mask [B, T_src]
     * \param target [B, T_trg] int64
     * \param target_mask [B, T_trg]
     * \returns Cost matrix [T_trg, B], not yet masked.
     */
    at::Tensor cost_matrix(const at::Tensor& representation,
                           const at::Tensor& source_mask,
                           const at::Tensor& target,
                           const at::Tensor& target_mask);

    // sum(cost_matrix * target_mask) / batch_size
    at::Tensor cost(const at::Tensor& representation,
                    const at::Tensor& source_mask,
                    const at::Tensor& target,
                    const at::Tensor& target_mask);

    /**
     * \brief Free-running generation for exactly 2 * T_src steps. There is no end-of-sequence
     *          handling: an end marker is emitted like any other token and generation continues.
     * \param representation [T_src, B, 2 * encoder_state_dim]
     * \param source_mask Optional [B, T_src]. All positions are attended if undefined.
     */
    GenerationResult generate(const at::Tensor& representation,
                              const GenerationOptions& options,
                              const at::Tensor& source_mask = {});

    int64_t vocab_size() const { return m_vocab_size; }

private:
    // Returns the time-major source mask after checking it against the representation.
    at::Tensor check_source(const at::Tensor& representation, const at::Tensor& source_mask) const;

    nn::RecurrentInputs transition_inputs(const nn::RecurrentInputs& feedback_inputs,
                                          const at::Tensor& glimpse);

    int64_t m_vocab_size = 0;
    int64_t m_embedding_dim = 0;
    int64_t m_state_dim = 0;
    int64_t m_encoder_state_dim = 0;

    nn::GRUInitialState m_transition{nullptr};
    nn::SequenceContentAttention m_attention{nullptr};
    nn::Readout m_readout{nullptr};
    nn::Fork m_fork{nullptr};
    nn::Fork m_distribute{nullptr};
};
TORCH_MODULE(Decoder);

}  // namespace rnnsearch::model
