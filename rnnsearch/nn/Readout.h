#pragma once

#include <ATen/core/Generator.h>
#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/embedding.h>
#include <torch/nn/modules/linear.h>
#include <torch/nn/pimpl.h>

#include <cstdint>
#include <optional>

namespace rnnsearch::nn {

// Elementwise maximum over `num_pieces` consecutive features. [..., D] -> [..., D / num_pieces]
at::Tensor maxout(const at::Tensor &x, int64_t num_pieces);

struct EmitOptions {
    // Take the most probable token instead of sampling from the distribution.
    bool greedy = false;
};

/**
 * \brief Maps (decoder state, glimpse, feedback) to logits over the target vocabulary.
 *
 *   merged = U_s * state + U_g * glimpse + U_f * feedback
 *   logits = softmax1(softmax0(maxout_2(merged + maxout_bias)))
 *
 * Also owns the feedback lookup table which embeds previously emitted tokens. The "no token yet"
 * feedback of the first step is std::nullopt and embeds to the zero vector.
 */
struct ReadoutImpl : torch::nn::Module {
    ReadoutImpl(int64_t state_dim, int64_t attended_dim, int64_t embedding_dim, int64_t vocab_size);

    // tokens: [...] int64 -> [..., embedding_dim]. std::nullopt -> zeros of shape [batch_size, embedding_dim].
    at::Tensor feedback(const std::optional<at::Tensor> &tokens, int64_t batch_size);

    // states: [B, state_dim], glimpses: [B, attended_dim], feedback: [B, embedding_dim] -> [B, vocab_size]
    at::Tensor forward(const at::Tensor &states, const at::Tensor &glimpses, const at::Tensor &feedback);

    // Per-item negative log-likelihood of `tokens` ([B]) under `logits` ([B, vocab_size]).
    at::Tensor cost(const at::Tensor &logits, const at::Tensor &tokens) const;

    // Selects the next token for every item, [B] int64.
    at::Tensor emit(const at::Tensor &logits,
                    const EmitOptions &options,
                    const std::optional<at::Generator> &generator) const;

    const int64_t state_dim, attended_dim, embedding_dim, vocab_size;
    torch::nn::Linear merge_states{nullptr}, merge_glimpses{nullptr}, merge_feedback{nullptr};
    at::Tensor maxout_bias;
    torch::nn::Linear softmax0{nullptr}, softmax1{nullptr};
    torch::nn::Embedding feedback_lookup{nullptr};
};

TORCH_MODULE(Readout);

}  // namespace rnnsearch::nn
