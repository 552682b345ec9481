#include "nn/Readout.h"

#include "torch_utils/tensor_utils.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <torch/nn/options/embedding.h>
#include <torch/nn/options/linear.h>

#include <vector>

namespace rnnsearch::nn {

namespace {

torch::nn::Linear make_projection(const int64_t in_features, const int64_t out_features) {
    return torch::nn::Linear(torch::nn::LinearOptions(in_features, out_features).bias(false));
}

}  // namespace

at::Tensor maxout(const at::Tensor &x, const int64_t num_pieces) {
    const int64_t features = x.size(-1);
    if ((features % num_pieces) != 0) {
        throw ShapeMismatchError("Maxout input size " + std::to_string(features) +
                                 " is not divisible by " + std::to_string(num_pieces) + ".");
    }
    std::vector<int64_t> shape(std::begin(x.sizes()), std::end(x.sizes()));
    shape.back() = features / num_pieces;
    shape.emplace_back(num_pieces);
    return std::get<0>(x.reshape(shape).max(-1));
}

ReadoutImpl::ReadoutImpl(const int64_t state_dim_,
                         const int64_t attended_dim_,
                         const int64_t embedding_dim_,
                         const int64_t vocab_size_)
        : state_dim(state_dim_),
          attended_dim(attended_dim_),
          embedding_dim(embedding_dim_),
          vocab_size(vocab_size_) {
    if ((state_dim % 2) != 0) {
        throw ConfigurationError("Readout maxout requires an even state dimension, got: " +
                                 std::to_string(state_dim));
    }

    merge_states = register_module("merge_states", make_projection(state_dim, state_dim));
    merge_glimpses = register_module("merge_glimpses", make_projection(attended_dim, state_dim));
    merge_feedback = register_module("merge_feedback", make_projection(embedding_dim, state_dim));
    maxout_bias = register_parameter("maxout_bias", at::zeros({state_dim}));
    softmax0 = register_module("softmax0", make_projection(state_dim / 2, embedding_dim));
    softmax1 = register_module("softmax1", torch::nn::Linear(embedding_dim, vocab_size));
    feedback_lookup = register_module(
            "feedback", torch::nn::Embedding(torch::nn::EmbeddingOptions(vocab_size, embedding_dim)));
}

at::Tensor ReadoutImpl::feedback(const std::optional<at::Tensor> &tokens, const int64_t batch_size) {
    if (!tokens) {
        return at::zeros({batch_size, embedding_dim}, feedback_lookup->weight.options());
    }
    return feedback_lookup(*tokens);
}

at::Tensor ReadoutImpl::forward(const at::Tensor &states,
                                const at::Tensor &glimpses,
                                const at::Tensor &feedback) {
    const at::Tensor merged =
            merge_states(states) + merge_glimpses(glimpses) + merge_feedback(feedback);
    return softmax1(softmax0(maxout(merged + maxout_bias, 2)));
}

at::Tensor ReadoutImpl::cost(const at::Tensor &logits, const at::Tensor &tokens) const {
    const at::Tensor log_probs = at::log_softmax(logits, -1);
    return -log_probs.gather(-1, tokens.unsqueeze(-1)).squeeze(-1);
}

at::Tensor ReadoutImpl::emit(const at::Tensor &logits,
                             const EmitOptions &options,
                             const std::optional<at::Generator> &generator) const {
    if (options.greedy) {
        return logits.argmax(-1);
    }
    const at::Tensor probs = at::softmax(logits, -1);
    return at::multinomial(probs, 1, false, generator).squeeze(-1);
}

}  // namespace rnnsearch::nn
