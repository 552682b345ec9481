#include "nn/Attention.h"

#include "torch_utils/tensor_utils.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <torch/nn/options/linear.h>

#include <limits>

namespace rnnsearch::nn {

at::Tensor masked_softmax(const at::Tensor &energies, const at::Tensor &mask) {
    utils::check_rank(energies, 2, "energies");
    utils::check_mask_matches(energies, mask, "energies", "mask");

    const at::Tensor valid = mask.ne(0);
    if (energies.size(0) == 0 || !valid.any(0).all().item<bool>()) {
        throw DegenerateInputError(
                "Attention received a batch item with no unmasked source positions.");
    }

    const at::Tensor masked_energies =
            energies.masked_fill(valid.logical_not(), -std::numeric_limits<float>::infinity());
    return at::softmax(masked_energies, 0);
}

SequenceContentAttentionImpl::SequenceContentAttentionImpl(const int64_t state_dim_,
                                                           const int64_t attended_dim_,
                                                           const int64_t match_dim_)
        : state_dim(state_dim_), attended_dim(attended_dim_), match_dim(match_dim_) {
    state_transformer = register_module(
            "state_transformer",
            torch::nn::Linear(torch::nn::LinearOptions(state_dim, match_dim).bias(false)));
    attended_transformer =
            register_module("attended_transformer", torch::nn::Linear(attended_dim, match_dim));
    energy_computer = register_module(
            "energy_computer",
            torch::nn::Linear(torch::nn::LinearOptions(match_dim, 1).bias(false)));
}

at::Tensor SequenceContentAttentionImpl::preprocess(const at::Tensor &attended) {
    utils::check_rank(attended, 3, "attended");
    return attended_transformer(attended);
}

AttentionOutput SequenceContentAttentionImpl::forward(const at::Tensor &state,
                                                      const at::Tensor &attended,
                                                      const at::Tensor &mask,
                                                      const at::Tensor &preprocessed) {
    utils::check_rank(state, 2, "state");
    utils::check_rank(attended, 3, "attended");
    utils::check_mask_matches(attended, mask, "attended", "attended_mask");
    if (state.size(0) != attended.size(1)) {
        throw ShapeMismatchError("Attention batch size mismatch: state [" +
                                 utils::tensor_shape_as_string(state) + "], attended [" +
                                 utils::tensor_shape_as_string(attended) + "].");
    }

    const at::Tensor keys = preprocessed.defined() ? preprocessed : preprocess(attended);

    // [B, M] broadcast against [T, B, M].
    const at::Tensor match = at::tanh(keys + state_transformer(state).unsqueeze(0));
    const at::Tensor energies = energy_computer(match).squeeze(-1);

    const at::Tensor weights = masked_softmax(energies, mask);
    const at::Tensor context = (weights.unsqueeze(-1) * attended).sum(0);

    return {context, weights};
}

}  // namespace rnnsearch::nn
