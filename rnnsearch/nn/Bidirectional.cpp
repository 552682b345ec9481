#include "nn/Bidirectional.h"

#include "torch_utils/tensor_utils.h"
#include "utils/errors.h"

#include <ATen/ATen.h>

namespace rnnsearch::nn {

BidirectionalImpl::BidirectionalImpl(const int64_t input_dim_, const int64_t dim_)
        : input_dim(input_dim_), dim(dim_) {
    fwd_fork = register_module("fwd_fork", Fork(input_dim, dim));
    back_fork = register_module("back_fork", Fork(input_dim, dim));
    forward_rnn = register_module("forward", GatedRecurrent(dim, true));
    backward_rnn = register_module("backward", GatedRecurrent(dim, true));
}

at::Tensor BidirectionalImpl::forward(const at::Tensor &x, const at::Tensor &mask) {
    utils::check_rank(x, 3, "x");
    utils::check_mask_matches(x, mask, "x", "mask");
    if (x.size(2) != input_dim) {
        throw ShapeMismatchError("Bidirectional expected " + std::to_string(input_dim) +
                                 " input features, got shape [" +
                                 utils::tensor_shape_as_string(x) + "].");
    }

    const RecurrentInputs fwd = fwd_fork(x);
    const RecurrentInputs back = back_fork(x);

    const at::Tensor forward_states =
            forward_rnn(fwd.inputs, fwd.gate_inputs, mask, at::Tensor{}, false);
    const at::Tensor backward_states =
            backward_rnn(back.inputs, back.gate_inputs, mask, at::Tensor{}, true);

    return at::cat({forward_states, backward_states}, 2);
}

}  // namespace rnnsearch::nn
