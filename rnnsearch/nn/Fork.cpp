#include "nn/Fork.h"

#include <torch/nn/options/linear.h>

namespace rnnsearch::nn {

ForkImpl::ForkImpl(const int64_t input_dim_, const int64_t dim_)
        : input_dim(input_dim_), dim(dim_) {
    to_inputs = register_module("inputs", torch::nn::Linear(input_dim, dim));
    to_gate_inputs = register_module("gate_inputs", torch::nn::Linear(input_dim, 2 * dim));
}

RecurrentInputs ForkImpl::forward(const at::Tensor &x) {
    return {to_inputs(x), to_gate_inputs(x)};
}

}  // namespace rnnsearch::nn
