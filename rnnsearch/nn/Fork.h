#pragma once

#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/linear.h>
#include <torch/nn/pimpl.h>

#include <cstdint>

namespace rnnsearch::nn {

// Inputs of one gated recurrent step: the candidate pre-activation and the two gate pre-activations.
struct RecurrentInputs {
    at::Tensor inputs;       // [..., dim]
    at::Tensor gate_inputs;  // [..., 2 * dim]
};

// Projects one source vector into both input streams of a gated recurrent cell.
struct ForkImpl : torch::nn::Module {
    ForkImpl(int64_t input_dim, int64_t dim);

    RecurrentInputs forward(const at::Tensor &x);

    const int64_t input_dim, dim;
    torch::nn::Linear to_inputs{nullptr}, to_gate_inputs{nullptr};
};

TORCH_MODULE(Fork);

}  // namespace rnnsearch::nn
