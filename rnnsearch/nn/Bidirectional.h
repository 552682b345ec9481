#pragma once

#include "nn/Fork.h"
#include "nn/GatedRecurrent.h"

#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/pimpl.h>

#include <cstdint>

namespace rnnsearch::nn {

// Two independent gated recurrent passes over the same sequence, each with its own input
// projection. Outputs are concatenated per position: [forward | backward].
struct BidirectionalImpl : torch::nn::Module {
    BidirectionalImpl(int64_t input_dim, int64_t dim);

    // x: [T, B, input_dim], mask: [T, B] -> [T, B, 2 * dim]
    at::Tensor forward(const at::Tensor &x, const at::Tensor &mask);

    const int64_t input_dim, dim;
    Fork fwd_fork{nullptr}, back_fork{nullptr};
    GatedRecurrent forward_rnn{nullptr}, backward_rnn{nullptr};
};

TORCH_MODULE(Bidirectional);

}  // namespace rnnsearch::nn
