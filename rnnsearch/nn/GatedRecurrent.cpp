#include "nn/GatedRecurrent.h"

#include "torch_utils/tensor_utils.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <ATen/TensorIndexing.h>
#include <torch/nn/init.h>
#include <torch/utils.h>

#include <vector>

namespace rnnsearch::nn {

namespace {
using Slice = torch::indexing::Slice;
}  // namespace

GatedRecurrentImpl::GatedRecurrentImpl(const int64_t dim_, const bool learned_initial_state)
        : dim(dim_) {
    state_to_state = register_parameter("state_to_state", at::empty({dim, dim}));
    state_to_gates = register_parameter("state_to_gates", at::empty({dim, 2 * dim}));
    if (learned_initial_state) {
        initial_state = register_parameter("initial_state", at::zeros({dim}));
    }
    reset_parameters();
}

void GatedRecurrentImpl::reset_parameters() {
    torch::NoGradGuard no_grad;
    torch::nn::init::orthogonal_(state_to_state);
    at::Tensor update_block = at::empty({dim, dim});
    at::Tensor reset_block = at::empty({dim, dim});
    torch::nn::init::orthogonal_(update_block);
    torch::nn::init::orthogonal_(reset_block);
    state_to_gates.copy_(at::cat({update_block, reset_block}, 1));
    if (initial_state.defined()) {
        initial_state.zero_();
    }
}

at::Tensor GatedRecurrentImpl::step(const at::Tensor &inputs,
                                    const at::Tensor &gate_inputs,
                                    const at::Tensor &states,
                                    const at::Tensor &mask) {
    const at::Tensor gate_values = gate_inputs + at::matmul(states, state_to_gates);
    const at::Tensor update = at::sigmoid(gate_values.index({Slice(), Slice(0, dim)}));
    const at::Tensor reset = at::sigmoid(gate_values.index({Slice(), Slice(dim, 2 * dim)}));

    const at::Tensor candidate = at::tanh(inputs + at::matmul(states * reset, state_to_state));
    at::Tensor next_states = update * candidate + (1 - update) * states;

    if (mask.defined()) {
        const at::Tensor m = mask.unsqueeze(-1).to(next_states.dtype());
        next_states = m * next_states + (1 - m) * states;
    }
    return next_states;
}

at::Tensor GatedRecurrentImpl::forward(const at::Tensor &inputs,
                                       const at::Tensor &gate_inputs,
                                       const at::Tensor &mask,
                                       const at::Tensor &initial_states_,
                                       const bool reverse) {
    utils::check_rank(inputs, 3, "inputs");
    utils::check_rank(gate_inputs, 3, "gate_inputs");
    if ((inputs.size(0) != gate_inputs.size(0)) || (inputs.size(1) != gate_inputs.size(1)) ||
        (inputs.size(2) != dim) || (gate_inputs.size(2) != 2 * dim)) {
        throw ShapeMismatchError("GatedRecurrent input shapes do not match: inputs [" +
                                 utils::tensor_shape_as_string(inputs) + "], gate_inputs [" +
                                 utils::tensor_shape_as_string(gate_inputs) +
                                 "], dim = " + std::to_string(dim));
    }
    if (mask.defined()) {
        utils::check_mask_matches(inputs, mask, "inputs", "mask");
    }

    const int64_t num_steps = inputs.size(0);
    const int64_t batch_size = inputs.size(1);

    at::Tensor states = initial_states_.defined() ? initial_states_ : initial_states(batch_size);
    if ((states.dim() != 2) || (states.size(0) != batch_size) || (states.size(1) != dim)) {
        throw ShapeMismatchError("GatedRecurrent initial states have shape [" +
                                 utils::tensor_shape_as_string(states) + "], expected [" +
                                 std::to_string(batch_size) + ", " + std::to_string(dim) + "].");
    }

    std::vector<at::Tensor> outputs(num_steps);
    for (int64_t i = 0; i < num_steps; ++i) {
        const int64_t t = reverse ? (num_steps - 1 - i) : i;
        const at::Tensor step_mask = mask.defined() ? mask[t] : at::Tensor{};
        states = step(inputs[t], gate_inputs[t], states, step_mask);
        outputs[t] = states;
    }

    if (num_steps == 0) {
        return at::empty({0, batch_size, dim}, inputs.options());
    }
    return at::stack(outputs, 0);
}

at::Tensor GatedRecurrentImpl::initial_states(const int64_t batch_size) const {
    if (!initial_state.defined()) {
        throw ConfigurationError(
                "GatedRecurrent was constructed without a learned initial state; initial states "
                "must be provided by the caller.");
    }
    return initial_state.unsqueeze(0).expand({batch_size, dim});
}

GRUInitialStateImpl::GRUInitialStateImpl(const int64_t dim_, const int64_t attended_state_dim_)
        : dim(dim_), attended_state_dim(attended_state_dim_) {
    transition = register_module("transition", GatedRecurrent(dim, false));
    initializer = register_module("initializer", torch::nn::Linear(attended_state_dim, dim));
}

at::Tensor GRUInitialStateImpl::initial_states(const at::Tensor &representation) {
    utils::check_rank(representation, 3, "representation");
    if (representation.size(2) != 2 * attended_state_dim) {
        throw ShapeMismatchError("Representation feature size " +
                                 std::to_string(representation.size(2)) + " does not match 2 * " +
                                 std::to_string(attended_state_dim) + ".");
    }
    if (representation.size(0) == 0) {
        throw ShapeMismatchError("Cannot compute the initial decoder state of an empty source.");
    }
    const at::Tensor backward_first =
            representation.index({0, Slice(), Slice(attended_state_dim, 2 * attended_state_dim)});
    return at::tanh(initializer(backward_first));
}

at::Tensor GRUInitialStateImpl::step(const RecurrentInputs &inputs,
                                     const at::Tensor &states,
                                     const at::Tensor &mask) {
    return transition->step(inputs.inputs, inputs.gate_inputs, states, mask);
}

}  // namespace rnnsearch::nn
