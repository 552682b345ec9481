#include "model/Decoder.h"

#include "torch_utils/tensor_utils.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <ATen/CPUGeneratorImpl.h>
#include <spdlog/spdlog.h>
#include <torch/utils.h>

#include <vector>

namespace rnnsearch::model {

DecoderImpl::DecoderImpl(const int64_t vocab_size,
                         const int64_t embedding_dim,
                         const int64_t state_dim,
                         const int64_t encoder_state_dim)
        : m_vocab_size{vocab_size},
          m_embedding_dim{embedding_dim},
          m_state_dim{state_dim},
          m_encoder_state_dim{encoder_state_dim},
          m_transition(state_dim, encoder_state_dim),
          m_attention(state_dim, 2 * encoder_state_dim, state_dim),
          m_readout(state_dim, 2 * encoder_state_dim, embedding_dim, vocab_size),
          m_fork(embedding_dim, state_dim),
          m_distribute(2 * encoder_state_dim, state_dim) {
    register_module("transition", m_transition);
    register_module("attention", m_attention);
    register_module("readout", m_readout);
    register_module("fork", m_fork);
    register_module("distribute", m_distribute);
}

at::Tensor DecoderImpl::check_source(const at::Tensor& representation,
                                     const at::Tensor& source_mask) const {
    utils::check_rank(representation, 3, "representation");
    if (representation.size(2) != 2 * m_encoder_state_dim) {
        throw ShapeMismatchError("Representation has shape [" +
                                 utils::tensor_shape_as_string(representation) + "], expected " +
                                 std::to_string(2 * m_encoder_state_dim) + " features.");
    }
    if (!source_mask.defined()) {
        return at::ones({representation.size(0), representation.size(1)},
                        representation.options());
    }
    utils::check_rank(source_mask, 2, "source_mask");
    const at::Tensor mask = source_mask.t().to(representation.dtype());
    utils::check_mask_matches(representation, mask, "representation", "source_mask");
    return mask;
}

nn::RecurrentInputs DecoderImpl::transition_inputs(const nn::RecurrentInputs& feedback_inputs,
                                                   const at::Tensor& glimpse) {
    const nn::RecurrentInputs distributed = m_distribute(glimpse);
    return {feedback_inputs.inputs + distributed.inputs,
            feedback_inputs.gate_inputs + distributed.gate_inputs};
}

at::Tensor DecoderImpl::cost_matrix(const at::Tensor& representation,
                                    const at::Tensor& source_mask,
                                    const at::Tensor& target,
                                    const at::Tensor& target_mask) {
    const at::Tensor attended_mask = check_source(representation, source_mask);
    utils::check_rank(target, 2, "target");
    utils::check_mask_matches(target, target_mask, "target", "target_mask");
    if (target.size(0) != representation.size(1)) {
        throw ShapeMismatchError("Batch size mismatch between representation [" +
                                 utils::tensor_shape_as_string(representation) + "] and target [" +
                                 utils::tensor_shape_as_string(target) + "].");
    }

    // Time-major from here on.
    const at::Tensor outputs = target.t().to(at::kLong);
    const at::Tensor mask = target_mask.t().to(representation.dtype());
    const int64_t num_steps = outputs.size(0);
    const int64_t batch_size = outputs.size(1);

    const at::Tensor preprocessed = m_attention->preprocess(representation);
    const at::Tensor feedback = m_readout->feedback(outputs, batch_size);  // [T, B, E]
    const nn::RecurrentInputs feedback_inputs = m_fork(feedback);

    at::Tensor states = m_transition->initial_states(representation);

    std::vector<at::Tensor> costs;
    costs.reserve(num_steps);
    for (int64_t t = 0; t < num_steps; ++t) {
        const nn::AttentionOutput glimpse =
                m_attention(states, representation, attended_mask, preprocessed);

        const at::Tensor prev_feedback = (t == 0) ? m_readout->feedback(std::nullopt, batch_size)
                                                  : feedback[t - 1];
        const at::Tensor logits = m_readout(states, glimpse.context, prev_feedback);
        costs.emplace_back(m_readout->cost(logits, outputs[t]));

        // The state after the last target is never read.
        if ((t + 1) < num_steps) {
            const nn::RecurrentInputs step_inputs = transition_inputs(
                    {feedback_inputs.inputs[t], feedback_inputs.gate_inputs[t]}, glimpse.context);
            states = m_transition->step(step_inputs, states, mask[t]);
        }
    }

    if (costs.empty()) {
        return at::zeros({0, batch_size}, representation.options());
    }
    return at::stack(costs, 0);
}

at::Tensor DecoderImpl::cost(const at::Tensor& representation,
                             const at::Tensor& source_mask,
                             const at::Tensor& target,
                             const at::Tensor& target_mask) {
    const at::Tensor costs = cost_matrix(representation, source_mask, target, target_mask);
    const at::Tensor mask = target_mask.t().to(costs.dtype());
    return (costs * mask).sum() / static_cast<double>(target.size(0));
}

GenerationResult DecoderImpl::generate(const at::Tensor& representation,
                                       const GenerationOptions& options,
                                       const at::Tensor& source_mask) {
    torch::NoGradGuard no_grad;

    const at::Tensor attended_mask = check_source(representation, source_mask);
    const int64_t source_length = representation.size(0);
    const int64_t batch_size = representation.size(1);
    const int64_t num_steps = 2 * source_length;

    std::optional<at::Generator> generator;
    if (options.seed) {
        generator = at::detail::createCPUGenerator(*options.seed);
    }

    spdlog::trace("[Decoder] generating {} steps for batch of {}", num_steps, batch_size);

    const at::Tensor preprocessed = m_attention->preprocess(representation);
    at::Tensor states = m_transition->initial_states(representation);
    std::optional<at::Tensor> prev_outputs;

    std::vector<at::Tensor> outputs, costs, weights;
    outputs.reserve(num_steps);
    costs.reserve(num_steps);
    weights.reserve(num_steps);

    for (int64_t step = 0; step < num_steps; ++step) {
        const nn::AttentionOutput glimpse =
                m_attention(states, representation, attended_mask, preprocessed);
        const at::Tensor logits = m_readout(states, glimpse.context,
                                            m_readout->feedback(prev_outputs, batch_size));

        const at::Tensor next_outputs = m_readout->emit(logits, options.emit, generator);
        costs.emplace_back(m_readout->cost(logits, next_outputs));
        outputs.emplace_back(next_outputs);
        weights.emplace_back(glimpse.weights);

        const nn::RecurrentInputs step_inputs = transition_inputs(
                m_fork(m_readout->feedback(next_outputs, batch_size)), glimpse.context);
        states = m_transition->step(step_inputs, states, at::Tensor{});
        prev_outputs = next_outputs;
    }

    return {at::stack(outputs, 0), at::stack(costs, 0), at::stack(weights, 0)};
}

}  // namespace rnnsearch::model
