#include "model/initialization.h"

#include "torch_utils/tensor_utils.h"

#include <ATen/ATen.h>
#include <ATen/CPUGeneratorImpl.h>
#include <spdlog/spdlog.h>
#include <torch/utils.h>

#include <string>
#include <string_view>

namespace rnnsearch::model {

namespace {

enum class InitType {
    ORTHOGONAL,
    ORTHOGONAL_BLOCKS,
    ZERO,
    GAUSSIAN,
};

InitType init_type_for(const std::string& name) {
    const size_t pos = name.rfind('.');
    const std::string_view leaf = (pos == std::string::npos)
                                          ? std::string_view(name)
                                          : std::string_view(name).substr(pos + 1);
    if (leaf == "state_to_state") {
        return InitType::ORTHOGONAL;
    } else if (leaf == "state_to_gates") {
        return InitType::ORTHOGONAL_BLOCKS;
    } else if ((leaf == "bias") || (leaf == "maxout_bias") || (leaf == "initial_state")) {
        return InitType::ZERO;
    }
    return InitType::GAUSSIAN;
}

// Same construction as torch::nn::init::orthogonal_, but drawing from the given generator.
at::Tensor make_orthogonal(const int64_t rows,
                           const int64_t cols,
                           const std::optional<at::Generator>& generator,
                           const at::TensorOptions& options) {
    at::Tensor flattened = at::randn({rows, cols}, generator, options);
    if (rows < cols) {
        flattened.t_();
    }
    auto [q, r] = at::linalg_qr(flattened);
    q *= at::diagonal(r, 0, -2, -1).sign();
    if (rows < cols) {
        q.t_();
    }
    return q;
}

}  // namespace

void initialize_parameters(torch::nn::Module& module,
                           const float weight_scale,
                           const std::optional<uint64_t>& seed) {
    torch::NoGradGuard no_grad;

    std::optional<at::Generator> generator;
    if (seed) {
        generator = at::detail::createCPUGenerator(*seed);
    }

    for (auto& param : module.named_parameters(true)) {
        at::Tensor& value = param.value();
        const InitType type = init_type_for(param.key());

        switch (type) {
        case InitType::ORTHOGONAL:
            value.copy_(make_orthogonal(value.size(0), value.size(1), generator, value.options()));
            break;
        case InitType::ORTHOGONAL_BLOCKS: {
            const int64_t dim = value.size(0);
            const at::Tensor update = make_orthogonal(dim, dim, generator, value.options());
            const at::Tensor reset = make_orthogonal(dim, dim, generator, value.options());
            value.copy_(at::cat({update, reset}, 1));
            break;
        }
        case InitType::ZERO:
            value.zero_();
            break;
        case InitType::GAUSSIAN:
            value.normal_(0.0, weight_scale, generator);
            break;
        }

        spdlog::trace("[initialize_parameters] {} [{}]", param.key(),
                      utils::tensor_shape_as_string(value));
    }
}

}  // namespace rnnsearch::model
