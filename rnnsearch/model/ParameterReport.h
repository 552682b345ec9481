#pragma once

#include <torch/nn/module.h>

#include <cstdint>
#include <string>
#include <vector>

namespace rnnsearch::model {

struct ParameterEntry {
    std::string name;
    std::vector<int64_t> shape;
    int64_t num_elements = 0;
};

struct ParameterReport {
    std::vector<ParameterEntry> entries;
    int64_t total = 0;
};

/**
 * \brief Collects the named parameters of a module tree.
 *
 * A tensor reachable under several names (a submodule registered twice, or a tied weight) is
 * listed and counted once, under the first name encountered.
 */
ParameterReport report_parameters(const torch::nn::Module& module);

// Logs one line per parameter (shape and name) followed by the total count.
void log_parameter_report(const ParameterReport& report);

}  // namespace rnnsearch::model
