#include "model/ParameterReport.h"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace rnnsearch::model {

ParameterReport report_parameters(const torch::nn::Module& module) {
    ParameterReport report;
    std::unordered_set<const void*> seen;

    for (const auto& param : module.named_parameters(true)) {
        const at::Tensor& value = param.value();
        if (!seen.emplace(value.unsafeGetTensorImpl()).second) {
            continue;
        }
        ParameterEntry entry;
        entry.name = param.key();
        entry.shape = value.sizes().vec();
        entry.num_elements = value.numel();
        report.total += entry.num_elements;
        report.entries.emplace_back(std::move(entry));
    }

    return report;
}

void log_parameter_report(const ParameterReport& report) {
    spdlog::info("Parameter names: ");
    for (const ParameterEntry& entry : report.entries) {
        std::string shape = "(";
        for (size_t i = 0; i < std::size(entry.shape); ++i) {
            shape += ((i > 0) ? ", " : "") + std::to_string(entry.shape[i]);
        }
        shape += ")";
        spdlog::info("    {:15}: {}", shape, entry.name);
    }
    spdlog::info("Total number of parameters: {}", report.total);
}

}  // namespace rnnsearch::model
