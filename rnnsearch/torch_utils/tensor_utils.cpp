#include "torch_utils/tensor_utils.h"

#include "utils/errors.h"

#include <ATen/ATen.h>

#include <ostream>
#include <sstream>

namespace rnnsearch::utils {

std::string print_size(const at::Tensor& t, const std::string& name) {
    std::stringstream ss;
    ss << name << " tensor size: [";
    for (int i = 0; i < t.dim(); i++) {
        ss << t.size(i);
        if (i + 1 < t.dim()) {
            ss << ", ";
        }
    }
    ss << "] dtype: " << t.dtype();
    return ss.str();
}

void print_tensor_shape(std::ostream& os, const at::Tensor& tensor, const std::string& delimiter) {
    for (size_t i = 0; i < std::size(tensor.sizes()); ++i) {
        if (i > 0) {
            os << delimiter;
        }
        os << tensor.size(i);
    }
}

std::string tensor_shape_as_string(const at::Tensor& tensor) {
    std::ostringstream oss;
    print_tensor_shape(oss, tensor, ", ");
    return oss.str();
}

void check_rank(const at::Tensor& t, const int64_t dim, const std::string& name) {
    if (!t.defined()) {
        throw ShapeMismatchError("Tensor '" + name + "' is undefined.");
    }
    if (t.dim() != dim) {
        throw ShapeMismatchError("Tensor '" + name + "' must have " + std::to_string(dim) +
                                 " dimensions, got shape [" + tensor_shape_as_string(t) + "].");
    }
}

void check_mask_matches(const at::Tensor& data,
                        const at::Tensor& mask,
                        const std::string& data_name,
                        const std::string& mask_name) {
    check_rank(mask, 2, mask_name);
    if (!data.defined() || (data.dim() < 2)) {
        throw ShapeMismatchError("Tensor '" + data_name + "' must have at least 2 dimensions.");
    }
    if ((data.size(0) != mask.size(0)) || (data.size(1) != mask.size(1))) {
        throw ShapeMismatchError("Shape mismatch between '" + data_name + "' [" +
                                 tensor_shape_as_string(data) + "] and '" + mask_name + "' [" +
                                 tensor_shape_as_string(mask) + "].");
    }
}

}  // namespace rnnsearch::utils
