#pragma once

#include <ATen/core/TensorBody.h>

#include <cstdint>
#include <iosfwd>
#include <string>

namespace rnnsearch::utils {

// Helper function to print tensor size.
std::string print_size(const at::Tensor& t, const std::string& name);

/// \brief Prints the tensor size to a stream.
void print_tensor_shape(std::ostream& os, const at::Tensor& tensor, const std::string& delimiter);

/// \brief Returns a string containing the input tensor size. Similar to print_size but less verbose.
std::string tensor_shape_as_string(const at::Tensor& tensor);

/**
 * \brief Throws ShapeMismatchError if the tensor is undefined or its rank differs from `dim`.
 * \param name Used in the error message only.
 */
void check_rank(const at::Tensor& t, int64_t dim, const std::string& name);

/**
 * \brief Throws ShapeMismatchError unless `mask` has exactly the sizes of the first two
 *          dimensions of `data`. Both are expected to share the same layout (batch-major or time-major).
 */
void check_mask_matches(const at::Tensor& data,
                        const at::Tensor& mask,
                        const std::string& data_name,
                        const std::string& mask_name);

}  // namespace rnnsearch::utils
