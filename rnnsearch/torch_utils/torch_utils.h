#pragma once

namespace rnnsearch::utils {

void initialise_torch();
void make_torch_deterministic();

}  // namespace rnnsearch::utils
