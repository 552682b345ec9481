#include "torch_utils/torch_utils.h"

#include <torch/torch.h>

namespace rnnsearch::utils {

void initialise_torch() {
    // The recurrent scans issue many tiny ops per step. Letting torch spin up a thread per core for
    // each of them costs far more than it saves.
    torch::set_num_threads(1);

    // We don't want empty tensors to be initialised with data since we always overwrite them.
    torch::globalContext().setDeterministicFillUninitializedMemory(false);
}

void make_torch_deterministic() { torch::globalContext().setDeterministicAlgorithms(true, false); }

}  // namespace rnnsearch::utils
