#include "nn/Bidirectional.h"
#include "nn/GatedRecurrent.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <catch2/catch_test_macros.hpp>
#include <torch/torch.h>

#define TEST_GROUP "[GatedRecurrent]"

using namespace rnnsearch;

CATCH_TEST_CASE(TEST_GROUP " step blends previous and candidate state", TEST_GROUP) {
    torch::manual_seed(0);
    nn::GatedRecurrent gru(3, true);

    const at::Tensor states = torch::randn({2, 3});
    const at::Tensor inputs = torch::randn({2, 3});

    CATCH_SECTION("Saturated update gate keeps the previous state") {
        const at::Tensor gate_inputs = at::cat({at::full({2, 3}, -1e4f), at::zeros({2, 3})}, 1);
        const at::Tensor next = gru->step(inputs, gate_inputs, states, at::Tensor{});
        CATCH_CHECK(at::allclose(next, states));
    }

    CATCH_SECTION("Fully open update gate returns the candidate") {
        const at::Tensor gate_inputs = at::cat({at::full({2, 3}, 1e4f), at::full({2, 3}, 1e4f)}, 1);
        const at::Tensor next = gru->step(inputs, gate_inputs, states, at::Tensor{});
        const at::Tensor expected = at::tanh(inputs + at::matmul(states, gru->state_to_state));
        CATCH_CHECK(at::allclose(next, expected, 1e-5, 1e-6));
    }

    CATCH_SECTION("Masked items are not updated") {
        const at::Tensor gate_inputs = torch::randn({2, 6});
        const at::Tensor mask = torch::tensor({1.0f, 0.0f});
        const at::Tensor next = gru->step(inputs, gate_inputs, states, mask);
        CATCH_CHECK(at::equal(next[1], states[1]));
        CATCH_CHECK_FALSE(at::equal(next[0], states[0]));
    }
}

CATCH_TEST_CASE(TEST_GROUP " transition matrices are orthogonal", TEST_GROUP) {
    nn::GatedRecurrent gru(5, true);
    const at::Tensor eye = at::eye(5);

    CATCH_CHECK(at::allclose(at::matmul(gru->state_to_state, gru->state_to_state.t()), eye, 1e-4,
                             1e-5));
    for (int64_t block = 0; block < 2; ++block) {
        const at::Tensor w = gru->state_to_gates.narrow(1, block * 5, 5);
        CATCH_CHECK(at::allclose(at::matmul(w, w.t()), eye, 1e-4, 1e-5));
    }
    CATCH_CHECK(at::equal(gru->initial_state, at::zeros({5})));
}

CATCH_TEST_CASE(TEST_GROUP " scan over a sequence", TEST_GROUP) {
    torch::manual_seed(1);
    nn::GatedRecurrent gru(4, true);
    const at::Tensor inputs = torch::randn({5, 3, 4});
    const at::Tensor gate_inputs = torch::randn({5, 3, 8});

    CATCH_SECTION("Output shape") {
        const at::Tensor out = gru(inputs, gate_inputs, at::ones({5, 3}), at::Tensor{}, false);
        CATCH_CHECK(out.sizes() == at::IntArrayRef({5, 3, 4}));
    }

    CATCH_SECTION("Reverse scan equals forward scan over the flipped sequence") {
        const at::Tensor reversed = gru(inputs, gate_inputs, at::ones({5, 3}), at::Tensor{}, true);
        const at::Tensor flipped =
                gru(inputs.flip(0), gate_inputs.flip(0), at::ones({5, 3}), at::Tensor{}, false);
        CATCH_CHECK(at::allclose(reversed, flipped.flip(0)));
    }

    CATCH_SECTION("Zero-length item keeps the initial state everywhere") {
        at::Tensor mask = at::ones({5, 3});
        mask.select(1, 2).zero_();
        const at::Tensor out = gru(inputs, gate_inputs, mask, at::Tensor{}, true);
        const at::Tensor expected = gru->initial_states(3)[2].unsqueeze(0).expand({5, 4});
        CATCH_CHECK(at::equal(out.select(1, 2), expected));
    }

    CATCH_SECTION("Mismatched gate inputs throw") {
        CATCH_CHECK_THROWS_AS(
                gru(inputs, torch::randn({5, 3, 7}), at::ones({5, 3}), at::Tensor{}, false),
                ShapeMismatchError);
    }

    CATCH_SECTION("Mismatched mask throws") {
        CATCH_CHECK_THROWS_AS(gru(inputs, gate_inputs, at::ones({4, 3}), at::Tensor{}, false),
                              ShapeMismatchError);
    }
}

CATCH_TEST_CASE(TEST_GROUP " decoder initial state", TEST_GROUP) {
    torch::manual_seed(2);
    nn::GRUInitialState transition(6, 4);

    CATCH_SECTION("Computed from the backward half at position 0") {
        const at::Tensor representation = torch::randn({3, 2, 8});
        const at::Tensor state = transition->initial_states(representation);
        CATCH_CHECK(state.sizes() == at::IntArrayRef({2, 6}));

        const at::Tensor backward_first = representation[0].narrow(1, 4, 4);
        const at::Tensor expected = at::tanh(transition->initializer(backward_first));
        CATCH_CHECK(at::allclose(state, expected));
    }

    CATCH_SECTION("Does not depend on forward features or later positions") {
        const at::Tensor representation = torch::randn({3, 2, 8});
        at::Tensor modified = representation.clone();
        modified.narrow(2, 0, 4).fill_(7.0f);
        modified.narrow(0, 1, 2).fill_(-3.0f);
        CATCH_CHECK(at::equal(transition->initial_states(representation),
                              transition->initial_states(modified)));
    }

    CATCH_SECTION("Wrong feature size throws") {
        CATCH_CHECK_THROWS_AS(transition->initial_states(torch::randn({3, 2, 6})),
                              ShapeMismatchError);
    }

    CATCH_SECTION("No learned initial state to fall back to") {
        CATCH_CHECK_THROWS_AS(transition->transition->initial_states(2), ConfigurationError);
    }
}

CATCH_TEST_CASE(TEST_GROUP " bidirectional concatenation", TEST_GROUP) {
    torch::manual_seed(3);
    nn::Bidirectional bidir(3, 4);
    const at::Tensor x = torch::randn({6, 2, 3});

    const at::Tensor out = bidir(x, at::ones({6, 2}));
    CATCH_CHECK(out.sizes() == at::IntArrayRef({6, 2, 8}));

    // Only the backward half of the first position sees the whole sequence.
    at::Tensor changed = x.clone();
    changed[5].fill_(4.0f);
    const at::Tensor out_changed = bidir(changed, at::ones({6, 2}));
    CATCH_CHECK(at::equal(out[0].narrow(1, 0, 4), out_changed[0].narrow(1, 0, 4)));
    CATCH_CHECK_FALSE(at::equal(out[0].narrow(1, 4, 4), out_changed[0].narrow(1, 4, 4)));
}
