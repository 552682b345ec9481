#include "nn/Attention.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <catch2/catch_test_macros.hpp>
#include <torch/torch.h>

#include <limits>

#define TEST_GROUP "[Attention]"

using namespace rnnsearch;

CATCH_TEST_CASE(TEST_GROUP " masked softmax", TEST_GROUP) {
    const at::Tensor energies = torch::tensor({1.0f, 5.0f, 2.0f, -3.0f, 0.5f, 7.0f}).view({3, 2});

    CATCH_SECTION("Unmasked columns are a plain softmax") {
        const at::Tensor weights = nn::masked_softmax(energies, at::ones({3, 2}));
        CATCH_CHECK(at::allclose(weights, at::softmax(energies, 0)));
    }

    CATCH_SECTION("Masked positions get exactly zero weight") {
        const at::Tensor mask = torch::tensor({1.0f, 1.0f, 1.0f, 0.0f, 0.0f, 0.0f}).view({3, 2});
        const at::Tensor weights = nn::masked_softmax(energies, mask);

        CATCH_CHECK(weights[1][1].item<float>() == 0.0f);
        CATCH_CHECK(weights[2][1].item<float>() == 0.0f);
        CATCH_CHECK(weights[2][0].item<float>() == 0.0f);
        CATCH_CHECK(weights[0][1].item<float>() == 1.0f);
        CATCH_CHECK(at::allclose(weights.sum(0), at::ones({2}), 0.0, 1e-6));
    }

    CATCH_SECTION("Fully masked item throws") {
        const at::Tensor mask = torch::tensor({1.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f}).view({3, 2});
        CATCH_CHECK_THROWS_AS(nn::masked_softmax(energies, mask), DegenerateInputError);
    }

    CATCH_SECTION("Very negative energies stay normalised") {
        const at::Tensor low = at::full({3, 2}, -1e30f);
        const at::Tensor weights = nn::masked_softmax(low, at::ones({3, 2}));
        CATCH_CHECK(at::isfinite(weights).all().item<bool>());
        CATCH_CHECK(at::allclose(weights.sum(0), at::ones({2}), 0.0, 1e-6));
    }
}

CATCH_TEST_CASE(TEST_GROUP " sequence content attention", TEST_GROUP) {
    torch::manual_seed(20);
    nn::SequenceContentAttention attention(8, 16, 8);

    const at::Tensor state = torch::randn({3, 8});
    const at::Tensor attended = torch::randn({5, 3, 16});
    at::Tensor mask = at::ones({5, 3});
    mask.narrow(0, 2, 3).select(1, 1).zero_();
    mask.narrow(0, 4, 1).select(1, 2).zero_();

    CATCH_SECTION("Weights form a distribution over the valid positions") {
        const nn::AttentionOutput output = attention(state, attended, mask);
        CATCH_REQUIRE(output.weights.sizes() == at::IntArrayRef({5, 3}));
        CATCH_REQUIRE(output.context.sizes() == at::IntArrayRef({3, 16}));

        CATCH_CHECK(output.weights.ge(0).all().item<bool>());
        CATCH_CHECK(at::allclose(output.weights.sum(0), at::ones({3}), 0.0, 1e-6));
        CATCH_CHECK(output.weights.masked_select(mask.eq(0)).eq(0).all().item<bool>());
    }

    CATCH_SECTION("Context is the weighted sum of the attended vectors") {
        const nn::AttentionOutput output = attention(state, attended, mask);
        const at::Tensor expected = (output.weights.unsqueeze(-1) * attended).sum(0);
        CATCH_CHECK(at::allclose(output.context, expected));
    }

    CATCH_SECTION("Preprocessed keys give the same result") {
        const nn::AttentionOutput output = attention(state, attended, mask);
        const nn::AttentionOutput cached =
                attention(state, attended, mask, attention->preprocess(attended));
        CATCH_CHECK(at::allclose(output.weights, cached.weights));
        CATCH_CHECK(at::allclose(output.context, cached.context));
    }

    CATCH_SECTION("Masked positions do not contribute") {
        const nn::AttentionOutput output = attention(state, attended, mask);
        at::Tensor other = attended.clone();
        other.narrow(0, 2, 3).select(1, 1).fill_(100.0f);
        const nn::AttentionOutput changed = attention(state, other, mask);
        CATCH_CHECK(at::allclose(output.context[1], changed.context[1]));
        CATCH_CHECK(at::allclose(output.weights.select(1, 1), changed.weights.select(1, 1)));
    }

    CATCH_SECTION("Fully masked item throws") {
        mask.select(1, 0).zero_();
        CATCH_CHECK_THROWS_AS(attention(state, attended, mask), DegenerateInputError);
    }

    CATCH_SECTION("Batch size mismatch throws") {
        CATCH_CHECK_THROWS_AS(attention(torch::randn({2, 8}), attended, mask),
                              ShapeMismatchError);
        CATCH_CHECK_THROWS_AS(attention(state, attended, at::ones({4, 3})), ShapeMismatchError);
    }
}
