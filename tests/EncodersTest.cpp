#include "TestUtils.h"
#include "model/Encoders.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <catch2/catch_test_macros.hpp>
#include <torch/torch.h>

#define TEST_GROUP "[Encoders]"

using namespace rnnsearch;
using rnnsearch::tests::make_mask;
using rnnsearch::tests::random_tokens;

CATCH_TEST_CASE(TEST_GROUP " word encoder", TEST_GROUP) {
    torch::manual_seed(10);
    model::WordEncoder encoder(10, 4, 8);

    const at::Tensor words = random_tokens(2, 5, 10);
    const at::Tensor mask = make_mask({3, 5}, 5);

    CATCH_SECTION("Time-major representation of both directions") {
        const at::Tensor representation = encoder(words, mask);
        CATCH_CHECK(representation.sizes() == at::IntArrayRef({5, 2, 16}));
    }

    CATCH_SECTION("Padded tokens do not change valid positions") {
        const at::Tensor representation = encoder(words, mask);

        at::Tensor other_words = words.clone();
        other_words[0].narrow(0, 3, 2).copy_((words[0].narrow(0, 3, 2) + 1).remainder(10));
        const at::Tensor other = encoder(other_words, mask);

        CATCH_CHECK(at::allclose(representation.narrow(0, 0, 3).select(1, 0),
                                 other.narrow(0, 0, 3).select(1, 0)));
        CATCH_CHECK(at::allclose(representation.select(1, 1), other.select(1, 1)));
    }

    CATCH_SECTION("Appended padding does not change valid positions") {
        const at::Tensor representation = encoder(words, mask);
        const at::Tensor longer_words = at::cat({words, random_tokens(2, 3, 10)}, 1);
        const at::Tensor longer = encoder(longer_words, make_mask({3, 5}, 8));

        CATCH_CHECK(longer.sizes() == at::IntArrayRef({8, 2, 16}));
        CATCH_CHECK(at::allclose(representation.narrow(0, 0, 3).select(1, 0),
                                 longer.narrow(0, 0, 3).select(1, 0)));
        CATCH_CHECK(at::allclose(representation.select(1, 1), longer.narrow(0, 0, 5).select(1, 1)));
    }

    CATCH_SECTION("Empty item stays at the initial state") {
        const at::Tensor representation = encoder(words, make_mask({0, 5}, 5));
        CATCH_CHECK(at::equal(representation.select(1, 0), at::zeros({5, 16})));
    }

    CATCH_SECTION("Mask shape must match the words") {
        CATCH_CHECK_THROWS_AS(encoder(words, make_mask({3, 4}, 4)), ShapeMismatchError);
        CATCH_CHECK_THROWS_AS(encoder(words, make_mask({3, 5, 5}, 5)), ShapeMismatchError);
    }
}

CATCH_TEST_CASE(TEST_GROUP " audio encoder reduces frames to words", TEST_GROUP) {
    torch::manual_seed(11);
    model::AudioEncoder encoder(6, 8);

    const at::Tensor audio = torch::randn({2, 12, 6});
    const at::Tensor audio_mask = make_mask({12, 9}, 12);
    const at::Tensor words_ends = torch::tensor({2, 7, 11, 3, 8, 8}, at::kLong).view({2, 3});
    const at::Tensor words_ends_mask = make_mask({3, 2}, 3);

    CATCH_SECTION("Word-level representation") {
        const at::Tensor representation = encoder(audio, audio_mask, words_ends, words_ends_mask);
        CATCH_CHECK(representation.sizes() == at::IntArrayRef({3, 2, 16}));
    }

    CATCH_SECTION("Padded frames do not change the representation") {
        const at::Tensor representation = encoder(audio, audio_mask, words_ends, words_ends_mask);
        at::Tensor other_audio = audio.clone();
        other_audio[1].narrow(0, 9, 3).fill_(3.0f);
        const at::Tensor other = encoder(other_audio, audio_mask, words_ends, words_ends_mask);
        CATCH_CHECK(at::allclose(representation, other));
    }

    CATCH_SECTION("Wrong feature size throws") {
        CATCH_CHECK_THROWS_AS(
                encoder(torch::randn({2, 12, 5}), audio_mask, words_ends, words_ends_mask),
                ShapeMismatchError);
    }

    CATCH_SECTION("Word ends outside the frame range throw") {
        const at::Tensor bad_ends = torch::tensor({2, 7, 12, 3, 8, 8}, at::kLong).view({2, 3});
        CATCH_CHECK_THROWS_AS(encoder(audio, audio_mask, bad_ends, words_ends_mask),
                              ShapeMismatchError);
    }
}

CATCH_TEST_CASE(TEST_GROUP " phones encoder reduces phones to words", TEST_GROUP) {
    torch::manual_seed(12);
    model::PhonesEncoder encoder(10, 4, 8);

    const at::Tensor phones = random_tokens(2, 7, 10);
    const at::Tensor phones_mask = make_mask({7, 5}, 7);
    const at::Tensor words_ends = torch::tensor({1, 4, 6, 2, 4, 4}, at::kLong).view({2, 3});
    const at::Tensor words_ends_mask = make_mask({3, 2}, 3);

    const at::Tensor representation = encoder(phones, phones_mask, words_ends, words_ends_mask);
    CATCH_CHECK(representation.sizes() == at::IntArrayRef({3, 2, 16}));
    CATCH_CHECK(at::isfinite(representation).all().item<bool>());

    CATCH_CHECK_THROWS_AS(encoder(phones, make_mask({7, 5}, 6), words_ends, words_ends_mask),
                          ShapeMismatchError);
}

CATCH_TEST_CASE(TEST_GROUP " gather word positions", TEST_GROUP) {
    const at::Tensor frames = at::arange(4 * 2 * 3, at::kFloat).view({4, 2, 3});
    const at::Tensor ends = torch::tensor({3, 0, 1, 1}, at::kLong).view({2, 2});

    const at::Tensor gathered = model::gather_word_positions(frames, ends);
    CATCH_REQUIRE(gathered.sizes() == at::IntArrayRef({2, 2, 3}));
    CATCH_CHECK(at::equal(gathered[0][0], frames[3][0]));
    CATCH_CHECK(at::equal(gathered[1][0], frames[0][0]));
    CATCH_CHECK(at::equal(gathered[0][1], frames[1][1]));
    CATCH_CHECK(at::equal(gathered[1][1], frames[1][1]));

    CATCH_CHECK_THROWS_AS(
            model::gather_word_positions(frames, torch::tensor({-1, 0}, at::kLong).view({2, 1})),
            ShapeMismatchError);
    CATCH_CHECK_THROWS_AS(
            model::gather_word_positions(frames, torch::tensor({0, 1, 2}, at::kLong).view({3, 1})),
            ShapeMismatchError);
}

CATCH_TEST_CASE(TEST_GROUP " fuse representations", TEST_GROUP) {
    const at::Tensor words = torch::tensor({1.0f, -2.0f, 3.0f, 0.5f}).view({2, 1, 2});
    const at::Tensor audio = torch::tensor({0.0f, 4.0f, -1.0f, 0.5f}).view({2, 1, 2});

    const at::Tensor fused = model::fuse_representations(words, audio);
    CATCH_CHECK(at::equal(fused, torch::tensor({1.0f, 4.0f, 3.0f, 0.5f}).view({2, 1, 2})));

    CATCH_CHECK_THROWS_AS(model::fuse_representations(words, at::zeros({3, 1, 2})),
                          ConfigurationError);
    CATCH_CHECK_THROWS_AS(model::fuse_representations(words, at::Tensor{}), ConfigurationError);
}
