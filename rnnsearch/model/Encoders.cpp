#include "model/Encoders.h"

#include "torch_utils/tensor_utils.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <spdlog/spdlog.h>
#include <torch/nn/options/embedding.h>

namespace rnnsearch::model {

namespace {

// Batch-major mask to the time-major float mask the recurrent layers expect.
at::Tensor time_major_mask(const at::Tensor& mask) { return mask.t().to(at::kFloat); }

void check_token_sequence(const at::Tensor& tokens,
                          const at::Tensor& mask,
                          const std::string& tokens_name,
                          const std::string& mask_name) {
    utils::check_rank(tokens, 2, tokens_name);
    utils::check_mask_matches(tokens, mask, tokens_name, mask_name);
}

// Runs the second, word-level stage over frame (or phone) level embeddings.
at::Tensor reduce_to_words(nn::Bidirectional& bidir,
                           const at::Tensor& frame_embeddings,
                           const at::Tensor& words_ends,
                           const at::Tensor& words_ends_mask) {
    const at::Tensor word_embeddings = gather_word_positions(frame_embeddings, words_ends);
    return bidir(word_embeddings, time_major_mask(words_ends_mask));
}

}  // namespace

at::Tensor gather_word_positions(const at::Tensor& frames, const at::Tensor& ends) {
    utils::check_rank(frames, 3, "frames");
    utils::check_rank(ends, 2, "words_ends");
    if (ends.size(0) != frames.size(1)) {
        throw ShapeMismatchError("Batch size mismatch between frames [" +
                                 utils::tensor_shape_as_string(frames) + "] and words_ends [" +
                                 utils::tensor_shape_as_string(ends) + "].");
    }
    if ((ends.numel() > 0) &&
        ((ends.min().item<int64_t>() < 0) || (ends.max().item<int64_t>() >= frames.size(0)))) {
        throw ShapeMismatchError("Word boundary indices must lie in [0, " +
                                 std::to_string(frames.size(0)) + ").");
    }

    // [F, B, D] -> [B, F, D], gather along F, back to time-major.
    const at::Tensor batch_major = frames.transpose(0, 1);
    const at::Tensor index = ends.to(at::kLong).unsqueeze(-1).expand({-1, -1, frames.size(2)});
    return batch_major.gather(1, index).transpose(0, 1);
}

at::Tensor fuse_representations(const at::Tensor& words, const at::Tensor& audio) {
    if (!words.defined() || !audio.defined() || (words.sizes() != audio.sizes())) {
        throw ConfigurationError(
                "Cannot fuse word and audio representations with different shapes: [" +
                (words.defined() ? utils::tensor_shape_as_string(words) : "undefined") + "] vs [" +
                (audio.defined() ? utils::tensor_shape_as_string(audio) : "undefined") +
                "]. Both encoders must be aligned to the same word positions.");
    }
    return at::maximum(words, audio);
}

WordEncoderImpl::WordEncoderImpl(const int64_t vocab_size,
                                 const int64_t embedding_dim,
                                 const int64_t state_dim)
        : m_lookup(torch::nn::EmbeddingOptions(vocab_size, embedding_dim)),
          m_bidir(embedding_dim, state_dim) {
    register_module("lookup", m_lookup);
    register_module("bidir", m_bidir);
}

at::Tensor WordEncoderImpl::forward(const at::Tensor& words, const at::Tensor& words_mask) {
    check_token_sequence(words, words_mask, "words", "words_mask");

    const at::Tensor embeddings = m_lookup(words.t());
    return m_bidir(embeddings, time_major_mask(words_mask));
}

AudioEncoderImpl::AudioEncoderImpl(const int64_t feature_size, const int64_t state_dim)
        : m_feature_size{feature_size},
          m_embedding(feature_size, state_dim),
          m_bidir(2 * state_dim, state_dim) {
    register_module("embedding", m_embedding);
    register_module("bidir", m_bidir);
}

at::Tensor AudioEncoderImpl::forward(const at::Tensor& audio,
                                     const at::Tensor& audio_mask,
                                     const at::Tensor& words_ends,
                                     const at::Tensor& words_ends_mask) {
    utils::check_rank(audio, 3, "audio");
    utils::check_mask_matches(audio, audio_mask, "audio", "audio_mask");
    check_token_sequence(words_ends, words_ends_mask, "words_ends", "words_ends_mask");
    if (audio.size(2) != m_feature_size) {
        throw ShapeMismatchError("Audio features have shape [" +
                                 utils::tensor_shape_as_string(audio) + "], expected " +
                                 std::to_string(m_feature_size) + " features per frame.");
    }

    const at::Tensor frames = audio.transpose(0, 1).to(at::kFloat);
    const at::Tensor frame_embeddings = m_embedding(frames, time_major_mask(audio_mask));

    spdlog::trace("[AudioEncoder] frame embeddings: {}",
                  utils::print_size(frame_embeddings, "frame_embeddings"));

    return reduce_to_words(m_bidir, frame_embeddings, words_ends, words_ends_mask);
}

PhonesEncoderImpl::PhonesEncoderImpl(const int64_t vocab_size,
                                     const int64_t embedding_dim,
                                     const int64_t state_dim)
        : m_lookup(torch::nn::EmbeddingOptions(vocab_size, embedding_dim)),
          m_embedding(embedding_dim, state_dim),
          m_bidir(2 * state_dim, state_dim) {
    register_module("lookup", m_lookup);
    register_module("embedding", m_embedding);
    register_module("bidir", m_bidir);
}

at::Tensor PhonesEncoderImpl::forward(const at::Tensor& phones,
                                      const at::Tensor& phones_mask,
                                      const at::Tensor& words_ends,
                                      const at::Tensor& words_ends_mask) {
    check_token_sequence(phones, phones_mask, "phones", "phones_mask");
    check_token_sequence(words_ends, words_ends_mask, "phones_words_ends",
                         "phones_words_ends_mask");

    const at::Tensor embeddings = m_lookup(phones.t());
    const at::Tensor phone_embeddings = m_embedding(embeddings, time_major_mask(phones_mask));

    return reduce_to_words(m_bidir, phone_embeddings, words_ends, words_ends_mask);
}

}  // namespace rnnsearch::model
