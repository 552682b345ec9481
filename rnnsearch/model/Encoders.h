#pragma once

#include "nn/Bidirectional.h"

#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/embedding.h>
#include <torch/nn/pimpl.h>

#include <cstdint>

namespace rnnsearch::model {

/**
 * \brief Word-level encoder: token lookup followed by one bidirectional pass.
 *
 * Inputs are batch-major as delivered by the batching code, the representation is time-major.
 *   words: [B, T] int64, words_mask: [B, T]  ->  [T, B, 2 * state_dim]
 */
class WordEncoderImpl : public torch::nn::Module {
public:
    WordEncoderImpl(int64_t vocab_size, int64_t embedding_dim, int64_t state_dim);

    at::Tensor forward(const at::Tensor& words, const at::Tensor& words_mask);

private:
    torch::nn::Embedding m_lookup{nullptr};
    nn::Bidirectional m_bidir{nullptr};
};
TORCH_MODULE(WordEncoder);

/**
 * \brief Audio encoder with a frame-to-word reduction.
 *
 * A frame-level bidirectional pass over linear-projected feature vectors produces frame-rate
 * embeddings. These are picked at the last frame of every word and fed through a second,
 * word-level bidirectional pass.
 *   audio: [B, F, feature_size], audio_mask: [B, F]
 *   words_ends: [B, W] int64 frame indices, words_ends_mask: [B, W]
 *   -> [W, B, 2 * state_dim]
 */
class AudioEncoderImpl : public torch::nn::Module {
public:
    AudioEncoderImpl(int64_t feature_size, int64_t state_dim);

    at::Tensor forward(const at::Tensor& audio,
                       const at::Tensor& audio_mask,
                       const at::Tensor& words_ends,
                       const at::Tensor& words_ends_mask);

private:
    int64_t m_feature_size = 0;
    nn::Bidirectional m_embedding{nullptr};
    nn::Bidirectional m_bidir{nullptr};
};
TORCH_MODULE(AudioEncoder);

/**
 * \brief Phone-level encoder with a phone-to-word reduction. Same two-stage structure as the
 *          audio encoder, but the first stage runs over looked-up phone embeddings.
 *   phones: [B, P] int64, phones_mask: [B, P]
 *   words_ends: [B, W] int64 phone indices, words_ends_mask: [B, W]
 *   -> [W, B, 2 * state_dim]
 */
class PhonesEncoderImpl : public torch::nn::Module {
public:
    PhonesEncoderImpl(int64_t vocab_size, int64_t embedding_dim, int64_t state_dim);

    at::Tensor forward(const at::Tensor& phones,
                       const at::Tensor& phones_mask,
                       const at::Tensor& words_ends,
                       const at::Tensor& words_ends_mask);

private:
    torch::nn::Embedding m_lookup{nullptr};
    nn::Bidirectional m_embedding{nullptr};
    nn::Bidirectional m_bidir{nullptr};
};
TORCH_MODULE(PhonesEncoder);

/**
 * \brief Picks one time-major frame per word.
 * \param frames [F, B, D]
 * \param ends [B, W] int64 indices into F. Padded entries must still be valid indices.
 * \returns [W, B, D]
 */
at::Tensor gather_word_positions(const at::Tensor& frames, const at::Tensor& ends);

/**
 * \brief Elementwise maximum of two aligned representations.
 * \throws ConfigurationError if the shapes differ.
 */
at::Tensor fuse_representations(const at::Tensor& words, const at::Tensor& audio);

}  // namespace rnnsearch::model
