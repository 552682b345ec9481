#pragma once

#include "config/ModelConfig.h"
#include "model/Decoder.h"
#include "model/Encoders.h"
#include "model/ParameterReport.h"

#include <ATen/core/TensorBody.h>
#include <torch/nn/module.h>
#include <torch/nn/pimpl.h>

#include <functional>

namespace rnnsearch::model {

/**
 * \brief Source side of a batch. Only the fields of the configured input type are read.
 *
 * All tensors are batch-major. For sampling, masks may be left undefined, in which case every
 * position is treated as valid.
 */
struct SourceBatch {
    at::Tensor words;            // [B, W] int64
    at::Tensor words_mask;       // [B, W]
    at::Tensor audio;            // [B, F, audio_feat_size]
    at::Tensor audio_mask;       // [B, F]
    at::Tensor words_ends;       // [B, W] int64, last audio frame of every word
    at::Tensor words_ends_mask;  // [B, W]
    at::Tensor phones;           // [B, P] int64
    at::Tensor phones_mask;      // [B, P]
    at::Tensor phones_words_ends;       // [B, W] int64, last phone of every word
    at::Tensor phones_words_ends_mask;  // [B, W]
};

struct TargetBatch {
    at::Tensor tokens;  // [B, T] int64
    at::Tensor mask;    // [B, T]
};

// A time-major representation with the batch-major mask of its positions.
struct EncodedSource {
    at::Tensor representation;  // [T, B, 2 * enc_nhids]
    at::Tensor mask;            // [B, T]
};

/**
 * \brief Encoder(s) and decoder of one configuration. This module is the single parameter store:
 *          training and sampling computations hold the same module handle.
 */
class Seq2SeqModelImpl : public torch::nn::Module {
public:
    explicit Seq2SeqModelImpl(const config::ModelConfig& config);

    // Source representation for the configured input type.
    EncodedSource encode(const SourceBatch& source);

    // Scalar training loss; sums the word and audio costs in multitask mode.
    at::Tensor cost(const SourceBatch& source, const TargetBatch& target);

    // Generation over an unmasked source.
    GenerationResult generate(const SourceBatch& source, const GenerationOptions& options);

    const config::ModelConfig& config() const { return m_config; }

private:
    EncodedSource encode_words(const SourceBatch& source);
    EncodedSource encode_audio(const SourceBatch& source);
    EncodedSource encode_phones(const SourceBatch& source);
    EncodedSource encode_both(const SourceBatch& source);

    const config::ModelConfig m_config;
    std::function<EncodedSource(const SourceBatch&)> m_encode;

    WordEncoder m_words_encoder{nullptr};
    AudioEncoder m_audio_encoder{nullptr};
    PhonesEncoder m_phones_encoder{nullptr};
    Decoder m_decoder{nullptr};
};
TORCH_MODULE(Seq2SeqModel);

// Masked, batched teacher-forced loss over a shared model.
class TrainingComputation {
public:
    explicit TrainingComputation(Seq2SeqModel model);

    at::Tensor operator()(const SourceBatch& source, const TargetBatch& target);

    const Seq2SeqModel& model() const { return m_model; }

private:
    Seq2SeqModel m_model;
};

// Reusable generation handle over a shared model. Sampling sources are unmasked.
class SamplingComputation {
public:
    SamplingComputation(Seq2SeqModel model, GenerationOptions options);

    GenerationResult operator()(const SourceBatch& source);

    const Seq2SeqModel& model() const { return m_model; }

private:
    Seq2SeqModel m_model;
    GenerationOptions m_options;
};

struct ModelComputations {
    Seq2SeqModel model;
    TrainingComputation training;
    SamplingComputation sampling;
    ParameterReport parameters;
};

/**
 * \brief Builds and initialises the model, the training and sampling computations over it, and
 *          logs the parameter report.
 * \throws ConfigurationError if the configuration is invalid.
 */
ModelComputations create_model(const config::ModelConfig& config,
                               const GenerationOptions& sampling_options = {});

}  // namespace rnnsearch::model
