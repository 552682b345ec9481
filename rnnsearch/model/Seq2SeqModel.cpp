#include "model/Seq2SeqModel.h"

#include "model/initialization.h"
#include "utils/errors.h"

#include <ATen/ATen.h>
#include <spdlog/spdlog.h>
#include <torch/utils.h>

#include <utility>

namespace rnnsearch::model {

namespace {

// Sampling batches carry no masks; every position is valid then.
at::Tensor mask_or_ones(const at::Tensor& mask, const at::Tensor& sequence) {
    if (mask.defined()) {
        return mask;
    }
    if (!sequence.defined() || (sequence.dim() < 2)) {
        throw ShapeMismatchError("Source sequence is missing or has fewer than 2 dimensions.");
    }
    return at::ones({sequence.size(0), sequence.size(1)}, at::kFloat);
}

}  // namespace

Seq2SeqModelImpl::Seq2SeqModelImpl(const config::ModelConfig& config) : m_config{config} {
    m_config.validate();

    spdlog::debug("Constructing a {} model. {}", config::to_string(m_config.input),
                  m_config.to_string());

    if (m_config.uses_words()) {
        m_words_encoder = register_module(
                "words_encoder",
                WordEncoder(m_config.src_vocab_size, m_config.enc_embed, m_config.enc_nhids));
    }
    if (m_config.uses_audio()) {
        m_audio_encoder = register_module(
                "audio_encoder", AudioEncoder(m_config.audio_feat_size, m_config.enc_nhids));
    }
    if (m_config.uses_phones()) {
        m_phones_encoder = register_module(
                "phones_encoder",
                PhonesEncoder(m_config.phones_vocab_size, m_config.enc_embed, m_config.enc_nhids));
    }
    m_decoder = register_module("decoder", Decoder(m_config.trg_vocab_size, m_config.dec_embed,
                                                   m_config.dec_nhids, m_config.enc_nhids));

    switch (m_config.input) {
    case config::InputType::WORDS:
        m_encode = [this](const SourceBatch& source) { return encode_words(source); };
        break;
    case config::InputType::AUDIO:
        m_encode = [this](const SourceBatch& source) { return encode_audio(source); };
        break;
    case config::InputType::PHONES:
        m_encode = [this](const SourceBatch& source) { return encode_phones(source); };
        break;
    case config::InputType::BOTH:
        m_encode = [this](const SourceBatch& source) { return encode_both(source); };
        break;
    }
}

EncodedSource Seq2SeqModelImpl::encode_words(const SourceBatch& source) {
    const at::Tensor mask = mask_or_ones(source.words_mask, source.words);
    return {m_words_encoder(source.words, mask), mask};
}

EncodedSource Seq2SeqModelImpl::encode_audio(const SourceBatch& source) {
    const at::Tensor audio_mask = mask_or_ones(source.audio_mask, source.audio);
    const at::Tensor words_ends_mask = mask_or_ones(source.words_ends_mask, source.words_ends);
    return {m_audio_encoder(source.audio, audio_mask, source.words_ends, words_ends_mask),
            words_ends_mask};
}

EncodedSource Seq2SeqModelImpl::encode_phones(const SourceBatch& source) {
    const at::Tensor phones_mask = mask_or_ones(source.phones_mask, source.phones);
    const at::Tensor words_ends_mask =
            mask_or_ones(source.phones_words_ends_mask, source.phones_words_ends);
    return {m_phones_encoder(source.phones, phones_mask, source.phones_words_ends,
                             words_ends_mask),
            words_ends_mask};
}

EncodedSource Seq2SeqModelImpl::encode_both(const SourceBatch& source) {
    const EncodedSource words = encode_words(source);
    const EncodedSource audio = encode_audio(source);
    return {fuse_representations(words.representation, audio.representation), words.mask};
}

EncodedSource Seq2SeqModelImpl::encode(const SourceBatch& source) { return m_encode(source); }

at::Tensor Seq2SeqModelImpl::cost(const SourceBatch& source, const TargetBatch& target) {
    if (m_config.multitask) {
        const EncodedSource words = encode_words(source);
        const EncodedSource audio = encode_audio(source);
        const at::Tensor words_cost =
                m_decoder->cost(words.representation, words.mask, target.tokens, target.mask);
        const at::Tensor audio_cost =
                m_decoder->cost(audio.representation, audio.mask, target.tokens, target.mask);
        return words_cost + audio_cost;
    }

    const EncodedSource encoded = encode(source);
    return m_decoder->cost(encoded.representation, encoded.mask, target.tokens, target.mask);
}

GenerationResult Seq2SeqModelImpl::generate(const SourceBatch& source,
                                            const GenerationOptions& options) {
    torch::NoGradGuard no_grad;

    // Multitask models sample from the word representation.
    const EncodedSource encoded = m_config.multitask ? encode_words(source) : encode(source);
    return m_decoder->generate(encoded.representation, options);
}

TrainingComputation::TrainingComputation(Seq2SeqModel model) : m_model(std::move(model)) {}

at::Tensor TrainingComputation::operator()(const SourceBatch& source, const TargetBatch& target) {
    return m_model->cost(source, target);
}

SamplingComputation::SamplingComputation(Seq2SeqModel model, GenerationOptions options)
        : m_model(std::move(model)), m_options(std::move(options)) {}

GenerationResult SamplingComputation::operator()(const SourceBatch& source) {
    // Sampling sources are unmasked.
    SourceBatch unmasked = source;
    unmasked.words_mask = {};
    unmasked.audio_mask = {};
    unmasked.words_ends_mask = {};
    unmasked.phones_mask = {};
    unmasked.phones_words_ends_mask = {};
    return m_model->generate(unmasked, m_options);
}

ModelComputations create_model(const config::ModelConfig& config,
                               const GenerationOptions& sampling_options) {
    Seq2SeqModel model(config);
    initialize_parameters(*model, config.weight_scale, config.seed);

    ParameterReport report = report_parameters(*model);
    log_parameter_report(report);

    return {model, TrainingComputation(model), SamplingComputation(model, sampling_options),
            std::move(report)};
}

}  // namespace rnnsearch::model
