#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rnnsearch::config {

// Source modality fed to the encoder(s). Resolved once when the model is built.
enum class InputType {
    WORDS,
    AUDIO,
    PHONES,
    BOTH,  // words and audio, fused by elementwise maximum
};

InputType parse_input_type(const std::string& input);
std::string to_string(InputType input);

struct ModelConfig {
    InputType input = InputType::WORDS;

    // Apply the decoder to the word and the audio representation separately and sum both costs.
    bool multitask = false;

    int32_t src_vocab_size = 0;
    int32_t phones_vocab_size = 0;
    int32_t trg_vocab_size = 0;
    int32_t audio_feat_size = 0;

    int32_t enc_embed = 620;
    int32_t enc_nhids = 1000;
    int32_t dec_embed = 620;
    int32_t dec_nhids = 1000;

    float weight_scale = 0.01f;
    std::optional<uint64_t> seed;

    bool uses_words() const { return input == InputType::WORDS || input == InputType::BOTH; }
    bool uses_audio() const { return input == InputType::AUDIO || input == InputType::BOTH; }
    bool uses_phones() const { return input == InputType::PHONES; }

    int32_t representation_dim() const { return 2 * enc_nhids; }

    // Throws ConfigurationError describing the first inconsistency found.
    void validate() const;

    std::string to_string() const;
};

ModelConfig load_model_config(const std::filesystem::path& path);

}  // namespace rnnsearch::config
