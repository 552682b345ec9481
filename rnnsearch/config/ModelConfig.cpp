#include "config/ModelConfig.h"

#include "utils/errors.h"

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <sstream>
#include <string>
#include <unordered_map>

namespace rnnsearch::config {

namespace {

const std::unordered_map<std::string, InputType> input_type_map = {
        {"words", InputType::WORDS},
        {"audio", InputType::AUDIO},
        {"phones", InputType::PHONES},
        {"both", InputType::BOTH},
};

void check_positive(const int32_t value, const std::string& name) {
    if (value <= 0) {
        throw ConfigurationError("model config error - " + name +
                                 " must be > 0, got: " + std::to_string(value));
    }
}

const toml::value& find_section(const toml::value& config_toml, const std::string& name) {
    if (!config_toml.contains(name)) {
        throw ConfigurationError("Model config must include the [" + name + "] section.");
    }
    return toml::find(config_toml, name);
}

}  // namespace

InputType parse_input_type(const std::string& input) {
    const auto it = input_type_map.find(input);
    if (it == std::cend(input_type_map)) {
        throw ConfigurationError("Unknown input type: '" + input +
                                 "'. Expected one of: words, audio, phones, both.");
    }
    return it->second;
}

std::string to_string(const InputType input) {
    switch (input) {
    case InputType::WORDS:
        return "words";
    case InputType::AUDIO:
        return "audio";
    case InputType::PHONES:
        return "phones";
    case InputType::BOTH:
        return "both";
    }
    throw ConfigurationError("Invalid InputType value.");
}

void ModelConfig::validate() const {
    if (uses_words()) {
        check_positive(src_vocab_size, "encoder.src_vocab_size");
    }
    if (uses_phones()) {
        check_positive(phones_vocab_size, "encoder.phones_vocab_size");
    }
    if (uses_audio()) {
        check_positive(audio_feat_size, "encoder.audio_feat_size");
    }
    check_positive(trg_vocab_size, "decoder.trg_vocab_size");
    check_positive(enc_embed, "encoder.embedding_dim");
    check_positive(enc_nhids, "encoder.state_dim");
    check_positive(dec_embed, "decoder.embedding_dim");
    check_positive(dec_nhids, "decoder.state_dim");

    // The readout maxout takes pairs of merged features.
    if ((dec_nhids % 2) != 0) {
        throw ConfigurationError("model config error - decoder.state_dim must be even, got: " +
                                 std::to_string(dec_nhids));
    }
    if (!(weight_scale > 0.0f)) {
        throw ConfigurationError("model config error - model.weight_scale must be > 0.");
    }
    if (multitask && (input != InputType::BOTH)) {
        throw ConfigurationError(
                "model config error - multitask training requires input = \"both\", got: \"" +
                config::to_string(input) + "\".");
    }
}

std::string ModelConfig::to_string() const {
    std::ostringstream oss;
    oss << "ModelConfig {"
        << " input: " << config::to_string(input) << ", multitask: " << multitask
        << ", src_vocab_size: " << src_vocab_size << ", phones_vocab_size: " << phones_vocab_size
        << ", trg_vocab_size: " << trg_vocab_size << ", audio_feat_size: " << audio_feat_size
        << ", enc_embed: " << enc_embed << ", enc_nhids: " << enc_nhids
        << ", dec_embed: " << dec_embed << ", dec_nhids: " << dec_nhids
        << ", weight_scale: " << weight_scale
        << ", seed: " << (seed ? std::to_string(*seed) : "none") << " }";
    return oss.str();
}

ModelConfig load_model_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("Model config file does not exist: '" + path.string() + "'.");
    }

    const toml::value config_toml = toml::parse(path.string());

    ModelConfig config;

    {
        const auto& model = find_section(config_toml, "model");
        config.input = parse_input_type(toml::find<std::string>(model, "input"));
        if (model.contains("multitask")) {
            config.multitask = toml::find<bool>(model, "multitask");
        }
        if (model.contains("weight_scale")) {
            config.weight_scale = toml::find<float>(model, "weight_scale");
        }
        if (model.contains("seed")) {
            const int64_t seed = toml::find<int64_t>(model, "seed");
            if (seed < 0) {
                throw ConfigurationError("model config error - model.seed cannot be < 0");
            }
            config.seed = static_cast<uint64_t>(seed);
        }
    }

    {
        const auto& encoder = find_section(config_toml, "encoder");
        if (encoder.contains("src_vocab_size")) {
            config.src_vocab_size = toml::find<int32_t>(encoder, "src_vocab_size");
        }
        if (encoder.contains("phones_vocab_size")) {
            config.phones_vocab_size = toml::find<int32_t>(encoder, "phones_vocab_size");
        }
        if (encoder.contains("audio_feat_size")) {
            config.audio_feat_size = toml::find<int32_t>(encoder, "audio_feat_size");
        }
        config.enc_embed = toml::find<int32_t>(encoder, "embedding_dim");
        config.enc_nhids = toml::find<int32_t>(encoder, "state_dim");
    }

    {
        const auto& decoder = find_section(config_toml, "decoder");
        config.trg_vocab_size = toml::find<int32_t>(decoder, "trg_vocab_size");
        config.dec_embed = toml::find<int32_t>(decoder, "embedding_dim");
        config.dec_nhids = toml::find<int32_t>(decoder, "state_dim");
    }

    config.validate();

    spdlog::debug("Loaded model config from '{}': {}", path.string(), config.to_string());

    return config;
}

}  // namespace rnnsearch::config
