#include "utils/config.hpp"
#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {
    void check(bool condition, const std::string& message) {
        if (!condition) {
            throw std::runtime_error("Invalid generator config: " + message);
        }
    }

    void check_special_id(int id, int vocab_size, const std::string& name) {
        std::ostringstream oss;
        oss << name << "=" << id << " is outside the vocabulary [0, " << vocab_size << ")";
        check(0 <= id && id < vocab_size, oss.str());
    }
}

void GeneratorConfig::validate() const {
    check(vocab_size > 0, "vocab_size must be positive");
    check(hidden_dim > 0, "hidden_dim must be positive");
    check(n_heads > 0, "n_heads must be positive");
    check(pff_dim > 0, "pff_dim must be positive");
    check(n_layers > 0, "n_layers must be positive");
    check(max_len > 1, "max_len must leave room for at least one generated token");

    if (hidden_dim % n_heads != 0) {
        std::ostringstream oss;
        oss << "hidden_dim=" << hidden_dim << " is not divisible by n_heads=" << n_heads;
        check(false, oss.str());
    }

    check(0.0f <= dropout && dropout < 1.0f, "dropout must be in [0, 1)");
    check(layer_norm_eps > 0.0f, "layer_norm_eps must be positive");

    check_special_id(pad_id, vocab_size, "pad_id");
    check_special_id(unk_id, vocab_size, "unk_id");
    check_special_id(bos_id, vocab_size, "bos_id");
    check_special_id(eos_id, vocab_size, "eos_id");
}

std::string describe(const GeneratorConfig& config) {
    std::ostringstream oss;
    oss << "vocab_size: " << config.vocab_size << "\n"
        << "hidden_dim: " << config.hidden_dim << "\n"
        << "n_heads: " << config.n_heads << "\n"
        << "pff_dim: " << config.pff_dim << "\n"
        << "n_layers: " << config.n_layers << "\n"
        << "max_len: " << config.max_len << "\n"
        << "activation: " << (config.activation == Activation::ReLU ? "relu" : "gelu") << "\n"
        << "cross_attention: " << (config.use_cross_attention ? "on" : "off") << "\n";
    return oss.str();
}

std::uint32_t parse_seed(const std::string& text) {
    size_t used = 0;
    unsigned long long value = 0;
    if (!text.empty() && std::isdigit(static_cast<unsigned char>(text.front()))) {
        try {
            value = std::stoull(text, &used);
        } catch (const std::out_of_range&) {
            used = 0;
        }
    }
    if (used == 0 || used != text.size() || value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("Seed must be an integer in [0, " +
                                 std::to_string(std::numeric_limits<std::uint32_t>::max()) + "], got '" + text + "'");
    }
    return static_cast<std::uint32_t>(value);
}

Activation parse_activation(const std::string& name) {
    if (name == "relu") return Activation::ReLU;
    if (name == "gelu") return Activation::GELU;
    throw std::runtime_error("Unknown activation '" + name + "', expected relu or gelu");
}

GeneratorConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    GeneratorConfig config;
    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            throw std::runtime_error("top level must be an object of groups");
        }

        for (const auto& group : j.items()) {
            const nlohmann::json& params = group.value();
            if (!params.is_object()) continue;

            config.vocab_size = params.value("vocab_size", config.vocab_size);
            config.hidden_dim = params.value("hidden_dim", config.hidden_dim);
            config.n_heads = params.value("n_heads", config.n_heads);
            config.pff_dim = params.value("pff_dim", config.pff_dim);
            config.n_layers = params.value("n_layers", config.n_layers);

            config.pad_id = params.value("pad_id", config.pad_id);
            config.unk_id = params.value("unk_id", config.unk_id);
            config.bos_id = params.value("bos_id", config.bos_id);
            config.eos_id = params.value("eos_id", config.eos_id);

            config.max_len = params.value("max_len", config.max_len);
            config.dropout = params.value("dropout", config.dropout);
            config.layer_norm_eps = params.value("layer_norm_eps", config.layer_norm_eps);
            config.use_cross_attention = params.value("use_cross_attention", config.use_cross_attention);
            if (params.contains("activation")) {
                config.activation = parse_activation(params["activation"].get<std::string>());
            }
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load config " + path + ": " + e.what());
    }

    config.validate();
    std::cout << "Loaded generator config from " << path << std::endl;
    return config;
}
