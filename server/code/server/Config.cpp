// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Config.hpp"

#include <core/ClassificationScorer.hpp>
#include <util/throw_ex.hpp>

#include <nlohmann/json.hpp>

#include <boost/asio/ip/address.hpp>

#include <charconv>
#include <concepts>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <system_error>
#include <type_traits>

namespace fs = std::filesystem;

namespace lmsvc::server {

namespace {
template <typename T>
void opt_get(const nlohmann::json& dict, std::string_view key, T& value) {
    auto it = dict.find(key);
    if (it != dict.end()) {
        value = it->get<T>();
    }
}

template <typename T>
concept JsonInteger = std::integral<T> && !std::same_as<T, bool>;

// nlohmann converts integers with a static_cast, so negative or huge values would wrap
template <JsonInteger T>
T getInt(const nlohmann::json& value, std::string_view key) {
    if (!value.is_number_integer()) {
        throw_ex{} << key << " must be an integer";
    }
    const auto i = value.get<int64_t>();
    bool fits;
    if constexpr (std::is_unsigned_v<T>) {
        fits = i >= 0 && uint64_t(i) <= std::numeric_limits<T>::max();
    }
    else {
        fits = i >= std::numeric_limits<T>::min() && i <= std::numeric_limits<T>::max();
    }
    if (!fits) {
        throw_ex{} << key << " is out of range: " << i;
    }
    return T(i);
}

template <JsonInteger T>
void opt_get(const nlohmann::json& dict, std::string_view key, T& value) {
    auto it = dict.find(key);
    if (it != dict.end()) {
        value = getInt<T>(*it, key);
    }
}

template <JsonInteger T>
void opt_get(const nlohmann::json& dict, std::string_view key, std::optional<T>& value) {
    auto it = dict.find(key);
    if (it == dict.end()) return;
    if (it->is_null()) {
        value.reset();
    }
    else {
        value = getInt<T>(*it, key);
    }
}

void checkModelPath(const std::string& path, std::string_view source) {
    if (path.empty()) {
        throw_ex{} << source << " is not set";
    }
    if (!path.ends_with(".gguf")) {
        throw_ex{} << source << " does not end with .gguf: " << path;
    }
    fs::path modelPath(path);
    if (!fs::exists(modelPath)) {
        throw_ex{} << source << " does not exist: " << path;
    }
    if (!fs::is_regular_file(modelPath)) {
        throw_ex{} << source << " is not a regular file: " << path;
    }
}
} // namespace

void Config::applyJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw_ex{} << "Config must be a json object";
    }

    try {
        opt_get(json, "host", host);
        opt_get(json, "port", port);
        opt_get(json, "model", modelPath);
        opt_get(json, "gpu", gpu);
        opt_get(json, "ctx_size", ctxSize);

        opt_get(json, "seed", mediator.seed);
        opt_get(json, "max_length_limit", mediator.maxLengthLimit);
        opt_get(json, "repetition_penalty", mediator.repetitionPenalty);
        opt_get(json, "classification_temperature", mediator.classificationTemperature);
        opt_get(json, "classification_margin", mediator.classificationMargin);
        opt_get(json, "log_preview_length", mediator.previewLength);

        if (auto it = json.find("scoring"); it != json.end()) {
            opt_get(*it, "exact", mediator.scoring.exactConfidence);
            opt_get(*it, "contains", mediator.scoring.containsConfidence);
            opt_get(*it, "fallback", mediator.scoring.fallbackConfidence);
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw_ex{} << "Invalid config: " << e.what();
    }
}

void Config::applyJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw_ex{} << "Cannot open config file: " << path;
    }
    auto json = nlohmann::json::parse(in, nullptr, false);
    if (json.is_discarded()) {
        throw_ex{} << "Config file is not valid json: " << path;
    }
    applyJson(json);
}

void Config::applyEnvironment(EnvLookup getenv) {
    if (auto env = getenv("LMSVC_HOST")) {
        host = env;
    }

    if (auto env = getenv("LMSVC_PORT")) {
        const std::string_view str(env);
        unsigned long value = 0;
        auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value, 10);
        if (ec == std::errc::result_out_of_range) {
            throw_ex{} << "LMSVC_PORT is out of range: " << str;
        }
        if (ec != std::errc{} || str.empty()) {
            throw_ex{} << "LMSVC_PORT is not a number: " << str;
        }
        if (end != str.data() + str.size()) {
            throw_ex{} << "Extra characters after LMSVC_PORT number: " << str;
        }
        if (value > std::numeric_limits<uint16_t>::max()) {
            throw_ex{} << "LMSVC_PORT exceeds " << std::numeric_limits<uint16_t>::max() << ": " << str;
        }
        port = uint16_t(value);
    }

    if (auto env = getenv("LMSVC_MODEL")) {
        modelPath = env;
        checkModelPath(modelPath, "LMSVC_MODEL");
    }
}

void Config::validate() const {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    if (ec) {
        throw_ex{} << "Invalid host address: " << host;
    }

    checkModelPath(modelPath, "Model path");

    if (mediator.maxLengthLimit <= 0) {
        throw_ex{} << "max_length_limit must be positive";
    }
    if (mediator.repetitionPenalty <= 0) {
        throw_ex{} << "repetition_penalty must be positive";
    }
    if (mediator.classificationTemperature < 0) {
        throw_ex{} << "classification_temperature must not be negative";
    }

    // throws on confidences out of range
    core::ClassificationScorer{mediator.scoring};
}

Config Config::load(const std::string& configPath, EnvLookup getenv) {
    Config ret;
    if (!configPath.empty()) {
        ret.applyJsonFile(configPath);
    }
    else if (auto env = getenv("LMSVC_CONFIG")) {
        ret.applyJsonFile(env);
    }
    ret.applyEnvironment(std::move(getenv));
    ret.validate();
    return ret;
}

} // namespace lmsvc::server
