// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <core/RequestMediator.hpp>

#include <nlohmann/json_fwd.hpp>
#include <itlib/ufunction.hpp>

#include <cstdint>
#include <string>

namespace lmsvc::server {

// server settings
// sources in order of precedence: environment, json file, defaults
struct Config {
    std::string host = "127.0.0.1";
    uint16_t port = 9090;
    std::string modelPath; // gguf file, required

    bool gpu = true;
    uint32_t ctxSize = 0; // 0 = the model's training context

    core::MediatorConfig mediator;

    // fields missing from the json keep their value
    // throws on wrong types and on integers which don't fit their field
    void applyJson(const nlohmann::json& json);
    void applyJsonFile(const std::string& path);

    // LMSVC_HOST, LMSVC_PORT, LMSVC_MODEL
    using EnvLookup = itlib::ufunction<const char*(const char*)>;
    void applyEnvironment(EnvLookup getenv);

    // throws a description of the first invalid setting
    void validate() const;

    // defaults <- configPath (if not empty, else LMSVC_CONFIG if set) <- environment, validated
    static Config load(const std::string& configPath, EnvLookup getenv);
};

} // namespace lmsvc::server
