// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <core/Types.hpp>

#include <llm/LanguageModelService.h>

namespace lmsvc::server {
class Service;
}

namespace lmsvc::rpc {

// thrift-facing side of the service
// calls block the connection thread until the service worker has handled them
// failures are thrown as llm::ModelError
class Handler final : public llm::LanguageModelServiceIf {
public:
    explicit Handler(server::Service& service);

    void generateText(llm::TextGenerationResponse& ret, const llm::TextGenerationRequest& request) override;
    void classifyText(llm::TextClassificationResponse& ret, const llm::TextClassificationRequest& request) override;

    // fields missing from the wire get the defaults of core::GenerationRequest
    static core::GenerationRequest fromWire(const llm::TextGenerationRequest& request);
    static core::ClassificationRequest fromWire(const llm::TextClassificationRequest& request);

    static llm::TextGenerationResponse toWire(const core::GenerationResponse& response);
    static llm::TextClassificationResponse toWire(const core::ClassificationResponse& response);
    static llm::ModelError toWire(const core::ModelError& error);

private:
    server::Service& m_service;
};

} // namespace lmsvc::rpc
