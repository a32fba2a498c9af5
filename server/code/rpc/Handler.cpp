// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Handler.hpp"
#include "Logging.hpp"

#include <server/Service.hpp>

#include <util/move_capture.hpp>

#include <future>

namespace lmsvc::rpc {

namespace {
// blocks until the service worker has produced a result
template <typename Response, typename Request, typename Call>
core::Result<Response> await(Request request, Call call) {
    std::promise<core::Result<Response>> promise;
    auto future = promise.get_future();
    call(std::move(request), [movecap(promise)](core::Result<Response> res) mutable {
        promise.set_value(std::move(res));
    });
    return future.get();
}
} // namespace

Handler::Handler(server::Service& service)
    : m_service(service)
{}

core::GenerationRequest Handler::fromWire(const llm::TextGenerationRequest& request) {
    core::GenerationRequest ret;
    ret.prompt = request.prompt;
    if (request.__isset.max_length) ret.maxLength = request.max_length;
    if (request.__isset.temperature) ret.temperature = request.temperature;
    if (request.__isset.top_k) ret.topK = request.top_k;
    if (request.__isset.top_p) ret.topP = request.top_p;
    return ret;
}

core::ClassificationRequest Handler::fromWire(const llm::TextClassificationRequest& request) {
    return {
        .text = request.text,
        .labels = request.labels,
    };
}

llm::TextGenerationResponse Handler::toWire(const core::GenerationResponse& response) {
    llm::TextGenerationResponse ret;
    ret.__set_generated_text(response.generatedText);
    ret.__set_generation_time(response.generationTime);
    ret.__set_input_tokens(response.inputTokens);
    ret.__set_generated_tokens(response.generatedTokens);
    return ret;
}

llm::TextClassificationResponse Handler::toWire(const core::ClassificationResponse& response) {
    llm::TextClassificationResponse ret;
    ret.__set_label(response.label);
    ret.__set_confidence(response.confidence);
    ret.__set_classification_time(response.classificationTime);
    return ret;
}

llm::ModelError Handler::toWire(const core::ModelError& error) {
    llm::ModelError ret;
    ret.__set_message(error.message);
    ret.__set_details(error.details);
    return ret;
}

void Handler::generateText(llm::TextGenerationResponse& ret, const llm::TextGenerationRequest& request) {
    auto res = await<core::GenerationResponse>(fromWire(request), [this](auto req, auto cb) {
        m_service.generateText(std::move(req), std::move(cb));
    });
    if (!res) {
        LMSVC_RPC_LOG(Debug, "generateText failed: ", res.error().message);
        throw toWire(res.error());
    }
    ret = toWire(*res);
}

void Handler::classifyText(llm::TextClassificationResponse& ret, const llm::TextClassificationRequest& request) {
    auto res = await<core::ClassificationResponse>(fromWire(request), [this](auto req, auto cb) {
        m_service.classifyText(std::move(req), std::move(cb));
    });
    if (!res) {
        LMSVC_RPC_LOG(Debug, "classifyText failed: ", res.error().message);
        throw toWire(res.error());
    }
    ret = toWire(*res);
}

} // namespace lmsvc::rpc
