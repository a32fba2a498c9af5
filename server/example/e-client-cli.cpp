// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <llm/LanguageModelService.h>
#include <llm/llm_constants.h>

#include <thrift/protocol/TBinaryProtocol.h>
#include <thrift/transport/TBufferTransports.h>
#include <thrift/transport/TSocket.h>

#include <util/strings.hpp>

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace at = apache::thrift;
namespace llm = lmsvc::llm;

namespace {
void classify(llm::LanguageModelServiceClient& client, std::string text, std::vector<std::string> labels) {
    std::cout << "\nClassifying text: " << text << '\n';

    llm::TextClassificationRequest req;
    req.__set_text(std::move(text));
    req.__set_labels(std::move(labels));

    llm::TextClassificationResponse res;
    try {
        client.classifyText(res, req);
    }
    catch (const llm::ModelError& e) {
        std::cout << "Error: " << e.message << ": " << e.details << '\n';
        return;
    }
    std::printf("\nClassification Result (took %.2f seconds):\nLabel: %s\nConfidence: %.2f\n",
        res.classification_time, res.label.c_str(), res.confidence);
}
} // namespace

int main(int argc, char* argv[]) {
    std::string host = argc > 1 ? argv[1] : "127.0.0.1";
    uint16_t port = uint16_t(llm::g_llm_constants.DEFAULT_PORT);
    if (argc > 2) {
        auto parsed = lmsvc::util::parsePort(argv[2]);
        if (!parsed) {
            std::cerr << "Invalid port: " << argv[2] << '\n';
            std::cerr << "usage: " << argv[0] << " [host] [port]\n";
            return 1;
        }
        port = *parsed;
    }

    try {
        auto transport = std::make_shared<at::transport::TBufferedTransport>(
            std::make_shared<at::transport::TSocket>(host, port));
        auto protocol = std::make_shared<at::protocol::TBinaryProtocol>(transport);
        llm::LanguageModelServiceClient client(protocol);
        transport->open();

        llm::TextGenerationRequest genReq;
        genReq.__set_prompt("Once upon a time in Silicon Valley,");
        genReq.__set_max_length(150);
        genReq.__set_temperature(0.8);

        std::cout << "\nGenerating text with prompt: " << genReq.prompt << '\n';
        llm::TextGenerationResponse gen;
        try {
            client.generateText(gen, genReq);
            std::printf("\nGenerated Text (took %.2f seconds):\n%s\n\n", gen.generation_time, gen.generated_text.c_str());
        }
        catch (const llm::ModelError& e) {
            std::cout << "Error: " << e.message << ": " << e.details << '\n';
        }

        classify(client,
            "I absolutely loved this movie! The acting was superb and the story was engaging.",
            {"positive", "negative", "neutral"});

        classify(client,
            "Python is a versatile programming language with great libraries for machine learning and data science.",
            {"technology", "sports", "entertainment", "education"});

        transport->close();
    }
    catch (const at::TException& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
