// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <llama/Init.hpp>
#include <llama/Model.hpp>
#include <llama/Backend.hpp>

#include <core/RequestMediator.hpp>

#include <server/Config.hpp>
#include <server/Service.hpp>

#include <rpc/RpcServer.hpp>

#include <jalog/Instance.hpp>
#include <jalog/sinks/DefaultSink.hpp>
#include <jalog/Log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

namespace net = boost::asio;

namespace {
void modelLoadProgressCallback(float progress) {
    const int barWidth = 50;
    static float currProgress = 0;
    auto delta = int(progress * barWidth) - int(currProgress * barWidth);
    for (int i = 0; i < delta; i++) {
        std::cout.put('=');
    }
    currProgress = progress;
    if (progress == 1.f) {
        std::cout << '\n';
    }
}

void printUsage(const char* argv0) {
    std::cout << "usage: " << argv0 << " [--config <file.json>]\n"
        "environment: LMSVC_CONFIG, LMSVC_HOST, LMSVC_PORT, LMSVC_MODEL\n";
}

int run(const lmsvc::server::Config& config) {
    lmsvc::llama::initLibrary();

    JALOG(Info, "Loading model ", config.modelPath);
    auto model = std::make_shared<lmsvc::llama::Model>(config.modelPath,
        lmsvc::llama::Model::Params{.gpu = config.gpu}, modelLoadProgressCallback);

    auto backend = std::make_unique<lmsvc::llama::Backend>(model, lmsvc::llama::Instance::InitParams{.ctxSize = config.ctxSize});
    backend->warmup();

    auto mediator = std::make_unique<lmsvc::core::RequestMediator>(
        std::move(backend), lmsvc::llama::makeTokenizerAdapter(model), config.mediator);

    lmsvc::server::Service service(std::move(mediator));

    lmsvc::rpc::RpcServer server(service, {.host = config.host, .port = config.port});
    server.start();

    JALOG(Info, "Starting Language Model server on ", config.host, ":", server.port());

    // the rpc server runs its own threads, this one only waits for a signal
    net::io_context ioctx;
    net::signal_set signals(ioctx, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) return;
        JALOG(Info, "Received signal ", signal, ", shutting down");
        server.stop();
    });
    ioctx.run();

    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    jalog::Instance jl;
    jl.setup().async().add<jalog::sinks::DefaultSink>();

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            std::cerr << "Unknown argument: " << arg << '\n';
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        auto config = lmsvc::server::Config::load(configPath, [](const char* name) {
            return std::getenv(name);
        });
        return run(config);
    }
    catch (const std::exception& e) {
        JALOG(Critical, "Fatal: ", e.what());
        std::cerr << "Fatal: " << e.what() << '\n';
        return 1;
    }
}
