// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace lmsvc::server {
class Service;
}

namespace lmsvc::rpc {

// serves LanguageModelService over thrift (buffered transport, binary protocol)
//
// every connection gets its own thread, calls from all connections are queued in the service
class RpcServer {
public:
    struct Params {
        std::string host = "127.0.0.1";
        uint16_t port = 9090; // 0 binds an ephemeral port, see port()
    };

    RpcServer(server::Service& service, Params params);
    ~RpcServer(); // stops

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    // bind, listen and serve on a background thread
    // returns once the server accepts connections, throws if it can't listen
    // a server can be started once
    void start();

    // the bound port, valid after start
    int port() const;

    // stop accepting, interrupt open connections and wait for their threads
    // thread safe, no-op if not serving
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace lmsvc::rpc
