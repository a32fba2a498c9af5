// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "RpcServer.hpp"
#include "Handler.hpp"
#include "Logging.hpp"

#include <util/throw_ex.hpp>

#include <thrift/TOutput.h>
#include <thrift/protocol/TBinaryProtocol.h>
#include <thrift/server/TThreadedServer.h>
#include <thrift/transport/TBufferTransports.h>
#include <thrift/transport/TServerSocket.h>

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

namespace at = apache::thrift;

namespace lmsvc::rpc {

namespace {
void thriftOutput(const char* msg) {
    LMSVC_RPC_LOG(Warning, "thrift: ", msg);
}

// signals when the server is listening and logs connections
class ServeEvents final : public at::server::TServerEventHandler {
public:
    std::promise<void> listening;
    std::atomic_bool listened = false;

    void preServe() override {
        listened = true;
        listening.set_value();
    }

    void* createContext(std::shared_ptr<at::protocol::TProtocol> input, std::shared_ptr<at::protocol::TProtocol>) override {
        LMSVC_RPC_LOG(Debug, "Connection from ", input->getTransport()->getOrigin());
        return nullptr;
    }

    void deleteContext(void*, std::shared_ptr<at::protocol::TProtocol> input, std::shared_ptr<at::protocol::TProtocol>) override {
        LMSVC_RPC_LOG(Debug, "Connection from ", input->getTransport()->getOrigin(), " closed");
    }
};
} // namespace

struct RpcServer::Impl {
    Params m_params;

    std::shared_ptr<Handler> m_handler;
    std::shared_ptr<at::transport::TServerSocket> m_socket;
    std::shared_ptr<ServeEvents> m_events;
    std::shared_ptr<at::server::TThreadedServer> m_server;

    std::mutex m_mutex; // guards the fields below
    bool m_started = false;
    std::thread m_thread;

    Impl(server::Service& service, Params params)
        : m_params(std::move(params))
        , m_handler(std::make_shared<Handler>(service))
        , m_socket(std::make_shared<at::transport::TServerSocket>(m_params.host, int(m_params.port)))
        , m_events(std::make_shared<ServeEvents>())
    {
        // blocked reads of open connections are interrupted on stop
        m_socket->setInterruptableChildren(true);

        m_server = std::make_shared<at::server::TThreadedServer>(
            std::make_shared<llm::LanguageModelServiceProcessor>(m_handler),
            m_socket,
            std::make_shared<at::transport::TBufferedTransportFactory>(),
            std::make_shared<at::protocol::TBinaryProtocolFactory>()
        );
        m_server->setServerEventHandler(m_events);
    }

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard lock(m_mutex);
        if (m_started) {
            throw_ex{} << "RpcServer can only be started once";
        }
        m_started = true;

        auto listening = m_events->listening.get_future();

        m_thread = std::thread([this] {
            try {
                m_server->serve();
            }
            catch (const at::TException& e) {
                LMSVC_RPC_LOG(Error, "Serving on ", m_params.host, ":", m_params.port, " failed: ", e.what());
                if (!m_events->listened) {
                    m_events->listening.set_exception(std::current_exception());
                }
            }
        });

        try {
            listening.get();
        }
        catch (const at::TException& e) {
            m_thread.join();
            throw_ex{} << "Cannot listen on " << m_params.host << ":" << m_params.port << ": " << e.what();
        }

        LMSVC_RPC_LOG(Info, "Listening on ", m_params.host, ":", m_socket->getPort());
    }

    void stop() {
        std::lock_guard lock(m_mutex);
        if (!m_thread.joinable()) return;
        m_server->stop();
        m_thread.join();
        LMSVC_RPC_LOG(Info, "Stopped serving on ", m_params.host, ":", m_socket->getPort());
    }
};

RpcServer::RpcServer(server::Service& service, Params params) {
    at::GlobalOutput.setOutputFunction(thriftOutput);
    m_impl = std::make_unique<Impl>(service, std::move(params));
}

RpcServer::~RpcServer() = default;

void RpcServer::start() {
    m_impl->start();
}

int RpcServer::port() const {
    return m_impl->m_socket->getPort();
}

void RpcServer::stop() {
    m_impl->stop();
}

} // namespace lmsvc::rpc
