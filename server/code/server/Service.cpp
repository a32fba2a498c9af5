// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Service.hpp"

#include <core/RequestMediator.hpp>

#include <util/thread_runner.hpp>
#include <util/move_capture.hpp>
#include <util/throw_ex.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

namespace asio = boost::asio;

namespace lmsvc::server {

struct Service::Impl {
    std::unique_ptr<core::RequestMediator> m_mediator;

    asio::io_context m_ioctx;
    asio::executor_work_guard<asio::io_context::executor_type> m_wg;

    util::thread_runner m_runner;

    Impl(std::unique_ptr<core::RequestMediator> mediator)
        : m_mediator(std::move(mediator))
        , m_wg(make_work_guard(m_ioctx))
        , m_runner(m_ioctx, 1)
    {}

    ~Impl() {
        // let queued requests finish, then the runner joins
        m_wg.reset();
    }

    void generateText(core::GenerationRequest request, GenerationCb cb) {
        post(m_ioctx, [this, movecap(request, cb)]() mutable {
            cb(m_mediator->generateText(request));
        });
    }

    void classifyText(core::ClassificationRequest request, ClassificationCb cb) {
        post(m_ioctx, [this, movecap(request, cb)]() mutable {
            cb(m_mediator->classifyText(request));
        });
    }
};

Service::Service(std::unique_ptr<core::RequestMediator> mediator) {
    if (!mediator) {
        throw_ex{} << "Service requires a mediator";
    }
    m_impl = std::make_unique<Impl>(std::move(mediator));
}

Service::~Service() = default;

void Service::generateText(core::GenerationRequest request, GenerationCb cb) {
    m_impl->generateText(std::move(request), std::move(cb));
}

void Service::classifyText(core::ClassificationRequest request, ClassificationCb cb) {
    m_impl->classifyText(std::move(request), std::move(cb));
}

} // namespace lmsvc::server
