// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <core/Types.hpp>
#include <itlib/ufunction.hpp>
#include <memory>

namespace lmsvc::core {
class RequestMediator;
}

namespace lmsvc::server {

// runs mediator calls on a dedicated worker thread, one at a time in submission order
// callbacks are invoked on the worker thread
class Service {
public:
    explicit Service(std::unique_ptr<core::RequestMediator> mediator);
    ~Service(); // waits for pending requests

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    using GenerationCb = itlib::ufunction<void(core::Result<core::GenerationResponse>)>;
    using ClassificationCb = itlib::ufunction<void(core::Result<core::ClassificationResponse>)>;

    void generateText(core::GenerationRequest request, GenerationCb cb);
    void classifyText(core::ClassificationRequest request, ClassificationCb cb);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace lmsvc::server
