// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "throw_ex.hpp"

#include <cstddef>
#include <thread>
#include <vector>

namespace lmsvc::util {

// runs ctx.run() on n threads
// the threads are joined on destruction, so the context must run out of work (or be stopped) by then
class thread_runner {
    std::vector<std::thread> m_threads; // would use jthread, but apple clang still doesn't support them
public:
    thread_runner() = default;

    template <typename Ctx>
    thread_runner(Ctx& ctx, size_t n) {
        start(ctx, n);
    }

    thread_runner(const thread_runner&) = delete;
    thread_runner& operator=(const thread_runner&) = delete;

    ~thread_runner() {
        join();
    }

    template <typename Ctx>
    void start(Ctx& ctx, size_t n) {
        if (!m_threads.empty()) {
            throw_ex{} << "thread_runner is already running " << m_threads.size() << " threads";
        }
        if (n == 0) {
            throw_ex{} << "thread_runner needs at least one thread";
        }
        m_threads.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            m_threads.emplace_back([&ctx] {
                ctx.run();
            });
        }
    }

    void join() {
        for (auto& t : m_threads) {
            t.join();
        }
        m_threads.clear();
    }

    size_t num_threads() const noexcept {
        return m_threads.size();
    }

    bool empty() const noexcept {
        return m_threads.empty();
    }
};

} // namespace lmsvc::util
