/**
 * @file    cancellation.cpp
 * @brief   Interrupt flag implementation
 * @license MIT
 */

#include "core/cancellation.hpp"
#include "core/types.hpp"

#include <atomic>
#include <csignal>

#ifndef _WIN32
#include <signal.h>
#endif

namespace pdm {

namespace {

std::atomic<bool> g_cancelled{false};

void on_interrupt(int) {
    g_cancelled.store(true, std::memory_order_relaxed);
}

}  // anonymous namespace

void install_interrupt_handler() {
#ifdef _WIN32
    std::signal(SIGINT, on_interrupt);
#else
    struct sigaction action{};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART
    sigaction(SIGINT, &action, nullptr);
#endif
}

bool cancel_requested() noexcept {
    return g_cancelled.load(std::memory_order_relaxed);
}

void request_cancel() noexcept {
    g_cancelled.store(true, std::memory_order_relaxed);
}

void reset_cancel() noexcept {
    g_cancelled.store(false, std::memory_order_relaxed);
}

void throw_if_cancelled() {
    if (cancel_requested()) {
        throw UserCancelled();
    }
}

}  // namespace pdm
