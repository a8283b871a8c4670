/**
 * @file    cancellation.hpp
 * @brief   Process-wide interrupt flag (Ctrl+C)
 * @license MIT
 */

#pragma once

namespace pdm {

/**
 * Install the SIGINT handler. On POSIX the handler is installed without
 * SA_RESTART, so a blocking console read returns and the prompt loop can
 * observe the flag.
 */
void install_interrupt_handler();

[[nodiscard]] bool cancel_requested() noexcept;

void request_cancel() noexcept;

void reset_cancel() noexcept;

/**
 * @throws UserCancelled  if an interrupt was received
 */
void throw_if_cancelled();

}  // namespace pdm
