// Copyright 2025 the libnrf24 contributors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>

#include "interrupt_pin.hpp"
#include "units.hpp"

namespace nrf24 {
/**
 * @brief Cancellable blocking wait on an interrupt line
 *
 * One thread at a time may block in `wait()`. Any thread may call `cancel()`,
 * including when nobody is waiting, in which case the next `wait()` returns
 * `outcome::cancelled` immediately. Several cancels before the next wait count
 * as one.
 *
 * The event flag, the cancel flag and the condition variable are only touched
 * with the mutex held, so a trigger or cancel that arrives between the caller
 * deciding to wait and the thread going to sleep is never lost.
 *
 * Usage:
 *
 * ```C++
 * nrf24::irq_waiter waiter(irq_pin);
 *
 * // thread 1
 * switch (waiter.wait(100ms)) { ... }
 *
 * // thread 2
 * waiter.cancel();
 * ```
 */
class irq_waiter
{
public:
  enum class outcome : u8
  {
    /// The interrupt line reached its active state
    event,
    /// `cancel()` was called
    cancelled,
    /// The timeout elapsed first
    timed_out,
  };

  /**
   * @brief Take over an interrupt pin
   *
   * The pin is configured immediately. It stays disarmed outside of `wait()`.
   *
   * @param p_pin - interrupt line, must outlive this object
   * @param p_settings - trigger condition, falling edge by default since the
   * nRF24L01+ IRQ output is active low.
   */
  explicit irq_waiter(interrupt_pin& p_pin,
                      interrupt_pin::settings const& p_settings = {});

  irq_waiter(irq_waiter const&) = delete;
  irq_waiter& operator=(irq_waiter const&) = delete;
  irq_waiter(irq_waiter&&) = delete;
  irq_waiter& operator=(irq_waiter&&) = delete;
  ~irq_waiter() = default;

  /**
   * @brief Block until the interrupt line triggers, a cancel, or a timeout
   *
   * If the line is already at its active level when the wait begins (a level
   * held interrupt that fired earlier), that counts as the event. If both a
   * cancel and an event are pending when the thread wakes, the cancel wins and
   * is consumed.
   *
   * @param p_timeout - maximum time to block, std::nullopt blocks until an
   * event or cancel. So does a timeout too long for the steady clock, such
   * as `time_duration::max()`.
   * @return outcome - why the wait ended
   * @throws nrf24::hardware_error - if the pin could not be armed. The waiter
   * is idle again afterwards.
   * @throws nrf24::operation_not_permitted - if another thread is already
   * waiting.
   */
  outcome wait(std::optional<time_duration> p_timeout = std::nullopt);

  /**
   * @brief Wake the current waiter, or make the next wait return immediately
   *
   * Safe to call from any thread.
   */
  void cancel() noexcept;

  /**
   * @brief Whether a thread is currently blocked in `wait()`
   *
   */
  [[nodiscard]] bool waiting() const;

private:
  [[nodiscard]] bool line_active();
  outcome block(std::optional<time_duration> p_timeout);
  void on_trigger(bool p_state) noexcept;

  interrupt_pin* m_pin;
  interrupt_pin::trigger m_trigger;
  mutable std::mutex m_mutex;
  std::condition_variable m_signal;
  bool m_waiting = false;
  bool m_event_pending = false;
  bool m_cancel_pending = false;
};
}  // namespace nrf24
