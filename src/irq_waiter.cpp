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

#include <libnrf24/irq_waiter.hpp>

#include <chrono>

#include <libnrf24/error.hpp>

namespace nrf24 {
namespace {
/// Returns the waiter to idle however `wait()` is left
class wait_scope
{
public:
  wait_scope(std::mutex& p_mutex, bool& p_waiting, bool& p_event_pending)
    : m_mutex(&p_mutex)
    , m_waiting(&p_waiting)
    , m_event_pending(&p_event_pending)
  {
  }

  wait_scope(wait_scope const&) = delete;
  wait_scope& operator=(wait_scope const&) = delete;

  ~wait_scope()
  {
    std::lock_guard lock(*m_mutex);
    *m_waiting = false;
    *m_event_pending = false;
  }

private:
  std::mutex* m_mutex;
  bool* m_waiting;
  bool* m_event_pending;
};
}  // namespace

irq_waiter::irq_waiter(interrupt_pin& p_pin,
                       interrupt_pin::settings const& p_settings)
  : m_pin(&p_pin)
  , m_trigger(p_settings.edge)
{
  m_pin->configure(p_settings);
}

bool irq_waiter::line_active()
{
  switch (m_trigger) {
    case interrupt_pin::trigger::falling_edge:
      return not m_pin->level();
    case interrupt_pin::trigger::rising_edge:
      return m_pin->level();
    case interrupt_pin::trigger::both_edges:
      // Any transition counts, so there is no level to sample.
      return false;
  }
  return false;
}

void irq_waiter::on_trigger(bool) noexcept
{
  {
    std::lock_guard lock(m_mutex);
    if (not m_waiting) {
      return;
    }
    m_event_pending = true;
  }
  m_signal.notify_all();
}

irq_waiter::outcome irq_waiter::wait(std::optional<time_duration> p_timeout)
{
  {
    std::lock_guard lock(m_mutex);
    if (m_waiting) {
      safe_throw(operation_not_permitted(this));
    }
    if (m_cancel_pending) {
      m_cancel_pending = false;
      return outcome::cancelled;
    }
    m_waiting = true;
    m_event_pending = false;
  }

  wait_scope scope(m_mutex, m_waiting, m_event_pending);

  // Armed without holding the mutex: some drivers call the handler from
  // within on_trigger() when the line is already active.
  m_pin->on_trigger([this](interrupt_pin::handler_tag, bool p_state) {
    on_trigger(p_state);
  });

  outcome result = outcome::timed_out;
  try {
    result = block(p_timeout);
  } catch (...) {
    m_pin->on_trigger(std::nullopt);
    throw;
  }
  m_pin->on_trigger(std::nullopt);

  return result;
}

irq_waiter::outcome irq_waiter::block(std::optional<time_duration> p_timeout)
{
  bool const already_active = line_active();

  std::unique_lock lock(m_mutex);
  if (already_active) {
    m_event_pending = true;
  }

  auto const ready = [this]() { return m_event_pending || m_cancel_pending; };

  // A deadline past the end of the clock is the same as no deadline
  auto const now = std::chrono::steady_clock::now();
  auto const headroom = std::chrono::steady_clock::time_point::max() - now;
  if (p_timeout && *p_timeout < headroom) {
    if (not m_signal.wait_until(lock, now + *p_timeout, ready)) {
      return outcome::timed_out;
    }
  } else {
    m_signal.wait(lock, ready);
  }

  if (m_cancel_pending) {
    m_cancel_pending = false;
    return outcome::cancelled;
  }
  return outcome::event;
}

void irq_waiter::cancel() noexcept
{
  {
    std::lock_guard lock(m_mutex);
    m_cancel_pending = true;
  }
  m_signal.notify_all();
}

bool irq_waiter::waiting() const
{
  std::lock_guard lock(m_mutex);
  return m_waiting;
}
}  // namespace nrf24
