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
#include <thread>

#include <libnrf24/error.hpp>

#include <boost/ut.hpp>

#include "fake_chip.hpp"

namespace nrf24 {
namespace {
using namespace std::chrono_literals;
using outcome = nrf24::irq_waiter::outcome;

void wait_until_waiting(irq_waiter& p_waiter)
{
  while (not p_waiter.waiting()) {
    std::this_thread::yield();
  }
}
}  // namespace

boost::ut::suite<"irq_waiter_test"> irq_waiter_test = []() {
  using namespace boost::ut;

  "configures the pin and stays disarmed"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;

    // Exercise
    irq_waiter waiter(pin);

    // Verify
    expect(interrupt_pin::settings{} == pin.configured());
    expect(not pin.armed());
    expect(not waiter.waiting());
  };

  "cancel before wait returns immediately, once"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);

    // Exercise
    waiter.cancel();
    waiter.cancel();
    auto const first = waiter.wait();
    auto const second = waiter.wait(1ms);

    // Verify
    expect(outcome::cancelled == first);
    expect(outcome::timed_out == second);
    expect(that % 1U == pin.times_armed());
  };

  "cancel from another thread wakes the waiter"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    std::thread canceller([&waiter]() {
      std::this_thread::sleep_for(10ms);
      waiter.cancel();
    });

    // Exercise
    auto const result = waiter.wait();
    canceller.join();

    // Verify
    expect(outcome::cancelled == result);
    expect(not waiter.waiting());
    expect(not pin.armed());
  };

  "the longest timeout still waits for a cancel"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    std::thread canceller([&waiter]() {
      wait_until_waiting(waiter);
      std::this_thread::sleep_for(20ms);
      waiter.cancel();
    });
    auto const start = std::chrono::steady_clock::now();

    // Exercise
    auto const result = waiter.wait(time_duration::max());
    auto const elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    // Verify
    expect(outcome::cancelled == result);
    expect(elapsed >= 20ms);
    expect(not pin.armed());
  };

  "trigger from another thread is the event"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    std::thread chip([&pin, &waiter]() {
      wait_until_waiting(waiter);
      std::this_thread::sleep_for(5ms);
      pin.assert_line();
    });

    // Exercise
    auto const result = waiter.wait(5s);
    chip.join();

    // Verify
    expect(outcome::event == result);
    expect(not pin.armed());
  };

  "timeout without an event"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    auto const start = std::chrono::steady_clock::now();

    // Exercise
    auto const result = waiter.wait(20ms);
    auto const elapsed = std::chrono::steady_clock::now() - start;

    // Verify
    expect(outcome::timed_out == result);
    expect(elapsed >= 20ms);
    expect(not pin.armed());
  };

  "line already active counts as the event"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    pin.assert_line();

    // Exercise
    auto const result = waiter.wait(5s);

    // Verify
    expect(outcome::event == result);
  };

  "edges outside of a wait are not remembered"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    pin.assert_line();
    pin.release_line();

    // Exercise
    auto const result = waiter.wait(5ms);

    // Verify
    expect(outcome::timed_out == result);
  };

  "cancel wins over a pending event"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    pin.assert_line();
    waiter.cancel();

    // Exercise
    auto const first = waiter.wait(5s);
    auto const second = waiter.wait(5s);

    // Verify
    expect(outcome::cancelled == first);
    expect(outcome::event == second);
  };

  "arming failure leaves the waiter usable"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    pin.fail_arming(true);

    // Exercise
    expect(throws<nrf24::hardware_error>([&]() { (void)waiter.wait(1s); }));
    auto const waiting_after_failure = waiter.waiting();
    pin.fail_arming(false);
    pin.assert_line();
    auto const result = waiter.wait(5s);

    // Verify
    expect(not waiting_after_failure);
    expect(outcome::event == result);
  };

  "a second concurrent waiter is refused"_test = []() {
    // Setup
    test::fake_interrupt_pin pin;
    irq_waiter waiter(pin);
    outcome first = outcome::timed_out;
    std::thread first_waiter([&waiter, &first]() { first = waiter.wait(); });
    wait_until_waiting(waiter);

    // Exercise
    expect(throws<nrf24::operation_not_permitted>(
      [&]() { (void)waiter.wait(1ms); }));
    waiter.cancel();
    first_waiter.join();

    // Verify
    expect(outcome::cancelled == first);
  };
};
}  // namespace nrf24
