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

#include <optional>

#include "functional.hpp"
#include "units.hpp"

namespace nrf24 {
/**
 * @brief Abstraction for the interrupt request (IRQ) input line
 *
 * Use this to automatically call a function when the pin's state has
 * transitioned, and to sample its current level.
 *
 * The transition states are:
 *
 *   - falling edge: the pin reads a transitions from HIGH to LOW
 *   - rising edge: the pin reads a transitions from LOW to HIGH
 *   - both: the pin reads any state change
 *
 * The handler may be invoked from a thread or interrupt context owned by the
 * implementation. Handlers must be short and must not throw.
 */
class interrupt_pin
{
public:
  /**
   * @brief The condition in which an interrupt it's triggered.
   *
   */
  enum class trigger : u8
  {
    /**
     * @brief Trigger the interrupt when a pin transitions from HIGH voltage to
     * LOW voltage.
     *
     */
    falling_edge = 0,
    /**
     * @brief Trigger the interrupt when a pin transitions from LOW voltage to
     * HIGH voltage.
     *
     */
    rising_edge = 1,
    /**
     * @brief Trigger the interrupt when a pin transitions it state
     *
     */
    both_edges = 2,
  };

  /**
   * @brief Generic settings for interrupt pins
   *
   */
  struct settings
  {
    /**
     * @brief Pull resistor for an interrupt pin.
     *
     * The nRF24L01+ drives its IRQ output actively, but a pull up keeps the
     * line from floating while the chip is unpowered.
     */
    pin_resistor resistor = pin_resistor::pull_up;

    /**
     * @brief The trigger condition that will signal the system to run the
     * callback.
     *
     */
    trigger edge = trigger::falling_edge;

    /**
     * @brief Enables default comparison
     *
     */
    bool operator==(settings const&) const = default;
  };

  /**
   * @brief Disambiguation tag object for interrupt pin handlers
   *
   */
  struct handler_tag
  {};

  /**
   * @brief Handler for edge triggered interrupts
   *
   * The input parameter `p_state` is the state of the pin when the interrupt
   * was triggered.
   */
  using optional_handler =
    std::optional<callback<void(handler_tag, bool p_state)>>;

  /**
   * @brief Configure the interrupt pin to match the settings supplied
   *
   * @param p_settings - settings to apply to interrupt pin
   * @throws nrf24::operation_not_supported - if the settings could not be
   * achieved.
   */
  void configure(settings const& p_settings)
  {
    driver_configure(p_settings);
  }

  /**
   * @brief Set the callback for when the interrupt occurs
   *
   * Any state transitions before this function is called are lost. Passing
   * `std::nullopt` disarms the pin. Once this returns with `std::nullopt`, the
   * previous handler will not be invoked again.
   *
   * @param p_callback - function to execute when the trigger condition occurs.
   * @throws nrf24::hardware_error - if edge detection could not be armed or
   * disarmed.
   */
  void on_trigger(optional_handler const& p_callback)
  {
    driver_on_trigger(p_callback);
  }

  /**
   * @brief Read the state of the pin
   *
   * @return bool - true indicates HIGH voltage level and false
   * indicates LOW voltage level
   */
  [[nodiscard]] bool level()
  {
    return driver_level();
  }

  virtual ~interrupt_pin() = default;

private:
  virtual void driver_configure(settings const& p_settings) = 0;
  virtual void driver_on_trigger(optional_handler const& p_callback) = 0;
  virtual bool driver_level() = 0;
};
}  // namespace nrf24
