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

#include <array>
#include <concepts>
#include <optional>
#include <span>
#include <string_view>

#include "interrupt_pin.hpp"
#include "irq_waiter.hpp"
#include "nrf24l01p.hpp"
#include "output_pin.hpp"
#include "register_bus.hpp"
#include "registers.hpp"
#include "spi_bus.hpp"
#include "units.hpp"

namespace nrf24 {
/**
 * @brief Driver for a single nRF24L01+ transceiver
 *
 * The driver is deliberately low level. It gives access to every register and
 * field by name and to the FIFO commands, and leaves configuration sequences
 * and power mode timing (Tpd2stby, Tstby2a, ...) to the application.
 *
 * All member functions except `cancel_wait()` must be called from one thread
 * at a time. `cancel_wait()` may be called from any thread while another one
 * is blocked in `wait_for_irq()`.
 *
 * Example, receive 1 byte packets:
 *
 * ```C++
 * nrf24::device radio(spi, ce_pin);
 * radio.reset_to_default();
 * radio.set(assign(field::prim_rx, 1),
 *           assign(field::pwr_up, 1),
 *           assign(field::rx_pw_p0, 1));
 * // wait Tpd2stby
 * radio.chip_enable_high();
 * while (radio.get(field::rx_empty)) {
 * }
 * std::array<nrf24::byte, 1> payload{};
 * radio.read_rx_payload(payload);
 * ```
 */
class device
{
public:
  /// Bus settings applied on construction
  static constexpr spi_bus::settings bus_settings{
    .clock_rate = 10_MHz,
    .bus_mode = spi_bus::mode::m0,
  };

  /**
   * @brief Construct a driver without an interrupt line
   *
   * `wait_for_irq()` is unavailable on such a device.
   *
   * @param p_spi - bus with the chip's CSN as chip select
   * @param p_chip_enable - CE line
   */
  device(spi_bus& p_spi, output_pin& p_chip_enable);

  /**
   * @brief Construct a driver with an interrupt line
   *
   * @param p_spi - bus with the chip's CSN as chip select
   * @param p_chip_enable - CE line
   * @param p_irq - the chip's active low IRQ output
   */
  device(spi_bus& p_spi, output_pin& p_chip_enable, interrupt_pin& p_irq);

  device(device const&) = delete;
  device& operator=(device const&) = delete;
  device(device&&) = delete;
  device& operator=(device&&) = delete;
  ~device() = default;

  void chip_enable_high();
  void chip_enable_low();

  /**
   * @brief Read any mix of registers and fields
   *
   * Each register involved is read once, whatever the number of requests that
   * reference it.
   *
   * ```C++
   * auto rx_full = radio.get(field::rx_full);
   * auto [rx_full, arc_cnt, p5] =
   *   radio.get(field::rx_full, field::arc_cnt, reg::rx_addr_p5);
   * ```
   *
   * @return u64 for a single request, otherwise std::array<u64, N> in request
   * order.
   * @throws nrf24::invalid_reference - if a request is not an nRF24L01+
   * register or field.
   * @throws nrf24::transport_error - if the bus failed. Nothing is returned.
   */
  template<std::convertible_to<target>... Targets>
    requires(sizeof...(Targets) >= 1)
  auto get(Targets const&... p_targets)
  {
    std::array<target, sizeof...(Targets)> const requests{ target(
      p_targets)... };
    std::array<u64, sizeof...(Targets)> values{};
    read(requests, values);
    if constexpr (sizeof...(Targets) == 1) {
      return values[0];
    } else {
      return values;
    }
  }

  /**
   * @brief Runtime sized form of `get()`
   *
   * @param p_targets - requests
   * @param p_values - receives one value per request
   */
  void read(std::span<target const> p_targets, std::span<u64> p_values);

  /**
   * @brief Write any mix of registers and fields
   *
   * ```C++
   * radio.set(assign(reg::rx_addr_p0, 0xE7'E7'E7'E7'E7));
   * auto status = radio.set(assign(field::prim_rx, 1), assign(field::pwr_up, 1));
   * ```
   *
   * @return byte - STATUS seen during the last transaction
   * @throws nrf24::value_out_of_range - a value does not fit. Nothing is
   * written.
   * @throws nrf24::operation_not_permitted - read-only target, or a register
   * receives both a whole value and field values. Nothing is written.
   * @throws nrf24::transport_error - registers grouped before the failure have
   * already been written.
   */
  template<std::same_as<assignment>... Assignments>
    requires(sizeof...(Assignments) >= 1)
  byte set(Assignments const&... p_assignments)
  {
    std::array<assignment, sizeof...(Assignments)> const batch{
      p_assignments...
    };
    return write(batch);
  }

  /**
   * @brief Runtime sized form of `set()`
   *
   */
  byte write(std::span<assignment const> p_assignments);

  /**
   * @brief Read the low bytes of a register
   *
   * With SETUP_AW below 5 bytes, only the low 3 or 4 bytes of RX_ADDR_P0,
   * RX_ADDR_P1 and TX_ADDR are in use:
   *
   * ```C++
   * auto const width = static_cast<u8>(radio.get(field::aw) + 2);
   * auto const address = radio.read_register(reg::tx_addr, width);
   * ```
   *
   * @param p_register - register to read
   * @param p_width - number of bytes, 1 to the register's width
   * @return u64 - the bytes read, LSByte first
   * @throws nrf24::invalid_reference - if the register is not an nRF24L01+
   * register.
   * @throws nrf24::value_out_of_range - if the width does not fit the register
   * @throws nrf24::transport_error - if the bus failed
   */
  u64 read_register(register_info const& p_register, u8 p_width);

  /**
   * @brief Describe a register's fields and their current values
   *
   * All fields are read with a single transaction. Output for CONFIG:
   *
   * ```
   * Register CONFIG at 0x00:
   *   MASK_RX_DR (bit 6): 0
   *   ...
   *   PRIM_RX (bit 0): 0
   * ```
   *
   * A register without fields is shown as one hexadecimal value.
   *
   * @param p_register - register to describe
   * @param p_buffer - receives the text, without a null terminator
   * @return std::string_view - the text, within p_buffer
   * @throws nrf24::invalid_reference - if the register is not an nRF24L01+
   * register.
   * @throws nrf24::value_out_of_range - if p_buffer is too small
   * @throws nrf24::transport_error - if the bus failed
   */
  std::string_view dump(register_info const& p_register,
                        std::span<char> p_buffer);

  /**
   * @brief Push a payload into the TX FIFO
   *
   * @param p_payload - 1 to 32 bytes
   * @return byte - STATUS
   * @throws nrf24::value_out_of_range - if the payload length is invalid
   */
  byte write_tx_payload(std::span<byte const> p_payload);

  /**
   * @brief Push a payload that will not request an acknowledgement
   *
   * Requires EN_DYN_ACK. Used in TX mode.
   */
  byte write_tx_payload_no_ack(std::span<byte const> p_payload);

  /**
   * @brief Queue a payload sent back with the next ACK on a pipe
   *
   * Used in RX mode. At most three ACK payloads can be pending.
   *
   * @param p_pipe - data pipe 0 to 5
   * @param p_payload - 1 to 32 bytes
   * @return byte - STATUS
   */
  byte write_ack_payload(u8 p_pipe, std::span<byte const> p_payload);

  /**
   * @brief Pop a payload from the RX FIFO
   *
   * @param p_payload - receives the payload, 1 to 32 bytes
   * @return byte - STATUS clocked out with the command
   */
  byte read_rx_payload(std::span<byte> p_payload);

  struct payload_width
  {
    byte status;
    u8 width;
  };

  /**
   * @brief Width of the payload at the top of the RX FIFO
   *
   * Flush the RX FIFO if the width is larger than 32.
   */
  payload_width rx_payload_width();

  byte flush_tx();
  byte flush_rx();

  /**
   * @brief Resend the last transmitted payload
   *
   * Active until W_TX_PAYLOAD or FLUSH_TX.
   */
  byte reuse_tx_payload();

  /// Read STATUS with a NOP command
  byte status();

  [[nodiscard]] byte last_status() const
  {
    return m_bus.last_status();
  }

  /**
   * @brief Put the chip back in its power on state
   *
   * Drives CE low, flushes both FIFOs and writes every writable register with
   * its factory default in one batch. Pending interrupt flags are cleared.
   */
  void reset_to_default();

  /**
   * @brief Block until the IRQ line is asserted, a cancel, or a timeout
   *
   * @param p_timeout - maximum time to block, std::nullopt for no limit
   * @return irq_waiter::outcome - why the wait ended
   * @throws nrf24::operation_not_supported - if the device has no IRQ line
   * @throws nrf24::hardware_error - if the IRQ line could not be armed
   */
  irq_waiter::outcome wait_for_irq(
    std::optional<time_duration> p_timeout = std::nullopt);

  /**
   * @brief Wake a thread blocked in `wait_for_irq()`
   *
   * If no thread is waiting, the next `wait_for_irq()` returns immediately.
   * Does nothing on a device without an IRQ line.
   */
  void cancel_wait();

private:
  byte write_payload(byte p_command, std::span<byte const> p_payload);

  register_map m_map;
  register_bus m_bus;
  output_pin* m_chip_enable;
  std::optional<irq_waiter> m_irq;
};
}  // namespace nrf24
