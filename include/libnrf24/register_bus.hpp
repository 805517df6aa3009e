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

#include <span>

#include "spi_bus.hpp"
#include "units.hpp"

namespace nrf24 {
/**
 * @brief nRF24L01+ SPI command set
 *
 */
namespace command {
constexpr byte read_register = 0b0000'0000;
constexpr byte write_register = 0b0010'0000;
constexpr byte register_address_mask = 0b0001'1111;
constexpr byte read_rx_payload = 0b0110'0001;
constexpr byte write_tx_payload = 0b1010'0000;
constexpr byte flush_tx = 0b1110'0001;
constexpr byte flush_rx = 0b1110'0010;
constexpr byte reuse_tx_payload = 0b1110'0011;
constexpr byte read_rx_payload_width = 0b0110'0000;
constexpr byte write_ack_payload = 0b1010'1000;
constexpr byte write_tx_payload_no_ack = 0b1011'0000;
constexpr byte nop = 0b1111'1111;
}  // namespace command

/// Largest payload the TX and RX FIFOs accept
constexpr usize max_payload_size = 32;

/**
 * @brief Frames nRF24L01+ commands onto an spi_bus
 *
 * Every member function performs exactly one `spi_bus::transfer()`. The chip
 * shifts its STATUS register out while the command byte is shifted in, so every
 * command returns STATUS and the last one seen is kept in `last_status()`.
 *
 * Errors thrown by the spi_bus implementation propagate unchanged.
 */
class register_bus
{
public:
  explicit register_bus(spi_bus& p_spi);

  /**
   * @brief Read a register
   *
   * @param p_address - 5-bit register address
   * @param p_width - number of bytes to read, 1 to 5
   * @return u64 - register value, first byte on the wire is the least
   * significant byte.
   */
  u64 read_register(u8 p_address, u8 p_width);

  /**
   * @brief Write a register
   *
   * @param p_address - 5-bit register address
   * @param p_width - number of bytes to write, 1 to 5
   * @param p_value - value to write, least significant byte first on the wire
   * @return byte - STATUS
   */
  byte write_register(u8 p_address, u8 p_width, u64 p_value);

  /**
   * @brief Issue a command followed by a data phase
   *
   * @param p_command - command byte
   * @param p_data_out - bytes to send after the command byte
   * @return byte - STATUS
   */
  byte write_command(byte p_command, std::span<byte const> p_data_out);

  /**
   * @brief Issue a command and read back its data phase
   *
   * The data phase clocks out `command::nop` bytes.
   *
   * @param p_command - command byte
   * @param p_data_in - receives the bytes following STATUS
   * @return byte - STATUS
   */
  byte read_command(byte p_command, std::span<byte> p_data_in);

  /**
   * @brief STATUS shifted out during the most recent transaction
   *
   */
  [[nodiscard]] byte last_status() const
  {
    return m_last_status;
  }

private:
  /// Command byte plus the largest data phase
  static constexpr usize max_transaction = 1 + max_payload_size;

  byte transact(std::span<byte const> p_out, std::span<byte> p_in);

  spi_bus* m_spi;
  byte m_last_status = 0;
};
}  // namespace nrf24
