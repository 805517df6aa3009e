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

#include "units.hpp"

namespace nrf24 {
/**
 * @brief Serial peripheral interface (SPI) bus transfer primitive used to talk
 * to a single transceiver.
 *
 * This interface supports exactly what the nRF24L01+ requires:
 *
 * 1. Word length locked to 8-bits
 * 2. Byte transfer is always MSB first
 * 3. Every call to `transfer()` is one complete transaction
 *
 * # One transfer, one transaction
 *
 * The transceiver decodes a command from the first byte clocked in after its
 * chip select is asserted and stops at de-assertion. Implementations MUST
 * assert chip select at the start of `transfer()` and de-assert it before
 * returning. Drivers never need to hold chip select across calls.
 *
 * # Full duplex
 *
 * `p_data_out` and `p_data_in` have the same length. Byte `i` of `p_data_in`
 * is the byte clocked in while byte `i` of `p_data_out` was clocked out.
 *
 * # Bus sharing
 *
 * Mutual exclusion between several devices on the same physical bus is the
 * responsibility of the implementation or the application. Drivers built on
 * this interface perform no locking.
 */
class spi_bus
{
public:
  /**
   * @brief Mode settings which control when data is sampled and shifted out
   *
   */
  enum class mode : u8
  {
    /**
     * @brief spi mode 0
     *
     * - Data is shifted out on: falling SCLK, and when CS activates
     * - Data is sampled on: rising SCLK
     * - CPOL (clock polarity): 0
     * - CPHA (clock phase): 0
     */
    m0,

    /**
     * @brief spi mode 1
     *
     * - Data is shifted out on: rising SCLK
     * - Data is sampled on: falling SCLK
     * - CPOL (clock polarity): 0
     * - CPHA (clock phase): 1
     */
    m1,

    /**
     * @brief spi mode 2
     *
     * - Data is shifted out on: rising SCLK, and when CS activates
     * - Data is sampled on: falling SCLK
     * - CPOL (clock polarity): 1
     * - CPHA (clock phase): 0
     */
    m2,

    /**
     * @brief spi mode 3
     *
     * - Data is shifted out on: falling SCLK
     * - Data is sampled on: rising SCLK
     * - CPOL (clock polarity): 1
     * - CPHA (clock phase): 1
     */
    m3,
  };

  /**
   * @brief Generic settings for a standard SPI device.
   *
   */
  struct settings
  {
    /**
     * @brief Best-effort clock rate to set the spi bus to
     *
     * The bus will run at a clock rate less than or equal to this value.
     */
    hertz clock_rate = 100_kHz;

    /**
     * @brief Bus mode select field
     *
     * Use this to select how the spi data and clock are sampled.
     */
    mode bus_mode = mode::m0;

    /**
     * @brief Enables default comparison
     *
     */
    bool operator==(settings const&) const = default;
  };

  /**
   * @brief Set the spi settings for this bus
   *
   * @param p_settings - settings to apply to the bus
   * @throws nrf24::operation_not_supported - if the mode cannot be
   * accommodated by the spi bus hardware or implementation of spi.
   */
  void configure(settings const& p_settings)
  {
    return driver_configure(p_settings);
  }

  /**
   * @brief Perform one full-duplex, chip select framed transaction.
   *
   * This function will block until the entire transfer is finished.
   *
   * @param p_data_out - bytes to clock out onto the bus
   * @param p_data_in - buffer receiving the bytes clocked in. Must be the same
   * length as p_data_out.
   * @throws nrf24::transport_error - if the transfer could not be performed
   */
  void transfer(std::span<byte const> p_data_out, std::span<byte> p_data_in)
  {
    return driver_transfer(p_data_out, p_data_in);
  }

  virtual ~spi_bus() = default;

private:
  virtual void driver_configure(settings const& p_settings) = 0;
  virtual void driver_transfer(std::span<byte const> p_data_out,
                               std::span<byte> p_data_in) = 0;
};
}  // namespace nrf24
