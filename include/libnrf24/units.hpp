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

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace nrf24 {
using byte = std::uint8_t;
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using usize = std::size_t;

/// Frequency in hertz
using hertz = u32;

/// Standard type for time durations handed to blocking APIs
using time_duration = std::chrono::nanoseconds;

/**
 * @brief Set of possible pin mode resistor settings.
 *
 * See each enumeration to get more details about when and how these should be
 * used.
 *
 */
enum class pin_resistor : u8
{
  /// No pull up. This will cause the pin to float. This may be desirable if the
  /// pin has an external resistor attached or if the signal is sensitive to
  /// external devices like resistors.
  none = 0,
  /// Pull the pin down to devices GND. This will ensure that the voltage read
  /// by the pin when there is no signal on the pin is LOW (or false).
  pull_down,
  /// See pull down explanation, but in this case the pin is pulled up to VCC,
  /// also called VDD on some systems.
  pull_up,
};

namespace literals {
// NOLINTNEXTLINE(google-runtime-int)
constexpr hertz operator""_Hz(unsigned long long p_value) noexcept
{
  return static_cast<hertz>(p_value);
}

// NOLINTNEXTLINE(google-runtime-int)
constexpr hertz operator""_kHz(unsigned long long p_value) noexcept
{
  return static_cast<hertz>(p_value * 1'000);
}

// NOLINTNEXTLINE(google-runtime-int)
constexpr hertz operator""_MHz(unsigned long long p_value) noexcept
{
  return static_cast<hertz>(p_value * 1'000'000);
}
}  // namespace literals

using namespace literals;
}  // namespace nrf24
