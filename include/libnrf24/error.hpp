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

#include <cstdint>
#include <system_error>
#include <type_traits>

namespace nrf24 {

template<class thrown_t>
void safe_throw(thrown_t&& p_thrown_object)
{
  static_assert(
    std::is_trivially_destructible_v<std::remove_cvref_t<thrown_t>>,
    "safe_throw() only works with trivially destructible thrown types");

  throw p_thrown_object;
}

/**
 * @brief Base exception class for all libnrf24 exceptions
 *
 */
class exception
{
public:
  constexpr exception(std::errc p_error_code, void const* p_instance)
    : m_instance(p_instance)
    , m_error_code(p_error_code)
  {
  }

  /**
   * @brief address of the object that threw an exception
   *
   * If the exception was thrown by a free function, this will be a nullptr.
   * Exception handlers can compare this address against the drivers used
   * within their try block to find out which one failed and craft a more
   * accurate log message. The address must only be used for lookup. The
   * object behind it may no longer be alive.
   */
  [[nodiscard]] void const* instance() const
  {
    return m_instance;
  }

  /**
   * @brief Convert this exception to the closest C++ error code
   *
   * Useful when a C API expects an error code back from a callback. Prefer
   * catching the derived types when the goal is recovery.
   *
   * @return std::errc - error code represented by the exception
   */
  [[nodiscard]] std::errc error_code() const
  {
    return m_error_code;
  }

private:
  void const* m_instance = nullptr;
  std::errc m_error_code{};
};

static_assert(std::is_trivially_destructible_v<exception>,
              "nrf24::exception MUST be trivially destructible.");

/**
 * @brief Raised when a register or field is not part of the register map the
 * driver was built with.
 *
 * This is a programming error. It is raised before any bus access occurs.
 *
 * # How to recover from this?
 *
 * Not recoverable. Fix the reference or add it to the register map.
 */
struct invalid_reference : public exception
{
  /**
   * @brief Construct a new invalid_reference exception
   *
   * @param p_address - address of the register that could not be resolved
   * @param p_instance - must point to the instance of the driver that threw
   * this exception.
   */
  constexpr invalid_reference(std::uint8_t p_address, void const* p_instance)
    : exception(std::errc::invalid_argument, p_instance)
    , address(p_address)
  {
  }

  std::uint8_t address;
};

/**
 * @brief Raised when a value does not fit in the field or register it is
 * destined for, or when a payload length is outside of what the chip accepts.
 *
 * Raised before any bus access occurs, so the chip is never left partially
 * written by this error.
 *
 * # How to recover from this?
 *
 * Not recoverable. This indicates a programming error in the caller.
 */
struct value_out_of_range : public exception
{
  constexpr value_out_of_range(std::uint64_t p_value,
                               std::uint64_t p_maximum,
                               void const* p_instance)
    : exception(std::errc::result_out_of_range, p_instance)
    , value(p_value)
    , maximum(p_maximum)
  {
  }

  std::uint64_t value;
  std::uint64_t maximum;
};

/**
 * @brief Raised when the bus transfer primitive failed
 *
 * Implementations of `nrf24::spi_bus` throw this when the transfer could not
 * be performed. The driver never retries on its own, the right retry policy
 * depends on the wiring and timing of the board.
 *
 * A failed write batch may have already updated the registers that were
 * grouped before the failing one.
 *
 * # How to recover from this?
 *
 * Retry at the application level if the physical bus is known to be
 * intermittent. Otherwise treat it as a hardware fault.
 */
struct transport_error : public exception
{
  constexpr transport_error(void const* p_instance)
    : exception(std::errc::io_error, p_instance)
  {
  }
};

/**
 * @brief Raised when the interrupt line could not be armed or disarmed
 *
 * Only raised from waits on the interrupt line. The failing wait returns to
 * idle and a new wait may be attempted.
 */
struct hardware_error : public exception
{
  constexpr hardware_error(void const* p_instance)
    : exception(std::errc::device_or_resource_busy, p_instance)
  {
  }
};

/**
 * @brief Raised when an operation is disallowed in the current state or with
 * the given combination of arguments.
 *
 * Examples: writing a read-only field, mixing a whole-register write and field
 * writes on the same register in one batch, or starting a second concurrent
 * wait on the same interrupt line.
 */
struct operation_not_permitted : public exception
{
  constexpr operation_not_permitted(void const* p_instance)
    : exception(std::errc::operation_not_permitted, p_instance)
  {
  }
};

/**
 * @brief Raised exclusively when a driver cannot configure itself based on the
 * settings passed to it, or when an optional capability was not provided.
 *
 * # How to recover from this?
 *
 * Normally, the configuration of an application is determined early at boot.
 * If the hardware cannot meet it, the application was never valid to begin
 * with. Either the code must be modified or the hardware changed.
 */
struct operation_not_supported : public exception
{
  constexpr operation_not_supported(void const* p_instance)
    : exception(std::errc::operation_not_supported, p_instance)
  {
  }
};
}  // namespace nrf24
