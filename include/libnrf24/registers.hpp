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
#include <string_view>

#include "units.hpp"

namespace nrf24 {
/// Highest register address expressible in the 5-bit command encoding
constexpr u8 max_register_address = 0x1F;
/// Widest register on the chip in bytes
constexpr u8 max_register_width = 5;

enum class access : u8
{
  read_write,
  read_only,
};

/**
 * @brief Mask covering the lowest `p_bits` bits of a 64-bit value
 *
 */
constexpr u64 bit_mask(u8 p_bits) noexcept
{
  return p_bits >= 64 ? ~u64{ 0 } : (u64{ 1 } << p_bits) - 1;
}

/**
 * @brief Describes one addressable register on the bus
 *
 * Register descriptors are immutable static data. Multi-byte registers hold
 * their value as an integer whose least significant byte is the first byte on
 * the wire.
 */
struct register_info
{
  std::string_view name;
  /// 5-bit address used in the R_REGISTER/W_REGISTER commands
  u8 address = 0;
  /// Size of the register in bytes
  u8 width = 1;
  /// Documented factory default value
  u64 reset_value = 0;
  access mode = access::read_write;
  /// Bits that are cleared by writing a 1 to them (interrupt flags)
  u64 clear_on_write_mask = 0;

  /// Largest value the register can hold
  [[nodiscard]] constexpr u64 max_value() const noexcept
  {
    return bit_mask(static_cast<u8>(width * 8));
  }
};

/**
 * @brief Describes one named bit-range within a register
 *
 * Fields belonging to the same register must never overlap.
 */
struct field_info
{
  std::string_view name;
  register_info const* owner = nullptr;
  u8 bit_offset = 0;
  u8 bit_width = 1;
  u64 reset_value = 0;
  access mode = access::read_write;

  /// Largest value the field can hold
  [[nodiscard]] constexpr u64 max_value() const noexcept
  {
    return bit_mask(bit_width);
  }

  /// Mask of this field's bits within the owning register
  [[nodiscard]] constexpr u64 mask() const noexcept
  {
    return max_value() << bit_offset;
  }

  /**
   * @brief Return the value of this field given the raw value of its register
   *
   * Example: `tx_ds.extract(0x21) == 1` since bit 5 of 0b0010'0001 is set.
   */
  [[nodiscard]] constexpr u64 extract(u64 p_register_value) const noexcept
  {
    return (p_register_value >> bit_offset) & max_value();
  }

  /**
   * @brief Replace this field's bits in a raw register value
   *
   * @param p_register_value - raw value of the owning register
   * @param p_value - new field value, must not exceed `max_value()`
   * @return u64 - register value with only this field's bits changed
   */
  [[nodiscard]] constexpr u64 inject(u64 p_register_value,
                                     u64 p_value) const noexcept
  {
    return (p_register_value & ~mask()) |
           ((p_value & max_value()) << bit_offset);
  }
};

/**
 * @brief Read request: either a whole register or a single field
 *
 * Implicitly constructible from both descriptors so heterogeneous lists can be
 * written as `{ reg::status, field::rf_ch }`.
 */
class target
{
public:
  enum class kind : u8
  {
    whole_register,
    field,
  };

  /// Refers to nothing. Rejected by every planner as an invalid reference.
  constexpr target() noexcept = default;

  constexpr target(register_info const& p_register) noexcept  // NOLINT
    : m_kind(kind::whole_register)
    , m_register(&p_register)
  {
  }

  constexpr target(field_info const& p_field) noexcept  // NOLINT
    : m_kind(kind::field)
    , m_register(p_field.owner)
    , m_field(&p_field)
  {
  }

  [[nodiscard]] constexpr kind type() const noexcept
  {
    return m_kind;
  }

  /// Register that must be accessed to resolve this request. May be null for
  /// a malformed field descriptor.
  [[nodiscard]] constexpr register_info const* owner() const noexcept
  {
    return m_register;
  }

  /// Field descriptor, null for whole register requests
  [[nodiscard]] constexpr field_info const* field() const noexcept
  {
    return m_field;
  }

  [[nodiscard]] constexpr u64 max_value() const noexcept
  {
    switch (m_kind) {
      case kind::whole_register:
        return m_register->max_value();
      case kind::field:
        return m_field->max_value();
    }
    return 0;
  }

  [[nodiscard]] constexpr access mode() const noexcept
  {
    switch (m_kind) {
      case kind::whole_register:
        return m_register->mode;
      case kind::field:
        return m_field->mode;
    }
    return access::read_only;
  }

  /**
   * @brief Decode this request's value from its register's raw value
   *
   */
  [[nodiscard]] constexpr u64 decode(u64 p_register_value) const noexcept
  {
    switch (m_kind) {
      case kind::whole_register:
        return p_register_value;
      case kind::field:
        return m_field->extract(p_register_value);
    }
    return 0;
  }

private:
  kind m_kind = kind::whole_register;
  register_info const* m_register = nullptr;
  field_info const* m_field = nullptr;
};

/**
 * @brief A register or field bound to the value it should be written with
 *
 * Use `nrf24::assign()` to construct.
 */
struct assignment
{
  nrf24::target target{};
  u64 value = 0;
};

/**
 * @brief Bind a value to a register or field for a write batch
 *
 * Example: `device.set(assign(field::pwr_up, 1), assign(field::prim_rx, 1));`
 *
 * The value is range checked when the batch is planned.
 */
constexpr assignment assign(target p_target, u64 p_value) noexcept
{
  return { .target = p_target, .value = p_value };
}

/**
 * @brief The set of registers and fields a planner accepts
 *
 * References not found in the map are rejected with
 * `nrf24::invalid_reference`. Descriptors are compared by identity, so a map
 * must be built from the same static objects that callers use.
 */
class register_map
{
public:
  constexpr register_map(std::span<register_info const* const> p_registers,
                         std::span<field_info const* const> p_fields) noexcept
    : m_registers(p_registers)
    , m_fields(p_fields)
  {
  }

  /**
   * @brief Look up a register by its address
   *
   * @return register_info const* - the register or nullptr if not in the map
   */
  [[nodiscard]] constexpr register_info const* find(
    u8 p_address) const noexcept
  {
    for (auto const* reg : m_registers) {
      if (reg->address == p_address) {
        return reg;
      }
    }
    return nullptr;
  }

  [[nodiscard]] constexpr bool contains(
    register_info const& p_register) const noexcept
  {
    return find(p_register.address) == &p_register;
  }

  [[nodiscard]] constexpr bool contains(
    field_info const& p_field) const noexcept
  {
    for (auto const* field : m_fields) {
      if (field == &p_field) {
        return p_field.owner != nullptr && contains(*p_field.owner);
      }
    }
    return false;
  }

  [[nodiscard]] constexpr bool contains(target const& p_target) const noexcept
  {
    if (p_target.owner() == nullptr) {
      return false;
    }
    switch (p_target.type()) {
      case target::kind::whole_register:
        return contains(*p_target.owner());
      case target::kind::field:
        return contains(*p_target.field());
    }
    return false;
  }

  [[nodiscard]] constexpr std::span<register_info const* const> registers()
    const noexcept
  {
    return m_registers;
  }

  [[nodiscard]] constexpr std::span<field_info const* const> fields()
    const noexcept
  {
    return m_fields;
  }

private:
  std::span<register_info const* const> m_registers;
  std::span<field_info const* const> m_fields;
};
}  // namespace nrf24
