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
#include <span>

#include "register_bus.hpp"
#include "registers.hpp"
#include "units.hpp"

namespace nrf24 {
/// Number of distinct register addresses a plan can touch
constexpr usize max_planned_registers = max_register_address + 1;

enum class direction : u8
{
  read,
  write,
};

/**
 * @brief One register transaction in the order it will be put on the bus
 *
 */
struct planned_transaction
{
  u8 address = 0;
  u8 width = 0;
  direction dir = direction::read;

  bool operator==(planned_transaction const&) const = default;
};

/**
 * @brief Plan for reading any mix of registers and fields
 *
 * Every distinct register address referenced by the requests is read exactly
 * once, in order of first appearance. Results are decoded back into the order
 * of the requests, duplicates included.
 *
 * The plan keeps a view of the request list passed to its constructor, which
 * must outlive the plan.
 */
class read_plan
{
public:
  /**
   * @brief Plan the reads for a list of requests
   *
   * @param p_map - registers and fields the requests may reference
   * @param p_targets - requests, at least one
   * @throws nrf24::invalid_reference - if the list is empty or a request is
   * not part of p_map or lies beyond the last register address.
   */
  read_plan(register_map const& p_map, std::span<target const> p_targets);

  /**
   * @brief Transactions this plan will issue, all reads
   *
   */
  [[nodiscard]] std::span<planned_transaction const> transactions() const
  {
    return std::span(m_transactions).first(m_count);
  }

  /**
   * @brief Perform the reads and decode the results
   *
   * `p_results` is only written once every read has completed, so a failing
   * bus leaves it untouched.
   *
   * @param p_bus - bus to read from
   * @param p_results - one value per request, in request order. Must be at
   * least as long as the request list.
   * @throws nrf24::value_out_of_range - if p_results is too short
   */
  void execute(register_bus& p_bus, std::span<u64> p_results) const;

private:
  std::span<target const> m_targets;
  std::array<planned_transaction, max_planned_registers> m_transactions{};
  /// Index into m_transactions for each register address
  std::array<u8, max_planned_registers> m_slot{};
  usize m_count = 0;
};

/**
 * @brief Per register work of a write plan
 *
 */
struct register_update
{
  u8 address = 0;
  u8 width = 0;
  /// True when only fields are written and the other bits must be preserved
  bool read_first = false;
  /// Bits written by the batch
  u64 mask = 0;
  /// New content of the masked bits
  u64 bits = 0;
  /// Bits of the current value that must be written back as zero
  u64 clear_on_write_mask = 0;

  /**
   * @brief Compose the value to write from the register's current content
   *
   */
  [[nodiscard]] constexpr u64 merge(u64 p_current) const noexcept
  {
    return (p_current & ~mask & ~clear_on_write_mask) | bits;
  }
};

/**
 * @brief Plan for writing any mix of registers and fields
 *
 * Assignments are grouped by register in order of first appearance. Each
 * register is written exactly once. Registers written only through fields are
 * read once beforehand so that bits not covered by the batch keep their value.
 * A whole register write never causes a read. When the same register is given
 * several whole register values, the last one wins.
 *
 * Writes are not atomic across registers. If the bus fails part way through
 * `execute()`, the registers grouped before the failure have already been
 * written.
 */
class write_plan
{
public:
  /**
   * @brief Validate and plan a write batch
   *
   * Nothing touches the bus if this throws.
   *
   * @param p_map - registers and fields the assignments may reference
   * @param p_assignments - values to write, at least one
   * @throws nrf24::invalid_reference - if the list is empty or an assignment
   * is not part of p_map or lies beyond the last register address.
   * @throws nrf24::value_out_of_range - if a value exceeds the field's bit
   * width or the register's byte width.
   * @throws nrf24::operation_not_permitted - if a read-only register or field
   * is written, or if a register receives both a whole register value and field
   * values in the same batch.
   */
  write_plan(register_map const& p_map,
             std::span<assignment const> p_assignments);

  [[nodiscard]] std::span<register_update const> updates() const
  {
    return std::span(m_updates).first(m_count);
  }

  /**
   * @brief Transactions this plan will issue, in order
   *
   * @param p_buffer - storage for the list, 2 entries per register suffices
   * @return std::span<planned_transaction const> - the used part of p_buffer
   */
  std::span<planned_transaction const> transactions(
    std::span<planned_transaction> p_buffer) const;

  /**
   * @brief Perform the read-modify-writes and writes
   *
   * @param p_bus - bus to write to
   * @return byte - STATUS of the last transaction
   */
  byte execute(register_bus& p_bus) const;

private:
  std::array<register_update, max_planned_registers> m_updates{};
  usize m_count = 0;
};
}  // namespace nrf24
