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

#include <libnrf24/access_plan.hpp>

#include <libnrf24/error.hpp>

namespace nrf24 {
namespace {
constexpr u8 unassigned = 0xFF;

register_info const& resolve(register_map const& p_map,
                             target const& p_target,
                             void const* p_instance)
{
  auto const* owner = p_target.owner();
  if (owner == nullptr) {
    safe_throw(invalid_reference(0, p_instance));
  }
  if (not p_map.contains(p_target) ||
      owner->address > max_register_address) {
    safe_throw(invalid_reference(owner->address, p_instance));
  }
  return *owner;
}
}  // namespace

read_plan::read_plan(register_map const& p_map,
                     std::span<target const> p_targets)
  : m_targets(p_targets)
{
  if (p_targets.empty()) {
    safe_throw(invalid_reference(0, this));
  }

  m_slot.fill(unassigned);

  for (auto const& request : p_targets) {
    auto const& reg = resolve(p_map, request, this);
    if (m_slot[reg.address] != unassigned) {
      continue;
    }
    m_slot[reg.address] = static_cast<u8>(m_count);
    m_transactions[m_count++] = {
      .address = reg.address,
      .width = reg.width,
      .dir = direction::read,
    };
  }
}

void read_plan::execute(register_bus& p_bus, std::span<u64> p_results) const
{
  if (p_results.size() < m_targets.size()) {
    safe_throw(value_out_of_range(p_results.size(), m_targets.size(), this));
  }

  std::array<u64, max_planned_registers> raw{};
  for (usize i = 0; i < m_count; i++) {
    auto const& transaction = m_transactions[i];
    raw[i] = p_bus.read_register(transaction.address, transaction.width);
  }

  for (usize i = 0; i < m_targets.size(); i++) {
    auto const& request = m_targets[i];
    p_results[i] = request.decode(raw[m_slot[request.owner()->address]]);
  }
}

write_plan::write_plan(register_map const& p_map,
                       std::span<assignment const> p_assignments)
{
  if (p_assignments.empty()) {
    safe_throw(invalid_reference(0, this));
  }

  std::array<u8, max_planned_registers> slot{};
  std::array<bool, max_planned_registers> has_whole{};
  std::array<bool, max_planned_registers> has_field{};
  slot.fill(unassigned);

  for (auto const& [where, value] : p_assignments) {
    auto const& reg = resolve(p_map, where, this);

    if (value > where.max_value()) {
      safe_throw(value_out_of_range(value, where.max_value(), this));
    }
    if (where.mode() == access::read_only) {
      safe_throw(operation_not_permitted(this));
    }

    if (slot[reg.address] == unassigned) {
      slot[reg.address] = static_cast<u8>(m_count);
      m_updates[m_count++] = {
        .address = reg.address,
        .width = reg.width,
      };
    }
    auto& update = m_updates[slot[reg.address]];

    switch (where.type()) {
      case target::kind::whole_register:
        if (has_field[reg.address]) {
          safe_throw(operation_not_permitted(this));
        }
        has_whole[reg.address] = true;
        update.read_first = false;
        update.mask = reg.max_value();
        update.bits = value;
        update.clear_on_write_mask = 0;
        break;
      case target::kind::field: {
        if (has_whole[reg.address]) {
          safe_throw(operation_not_permitted(this));
        }
        has_field[reg.address] = true;
        auto const& field = *where.field();
        update.read_first = true;
        update.mask |= field.mask();
        update.bits = field.inject(update.bits, value);
        update.clear_on_write_mask = reg.clear_on_write_mask;
        break;
      }
    }
  }
}

std::span<planned_transaction const> write_plan::transactions(
  std::span<planned_transaction> p_buffer) const
{
  usize used = 0;
  auto push = [&](planned_transaction p_transaction) {
    if (used >= p_buffer.size()) {
      safe_throw(value_out_of_range(used + 1, p_buffer.size(), this));
    }
    p_buffer[used++] = p_transaction;
  };

  for (auto const& update : updates()) {
    if (update.read_first) {
      push({ update.address, update.width, direction::read });
    }
    push({ update.address, update.width, direction::write });
  }

  return p_buffer.first(used);
}

byte write_plan::execute(register_bus& p_bus) const
{
  byte status = p_bus.last_status();
  for (auto const& update : updates()) {
    u64 current = 0;
    if (update.read_first) {
      current = p_bus.read_register(update.address, update.width);
    }
    status =
      p_bus.write_register(update.address, update.width, update.merge(current));
  }
  return status;
}
}  // namespace nrf24
