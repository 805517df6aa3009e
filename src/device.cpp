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

#include <libnrf24/device.hpp>

#include <algorithm>
#include <cstdio>

#include <libnrf24/access_plan.hpp>
#include <libnrf24/error.hpp>

namespace nrf24 {
namespace {
constexpr u8 max_pipe = 5;
constexpr usize max_register_bits = 8 * max_register_width;
}  // namespace

device::device(spi_bus& p_spi, output_pin& p_chip_enable)
  : m_map(nrf24l01p_map())
  , m_bus(p_spi)
  , m_chip_enable(&p_chip_enable)
{
  p_spi.configure(bus_settings);
  m_chip_enable->configure({});
  m_chip_enable->level(false);
}

device::device(spi_bus& p_spi,
               output_pin& p_chip_enable,
               interrupt_pin& p_irq)
  : device(p_spi, p_chip_enable)
{
  m_irq.emplace(p_irq);
}

void device::chip_enable_high()
{
  m_chip_enable->level(true);
}

void device::chip_enable_low()
{
  m_chip_enable->level(false);
}

void device::read(std::span<target const> p_targets, std::span<u64> p_values)
{
  read_plan const plan(m_map, p_targets);
  plan.execute(m_bus, p_values);
}

byte device::write(std::span<assignment const> p_assignments)
{
  write_plan const plan(m_map, p_assignments);
  return plan.execute(m_bus);
}

u64 device::read_register(register_info const& p_register, u8 p_width)
{
  if (not m_map.contains(p_register)) {
    safe_throw(invalid_reference(p_register.address, this));
  }
  if (p_width == 0 || p_width > p_register.width) {
    safe_throw(value_out_of_range(p_width, p_register.width, this));
  }
  return m_bus.read_register(p_register.address, p_width);
}

std::string_view device::dump(register_info const& p_register,
                              std::span<char> p_buffer)
{
  if (not m_map.contains(p_register)) {
    safe_throw(invalid_reference(p_register.address, this));
  }

  std::array<field_info const*, max_register_bits> fields{};
  std::array<target, max_register_bits> requests{};
  usize count = 0;
  for (auto const* field : m_map.fields()) {
    if (field->owner == &p_register && count < fields.size()) {
      fields[count] = field;
      requests[count] = *field;
      count++;
    }
  }
  if (count == 0) {
    requests[count++] = p_register;
  }

  std::array<u64, max_register_bits> values{};
  read(std::span(requests).first(count), values);

  usize used = 0;
  auto append = [this, &p_buffer, &used](char const* p_format,
                                         auto... p_args) {
    auto const room = p_buffer.size() - used;
    auto const length = static_cast<usize>(std::max(
      std::snprintf(p_buffer.data() + used, room, p_format, p_args...), 0));
    if (length >= room) {
      safe_throw(value_out_of_range(used + length + 1, p_buffer.size(), this));
    }
    used += length;
  };

  append("Register %.*s at 0x%02X:\n",
         static_cast<int>(p_register.name.size()),
         p_register.name.data(),
         static_cast<unsigned>(p_register.address));

  if (fields[0] == nullptr) {
    append("  value: 0x%0*llX\n",
           static_cast<int>(2 * p_register.width),
           static_cast<unsigned long long>(values[0]));
    return { p_buffer.data(), used };
  }

  for (usize i = 0; i < count; i++) {
    auto const& field = *fields[i];
    auto const name_length = static_cast<int>(field.name.size());
    auto const low = static_cast<unsigned>(field.bit_offset);
    auto const value = static_cast<unsigned long long>(values[i]);
    if (field.bit_width == 1) {
      append("  %.*s (bit %u): %llu\n", name_length, field.name.data(), low,
             value);
    } else {
      auto const high = low + field.bit_width - 1U;
      append("  %.*s (bit %u:%u): %llu\n", name_length, field.name.data(),
             high, low, value);
    }
  }

  return { p_buffer.data(), used };
}

byte device::write_payload(byte p_command, std::span<byte const> p_payload)
{
  if (p_payload.empty() || p_payload.size() > max_payload_size) {
    safe_throw(value_out_of_range(p_payload.size(), max_payload_size, this));
  }
  return m_bus.write_command(p_command, p_payload);
}

byte device::write_tx_payload(std::span<byte const> p_payload)
{
  return write_payload(command::write_tx_payload, p_payload);
}

byte device::write_tx_payload_no_ack(std::span<byte const> p_payload)
{
  return write_payload(command::write_tx_payload_no_ack, p_payload);
}

byte device::write_ack_payload(u8 p_pipe, std::span<byte const> p_payload)
{
  if (p_pipe > max_pipe) {
    safe_throw(value_out_of_range(p_pipe, max_pipe, this));
  }
  return write_payload(command::write_ack_payload | p_pipe, p_payload);
}

byte device::read_rx_payload(std::span<byte> p_payload)
{
  if (p_payload.empty() || p_payload.size() > max_payload_size) {
    safe_throw(value_out_of_range(p_payload.size(), max_payload_size, this));
  }
  return m_bus.read_command(command::read_rx_payload, p_payload);
}

device::payload_width device::rx_payload_width()
{
  std::array<byte, 1> width{};
  auto const status = m_bus.read_command(command::read_rx_payload_width, width);
  return { .status = status, .width = width[0] };
}

byte device::flush_tx()
{
  return m_bus.write_command(command::flush_tx, {});
}

byte device::flush_rx()
{
  return m_bus.write_command(command::flush_rx, {});
}

byte device::reuse_tx_payload()
{
  return m_bus.write_command(command::reuse_tx_payload, {});
}

byte device::status()
{
  return m_bus.write_command(command::nop, {});
}

void device::reset_to_default()
{
  chip_enable_low();
  flush_tx();
  flush_rx();

  std::array<assignment, max_planned_registers> defaults{};
  usize count = 0;
  for (auto const* reg : m_map.registers()) {
    if (reg->mode == access::read_only) {
      continue;
    }
    // Writing 1 to the interrupt flags clears them
    defaults[count++] =
      assign(*reg, reg->reset_value | reg->clear_on_write_mask);
  }

  write(std::span(defaults).first(count));
}

irq_waiter::outcome device::wait_for_irq(std::optional<time_duration> p_timeout)
{
  if (not m_irq) {
    safe_throw(operation_not_supported(this));
  }
  return m_irq->wait(p_timeout);
}

void device::cancel_wait()
{
  if (m_irq) {
    m_irq->cancel();
  }
}
}  // namespace nrf24
