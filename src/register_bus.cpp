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

#include <libnrf24/register_bus.hpp>

#include <algorithm>
#include <array>

#include <libnrf24/error.hpp>
#include <libnrf24/registers.hpp>

namespace nrf24 {
namespace {
void check_register(u8 p_address, u8 p_width, void const* p_instance)
{
  if (p_address > max_register_address) {
    safe_throw(invalid_reference(p_address, p_instance));
  }
  if (p_width == 0 || p_width > max_register_width) {
    safe_throw(value_out_of_range(p_width, max_register_width, p_instance));
  }
}
}  // namespace

register_bus::register_bus(spi_bus& p_spi)
  : m_spi(&p_spi)
{
}

byte register_bus::transact(std::span<byte const> p_out, std::span<byte> p_in)
{
  m_spi->transfer(p_out, p_in);
  m_last_status = p_in[0];
  return m_last_status;
}

u64 register_bus::read_register(u8 p_address, u8 p_width)
{
  check_register(p_address, p_width, this);

  std::array<byte, 1 + max_register_width> out{};
  std::array<byte, 1 + max_register_width> in{};
  auto const length = static_cast<usize>(1 + p_width);

  out[0] = command::read_register | (p_address & command::register_address_mask);
  std::fill_n(out.begin() + 1, p_width, command::nop);

  transact(std::span(out).first(length), std::span(in).first(length));

  u64 value = 0;
  for (usize i = 0; i < p_width; i++) {
    value |= u64{ in[1 + i] } << (8 * i);
  }
  return value;
}

byte register_bus::write_register(u8 p_address, u8 p_width, u64 p_value)
{
  check_register(p_address, p_width, this);

  std::array<byte, 1 + max_register_width> out{};
  std::array<byte, 1 + max_register_width> in{};
  auto const length = static_cast<usize>(1 + p_width);

  out[0] =
    command::write_register | (p_address & command::register_address_mask);
  for (usize i = 0; i < p_width; i++) {
    out[1 + i] = static_cast<byte>(p_value >> (8 * i));
  }

  return transact(std::span(out).first(length), std::span(in).first(length));
}

byte register_bus::write_command(byte p_command,
                                 std::span<byte const> p_data_out)
{
  if (p_data_out.size() > max_payload_size) {
    safe_throw(
      value_out_of_range(p_data_out.size(), max_payload_size, this));
  }

  std::array<byte, max_transaction> out{};
  std::array<byte, max_transaction> in{};
  auto const length = 1 + p_data_out.size();

  out[0] = p_command;
  std::ranges::copy(p_data_out, out.begin() + 1);

  return transact(std::span(out).first(length), std::span(in).first(length));
}

byte register_bus::read_command(byte p_command, std::span<byte> p_data_in)
{
  if (p_data_in.size() > max_payload_size) {
    safe_throw(value_out_of_range(p_data_in.size(), max_payload_size, this));
  }

  std::array<byte, max_transaction> out{};
  std::array<byte, max_transaction> in{};
  auto const length = 1 + p_data_in.size();

  out.fill(command::nop);
  out[0] = p_command;

  auto const status =
    transact(std::span(out).first(length), std::span(in).first(length));
  std::copy_n(in.begin() + 1, p_data_in.size(), p_data_in.begin());
  return status;
}
}  // namespace nrf24
