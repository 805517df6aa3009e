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

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <deque>
#include <vector>

#include <libnrf24/device.hpp>
#include <libnrf24/error.hpp>

// Two nRF24L01+ simulated in memory and linked by a perfect radio channel.
// The transmitter pushes one payload, the receiver sleeps in wait_for_irq()
// until RX_DR pulls its IRQ line low.

namespace {
using namespace nrf24;
using namespace std::chrono_literals;

class simulated_radio : public spi_bus
{
public:
  class chip_enable_pin : public output_pin
  {
  public:
    explicit chip_enable_pin(simulated_radio& p_radio)
      : m_radio(&p_radio)
    {
    }

  private:
    void driver_configure(settings const&) override
    {
    }
    void driver_level(bool p_high) override
    {
      m_radio->chip_enable(p_high);
    }
    bool driver_level() override
    {
      return m_radio->m_chip_enable;
    }
    simulated_radio* m_radio;
  };

  class irq_pin : public interrupt_pin
  {
  public:
    explicit irq_pin(simulated_radio& p_radio)
      : m_radio(&p_radio)
    {
    }

    void notify()
    {
      if (m_handler) {
        (*m_handler)(handler_tag{}, level());
      }
    }

  private:
    void driver_configure(settings const&) override
    {
    }
    void driver_on_trigger(optional_handler const& p_callback) override
    {
      m_handler = p_callback;
    }
    bool driver_level() override
    {
      return not m_radio->irq_asserted();
    }
    simulated_radio* m_radio;
    optional_handler m_handler{};
  };

  simulated_radio()
    : ce(*this)
    , irq(*this)
  {
    for (auto const* reg : nrf24l01p_registers) {
      m_registers[reg->address] = reg->reset_value;
    }
  }

  void link(simulated_radio& p_peer)
  {
    m_peer = &p_peer;
    p_peer.m_peer = this;
  }

  chip_enable_pin ce;
  irq_pin irq;

private:
  [[nodiscard]] bool field_set(field_info const& p_field) const
  {
    return p_field.extract(m_registers[p_field.owner->address]) != 0;
  }

  void raise(field_info const& p_flag)
  {
    auto& status = m_registers[reg::status.address];
    status = p_flag.inject(status, 1);
    irq.notify();
  }

  [[nodiscard]] bool irq_asserted() const
  {
    return (field_set(field::rx_dr) && not field_set(field::mask_rx_dr)) ||
           (field_set(field::tx_ds) && not field_set(field::mask_tx_ds)) ||
           (field_set(field::max_rt) && not field_set(field::mask_max_rt));
  }

  [[nodiscard]] bool listening() const
  {
    return m_chip_enable && field_set(field::pwr_up) &&
           field_set(field::prim_rx);
  }

  void chip_enable(bool p_high)
  {
    m_chip_enable = p_high;
    if (not p_high || not field_set(field::pwr_up) ||
        field_set(field::prim_rx)) {
      return;
    }
    while (not m_tx_fifo.empty()) {
      auto const payload = m_tx_fifo.front();
      m_tx_fifo.pop_front();
      if (m_peer != nullptr && m_peer->listening()) {
        m_peer->receive(payload);
        raise(field::tx_ds);
      } else {
        raise(field::max_rt);
        break;
      }
    }
    refresh();
  }

  void receive(std::vector<byte> const& p_payload)
  {
    m_rx_fifo.push_back(p_payload);
    auto& status = m_registers[reg::status.address];
    status = field::rx_p_no.inject(status, 0);
    refresh();
    raise(field::rx_dr);
  }

  void refresh()
  {
    auto& fifo = m_registers[reg::fifo_status.address];
    fifo = field::rx_empty.inject(fifo, m_rx_fifo.empty());
    fifo = field::tx_empty.inject(fifo, m_tx_fifo.empty());
    if (m_rx_fifo.empty()) {
      auto& status = m_registers[reg::status.address];
      status = field::rx_p_no.inject(status, 0b111);
    }
  }

  void driver_configure(settings const&) override
  {
  }

  void driver_transfer(std::span<byte const> p_data_out,
                       std::span<byte> p_data_in) override
  {
    auto const opcode = p_data_out[0];
    auto const address = opcode & command::register_address_mask;
    p_data_in[0] = static_cast<byte>(m_registers[reg::status.address]);

    if ((opcode & 0b1110'0000) == command::read_register) {
      for (usize i = 1; i < p_data_in.size(); i++) {
        p_data_in[i] = static_cast<byte>(m_registers[address] >> (8 * (i - 1)));
      }
    } else if ((opcode & 0b1110'0000) == command::write_register) {
      u64 value = 0;
      for (usize i = 1; i < p_data_out.size(); i++) {
        value |= u64{ p_data_out[i] } << (8 * (i - 1));
      }
      if (address == reg::status.address) {
        m_registers[address] &= ~(value & reg::status.clear_on_write_mask);
      } else {
        m_registers[address] = value;
      }
    } else if (opcode == command::write_tx_payload) {
      m_tx_fifo.emplace_back(p_data_out.begin() + 1, p_data_out.end());
    } else if (opcode == command::read_rx_payload && not m_rx_fifo.empty()) {
      auto const& payload = m_rx_fifo.front();
      std::copy_n(payload.begin(),
                  std::min(payload.size(), p_data_in.size() - 1),
                  p_data_in.begin() + 1);
      m_rx_fifo.pop_front();
    } else if (opcode == command::read_rx_payload_width &&
               not m_rx_fifo.empty()) {
      p_data_in[1] = static_cast<byte>(m_rx_fifo.front().size());
    } else if (opcode == command::flush_tx) {
      m_tx_fifo.clear();
    } else if (opcode == command::flush_rx) {
      m_rx_fifo.clear();
    }
    refresh();
  }

  std::array<u64, max_register_address + 1> m_registers{};
  std::deque<std::vector<byte>> m_tx_fifo{};
  std::deque<std::vector<byte>> m_rx_fifo{};
  simulated_radio* m_peer = nullptr;
  bool m_chip_enable = false;
};

void application(simulated_radio& p_tx_chip, simulated_radio& p_rx_chip)
{
  device receiver(p_rx_chip, p_rx_chip.ce, p_rx_chip.irq);
  receiver.reset_to_default();
  receiver.set(assign(field::prim_rx, 1),
               assign(field::pwr_up, 1),
               assign(field::rx_pw_p0, 32));

  device transmitter(p_tx_chip, p_tx_chip.ce);
  transmitter.reset_to_default();
  transmitter.set(assign(field::pwr_up, 1));

  receiver.chip_enable_high();

  std::array<byte, 32> sent{};
  for (usize i = 0; i < sent.size(); i++) {
    sent[i] = static_cast<byte>(i);
  }
  transmitter.write_tx_payload(sent);
  transmitter.chip_enable_high();

  auto const [tx_ds, max_rt] = transmitter.get(field::tx_ds, field::max_rt);
  if (tx_ds) {
    std::printf("Data sent and ACK received after %d retransmissions\n",
                static_cast<int>(transmitter.get(field::arc_cnt)));
  } else if (max_rt) {
    std::printf("Transmitted without ACK, giving up\n");
  }
  transmitter.set(assign(field::tx_ds, 1), assign(field::max_rt, 1));
  transmitter.chip_enable_low();

  switch (receiver.wait_for_irq(100ms)) {
    case irq_waiter::outcome::event:
      break;
    case irq_waiter::outcome::cancelled:
      std::puts("Wait cancelled");
      return;
    case irq_waiter::outcome::timed_out:
      std::puts("Data not received");
      return;
  }

  auto const [status, width] = receiver.rx_payload_width();
  std::array<byte, 32> received{};
  receiver.read_rx_payload(std::span(received).first(width));
  receiver.set(assign(field::rx_dr, 1));
  receiver.chip_enable_low();

  if (std::ranges::equal(sent, received)) {
    std::printf("Data received (STATUS 0x%02X)\n", static_cast<unsigned>(status));
  } else {
    std::puts("Invalid data received");
  }
}
}  // namespace

int main()
{
  simulated_radio tx_chip;
  simulated_radio rx_chip;
  tx_chip.link(rx_chip);

  try {
    application(tx_chip, rx_chip);
  } catch (nrf24::exception const& p_error) {
    std::printf("nrf24 error %d from instance %p\n",
                static_cast<int>(p_error.error_code()),
                p_error.instance());
    return 1;
  }
  return 0;
}
