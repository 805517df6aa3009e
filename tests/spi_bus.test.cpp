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

#include <libnrf24/spi_bus.hpp>

#include <array>

#include <boost/ut.hpp>

namespace nrf24 {
namespace {
constexpr nrf24::spi_bus::settings expected_settings{
  .clock_rate = 8_MHz,
  .bus_mode = nrf24::spi_bus::mode::m3,
};

class test_spi_bus : public nrf24::spi_bus
{
public:
  settings m_settings{};
  std::span<byte const> m_data_out{};
  std::span<byte> m_data_in{};

  ~test_spi_bus() override = default;

private:
  void driver_configure(settings const& p_settings) override
  {
    m_settings = p_settings;
  }

  void driver_transfer(std::span<byte const> p_data_out,
                       std::span<byte> p_data_in) override
  {
    m_data_out = p_data_out;
    m_data_in = p_data_in;
  }
};
}  // namespace

boost::ut::suite<"spi_bus_test"> spi_bus_test = []() {
  using namespace boost::ut;

  "spi_bus interface test"_test = []() {
    // Setup
    test_spi_bus test;
    std::array<byte, 4> const expected_out{ 0x20, 'a', 'b', 'c' };
    std::array<byte, 4> expected_in{};

    // Exercise
    test.configure(expected_settings);
    test.transfer(expected_out, expected_in);

    // Verify
    expect(that % expected_out.data() == test.m_data_out.data());
    expect(that % expected_in.data() == test.m_data_in.data());
    expect(that % expected_out.size() == test.m_data_out.size());
    expect(that % expected_in.size() == test.m_data_in.size());
    expect(expected_settings == test.m_settings);
  };

  "spi_bus::settings defaults"_test = []() {
    // Setup
    constexpr nrf24::spi_bus::settings defaults{};

    // Verify
    expect(that % 100'000U == defaults.clock_rate);
    expect(nrf24::spi_bus::mode::m0 == defaults.bus_mode);
    expect(defaults != expected_settings);
  };
};
}  // namespace nrf24
