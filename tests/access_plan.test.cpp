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

#include <array>
#include <vector>

#include <libnrf24/error.hpp>
#include <libnrf24/nrf24l01p.hpp>

#include <boost/ut.hpp>

#include "fake_chip.hpp"

namespace nrf24 {
namespace {
// Register R with field A on bits 0-1 and field B on bits 4-5
constexpr register_info sample_register{
  .name = "R",
  .address = 0x01,
};
constexpr field_info sample_a{
  .name = "A",
  .owner = &sample_register,
  .bit_offset = 0,
  .bit_width = 2,
};
constexpr field_info sample_b{
  .name = "B",
  .owner = &sample_register,
  .bit_offset = 4,
  .bit_width = 2,
};
constexpr std::array<register_info const*, 1> sample_registers{
  &sample_register
};
constexpr std::array<field_info const*, 2> sample_fields{ &sample_a,
                                                          &sample_b };
constexpr register_map sample_map(sample_registers, sample_fields);

constexpr register_info stray_register{
  .name = "STRAY",
  .address = 0x1E,
};

// Accepted by a custom map but outside the chip's address space
constexpr register_info unreachable_register{
  .name = "UNREACHABLE",
  .address = 0x40,
};
constexpr field_info unreachable_field{
  .name = "UNREACHABLE_BIT",
  .owner = &unreachable_register,
  .bit_offset = 0,
};
constexpr std::array<register_info const*, 1> unreachable_registers{
  &unreachable_register
};
constexpr std::array<field_info const*, 1> unreachable_fields{
  &unreachable_field
};
constexpr register_map unreachable_map(unreachable_registers,
                                       unreachable_fields);

constexpr planned_transaction read_of(register_info const& p_register)
{
  return {
    .address = p_register.address,
    .width = p_register.width,
    .dir = direction::read,
  };
}

constexpr planned_transaction write_of(register_info const& p_register)
{
  return {
    .address = p_register.address,
    .width = p_register.width,
    .dir = direction::write,
  };
}

std::vector<planned_transaction> write_transactions(write_plan const& p_plan)
{
  std::array<planned_transaction, 2 * max_planned_registers> buffer{};
  auto const used = p_plan.transactions(buffer);
  return { used.begin(), used.end() };
}
}  // namespace

boost::ut::suite<"read_plan_test"> read_plan_test = []() {
  using namespace boost::ut;

  "one read per distinct register, in order of first appearance"_test = []() {
    // Setup
    std::array<target, 4> const requests{
      field::rx_dr, reg::config, field::tx_ds, field::pwr_up
    };

    // Exercise
    read_plan const plan(nrf24l01p_map(), requests);

    // Verify
    std::vector<planned_transaction> const expected{ read_of(reg::status),
                                                     read_of(reg::config) };
    std::vector<planned_transaction> const actual(plan.transactions().begin(),
                                                  plan.transactions().end());
    expect(expected == actual);
  };

  "results follow request order, duplicates included"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    chip.registers[reg::status.address] = 0b0110'1110;
    chip.registers[reg::rf_ch.address] = 76;
    std::array<target, 5> const requests{
      field::tx_ds, reg::rf_ch, field::rx_p_no, field::tx_ds, field::max_rt
    };
    std::array<u64, 5> results{};

    // Exercise
    read_plan const plan(nrf24l01p_map(), requests);
    plan.execute(bus, results);

    // Verify
    expect(std::array<u64, 5>{ 1, 76, 0b111, 1, 0 } == results);
    expect(that % 2U == register_reads(chip));
    expect(that % 0U == register_writes(chip));
  };

  "wide registers are read with their full width"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    std::array<target, 1> const requests{ reg::rx_addr_p1 };
    std::array<u64, 1> results{};

    // Exercise
    read_plan const plan(nrf24l01p_map(), requests);
    plan.execute(bus, results);

    // Verify
    expect(that % 0xC2'C2'C2'C2'C2U == results[0]);
    expect(that % 6U == chip.transactions[0].size());
  };

  "transport failure leaves the results untouched"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    chip.fail_after = 1;
    std::array<target, 2> const requests{ reg::config, reg::rf_ch };
    std::array<u64, 2> results{ 0xDEAD, 0xBEEF };
    read_plan const plan(nrf24l01p_map(), requests);

    // Exercise
    expect(throws<nrf24::transport_error>(
      [&]() { plan.execute(bus, results); }));

    // Verify
    expect(std::array<u64, 2>{ 0xDEAD, 0xBEEF } == results);
  };

  "results span too short"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    std::array<target, 2> const requests{ reg::config, reg::rf_ch };
    std::array<u64, 1> results{};
    read_plan const plan(nrf24l01p_map(), requests);

    // Exercise + Verify
    expect(throws<nrf24::value_out_of_range>(
      [&]() { plan.execute(bus, results); }));
    expect(that % 0U == chip.transactions.size());
  };

  "invalid references are rejected"_test = []() {
    std::array<target, 2> const foreign{ reg::config, stray_register };
    std::array<target, 1> const nothing{ target{} };

    expect(throws<nrf24::invalid_reference>(
      [&]() { (void)read_plan(nrf24l01p_map(), foreign); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { (void)read_plan(nrf24l01p_map(), nothing); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { (void)read_plan(nrf24l01p_map(), std::span<target const>{}); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { (void)read_plan(sample_map, foreign); }));
  };

  "registers beyond the address space are rejected"_test = []() {
    // Setup
    std::array<target, 1> const whole{ unreachable_register };
    std::array<target, 1> const bit{ unreachable_field };
    std::array<assignment, 1> const batch{ assign(unreachable_field, 1) };

    // Exercise + Verify
    expect(unreachable_map.contains(unreachable_register));
    expect(throws<nrf24::invalid_reference>(
      [&]() { (void)read_plan(unreachable_map, whole); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { (void)read_plan(unreachable_map, bit); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { (void)write_plan(unreachable_map, batch); }));
  };

  "invalid reference carries the register address"_test = []() {
    std::array<target, 1> const foreign{ stray_register };
    u8 address = 0;
    try {
      read_plan const plan(nrf24l01p_map(), foreign);
    } catch (nrf24::invalid_reference const& p_error) {
      address = p_error.address;
    }
    expect(that % 0x1E == address);
  };
};

boost::ut::suite<"write_plan_test"> write_plan_test = []() {
  using namespace boost::ut;

  "field writes merge into one read-modify-write"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    chip.registers[sample_register.address] = 0b0001'0000;
    std::array<assignment, 2> const batch{ assign(sample_a, 3),
                                           assign(sample_b, 0) };

    // Exercise
    write_plan const plan(sample_map, batch);
    plan.execute(bus);
    auto const write_traffic = chip.transactions.size();

    std::array<target, 2> const requests{ sample_a, sample_b };
    std::array<u64, 2> results{};
    read_plan const readback(sample_map, requests);
    chip.transactions.clear();
    readback.execute(bus, results);

    // Verify
    expect(std::vector<planned_transaction>{ read_of(sample_register),
                                             write_of(sample_register) } ==
           write_transactions(plan));
    expect(that % 0b0000'0011U == chip.registers[sample_register.address]);
    expect(that % 2U == write_traffic);
    expect(std::array<u64, 2>{ 3, 0 } == results);
    expect(that % 1U == chip.transactions.size());
  };

  "whole register writes never read first"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    std::array<assignment, 3> const batch{
      assign(reg::rf_ch, 10),
      assign(reg::rx_addr_p0, 0x11'22'33'44'55),
      assign(reg::rf_ch, 40),
    };

    // Exercise
    write_plan const plan(nrf24l01p_map(), batch);
    plan.execute(bus);

    // Verify
    expect(std::vector<planned_transaction>{ write_of(reg::rf_ch),
                                             write_of(reg::rx_addr_p0) } ==
           write_transactions(plan));
    expect(that % 0U == register_reads(chip));
    expect(that % 2U == register_writes(chip));
    expect(that % 40U == chip.registers[reg::rf_ch.address]);
    expect(that % 0x11'22'33'44'55U ==
           chip.registers[reg::rx_addr_p0.address]);
  };

  "registers are grouped in order of first appearance"_test = []() {
    // Setup
    std::array<assignment, 4> const batch{
      assign(field::pwr_up, 1),
      assign(reg::rf_ch, 40),
      assign(field::prim_rx, 1),
      assign(field::rf_pwr, 2),
    };

    // Exercise
    write_plan const plan(nrf24l01p_map(), batch);

    // Verify
    expect(std::vector<planned_transaction>{ read_of(reg::config),
                                             write_of(reg::config),
                                             write_of(reg::rf_ch),
                                             read_of(reg::rf_setup),
                                             write_of(reg::rf_setup) } ==
           write_transactions(plan));
  };

  "later field value wins within a batch"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    std::array<assignment, 2> const batch{ assign(field::rf_ch, 10),
                                           assign(field::rf_ch, 20) };

    // Exercise
    write_plan const plan(nrf24l01p_map(), batch);
    plan.execute(bus);

    // Verify
    expect(that % 20U == chip.registers[reg::rf_ch.address]);
    expect(that % 2U == chip.transactions.size());
  };

  "clear-on-write flags outside the batch are written as zero"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    chip.registers[reg::status.address] = 0b0101'1110;
    std::array<assignment, 1> const batch{ assign(field::tx_ds, 1) };

    // Exercise
    write_plan const plan(nrf24l01p_map(), batch);
    plan.execute(bus);

    // Verify
    expect(std::vector<byte>{ 0x27, 0b0010'1110 } == chip.transactions[1]);
    expect(that % 0b0101'1110U == chip.registers[reg::status.address]);
  };

  "clearing one interrupt flag keeps the others pending"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    chip.registers[reg::status.address] = 0b0111'1110;
    std::array<assignment, 1> const batch{ assign(field::rx_dr, 1) };

    // Exercise
    write_plan const plan(nrf24l01p_map(), batch);
    plan.execute(bus);

    // Verify
    expect(that % 0b0011'1110U == chip.registers[reg::status.address]);
  };

  "execute returns the last STATUS"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    chip.registers[reg::status.address] = 0x4E;
    std::array<assignment, 1> const batch{ assign(reg::feature, 0b111) };

    // Exercise
    write_plan const plan(nrf24l01p_map(), batch);
    auto const status = plan.execute(bus);

    // Verify
    expect(that % 0x4E == status);
  };

  "rejected batches never reach the bus"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    auto const plan_and_run = [&](std::span<assignment const> p_batch) {
      write_plan const plan(nrf24l01p_map(), p_batch);
      plan.execute(bus);
    };
    std::array<assignment, 2> const too_large{ assign(reg::config, 0x0B),
                                               assign(field::rf_ch, 128) };
    std::array<assignment, 1> const too_wide{ assign(reg::config, 0x100) };
    std::array<assignment, 1> const read_only_field{ assign(field::rx_empty,
                                                            0) };
    std::array<assignment, 1> const read_only_register{
      assign(reg::observe_tx, 0)
    };
    std::array<assignment, 2> const mixed{ assign(reg::config, 0x08),
                                           assign(field::pwr_up, 1) };
    std::array<assignment, 2> const mixed_reversed{ assign(field::pwr_up, 1),
                                                    assign(reg::config,
                                                           0x08) };
    std::array<assignment, 1> const foreign{ assign(stray_register, 0) };
    std::array<assignment, 1> const nothing{};

    // Exercise + Verify
    expect(throws<nrf24::value_out_of_range>(
      [&]() { plan_and_run(too_large); }));
    expect(throws<nrf24::value_out_of_range>(
      [&]() { plan_and_run(too_wide); }));
    expect(throws<nrf24::operation_not_permitted>(
      [&]() { plan_and_run(read_only_field); }));
    expect(throws<nrf24::operation_not_permitted>(
      [&]() { plan_and_run(read_only_register); }));
    expect(throws<nrf24::operation_not_permitted>(
      [&]() { plan_and_run(mixed); }));
    expect(throws<nrf24::operation_not_permitted>(
      [&]() { plan_and_run(mixed_reversed); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { plan_and_run(foreign); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { plan_and_run(nothing); }));
    expect(throws<nrf24::invalid_reference>(
      [&]() { plan_and_run(std::span<assignment const>{}); }));
    expect(that % 0U == chip.transactions.size());
    expect(that % 0x08U == chip.registers[reg::config.address]);
  };

  "transport failure part way keeps earlier registers"_test = []() {
    // Setup
    test::fake_chip chip;
    register_bus bus(chip);
    chip.fail_after = 1;
    std::array<assignment, 2> const batch{ assign(reg::rf_ch, 40),
                                           assign(reg::setup_retr, 0x5F) };
    write_plan const plan(nrf24l01p_map(), batch);

    // Exercise
    expect(throws<nrf24::transport_error>([&]() { plan.execute(bus); }));

    // Verify
    expect(that % 40U == chip.registers[reg::rf_ch.address]);
    expect(that % 0x03U == chip.registers[reg::setup_retr.address]);
  };

  "transactions buffer too small"_test = []() {
    std::array<assignment, 1> const batch{ assign(field::pwr_up, 1) };
    std::array<planned_transaction, 1> buffer{};
    write_plan const plan(nrf24l01p_map(), batch);

    expect(throws<nrf24::value_out_of_range>(
      [&]() { (void)plan.transactions(buffer); }));
  };
};
}  // namespace nrf24
