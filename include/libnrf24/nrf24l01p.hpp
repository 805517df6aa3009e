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

#include "registers.hpp"

/**
 * @file nrf24l01p.hpp
 * @brief Register and field table of the Nordic Semiconductor nRF24L01+
 *
 * Names follow the nRF24L01+ Product Specification v1.0, section 9.1, in lower
 * case. Registers live in `nrf24::reg` and fields in `nrf24::field`. FIFO_STATUS
 * repeats the STATUS TX_FULL flag and is called `fifo_tx_full` here. Reserved
 * and obsolete bits have no field descriptor.
 */
namespace nrf24::reg {
inline constexpr register_info config{
  .name = "CONFIG",
  .address = 0x00,
  .width = 1,
  .reset_value = 0x08,
};
inline constexpr register_info en_aa{
  .name = "EN_AA",
  .address = 0x01,
  .width = 1,
  .reset_value = 0x3F,
};
inline constexpr register_info en_rxaddr{
  .name = "EN_RXADDR",
  .address = 0x02,
  .width = 1,
  .reset_value = 0x03,
};
inline constexpr register_info setup_aw{
  .name = "SETUP_AW",
  .address = 0x03,
  .width = 1,
  .reset_value = 0x03,
};
inline constexpr register_info setup_retr{
  .name = "SETUP_RETR",
  .address = 0x04,
  .width = 1,
  .reset_value = 0x03,
};
inline constexpr register_info rf_ch{
  .name = "RF_CH",
  .address = 0x05,
  .width = 1,
  .reset_value = 0x02,
};
inline constexpr register_info rf_setup{
  .name = "RF_SETUP",
  .address = 0x06,
  .width = 1,
  .reset_value = 0x0E,
};
inline constexpr register_info status{
  .name = "STATUS",
  .address = 0x07,
  .width = 1,
  .reset_value = 0x0E,
  .clear_on_write_mask = 0b0111'0000,
};
inline constexpr register_info observe_tx{
  .name = "OBSERVE_TX",
  .address = 0x08,
  .width = 1,
  .reset_value = 0x00,
  .mode = access::read_only,
};
inline constexpr register_info rpd{
  .name = "RPD",
  .address = 0x09,
  .width = 1,
  .reset_value = 0x00,
  .mode = access::read_only,
};
inline constexpr register_info rx_addr_p0{
  .name = "RX_ADDR_P0",
  .address = 0x0A,
  .width = 5,
  .reset_value = 0xE7'E7'E7'E7'E7,
};
inline constexpr register_info rx_addr_p1{
  .name = "RX_ADDR_P1",
  .address = 0x0B,
  .width = 5,
  .reset_value = 0xC2'C2'C2'C2'C2,
};
inline constexpr register_info rx_addr_p2{
  .name = "RX_ADDR_P2",
  .address = 0x0C,
  .width = 1,
  .reset_value = 0xC3,
};
inline constexpr register_info rx_addr_p3{
  .name = "RX_ADDR_P3",
  .address = 0x0D,
  .width = 1,
  .reset_value = 0xC4,
};
inline constexpr register_info rx_addr_p4{
  .name = "RX_ADDR_P4",
  .address = 0x0E,
  .width = 1,
  .reset_value = 0xC5,
};
inline constexpr register_info rx_addr_p5{
  .name = "RX_ADDR_P5",
  .address = 0x0F,
  .width = 1,
  .reset_value = 0xC6,
};
inline constexpr register_info tx_addr{
  .name = "TX_ADDR",
  .address = 0x10,
  .width = 5,
  .reset_value = 0xE7'E7'E7'E7'E7,
};
inline constexpr register_info rx_pw_p0{
  .name = "RX_PW_P0",
  .address = 0x11,
  .width = 1,
  .reset_value = 0x00,
};
inline constexpr register_info rx_pw_p1{
  .name = "RX_PW_P1",
  .address = 0x12,
  .width = 1,
  .reset_value = 0x00,
};
inline constexpr register_info rx_pw_p2{
  .name = "RX_PW_P2",
  .address = 0x13,
  .width = 1,
  .reset_value = 0x00,
};
inline constexpr register_info rx_pw_p3{
  .name = "RX_PW_P3",
  .address = 0x14,
  .width = 1,
  .reset_value = 0x00,
};
inline constexpr register_info rx_pw_p4{
  .name = "RX_PW_P4",
  .address = 0x15,
  .width = 1,
  .reset_value = 0x00,
};
inline constexpr register_info rx_pw_p5{
  .name = "RX_PW_P5",
  .address = 0x16,
  .width = 1,
  .reset_value = 0x00,
};
inline constexpr register_info fifo_status{
  .name = "FIFO_STATUS",
  .address = 0x17,
  .width = 1,
  .reset_value = 0x11,
  .mode = access::read_only,
};
inline constexpr register_info dynpd{
  .name = "DYNPD",
  .address = 0x1C,
  .width = 1,
  .reset_value = 0x00,
};
inline constexpr register_info feature{
  .name = "FEATURE",
  .address = 0x1D,
  .width = 1,
  .reset_value = 0x00,
};
}  // namespace nrf24::reg

namespace nrf24::field {
// CONFIG
inline constexpr field_info mask_rx_dr{
  .name = "MASK_RX_DR",
  .owner = &reg::config,
  .bit_offset = 6,
  .bit_width = 1,
};
inline constexpr field_info mask_tx_ds{
  .name = "MASK_TX_DS",
  .owner = &reg::config,
  .bit_offset = 5,
  .bit_width = 1,
};
inline constexpr field_info mask_max_rt{
  .name = "MASK_MAX_RT",
  .owner = &reg::config,
  .bit_offset = 4,
  .bit_width = 1,
};
inline constexpr field_info en_crc{
  .name = "EN_CRC",
  .owner = &reg::config,
  .bit_offset = 3,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info crco{
  .name = "CRCO",
  .owner = &reg::config,
  .bit_offset = 2,
  .bit_width = 1,
};
inline constexpr field_info pwr_up{
  .name = "PWR_UP",
  .owner = &reg::config,
  .bit_offset = 1,
  .bit_width = 1,
};
inline constexpr field_info prim_rx{
  .name = "PRIM_RX",
  .owner = &reg::config,
  .bit_offset = 0,
  .bit_width = 1,
};
// EN_AA
inline constexpr field_info enaa_p5{
  .name = "ENAA_P5",
  .owner = &reg::en_aa,
  .bit_offset = 5,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info enaa_p4{
  .name = "ENAA_P4",
  .owner = &reg::en_aa,
  .bit_offset = 4,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info enaa_p3{
  .name = "ENAA_P3",
  .owner = &reg::en_aa,
  .bit_offset = 3,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info enaa_p2{
  .name = "ENAA_P2",
  .owner = &reg::en_aa,
  .bit_offset = 2,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info enaa_p1{
  .name = "ENAA_P1",
  .owner = &reg::en_aa,
  .bit_offset = 1,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info enaa_p0{
  .name = "ENAA_P0",
  .owner = &reg::en_aa,
  .bit_offset = 0,
  .bit_width = 1,
  .reset_value = 1,
};
// EN_RXADDR
inline constexpr field_info erx_p5{
  .name = "ERX_P5",
  .owner = &reg::en_rxaddr,
  .bit_offset = 5,
  .bit_width = 1,
};
inline constexpr field_info erx_p4{
  .name = "ERX_P4",
  .owner = &reg::en_rxaddr,
  .bit_offset = 4,
  .bit_width = 1,
};
inline constexpr field_info erx_p3{
  .name = "ERX_P3",
  .owner = &reg::en_rxaddr,
  .bit_offset = 3,
  .bit_width = 1,
};
inline constexpr field_info erx_p2{
  .name = "ERX_P2",
  .owner = &reg::en_rxaddr,
  .bit_offset = 2,
  .bit_width = 1,
};
inline constexpr field_info erx_p1{
  .name = "ERX_P1",
  .owner = &reg::en_rxaddr,
  .bit_offset = 1,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info erx_p0{
  .name = "ERX_P0",
  .owner = &reg::en_rxaddr,
  .bit_offset = 0,
  .bit_width = 1,
  .reset_value = 1,
};
// SETUP_AW
inline constexpr field_info aw{
  .name = "AW",
  .owner = &reg::setup_aw,
  .bit_offset = 0,
  .bit_width = 2,
  .reset_value = 3,
};
// SETUP_RETR
inline constexpr field_info ard{
  .name = "ARD",
  .owner = &reg::setup_retr,
  .bit_offset = 4,
  .bit_width = 4,
};
inline constexpr field_info arc{
  .name = "ARC",
  .owner = &reg::setup_retr,
  .bit_offset = 0,
  .bit_width = 4,
  .reset_value = 3,
};
// RF_CH
inline constexpr field_info rf_ch{
  .name = "RF_CH",
  .owner = &reg::rf_ch,
  .bit_offset = 0,
  .bit_width = 7,
  .reset_value = 2,
};
// RF_SETUP
inline constexpr field_info cont_wave{
  .name = "CONT_WAVE",
  .owner = &reg::rf_setup,
  .bit_offset = 7,
  .bit_width = 1,
};
inline constexpr field_info rf_dr_low{
  .name = "RF_DR_LOW",
  .owner = &reg::rf_setup,
  .bit_offset = 5,
  .bit_width = 1,
};
inline constexpr field_info pll_lock{
  .name = "PLL_LOCK",
  .owner = &reg::rf_setup,
  .bit_offset = 4,
  .bit_width = 1,
};
inline constexpr field_info rf_dr_high{
  .name = "RF_DR_HIGH",
  .owner = &reg::rf_setup,
  .bit_offset = 3,
  .bit_width = 1,
  .reset_value = 1,
};
inline constexpr field_info rf_pwr{
  .name = "RF_PWR",
  .owner = &reg::rf_setup,
  .bit_offset = 1,
  .bit_width = 2,
  .reset_value = 3,
};
// STATUS
inline constexpr field_info rx_dr{
  .name = "RX_DR",
  .owner = &reg::status,
  .bit_offset = 6,
  .bit_width = 1,
};
inline constexpr field_info tx_ds{
  .name = "TX_DS",
  .owner = &reg::status,
  .bit_offset = 5,
  .bit_width = 1,
};
inline constexpr field_info max_rt{
  .name = "MAX_RT",
  .owner = &reg::status,
  .bit_offset = 4,
  .bit_width = 1,
};
inline constexpr field_info rx_p_no{
  .name = "RX_P_NO",
  .owner = &reg::status,
  .bit_offset = 1,
  .bit_width = 3,
  .reset_value = 7,
  .mode = access::read_only,
};
inline constexpr field_info tx_full{
  .name = "TX_FULL",
  .owner = &reg::status,
  .bit_offset = 0,
  .bit_width = 1,
  .mode = access::read_only,
};
// OBSERVE_TX
inline constexpr field_info plos_cnt{
  .name = "PLOS_CNT",
  .owner = &reg::observe_tx,
  .bit_offset = 4,
  .bit_width = 4,
  .mode = access::read_only,
};
inline constexpr field_info arc_cnt{
  .name = "ARC_CNT",
  .owner = &reg::observe_tx,
  .bit_offset = 0,
  .bit_width = 4,
  .mode = access::read_only,
};
// RPD
inline constexpr field_info rpd{
  .name = "RPD",
  .owner = &reg::rpd,
  .bit_offset = 0,
  .bit_width = 1,
  .mode = access::read_only,
};
// RX_PW_P0
inline constexpr field_info rx_pw_p0{
  .name = "RX_PW_P0",
  .owner = &reg::rx_pw_p0,
  .bit_offset = 0,
  .bit_width = 6,
};
// RX_PW_P1
inline constexpr field_info rx_pw_p1{
  .name = "RX_PW_P1",
  .owner = &reg::rx_pw_p1,
  .bit_offset = 0,
  .bit_width = 6,
};
// RX_PW_P2
inline constexpr field_info rx_pw_p2{
  .name = "RX_PW_P2",
  .owner = &reg::rx_pw_p2,
  .bit_offset = 0,
  .bit_width = 6,
};
// RX_PW_P3
inline constexpr field_info rx_pw_p3{
  .name = "RX_PW_P3",
  .owner = &reg::rx_pw_p3,
  .bit_offset = 0,
  .bit_width = 6,
};
// RX_PW_P4
inline constexpr field_info rx_pw_p4{
  .name = "RX_PW_P4",
  .owner = &reg::rx_pw_p4,
  .bit_offset = 0,
  .bit_width = 6,
};
// RX_PW_P5
inline constexpr field_info rx_pw_p5{
  .name = "RX_PW_P5",
  .owner = &reg::rx_pw_p5,
  .bit_offset = 0,
  .bit_width = 6,
};
// FIFO_STATUS
inline constexpr field_info tx_reuse{
  .name = "TX_REUSE",
  .owner = &reg::fifo_status,
  .bit_offset = 6,
  .bit_width = 1,
  .mode = access::read_only,
};
inline constexpr field_info fifo_tx_full{
  .name = "FIFO_TX_FULL",
  .owner = &reg::fifo_status,
  .bit_offset = 5,
  .bit_width = 1,
  .mode = access::read_only,
};
inline constexpr field_info tx_empty{
  .name = "TX_EMPTY",
  .owner = &reg::fifo_status,
  .bit_offset = 4,
  .bit_width = 1,
  .reset_value = 1,
  .mode = access::read_only,
};
inline constexpr field_info rx_full{
  .name = "RX_FULL",
  .owner = &reg::fifo_status,
  .bit_offset = 1,
  .bit_width = 1,
  .mode = access::read_only,
};
inline constexpr field_info rx_empty{
  .name = "RX_EMPTY",
  .owner = &reg::fifo_status,
  .bit_offset = 0,
  .bit_width = 1,
  .reset_value = 1,
  .mode = access::read_only,
};
// DYNPD
inline constexpr field_info dpl_p5{
  .name = "DPL_P5",
  .owner = &reg::dynpd,
  .bit_offset = 5,
  .bit_width = 1,
};
inline constexpr field_info dpl_p4{
  .name = "DPL_P4",
  .owner = &reg::dynpd,
  .bit_offset = 4,
  .bit_width = 1,
};
inline constexpr field_info dpl_p3{
  .name = "DPL_P3",
  .owner = &reg::dynpd,
  .bit_offset = 3,
  .bit_width = 1,
};
inline constexpr field_info dpl_p2{
  .name = "DPL_P2",
  .owner = &reg::dynpd,
  .bit_offset = 2,
  .bit_width = 1,
};
inline constexpr field_info dpl_p1{
  .name = "DPL_P1",
  .owner = &reg::dynpd,
  .bit_offset = 1,
  .bit_width = 1,
};
inline constexpr field_info dpl_p0{
  .name = "DPL_P0",
  .owner = &reg::dynpd,
  .bit_offset = 0,
  .bit_width = 1,
};
// FEATURE
inline constexpr field_info en_dpl{
  .name = "EN_DPL",
  .owner = &reg::feature,
  .bit_offset = 2,
  .bit_width = 1,
};
inline constexpr field_info en_ack_pay{
  .name = "EN_ACK_PAY",
  .owner = &reg::feature,
  .bit_offset = 1,
  .bit_width = 1,
};
inline constexpr field_info en_dyn_ack{
  .name = "EN_DYN_ACK",
  .owner = &reg::feature,
  .bit_offset = 0,
  .bit_width = 1,
};
}  // namespace nrf24::field

namespace nrf24 {
inline constexpr std::array<register_info const*, 26> nrf24l01p_registers{
  &reg::config,
  &reg::en_aa,
  &reg::en_rxaddr,
  &reg::setup_aw,
  &reg::setup_retr,
  &reg::rf_ch,
  &reg::rf_setup,
  &reg::status,
  &reg::observe_tx,
  &reg::rpd,
  &reg::rx_addr_p0,
  &reg::rx_addr_p1,
  &reg::rx_addr_p2,
  &reg::rx_addr_p3,
  &reg::rx_addr_p4,
  &reg::rx_addr_p5,
  &reg::tx_addr,
  &reg::rx_pw_p0,
  &reg::rx_pw_p1,
  &reg::rx_pw_p2,
  &reg::rx_pw_p3,
  &reg::rx_pw_p4,
  &reg::rx_pw_p5,
  &reg::fifo_status,
  &reg::dynpd,
  &reg::feature,
};

inline constexpr std::array<field_info const*, 56> nrf24l01p_fields{
  &field::mask_rx_dr,
  &field::mask_tx_ds,
  &field::mask_max_rt,
  &field::en_crc,
  &field::crco,
  &field::pwr_up,
  &field::prim_rx,
  &field::enaa_p5,
  &field::enaa_p4,
  &field::enaa_p3,
  &field::enaa_p2,
  &field::enaa_p1,
  &field::enaa_p0,
  &field::erx_p5,
  &field::erx_p4,
  &field::erx_p3,
  &field::erx_p2,
  &field::erx_p1,
  &field::erx_p0,
  &field::aw,
  &field::ard,
  &field::arc,
  &field::rf_ch,
  &field::cont_wave,
  &field::rf_dr_low,
  &field::pll_lock,
  &field::rf_dr_high,
  &field::rf_pwr,
  &field::rx_dr,
  &field::tx_ds,
  &field::max_rt,
  &field::rx_p_no,
  &field::tx_full,
  &field::plos_cnt,
  &field::arc_cnt,
  &field::rpd,
  &field::rx_pw_p0,
  &field::rx_pw_p1,
  &field::rx_pw_p2,
  &field::rx_pw_p3,
  &field::rx_pw_p4,
  &field::rx_pw_p5,
  &field::tx_reuse,
  &field::fifo_tx_full,
  &field::tx_empty,
  &field::rx_full,
  &field::rx_empty,
  &field::dpl_p5,
  &field::dpl_p4,
  &field::dpl_p3,
  &field::dpl_p2,
  &field::dpl_p1,
  &field::dpl_p0,
  &field::en_dpl,
  &field::en_ack_pay,
  &field::en_dyn_ack,
};

/**
 * @brief Register map of the nRF24L01+
 *
 * Used by `nrf24::device` to validate every register and field reference.
 */
constexpr register_map nrf24l01p_map() noexcept
{
  return { nrf24l01p_registers, nrf24l01p_fields };
}
}  // namespace nrf24
