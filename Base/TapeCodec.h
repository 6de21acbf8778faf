// Part of SimSpec - A ZX Spectrum emulator
//
// TapeCodec.h: Decoding of ROM-timed tape pulses into data blocks
//
//  Copyright (c) 1999-2024 Simon Owen
//
// This program is free software; you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation; either version 2 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program; if not, write to the Free Software
// Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

#pragma once

// Standard ROM timings, in 3.5MHz T-states
constexpr uint32_t PILOT_PULSE_LENGTH = 2168;
constexpr uint32_t SYNC1_PULSE_LENGTH = 667;
constexpr uint32_t SYNC2_PULSE_LENGTH = 735;
constexpr uint32_t BIT0_PULSE_LENGTH = 855;
constexpr uint32_t BIT1_PULSE_LENGTH = 1710;
constexpr uint32_t HEADER_PILOT_PULSES = 8063;
constexpr uint32_t DATA_PILOT_PULSES = 3223;
constexpr uint32_t MIN_PILOT_PULSES = 256;
constexpr uint32_t BLOCK_PAUSE_MS = 1000;

class PulseDecoder
{
public:
    // Feed one pulse; returns a completed block, if any
    std::optional<std::vector<uint8_t>> AddPulse(uint32_t tstates);

    // Finish any block in progress
    std::optional<std::vector<uint8_t>> Flush();
    void Reset();

    bool IsIdle() const { return m_state == State::Idle; }

private:
    enum class State { Idle, Pilot, Sync, Data };

    std::optional<std::vector<uint8_t>> EndBlock();

    State m_state{ State::Idle };
    uint32_t m_pilot_count{ 0 };
    std::optional<uint32_t> m_first_half;
    uint8_t m_byte{ 0 };
    int m_bits{ 0 };
    std::vector<uint8_t> m_data;
};

// Pulse sequence for a block in the standard ROM format, used by tests
std::vector<uint32_t> EncodeRomBlock(const std::vector<uint8_t>& data);
