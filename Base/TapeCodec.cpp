// Part of SimSpec - A ZX Spectrum emulator
//
// TapeCodec.cpp: Decoding of ROM-timed tape pulses into data blocks
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

// Notes:
//  Pulses are matched with 25% tolerance.  Sync and bit 0 lengths overlap,
//  as do pilot and bit 1, so the decoder state picks the interpretation.
//  Each data bit is two equal pulses, most significant bit first.  Any pulse
//  that doesn't fit ends the block.

#include "SimSpec.h"
#include "TapeCodec.h"

static bool Matches(uint32_t tstates, uint32_t expected)
{
    auto tolerance = expected / 4;
    return tstates >= expected - tolerance && tstates <= expected + tolerance;
}

static bool IsSync(uint32_t tstates)
{
    return tstates >= SYNC1_PULSE_LENGTH - SYNC1_PULSE_LENGTH / 4 &&
        tstates <= SYNC2_PULSE_LENGTH + SYNC2_PULSE_LENGTH / 4;
}

void PulseDecoder::Reset()
{
    m_state = State::Idle;
    m_pilot_count = 0;
    m_first_half.reset();
    m_byte = 0;
    m_bits = 0;
    m_data.clear();
}

std::optional<std::vector<uint8_t>> PulseDecoder::EndBlock()
{
    std::optional<std::vector<uint8_t>> block;
    if (!m_data.empty())
        block = std::move(m_data);

    Reset();
    return block;
}

std::optional<std::vector<uint8_t>> PulseDecoder::Flush()
{
    return EndBlock();
}

std::optional<std::vector<uint8_t>> PulseDecoder::AddPulse(uint32_t tstates)
{
    switch (m_state)
    {
    case State::Idle:
        if (Matches(tstates, PILOT_PULSE_LENGTH))
        {
            m_state = State::Pilot;
            m_pilot_count = 1;
        }
        break;

    case State::Pilot:
        if (Matches(tstates, PILOT_PULSE_LENGTH))
            m_pilot_count++;
        else if (IsSync(tstates) && m_pilot_count >= MIN_PILOT_PULSES)
            m_state = State::Sync;
        else
            Reset();
        break;

    case State::Sync:
        if (IsSync(tstates))
        {
            m_state = State::Data;
            m_first_half.reset();
            m_byte = 0;
            m_bits = 0;
        }
        else
            Reset();
        break;

    case State::Data:
    {
        bool is_bit0 = Matches(tstates, BIT0_PULSE_LENGTH);
        bool is_bit1 = Matches(tstates, BIT1_PULSE_LENGTH);

        if (!is_bit0 && !is_bit1)
        {
            auto block = EndBlock();

            // The end of one block may run straight into the next pilot
            if (Matches(tstates, PILOT_PULSE_LENGTH))
            {
                m_state = State::Pilot;
                m_pilot_count = 1;
            }
            return block;
        }

        if (!m_first_half)
        {
            m_first_half = tstates;
            break;
        }

        bool first_bit1 = Matches(*m_first_half, BIT1_PULSE_LENGTH);
        m_first_half.reset();

        if (first_bit1 != is_bit1)
            return EndBlock();

        m_byte = static_cast<uint8_t>((m_byte << 1) | (is_bit1 ? 1 : 0));
        if (++m_bits == 8)
        {
            m_data.push_back(m_byte);
            m_byte = 0;
            m_bits = 0;
        }
        break;
    }
    }

    return std::nullopt;
}

////////////////////////////////////////////////////////////////////////////////

std::vector<uint32_t> EncodeRomBlock(const std::vector<uint8_t>& data)
{
    std::vector<uint32_t> pulses;

    auto pilot_pulses = (!data.empty() && data[0] < 0x80) ? HEADER_PILOT_PULSES : DATA_PILOT_PULSES;
    pulses.insert(pulses.end(), pilot_pulses, PILOT_PULSE_LENGTH);
    pulses.push_back(SYNC1_PULSE_LENGTH);
    pulses.push_back(SYNC2_PULSE_LENGTH);

    for (auto b : data)
    {
        for (int bit = 7; bit >= 0; --bit)
        {
            auto len = (b & (1 << bit)) ? BIT1_PULSE_LENGTH : BIT0_PULSE_LENGTH;
            pulses.push_back(len);
            pulses.push_back(len);
        }
    }

    return pulses;
}
