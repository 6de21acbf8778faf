// Part of SimSpec - A ZX Spectrum emulator
//
// AY.cpp: AY-3-8912 sound chip
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
//  The chip is run on demand: register writes and the end of the frame
//  catch it up to the current T-state first.  Each channel's output is
//  kept as a list of level changes, which the sound code turns into
//  band-limited steps alongside the beeper.
//
//  Tone counters advance every 8 chip clocks.  Noise and the envelope
//  advance at half that rate.  The envelope has 16 steps per cycle.

#include "SimSpec.h"
#include "AY.h"

static const std::array<uint8_t, AY_NUM_REGS> register_masks
{
    0xff, 0x0f, 0xff, 0x0f, 0xff, 0x0f, 0x1f, 0xff,
    0x1f, 0x1f, 0x1f, 0xff, 0xff, 0x0f, 0xff, 0xff,
};

void AYDevice::Reset(uint32_t tstate)
{
    m_regs.fill(0);
    m_selected = 0;

    m_tone_count.fill(0);
    m_tone_high.fill(false);
    m_noise_count = 0;
    m_noise_lfsr = 1;

    RestartEnvelope();
    UpdateOutput(tstate);
}

void AYDevice::Write(uint32_t tstate, uint8_t val)
{
    Update(tstate);

    m_regs[m_selected] = val & register_masks[m_selected];

    if (m_selected == AY_ENV_SHAPE)
        RestartEnvelope();

    UpdateOutput(tstate);
}

void AYDevice::Update(uint32_t tstate)
{
    while (m_next_tick <= tstate)
    {
        Tick();
        UpdateOutput(m_next_tick);
        m_next_tick += AY_TICK_TSTATES;
    }
}

void AYDevice::FrameEnd(uint32_t frame_tstates)
{
    m_next_tick = (m_next_tick > frame_tstates) ? m_next_tick - frame_tstates : 0;

    for (auto& steps : m_steps)
        steps.clear();
}

void AYDevice::Tick()
{
    for (int ch = 0; ch < AY_CHANNELS; ++ch)
    {
        auto reg = AY_TONE_PERIOD_A + ch * 2;
        auto period = std::max((m_regs[reg + 1] << 8) | m_regs[reg], 1);

        if (++m_tone_count[ch] >= period)
        {
            m_tone_count[ch] = 0;
            m_tone_high[ch] = !m_tone_high[ch];
        }
    }

    m_half_tick = !m_half_tick;
    if (m_half_tick)
        return;

    if (++m_noise_count >= std::max<int>(m_regs[AY_NOISE_PERIOD], 1))
    {
        // 17-bit LFSR with taps at bits 0 and 3
        m_noise_count = 0;
        auto bit = (m_noise_lfsr ^ (m_noise_lfsr >> 3)) & 1;
        m_noise_lfsr = (m_noise_lfsr >> 1) | (bit << 16);
    }

    auto env_period = std::max((m_regs[AY_ENV_PERIOD_HIGH] << 8) | m_regs[AY_ENV_PERIOD_LOW], 1);
    if (++m_env_count >= env_period)
    {
        m_env_count = 0;
        StepEnvelope();
    }
}

void AYDevice::RestartEnvelope()
{
    auto shape = m_regs[AY_ENV_SHAPE];

    m_env_attack = (shape & 0x04) ? 0x0f : 0x00;

    // Shapes without continue hold at zero after one cycle
    if (!(shape & 0x08))
    {
        m_env_hold = true;
        m_env_alternate = m_env_attack != 0;
    }
    else
    {
        m_env_hold = (shape & 0x01) != 0;
        m_env_alternate = (shape & 0x02) != 0;
    }

    m_env_step = 0x0f;
    m_env_count = 0;
    m_env_holding = false;
}

void AYDevice::StepEnvelope()
{
    if (m_env_holding || --m_env_step >= 0)
        return;

    if (m_env_alternate)
        m_env_attack ^= 0x0f;

    if (m_env_hold)
    {
        m_env_holding = true;
        m_env_step = 0;
    }
    else
    {
        m_env_step = 0x0f;
    }
}

uint8_t AYDevice::ChannelLevel(int channel) const
{
    auto mixer = m_regs[AY_MIXER];
    bool tone = m_tone_high[channel] || (mixer & (0x01 << channel));
    bool noise = (m_noise_lfsr & 1) || (mixer & (0x08 << channel));

    if (!tone || !noise)
        return 0;

    auto amplitude = m_regs[AY_AMPLITUDE_A + channel];
    if (amplitude & AY_AMPLITUDE_ENVELOPE)
        return static_cast<uint8_t>(m_env_step ^ m_env_attack);

    return amplitude & 0x0f;
}

void AYDevice::UpdateOutput(uint32_t tstate)
{
    for (int ch = 0; ch < AY_CHANNELS; ++ch)
    {
        auto level = ChannelLevel(ch);
        if (level != m_levels[ch])
        {
            m_levels[ch] = level;
            m_steps[ch].push_back({ tstate, level });
        }
    }
}
