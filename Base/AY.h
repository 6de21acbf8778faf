// Part of SimSpec - A ZX Spectrum emulator
//
// AY.h: AY-3-8912 sound chip
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

constexpr int AY_CHANNELS = 3;
constexpr int AY_NUM_REGS = 16;
constexpr uint32_t AY_TICK_TSTATES = 16;    // 8 chip clocks, at half the CPU clock

constexpr uint8_t AY_TONE_PERIOD_A = 0;
constexpr uint8_t AY_NOISE_PERIOD = 6;
constexpr uint8_t AY_MIXER = 7;
constexpr uint8_t AY_AMPLITUDE_A = 8;
constexpr uint8_t AY_ENV_PERIOD_LOW = 11;
constexpr uint8_t AY_ENV_PERIOD_HIGH = 12;
constexpr uint8_t AY_ENV_SHAPE = 13;
constexpr uint8_t AY_PORT_A = 14;

constexpr uint8_t AY_MIXER_PORT_A_OUTPUT = 0x40;
constexpr uint8_t AY_AMPLITUDE_ENVELOPE = 0x10;

// Channel output level (0-15) from the given T-state in the frame
struct LevelStep
{
    uint32_t tstate;
    uint8_t level;
};

class AYDevice
{
public:
    AYDevice() { Reset(0); }

    void Reset(uint32_t tstate);

    uint8_t Selected() const { return m_selected; }
    void Select(uint8_t reg) { m_selected = reg & (AY_NUM_REGS - 1); }
    uint8_t Register(uint8_t reg) const { return m_regs[reg & (AY_NUM_REGS - 1)]; }

    // Write the selected register, after running the chip up to tstate
    void Write(uint32_t tstate, uint8_t val);

    void Update(uint32_t tstate);
    void FrameEnd(uint32_t frame_tstates);

    const std::vector<LevelStep>& Output(int channel) const { return m_steps[channel]; }

private:
    void Tick();
    void RestartEnvelope();
    void StepEnvelope();
    uint8_t ChannelLevel(int channel) const;
    void UpdateOutput(uint32_t tstate);

    std::array<uint8_t, AY_NUM_REGS> m_regs{};
    uint8_t m_selected{ 0 };

    uint32_t m_next_tick{ 0 };
    bool m_half_tick{ false };

    std::array<int, AY_CHANNELS> m_tone_count{};
    std::array<bool, AY_CHANNELS> m_tone_high{};

    int m_noise_count{ 0 };
    uint32_t m_noise_lfsr{ 1 };

    int m_env_count{ 0 };
    int m_env_step{ 0 };
    uint8_t m_env_attack{ 0 };
    bool m_env_hold{ false };
    bool m_env_alternate{ false };
    bool m_env_holding{ false };

    std::array<uint8_t, AY_CHANNELS> m_levels{};
    std::array<std::vector<LevelStep>, AY_CHANNELS> m_steps{};
};
