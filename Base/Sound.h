// Part of SimSpec - A ZX Spectrum emulator
//
// Sound.h: Band-limited synthesis of the EAR and MIC lines and the AY
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

#include "AY.h"
#include "Hardware.h"
#include "BlipBuffer.h"

constexpr auto SAMPLE_FREQ = 44100;
constexpr auto SAMPLE_BITS = 16;
constexpr auto MAX_CHANNELS = 2;
constexpr auto NUM_SIGNAL_LINES = 3;

static_assert(sizeof(blip_sample_t) * 8 == SAMPLE_BITS, "unexpected Blip_Buffer sample size");

// Amplitude of each line when high, indexed by SignalLine
using LineWeights = std::array<int, NUM_SIGNAL_LINES>;
using WeightTable = std::array<LineWeights, MAX_CHANNELS>;

// Speaker and MIC with the incoming tape signal, or the speaker alone
extern const WeightTable audible_tape_weights;
extern const WeightTable speaker_weights;

class EdgeAccumulator
{
public:
    EdgeAccumulator(uint32_t clock_hz, int sample_rate = SAMPLE_FREQ);
    EdgeAccumulator(const EdgeAccumulator&) = delete;
    void operator= (const EdgeAccumulator&) = delete;

    void SetClockRate(uint32_t clock_hz);
    int SampleRate() const { return m_sample_rate; }

    // Discard pending samples and line levels
    void Reset();

    void Accumulate(SignalLine line, const std::vector<SignalEdge>& edges, const WeightTable& weights);
    void Accumulate(int ay_channel, const std::vector<LevelStep>& steps);
    int FinalizeFrame(uint32_t frame_tstates);
    std::vector<blip_sample_t> RenderInterleaved(int sample_count, int channels);

private:
    int m_sample_rate{ SAMPLE_FREQ };

    Blip_Buffer buf_left{}, buf_right{};
    std::array<std::array<Blip_Synth<blip_med_quality, 256>, NUM_SIGNAL_LINES>, MAX_CHANNELS> synths{};
    std::array<std::array<Blip_Synth<blip_med_quality, 256>, AY_CHANNELS>, MAX_CHANNELS> ay_synths{};
};
