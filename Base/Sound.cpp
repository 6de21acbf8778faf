// Part of SimSpec - A ZX Spectrum emulator
//
// Sound.cpp: Band-limited synthesis of the EAR and MIC lines and the AY
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
//  Each line has its own synth per channel, so a line's level is remembered
//  between frames and only changes produce amplitude steps.  Edge times are
//  T-states from the start of the frame, matching Blip_Buffer's frame clock.
//
//  AY channels use the chip's logarithmic volume curve, and are heard on
//  both sides as the 128K has mono output.

#include "SimSpec.h"
#include "Sound.h"

//                                         EAR  MIC  EAR-in
const WeightTable audible_tape_weights{ { { 96, 24, 48 }, { 96, 24, 48 } } };
const WeightTable speaker_weights{ { { 128, 0, 0 }, { 128, 0, 0 } } };

static const std::array<int, 16> ay_amplitudes{ 0, 1, 1, 1, 2, 3, 4, 6, 7, 11, 15, 19, 24, 29, 36, 42 };

EdgeAccumulator::EdgeAccumulator(uint32_t clock_hz, int sample_rate)
    : m_sample_rate(sample_rate)
{
    if (buf_left.set_sample_rate(sample_rate) || buf_right.set_sample_rate(sample_rate))
        Message(MsgType::Error, "Failed to allocate {}Hz sound buffers", sample_rate);

    SetClockRate(clock_hz);

    for (auto& synth : synths[0])
        synth.output(&buf_left);
    for (auto& synth : synths[1])
        synth.output(&buf_right);
    for (auto& synth : ay_synths[0])
        synth.output(&buf_left);
    for (auto& synth : ay_synths[1])
        synth.output(&buf_right);

    for (auto& channel : synths)
    {
        for (auto& synth : channel)
            synth.volume(1.0);
    }

    for (auto& channel : ay_synths)
    {
        for (auto& synth : channel)
            synth.volume(1.0);
    }

    Reset();
}

void EdgeAccumulator::SetClockRate(uint32_t clock_hz)
{
    buf_left.clock_rate(clock_hz);
    buf_right.clock_rate(clock_hz);
}

void EdgeAccumulator::Reset()
{
    // Return the synths to zero before clearing, so the step isn't heard
    for (auto& channel : synths)
    {
        for (auto& synth : channel)
            synth.update(0, 0);
    }

    for (auto& channel : ay_synths)
    {
        for (auto& synth : channel)
            synth.update(0, 0);
    }

    buf_left.clear();
    buf_right.clear();
}

void EdgeAccumulator::Accumulate(SignalLine line, const std::vector<SignalEdge>& edges, const WeightTable& weights)
{
    auto idx = static_cast<size_t>(line);

    for (auto& edge : edges)
    {
        for (int ch = 0; ch < MAX_CHANNELS; ++ch)
            synths[ch][idx].update(edge.tstate, edge.level ? weights[ch][idx] : 0);
    }
}

void EdgeAccumulator::Accumulate(int ay_channel, const std::vector<LevelStep>& steps)
{
    if (ay_channel < 0 || ay_channel >= AY_CHANNELS)
        return;

    for (auto& step : steps)
    {
        for (auto& channel : ay_synths)
            channel[ay_channel].update(step.tstate, ay_amplitudes[step.level & 0x0f]);
    }
}

int EdgeAccumulator::FinalizeFrame(uint32_t frame_tstates)
{
    buf_left.end_frame(frame_tstates);
    buf_right.end_frame(frame_tstates);

    return static_cast<int>(buf_left.samples_avail());
}

std::vector<blip_sample_t> EdgeAccumulator::RenderInterleaved(int sample_count, int channels)
{
    channels = std::clamp(channels, 1, MAX_CHANNELS);
    auto count = std::min(static_cast<long>(sample_count), buf_left.samples_avail());
    count = std::max(count, 0L);

    std::vector<blip_sample_t> samples(count * channels);

    if (channels == 2)
    {
        buf_left.read_samples(samples.data(), count, 1);
        buf_right.read_samples(samples.data() + 1, count, 1);
    }
    else
    {
        buf_left.read_samples(samples.data(), count);
        buf_right.remove_samples(count);
    }

    return samples;
}
