// Part of SimSpec - A ZX Spectrum emulator
//
// TestDoubles.h: Scripted machine and tape for engine tests
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

#include <gtest/gtest.h>

#include "FrameBuffer.h"
#include "Hardware.h"
#include "Tape.h"

// Each frame covers exactly frame_tstates and reports a scripted probe count
class FakeHardware final : public Hardware
{
public:
    Model GetModel() const override { return Model::Spectrum48; }
    uint32_t FrameTStates() const override { return frame_tstates; }
    uint32_t ClockHz() const override { return 3'500'000; }

    void BindCpu(spec_cpu& cpu) override { cpu.bus = nullptr; }

    void BeginFrame() override
    {
        if (m_frame_cycles < frame_tstates)
            return;

        m_frame_base += frame_tstates;
        m_frame_cycles -= frame_tstates;
        m_edges = {};
    }

    void ExecuteFrame(spec_cpu&) override
    {
        m_frame_cycles += frame_tstates;
        executed_frames++;

        if (m_fed_cursor > frame_tstates)
            m_fed_cursor -= frame_tstates;
        else
            m_fed_cursor = 0;
    }

    uint64_t CurrentTick() const override { return m_frame_base + m_frame_cycles; }

    void Reset(spec_cpu&, bool hard) override { resets.push_back(hard); }

    bool TriggerNmi(spec_cpu&) override
    {
        if (nmi_refusals > 0)
        {
            nmi_refusals--;
            return false;
        }

        nmis++;
        return true;
    }

    const std::vector<SignalEdge>& OutputEdges(SignalLine line) const override { return m_edges[static_cast<size_t>(line)]; }
    std::vector<uint32_t> MicOutPulses() override { return std::move(mic_pulses); }
    unsigned int ProbeCount() const override { return probe_count; }

    uint32_t InputFeedCapacity(unsigned int frame_limit) const override
    {
        auto limit = frame_tstates * frame_limit;
        return (limit > m_fed_cursor) ? limit - m_fed_cursor : 0;
    }

    void FeedEarIn(const std::vector<uint32_t>& pulses) override
    {
        for (auto pulse : pulses)
        {
            m_fed_cursor += pulse;
            fed_pulses.push_back(pulse);
        }
    }

    void ClearEarIn() override
    {
        m_fed_cursor = 0;
        ear_in_clears++;
    }

    std::vector<uint8_t> ReadMemory() const override { return memory; }
    void WriteMemory(uint16_t address, const std::vector<uint8_t>& data) override
    {
        size_t offset = address - PAGE_SIZE;
        for (size_t i = 0; i < data.size() && offset + i < memory.size(); ++i)
            memory[offset + i] = data[i];
    }
    uint8_t Peek(uint16_t address) const override { return (address < PAGE_SIZE) ? 0xff : memory[address - PAGE_SIZE]; }

    uint8_t GetBorder() const override { return border; }
    void SetBorder(uint8_t colour) override { border = colour; }

    void SetKey(int, int, bool) override { }
    void ReleaseAllKeys() override { }

    int VideoWidth() const override { return 256; }
    int VideoHeight() const override { return 192; }
    void RenderVideo(FrameBuffer& fb) override { fb.FillRect(0, 0, fb.Width(), fb.Height(), border); }

    uint32_t frame_tstates{ 69888 };
    unsigned int probe_count{ 0 };
    int nmi_refusals{ 0 };
    int nmis{ 0 };
    int executed_frames{ 0 };
    int ear_in_clears{ 0 };
    uint8_t border{ 7 };
    std::vector<bool> resets;
    std::vector<uint32_t> mic_pulses;
    std::vector<uint32_t> fed_pulses;
    std::vector<uint8_t> memory = std::vector<uint8_t>(0xc000, 0);

private:
    uint32_t m_frame_cycles{ 0 };
    uint64_t m_frame_base{ 0 };
    uint32_t m_fed_cursor{ 0 };
    std::array<std::vector<SignalEdge>, 3> m_edges{};
};

// Tape of fixed-length pulses, split into equal chunks
class FakeTapeMedia final : public TapeMedia
{
public:
    FakeTapeMedia(int chunks, int pulses_per_chunk, uint32_t pulse_length = 2168)
        : m_chunks(chunks), m_pulses_per_chunk(pulses_per_chunk), m_pulse_length(pulse_length)
    {
    }

    std::string GetPath() const override { return "fake.tap"; }
    bool WriteProtected() const override { return write_protected; }

    int ChunkCount() const override { return m_chunks + static_cast<int>(appended.size()); }
    int CurrentChunk() const override { return m_position / m_pulses_per_chunk; }

    bool SelectChunk(int index) override
    {
        if (index < 0 || index >= ChunkCount())
            return false;

        m_position = index * m_pulses_per_chunk;
        m_stop_pending = false;
        return true;
    }

    std::string ChunkInfo(int index) const override { return fmt::format("Chunk {}", index); }

    std::optional<uint32_t> NextPulse() override
    {
        if (m_stop_pending)
        {
            m_stop_pending = false;
            return std::nullopt;
        }

        if (AtEnd())
            return std::nullopt;

        m_position++;
        if (m_position == (stop_after_chunk + 1) * m_pulses_per_chunk)
            m_stop_pending = true;

        return m_pulse_length;
    }

    bool AtEnd() const override { return m_position >= m_chunks * m_pulses_per_chunk; }

    bool AppendChunk(const std::vector<uint8_t>& data) override
    {
        if (fail_writes)
            return false;

        appended.push_back(data);
        return true;
    }

    bool write_protected{ false };
    bool fail_writes{ false };
    int stop_after_chunk{ -1 };     // chunk followed by a stop point
    std::vector<std::vector<uint8_t>> appended;

private:
    int m_chunks{};
    int m_pulses_per_chunk{};
    uint32_t m_pulse_length{};
    int m_position{ 0 };
    bool m_stop_pending{ false };
};

// TZX image holding a pure tone block, optionally followed by a "stop the
// tape" pause and a second tone
inline bool WriteToneTzx(const fs::path& path, uint16_t pulse_length, uint16_t pulse_count, uint16_t count_after_stop = 0)
{
    std::vector<uint8_t> tzx{ 'Z', 'X', 'T', 'a', 'p', 'e', '!', 0x1a, 1, 20 };

    auto add_tone = [&](uint16_t count)
    {
        tzx.push_back(0x12);
        tzx.push_back(static_cast<uint8_t>(pulse_length & 0xff));
        tzx.push_back(static_cast<uint8_t>(pulse_length >> 8));
        tzx.push_back(static_cast<uint8_t>(count & 0xff));
        tzx.push_back(static_cast<uint8_t>(count >> 8));
    };

    add_tone(pulse_count);

    if (count_after_stop)
    {
        tzx.insert(tzx.end(), { 0x20, 0x00, 0x00 });
        add_tone(count_after_stop);
    }

    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(tzx.data()), tzx.size());
    return file.good();
}

// Temporary file removed when the test ends
struct TempPath
{
    explicit TempPath(const std::string& name)
        : path(fs::temp_directory_path() / fmt::format("simspec_{}_{}", ::testing::UnitTest::GetInstance()->current_test_info()->name(), name))
    {
        fs::remove(path);
    }

    ~TempPath()
    {
        std::error_code ec;
        fs::remove(path, ec);
    }

    fs::path path;
};
