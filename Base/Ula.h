// Part of SimSpec - A ZX Spectrum emulator
//
// Ula.h: ULA logic shared by all Spectrum models
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

#include "Events.h"
#include "Hardware.h"
#include "Joystick.h"

constexpr uint8_t ULA_EAR_IN_MASK = 0x40;
constexpr uint8_t ULA_EAR_OUT_MASK = 0x10;
constexpr uint8_t ULA_MIC_OUT_MASK = 0x08;
constexpr uint8_t ULA_BORDER_MASK = 0x07;

constexpr int SCREEN_WIDTH = 256;
constexpr int SCREEN_HEIGHT = 192;
constexpr uint16_t SCREEN_ATTRS = 0x1800;
constexpr int FLASH_FRAMES = 16;

class Ula : public Hardware, public Z80Bus
{
public:
    explicit Ula(Model model);

    Model GetModel() const override { return m_info.model; }
    uint32_t FrameTStates() const override { return m_info.frame_tstates; }
    uint32_t ClockHz() const override { return m_info.cpu_hz; }

    void BindCpu(spec_cpu& cpu) override { cpu.bus = this; }

    void BeginFrame() override;
    void ExecuteFrame(spec_cpu& cpu) override;
    uint64_t CurrentTick() const override { return m_frame_base + m_frame_cycles; }

    void Reset(spec_cpu& cpu, bool hard) override;
    bool TriggerNmi(spec_cpu& cpu) override;

    const std::vector<SignalEdge>& OutputEdges(SignalLine line) const override;
    std::vector<uint32_t> MicOutPulses() override;
    unsigned int ProbeCount() const override { return m_probe_count; }

    uint32_t InputFeedCapacity(unsigned int frame_limit) const override;
    void FeedEarIn(const std::vector<uint32_t>& pulses) override;
    void ClearEarIn() override;

    void WriteMemory(uint16_t address, const std::vector<uint8_t>& data) override;

    uint8_t GetBorder() const override { return m_border; }
    void SetBorder(uint8_t colour) override { m_border = colour & ULA_BORDER_MASK; }

    void SetKey(int row, int bit, bool pressed) override;
    void ReleaseAllKeys() override;

    int VideoWidth() const override { return SCREEN_WIDTH + m_border_size * 2; }
    int VideoHeight() const override { return SCREEN_HEIGHT + m_border_size * 2; }
    void RenderVideo(FrameBuffer& fb) override;

    JoystickPort* Joystick() override { return &m_joystick; }

    // Z80Bus
    void Tick(unsigned t) override { m_frame_cycles += t; }
    uint8_t In(uint16_t port) override;
    void Out(uint16_t port, uint8_t val) override;

protected:
    virtual void ResetHardware() { }
    virtual void FrameEnd(uint32_t /*frame_tstates*/) { }
    virtual const uint8_t* ScreenMemory() const = 0;

    static void RandomFill(std::vector<uint8_t>& mem);

    uint8_t ReadKeyRow(int row) const;

private:
    void CheckEvents();
    void ExecuteEvent(const CPU_EVENT& event);
    void RecordEdge(SignalLine line, uint32_t tstate, bool level);

protected:
    const ModelInfo& m_info;
    EventQueue m_events;

    uint32_t m_frame_cycles{ 0 };
    uint64_t m_frame_base{ 0 };
    uint64_t m_frame_count{ 0 };
    bool m_break{ false };
    bool m_int_active{ false };

    uint8_t m_border{ WHITE_BORDER };
    int m_border_size{ 0 };
    bool m_ear_out{ false };
    bool m_mic_out{ false };
    bool m_ear_in{ false };

    std::array<std::vector<SignalEdge>, 3> m_edges{};
    unsigned int m_probe_count{ 0 };
    uint64_t m_last_mic_edge{ 0 };

    std::deque<uint32_t> m_ear_in_queue;    // due times of queued EAR edges
    uint32_t m_ear_in_cursor{ 0 };

    std::array<uint8_t, NUM_KEY_ROWS> m_keys{};
    JoystickPort m_joystick;

    static constexpr uint8_t WHITE_BORDER = 7;
};
