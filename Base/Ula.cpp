// Part of SimSpec - A ZX Spectrum emulator
//
// Ula.cpp: ULA logic shared by all Spectrum models
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
//  Execution is polled a frame at a time.  The frame ends when the frame
//  interrupt event fires, which may be a few T-states after the nominal end
//  if an instruction straddles it.  The excess carries into the next frame.
//
//  Port 0xfe reads count as EAR probes, which the tape heuristics use to
//  spot a program waiting for tape input.

#include "SimSpec.h"
#include "Ula.h"

#include <random>

#include "FrameBuffer.h"
#include "Options.h"

static const std::array<int, 5> border_sizes{ 0, 8, 16, 32, 48 };

Ula::Ula(Model model)
    : m_info(GetModelInfo(model))
{
    auto border_idx = std::clamp(GetOption(border), 0, static_cast<int>(border_sizes.size()) - 1);
    m_border_size = border_sizes[border_idx];

    m_keys.fill(0x1f);

    // The frame starts with INT asserted
    m_int_active = true;
    m_events.AddEvent(EventType::FrameInterruptEnd, m_info.int_tstates);
    m_events.AddEvent(EventType::FrameInterrupt, m_info.frame_tstates);
}

void Ula::RandomFill(std::vector<uint8_t>& mem)
{
    std::mt19937 rng{ std::random_device{}() };
    std::uniform_int_distribution<int> dist(0, 255);
    std::generate(mem.begin(), mem.end(), [&] { return static_cast<uint8_t>(dist(rng)); });
}

////////////////////////////////////////////////////////////////////////////////

void Ula::BeginFrame()
{
    auto frame_tstates = m_info.frame_tstates;
    if (m_frame_cycles < frame_tstates)
        return;

    m_events.FrameEnd(frame_tstates);
    for (auto& due_time : m_ear_in_queue)
        due_time -= frame_tstates;
    m_ear_in_cursor = (m_ear_in_cursor > frame_tstates) ? m_ear_in_cursor - frame_tstates : 0;

    m_frame_base += frame_tstates;
    m_frame_cycles -= frame_tstates;
    m_frame_count++;
    FrameEnd(frame_tstates);

    for (auto& edges : m_edges)
        edges.clear();
    m_probe_count = 0;
}

void Ula::ExecuteFrame(spec_cpu& cpu)
{
    BindCpu(cpu);

    for (m_break = false; !m_break; )
    {
        cpu.on_step();

        CheckEvents();

        // Never between an index prefix and its instruction
        if (cpu.get_iregp_kind() != z80::iregp::hl)
            continue;

        if (m_int_active)
            cpu.on_handle_active_int();
    }
}

void Ula::CheckEvents()
{
    CPU_EVENT event;
    while (m_events.PopDue(m_frame_cycles, event))
        ExecuteEvent(event);
}

void Ula::ExecuteEvent(const CPU_EVENT& event)
{
    switch (event.type)
    {
    case EventType::FrameInterrupt:
        m_int_active = true;
        m_events.AddEvent(EventType::FrameInterruptEnd, event.due_time + m_info.int_tstates);
        m_events.AddEvent(EventType::FrameInterrupt, event.due_time + m_info.frame_tstates);
        m_break = true;
        break;

    case EventType::FrameInterruptEnd:
        m_int_active = false;
        break;

    case EventType::TapeEdge:
        m_ear_in = !m_ear_in;
        RecordEdge(SignalLine::EarIn, event.due_time, m_ear_in);

        m_ear_in_queue.pop_front();
        if (!m_ear_in_queue.empty())
            m_events.AddEvent(EventType::TapeEdge, m_ear_in_queue.front());
        break;

    case EventType::None:
        break;
    }
}

void Ula::Reset(spec_cpu& cpu, bool hard)
{
    cpu.set_is_halted(false);
    cpu.set_iff1(false);
    cpu.set_iff2(false);
    cpu.set_int_mode(0);
    cpu.set_pc(0);
    cpu.set_ir(0);

    if (hard)
    {
        cpu.set_af(0xffff);
        cpu.set_bc(0xffff);
        cpu.set_de(0xffff);
        cpu.set_hl(0xffff);
        cpu.set_ix(0xffff);
        cpu.set_iy(0xffff);
        cpu.set_sp(0xffff);
        cpu.set_alt_af(0xffff);
        cpu.set_alt_bc(0xffff);
        cpu.set_alt_de(0xffff);
        cpu.set_alt_hl(0xffff);

        ResetHardware();
    }
}

bool Ula::TriggerNmi(spec_cpu& cpu)
{
    // Not accepted between an index prefix and its instruction
    if (cpu.get_iregp_kind() != z80::iregp::hl)
        return false;

    cpu.initiate_nmi();
    return true;
}

////////////////////////////////////////////////////////////////////////////////

void Ula::RecordEdge(SignalLine line, uint32_t tstate, bool level)
{
    m_edges[static_cast<size_t>(line)].push_back({ tstate, level });
}

const std::vector<SignalEdge>& Ula::OutputEdges(SignalLine line) const
{
    return m_edges[static_cast<size_t>(line)];
}

std::vector<uint32_t> Ula::MicOutPulses()
{
    std::vector<uint32_t> pulses;

    for (auto& edge : m_edges[static_cast<size_t>(SignalLine::MicOut)])
    {
        auto edge_tick = m_frame_base + edge.tstate;
        pulses.push_back(static_cast<uint32_t>(edge_tick - m_last_mic_edge));
        m_last_mic_edge = edge_tick;
    }

    // A silent line still needs to reach the decoder so it can finish a block
    auto now = CurrentTick();
    if (pulses.empty() && (now - m_last_mic_edge) > m_info.frame_tstates)
    {
        pulses.push_back(static_cast<uint32_t>(std::min<uint64_t>(now - m_last_mic_edge, UINT32_MAX)));
        m_last_mic_edge = now;
    }

    return pulses;
}

uint32_t Ula::InputFeedCapacity(unsigned int frame_limit) const
{
    auto cursor = m_ear_in_queue.empty() ? std::max(m_ear_in_cursor, m_frame_cycles) : m_ear_in_cursor;
    auto limit = m_info.frame_tstates * frame_limit;
    return (limit > cursor) ? limit - cursor : 0;
}

void Ula::FeedEarIn(const std::vector<uint32_t>& pulses)
{
    if (pulses.empty())
        return;

    auto was_empty = m_ear_in_queue.empty();
    if (was_empty)
        m_ear_in_cursor = std::max(m_ear_in_cursor, m_frame_cycles);

    for (auto pulse : pulses)
    {
        m_ear_in_cursor += pulse;
        m_ear_in_queue.push_back(m_ear_in_cursor);
    }

    if (was_empty)
        m_events.AddEvent(EventType::TapeEdge, m_ear_in_queue.front());
}

void Ula::ClearEarIn()
{
    m_events.CancelEvent(EventType::TapeEdge);
    m_ear_in_queue.clear();
    m_ear_in_cursor = m_frame_cycles;
}

////////////////////////////////////////////////////////////////////////////////

void Ula::WriteMemory(uint16_t address, const std::vector<uint8_t>& data)
{
    uint32_t addr = address;

    for (auto b : data)
    {
        if (addr > 0xffff)
            break;

        Write(static_cast<uint16_t>(addr++), b);
    }
}

void Ula::SetKey(int row, int bit, bool pressed)
{
    if (row < 0 || row >= NUM_KEY_ROWS || bit < 0 || bit > 4)
        return;

    if (pressed)
        m_keys[row] &= ~(1 << bit);
    else
        m_keys[row] |= (1 << bit);
}

void Ula::ReleaseAllKeys()
{
    m_keys.fill(0x1f);
}

uint8_t Ula::ReadKeyRow(int row) const
{
    return m_keys[row] & ~m_joystick.KeyRowMask(row);
}

////////////////////////////////////////////////////////////////////////////////

uint8_t Ula::In(uint16_t port)
{
    if (auto joy_val = m_joystick.In(port))
        return *joy_val;

    if (!(port & 1))
    {
        m_probe_count++;

        // Address lines A8-A15 select the keyboard half-rows
        uint8_t val = 0x1f;
        for (int row = 0; row < NUM_KEY_ROWS; ++row)
        {
            if (!(port & (0x100 << row)))
                val &= ReadKeyRow(row);
        }

        return val | 0xa0 | (m_ear_in ? ULA_EAR_IN_MASK : 0);
    }

    return 0xff;
}

void Ula::Out(uint16_t port, uint8_t val)
{
    if (port & 1)
        return;

    m_border = val & ULA_BORDER_MASK;

    bool ear = (val & ULA_EAR_OUT_MASK) != 0;
    if (ear != m_ear_out)
    {
        m_ear_out = ear;
        RecordEdge(SignalLine::EarOut, m_frame_cycles, ear);
    }

    bool mic = (val & ULA_MIC_OUT_MASK) != 0;
    if (mic != m_mic_out)
    {
        m_mic_out = mic;
        RecordEdge(SignalLine::MicOut, m_frame_cycles, mic);
    }
}

////////////////////////////////////////////////////////////////////////////////

void Ula::RenderVideo(FrameBuffer& fb)
{
    fb.FillRect(0, 0, fb.Width(), fb.Height(), m_border);

    auto screen = ScreenMemory();
    auto flash_invert = ((m_frame_count / FLASH_FRAMES) & 1) != 0;

    for (int y = 0; y < SCREEN_HEIGHT; ++y)
    {
        if (m_border_size + y >= fb.Height())
            break;

        auto line = fb.GetLine(m_border_size + y) + m_border_size;
        auto pixel_row = ((y & 0xc0) << 5) | ((y & 0x07) << 8) | ((y & 0x38) << 2);
        auto attr_row = SCREEN_ATTRS + (y >> 3) * 32;

        for (int x = 0; x < SCREEN_WIDTH / 8; ++x)
        {
            auto pixels = screen[pixel_row + x];
            auto attr = screen[attr_row + x];

            uint8_t bright = (attr & 0x40) ? BRIGHT : 0;
            uint8_t ink = (attr & 0x07) | bright;
            uint8_t paper = ((attr >> 3) & 0x07) | bright;

            if ((attr & 0x80) && flash_invert)
                std::swap(ink, paper);

            for (int bit = 0; bit < 8; ++bit)
                *line++ = (pixels & (0x80 >> bit)) ? ink : paper;
        }
    }
}
