// Part of SimSpec - A ZX Spectrum emulator
//
// Spectrum128.cpp: 128K Spectrum with paged memory, sound chip and keypad
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
//  Port 0x7ffd is decoded on A15=0 and A1=0:
//    b0-2 = RAM bank at 0xc000, b3 = shadow screen in bank 7,
//    b4 = ROM select (1 = 48K BASIC), b5 = lock paging until reset
//
//  The sound chip is decoded at 0xfffd (register select/read) and 0xbffd
//  (data write).  The ULA still sees any of these writes on an even port.
//
//  Keypad handshake: the Spectrum pulls CTS low to ask for a bit, and the
//  keypad answers with DTR low and the bit on TXD.  CTS going high moves on
//  to the next bit.  A scan starts on the first request after the previous
//  one completed, or after the line has been quiet for a while.

#include "SimSpec.h"
#include "Spectrum128.h"

constexpr uint8_t PORT_A_OUTPUT_MASK = 0x0f;
constexpr uint8_t RS232_INPUT_MASK = 0xc0;

void Keypad::SetKey(int key, bool pressed)
{
    if (key < 0 || key >= NUM_KEYPAD_KEYS)
        return;

    if (pressed)
        m_keys |= (1U << key);
    else
        m_keys &= ~(1U << key);
}

void Keypad::Reset()
{
    m_frame = 0;
    m_bits_left = 0;
    m_cts_low = false;
}

void Keypad::Write(uint8_t lines, uint64_t tick)
{
    bool cts_low = !(lines & KEYPAD_CTS_MASK);
    if (cts_low == m_cts_low)
        return;

    if (tick - m_last_edge > KEYPAD_RESYNC_TSTATES)
        m_bits_left = 0;

    m_last_edge = tick;
    m_cts_low = cts_low;

    if (cts_low)
    {
        // Key state is latched at the start of each scan
        if (!m_bits_left)
        {
            m_frame = 1 | (m_keys << 1);
            m_bits_left = KEYPAD_FRAME_BITS;
        }
    }
    else if (m_bits_left)
    {
        m_frame >>= 1;
        m_bits_left--;
    }
}

uint8_t Keypad::Read() const
{
    uint8_t lines = KEYPAD_DTR_MASK | KEYPAD_TXD_MASK;

    if (m_cts_low && m_bits_left)
    {
        lines &= ~KEYPAD_DTR_MASK;
        if (m_frame & 1)
            lines &= ~KEYPAD_TXD_MASK;
    }

    return lines;
}

////////////////////////////////////////////////////////////////////////////////

Spectrum128::Spectrum128(const std::vector<uint8_t>& rom0, const std::vector<uint8_t>& rom1)
    : Ula(Model::Spectrum128), m_roms{ rom0, rom1 }
{
    for (auto& rom : m_roms)
        rom.resize(ROM_SIZE, 0xff);

    m_ram.resize(m_info.ram_size);
    RandomFill(m_ram);
}

void Spectrum128::ResetHardware()
{
    m_mem_port = 0;
    m_ay.Reset(m_frame_cycles);
    m_keypad.Reset();
}

void Spectrum128::ExecuteFrame(spec_cpu& cpu)
{
    Ula::ExecuteFrame(cpu);
    m_ay.Update(m_frame_cycles);
}

void Spectrum128::FrameEnd(uint32_t frame_tstates)
{
    m_ay.FrameEnd(frame_tstates);
}

const uint8_t* Spectrum128::PageForAddress(uint16_t addr) const
{
    switch (addr >> 14)
    {
    case 0: return m_roms[(m_mem_port & MEM_PORT_ROM_MASK) ? 1 : 0].data();
    case 1: return &m_ram[5 * PAGE_SIZE];
    case 2: return &m_ram[2 * PAGE_SIZE];
    default: return &m_ram[(m_mem_port & MEM_PORT_BANK_MASK) * PAGE_SIZE];
    }
}

uint8_t* Spectrum128::PageForAddress(uint16_t addr)
{
    if (addr < ROM_SIZE)
        return nullptr;

    return const_cast<uint8_t*>(std::as_const(*this).PageForAddress(addr));
}

uint8_t Spectrum128::Peek(uint16_t address) const
{
    return PageForAddress(address)[address & (PAGE_SIZE - 1)];
}

void Spectrum128::Write(uint16_t addr, uint8_t val)
{
    if (auto page = PageForAddress(addr))
        page[addr & (PAGE_SIZE - 1)] = val;
}

const uint8_t* Spectrum128::ScreenMemory() const
{
    auto bank = (m_mem_port & MEM_PORT_SCREEN_MASK) ? 7 : 5;
    return &m_ram[bank * PAGE_SIZE];
}

// The three banks visible from 0x4000, in address order
std::vector<uint8_t> Spectrum128::ReadMemory() const
{
    std::vector<uint8_t> mem;
    mem.reserve(3 * PAGE_SIZE);

    for (uint32_t addr = 0x4000; addr < 0x10000; addr += PAGE_SIZE)
    {
        auto page = PageForAddress(static_cast<uint16_t>(addr));
        mem.insert(mem.end(), page, page + PAGE_SIZE);
    }

    return mem;
}

// Port A is pulled high unless the chip drives it
uint8_t Spectrum128::KeypadLines() const
{
    return (m_ay.Register(AY_MIXER) & AY_MIXER_PORT_A_OUTPUT) ? m_ay.Register(AY_PORT_A) : 0xff;
}

uint8_t Spectrum128::In(uint16_t port)
{
    if ((port & 0xc002) == 0xc000)
    {
        if (m_ay.Selected() == AY_PORT_A)
            return (KeypadLines() & PORT_A_OUTPUT_MASK) | m_keypad.Read() | RS232_INPUT_MASK;

        return m_ay.Register(m_ay.Selected());
    }

    return Ula::In(port);
}

void Spectrum128::Out(uint16_t port, uint8_t val)
{
    if (!(port & 0x8002) && !(m_mem_port & MEM_PORT_LOCK_MASK))
        m_mem_port = val;

    if ((port & 0xc002) == 0xc000)
    {
        m_ay.Select(val);
    }
    else if ((port & 0xc002) == 0x8000)
    {
        m_ay.Write(m_frame_cycles, val);

        if (m_ay.Selected() == AY_PORT_A || m_ay.Selected() == AY_MIXER)
            m_keypad.Write(KeypadLines(), CurrentTick());
    }

    Ula::Out(port, val);
}
