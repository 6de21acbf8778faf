// Part of SimSpec - A ZX Spectrum emulator
//
// Spectrum128.h: 128K Spectrum with paged memory, sound chip and keypad
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
#include "Ula.h"

constexpr uint8_t MEM_PORT_BANK_MASK = 0x07;
constexpr uint8_t MEM_PORT_SCREEN_MASK = 0x08;
constexpr uint8_t MEM_PORT_ROM_MASK = 0x10;
constexpr uint8_t MEM_PORT_LOCK_MASK = 0x20;

constexpr int NUM_RAM_BANKS = 8;

// AY port A lines used by the keypad
constexpr uint8_t KEYPAD_CTS_MASK = 0x01;   // out: 0 = Spectrum ready for a bit
constexpr uint8_t KEYPAD_DTR_MASK = 0x10;   // in: 0 = keypad has a bit ready
constexpr uint8_t KEYPAD_TXD_MASK = 0x20;   // in: 0 = bit is set

constexpr int NUM_KEYPAD_KEYS = 20;
constexpr int KEYPAD_FRAME_BITS = NUM_KEYPAD_KEYS + 1;
constexpr uint64_t KEYPAD_RESYNC_TSTATES = 20000;

// Serial keypad on the AY I/O port.  Each scan is a presence bit followed by
// the 20 keys, four per row, sent one bit per CTS handshake.
class Keypad
{
public:
    void SetKey(int key, bool pressed);
    void ReleaseAll() { m_keys = 0; }
    void Reset();

    // Lines driven by the Spectrum, sampled at the given CPU tick
    void Write(uint8_t lines, uint64_t tick);

    // DTR and TXD lines, in their port A positions
    uint8_t Read() const;

private:
    uint32_t m_keys{ 0 };
    uint32_t m_frame{ 0 };
    int m_bits_left{ 0 };
    bool m_cts_low{ false };
    uint64_t m_last_edge{ 0 };
};

class Spectrum128 final : public Ula
{
public:
    Spectrum128(const std::vector<uint8_t>& rom0, const std::vector<uint8_t>& rom1);

    void ExecuteFrame(spec_cpu& cpu) override;

    std::vector<uint8_t> ReadMemory() const override;
    uint8_t Peek(uint16_t address) const override;

    uint8_t Read(uint16_t addr) override { return Peek(addr); }
    void Write(uint16_t addr, uint8_t val) override;
    uint8_t In(uint16_t port) override;
    void Out(uint16_t port, uint8_t val) override;

    Keypad* GetKeypad() override { return &m_keypad; }
    AYDevice* SoundChip() override { return &m_ay; }
    void LockTo48K() override { m_mem_port = MEM_PORT_ROM_MASK | MEM_PORT_LOCK_MASK; }

    uint8_t GetMemPort() const { return m_mem_port; }

protected:
    void ResetHardware() override;
    void FrameEnd(uint32_t frame_tstates) override;
    const uint8_t* ScreenMemory() const override;

private:
    uint8_t* PageForAddress(uint16_t addr);
    const uint8_t* PageForAddress(uint16_t addr) const;
    uint8_t KeypadLines() const;

    std::array<std::vector<uint8_t>, 2> m_roms;
    std::vector<uint8_t> m_ram;
    uint8_t m_mem_port{ 0 };

    AYDevice m_ay;
    Keypad m_keypad;
};
