// Part of SimSpec - A ZX Spectrum emulator
//
// Spectrum48.h: 16K and 48K Spectrum
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

#include "Ula.h"

class Spectrum48 final : public Ula
{
public:
    Spectrum48(Model model, const std::vector<uint8_t>& rom);

    std::vector<uint8_t> ReadMemory() const override { return m_ram; }
    uint8_t Peek(uint16_t address) const override;

    uint8_t Read(uint16_t addr) override { return Peek(addr); }
    void Write(uint16_t addr, uint8_t val) override;

protected:
    const uint8_t* ScreenMemory() const override { return m_ram.data(); }

private:
    std::vector<uint8_t> m_rom;
    std::vector<uint8_t> m_ram;
};
