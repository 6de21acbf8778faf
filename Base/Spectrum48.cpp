// Part of SimSpec - A ZX Spectrum emulator
//
// Spectrum48.cpp: 16K and 48K Spectrum
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

#include "SimSpec.h"
#include "Spectrum48.h"

Spectrum48::Spectrum48(Model model, const std::vector<uint8_t>& rom)
    : Ula(model), m_rom(rom)
{
    m_rom.resize(ROM_SIZE, 0xff);
    m_ram.resize(m_info.ram_size);
    RandomFill(m_ram);
}

uint8_t Spectrum48::Peek(uint16_t address) const
{
    if (address < ROM_SIZE)
        return m_rom[address];

    // Unfitted upper RAM on the 16K model floats high
    size_t offset = address - ROM_SIZE;
    return (offset < m_ram.size()) ? m_ram[offset] : 0xff;
}

void Spectrum48::Write(uint16_t addr, uint8_t val)
{
    if (addr < ROM_SIZE)
        return;

    size_t offset = addr - ROM_SIZE;
    if (offset < m_ram.size())
        m_ram[offset] = val;
}
