// Part of SimSpec - A ZX Spectrum emulator
//
// CPU.h: Z80 processor bound to the hardware bus
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

#include "z80.h"

constexpr uint16_t IM1_INTERRUPT_HANDLER = 0x0038;
constexpr uint16_t NMI_INTERRUPT_HANDLER = 0x0066;

// Memory and I/O as seen from the CPU pins
class Z80Bus
{
public:
    virtual ~Z80Bus() = default;

    virtual void Tick(unsigned t) = 0;
    virtual uint8_t Read(uint16_t addr) = 0;
    virtual void Write(uint16_t addr, uint8_t val) = 0;
    virtual uint8_t In(uint16_t port) = 0;
    virtual void Out(uint16_t port, uint8_t val) = 0;
};

// The register state is independent of the machine it runs in, so a CPU
// can be copied to new hardware and rebound to its bus.
struct spec_cpu : public z80::z80_cpu<spec_cpu>
{
    using base = z80::z80_cpu<spec_cpu>;
    using base::sf_mask, base::zf_mask, base::yf_mask, base::hf_mask;
    using base::xf_mask, base::pf_mask, base::nf_mask, base::cf_mask;

    Z80Bus* bus{ nullptr };

    void on_tick(unsigned t)
    {
        bus->Tick(t);
    }

    z80::fast_u8 on_read(z80::fast_u16 addr)
    {
        return bus->Read(static_cast<uint16_t>(addr));
    }

    void on_write(z80::fast_u16 addr, z80::fast_u8 val)
    {
        bus->Write(static_cast<uint16_t>(addr), static_cast<uint8_t>(val));
    }

    z80::fast_u8 on_input(z80::fast_u16 port)
    {
        return bus->In(static_cast<uint16_t>(port));
    }

    void on_output(z80::fast_u16 port, z80::fast_u8 val)
    {
        bus->Out(static_cast<uint16_t>(port), static_cast<uint8_t>(val));
    }
};
