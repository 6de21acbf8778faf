// Part of SimSpec - A ZX Spectrum emulator
//
// FrameBuffer.h: Palettised display image
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

// Spectrum colours, with bit 3 selecting BRIGHT
enum : uint8_t
{
    BLACK = 0, BLUE, RED, MAGENTA, GREEN, CYAN, YELLOW, WHITE,
    BRIGHT = 0x08,
    NUM_COLOURS = 16
};

class FrameBuffer
{
public:
    FrameBuffer(int width, int height);

    const uint8_t* GetLine(int line) const { return &m_framebuffer[line * m_width]; }
    uint8_t* GetLine(int line) { return &m_framebuffer[line * m_width]; }

    int Width() const { return m_width; }
    int Height() const { return m_height; }

    bool Clip(int& x, int& y, int& width, int& height) const;

    void FillRect(int x, int y, int width, int height, uint8_t colour);

protected:
    int m_width{};
    int m_height{};
    std::vector<uint8_t> m_framebuffer;
};
