// Part of SimSpec - A ZX Spectrum emulator
//
// FrameBuffer.cpp: Palettised display image
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
#include "FrameBuffer.h"

FrameBuffer::FrameBuffer(int width, int height) :
    m_width(width), m_height(height)
{
    m_framebuffer.resize(width * height);
}

bool FrameBuffer::Clip(int& x, int& y, int& width, int& height) const
{
    auto orig_x = x;
    auto orig_y = y;

    x = std::max(0, x);
    y = std::max(0, y);
    width = std::min(m_width - x, width - (x - orig_x));
    height = std::min(m_height - y, height - (y - orig_y));

    return width > 0 && height > 0;
}

void FrameBuffer::FillRect(int x, int y, int width, int height, uint8_t colour)
{
    if (Clip(x, y, width, height))
    {
        while (height--)
            memset(GetLine(y++) + x, colour, width);
    }
}
