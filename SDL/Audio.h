// Part of SimSpec - A ZX Spectrum emulator
//
// Audio.h: SDL audio output fed from the frame loop
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

#include "Sound.h"

class Audio
{
public:
    static bool Init();
    static void Exit();

    static bool IsAvailable();
    static int SampleRate();
    static int Channels();

    static void Play();
    static void Pause();

    // Interleaved samples for one frame.  Returns false if the frame was dropped.
    static bool AddFrame(std::vector<blip_sample_t>&& samples);
};
