// Part of SimSpec - A ZX Spectrum emulator
//
// Heuristics.h: Automatic tape motion and turbo control
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

class Hardware;
class TapeDeck;

constexpr unsigned int DEFAULT_IDLE_THRESHOLD = 20;
constexpr unsigned int DEFAULT_PROBE_THRESHOLD = 1000;

struct TapeThresholds
{
    unsigned int idle{ DEFAULT_IDLE_THRESHOLD };    // probes over two frames below which loading has finished
    unsigned int probe{ DEFAULT_PROBE_THRESHOLD };  // probes in one frame above which a program waits for tape

    static TapeThresholds FromOptions();
};

namespace Heuristics
{
// Decode last frame's MIC output into the tape.  Returns true if recording.
bool RecordFromMicOut(Hardware& hw, TapeDeck& deck, bool& turbo);

// Start or stop the tape depending on how hard the program polls EAR
void AutoDetectLoad(Hardware& hw, TapeDeck& deck, bool& turbo, const TapeThresholds& thresholds);

// Queue the next frame of tape pulses.  Returns true if the tape ran out.
bool FeedEarInOrStop(Hardware& hw, TapeDeck& deck, bool& turbo);
}
