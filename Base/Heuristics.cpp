// Part of SimSpec - A ZX Spectrum emulator
//
// Heuristics.cpp: Automatic tape motion and turbo control
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
//  A program loading from tape samples the EAR bit thousands of times a
//  frame.  When that stops for two frames the load is over, so the tape is
//  stopped and the turbo dropped.  Anything polling the port that hard while
//  the tape is stopped is assumed to be waiting for tape data.

#include "SimSpec.h"
#include "Heuristics.h"

#include "Frame.h"
#include "Hardware.h"
#include "Options.h"
#include "Tape.h"

TapeThresholds TapeThresholds::FromOptions()
{
    TapeThresholds thresholds;
    thresholds.idle = static_cast<unsigned int>(std::max(GetOption(idlethreshold), 0));
    thresholds.probe = static_cast<unsigned int>(std::max(GetOption(probethreshold), 0));
    return thresholds;
}

namespace Heuristics
{

bool RecordFromMicOut(Hardware& hw, TapeDeck& deck, bool& turbo)
{
    if (!deck.IsRecording())
        return false;

    auto pulses = hw.MicOutPulses();

    if (auto chunks = deck.RecordMicOut(pulses))
    {
        if (*chunks)
        {
            TRACE("Saved: {} TAP chunks\n", *chunks);
            Frame::SetStatus("Saved: {} TAP chunks", *chunks);
        }

        // Only stay accelerated while a block is being decoded
        if (turbo || deck.auto_accelerate)
            turbo = !deck.DecoderIdle();
    }
    else
    {
        TRACE("Failed to write tape data to {}\n", deck.Media()->GetPath());
        Frame::SetStatus("Tape write failed, recording stopped");
        turbo = false;
    }

    return true;
}

void AutoDetectLoad(Hardware& hw, TapeDeck& deck, bool& turbo, const TapeThresholds& thresholds)
{
    auto count = hw.ProbeCount();
    if (!count)
        return;

    if (turbo && deck.IsPlaying())
    {
        if (deck.prev_probe_count + count < thresholds.idle)
        {
            deck.Stop();
            hw.ClearEarIn();
            turbo = false;
        }
    }
    else if (deck.auto_accelerate && deck.IsInserted() && !deck.IsRunning())
    {
        if (count > thresholds.probe && deck.Play())
            turbo = true;
    }

    deck.prev_probe_count = count;
}

bool FeedEarInOrStop(Hardware& hw, TapeDeck& deck, bool& turbo)
{
    if (!deck.IsPlaying())
        return false;

    if (deck.FeedEarIn(hw))
        return false;

    deck.Stop();
    turbo = false;
    return true;
}

} // namespace Heuristics
