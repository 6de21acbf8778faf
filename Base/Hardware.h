// Part of SimSpec - A ZX Spectrum emulator
//
// Hardware.h: Capabilities common to all emulated machines
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
//  The frame loop, tape heuristics, sound and model migration only talk to
//  the machine through this interface.  Optional peripherals are exposed
//  through accessors that return nullptr when the machine lacks them.

#pragma once

#include "CPU.h"
#include "Model.h"

class AYDevice;
class FrameBuffer;
class JoystickPort;
class Keypad;

enum class SignalLine { EarOut, MicOut, EarIn };

// Line level change, timed in T-states from the start of the frame
struct SignalEdge
{
    uint32_t tstate;
    bool level;
};

constexpr uint8_t NUM_KEY_ROWS = 8;

class Hardware
{
public:
    virtual ~Hardware() = default;

    virtual Model GetModel() const = 0;
    virtual uint32_t FrameTStates() const = 0;
    virtual uint32_t ClockHz() const = 0;

    // Attach the CPU to this machine's bus
    virtual void BindCpu(spec_cpu& cpu) = 0;

    // Start a new frame if the previous one completed, discarding its edges
    virtual void BeginFrame() = 0;
    virtual void ExecuteFrame(spec_cpu& cpu) = 0;
    virtual uint64_t CurrentTick() const = 0;

    virtual void Reset(spec_cpu& cpu, bool hard) = 0;
    virtual bool TriggerNmi(spec_cpu& cpu) = 0;

    // Signals from the last completed frame
    virtual const std::vector<SignalEdge>& OutputEdges(SignalLine line) const = 0;
    virtual std::vector<uint32_t> MicOutPulses() = 0;
    virtual unsigned int ProbeCount() const = 0;

    // EAR input: T-states still to be covered to reach frame_limit frames
    // ahead, then pulse durations to queue after those already fed.
    virtual uint32_t InputFeedCapacity(unsigned int frame_limit) const = 0;
    virtual void FeedEarIn(const std::vector<uint32_t>& pulses) = 0;
    virtual void ClearEarIn() = 0;

    // RAM from 0x4000 as seen by a 48K program, in sequential bank order
    virtual std::vector<uint8_t> ReadMemory() const = 0;
    virtual void WriteMemory(uint16_t address, const std::vector<uint8_t>& data) = 0;
    virtual uint8_t Peek(uint16_t address) const = 0;

    virtual uint8_t GetBorder() const = 0;
    virtual void SetBorder(uint8_t colour) = 0;

    virtual void SetKey(int row, int bit, bool pressed) = 0;
    virtual void ReleaseAllKeys() = 0;

    virtual int VideoWidth() const = 0;
    virtual int VideoHeight() const = 0;
    virtual void RenderVideo(FrameBuffer& fb) = 0;

    virtual JoystickPort* Joystick() { return nullptr; }
    virtual Keypad* GetKeypad() { return nullptr; }
    virtual AYDevice* SoundChip() { return nullptr; }

    // Restrict a paged machine to the 48K memory map until the next reset
    virtual void LockTo48K() { }
};
