// Part of SimSpec - A ZX Spectrum emulator
//
// Session.h: A running machine with its tape deck and speed state
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

#include "Actions.h"
#include "Frame.h"
#include "Hardware.h"
#include "Heuristics.h"
#include "Joystick.h"
#include "Tape.h"

class EdgeAccumulator;

class Session
{
public:
    explicit Session(std::unique_ptr<Hardware> hw);
    Session(const Session&) = delete;
    void operator= (const Session&) = delete;

    static std::unique_ptr<Hardware> CreateHardware(Model model, const RomSet& roms);
    static std::unique_ptr<Session> Create(Model model, const RomSet& roms);

    Hardware& GetHardware() const { return *m_hw; }
    spec_cpu& Cpu() { return m_cpu; }
    const spec_cpu& Cpu() const { return m_cpu; }
    TapeDeck& Tape() { return m_tape; }
    const TapeDeck& Tape() const { return m_tape; }

    bool IsTurbo() const { return m_turbo; }
    void SetTurbo(bool turbo) { m_turbo = turbo; }
    bool IsPaused() const { return m_paused; }
    void SetPaused(bool paused) { m_paused = paused; }

    FrameResult RunFrame();
    int RenderAudio(EdgeAccumulator& accumulator);
    void RenderVideo(FrameBuffer& fb);

    // Honoured at the start of the next frame
    void RequestReset(bool hard) { m_reset_request = hard; }
    void RequestNmi() { m_nmi_request = true; }
    bool NmiPending() const { return m_nmi_request; }

    bool InsertTape(const std::string& filepath);
    bool NewTape();
    void SelectJoystick(JoystickType type);

    // Commands that act within the session.  Returns false if not handled.
    bool Do(Action action);

    std::string StatusLine() const;

    TapeThresholds thresholds;

private:
    friend class Migration;

    std::unique_ptr<Hardware> m_hw;
    spec_cpu m_cpu{};
    TapeDeck m_tape;

    bool m_turbo{ false };
    bool m_paused{ false };
    bool m_nmi_request{ false };
    std::optional<bool> m_reset_request;
};
