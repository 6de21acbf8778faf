// Part of SimSpec - A ZX Spectrum emulator
//
// Session.cpp: A running machine with its tape deck and speed state
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
//  Tape decisions are made before each frame runs, using the signals from
//  the frame before, so they only affect the frame about to be executed.

#include "SimSpec.h"
#include "Session.h"

#include "AY.h"
#include "Options.h"
#include "Sound.h"
#include "Spectrum128.h"
#include "Spectrum48.h"

Session::Session(std::unique_ptr<Hardware> hw)
    : thresholds(TapeThresholds::FromOptions()), m_hw(std::move(hw))
{
    m_hw->BindCpu(m_cpu);
}

std::unique_ptr<Hardware> Session::CreateHardware(Model model, const RomSet& roms)
{
    switch (model)
    {
    case Model::Spectrum16:
    case Model::Spectrum48:
        return std::make_unique<Spectrum48>(model, roms.rom48);

    case Model::Spectrum128:
        return std::make_unique<Spectrum128>(roms.rom128_0, roms.rom128_1);
    }

    return nullptr;
}

std::unique_ptr<Session> Session::Create(Model model, const RomSet& roms)
{
    auto hw = CreateHardware(model, roms);
    if (!hw)
        return nullptr;

    auto session = std::make_unique<Session>(std::move(hw));
    session->m_hw->Reset(session->m_cpu, true);
    return session;
}

FrameResult Session::RunFrame()
{
    // Snapshot to detect a change of state
    auto turbo = m_turbo;
    auto running = m_tape.IsRunning();

    if (!Heuristics::RecordFromMicOut(*m_hw, m_tape, m_turbo) && (m_tape.auto_accelerate || m_turbo))
        Heuristics::AutoDetectLoad(*m_hw, m_tape, m_turbo, thresholds);

    m_hw->BeginFrame();
    auto start_tick = m_hw->CurrentTick();

    if (Heuristics::FeedEarInOrStop(*m_hw, m_tape, m_turbo) && running)
    {
        auto reason = m_tape.AtEnd() ? "End of TAPE" : "Stop the tape";
        TRACE("Auto STOP: {}\n", reason);
        Frame::SetStatus("Auto STOP: {}", reason);
    }

    // Keep the NMI request until the CPU accepts it
    if (m_nmi_request && m_hw->TriggerNmi(m_cpu))
        m_nmi_request = false;

    if (m_reset_request)
    {
        m_hw->Reset(m_cpu, *m_reset_request);
        m_reset_request.reset();
    }

    m_hw->ExecuteFrame(m_cpu);

    FrameResult result;
    result.tstates = m_hw->CurrentTick() - start_tick;
    result.state_changed = (running != m_tape.IsRunning()) || (turbo != m_turbo);
    return result;
}

int Session::RenderAudio(EdgeAccumulator& accumulator)
{
    auto& weights = m_tape.audible ? audible_tape_weights : speaker_weights;

    accumulator.Accumulate(SignalLine::EarOut, m_hw->OutputEdges(SignalLine::EarOut), weights);
    accumulator.Accumulate(SignalLine::MicOut, m_hw->OutputEdges(SignalLine::MicOut), weights);
    accumulator.Accumulate(SignalLine::EarIn, m_hw->OutputEdges(SignalLine::EarIn), weights);

    if (auto ay = m_hw->SoundChip())
    {
        for (int ch = 0; ch < AY_CHANNELS; ++ch)
            accumulator.Accumulate(ch, ay->Output(ch));
    }

    return accumulator.FinalizeFrame(m_hw->FrameTStates());
}

void Session::RenderVideo(FrameBuffer& fb)
{
    m_hw->RenderVideo(fb);
}

////////////////////////////////////////////////////////////////////////////////

bool Session::InsertTape(const std::string& filepath)
{
    if (!m_tape.Insert(filepath))
    {
        Message(MsgType::Warning, "Failed to open tape image:\n\n{}", filepath);
        return false;
    }

    m_hw->ClearEarIn();

    m_tape.auto_accelerate = GetOption(autoaccel);
    m_tape.audible = GetOption(audibletape);

    Frame::SetStatus("{}  inserted", fs::path(filepath).filename().string());
    return true;
}

bool Session::NewTape()
{
    return InsertTape(Util::UniqueOutputPath("tap").string());
}

void Session::SelectJoystick(JoystickType type)
{
    if (auto joystick = m_hw->Joystick())
        joystick->SetType(type);
}

bool Session::Do(Action action)
{
    // Pulses already queued belong to the old tape position
    switch (action)
    {
    case Action::EjectTape:
    case Action::TapeRewind:
    case Action::TapePrevChunk:
    case Action::TapeNextChunk:
    case Action::TapeStop:
    case Action::TapeRecord:
        m_hw->ClearEarIn();
        break;

    default:
        break;
    }

    switch (action)
    {
    case Action::HardReset:
    case Action::SoftReset:
        // Ensure we're not paused, to avoid confusion
        m_paused = false;
        RequestReset(action == Action::HardReset);
        break;

    case Action::Nmi:
        RequestNmi();
        break;

    case Action::Pause:
        m_paused = !m_paused;
        break;

    case Action::ToggleTurbo:
        m_turbo = !m_turbo;
        Frame::SetStatus("Turbo mode {}", m_turbo ? "enabled" : "disabled");
        break;

    case Action::NewTape:
        return NewTape();

    case Action::EjectTape:
        if (m_tape.IsInserted())
        {
            Frame::SetStatus("{}  ejected", fs::path(m_tape.Media()->GetPath()).filename().string());
            m_tape.Eject();
        }
        break;

    case Action::TapeRewind:
    case Action::TapePrevChunk:
    case Action::TapeNextChunk:
        if (!m_tape.IsInserted())
            Frame::SetStatus("No tape inserted");
        else if (action == Action::TapeRewind)
            m_tape.Rewind();
        else if (action == Action::TapePrevChunk)
            m_tape.PrevChunk();
        else if (!m_tape.NextChunk())
            Frame::SetStatus("No more tape chunks");
        break;

    case Action::TapePlay:
        if (!m_tape.Play())
            Frame::SetStatus("No tape inserted");
        break;

    case Action::TapeStop:
        m_tape.Stop();
        break;

    case Action::TapeRecord:
        if (!m_tape.IsInserted())
            Frame::SetStatus("No tape inserted");
        else if (!m_tape.Record())
            Frame::SetStatus("Tape is write-protected");
        break;

    case Action::ToggleAudibleTape:
        m_tape.audible = !m_tape.audible;
        SetOption(audibletape, m_tape.audible);
        Frame::SetStatus("Tape sound {}", m_tape.audible ? "enabled" : "disabled");
        break;

    case Action::ToggleAutoAccel:
        m_tape.auto_accelerate = !m_tape.auto_accelerate;
        SetOption(autoaccel, m_tape.auto_accelerate);
        Frame::SetStatus("Tape auto-acceleration {}", m_tape.auto_accelerate ? "enabled" : "disabled");
        break;

    case Action::JoystickNone:          SelectJoystick(JoystickType::None); break;
    case Action::JoystickKempston:      SelectJoystick(JoystickType::Kempston); break;
    case Action::JoystickFuller:        SelectJoystick(JoystickType::Fuller); break;
    case Action::JoystickSinclairRight: SelectJoystick(JoystickType::SinclairRight); break;
    case Action::JoystickSinclairLeft:  SelectJoystick(JoystickType::SinclairLeft); break;
    case Action::JoystickCursor:        SelectJoystick(JoystickType::Cursor); break;

        // Handled by the application
    default:
        return false;
    }

    return true;
}

std::string Session::StatusLine() const
{
    auto info = fmt::format("ZX Spectrum {}k", GetModelInfo(m_hw->GetModel()).id);

    if (m_paused)
        info += " ⏸ ";
    else if (m_turbo)
        info += " 🏎️ ";

    if (auto joystick = m_hw->Joystick(); joystick && joystick->Type() != JoystickType::None)
    {
        info += fmt::format(" 🕹 {}", joystick->Name());
        if (joystick->SubIndex() != 0)
            info += fmt::format(" #{}", joystick->SubIndex() + 1);
    }

    return info + m_tape.StatusText();
}
