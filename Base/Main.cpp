// Part of SimSpec - A ZX Spectrum emulator
//
// Main.cpp: Application start-up, frame loop and shutdown
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
//  Each pass of the loop handles pending input, runs one frame (or a turbo
//  burst), presents it, then waits for the next frame deadline.  Sound is
//  only produced at normal speed, and the sound device is paused otherwise.

#include "SimSpec.h"
#include "Main.h"

#include "Audio.h"
#include "Frame.h"
#include "FrameBuffer.h"
#include "Input.h"
#include "Migration.h"
#include "Options.h"
#include "OSD.h"
#include "Session.h"
#include "Sound.h"
#include "UI.h"
#include "Video.h"


extern "C" int main(int argc_, char* argv_[])
{
    if (Main::Init(argc_, argv_))
        Main::Run();

    Main::Exit();

    return 0;
}

namespace Main
{
static RomSet roms;
static std::unique_ptr<Session> session;
static std::unique_ptr<EdgeAccumulator> accumulator;
static std::unique_ptr<FrameTimer> timer;
static std::unique_ptr<FrameBuffer> framebuffer;

static bool audio_active;
static std::string window_title;

static void UpdateTitle()
{
    auto title = session->StatusLine();

    auto status = Frame::StatusText();
    if (!status.empty())
        title += "  " + status;

    if (title != window_title)
    {
        Video::SetTitle(title);
        window_title = std::move(title);
    }
}

static void SetAudioActive(bool active)
{
    if (active == audio_active)
        return;

    if (active)
    {
        accumulator->Reset();
        Audio::Play();
    }
    else
    {
        Audio::Pause();
    }

    audio_active = active;
}

static void ApplyMachine()
{
    auto& hw = session->GetHardware();

    accumulator->SetClockRate(hw.ClockHz());
    accumulator->Reset();

    timer->SetFrameDuration(GetModelInfo(hw.GetModel()).FrameDuration());
    framebuffer = std::make_unique<FrameBuffer>(hw.VideoWidth(), hw.VideoHeight());
}

bool Init(int argc_, char* argv_[])
{
    Util::SetMessageHandler(UI::ShowMessage);
    TRACE("SimSpec {}\n", SIMSPEC_VERSION);

    // Load settings and check command-line options
    if (!Options::Load(argc_, argv_) || !OSD::Init())
        return false;

    if (!roms.Load())
        return false;

    auto model = ParseModel(GetOption(model));
    if (!model)
    {
        Message(MsgType::Warning, "Unknown model: {}", GetOption(model));
        model = Model::Spectrum128;
        SetOption(model, GetModelInfo(*model).id);
    }

    session = Session::Create(*model, roms);
    if (!session)
        return false;

    if (auto joystick = ParseJoystickType(std::to_string(GetOption(joystick))))
        session->SelectJoystick(*joystick);

    auto& hw = session->GetHardware();
    if (!UI::Init() || !Video::Init(hw.VideoWidth(), hw.VideoHeight()) || !Input::Init())
        return false;

    // Run silently if there's no sound device
    if (!Audio::Init())
        TRACE("No audio output available\n");

    accumulator = std::make_unique<EdgeAccumulator>(hw.ClockHz(), Audio::SampleRate());
    timer = std::make_unique<FrameTimer>(GetModelInfo(hw.GetModel()).FrameDuration());
    ApplyMachine();

    if (!GetOption(tape).empty())
        session->InsertTape(GetOption(tape));

    return true;
}

void Run()
{
    while (UI::CheckEvents())
    {
        if (session->IsPaused())
        {
            SetAudioActive(false);
            UpdateTitle();
            UI::WaitEvent();

            // Frame deadlines follow on from the resume time
            timer->Restart();
            continue;
        }

        auto result = Frame::Run(*session, *timer);
        if (result.state_changed)
            TRACE("State changed: turbo={} tape running={}\n", session->IsTurbo(), session->Tape().IsRunning());

        session->RenderVideo(*framebuffer);
        Video::Update(*framebuffer);

        Frame::Flyback();
        UpdateTitle();

        SetAudioActive(!session->IsTurbo());

        if (!session->IsTurbo())
        {
            if (Audio::IsAvailable())
            {
                auto samples = session->RenderAudio(*accumulator);
                if (!Audio::AddFrame(accumulator->RenderInterleaved(samples, Audio::Channels())))
                    TRACE("Audio frame dropped\n");
            }

            Frame::Sync(*timer);
        }
    }
}

void Exit()
{
    Audio::Exit();
    Input::Exit();
    Video::Exit();
    UI::Exit();

    session.reset();
    accumulator.reset();
    timer.reset();
    framebuffer.reset();

    OSD::Exit();

    if (!Options::Save())
        TRACE("Failed to save options\n");
}

Session& CurrentSession()
{
    return *session;
}

bool ChangeModel(const std::string& id)
{
    auto old_model = session->GetHardware().GetModel();

    if (!Migration::ChangeModel(session, id, roms))
    {
        Frame::SetStatus("Unknown model: {}", id);
        return false;
    }

    if (session->GetHardware().GetModel() != old_model)
    {
        auto new_id = GetModelInfo(session->GetHardware().GetModel()).id;

        ApplyMachine();
        SetOption(model, new_id);
        Frame::SetStatus("ZX Spectrum {}k", new_id);
    }

    return true;
}

} // namespace Main
