// Part of SimSpec - A ZX Spectrum emulator
//
// UI.cpp: SDL event processing and message display
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
//  Events go to Input first; anything it leaves is handled here.  Files
//  dropped on the window are inserted as the tape.

#include "SimSpec.h"
#include "UI.h"

#include "Input.h"
#include "Main.h"
#include "Options.h"
#include "Session.h"

bool UI::Init()
{
    SDL_EventState(SDL_DROPFILE, SDL_ENABLE);
    SDL_ShowCursor(SDL_DISABLE);
    return true;
}

void UI::Exit()
{
}


// Check and process any incoming messages
bool UI::CheckEvents()
{
    SDL_Event event;

    while (SDL_PollEvent(&event))
    {
        // Input has first go at processing any messages
        if (Input::FilterEvent(&event))
            continue;

        switch (event.type)
        {
        case SDL_QUIT:
            return false;

        case SDL_DROPFILE:
            if (Main::CurrentSession().InsertTape(event.drop.file))
                SetOption(tape, event.drop.file);

            SDL_free(event.drop.file);
            break;

        case SDL_WINDOWEVENT:
            // Don't leave keys held when focus moves elsewhere
            if (event.window.event == SDL_WINDOWEVENT_FOCUS_LOST)
                Input::Purge();
            break;

        default:
            break;
        }
    }

    return true;
}

void UI::WaitEvent()
{
    SDL_WaitEvent(nullptr);
}

void UI::ShowMessage(MsgType type, const std::string& str)
{
    Uint32 flags = SDL_MESSAGEBOX_INFORMATION;
    if (type == MsgType::Warning)
        flags = SDL_MESSAGEBOX_WARNING;
    else if (type == MsgType::Error || type == MsgType::Fatal)
    {
        fmt::print(stderr, "error: {}\n", str);
        flags = SDL_MESSAGEBOX_ERROR;
    }

    SDL_ShowSimpleMessageBox(flags, WINDOW_CAPTION, str.c_str(), nullptr);
}

////////////////////////////////////////////////////////////////////////////////

bool UI::DoAction(Action action, bool pressed)
{
    if (!pressed || action != Action::ExitApp)
        return false;

    SDL_Event event{};
    event.type = SDL_QUIT;
    SDL_PushEvent(&event);
    return true;
}
