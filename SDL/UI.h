// Part of SimSpec - A ZX Spectrum emulator
//
// UI.h: SDL event processing and message display
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

#ifdef _DEBUG
#define WINDOW_CAPTION      "SimSpec/SDL [DEBUG]"
#else
#define WINDOW_CAPTION      "SimSpec/SDL"
#endif

#include "Actions.h"

class UI
{
public:
    static bool Init();
    static void Exit();

    // Process pending events.  Returns false if the application should quit.
    static bool CheckEvents();
    static void WaitEvent();

    static bool DoAction(Action action, bool pressed = true);
    static void ShowMessage(MsgType type, const std::string& str);
};
