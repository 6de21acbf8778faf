// Part of SimSpec - A ZX Spectrum emulator
//
// Input.h: SDL keyboard and game controller input
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

struct SDLControllerDeleter { void operator()(SDL_GameController* controller) { SDL_GameControllerClose(controller); } };
using unique_sdl_controller = unique_resource<SDL_GameController*, nullptr, SDLControllerDeleter>;

constexpr auto CONTROLLER_DEADZONE = 32768 * 20 / 100;

class Input
{
public:
    static bool Init();
    static void Exit();

    static bool FilterEvent(SDL_Event* pEvent_);
    static void Purge();
};
