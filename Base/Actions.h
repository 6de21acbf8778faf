// Part of SimSpec - A ZX Spectrum emulator
//
// Actions.h: Actions bound to function keys
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

enum class Action
{
    ExitApp, HardReset, SoftReset, Nmi, Pause, ToggleTurbo,
    Spectrum16, Spectrum48, Spectrum128,
    InsertTape, NewTape, EjectTape, TapeRewind, TapePrevChunk, TapeNextChunk,
    TapePlay, TapeStop, TapeRecord, ToggleAudibleTape, ToggleAutoAccel,
    JoystickNone, JoystickKempston, JoystickFuller, JoystickSinclairRight,
    JoystickSinclairLeft, JoystickCursor
};

namespace Actions
{
bool Do(Action action, bool pressed = true);
void Key(int fn_key, bool pressed, bool ctrl, bool alt, bool shift);
std::string to_string(Action action);
std::optional<Action> from_string(const std::string& name);
}
