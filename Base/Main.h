// Part of SimSpec - A ZX Spectrum emulator
//
// Main.h: Application start-up, frame loop and shutdown
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

class Session;

namespace Main
{
bool Init(int argc, char* argv[]);
void Run();
void Exit();

Session& CurrentSession();

// Replace the running session with one for the given model id
bool ChangeModel(const std::string& id);
}
