// Part of SimSpec - A ZX Spectrum emulator
//
// Migration.h: Moving a running session to a different model
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

#include "Session.h"

constexpr uint8_t MIGRATION_FILL_BYTE = 0xff;

class Migration
{
public:
    // Consumes the session and returns its replacement, or the same session
    // if it's already the requested model.
    static std::unique_ptr<Session> Migrate(std::unique_ptr<Session> session, Model target, const RomSet& roms);

    // Change to a model named by id (16, 48 or 128).  Unknown ids are
    // rejected without touching the session.
    static bool ChangeModel(std::unique_ptr<Session>& session, const std::string& id, const RomSet& roms);

    // Machine RAM from 0x4000, padded to the full 48K address space
    static std::vector<uint8_t> SnapshotMemory(const Hardware& hw);
};
