// Part of SimSpec - A ZX Spectrum emulator
//
// Migration.cpp: Moving a running session to a different model
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
//  RAM is carried as the 48K a program sees from 0x4000.  A 16K source pads
//  the rest with 0xff, and a 128K source supplies the banks currently paged
//  in.  The new machine gets fresh ROMs and randomised RAM before the image
//  is written over it through its normal memory map.
//
//  A 128K target starts in 48K BASIC with paging locked, as the program it
//  receives knows nothing of the extra banks.

#include "SimSpec.h"
#include "Migration.h"

#include "Joystick.h"

std::vector<uint8_t> Migration::SnapshotMemory(const Hardware& hw)
{
    auto data = hw.ReadMemory();
    data.resize(0x10000 - PAGE_SIZE, MIGRATION_FILL_BYTE);
    return data;
}

std::unique_ptr<Session> Migration::Migrate(std::unique_ptr<Session> session, Model target, const RomSet& roms)
{
    auto& old_hw = session->GetHardware();
    if (old_hw.GetModel() == target)
        return session;

    auto hw = Session::CreateHardware(target, roms);
    if (!hw)
        return session;

    TRACE("Migrating from {}K to {}K\n", GetModelInfo(old_hw.GetModel()).id, GetModelInfo(target).id);

    hw->LockTo48K();

    hw->WriteMemory(PAGE_SIZE, SnapshotMemory(old_hw));
    hw->SetBorder(old_hw.GetBorder());

    if (auto old_joystick = old_hw.Joystick())
    {
        if (auto joystick = hw->Joystick())
            *joystick = *old_joystick;
    }

    auto new_session = std::make_unique<Session>(std::move(hw));
    new_session->m_cpu = session->m_cpu;
    new_session->m_hw->BindCpu(new_session->m_cpu);

    new_session->m_tape = std::move(session->m_tape);
    new_session->thresholds = session->thresholds;
    new_session->m_turbo = session->m_turbo;
    new_session->m_paused = session->m_paused;
    new_session->m_nmi_request = session->m_nmi_request;
    new_session->m_reset_request = session->m_reset_request;

    return new_session;
}

bool Migration::ChangeModel(std::unique_ptr<Session>& session, const std::string& id, const RomSet& roms)
{
    auto model = ParseModel(id);
    if (!model)
    {
        TRACE("Unknown model: {}\n", id);
        return false;
    }

    session = Migrate(std::move(session), *model, roms);
    return true;
}
