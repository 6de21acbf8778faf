// Part of SimSpec - A ZX Spectrum emulator
//
// Actions.cpp: Actions bound to functions keys
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

#include "SimSpec.h"
#include "Actions.h"

#include "Frame.h"
#include "Main.h"
#include "Options.h"
#include "Session.h"
#include "UI.h"

namespace Actions
{

struct ActionKey
{
    Action action{ Action::ExitApp };
    int fn_key{};
    bool ctrl{};
    bool alt{};
    bool shift{};
};

static std::vector<ActionKey> s_mappings;

struct ActionEntry
{
    Action action;
    std::string name;
};

static const std::vector<ActionEntry> actions =
{
    { Action::ExitApp, "ExitApp" },
    { Action::HardReset, "HardReset" },
    { Action::SoftReset, "SoftReset" },
    { Action::Nmi, "Nmi" },
    { Action::Pause, "Pause" },
    { Action::ToggleTurbo, "ToggleTurbo" },
    { Action::Spectrum16, "Spectrum16" },
    { Action::Spectrum48, "Spectrum48" },
    { Action::Spectrum128, "Spectrum128" },
    { Action::InsertTape, "InsertTape" },
    { Action::NewTape, "NewTape" },
    { Action::EjectTape, "EjectTape" },
    { Action::TapeRewind, "TapeRewind" },
    { Action::TapePrevChunk, "TapePrevChunk" },
    { Action::TapeNextChunk, "TapeNextChunk" },
    { Action::TapePlay, "TapePlay" },
    { Action::TapeStop, "TapeStop" },
    { Action::TapeRecord, "TapeRecord" },
    { Action::ToggleAudibleTape, "ToggleAudibleTape" },
    { Action::ToggleAutoAccel, "ToggleAutoAccel" },
    { Action::JoystickNone, "JoystickNone" },
    { Action::JoystickKempston, "JoystickKempston" },
    { Action::JoystickFuller, "JoystickFuller" },
    { Action::JoystickSinclairRight, "JoystickSinclairRight" },
    { Action::JoystickSinclairLeft, "JoystickSinclairLeft" },
    { Action::JoystickCursor, "JoystickCursor" },
};

bool Do(Action action, bool pressed/*=true*/)
{
    // OS-specific functionality takes precedence
    if (UI::DoAction(action, pressed))
        return true;

    // Nothing acts on release
    if (!pressed)
        return false;

    switch (action)
    {
    case Action::Spectrum16:  return Main::ChangeModel("16");
    case Action::Spectrum48:  return Main::ChangeModel("48");
    case Action::Spectrum128: return Main::ChangeModel("128");

    case Action::InsertTape:
        if (GetOption(tape).empty())
        {
            Frame::SetStatus("No tape image to insert");
            return false;
        }
        return Main::CurrentSession().InsertTape(GetOption(tape));

    case Action::NewTape:
        if (!Main::CurrentSession().NewTape())
            return false;
        SetOption(tape, Main::CurrentSession().Tape().Media()->GetPath());
        return true;

    default:
        break;
    }

    return Main::CurrentSession().Do(action);
}

std::string to_string(Action action)
{
    auto it = std::find_if(actions.begin(), actions.end(),
        [&](const ActionEntry& entry) { return entry.action == action; });

    return (it != actions.end()) ? it->name : "";
}

std::optional<Action> from_string(const std::string& name)
{
    auto lower_action = tolower(trim(name));
    auto it = std::find_if(actions.begin(), actions.end(),
        [&](const ActionEntry& entry) { return tolower(entry.name) == lower_action; });

    if (it == actions.end())
        return std::nullopt;

    return it->action;
}

static void UpdateMappings()
{
    for (auto entry : split(GetOption(fkeys), ','))
    {
        auto fields = split(entry, '=');
        if (fields.size() != 2)
            continue;

        auto action = from_string(fields[1]);
        if (!action)
        {
            TRACE("Unknown action: {}\n", fields[1]);
            continue;
        }

        try
        {
            ActionKey key{};
            key.action = *action;

            auto mapping = tolower(trim(fields[0]));
            for (auto it = mapping.begin(); it != mapping.end(); ++it)
            {
                switch (*it)
                {
                case 'c': key.ctrl = true; continue;
                case 'a': key.alt = true; continue;
                case 's': key.shift = true; continue;
                case 'f':
                if ((it + 1) != mapping.end())
                {
                    key.fn_key = std::stoi(std::string(it + 1, mapping.end()));
                }
                break;
                }
                break;
            }

            if (key.fn_key)
            {
                s_mappings.emplace_back(std::move(key));
            }
        }
        catch (const std::invalid_argument&)
        {
            TRACE("Invalid key mapping: {}\n", entry);
        }
        catch (const std::out_of_range&)
        {
            TRACE("Invalid key mapping: {}\n", entry);
        }
    }
}

void Key(int fn_key, bool pressed, bool ctrl, bool alt, bool shift)
{
    if (s_mappings.empty() && !GetOption(fkeys).empty())
    {
        UpdateMappings();

        // Use the default mappings if the configuration was incompatible.
        if (s_mappings.empty())
        {
            Config config{};
            SetOption(fkeys, config.fkeys);
            UpdateMappings();
        }
    }

    auto it = std::find_if(s_mappings.begin(), s_mappings.end(),
        [&](const ActionKey& ak)
        {
            return ak.fn_key == fn_key &&
                ak.ctrl == ctrl &&
                ak.alt == alt &&
                ak.shift == shift;
        });

    if (it != s_mappings.end())
    {
        Do(it->action, pressed);
    }
}

} // namespace Actions
