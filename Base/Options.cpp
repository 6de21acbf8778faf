// Part of SimSpec - A ZX Spectrum emulator
//
// Options.cpp: Option saving, loading and command-line processing
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
//  Options specified on the command-line override options in the file.
//  The settings are only written back when the emulator closes.

#include "SimSpec.h"
#include "Options.h"

#include "Joystick.h"

namespace Options
{
Config g_config;


static void SetValue(int& value, const std::string& str)
{
    try {
        value = std::stoi(str);
    } catch (const std::invalid_argument&) {
        // keep default value
    } catch (const std::out_of_range&) {
        // keep default value
    }
}

static void SetValue(bool& value, const std::string& str)
{
    value = str == "1" || tolower(str) == "yes";
}

static void SetValue(std::string& value, const std::string_view& sv)
{
    value = sv;
}

bool SetNamedValue(const std::string& option_name, const std::string& str)
{
    auto name = trim(tolower(option_name));

    if (name == "cfgversion") SetValue(g_config.cfgversion, str);
    else if (name == "model") SetValue(g_config.model, str);
    else if (name == "rom48") SetValue(g_config.rom48, str);
    else if (name == "rom128_0") SetValue(g_config.rom128_0, str);
    else if (name == "rom128_1") SetValue(g_config.rom128_1, str);
    else if (name == "fullscreen") SetValue(g_config.fullscreen, str);
    else if (name == "scale") SetValue(g_config.scale, str);
    else if (name == "border") SetValue(g_config.border, str);
    else if (name == "tape") SetValue(g_config.tape, str);
    else if (name == "autoaccel") SetValue(g_config.autoaccel, str);
    else if (name == "audibletape") SetValue(g_config.audibletape, str);
    else if (name == "idlethreshold") SetValue(g_config.idlethreshold, str);
    else if (name == "probethreshold") SetValue(g_config.probethreshold, str);
    else if (name == "joystick") SetValue(g_config.joystick, str);
    else if (name == "latency") SetValue(g_config.latency, str);
    else if (name == "samplerate") SetValue(g_config.samplerate, str);
    else if (name == "channels") SetValue(g_config.channels, str);
    else if (name == "status") SetValue(g_config.status, str);
    else if (name == "nextfile") SetValue(g_config.nextfile, str);
    else if (name == "outpath") SetValue(g_config.outpath, str);
    else if (name == "fkeys") SetValue(g_config.fkeys, str);
    else
    {
        return false;
    }

    return true;
}

// Short command-line forms: -16|-48|-128, -b BORDER, -j N|K|F|S1|S2|C
static bool SetShortOption(const std::string& option, int& argc_, char**& argv_)
{
    if (option == "16" || option == "48" || option == "128")
    {
        SetOption(model, option);
        return true;
    }

    if (option != "b" && option != "j")
        return false;

    if (argc_ <= 1)
    {
        TRACE("Missing value for command-line option: -{}\n", option);
        return true;
    }

    argc_--;
    std::string value = *++argv_;

    if (option == "b")
    {
        SetValue(g_config.border, value);
    }
    else if (auto type = ParseJoystickType(value))
    {
        SetOption(joystick, static_cast<int>(*type));
    }
    else
    {
        Message(MsgType::Warning, "Unknown joystick: \"{}\", choose from: N|K|F|S1|S2|C", value);
    }

    return true;
}

bool Load(int argc_, char* argv_[])
{
    // Set defaults.
    g_config = {};

    auto path = OSD::MakeFilePath(PathType::Settings, OPTIONS_FILE);
    std::ifstream file(path);
    for (std::string line; std::getline(file, line); )
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::stringstream ss(line);
        std::string key, value;
        if (std::getline(ss, key, '=') && std::getline(ss, value))
        {
            if (!SetNamedValue(key, value))
            {
                TRACE("Unknown setting: {}={}\n", key, value);
            }
        }
    }

    // If the loaded configuration is incompatible, reset to defaults.
    if (g_config.cfgversion != ConfigVersion)
        g_config = {};

    auto tape_arg = false;

    while (argc_ && --argc_)
    {
        auto pcszOption = *++argv_;
        if (*pcszOption == '-')
        {
            std::string option = pcszOption + 1;

            if (SetShortOption(option, argc_, argv_))
                continue;

            argc_--;
            if (argc_ <= 0 || !SetNamedValue(option, *++argv_))
            {
                TRACE("Unknown command-line option: {}\n", option);
            }
        }
        else if (!tape_arg)
        {
            // A bare filename is the tape image
            SetOption(tape, pcszOption);
            tape_arg = true;
        }
        else
        {
            TRACE("Unexpected command-line parameter: {}\n", pcszOption);
        }
    }

    return true;
}

bool Save()
{
    auto path = OSD::MakeFilePath(PathType::Settings, OPTIONS_FILE);

    std::ofstream ofs(path, std::ofstream::out);
    if (!ofs)
    {
        TRACE("Failed to save options\n");
        return false;
    }

    ofs << std::noboolalpha;

    using namespace std;
    ofs << "cfgversion=" << to_string(g_config.cfgversion) << std::endl;
    ofs << "model=" << g_config.model << std::endl;
    ofs << "rom48=" << g_config.rom48 << std::endl;
    ofs << "rom128_0=" << g_config.rom128_0 << std::endl;
    ofs << "rom128_1=" << g_config.rom128_1 << std::endl;
    ofs << "fullscreen=" << to_string(g_config.fullscreen) << std::endl;
    ofs << "scale=" << to_string(g_config.scale) << std::endl;
    ofs << "border=" << to_string(g_config.border) << std::endl;
    ofs << "tape=" << g_config.tape << std::endl;
    ofs << "autoaccel=" << to_string(g_config.autoaccel) << std::endl;
    ofs << "audibletape=" << to_string(g_config.audibletape) << std::endl;
    ofs << "idlethreshold=" << to_string(g_config.idlethreshold) << std::endl;
    ofs << "probethreshold=" << to_string(g_config.probethreshold) << std::endl;
    ofs << "joystick=" << to_string(g_config.joystick) << std::endl;
    ofs << "latency=" << to_string(g_config.latency) << std::endl;
    ofs << "samplerate=" << to_string(g_config.samplerate) << std::endl;
    ofs << "channels=" << to_string(g_config.channels) << std::endl;
    ofs << "status=" << to_string(g_config.status) << std::endl;
    ofs << "nextfile=" << to_string(g_config.nextfile) << std::endl;
    ofs << "outpath=" << g_config.outpath << std::endl;
    ofs << "fkeys=" << g_config.fkeys << std::endl;

    return ofs.good();
}

} // namespace Options
