// Part of SimSpec - A ZX Spectrum emulator
//
// Options.h: Option saving, loading and command-line processing
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

constexpr auto OPTIONS_FILE = "SimSpec.cfg";
constexpr auto ConfigVersion = 1;       // increment to force a config reset if incompatible changes are made

struct Config
{
    int cfgversion = ConfigVersion;     // Config compatability number (set defaults if mismatched)

    std::string model = "128";          // Hardware model (16, 48 or 128)
    std::string rom48;                  // 48K ROM image (blank for 48.rom in the resource directory)
    std::string rom128_0;               // 128K editor ROM image (blank for 128-0.rom)
    std::string rom128_1;               // 128K BASIC ROM image (blank for 128-1.rom)

    bool fullscreen = false;            // Start in full-screen mode?
    int scale = 2;                      // Window scale (1-4)
    int border = 2;                     // Border size (0=none to 4=full)

    std::string tape;                   // Tape image file
    bool autoaccel = true;              // Auto-start tape and run at turbo speed while it's being read?
    bool audibletape = true;            // Mix tape signal into the sound output?
    int idlethreshold = 20;             // EAR reads over two frames below which a turbo tape load stops
    int probethreshold = 1000;          // EAR reads in a frame above which a stopped tape auto-starts

    int joystick = 0;                   // Joystick type (0=none, 1=Kempston, 2=Fuller, 3=Sinclair right, 4=Sinclair left, 5=Cursor)

    int latency = 2;                    // Audio frames buffered between emulation and the output device
    int samplerate = 44100;             // Audio output sample rate
    int channels = 2;                   // Audio output channels (1 or 2)

    bool status = true;                 // Show status messages?
    int nextfile = 0;                   // Next file number for auto-generated filenames
    std::string outpath;                // Default path for output files

    std::string fkeys =                 // Function key bindings
        "F1=NewTape,SF1=EjectTape,"
        "F2=TapePlay,SF2=TapeStop,"
        "F3=TapeRecord,SF3=TapeRewind,"
        "F4=TapePrevChunk,SF4=TapeNextChunk,"
        "F5=ToggleAudibleTape,SF5=ToggleAutoAccel,"
        "F6=Spectrum16,SF6=Spectrum48,CF6=Spectrum128,"
        "F7=JoystickKempston,SF7=JoystickNone,"
        "F9=Pause,"
        "F10=ToggleTurbo,"
        "F11=Nmi,"
        "F12=SoftReset,SF12=HardReset,CF12=ExitApp";
};


namespace Options
{
bool Load(int argc_, char* argv[]);
bool Save();

bool SetNamedValue(const std::string& option_name, const std::string& str);

extern Config g_config;
}

#define GetOption(field)        (Options::g_config.field)
#define SetOption(field,value)  (Options::g_config.field = (value))
