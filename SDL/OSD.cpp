// Part of SimSpec - A ZX Spectrum emulator
//
// OSD.cpp: SDL common "OS-dependant" functions
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
//  Settings live in ~/.simspec, new tapes go to ~/Desktop/SimSpec (or the
//  outpath option), and ROMs are found in RESOURCE_DIR or beside the
//  executable.

#include "SimSpec.h"

#include "Options.h"

bool OSD::Init()
{
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_GAMECONTROLLER) < 0)
    {
        Message(MsgType::Error, "SDL init failed: {}", SDL_GetError());
        return false;
    }

    return true;
}

void OSD::Exit()
{
    SDL_Quit();
}

static fs::path ExecutablePath()
{
    fs::path path;

    if (auto base_path = SDL_GetBasePath())
    {
        path = base_path;
        SDL_free(base_path);
    }

    return path;
}

static fs::path HomePath()
{
    auto home = getenv("HOME");
    return home ? fs::path(home) : ExecutablePath();
}

fs::path OSD::MakeFilePath(PathType type, const std::string& filename)
{
    fs::path path;

    switch (type)
    {
    case PathType::Settings:
        path = HomePath() / ".simspec";
        break;

    case PathType::Output:
        if (!GetOption(outpath).empty())
            path = GetOption(outpath);
        else if (fs::exists(HomePath() / "Desktop"))
            path = HomePath() / "Desktop" / "SimSpec";
        else
            path = HomePath() / "SimSpec";
        break;

    case PathType::Resource:
        path = RESOURCE_DIR;
        if (!fs::exists(path / filename))
            path = ExecutablePath();
        break;
    }

    std::error_code ec;
    if (!fs::exists(path, ec))
        fs::create_directories(path, ec);

    return path / filename;
}

void OSD::DebugTrace(const std::string& str)
{
    fmt::print(stderr, "{}", str);
}
