// Part of SimSpec - A ZX Spectrum emulator
//
// Model.cpp: Hardware model definitions and ROM images
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
#include "Model.h"

#include "Options.h"
#include "Stream.h"

static const std::array<ModelInfo, 3> models
{{
    { Model::Spectrum16, "16", 0x4000, 3'500'000, 69888, 32 },
    { Model::Spectrum48, "48", 0xc000, 3'500'000, 69888, 32 },
    { Model::Spectrum128, "128", 0x20000, 3'546'900, 70908, 36 },
}};

const ModelInfo& GetModelInfo(Model model)
{
    return models[static_cast<size_t>(model)];
}

std::optional<Model> ParseModel(const std::string& id)
{
    auto name = tolower(trim(id));
    if (!name.empty() && name.back() == 'k')
        name.pop_back();

    for (auto& info : models)
    {
        if (name == info.id)
            return info.model;
    }

    return std::nullopt;
}

////////////////////////////////////////////////////////////////////////////////

static bool LoadRom(const std::string& custom_path, const std::string& default_name, std::vector<uint8_t>& rom)
{
    auto path = custom_path.empty() ?
        OSD::MakeFilePath(PathType::Resource, default_name).string() : custom_path;

    auto stream = Stream::Open(path, true);
    if (!stream)
    {
        Message(MsgType::Error, "Failed to open ROM image:\n\n{}", path);
        return false;
    }

    auto data = stream->ReadAll();
    if (data.size() != ROM_SIZE)
    {
        Message(MsgType::Error, "Invalid ROM image size ({} bytes):\n\n{}", data.size(), path);
        return false;
    }

    rom = std::move(data);
    return true;
}

bool RomSet::Load()
{
    return LoadRom(GetOption(rom48), "48.rom", rom48) &&
        LoadRom(GetOption(rom128_0), "128-0.rom", rom128_0) &&
        LoadRom(GetOption(rom128_1), "128-1.rom", rom128_1);
}
