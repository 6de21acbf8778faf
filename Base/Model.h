// Part of SimSpec - A ZX Spectrum emulator
//
// Model.h: Hardware model definitions and ROM images
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

enum class Model { Spectrum16, Spectrum48, Spectrum128 };

constexpr auto ROM_SIZE = 0x4000;
constexpr auto PAGE_SIZE = 0x4000;

struct ModelInfo
{
    Model model;
    const char* id;             // command-line and config name
    unsigned int ram_size;      // bytes of RAM fitted
    uint32_t cpu_hz;
    uint32_t frame_tstates;
    uint32_t int_tstates;       // length of the INT pulse

    std::chrono::nanoseconds FrameDuration() const
    {
        return std::chrono::nanoseconds(uint64_t(frame_tstates) * 1'000'000'000 / cpu_hz);
    }
};

const ModelInfo& GetModelInfo(Model model);
std::optional<Model> ParseModel(const std::string& id);

struct RomSet
{
    std::vector<uint8_t> rom48;
    std::vector<uint8_t> rom128_0;      // 128K editor
    std::vector<uint8_t> rom128_1;      // 48K BASIC, used when paging is locked

    bool Load();
};
