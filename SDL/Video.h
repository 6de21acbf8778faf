// Part of SimSpec - A ZX Spectrum emulator
//
// Video.h: SDL window and display texture
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

#include "FrameBuffer.h"

struct SDLRendererDeleter { void operator()(SDL_Renderer* renderer) { SDL_DestroyRenderer(renderer); } };
using unique_sdl_renderer = unique_resource<SDL_Renderer*, nullptr, SDLRendererDeleter>;

struct SDLWindowDeleter { void operator()(SDL_Window* window) { SDL_DestroyWindow(window); } };
using unique_sdl_window = unique_resource<SDL_Window*, nullptr, SDLWindowDeleter>;

struct SDLTextureDeleter { void operator()(SDL_Texture* texture) { SDL_DestroyTexture(texture); } };
using unique_sdl_texture = unique_resource<SDL_Texture*, nullptr, SDLTextureDeleter>;

constexpr auto MIN_SCALE = 1;
constexpr auto MAX_SCALE = 4;

class Video
{
public:
    static bool Init(int width, int height);
    static void Exit();

    static void Update(const FrameBuffer& fb);
    static void SetTitle(const std::string& title);
    static void ToggleFullscreen();
};
