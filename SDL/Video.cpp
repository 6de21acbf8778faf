// Part of SimSpec - A ZX Spectrum emulator
//
// Video.cpp: SDL window and display texture
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
//  The framebuffer holds palette indices, which are expanded into a streaming
//  ARGB texture each frame.  The texture is then stretched to the largest
//  area of the window that keeps the original aspect ratio.

#include "SimSpec.h"
#include "Video.h"

#include "Options.h"
#include "UI.h"

constexpr uint8_t NORMAL_INTENSITY = 0xd7;
constexpr uint8_t BRIGHT_INTENSITY = 0xff;

static unique_sdl_window window;
static unique_sdl_renderer renderer;
static unique_sdl_texture screen_texture;

static std::array<uint32_t, NUM_COLOURS> aulPalette;

static SDL_Rect rSource{};
static SDL_Rect rTarget{};
static SDL_Rect rDisplay{};


static void CreatePalette()
{
    for (int i = 0; i < NUM_COLOURS; ++i)
    {
        uint32_t level = (i & BRIGHT) ? BRIGHT_INTENSITY : NORMAL_INTENSITY;
        uint32_t red = (i & RED) ? level : 0;
        uint32_t green = (i & GREEN) ? level : 0;
        uint32_t blue = (i & BLUE) ? level : 0;

        aulPalette[i] = 0xff000000 | (red << 16) | (green << 8) | blue;
    }
}

static void ResizeSource(int source_width, int source_height)
{
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "nearest");

    screen_texture.reset(
        SDL_CreateTexture(
            renderer,
            SDL_PIXELFORMAT_ARGB8888,
            SDL_TEXTUREACCESS_STREAMING,
            source_width,
            source_height));

    if (!screen_texture)
        TRACE("SDL_CreateTexture failed: {}\n", SDL_GetError());

    rSource.w = source_width;
    rSource.h = source_height;
}

static void ResizeTarget(int target_width, int target_height)
{
    int width = rSource.w;
    int height = rSource.h;

    int width_fit = width * target_height / height;
    int height_fit = height * target_width / width;

    if (width_fit <= target_width)
    {
        width = width_fit;
        height = target_height;
    }
    else if (height_fit <= target_height)
    {
        width = target_width;
        height = height_fit;
    }

    rDisplay.x = (target_width - width) / 2;
    rDisplay.y = (target_height - height) / 2;
    rDisplay.w = width;
    rDisplay.h = height;

    rTarget.w = target_width;
    rTarget.h = target_height;
}

static bool DrawChanges(const FrameBuffer& fb)
{
    int width = fb.Width();
    int height = fb.Height();

    int window_width{};
    int window_height{};
    SDL_GetWindowSize(window, &window_width, &window_height);

    bool source_changed = (width != rSource.w) || (height != rSource.h);
    bool target_changed = window_width != rTarget.w || window_height != rTarget.h;

    if (source_changed)
        ResizeSource(width, height);

    if (source_changed || target_changed)
        ResizeTarget(window_width, window_height);

    if (!screen_texture)
        return false;

    int texture_pitch = 0;
    uint8_t* pTexture = nullptr;
    if (SDL_LockTexture(screen_texture, nullptr, (void**)&pTexture, &texture_pitch) != 0)
        return false;

    for (int y = 0; y < height; ++y)
    {
        auto pdw = reinterpret_cast<uint32_t*>(pTexture);
        auto pb = fb.GetLine(y);

        for (int x = 0; x < width; ++x)
            pdw[x] = aulPalette[pb[x] & (NUM_COLOURS - 1)];

        pTexture += texture_pitch;
    }

    SDL_UnlockTexture(screen_texture);
    return true;
}

static void Render()
{
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, screen_texture, nullptr, &rDisplay);
    SDL_RenderPresent(renderer);
}

////////////////////////////////////////////////////////////////////////////////

bool Video::Init(int width, int height)
{
    Exit();

    SDL_SetHint(SDL_HINT_RENDER_VSYNC, "0");

    auto scale = std::clamp(GetOption(scale), MIN_SCALE, MAX_SCALE);

    Uint32 window_flags = SDL_WINDOW_RESIZABLE;
    if (GetOption(fullscreen))
        window_flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;

    window = SDL_CreateWindow(
        WINDOW_CAPTION, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        width * scale, height * scale, window_flags);
    if (!window)
    {
        Message(MsgType::Error, "Failed to create window: {}", SDL_GetError());
        return false;
    }

    SDL_SetWindowMinimumSize(window, width, height);

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer)
    {
        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
        if (!renderer)
        {
            Message(MsgType::Error, "Failed to create renderer: {}", SDL_GetError());
            return false;
        }
    }

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 0xff);
    CreatePalette();

    rSource.w = rSource.h = 0;
    rTarget.w = rTarget.h = 0;

    return true;
}

void Video::Exit()
{
    screen_texture.reset();
    renderer.reset();
    window.reset();
}

void Video::Update(const FrameBuffer& fb)
{
    if (window && DrawChanges(fb))
        Render();
}

void Video::SetTitle(const std::string& title)
{
    if (window)
        SDL_SetWindowTitle(window, title.c_str());
}

void Video::ToggleFullscreen()
{
    SetOption(fullscreen, !GetOption(fullscreen));

    if (window)
        SDL_SetWindowFullscreen(window, GetOption(fullscreen) ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0);
}
