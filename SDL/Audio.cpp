// Part of SimSpec - A ZX Spectrum emulator
//
// Audio.cpp: SDL audio output fed from the frame loop
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
//  The device runs in callback mode on SDL's audio thread, which takes whole
//  frames from the carousel.  The frame loop never waits for it, as pacing
//  comes from the frame timer rather than the sound card.

#include "SimSpec.h"
#include "Audio.h"

#include "Carousel.h"
#include "Options.h"

constexpr auto MIN_LATENCY_FRAMES = 1;
constexpr auto MAX_LATENCY_FRAMES = 20;

static SDL_AudioDeviceID dev;
static SDL_AudioSpec obtained{};
static std::unique_ptr<AudioCarousel<blip_sample_t>> carousel;

static void SDLCALL AudioCallback(void* /*userdata*/, Uint8* stream, int len)
{
    carousel->Fill(reinterpret_cast<blip_sample_t*>(stream), len / sizeof(blip_sample_t));
}

////////////////////////////////////////////////////////////////////////////////

bool Audio::Init()
{
    Exit();

    auto latency = std::clamp(GetOption(latency), MIN_LATENCY_FRAMES, MAX_LATENCY_FRAMES);
    carousel = std::make_unique<AudioCarousel<blip_sample_t>>(latency);

    SDL_AudioSpec desired{};
    desired.freq = GetOption(samplerate) > 0 ? GetOption(samplerate) : SAMPLE_FREQ;
    desired.format = AUDIO_S16SYS;
    desired.channels = static_cast<Uint8>(std::clamp(GetOption(channels), 1, MAX_CHANNELS));
    desired.samples = 512;
    desired.callback = AudioCallback;

    dev = SDL_OpenAudioDevice(nullptr, 0, &desired, &obtained, 0);
    if (!dev)
    {
        TRACE("SDL_OpenAudioDevice failed: {}\n", SDL_GetError());
        return false;
    }

    TRACE("Audio: {} Hz, {} channels, {} frames latency\n", obtained.freq, obtained.channels, latency);
    return true;
}

void Audio::Exit()
{
    if (dev)
    {
        SDL_CloseAudioDevice(dev);
        dev = 0;
    }

    carousel.reset();
}

bool Audio::IsAvailable()
{
    return dev != 0;
}

int Audio::SampleRate()
{
    return dev ? obtained.freq : SAMPLE_FREQ;
}

int Audio::Channels()
{
    return dev ? obtained.channels : MAX_CHANNELS;
}

void Audio::Play()
{
    if (dev)
        SDL_PauseAudioDevice(dev, 0);
}

void Audio::Pause()
{
    if (!dev)
        return;

    SDL_PauseAudioDevice(dev, 1);

    // Discard anything still queued
    SDL_LockAudioDevice(dev);
    carousel->Clear();
    SDL_UnlockAudioDevice(dev);
}

bool Audio::AddFrame(std::vector<blip_sample_t>&& samples)
{
    if (!dev)
        return false;

    return carousel->PushFrame(std::move(samples));
}
