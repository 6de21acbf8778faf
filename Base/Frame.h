// Part of SimSpec - A ZX Spectrum emulator
//
// Frame.h: Frame pacing and status text
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

class Session;

struct FrameResult
{
    uint64_t tstates{ 0 };          // emulated time covered
    bool state_changed{ false };    // tape motion or turbo changed
};

// Deadlines fall at whole frame intervals from the last restart, so waking
// late never shifts the frames that follow.
class FrameTimer
{
public:
    using clock = std::chrono::steady_clock;

    explicit FrameTimer(std::chrono::nanoseconds frame_duration);

    std::chrono::nanoseconds FrameDuration() const { return m_frame_duration; }
    void SetFrameDuration(std::chrono::nanoseconds frame_duration);

    void Restart();

    // Sleep until the next deadline.  If it has already passed, skip to the
    // latest one due and return how many frames were missed.
    std::optional<uint32_t> Synchronize();

    // Frames missed by 'now', or nothing if the deadline following 'last'
    // hasn't strictly passed
    static std::optional<uint32_t> MissedFrames(clock::time_point last, clock::time_point now, std::chrono::nanoseconds frame_duration);

    // Move to the next deadline if it has passed, returning the time since
    // the previous one.
    std::optional<std::chrono::nanoseconds> CheckFrameElapsed();

private:
    std::chrono::nanoseconds m_frame_duration;
    clock::time_point m_time;
};

namespace Frame
{
// One frame, or a turbo burst lasting up to one frame of real time
FrameResult Run(Session& session, FrameTimer& timer);
FrameResult RunAccelerated(Session& session, FrameTimer& timer);

void Sync(FrameTimer& timer);

void Flyback();
std::string StatusText();

void SetStatus(std::string&& str);

template <typename ...Args>
void SetStatus(const std::string& format, Args&& ... args)
{
    SetStatus(fmt::format(format, std::forward<Args>(args)...));
}
}
