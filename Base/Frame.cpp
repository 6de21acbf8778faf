// Part of SimSpec - A ZX Spectrum emulator
//
// Frame.cpp: Frame pacing and status text
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
#include "Frame.h"

#include <thread>

#include "Options.h"
#include "Session.h"

constexpr auto STATUS_ACTIVE_TIME = std::chrono::milliseconds(2500);

FrameTimer::FrameTimer(std::chrono::nanoseconds frame_duration)
    : m_frame_duration(frame_duration), m_time(clock::now())
{
}

void FrameTimer::SetFrameDuration(std::chrono::nanoseconds frame_duration)
{
    m_frame_duration = frame_duration;
    Restart();
}

void FrameTimer::Restart()
{
    m_time = clock::now();
}

std::optional<uint32_t> FrameTimer::MissedFrames(clock::time_point last, clock::time_point now, std::chrono::nanoseconds frame_duration)
{
    if (now <= last + frame_duration)
        return std::nullopt;

    return static_cast<uint32_t>((now - last) / frame_duration);
}

std::optional<uint32_t> FrameTimer::Synchronize()
{
    auto now = clock::now();
    auto missed = MissedFrames(m_time, now, m_frame_duration);

    if (!missed)
    {
        m_time += m_frame_duration;
        std::this_thread::sleep_until(m_time);
        return std::nullopt;
    }

    m_time += m_frame_duration * *missed;
    return missed;
}

std::optional<std::chrono::nanoseconds> FrameTimer::CheckFrameElapsed()
{
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - m_time);
    if (elapsed < m_frame_duration)
        return std::nullopt;

    m_time += m_frame_duration;
    return elapsed;
}

////////////////////////////////////////////////////////////////////////////////

namespace Frame
{
static std::chrono::steady_clock::time_point status_time;
static std::string status_text;

FrameResult Run(Session& session, FrameTimer& timer)
{
    if (session.IsTurbo())
        return RunAccelerated(session, timer);

    return session.RunFrame();
}

FrameResult RunAccelerated(Session& session, FrameTimer& timer)
{
    FrameResult total;

    while (!timer.CheckFrameElapsed())
    {
        auto result = session.RunFrame();
        total.tstates += result.tstates;

        if (result.state_changed)
        {
            total.state_changed = true;

            // Turbo ended automatically, so return to normal pacing
            if (!session.IsTurbo())
                break;
        }
    }

    return total;
}

void Sync(FrameTimer& timer)
{
    if (auto missed = timer.Synchronize())
        TRACE("*** missed {} frames ***\n", *missed);
}

void Flyback()
{
    if (!status_text.empty())
    {
        auto now = std::chrono::steady_clock::now();
        if ((now - status_time) > STATUS_ACTIVE_TIME)
            status_text.clear();
    }
}

std::string StatusText()
{
    return status_text;
}

void SetStatus(std::string&& str)
{
    TRACE("Status: {}\n", str);

    if (GetOption(status))
    {
        status_text = std::move(str);
        status_time = std::chrono::steady_clock::now();
    }
}

} // namespace Frame
