// Part of SimSpec - A ZX Spectrum emulator
//
// FrameTests.cpp: Frame pacing, turbo bursts and session frame order
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
#include <gtest/gtest.h>

#include <thread>

#include "Frame.h"
#include "Session.h"
#include "TestDoubles.h"

using namespace std::chrono_literals;

namespace
{
constexpr auto FRAME_DURATION = 20ms;

struct SessionFixture : public ::testing::Test
{
    SessionFixture()
    {
        auto hardware = std::make_unique<FakeHardware>();
        hw = hardware.get();
        session = std::make_unique<Session>(std::move(hardware));
    }

    FakeHardware* hw{};
    std::unique_ptr<Session> session;
};
}

TEST(FrameTimer, SynchronizeKeepsFramePace)
{
    FrameTimer timer(FRAME_DURATION);
    auto start = FrameTimer::clock::now();

    for (int i = 0; i < 5; ++i)
        EXPECT_FALSE(timer.Synchronize().has_value());

    auto elapsed = FrameTimer::clock::now() - start;
    EXPECT_GE(elapsed, FRAME_DURATION * 5 - 1ms);
    EXPECT_LT(elapsed, FRAME_DURATION * 5 + 50ms);
}

TEST(FrameTimer, OverrunReportsMissedFrames)
{
    FrameTimer timer(FRAME_DURATION);
    std::this_thread::sleep_for(FRAME_DURATION * 3 + 10ms);

    auto missed = timer.Synchronize();
    ASSERT_TRUE(missed.has_value());
    EXPECT_GE(*missed, 3U);
}

TEST(FrameTimer, OnlyLateFramesAreMissed)
{
    auto start = FrameTimer::clock::now();

    EXPECT_FALSE(FrameTimer::MissedFrames(start, start + FRAME_DURATION / 2, FRAME_DURATION).has_value());
    EXPECT_FALSE(FrameTimer::MissedFrames(start, start + FRAME_DURATION, FRAME_DURATION).has_value());

    auto missed = FrameTimer::MissedFrames(start, start + FRAME_DURATION + 1ns, FRAME_DURATION);
    ASSERT_TRUE(missed.has_value());
    EXPECT_EQ(*missed, 1U);

    missed = FrameTimer::MissedFrames(start, start + FRAME_DURATION * 3 + 1ms, FRAME_DURATION);
    ASSERT_TRUE(missed.has_value());
    EXPECT_EQ(*missed, 3U);
}

TEST(FrameTimer, OverrunDoesNotSleep)
{
    FrameTimer timer(FRAME_DURATION);
    std::this_thread::sleep_for(FRAME_DURATION * 2 + 5ms);

    auto start = FrameTimer::clock::now();
    EXPECT_TRUE(timer.Synchronize().has_value());
    EXPECT_LT(FrameTimer::clock::now() - start, 5ms);
}

TEST(FrameTimer, CheckFrameElapsed)
{
    FrameTimer timer(FRAME_DURATION);
    EXPECT_FALSE(timer.CheckFrameElapsed().has_value());

    std::this_thread::sleep_for(FRAME_DURATION + 5ms);

    auto elapsed = timer.CheckFrameElapsed();
    ASSERT_TRUE(elapsed.has_value());
    EXPECT_GE(*elapsed, FRAME_DURATION);

    // The deadline moved on by one frame
    EXPECT_FALSE(timer.CheckFrameElapsed().has_value());
}

TEST(FrameTimer, RestartMovesDeadline)
{
    FrameTimer timer(FRAME_DURATION);
    std::this_thread::sleep_for(FRAME_DURATION * 2);

    timer.Restart();
    EXPECT_FALSE(timer.CheckFrameElapsed().has_value());
}

////////////////////////////////////////////////////////////////////////////////

TEST_F(SessionFixture, NormalFramesReportTickDelta)
{
    auto start = hw->CurrentTick();
    uint64_t total = 0;

    for (int i = 0; i < 10; ++i)
    {
        auto result = session->RunFrame();
        EXPECT_EQ(result.tstates, hw->frame_tstates);
        EXPECT_FALSE(result.state_changed);
        total += result.tstates;
    }

    EXPECT_EQ(total, hw->CurrentTick() - start);
    EXPECT_EQ(total, 10ULL * hw->frame_tstates);
}

TEST_F(SessionFixture, NormalRunIsOneFrame)
{
    FrameTimer timer(FRAME_DURATION);

    auto result = Frame::Run(*session, timer);
    EXPECT_EQ(hw->executed_frames, 1);
    EXPECT_EQ(result.tstates, hw->frame_tstates);
}

TEST_F(SessionFixture, TurboEndsWithinOneFrameInterval)
{
    FrameTimer timer(FRAME_DURATION);
    session->SetTurbo(true);

    auto start = FrameTimer::clock::now();
    auto result = Frame::Run(*session, timer);
    auto elapsed = FrameTimer::clock::now() - start;

    EXPECT_TRUE(session->IsTurbo());
    EXPECT_GT(hw->executed_frames, 1);
    EXPECT_EQ(result.tstates, uint64_t(hw->executed_frames) * hw->frame_tstates);
    EXPECT_LT(elapsed, FRAME_DURATION + 15ms);
}

TEST_F(SessionFixture, TurboStopsEarlyWhenLoadingEnds)
{
    FrameTimer timer(FRAME_DURATION);

    session->Tape().Insert(std::make_unique<FakeTapeMedia>(1, 10000));
    ASSERT_TRUE(session->Tape().Play());
    session->SetTurbo(true);

    // Too few EAR reads for a loader
    hw->probe_count = 5;

    auto result = Frame::RunAccelerated(*session, timer);
    EXPECT_TRUE(result.state_changed);
    EXPECT_FALSE(session->IsTurbo());
    EXPECT_FALSE(session->Tape().IsRunning());
    EXPECT_EQ(hw->executed_frames, 1);
}

TEST_F(SessionFixture, NmiRetriedUntilAccepted)
{
    hw->nmi_refusals = 2;
    session->RequestNmi();

    session->RunFrame();
    EXPECT_TRUE(session->NmiPending());
    session->RunFrame();
    EXPECT_TRUE(session->NmiPending());
    session->RunFrame();
    EXPECT_FALSE(session->NmiPending());
    EXPECT_EQ(hw->nmis, 1);
}

TEST_F(SessionFixture, ResetAppliedAtFrameStart)
{
    session->RequestReset(true);
    session->RunFrame();
    session->RunFrame();

    ASSERT_EQ(hw->resets.size(), 1U);
    EXPECT_TRUE(hw->resets[0]);
}

TEST_F(SessionFixture, ResetActionUnpauses)
{
    session->SetPaused(true);
    EXPECT_TRUE(session->Do(Action::SoftReset));
    EXPECT_FALSE(session->IsPaused());

    session->RunFrame();
    ASSERT_EQ(hw->resets.size(), 1U);
    EXPECT_FALSE(hw->resets[0]);
}

TEST_F(SessionFixture, ModelSwapNotHandledBySession)
{
    EXPECT_FALSE(session->Do(Action::Spectrum128));
    EXPECT_FALSE(session->Do(Action::ExitApp));
}

TEST_F(SessionFixture, StatusLine)
{
    EXPECT_EQ(session->StatusLine(), "ZX Spectrum 48k");

    EXPECT_TRUE(session->Do(Action::ToggleTurbo));
    EXPECT_NE(session->StatusLine().find("🏎️"), std::string::npos);
    EXPECT_EQ(Frame::StatusText(), "Turbo mode enabled");

    session->Tape().Insert(std::make_unique<FakeTapeMedia>(3, 100));
    EXPECT_NE(session->StatusLine().find("1: Chunk 0"), std::string::npos);

    session->Tape().Play();
    EXPECT_NE(session->StatusLine().find("⏵"), std::string::npos);
}

TEST(FrameStatus, SetStatusFormats)
{
    Frame::SetStatus("{}  inserted", "game.tzx");
    EXPECT_EQ(Frame::StatusText(), "game.tzx  inserted");

    // Still current straight after being set
    Frame::Flyback();
    EXPECT_EQ(Frame::StatusText(), "game.tzx  inserted");
}
