// Part of SimSpec - A ZX Spectrum emulator
//
// HeuristicsTests.cpp: Tape auto-start, auto-stop and recording decisions
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

#include "Frame.h"
#include "Heuristics.h"
#include "Session.h"
#include "TestDoubles.h"

namespace
{
struct HeuristicsFixture : public ::testing::Test
{
    HeuristicsFixture()
    {
        auto tape = std::make_unique<FakeTapeMedia>(2, 500);
        media = tape.get();
        deck.Insert(std::move(tape));
    }

    FakeHardware hw;
    TapeDeck deck;
    FakeTapeMedia* media{};
    TapeThresholds thresholds;
    bool turbo{ false };
};

std::vector<uint8_t> HeaderBlock()
{
    std::vector<uint8_t> block{ 0x00, 0x03 };
    for (auto ch : std::string("screen    "))
        block.push_back(static_cast<uint8_t>(ch));
    block.insert(block.end(), { 0x00, 0x1b, 0x00, 0x40, 0x00, 0x80 });

    uint8_t checksum = 0;
    for (auto b : block)
        checksum ^= b;
    block.push_back(checksum);
    return block;
}
}

TEST_F(HeuristicsFixture, DefaultThresholds)
{
    EXPECT_EQ(thresholds.idle, 20U);
    EXPECT_EQ(thresholds.probe, 1000U);

    auto from_options = TapeThresholds::FromOptions();
    EXPECT_EQ(from_options.idle, DEFAULT_IDLE_THRESHOLD);
    EXPECT_EQ(from_options.probe, DEFAULT_PROBE_THRESHOLD);
}

TEST_F(HeuristicsFixture, AutoStartAboveProbeThreshold)
{
    hw.probe_count = 1001;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);

    EXPECT_TRUE(deck.IsPlaying());
    EXPECT_TRUE(turbo);
    EXPECT_EQ(deck.prev_probe_count, 1001U);
}

TEST_F(HeuristicsFixture, NoAutoStartAtProbeThreshold)
{
    hw.probe_count = 1000;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);

    EXPECT_FALSE(deck.IsRunning());
    EXPECT_FALSE(turbo);
}

TEST_F(HeuristicsFixture, NoAutoStartWithoutAutoAccelerate)
{
    deck.auto_accelerate = false;
    hw.probe_count = 5000;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);

    EXPECT_FALSE(deck.IsRunning());
    EXPECT_FALSE(turbo);
}

TEST_F(HeuristicsFixture, AutoStopBelowIdleThreshold)
{
    ASSERT_TRUE(deck.Play());
    turbo = true;

    hw.probe_count = 5000;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);
    hw.probe_count = 10;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);
    EXPECT_TRUE(deck.IsPlaying());
    EXPECT_TRUE(turbo);

    hw.probe_count = 9;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);
    EXPECT_FALSE(deck.IsRunning());
    EXPECT_FALSE(turbo);
}

TEST_F(HeuristicsFixture, NoAutoStopAtIdleThreshold)
{
    ASSERT_TRUE(deck.Play());
    turbo = true;

    deck.prev_probe_count = 10;
    hw.probe_count = 10;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);

    EXPECT_TRUE(deck.IsPlaying());
    EXPECT_TRUE(turbo);
}

TEST_F(HeuristicsFixture, ZeroProbesChangeNothing)
{
    ASSERT_TRUE(deck.Play());
    turbo = true;
    deck.prev_probe_count = 3000;

    hw.probe_count = 0;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);

    EXPECT_TRUE(deck.IsPlaying());
    EXPECT_TRUE(turbo);
    EXPECT_EQ(deck.prev_probe_count, 3000U);
}

TEST_F(HeuristicsFixture, ManualPlayWithoutTurboIsLeftRunning)
{
    ASSERT_TRUE(deck.Play());

    hw.probe_count = 3;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);

    EXPECT_TRUE(deck.IsPlaying());
    EXPECT_FALSE(turbo);
}

TEST_F(HeuristicsFixture, ConfiguredThresholds)
{
    thresholds.probe = 100;
    hw.probe_count = 101;
    Heuristics::AutoDetectLoad(hw, deck, turbo, thresholds);

    EXPECT_TRUE(deck.IsPlaying());
    EXPECT_TRUE(turbo);
}

TEST_F(HeuristicsFixture, EndOfTapeStopsAndDropsTurbo)
{
    media->SelectChunk(1);
    ASSERT_TRUE(deck.Play());
    turbo = true;

    // 500 pulses of 2168 T-states cover about 16 frames
    int frames = 0;
    while (!Heuristics::FeedEarInOrStop(hw, deck, turbo))
    {
        spec_cpu cpu{};
        hw.ExecuteFrame(cpu);
        hw.BeginFrame();
        ASSERT_LT(++frames, 100);
    }

    EXPECT_GE(frames, 15);
    EXPECT_LE(frames, 17);
    EXPECT_FALSE(deck.IsRunning());
    EXPECT_FALSE(turbo);
    EXPECT_EQ(hw.fed_pulses.size(), 500U);
}

TEST_F(HeuristicsFixture, FeedCoversOneFrame)
{
    ASSERT_TRUE(deck.Play());
    EXPECT_FALSE(Heuristics::FeedEarInOrStop(hw, deck, turbo));

    uint64_t fed = 0;
    for (auto pulse : hw.fed_pulses)
        fed += pulse;

    EXPECT_GE(fed, hw.frame_tstates);
    EXPECT_LT(fed, hw.frame_tstates + PILOT_PULSE_LENGTH);
}

TEST_F(HeuristicsFixture, RecordingSavesDecodedBlocks)
{
    ASSERT_TRUE(deck.Record());

    auto block = HeaderBlock();
    hw.mic_pulses = EncodeRomBlock(block);
    hw.mic_pulses.push_back(hw.frame_tstates * 2);

    EXPECT_TRUE(Heuristics::RecordFromMicOut(hw, deck, turbo));

    ASSERT_EQ(media->appended.size(), 1U);
    EXPECT_EQ(media->appended[0], block);
    EXPECT_TRUE(deck.IsRecording());
    EXPECT_EQ(Frame::StatusText(), "Saved: 1 TAP chunks");
}

TEST_F(HeuristicsFixture, RecordingTurboFollowsDecoder)
{
    ASSERT_TRUE(deck.Record());

    // Pilot tone in progress
    hw.mic_pulses.assign(1000, PILOT_PULSE_LENGTH);
    Heuristics::RecordFromMicOut(hw, deck, turbo);
    EXPECT_TRUE(turbo);

    // Gap ends the block
    hw.mic_pulses = { hw.frame_tstates * 2 };
    Heuristics::RecordFromMicOut(hw, deck, turbo);
    EXPECT_FALSE(turbo);
}

TEST_F(HeuristicsFixture, RecordingWriteFailureStops)
{
    ASSERT_TRUE(deck.Record());
    media->fail_writes = true;
    turbo = true;

    hw.mic_pulses = EncodeRomBlock(HeaderBlock());
    hw.mic_pulses.push_back(hw.frame_tstates * 2);

    EXPECT_TRUE(Heuristics::RecordFromMicOut(hw, deck, turbo));
    EXPECT_FALSE(turbo);
    EXPECT_FALSE(deck.IsRunning());
    EXPECT_EQ(Frame::StatusText(), "Tape write failed, recording stopped");
}

TEST_F(HeuristicsFixture, NotRecordingTakesAutoDetectPath)
{
    EXPECT_FALSE(Heuristics::RecordFromMicOut(hw, deck, turbo));
}

////////////////////////////////////////////////////////////////////////////////

TEST(SessionHeuristics, AutoStartFromRunFrame)
{
    auto hardware = std::make_unique<FakeHardware>();
    auto hw = hardware.get();
    Session session(std::move(hardware));

    session.Tape().Insert(std::make_unique<FakeTapeMedia>(1, 5000));
    hw->probe_count = 1001;

    auto result = session.RunFrame();
    EXPECT_TRUE(result.state_changed);
    EXPECT_TRUE(session.IsTurbo());
    EXPECT_TRUE(session.Tape().IsPlaying());
    EXPECT_FALSE(hw->fed_pulses.empty());
}

TEST(SessionHeuristics, EndOfTapeStatus)
{
    auto hardware = std::make_unique<FakeHardware>();
    auto hw = hardware.get();
    Session session(std::move(hardware));

    session.Tape().Insert(std::make_unique<FakeTapeMedia>(1, 10));
    session.Tape().Play();
    session.SetTurbo(true);
    hw->probe_count = 3000;

    session.RunFrame();
    EXPECT_TRUE(session.Tape().IsPlaying());

    auto result = session.RunFrame();
    EXPECT_TRUE(result.state_changed);
    EXPECT_FALSE(session.IsTurbo());
    EXPECT_FALSE(session.Tape().IsRunning());
    EXPECT_EQ(Frame::StatusText(), "Auto STOP: End of TAPE");
}

TEST(SessionHeuristics, StopPointStatus)
{
    auto hardware = std::make_unique<FakeHardware>();
    Session session(std::move(hardware));

    auto tape = std::make_unique<FakeTapeMedia>(2, 10);
    tape->stop_after_chunk = 0;
    session.Tape().Insert(std::move(tape));
    session.Tape().Play();

    session.RunFrame();
    EXPECT_TRUE(session.Tape().IsPlaying());

    auto result = session.RunFrame();
    EXPECT_TRUE(result.state_changed);
    EXPECT_FALSE(session.Tape().IsRunning());
    EXPECT_EQ(Frame::StatusText(), "Auto STOP: Stop the tape");
}

TEST(SessionHeuristics, AutoStopDiscardsQueuedPulses)
{
    FakeHardware hw;
    TapeDeck deck;
    deck.Insert(std::make_unique<FakeTapeMedia>(1, 5000));
    ASSERT_TRUE(deck.Play());
    bool turbo = true;

    hw.probe_count = 5;
    Heuristics::AutoDetectLoad(hw, deck, turbo, TapeThresholds{});
    EXPECT_FALSE(deck.IsRunning());
    EXPECT_EQ(hw.ear_in_clears, 1);
}

TEST(SessionTape, TapeCommandsDiscardQueuedPulses)
{
    RomSet roms;
    roms.rom48.assign(ROM_SIZE, 0x00);

    auto session = Session::Create(Model::Spectrum48, roms);
    ASSERT_TRUE(session);
    auto& hw = session->GetHardware();

    session->Tape().Insert(std::make_unique<FakeTapeMedia>(3, 100));

    for (auto action : { Action::TapeStop, Action::TapeNextChunk, Action::TapeRewind, Action::EjectTape })
    {
        ASSERT_TRUE(session->Do(Action::TapePlay));
        ASSERT_TRUE(session->Tape().FeedEarIn(hw));
        EXPECT_EQ(hw.InputFeedCapacity(1), 0U);

        EXPECT_TRUE(session->Do(action));
        EXPECT_EQ(hw.InputFeedCapacity(1), hw.FrameTStates());
    }
}

TEST(SessionTape, PlayKeepsQueuedPulses)
{
    auto hardware = std::make_unique<FakeHardware>();
    auto hw = hardware.get();
    Session session(std::move(hardware));
    session.Tape().Insert(std::make_unique<FakeTapeMedia>(1, 10));

    EXPECT_TRUE(session.Do(Action::TapePlay));
    EXPECT_EQ(hw->ear_in_clears, 0);

    EXPECT_TRUE(session.Do(Action::TapeStop));
    EXPECT_EQ(hw->ear_in_clears, 1);
}
