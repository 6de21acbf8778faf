// Part of SimSpec - A ZX Spectrum emulator
//
// EndToEndTests.cpp: Tape loading on a real machine core
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

#include "Session.h"
#include "Sound.h"
#include "TestDoubles.h"

namespace
{
constexpr uint16_t TONE_PULSES = 6457;
constexpr uint64_t TONE_TSTATES = uint64_t(TONE_PULSES) * PILOT_PULSE_LENGTH;

// DI ; loop: IN A,(0xfe) ; JR loop
RomSet PollingRom()
{
    RomSet roms;
    roms.rom48 = { 0xf3, 0xdb, 0xfe, 0x18, 0xfc };
    roms.rom48.resize(ROM_SIZE, 0x00);
    return roms;
}

// LD SP,0x8000 ; IM 1 ; EI ; JR $
RomSet InterruptRom()
{
    RomSet roms;
    roms.rom48 = { 0x31, 0x00, 0x80, 0xed, 0x56, 0xfb, 0x18, 0xfe };
    roms.rom48.resize(ROM_SIZE, 0x00);
    roms.rom48[0x38] = 0x18;
    roms.rom48[0x39] = 0xfe;
    return roms;
}

// As above, but spinning through a long run of DD prefixes ending in JP 0x0006
RomSet PrefixChainRom()
{
    auto roms = InterruptRom();
    constexpr uint16_t chain_end = 0x3ff0;
    std::fill(roms.rom48.begin() + 6, roms.rom48.begin() + chain_end, uint8_t(0xdd));
    roms.rom48[chain_end] = 0xc3;
    roms.rom48[chain_end + 1] = 0x06;
    roms.rom48[chain_end + 2] = 0x00;
    return roms;
}

class LoadingSession : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(WriteToneTzx(tzx.path, PILOT_PULSE_LENGTH, TONE_PULSES));

        session = Session::Create(Model::Spectrum48, PollingRom());
        ASSERT_TRUE(session);
        ASSERT_TRUE(session->InsertTape(tzx.path.string()));
    }

    TempPath tzx{ "tone.tzx" };
    std::unique_ptr<Session> session;
};
}

TEST_F(LoadingSession, PollingLoopCountsAsProbes)
{
    session->Tape().auto_accelerate = false;
    session->RunFrame();

    // 23 T-states per IN/JR pass
    auto probes = session->GetHardware().ProbeCount();
    EXPECT_NEAR(probes, 69888 / 23, 2);
}

TEST_F(LoadingSession, TurboCoversTheWholeTone)
{
    auto& hw = session->GetHardware();

    // Nothing has been probed before the first frame
    auto first = session->RunFrame();
    EXPECT_FALSE(first.state_changed);
    EXPECT_FALSE(session->IsTurbo());

    auto start_tick = hw.CurrentTick();
    auto started = session->RunFrame();
    EXPECT_TRUE(started.state_changed);
    EXPECT_TRUE(session->IsTurbo());
    EXPECT_TRUE(session->Tape().IsPlaying());

    std::optional<uint64_t> end_tick;
    for (int i = 0; i < 400 && !end_tick; ++i)
    {
        auto result = session->RunFrame();
        EXPECT_NEAR(result.tstates, 69888U, 23);

        if (result.state_changed)
        {
            EXPECT_FALSE(session->IsTurbo());
            EXPECT_FALSE(session->Tape().IsRunning());
            end_tick = hw.CurrentTick();
        }
    }

    ASSERT_TRUE(end_tick.has_value());
    EXPECT_EQ(Frame::StatusText(), "Auto STOP: End of TAPE");

    auto elapsed = *end_tick - start_tick;
    EXPECT_GE(elapsed, TONE_TSTATES);
    EXPECT_LE(elapsed, TONE_TSTATES + 2 * 69888 + 100);

    // The program is still polling, but the tape has nothing left to give
    for (int i = 0; i < 5; ++i)
    {
        auto result = session->RunFrame();
        EXPECT_FALSE(result.state_changed);
        EXPECT_FALSE(session->IsTurbo());
    }
}

TEST_F(LoadingSession, ToneIsAudibleWhileLoading)
{
    EdgeAccumulator accumulator(session->GetHardware().ClockHz());

    session->RunFrame();
    session->RenderAudio(accumulator);
    session->RunFrame();
    session->RenderAudio(accumulator);

    session->RunFrame();
    auto samples = session->RenderAudio(accumulator);
    ASSERT_GT(samples, 0);

    auto frame = accumulator.RenderInterleaved(samples, 2);
    EXPECT_TRUE(std::any_of(frame.begin(), frame.end(), [](blip_sample_t s) { return s != 0; }));
}

TEST_F(LoadingSession, RewindAfterEndPlaysAgain)
{
    for (int i = 0; i < 300 && (i < 2 || session->IsTurbo()); ++i)
        session->RunFrame();
    ASSERT_FALSE(session->IsTurbo());

    EXPECT_TRUE(session->Do(Action::TapeRewind));
    session->RunFrame();
    EXPECT_TRUE(session->IsTurbo());
    EXPECT_TRUE(session->Tape().IsPlaying());
}

TEST(InterruptSession, FrameInterruptIsAccepted)
{
    auto session = Session::Create(Model::Spectrum48, InterruptRom());
    ASSERT_TRUE(session);

    session->RunFrame();
    session->RunFrame();
    EXPECT_EQ(session->Cpu().get_sp(), 0x7ffe);
}

TEST(InterruptSession, NoInterruptAfterIndexPrefix)
{
    auto session = Session::Create(Model::Spectrum48, PrefixChainRom());
    ASSERT_TRUE(session);

    // Both interrupts arrive while the prefix run is executing
    for (int i = 0; i < 3; ++i)
        session->RunFrame();

    EXPECT_EQ(session->Cpu().get_sp(), 0x8000);
}
