// Part of SimSpec - A ZX Spectrum emulator
//
// Spectrum128Tests.cpp: 128K port decoding, sound chip and keypad
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

#include "Spectrum128.h"
#include "Spectrum48.h"

namespace
{
constexpr uint16_t MEM_PORT = 0x7ffd;
constexpr uint16_t AY_SELECT_PORT = 0xfffd;
constexpr uint16_t AY_DATA_PORT = 0xbffd;

// DI ; JR $
std::vector<uint8_t> IdleRom()
{
    std::vector<uint8_t> rom{ 0xf3, 0x18, 0xfe };
    rom.resize(ROM_SIZE, 0x00);
    return rom;
}

struct Spectrum128Fixture : public ::testing::Test
{
    void WriteAY(uint8_t reg, uint8_t val)
    {
        hw.Out(AY_SELECT_PORT, reg);
        hw.Out(AY_DATA_PORT, val);
    }

    Spectrum128 hw{ IdleRom(), IdleRom() };
};

// One full scan, returning the bits in the order sent
std::vector<bool> ReadScan(Keypad& keypad, uint64_t& tick)
{
    std::vector<bool> bits;

    for (int i = 0; i < KEYPAD_FRAME_BITS; ++i)
    {
        keypad.Write(static_cast<uint8_t>(~KEYPAD_CTS_MASK), tick += 100);

        auto lines = keypad.Read();
        EXPECT_FALSE(lines & KEYPAD_DTR_MASK);
        bits.push_back(!(lines & KEYPAD_TXD_MASK));

        keypad.Write(0xff, tick += 100);
    }

    return bits;
}
}

TEST_F(Spectrum128Fixture, EvenPortWriteReachesPagingAndUla)
{
    hw.Out(0x7ffc, 0x03);
    EXPECT_EQ(hw.GetMemPort(), 0x03);
    EXPECT_EQ(hw.GetBorder(), 3);
}

TEST_F(Spectrum128Fixture, OddPortLeavesBorder)
{
    hw.SetBorder(5);
    hw.Out(MEM_PORT, 0x02);
    EXPECT_EQ(hw.GetMemPort(), 0x02);
    EXPECT_EQ(hw.GetBorder(), 5);
}

TEST_F(Spectrum128Fixture, PagingLockHoldsUntilReset)
{
    hw.Out(MEM_PORT, MEM_PORT_LOCK_MASK | 0x04);
    hw.Out(MEM_PORT, 0x01);
    EXPECT_EQ(hw.GetMemPort(), MEM_PORT_LOCK_MASK | 0x04);

    spec_cpu cpu{};
    hw.Reset(cpu, true);
    hw.Out(MEM_PORT, 0x01);
    EXPECT_EQ(hw.GetMemPort(), 0x01);
}

TEST_F(Spectrum128Fixture, SoundChipRegistersReadBack)
{
    WriteAY(AY_AMPLITUDE_A, 0xff);
    hw.Out(AY_SELECT_PORT, AY_AMPLITUDE_A);
    EXPECT_EQ(hw.In(AY_SELECT_PORT), 0x1f);
}

TEST_F(Spectrum128Fixture, SoundChipOutputLastsOneFrame)
{
    ASSERT_NE(hw.SoundChip(), nullptr);

    WriteAY(AY_MIXER, 0x3f);
    WriteAY(AY_AMPLITUDE_A, 10);

    auto& steps = hw.SoundChip()->Output(0);
    ASSERT_EQ(steps.size(), 1U);
    EXPECT_EQ(steps[0].level, 10);

    spec_cpu cpu{};
    hw.ExecuteFrame(cpu);
    EXPECT_EQ(hw.SoundChip()->Output(0).size(), 1U);

    hw.BeginFrame();
    EXPECT_TRUE(hw.SoundChip()->Output(0).empty());
}

TEST(Spectrum48, NoSoundChipOrKeypad)
{
    Spectrum48 hw(Model::Spectrum48, IdleRom());
    EXPECT_EQ(hw.SoundChip(), nullptr);
    EXPECT_EQ(hw.GetKeypad(), nullptr);
}

////////////////////////////////////////////////////////////////////////////////

TEST(Keypad, IdleLinesHigh)
{
    Keypad keypad;
    EXPECT_EQ(keypad.Read(), KEYPAD_DTR_MASK | KEYPAD_TXD_MASK);
}

TEST(Keypad, ScanSendsPresenceThenKeys)
{
    Keypad keypad;
    keypad.SetKey(0, true);
    keypad.SetKey(13, true);
    keypad.SetKey(NUM_KEYPAD_KEYS, true);

    uint64_t tick = 0;
    auto bits = ReadScan(keypad, tick);

    std::vector<bool> expected(KEYPAD_FRAME_BITS, false);
    expected[0] = true;
    expected[1 + 0] = true;
    expected[1 + 13] = true;
    EXPECT_EQ(bits, expected);

    // Finished, so no bit is offered until the next request
    EXPECT_EQ(keypad.Read(), KEYPAD_DTR_MASK | KEYPAD_TXD_MASK);
}

TEST(Keypad, KeysLatchedAtScanStart)
{
    Keypad keypad;
    uint64_t tick = 0;

    keypad.Write(static_cast<uint8_t>(~KEYPAD_CTS_MASK), tick += 100);
    keypad.SetKey(2, true);
    keypad.Write(0xff, tick += 100);

    // Finish the scan already started
    for (int i = 1; i < KEYPAD_FRAME_BITS; ++i)
    {
        keypad.Write(static_cast<uint8_t>(~KEYPAD_CTS_MASK), tick += 100);
        EXPECT_TRUE(keypad.Read() & KEYPAD_TXD_MASK);
        keypad.Write(0xff, tick += 100);
    }

    auto bits = ReadScan(keypad, tick);
    EXPECT_TRUE(bits[1 + 2]);
}

TEST(Keypad, QuietLineRestartsScan)
{
    Keypad keypad;
    keypad.SetKey(19, true);
    uint64_t tick = 0;

    for (int i = 0; i < 5; ++i)
    {
        keypad.Write(static_cast<uint8_t>(~KEYPAD_CTS_MASK), tick += 100);
        keypad.Write(0xff, tick += 100);
    }

    tick += KEYPAD_RESYNC_TSTATES * 2;
    auto bits = ReadScan(keypad, tick);
    EXPECT_TRUE(bits[0]);
    EXPECT_TRUE(bits[1 + 19]);
}

TEST_F(Spectrum128Fixture, KeypadOnSoundChipPortA)
{
    ASSERT_NE(hw.GetKeypad(), nullptr);

    WriteAY(AY_PORT_A, 0xff);
    WriteAY(AY_MIXER, AY_MIXER_PORT_A_OUTPUT);

    // CTS low asks for the presence bit
    WriteAY(AY_PORT_A, 0xfe);
    EXPECT_EQ(hw.In(AY_SELECT_PORT), 0xce);

    WriteAY(AY_PORT_A, 0xff);
    EXPECT_EQ(hw.In(AY_SELECT_PORT), 0xff);
}

TEST_F(Spectrum128Fixture, KeypadIgnoresPortAWhenInput)
{
    WriteAY(AY_MIXER, 0x00);
    WriteAY(AY_PORT_A, 0xfe);

    EXPECT_EQ(hw.In(AY_SELECT_PORT) & (KEYPAD_DTR_MASK | KEYPAD_TXD_MASK), KEYPAD_DTR_MASK | KEYPAD_TXD_MASK);
}
