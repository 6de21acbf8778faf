// Part of SimSpec - A ZX Spectrum emulator
//
// CarouselTests.cpp: Audio frame handoff between emulation and output
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

#include "Carousel.h"

TEST(AudioCarousel, FullCarouselDropsNewFrames)
{
    AudioCarousel<int16_t> carousel(2);
    EXPECT_EQ(carousel.Capacity(), 2U);

    EXPECT_TRUE(carousel.PushFrame({ 1, 1 }));
    EXPECT_TRUE(carousel.PushFrame({ 2, 2 }));
    EXPECT_FALSE(carousel.PushFrame({ 3, 3 }));
    EXPECT_EQ(carousel.QueuedFrames(), 2U);
    EXPECT_EQ(carousel.DroppedFrames(), 1U);

    std::vector<int16_t> out(4);
    carousel.Fill(out.data(), out.size());
    EXPECT_EQ(out, (std::vector<int16_t>{ 1, 1, 2, 2 }));
}

TEST(AudioCarousel, UnderrunPlaysSilence)
{
    AudioCarousel<int16_t> carousel(2);
    carousel.PushFrame({ 5, 6, 7 });

    std::vector<int16_t> out(6, -1);
    carousel.Fill(out.data(), out.size());
    EXPECT_EQ(out, (std::vector<int16_t>{ 5, 6, 7, 0, 0, 0 }));
    EXPECT_EQ(carousel.QueuedFrames(), 0U);
}

TEST(AudioCarousel, PartialReadsSpanFrames)
{
    AudioCarousel<int16_t> carousel(3);
    carousel.PushFrame({ 1, 2, 3 });
    carousel.PushFrame({ 4, 5, 6 });

    std::vector<int16_t> out(2);
    carousel.Fill(out.data(), out.size());
    EXPECT_EQ(out, (std::vector<int16_t>{ 1, 2 }));
    EXPECT_EQ(carousel.QueuedFrames(), 2U);

    carousel.Fill(out.data(), out.size());
    EXPECT_EQ(out, (std::vector<int16_t>{ 3, 4 }));
    EXPECT_EQ(carousel.QueuedFrames(), 1U);
}

TEST(AudioCarousel, ClearDiscardsQueued)
{
    AudioCarousel<int16_t> carousel(2);
    carousel.PushFrame({ 1, 2 });
    carousel.PushFrame({ 3, 4 });
    carousel.Clear();

    EXPECT_EQ(carousel.QueuedFrames(), 0U);

    std::vector<int16_t> out(2, -1);
    carousel.Fill(out.data(), out.size());
    EXPECT_EQ(out, (std::vector<int16_t>{ 0, 0 }));

    EXPECT_TRUE(carousel.PushFrame({ 9 }));
}

TEST(AudioCarousel, MinimumOneFrame)
{
    AudioCarousel<int16_t> carousel(0);
    EXPECT_EQ(carousel.Capacity(), 1U);
}

TEST(AudioCarousel, ProducerAndConsumerThreads)
{
    constexpr int FRAMES = 2000;
    constexpr int FRAME_SAMPLES = 16;

    AudioCarousel<int16_t> carousel(4);
    std::atomic<bool> done{ false };
    std::vector<int16_t> received;

    std::thread consumer([&]
    {
        std::vector<int16_t> out(FRAME_SAMPLES);
        while (!done || carousel.QueuedFrames())
        {
            carousel.Fill(out.data(), out.size());
            for (auto s : out)
            {
                if (s)
                    received.push_back(s);
            }
        }
    });

    int pushed = 0;
    for (int i = 1; i <= FRAMES; ++i)
    {
        if (carousel.PushFrame(std::vector<int16_t>(FRAME_SAMPLES, static_cast<int16_t>(i))))
            pushed++;
        else
            std::this_thread::yield();
    }

    done = true;
    consumer.join();

    // Frames arrive whole and in order, whatever was dropped
    EXPECT_EQ(received.size(), static_cast<size_t>(pushed) * FRAME_SAMPLES);
    EXPECT_TRUE(std::is_sorted(received.begin(), received.end()));
    EXPECT_EQ(static_cast<uint64_t>(FRAMES - pushed), carousel.DroppedFrames());
}
