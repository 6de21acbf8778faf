// Part of SimSpec - A ZX Spectrum emulator
//
// Carousel.h: Frame handoff between the emulation and the audio device
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
//  Single producer (the frame loop) and single consumer (the audio callback).
//  Neither side waits: a full carousel drops the new frame, and an empty one
//  plays silence.  Clear() must only be called while the consumer is stopped.

#pragma once

template <typename T>
class AudioCarousel
{
public:
    explicit AudioCarousel(size_t latency_frames)
        : m_slots(std::max<size_t>(latency_frames, 1) + 1)
    {
    }

    AudioCarousel(const AudioCarousel&) = delete;
    void operator= (const AudioCarousel&) = delete;

    size_t Capacity() const { return m_slots.size() - 1; }
    size_t QueuedFrames() const { return m_tail.load() - m_head.load(); }
    uint64_t DroppedFrames() const { return m_dropped.load(); }

    // Producer side.  Returns false if the frame was dropped.
    bool PushFrame(std::vector<T>&& frame)
    {
        auto tail = m_tail.load(std::memory_order_relaxed);
        if (tail - m_head.load(std::memory_order_acquire) >= Capacity())
        {
            m_dropped++;
            return false;
        }

        m_slots[tail % m_slots.size()].swap(frame);
        m_tail.store(tail + 1, std::memory_order_release);
        return true;
    }

    // Consumer side: copy out queued samples, padding with silence
    void Fill(T* out, size_t count)
    {
        while (count)
        {
            auto head = m_head.load(std::memory_order_relaxed);
            if (head == m_tail.load(std::memory_order_acquire))
            {
                std::fill(out, out + count, T{});
                return;
            }

            auto& slot = m_slots[head % m_slots.size()];
            auto len = std::min(count, slot.size() - m_offset);
            std::copy_n(slot.data() + m_offset, len, out);

            out += len;
            count -= len;
            m_offset += len;

            if (m_offset >= slot.size())
            {
                m_offset = 0;
                m_head.store(head + 1, std::memory_order_release);
            }
        }
    }

    void Clear()
    {
        m_head.store(m_tail.load());
        m_offset = 0;
    }

private:
    std::vector<std::vector<T>> m_slots;
    std::atomic<size_t> m_head{ 0 };
    std::atomic<size_t> m_tail{ 0 };
    std::atomic<uint64_t> m_dropped{ 0 };
    size_t m_offset{ 0 };   // consumer position within the head slot
};
