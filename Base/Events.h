// Part of SimSpec - A ZX Spectrum emulator
//
// Events.h: Sorted queue of timed hardware events
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

enum class EventType
{
    None,
    FrameInterrupt, FrameInterruptEnd,
    TapeEdge,
};

struct CPU_EVENT
{
    EventType type{ EventType::None };
    uint32_t due_time{ 0 };
    CPU_EVENT* next_ptr{ nullptr };
};

constexpr auto MAX_EVENTS = 16;

// Fixed pool of events, kept in due time order.  Each machine owns one.
class EventQueue
{
public:
    EventQueue() { Clear(); }
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void Clear();
    void AddEvent(EventType type, uint32_t due_time);
    void CancelEvent(EventType type);
    void FrameEnd(uint32_t elapsed_time);

    // Remove and return the next event due at or before the given time
    bool PopDue(uint32_t frame_cycles, CPU_EVENT& event)
    {
        if (!head_ptr || frame_cycles < head_ptr->due_time)
            return false;

        event = *head_ptr;
        head_ptr->next_ptr = free_head_ptr;
        free_head_ptr = head_ptr;
        head_ptr = event.next_ptr;
        return true;
    }

private:
    std::array<CPU_EVENT, MAX_EVENTS> events{};
    CPU_EVENT* head_ptr{ nullptr };
    CPU_EVENT* free_head_ptr{ nullptr };
};
