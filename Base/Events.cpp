// Part of SimSpec - A ZX Spectrum emulator
//
// Events.cpp: Sorted queue of timed hardware events
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
#include "Events.h"

void EventQueue::Clear()
{
    for (size_t i = 0; i < events.size() - 1; ++i)
        events[i].next_ptr = &events[i + 1];
    events.back().next_ptr = nullptr;

    free_head_ptr = events.data();
    head_ptr = nullptr;
}

void EventQueue::AddEvent(EventType type, uint32_t due_time)
{
    if (!free_head_ptr)
    {
        TRACE("Event pool exhausted, dropping event {}\n", static_cast<int>(type));
        return;
    }

    auto psNextFree = free_head_ptr->next_ptr;
    auto ppsEvent = &head_ptr;

    while (*ppsEvent && (*ppsEvent)->due_time <= due_time)
        ppsEvent = &((*ppsEvent)->next_ptr);

    free_head_ptr->type = type;
    free_head_ptr->due_time = due_time;

    free_head_ptr->next_ptr = *ppsEvent;
    *ppsEvent = free_head_ptr;
    free_head_ptr = psNextFree;
}

void EventQueue::CancelEvent(EventType type)
{
    auto event_ptr = &head_ptr;

    while (*event_ptr)
    {
        if ((*event_ptr)->type != type)
        {
            event_ptr = &((*event_ptr)->next_ptr);
        }
        else
        {
            auto next_ptr = (*event_ptr)->next_ptr;
            (*event_ptr)->next_ptr = free_head_ptr;
            free_head_ptr = *event_ptr;
            *event_ptr = next_ptr;
        }
    }
}

void EventQueue::FrameEnd(uint32_t elapsed_time)
{
    for (auto event_ptr = head_ptr; event_ptr; event_ptr = event_ptr->next_ptr)
        event_ptr->due_time -= elapsed_time;
}
