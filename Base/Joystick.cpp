// Part of SimSpec - A ZX Spectrum emulator
//
// Joystick.cpp: Joystick interfaces attached to the Spectrum bus
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
//  Kempston reads active-high on port 0x1f, Fuller active-low on port 0x7f.
//  Sinclair and Cursor interfaces appear as keys on the matrix:
//    Sinclair right: 6=left 7=right 8=down 9=up 0=fire
//    Sinclair left:  1=left 2=right 3=down 4=up 5=fire
//    Cursor:         5=left 6=down 7=up 8=right 0=fire

#include "SimSpec.h"
#include "Joystick.h"

std::optional<JoystickType> ParseJoystickType(const std::string& name)
{
    auto str = tolower(trim(name));

    if (str == "n" || str == "0") return JoystickType::None;
    if (str == "k" || str == "1") return JoystickType::Kempston;
    if (str == "f" || str == "2") return JoystickType::Fuller;
    if (str == "s1" || str == "3") return JoystickType::SinclairRight;
    if (str == "s2" || str == "4") return JoystickType::SinclairLeft;
    if (str == "c" || str == "5") return JoystickType::Cursor;

    return std::nullopt;
}

void JoystickPort::SetType(JoystickType type)
{
    m_type = type;
    m_position = HJ_CENTRE;
    m_fire = false;
}

std::string JoystickPort::Name() const
{
    switch (m_type)
    {
    case JoystickType::Kempston: return "Kempston";
    case JoystickType::Fuller: return "Fuller";
    case JoystickType::SinclairRight:
    case JoystickType::SinclairLeft: return "Sinclair";
    case JoystickType::Cursor: return "Cursor";
    case JoystickType::None: break;
    }

    return "";
}

int JoystickPort::SubIndex() const
{
    return (m_type == JoystickType::SinclairLeft) ? 1 : 0;
}


void JoystickPort::SetX(int position)
{
    int nLeftRight = HJ_LEFT | HJ_RIGHT;

    // Opposite directions cancel each other out
    if (!(~position & nLeftRight))
        position &= ~nLeftRight;

    (m_position &= ~nLeftRight) |= (position & nLeftRight);
}

void JoystickPort::SetY(int position)
{
    int nUpDown = HJ_UP | HJ_DOWN;

    if (!(~position & nUpDown))
        position &= ~nUpDown;

    (m_position &= ~nUpDown) |= (position & nUpDown);
}

void JoystickPort::SetPosition(int position)
{
    SetX(position);
    SetY(position);
}

void JoystickPort::SetFire(bool pressed)
{
    m_fire = pressed;
}


std::optional<uint8_t> JoystickPort::In(uint16_t port) const
{
    uint8_t ret = 0;

    if (m_type == JoystickType::Kempston && (port & 0xff) == KEMPSTON_PORT)
    {
        if (m_position & HJ_RIGHT) ret |= 1;
        if (m_position & HJ_LEFT)  ret |= 2;
        if (m_position & HJ_DOWN)  ret |= 4;
        if (m_position & HJ_UP)    ret |= 8;
        if (m_fire)                ret |= 16;
        return ret;
    }

    if (m_type == JoystickType::Fuller && (port & 0xff) == FULLER_PORT)
    {
        if (m_position & HJ_UP)    ret |= 1;
        if (m_position & HJ_DOWN)  ret |= 2;
        if (m_position & HJ_LEFT)  ret |= 4;
        if (m_position & HJ_RIGHT) ret |= 8;
        if (m_fire)                ret |= 0x80;
        return static_cast<uint8_t>(~ret);
    }

    return std::nullopt;
}

uint8_t JoystickPort::KeyRowMask(int row) const
{
    uint8_t mask = 0;

    switch (m_type)
    {
    case JoystickType::SinclairRight:
        if (row == 4)
        {
            if (m_fire)                mask |= 1;
            if (m_position & HJ_UP)    mask |= 2;
            if (m_position & HJ_DOWN)  mask |= 4;
            if (m_position & HJ_RIGHT) mask |= 8;
            if (m_position & HJ_LEFT)  mask |= 16;
        }
        break;

    case JoystickType::SinclairLeft:
        if (row == 3)
        {
            if (m_position & HJ_LEFT)  mask |= 1;
            if (m_position & HJ_RIGHT) mask |= 2;
            if (m_position & HJ_DOWN)  mask |= 4;
            if (m_position & HJ_UP)    mask |= 8;
            if (m_fire)                mask |= 16;
        }
        break;

    case JoystickType::Cursor:
        if (row == 3)
        {
            if (m_position & HJ_LEFT)  mask |= 16;
        }
        else if (row == 4)
        {
            if (m_fire)                mask |= 1;
            if (m_position & HJ_RIGHT) mask |= 4;
            if (m_position & HJ_UP)    mask |= 8;
            if (m_position & HJ_DOWN)  mask |= 16;
        }
        break;

    default:
        break;
    }

    return mask;
}
