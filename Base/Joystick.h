// Part of SimSpec - A ZX Spectrum emulator
//
// Joystick.h: Joystick interfaces attached to the Spectrum bus
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

enum class JoystickType { None, Kempston, Fuller, SinclairRight, SinclairLeft, Cursor };
enum eHostJoy { HJ_CENTRE = 0, HJ_LEFT = 1, HJ_RIGHT = 2, HJ_UP = 4, HJ_DOWN = 8, HJ_FIRE = 16 };

constexpr uint8_t KEMPSTON_PORT = 0x1f;
constexpr uint8_t FULLER_PORT = 0x7f;

std::optional<JoystickType> ParseJoystickType(const std::string& name);

class JoystickPort
{
public:
    JoystickType Type() const { return m_type; }
    void SetType(JoystickType type);

    // Name shown in the status line, and sub-index for multi-port interfaces
    std::string Name() const;
    int SubIndex() const;

    void SetPosition(int position);
    void SetX(int position);
    void SetY(int position);
    void SetFire(bool pressed);
    int GetState() const { return m_position | (m_fire ? HJ_FIRE : 0); }

    // Port-based interfaces
    std::optional<uint8_t> In(uint16_t port) const;

    // Interfaces wired to the keyboard matrix clear bits in the half-row
    uint8_t KeyRowMask(int row) const;

private:
    JoystickType m_type{ JoystickType::None };
    int m_position{ HJ_CENTRE };
    bool m_fire{ false };
};
