// Part of SimSpec - A ZX Spectrum emulator
//
// Input.cpp: SDL keyboard and game controller input
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
//  The Spectrum matrix is rebuilt from the set of host keys held down each
//  time one changes, so combination keys sharing CAPS SHIFT release cleanly.
//
//  Host shift is CAPS SHIFT and left ctrl is SYMBOL SHIFT.  The cursor keys
//  and right ctrl drive the selected joystick, or the Spectrum cursor keys
//  when there isn't one.

#include "SimSpec.h"
#include "Input.h"

#include "Actions.h"
#include "Joystick.h"
#include "Main.h"
#include "Session.h"
#include "Spectrum128.h"
#include "Video.h"

struct MatrixKey
{
    int row;
    int bit;
};

constexpr MatrixKey CAPS_SHIFT{ 0, 0 };
constexpr MatrixKey SYMBOL_SHIFT{ 7, 1 };

static unique_sdl_controller controller;
static std::set<SDL_Keycode> held_keys;

static const std::map<SDL_Keycode, MatrixKey> key_matrix =
{
    { SDLK_z, { 0, 1 } }, { SDLK_x, { 0, 2 } }, { SDLK_c, { 0, 3 } }, { SDLK_v, { 0, 4 } },
    { SDLK_a, { 1, 0 } }, { SDLK_s, { 1, 1 } }, { SDLK_d, { 1, 2 } }, { SDLK_f, { 1, 3 } }, { SDLK_g, { 1, 4 } },
    { SDLK_q, { 2, 0 } }, { SDLK_w, { 2, 1 } }, { SDLK_e, { 2, 2 } }, { SDLK_r, { 2, 3 } }, { SDLK_t, { 2, 4 } },
    { SDLK_1, { 3, 0 } }, { SDLK_2, { 3, 1 } }, { SDLK_3, { 3, 2 } }, { SDLK_4, { 3, 3 } }, { SDLK_5, { 3, 4 } },
    { SDLK_0, { 4, 0 } }, { SDLK_9, { 4, 1 } }, { SDLK_8, { 4, 2 } }, { SDLK_7, { 4, 3 } }, { SDLK_6, { 4, 4 } },
    { SDLK_p, { 5, 0 } }, { SDLK_o, { 5, 1 } }, { SDLK_i, { 5, 2 } }, { SDLK_u, { 5, 3 } }, { SDLK_y, { 5, 4 } },
    { SDLK_RETURN, { 6, 0 } }, { SDLK_l, { 6, 1 } }, { SDLK_k, { 6, 2 } }, { SDLK_j, { 6, 3 } }, { SDLK_h, { 6, 4 } },
    { SDLK_SPACE, { 7, 0 } }, { SDLK_m, { 7, 2 } }, { SDLK_n, { 7, 3 } }, { SDLK_b, { 7, 4 } },

    { SDLK_LSHIFT, CAPS_SHIFT }, { SDLK_RSHIFT, CAPS_SHIFT },
    { SDLK_LCTRL, SYMBOL_SHIFT },
};

// Keys that type CAPS SHIFT with a number
static const std::map<SDL_Keycode, MatrixKey> caps_combos =
{
    { SDLK_BACKSPACE, { 4, 0 } },   // DELETE
    { SDLK_LEFT, { 3, 4 } },        // 5
    { SDLK_DOWN, { 4, 4 } },        // 6
    { SDLK_UP, { 4, 3 } },          // 7
    { SDLK_RIGHT, { 4, 2 } },       // 8
};

// Keypad positions on the 128K serial keypad
static const std::map<SDL_Keycode, int> keypad_keys =
{
    { SDLK_KP_0, 0 }, { SDLK_KP_1, 1 }, { SDLK_KP_2, 2 }, { SDLK_KP_3, 3 }, { SDLK_KP_4, 4 },
    { SDLK_KP_5, 5 }, { SDLK_KP_6, 6 }, { SDLK_KP_7, 7 }, { SDLK_KP_8, 8 }, { SDLK_KP_9, 9 },
    { SDLK_KP_PERIOD, 10 }, { SDLK_KP_ENTER, 11 }, { SDLK_KP_PLUS, 12 }, { SDLK_KP_MINUS, 13 },
    { SDLK_KP_MULTIPLY, 14 }, { SDLK_KP_DIVIDE, 15 }, { SDLK_NUMLOCKCLEAR, 16 },
};

static bool JoystickSelected(Hardware& hw)
{
    auto joystick = hw.Joystick();
    return joystick && joystick->Type() != JoystickType::None;
}

static void UpdateJoystickFromKeys(JoystickPort& joystick)
{
    auto held = [](SDL_Keycode key) { return held_keys.count(key) != 0; };

    joystick.SetX((held(SDLK_LEFT) ? HJ_LEFT : 0) | (held(SDLK_RIGHT) ? HJ_RIGHT : 0));
    joystick.SetY((held(SDLK_UP) ? HJ_UP : 0) | (held(SDLK_DOWN) ? HJ_DOWN : 0));
    joystick.SetFire(held(SDLK_RCTRL));
}

static void UpdateMatrix()
{
    auto& hw = Main::CurrentSession().GetHardware();
    bool use_joystick = JoystickSelected(hw);

    hw.ReleaseAllKeys();

    for (auto key : held_keys)
    {
        if (auto it = key_matrix.find(key); it != key_matrix.end())
        {
            hw.SetKey(it->second.row, it->second.bit, true);
        }
        else if (key == SDLK_RCTRL && !use_joystick)
        {
            hw.SetKey(SYMBOL_SHIFT.row, SYMBOL_SHIFT.bit, true);
        }
        else if (auto it_combo = caps_combos.find(key); it_combo != caps_combos.end())
        {
            if (use_joystick && key != SDLK_BACKSPACE)
                continue;

            hw.SetKey(CAPS_SHIFT.row, CAPS_SHIFT.bit, true);
            hw.SetKey(it_combo->second.row, it_combo->second.bit, true);
        }
    }
}

static bool KeypadKey(SDL_Keycode key, bool pressed)
{
    auto it = keypad_keys.find(key);
    if (it == keypad_keys.end())
        return false;

    if (auto keypad = Main::CurrentSession().GetHardware().GetKeypad())
        keypad->SetKey(it->second, pressed);

    return true;
}

static void OpenController(int index)
{
    if (controller || !SDL_IsGameController(index))
        return;

    controller = SDL_GameControllerOpen(index);
    if (controller)
        TRACE("Opened game controller {}\n", index);
}

////////////////////////////////////////////////////////////////////////////////

bool Input::Init()
{
    Exit();

    for (int i = 0; i < SDL_NumJoysticks(); i++)
        OpenController(i);

    return true;
}

void Input::Exit()
{
    controller.reset();
    held_keys.clear();
}

// Release everything held
void Input::Purge()
{
    SDL_Event event;
    while (SDL_PeepEvents(&event, 1, SDL_GETEVENT, SDL_KEYDOWN, SDL_KEYUP));

    held_keys.clear();
    SDL_SetModState(KMOD_NONE);

    auto& hw = Main::CurrentSession().GetHardware();
    hw.ReleaseAllKeys();

    if (auto keypad = hw.GetKeypad())
        keypad->ReleaseAll();

    if (auto joystick = hw.Joystick())
    {
        joystick->SetPosition(HJ_CENTRE);
        joystick->SetFire(false);
    }
}


// Process SDL event messages
bool Input::FilterEvent(SDL_Event* pEvent_)
{
    switch (pEvent_->type)
    {
    case SDL_KEYDOWN:
    case SDL_KEYUP:
    {
        SDL_KeyboardEvent* pEvent = &pEvent_->key;
        SDL_Keysym* pKey = &pEvent->keysym;

        bool fPress = pEvent->type == SDL_KEYDOWN;

        // Ignore key repeats
        if (pEvent->repeat)
            break;

        TRACE("SDL_KEY{} ({:x})\n", fPress ? "DOWN" : "UP", pKey->sym);

        bool fCtrl = !!(pKey->mod & KMOD_CTRL);
        bool fAlt = !!(pKey->mod & KMOD_ALT);
        bool fShift = !!(pKey->mod & KMOD_SHIFT);

        if (pKey->sym >= SDLK_F1 && pKey->sym <= SDLK_F12)
        {
            Actions::Key(pKey->sym - SDLK_F1 + 1, fPress, fCtrl, fAlt, fShift);
            break;
        }

        auto& session = Main::CurrentSession();

        // Unpause on key press if paused, so the user doesn't think we've hung
        if (fPress && session.IsPaused())
            session.SetPaused(false);

        if (pKey->sym == SDLK_RETURN && fAlt)
        {
            if (fPress)
                Video::ToggleFullscreen();
            break;
        }

        if (KeypadKey(pKey->sym, fPress))
            break;

        if (fPress)
            held_keys.insert(pKey->sym);
        else
            held_keys.erase(pKey->sym);

        UpdateMatrix();

        switch (pKey->sym)
        {
        case SDLK_LEFT: case SDLK_RIGHT: case SDLK_UP: case SDLK_DOWN: case SDLK_RCTRL:
            if (JoystickSelected(session.GetHardware()))
                UpdateJoystickFromKeys(*session.GetHardware().Joystick());
            break;
        }
        break;
    }

    case SDL_CONTROLLERDEVICEADDED:
        OpenController(pEvent_->cdevice.which);
        break;

    case SDL_CONTROLLERDEVICEREMOVED:
        if (controller && SDL_JoystickInstanceID(SDL_GameControllerGetJoystick(controller)) == pEvent_->cdevice.which)
            controller.reset();
        break;

    case SDL_CONTROLLERAXISMOTION:
    {
        auto joystick = Main::CurrentSession().GetHardware().Joystick();
        if (!joystick)
            break;

        auto p = &pEvent_->caxis;
        auto position = (p->value < -CONTROLLER_DEADZONE) ? -1 : (p->value > CONTROLLER_DEADZONE) ? 1 : 0;

        if (p->axis == SDL_CONTROLLER_AXIS_LEFTX)
            joystick->SetX((position < 0) ? HJ_LEFT : (position > 0) ? HJ_RIGHT : HJ_CENTRE);
        else if (p->axis == SDL_CONTROLLER_AXIS_LEFTY)
            joystick->SetY((position < 0) ? HJ_UP : (position > 0) ? HJ_DOWN : HJ_CENTRE);
        break;
    }

    case SDL_CONTROLLERBUTTONDOWN:
    case SDL_CONTROLLERBUTTONUP:
    {
        auto joystick = Main::CurrentSession().GetHardware().Joystick();
        if (!joystick)
            break;

        auto p = &pEvent_->cbutton;
        bool pressed = p->state == SDL_PRESSED;

        switch (p->button)
        {
        case SDL_CONTROLLER_BUTTON_DPAD_LEFT:  joystick->SetX(pressed ? HJ_LEFT : HJ_CENTRE); break;
        case SDL_CONTROLLER_BUTTON_DPAD_RIGHT: joystick->SetX(pressed ? HJ_RIGHT : HJ_CENTRE); break;
        case SDL_CONTROLLER_BUTTON_DPAD_UP:    joystick->SetY(pressed ? HJ_UP : HJ_CENTRE); break;
        case SDL_CONTROLLER_BUTTON_DPAD_DOWN:  joystick->SetY(pressed ? HJ_DOWN : HJ_CENTRE); break;
        default:                               joystick->SetFire(pressed); break;
        }
        break;
    }

    default:
        return false;
    }

    return true;
}
