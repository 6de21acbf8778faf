// Part of SimSpec - A ZX Spectrum emulator
//
// Util.cpp: Debug tracing, and other utility tasks
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
#include "Util.h"

#include "Options.h"

namespace Util
{
static MessageHandler message_handler;

void SetMessageHandler(MessageHandler handler)
{
    message_handler = std::move(handler);
}

fs::path UniqueOutputPath(const std::string& ext)
{
    auto output_path = OSD::MakeFilePath(PathType::Output);

    for (;;)
    {
        auto path = output_path / fmt::format("spec{:04}.{}", GetOption(nextfile), ext);
        SetOption(nextfile, GetOption(nextfile) + 1);

        if (!fs::exists(path))
        {
            return path;
        }
    }
}

} // namespace Util

//////////////////////////////////////////////////////////////////////////////

void Message(MsgType type, const std::string& message)
{
    TRACE("{}\n", message);

    if (Util::message_handler)
        Util::message_handler(type, message);
    else if (type != MsgType::Info)
        OSD::DebugTrace(message + "\n");

    if (type == MsgType::Fatal)
        exit(1);
}


std::string tolower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
        [](uint8_t ch) { return std::tolower(ch); });

    return str;
}

std::vector<std::string> split(const std::string& str, char sep)
{
    std::vector<std::string> strings;
    std::istringstream ss(str);
    std::string s;
    while (getline(ss, s, sep))
    {
        strings.push_back(std::move(s));
    }
    return strings;
}

////////////////////////////////////////////////////////////////////////////////

#ifdef _DEBUG

static std::string TimeString()
{
    using namespace std::chrono;

    static std::optional<steady_clock::time_point> start_time;
    auto now = steady_clock::now();
    if (!start_time)
        start_time = now;
    auto elapsed = duration_cast<milliseconds>(now - *start_time).count();

    auto ms = elapsed % 1000;
    auto secs = (elapsed /= 1000) % 60;
    auto mins = (elapsed /= 60) % 100;

    return fmt::format("{:02}:{:02}.{:03}", mins, secs, ms);
}

void TraceOutputString(const std::string& str)
{
    OSD::DebugTrace(fmt::format("{} {}", TimeString(), str));
}
#endif  // _DEBUG
