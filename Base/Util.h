// Part of SimSpec - A ZX Spectrum emulator
//
// Util.h: Debug tracing, and other utility tasks
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

enum class PathType { Settings, Output, Resource };

enum class MsgType { Info, Warning, Error, Fatal };

namespace Util
{
fs::path UniqueOutputPath(const std::string& ext);

// Platform code installs a handler to present messages to the user
using MessageHandler = std::function<void(MsgType, const std::string&)>;
void SetMessageHandler(MessageHandler handler);
}

void Message(MsgType type, const std::string& message);
template <typename ...Args>
void Message(MsgType type, const std::string& format, Args&& ... args)
{
    Message(type, fmt::format(format, std::forward<Args>(args)...));
}

std::string tolower(std::string str);
std::vector<std::string> split(const std::string& str, char sep);

inline std::string trim(const std::string& str)
{
    std::string s(str.c_str());
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    return s;
}

template<typename T, T invalid, typename D>
struct unique_resource
{
    unique_resource() = default;
    unique_resource(T res) : _res(res) {}
    unique_resource(const unique_resource&) = delete;
    unique_resource(unique_resource&& other) noexcept { _res = other.release(); }
    unique_resource& operator=(const unique_resource&) = delete;
    unique_resource& operator=(unique_resource&& other) noexcept { reset(other.release()); return *this; }
    ~unique_resource() { reset(); }

    const T& operator=(const T res) { reset(res); return _res; }
    operator const T& () const { return _res; }
    T* operator&() { return &_res; }
    T get() const { return _res; }

    template<typename T_ = T, typename = std::enable_if_t<std::is_pointer_v<T_>>>
    T operator->() { return _res; }

    void reset() { if (_res != invalid) { D deleter; deleter(_res); _res = invalid; } }
    void reset(T res) { reset(); _res = res; }
    T release() { T res = _res; _res = invalid; return res; }

private:
    T _res{ invalid };
};

struct FILECloser { void operator()(FILE* file) { fclose(file); } };
using unique_FILE = unique_resource<FILE*, nullptr, FILECloser>;


#ifdef _DEBUG
void TraceOutputString(const std::string& str);
template <typename ...Args>
void TraceOutputString(const std::string& format, Args&& ... args)
{
    TraceOutputString(fmt::format(format, std::forward<Args>(args)...));
}
#define TRACE ::TraceOutputString
#else
inline void TraceOutputString(const std::string&) { }
template <typename ...Args>
void TraceOutputString(const std::string&, Args&& ...) { }
#define TRACE 1 ? (void)0 : ::TraceOutputString
#endif
