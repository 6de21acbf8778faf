// Part of SimSpec - A ZX Spectrum emulator
//
// Stream.cpp: Data stream abstraction classes
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
//  Tape and ROM images may be plain files or gzip-compressed.  Compressed
//  images are always read-only, as nothing is written back to them.

#include "SimSpec.h"
#include "Stream.h"

Stream::Stream(const std::string& filepath, bool read_only)
    : m_path(filepath), m_read_only(read_only)
{
}

std::unique_ptr<Stream> Stream::Open(const std::string& filepath, bool read_only)
{
    if (filepath.empty())
        return nullptr;

    // Try read-write first, falling back to read-only
    unique_FILE file = fopen(filepath.c_str(), "r+b");
    read_only |= !file;
    file.reset();

    if (!(file = fopen(filepath.c_str(), "rb")))
        return nullptr;

    std::array<uint8_t, 2> sig{};
    if (fread(sig.data(), 1, sig.size(), file) != sig.size() || sig != GZ_SIGNATURE)
    {
        rewind(file);
        return std::make_unique<FileStream>(std::move(file), filepath, read_only);
    }

    file.reset();

    if (auto gz_file = gzopen(filepath.c_str(), "rb"))
        return std::make_unique<ZLibStream>(gz_file, filepath);

    return nullptr;
}

std::vector<uint8_t> Stream::ReadAll()
{
    std::vector<uint8_t> data;
    std::array<uint8_t, 16384> buf;

    if (!Rewind())
        return data;

    for (size_t len; (len = Read(buf.data(), buf.size())) > 0; )
        data.insert(data.end(), buf.begin(), buf.begin() + len);

    return data;
}

////////////////////////////////////////////////////////////////////////////////

FileStream::FileStream(unique_FILE&& file, const std::string& filepath, bool read_only)
    : Stream(filepath, read_only), m_file(std::move(file))
{
}

bool FileStream::Rewind()
{
    return m_file && fseek(m_file, 0, SEEK_SET) == 0;
}

size_t FileStream::Read(void* buffer, size_t len)
{
    return (m_file && len) ? fread(buffer, 1, len, m_file) : 0U;
}

////////////////////////////////////////////////////////////////////////////////

ZLibStream::ZLibStream(gzFile file, const std::string& filepath)
    : Stream(filepath, true), m_file(file)
{
}

bool ZLibStream::Rewind()
{
    return m_file && gzrewind(m_file) == 0;
}

size_t ZLibStream::Read(void* buffer, size_t len)
{
    auto avail = m_file ? gzread(m_file, buffer, static_cast<unsigned>(len)) : 0;
    return (avail < 0) ? 0U : static_cast<size_t>(avail);
}
