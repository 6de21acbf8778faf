// Part of SimSpec - A ZX Spectrum emulator
//
// Stream.h: Data stream abstraction classes
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

// Read-only source for tape and ROM images, transparently decompressing gzip
class Stream
{
public:
    Stream(const std::string& filepath, bool read_only);
    virtual ~Stream() = default;

    static std::unique_ptr<Stream> Open(const std::string& filepath, bool read_only = false);

    // True if the file couldn't be opened for writing, or is compressed
    bool WriteProtected() const { return m_read_only; }
    std::string GetPath() const { return m_path; }

    virtual bool Rewind() = 0;
    virtual size_t Read(void* buffer, size_t len) = 0;

    std::vector<uint8_t> ReadAll();

protected:
    std::string m_path;
    bool m_read_only{ false };
};

class FileStream final : public Stream
{
public:
    FileStream(unique_FILE&& file, const std::string& filepath, bool read_only);

    bool Rewind() override;
    size_t Read(void* buffer, size_t len) override;

private:
    unique_FILE m_file;
};

const std::array<uint8_t, 2> GZ_SIGNATURE{ 0x1f, 0x8b };

struct gzFileCloser { void operator()(gzFile file) { gzclose(file); } };
using unique_gzFile = unique_resource<gzFile, nullptr, gzFileCloser>;

class ZLibStream final : public Stream
{
public:
    ZLibStream(gzFile file, const std::string& filepath);

    bool Rewind() override;
    size_t Read(void* buffer, size_t len) override;

private:
    unique_gzFile m_file;
};
