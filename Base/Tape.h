// Part of SimSpec - A ZX Spectrum emulator
//
// Tape.h: Tape images and the tape deck
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

#include "TapeCodec.h"

class Hardware;

// Chunked tape contents, played back as pulse lengths in T-states
class TapeMedia
{
public:
    virtual ~TapeMedia() = default;

    virtual std::string GetPath() const = 0;
    virtual bool WriteProtected() const = 0;

    virtual int ChunkCount() const = 0;
    virtual int CurrentChunk() const = 0;
    virtual bool SelectChunk(int index) = 0;
    virtual std::string ChunkInfo(int index) const = 0;

    // Nothing at a stop point or the end of the tape
    virtual std::optional<uint32_t> NextPulse() = 0;
    virtual bool AtEnd() const = 0;

    // Add a block to the end of the tape and write it out
    virtual bool AppendChunk(const std::vector<uint8_t>& data) = 0;
};

struct TapeDeleter { void operator()(libspectrum_tape* tape) { libspectrum_tape_free(tape); } };
using unique_libspectrum_tape = unique_resource<libspectrum_tape*, nullptr, TapeDeleter>;

class TapeImage final : public TapeMedia
{
public:
    static bool IsRecognised(const std::string& filepath);
    static std::unique_ptr<TapeImage> Open(const std::string& filepath);
    static std::unique_ptr<TapeImage> Create(const std::string& filepath);

    std::string GetPath() const override { return m_path; }
    bool WriteProtected() const override { return m_read_only; }

    int ChunkCount() const override;
    int CurrentChunk() const override;
    bool SelectChunk(int index) override;
    std::string ChunkInfo(int index) const override;

    std::optional<uint32_t> NextPulse() override;
    bool AtEnd() const override { return m_at_end; }
    bool AppendChunk(const std::vector<uint8_t>& data) override;

    bool Save();

    static std::string GetBlockDetails(libspectrum_tape_block* block);

private:
    TapeImage(const std::string& filepath, bool read_only);
    libspectrum_tape_block* GetBlock(int index) const;

    std::string m_path;
    bool m_read_only{ false };
    unique_libspectrum_tape m_tape;
    bool m_at_end{ false };
    bool m_stop_pending{ false };
};


enum class TapeMotion { Stopped, Playing, Recording };

class TapeDeck
{
public:
    bool Insert(const std::string& filepath);
    void Insert(std::unique_ptr<TapeMedia> media);
    void Eject();

    bool IsInserted() const { return m_media != nullptr; }
    bool IsRunning() const { return m_motion != TapeMotion::Stopped; }
    bool IsPlaying() const { return m_motion == TapeMotion::Playing; }
    bool IsRecording() const { return m_motion == TapeMotion::Recording; }
    TapeMotion Motion() const { return m_motion; }
    TapeMedia* Media() const { return m_media.get(); }

    bool Play();
    void Stop();
    bool Record();
    bool Rewind();
    bool PrevChunk();
    bool NextChunk();

    // Queue pulses on EAR input up to the end of the current frame.
    // Returns false if the tape has run out or reached a stop point.
    bool FeedEarIn(Hardware& hw);
    bool AtEnd() const { return IsInserted() && !m_next_pulse && m_media->AtEnd(); }

    // Decode MIC output pulses, returning the number of blocks written,
    // or nothing if the tape image couldn't be written and recording stopped.
    std::optional<int> RecordMicOut(const std::vector<uint32_t>& pulses);
    bool DecoderIdle() const { return m_decoder.IsIdle(); }

    std::string StatusText() const;

    unsigned int prev_probe_count{ 0 };
    bool auto_accelerate{ false };
    bool audible{ false };

private:
    bool SeekChunk(int index);

    std::unique_ptr<TapeMedia> m_media;
    TapeMotion m_motion{ TapeMotion::Stopped };
    std::optional<uint32_t> m_next_pulse;
    bool m_stop_at_frame_end{ false };
    PulseDecoder m_decoder;
};
