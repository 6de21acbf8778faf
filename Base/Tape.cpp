// Part of SimSpec - A ZX Spectrum emulator
//
// Tape.cpp: Tape images and the tape deck
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
//  Any image libspectrum understands can be played, but only TAP images are
//  written back.  Other formats are treated as write-protected so recording
//  never replaces them.
//
//  Edge levels forced by the image are ignored; every edge toggles EAR.
//
//  A stop block in the image stops the deck once the pulses before it have
//  been fed.  Play continues from the following block.

#include "SimSpec.h"
#include "Tape.h"

#include "Hardware.h"
#include "Stream.h"

// Return whether the supplied filename appears to be a tape image
bool TapeImage::IsRecognised(const std::string& filepath)
{
    libspectrum_id_t type = LIBSPECTRUM_ID_UNKNOWN;

    if (libspectrum_identify_file(&type, filepath.c_str(), nullptr, 0) == LIBSPECTRUM_ERROR_NONE)
    {
        switch (type)
        {
        case LIBSPECTRUM_ID_TAPE_TAP:
        case LIBSPECTRUM_ID_TAPE_TZX:
        case LIBSPECTRUM_ID_TAPE_WAV:
        case LIBSPECTRUM_ID_TAPE_CSW:
        case LIBSPECTRUM_ID_TAPE_PZX:
            return true;
        default:
            return false;
        }
    }

    return false;
}

TapeImage::TapeImage(const std::string& filepath, bool read_only)
    : m_path(filepath), m_read_only(read_only)
{
}

std::unique_ptr<TapeImage> TapeImage::Create(const std::string& filepath)
{
    auto image = std::unique_ptr<TapeImage>(new TapeImage(filepath, false));
    image->m_tape = libspectrum_tape_alloc();
    if (!image->m_tape.get())
        return nullptr;

    return image;
}

std::unique_ptr<TapeImage> TapeImage::Open(const std::string& filepath)
{
    auto stream = Stream::Open(filepath);
    if (!stream)
        return nullptr;

    auto data = stream->ReadAll();

    // Identify using the name of the uncompressed contents
    auto name = fs::path(filepath);
    if (tolower(name.extension().string()) == ".gz")
        name.replace_extension();

    // An empty file is a blank tape, writable only if it's a plain TAP
    if (data.empty())
    {
        auto is_tap = name == fs::path(filepath) && tolower(name.extension().string()) == ".tap";
        auto image = std::unique_ptr<TapeImage>(new TapeImage(filepath, stream->WriteProtected() || !is_tap));
        image->m_tape = libspectrum_tape_alloc();
        if (!image->m_tape.get())
            return nullptr;

        return image;
    }

    libspectrum_id_t type = LIBSPECTRUM_ID_UNKNOWN;
    if (libspectrum_identify_file(&type, name.string().c_str(), data.data(), data.size()) != LIBSPECTRUM_ERROR_NONE)
        type = LIBSPECTRUM_ID_UNKNOWN;

    auto read_only = stream->WriteProtected() || name != fs::path(filepath) || type != LIBSPECTRUM_ID_TAPE_TAP;
    auto image = std::unique_ptr<TapeImage>(new TapeImage(filepath, read_only));

    image->m_tape = libspectrum_tape_alloc();
    if (!image->m_tape.get() ||
        libspectrum_tape_read(image->m_tape, data.data(), data.size(), type, name.string().c_str()) != LIBSPECTRUM_ERROR_NONE)
    {
        return nullptr;
    }

    return image;
}

libspectrum_tape_block* TapeImage::GetBlock(int index) const
{
    libspectrum_tape_iterator it;
    auto block = libspectrum_tape_iterator_init(&it, m_tape.get());

    while (block && index-- > 0)
        block = libspectrum_tape_iterator_next(&it);

    return block;
}

int TapeImage::ChunkCount() const
{
    int count = 0;

    libspectrum_tape_iterator it;
    for (auto block = libspectrum_tape_iterator_init(&it, m_tape.get()); block; block = libspectrum_tape_iterator_next(&it))
        count++;

    return count;
}

int TapeImage::CurrentChunk() const
{
    if (m_at_end)
        return ChunkCount();

    int n = 0;
    if (!libspectrum_tape_present(m_tape.get()) ||
        libspectrum_tape_position(&n, m_tape.get()) != LIBSPECTRUM_ERROR_NONE)
    {
        return 0;
    }

    return n;
}

bool TapeImage::SelectChunk(int index)
{
    if (index < 0 || index >= ChunkCount())
        return false;

    if (libspectrum_tape_nth_block(m_tape, index) != LIBSPECTRUM_ERROR_NONE)
        return false;

    m_at_end = m_stop_pending = false;
    return true;
}

std::string TapeImage::ChunkInfo(int index) const
{
    auto block = GetBlock(index);
    return block ? GetBlockDetails(block) : "";
}

std::optional<uint32_t> TapeImage::NextPulse()
{
    if (m_stop_pending)
    {
        m_stop_pending = false;
        return std::nullopt;
    }

    if (m_at_end || !libspectrum_tape_present(m_tape))
        return std::nullopt;

    uint32_t pulse = 0;

    for (;;)
    {
        libspectrum_dword tstates;
        int flags;

        // Fetch details of the next edge, and the time until it's due
        if (libspectrum_tape_get_next_edge(&tstates, &flags, m_tape) != LIBSPECTRUM_ERROR_NONE)
        {
            m_at_end = true;
            break;
        }

        pulse += tstates;

        if (flags & LIBSPECTRUM_TAPE_FLAGS_TAPE)
            m_at_end = true;
        else if (flags & LIBSPECTRUM_TAPE_FLAGS_STOP)
        {
            // Any pulse leading up to the stop is returned first
            if (!pulse)
                return std::nullopt;

            m_stop_pending = true;
        }

        if (m_at_end || m_stop_pending)
            break;

        // Silent periods and zero-length edges are merged into the following pulse
        if (!(flags & LIBSPECTRUM_TAPE_FLAGS_NO_EDGE) && pulse)
            break;
    }

    if (!pulse)
        return std::nullopt;

    return pulse;
}

bool TapeImage::AppendChunk(const std::vector<uint8_t>& data)
{
    if (m_read_only || data.empty())
        return false;

    libspectrum_tape_block* block = nullptr;
    if (libspectrum_tape_block_alloc(&block, LIBSPECTRUM_TAPE_BLOCK_ROM) != LIBSPECTRUM_ERROR_NONE)
        return false;

    auto buffer = libspectrum_new(libspectrum_byte, data.size());
    memcpy(buffer, data.data(), data.size());

    libspectrum_tape_block_set_data_length(block, data.size());
    libspectrum_tape_block_set_data(block, buffer);
    libspectrum_tape_block_set_pause(block, BLOCK_PAUSE_MS);

    libspectrum_tape_append_block(m_tape, block);
    return Save();
}

bool TapeImage::Save()
{
    libspectrum_byte* buffer = nullptr;
    size_t length = 0;

    if (libspectrum_tape_write(&buffer, &length, m_tape, LIBSPECTRUM_ID_TAPE_TAP) != LIBSPECTRUM_ERROR_NONE)
        return false;

    unique_FILE file = fopen(m_path.c_str(), "wb");
    auto written = file ? fwrite(buffer, 1, length, file) : 0;
    libspectrum_free(buffer);

    return file && written == length && fflush(file) == 0;
}

// Return a string describing a given tape block
std::string TapeImage::GetBlockDetails(libspectrum_tape_block* block)
{
    auto block_type = libspectrum_tape_block_type(block);

    if (block_type == LIBSPECTRUM_TAPE_BLOCK_ROM || block_type == LIBSPECTRUM_TAPE_BLOCK_TURBO)
    {
        auto data = libspectrum_tape_block_data(block);
        auto length = libspectrum_tape_block_data_length(block);

        // Spectrum header length and type byte?
        if (length == 17 + 2 && data[0] == 0x00)
        {
            std::string filename;
            for (int i = 0; i < 10; i++)
            {
                char ch = data[i + 2];
                filename += (ch >= ' ' && ch < 0x7f) ? ch : '?';
            }

            std::string type;
            std::string extra;

            switch (data[1])
            {
            case 0:
            {
                type = "Program";

                unsigned int line = (data[15] << 8) | data[14];
                if (line < 0x8000)
                    extra = fmt::format(" LINE {}", line);
                break;
            }

            case 1: type = "Number array"; break;
            case 2: type = "Character array"; break;

            case 3:
            {
                type = "Bytes";

                unsigned int addr = (data[15] << 8) | data[14];
                unsigned int len = (data[13] << 8) | data[12];
                extra = fmt::format(" {},{}", addr, len);
                break;
            }

            default:
                type = "Header";
                break;
            }

            return fmt::format("{}: \"{}\"{}", type, trim(filename), extra);
        }

        // Exclude the flag and checksum bytes from the length
        return fmt::format("Data {}", (length >= 2) ? length - 2 : length);
    }

    switch (block_type)
    {
    case LIBSPECTRUM_TAPE_BLOCK_PURE_DATA:
    case LIBSPECTRUM_TAPE_BLOCK_RAW_DATA:
        return fmt::format("{} bytes", libspectrum_tape_block_data_length(block));

    case LIBSPECTRUM_TAPE_BLOCK_PURE_TONE:
        return fmt::format("Tone {}x{} T", libspectrum_tape_block_count(block), libspectrum_tape_block_pulse_length(block));

    case LIBSPECTRUM_TAPE_BLOCK_PULSES:
        return fmt::format("{} pulses", libspectrum_tape_block_count(block));

    case LIBSPECTRUM_TAPE_BLOCK_PAUSE:
        return fmt::format("Pause {}ms", libspectrum_tape_block_pause(block));

    case LIBSPECTRUM_TAPE_BLOCK_GROUP_START:
    case LIBSPECTRUM_TAPE_BLOCK_COMMENT:
    case LIBSPECTRUM_TAPE_BLOCK_MESSAGE:
        if (auto text = libspectrum_tape_block_text(block))
            return text;
        break;

    default:
        break;
    }

    std::array<char, 64> description{};
    if (libspectrum_tape_block_description(description.data(), description.size(), block) != LIBSPECTRUM_ERROR_NONE)
        return "Unknown";

    return description.data();
}

////////////////////////////////////////////////////////////////////////////////

bool TapeDeck::Insert(const std::string& filepath)
{
    std::unique_ptr<TapeMedia> media;

    // A new file becomes a blank tape ready for recording
    if (!fs::exists(filepath))
        media = TapeImage::Create(filepath);
    else
        media = TapeImage::Open(filepath);

    if (!media)
        return false;

    Insert(std::move(media));
    return true;
}

void TapeDeck::Insert(std::unique_ptr<TapeMedia> media)
{
    Eject();

    m_media = std::move(media);
    auto_accelerate = true;
    audible = true;
}

void TapeDeck::Eject()
{
    Stop();

    m_media.reset();
    m_next_pulse.reset();
    prev_probe_count = 0;
}

bool TapeDeck::Play()
{
    if (!IsInserted())
        return false;

    if (IsRecording())
        Stop();

    m_motion = TapeMotion::Playing;
    return true;
}

void TapeDeck::Stop()
{
    if (IsRecording())
    {
        if (auto block = m_decoder.Flush())
        {
            if (!m_media->AppendChunk(*block))
                Message(MsgType::Error, "Failed to write to tape image:\n\n{}", m_media->GetPath());
        }
    }

    m_motion = TapeMotion::Stopped;
    m_stop_at_frame_end = false;
}

bool TapeDeck::Record()
{
    if (!IsInserted() || m_media->WriteProtected())
        return false;

    Stop();

    m_decoder.Reset();
    m_next_pulse.reset();
    m_motion = TapeMotion::Recording;
    return true;
}

bool TapeDeck::SeekChunk(int index)
{
    if (!IsInserted())
        return false;

    Stop();
    if (!m_media->SelectChunk(index))
        return false;

    m_next_pulse.reset();
    return true;
}

bool TapeDeck::Rewind()
{
    return SeekChunk(0);
}

bool TapeDeck::PrevChunk()
{
    return IsInserted() && SeekChunk(std::max(0, m_media->CurrentChunk() - 1));
}

bool TapeDeck::NextChunk()
{
    return IsInserted() && SeekChunk(m_media->CurrentChunk() + 1);
}

bool TapeDeck::FeedEarIn(Hardware& hw)
{
    // Pulses before the stop point have been fed, so stop now
    if (m_stop_at_frame_end)
    {
        m_stop_at_frame_end = false;
        return false;
    }

    if (!m_next_pulse)
        m_next_pulse = m_media->NextPulse();

    if (!m_next_pulse)
        return false;

    // Only cover a single frame, so turbo decisions stay frame accurate
    auto capacity = hw.InputFeedCapacity(1);

    std::vector<uint32_t> pulses;
    uint64_t fed = 0;

    while (m_next_pulse && fed < capacity)
    {
        fed += *m_next_pulse;
        pulses.push_back(*m_next_pulse);
        m_next_pulse = m_media->NextPulse();
    }

    if (!m_next_pulse && !m_media->AtEnd())
        m_stop_at_frame_end = true;

    hw.FeedEarIn(pulses);
    return true;
}

std::optional<int> TapeDeck::RecordMicOut(const std::vector<uint32_t>& pulses)
{
    int blocks = 0;

    for (auto pulse : pulses)
    {
        if (auto block = m_decoder.AddPulse(pulse))
        {
            // Writing stops on the first failure
            if (!m_media->AppendChunk(*block))
            {
                m_decoder.Reset();
                m_motion = TapeMotion::Stopped;
                return std::nullopt;
            }

            blocks++;
        }
    }

    return blocks;
}

std::string TapeDeck::StatusText() const
{
    if (!IsInserted())
        return "";

    auto flash = auto_accelerate ? "⚡" : " ";
    auto sound = audible ? "🔊" : "🔈";

    if (IsPlaying())
        return fmt::format(" 🖭{}{} ⏵", flash, sound);
    else if (IsRecording())
        return fmt::format(" 🖭{}{} ⏺", flash, sound);

    auto chunk = m_media->CurrentChunk();
    if (chunk >= m_media->ChunkCount())
        return fmt::format(" 🖭{}{} {}: end of tape", flash, sound, chunk + 1);

    return fmt::format(" 🖭{}{} {}: {}", flash, sound, chunk + 1, m_media->ChunkInfo(chunk));
}
