/*
 * Loudness normalizer based on the EBU R128 standard
 *
 * Copyright (c) 2014, Alessandro Ghedini
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 *     * Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *
 *     * Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */
#include <math.h>
#include <algorithm>
#include <tag.hpp>

#include <taglib/taglib.h>
#include <taglib/tstring.h>
#include <taglib/tbytevector.h>
#include <taglib/audioproperties.h>
#include <taglib/textidentificationframe.h>
#include <taglib/relativevolumeframe.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/id3v2header.h>
#include <taglib/flacfile.h>
#include <taglib/vorbisfile.h>
#include <taglib/oggflacfile.h>
#include <taglib/speexfile.h>
#include <taglib/opusfile.h>
#include <taglib/xiphcomment.h>
#include <taglib/mp4file.h>

#define TAGLIB_VERSION (TAGLIB_MAJOR_VERSION * 10000 + TAGLIB_MINOR_VERSION * 100 + TAGLIB_PATCH_VERSION)


static std::string str(const TagLib::String &s)
{
    return s.to8Bit(true);
}

static TagLib::String tstr(const std::string &s)
{
    return TagLib::String(s, TagLib::String::UTF8);
}

// only fields that can hold a gain value are of interest
static bool is_gain_key(const TagLib::String &key)
{
    const std::string desc = str(key.upper());
    return (desc.find("REPLAYGAIN_") != std::string::npos) || (desc.rfind("R128_", 0) == 0);
}

template <class FileType>
static std::optional<double> file_duration(FileType &f)
{
    const TagLib::AudioProperties *properties = f.audioProperties();
    if (properties && properties->lengthInMilliseconds() > 0)
        return properties->lengthInMilliseconds() / 1000.0;
    return std::nullopt;
}


/*** MP3 ****/
static void read_id3v2(TagLib::ID3v2::Tag *tag, ExistingTags &tags)
{
    tags.id3v2Version = tag->header()->majorVersion();

    TagLib::ID3v2::FrameList::ConstIterator it;
    TagLib::ID3v2::FrameList frames = tag->frameList("TXXX");

    for (it = frames.begin(); it != frames.end(); ++it)
    {
        TagLib::ID3v2::UserTextIdentificationFrame *frame = dynamic_cast<TagLib::ID3v2::UserTextIdentificationFrame*>(*it);

        if (frame && frame->fieldList().size() >= 2 && is_gain_key(frame->description()))
            tags.fields.push_back({str(frame->description()), str(frame->fieldList()[1])});
    }

    frames = tag->frameList("RVA2");
    for (it = frames.begin(); it != frames.end(); ++it)
    {
        TagLib::ID3v2::RelativeVolumeFrame *frame = dynamic_cast<TagLib::ID3v2::RelativeVolumeFrame*>(*it);

        if (!frame || !frame->channels().contains(TagLib::ID3v2::RelativeVolumeFrame::MasterVolume))
            continue;

        Rva2Frame rva2;
        rva2.identification = str(frame->identification());
        rva2.gain = frame->volumeAdjustmentIndex(TagLib::ID3v2::RelativeVolumeFrame::MasterVolume) / 512.0;

        // peak is a big endian integer of bitsRepresentingPeak bits, 1.0 at half scale
        TagLib::ID3v2::RelativeVolumeFrame::PeakVolume pv = frame->peakVolume(TagLib::ID3v2::RelativeVolumeFrame::MasterVolume);
        if (pv.bitsRepresentingPeak > 0 && pv.bitsRepresentingPeak <= 32 && !pv.peakVolume.isEmpty())
        {
            unsigned long long value = 0;
            unsigned bytes = std::min<unsigned>(pv.peakVolume.size(), 4);
            for (unsigned i = 0; i < bytes; i++)
                value = (value << 8) | (unsigned char) pv.peakVolume[i];
            rva2.peak = value / pow(2.0, pv.bitsRepresentingPeak - 1);
        }
        tags.rva2.push_back(rva2);
    }
}

static void tag_remove_txxx(TagLib::ID3v2::Tag *tag, const std::string &key)
{
    TagLib::ID3v2::FrameList::Iterator it;
    TagLib::ID3v2::FrameList frames = tag->frameList("TXXX");

    // this removes all variants of upper-/lower-/mixed-case tags
    for (it = frames.begin(); it != frames.end(); ++it)
    {
        TagLib::ID3v2::UserTextIdentificationFrame *frame = dynamic_cast<TagLib::ID3v2::UserTextIdentificationFrame*>(*it);
        if (frame && equalsIgnoreCase(str(frame->description()), key))
            tag->removeFrame(frame);
    }
}

static void tag_add_txxx(TagLib::ID3v2::Tag *tag, const std::string &key, const std::string &value)
{
    TagLib::ID3v2::UserTextIdentificationFrame *frame = new TagLib::ID3v2::UserTextIdentificationFrame(TagLib::String::UTF8);
    frame->setDescription(tstr(key));
    frame->setText(tstr(value));
    tag->addFrame(frame);
}

static void tag_remove_rva2(TagLib::ID3v2::Tag *tag, const std::string &identification)
{
    TagLib::ID3v2::FrameList::Iterator it;
    TagLib::ID3v2::FrameList frames = tag->frameList("RVA2");

    for (it = frames.begin(); it != frames.end(); ++it)
    {
        TagLib::ID3v2::RelativeVolumeFrame *frame = dynamic_cast<TagLib::ID3v2::RelativeVolumeFrame*>(*it);
        if (frame && equalsIgnoreCase(str(frame->identification()), identification))
            tag->removeFrame(frame);
    }
}

static void tag_add_rva2(TagLib::ID3v2::Tag *tag, const Rva2Frame &rva2)
{
    TagLib::ID3v2::RelativeVolumeFrame *frame = new TagLib::ID3v2::RelativeVolumeFrame();
    frame->setIdentification(tstr(rva2.identification));

    // volume adjustment is stored as a 16 bit signed multiple of 1/512 dB
    long index = std::clamp<long>(lround(rva2.gain * 512.0), -32768, 32767);
    frame->setVolumeAdjustmentIndex(short(index), TagLib::ID3v2::RelativeVolumeFrame::MasterVolume);

    if (rva2.peak)
    {
        long value = std::clamp<long>(lround(*rva2.peak * 32768.0), 0, 65535);

        TagLib::ID3v2::RelativeVolumeFrame::PeakVolume pv;
        pv.bitsRepresentingPeak = 16;
        pv.peakVolume = TagLib::ByteVector::fromShort(short((unsigned short) value), true);
        frame->setPeakVolume(pv, TagLib::ID3v2::RelativeVolumeFrame::MasterVolume);
    }
    tag->addFrame(frame);
}

static void update_id3v2(TagLib::ID3v2::Tag *tag, const TagUpdate &update)
{
    for (const std::string &key : update.remove)
        tag_remove_txxx(tag, key);

    for (const TagFrame &field : update.set)
    {
        tag_remove_txxx(tag, field.key);
        tag_add_txxx(tag, field.key, field.value);
    }

    for (const std::string &identification : update.removeRva2)
        tag_remove_rva2(tag, identification);

    for (const Rva2Frame &rva2 : update.rva2)
    {
        tag_remove_rva2(tag, rva2.identification);
        tag_add_rva2(tag, rva2);
    }
}

static bool tag_write_mp3(const fs::path &path, const TagUpdate &update, std::string &error)
{
    TagLib::MPEG::File f(path.c_str());

    if (!f.isValid())
    {
        error = "Cannot open or read file";
        return false;
    }

    update_id3v2(f.ID3v2Tag(true), update);

    int version = (update.id3v2Version == 3) ? 3 : 4;
#if TAGLIB_VERSION >= 11200
    if (!f.save(TagLib::MPEG::File::ID3v2, TagLib::MPEG::File::StripNone, version == 3 ? TagLib::ID3v2::v3 : TagLib::ID3v2::v4))
#else
    if (!f.save(TagLib::MPEG::File::ID3v2, false, version))
#endif
    {
        error = "Cannot write to file";
        return false;
    }
    return true;
}


/*** Vorbis comment ****/
static void read_xiph(TagLib::Ogg::XiphComment *tag, ExistingTags &tags)
{
    if (!tag)
        return;

    const TagLib::Ogg::FieldListMap &items = tag->fieldListMap();
    for (TagLib::Ogg::FieldListMap::ConstIterator item = items.begin(); item != items.end(); ++item)
    {
        if (!is_gain_key(item->first))
            continue;

        for (TagLib::StringList::ConstIterator value = item->second.begin(); value != item->second.end(); ++value)
            tags.fields.push_back({str(item->first), str(*value)});
    }
}

static void tag_remove_xiph(TagLib::Ogg::XiphComment *tag, const std::string &key)
{
    TagLib::StringList list;
    const TagLib::Ogg::FieldListMap &items = tag->fieldListMap();

    for (TagLib::Ogg::FieldListMap::ConstIterator item = items.begin(); item != items.end(); ++item)
        if (equalsIgnoreCase(str(item->first), key))
            list.append(item->first);

    for (int i = 0; i < int(list.size()); ++i)
        tag->removeFields(list[i]);
}

static void update_xiph(TagLib::Ogg::XiphComment *tag, const TagUpdate &update)
{
    for (const std::string &key : update.remove)
        tag_remove_xiph(tag, key);

    for (const TagFrame &field : update.set)
    {
        tag_remove_xiph(tag, field.key);
        tag->addField(tstr(field.key), tstr(field.value), true);
    }
}

static bool tag_write_flac(const fs::path &path, const TagUpdate &update, std::string &error)
{
    TagLib::FLAC::File f(path.c_str());

    if (!f.isValid())
    {
        error = "Cannot open or read file";
        return false;
    }

    update_xiph(f.xiphComment(true), update);

    if (!f.save())
    {
        error = "Cannot write to file";
        return false;
    }
    return true;
}

// Ogg Vorbis, Ogg FLAC, Ogg Speex and Opus only differ in the file class
template <class FileType>
static bool tag_read_ogg(const fs::path &path, ExistingTags &tags, std::optional<double> &duration, std::string &error)
{
    FileType f(path.c_str());

    if (!f.isValid())
    {
        error = "Cannot open or read file";
        return false;
    }

    read_xiph(f.tag(), tags);
    duration = file_duration(f);
    return true;
}

template <class FileType>
static bool tag_write_ogg(const fs::path &path, const TagUpdate &update, std::string &error)
{
    FileType f(path.c_str());

    if (!f.isValid() || !f.tag())
    {
        error = "Cannot open or read file";
        return false;
    }

    update_xiph(f.tag(), update);

    if (!f.save())
    {
        error = "Cannot write to file";
        return false;
    }
    return true;
}


/*** MP4 ****/
static void read_mp4(TagLib::MP4::Tag *tag, ExistingTags &tags)
{
    if (!tag)
        return;

#if TAGLIB_VERSION >= 11200
    TagLib::MP4::ItemMap items = tag->itemMap();
    for(TagLib::MP4::ItemMap::ConstIterator item = items.begin(); item != items.end(); ++item)
#else
    TagLib::MP4::ItemListMap &items = tag->itemListMap();
    for(TagLib::MP4::ItemListMap::ConstIterator item = items.begin(); item != items.end(); ++item)
#endif
    {
        if (!is_gain_key(item->first))
            continue;

        TagLib::StringList values = item->second.toStringList();
        for (TagLib::StringList::ConstIterator value = values.begin(); value != values.end(); ++value)
            tags.fields.push_back({str(item->first), str(*value)});
    }
}

static void tag_remove_mp4(TagLib::MP4::Tag *tag, const std::string &key)
{
    TagLib::StringList list;

#if TAGLIB_VERSION >= 11200
    TagLib::MP4::ItemMap items = tag->itemMap();
    for(TagLib::MP4::ItemMap::ConstIterator item = items.begin(); item != items.end(); ++item)
#else
    TagLib::MP4::ItemListMap &items = tag->itemListMap();
    for(TagLib::MP4::ItemListMap::ConstIterator item = items.begin(); item != items.end(); ++item)
#endif
    {
        if (equalsIgnoreCase(str(item->first), key))
            list.append(item->first);
    }

    for (int i = 0; i < int(list.size()); ++i)
        tag->removeItem(list[i]);
}

static bool tag_write_mp4(const fs::path &path, const TagUpdate &update, std::string &error)
{
    TagLib::MP4::File f(path.c_str());
    TagLib::MP4::Tag *tag = f.tag();

    if (!f.isValid() || !tag)
    {
        error = "Cannot open or read file";
        return false;
    }

    for (const std::string &key : update.remove)
        tag_remove_mp4(tag, key);

    for (const TagFrame &field : update.set)
    {
        tag_remove_mp4(tag, field.key);
        tag->setItem(tstr(field.key), TagLib::MP4::Item(TagLib::StringList(tstr(field.value))));
    }

    if (!f.save())
    {
        error = "Cannot write to file";
        return false;
    }
    return true;
}


bool TagLibStore::read(Track &track, std::string &error)
{
    track.tags = ExistingTags();
    std::optional<double> duration;

    try
    {
        if (!readTags(track.filePath(), track.format, track.tags, duration, error))
            return false;
    }
    catch (const std::exception &e)
    {
        error = e.what();
        return false;
    }

    if (duration && !track.duration)
        track.duration = duration;
    return true;
}

bool TagLibStore::readTags(const fs::path &path, TrackFormat format, ExistingTags &tags, std::optional<double> &duration, std::string &error)
{
    switch (format)
    {
    case TrackFormat::MP3:
    {
        TagLib::MPEG::File f(path.c_str());
        if (!f.isValid())
        {
            error = "Cannot open or read file";
            return false;
        }
        if (f.hasID3v2Tag())
            read_id3v2(f.ID3v2Tag(), tags);
        duration = file_duration(f);
        return true;
    }

    case TrackFormat::FLAC:
    {
        TagLib::FLAC::File f(path.c_str());
        if (!f.isValid())
        {
            error = "Cannot open or read file";
            return false;
        }
        if (f.hasXiphComment())
            read_xiph(f.xiphComment(), tags);
        duration = file_duration(f);
        return true;
    }

    // must separate because TagLib uses different file classes
    case TrackFormat::OGG_VORBIS:
        return tag_read_ogg<TagLib::Ogg::Vorbis::File>(path, tags, duration, error);

    case TrackFormat::OGG_FLAC:
        return tag_read_ogg<TagLib::Ogg::FLAC::File>(path, tags, duration, error);

    case TrackFormat::OGG_SPEEX:
        return tag_read_ogg<TagLib::Ogg::Speex::File>(path, tags, duration, error);

    case TrackFormat::OPUS:
        return tag_read_ogg<TagLib::Ogg::Opus::File>(path, tags, duration, error);

    case TrackFormat::MP4:
    {
        TagLib::MP4::File f(path.c_str());
        if (!f.isValid())
        {
            error = "Cannot open or read file";
            return false;
        }
        read_mp4(f.tag(), tags);
        duration = file_duration(f);
        return true;
    }

    default:
        error = "File type not supported";
        return false;
    }
}

fs::path TagLibStore::temporaryPath(const fs::path &path)
{
    fs::path name = ".";
    name += path.filename();
    name += ".regain-tmp";
    return path.parent_path() / name;
}

bool TagLibStore::write(const Track &track, const TagUpdate &update, std::string &error)
{
    const fs::path tmp = temporaryPath(track.filePath());
    std::error_code ec;

    fs::copy_file(track.filePath(), tmp, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        error = "Cannot create temporary copy: " + ec.message();
        return false;
    }

    bool ok = false;
    try
    {
        ok = writeTags(tmp, track.format, update, error);
    }
    catch (const std::exception &e)
    {
        error = e.what();
        ok = false;
    }

    if (ok)
    {
        fs::rename(tmp, track.filePath(), ec);
        if (ec)
        {
            error = "Cannot replace original: " + ec.message();
            ok = false;
        }
    }

    // the original stays untouched on any failure
    if (!ok)
    {
        std::error_code rm;
        fs::remove(tmp, rm);
    }
    return ok;
}

bool TagLibStore::writeTags(const fs::path &path, TrackFormat format, const TagUpdate &update, std::string &error)
{
    switch (format)
    {
    case TrackFormat::MP3:
        return tag_write_mp3(path, update, error);

    case TrackFormat::FLAC:
        return tag_write_flac(path, update, error);

    case TrackFormat::OGG_VORBIS:
        return tag_write_ogg<TagLib::Ogg::Vorbis::File>(path, update, error);

    case TrackFormat::OGG_FLAC:
        return tag_write_ogg<TagLib::Ogg::FLAC::File>(path, update, error);

    case TrackFormat::OGG_SPEEX:
        return tag_write_ogg<TagLib::Ogg::Speex::File>(path, update, error);

    case TrackFormat::OPUS:
        return tag_write_ogg<TagLib::Ogg::Opus::File>(path, update, error);

    case TrackFormat::MP4:
        return tag_write_mp4(path, update, error);

    default:
        error = "File type not supported";
        return false;
    }
}
