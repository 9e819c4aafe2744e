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
#ifndef TAGCODEC_H
#define TAGCODEC_H

#include <string>
#include <vector>
#include <optional>
#include <track.hpp>

// this is where we store the RG tags in MP4/M4A files
#define MP4_ATOM_ITUNES "----:com.apple.iTunes:"
// older freeform mean used by some taggers, superseded on write
#define MP4_ATOM_HYDROGENAUDIO "----:org.hydrogenaudio.replaygain:"

// define possible replaygain tags
enum RG_ENUM {
    RG_TRACK_GAIN,
    RG_TRACK_PEAK,
    RG_ALBUM_GAIN,
    RG_ALBUM_PEAK,
    RG_REFERENCE_LOUDNESS
};

extern const char *RG_STRING[];

#define R128_TRACK_GAIN "R128_TRACK_GAIN"
#define R128_ALBUM_GAIN "R128_ALBUM_GAIN"

#define RVA2_TRACK "track"
#define RVA2_ALBUM "album"

/* Changes to apply to one file's tag */
struct TagUpdate
{
    std::vector<TagFrame> set;              // canonical key, replaces every spelling of it
    std::vector<std::string> remove;        // removed in every spelling
    std::vector<Rva2Frame> rva2;
    std::vector<std::string> removeRva2;    // RVA2 identifications to drop
    unsigned id3v2Version = 0;              // ID3v2 minor version to save with, 0 otherwise
    std::vector<std::string> warnings;
};

std::string formatGain(double gain);
std::string formatPeak(double peak);
int gain_to_q78num(double gain);

/* Leading signed decimal of a tag value, units and trailing text ignored */
bool parseNumber(const std::string &value, double &number);

bool equalsIgnoreCase(const std::string &s1, const std::string &s2);

/*
 * One encoder per tag scheme. encode() maps gain results to the concrete
 * fields of the scheme, decode() recovers loudness/peak from what a file
 * already carries.
 */
class TagEncoder
{
public:
    enum ALBUMMODE
    {
        ALBUM_NONE,     // track-only file: album fields are removed
        ALBUM_KEEP,     // album aggregate unavailable: album fields are left alone
        ALBUM_WRITE
    };

    virtual ~TagEncoder() = default;

    virtual TagUpdate encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const = 0;
    virtual StoredGain decode(const ExistingTags &tags) const = 0;

    /* Adjusts an ALBUM_KEEP update so the album fields a file carries survive it */
    virtual void keepAlbumFields(const ExistingTags &tags, TagUpdate &update) const { (void)tags; (void)update; }

    /* True when writing update would not change tags */
    bool upToDate(const ExistingTags &tags, const TagUpdate &update) const;

protected:
    void encodeReplayGain(TagUpdate &update, const std::string &prefix, const GainResult &track,
                          const std::optional<GainResult> &album, ALBUMMODE mode) const;
};

/* FLAC, Ogg Vorbis, Ogg FLAC, Ogg Speex */
class VorbisCommentEncoder : public TagEncoder
{
public:
    TagUpdate encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const override;
    StoredGain decode(const ExistingTags &tags) const override;
};

/* Vorbis comment fields plus the RFC 7845 R128_* gains */
class OpusEncoder : public VorbisCommentEncoder
{
public:
    TagUpdate encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const override;
    StoredGain decode(const ExistingTags &tags) const override;

    /* ReplayGain 2.0 gain to a Q7.8 R128 gain, clamped to 16 bit */
    static int r128Gain(double gain, const char *context, std::vector<std::string> &warnings);
};

/* TXXX fields plus RVA2 frames, saved as ID3v2.4 */
class Id3v2Encoder : public TagEncoder
{
public:
    TagUpdate encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const override;
    StoredGain decode(const ExistingTags &tags) const override;

    static double rva2Peak(double peak, const char *context, std::vector<std::string> &warnings);
};

/* iTunes freeform atoms */
class Mp4Encoder : public TagEncoder
{
public:
    TagUpdate encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const override;
    StoredGain decode(const ExistingTags &tags) const override;
    void keepAlbumFields(const ExistingTags &tags, TagUpdate &update) const override;
};

/* Encoder for a container kind, nullptr when the kind cannot be tagged */
const TagEncoder* tagEncoder(TrackFormat format);

#endif
