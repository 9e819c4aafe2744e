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
#include <cmath>
#include <cctype>
#include <algorithm>
#include <locale>
#include <sstream>
#include <iomanip>
#include <gain.hpp>
#include <tagcodec.hpp>


const char *RG_STRING[] = {
    "REPLAYGAIN_TRACK_GAIN",
    "REPLAYGAIN_TRACK_PEAK",
    "REPLAYGAIN_ALBUM_GAIN",
    "REPLAYGAIN_ALBUM_PEAK",
    "REPLAYGAIN_REFERENCE_LOUDNESS"
};

static std::string num2str(double val, int precision)
{
    std::stringstream stream;
    stream.imbue(std::locale::classic());
    stream << std::fixed << std::setprecision(precision) << val;
    return stream.str();
}

std::string formatGain(double gain)
{
    return num2str(gain, 2) + " dB";
}

std::string formatPeak(double peak)
{
    return num2str(peak, 6);
}

int gain_to_q78num(double gain)
{
    // convert float to Q7.8 number: Q = round(f * 2^8)
    return (int) round(gain * 256.0);    // 2^8 = 256
}

bool parseNumber(const std::string &value, double &number)
{
    // [+-]?\d+(\.\d+)? after leading blanks, anything behind it is ignored
    std::string::size_type i = 0;
    while (i < value.size() && std::isspace((unsigned char) value[i]))
        i++;

    std::string::size_type start = i;
    if (i < value.size() && (value[i] == '+' || value[i] == '-'))
        i++;

    std::string::size_type digits = i;
    while (i < value.size() && std::isdigit((unsigned char) value[i]))
        i++;
    if (i == digits)
        return false;

    if (i + 1 < value.size() && value[i] == '.' && std::isdigit((unsigned char) value[i + 1]))
    {
        i++;
        while (i < value.size() && std::isdigit((unsigned char) value[i]))
            i++;
    }

    std::istringstream stream(value.substr(start, i - start));
    stream.imbue(std::locale::classic());

    double n;
    if (!(stream >> n) || !std::isfinite(n))
        return false;

    number = n;
    return true;
}

bool equalsIgnoreCase(const std::string &s1, const std::string &s2)
{
    if (s1.size() != s2.size())
        return false;
    for (unsigned long long i = 0; i < s1.size(); i++)
        if (std::toupper((unsigned char) s1[i]) != std::toupper((unsigned char) s2[i]))
            return false;
    return true;
}

static const TagFrame* findField(const ExistingTags &tags, const std::string &key)
{
    for (const TagFrame &field : tags.fields)
        if (equalsIgnoreCase(field.key, key))
            return &field;
    return nullptr;
}

static std::optional<double> findGain(const ExistingTags &tags, const std::string &key)
{
    double gain;
    const TagFrame *field = findField(tags, key);
    if (field && parseNumber(field->value, gain))
        return RG_TO_LUFS(gain);
    return std::nullopt;
}

static std::optional<double> findPeak(const ExistingTags &tags, const std::string &key)
{
    double peak;
    const TagFrame *field = findField(tags, key);
    if (field && parseNumber(field->value, peak) && peak >= 0.0)
        return peak;
    return std::nullopt;
}

// values as they read back from the text fields
static double writtenGain(double gain)
{
    double value = gain;
    parseNumber(formatGain(gain), value);
    return value;
}

static double writtenPeak(double peak)
{
    double value = peak;
    parseNumber(formatPeak(peak), value);
    return value;
}

static void decodeReplayGain(const ExistingTags &tags, const std::string &prefix, StoredGain &stored)
{
    if (!stored.trackLoudness)
        stored.trackLoudness = findGain(tags, prefix + RG_STRING[RG_TRACK_GAIN]);
    if (!stored.trackPeak)
        stored.trackPeak = findPeak(tags, prefix + RG_STRING[RG_TRACK_PEAK]);
    if (!stored.albumLoudness)
        stored.albumLoudness = findGain(tags, prefix + RG_STRING[RG_ALBUM_GAIN]);
    if (!stored.albumPeak)
        stored.albumPeak = findPeak(tags, prefix + RG_STRING[RG_ALBUM_PEAK]);
}


/*** Common ***/
void TagEncoder::encodeReplayGain(TagUpdate &update, const std::string &prefix, const GainResult &track,
                                  const std::optional<GainResult> &album, ALBUMMODE mode) const
{
    update.set.push_back({prefix + RG_STRING[RG_TRACK_GAIN], formatGain(track.gain)});
    update.set.push_back({prefix + RG_STRING[RG_TRACK_PEAK], formatPeak(track.peak)});

    // Only write album tags if the album aggregate exists
    if (mode == ALBUM_WRITE && album)
    {
        update.set.push_back({prefix + RG_STRING[RG_ALBUM_GAIN], formatGain(album->gain)});
        update.set.push_back({prefix + RG_STRING[RG_ALBUM_PEAK], formatPeak(album->peak)});
    }
    else if (mode == ALBUM_NONE)
    {
        update.remove.push_back(prefix + RG_STRING[RG_ALBUM_GAIN]);
        update.remove.push_back(prefix + RG_STRING[RG_ALBUM_PEAK]);
    }

    // stale 89 dB style reference, wrong value might confuse players
    update.remove.push_back(prefix + RG_STRING[RG_REFERENCE_LOUDNESS]);
}

bool TagEncoder::upToDate(const ExistingTags &tags, const TagUpdate &update) const
{
    for (const TagFrame &field : update.set)
    {
        unsigned matches = 0;
        bool exact = false;
        for (const TagFrame &existing : tags.fields)
        {
            if (!equalsIgnoreCase(existing.key, field.key))
                continue;
            matches++;
            exact = (existing.key == field.key && existing.value == field.value);
        }
        if (matches != 1 || !exact)
            return false;
    }

    for (const std::string &key : update.remove)
        if (findField(tags, key))
            return false;

    for (const Rva2Frame &frame : update.rva2)
    {
        unsigned matches = 0;
        bool same = false;
        for (const Rva2Frame &existing : tags.rva2)
        {
            if (!equalsIgnoreCase(existing.identification, frame.identification))
                continue;
            matches++;
            // RVA2 stores adjustment * 512 and a 16 bit peak
            same = (existing.identification == frame.identification) &&
                   (lround(existing.gain * 512.0) == lround(frame.gain * 512.0)) &&
                   existing.peak && frame.peak &&
                   (lround(*existing.peak * 32768.0) == lround(*frame.peak * 32768.0));
        }
        if (matches != 1 || !same)
            return false;
    }

    for (const std::string &identification : update.removeRva2)
        for (const Rva2Frame &existing : tags.rva2)
            if (equalsIgnoreCase(existing.identification, identification))
                return false;

    if (update.id3v2Version != 0 && tags.id3v2Version != update.id3v2Version)
        return false;

    return true;
}


/*** Vorbis comment (FLAC, Ogg Vorbis, Ogg FLAC, Ogg Speex) ***/
TagUpdate VorbisCommentEncoder::encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const
{
    TagUpdate update;
    encodeReplayGain(update, "", track, album, mode);

    // Ogg Opus R128 gain tags (shouldn't ever be in other formats...)
    update.remove.push_back(R128_TRACK_GAIN);
    update.remove.push_back(R128_ALBUM_GAIN);
    return update;
}

StoredGain VorbisCommentEncoder::decode(const ExistingTags &tags) const
{
    StoredGain stored;
    decodeReplayGain(tags, "", stored);
    return stored;
}


/*** Ogg: Opus ****/

// Opus Notes:
//
// 1. R128_TRACK_GAIN and R128_ALBUM_GAIN are relative to -23 LUFS (EBU R128),
//    REPLAYGAIN_* fields to -18 LUFS. Both are derived from the same loudness,
//    so a player honouring either scheme ends up at the same volume.
// 2. R128_* values are ASCII-encoded Q7.8 numbers without unit, limited to
//    a signed 16 bit range.
// 3. The header's 'output_gain' is left untouched.
TagUpdate OpusEncoder::encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const
{
    TagUpdate update;
    encodeReplayGain(update, "", track, album, mode);

    update.set.push_back({R128_TRACK_GAIN, std::to_string(r128Gain(track.gain, "track", update.warnings))});

    if (mode == ALBUM_WRITE && album)
        update.set.push_back({R128_ALBUM_GAIN, std::to_string(r128Gain(album->gain, "album", update.warnings))});
    else if (mode == ALBUM_NONE)
        update.remove.push_back(R128_ALBUM_GAIN);

    return update;
}

StoredGain OpusEncoder::decode(const ExistingTags &tags) const
{
    StoredGain stored = VorbisCommentEncoder::decode(tags);

    double q78;
    const TagFrame *field = findField(tags, R128_TRACK_GAIN);
    if (!stored.trackLoudness && field && parseNumber(field->value, q78))
        stored.trackLoudness = R128_REFERENCE_LUFS - q78 / 256.0;

    field = findField(tags, R128_ALBUM_GAIN);
    if (!stored.albumLoudness && field && parseNumber(field->value, q78))
        stored.albumLoudness = R128_REFERENCE_LUFS - q78 / 256.0;

    return stored;
}

int OpusEncoder::r128Gain(double gain, const char *context, std::vector<std::string> &warnings)
{
    int value = gain_to_q78num(writtenGain(gain) + (R128_REFERENCE_LUFS - RG_REFERENCE_LUFS));
    int clipped = std::max(-32768, std::min(value, 32767));

    if (value != clipped)
    {
        std::stringstream msg;
        msg << "Clipping Opus R128 " << context << " gain adjustment " << std::fixed << std::setprecision(2)
            << value / 256.0 << " dB to " << clipped / 256.0 << " dB";
        warnings.push_back(msg.str());
    }
    return clipped;
}


/*** MP3 (ID3v2) ****/
TagUpdate Id3v2Encoder::encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const
{
    TagUpdate update;
    encodeReplayGain(update, "", track, album, mode);

    Rva2Frame frame;
    frame.identification = RVA2_TRACK;
    frame.gain = writtenGain(track.gain);
    frame.peak = rva2Peak(writtenPeak(track.peak), "track", update.warnings);
    update.rva2.push_back(frame);

    if (mode == ALBUM_WRITE && album)
    {
        frame.identification = RVA2_ALBUM;
        frame.gain = writtenGain(album->gain);
        frame.peak = rva2Peak(writtenPeak(album->peak), "album", update.warnings);
        update.rva2.push_back(frame);
    }
    else if (mode == ALBUM_NONE)
        update.removeRva2.push_back(RVA2_ALBUM);

    update.id3v2Version = 4;
    return update;
}

StoredGain Id3v2Encoder::decode(const ExistingTags &tags) const
{
    StoredGain stored;
    decodeReplayGain(tags, "", stored);

    // Try the legacy RVA2 frames if information is missing
    for (const Rva2Frame &frame : tags.rva2)
    {
        if (equalsIgnoreCase(frame.identification, RVA2_TRACK) && !stored.hasTrack())
        {
            stored.trackLoudness = RG_TO_LUFS(frame.gain);
            if (frame.peak)
                stored.trackPeak = *frame.peak;
        }
        else if (equalsIgnoreCase(frame.identification, RVA2_ALBUM) && !stored.hasAlbum())
        {
            stored.albumLoudness = RG_TO_LUFS(frame.gain);
            if (frame.peak)
                stored.albumPeak = *frame.peak;
        }
    }
    return stored;
}

double Id3v2Encoder::rva2Peak(double peak, const char *context, std::vector<std::string> &warnings)
{
    // 16 bit peak on a linear scale with a maximum of 65535/32768, rounded half to even
    double value = std::nearbyint(peak * 32768.0);

    if (value > 65535.0)
    {
        std::stringstream msg;
        msg << "Clipping RVA2 " << context << " peak " << std::fixed << std::setprecision(2)
            << value / 32768.0 << " to " << 65535.0 / 32768.0;
        warnings.push_back(msg.str());
        value = 65535.0;
    }
    return value / 32768.0;
}


/*** MP4 ****/
TagUpdate Mp4Encoder::encode(const GainResult &track, const std::optional<GainResult> &album, ALBUMMODE mode) const
{
    TagUpdate update;
    encodeReplayGain(update, MP4_ATOM_ITUNES, track, album, mode);

    // the old mean is superseded
    const std::string legacy = MP4_ATOM_HYDROGENAUDIO;
    update.remove.push_back(legacy + RG_STRING[RG_TRACK_GAIN]);
    update.remove.push_back(legacy + RG_STRING[RG_TRACK_PEAK]);
    update.remove.push_back(legacy + RG_STRING[RG_ALBUM_GAIN]);
    update.remove.push_back(legacy + RG_STRING[RG_ALBUM_PEAK]);
    update.remove.push_back(legacy + RG_STRING[RG_REFERENCE_LOUDNESS]);
    return update;
}

void Mp4Encoder::keepAlbumFields(const ExistingTags &tags, TagUpdate &update) const
{
    // album values only found under the old mean move to the iTunes mean
    const std::string legacy = MP4_ATOM_HYDROGENAUDIO;
    for (RG_ENUM key : {RG_ALBUM_GAIN, RG_ALBUM_PEAK})
    {
        const TagFrame *field = findField(tags, legacy + RG_STRING[key]);
        if (field && !findField(tags, std::string(MP4_ATOM_ITUNES) + RG_STRING[key]))
            update.set.push_back({std::string(MP4_ATOM_ITUNES) + RG_STRING[key], field->value});
    }
}

StoredGain Mp4Encoder::decode(const ExistingTags &tags) const
{
    StoredGain stored;
    decodeReplayGain(tags, MP4_ATOM_ITUNES, stored);
    decodeReplayGain(tags, MP4_ATOM_HYDROGENAUDIO, stored);
    return stored;
}


const TagEncoder* tagEncoder(TrackFormat format)
{
    static const VorbisCommentEncoder vorbis;
    static const OpusEncoder opus;
    static const Id3v2Encoder id3v2;
    static const Mp4Encoder mp4;

    switch (format)
    {
    case TrackFormat::FLAC:
    case TrackFormat::OGG_VORBIS:
    case TrackFormat::OGG_FLAC:
    case TrackFormat::OGG_SPEEX:
        return &vorbis;

    case TrackFormat::OPUS:
        return &opus;

    case TrackFormat::MP3:
        return &id3v2;

    case TrackFormat::MP4:
        return &mp4;

    default:
        return nullptr;
    }
}
