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
#ifndef TRACK_H
#define TRACK_H

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

enum class TrackFormat
{
    UNKNOWN,
    MP3,        // ID3v2
    FLAC,       // Vorbis comment in a FLAC stream
    OGG_VORBIS,
    OGG_FLAC,
    OGG_SPEEX,
    OPUS,
    MP4         // iTunes-style freeform atoms
};

const char* formatName(TrackFormat format);

/* Result of a single loudness measurement */
struct Measurement
{
    double loudness = 0.0;  // integrated loudness, LUFS
    double peak = 0.0;      // linear true peak
    double duration = 0.0;  // seconds
};

/* Immutable gain/peak pair, one per track and one per album */
struct GainResult
{
    double gain = 0.0;      // dB relative to the -18 LUFS reference
    double peak = 0.0;      // linear, never negative
    double loudness = 0.0;  // LUFS the gain was derived from
};

/* Text field as found in (or destined for) a tag: Vorbis comment name, TXXX description or MP4 atom name */
struct TagFrame
{
    std::string key;
    std::string value;
};

/* ID3v2 RVA2 master volume adjustment */
struct Rva2Frame
{
    std::string identification;     // "track" or "album"
    double gain = 0.0;              // dB
    std::optional<double> peak;     // linear
};

/* Gain related content of a file's tag, as read by the tag store */
struct ExistingTags
{
    std::vector<TagFrame> fields;
    std::vector<Rva2Frame> rva2;
    unsigned id3v2Version = 0;      // 0 when the file has no ID3v2 tag
};

/* Values recovered from the tags a file already carries */
struct StoredGain
{
    std::optional<double> trackLoudness;
    std::optional<double> trackPeak;
    std::optional<double> albumLoudness;
    std::optional<double> albumPeak;

    bool hasTrack() const { return trackLoudness.has_value() && trackPeak.has_value(); }
    bool hasAlbum() const { return albumLoudness.has_value() && albumPeak.has_value(); }
};

class Track
{
public:
    enum STATE
    {
        PENDING,
        MEASURING,
        MEASURED,
        SKIPPED,
        WAITING,
        TAGGING,
        DONE,
        FAILED
    };

    enum FAILURE
    {
        NONE,
        MEASUREMENT_FAILURE,
        UNSUPPORTED_FORMAT,
        TAG_READ_FAILURE,
        TAG_WRITE_FAILURE
    };

    static constexpr long NO_ALBUM = -1;

    Track(const fs::path &path, long albumId = NO_ALBUM, bool includeInAlbum = true);

    const fs::path& filePath() const { return p; }
    fs::path fileName() const { return p.filename(); }
    long albumId() const { return album; }
    bool includeInAlbum() const { return include; }
    bool isAlbumMember() const { return album != NO_ALBUM; }

    TrackFormat format = TrackFormat::UNKNOWN;
    std::optional<double> measuredLoudness;
    std::optional<double> measuredPeak;
    std::optional<double> duration;
    ExistingTags tags;
    StoredGain stored;
    bool alreadyTagged = false;
    bool rescanned = false;

    std::optional<GainResult> trackResult;

    STATE state() const { return st.load(); }
    void setState(STATE s) { st.store(s); }
    FAILURE failure() const { return fail; }
    void setFailed(FAILURE f, const std::string &reason);
    const std::string& failureReason() const { return reason; }

    /* Loudness/peak used for gain computation: fresh measurement first, stored tags otherwise */
    bool hasLoudness() const;
    double loudness() const;
    double peak() const;

private:
    fs::path p;
    long album;
    bool include;
    std::atomic<STATE> st{PENDING};
    FAILURE fail = NONE;
    std::string reason;
};

const char* failureName(Track::FAILURE failure);

class Album
{
public:
    enum AGGREGATE
    {
        PENDING,
        COMPUTED,
        REUSED,
        EMPTY,
        FAILED
    };

    Album(long id) : albumId(id) { }

    long id() const { return albumId; }
    std::vector<std::shared_ptr<Track>> tracks;

    unsigned long long includedCount() const;

    /* Written once, by the worker that passes the barrier */
    AGGREGATE aggregate = PENDING;
    std::optional<GainResult> result;

    /* Called when a member finished measuring; true for the member that completes the album */
    bool arrive();
    void resetBarrier();

private:
    long albumId;
    std::atomic<unsigned long long> pending{0};
};

/* Output of the album grouper, immutable once measurement starts */
struct Grouping
{
    std::vector<std::shared_ptr<Track>> tracks;     // command-line order
    std::vector<std::shared_ptr<Album>> albums;

    std::shared_ptr<Album> album(long id) const;
};

#endif
