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
#include <track.hpp>


const char* formatName(TrackFormat format)
{
    switch (format)
    {
    case TrackFormat::MP3:        return "MP3/ID3v2";
    case TrackFormat::FLAC:       return "FLAC";
    case TrackFormat::OGG_VORBIS: return "Ogg Vorbis";
    case TrackFormat::OGG_FLAC:   return "Ogg FLAC";
    case TrackFormat::OGG_SPEEX:  return "Ogg Speex";
    case TrackFormat::OPUS:       return "Ogg Opus";
    case TrackFormat::MP4:        return "MP4/iTunes";
    default:                      return "unknown";
    }
}

const char* failureName(Track::FAILURE failure)
{
    switch (failure)
    {
    case Track::MEASUREMENT_FAILURE: return "measurement failed";
    case Track::UNSUPPORTED_FORMAT:  return "unsupported format";
    case Track::TAG_READ_FAILURE:    return "cannot read tags";
    case Track::TAG_WRITE_FAILURE:   return "cannot write tags";
    default:                         return "none";
    }
}


Track::Track(const fs::path &path, long albumId, bool includeInAlbum)
    : p(path), album(albumId), include(includeInAlbum)
{ }

void Track::setFailed(FAILURE f, const std::string &why)
{
    fail = f;
    reason = why;
    setState(FAILED);
}

bool Track::hasLoudness() const
{
    if (measuredLoudness && measuredPeak)
        return true;
    return stored.hasTrack();
}

double Track::loudness() const
{
    if (measuredLoudness)
        return *measuredLoudness;
    return stored.trackLoudness.value_or(0.0);
}

double Track::peak() const
{
    if (measuredPeak)
        return *measuredPeak;
    return stored.trackPeak.value_or(0.0);
}


unsigned long long Album::includedCount() const
{
    unsigned long long n = 0;
    for (const std::shared_ptr<Track> &track : tracks)
        if (track->includeInAlbum())
            n++;
    return n;
}

bool Album::arrive()
{
    return pending.fetch_sub(1, std::memory_order_acq_rel) == 1;
}

void Album::resetBarrier()
{
    pending.store(tracks.size());
    aggregate = PENDING;
    result.reset();
}


std::shared_ptr<Album> Grouping::album(long id) const
{
    for (const std::shared_ptr<Album> &a : albums)
        if (a->id() == id)
            return a;
    return nullptr;
}
