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
#include <algorithm>
#include <gain.hpp>


GainResult computeTrackGain(double loudness, double peak)
{
    GainResult result;
    result.gain = LUFS_TO_RG(loudness);
    result.peak = std::max<double>(0.0, peak);
    result.loudness = loudness;
    return result;
}

GainResult computeTrackGain(const Measurement &measurement)
{
    return computeTrackGain(measurement.loudness, measurement.peak);
}

double combineLoudness(const std::vector<double> &loudness, const std::vector<double> &durations)
{
    bool weighted = (durations.size() == loudness.size());
    for (unsigned long long i = 0; weighted && i < durations.size(); i++)
        if (!(durations[i] > 0.0))
            weighted = false;

    double energy = 0.0;
    double weights = 0.0;
    for (unsigned long long i = 0; i < loudness.size(); i++)
    {
        double w = weighted ? durations[i] : 1.0;
        energy += w * pow(10.0, loudness[i] / 10.0);
        weights += w;
    }

    // the -0.691 dB K-weighting offset cancels out
    return 10.0 * log10(energy / weights);
}

bool computeAlbumGain(const std::vector<std::shared_ptr<Track>> &tracks, GainResult &result)
{
    std::vector<double> loudness;
    std::vector<double> durations;
    double peak = 0.0;

    for (const std::shared_ptr<Track> &track : tracks)
    {
        if (!track->includeInAlbum() || track->state() == Track::FAILED || !track->hasLoudness())
            continue;

        loudness.push_back(track->loudness());
        durations.push_back(track->duration.value_or(0.0));
        peak = std::max<double>(peak, track->peak());
    }

    if (loudness.empty())
        return false;

    result = computeTrackGain(combineLoudness(loudness, durations), peak);
    return true;
}

bool needsMeasurement(const Track &track, bool force)
{
    return force || !track.alreadyTagged;
}

bool storedAlbumGain(const Album &album, GainResult &result)
{
    std::optional<double> loudness;
    std::optional<double> peak;

    // stored values never stand in for an album without included members
    if (album.includedCount() == 0)
        return false;

    for (const std::shared_ptr<Track> &track : album.tracks)
    {
        if (track->rescanned || track->state() == Track::FAILED || !track->stored.hasAlbum())
            return false;

        if (!loudness)
        {
            loudness = track->stored.albumLoudness;
            peak = track->stored.albumPeak;
        }
        else if (*loudness != *track->stored.albumLoudness || *peak != *track->stored.albumPeak)
            return false;
    }

    if (!loudness)
        return false;

    result = computeTrackGain(*loudness, *peak);
    return true;
}
