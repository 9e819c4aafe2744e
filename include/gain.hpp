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
#ifndef GAIN_H
#define GAIN_H

#include <vector>
#include <memory>
#include <track.hpp>

// ReplayGain 2.0 reference loudness
#define RG_REFERENCE_LUFS (-18.0)
// EBU R128 reference used by the Opus R128_* tags (RFC 7845)
#define R128_REFERENCE_LUFS (-23.0)

#define LUFS_TO_RG(L) (RG_REFERENCE_LUFS - (L))
#define RG_TO_LUFS(G) (RG_REFERENCE_LUFS - (G))

GainResult computeTrackGain(double loudness, double peak);
GainResult computeTrackGain(const Measurement &measurement);

/*
 * Integrated loudness of several programmes played back to back:
 * energies weighted by duration, averaged, converted back to LUFS.
 * Falls back to equal weights when a duration is missing or zero.
 */
double combineLoudness(const std::vector<double> &loudness, const std::vector<double> &durations);

/*
 * Album gain from the included members. Returns false ("empty album") when
 * no included member has a loudness value.
 */
bool computeAlbumGain(const std::vector<std::shared_ptr<Track>> &tracks, GainResult &result);

/* Skip policy: a tagged track is only measured again when forced */
bool needsMeasurement(const Track &track, bool force);

/*
 * True when every member was skipped and all of them carry the same stored
 * album loudness and peak; result then holds those values.
 */
bool storedAlbumGain(const Album &album, GainResult &result);

#endif
