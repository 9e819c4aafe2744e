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
/*
 * Unit tests for src/gain.cpp
 */

#include <cmath>
#include <gain.hpp>
#include <tagcodec.hpp>

#include <gtest/gtest.h>

static std::shared_ptr<Track> measuredTrack(const char *path, double loudness, double peak,
                                            bool include = true, double duration = 0.0)
{
    std::shared_ptr<Track> track = std::make_shared<Track>(path, 1, include);
    track->measuredLoudness = loudness;
    track->measuredPeak = peak;
    if (duration > 0.0)
        track->duration = duration;
    track->rescanned = true;
    track->setState(Track::WAITING);
    return track;
}

TEST(Gain, TrackGain)
{
    GainResult a = computeTrackGain(-20.0, 0.5);
    EXPECT_DOUBLE_EQ(2.0, a.gain);
    EXPECT_DOUBLE_EQ(0.5, a.peak);
    EXPECT_DOUBLE_EQ(-20.0, a.loudness);
    EXPECT_EQ("2.00 dB", formatGain(a.gain));

    GainResult b = computeTrackGain(-16.0, 0.9);
    EXPECT_DOUBLE_EQ(-2.0, b.gain);
    EXPECT_EQ("-2.00 dB", formatGain(b.gain));

    Measurement m;
    m.loudness = -18.0;
    m.peak = 1.2;
    EXPECT_DOUBLE_EQ(0.0, computeTrackGain(m).gain);
    EXPECT_DOUBLE_EQ(1.2, computeTrackGain(m).peak);
}

TEST(Gain, NegativePeakIsClamped)
{
    EXPECT_DOUBLE_EQ(0.0, computeTrackGain(-18.0, -0.1).peak);
}

TEST(Gain, CombineEqualWeights)
{
    double l = combineLoudness({-20.0, -16.0}, {});
    EXPECT_NEAR(10.0 * log10((pow(10.0, -2.0) + pow(10.0, -1.6)) / 2.0), l, 1e-9);

    // energy mean, not the arithmetic mean of -18
    EXPECT_GT(l, -18.0);
}

TEST(Gain, CombineDurationWeighted)
{
    double l = combineLoudness({-20.0, -16.0}, {300.0, 100.0});
    double expected = 10.0 * log10((300.0 * pow(10.0, -2.0) + 100.0 * pow(10.0, -1.6)) / 400.0);
    EXPECT_NEAR(expected, l, 1e-9);

    // a missing duration falls back to equal weights
    EXPECT_DOUBLE_EQ(combineLoudness({-20.0, -16.0}, {}), combineLoudness({-20.0, -16.0}, {300.0, 0.0}));
}

TEST(Gain, AlbumOfTwo)
{
    GainResult album;
    ASSERT_TRUE(computeAlbumGain({measuredTrack("a.flac", -20.0, 0.5), measuredTrack("b.flac", -16.0, 0.9)}, album));

    EXPECT_EQ("-0.45 dB", formatGain(album.gain));
    EXPECT_DOUBLE_EQ(0.9, album.peak);
}

TEST(Gain, AlbumIsOrderIndependent)
{
    GainResult ab, ba;
    std::shared_ptr<Track> a = measuredTrack("a.flac", -20.0, 0.5, true, 200.0);
    std::shared_ptr<Track> b = measuredTrack("b.flac", -16.0, 0.9, true, 100.0);

    ASSERT_TRUE(computeAlbumGain({a, b}, ab));
    ASSERT_TRUE(computeAlbumGain({b, a}, ba));
    EXPECT_NEAR(ab.gain, ba.gain, 1e-12);
    EXPECT_DOUBLE_EQ(ab.peak, ba.peak);
}

TEST(Gain, ExcludedTracksDoNotContribute)
{
    GainResult withExcluded, without;

    ASSERT_TRUE(computeAlbumGain({measuredTrack("1.flac", -20.0, 0.5),
                                  measuredTrack("2.flac", -16.0, 0.9),
                                  measuredTrack("3.flac", -5.0, 1.5, false),
                                  measuredTrack("4.flac", -40.0, 0.1, false)}, withExcluded));
    ASSERT_TRUE(computeAlbumGain({measuredTrack("1.flac", -20.0, 0.5),
                                  measuredTrack("2.flac", -16.0, 0.9)}, without));

    EXPECT_DOUBLE_EQ(without.gain, withExcluded.gain);
    EXPECT_DOUBLE_EQ(0.9, withExcluded.peak);
}

TEST(Gain, EmptyAlbum)
{
    GainResult result;
    EXPECT_FALSE(computeAlbumGain({}, result));
    EXPECT_FALSE(computeAlbumGain({measuredTrack("x.flac", -20.0, 0.5, false)}, result));

    std::shared_ptr<Track> failed = measuredTrack("y.flac", -20.0, 0.5);
    failed->setFailed(Track::MEASUREMENT_FAILURE, "Error while decoding");
    EXPECT_FALSE(computeAlbumGain({failed}, result));
}

TEST(Gain, SkipPolicy)
{
    Track track("a.flac");
    EXPECT_TRUE(needsMeasurement(track, false));

    track.alreadyTagged = true;
    EXPECT_FALSE(needsMeasurement(track, false));
    EXPECT_TRUE(needsMeasurement(track, true));
}

TEST(Gain, StoredAlbumValuesReused)
{
    Album album(1);
    for (const char *path : {"a.flac", "b.flac"})
    {
        std::shared_ptr<Track> track = std::make_shared<Track>(path, 1, true);
        track->stored.trackLoudness = -20.0;
        track->stored.trackPeak = 0.5;
        track->stored.albumLoudness = -17.55;
        track->stored.albumPeak = 0.9;
        track->setState(Track::WAITING);
        album.tracks.push_back(track);
    }

    GainResult result;
    ASSERT_TRUE(storedAlbumGain(album, result));
    EXPECT_NEAR(-0.45, result.gain, 1e-9);
    EXPECT_DOUBLE_EQ(0.9, result.peak);

    // disagreement between members forces a computation
    album.tracks[1]->stored.albumPeak = 0.8;
    EXPECT_FALSE(storedAlbumGain(album, result));
    album.tracks[1]->stored.albumPeak = 0.9;

    // so does a rescan of any member
    album.tracks[0]->rescanned = true;
    EXPECT_FALSE(storedAlbumGain(album, result));
}

TEST(Gain, StoredAlbumValuesNeedIncludedMember)
{
    Album album(1);
    for (const char *path : {"x.flac", "y.flac"})
    {
        std::shared_ptr<Track> track = std::make_shared<Track>(path, 1, false);
        track->stored.trackLoudness = -20.0;
        track->stored.trackPeak = 0.5;
        track->stored.albumLoudness = -19.0;
        track->stored.albumPeak = 0.7;
        track->setState(Track::SKIPPED);
        album.tracks.push_back(track);
    }

    GainResult result;
    EXPECT_EQ(0u, album.includedCount());
    EXPECT_FALSE(storedAlbumGain(album, result));
}
