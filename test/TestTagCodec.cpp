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
 * Unit tests for src/tagcodec.cpp
 */

#include <algorithm>
#include <gain.hpp>
#include <tagcodec.hpp>

#include <gtest/gtest.h>

static std::string valueOf(const TagUpdate &update, const std::string &key)
{
    for (const TagFrame &field : update.set)
        if (field.key == key)
            return field.value;
    return "";
}

static bool removes(const TagUpdate &update, const std::string &key)
{
    return std::find(update.remove.begin(), update.remove.end(), key) != update.remove.end();
}

TEST(TagCodec, Format)
{
    EXPECT_EQ("2.00 dB", formatGain(2.0));
    EXPECT_EQ("-0.45 dB", formatGain(-0.4452));
    EXPECT_EQ("0.000000", formatPeak(0.0));
    EXPECT_EQ("0.988553", formatPeak(0.9885530));
    EXPECT_EQ(-768, gain_to_q78num(-3.0));
    EXPECT_EQ(128, gain_to_q78num(0.5));
}

TEST(TagCodec, ParseNumber)
{
    double n = 0.0;
    EXPECT_TRUE(parseNumber("-2.00 dB", n));
    EXPECT_DOUBLE_EQ(-2.0, n);
    EXPECT_TRUE(parseNumber("  +1.5dB", n));
    EXPECT_DOUBLE_EQ(1.5, n);
    EXPECT_TRUE(parseNumber("0.988553", n));
    EXPECT_DOUBLE_EQ(0.988553, n);
    EXPECT_TRUE(parseNumber("-768", n));
    EXPECT_DOUBLE_EQ(-768.0, n);

    EXPECT_FALSE(parseNumber("", n));
    EXPECT_FALSE(parseNumber("dB", n));
    EXPECT_FALSE(parseNumber("nan", n));

    // the number ends before an exponent or a bare dot
    EXPECT_TRUE(parseNumber("2e1 dB", n));
    EXPECT_DOUBLE_EQ(2.0, n);
    EXPECT_TRUE(parseNumber("-3.E2", n));
    EXPECT_DOUBLE_EQ(-3.0, n);
    EXPECT_FALSE(parseNumber(".5", n));
    EXPECT_FALSE(parseNumber("inf", n));
    EXPECT_FALSE(parseNumber("- 1", n));
}

TEST(TagCodec, FormatDispatch)
{
    EXPECT_EQ(nullptr, tagEncoder(TrackFormat::UNKNOWN));
    EXPECT_EQ(tagEncoder(TrackFormat::FLAC), tagEncoder(TrackFormat::OGG_VORBIS));
    EXPECT_NE(tagEncoder(TrackFormat::FLAC), tagEncoder(TrackFormat::OPUS));
    EXPECT_NE(nullptr, tagEncoder(TrackFormat::MP3));
    EXPECT_NE(nullptr, tagEncoder(TrackFormat::MP4));
}

TEST(TagCodec, VorbisCommentTrackOnly)
{
    TagUpdate update = tagEncoder(TrackFormat::FLAC)->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_NONE);

    EXPECT_EQ("2.00 dB", valueOf(update, "REPLAYGAIN_TRACK_GAIN"));
    EXPECT_EQ("0.500000", valueOf(update, "REPLAYGAIN_TRACK_PEAK"));
    EXPECT_EQ(2u, update.set.size());

    EXPECT_TRUE(removes(update, "REPLAYGAIN_ALBUM_GAIN"));
    EXPECT_TRUE(removes(update, "REPLAYGAIN_ALBUM_PEAK"));
    EXPECT_TRUE(removes(update, "REPLAYGAIN_REFERENCE_LOUDNESS"));
    EXPECT_TRUE(removes(update, "R128_TRACK_GAIN"));
    EXPECT_TRUE(removes(update, "R128_ALBUM_GAIN"));
    EXPECT_TRUE(update.rva2.empty());
    EXPECT_EQ(0u, update.id3v2Version);
}

TEST(TagCodec, VorbisCommentAlbum)
{
    GainResult album = computeTrackGain(-17.5548, 0.9);
    TagUpdate update = tagEncoder(TrackFormat::OGG_VORBIS)->encode(computeTrackGain(-16.0, 0.9), album, TagEncoder::ALBUM_WRITE);

    EXPECT_EQ("-2.00 dB", valueOf(update, "REPLAYGAIN_TRACK_GAIN"));
    EXPECT_EQ("-0.45 dB", valueOf(update, "REPLAYGAIN_ALBUM_GAIN"));
    EXPECT_EQ("0.900000", valueOf(update, "REPLAYGAIN_ALBUM_PEAK"));
    EXPECT_FALSE(removes(update, "REPLAYGAIN_ALBUM_GAIN"));
}

TEST(TagCodec, AlbumKeepLeavesAlbumFields)
{
    TagUpdate update = tagEncoder(TrackFormat::FLAC)->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_KEEP);

    EXPECT_EQ("", valueOf(update, "REPLAYGAIN_ALBUM_GAIN"));
    EXPECT_FALSE(removes(update, "REPLAYGAIN_ALBUM_GAIN"));
    EXPECT_FALSE(removes(update, "REPLAYGAIN_ALBUM_PEAK"));
}

TEST(TagCodec, OpusR128)
{
    GainResult track = computeTrackGain(-20.0, 0.5);
    GainResult album = computeTrackGain(-18.0, 0.7);
    TagUpdate update = tagEncoder(TrackFormat::OPUS)->encode(track, album, TagEncoder::ALBUM_WRITE);

    // -20 LUFS is 3 dB above -23 LUFS
    EXPECT_EQ("-768", valueOf(update, "R128_TRACK_GAIN"));
    EXPECT_EQ("-1280", valueOf(update, "R128_ALBUM_GAIN"));
    EXPECT_EQ("2.00 dB", valueOf(update, "REPLAYGAIN_TRACK_GAIN"));
    EXPECT_FALSE(removes(update, "R128_TRACK_GAIN"));

    TagUpdate trackOnly = tagEncoder(TrackFormat::OPUS)->encode(track, std::nullopt, TagEncoder::ALBUM_NONE);
    EXPECT_TRUE(removes(trackOnly, "R128_ALBUM_GAIN"));
}

TEST(TagCodec, OpusR128Clipped)
{
    std::vector<std::string> warnings;
    EXPECT_EQ(32767, OpusEncoder::r128Gain(200.0, "track", warnings));
    EXPECT_EQ(-32768, OpusEncoder::r128Gain(-200.0, "track", warnings));
    EXPECT_EQ(2u, warnings.size());

    warnings.clear();
    EXPECT_EQ(-768, OpusEncoder::r128Gain(2.0, "track", warnings));
    EXPECT_TRUE(warnings.empty());
}

TEST(TagCodec, Id3v2)
{
    GainResult album = computeTrackGain(-17.0, 0.95);
    TagUpdate update = tagEncoder(TrackFormat::MP3)->encode(computeTrackGain(-20.0, 0.5), album, TagEncoder::ALBUM_WRITE);

    EXPECT_EQ("2.00 dB", valueOf(update, "REPLAYGAIN_TRACK_GAIN"));
    EXPECT_EQ("-1.00 dB", valueOf(update, "REPLAYGAIN_ALBUM_GAIN"));
    EXPECT_EQ(4u, update.id3v2Version);

    ASSERT_EQ(2u, update.rva2.size());
    EXPECT_EQ("track", update.rva2[0].identification);
    EXPECT_DOUBLE_EQ(2.0, update.rva2[0].gain);
    EXPECT_DOUBLE_EQ(0.5, *update.rva2[0].peak);
    EXPECT_EQ("album", update.rva2[1].identification);
    EXPECT_DOUBLE_EQ(-1.0, update.rva2[1].gain);

    TagUpdate trackOnly = tagEncoder(TrackFormat::MP3)->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_NONE);
    ASSERT_EQ(1u, trackOnly.rva2.size());
    ASSERT_EQ(1u, trackOnly.removeRva2.size());
    EXPECT_EQ("album", trackOnly.removeRva2[0]);
}

TEST(TagCodec, Rva2PeakClipped)
{
    std::vector<std::string> warnings;
    EXPECT_DOUBLE_EQ(65535.0 / 32768.0, Id3v2Encoder::rva2Peak(3.0, "track", warnings));
    EXPECT_EQ(1u, warnings.size());

    warnings.clear();
    EXPECT_DOUBLE_EQ(0.5, Id3v2Encoder::rva2Peak(0.5, "track", warnings));
    EXPECT_TRUE(warnings.empty());
}

TEST(TagCodec, Mp4)
{
    TagUpdate update = tagEncoder(TrackFormat::MP4)->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_NONE);

    EXPECT_EQ("2.00 dB", valueOf(update, "----:com.apple.iTunes:REPLAYGAIN_TRACK_GAIN"));
    EXPECT_EQ("0.500000", valueOf(update, "----:com.apple.iTunes:REPLAYGAIN_TRACK_PEAK"));
    EXPECT_TRUE(removes(update, "----:com.apple.iTunes:REPLAYGAIN_ALBUM_GAIN"));
    EXPECT_TRUE(removes(update, "----:org.hydrogenaudio.replaygain:REPLAYGAIN_TRACK_GAIN"));
    EXPECT_TRUE(removes(update, "----:org.hydrogenaudio.replaygain:REPLAYGAIN_ALBUM_GAIN"));

    TagUpdate keep = tagEncoder(TrackFormat::MP4)->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_KEEP);
    EXPECT_TRUE(removes(keep, "----:org.hydrogenaudio.replaygain:REPLAYGAIN_TRACK_GAIN"));
    EXPECT_TRUE(removes(keep, "----:org.hydrogenaudio.replaygain:REPLAYGAIN_ALBUM_GAIN"));
}

TEST(TagCodec, Mp4KeepMovesLegacyAlbumFields)
{
    const TagEncoder *encoder = tagEncoder(TrackFormat::MP4);

    ExistingTags tags;
    tags.fields = {{"----:org.hydrogenaudio.replaygain:REPLAYGAIN_ALBUM_GAIN", "1.00 dB"},
                   {"----:org.hydrogenaudio.replaygain:REPLAYGAIN_ALBUM_PEAK", "0.700000"},
                   {"----:com.apple.iTunes:REPLAYGAIN_ALBUM_PEAK", "0.800000"}};

    TagUpdate update = encoder->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_KEEP);
    encoder->keepAlbumFields(tags, update);

    EXPECT_EQ("1.00 dB", valueOf(update, "----:com.apple.iTunes:REPLAYGAIN_ALBUM_GAIN"));
    // an iTunes value already present wins over the old mean
    EXPECT_EQ("", valueOf(update, "----:com.apple.iTunes:REPLAYGAIN_ALBUM_PEAK"));
    EXPECT_FALSE(removes(update, "----:com.apple.iTunes:REPLAYGAIN_ALBUM_PEAK"));
    EXPECT_TRUE(removes(update, "----:org.hydrogenaudio.replaygain:REPLAYGAIN_ALBUM_GAIN"));
    EXPECT_TRUE(removes(update, "----:org.hydrogenaudio.replaygain:REPLAYGAIN_ALBUM_PEAK"));

    // other schemes keep album fields in place already
    TagUpdate flac = tagEncoder(TrackFormat::FLAC)->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_KEEP);
    const size_t before = flac.set.size();
    tagEncoder(TrackFormat::FLAC)->keepAlbumFields(tags, flac);
    EXPECT_EQ(before, flac.set.size());
}

TEST(TagCodec, DecodeVorbisComment)
{
    ExistingTags tags;
    tags.fields = {{"replaygain_track_gain", "-2.00 dB"}, {"REPLAYGAIN_TRACK_PEAK", "0.9"},
                   {"REPLAYGAIN_ALBUM_GAIN", "bogus"}};

    StoredGain stored = tagEncoder(TrackFormat::FLAC)->decode(tags);
    ASSERT_TRUE(stored.hasTrack());
    EXPECT_DOUBLE_EQ(-16.0, *stored.trackLoudness);
    EXPECT_DOUBLE_EQ(0.9, *stored.trackPeak);
    EXPECT_FALSE(stored.albumLoudness.has_value());
    EXPECT_FALSE(stored.hasAlbum());
}

TEST(TagCodec, DecodeOpusFallsBackToR128)
{
    ExistingTags tags;
    tags.fields = {{"R128_TRACK_GAIN", "-768"}, {"REPLAYGAIN_TRACK_PEAK", "0.5"}};

    StoredGain stored = tagEncoder(TrackFormat::OPUS)->decode(tags);
    ASSERT_TRUE(stored.hasTrack());
    EXPECT_DOUBLE_EQ(-20.0, *stored.trackLoudness);
}

TEST(TagCodec, DecodeId3v2FallsBackToRva2)
{
    ExistingTags tags;
    Rva2Frame frame;
    frame.identification = "track";
    frame.gain = 2.0;
    frame.peak = 0.5;
    tags.rva2.push_back(frame);

    StoredGain stored = tagEncoder(TrackFormat::MP3)->decode(tags);
    ASSERT_TRUE(stored.hasTrack());
    EXPECT_DOUBLE_EQ(-20.0, *stored.trackLoudness);
    EXPECT_DOUBLE_EQ(0.5, *stored.trackPeak);
    EXPECT_FALSE(stored.hasAlbum());
}

TEST(TagCodec, DecodeMp4LegacyMean)
{
    ExistingTags tags;
    tags.fields = {{"----:org.hydrogenaudio.replaygain:REPLAYGAIN_TRACK_GAIN", "1.00 dB"},
                   {"----:org.hydrogenaudio.replaygain:REPLAYGAIN_TRACK_PEAK", "0.7"},
                   {"----:com.apple.iTunes:REPLAYGAIN_TRACK_GAIN", "3.00 dB"}};

    StoredGain stored = tagEncoder(TrackFormat::MP4)->decode(tags);
    ASSERT_TRUE(stored.hasTrack());
    EXPECT_DOUBLE_EQ(-21.0, *stored.trackLoudness);
    EXPECT_DOUBLE_EQ(0.7, *stored.trackPeak);
}

TEST(TagCodec, UpToDate)
{
    const TagEncoder *encoder = tagEncoder(TrackFormat::FLAC);
    TagUpdate update = encoder->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_NONE);

    ExistingTags tags;
    tags.fields = {{"REPLAYGAIN_TRACK_GAIN", "2.00 dB"}, {"REPLAYGAIN_TRACK_PEAK", "0.500000"}};
    EXPECT_TRUE(encoder->upToDate(tags, update));

    // a different spelling is rewritten
    tags.fields[0].key = "replaygain_track_gain";
    EXPECT_FALSE(encoder->upToDate(tags, update));
    tags.fields[0].key = "REPLAYGAIN_TRACK_GAIN";

    // so is a duplicate
    tags.fields.push_back({"REPLAYGAIN_TRACK_GAIN", "2.00 dB"});
    EXPECT_FALSE(encoder->upToDate(tags, update));
    tags.fields.pop_back();

    // and an obsolete field
    tags.fields.push_back({"REPLAYGAIN_REFERENCE_LOUDNESS", "89.0 dB"});
    EXPECT_FALSE(encoder->upToDate(tags, update));
}

TEST(TagCodec, UpToDateId3v2)
{
    const TagEncoder *encoder = tagEncoder(TrackFormat::MP3);
    TagUpdate update = encoder->encode(computeTrackGain(-20.0, 0.5), std::nullopt, TagEncoder::ALBUM_NONE);

    ExistingTags tags;
    tags.fields = {{"REPLAYGAIN_TRACK_GAIN", "2.00 dB"}, {"REPLAYGAIN_TRACK_PEAK", "0.500000"}};
    tags.rva2 = update.rva2;
    tags.id3v2Version = 4;
    EXPECT_TRUE(encoder->upToDate(tags, update));

    tags.id3v2Version = 3;
    EXPECT_FALSE(encoder->upToDate(tags, update));
    tags.id3v2Version = 4;

    Rva2Frame album;
    album.identification = "album";
    album.gain = -1.0;
    tags.rva2.push_back(album);
    EXPECT_FALSE(encoder->upToDate(tags, update));
}
