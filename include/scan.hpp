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
#ifndef SCAN_H
#define SCAN_H

#include <string>
#include <vector>
#include <filesystem>
#include <track.hpp>

extern "C" {
#include <ebur128.h>
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswresample/swresample.h>
#include <libavutil/avutil.h>
#include <libavutil/common.h>
#include <libavutil/opt.h>
}

namespace fs = std::filesystem;

/*
 * Container probing and loudness measurement. Implementations must be safe
 * to call from several workers at once, each on a different file.
 */
class LoudnessScanner
{
public:
    virtual ~LoudnessScanner() = default;

    virtual bool probe(const fs::path &path, TrackFormat &format, std::string &error) = 0;

    /* info receives human readable container/stream lines */
    virtual bool measure(const fs::path &path, Measurement &measurement, std::vector<std::string> &info, std::string &error) = 0;
};

class FFmpegScanner : public LoudnessScanner
{
public:
    FFmpegScanner();

    bool probe(const fs::path &path, TrackFormat &format, std::string &error) override;
    bool measure(const fs::path &path, Measurement &measurement, std::vector<std::string> &info, std::string &error) override;

    static TrackFormat trackFormat(const std::string &container, enum AVCodecID codec);

private:
    bool openStream(const fs::path &path, AVFormatContext **container, AVCodecContext **ctx, int &stream_id, std::string &error);
    bool scanFrame(ebur128_state *ebur128, AVFrame *frame, SwrContext *swr, std::string &error);
};

#endif
