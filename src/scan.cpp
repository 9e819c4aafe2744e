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
#include <sstream>
#include <algorithm>
#include <scan.hpp>


static std::string av_error(int rc)
{
    char errbuf[2048];
    av_strerror(rc, errbuf, sizeof(errbuf));
    return errbuf;
}

static void scan_av_log(void *avcl, int level, const char *fmt, va_list args)
{
    (void)avcl; (void)level; (void)fmt; (void)args;
}

FFmpegScanner::FFmpegScanner()
{
#if ( LIBAVFORMAT_VERSION_INT < AV_VERSION_INT(58,9,100) )
    av_register_all();
#endif

    av_log_set_callback(scan_av_log);
}

TrackFormat FFmpegScanner::trackFormat(const std::string &container, enum AVCodecID codec)
{
    if (container == "mp3")
        return TrackFormat::MP3;

    if (container == "flac")
        return TrackFormat::FLAC;

    // must separate because the tags live in different file classes
    if (container == "ogg")
    {
        switch (codec)
        {
        case AV_CODEC_ID_OPUS:
            return TrackFormat::OPUS;
        case AV_CODEC_ID_VORBIS:
            return TrackFormat::OGG_VORBIS;
        case AV_CODEC_ID_FLAC:
            return TrackFormat::OGG_FLAC;
        case AV_CODEC_ID_SPEEX:
            return TrackFormat::OGG_SPEEX;
        default:
            return TrackFormat::UNKNOWN;
        }
    }

    // "mov,mp4,m4a,3gp,3g2,mj2"
    if (container.find("mp4") != std::string::npos)
        return TrackFormat::MP4;

    return TrackFormat::UNKNOWN;
}

bool FFmpegScanner::openStream(const fs::path &path, AVFormatContext **container, AVCodecContext **ctx, int &stream_id, std::string &error)
{
    int rc = avformat_open_input(container, path.string().c_str(), NULL, NULL);
    if (rc < 0)
    {
        error = "Could not open input: " + av_error(rc);
        return false;
    }

    rc = avformat_find_stream_info(*container, NULL);
    if (rc < 0)
    {
        avformat_close_input(container);
        error = "Could not find stream info: " + av_error(rc);
        return false;
    }

    /* Select the audio stream */
    AVCodec *codec = NULL;

#if (LIBAVFORMAT_VERSION_INT < AV_VERSION_INT(59,0,100))
    stream_id = av_find_best_stream(*container, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
#else
    stream_id = av_find_best_stream(*container, AVMEDIA_TYPE_AUDIO, -1, -1, const_cast<const AVCodec**>(&codec), 0);
#endif

    if (stream_id < 0 || codec == NULL)
    {
        avformat_close_input(container);
        error = "Could not find audio stream!";
        return false;
    }

    /* Create decoding context */
    *ctx = avcodec_alloc_context3(codec);
    if (!*ctx)
    {
        avformat_close_input(container);
        error = "Could not allocate audio codec context!";
        return false;
    }

    avcodec_parameters_to_context(*ctx, (*container)->streams[stream_id]->codecpar);

    /* Init the audio decoder */
    rc = avcodec_open2(*ctx, codec, NULL);
    if (rc < 0)
    {
        avcodec_free_context(ctx);
        avformat_close_input(container);
        error = "Could not open codec: " + av_error(rc);
        return false;
    }
    return true;
}

bool FFmpegScanner::probe(const fs::path &path, TrackFormat &format, std::string &error)
{
    AVFormatContext *container = NULL;
    AVCodecContext *ctx = NULL;
    int stream_id = -1;

    if (!openStream(path, &container, &ctx, stream_id, error))
        return false;

    format = trackFormat(container->iformat->name, ctx->codec_id);

    avcodec_free_context(&ctx);
    avformat_close_input(&container);
    return true;
}

bool FFmpegScanner::measure(const fs::path &path, Measurement &measurement, std::vector<std::string> &info, std::string &error)
{
    AVFormatContext *container = NULL;
    AVCodecContext *ctx = NULL;
    int stream_id = -1;

    if (!openStream(path, &container, &ctx, stream_id, error))
        return false;

    info.push_back(std::string("Container: ") + container->iformat->long_name + " [" + container->iformat->name + "]");

    /* Try to get default channel layout (they aren’t specified in .wav files) */
#if (LIBAVUTIL_VERSION_MAJOR < 58)
    if (!ctx->channel_layout)
        ctx->channel_layout = av_get_default_channel_layout(ctx->channels);
    int channels = ctx->channels;
#else
    if (ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC)
        av_channel_layout_default(&ctx->ch_layout, ctx->ch_layout.nb_channels);
    int channels = ctx->ch_layout.nb_channels;
#endif

    /* Show some information about the file, only show bits/sample where it makes sense */
    char infobuf[512];
#if (LIBAVUTIL_VERSION_MAJOR < 58)
    av_get_channel_layout_string(infobuf, sizeof(infobuf), -1, ctx->channel_layout);
#else
    av_channel_layout_describe(&ctx->ch_layout, infobuf, sizeof(infobuf));
#endif

    std::stringstream stream;
    stream << "Stream #" << stream_id << ": " << ctx->codec->long_name << ", ";
    if (ctx->bits_per_raw_sample > 0 || ctx->bits_per_coded_sample > 0)
        stream << (ctx->bits_per_raw_sample > 0 ? ctx->bits_per_raw_sample : ctx->bits_per_coded_sample) << " bit, ";
    stream << ctx->sample_rate << " Hz, " << channels << " ch, " << infobuf;
    info.push_back(stream.str());

    ebur128_state *ebur128 = ebur128_init(channels, ctx->sample_rate, EBUR128_MODE_I | EBUR128_MODE_TRUE_PEAK);
    if (ebur128 == NULL)
    {
        avcodec_free_context(&ctx);
        avformat_close_input(&container);
        error = "Could not initialize EBU R128 scanner!";
        return false;
    }

    AVFrame *frame = av_frame_alloc();
    if (frame == NULL)
    {
        ebur128_destroy(&ebur128);
        avcodec_free_context(&ctx);
        avformat_close_input(&container);
        error = "Could not allocate frame!";
        return false;
    }

    SwrContext *swr = swr_alloc();
    AVPacket *packet = av_packet_alloc();
    unsigned long long samples = 0;
    bool ok = (swr != NULL && packet != NULL);
    int rc = 0;

    if (!ok)
        error = "Could not allocate resampler!";

    // a NULL packet at the end drains the decoder
    bool eof = false;
    while (ok && !eof)
    {
        if (av_read_frame(container, packet) < 0)
            eof = true;
        else if (packet->stream_index != stream_id)
        {
            av_packet_unref(packet);
            continue;
        }

        rc = avcodec_send_packet(ctx, eof ? NULL : packet);
        av_packet_unref(packet);
        if (rc < 0 && rc != AVERROR_EOF)
        {
            error = "Error while sending a packet to the decoder: " + av_error(rc);
            ok = false;
            break;
        }

        while (ok)
        {
            rc = avcodec_receive_frame(ctx, frame);
            if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF)
                break;
            else if (rc < 0)
            {
                error = "Error while receiving a frame from the decoder: " + av_error(rc);
                ok = false;
                break;
            }

            samples += frame->nb_samples;
            ok = scanFrame(ebur128, frame, swr, error);
            av_frame_unref(frame);
        }
    }

    /* Free */
    av_packet_free(&packet);
    av_frame_free(&frame);
    swr_free(&swr);
    int sample_rate = ctx->sample_rate;
    avcodec_free_context(&ctx);
    avformat_close_input(&container);

    if (!ok)
    {
        ebur128_destroy(&ebur128);
        return false;
    }

    /* Save results */
    double global_loudness;
    if (ebur128_loudness_global(ebur128, &global_loudness) != EBUR128_SUCCESS)
    {
        ebur128_destroy(&ebur128);
        error = "Error while calculating loudness!";
        return false;
    }

    // silence gates out every block
    if (global_loudness == -HUGE_VAL)
    {
        ebur128_destroy(&ebur128);
        error = "No audible content, loudness is undefined!";
        return false;
    }

    double peak = 0.0;
    for (unsigned ch = 0; ch < ebur128->channels; ch++)
    {
        double tmp;

        if (ebur128_true_peak(ebur128, ch, &tmp) == EBUR128_SUCCESS)
            peak = std::max<double>(peak, tmp);
    }
    ebur128_destroy(&ebur128);

    measurement.loudness = global_loudness;
    measurement.peak = peak;
    measurement.duration = (sample_rate > 0) ? double(samples) / sample_rate : 0.0;
    return true;
}

bool FFmpegScanner::scanFrame(ebur128_state *ebur128, AVFrame *frame, SwrContext *swr, std::string &error)
{
    // float output keeps inter-sample peaks above full scale
#if (LIBAVUTIL_VERSION_MAJOR < 58)
    int ret = 0;
    swr_alloc_set_opts(swr,
                       frame->channel_layout,  AV_SAMPLE_FMT_FLT,  frame->sample_rate, // out_channel
                       frame->channel_layout, (AVSampleFormat) frame->format, frame->sample_rate, // in_channel
                       0, NULL); // log_offset, log_ctx
    int channels = frame->channels;
#else
    int ret = swr_alloc_set_opts2(&swr,
                                  &frame->ch_layout,  AV_SAMPLE_FMT_FLT,  frame->sample_rate, // out_channel
                                  &frame->ch_layout, (AVSampleFormat) frame->format, frame->sample_rate, // in_channel
                                  0, NULL); // log_offset, log_ctx
    int channels = frame->ch_layout.nb_channels;
#endif

    int rc = swr_init(swr);
    if (rc < 0 || ret < 0)
    {
        error = "Could not open SWResample: " + av_error(rc < 0 ? rc : ret);
        return false;
    }

    int out_linesize;
    int out_size = av_samples_get_buffer_size(&out_linesize, channels, frame->nb_samples, AV_SAMPLE_FMT_FLT, 0);
    if (out_size < 0)
    {
        swr_close(swr);
        error = "Invalid frame size";
        return false;
    }
    uint8_t *out_data = (uint8_t *) av_malloc(out_size);

    if (out_data == NULL || swr_convert(swr, (uint8_t**) &out_data, frame->nb_samples, (const uint8_t**) frame->data, frame->nb_samples) < 0)
    {
        swr_close(swr);
        av_free(out_data);
        error = "Cannot convert";
        return false;
    }

    rc = ebur128_add_frames_float(ebur128, (float *) out_data, frame->nb_samples);

    swr_close(swr);
    av_free(out_data);

    if (rc != EBUR128_SUCCESS)
    {
        error = "Error filtering";
        return false;
    }
    return true;
}
