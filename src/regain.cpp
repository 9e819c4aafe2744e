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
#include <cstdio>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <functional>
#include <thread>
#include <cmath>
#include <regain.hpp>
#include <gain.hpp>
#include <scan.hpp>
#include <tag.hpp>
#include <config.h>
#include <taglib/taglib.h>
#include <mvthreadpool/mvThreadPool.h>


ReGain::ReGain(LoudnessScanner &scanner, TagStore &store) : scanner(scanner), store(store)
{
    setNumberOfThreads(0);
}

void ReGain::version()
{
    /* Libebur128 version */
    int ebur128_v_major = 0, ebur128_v_minor = 0, ebur128_v_patch = 0;
    char ebur128_version[15] = "";
    ebur128_get_version(&ebur128_v_major, &ebur128_v_minor, &ebur128_v_patch);
    snprintf(ebur128_version, sizeof(ebur128_version), "%d.%d.%d", ebur128_v_major, ebur128_v_minor, ebur128_v_patch);

    /* Libavformat version */
    unsigned lavf_ver = 0;
    char lavf_version[15] = "";
    lavf_ver = avformat_version();
    snprintf(lavf_version, sizeof(lavf_version), "%u.%u.%u", lavf_ver>>16, lavf_ver>>8&0xff, lavf_ver&0xff);

    /* Libswresample version */
    unsigned swr_ver = 0;
    char swr_version[15] = "";
    swr_ver = swresample_version();
    snprintf(swr_version, sizeof(swr_version), "%u.%u.%u", swr_ver>>16, swr_ver>>8&0xff, swr_ver&0xff);

    /* Taglib version */
    char tlib_version[15] = "";
    snprintf(tlib_version, sizeof(tlib_version), "%d.%d.%d", TAGLIB_MAJOR_VERSION, TAGLIB_MINOR_VERSION, TAGLIB_PATCH_VERSION);

    printf("%s %s - using:\n", PROJECT_NAME, PROJECT_VER);
    printf("  %s %s\n", "libebur128", ebur128_version);
    printf("  %s %s\n", "libavformat", lavf_version);
    printf("  %s %s\n", "libswresample", swr_version);
    printf("  %s %s\n", "taglib", tlib_version);
}

void ReGain::setDryRun(bool enable)
{
    dryRun = enable;
}

void ReGain::setForce(bool enable)
{
    force = enable;
}

void ReGain::setNumberOfThreads(unsigned n)
{
    if (n == 0)
        nthreads = std::max<unsigned>(1, std::thread::hardware_concurrency());
    else
        nthreads = n;
}

void ReGain::setVerbosity(int level)
{
    verbosity = std::clamp<int>(level, 0, 4);
}

bool ReGain::processLibrary(Grouping &grouping)
{
    failures = 0;

    for (const std::shared_ptr<Album> &album : grouping.albums)
        album->resetBarrier();

    if (verbosity > 0 && grouping.tracks.size() > 0)
        std::cout << "Analysing audio files..." << std::endl;
    else if (verbosity > 0 && grouping.tracks.size() == 0)
        std::cout << "No audio files to analyse" << std::endl;

    Marvel::mvThreadPool threadpool = Marvel::mvThreadPool(nthreads);
    pool = &threadpool;

    for (const std::shared_ptr<Track> &track : grouping.tracks)
        threadpool.submit(std::bind(&ReGain::processTrack, this, track, grouping.album(track->albumId())));

    // album members submit their tagging units from inside the pool
    threadpool.wait_for_finished();
    pool = nullptr;

    return (failures == 0);
}

void ReGain::processTrack(std::shared_ptr<Track> track, std::shared_ptr<Album> album)
{
    bool ok = inspectTrack(*track);

    // track-only files are tagged right away
    if (!album)
    {
        if (ok)
        {
            std::string status = tagTrack(*track, std::nullopt, TagEncoder::ALBUM_NONE);
            printTrack(*track, nullptr, status);
        }
        return;
    }

    if (ok)
        track->setState(Track::WAITING);

    // the last member to arrive computes the aggregate, nobody waits for siblings
    if (album->arrive())
        completeAlbum(album);
}

bool ReGain::inspectTrack(Track &track)
{
    std::string error;

    if (!scanner.probe(track.filePath(), track.format, error))
    {
        failTrack(track, Track::UNSUPPORTED_FORMAT, error);
        return false;
    }

    const TagEncoder *encoder = tagEncoder(track.format);
    if (!encoder)
    {
        failTrack(track, Track::UNSUPPORTED_FORMAT, "File type not supported");
        return false;
    }

    if (!store.read(track, error))
    {
        failTrack(track, Track::TAG_READ_FAILURE, error);
        return false;
    }

    track.stored = encoder->decode(track.tags);
    track.alreadyTagged = track.stored.hasTrack();

    if (needsMeasurement(track, force))
    {
        track.setState(Track::MEASURING);

        Measurement measurement;
        std::vector<std::string> info;
        bool measured = scanner.measure(track.filePath(), measurement, info, error);

        if (verbosity >= 3 && !info.empty())
        {
            std::stringstream msg;
            for (const std::string &line : info)
                msg << "[" << track.fileName().string() << "] " << line << std::endl;
            std::cout << msg.str();
        }

        if (!measured)
        {
            failTrack(track, Track::MEASUREMENT_FAILURE, error);
            return false;
        }

        track.measuredLoudness = measurement.loudness;
        track.measuredPeak = measurement.peak;
        if (measurement.duration > 0.0)
            track.duration = measurement.duration;
        track.rescanned = true;
        track.setState(Track::MEASURED);
    }
    else
        track.setState(Track::SKIPPED);

    track.trackResult = computeTrackGain(track.loudness(), track.peak());
    return true;
}

void ReGain::completeAlbum(std::shared_ptr<Album> album)
{
    GainResult result;
    bool failed = false;

    for (const std::shared_ptr<Track> &track : album->tracks)
        if (track->includeInAlbum() && track->state() == Track::FAILED)
            failed = true;

    if (failed)
    {
        album->aggregate = Album::FAILED;

        std::stringstream err;
        err << "[Album #" << album->id() << "] Album gain not computed, an included track failed!" << std::endl;
        for (const std::shared_ptr<Track> &track : album->tracks)
            if (track->includeInAlbum() && track->state() == Track::FAILED)
                err << "\tFile scan failed [" << track->fileName().string() << "]!" << std::endl;
        std::cerr << err.str();
    }
    else if (storedAlbumGain(*album, result))
    {
        album->aggregate = Album::REUSED;
        album->result = result;
    }
    else if (computeAlbumGain(album->tracks, result))
    {
        album->aggregate = Album::COMPUTED;
        album->result = result;
    }
    else
    {
        album->aggregate = Album::EMPTY;

        if (verbosity > 0)
        {
            std::stringstream err;
            err << "[Album #" << album->id() << "] No included track, album gain skipped" << std::endl;
            std::cerr << err.str();
        }
    }

    printAlbum(*album);

    for (const std::shared_ptr<Track> &track : album->tracks)
        if (track->state() != Track::FAILED)
            pool->submit(std::bind(&ReGain::tagAlbumTrack, this, track, album));
}

void ReGain::tagAlbumTrack(std::shared_ptr<Track> track, std::shared_ptr<Album> album)
{
    bool available = (album->aggregate == Album::COMPUTED || album->aggregate == Album::REUSED);
    std::string status = tagTrack(*track, album->result, available ? TagEncoder::ALBUM_WRITE : TagEncoder::ALBUM_KEEP);
    printTrack(*track, album.get(), status);
}

std::string ReGain::tagTrack(Track &track, const std::optional<GainResult> &album, TagEncoder::ALBUMMODE mode)
{
    const TagEncoder *encoder = tagEncoder(track.format);
    TagUpdate update = encoder->encode(*track.trackResult, album, mode);
    if (mode == TagEncoder::ALBUM_KEEP)
        encoder->keepAlbumFields(track.tags, update);

    for (const std::string &warning : update.warnings)
        printWarning(track, warning);

    if (verbosity >= 4)
    {
        std::stringstream msg;
        const std::string prefix = "[" + track.fileName().string() + "] ";
        for (const TagFrame &field : update.set)
            msg << prefix << "Set " << field.key << "=" << field.value << std::endl;
        for (const std::string &key : update.remove)
            msg << prefix << "Remove " << key << std::endl;
        for (const Rva2Frame &rva2 : update.rva2)
            msg << prefix << "Set RVA2 " << rva2.identification << ": " << std::fixed << std::setprecision(2) << rva2.gain
                << " dB, peak " << std::setprecision(6) << rva2.peak.value_or(0.0) << std::endl;
        for (const std::string &identification : update.removeRva2)
            msg << prefix << "Remove RVA2 " << identification << std::endl;
        std::cout << msg.str();
    }

    std::string status;
    if (encoder->upToDate(track.tags, update))
        status = "Tags up to date";
    else if (dryRun)
        status = "Needs tag update";
    else
    {
        track.setState(Track::TAGGING);

        std::string error;
        if (!store.write(track, update, error))
        {
            failTrack(track, Track::TAG_WRITE_FAILURE, error);
            return "Tag update failed";
        }
        status = "Updated tags";
    }

    track.setState(Track::DONE);
    return status;
}

void ReGain::failTrack(Track &track, Track::FAILURE failure, const std::string &reason)
{
    track.setFailed(failure, reason);
    failures++;

    std::stringstream err;
    err << "[" << track.fileName().string() << "] " << "Error, " << failureName(failure);
    if (!reason.empty())
        err << ": " << reason;
    err << std::endl;
    std::cerr << err.str();
}

void ReGain::printWarning(const Track &track, const std::string &warning) const
{
    if (verbosity < 1)
        return;

    std::stringstream err;
    err << "[" << track.fileName().string() << "] " << "Warning: " << warning << std::endl;
    std::cerr << err.str();
}

void ReGain::printTrack(const Track &track, const Album *album, const std::string &status) const
{
    if (verbosity < 2 || !track.trackResult)
        return;

    const GainResult &result = *track.trackResult;

    // output something human-readable
    std::stringstream msg;
    msg << "\nTrack: "   << track.filePath() << "\n"
        << " Loudness: " << std::fixed << std::setprecision(2) << result.loudness << " LUFS\n"
        << " Peak:     " << std::setprecision(6) << result.peak;
    if (result.peak > 0.0)
        msg << std::setprecision(2) << " (" << 20.0 * log10(result.peak) << " dBTP)";
    msg << "\n";

    msg << " Gain:     " << std::setprecision(2) << result.gain << " dB";
    if (track.format == TrackFormat::OPUS)
        msg << " (" << gain_to_q78num(result.gain + (R128_REFERENCE_LUFS - RG_REFERENCE_LUFS)) << ")";
    msg << "\n";

    if (album && album->result && (album->aggregate == Album::COMPUTED || album->aggregate == Album::REUSED))
        msg << " Album:    " << std::setprecision(2) << album->result->gain << " dB, peak " << std::setprecision(6) << album->result->peak << "\n";

    msg << " " << (track.rescanned ? "Rescanned loudness" : "Reused stored values") << "\n"
        << " " << status << std::endl;
    std::cout << msg.str();
}

void ReGain::printAlbum(const Album &album) const
{
    if (verbosity < 2 || !album.result)
        return;

    std::stringstream msg;
    msg << "\nAlbum #" << album.id() << ": " << album.tracks.size() << " tracks, " << album.includedCount() << " included\n"
        << " Loudness: " << std::fixed << std::setprecision(2) << album.result->loudness << " LUFS\n"
        << " Peak:     " << std::setprecision(6) << album.result->peak;
    if (album.result->peak > 0.0)
        msg << std::setprecision(2) << " (" << 20.0 * log10(album.result->peak) << " dBTP)";
    msg << "\n"
        << " Gain:     " << std::setprecision(2) << album.result->gain << " dB\n";
    if (album.aggregate == Album::REUSED)
        msg << " Reused stored album values\n";
    std::cout << msg.str();
}
