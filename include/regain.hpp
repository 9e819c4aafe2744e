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
#ifndef REGAIN_H
#define REGAIN_H

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <track.hpp>
#include <tagcodec.hpp>

class LoudnessScanner;
class TagStore;

namespace Marvel {
    class mvThreadPool;
}

class ReGain
{
public:
    ReGain(LoudnessScanner &scanner, TagStore &store);

    static void version();

    void setDryRun(bool enable);
    void setForce(bool enable);
    void setNumberOfThreads(unsigned n);
    void setVerbosity(int level);

    /* Measures and tags every track of the grouping; false if any track failed */
    bool processLibrary(Grouping &grouping);

    unsigned long long failedTracks() const { return failures.load(); }
    unsigned numberOfThreads() const { return nthreads; }

    int verbosity = 2;

private:
    LoudnessScanner &scanner;
    TagStore &store;
    bool dryRun = false;
    bool force = false;
    unsigned nthreads = 1;
    Marvel::mvThreadPool *pool = nullptr;
    std::atomic<unsigned long long> failures{0};

    void processTrack(std::shared_ptr<Track> track, std::shared_ptr<Album> album);
    bool inspectTrack(Track &track);
    void completeAlbum(std::shared_ptr<Album> album);
    void tagAlbumTrack(std::shared_ptr<Track> track, std::shared_ptr<Album> album);
    std::string tagTrack(Track &track, const std::optional<GainResult> &album, TagEncoder::ALBUMMODE mode);

    void failTrack(Track &track, Track::FAILURE failure, const std::string &reason);
    void printWarning(const Track &track, const std::string &warning) const;
    void printTrack(const Track &track, const Album *album, const std::string &status) const;
    void printAlbum(const Album &album) const;
};

#endif
