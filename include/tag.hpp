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
#ifndef TAG_H
#define TAG_H

#include <string>
#include <track.hpp>
#include <tagcodec.hpp>

/*
 * Persistence of gain fields. read() fills track.tags with the gain related
 * fields the file carries (and track.duration when the container knows it),
 * write() applies an update. Both report failures through the error string.
 */
class TagStore
{
public:
    virtual ~TagStore() = default;

    virtual bool read(Track &track, std::string &error) = 0;
    virtual bool write(const Track &track, const TagUpdate &update, std::string &error) = 0;
};

/* TagLib backed store; writes go to a copy that replaces the original only once saved */
class TagLibStore : public TagStore
{
public:
    bool read(Track &track, std::string &error) override;
    bool write(const Track &track, const TagUpdate &update, std::string &error) override;

    static fs::path temporaryPath(const fs::path &path);

private:
    bool readTags(const fs::path &path, TrackFormat format, ExistingTags &tags, std::optional<double> &duration, std::string &error);
    bool writeTags(const fs::path &path, TrackFormat format, const TagUpdate &update, std::string &error);
};

#endif
