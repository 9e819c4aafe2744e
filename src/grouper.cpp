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
#include <algorithm>
#include <grouper.hpp>


GroupMarker parseGroupMarker(const std::string &arg)
{
    if (arg == "-a" || arg == "--album")
        return GroupMarker::ALBUM;
    if (arg == "-t" || arg == "--track")
        return GroupMarker::TRACK;
    if (arg == "-e" || arg == "--exclude")
        return GroupMarker::EXCLUDE;
    return GroupMarker::NONE;
}

Grouping groupArguments(const std::vector<std::string> &args)
{
    Grouping grouping;
    std::shared_ptr<Album> current;
    GroupMarker mode = GroupMarker::NONE;
    long nextAlbumId = 1;

    for (const std::string &arg : args)
    {
        GroupMarker marker = parseGroupMarker(arg);
        switch (marker)
        {
        case GroupMarker::ALBUM:
            current = std::make_shared<Album>(nextAlbumId++);
            grouping.albums.push_back(current);
            mode = marker;
            continue;

        case GroupMarker::EXCLUDE:
            // excluded files need an album to be excluded from
            if (!current)
            {
                current = std::make_shared<Album>(nextAlbumId++);
                grouping.albums.push_back(current);
            }
            mode = marker;
            continue;

        case GroupMarker::TRACK:
            mode = marker;
            continue;

        default:
            break;
        }

        std::shared_ptr<Track> track;
        if (mode == GroupMarker::TRACK || !current)
            track = std::make_shared<Track>(fs::path(arg).make_preferred());
        else
        {
            track = std::make_shared<Track>(fs::path(arg).make_preferred(), current->id(), mode != GroupMarker::EXCLUDE);
            current->tracks.push_back(track);
        }
        grouping.tracks.push_back(track);
    }

    grouping.albums.erase(std::remove_if(grouping.albums.begin(), grouping.albums.end(),
                                         [](const std::shared_ptr<Album> &album) { return album->tracks.empty(); }),
                          grouping.albums.end());

    for (const std::shared_ptr<Album> &album : grouping.albums)
        album->resetBarrier();

    return grouping;
}
