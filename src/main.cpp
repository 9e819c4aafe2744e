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
#include <string>
#include <vector>
#include <iostream>
#include <chrono>
#include <cmath>
#include <algorithm>
#include <regain.hpp>
#include <grouper.hpp>
#include <scan.hpp>
#include <tag.hpp>
#include <config.h>
#include <argparse/argparse.hpp>

#define EXIT_USAGE 2


static void printUsage(const argparse::ArgumentParser &parser)
{
    std::cerr << parser.help().rdbuf() << std::endl;
    std::cerr << "Files are grouped by markers placed between them:\n"
              << "  -a, --album    following files form a new album\n"
              << "  -t, --track    following files get track gain only\n"
              << "  -e, --exclude  following files join the album but not its gain computation\n"
              << "Files given before any marker are tagged with track gain only.\n"
              << "Writes MP3 (ID3v2), FLAC, Ogg Vorbis/FLAC/Speex, Opus and MP4 tags." << std::endl;
}

/*
 * Separates options (and their values) from the ordered stream of album
 * markers and file names, which is handed to the grouper unchanged.
 * Everything after "--" is a file name.
 */
static void splitArguments(int argc, char *argv[], std::vector<std::string> &options, std::vector<std::string> &files)
{
    static const std::vector<std::string> with_value = {"-j", "--jobs", "-V", "--verbosity"};

    options.push_back(argv[0]);

    for (int i = 1; i < argc; i++)
    {
        const std::string arg = argv[i];

        if (arg == "--")
        {
            for (i++; i < argc; i++)
                files.push_back(argv[i]);
            break;
        }

        if (parseGroupMarker(arg) != GroupMarker::NONE || arg.size() < 2 || arg[0] != '-')
            files.push_back(arg);
        else
        {
            options.push_back(arg);
            if (std::find(with_value.begin(), with_value.end(), arg) != with_value.end() && i + 1 < argc)
                options.push_back(argv[++i]);
        }
    }
}

int main(int argc, char *argv[])
{
    auto t1 = std::chrono::high_resolution_clock::now();

    /* Define arguments */
    argparse::ArgumentParser parser(PROJECT_NAME, PROJECT_VER, argparse::default_arguments::none);

    parser.add_argument("--help", "-h").default_value(false).implicit_value(true)
        .help("Show help information and exit.");

    parser.add_argument("--version", "-v").default_value(false).implicit_value(true)
        .help("Show version number and exit.");

    parser.add_argument("--dry-run", "-n").default_value(false).implicit_value(true)
        .help("Calculate and print gain values, don't write tags.");

    parser.add_argument("--force", "-f").default_value(false).implicit_value(true)
        .help("Recalculate gain even for files that are already tagged.");

    parser.add_argument("--jobs", "-j").default_value(0).nargs(1)
        .action([](const std::string& value) { return std::stoi(value); })
        .help("Set number of worker threads (n). 0 = auto. Default is 0.");

    parser.add_argument("--verbosity", "-V").default_value(2).nargs(1)
        .action([](const std::string& value) { return std::stoi(value); })
        .help("Set verbosity level.\n"
              "\t0: Only error messages are printed.\n"
              "\t1: Warnings and summary.\n"
              "\t2: Print audio gain and peak values.\n"
              "\t3: Print audio gain and peak values, as well as container and stream info.\n"
              "\t4: Debug, print every tag field written.");

    parser.add_argument("--quiet", "-q").default_value(false).implicit_value(true)
        .help("Low verbosity level. Equal to \"-V 1\".");

    parser.add_argument("--debug").default_value(false).implicit_value(true)
        .help("Highest verbosity level. Equal to \"-V 4\".");

    /* Try parsing arguments, exit on error */
    std::vector<std::string> options;
    std::vector<std::string> files;
    splitArguments(argc, argv, options, files);

    try
    {
        parser.parse_args(options);
    }
    catch (const std::exception& err)
    {
        std::cerr << err.what() << std::endl << std::endl;
        printUsage(parser);
        return EXIT_USAGE;
    }

    if (parser.get<bool>("--help"))
    {
        std::cout << parser.help().rdbuf() << std::endl;
        return 0;
    }

    if (parser.get<bool>("--version"))
    {
        ReGain::version();
        return 0;
    }

    bool found = false;
    for (const std::string &arg : files)
        if (parseGroupMarker(arg) == GroupMarker::NONE)
            found = true;

    if (!found)
    {
        std::cerr << "No files provided!" << std::endl << std::endl;
        printUsage(parser);
        return EXIT_USAGE;
    }

    /* libebur128 version check -- versions before 1.2.4 aren’t recommended */
    int ebur128_v_major = 0, ebur128_v_minor = 0, ebur128_v_patch = 0;
    ebur128_get_version(&ebur128_v_major, &ebur128_v_minor, &ebur128_v_patch);
    if (ebur128_v_major <= 1 && ebur128_v_minor <= 2 && ebur128_v_patch < 4)
        std::cerr << "Old libebur128 version detected. Please update to version 1.2.4 or newer!" << std::endl;

    /* Set stdout float formatting */
    std::cout.setf(std::ios::fixed, std::ios::floatfield); // set fixed floating format
    std::cout.precision(2); // for fixed format, two decimal places

    /* Create regain object and set options */
    FFmpegScanner scanner;
    TagLibStore store;
    ReGain rg(scanner, store);

    rg.setVerbosity(parser.get<int>("--verbosity"));
    if (parser.get<bool>("--quiet"))
        rg.setVerbosity(1);
    if (parser.get<bool>("--debug"))
        rg.setVerbosity(4);

    rg.setDryRun(parser.get<bool>("--dry-run"));
    rg.setForce(parser.get<bool>("--force"));

    int jobs = parser.get<int>("--jobs");
    rg.setNumberOfThreads(jobs > 0 ? unsigned(jobs) : 0);

    Grouping grouping = groupArguments(files);
    bool ok = rg.processLibrary(grouping);

    auto t2 = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::ratio<1,1>>(t2 - t1).count();

    if (rg.verbosity > 0)
    {
        if (duration < 60.0)
            std::cout << "Finished in " << duration << " seconds" << std::endl;
        else
        {
            int du = int(round(duration));
            std::cout << "Finished in " << (du / 60) << "m:" << (du % 60) << "s" << std::endl;
        }

        if (rg.failedTracks() > 0)
            std::cerr << rg.failedTracks() << " of " << grouping.tracks.size() << " files failed" << std::endl;
    }

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
