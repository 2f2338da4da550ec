/* This file is part of the pngcard project
   Copyright (C) 2011 Jens Mueller <tschensensinger at gmx dot de>

   This library is free software; you can redistribute it and/or
   modify it under the terms of the GNU Library General Public
   License as published by the Free Software Foundation; either
   version 2 of the License, or (at your option) any later version.

   This library is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
   Library General Public License for more details.

   You should have received a copy of the GNU Library General Public License
   along with this library; see the file COPYING.  If not, write to
   the Free Software Foundation, Inc., 51 Franklin Street, Fifth Floor,
   Boston, MA 02110-1301, USA.
*/

#include <stdio.h>
#include <string.h>
#include <string>

#include "pngcardconfig.h"

#include "dng_auto_ptr.h"
#include "dng_exceptions.h"
#include "dng_file_stream.h"
#include "dng_memory.h"

#include "pngcardcodec.h"
#include "pngcardexceptions.h"
#include "pngcardglobals.h"

enum ConvertMode
{
    modeExtract,
    modeEmbed,
    modeStrip
};

static bool readStdin(std::string& text)
{
    char buffer[4096];
    size_t count;

    while ((count = fread(buffer, 1, sizeof(buffer), stdin)) > 0)
        text.append(buffer, count);

    return ferror(stdin) == 0;
}

static void readFile(const char* fileName, std::string& text)
{
    dng_file_stream stream(fileName);
    AutoPtr<dng_memory_block> block(stream.AsMemoryBlock(gDefaultDNGMemoryAllocator));

    text.assign(block->Buffer_char(), block->LogicalSize());
}

int main(int argc, const char* argv [])
{
    if (argc == 1)
    {
        fprintf(stderr,
                "\n"
                "pngcardconvert - PNG character card tool (%s %s)\n"
                "Usage: %s [options] <pngfile>\n"
                "Valid options:\n"
                "  -x                   extract embedded card (default)\n"
                "  -k chara|ccv3        extract only this card slot\n"
                "  -e <filename>|-      embed card json from this file, - for stdin\n"
                "  -strip               remove embedded cards\n"
                "  -nochara             do not write the chara slot\n"
                "  -noccv3              do not write the ccv3 slot\n"
                "  -o <filename>        specify output filename\n"
                "  -v                   verbose\n",
                PNGCARD_NAME, PNGCARD_VERSION, argv[0]);

        return -1;
    }

    //parse options
    int index;
    ConvertMode mode = modeExtract;
    const char* jsonfilename = NULL;
    const char* outfilename = NULL;
    const char* keywordname = NULL;
    PngCardOptions options;

    for (index = 1; index < argc && argv[index][0] == '-'; index++)
    {
        std::string option = &argv[index][1];

        if ((0 == strcmp(option.c_str(), "o") ||
             0 == strcmp(option.c_str(), "e") ||
             0 == strcmp(option.c_str(), "k")) && index + 1 >= argc)
        {
            fprintf(stderr, "option -%s needs an argument\n", option.c_str());
            return 1;
        }

        if (0 == strcmp(option.c_str(), "x"))
        {
            mode = modeExtract;
        }

        if (0 == strcmp(option.c_str(), "k"))
        {
            keywordname = argv[++index];
        }

        if (0 == strcmp(option.c_str(), "e"))
        {
            mode = modeEmbed;
            jsonfilename = argv[++index];
        }

        if (0 == strcmp(option.c_str(), "strip"))
        {
            mode = modeStrip;
        }

        if (0 == strcmp(option.c_str(), "nochara"))
        {
            options.fWriteChara = false;
        }

        if (0 == strcmp(option.c_str(), "noccv3"))
        {
            options.fWriteCcv3 = false;
        }

        if (0 == strcmp(option.c_str(), "o"))
        {
            outfilename = argv[++index];
        }

        if (0 == strcmp(option.c_str(), "v"))
        {
            gPngCardVerbose = true;
        }
    }

    if (index == argc)
    {
        fprintf (stderr, "no file specified\n");
        return 1;
    }

    const char* filename = argv[index++];

    CardKeyword keyword = ckChara;
    if (keywordname != NULL && !ParseCardKeyword(keywordname, keyword))
    {
        fprintf(stderr, "unknown card slot '%s'\n", keywordname);
        return 1;
    }

    try
    {
        dng_file_stream stream(filename);
        AutoPtr<dng_memory_block> input(stream.AsMemoryBlock(gDefaultDNGMemoryAllocator));

        const uint8* data = input->Buffer_uint8();
        uint64 length = input->LogicalSize();

        PngCardCodec codec;

        if (mode == modeExtract)
        {
            PngCard card;
            bool found = (keywordname != NULL) ? codec.Extract(data, length, keyword, card)
                                               : codec.Extract(data, length, card);
            if (!found)
            {
                fprintf(stderr, "no card found in '%s'\n", filename);
                return 2;
            }

            if (gPngCardVerbose)
            {
                fprintf(stderr, "Found %s card, %u bytes\n",
                        CardKeywordName(card.fKeyword), (unsigned)card.fJsonText.size());
            }

            if (outfilename != NULL)
            {
                dng_file_stream outstream(outfilename, true);
                outstream.Put(card.fJsonText.data(), (uint32)card.fJsonText.size());
                outstream.Flush();
            }
            else
            {
                fwrite(card.fJsonText.data(), 1, card.fJsonText.size(), stdout);
            }

            return 0;
        }

        AutoPtr<dng_memory_block> output;

        if (mode == modeEmbed)
        {
            std::string jsonText;
            if (0 == strcmp(jsonfilename, "-"))
            {
                if (!readStdin(jsonText))
                {
                    fprintf(stderr, "could not read card from stdin\n");
                    return 1;
                }
            }
            else
            {
                readFile(jsonfilename, jsonText);
            }

            output.Reset(codec.Embed(data, length, jsonText, options));
        }
        else
        {
            output.Reset(codec.Strip(data, length));
        }

        // output filename: replace png file extension with -card.png
        std::string lpszOutFileName(filename);
        if (outfilename != NULL)
        {
            lpszOutFileName.assign(outfilename);
        }
        else
        {
            size_t found = lpszOutFileName.find_last_of(".");
            size_t slash = lpszOutFileName.find_last_of("/\\");
            if (found != std::string::npos && (slash == std::string::npos || found > slash))
                lpszOutFileName.resize(found);
            lpszOutFileName.append("-card.png");
        }

        dng_file_stream outstream(lpszOutFileName.c_str(), true);
        outstream.Put(output->Buffer(), output->LogicalSize());
        outstream.Flush();

        if (gPngCardVerbose)
        {
            fprintf(stderr, "Wrote %u bytes to '%s'\n",
                    output->LogicalSize(), lpszOutFileName.c_str());
        }
    }
    catch (PngCardException& e)
    {
        if (e.SubMessage().empty())
            fprintf(stderr, "*** %s\n", LookupPngCardError(e.ErrorCode()));
        else
            fprintf(stderr, "*** %s: %s\n", LookupPngCardError(e.ErrorCode()), e.SubMessage().c_str());
        return 3;
    }
    catch (dng_exception& e)
    {
        fprintf(stderr, "*** File error (Error #%i)\n", (int)e.ErrorCode());
        return 1;
    }

    return 0;
}
