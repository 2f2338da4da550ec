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

#include "stdio.h"
#include "string.h"
#include <string>

#include "pngcardconfig.h"

#include "dng_auto_ptr.h"
#include "dng_exceptions.h"
#include "dng_file_stream.h"
#include "dng_memory.h"

#include "pngcardcodec.h"
#include "pngcardexceptions.h"
#include "pngcardglobals.h"
#include "pngchunkwalker.h"
#include "pngtextchunk.h"

static void printCardSlot(const PngCardCodec& codec, const uint8* data, uint64 length, CardKeyword keyword)
{
    try
    {
        PngCard card;
        if (codec.Extract(data, length, keyword, card))
            printf("  %s: %u bytes of json\n", CardKeywordName(keyword), (unsigned)card.fJsonText.size());
        else
            printf("  %s: none\n", CardKeywordName(keyword));
    }
    catch (PngCardException& e)
    {
        printf("  %s: %s (%s)\n", CardKeywordName(keyword),
               LookupPngCardError(e.ErrorCode()), e.SubMessage().c_str());
    }
}

int main(int argc, const char* argv [])
{
    if (argc == 1)
    {
        fprintf(stderr,
                "\n"
                "pngcardanalyze - PNG chunk analyzer tool (%s %s)\n"
                "Usage: %s [options] <pngfile>\n"
                "Valid options:\n"
                "  -t            print keywords of all tEXt chunks\n"
                "  -v            verbose\n",
                PNGCARD_NAME, PNGCARD_VERSION, argv[0]);

        return -1;
    }

    int32 index;
    bool listText = false;
    for (index = 1; index < argc && argv[index][0] == '-'; index++)
    {
        std::string option = &argv[index][1];

        if (0 == strcmp(option.c_str(), "t"))
        {
            listText = true;
        }

        if (0 == strcmp(option.c_str(), "v"))
        {
            gPngCardVerbose = true;
        }
    }

    if (index == argc)
    {
        fprintf (stderr, "*** No file specified\n");
        return 1;
    }

    const char* fileName = argv[index];

    AutoPtr<dng_memory_block> block;
    try
    {
        dng_file_stream stream(fileName);
        block.Reset(stream.AsMemoryBlock(gDefaultDNGMemoryAllocator));
    }
    catch (dng_exception& e)
    {
        fprintf(stderr, "*** Cannot read '%s' (Error #%i)\n", fileName, (int)e.ErrorCode());
        return 1;
    }

    const uint8* data = block->Buffer_uint8();
    uint64 length = block->LogicalSize();

    printf("File: %s\n", fileName);
    printf("Size: %llu bytes\n", (unsigned long long)length);

    if (!HasPngSignature(data, length))
    {
        printf("Signature: invalid\n");
        return pngcard_error_not_a_png;
    }
    printf("Signature: ok\n");
    printf("\n");

    uint32 chunkCount = 0;
    uint32 badCount = 0;

    PngChunkWalker walker(data, length);
    PngChunk chunk;
    while (walker.Next(chunk))
    {
        bool crcValid = chunk.CRCValid();

        printf("Chunk: %-4s  offset %8llu  length %8u  crc %08x %s\n",
               chunk.fType, (unsigned long long)chunk.fOffset, chunk.fLength,
               chunk.fCRC, crcValid ? "ok" : "BAD");

        if (listText)
        {
            std::string keyword;
            const uint8* text;
            uint32 textLength;

            if (PngTextChunk::Split(chunk, keyword, text, textLength))
                printf("  Keyword: %s (%u bytes of text)\n", keyword.c_str(), textLength);
        }

        chunkCount++;
        if (!crcValid)
            badCount++;
    }

    printf("\n");
    printf("Chunks: %u\n", chunkCount);
    printf("BadCRC: %u\n", badCount);
    if (walker.SawEnd())
    {
        if (walker.Position() < length)
            printf("End: IEND, %llu trailing bytes\n", (unsigned long long)(length - walker.Position()));
        else
            printf("End: IEND\n");
    }
    else
    {
        printf("End: truncated at offset %llu\n", (unsigned long long)walker.Position());
    }
    printf("\n");

    PngCardCodec codec;
    printf("Cards:\n");
    printCardSlot(codec, data, length, ckChara);
    printCardSlot(codec, data, length, ckCcv3);

    return 0;
}
