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

#include "pngcardcodec.h"
#include "pngcardexceptions.h"
#include "pngcardglobals.h"
#include "pngtextchunk.h"
#include "cardencoding.h"

#include "dng_auto_ptr.h"
#include "dng_memory_stream.h"

#include <stdio.h>

static const char* kCardKeywordNames[] = { "chara", "ccv3" };

const char* CardKeywordName(CardKeyword keyword)
{
    return kCardKeywordNames[keyword == ckCcv3 ? 1 : 0];
}

bool ParseCardKeyword(const std::string& name, CardKeyword& keyword)
{
    if (name == kCardKeywordNames[ckChara])
    {
        keyword = ckChara;
        return true;
    }

    if (name == kCardKeywordNames[ckCcv3])
    {
        keyword = ckCcv3;
        return true;
    }

    return false;
}

static bool IsCardChunk(const PngChunk& chunk, CardKeyword& keyword)
{
    std::string name;
    const uint8* text;
    uint32 textLength;

    if (!PngTextChunk::Split(chunk, name, text, textLength))
        return false;

    return ParseCardKeyword(name, keyword);
}

// Signature, every chunk up to IEND minus the card slots, the new slots,
// IEND. Nothing after IEND is copied.
static void RewriteCards(const uint8* data, uint64 length, const std::string& payload64,
                         const PngCardOptions& options, dng_stream& stream)
{
    stream.Put(PNG_SIGNATURE_DATA, PNG_SIGNATURE_LEN);

    PngChunkWalker walker(data, length);
    PngChunk chunk;

    while (walker.Next(chunk))
    {
        CardKeyword keyword;

        if (chunk.IsType("IEND"))
        {
            if (options.fWriteChara)
                PngTextChunk::Write(stream, CardKeywordName(ckChara), payload64);
            if (options.fWriteCcv3)
                PngTextChunk::Write(stream, CardKeywordName(ckCcv3), payload64);
        }
        else if (IsCardChunk(chunk, keyword))
        {
            if (gPngCardVerbose)
            {
                fprintf(stderr, "Dropping %s card chunk at offset %llu\n",
                        CardKeywordName(keyword), (unsigned long long)chunk.fOffset);
            }
            continue;
        }

        stream.Put(chunk.Begin(), (uint32)chunk.TotalSize());
    }

    if (!walker.SawEnd())
    {
        if (walker.Position() < length)
            ThrowTruncatedPng("chunk overruns the end of the file");
        else
            ThrowTruncatedPng("no IEND chunk");
    }
}

PngCardCodec::PngCardCodec(dng_memory_allocator& allocator)
    : m_Allocator(allocator)
{
}

PngCardCodec::~PngCardCodec(void)
{
}

bool PngCardCodec::Extract(const uint8* data, uint64 length, PngCard& card) const
{
    return ExtractMatching(data, length, NULL, card);
}

bool PngCardCodec::Extract(const uint8* data, uint64 length, CardKeyword keyword, PngCard& card) const
{
    return ExtractMatching(data, length, &keyword, card);
}

bool PngCardCodec::ExtractMatching(const uint8* data, uint64 length,
                                   const CardKeyword* only, PngCard& card) const
{
    if (!HasPngSignature(data, length))
        return false;

    PngChunkWalker walker(data, length);
    PngChunk chunk;

    while (walker.Next(chunk))
    {
        std::string name;
        const uint8* text;
        uint32 textLength;
        CardKeyword keyword;

        if (!PngTextChunk::Split(chunk, name, text, textLength))
            continue;

        if (!ParseCardKeyword(name, keyword))
            continue;

        if (only != NULL && *only != keyword)
            continue;

        std::string bytes;

        if (!CardEncoding::DecodeBase64(text, textLength, bytes))
            ThrowCardDecodeError("card text is not valid base64");

        if (!CardEncoding::IsValidUTF8(bytes))
            ThrowCardDecodeError("card text is not valid UTF-8");

        card.fKeyword = keyword;
        card.fJsonText.swap(bytes);
        return true;
    }

    return false;
}

void PngCardCodec::Embed(const uint8* data, uint64 length, const std::string& jsonText,
                         const PngCardOptions& options, dng_stream& stream) const
{
    AutoPtr<dng_memory_block> block(Embed(data, length, jsonText, options));

    stream.Put(block->Buffer(), block->LogicalSize());
}

dng_memory_block* PngCardCodec::Embed(const uint8* data, uint64 length, const std::string& jsonText,
                                      const PngCardOptions& options) const
{
    if (!HasPngSignature(data, length))
        ThrowNotAPng();

    if (!CardEncoding::IsValidUTF8(jsonText))
        ThrowCardDecodeError("card text is not valid UTF-8");

    std::string payload64 = CardEncoding::EncodeBase64(jsonText);

    dng_memory_stream stream(m_Allocator);
    stream.SetBigEndian();

    RewriteCards(data, length, payload64, options, stream);

    return stream.AsMemoryBlock(m_Allocator);
}

dng_memory_block* PngCardCodec::Strip(const uint8* data, uint64 length) const
{
    PngCardOptions options;
    options.fWriteChara = false;
    options.fWriteCcv3 = false;

    return Embed(data, length, std::string(), options);
}
