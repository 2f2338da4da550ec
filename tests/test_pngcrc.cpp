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

#include "testpng.h"

#include "pngcrc.h"

static void testIendCrc()
{
    printf("Test: CRC of IEND... ");

    check(PngCRC::Compute("IEND", 4) == 0xAE426082, "IEND crc");
    check(PngCRC::Chunk("IEND", NULL, 0) == 0xAE426082, "empty IEND chunk crc");

    printf("PASSED\n");
}

static void testCheckValue()
{
    printf("Test: CRC-32 check value... ");

    check(PngCRC::Compute("123456789", 9) == 0xCBF43926, "check value");
    check(PngCRC::Compute("", 0) == 0, "empty input");

    printf("PASSED\n");
}

static void testIncremental()
{
    printf("Test: Incremental CRC matches one pass... ");

    const char* text = "tEXtchara";
    uint32 whole = PngCRC::Compute(text, 9);
    uint32 parts = PngCRC::Update(PngCRC::Update(0, text, 4), text + 4, 5);
    check(whole == parts, "split update");

    printf("PASSED\n");
}

static void testChunkCrc()
{
    printf("Test: Chunk CRC covers type and payload... ");

    const char payload[] = "chara\0eyJhIjoxfQ==";
    uint32 crc = PngCRC::Chunk("tEXt", (const uint8*)payload, sizeof(payload) - 1);
    check(crc == 0x3CAC8152, "tEXt chara crc");

    const uint8* ihdr = kMinimalPng + 16;
    check(PngCRC::Chunk("IHDR", ihdr, 13) == 0x1F15C489, "IHDR crc");

    printf("PASSED\n");
}

int main()
{
    printf("=== PngCRC Test ===\n");

    testIendCrc();
    testCheckValue();
    testIncremental();
    testChunkCrc();

    printf("All tests passed\n");
    return 0;
}
