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

#pragma once

#include "dng_types.h"

// PNG chunk CRC (ISO/IEC 15948 Annex D). The lookup table lives in zlib
// and is read-only once built, so these may be called from any thread.
class PngCRC
{
public:
    static uint32 Compute(const void* data, uint32 length);

    // Continue a running CRC. Start with Update(0, ...).
    static uint32 Update(uint32 crc, const void* data, uint32 length);

    // CRC over the 4-byte chunk tag followed by the chunk payload.
    static uint32 Chunk(const char* type, const uint8* data, uint32 length);
};
