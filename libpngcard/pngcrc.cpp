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

#include "pngcrc.h"

#include "zlib.h"

uint32 PngCRC::Compute(const void* data, uint32 length)
{
    return Update(0, data, length);
}

uint32 PngCRC::Update(uint32 crc, const void* data, uint32 length)
{
    if (length == 0)
        return crc;

    return (uint32)crc32(crc, (const Bytef*)data, length);
}

uint32 PngCRC::Chunk(const char* type, const uint8* data, uint32 length)
{
    uint32 crc = Update(0, type, 4);
    return Update(crc, data, length);
}
