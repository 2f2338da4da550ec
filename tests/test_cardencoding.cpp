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

#include "cardencoding.h"

static bool decode(const char* text, std::string& bytes)
{
    return CardEncoding::DecodeBase64((const uint8*)text, (uint32)strlen(text), bytes);
}

static void testEncode()
{
    printf("Test: Base64 encode... ");

    check(CardEncoding::EncodeBase64("{\"a\":1}") == "eyJhIjoxfQ==", "two pad chars");
    check(CardEncoding::EncodeBase64("ab") == "YWI=", "one pad char");
    check(CardEncoding::EncodeBase64("abc") == "YWJj", "no padding");
    check(CardEncoding::EncodeBase64("").empty(), "empty input");
    check(CardEncoding::EncodeBase64("{\"name\":\"\xC3\x86rith \xE7\x8C\xAB\"}") ==
          "eyJuYW1lIjoiw4ZyaXRoIOeMqyJ9", "utf-8 bytes");

    printf("PASSED\n");
}

static void testDecode()
{
    printf("Test: Base64 decode... ");

    std::string bytes;
    check(decode("eyJhIjoxfQ==", bytes) && bytes == "{\"a\":1}", "padded");
    check(decode("eyJhIjoxfQ", bytes) && bytes == "{\"a\":1}", "padding left off");
    check(decode("eyJh\r\nIjox fQ==\n", bytes) && bytes == "{\"a\":1}", "whitespace ignored");
    check(decode("YWJj", bytes) && bytes == "abc", "no padding needed");
    check(decode("", bytes) && bytes.empty(), "empty text");

    std::string binary("\x00\xFF\x10", 3);
    check(decode(CardEncoding::EncodeBase64(binary).c_str(), bytes) && bytes == binary, "binary bytes");

    printf("PASSED\n");
}

static void testDecodeRejects()
{
    printf("Test: Base64 decode rejects malformed text... ");

    std::string bytes;
    check(!decode("eyJh*joxfQ==", bytes), "character outside alphabet");
    check(!decode("eyJhI", bytes), "length 1 mod 4");
    check(!decode("eyJhIjoxfQ=", bytes), "partial padding");
    check(!decode("ey=hIjox", bytes), "padding inside");
    check(!decode("====", bytes), "padding only");
    check(!decode("eyJhIjoxfQ===", bytes), "too much padding");
    check(!decode("eyJh\xC3\xA9", bytes), "non-ascii byte");

    const char withNul[] = "eyJh\0Ijox";
    check(!CardEncoding::DecodeBase64((const uint8*)withNul, sizeof(withNul) - 1, bytes), "embedded NUL");

    printf("PASSED\n");
}

static void testUtf8()
{
    printf("Test: UTF-8 validation... ");

    check(CardEncoding::IsValidUTF8(""), "empty");
    check(CardEncoding::IsValidUTF8("{\"a\":1}"), "ascii");
    check(CardEncoding::IsValidUTF8("\xC3\x86rith \xE7\x8C\xAB"), "two and three byte forms");
    check(CardEncoding::IsValidUTF8("\xF0\x9F\x98\x80"), "four byte form");
    check(CardEncoding::IsValidUTF8("\xEF\xBB\xBF{}"), "byte order mark");
    check(CardEncoding::IsValidUTF8("\xF4\x8F\xBF\xBF"), "U+10FFFF");
    check(CardEncoding::IsValidUTF8(std::string("a\0b", 3)), "U+0000");

    printf("PASSED\n");
}

static void testUtf8Rejects()
{
    printf("Test: UTF-8 validation rejects malformed bytes... ");

    check(!CardEncoding::IsValidUTF8("\x80"), "lone continuation byte");
    check(!CardEncoding::IsValidUTF8("\xC0\xAF"), "overlong two byte");
    check(!CardEncoding::IsValidUTF8("\xE0\x80\xAF"), "overlong three byte");
    check(!CardEncoding::IsValidUTF8("\xF0\x80\x80\xAF"), "overlong four byte");
    check(!CardEncoding::IsValidUTF8("\xED\xA0\x80"), "surrogate");
    check(!CardEncoding::IsValidUTF8("\xF4\x90\x80\x80"), "above U+10FFFF");
    check(!CardEncoding::IsValidUTF8("\xF5\x80\x80\x80"), "invalid lead byte");
    check(!CardEncoding::IsValidUTF8("\xFF"), "0xFF");
    check(!CardEncoding::IsValidUTF8("abc\xE7\x8C"), "truncated sequence");
    check(!CardEncoding::IsValidUTF8("\xE7\x8C" "a"), "broken continuation");

    printf("PASSED\n");
}

int main()
{
    printf("=== CardEncoding Test ===\n");

    testEncode();
    testDecode();
    testDecodeRejects();
    testUtf8();
    testUtf8Rejects();

    printf("All tests passed\n");
    return 0;
}
