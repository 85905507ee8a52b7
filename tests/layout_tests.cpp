/////////////////////////////////////////////////////////////////////////////////
//
// Copyright 2023 Equinor ASA
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http ://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
/////////////////////////////////////////////////////////////////////////////////

#include "gtest/gtest.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include "opensegy/exception.h"
#include "opensegy/impl/layout.h"
#include "opensegy/impl/structaccess.h"

using namespace InternalSEGY;
using namespace OpenSEGY::Errors;

namespace
{
    std::uint32_t ibmBits(double value)
    {
        return doubleToIbm(value);
    }
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testOffsets)
{
    ASSERT_EQ(Layout::TextualHeaderSize, 3200);
    ASSERT_EQ(Layout::BinaryHeaderSize, 400);
    ASSERT_EQ(Layout::TraceHeaderSize, 240);
    ASSERT_EQ(Layout::BinaryHeaderPos, 3200);
    ASSERT_EQ(Layout::FirstTracePos, 3600);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testBigEndianLoadStore)
{
    std::uint8_t buf[8]{ 0 };

    storeBE<std::int32_t>(buf, 0x01020304);
    ASSERT_EQ(buf[0], 0x01);
    ASSERT_EQ(buf[3], 0x04);
    ASSERT_EQ(loadBE<std::int32_t>(buf), 0x01020304);

    storeBE<std::int16_t>(buf, -2);
    ASSERT_EQ(buf[0], 0xff);
    ASSERT_EQ(buf[1], 0xfe);
    ASSERT_EQ(loadBE<std::int16_t>(buf), -2);

    storeSignedBE(buf + 2, 4, -123456);
    ASSERT_EQ(loadSignedBE(buf + 2, 4), -123456);
    storeSignedBE(buf, 1, -5);
    ASSERT_EQ(loadSignedBE(buf, 1), -5);
    ASSERT_THROW(loadSignedBE(buf, 3), SegyInternalError);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testFieldCodec)
{
    std::uint8_t block[400]{ 0 };
    const FieldSpec interval{ 16, 2, FieldEncoding::UInt16, "Interval" };
    const FieldSpec scalar{ 70, 2, FieldEncoding::Int16, "CoordinateScalar" };
    const FieldSpec cdpx{ 180, 4, FieldEncoding::Int32, "CdpX" };

    encodeField(block, interval, 40000);
    ASSERT_EQ(block[16], 0x9c);
    ASSERT_EQ(block[17], 0x40);
    ASSERT_EQ(decodeField(block, interval), 40000);

    encodeField(block, scalar, -100);
    ASSERT_EQ(decodeField(block, scalar), -100);

    encodeField(block, cdpx, std::numeric_limits<std::int32_t>::min());
    ASSERT_EQ(decodeField(block, cdpx), std::numeric_limits<std::int32_t>::min());

    ASSERT_THROW(encodeField(block, interval, -1), SegyInvalidArgument);
    ASSERT_THROW(encodeField(block, interval, 65536), SegyInvalidArgument);
    ASSERT_THROW(encodeField(block, scalar, 32768), SegyInvalidArgument);
    ASSERT_THROW(encodeField(block, cdpx, std::int64_t(1) << 31), SegyInvalidArgument);

    // Rejected values leave the field untouched.
    ASSERT_EQ(decodeField(block, interval), 40000);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testFormats)
{
    ASSERT_TRUE(isKnownFormat(1));
    ASSERT_TRUE(isKnownFormat(2));
    ASSERT_TRUE(isKnownFormat(3));
    ASSERT_TRUE(isKnownFormat(5));
    ASSERT_TRUE(isKnownFormat(8));
    ASSERT_FALSE(isKnownFormat(0));
    ASSERT_FALSE(isKnownFormat(4));
    ASSERT_FALSE(isKnownFormat(6));

    ASSERT_EQ(bytesPerSample(1), 4);
    ASSERT_EQ(bytesPerSample(2), 4);
    ASSERT_EQ(bytesPerSample(3), 2);
    ASSERT_EQ(bytesPerSample(5), 4);
    ASSERT_EQ(bytesPerSample(8), 1);
    ASSERT_THROW(bytesPerSample(4), SegyUnsupportedFormat);

    ASSERT_EQ(formatDescription(1), "IBM floating point (4 bytes)");
    ASSERT_EQ(formatDescription(5), "IEEE floating point (4 bytes)");
    ASSERT_EQ(formatDescription(8), "1-byte integer");
    ASSERT_EQ(formatDescription(42), "Unknown (42)");

    try
    {
        bytesPerSample(42);
        FAIL() << "Expected SegyUnsupportedFormat";
    }
    catch (const SegyUnsupportedFormat& ex)
    {
        ASSERT_EQ(ex.code(), 42);
    }
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testIbmKnownValues)
{
    ASSERT_EQ(ibmBits(1.0), 0x41100000u);
    ASSERT_EQ(ibmBits(0.5), 0x40800000u);
    ASSERT_EQ(ibmBits(-118.625), 0xC276A000u);
    ASSERT_EQ(ibmBits(0.0), 0u);

    ASSERT_EQ(ibmToDouble(0x41100000u), 1.0);
    ASSERT_EQ(ibmToDouble(0x40800000u), 0.5);
    ASSERT_EQ(ibmToDouble(0xC276A000u), -118.625);
    ASSERT_EQ(ibmToDouble(0x00000000u), 0.0);
    ASSERT_EQ(ibmToDouble(0x80000000u), 0.0);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testIbmPrecision)
{
    const double values[] = { 3.14159265, -2.718281828, 1.0e-5, 6.02e23, -1.6e-19, 123456.789, 0.1 };
    for (double value : values)
    {
        const double back = ibmToDouble(doubleToIbm(value));
        EXPECT_NEAR(back, value, std::fabs(value) * 1.0e-6) << "value " << value;
    }

    // Values just below a power of 16 round up into the next exponent.
    ASSERT_EQ(ibmToDouble(doubleToIbm(15.9999999999)), 16.0);

    ASSERT_EQ(doubleToIbm(1.0e80), 0x7fffffffu);
    ASSERT_EQ(doubleToIbm(-1.0e80), 0xffffffffu);
    ASSERT_EQ(doubleToIbm(1.0e-90), 0u);
    ASSERT_THROW(doubleToIbm(std::numeric_limits<double>::infinity()), SegyInvalidArgument);
    ASSERT_THROW(doubleToIbm(std::numeric_limits<double>::quiet_NaN()), SegyInvalidArgument);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testSampleDecode)
{
    const std::uint8_t ibm[] = { 0x41, 0x10, 0x00, 0x00, 0xC2, 0x76, 0xA0, 0x00 };
    double out[2];
    decodeSamples(ibm, 2, 1, out);
    ASSERT_EQ(out[0], 1.0);
    ASSERT_EQ(out[1], -118.625);

    const std::uint8_t ieee[] = { 0x3f, 0x80, 0x00, 0x00, 0xc0, 0x00, 0x00, 0x00 };
    float fout[2];
    decodeSamples(ieee, 2, 5, fout);
    ASSERT_EQ(fout[0], 1.0f);
    ASSERT_EQ(fout[1], -2.0f);

    const std::uint8_t i16[] = { 0xff, 0xff, 0x7f, 0xff };
    decodeSamples(i16, 2, 3, out);
    ASSERT_EQ(out[0], -1.0);
    ASSERT_EQ(out[1], 32767.0);

    const std::uint8_t i32[] = { 0x80, 0x00, 0x00, 0x00 };
    decodeSamples(i32, 1, 2, out);
    ASSERT_EQ(out[0], -2147483648.0);

    const std::uint8_t i8[] = { 0x80, 0x7f };
    decodeSamples(i8, 2, 8, out);
    ASSERT_EQ(out[0], -128.0);
    ASSERT_EQ(out[1], 127.0);

    ASSERT_THROW(decodeSamples(i8, 1, 4, out), SegyUnsupportedFormat);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testSampleEncode)
{
    const double in[] = { -3.4, 2.5, 100.0 };
    std::uint8_t raw[12]{ 0 };

    encodeSamples(in, 3, 3, raw);
    ASSERT_EQ(loadBE<std::int16_t>(raw), -3);
    ASSERT_EQ(loadBE<std::int16_t>(raw + 2), 3);
    ASSERT_EQ(loadBE<std::int16_t>(raw + 4), 100);

    encodeSamples(in, 3, 5, raw);
    ASSERT_EQ(loadBE<float>(raw + 8), 100.0f);

    encodeSamples(in, 1, 1, raw);
    ASSERT_NEAR(ibmToDouble(loadBE<std::uint32_t>(raw)), -3.4, 1.0e-6);

    const double tooBig[] = { 200.0 };
    ASSERT_THROW(encodeSamples(tooBig, 1, 8, raw), SegyInvalidArgument);
    const double notFinite[] = { std::numeric_limits<double>::infinity() };
    ASSERT_THROW(encodeSamples(notFinite, 1, 2, raw), SegyInvalidArgument);
    ASSERT_THROW(encodeSamples(in, 1, 7, raw), SegyUnsupportedFormat);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(layout_tests, testEbcdic)
{
    const std::string ascii = "C01 CLIENT: ACME 0123456789 (a+b)=c/d";
    const std::string ebcdic = asciiToEbcdic(ascii);

    ASSERT_EQ(ebcdic.size(), ascii.size());
    ASSERT_EQ(static_cast<std::uint8_t>(ebcdic[0]), 0xC3);
    ASSERT_EQ(static_cast<std::uint8_t>(ebcdic[3]), 0x40);
    ASSERT_EQ(ebcdicToAscii(ebcdic), ascii);

    ASSERT_TRUE(looksLikeEbcdic(ebcdic));
    ASSERT_FALSE(looksLikeEbcdic(ascii));
    ASSERT_FALSE(looksLikeEbcdic(std::string()));
    ASSERT_TRUE(looksLikeEbcdic(std::string(3200, '\x40')));
    ASSERT_FALSE(looksLikeEbcdic(std::string(3200, ' ')));
}
