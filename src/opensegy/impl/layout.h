// Copyright 2017-2020, Schlumberger
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "declspec.h"

#include <cstdint>
#include <string>

/**
 * \file layout.h
 * \brief Byte level description of the SEG-Y container.
 *
 * Fixed offsets of the three header kinds, the header field codec,
 * and decoding and encoding of the supported sample formats. Nothing
 * here knows about files; everything works on caller owned buffers.
 */

namespace InternalSEGY {
#if 0
}
#endif

namespace Layout {
  constexpr std::int64_t TextualHeaderSize = 3200;
  constexpr std::int64_t BinaryHeaderSize  = 400;
  constexpr std::int64_t TraceHeaderSize   = 240;
  constexpr std::int64_t BinaryHeaderPos   = TextualHeaderSize;
  constexpr std::int64_t FirstTracePos     = TextualHeaderSize + BinaryHeaderSize;
}

/**
 * How a header field is stored. All multi-byte encodings are big-endian.
 */
enum class FieldEncoding : std::uint8_t
{
  Int8,
  Int16,
  UInt16,
  Int32,
};

/**
 * Position of one field relative to the start of its header block.
 */
struct FieldSpec
{
  std::int32_t  offset;
  std::int32_t  width;
  FieldEncoding encoding;
  const char*   name;
};

/**
 * Sample format codes as stored in the binary header.
 */
enum class RawFormat : std::int32_t
{
  IbmFloat32  = 1,
  Int32       = 2,
  Int16       = 3,
  IeeeFloat32 = 5,
  Int8        = 8,
};

OPENSEGY_TEST_API std::int64_t decodeField(const std::uint8_t* block, const FieldSpec& spec);
OPENSEGY_TEST_API void encodeField(std::uint8_t* block, const FieldSpec& spec, std::int64_t value);

OPENSEGY_TEST_API bool isKnownFormat(std::int32_t code);
OPENSEGY_TEST_API std::int32_t bytesPerSample(std::int32_t code);
OPENSEGY_TEST_API std::string formatDescription(std::int32_t code);

OPENSEGY_TEST_API double ibmToDouble(std::uint32_t ibm);
OPENSEGY_TEST_API std::uint32_t doubleToIbm(double value);

OPENSEGY_TEST_API void decodeSamples(const void* raw, std::int64_t count, std::int32_t code, double* out);
OPENSEGY_TEST_API void decodeSamples(const void* raw, std::int64_t count, std::int32_t code, float* out);
OPENSEGY_TEST_API void encodeSamples(const double* in, std::int64_t count, std::int32_t code, void* raw);

OPENSEGY_TEST_API bool looksLikeEbcdic(const std::string& text);
OPENSEGY_TEST_API std::string ebcdicToAscii(const std::string& text);
OPENSEGY_TEST_API std::string asciiToEbcdic(const std::string& text);

} // namespace
