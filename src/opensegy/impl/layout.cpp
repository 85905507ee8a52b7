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

#include "layout.h"
#include "structaccess.h"
#include "../exception.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <algorithm>

namespace InternalSEGY {
#if 0
}
#endif

using OpenSEGY::Errors::SegyInvalidArgument;
using OpenSEGY::Errors::SegyUnsupportedFormat;
using OpenSEGY::Errors::SegyInternalError;

namespace {
  /**
   * EBCDIC (code page 037) to 7-bit ASCII. Control characters become
   * spaces, characters with no ASCII equivalent become '?'.
   */
  static const std::uint8_t e2a[256] = {
    0x20, 0x20, 0x20, 0x20, 0x3f, 0x20, 0x3f, 0x20, 0x3f, 0x3f, 0x3f, 0x20, 0x20, 0x20, 0x20, 0x20,
    0x20, 0x20, 0x20, 0x20, 0x3f, 0x20, 0x20, 0x3f, 0x20, 0x20, 0x3f, 0x3f, 0x20, 0x20, 0x20, 0x20,
    0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x20, 0x20, 0x20, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x20, 0x20, 0x20,
    0x3f, 0x3f, 0x20, 0x3f, 0x3f, 0x3f, 0x3f, 0x20, 0x3f, 0x3f, 0x3f, 0x3f, 0x20, 0x20, 0x3f, 0x20,
    0x20, 0x20, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x2e, 0x3c, 0x28, 0x2b, 0x7c,
    0x26, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x21, 0x24, 0x2a, 0x29, 0x3b, 0x3f,
    0x2d, 0x2f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x2c, 0x25, 0x5f, 0x3e, 0x3f,
    0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x60, 0x3a, 0x23, 0x40, 0x27, 0x3d, 0x22,
    0x3f, 0x61, 0x62, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68, 0x69, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f,
    0x3f, 0x6a, 0x6b, 0x6c, 0x6d, 0x6e, 0x6f, 0x70, 0x71, 0x72, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f,
    0x3f, 0x7e, 0x73, 0x74, 0x75, 0x76, 0x77, 0x78, 0x79, 0x7a, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f,
    0x5e, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x5b, 0x5d, 0x3f, 0x3f, 0x3f, 0x3f,
    0x7b, 0x41, 0x42, 0x43, 0x44, 0x45, 0x46, 0x47, 0x48, 0x49, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f,
    0x7d, 0x4a, 0x4b, 0x4c, 0x4d, 0x4e, 0x4f, 0x50, 0x51, 0x52, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f,
    0x5c, 0x3f, 0x53, 0x54, 0x55, 0x56, 0x57, 0x58, 0x59, 0x5a, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f,
    0x30, 0x31, 0x32, 0x33, 0x34, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f, 0x3f,
  };

  /**
   * 7-bit ASCII to EBCDIC (code page 037). Bytes >= 0x80 map to '?'.
   */
  static const std::uint8_t a2e[128] = {
    0x00, 0x01, 0x02, 0x03, 0x37, 0x2d, 0x2e, 0x2f, 0x16, 0x05, 0x25, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f,
    0x10, 0x11, 0x12, 0x13, 0x3c, 0x3d, 0x32, 0x26, 0x18, 0x19, 0x3f, 0x27, 0x1c, 0x1d, 0x1e, 0x1f,
    0x40, 0x5a, 0x7f, 0x7b, 0x5b, 0x6c, 0x50, 0x7d, 0x4d, 0x5d, 0x5c, 0x4e, 0x6b, 0x60, 0x4b, 0x61,
    0xf0, 0xf1, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7, 0xf8, 0xf9, 0x7a, 0x5e, 0x4c, 0x7e, 0x6e, 0x6f,
    0x7c, 0xc1, 0xc2, 0xc3, 0xc4, 0xc5, 0xc6, 0xc7, 0xc8, 0xc9, 0xd1, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6,
    0xd7, 0xd8, 0xd9, 0xe2, 0xe3, 0xe4, 0xe5, 0xe6, 0xe7, 0xe8, 0xe9, 0xba, 0xe0, 0xbb, 0xb0, 0x6d,
    0x79, 0x81, 0x82, 0x83, 0x84, 0x85, 0x86, 0x87, 0x88, 0x89, 0x91, 0x92, 0x93, 0x94, 0x95, 0x96,
    0x97, 0x98, 0x99, 0xa2, 0xa3, 0xa4, 0xa5, 0xa6, 0xa7, 0xa8, 0xa9, 0xc0, 0x4f, 0xd0, 0xa1, 0x07,
  };

  /**
   * Round to the nearest integer of type T. Values that don't fit,
   * and anything non-finite, are rejected because an integer sample
   * format has no way of representing them.
   */
  template<typename T>
  T roundForFormat(double value, std::int32_t code)
  {
    if (!std::isfinite(value) ||
        value < static_cast<double>(std::numeric_limits<T>::min()) - 0.5 ||
        value > static_cast<double>(std::numeric_limits<T>::max()) + 0.5)
      throw SegyInvalidArgument("Sample value " + std::to_string(value) +
                                " cannot be stored in format " +
                                std::to_string(code));
    const double rounded = std::round(value);
    return static_cast<T>(std::min(std::max(rounded,
        static_cast<double>(std::numeric_limits<T>::min())),
        static_cast<double>(std::numeric_limits<T>::max())));
  }

  template<typename T>
  void decodeSamplesT(const void* raw, std::int64_t count, std::int32_t code, T* out)
  {
    const std::uint8_t* src = static_cast<const std::uint8_t*>(raw);
    switch (static_cast<RawFormat>(code)) {
    case RawFormat::IbmFloat32:
      for (std::int64_t ii = 0; ii < count; ++ii)
        out[ii] = static_cast<T>(ibmToDouble(loadBE<std::uint32_t>(src + 4*ii)));
      break;
    case RawFormat::Int32:
      for (std::int64_t ii = 0; ii < count; ++ii)
        out[ii] = static_cast<T>(loadBE<std::int32_t>(src + 4*ii));
      break;
    case RawFormat::Int16:
      for (std::int64_t ii = 0; ii < count; ++ii)
        out[ii] = static_cast<T>(loadBE<std::int16_t>(src + 2*ii));
      break;
    case RawFormat::IeeeFloat32:
      for (std::int64_t ii = 0; ii < count; ++ii)
        out[ii] = static_cast<T>(loadBE<float>(src + 4*ii));
      break;
    case RawFormat::Int8:
      for (std::int64_t ii = 0; ii < count; ++ii)
        out[ii] = static_cast<T>(static_cast<std::int8_t>(src[ii]));
      break;
    default:
      throw SegyUnsupportedFormat(code);
    }
  }
}

/////////////////////////////////////////////////////////////////////////////
//    Header fields   ///////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

std::int64_t
decodeField(const std::uint8_t* block, const FieldSpec& spec)
{
  const std::uint8_t* ptr = block + spec.offset;
  switch (spec.encoding) {
  case FieldEncoding::Int8:   return static_cast<std::int8_t>(*ptr);
  case FieldEncoding::Int16:  return loadBE<std::int16_t>(ptr);
  case FieldEncoding::UInt16: return loadBE<std::uint16_t>(ptr);
  case FieldEncoding::Int32:  return loadBE<std::int32_t>(ptr);
  }
  throw SegyInternalError(std::string("Bad encoding for field ") + spec.name);
}

/**
 * Store value in the field, rejecting values the field cannot hold
 * instead of truncating them.
 */
void
encodeField(std::uint8_t* block, const FieldSpec& spec, std::int64_t value)
{
  std::int64_t lo, hi;
  switch (spec.encoding) {
  case FieldEncoding::Int8:   lo = -128;        hi = 127;        break;
  case FieldEncoding::Int16:  lo = -32768;      hi = 32767;      break;
  case FieldEncoding::UInt16: lo = 0;           hi = 65535;      break;
  case FieldEncoding::Int32:  lo = INT32_MIN;   hi = INT32_MAX;  break;
  default:
    throw SegyInternalError(std::string("Bad encoding for field ") + spec.name);
  }
  if (value < lo || value > hi)
    throw SegyInvalidArgument("Value " + std::to_string(value) +
                              " does not fit in header field " + spec.name);
  std::uint8_t* ptr = block + spec.offset;
  if (spec.encoding == FieldEncoding::UInt16)
    storeBE<std::uint16_t>(ptr, static_cast<std::uint16_t>(value));
  else
    storeSignedBE(ptr, spec.width, value);
}

/////////////////////////////////////////////////////////////////////////////
//    Sample formats   //////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

bool
isKnownFormat(std::int32_t code)
{
  switch (static_cast<RawFormat>(code)) {
  case RawFormat::IbmFloat32:
  case RawFormat::Int32:
  case RawFormat::Int16:
  case RawFormat::IeeeFloat32:
  case RawFormat::Int8:
    return true;
  default:
    return false;
  }
}

/**
 * Width in bytes of one sample. An unknown code raises
 * SegyUnsupportedFormat; choosing a fallback width is up to the caller.
 */
std::int32_t
bytesPerSample(std::int32_t code)
{
  switch (static_cast<RawFormat>(code)) {
  case RawFormat::IbmFloat32:  return 4;
  case RawFormat::Int32:       return 4;
  case RawFormat::Int16:       return 2;
  case RawFormat::IeeeFloat32: return 4;
  case RawFormat::Int8:        return 1;
  default:
    throw SegyUnsupportedFormat(code);
  }
}

std::string
formatDescription(std::int32_t code)
{
  switch (static_cast<RawFormat>(code)) {
  case RawFormat::IbmFloat32:  return "IBM floating point (4 bytes)";
  case RawFormat::Int32:       return "4-byte integer";
  case RawFormat::Int16:       return "2-byte integer";
  case RawFormat::IeeeFloat32: return "IEEE floating point (4 bytes)";
  case RawFormat::Int8:        return "1-byte integer";
  default:
    return "Unknown (" + std::to_string(code) + ")";
  }
}

/**
 * IBM System/370 single precision: sign bit, 7 bit base-16 exponent
 * biased by 64, 24 bit fraction with the radix point to its left.
 * Every IBM value is exactly representable as a double.
 */
double
ibmToDouble(std::uint32_t ibm)
{
  const std::uint32_t fraction = ibm & 0x00ffffffu;
  if (fraction == 0)
    return 0.0;
  const int exponent = static_cast<int>((ibm >> 24) & 0x7f);
  const double magnitude = std::ldexp(static_cast<double>(fraction),
                                      4 * (exponent - 64) - 24);
  return (ibm & 0x80000000u) ? -magnitude : magnitude;
}

/**
 * Inverse of ibmToDouble(), rounding the fraction to nearest.
 * Values too large for IBM become the largest finite IBM number,
 * values too small lose precision and eventually become zero.
 */
std::uint32_t
doubleToIbm(double value)
{
  if (!std::isfinite(value))
    throw SegyInvalidArgument("IBM float cannot represent " + std::to_string(value));
  if (value == 0.0)
    return 0;

  const std::uint32_t sign = std::signbit(value) ? 0x80000000u : 0u;
  int e2 = 0;
  const double mantissa = std::frexp(std::fabs(value), &e2); // [0.5, 1)
  int e16 = (e2 >= 0) ? (e2 + 3) / 4 : -((-e2) / 4);         // ceil(e2/4)
  const double fraction = std::ldexp(mantissa, e2 - 4*e16);  // [1/16, 1)
  std::int64_t bits = std::llround(std::ldexp(fraction, 24));
  if (bits >= (std::int64_t(1) << 24)) {
    bits >>= 4;
    ++e16;
  }
  int biased = e16 + 64;
  if (biased > 127)
    return sign | 0x7fffffffu;
  if (biased < 0) {
    const int shift = -4 * biased;
    if (shift >= 24)
      return 0;
    bits >>= shift;
    biased = 0;
    if (bits == 0)
      return 0;
  }
  return sign | (static_cast<std::uint32_t>(biased) << 24) | static_cast<std::uint32_t>(bits);
}

void
decodeSamples(const void* raw, std::int64_t count, std::int32_t code, double* out)
{
  decodeSamplesT(raw, count, code, out);
}

void
decodeSamples(const void* raw, std::int64_t count, std::int32_t code, float* out)
{
  decodeSamplesT(raw, count, code, out);
}

void
encodeSamples(const double* in, std::int64_t count, std::int32_t code, void* raw)
{
  std::uint8_t* dst = static_cast<std::uint8_t*>(raw);
  switch (static_cast<RawFormat>(code)) {
  case RawFormat::IbmFloat32:
    for (std::int64_t ii = 0; ii < count; ++ii)
      storeBE<std::uint32_t>(dst + 4*ii, doubleToIbm(in[ii]));
    break;
  case RawFormat::Int32:
    for (std::int64_t ii = 0; ii < count; ++ii)
      storeBE<std::int32_t>(dst + 4*ii, roundForFormat<std::int32_t>(in[ii], code));
    break;
  case RawFormat::Int16:
    for (std::int64_t ii = 0; ii < count; ++ii)
      storeBE<std::int16_t>(dst + 2*ii, roundForFormat<std::int16_t>(in[ii], code));
    break;
  case RawFormat::IeeeFloat32:
    for (std::int64_t ii = 0; ii < count; ++ii)
      storeBE<float>(dst + 4*ii, static_cast<float>(in[ii]));
    break;
  case RawFormat::Int8:
    for (std::int64_t ii = 0; ii < count; ++ii)
      dst[ii] = static_cast<std::uint8_t>(roundForFormat<std::int8_t>(in[ii], code));
    break;
  default:
    throw SegyUnsupportedFormat(code);
  }
}

/////////////////////////////////////////////////////////////////////////////
//    Textual header   //////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

/**
 * A card image header starts with "C" which is 0xC3 in EBCDIC. If the
 * first byte is neither, count EBCDIC spaces against ASCII spaces.
 */
bool
looksLikeEbcdic(const std::string& text)
{
  if (text.empty())
    return false;
  const std::uint8_t first = static_cast<std::uint8_t>(text[0]);
  if (first == 0xC3)
    return true;
  if (first == 'C')
    return false;
  const auto ebcdic_spaces = std::count(text.begin(), text.end(), '\x40');
  const auto ascii_spaces = std::count(text.begin(), text.end(), '\x20');
  return ebcdic_spaces > ascii_spaces;
}

std::string
ebcdicToAscii(const std::string& text)
{
  std::string result(text.size(), ' ');
  for (std::size_t ii = 0; ii < text.size(); ++ii)
    result[ii] = static_cast<char>(e2a[static_cast<std::uint8_t>(text[ii])]);
  return result;
}

std::string
asciiToEbcdic(const std::string& text)
{
  std::string result(text.size(), '\x40');
  for (std::size_t ii = 0; ii < text.size(); ++ii) {
    const std::uint8_t ch = static_cast<std::uint8_t>(text[ii]);
    result[ii] = static_cast<char>(ch < 128 ? a2e[ch] : 0x6f);
  }
  return result;
}

} // namespace
