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

#include "api.h"
#include "iocontext.h"
#include "exception.h"
#include "impl/file.h"
#include "impl/layout.h"
#include "impl/logger.h"
#include "impl/environment.h"

#include <tuple>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <atomic>
#include <algorithm>

/**
 * \file api.cpp
 * \brief Implements the pure interfaces of the API.
 */

using InternalSEGY::FieldSpec;
using InternalSEGY::FieldEncoding;
using InternalSEGY::OpenMode;
using InternalSEGY::UsageHint;
namespace Layout = InternalSEGY::Layout;

namespace {
  /**
   * Attach a logger. Used by the SegyReader and SegyWriter constructors.
   * An explicit logger in a LocalIOContext wins, otherwise the level
   * comes from $OPENSEGY_VERBOSE.
   */
  std::tuple<std::function<bool(int, const std::string&)>, std::shared_ptr<OpenSEGY::IOContext>> setupLogging(const OpenSEGY::IOContext *iocontext)
  {
    std::function<bool(int, const std::string&)> logger;
    std::shared_ptr<OpenSEGY::IOContext> ctxt = iocontext ? iocontext->clone() : nullptr;
    auto iocontext_local = dynamic_cast<OpenSEGY::LocalIOContext*>(ctxt.get());
    if (iocontext_local && iocontext_local->getLogger()) {
      logger = iocontext_local->getLogger();
    }
    else {
      logger = InternalSEGY::LoggerBase::standardCallback
        (InternalSEGY::LoggerBase::getVerboseFromEnv("OPENSEGY_VERBOSE"),
         "opensegy-api: ", "");
    }
    return std::make_tuple(logger, ctxt);
  }

  /**
   * Settings from the context, or from a default constructed
   * LocalIOContext if the caller didn't pass one. The latter picks
   * up the environment variables.
   */
  OpenSEGY::LocalIOContext localSettings(const OpenSEGY::IOContext *iocontext)
  {
    auto local = dynamic_cast<const OpenSEGY::LocalIOContext*>(iocontext);
    return local ? *local : OpenSEGY::LocalIOContext();
  }
}

namespace OpenSEGY {
#if 0
}
#endif

/////////////////////////////////////////////////////////////////////////////
//    Field tables   ////////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

namespace Impl {
#if 0
}
#endif

/**
 * \brief Map public enums to their on-disk description.
 *
 * Offsets are relative to the start of the header block, i.e. binary
 * header offset 16 is absolute file offset 3216.
 */
class EnumMapper
{
  EnumMapper() = delete;
public:
  static const FieldSpec& binField(BinField field);
  static const FieldSpec& traceField(TraceField field);
  static SampleFormat mapFormatCode(std::int32_t code);
};

namespace {
  static const FieldSpec bin_fields[] = {
    {   0, 4, FieldEncoding::Int32,  "JobId" },
    {   4, 4, FieldEncoding::Int32,  "LineNumber" },
    {   8, 4, FieldEncoding::Int32,  "ReelNumber" },
    {  12, 2, FieldEncoding::Int16,  "Traces" },
    {  14, 2, FieldEncoding::Int16,  "AuxTraces" },
    {  16, 2, FieldEncoding::UInt16, "Interval" },
    {  18, 2, FieldEncoding::UInt16, "IntervalOriginal" },
    {  20, 2, FieldEncoding::UInt16, "Samples" },
    {  22, 2, FieldEncoding::UInt16, "SamplesOriginal" },
    {  24, 2, FieldEncoding::Int16,  "Format" },
    {  26, 2, FieldEncoding::Int16,  "EnsembleFold" },
    {  28, 2, FieldEncoding::Int16,  "SortingCode" },
    {  30, 2, FieldEncoding::Int16,  "VerticalSum" },
    {  54, 2, FieldEncoding::Int16,  "MeasurementSystem" },
    {  56, 2, FieldEncoding::Int16,  "ImpulsePolarity" },
    {  58, 2, FieldEncoding::Int16,  "VibratoryPolarity" },
    { 300, 2, FieldEncoding::UInt16, "SegyRevision" },
    { 302, 2, FieldEncoding::Int16,  "FixedLengthTraces" },
    { 304, 2, FieldEncoding::Int16,  "ExtendedHeaders" },
  };

  static const FieldSpec trace_fields[] = {
    {   0, 4, FieldEncoding::Int32,  "SequenceLine" },
    {   4, 4, FieldEncoding::Int32,  "SequenceFile" },
    {   8, 4, FieldEncoding::Int32,  "FieldRecord" },
    {  12, 4, FieldEncoding::Int32,  "TraceNumber" },
    {  16, 4, FieldEncoding::Int32,  "EnergySourcePoint" },
    {  20, 4, FieldEncoding::Int32,  "Ensemble" },
    {  24, 4, FieldEncoding::Int32,  "EnsembleTrace" },
    {  28, 2, FieldEncoding::Int16,  "TraceId" },
    {  36, 4, FieldEncoding::Int32,  "Offset" },
    {  68, 2, FieldEncoding::Int16,  "ElevationScalar" },
    {  70, 2, FieldEncoding::Int16,  "CoordinateScalar" },
    {  72, 4, FieldEncoding::Int32,  "SourceX" },
    {  76, 4, FieldEncoding::Int32,  "SourceY" },
    {  80, 4, FieldEncoding::Int32,  "GroupX" },
    {  84, 4, FieldEncoding::Int32,  "GroupY" },
    {  88, 2, FieldEncoding::Int16,  "CoordinateUnits" },
    { 108, 2, FieldEncoding::Int16,  "DelayTime" },
    { 114, 2, FieldEncoding::UInt16, "SampleCount" },
    { 116, 2, FieldEncoding::UInt16, "SampleInterval" },
    { 180, 4, FieldEncoding::Int32,  "CdpX" },
    { 184, 4, FieldEncoding::Int32,  "CdpY" },
    { 188, 4, FieldEncoding::Int32,  "Inline" },
    { 192, 4, FieldEncoding::Int32,  "Crossline" },
    { 196, 4, FieldEncoding::Int32,  "ShotPoint" },
  };

  constexpr std::size_t bin_field_count = sizeof(bin_fields) / sizeof(bin_fields[0]);
  constexpr std::size_t trace_field_count = sizeof(trace_fields) / sizeof(trace_fields[0]);
  static_assert(bin_field_count == static_cast<std::size_t>(BinField::ExtendedHeaders) + 1,
                "bin_fields must match BinField");
  static_assert(trace_field_count == static_cast<std::size_t>(TraceField::ShotPoint) + 1,
                "trace_fields must match TraceField");
}

const FieldSpec&
EnumMapper::binField(BinField field)
{
  const std::size_t ix = static_cast<std::size_t>(field);
  if (ix >= bin_field_count)
    throw Errors::SegyInvalidArgument("Unknown BinField " + std::to_string(ix));
  return bin_fields[ix];
}

const FieldSpec&
EnumMapper::traceField(TraceField field)
{
  const std::size_t ix = static_cast<std::size_t>(field);
  if (ix >= trace_field_count)
    throw Errors::SegyInvalidArgument("Unknown TraceField " + std::to_string(ix));
  return trace_fields[ix];
}

SampleFormat
EnumMapper::mapFormatCode(std::int32_t code)
{
  return InternalSEGY::isKnownFormat(code) ?
    static_cast<SampleFormat>(code) : SampleFormat::unknown;
}

} // namespace Impl

/////////////////////////////////////////////////////////////////////////////
//    Headers   /////////////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

BinaryHeader::BinaryHeader()
  : _raw()
{
  _raw.fill(0);
}

BinaryHeader::BinaryHeader(const raw_t& raw)
  : _raw(raw)
{
}

std::int64_t
BinaryHeader::get(BinField field) const
{
  return InternalSEGY::decodeField(_raw.data(), Impl::EnumMapper::binField(field));
}

BinaryHeader&
BinaryHeader::set(BinField field, std::int64_t value)
{
  InternalSEGY::encodeField(_raw.data(), Impl::EnumMapper::binField(field), value);
  return *this;
}

std::int32_t
BinaryHeader::sampleInterval() const
{
  return static_cast<std::int32_t>(get(BinField::Interval));
}

std::int32_t
BinaryHeader::samples() const
{
  return static_cast<std::int32_t>(get(BinField::Samples));
}

std::int32_t
BinaryHeader::formatCode() const
{
  return static_cast<std::int32_t>(get(BinField::Format));
}

MeasurementSystem
BinaryHeader::measurementSystem() const
{
  switch (get(BinField::MeasurementSystem)) {
  case 1:  return MeasurementSystem::meters;
  case 2:  return MeasurementSystem::feet;
  default: return MeasurementSystem::unknown;
  }
}

const std::vector<BinField>&
BinaryHeader::allFields()
{
  static const std::vector<BinField> all = [](){
    std::vector<BinField> result;
    for (std::size_t ii = 0; ii < Impl::bin_field_count; ++ii)
      result.push_back(static_cast<BinField>(ii));
    return result;
  }();
  return all;
}

std::string
BinaryHeader::fieldName(BinField field)
{
  return Impl::EnumMapper::binField(field).name;
}

TraceHeader::TraceHeader()
  : _raw()
{
  _raw.fill(0);
}

TraceHeader::TraceHeader(const raw_t& raw)
  : _raw(raw)
{
}

std::int64_t
TraceHeader::get(TraceField field) const
{
  return InternalSEGY::decodeField(_raw.data(), Impl::EnumMapper::traceField(field));
}

TraceHeader&
TraceHeader::set(TraceField field, std::int64_t value)
{
  InternalSEGY::encodeField(_raw.data(), Impl::EnumMapper::traceField(field), value);
  return *this;
}

double
TraceHeader::scaleCoordinate(std::int64_t value) const
{
  const std::int64_t scalar = get(TraceField::CoordinateScalar);
  if (scalar < 0)
    return static_cast<double>(value) / static_cast<double>(-scalar);
  if (scalar > 0)
    return static_cast<double>(value) * static_cast<double>(scalar);
  return static_cast<double>(value);
}

const std::vector<TraceField>&
TraceHeader::allFields()
{
  static const std::vector<TraceField> all = [](){
    std::vector<TraceField> result;
    for (std::size_t ii = 0; ii < Impl::trace_field_count; ++ii)
      result.push_back(static_cast<TraceField>(ii));
    return result;
  }();
  return all;
}

std::string
TraceHeader::fieldName(TraceField field)
{
  return Impl::EnumMapper::traceField(field).name;
}

void
FileInfo::dump(std::ostream& out) const
{
  std::stringstream ss;
  ss << std::string(60, '=') << "\n"
     << "SEGY FILE HEADER SUMMARY\n"
     << std::string(60, '=') << "\n"
     << "File:                 " << filepath << "\n"
     << "Total traces:         " << total_traces << "\n"
     << "Samples per trace:    " << samples_per_trace << "\n"
     << "Sample data size:     " << std::fixed << std::setprecision(2)
     << total_data_size_mb << " MB\n"
     << "Sample interval:      " << sample_interval_us << " us ("
     << std::setprecision(3) << sample_interval_ms << " ms)\n"
     << "Total time/depth:     " << std::setprecision(2)
     << total_time_depth_ms << " ms\n"
     << "Format:               " << data_format << "\n"
     << "Measurement system:   " << measurement_system << "\n"
     << std::string(60, '=') << "\n";
  out << ss.str();
}

SegyWriterArgs&
SegyWriterArgs::iocontext(const IOContext *value)
{
  _iocontext = value ? value->clone() : nullptr;
  return *this;
}

/////////////////////////////////////////////////////////////////////////////
//    SegyMeta, SegyReader, SegyWriter   ////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

namespace Impl {
#if 0
}
#endif

/**
 * \brief Header information and geometry shared by reader and writer.
 *
 * Thread safety: Everything except _tracecount is set in the
 * constructor. Only the writer changes _tracecount, and the
 * writer is not thread safe.
 */
class SegyMeta : virtual public ISegyMeta
{
public:
  typedef std::function<bool(int, const std::string&)> LoggerFn;

protected:
  std::shared_ptr<InternalSEGY::IFileADT> _fd;
  std::string  _filename;
  std::string  _text;
  BinaryHeader _bin;
  std::int32_t _samples;
  std::int32_t _interval;
  std::int32_t _format;
  std::int32_t _bps;
  std::int64_t _stride;
  std::int64_t _tracecount;
  LoggerFn     _logger;

protected:
  SegyMeta()
    : _fd(), _filename(), _text(), _bin()
    , _samples(0), _interval(0), _format(0), _bps(0)
    , _stride(0), _tracecount(0)
    , _logger(InternalSEGY::LoggerBase::emptyCallback())
  {
  }

  /**
   * Return the open file or throw if it has been closed. Callers keep
   * the returned pointer for the duration of their operation.
   */
  std::shared_ptr<InternalSEGY::IFileADT> _file() const
  {
    std::shared_ptr<InternalSEGY::IFileADT> fd = _fd;
    if (!fd)
      throw Errors::SegyClosedError("The file \"" + _filename + "\" is closed.");
    return fd;
  }

  /**
   * Read the textual and binary headers from an existing file and
   * derive the trace geometry. The file length must be exactly
   * 3600 + tracecount * stride.
   */
  void _loadHeaders(bool allow_unknown_format)
  {
    const std::int64_t eof = _fd->xx_eof();
    if (eof < Layout::FirstTracePos)
      throw Errors::SegyFormatError(_filename + ": Only " + std::to_string(eof) +
                                    " bytes, too short to hold the SEG-Y headers.");
    _text.assign(static_cast<std::size_t>(Layout::TextualHeaderSize), ' ');
    _fd->xx_read(&_text[0], 0, Layout::TextualHeaderSize, UsageHint::Header);
    BinaryHeader::raw_t raw;
    _fd->xx_read(raw.data(), Layout::BinaryHeaderPos, Layout::BinaryHeaderSize, UsageHint::Header);
    _bin = BinaryHeader(raw);
    _initGeometry(allow_unknown_format);

    const std::int64_t databytes = eof - Layout::FirstTracePos;
    if (databytes % _stride != 0)
      throw Errors::SegyCorruptFile
        (_filename + ": Trace area of " + std::to_string(databytes) +
         " bytes is not a multiple of the trace size " + std::to_string(_stride) + ".");
    _tracecount = databytes / _stride;

    if (_logger(1, ""))
      InternalSEGY::LoggerBase::logger(_logger, 1, std::stringstream() << "Opened \"" << _filename << "\": "
              << _tracecount << " traces of " << _samples
              << " samples, interval " << _interval << " us, format " << _format);
  }

  /**
   * Validate the binary header and compute samples, interval, format,
   * and the trace stride.
   */
  void _initGeometry(bool allow_unknown_format)
  {
    _samples  = _bin.samples();
    _interval = _bin.sampleInterval();
    _format   = _bin.formatCode();
    if (_samples <= 0)
      throw Errors::SegyCorruptFile(_filename + ": Samples per trace must be positive.");
    if (_interval <= 0)
      throw Errors::SegyCorruptFile(_filename + ": Sample interval must be positive.");
    if (_bin.get(BinField::SegyRevision) >= 0x0100 && _bin.get(BinField::ExtendedHeaders) != 0)
      throw Errors::SegyFormatError(_filename + ": Extended textual headers are not supported.");
    if (InternalSEGY::isKnownFormat(_format)) {
      _bps = InternalSEGY::bytesPerSample(_format);
    }
    else if (allow_unknown_format) {
      _bps = 4;
      _logger(0, _filename + ": Unsupported sample format " +
              std::to_string(_format) + ", assuming 4 bytes per sample.");
    }
    else {
      throw Errors::SegyUnsupportedFormat(_format);
    }
    _stride = Layout::TraceHeaderSize + static_cast<std::int64_t>(_samples) * _bps;
  }

  std::int64_t _traceOffset(std::int64_t index) const
  {
    return Layout::FirstTracePos + index * _stride;
  }

  void _checkTrace(std::int64_t index, std::int64_t limit) const
  {
    if (index < 0 || index >= limit)
      throw Errors::SegyIndexOutOfRange
        ("Trace index " + std::to_string(index) +
         " is outside [0, " + std::to_string(limit) + ").");
  }

  void _checkTraceRange(std::int64_t start, std::int64_t end) const
  {
    if (start < 0 || end > _tracecount || start >= end)
      throw Errors::SegyIndexOutOfRange
        ("Trace range [" + std::to_string(start) + ", " + std::to_string(end) +
         ") is not inside [0, " + std::to_string(_tracecount) + ").");
  }

  void _checkSampleRange(std::int64_t start, std::int64_t end) const
  {
    if (start < 0 || end > _samples || start >= end)
      throw Errors::SegySampleRangeError
        ("Sample range [" + std::to_string(start) + ", " + std::to_string(end) +
         ") is not inside [0, " + std::to_string(_samples) + ").");
  }

public:
  std::string filename() const override
  {
    _file();
    return _filename;
  }

  std::int64_t tracecount() const override
  {
    _file();
    return _tracecount;
  }

  std::int32_t samples() const override
  {
    _file();
    return _samples;
  }

  std::int32_t sampleinterval_us() const override
  {
    _file();
    return _interval;
  }

  double sampleinterval_ms() const override
  {
    _file();
    return _interval / 1000.0;
  }

  std::int32_t formatcode() const override
  {
    _file();
    return _format;
  }

  SampleFormat format() const override
  {
    _file();
    return EnumMapper::mapFormatCode(_format);
  }

  std::int32_t bytespersample() const override
  {
    _file();
    return _bps;
  }

  std::int64_t tracestride() const override
  {
    _file();
    return _stride;
  }

  std::string textheader() const override
  {
    _file();
    return _text;
  }

  std::string textheaderAscii() const override
  {
    _file();
    return InternalSEGY::looksLikeEbcdic(_text) ?
      InternalSEGY::ebcdicToAscii(_text) : _text;
  }

  BinaryHeader binheader() const override
  {
    _file();
    return _bin;
  }

  FileInfo fileinfo() const override
  {
    _file();
    FileInfo info;
    info.filepath            = _filename;
    info.total_traces        = _tracecount;
    info.samples_per_trace   = _samples;
    info.sample_interval_us  = _interval;
    info.sample_interval_ms  = _interval / 1000.0;
    info.total_time_depth_ms = _samples * info.sample_interval_ms;
    info.data_format         = InternalSEGY::formatDescription(_format);
    info.format_code         = _format;
    switch (_bin.measurementSystem()) {
    case MeasurementSystem::meters: info.measurement_system = "Meters"; break;
    case MeasurementSystem::feet:   info.measurement_system = "Feet"; break;
    default:                        info.measurement_system = "Unknown"; break;
    }
    const double bytes = static_cast<double>(_tracecount) * _samples * _bps;
    info.total_data_size_mb  = std::round(bytes / (1024.0 * 1024.0) * 100.0) / 100.0;
    info.binary_header       = _bin;
    return info;
  }

  void dump(std::ostream& out) const override
  {
    fileinfo().dump(out);
    std::stringstream ss;
    ss << "Binary header:\n";
    for (BinField field : BinaryHeader::allFields())
      ss << "  " << std::left << std::setw(20) << BinaryHeader::fieldName(field)
         << " " << _bin.get(field) << "\n";
    ss << "Textual header:\n";
    const std::string text = textheaderAscii();
    for (std::size_t pos = 0; pos < text.size(); pos += 80)
      ss << "  " << text.substr(pos, 80) << "\n";
    out << ss.str();
  }
};

/**
 * \brief Concrete implementation of ISegyReader.
 *
 * Thread safety: Reads are safe to issue concurrently. The error
 * flag is atomic. close() must not overlap anything else.
 */
class SegyReader : public SegyMeta, virtual public ISegyReader
{
private:
  mutable std::atomic<bool> _errorflag;
  std::int64_t _large_read_mb;

public:
  /**
   * \copydoc ISegyReader::open()
   */
  SegyReader(const std::string& filename, const IOContext* iocontext)
    : SegyMeta()
    , _errorflag(false)
    , _large_read_mb(0)
  {
    std::shared_ptr<IOContext> ctxt;
    std::tie(_logger, ctxt) = setupLogging(iocontext);
    const LocalIOContext settings = localSettings(ctxt.get());
    _large_read_mb = settings.getLargeReadWarningMB();
    _filename = filename;
    _fd = InternalSEGY::FileFactory::instance().create(
        filename, OpenMode::ReadOnly, ctxt.get());
    try {
      _loadHeaders(settings.getAllowUnknownFormat());
    }
    catch (const Errors::SegyEndOfFile& ex) {
      // Only possible if the file shrank while being opened.
      _fd->xx_close();
      throw Errors::SegyCorruptFile(_filename + ": " + ex.what());
    }
    catch (const std::exception&) {
      _fd->xx_close();
      throw;
    }
  }

  ~SegyReader()
  {
    if (_fd) {
      try {
        close();
      }
      catch (const std::exception& ex) {
        // Caller should have done an explicit close() so it can handle
        // exceptions itself. Exceptions thrown from a destructor are evil.
        _logger(0, "ERROR closing a file opened for read: " + std::string(ex.what()));
      }
    }
  }

  TraceHeader traceheader(std::int64_t index) const override
  {
    auto fd = _file();
    _checkTrace(index, _tracecount);
    TraceHeader::raw_t raw;
    _guarded([&](){
      fd->xx_read(raw.data(), _traceOffset(index), Layout::TraceHeaderSize, UsageHint::TraceHeader);
    });
    return TraceHeader(raw);
  }

  std::vector<double> readsamples(std::int64_t index, std::int64_t start, std::int64_t end) const override
  {
    auto fd = _file();
    _checkTrace(index, _tracecount);
    _checkSampleRange(start, end);
    SampleMatrix<double> result(1, end - start);
    _readRows(fd, index, index + 1, start, end, result);
    return result.values();
  }

  std::vector<double> readtrace(std::int64_t index) const override
  {
    return readsamples(index, 0, samples());
  }

  TraceMatrix readtraces(std::int64_t start, std::int64_t end) const override
  {
    auto fd = _file();
    _checkTraceRange(start, end);
    TraceMatrix result(end - start, _samples);
    _readRows(fd, start, end, 0, _samples, result);
    return result;
  }

  ChunkData readwindow(std::int64_t trace_start, std::int64_t trace_end, std::int64_t sample_start, std::int64_t sample_end) const override
  {
    auto fd = _file();
    _checkTraceRange(trace_start, trace_end);
    _checkSampleRange(sample_start, sample_end);
    ChunkData result(trace_end - trace_start, sample_end - sample_start);
    _readRows(fd, trace_start, trace_end, sample_start, sample_end, result);
    return result;
  }

  TraceMatrix readall() const override
  {
    _file();
    const double mb = static_cast<double>(_tracecount) * _samples * _bps / (1024.0*1024.0);
    if (mb > static_cast<double>(_large_read_mb))
      InternalSEGY::LoggerBase::logger(_logger, 0, std::stringstream() << "Reading all of \"" << _filename << "\" needs "
              << std::fixed << std::setprecision(1) << mb
              << " MB of sample data. Consider reading a range of traces.");
    if (_tracecount == 0)
      return TraceMatrix(0, _samples);
    return readtraces(0, _tracecount);
  }

  std::vector<double> timeaxis(std::int64_t start, std::int64_t end) const override
  {
    _file();
    if (start < 0 || end > _samples || start > end)
      throw Errors::SegySampleRangeError
        ("Sample range [" + std::to_string(start) + ", " + std::to_string(end) +
         ") is not inside [0, " + std::to_string(_samples) + "].");
    const double interval_ms = _interval / 1000.0;
    std::vector<double> result;
    result.reserve(static_cast<std::size_t>(end - start));
    for (std::int64_t ii = start; ii < end; ++ii)
      result.push_back(static_cast<double>(ii) * interval_ms);
    return result;
  }

  std::vector<std::int64_t> traceaxis(std::int64_t start, std::int64_t end) const override
  {
    _file();
    if (start < 0 || end > _tracecount || start > end)
      throw Errors::SegyIndexOutOfRange
        ("Trace range [" + std::to_string(start) + ", " + std::to_string(end) +
         ") is not inside [0, " + std::to_string(_tracecount) + "].");
    std::vector<std::int64_t> result;
    result.reserve(static_cast<std::size_t>(end - start));
    for (std::int64_t ii = start; ii < end; ++ii)
      result.push_back(ii);
    return result;
  }

  bool errorflag() const override
  {
    return _errorflag.load();
  }

  /**
   * \details Thread safety: No other operation may be in progress.
   */
  void close() override
  {
    std::shared_ptr<InternalSEGY::IFileADT> fd = _file();
    _fd.reset();
    fd->xx_close();
  }

private:
  /**
   * Run a low level read. A short read means the file changed after
   * it was opened. Flag the reader as broken and report it as corrupt.
   * Once flagged, every read fails.
   */
  void _guarded(const std::function<void()>& fn) const
  {
    if (_errorflag.load())
      throw Errors::SegyCorruptFile(_filename + ": An earlier read failed, the file can no longer be trusted.");
    try {
      fn();
    }
    catch (const Errors::SegyEndOfFile& ex) {
      _errorflag.store(true);
      throw Errors::SegyCorruptFile(_filename + ": " + ex.what());
    }
    catch (const Errors::SegyIoError&) {
      _errorflag.store(true);
      throw;
    }
  }

  /**
   * Decode samples [s0,s1) of traces [t0,t1) into consecutive rows
   * of result. Only the needed bytes of each trace are read.
   */
  template<typename T>
  void _readRows(const std::shared_ptr<InternalSEGY::IFileADT>& fd,
                 std::int64_t t0, std::int64_t t1,
                 std::int64_t s0, std::int64_t s1,
                 SampleMatrix<T>& result) const
  {
    if (!InternalSEGY::isKnownFormat(_format))
      throw Errors::SegyUnsupportedFormat(_format);
    const std::int64_t count = s1 - s0;
    const std::int32_t format = _format;
    InternalSEGY::ReadList requests;
    requests.reserve(static_cast<std::size_t>(t1 - t0));
    for (std::int64_t trace = t0; trace < t1; ++trace) {
      T* out = result.row(trace - t0);
      requests.push_back(InternalSEGY::ReadRequest
        (_traceOffset(trace) + Layout::TraceHeaderSize + s0 * _bps,
         count * _bps,
         [out, count, format](const void* data, std::int64_t) {
           InternalSEGY::decodeSamples(data, count, format, out);
         }));
    }
    _guarded([&](){
      fd->xx_readv(requests, (t1 - t0) > 1, UsageHint::Data);
    });
  }
};

/**
 * \brief Concrete implementation of ISegyWriter.
 *
 * Thread safety: Not thread safe.
 */
class SegyWriter : public SegyMeta, virtual public ISegyWriter
{
private:
  bool _errorflag;

public:
  /**
   * \copydoc ISegyWriter::open()
   */
  explicit SegyWriter(const SegyWriterArgs& args)
    : SegyMeta()
    , _errorflag(false)
  {
    std::shared_ptr<IOContext> ctxt;
    std::tie(_logger, ctxt) = setupLogging(args._iocontext.get());
    _filename = args._filename;
    if (_filename.empty())
      throw Errors::SegyInvalidArgument("Output file name must be specified.");
    _bin = args._binheader;
    if (args._samples >= 0)
      _bin.set(BinField::Samples, args._samples);
    if (args._interval >= 0)
      _bin.set(BinField::Interval, args._interval);
    if (args._format >= 0)
      _bin.set(BinField::Format, args._format);
    _text = _encodeText(args._textheader, args._ebcdic);
    try {
      _initGeometry(false);
    }
    catch (const Errors::SegyCorruptFile& ex) {
      // Bad arguments rather than a bad file.
      throw Errors::SegyInvalidArgument(ex.what());
    }

    _fd = InternalSEGY::FileFactory::instance().create(
        _filename, OpenMode::Truncate, ctxt.get());
    _fd->xx_write(_text.data(), 0, Layout::TextualHeaderSize, UsageHint::Header);
    _fd->xx_write(_bin.raw().data(), Layout::BinaryHeaderPos, Layout::BinaryHeaderSize, UsageHint::Header);
    _tracecount = 0;
    if (_logger(1, ""))
      InternalSEGY::LoggerBase::logger(_logger, 1, std::stringstream() << "Created \"" << _filename << "\": "
              << _samples << " samples, interval " << _interval
              << " us, format " << _format);
  }

  /**
   * \copydoc ISegyWriter::reopen()
   */
  SegyWriter(const std::string& filename, const IOContext* iocontext)
    : SegyMeta()
    , _errorflag(false)
  {
    std::shared_ptr<IOContext> ctxt;
    std::tie(_logger, ctxt) = setupLogging(iocontext);
    _filename = filename;
    _fd = InternalSEGY::FileFactory::instance().create(
        filename, OpenMode::ReadWrite, ctxt.get());
    try {
      _loadHeaders(false);
    }
    catch (const std::exception&) {
      _fd->xx_close();
      throw;
    }
  }

  ~SegyWriter()
  {
    if (_fd) {
      try {
        close();
      }
      catch (const std::exception& ex) {
        _logger(0, "ERROR closing a file opened for write: " + std::string(ex.what()));
      }
    }
  }

  void writetrace(std::int64_t index, const TraceHeader& header, const std::vector<double>& samples) override
  {
    auto fd = _file();
    _checkTrace(index, _tracecount + 1);
    _checkSampleCount(samples);
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(_stride));
    std::copy(header.raw().begin(), header.raw().end(), buffer.begin());
    InternalSEGY::encodeSamples(samples.data(), _samples, _format,
                                buffer.data() + Layout::TraceHeaderSize);
    _guarded([&](){
      fd->xx_write(buffer.data(), _traceOffset(index), _stride, UsageHint::Data);
    });
    if (index == _tracecount)
      ++_tracecount;
  }

  void writeheader(std::int64_t index, const TraceHeader& header) override
  {
    auto fd = _file();
    _checkTrace(index, _tracecount);
    _guarded([&](){
      fd->xx_write(header.raw().data(), _traceOffset(index), Layout::TraceHeaderSize, UsageHint::TraceHeader);
    });
  }

  void writesamples(std::int64_t index, const std::vector<double>& samples) override
  {
    auto fd = _file();
    _checkTrace(index, _tracecount);
    _checkSampleCount(samples);
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(_stride - Layout::TraceHeaderSize));
    InternalSEGY::encodeSamples(samples.data(), _samples, _format, buffer.data());
    _guarded([&](){
      fd->xx_write(buffer.data(), _traceOffset(index) + Layout::TraceHeaderSize,
                   _stride - Layout::TraceHeaderSize, UsageHint::Data);
    });
  }

  void settextheader(const std::string& text, bool ebcdic) override
  {
    auto fd = _file();
    std::string encoded = _encodeText(text, ebcdic);
    _guarded([&](){
      fd->xx_write(encoded.data(), 0, Layout::TextualHeaderSize, UsageHint::Header);
    });
    _text = encoded;
  }

  void close() override
  {
    std::shared_ptr<InternalSEGY::IFileADT> fd = _file();
    _fd.reset();
    fd->xx_close();
    if (_logger(1, ""))
      InternalSEGY::LoggerBase::logger(_logger, 1, std::stringstream() << "Closed \"" << _filename << "\" with "
              << _tracecount << " traces");
  }

private:
  static std::string _encodeText(const std::string& text, bool ebcdic)
  {
    if (static_cast<std::int64_t>(text.size()) > Layout::TextualHeaderSize)
      throw Errors::SegyInvalidArgument
        ("Textual header is " + std::to_string(text.size()) +
         " bytes, the maximum is 3200.");
    std::string padded = text + std::string(static_cast<std::size_t>(Layout::TextualHeaderSize) - text.size(), ' ');
    return ebcdic ? InternalSEGY::asciiToEbcdic(padded) : padded;
  }

  void _checkSampleCount(const std::vector<double>& samples) const
  {
    if (static_cast<std::int64_t>(samples.size()) != _samples)
      throw Errors::SegyInvalidArgument
        ("Got " + std::to_string(samples.size()) + " samples, expected " +
         std::to_string(_samples) + ".");
  }

  /**
   * A failed write leaves the file in an unknown state. Refuse
   * to write anything more to it.
   */
  void _guarded(const std::function<void()>& fn)
  {
    if (_errorflag)
      throw Errors::SegyCorruptFile(_filename + ": An earlier write failed, the file may be corrupt.");
    try {
      fn();
    }
    catch (const std::exception&) {
      _errorflag = true;
      throw;
    }
  }
};

} // namespace Impl

/////////////////////////////////////////////////////////////////////////////
//    Factories and helpers   ///////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

ProgressWithDots::ProgressWithDots(int length, std::ostream& outfile)
  : _dots_printed(0)
  , _length(length)
  , _outfile(outfile)
  , _mutex()
{
}

bool
ProgressWithDots::operator()(std::int64_t done, std::int64_t total)
{
  if (_length < 1)
    return true;
  std::lock_guard<std::mutex> lk(_mutex);
  if (_dots_printed == 0)
    _outfile << "[" + std::string(_length, ' ') + "]\r[" << std::flush;
  const std::int64_t needed = (total <= 0) ? 1 : 1 + ((done * (_length-1)) / total);
  while (needed > _dots_printed) {
    _outfile << '.';
    _dots_printed += 1;
  }
  _outfile << std::flush;
  if (done == total)
    _outfile << "\n" << std::flush;
  return true;
}

// Dummy destructors for the interface types, giving the compiler
// an obvious place to put the vtbl.

ISegyMeta::~ISegyMeta() {}
ISegyReader::~ISegyReader() {}
ISegyWriter::~ISegyWriter() {}

std::shared_ptr<ISegyReader>
ISegyReader::open(const std::string& filename, const IOContext* iocontext)
{
  return std::shared_ptr<ISegyReader>(new Impl::SegyReader(filename, iocontext));
}

std::shared_ptr<ISegyWriter>
ISegyWriter::open(const SegyWriterArgs& args)
{
  return std::shared_ptr<ISegyWriter>(new Impl::SegyWriter(args));
}

std::shared_ptr<ISegyWriter>
ISegyWriter::reopen(const std::string& filename, const IOContext* iocontext)
{
  return std::shared_ptr<ISegyWriter>(new Impl::SegyWriter(filename, iocontext));
}

namespace Formatters {
  /**
   * \brief Return the string representation of the input enum type.
   */
  std::string enumToString(SampleFormat value)
  {
    switch (value) {
    case SampleFormat::unknown:      return "SampleFormat::unknown";
    case SampleFormat::ibm_float32:  return "SampleFormat::ibm_float32";
    case SampleFormat::int32:        return "SampleFormat::int32";
    case SampleFormat::int16:        return "SampleFormat::int16";
    case SampleFormat::ieee_float32: return "SampleFormat::ieee_float32";
    case SampleFormat::int8:         return "SampleFormat::int8";
    default: return "SampleFormat::" + std::to_string((int)value);
    }
  }

  std::string enumToString(MeasurementSystem value)
  {
    switch (value) {
    case MeasurementSystem::unknown: return "MeasurementSystem::unknown";
    case MeasurementSystem::meters:  return "MeasurementSystem::meters";
    case MeasurementSystem::feet:    return "MeasurementSystem::feet";
    default: return "MeasurementSystem::" + std::to_string((int)value);
    }
  }

  std::ostream& operator<<(std::ostream& os, SampleFormat value)
  {
    return os << enumToString(value);
  }

  std::ostream& operator<<(std::ostream& os, MeasurementSystem value)
  {
    return os << enumToString(value);
  }

  std::ostream& operator<<(std::ostream& os, BinField value)
  {
    return os << "BinField::" << BinaryHeader::fieldName(value);
  }

  std::ostream& operator<<(std::ostream& os, TraceField value)
  {
    return os << "TraceField::" << TraceHeader::fieldName(value);
  }
}

} // namespace
