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

#include <cstdint>
#include <vector>
#include <array>
#include <ostream>
#include <iostream>
#include <functional>
#include <memory>
#include <string>
#include <mutex>

#include "declspec.h"

namespace OpenSEGY {
  /**
   * \mainpage
   *
   * The %OpenSEGY C++ API gives random access to the traces of a
   * SEG-Y file and splits the trace by sample grid into chunks.
   * The main part of the API is here:
   *
   * \li ISegyReader and its ISegyMeta base class.
   * \li ISegyWriter and its SegyWriterArgs argument package.
   * \li GridPartitioner for chunking, see partition.h.
   * \li StatisticsEngine for descriptive statistics, see statistics.h.
   * \li \ref exceptions that you might want to catch.
   * \li LocalIOContext for per-file options.
   */
}

namespace OpenSEGY {
#if 0
}
#endif

class IOContext;

namespace Impl {
  class SegyReader;
  class SegyWriter;
  class EnumMapper;
}

/** \file api.h
 *
 * \brief ISegyReader, ISegyWriter, and other user visible classes.
 *
 * A SEG-Y file is a 3200 byte textual header, a 400 byte binary
 * header, and a sequence of traces each consisting of a 240 byte
 * trace header followed by a fixed number of samples. All integers
 * are big-endian.
 *
 * The header classes in this file hold the raw bytes and decode
 * individual fields on request. Fields are named by the BinField and
 * TraceField enums; the byte offsets behind them are an implementation
 * detail.
 */

/**
 * \brief Sample format code from the binary header.
 *
 * Thread safety: Enums do not have race conditions.
 */
enum class OPENSEGY_API SampleFormat
{
  unknown      = 0,
  ibm_float32  = 1,
  int32        = 2,
  int16        = 3,
  ieee_float32 = 5,
  int8         = 8,
};

/**
 * \brief Unit of distances and elevations, from the binary header.
 *
 * Thread safety: Enums do not have race conditions.
 */
enum class OPENSEGY_API MeasurementSystem
{
  unknown = 0,
  meters  = 1,
  feet    = 2,
};

/**
 * \brief Named fields in the 400 byte binary file header.
 *
 * Thread safety: Enums do not have race conditions.
 */
enum class OPENSEGY_API BinField
{
  JobId,
  LineNumber,
  ReelNumber,
  Traces,              /**< \brief Data traces per ensemble. */
  AuxTraces,           /**< \brief Auxiliary traces per ensemble. */
  Interval,            /**< \brief Sample interval in microseconds. */
  IntervalOriginal,
  Samples,             /**< \brief Samples per trace. */
  SamplesOriginal,
  Format,              /**< \brief Sample format code, see SampleFormat. */
  EnsembleFold,
  SortingCode,
  VerticalSum,
  MeasurementSystem,   /**< \brief 1 = meters, 2 = feet. */
  ImpulsePolarity,
  VibratoryPolarity,
  SegyRevision,
  FixedLengthTraces,
  ExtendedHeaders,     /**< \brief Number of extended textual headers. */
};

/**
 * \brief Named fields in the 240 byte trace header.
 *
 * Thread safety: Enums do not have race conditions.
 */
enum class OPENSEGY_API TraceField
{
  SequenceLine,
  SequenceFile,
  FieldRecord,
  TraceNumber,
  EnergySourcePoint,
  Ensemble,            /**< \brief CDP ensemble number. */
  EnsembleTrace,
  TraceId,
  Offset,
  ElevationScalar,
  CoordinateScalar,    /**< \brief Power of ten applied to X/Y coordinates. */
  SourceX,
  SourceY,
  GroupX,
  GroupY,
  CoordinateUnits,
  DelayTime,
  SampleCount,         /**< \brief Per-trace override, reported as-is. */
  SampleInterval,      /**< \brief Per-trace override, reported as-is. */
  CdpX,
  CdpY,
  Inline,
  Crossline,
  ShotPoint,
};

namespace Formatters {
  extern OPENSEGY_API std::ostream& operator<<(std::ostream& os, SampleFormat value);
  extern OPENSEGY_API std::ostream& operator<<(std::ostream& os, MeasurementSystem value);
  extern OPENSEGY_API std::ostream& operator<<(std::ostream& os, BinField value);
  extern OPENSEGY_API std::ostream& operator<<(std::ostream& os, TraceField value);
}

/**
 * \brief The 400 byte binary file header.
 *
 * A default constructed header is all zeros. Setters reject values
 * that do not fit in the field with SegyInvalidArgument.
 *
 * \details Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
class OPENSEGY_API BinaryHeader
{
public:
  typedef std::array<std::uint8_t, 400> raw_t;

private:
  raw_t _raw;

public:
  BinaryHeader();
  explicit BinaryHeader(const raw_t& raw);
  std::int64_t  get(BinField field) const;
  BinaryHeader& set(BinField field, std::int64_t value);
  const raw_t&  raw() const { return _raw; }

  std::int32_t  sampleInterval() const;  /**< \brief Microseconds. */
  std::int32_t  samples() const;
  std::int32_t  formatCode() const;
  MeasurementSystem measurementSystem() const;

  static const std::vector<BinField>& allFields();
  static std::string fieldName(BinField field);
};

/**
 * \brief The 240 byte header preceding each trace.
 *
 * \details Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
class OPENSEGY_API TraceHeader
{
public:
  typedef std::array<std::uint8_t, 240> raw_t;

private:
  raw_t _raw;

public:
  TraceHeader();
  explicit TraceHeader(const raw_t& raw);
  std::int64_t get(TraceField field) const;
  TraceHeader& set(TraceField field, std::int64_t value);
  const raw_t& raw() const { return _raw; }

  /**
   * Apply the coordinate scalar to a raw coordinate. A negative
   * scalar divides by its absolute value, a positive one multiplies.
   * Zero is treated as one.
   */
  double scaleCoordinate(std::int64_t value) const;
  double cdpX() const { return scaleCoordinate(get(TraceField::CdpX)); }
  double cdpY() const { return scaleCoordinate(get(TraceField::CdpY)); }

  static const std::vector<TraceField>& allFields();
  static std::string fieldName(TraceField field);
};

/**
 * \brief Dense row major matrix, one row per trace.
 *
 * Owns its data. Element (row, col) is sample col of trace row.
 *
 * \details Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
template<typename T>
class SampleMatrix
{
private:
  std::int64_t _rows;
  std::int64_t _cols;
  std::vector<T> _data;

public:
  typedef T value_type;
  SampleMatrix() : _rows(0), _cols(0), _data() {}
  SampleMatrix(std::int64_t rows, std::int64_t cols)
    : _rows(rows), _cols(cols), _data(static_cast<std::size_t>(rows * cols), T(0))
  {
  }
  std::int64_t rows() const { return _rows; }
  std::int64_t cols() const { return _cols; }
  std::int64_t size() const { return _rows * _cols; }
  bool empty() const { return _data.empty(); }
  std::array<std::int64_t,2> shape() const { return std::array<std::int64_t,2>{_rows, _cols}; }
  T*       data()       { return _data.data(); }
  const T* data() const { return _data.data(); }
  T*       row(std::int64_t r)       { return _data.data() + r * _cols; }
  const T* row(std::int64_t r) const { return _data.data() + r * _cols; }
  T&       operator()(std::int64_t r, std::int64_t c)       { return _data[static_cast<std::size_t>(r * _cols + c)]; }
  const T& operator()(std::int64_t r, std::int64_t c) const { return _data[static_cast<std::size_t>(r * _cols + c)]; }
  const std::vector<T>& values() const { return _data; }
};

/** \brief Traces decoded to double precision. */
typedef SampleMatrix<double> TraceMatrix;
/** \brief A snapshot of one chunk in single precision. */
typedef SampleMatrix<float> ChunkData;

/**
 * \brief Summary of an open file.
 *
 * \details Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
class OPENSEGY_API FileInfo
{
public:
  std::string  filepath;
  std::int64_t total_traces;
  std::int32_t samples_per_trace;
  std::int32_t sample_interval_us;
  double       sample_interval_ms;
  double       total_time_depth_ms;
  std::string  data_format;         /**< \brief Human readable format. */
  std::int32_t format_code;
  std::string  measurement_system;  /**< \brief "Meters", "Feet" or "Unknown". */
  double       total_data_size_mb;  /**< \brief Sample bytes only, rounded to 2 decimals. */
  BinaryHeader binary_header;

  FileInfo()
    : filepath(), total_traces(0), samples_per_trace(0)
    , sample_interval_us(0), sample_interval_ms(0), total_time_depth_ms(0)
    , data_format(), format_code(0), measurement_system()
    , total_data_size_mb(0), binary_header()
  {
  }

  /** \brief Print in the format used by segydumpc. */
  void dump(std::ostream& out) const;
};

/**
 * \brief Argument package for creating a SEG-Y file.
 *
 * Short lived helper to pass the many arguments needed when creating
 * a file. The binary header is copied as given except that samples,
 * interval and format, if set explicitly, overwrite the corresponding
 * fields.
 *
 * \code
 *   SegyWriterArgs args = SegyWriterArgs()
 *     .filename("out.sgy")
 *     .samples(250)
 *     .interval(2000)
 *     .format(SampleFormat::ibm_float32);
 * \endcode
 *
 * Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
class OPENSEGY_API SegyWriterArgs
{
private:
  friend class Impl::SegyWriter;
  std::string _filename;
  std::shared_ptr<const IOContext> _iocontext;
  std::string _textheader;
  bool _ebcdic;
  BinaryHeader _binheader;
  std::int32_t _samples;
  std::int32_t _interval;
  std::int32_t _format;

public:
  SegyWriterArgs()
    : _filename("")
    , _iocontext()
    , _textheader("")
    , _ebcdic(false)
    , _binheader()
    , _samples(-1)
    , _interval(-1)
    , _format(-1)
  {
  }

  /** \brief Name of the file to create. It is truncated if it exists. */
  SegyWriterArgs& filename(const std::string& value) {
    _filename = value;
    return *this;
  }
  /** \brief Options for the file. The context is copied. */
  SegyWriterArgs& iocontext(const IOContext *value);
  /**
   * \brief Textual header, ASCII. Padded with spaces to 3200 bytes.
   * Longer text raises SegyInvalidArgument when the file is created.
   */
  SegyWriterArgs& textheader(const std::string& value) {
    _textheader = value;
    return *this;
  }
  /** \brief Store the textual header as EBCDIC instead of ASCII. */
  SegyWriterArgs& ebcdic(bool value) {
    _ebcdic = value;
    return *this;
  }
  /** \brief Binary header to start from. */
  SegyWriterArgs& binheader(const BinaryHeader& value) {
    _binheader = value;
    return *this;
  }
  /** \brief Samples per trace. */
  SegyWriterArgs& samples(std::int32_t value) {
    _samples = value;
    return *this;
  }
  /** \brief Sample interval in microseconds. */
  SegyWriterArgs& interval(std::int32_t value) {
    _interval = value;
    return *this;
  }
  /** \brief Sample format. */
  SegyWriterArgs& format(SampleFormat value) {
    _format = static_cast<std::int32_t>(value);
    return *this;
  }

  const std::string& getFilename() const { return _filename; }
};

/**
 * \brief Base class of ISegyReader and ISegyWriter.
 *
 * All methods raise SegyClosedError once the file has been closed.
 *
 * Thread safety: Interfaces do not have race conditions.
 */
class OPENSEGY_API ISegyMeta
{
public:
  virtual ~ISegyMeta();
  virtual std::string   filename()          const = 0; /**< \brief Name the file was opened with. */
  virtual std::int64_t  tracecount()        const = 0; /**< \brief Number of traces. */
  virtual std::int32_t  samples()           const = 0; /**< \brief Samples per trace. */
  virtual std::int32_t  sampleinterval_us() const = 0; /**< \brief From the binary header. */
  virtual double        sampleinterval_ms() const = 0; /**< \brief sampleinterval_us() / 1000. */
  virtual std::int32_t  formatcode()        const = 0; /**< \brief Raw format code, may be unknown. */
  virtual SampleFormat  format()            const = 0; /**< \brief unknown if not supported. */
  virtual std::int32_t  bytespersample()    const = 0; /**< \brief 4 for unknown formats. */
  virtual std::int64_t  tracestride()       const = 0; /**< \brief 240 + samples * bytes per sample. */
  virtual std::string   textheader()        const = 0; /**< \brief 3200 bytes exactly as stored. */
  virtual std::string   textheaderAscii()   const = 0; /**< \brief Converted from EBCDIC if needed. */
  virtual BinaryHeader  binheader()         const = 0; /**< \brief Copy of the binary header. */
  virtual FileInfo      fileinfo()          const = 0; /**< \brief Summary for display. */
  virtual void          dump(std::ostream&) const = 0; /**< \brief Output in human readable form for debugging. */
};

/**
 * \brief Read access to a SEG-Y file.
 *
 * Every read computes an absolute offset, so concurrent reads from
 * several threads are safe. close() must not run concurrently with
 * anything else.
 *
 * If a read finds the file shorter than it was at open, the reader
 * raises SegyCorruptFile and refuses all further bulk reads.
 *
 * Thread safety: Interfaces do not have race conditions.
 */
class OPENSEGY_API ISegyReader : virtual public ISegyMeta
{
public:
  virtual ~ISegyReader();
  /** \brief Header of trace index. Raises SegyIndexOutOfRange. */
  virtual TraceHeader traceheader(std::int64_t index) const = 0;
  /** \brief Samples [start,end) of one trace. */
  virtual std::vector<double> readsamples(std::int64_t index, std::int64_t start, std::int64_t end) const = 0;
  /** \brief All samples of one trace. */
  virtual std::vector<double> readtrace(std::int64_t index) const = 0;
  /** \brief Traces [start,end), all samples. */
  virtual TraceMatrix readtraces(std::int64_t start, std::int64_t end) const = 0;
  /** \brief Traces [trace_start,trace_end), samples [sample_start,sample_end), as float. */
  virtual ChunkData readwindow(std::int64_t trace_start, std::int64_t trace_end, std::int64_t sample_start, std::int64_t sample_end) const = 0;
  /** \brief Every trace. Logs a warning if the data is large. */
  virtual TraceMatrix readall() const = 0;
  /** \brief Time or depth in ms of samples [start,end). */
  virtual std::vector<double> timeaxis(std::int64_t start, std::int64_t end) const = 0;
  /** \brief Trace numbers start..end-1. */
  virtual std::vector<std::int64_t> traceaxis(std::int64_t start, std::int64_t end) const = 0;
  /** \brief True if an earlier read detected a damaged file. */
  virtual bool errorflag() const = 0;
  /** \brief Release the file. Later calls raise SegyClosedError. */
  virtual void close() = 0;
  /** \brief Open an existing file for read. */
  static std::shared_ptr<ISegyReader> open(const std::string& filename, const IOContext* iocontext = nullptr);
};

/**
 * \brief Create or update a SEG-Y file.
 *
 * A trace is added by writing it at index tracecount(). Existing
 * traces can be overwritten in place, header and samples separately.
 *
 * Thread safety: Interfaces do not have race conditions.
 * The implementation is not thread safe.
 */
class OPENSEGY_API ISegyWriter : virtual public ISegyMeta
{
public:
  virtual ~ISegyWriter();
  /** \brief Write header and samples of trace index, index <= tracecount(). */
  virtual void writetrace(std::int64_t index, const TraceHeader& header, const std::vector<double>& samples) = 0;
  /** \brief Replace the header of an existing trace. */
  virtual void writeheader(std::int64_t index, const TraceHeader& header) = 0;
  /** \brief Replace the samples of an existing trace. */
  virtual void writesamples(std::int64_t index, const std::vector<double>& samples) = 0;
  /** \brief Replace the textual header. */
  virtual void settextheader(const std::string& text, bool ebcdic = false) = 0;
  /** \brief Flush and release the file. */
  virtual void close() = 0;
  /** \brief Create a new file. */
  static std::shared_ptr<ISegyWriter> open(const SegyWriterArgs& args);
  /** \brief Open an existing file for update. */
  static std::shared_ptr<ISegyWriter> reopen(const std::string& filename, const IOContext* iocontext = nullptr);
};

/**
 * \brief Simple progress bar for the command line tools.
 *
 * Can be passed as a callback wherever a progress function taking
 * (done, total) is expected.
 *
 * Thread safety:
 * Protected by a mutex.
 */
class OPENSEGY_API ProgressWithDots
{
private:
  int _dots_printed;
  int _length;
  std::ostream& _outfile;
  std::mutex _mutex;

private:
  ProgressWithDots(const ProgressWithDots&) = delete;
  ProgressWithDots& operator=(const ProgressWithDots&) = delete;

public:
  /**
   * \param length Size of progress bar, default 51 dots.
   * \param outfile Stream to write output, default std::cerr
   */
  ProgressWithDots(int length=51, std::ostream& outfile = std::cerr);
  /**
   * \brief Callback invoked to report progress. Always returns true.
   */
  bool operator()(std::int64_t done, std::int64_t total);
};

} // namespace
