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

/**
 * \file segydumpc.cpp
 * \brief Show headers and a statistics summary of a SEG-Y file.
 */

#include "../api.h"
#include "../iocontext.h"
#include "../statistics.h"

#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cstdlib>
#include <unistd.h>
#include <getopt.h>

/*=========================================================================*/
/*   OPTION PROCESSING   ==================================================*/
/*=========================================================================*/

class Options
{
public:
  std::string myname;
  int verbose;
  int traces;
  bool textheader;
  bool binheader;
  bool statistics;
  bool allow_unknown;
  std::vector<std::string> inputs;
  Options(int argc, char **argv)
    : myname(argc >= 1 ? argv[0] : "segydumpc")
    , verbose(1)
    , traces(5)
    , textheader(true)
    , binheader(false)
    , statistics(false)
    , allow_unknown(false)
  {
    if (myname.find_last_of("/\\") != std::string::npos)
      myname = myname.substr(myname.find_last_of("/\\")+1);
    if (argc > 1 && argv != nullptr) {
      parse(argc, argv);
      check();
      if (verbose > 1)
        show(std::cerr);
    }
    else {
      help(myname);
      exit(1);
    }
  }

  static void help(const std::string& myname)
  {
    static std::vector<std::string> help_options
      {
       "-h, --help:           Output this help text.",
       "-v, --verbose:        Verbose output. May be repeated.",
       "-q, --quiet:          Less verbose output. May be repeated.",
       "-t, --traces N:       Show the first N trace headers, default 5.",
       "-n, --no-text:        Do not show the textual header.",
       "-b, --binary:         Show every binary header field.",
       "-s, --statistics:     Show sampled sample value statistics.",
       "-u, --allow-unknown:  Accept an unknown sample format code.",
      };
    std::cerr << "Usage: " << myname << " options... file...\n";
    for (const std::string& s : help_options)
      std::cerr << "    " << s << "\n";
  }

  void show(std::ostream& os) const
  {
    os << myname << " "
       << (verbose<=0 ? std::string(" -q") :
           verbose==1 ? std::string():
           " -" + std::string(verbose-1, 'v'))
       << " --traces " << traces
       << (textheader    ? "" : " --no-text")
       << (binheader     ? " --binary" : "")
       << (statistics    ? " --statistics" : "")
       << (allow_unknown ? " --allow-unknown" : "");
    for (const std::string& s : inputs)
      os << " '" << s << "'";
    os << std::endl;
  }

  static const char* short_options()
  {
    return "hvqt:nbsu";
  }

  static const struct option *long_options()
  {
    static const struct option result[] = {
       {"help",           no_argument,       0,  'h' },
       {"verbose",        no_argument,       0,  'v' },
       {"quiet",          no_argument,       0,  'q' },
       {"traces",         required_argument, 0,  't' },
       {"no-text",        no_argument,       0,  'n' },
       {"binary",         no_argument,       0,  'b' },
       {"statistics",     no_argument,       0,  's' },
       {"allow-unknown",  no_argument,       0,  'u' },
       {0,                0,                 0,  0 }
    };
    return result;
  }

  void setopt(int ch, const char *optarg)
  {
    switch (ch) {
    case 'h':
      help(myname);
      exit(1);
      break;

    case 'v': ++verbose; break;
    case 'q': --verbose; break;
    case 't': traces        = static_cast<int>(std::strtol(optarg, nullptr, 10)); break;
    case 'n': textheader    = false; break;
    case 'b': binheader     = true; break;
    case 's': statistics    = true; break;
    case 'u': allow_unknown = true; break;

    default:
      help(myname);
      throw std::runtime_error("command line: unknown option. Try --help.");
    }
  }

  void parse(int argc, char** argv)
  {
    int ch;
    while ((ch = getopt_long(argc, argv, short_options(), long_options(), nullptr)) >= 0) {
      setopt(ch, optarg);
    }
    while (optind < argc)
      inputs.push_back(std::string(argv[optind++]));
  }

  void check()
  {
    if (inputs.empty()) {
      help(myname);
      throw std::runtime_error("No inputs provided.");
    }
    if (traces < 0)
      throw std::runtime_error("--traces cannot be negative.");
  }
};

/*=========================================================================*/
/*   END OPTION PROCESSING   ==============================================*/
/*=========================================================================*/

void
dump_binary(std::shared_ptr<OpenSEGY::ISegyReader> r, std::ostream& os)
{
  using namespace OpenSEGY;
  const BinaryHeader bin = r->binheader();
  for (BinField field : BinaryHeader::allFields())
    os << std::left << std::setw(31) << BinaryHeader::fieldName(field)
       << "= " << bin.get(field) << "\n";
  os << std::right;
}

void
dump_text(std::shared_ptr<OpenSEGY::ISegyReader> r, std::ostream& os)
{
  const std::string text = r->textheaderAscii();
  os << "Textual header:\n";
  for (std::size_t pos = 0; pos < text.size(); pos += 80)
    os << text.substr(pos, 80) << "\n";
}

void
dump_traces(std::shared_ptr<OpenSEGY::ISegyReader> r, int count, std::ostream& os)
{
  using namespace OpenSEGY;
  const std::int64_t n = std::min(static_cast<std::int64_t>(count), r->tracecount());
  if (n <= 0)
    return;
  auto oldflags = os.flags();
  os << "Trace  Inline  Xline   Ensemble  CdpX            CdpY            Samples\n";
  for (std::int64_t ii = 0; ii < n; ++ii) {
    const TraceHeader th = r->traceheader(ii);
    os << std::setw(5) << ii << " "
       << std::setw(7) << th.get(TraceField::Inline) << " "
       << std::setw(6) << th.get(TraceField::Crossline) << " "
       << std::setw(10) << th.get(TraceField::Ensemble) << " "
       << std::fixed << std::setprecision(2)
       << std::setw(15) << th.cdpX() << " "
       << std::setw(15) << th.cdpY() << " "
       << std::setw(7) << th.get(TraceField::SampleCount) << "\n";
  }
  os.flags(oldflags);
}

void
dump_statistics(std::shared_ptr<OpenSEGY::ISegyReader> r, std::ostream& os)
{
  const OpenSEGY::SampleStatistics s = OpenSEGY::StatisticsEngine().computeSampled(*r);
  auto oldflags = os.flags();
  auto oldprec = os.precision();
  os << std::setprecision(6)
     << "Sample count (not finite)      = " << s.count << " (" << s.infinite << ")\n"
     << "Min / max                      = " << s.min << " " << s.max << "\n"
     << "Mean / std                     = " << s.mean << " " << s.stddev << "\n"
     << "Median                         = " << s.median << "\n"
     << "Percentile 5 / 95              = " << s.p5 << " " << s.p95 << "\n";
  os.flags(oldflags);
  os.precision(oldprec);
}

void
run(const std::string filename, const Options& opt, std::ostream& os)
{
  OpenSEGY::LocalIOContext context;
  context.allowUnknownFormat(opt.allow_unknown);
  std::shared_ptr<OpenSEGY::ISegyReader> r = OpenSEGY::ISegyReader::open(filename, &context);
  r->fileinfo().dump(os);
  if (opt.binheader)
    dump_binary(r, os);
  if (opt.textheader)
    dump_text(r, os);
  dump_traces(r, opt.traces, os);
  if (opt.statistics)
    dump_statistics(r, os);
  os << std::flush;
  r->close();
}

int main(int argc, char **argv)
{
  try {
    Options options(argc, argv);
    for (const std::string& filename : options.inputs) {
      run(filename, options, std::cout);
    }
  }
  catch (const std::exception& ex) {
    std::string myname(argc >= 1 ? argv[0] : "segydumpc");
    if (myname.find_last_of("/\\") != std::string::npos)
      myname = myname.substr(myname.find_last_of("/\\")+1);
    std::cerr << myname << ": " << ex.what() << std::endl;
    exit(1);
  }
}
