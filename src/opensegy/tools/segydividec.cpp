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
 * \file segydividec.cpp
 * \brief Tile a SEG-Y file into chunks and optionally export them.
 */

#include "../api.h"
#include "../iocontext.h"
#include "../partition.h"
#include "../chunkexport.h"

#include <functional>
#include <iostream>
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
  std::int64_t traces;
  double depth;
  std::string outdir;
  std::string prefix;
  int threads;
  std::vector<std::string> inputs;
  Options(int argc, char **argv)
    : myname(argc >= 1 ? argv[0] : "segydividec")
    , verbose(1)
    , traces(100)
    , depth(500.0)
    , outdir()
    , prefix("chunk")
    , threads(0)
    , inputs()
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
       "-n, --traces N:       Traces per chunk, default 100.",
       "-d, --depth MS:       Depth or time interval per chunk, default 500 ms.",
       "-o, --output DIR:     Write the chunks to this directory.",
       "-p, --prefix NAME:    Chunk file name prefix, default \"chunk\".",
       "-j, --threads N:      Export threads, default from $OPENSEGY_NUMTHREADS.",
      };
    std::cerr << "Usage: " << myname << " options... file\n";
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
       << " --depth " << depth
       << (outdir.empty() ? std::string() : " --output '" + outdir + "'")
       << " --prefix '" << prefix << "'"
       << " --threads " << threads;
    for (const std::string& s : inputs)
      os << " '" << s << "'";
    os << std::endl;
  }

  static const char* short_options()
  {
    return "hvqn:d:o:p:j:";
  }

  static const struct option *long_options()
  {
    static const struct option result[] = {
       {"help",           no_argument,       0,  'h' },
       {"verbose",        no_argument,       0,  'v' },
       {"quiet",          no_argument,       0,  'q' },
       {"traces",         required_argument, 0,  'n' },
       {"depth",          required_argument, 0,  'd' },
       {"output",         required_argument, 0,  'o' },
       {"prefix",         required_argument, 0,  'p' },
       {"threads",        required_argument, 0,  'j' },
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
    case 'n': traces  = std::strtoll(optarg, nullptr, 10); break;
    case 'd': depth   = std::strtod(optarg, nullptr); break;
    case 'o': outdir  = optarg; break;
    case 'p': prefix  = optarg; break;
    case 'j': threads = static_cast<int>(std::strtol(optarg, nullptr, 10)); break;

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
    if (inputs.size() != 1) {
      help(myname);
      throw std::runtime_error("Exactly one input file must be provided.");
    }
    if (traces <= 0)
      throw std::runtime_error("--traces must be positive.");
    if (!(depth > 0))
      throw std::runtime_error("--depth must be positive.");
    if (threads < 0)
      throw std::runtime_error("--threads cannot be negative.");
  }
};

/*=========================================================================*/
/*   END OPTION PROCESSING   ==============================================*/
/*=========================================================================*/

void
run(const std::string filename, const Options& opt, std::ostream& os)
{
  OpenSEGY::LocalIOContext context;
  if (opt.threads > 0)
    context.threads(opt.threads);
  std::shared_ptr<OpenSEGY::ISegyReader> r = OpenSEGY::ISegyReader::open(filename, &context);
  OpenSEGY::GridPartitioner grid(r);
  const std::vector<OpenSEGY::ChunkDescriptor> chunks =
    grid.partitionGrid(opt.traces, opt.depth);
  if (opt.verbose > 0)
    os << OpenSEGY::ChunkExporter::divisionSummary(grid, chunks, filename) << std::flush;
  if (!opt.outdir.empty()) {
    OpenSEGY::ChunkExporter exporter(grid, opt.outdir, opt.prefix, filename);
    if (opt.verbose > 0) {
      os << "Writing " << chunks.size() << " chunks to '" << opt.outdir << "'\n" << std::flush;
      OpenSEGY::ProgressWithDots progress;
      exporter.exportAll(chunks, context.getThreads(), std::ref(progress));
    }
    else {
      exporter.exportAll(chunks, context.getThreads());
    }
  }
  r->close();
}

int main(int argc, char **argv)
{
  try {
    Options options(argc, argv);
    run(options.inputs.front(), options, std::cout);
  }
  catch (const std::exception& ex) {
    std::string myname(argc >= 1 ? argv[0] : "segydividec");
    if (myname.find_last_of("/\\") != std::string::npos)
      myname = myname.substr(myname.find_last_of("/\\")+1);
    std::cerr << myname << ": " << ex.what() << std::endl;
    exit(1);
  }
}
