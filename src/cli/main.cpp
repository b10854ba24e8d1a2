#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/IR.hpp"
#include "common/LiteralValue.hpp"
#include "compiler/LoadStoreOpt.hpp"
#include "frontend/BlockBuilder.hpp"
#include "interpreter/Interpreter.hpp"

using namespace lsopt;

static std::string readFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("failed to open file: " + path);
  }
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

static bool parseArgList(const std::string& text, std::vector<int64_t>& out) {
  std::istringstream iss(text);
  std::string item;
  while (std::getline(iss, item, ',')) {
    int64_t v = 0;
    if (!parseInteger(item, v)) {
      return false;
    }
    out.push_back(v);
  }
  return true;
}

static void printUsage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " [--print | --run] [--opt] [--stats] [--args=i,j,...] "
               "<block.lsir>\n"
            << "  --print  Parse the block and print its listing (default)\n"
            << "  --opt    Run load/store optimization before printing or "
               "running\n"
            << "  --run    Execute the block and print every escaped value\n"
            << "  --stats  Print optimization counters to stderr\n"
            << "  --args   Object identities for getarg(0), getarg(1), ... "
               "(equal identities alias)\n";
}

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }
  enum Mode { PRINT, RUN };
  Mode mode = Mode::PRINT;
  bool optimize = false;
  bool stats = false;
  std::vector<int64_t> argIdentities;
  std::string inputPath;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "--print") {
      mode = Mode::PRINT;
    } else if (arg == "--run") {
      mode = Mode::RUN;
    } else if (arg == "--opt") {
      optimize = true;
    } else if (arg == "--stats") {
      stats = true;
    } else if (arg.rfind("--args=", 0) == 0) {
      if (!parseArgList(arg.substr(7), argIdentities)) {
        std::cerr << "Bad --args list: " << arg.substr(7) << "\n";
        printUsage(argv[0]);
        return 1;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    } else {
      if (!inputPath.empty()) {
        std::cerr << "Multiple input files given. Only one is supported.\n";
        printUsage(argv[0]);
        return 1;
      }
      inputPath = arg;
    }
  }

  if (inputPath.empty()) {
    printUsage(argv[0]);
    return 1;
  }

  try {
    const std::string src = readFile(inputPath);
    IR::Block block = parseBlock(src);

    if (optimize || stats) {
      IR::OptimizeStats counters;
      IR::Block optimized = IR::optimizeLoadStore(block, counters);
      if (stats) {
        std::cerr << "loads forwarded:     " << counters.loadsForwarded
                  << "\n"
                  << "stores eliminated:   " << counters.storesEliminated
                  << "\n"
                  << "entries invalidated: " << counters.entriesInvalidated
                  << "\n";
      }
      if (optimize) {
        block = std::move(optimized);
      }
    }

    if (mode == Mode::PRINT) {
      std::cout << IR::toSource(block) << std::flush;
    } else if (mode == Mode::RUN) {
      ExecResult r = interpret(block, argIdentities);
      if (!r.ok) {
        std::cerr << "[error] " << r.error << "\n";
        return 2;
      }
      std::cout << r.stdout_text << std::flush;
    }
  } catch (const std::exception& e) {
    std::cerr << "[error] " << e.what() << "\n";
    return 2;
  }
  return 0;
}
