#include <array>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <span>
#include <vector>

#include <getopt.h>

#include <imgsniff/codecs.hpp>
#include <imgsniff/sniff.hpp>





void print_help(const std::filesystem::path& name) {
  std::cout <<
    "imgsniff " IMGSNIFF_VERSION "\n"
    "\n"
    "Guess the image format of the provided file(s) from their first bytes and\n"
    "return the number of files that could not be identified.\n"
    "\n"
    "Usage: " << name.filename().native() << " [options] <file1>...\n"
    "\n"
    "Available options:\n"
    "  -h, --help              show this help and exit\n"
    "  -v, --verbose           print how the format was found and all warnings\n"
    "  -s, --signatures-only   do not consult the image libraries\n"
    "  -n, --bytes=<count>     number of leading bytes to inspect (default 32)\n"
    << std::flush;
}



void print_decoders() {
  std::cout << "decoders:";
  auto list = imgsniff::list_decoder_codecs();
  if (list.empty()) {
    std::cout << " none";
  }
  for (auto c: list) {
    std::cout << ' ' << imgsniff::stringify(c);
  }
  std::cout << '\n';
}





int main(int argc, char** argv) {
  auto args = std::span{argv, static_cast<size_t>(argc)};

  static std::array<option, 5> long_options = {
    option{"help",            no_argument,       nullptr, 'h'},
    option{"verbose",         no_argument,       nullptr, 'v'},
    option{"signatures-only", no_argument,       nullptr, 's'},
    option{"bytes",           required_argument, nullptr, 'n'},
    option{nullptr,           0,                 nullptr, 0},
  };

  bool help   {false};
  bool verbose{false};

  imgsniff::sniff_options options;

  int c{-1};
  while ((c = getopt_long(args.size(), args.data(), "hvsn:",
                          long_options.data(), nullptr)) != -1) {
    switch (c) {
      case 'h': help    = true; break;
      case 'v': verbose = true; break;
      case 's': options.use_decoders = false; break;
      case 'n': {
        char* end{nullptr};
        auto count = std::strtoul(optarg, &end, 10);
        if (end == optarg || *end != '\0' || count == 0) {
          std::cerr << "invalid byte count: " << optarg << std::endl;
          return 1;
        }
        options.header_size = count;
        break;
      }
      default: help = true; break;
    }
  }

  std::vector<std::filesystem::path> files;
  while (optind < argc) {
    files.emplace_back(args[optind++]);
  }

  if (help || files.empty()) {
    print_help(args[0]);
    return 0;
  }

  if (verbose) {
    print_decoders();
  }

  int unknown_count{0};

  for (const auto& file: files) {
    auto report = imgsniff::sniff(file, {}, options);

    std::cout << file.native() << ": " << report.format.value_or("unknown");
    if (verbose) {
      std::cout << " (" << imgsniff::stringify(report.found_by) << ')';
    }
    std::cout << '\n';

    if (verbose) {
      for (const auto& str: report.warnings) {
        std::cerr << "  ⚠ " << str << '\n';
      }
    }

    if (!report.format) {
      unknown_count++;
    }
  }

  return unknown_count;
}
