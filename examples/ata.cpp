#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <ata/ata.hpp>
#include <ata/codec.hpp>
#include <ata/crypto.hpp>
#include <ata/log.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

namespace {

std::atomic<bool> gCancel{false};

void onInterrupt(int) {
  gCancel.store(true);
}

void printUsage(const char *program) {
  std::cerr << "Usage: " << program << " <command> [options]\n\n"
            << "Commands:\n"
            << "  create <archive> <paths...>        Create an archive\n"
            << "  list <archive>                     List archive contents\n"
            << "  extract <archive> [entries...]     Extract entries (all by default)\n"
            << "  verify <archive>                   Check every entry without writing\n\n"
            << "Options:\n"
            << "  -c, --compression none|zlib|zstd   Compression (default zstd when built in,\n"
            << "                                     zlib otherwise)\n"
            << "  -l, --level N                      Compression level, 1-9 for zlib, 1-19\n"
            << "                                     for zstd\n"
            << "  -e, --encryption none|aes          Encryption (default none)\n"
            << "      --chunk-size BYTES             Chunk size (default 4194304)\n"
            << "  -j, --jobs N                       Worker threads (default: all cores)\n"
            << "  -o, --output DIR                   Extraction directory (default .)\n"
            << "      --all-or-nothing               Extract nothing if any entry fails\n"
            << "      --recover                      Read what an unfinished archive holds\n"
            << "  -v, --verbose                      More output\n"
            << "  -q, --quiet                        Warnings and errors only\n\n"
            << "The passphrase is read from ATA_PASSPHRASE or asked for on the terminal.\n";
}

// Reads the passphrase from the environment or the terminal, with echo off
class TerminalPassphrase : public ata::PassphraseProvider {
public:
  std::optional<std::string> passphrase(bool confirm) override {
    if (const char *env = std::getenv("ATA_PASSPHRASE")) {
      return std::string(env);
    }

    auto first = prompt("Passphrase: ");
    if (!first || !confirm) {
      return first;
    }
    auto second = prompt("Repeat passphrase: ");
    if (!second || *second != *first) {
      std::cerr << "Passphrases do not match\n";
      return std::nullopt;
    }
    return first;
  }

private:
  static std::optional<std::string> prompt(const char *label) {
    std::cerr << label << std::flush;

#ifdef _WIN32
    HANDLE input = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    bool restore = GetConsoleMode(input, &mode);
    if (restore) {
      SetConsoleMode(input, mode & ~ENABLE_ECHO_INPUT);
    }
#else
    termios oldTerm{};
    bool restore = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &oldTerm) == 0;
    if (restore) {
      termios noEcho = oldTerm;
      noEcho.c_lflag &= ~static_cast<tcflag_t>(ECHO);
      tcsetattr(STDIN_FILENO, TCSANOW, &noEcho);
    }
#endif

    std::string line;
    bool ok = static_cast<bool>(std::getline(std::cin, line));

#ifdef _WIN32
    if (restore) {
      SetConsoleMode(input, mode);
    }
#else
    if (restore) {
      tcsetattr(STDIN_FILENO, TCSANOW, &oldTerm);
    }
#endif
    std::cerr << "\n";

    if (!ok) {
      return std::nullopt;
    }
    return line;
  }
};

struct CommandLine {
  std::string command;
  std::vector<std::string> positional;
  std::filesystem::path output = ".";
  ata::ArchiveOptions options;
  bool verbose = false;
  bool quiet = false;
};

bool parseNumber(const std::string &text, unsigned long long &out) {
  if (text.empty()) {
    return false;
  }
  try {
    size_t used = 0;
    out = std::stoull(text, &used);
    return used == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parseArguments(int argc, char *argv[], CommandLine &cli, std::string &error) {
  if (argc < 2) {
    error = "Missing command";
    return false;
  }
  cli.command = argv[1];
  if (ata::makeCodec(ata::CompressionId::Zstd)) {
    cli.options.compression = ata::CompressionId::Zstd;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&](std::string &out) {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string text;
    unsigned long long number = 0;

    if (arg == "-c" || arg == "--compression") {
      if (!value(text)) {
        return false;
      }
      auto id = ata::parseCompressionName(text);
      if (!id) {
        error = "Unknown compression: " + text;
        return false;
      }
      cli.options.compression = *id;
    } else if (arg == "-l" || arg == "--level") {
      // The upper bound for the chosen codec is checked with the other options
      if (!value(text) || !parseNumber(text, number) || number < 1 ||
          number > static_cast<unsigned long long>(
                       ata::maxCompressionLevel(ata::CompressionId::Zstd))) {
        error = "Compression level must be between 1 and 19";
        return false;
      }
      cli.options.compressionLevel = static_cast<int>(number);
    } else if (arg == "-e" || arg == "--encryption") {
      if (!value(text)) {
        return false;
      }
      auto id = ata::parseEncryptionName(text);
      if (!id) {
        error = "Unknown encryption: " + text;
        return false;
      }
      cli.options.encryption = *id;
    } else if (arg == "--chunk-size") {
      if (!value(text) || !parseNumber(text, number)) {
        error = "Invalid chunk size";
        return false;
      }
      cli.options.chunkSize = static_cast<size_t>(number);
    } else if (arg == "-j" || arg == "--jobs") {
      if (!value(text) || !parseNumber(text, number) || number > 1024) {
        error = "Invalid number of jobs";
        return false;
      }
      cli.options.parallelism = static_cast<unsigned>(number);
    } else if (arg == "-o" || arg == "--output") {
      if (!value(text)) {
        return false;
      }
      cli.output = text;
    } else if (arg == "--all-or-nothing") {
      cli.options.policy = ata::ExtractPolicy::AllOrNothing;
    } else if (arg == "--recover") {
      cli.options.allowIncomplete = true;
    } else if (arg == "-v" || arg == "--verbose") {
      cli.verbose = true;
    } else if (arg == "-q" || arg == "--quiet") {
      cli.quiet = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      error = "Unknown option: " + arg;
      return false;
    } else {
      cli.positional.push_back(arg);
    }
  }

  if (cli.positional.empty()) {
    error = "Missing archive path";
    return false;
  }
  return true;
}

// Print failed entries, return the process exit code
int reportOutcome(const ata::ArchiveReport &report, bool verbose) {
  for (const auto &entry : report.entries) {
    if (!entry.ok) {
      std::cerr << "FAILED " << entry.error.describe() << "\n";
    } else if (verbose) {
      std::cout << "ok     " << entry.path << "\n";
    }
  }
  if (report.error.isSet()) {
    std::cerr << "Error: " << report.error.describe() << "\n";
  }
  if (!report.complete) {
    std::cerr << "Warning: archive is incomplete, only recovered entries were processed\n";
  }
  return report.ok() ? 0 : 1;
}

int runCreate(const CommandLine &cli, TerminalPassphrase &passphrase) {
  std::vector<std::filesystem::path> roots(cli.positional.begin() + 1, cli.positional.end());
  if (roots.empty()) {
    std::cerr << "Error: No files specified\n";
    return 2;
  }

  ata::FilesystemSource source(std::move(roots));
  ata::Error error;
  auto report = ata::Archive::create(cli.positional[0], source, cli.options, &passphrase, &error);
  if (!report) {
    std::cerr << "Error creating archive: " << error.describe() << "\n";
    return 1;
  }

  if (cli.verbose) {
    for (const auto &entry : report->entries) {
      std::cout << "Added: " << entry.path << "\n";
    }
  }
  if (!cli.quiet) {
    std::cout << "Archive created: " << cli.positional[0] << " (" << report->entries.size()
              << " entries, " << report->plainBytes << " -> " << report->storedBytes
              << " bytes)\n";
  }
  return 0;
}

int runList(ata::Archive &archive, bool verbose) {
  for (const auto &entry : archive.entries()) {
    if (!verbose) {
      std::cout << entry.path << "\n";
      continue;
    }
    std::cout << entry.path << " (" << ata::entryKindName(entry.kind) << ", Original: "
              << entry.size << " bytes, Stored: " << entry.storedSize() << " bytes";
    if (entry.kind == ata::EntryKind::Symlink) {
      std::cout << ", -> " << entry.linkTarget;
    }
    std::cout << ")\n";
  }
  if (!archive.isComplete()) {
    std::cerr << "Warning: archive is incomplete\n";
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine cli;
  std::string parseError;
  if (!parseArguments(argc, argv, cli, parseError)) {
    std::cerr << "Error: " << parseError << "\n\n";
    printUsage(argv[0]);
    return 2;
  }

  auto log = ata::logger();
  log->set_level(cli.verbose ? spdlog::level::debug
                             : (cli.quiet ? spdlog::level::warn : spdlog::level::info));

  std::signal(SIGINT, onInterrupt);
  cli.options.cancel = &gCancel;

  TerminalPassphrase passphrase;

  if (cli.command == "create") {
    return runCreate(cli, passphrase);
  }

  if (cli.command != "list" && cli.command != "extract" && cli.command != "verify") {
    std::cerr << "Error: Unknown command: " << cli.command << "\n\n";
    printUsage(argv[0]);
    return 2;
  }

  ata::Error error;
  auto archive = ata::Archive::open(cli.positional[0], cli.options, &passphrase, &error);
  if (!archive) {
    std::cerr << "Error opening archive: " << error.describe() << "\n";
    return 1;
  }

  if (cli.command == "list") {
    return runList(*archive, cli.verbose);
  }

  if (cli.command == "verify") {
    auto report = archive->verify();
    int code = reportOutcome(report, cli.verbose);
    if (code == 0 && !cli.quiet) {
      std::cout << "Archive is valid\n";
    }
    return code;
  }

  ata::FilesystemSink sink(cli.output);
  std::vector<std::string> selection(cli.positional.begin() + 1, cli.positional.end());
  auto report = selection.empty() ? archive->extractAll(sink) : archive->extract(selection, sink);
  int code = reportOutcome(report, cli.verbose);
  if (!cli.quiet) {
    std::cout << "Extracted " << report.fileCount << " files to " << cli.output.string() << "\n";
  }
  return code;
}
