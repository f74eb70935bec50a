#include <iostream>

#include <ata/ata.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.ata>\n";
    return 1;
  }

  ata::Error error;
  auto archive = ata::Archive::open(argv[1], {}, nullptr, &error);

  if (!archive) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Entries: " << archive->entryCount() << "\n\n";

  for (const auto &entry : archive->entries()) {
    std::cout << "  " << entry.path << " (" << ata::entryKindName(entry.kind) << ", "
              << entry.size << " bytes)\n";
  }

  return 0;
}
