#pragma once

// ata archive library
// Chunked, compressed and optionally encrypted file-tree archives, written
// and read with a parallel chunk pipeline.

#include "archive.hpp"
#include "filesystem.hpp"
#include "memory.hpp"
#include "options.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides three levels of abstraction:
//
// 1. Primitives: ChunkSplitter, Codec, Cipher, ChunkPipeline, Scheduler
//    - One chunk at a time, usable on their own
//
// 2. Container: Reader / Writer, ManifestBuilder / ManifestReader
//    - Byte layout of the archive file
//
// 3. Engine: Archive class
//    - Archive::create() writes a whole entry source, Archive::open() reads
//    - Entries come from an EntrySource and go to an EntrySink
//
// Example usage:
//
//   // Creating an encrypted archive
//   ata::FilesystemSource source({"photos"});
//   ata::FixedPassphrase passphrase("secret");
//   ata::ArchiveOptions options;
//   options.encryption = ata::EncryptionId::Aes256Gcm;
//   ata::Error error;
//   auto report = ata::Archive::create("photos.ata", source, options, &passphrase, &error);
//
//   // Listing and extracting it
//   auto archive = ata::Archive::open("photos.ata", {}, &passphrase, &error);
//   if (archive) {
//     for (const auto &entry : archive->entries()) {
//       std::cout << entry.path << std::endl;
//     }
//     ata::FilesystemSink sink("restore");
//     auto result = archive->extractAll(sink);
//   }

namespace ata {}
