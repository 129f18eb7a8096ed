#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <string>

namespace filepipe {

// Feeds reader into ar through archive_read_open2. The reader must outlive ar.
int OpenArchiveFromReader(struct archive* ar, IReader& reader);

// Sink state for OpenArchiveToWriter; owned by the caller and kept alive
// until ar is freed. err holds the first failure of writer.
struct ArchiveSink {
    IWriter* writer = nullptr;
    Result err;
};

int OpenArchiveToWriter(struct archive* ar, ArchiveSink& sink);

std::string ArchiveErr(struct archive* ar);

} // namespace filepipe
