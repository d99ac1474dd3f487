/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_archive_hpp
#define stratum_build_engine_archive_hpp

#include <string>

#include "build_engine/FilesystemState.hpp"

/**
 * Serialization of changesets as OCI layer archives
 */

namespace stratum {
namespace build_engine {
namespace archive {

extern const std::string WHITEOUT_PREFIX;
extern const std::string OPAQUE_WHITEOUT;

/**
 * Writes a POSIX ustar archive of the changeset. The output only depends on the
 * changeset: entries are sorted by path, modification times are zero and user/group
 * names are empty. Deletions become whiteout files ".wh.<name>", opaque directories
 * a ".wh..wh..opq" file. Paths that don't fit the ustar header use a PAX header.
 */
std::string createTar(const Changeset& changeset);

/**
 * Reads a tar archive (ustar, GNU long names, PAX path/linkpath/size) into a changeset,
 * translating whiteout files back into deletions. Device files and FIFOs are skipped.
 */
Changeset readTar(const std::string& tar);

std::string gzip(const std::string& data);
std::string gunzip(const std::string& data);
bool isGzip(const std::string& data);

}
}
}

#endif
