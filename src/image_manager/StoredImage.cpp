/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "image_manager/StoredImage.hpp"

#include <vector>

#include <boost/format.hpp>


namespace stratum {
namespace image_manager {

std::string StoredImage::createSizeString(int64_t size)
{
    const std::vector<std::string> suffix = {"B", "KB", "MB", "GB", "TB"};
    const double unit(1024);

    double size_d(size);
    size_t i = 0;

    while ( (size_d > unit) && (i < (suffix.size() - 1) ) )
    {
        size_d = size_d / unit;
        ++i;
    }
    return ( boost::format("%.2f%s") % size_d % suffix[i] ).str();
}

bool operator==(const StoredImage& lhs, const StoredImage& rhs) {
    return lhs.reference == rhs.reference
        && lhs.manifest == rhs.manifest
        && lhs.id == rhs.id
        && lhs.size == rhs.size;
}

} // namespace
} // namespace
