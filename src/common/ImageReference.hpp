/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_common_ImageReference_hpp
#define stratum_common_ImageReference_hpp

#include <string>
#include <vector>
#include <ostream>


namespace stratum {
namespace common {

struct ImageReference {
    std::string server;
    std::string repositoryNamespace;
    std::string image;
    std::string tag;
    std::string digest;

    static ImageReference parse(const std::string& input);

    std::string getFullName() const;
    std::string getRepositoryName() const;
    std::string getRegistryReference() const;
    std::string getRegistryEndpoint(const std::vector<std::string>& insecureRegistries = {}) const;
    std::string string() const;
    ImageReference normalize() const;

    static const std::string DEFAULT_SERVER;
    static const std::string DEFAULT_SERVER_ENDPOINT;
    static const std::string DEFAULT_REPOSITORY_NAMESPACE;
    static const std::string DEFAULT_TAG;
};

bool operator==(const ImageReference&, const ImageReference&);
bool operator!=(const ImageReference&, const ImageReference&);

std::ostream& operator<<(std::ostream&, const ImageReference&);

}
}

#endif
