/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_common_Digest_hpp
#define stratum_common_Digest_hpp

#include <string>
#include <ostream>

#include <boost/filesystem.hpp>
#include <openssl/evp.h>


namespace stratum {
namespace common {

/**
 * Content digest in the "<algorithm>:<hex>" form used by the OCI specifications
 * and by the registry API. Only sha256 is produced; other algorithms are parsed
 * so that they can be reported, but cannot be verified.
 */
class Digest {
public:
    static const std::string SHA256;

public:
    Digest() = default;
    Digest(const std::string& algorithm, const std::string& hex);

    static Digest parse(const std::string& digestString);
    static Digest compute(const std::string& bytes);
    static Digest computeFile(const boost::filesystem::path& file);

    const std::string& getAlgorithm() const { return algorithm; }
    const std::string& getHex() const { return hex; }
    std::string string() const;
    bool empty() const { return hex.empty(); }

private:
    std::string algorithm;
    std::string hex;
};

bool operator==(const Digest&, const Digest&);
bool operator!=(const Digest&, const Digest&);
bool operator<(const Digest&, const Digest&);
std::ostream& operator<<(std::ostream&, const Digest&);

/**
 * Incremental SHA-256 computation, for content that is produced or read in pieces.
 */
class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    ~Sha256Hasher();

    void update(const char* data, size_t size);
    void update(const std::string& data) { update(data.data(), data.size()); }
    Digest finalize();

private:
    EVP_MD_CTX* context;
    bool finalized = false;
};

}
}

#endif
