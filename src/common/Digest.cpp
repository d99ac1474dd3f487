/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Digest.hpp"

#include <fstream>
#include <vector>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/string.hpp"


namespace stratum {
namespace common {

const std::string Digest::SHA256{"sha256"};

Digest::Digest(const std::string& algorithm, const std::string& hex)
    : algorithm{algorithm}
    , hex{hex}
{
    if(algorithm.empty() || !libstratum::string::isHex(hex)) {
        auto message = boost::format("Invalid digest '%s:%s'") % algorithm % hex;
        STRATUM_THROW_ERROR(message.str());
    }
    if(algorithm == SHA256 && hex.size() != 64) {
        auto message = boost::format("Invalid sha256 digest '%s': expected 64 hexadecimal characters") % hex;
        STRATUM_THROW_ERROR(message.str());
    }
}

Digest Digest::parse(const std::string& digestString) {
    auto separator = digestString.find(':');
    if(separator == std::string::npos) {
        auto message = boost::format("Invalid digest '%s': expected <algorithm>:<hex>") % digestString;
        STRATUM_THROW_ERROR(message.str());
    }
    return Digest{digestString.substr(0, separator), digestString.substr(separator+1)};
}

Digest Digest::compute(const std::string& bytes) {
    auto hasher = Sha256Hasher{};
    hasher.update(bytes);
    return hasher.finalize();
}

Digest Digest::computeFile(const boost::filesystem::path& file) {
    std::ifstream ifs(file.string(), std::ios::binary);
    if(!ifs) {
        auto message = boost::format("Failed to open %s to compute its digest") % file;
        STRATUM_THROW_ERROR(message.str());
    }

    auto hasher = Sha256Hasher{};
    auto buffer = std::vector<char>(1 << 16);
    while(ifs) {
        ifs.read(buffer.data(), buffer.size());
        hasher.update(buffer.data(), ifs.gcount());
    }
    if(ifs.bad()) {
        auto message = boost::format("Failed to read %s to compute its digest") % file;
        STRATUM_THROW_ERROR(message.str());
    }
    return hasher.finalize();
}

std::string Digest::string() const {
    return algorithm + ":" + hex;
}

bool operator==(const Digest& lhs, const Digest& rhs) {
    return lhs.getAlgorithm() == rhs.getAlgorithm() && lhs.getHex() == rhs.getHex();
}

bool operator!=(const Digest& lhs, const Digest& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Digest& lhs, const Digest& rhs) {
    return lhs.string() < rhs.string();
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    os << digest.string();
    return os;
}

Sha256Hasher::Sha256Hasher()
    : context{EVP_MD_CTX_new()}
{
    if(context == nullptr) {
        STRATUM_THROW_ERROR("Failed to allocate OpenSSL digest context");
    }
    if(EVP_DigestInit_ex(context, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(context);
        STRATUM_THROW_ERROR("Failed to initialize SHA-256 digest context");
    }
}

Sha256Hasher::~Sha256Hasher() {
    EVP_MD_CTX_free(context);
}

void Sha256Hasher::update(const char* data, size_t size) {
    if(finalized) {
        STRATUM_THROW_ERROR("Attempted to update a finalized SHA-256 computation");
    }
    if(size > 0 && EVP_DigestUpdate(context, data, size) != 1) {
        STRATUM_THROW_ERROR("Failed to update SHA-256 digest");
    }
}

Digest Sha256Hasher::finalize() {
    if(finalized) {
        STRATUM_THROW_ERROR("Attempted to finalize a SHA-256 computation twice");
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(context, hash, &length) != 1) {
        STRATUM_THROW_ERROR("Failed to finalize SHA-256 digest");
    }
    finalized = true;
    return Digest{Digest::SHA256, libstratum::string::toHex(hash, length)};
}

}
}
