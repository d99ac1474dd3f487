/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/ImageReference.hpp"

#include <algorithm>
#include <sstream>
#include <tuple>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/logging.hpp"


namespace stratum {
namespace common {

const std::string ImageReference::DEFAULT_SERVER{"index.docker.io"};
const std::string ImageReference::DEFAULT_SERVER_ENDPOINT{"https://registry-1.docker.io"};
const std::string ImageReference::DEFAULT_REPOSITORY_NAMESPACE{"library"};
const std::string ImageReference::DEFAULT_TAG{"latest"};

namespace {

// Grammar of the Docker distribution references ("reference" package):
// [domain[:port]/]path-component[/path-component...][:tag][@digest]
const boost::regex& getReferenceRegex() {
    static const auto regex = []() {
        auto alphaNumeric = std::string{"[a-z0-9]+"};
        auto separator = std::string{"(?:[._]|__|[-]+)"};
        auto pathComponent = alphaNumeric + "(?:" + separator + alphaNumeric + ")*";
        auto domainComponent = std::string{"(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"};
        auto domain = "(?:" + domainComponent + "(?:\\." + domainComponent + ")*"
                    + "|\\[[a-fA-F0-9:]+\\])(?:\\:[0-9]+)?";
        auto name = "(?:" + domain + "\\/)?" + pathComponent + "(?:\\/" + pathComponent + ")*";
        auto tag = std::string{"[\\w][\\w.-]{0,127}"};
        auto digest = std::string{"[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*[:][0-9A-Fa-f]{32,}"};
        return boost::regex{"^(" + name + ")(?:\\:(" + tag + "))?(?:\\@(" + digest + "))?$"};
    }();
    return regex;
}

// A leading component is a registry host when it looks like a domain name,
// has a port or is "localhost" (same rule as the Docker CLI).
bool isRegistryHost(const std::string& component) {
    return component.find('.') != std::string::npos
        || component.find(':') != std::string::npos
        || component.find('[') != std::string::npos
        || component == "localhost";
}

std::tuple<std::string, std::string, std::string> splitName(const std::string& name) {
    auto server = ImageReference::DEFAULT_SERVER;
    auto remainder = name;

    auto firstSeparator = name.find('/');
    if(firstSeparator != std::string::npos && isRegistryHost(name.substr(0, firstSeparator))) {
        server = name.substr(0, firstSeparator);
        remainder = name.substr(firstSeparator + 1);
    }

    auto lastSeparator = remainder.rfind('/');
    if(lastSeparator == std::string::npos) {
        // official images of Docker Hub live in the "library" namespace
        auto repositoryNamespace = server == ImageReference::DEFAULT_SERVER
            ? ImageReference::DEFAULT_REPOSITORY_NAMESPACE
            : std::string{};
        return std::make_tuple(server, repositoryNamespace, remainder);
    }
    return std::make_tuple(server, remainder.substr(0, lastSeparator), remainder.substr(lastSeparator + 1));
}

}

/**
 * Parses a reference such as "alpine", "alpine:3.18", "localhost:5000/team/app:1.0"
 * or "repo/app@sha256:...". A reference without tag and digest gets the default tag.
 */
ImageReference ImageReference::parse(const std::string& input) {
    libstratum::logMessage(boost::format("Parsing image reference from string: %s") % input, libstratum::LogLevel::DEBUG);

    // ".." would allow references to escape directories named after them
    if(input.find("..") != std::string::npos) {
        auto message = boost::format("Invalid image reference '%s'\n"
                                     "Image references are not allowed to contain the sequence '..'") % input;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, message.str());
    }

    boost::smatch matches;
    if(!boost::regex_match(input, matches, getReferenceRegex())) {
        auto message = boost::format("Invalid image reference '%s'") % input;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, message.str());
    }

    auto reference = ImageReference{};
    std::tie(reference.server, reference.repositoryNamespace, reference.image) = splitName(matches[1].str());

    if(matches[2].matched) {
        reference.tag = matches[2].str();
    }
    else if(!matches[3].matched) {
        reference.tag = DEFAULT_TAG;
    }

    if(matches[3].matched) {
        reference.digest = matches[3].str();
    }

    libstratum::logMessage(boost::format("Successfully parsed image reference %s") % reference, libstratum::LogLevel::DEBUG);
    return reference;
}

std::string ImageReference::getFullName() const {
    return server + "/" + getRepositoryName();
}

/**
 * Name of the repository as used in the paths of the registry API, e.g. "library/alpine".
 */
std::string ImageReference::getRepositoryName() const {
    if(repositoryNamespace.empty()) {
        return image;
    }
    return repositoryNamespace + "/" + image;
}

/**
 * The <reference> component of the manifest endpoint: the digest if any, else the tag.
 */
std::string ImageReference::getRegistryReference() const {
    if(!digest.empty()) {
        return digest;
    }
    return tag.empty() ? DEFAULT_TAG : tag;
}

/**
 * Base URL of the registry serving this reference. Plain http is used for the
 * local host and for registries explicitly configured as insecure.
 */
std::string ImageReference::getRegistryEndpoint(const std::vector<std::string>& insecureRegistries) const {
    if(server == DEFAULT_SERVER || server == "docker.io") {
        return DEFAULT_SERVER_ENDPOINT;
    }

    if(server.compare(0, 7, "http://") == 0 || server.compare(0, 8, "https://") == 0) {
        return server;
    }

    auto host = server.substr(0, server.rfind(':') == std::string::npos ? server.size() : server.rfind(':'));
    bool isInsecure = host == "localhost"
        || host == "127.0.0.1"
        || std::find(insecureRegistries.cbegin(), insecureRegistries.cend(), server) != insecureRegistries.cend();

    return (isInsecure ? "http://" : "https://") + server;
}

std::string ImageReference::string() const {
    auto output = std::stringstream{};
    output << getFullName();
    if (!tag.empty()){
        output << ":" << tag;
    }
    if (!digest.empty()){
        output << "@" << digest;
    }
    return output.str();
}

/**
 * Normalizing a reference means clearing the tag if the digest is also present,
 * reproducing Docker's behavior which ignores the tag when a digest is given.
 */
ImageReference ImageReference::normalize() const {
    auto output = *this;
    if (!digest.empty() && !tag.empty()){
        output.tag.clear();
    }
    return output;
}

bool operator==(const ImageReference& lhs, const ImageReference& rhs) {
    return lhs.server == rhs.server
        && lhs.repositoryNamespace == rhs.repositoryNamespace
        && lhs.image == rhs.image
        && lhs.tag == rhs.tag
        && lhs.digest == rhs.digest;
}

bool operator!=(const ImageReference& lhs, const ImageReference& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ImageReference& imageReference) {
    os << imageReference.string();
    return os;
}

}
}
