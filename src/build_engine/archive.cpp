/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/archive.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <map>
#include <cstdio>
#include <cstdint>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <zlib.h>

#include "libstratum/Error.hpp"
#include "libstratum/utility/logging.hpp"


namespace stratum {
namespace build_engine {
namespace archive {

const std::string WHITEOUT_PREFIX{".wh."};
const std::string OPAQUE_WHITEOUT{".wh..wh..opq"};

static constexpr std::size_t BLOCK_SIZE = 512;
static constexpr std::size_t NAME_SIZE = 100;
static constexpr std::size_t PREFIX_SIZE = 155;
static constexpr uint64_t MAX_OCTAL_SIZE = 077777777777ULL;

static constexpr char REGTYPE = '0';
static constexpr char AREGTYPE = '\0';
static constexpr char LNKTYPE = '1';
static constexpr char SYMTYPE = '2';
static constexpr char DIRTYPE = '5';
static constexpr char PAX_HEADER = 'x';
static constexpr char PAX_GLOBAL_HEADER = 'g';
static constexpr char GNU_LONGNAME = 'L';
static constexpr char GNU_LONGLINK = 'K';

#pragma pack(push, 1)
struct Header {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};
#pragma pack(pop)

static_assert(sizeof(Header) == BLOCK_SIZE, "tar header must be one block");

namespace {

struct TarEntry {
    std::string name;
    char typeflag;
    mode_t mode;
    uid_t uid;
    gid_t gid;
    std::string linkName;
    std::shared_ptr<const std::string> content;
};

void writeOctal(char* field, std::size_t size, uint64_t value) {
    field[size - 1] = '\0';
    for(std::size_t i = size - 1; i > 0; --i) {
        field[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

unsigned int computeChecksum(const Header& header) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    unsigned int sum = 0;
    for(std::size_t i = 0; i < BLOCK_SIZE; ++i) {
        bool isChecksumField = i >= offsetof(Header, chksum) && i < offsetof(Header, typeflag);
        sum += isChecksumField ? ' ' : bytes[i];
    }
    return sum;
}

void appendPadding(std::string& tar, std::size_t size) {
    auto remainder = size % BLOCK_SIZE;
    if(remainder != 0) {
        tar.append(BLOCK_SIZE - remainder, '\0');
    }
}

/**
 * Fills the name/prefix fields, returns false if the name doesn't fit ustar.
 */
bool setName(Header& header, const std::string& name) {
    if(name.size() <= NAME_SIZE) {
        std::memcpy(header.name, name.data(), name.size());
        return true;
    }
    auto split = name.rfind('/', PREFIX_SIZE);
    if(split == std::string::npos || split == 0 || name.size() - split - 1 > NAME_SIZE) {
        return false;
    }
    std::memcpy(header.prefix, name.data(), split);
    std::memcpy(header.name, name.data() + split + 1, name.size() - split - 1);
    return true;
}

std::string makePaxRecord(const std::string& key, const std::string& value) {
    // the length field counts itself
    auto payload = " " + key + "=" + value + "\n";
    auto length = payload.size() + 1;
    while(std::to_string(length).size() + payload.size() != length) {
        ++length;
    }
    return std::to_string(length) + payload;
}

void appendHeader(std::string& tar, const std::string& name, char typeflag, mode_t mode,
                  uid_t uid, gid_t gid, uint64_t size, const std::string& linkName) {
    Header header;
    std::memset(&header, 0, sizeof(header));

    auto paxRecords = std::string{};
    if(!setName(header, name)) {
        paxRecords += makePaxRecord("path", name);
        std::memcpy(header.name, name.data(), NAME_SIZE);
    }
    if(linkName.size() > sizeof(header.linkname)) {
        paxRecords += makePaxRecord("linkpath", linkName);
        std::memcpy(header.linkname, linkName.data(), sizeof(header.linkname));
    }
    else {
        std::memcpy(header.linkname, linkName.data(), linkName.size());
    }
    if(size > MAX_OCTAL_SIZE) {
        paxRecords += makePaxRecord("size", std::to_string(size));
    }

    if(!paxRecords.empty()) {
        auto paxName = "PaxHeaders/" + getBaseName("/" + name).substr(0, 64);
        appendHeader(tar, paxName, PAX_HEADER, 0644, 0, 0, paxRecords.size(), "");
        tar += paxRecords;
        appendPadding(tar, paxRecords.size());
    }

    writeOctal(header.mode, sizeof(header.mode), mode & 07777);
    writeOctal(header.uid, sizeof(header.uid), uid);
    writeOctal(header.gid, sizeof(header.gid), gid);
    writeOctal(header.size, sizeof(header.size), size > MAX_OCTAL_SIZE ? 0 : size);
    writeOctal(header.mtime, sizeof(header.mtime), 0);
    header.typeflag = typeflag;
    std::memcpy(header.magic, "ustar", 6);
    header.version[0] = '0';
    header.version[1] = '0';

    auto checksum = computeChecksum(header);
    std::snprintf(header.chksum, sizeof(header.chksum), "%06o", checksum);
    header.chksum[7] = ' ';

    tar.append(reinterpret_cast<const char*>(&header), BLOCK_SIZE);
}

TarEntry makeTarEntry(const std::string& path, const FileEntry& entry) {
    auto tarEntry = TarEntry{path.substr(1), REGTYPE, entry.mode, entry.uid, entry.gid, "", entry.content};
    switch(entry.type) {
    case FileEntry::Type::regularFile:
        break;
    case FileEntry::Type::directory:
        tarEntry.typeflag = DIRTYPE;
        tarEntry.name += "/";
        tarEntry.content.reset();
        break;
    case FileEntry::Type::symlink:
        tarEntry.typeflag = SYMTYPE;
        tarEntry.linkName = entry.linkTarget;
        tarEntry.content.reset();
        break;
    case FileEntry::Type::hardlink:
        tarEntry.typeflag = LNKTYPE;
        tarEntry.linkName = normalizePath(entry.linkTarget).substr(1);
        tarEntry.content.reset();
        break;
    }
    return tarEntry;
}

TarEntry makeWhiteout(const std::string& path, const std::string& whiteoutName) {
    auto parent = getParentPath(path);
    auto name = (parent == "/" ? std::string{} : parent.substr(1) + "/") + whiteoutName;
    return TarEntry{name, REGTYPE, 0, 0, 0, "", nullptr};
}

uint64_t parseNumber(const char* field, std::size_t size) {
    // GNU base-256 encoding for large values
    if(static_cast<unsigned char>(field[0]) & 0x80) {
        uint64_t value = static_cast<unsigned char>(field[0]) & 0x7f;
        for(std::size_t i = 1; i < size; ++i) {
            if(value >> 56 != 0) {
                STRATUM_THROW_ERROR("Numeric field in tar header exceeds 64 bits");
            }
            value = (value << 8) | static_cast<unsigned char>(field[i]);
        }
        return value;
    }
    uint64_t value = 0;
    std::size_t i = 0;
    while(i < size && field[i] == ' ') {
        ++i;
    }
    for(; i < size && field[i] >= '0' && field[i] <= '7'; ++i) {
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
    }
    return value;
}

std::string readField(const char* field, std::size_t size) {
    return std::string{field, strnlen(field, size)};
}

uint64_t parseDecimal(const std::string& value, const std::string& what) {
    bool isNumber = !value.empty() && value.size() <= 19
        && std::all_of(value.cbegin(), value.cend(), [](char c) { return c >= '0' && c <= '9'; });
    if(!isNumber) {
        auto message = boost::format("Invalid %s \"%s\" in PAX extended header") % what % value;
        STRATUM_THROW_ERROR(message.str());
    }
    return std::stoull(value);
}

std::map<std::string, std::string> parsePaxRecords(const std::string& data) {
    auto records = std::map<std::string, std::string>{};
    std::size_t position = 0;
    while(position < data.size()) {
        auto space = data.find(' ', position);
        if(space == std::string::npos) {
            break;
        }
        auto length = parseDecimal(data.substr(position, space - position), "record length");
        if(length <= space - position + 1 || length > data.size() - position) {
            STRATUM_THROW_ERROR("Malformed PAX extended header in tar archive");
        }
        auto record = data.substr(space + 1, position + length - space - 2); // strip trailing newline
        auto equal = record.find('=');
        if(equal != std::string::npos) {
            records[record.substr(0, equal)] = record.substr(equal + 1);
        }
        position += length;
    }
    return records;
}

}

std::string createTar(const Changeset& changeset) {
    auto tarEntries = std::map<std::string, TarEntry>{};

    for(const auto& upsert : changeset.upserts) {
        auto tarEntry = makeTarEntry(upsert.first, upsert.second);
        tarEntries.emplace(upsert.first, tarEntry);
    }
    for(const auto& path : changeset.deletions) {
        auto whiteout = makeWhiteout(path, WHITEOUT_PREFIX + getBaseName(path));
        tarEntries.emplace("/" + whiteout.name, whiteout);
    }
    for(const auto& directory : changeset.opaqueDirectories) {
        auto whiteout = makeWhiteout(directory + "/" + OPAQUE_WHITEOUT, OPAQUE_WHITEOUT);
        tarEntries.emplace("/" + whiteout.name, whiteout);
    }

    auto tar = std::string{};
    for(const auto& item : tarEntries) {
        const auto& entry = item.second;
        auto size = entry.content ? entry.content->size() : std::size_t{0};
        appendHeader(tar, entry.name, entry.typeflag, entry.mode, entry.uid, entry.gid, size, entry.linkName);
        if(size > 0) {
            tar += *entry.content;
            appendPadding(tar, size);
        }
    }
    tar.append(2 * BLOCK_SIZE, '\0');
    return tar;
}

Changeset readTar(const std::string& tar) {
    auto changeset = Changeset{};
    auto longName = boost::optional<std::string>{};
    auto longLink = boost::optional<std::string>{};
    auto paxRecords = std::map<std::string, std::string>{};
    std::size_t offset = 0;

    while(offset + BLOCK_SIZE <= tar.size()) {
        const auto* header = reinterpret_cast<const Header*>(tar.data() + offset);

        bool isEndOfArchive = std::all_of(tar.data() + offset, tar.data() + offset + BLOCK_SIZE,
                                          [](char c) { return c == '\0'; });
        if(isEndOfArchive) {
            break;
        }

        auto expectedChecksum = parseNumber(header->chksum, sizeof(header->chksum));
        if(expectedChecksum != computeChecksum(*header)) {
            auto message = boost::format("Invalid tar header checksum at offset %d") % offset;
            STRATUM_THROW_ERROR(message.str());
        }

        auto size = parseNumber(header->size, sizeof(header->size));
        if(paxRecords.count("size")) {
            size = parseDecimal(paxRecords["size"], "size");
        }
        offset += BLOCK_SIZE;
        if(size > tar.size() - offset) {
            STRATUM_THROW_ERROR("Truncated tar archive");
        }
        auto data = tar.substr(offset, size);
        offset += size;
        if(size % BLOCK_SIZE != 0) {
            offset = std::min(offset + BLOCK_SIZE - size % BLOCK_SIZE, tar.size());
        }

        auto typeflag = header->typeflag;
        if(typeflag == GNU_LONGNAME) {
            longName = readField(data.data(), data.size());
            continue;
        }
        if(typeflag == GNU_LONGLINK) {
            longLink = readField(data.data(), data.size());
            continue;
        }
        if(typeflag == PAX_HEADER) {
            paxRecords = parsePaxRecords(data);
            continue;
        }
        if(typeflag == PAX_GLOBAL_HEADER) {
            continue;
        }

        auto name = readField(header->name, sizeof(header->name));
        auto prefix = readField(header->prefix, sizeof(header->prefix));
        if(!prefix.empty() && std::strncmp(header->magic, "ustar", 5) == 0) {
            name = prefix + "/" + name;
        }
        auto linkName = readField(header->linkname, sizeof(header->linkname));
        if(longName) {
            name = *longName;
        }
        if(longLink) {
            linkName = *longLink;
        }
        if(paxRecords.count("path")) {
            name = paxRecords["path"];
        }
        if(paxRecords.count("linkpath")) {
            linkName = paxRecords["linkpath"];
        }
        longName = boost::none;
        longLink = boost::none;
        paxRecords.clear();

        auto path = normalizePath(name);
        if(path == "/") {
            continue;
        }

        auto baseName = getBaseName(path);
        if(baseName == OPAQUE_WHITEOUT) {
            changeset.opaqueDirectories.insert(getParentPath(path));
            continue;
        }
        if(boost::algorithm::starts_with(baseName, WHITEOUT_PREFIX)) {
            auto parent = getParentPath(path);
            auto deleted = (parent == "/" ? std::string{} : parent) + "/" + baseName.substr(WHITEOUT_PREFIX.size());
            changeset.deletions.insert(deleted);
            continue;
        }

        auto entry = FileEntry{};
        entry.mode = static_cast<mode_t>(parseNumber(header->mode, sizeof(header->mode)) & 07777);
        entry.uid = static_cast<uid_t>(parseNumber(header->uid, sizeof(header->uid)));
        entry.gid = static_cast<gid_t>(parseNumber(header->gid, sizeof(header->gid)));

        switch(typeflag) {
        case REGTYPE:
        case AREGTYPE:
        case '7': // contiguous file
            entry.type = FileEntry::Type::regularFile;
            entry.content = std::make_shared<const std::string>(std::move(data));
            break;
        case DIRTYPE:
            entry.type = FileEntry::Type::directory;
            break;
        case SYMTYPE:
            entry.type = FileEntry::Type::symlink;
            entry.linkTarget = linkName;
            break;
        case LNKTYPE: {
            entry.type = FileEntry::Type::hardlink;
            entry.linkTarget = normalizePath(linkName);
            auto target = changeset.upserts.find(entry.linkTarget);
            if(target != changeset.upserts.end() && target->second.type == FileEntry::Type::regularFile) {
                entry.type = FileEntry::Type::regularFile;
                entry.content = target->second.content;
                entry.linkTarget.clear();
            }
            break;
        }
        default:
            libstratum::logMessage(boost::format("Skipping special file %s (tar type '%c') in layer archive")
                                   % path % typeflag, libstratum::LogLevel::DEBUG);
            continue;
        }

        changeset.upserts[path] = entry;
    }

    return changeset;
}

std::string gzip(const std::string& data) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    // windowBits 15 + 16 writes a gzip wrapper with zeroed timestamp and no file name
    if(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        STRATUM_THROW_ERROR("Failed to initialize gzip compression");
    }

    auto compressed = std::string{};
    compressed.resize(deflateBound(&stream, static_cast<uLong>(data.size())));

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(&compressed[0]);
    stream.avail_out = static_cast<uInt>(compressed.size());

    auto ret = deflate(&stream, Z_FINISH);
    compressed.resize(stream.total_out);
    deflateEnd(&stream);

    if(ret != Z_STREAM_END) {
        auto message = boost::format("gzip compression failed (zlib error %d)") % ret;
        STRATUM_THROW_ERROR(message.str());
    }
    return compressed;
}

std::string gunzip(const std::string& data) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    // windowBits 15 + 32 detects the gzip or zlib wrapper
    if(inflateInit2(&stream, 15 + 32) != Z_OK) {
        STRATUM_THROW_ERROR("Failed to initialize gzip decompression");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    auto output = std::string{};
    auto buffer = std::vector<char>(64 * 1024);
    int ret = Z_OK;

    while(true) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());
        ret = inflate(&stream, Z_NO_FLUSH);
        output.append(buffer.data(), buffer.size() - stream.avail_out);

        if(ret == Z_STREAM_END) {
            // concatenated gzip members
            if(stream.avail_in > 0) {
                inflateReset(&stream);
                continue;
            }
            break;
        }
        if(ret != Z_OK) {
            break;
        }
    }
    inflateEnd(&stream);

    if(ret != Z_STREAM_END) {
        auto message = boost::format("gzip decompression failed (zlib error %d)") % ret;
        STRATUM_THROW_ERROR(message.str());
    }
    return output;
}

bool isGzip(const std::string& data) {
    return data.size() >= 2
        && static_cast<unsigned char>(data[0]) == 0x1f
        && static_cast<unsigned char>(data[1]) == 0x8b;
}

}
}
}
