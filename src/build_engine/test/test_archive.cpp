/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include <cstdio>
#include <string>

#include "libstratum/Error.hpp"
#include "build_engine/FilesystemState.hpp"
#include "build_engine/archive.hpp"
#include "build_engine/Layer.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace build_engine {
namespace test {

TEST_GROUP(ArchiveTestGroup) {
};

static Changeset makeChangeset() {
    auto changeset = Changeset{};
    changeset.upserts["/app"] = FileEntry::makeDirectory();
    changeset.upserts["/app/main"] = FileEntry::makeFile("#!/bin/sh\necho hello\n", 0755);
    changeset.upserts["/app/link"] = FileEntry::makeSymlink("main");
    changeset.deletions.insert("/etc/motd");
    changeset.opaqueDirectories.insert("/var/cache");
    return changeset;
}

TEST(ArchiveTestGroup, tarLayout) {
    auto tar = archive::createTar(makeChangeset());

    // headers and contents are padded to 512-byte blocks, plus two zero blocks at the end
    CHECK_EQUAL(tar.size() % 512, 0);
    CHECK(tar.size() >= 2 * 512);
    CHECK_EQUAL(tar.substr(tar.size() - 1024), std::string(1024, '\0'));

    // entries are sorted by path, directories have a trailing slash
    CHECK_EQUAL(std::string{tar.c_str()}, std::string{"app/"});
    CHECK(tar.find("ustar") != std::string::npos);
    CHECK(tar.find("etc/.wh.motd") != std::string::npos);
    CHECK(tar.find("var/cache/.wh..wh..opq") != std::string::npos);
}

TEST(ArchiveTestGroup, tarIsDeterministic) {
    CHECK(archive::createTar(makeChangeset()) == archive::createTar(makeChangeset()));
    CHECK(archive::gzip(archive::createTar(makeChangeset())) == archive::gzip(archive::createTar(makeChangeset())));
}

TEST(ArchiveTestGroup, readTar) {
    auto changeset = archive::readTar(archive::createTar(makeChangeset()));

    CHECK_EQUAL(changeset.upserts.size(), 3);
    CHECK(changeset.upserts.at("/app").type == FileEntry::Type::directory);
    CHECK(changeset.upserts.at("/app/main") == FileEntry::makeFile("#!/bin/sh\necho hello\n", 0755));
    CHECK_EQUAL(changeset.upserts.at("/app/link").linkTarget, std::string{"main"});
    CHECK(changeset.deletions == std::set<std::string>{"/etc/motd"});
    CHECK(changeset.opaqueDirectories == std::set<std::string>{"/var/cache"});
}

TEST(ArchiveTestGroup, longNames) {
    auto longDirectory = "/" + std::string(120, 'd');
    auto longName = longDirectory + "/" + std::string(150, 'f');
    auto longTarget = std::string(130, 't');

    auto changeset = Changeset{};
    changeset.upserts[longName] = FileEntry::makeFile("content");
    changeset.upserts[longDirectory + "/short"] = FileEntry::makeSymlink(longTarget);

    auto parsed = archive::readTar(archive::createTar(changeset));
    CHECK_EQUAL(parsed.upserts.size(), 2);
    CHECK_EQUAL(*parsed.upserts.at(longName).content, std::string{"content"});
    CHECK_EQUAL(parsed.upserts.at(longDirectory + "/short").linkTarget, longTarget);
}

TEST(ArchiveTestGroup, corruptedTar) {
    auto tar = archive::createTar(makeChangeset());
    tar[10] = 'X';
    CHECK_THROWS(libstratum::Error, archive::readTar(tar));

    auto truncated = archive::createTar(makeChangeset()).substr(0, 512 * 3 + 10);
    CHECK_THROWS(libstratum::Error, archive::readTar(truncated));
}

static void updateChecksum(std::string& tar, std::size_t headerOffset) {
    unsigned int sum = 0;
    for(std::size_t i = 0; i < 512; ++i) {
        bool isChecksumField = i >= 148 && i < 156;
        sum += isChecksumField ? ' ' : static_cast<unsigned char>(tar[headerOffset + i]);
    }
    char checksum[8];
    std::snprintf(checksum, sizeof(checksum), "%06o", sum);
    tar.replace(headerOffset + 148, 7, checksum, 7);
    tar[headerOffset + 155] = ' ';
}

TEST(ArchiveTestGroup, hugeBase256Size) {
    auto changeset = Changeset{};
    changeset.upserts["/file"] = FileEntry::makeFile("content");
    auto tar = archive::createTar(changeset);

    // size field in GNU base-256 encoding, close to 2^64
    auto size = std::string{"\x80\x00\x00\x00\xff\xff\xff\xff\xff\xff\xfe\x00", 12};
    tar.replace(124, 12, size);
    updateChecksum(tar, 0);
    CHECK_THROWS(libstratum::Error, archive::readTar(tar));

    // more than 64 bits
    size = std::string{"\x80\x00\x01\x00\x00\x00\x00\x00\x00\x00\x00\x00", 12};
    tar.replace(124, 12, size);
    updateChecksum(tar, 0);
    CHECK_THROWS(libstratum::Error, archive::readTar(tar));
}

TEST(ArchiveTestGroup, malformedPaxSize) {
    auto file = Changeset{};
    file.upserts["/file"] = FileEntry::makeFile("content");

    auto makeTarWithPaxRecords = [&file](const std::string& records) {
        auto pax = Changeset{};
        pax.upserts["/PaxHeader"] = FileEntry::makeFile(records);
        auto tar = archive::createTar(pax).substr(0, 1024);
        tar[156] = 'x';
        updateChecksum(tar, 0);
        return tar + archive::createTar(file);
    };

    auto parsed = archive::readTar(makeTarWithPaxRecords("10 size=7\n"));
    CHECK_EQUAL(*parsed.upserts.at("/file").content, std::string{"content"});

    CHECK_THROWS(libstratum::Error, archive::readTar(makeTarWithPaxRecords("11 size=ab\n")));
    CHECK_THROWS(libstratum::Error, archive::readTar(makeTarWithPaxRecords("11 size=-1\n")));
    CHECK_THROWS(libstratum::Error, archive::readTar(makeTarWithPaxRecords("1x size=7\n")));
}

TEST(ArchiveTestGroup, gzip) {
    auto data = std::string(100000, 'a') + "tail";
    auto compressed = archive::gzip(data);
    CHECK(archive::isGzip(compressed));
    CHECK(!archive::isGzip(data));
    CHECK(compressed.size() < data.size());
    CHECK_EQUAL(archive::gunzip(compressed), data);

    // concatenated members
    CHECK_EQUAL(archive::gunzip(archive::gzip("ab") + archive::gzip("cd")), std::string{"abcd"});

    CHECK_THROWS(libstratum::Error, archive::gunzip("not compressed"));
}

TEST(ArchiveTestGroup, layerDigests) {
    auto changeset = makeChangeset();
    auto layer = Layer::create(changeset, "COPY . /app");
    auto tar = archive::createTar(changeset);

    // diff_id identifies the uncompressed tar, the digest the compressed blob
    CHECK(layer.diffID == common::Digest::compute(tar));
    CHECK(layer.digest == common::Digest::compute(*layer.blob));
    CHECK(layer.diffID != layer.digest);
    CHECK_EQUAL(layer.size, static_cast<int64_t>(layer.blob->size()));
    CHECK_EQUAL(archive::gunzip(*layer.blob), tar);

    auto descriptor = layer.getDescriptor();
    CHECK_EQUAL(descriptor.mediaType, common::mediaType::OCI_LAYER_TAR_GZIP);
    CHECK(descriptor.digest == layer.digest);
    CHECK_EQUAL(descriptor.size, layer.size);
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
