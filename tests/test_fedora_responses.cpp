#include <gtest/gtest.h>

#include "core/repository/Repository.hpp"
#include "services/fedora/FedoraClient.hpp"
#include "services/fedora/FedoraResponses.hpp"

using namespace fixity;

namespace {

const char kProfile[] = R"XML(<?xml version="1.0" encoding="UTF-8"?>
<datastreamProfile xmlns="http://www.fedora.info/definitions/1/0/management/"
    pid="obj:1" dsID="MODS">
  <dsLabel>MODS record</dsLabel>
  <dsVersionID>MODS.2</dsVersionID>
  <dsCreateDate>2013-02-11T15:04:05.123Z</dsCreateDate>
  <dsState>A</dsState>
  <dsMIME>text/xml</dsMIME>
  <dsControlGroup>M</dsControlGroup>
  <dsSize>1234</dsSize>
  <dsVersionable>true</dsVersionable>
  <dsChecksumType>SHA-256</dsChecksumType>
  <dsChecksum>9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08</dsChecksum>
  <dsChecksumValid>false</dsChecksumValid>
</datastreamProfile>)XML";

const char kHistory[] = R"XML(<?xml version="1.0" encoding="UTF-8"?>
<datastreamHistory xmlns="http://www.fedora.info/definitions/1/0/management/"
    pid="obj:1" dsID="DC">
  <datastreamProfile pid="obj:1" dsID="DC">
    <dsCreateDate>2014-01-01T00:00:00.000Z</dsCreateDate>
    <dsMIME>text/xml</dsMIME>
    <dsVersionable>true</dsVersionable>
    <dsChecksumType>MD5</dsChecksumType>
    <dsChecksum>d41d8cd98f00b204e9800998ecf8427e</dsChecksum>
  </datastreamProfile>
  <datastreamProfile pid="obj:1" dsID="DC">
    <dsCreateDate>2010-01-01T00:00:00.000Z</dsCreateDate>
    <dsMIME>text/xml</dsMIME>
    <dsVersionable>false</dsVersionable>
    <dsChecksumType>DISABLED</dsChecksumType>
    <dsChecksum>none</dsChecksum>
  </datastreamProfile>
</datastreamHistory>)XML";

} // namespace

TEST(FedoraResponses, DatastreamProfile) {
  DatastreamRecord r = fedora::parse_datastream_profile(kProfile, "obj:1", "MODS");
  EXPECT_EQ(r.pid, "obj:1");
  EXPECT_EQ(r.dsid, "MODS");
  EXPECT_EQ(r.checksum_type, ChecksumType::SHA256);
  ASSERT_TRUE(r.checksum.has_value());
  EXPECT_EQ(r.checksum->substr(0, 8), "9f86d081");
  EXPECT_EQ(r.mimetype, "text/xml");
  EXPECT_TRUE(r.versionable);
  EXPECT_EQ(r.created, "2013-02-11T15:04:05.123Z");
  EXPECT_TRUE(has_recorded_checksum(r));

  EXPECT_FALSE(fedora::parse_checksum_valid(kProfile));
}

TEST(FedoraResponses, HistoryKeepsPerVersionMetadata) {
  auto versions = fedora::parse_datastream_history(kHistory, "obj:1", "DC");
  ASSERT_EQ(versions.size(), 2u);
  EXPECT_EQ(versions[0].created, "2014-01-01T00:00:00.000Z");
  EXPECT_EQ(versions[0].checksum_type, ChecksumType::MD5);
  EXPECT_TRUE(has_recorded_checksum(versions[0]));

  EXPECT_EQ(versions[1].created, "2010-01-01T00:00:00.000Z");
  EXPECT_EQ(versions[1].checksum_type, ChecksumType::Disabled);
  EXPECT_FALSE(versions[1].checksum.has_value());
  EXPECT_FALSE(versions[1].versionable);
}

TEST(FedoraResponses, DatastreamIds) {
  const char xml[] = R"XML(<objectDatastreams xmlns="http://www.fedora.info/definitions/1/0/access/"
      pid="obj:1" baseURL="http://localhost:8080/fedora/">
    <datastream dsid="DC" label="Dublin Core" mimeType="text/xml"/>
    <datastream dsid="RELS-EXT" label="Relationships" mimeType="application/rdf+xml"/>
    <datastream dsid="OBJ" label="master" mimeType="image/tiff"/>
  </objectDatastreams>)XML";
  EXPECT_EQ(fedora::parse_datastream_ids(xml),
            (std::vector<std::string>{"DC", "RELS-EXT", "OBJ"}));
}

TEST(FedoraResponses, ObjectProfile) {
  const char xml[] = R"XML(<objectProfile xmlns="http://www.fedora.info/definitions/1/0/access/" pid="obj:1">
    <objLabel>A test object</objLabel><objOwnerId>fedoraAdmin</objOwnerId>
  </objectProfile>)XML";
  ObjectInfo info = fedora::parse_object_profile(xml, "obj:1");
  EXPECT_EQ(info.pid, "obj:1");
  EXPECT_EQ(info.label, "A test object");
}

TEST(FedoraResponses, MalformedXmlRaises) {
  EXPECT_THROW(fedora::parse_datastream_profile("<datastreamProfile>", "a:1", "DS"),
               RepositoryError);
  EXPECT_THROW(fedora::parse_datastream_profile("<other/>", "a:1", "DS"), RepositoryError);
  EXPECT_THROW(fedora::parse_checksum_valid("<datastreamProfile/>"), RepositoryError);
}

TEST(FedoraResponses, UnknownChecksumTypeRaises) {
  const char xml[] = "<datastreamProfile><dsChecksumType>CRC32</dsChecksumType></datastreamProfile>";
  EXPECT_THROW(fedora::parse_datastream_profile(xml, "a:1", "DS"), RepositoryError);
}

TEST(FedoraResponses, RisearchPids) {
  const char body[] = R"({"results":[{"pid":"info:fedora/obj:1"},{"pid":"obj:2"},{"other":"x"}]})";
  EXPECT_EQ(fedora::parse_risearch_pids(body), (std::vector<std::string>{"obj:1", "obj:2"}));
  EXPECT_THROW(fedora::parse_risearch_pids("not json"), RepositoryError);
  EXPECT_THROW(fedora::parse_risearch_pids("{}"), RepositoryError);
}

TEST(ChecksumTypes, WireNames) {
  EXPECT_EQ(parse_checksum_type("SHA-256"), ChecksumType::SHA256);
  EXPECT_EQ(parse_checksum_type("DISABLED"), ChecksumType::Disabled);
  EXPECT_EQ(to_string(ChecksumType::SHA1), "SHA-1");
  EXPECT_EQ(to_string(ChecksumType::Default), "DEFAULT");
  EXPECT_THROW(parse_checksum_type("sha256"), std::invalid_argument);
}

TEST(SplitBaseUrl, SeparatesOriginAndPath) {
  BaseUrl b = split_base_url("http://localhost:8080/fedora/");
  EXPECT_EQ(b.origin, "http://localhost:8080");
  EXPECT_EQ(b.path, "/fedora");

  b = split_base_url("https://repo.example.org");
  EXPECT_EQ(b.origin, "https://repo.example.org");
  EXPECT_EQ(b.path, "");

  EXPECT_THROW(split_base_url("localhost:8080/fedora"), std::invalid_argument);
  EXPECT_THROW(split_base_url("ftp://host/fedora"), std::invalid_argument);
  EXPECT_THROW(split_base_url("http:///fedora"), std::invalid_argument);
}
