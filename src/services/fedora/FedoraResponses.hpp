#pragma once
#include <string>
#include <vector>

#include "core/repository/Repository.hpp"

// Parsers for Fedora 3 REST API responses. Malformed input raises
// fixity::RepositoryError.
namespace fixity::fedora {

// <objectProfile> from GET /objects/{pid}?format=xml
ObjectInfo parse_object_profile(const std::string& xml, const std::string& pid);

// <objectDatastreams> from GET /objects/{pid}/datastreams?format=xml
std::vector<std::string> parse_datastream_ids(const std::string& xml);

// <datastreamProfile> from GET /objects/{pid}/datastreams/{dsid}?format=xml
DatastreamRecord parse_datastream_profile(const std::string& xml,
                                          const std::string& pid,
                                          const std::string& dsid);

// <datastreamHistory> from .../{dsid}/history?format=xml, newest first.
std::vector<DatastreamRecord> parse_datastream_history(const std::string& xml,
                                                       const std::string& pid,
                                                       const std::string& dsid);

// dsChecksumValid of a profile fetched with validateChecksum=true.
bool parse_checksum_valid(const std::string& xml);

// Resource index tuples in JSON format, one "pid" column. Strips the
// info:fedora/ prefix.
std::vector<std::string> parse_risearch_pids(const std::string& json);

} // namespace fixity::fedora
