#include "Repository.hpp"
#include <stdexcept>

namespace fixity {

namespace {

struct TypeName {
  ChecksumType type;
  const char* name;
};

const TypeName kTypeNames[] = {
  {ChecksumType::Default,  "DEFAULT"},
  {ChecksumType::Disabled, "DISABLED"},
  {ChecksumType::MD5,      "MD5"},
  {ChecksumType::SHA1,     "SHA-1"},
  {ChecksumType::SHA256,   "SHA-256"},
  {ChecksumType::SHA384,   "SHA-384"},
  {ChecksumType::SHA512,   "SHA-512"},
};

} // namespace

std::string to_string(ChecksumType t) {
  for (const auto& tn : kTypeNames) {
    if (tn.type == t) return tn.name;
  }
  return "DISABLED";
}

ChecksumType parse_checksum_type(const std::string& name) {
  for (const auto& tn : kTypeNames) {
    if (name == tn.name) return tn.type;
  }
  throw std::invalid_argument("unknown checksum type: " + name);
}

bool has_recorded_checksum(const DatastreamRecord& r) {
  return r.checksum_type != ChecksumType::Disabled && r.checksum.has_value();
}

} // namespace fixity
