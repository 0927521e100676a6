#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixity {

// Checksum algorithms a datastream can carry. Disabled means no fixity
// information is recorded; Default asks the repository for its configured
// algorithm and is only meaningful when saving.
enum class ChecksumType {
  Default,
  Disabled,
  MD5,
  SHA1,
  SHA256,
  SHA384,
  SHA512
};

// Wire names as the repository spells them ("SHA-256", "DISABLED", ...).
std::string to_string(ChecksumType t);
// Throws std::invalid_argument on an unknown name.
ChecksumType parse_checksum_type(const std::string& name);

struct ObjectInfo {
  std::string pid;
  std::string label;
};

// One datastream, or one historical version of it.
struct DatastreamRecord {
  std::string pid;
  std::string dsid;
  ChecksumType checksum_type = ChecksumType::Disabled;
  std::optional<std::string> checksum; // empty when the repository reports "none"
  std::string mimetype;
  bool versionable = false;
  std::string created;
};

// True when the record carries usable fixity information.
bool has_recorded_checksum(const DatastreamRecord& r);

class RepositoryError : public std::runtime_error {
public:
  explicit RepositoryError(const std::string& what, int status = 0)
    : std::runtime_error(what), status_(status) {}
  int status() const { return status_; }
private:
  int status_; // HTTP status, 0 when no response was received
};

// Capabilities the audit needs from a digital-object repository.
// All calls block; failures raise RepositoryError.
class Repository {
public:
  virtual ~Repository() = default;

  virtual std::vector<std::string> findByModel(const std::string& modelUri) = 0;
  // nullopt when the object does not exist or is not accessible.
  virtual std::optional<ObjectInfo> getObject(const std::string& pid) = 0;
  virtual std::vector<std::string> listDatastreamIds(const std::string& pid) = 0;
  virtual DatastreamRecord getDatastream(const std::string& pid,
                                         const std::string& dsid) = 0;
  virtual std::vector<DatastreamRecord> datastreamHistory(const std::string& pid,
                                                          const std::string& dsid) = 0;
  // Asks the repository to recompute the checksum of this exact snapshot and
  // compare it with the stored value.
  virtual bool verifyChecksum(const DatastreamRecord& snapshot) = 0;
  // Re-saves the datastream with the given checksum type so the repository
  // computes and stores a fresh checksum.
  virtual void saveDatastream(const DatastreamRecord& ds,
                              ChecksumType checksumType,
                              const std::string& logMessage) = 0;
};

} // namespace fixity
