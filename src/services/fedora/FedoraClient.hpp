#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/repository/Repository.hpp"

namespace httplib { class Client; }

namespace fixity {

struct FedoraConfig {
  std::string rootUrl;   // e.g. http://localhost:8080/fedora/
  std::string user;      // empty = anonymous
  std::string password;
  int timeoutSeconds = 0; // 0 keeps the HTTP library defaults
};

struct BaseUrl {
  std::string origin;
  std::string path;
};

// "http://host:8080/fedora/" -> {"http://host:8080", "/fedora"}.
// Throws std::invalid_argument unless the URL is http(s) with a host.
BaseUrl split_base_url(const std::string& url);

// Repository backed by the Fedora Commons 3.x REST API.
class FedoraClient : public Repository {
public:
  explicit FedoraClient(const FedoraConfig& cfg);
  ~FedoraClient() override;

  std::vector<std::string> findByModel(const std::string& modelUri) override;
  std::optional<ObjectInfo> getObject(const std::string& pid) override;
  std::vector<std::string> listDatastreamIds(const std::string& pid) override;
  DatastreamRecord getDatastream(const std::string& pid,
                                 const std::string& dsid) override;
  std::vector<DatastreamRecord> datastreamHistory(const std::string& pid,
                                                  const std::string& dsid) override;
  bool verifyChecksum(const DatastreamRecord& snapshot) override;
  void saveDatastream(const DatastreamRecord& ds, ChecksumType checksumType,
                      const std::string& logMessage) override;

private:
  std::string get(const std::string& path, int* status = nullptr);
  std::string objectPath(const std::string& pid) const;
  std::string datastreamPath(const std::string& pid, const std::string& dsid) const;

  std::string basePath_;
  std::unique_ptr<httplib::Client> http_;
};

} // namespace fixity
