#include "FedoraClient.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "services/fedora/FedoraResponses.hpp"

// -------- helpers --------

using Query = std::vector<std::pair<std::string, std::string>>;

// Percent-encodes everything but RFC 3986 unreserved characters; pids keep
// their ':' so paths look the way Fedora documents them.
static std::string url_encode(const std::string& s, bool keepColon = false) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        (keepColon && c == ':')) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(k[(c >> 4) & 0xF]);
      out.push_back(k[c & 0xF]);
    }
  }
  return out;
}

static std::string with_query(const std::string& path, const Query& q) {
  std::string out = path;
  char sep = '?';
  for (const auto& [k, v] : q) {
    out += sep;
    out += url_encode(k) + "=" + url_encode(v);
    sep = '&';
  }
  return out;
}

static std::string snippet(const std::string& body) {
  constexpr size_t kMax = 200;
  return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
}

// -------- client --------

namespace fixity {

BaseUrl split_base_url(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    throw std::invalid_argument("not a URL: " + url);
  const std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https")
    throw std::invalid_argument("unsupported URL scheme: " + scheme);

  const auto host_begin = scheme_end + 3;
  const auto path_begin = url.find('/', host_begin);
  BaseUrl out;
  out.origin = url.substr(0, path_begin);
  if (out.origin.size() <= host_begin)
    throw std::invalid_argument("URL has no host: " + url);
  if (path_begin != std::string::npos) out.path = url.substr(path_begin);
  while (!out.path.empty() && out.path.back() == '/') out.path.pop_back();
  return out;
}

FedoraClient::FedoraClient(const FedoraConfig& cfg) {
  BaseUrl base = split_base_url(cfg.rootUrl);
  basePath_ = base.path;
  http_ = std::make_unique<httplib::Client>(base.origin);
  http_->set_url_encode(false); // paths are encoded here
  http_->set_follow_location(true);
  if (!cfg.user.empty()) http_->set_basic_auth(cfg.user, cfg.password);
  if (cfg.timeoutSeconds > 0) {
    http_->set_connection_timeout(cfg.timeoutSeconds, 0);
    http_->set_read_timeout(cfg.timeoutSeconds, 0);
    http_->set_write_timeout(cfg.timeoutSeconds, 0);
  }
  spdlog::info("using Fedora at {}{}", base.origin, basePath_);
}

FedoraClient::~FedoraClient() = default;

std::string FedoraClient::objectPath(const std::string& pid) const {
  return basePath_ + "/objects/" + url_encode(pid, true);
}

std::string FedoraClient::datastreamPath(const std::string& pid,
                                         const std::string& dsid) const {
  return objectPath(pid) + "/datastreams/" + url_encode(dsid);
}

// GET returning the body of a 200 response. When `status` is given, non-200
// answers are returned through it instead of raising.
std::string FedoraClient::get(const std::string& path, int* status) {
  spdlog::debug("GET {}", path);
  auto res = http_->Get(path);
  if (!res)
    throw RepositoryError("GET " + path + " failed: " + httplib::to_string(res.error()));
  if (status) *status = res->status;
  if (res->status != 200 && !status) {
    throw RepositoryError("GET " + path + " returned " + std::to_string(res->status) +
                          ": " + snippet(res->body), res->status);
  }
  return res->body;
}

std::vector<std::string> FedoraClient::findByModel(const std::string& modelUri) {
  const std::string sparql =
    "SELECT ?pid WHERE { ?pid <info:fedora/fedora-system:def/model#hasModel> <" +
    modelUri + "> }";
  const std::string path = with_query(basePath_ + "/risearch", {
    {"type", "tuples"}, {"lang", "sparql"}, {"format", "json"}, {"query", sparql}});
  return fedora::parse_risearch_pids(get(path));
}

std::optional<ObjectInfo> FedoraClient::getObject(const std::string& pid) {
  int status = 0;
  std::string body = get(with_query(objectPath(pid), {{"format", "xml"}}), &status);
  if (status == 404 || status == 401 || status == 403) {
    spdlog::debug("{}: HTTP {}", pid, status);
    return std::nullopt;
  }
  if (status != 200)
    throw RepositoryError(pid + ": HTTP " + std::to_string(status), status);
  return fedora::parse_object_profile(body, pid);
}

std::vector<std::string> FedoraClient::listDatastreamIds(const std::string& pid) {
  return fedora::parse_datastream_ids(
    get(with_query(objectPath(pid) + "/datastreams", {{"format", "xml"}})));
}

DatastreamRecord FedoraClient::getDatastream(const std::string& pid,
                                             const std::string& dsid) {
  return fedora::parse_datastream_profile(
    get(with_query(datastreamPath(pid, dsid), {{"format", "xml"}})), pid, dsid);
}

std::vector<DatastreamRecord> FedoraClient::datastreamHistory(const std::string& pid,
                                                              const std::string& dsid) {
  return fedora::parse_datastream_history(
    get(with_query(datastreamPath(pid, dsid) + "/history", {{"format", "xml"}})),
    pid, dsid);
}

bool FedoraClient::verifyChecksum(const DatastreamRecord& snapshot) {
  Query q = {{"format", "xml"}, {"validateChecksum", "true"}};
  if (!snapshot.created.empty()) q.emplace_back("asOfDateTime", snapshot.created);
  return fedora::parse_checksum_valid(
    get(with_query(datastreamPath(snapshot.pid, snapshot.dsid), q)));
}

void FedoraClient::saveDatastream(const DatastreamRecord& ds,
                                  ChecksumType checksumType,
                                  const std::string& logMessage) {
  const std::string path = with_query(datastreamPath(ds.pid, ds.dsid), {
    {"checksumType", to_string(checksumType)}, {"logMessage", logMessage}});
  spdlog::debug("PUT {}", path);
  // no body: Fedora would take one as new content
  auto res = http_->Put(path);
  if (!res)
    throw RepositoryError("PUT failed: " + httplib::to_string(res.error()));
  if (res->status != 200) {
    throw RepositoryError("HTTP " + std::to_string(res->status) + ": " +
                          snippet(res->body), res->status);
  }
}

} // namespace fixity
