#include "FedoraResponses.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>

using nlohmann::json;

// -------- libxml2 helpers --------

namespace {

struct xml_doc_deleter_t {
  void operator()(xmlDoc* d) const { xmlFreeDoc(d); }
};
struct xpath_context_deleter_t {
  void operator()(xmlXPathContext* c) const { xmlXPathFreeContext(c); }
};
struct xpath_object_deleter_t {
  void operator()(xmlXPathObject* o) const { xmlXPathFreeObject(o); }
};

using XmlDoc = std::unique_ptr<xmlDoc, xml_doc_deleter_t>;
using XPathContext = std::unique_ptr<xmlXPathContext, xpath_context_deleter_t>;
using XPathObject = std::unique_ptr<xmlXPathObject, xpath_object_deleter_t>;

const char kInfoFedora[] = "info:fedora/";

// Fedora answers in several namespaces depending on version and endpoint, so
// every query matches on local names only.
std::string el(const char* name) {
  return std::string("*[local-name()='") + name + "']";
}

class XmlResponse {
public:
  explicit XmlResponse(const std::string& xml) {
    doc_.reset(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                             XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc_) throw fixity::RepositoryError("malformed XML response");
    ctx_.reset(xmlXPathNewContext(doc_.get()));
    if (!ctx_) throw fixity::RepositoryError("cannot create XPath context");
  }

  // Nodes matching `path`, evaluated relative to `from` (document when null).
  std::vector<xmlNode*> select(const std::string& path, xmlNode* from = nullptr) {
    ctx_->node = from ? from : xmlDocGetRootElement(doc_.get());
    XPathObject res(xmlXPathEvalExpression(
      reinterpret_cast<const xmlChar*>(path.c_str()), ctx_.get()));
    if (!res) throw fixity::RepositoryError("bad XPath expression: " + path);

    std::vector<xmlNode*> out;
    if (res->nodesetval) {
      for (int i = 0; i < res->nodesetval->nodeNr; ++i)
        out.push_back(res->nodesetval->nodeTab[i]);
    }
    return out;
  }

  // Text of the first node matching `path`, or `def` when there is none.
  std::string text(const std::string& path, xmlNode* from = nullptr,
                   const std::string& def = {}) {
    auto nodes = select(path, from);
    if (nodes.empty()) return def;
    return content(nodes.front());
  }

  static std::string content(xmlNode* n) {
    xmlChar* c = xmlNodeGetContent(n);
    if (!c) return {};
    std::string s(reinterpret_cast<const char*>(c));
    xmlFree(c);
    return s;
  }

private:
  XmlDoc doc_;
  XPathContext ctx_;
};

fixity::DatastreamRecord read_profile(XmlResponse& x, xmlNode* profile,
                                      const std::string& pid,
                                      const std::string& dsid) {
  fixity::DatastreamRecord r;
  r.pid = pid;
  r.dsid = dsid;

  const std::string type = x.text("./" + el("dsChecksumType"), profile, "DISABLED");
  try {
    r.checksum_type = fixity::parse_checksum_type(type);
  } catch (const std::invalid_argument&) {
    throw fixity::RepositoryError(pid + "/" + dsid + ": unknown checksum type " + type);
  }

  const std::string value = x.text("./" + el("dsChecksum"), profile, "none");
  if (!value.empty() && value != "none") r.checksum = value;

  r.mimetype = x.text("./" + el("dsMIME"), profile);
  r.versionable = x.text("./" + el("dsVersionable"), profile) == "true";
  r.created = x.text("./" + el("dsCreateDate"), profile);
  return r;
}

} // namespace

namespace fixity::fedora {

ObjectInfo parse_object_profile(const std::string& xml, const std::string& pid) {
  XmlResponse x(xml);
  ObjectInfo info;
  info.pid = pid;
  info.label = x.text("/" + el("objectProfile") + "/" + el("objLabel"));
  return info;
}

std::vector<std::string> parse_datastream_ids(const std::string& xml) {
  XmlResponse x(xml);
  std::vector<std::string> ids;
  for (xmlNode* n : x.select("/" + el("objectDatastreams") + "/" + el("datastream") + "/@dsid"))
    ids.push_back(XmlResponse::content(n));
  return ids;
}

DatastreamRecord parse_datastream_profile(const std::string& xml,
                                          const std::string& pid,
                                          const std::string& dsid) {
  XmlResponse x(xml);
  auto profiles = x.select("/" + el("datastreamProfile"));
  if (profiles.empty())
    throw RepositoryError(pid + "/" + dsid + ": no datastreamProfile in response");
  return read_profile(x, profiles.front(), pid, dsid);
}

std::vector<DatastreamRecord> parse_datastream_history(const std::string& xml,
                                                       const std::string& pid,
                                                       const std::string& dsid) {
  XmlResponse x(xml);
  std::vector<DatastreamRecord> versions;
  for (xmlNode* p : x.select("/" + el("datastreamHistory") + "/" + el("datastreamProfile")))
    versions.push_back(read_profile(x, p, pid, dsid));
  return versions;
}

bool parse_checksum_valid(const std::string& xml) {
  XmlResponse x(xml);
  auto v = x.select("/" + el("datastreamProfile") + "/" + el("dsChecksumValid"));
  if (v.empty()) throw RepositoryError("response has no dsChecksumValid");
  return XmlResponse::content(v.front()) == "true";
}

std::vector<std::string> parse_risearch_pids(const std::string& body) {
  json j;
  try { j = json::parse(body); }
  catch (const json::parse_error& e) {
    throw RepositoryError(std::string("malformed risearch response: ") + e.what());
  }
  if (!j.contains("results") || !j["results"].is_array())
    throw RepositoryError("risearch response has no results");

  std::vector<std::string> pids;
  for (const auto& row : j["results"]) {
    if (!row.contains("pid") || !row["pid"].is_string()) continue;
    std::string pid = row["pid"].get<std::string>();
    if (pid.rfind(kInfoFedora, 0) == 0) pid.erase(0, sizeof(kInfoFedora) - 1);
    pids.push_back(pid);
  }
  return pids;
}

} // namespace fixity::fedora
