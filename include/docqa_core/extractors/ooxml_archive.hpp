#pragma once

// Only compiled when libzip and libxml2 were found (DOCQA_HAVE_OOXML).

#include <libxml/tree.h>
#include <zip.h>

#include <filesystem>
#include <string>
#include <vector>

namespace docqa_core {

// Read-only view of an Office Open XML package (.docx/.xlsx/.pptx).
class OoxmlArchive {
 public:
  explicit OoxmlArchive(const std::filesystem::path& path);
  ~OoxmlArchive();

  OoxmlArchive(const OoxmlArchive&) = delete;
  OoxmlArchive& operator=(const OoxmlArchive&) = delete;

  bool has_entry(const std::string& name) const;
  std::string read_entry(const std::string& name) const;

  // Entries named <prefix><N><suffix>, ordered by N ("slide2" before "slide10").
  std::vector<std::string> numbered_entries(const std::string& prefix,
                                            const std::string& suffix) const;

 private:
  zip_t* archive_ = nullptr;
};

class XmlDocument {
 public:
  XmlDocument(const std::string& xml, const std::string& name);
  ~XmlDocument();

  XmlDocument(const XmlDocument&) = delete;
  XmlDocument& operator=(const XmlDocument&) = delete;

  xmlNode* root() const;

 private:
  xmlDoc* doc_ = nullptr;
};

// Element name without its namespace prefix.
std::string local_name(const xmlNode* node);
std::string attribute(const xmlNode* node, const char* name);

// Text of every <p> element below root, built from its <t> runs with <tab>
// and <br> honoured. Blank paragraphs are dropped.
std::vector<std::string> collect_paragraphs(const xmlNode* root);

// Concatenated <t> runs below node.
std::string text_runs(const xmlNode* node);

}  // namespace docqa_core
