#include "docqa_core/extractors/ooxml_archive.hpp"

#include <libxml/parser.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "docqa_core/extractors/content_extractor.hpp"

namespace docqa_core {

OoxmlArchive::OoxmlArchive(const std::filesystem::path& path) {
  int error_code = 0;
  archive_ = zip_open(path.string().c_str(), ZIP_RDONLY, &error_code);
  if (!archive_) {
    zip_error_t error;
    zip_error_init_with_code(&error, error_code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    throw ContentExtractorError("Not a readable Office package: " + message);
  }
}

OoxmlArchive::~OoxmlArchive() {
  if (archive_) {
    zip_discard(archive_);
  }
}

bool OoxmlArchive::has_entry(const std::string& name) const {
  return zip_name_locate(archive_, name.c_str(), 0) >= 0;
}

std::string OoxmlArchive::read_entry(const std::string& name) const {
  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat(archive_, name.c_str(), 0, &stat) != 0 || !(stat.valid & ZIP_STAT_SIZE)) {
    throw ContentExtractorError("Missing package part: " + name);
  }

  zip_file_t* file = zip_fopen(archive_, name.c_str(), 0);
  if (!file) {
    throw ContentExtractorError("Could not open package part: " + name);
  }

  std::string data(static_cast<size_t>(stat.size), '\0');
  zip_int64_t read = zip_fread(file, data.data(), stat.size);
  zip_fclose(file);
  if (read < 0 || static_cast<zip_uint64_t>(read) != stat.size) {
    throw ContentExtractorError("Truncated package part: " + name);
  }
  return data;
}

std::vector<std::string> OoxmlArchive::numbered_entries(const std::string& prefix,
                                                        const std::string& suffix) const {
  std::vector<std::pair<long, std::string>> numbered;
  const zip_int64_t total = zip_get_num_entries(archive_, 0);
  for (zip_int64_t i = 0; i < total; ++i) {
    const char* raw_name = zip_get_name(archive_, static_cast<zip_uint64_t>(i), 0);
    if (!raw_name) continue;
    std::string name(raw_name);
    if (name.size() <= prefix.size() + suffix.size() || name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }
    std::string middle = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (middle.empty() ||
        !std::all_of(middle.begin(), middle.end(), [](unsigned char c) { return std::isdigit(c); })) {
      continue;
    }
    numbered.emplace_back(std::stol(middle), std::move(name));
  }
  std::sort(numbered.begin(), numbered.end());

  std::vector<std::string> names;
  names.reserve(numbered.size());
  for (auto& [number, name] : numbered) {
    names.push_back(std::move(name));
  }
  return names;
}

XmlDocument::XmlDocument(const std::string& xml, const std::string& name) {
  doc_ = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), name.c_str(), nullptr,
                       XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
  if (!doc_) {
    throw ContentExtractorError("Malformed XML in package part: " + name);
  }
}

XmlDocument::~XmlDocument() {
  if (doc_) {
    xmlFreeDoc(doc_);
  }
}

xmlNode* XmlDocument::root() const {
  return xmlDocGetRootElement(doc_);
}

std::string local_name(const xmlNode* node) {
  if (!node || !node->name) return "";
  return reinterpret_cast<const char*>(node->name);
}

std::string attribute(const xmlNode* node, const char* name) {
  xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
  if (!value) return "";
  std::string result(reinterpret_cast<const char*>(value));
  xmlFree(value);
  return result;
}

namespace {

void append_runs(const xmlNode* node, std::string& out) {
  for (const xmlNode* child = node->children; child; child = child->next) {
    if (child->type != XML_ELEMENT_NODE) continue;
    const std::string name = local_name(child);
    if (name == "t") {
      for (const xmlNode* text = child->children; text; text = text->next) {
        if (text->type == XML_TEXT_NODE && text->content) {
          out += reinterpret_cast<const char*>(text->content);
        }
      }
    } else if (name == "tab") {
      out += '\t';
    } else if (name == "br" || name == "cr") {
      out += '\n';
    } else {
      append_runs(child, out);
    }
  }
}

void walk_paragraphs(const xmlNode* node, std::vector<std::string>& paragraphs) {
  for (const xmlNode* child = node->children; child; child = child->next) {
    if (child->type != XML_ELEMENT_NODE) continue;
    if (local_name(child) == "p") {
      std::string text;
      append_runs(child, text);
      const bool blank = std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isspace(c); });
      if (!blank) {
        paragraphs.push_back(std::move(text));
      }
    } else {
      walk_paragraphs(child, paragraphs);
    }
  }
}

}  // namespace

std::vector<std::string> collect_paragraphs(const xmlNode* root) {
  std::vector<std::string> paragraphs;
  if (root) {
    walk_paragraphs(root, paragraphs);
  }
  return paragraphs;
}

std::string text_runs(const xmlNode* node) {
  std::string out;
  if (node) {
    append_runs(node, out);
  }
  return out;
}

}  // namespace docqa_core
