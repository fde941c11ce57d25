#include "dat_parser.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

#include "utils.hpp"

namespace {

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlCharDeleter {
  void operator()(xmlChar* text) const { xmlFree(text); }
};
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

bool is_element(const xmlNode* node, const char* name) {
  return node && node->type == XML_ELEMENT_NODE &&
         xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

const xmlNode* first_child(const xmlNode* parent, const char* name) {
  for(auto* child = parent->children; child; child = child->next) {
    if(is_element(child, name)) return child;
  }
  return nullptr;
}

std::string attribute(const xmlNode* node, const char* name, const std::string& fallback = std::string()) {
  XmlCharPtr value(xmlGetProp(node, reinterpret_cast<const xmlChar*>(name)));
  if(!value) return fallback;
  return reinterpret_cast<const char*>(value.get());
}

std::string text_of(const xmlNode* node) {
  if(!node) return {};
  XmlCharPtr value(xmlNodeGetContent(node));
  if(!value) return {};
  return trim_copy(reinterpret_cast<const char*>(value.get()));
}

DatGame read_game(const xmlNode* game_node) {
  DatGame game;
  game.name = attribute(game_node, "name");
  game.description = text_of(first_child(game_node, "description"));
  if(game.description.empty()) {
    game.description = game.name;
  }
  for(auto* child = game_node->children; child; child = child->next) {
    if(!is_element(child, "rom")) continue;
    DatRom rom;
    rom.name = attribute(child, "name");
    rom.size = attribute(child, "size", "0");
    rom.crc = attribute(child, "crc");
    rom.md5 = attribute(child, "md5");
    rom.sha1 = attribute(child, "sha1");
    game.roms.push_back(std::move(rom));
  }
  return game;
}

// Games may sit at any depth below the root.
void collect_games(const xmlNode* parent, std::vector<DatGame>& out) {
  for(auto* child = parent->children; child; child = child->next) {
    if(child->type != XML_ELEMENT_NODE) continue;
    if(is_element(child, "game")) {
      out.push_back(read_game(child));
    }
    collect_games(child, out);
  }
}

std::string last_xml_error() {
  const xmlError* err = xmlGetLastError();
  if(!err || !err->message) return "malformed document";
  std::string message = trim_copy(err->message);
  if(err->line > 0) {
    message += " (line " + std::to_string(err->line) + ")";
  }
  return message;
}

} // namespace

std::size_t DatDocument::rom_count() const {
  std::size_t total = 0;
  for(const auto& game : games) total += game.roms.size();
  return total;
}

std::optional<DatDocument> parse_dat_memory(const std::string& content, std::string& error) {
  error.clear();
  xmlResetLastError();
  XmlDocPtr doc(xmlReadMemory(content.data(),
                              static_cast<int>(content.size()),
                              nullptr,
                              nullptr,
                              XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if(!doc) {
    error = last_xml_error();
    return std::nullopt;
  }
  const xmlNode* root = xmlDocGetRootElement(doc.get());
  if(!root) {
    error = "document has no root element";
    return std::nullopt;
  }

  DatDocument out;
  if(const auto* header = first_child(root, "header")) {
    out.header_name = text_of(first_child(header, "name"));
  }
  collect_games(root, out.games);
  return out;
}

std::optional<DatDocument> parse_dat_file(const std::filesystem::path& path, std::string& error) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    error = std::string("cannot open: ") + std::strerror(errno);
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if(in.bad()) {
    error = "read error";
    return std::nullopt;
  }
  return parse_dat_memory(buffer.str(), error);
}
