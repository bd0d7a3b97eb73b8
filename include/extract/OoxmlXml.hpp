#pragma once

#include <string>

#include <pugixml.hpp>

// Namespace-prefix tolerant helpers over pugixml for OOXML parts. Producers
// disagree on prefixes ("w:p", "x:row", unprefixed), so lookups go by local
// name.
namespace extract::ooxml {

// throws ExtractionError naming the part on malformed XML
void load_part(pugi::xml_document& doc, const std::string& xml, const std::string& part);

const char* local_name(const pugi::xml_node& n);
const char* local_name(const pugi::xml_attribute& a);

bool is(const pugi::xml_node& n, const char* local);

pugi::xml_node child(const pugi::xml_node& n, const char* local);

// attribute value by local name, "" when absent
std::string attr(const pugi::xml_node& n, const char* local);

}  // namespace extract::ooxml
