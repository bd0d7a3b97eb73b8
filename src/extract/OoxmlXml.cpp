#include "extract/OoxmlXml.hpp"
#include "extract/Errors.hpp"

#include <cstring>

namespace extract::ooxml {

void load_part(pugi::xml_document& doc, const std::string& xml, const std::string& part) {
    const pugi::xml_parse_result res =
        doc.load_buffer(xml.data(), xml.size(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!res) {
        throw ExtractionError("malformed XML in " + part + ": " + res.description());
    }
}

static const char* strip_prefix(const char* name) {
    const char* colon = std::strchr(name, ':');
    return colon ? colon + 1 : name;
}

const char* local_name(const pugi::xml_node& n) {
    return strip_prefix(n.name());
}

const char* local_name(const pugi::xml_attribute& a) {
    return strip_prefix(a.name());
}

bool is(const pugi::xml_node& n, const char* local) {
    return n.type() == pugi::node_element && std::strcmp(local_name(n), local) == 0;
}

pugi::xml_node child(const pugi::xml_node& n, const char* local) {
    for (pugi::xml_node c : n.children()) {
        if (is(c, local)) return c;
    }
    return pugi::xml_node();
}

std::string attr(const pugi::xml_node& n, const char* local) {
    for (pugi::xml_attribute a : n.attributes()) {
        if (std::strcmp(local_name(a), local) == 0) return a.value();
    }
    return "";
}

}  // namespace extract::ooxml
