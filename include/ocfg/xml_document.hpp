#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ocfg {

// ============================================================================
// Owned XML element tree
// ============================================================================

// Element-only view of a parsed document. Text, comments and processing
// instructions are dropped; attribute values are kept verbatim.
struct XmlElement {
    std::string name;
    std::map<std::string, std::string> attributes;
    std::vector<XmlElement> children;
    int line = 0;

    std::optional<std::string> attribute(const std::string& key) const;
};

struct XmlParseResult {
    bool ok = false;
    std::string error;
    XmlElement root;
};

// Parse an XML file. Network access and external entity loading are
// disabled; libxml2 diagnostics are captured into `error` instead of stderr.
XmlParseResult parse_xml_file(const std::string& path);

// Parse an in-memory XML document
XmlParseResult parse_xml_string(const std::string& content,
                                const std::string& source_path = "");

} // namespace ocfg
