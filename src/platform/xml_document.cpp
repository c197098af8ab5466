#include "ocfg/xml_document.hpp"

#include <memory>
#include <mutex>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

namespace ocfg {

namespace {

constexpr int kParseOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* s) const { xmlFree(s); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

void ensure_parser_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

std::string to_string(const xmlChar* s) {
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

std::string last_error_message(const std::string& source_path) {
    const xmlError* err = xmlGetLastError();
    std::string message = "XML parse error";
    if (err && err->message) {
        message = err->message;
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
        if (err->line > 0) {
            message = "line " + std::to_string(err->line) + ": " + message;
        }
    }
    if (!source_path.empty()) {
        message = source_path + ": " + message;
    }
    return message;
}

XmlElement convert(xmlDoc* doc, xmlNode* node) {
    XmlElement element;
    element.name = to_string(node->name);
    element.line = static_cast<int>(xmlGetLineNo(node));

    for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
        XmlCharPtr value(xmlNodeListGetString(doc, attr->children, 1));
        element.attributes[to_string(attr->name)] = to_string(value.get());
    }

    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            element.children.push_back(convert(doc, child));
        }
    }
    return element;
}

XmlParseResult convert_document(XmlDocPtr doc, const std::string& source_path) {
    XmlParseResult result;
    if (!doc) {
        result.error = last_error_message(source_path);
        return result;
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (root == nullptr) {
        result.error = source_path.empty() ? "document has no root element"
                                           : source_path + ": document has no root element";
        return result;
    }

    result.root = convert(doc.get(), root);
    result.ok = true;
    return result;
}

} // namespace

std::optional<std::string> XmlElement::attribute(const std::string& key) const {
    auto it = attributes.find(key);
    if (it == attributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

XmlParseResult parse_xml_file(const std::string& path) {
    ensure_parser_initialized();
    xmlResetLastError();
    XmlDocPtr doc(xmlReadFile(path.c_str(), nullptr, kParseOptions));
    return convert_document(std::move(doc), path);
}

XmlParseResult parse_xml_string(const std::string& content, const std::string& source_path) {
    ensure_parser_initialized();
    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(content.data(), static_cast<int>(content.size()),
                                source_path.empty() ? nullptr : source_path.c_str(),
                                nullptr, kParseOptions));
    return convert_document(std::move(doc), source_path);
}

} // namespace ocfg
