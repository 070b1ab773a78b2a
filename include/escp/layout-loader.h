#pragma once

#include <escp/document.h>
#include <escp/result.hpp>
#include <escp/widget.h>
#include <yaml-cpp/yaml.h>
#include <string>

namespace escp {

//=============================================================================
// Layout loader - build a Document from a YAML layout description
//
//   pages:
//     - root:
//         type: container
//         width: 160
//         height: 51
//         children:
//           - { type: label, x: 2, y: 1, width: 20, text: "INVOICE", bold: true }
//
// Composition errors keep their ErrorKind and are prefixed with the node path
// (e.g. "pages[0].root.children[2]"). Malformed YAML reports ErrorKind::Config.
//=============================================================================

Result<Document> loadDocument(const std::string& yaml);

Result<Document> loadDocumentFile(const std::string& path);

// Build one widget (and its subtree) from a YAML node
Result<Widget::Ptr> parseWidget(const YAML::Node& node, const std::string& where = "root");

} // namespace escp
