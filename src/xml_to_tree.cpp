/* xml_to_tree.cpp - builds a markup tree from XML with pugixml.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "xml_to_tree.hpp"
#include <string>
#include <utility>

namespace {
std::string get_local_name(const char* qname) {
	if (qname == nullptr) {
		return {};
	}
	std::string s(qname);
	auto pos = s.find(':');
	return pos == std::string::npos ? s : s.substr(pos + 1);
}
} // namespace

bool xml_to_tree::convert(const std::string& xml_content) {
	clear();
	pugi::xml_document doc;
	const auto result = doc.load_buffer(xml_content.data(), xml_content.size(), pugi::parse_default | pugi::parse_ws_pcdata);
	if (!result) {
		clear();
		error = std::string(result.description()) + " at offset " + std::to_string(result.offset);
		return false;
	}
	if (doc.document_element() == nullptr) {
		error = "No root element";
		return false;
	}
	for (auto child : doc.children()) {
		process_node(child, 0);
	}
	return true;
}

void xml_to_tree::clear() noexcept {
	tree.clear();
	error.clear();
}

void xml_to_tree::process_node(pugi::xml_node node, size_t parent) {
	switch (node.type()) {
		case pugi::node_element: {
			const size_t index = tree.add_element(parent, get_local_name(node.name()));
			for (auto attr : node.attributes()) {
				tree.add_attribute(index, attr.name(), attr.value());
			}
			for (auto child : node.children()) {
				process_node(child, index);
			}
			break;
		}
		case pugi::node_pcdata:
		case pugi::node_cdata:
			// Text directly under the document (outside the root element) has no element parent to address.
			if (parent != 0) {
				tree.add_text(parent, node.value());
			}
			break;
		default:
			break;
	}
}
