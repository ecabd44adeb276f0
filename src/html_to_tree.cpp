/* html_to_tree.cpp - builds a markup tree from HTML with lexbor.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_to_tree.hpp"
#include "utils.hpp"
#include <lexbor/dom/interfaces/attr.h>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/html/html.h>
#include <lexbor/html/parser.h>
#include <stdexcept>
#include <string>
#include <string_view>

html_to_tree::html_to_tree() : doc(lxb_html_document_create()) {
	if (!doc) {
		throw std::runtime_error("Failed to create Lexbor HTML document");
	}
}

bool html_to_tree::convert(const std::string& html_content) {
	clear();
	const std::string utf8_content = convert_to_utf8(html_content);
	const auto status = lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(utf8_content.data()), utf8_content.length());
	if (status != LXB_STATUS_OK) {
		return false;
	}
	auto* node = lxb_dom_interface_node(doc.get());
	if (node == nullptr) {
		return false;
	}
	for (auto* child = node->first_child; child; child = child->next) {
		process_node(child, 0);
	}
	return tree.root_element() != markup_tree::npos;
}

void html_to_tree::clear() noexcept {
	tree.clear();
}

void html_to_tree::process_node(lxb_dom_node_t* node, size_t parent) {
	switch (node->type) {
		case LXB_DOM_NODE_TYPE_ELEMENT: {
			auto* element = lxb_dom_interface_element(node);
			const size_t index = tree.add_element(parent, std::string(get_tag_name(element)));
			for (auto* attr = lxb_dom_element_first_attribute(element); attr; attr = lxb_dom_element_next_attribute(attr)) {
				size_t name_len = 0;
				const lxb_char_t* name = lxb_dom_attr_qualified_name(attr, &name_len);
				size_t value_len = 0;
				const lxb_char_t* value = lxb_dom_attr_value(attr, &value_len);
				if (name == nullptr || name_len == 0) {
					continue;
				}
				tree.add_attribute(index, std::string(reinterpret_cast<const char*>(name), name_len), value ? std::string(reinterpret_cast<const char*>(value), value_len) : std::string());
			}
			for (auto* child = node->first_child; child; child = child->next) {
				process_node(child, index);
			}
			break;
		}
		case LXB_DOM_NODE_TYPE_TEXT:
		case LXB_DOM_NODE_TYPE_CDATA_SECTION: {
			if (parent == 0) {
				break;
			}
			size_t length = 0;
			const auto* text_data = lxb_dom_node_text_content(node, &length);
			tree.add_text(parent, text_data ? std::string(reinterpret_cast<const char*>(text_data), length) : std::string());
			break;
		}
		default:
			break;
	}
}

std::string_view html_to_tree::get_tag_name(lxb_dom_element_t* element) noexcept {
	if (!element) {
		return {};
	}
	size_t len;
	const auto* name = lxb_dom_element_local_name(element, &len);
	return name ? std::string_view{reinterpret_cast<const char*>(name), len} : std::string_view{};
}
