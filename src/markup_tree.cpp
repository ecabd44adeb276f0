/* markup_tree.cpp - node arena implementation.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "markup_tree.hpp"
#include <stdexcept>

namespace {
bool walk_text(const markup_tree& tree, size_t index, const std::function<bool(size_t, const std::string&)>& visitor) {
	const auto& n = tree.node(index);
	if (n.type == markup_node_type::text) {
		return visitor(index, n.text);
	}
	for (const size_t child : n.children) {
		if (!walk_text(tree, child, visitor)) {
			return false;
		}
	}
	return true;
}
} // namespace

markup_tree::markup_tree() {
	clear();
}

void markup_tree::clear() {
	nodes.clear();
	markup_node doc;
	doc.type = markup_node_type::document;
	nodes.push_back(std::move(doc));
}

size_t markup_tree::append(size_t parent, markup_node&& n) {
	if (parent >= nodes.size() || nodes[parent].type == markup_node_type::text) {
		throw std::out_of_range("Invalid parent node");
	}
	n.parent = parent;
	const size_t index = nodes.size();
	nodes.push_back(std::move(n));
	nodes[parent].children.push_back(index);
	return index;
}

size_t markup_tree::add_element(size_t parent, std::string name) {
	markup_node n;
	n.type = markup_node_type::element;
	n.name = std::move(name);
	return append(parent, std::move(n));
}

size_t markup_tree::add_text(size_t parent, std::string text) {
	markup_node n;
	n.type = markup_node_type::text;
	n.text = std::move(text);
	return append(parent, std::move(n));
}

void markup_tree::add_attribute(size_t index, std::string name, std::string value) {
	if (!is_element(index)) {
		throw std::out_of_range("Attributes can only be set on elements");
	}
	nodes[index].attributes.emplace_back(std::move(name), std::move(value));
}

size_t markup_tree::root_element() const noexcept {
	for (const size_t child : nodes.front().children) {
		if (nodes[child].type == markup_node_type::element) {
			return child;
		}
	}
	return npos;
}

std::optional<std::string> markup_tree::attribute(size_t index, std::string_view name) const {
	if (!is_element(index)) {
		return std::nullopt;
	}
	for (const auto& [key, value] : nodes[index].attributes) {
		if (key == name) {
			return value;
		}
	}
	return std::nullopt;
}

std::vector<size_t> markup_tree::element_children(size_t index) const {
	std::vector<size_t> result;
	for (const size_t child : node(index).children) {
		if (nodes[child].type == markup_node_type::element) {
			result.push_back(child);
		}
	}
	return result;
}

std::vector<size_t> markup_tree::element_children(size_t index, std::string_view name) const {
	std::vector<size_t> result;
	for (const size_t child : node(index).children) {
		if (nodes[child].type == markup_node_type::element && nodes[child].name == name) {
			result.push_back(child);
		}
	}
	return result;
}

std::vector<size_t> markup_tree::descendants(size_t index, std::string_view name) const {
	std::vector<size_t> result;
	for (const size_t child : node(index).children) {
		if (nodes[child].type != markup_node_type::element) {
			continue;
		}
		if (nodes[child].name == name) {
			result.push_back(child);
		}
		const auto nested = descendants(child, name);
		result.insert(result.end(), nested.begin(), nested.end());
	}
	return result;
}

size_t markup_tree::sibling_ordinal(size_t index) const {
	const auto& n = node(index);
	if (n.parent == npos) {
		return 1;
	}
	size_t ordinal = 1;
	for (const size_t sibling : nodes[n.parent].children) {
		if (sibling == index) {
			break;
		}
		if (nodes[sibling].type == markup_node_type::element && nodes[sibling].name == n.name) {
			++ordinal;
		}
	}
	return ordinal;
}

std::vector<size_t> markup_tree::ancestors(size_t index) const {
	std::vector<size_t> result;
	size_t current = node(index).parent;
	while (current != npos && nodes[current].type == markup_node_type::element) {
		result.push_back(current);
		current = nodes[current].parent;
	}
	return result;
}

void markup_tree::for_each_text(const std::function<bool(size_t, const std::string&)>& visitor) const {
	walk_text(*this, 0, visitor);
}
