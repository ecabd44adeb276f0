/* markup_tree.hpp - immutable node arena shared by the XML and HTML front ends.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class markup_node_type {
	document,
	element,
	text
};

struct markup_node {
	markup_node_type type{markup_node_type::element};
	std::string name;
	std::string text;
	std::vector<std::pair<std::string, std::string>> attributes;
	size_t parent{std::numeric_limits<size_t>::max()};
	std::vector<size_t> children;
};

// Nodes are addressed by index. Index 0 is always the document node; the
// outermost element is its first element child.
class markup_tree {
public:
	static constexpr size_t npos = std::numeric_limits<size_t>::max();

	markup_tree();
	~markup_tree() = default;
	markup_tree(const markup_tree&) = default;
	markup_tree& operator=(const markup_tree&) = default;
	markup_tree(markup_tree&&) = default;
	markup_tree& operator=(markup_tree&&) = default;

	size_t add_element(size_t parent, std::string name);
	size_t add_text(size_t parent, std::string text);
	void add_attribute(size_t index, std::string name, std::string value);
	void clear();

	[[nodiscard]] size_t size() const noexcept {
		return nodes.size();
	}

	[[nodiscard]] const markup_node& node(size_t index) const {
		return nodes.at(index);
	}

	[[nodiscard]] bool is_element(size_t index) const noexcept {
		return index < nodes.size() && nodes[index].type == markup_node_type::element;
	}

	[[nodiscard]] size_t root_element() const noexcept;
	[[nodiscard]] std::optional<std::string> attribute(size_t index, std::string_view name) const;
	[[nodiscard]] std::vector<size_t> element_children(size_t index) const;
	[[nodiscard]] std::vector<size_t> element_children(size_t index, std::string_view name) const;
	[[nodiscard]] std::vector<size_t> descendants(size_t index, std::string_view name) const;
	[[nodiscard]] size_t sibling_ordinal(size_t index) const;
	[[nodiscard]] std::vector<size_t> ancestors(size_t index) const;

	// Visits text nodes depth-first in source order. Returning false from the visitor stops the walk.
	void for_each_text(const std::function<bool(size_t, const std::string&)>& visitor) const;

private:
	std::vector<markup_node> nodes;

	size_t append(size_t parent, markup_node&& n);
};
