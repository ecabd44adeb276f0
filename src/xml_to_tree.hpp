/* xml_to_tree.hpp - XML to markup tree header file.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "markup_tree.hpp"
#include <pugixml.hpp>
#include <string>
#include <utility>

class xml_to_tree {
public:
	xml_to_tree() = default;
	~xml_to_tree() = default;
	xml_to_tree(const xml_to_tree&) = delete;
	xml_to_tree& operator=(const xml_to_tree&) = delete;
	xml_to_tree(xml_to_tree&&) = default;
	xml_to_tree& operator=(xml_to_tree&&) = default;
	[[nodiscard]] bool convert(const std::string& xml_content);

	[[nodiscard]] const markup_tree& get_tree() const noexcept {
		return tree;
	}

	[[nodiscard]] markup_tree take_tree() noexcept {
		return std::move(tree);
	}

	[[nodiscard]] const std::string& get_error() const noexcept {
		return error;
	}

	void clear() noexcept;

private:
	markup_tree tree{};
	std::string error{};

	void process_node(pugi::xml_node node, size_t parent);
};
