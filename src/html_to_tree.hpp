/* html_to_tree.hpp - HTML to markup tree header file.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "markup_tree.hpp"
#include <lexbor/html/html.h>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

class html_to_tree {
public:
	html_to_tree();
	~html_to_tree() = default;
	html_to_tree(const html_to_tree&) = delete;
	html_to_tree& operator=(const html_to_tree&) = delete;
	html_to_tree(html_to_tree&&) = default;
	html_to_tree& operator=(html_to_tree&&) = default;
	[[nodiscard]] bool convert(const std::string& html_content);

	[[nodiscard]] const markup_tree& get_tree() const noexcept {
		return tree;
	}

	[[nodiscard]] markup_tree take_tree() noexcept {
		return std::move(tree);
	}

	void clear() noexcept;

private:
	struct DocumentDeleter {
		void operator()(lxb_html_document_t* doc) const noexcept {
			if (doc) {
				lxb_html_document_destroy(doc);
			}
		}
	};
	using DocumentPtr = std::unique_ptr<lxb_html_document_t, DocumentDeleter>;

	markup_tree tree;
	DocumentPtr doc;

	void process_node(lxb_dom_node_t* node, size_t parent);
	[[nodiscard]] static std::string_view get_tag_name(lxb_dom_element_t* element) noexcept;
};
