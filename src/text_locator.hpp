/* text_locator.hpp - first-match search over spine documents.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "epub_package.hpp"
#include "markup_tree.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class document_dialect {
	automatic,
	xml,
	html
};

struct path_step {
	std::string tag_name;
	size_t ordinal;

	bool operator==(const path_step& other) const = default;
};

struct text_match {
	size_t node;
	size_t match_start;
	size_t match_end;
	std::vector<path_step> element_path;
	std::vector<size_t> index_path;
};

struct structural_address {
	size_t spine_index{0};
	size_t spine_total{0};
	std::string matched_file;
	std::vector<path_step> element_path;
	std::vector<size_t> index_path;
	size_t match_start{0};
	size_t match_end{0};
};

[[nodiscard]] std::optional<document_dialect> parse_dialect(std::string_view name) noexcept;
[[nodiscard]] const char* dialect_name(document_dialect dialect) noexcept;
[[nodiscard]] markup_tree load_document(const spine_document& document, document_dialect dialect);
[[nodiscard]] std::optional<text_match> find_in_tree(const markup_tree& tree, std::string_view query);
[[nodiscard]] std::optional<structural_address> locate_text(const std::vector<spine_document>& documents, std::string_view query, document_dialect dialect = document_dialect::automatic);
