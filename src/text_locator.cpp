/* text_locator.cpp - first-match search and structural addressing.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "text_locator.hpp"
#include "html_to_tree.hpp"
#include "locate_exception.hpp"
#include "utils.hpp"
#include "xml_to_tree.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <wx/log.h>

namespace {
// Name of the step recorded for the document node above the outermost element.
constexpr const char* DOCUMENT_STEP_NAME = "[document]";

bool is_html_content(const std::string& media_type) {
	return media_type == "text/html";
}

markup_tree parse_as_html(const spine_document& document, const std::string& content) {
	html_to_tree converter;
	if (!converter.convert(content)) {
		throw locate_exception(locate_error_code::document_unreadable, "Failed to parse document as HTML", wxString::FromUTF8(document.path), wxString::FromUTF8(document.id));
	}
	return converter.take_tree();
}

// pugixml loads no DTD, so it leaves named references other than the five
// predefined XML entities undecoded in the text.
bool has_html_entity_references(std::string_view content) {
	static constexpr std::string_view predefined[] = {"amp", "lt", "gt", "quot", "apos"};
	size_t pos = content.find('&');
	while (pos != std::string_view::npos) {
		size_t end = pos + 1;
		while (end < content.size() && std::isalnum(static_cast<unsigned char>(content[end]))) {
			++end;
		}
		if (end > pos + 1 && end < content.size() && content[end] == ';' && std::isalpha(static_cast<unsigned char>(content[pos + 1]))) {
			const auto name = content.substr(pos + 1, end - pos - 1);
			if (std::find(std::begin(predefined), std::end(predefined), name) == std::end(predefined)) {
				return true;
			}
		}
		pos = content.find('&', end);
	}
	return false;
}
} // namespace

std::optional<document_dialect> parse_dialect(std::string_view name) noexcept {
	if (name == "auto") {
		return document_dialect::automatic;
	}
	if (name == "xml") {
		return document_dialect::xml;
	}
	if (name == "html") {
		return document_dialect::html;
	}
	return std::nullopt;
}

const char* dialect_name(document_dialect dialect) noexcept {
	switch (dialect) {
		case document_dialect::xml:
			return "xml";
		case document_dialect::html:
			return "html";
		default:
			return "auto";
	}
}

markup_tree load_document(const spine_document& document, document_dialect dialect) {
	const wxString file = wxString::FromUTF8(document.path);
	std::string content;
	if (!read_file(file, content)) {
		throw locate_exception(locate_error_code::document_unreadable, "Failed to read spine document", file, wxString::FromUTF8(document.id));
	}
	if (dialect == document_dialect::html || (dialect == document_dialect::automatic && is_html_content(document.media_type))) {
		return parse_as_html(document, content);
	}
	if (dialect == document_dialect::automatic && has_html_entity_references(content)) {
		wxLogVerbose("%s uses HTML named entities; parsing as HTML", file);
		return parse_as_html(document, content);
	}
	xml_to_tree converter;
	if (converter.convert(content)) {
		return converter.take_tree();
	}
	if (dialect == document_dialect::xml) {
		throw locate_exception(locate_error_code::document_unreadable, "Failed to parse document as XML", file, wxString::FromUTF8(converter.get_error()));
	}
	// Tag soup served as XHTML.
	wxLogWarning("%s is not well-formed XML (%s); parsing as HTML", file, wxString::FromUTF8(converter.get_error()));
	return parse_as_html(document, content);
}

std::optional<text_match> find_in_tree(const markup_tree& tree, std::string_view query) {
	if (query.empty()) {
		return std::nullopt;
	}
	std::optional<text_match> match;
	tree.for_each_text([&](size_t index, const std::string& text) {
		const size_t pos = text.find(query);
		if (pos == std::string::npos) {
			return true;
		}
		text_match m;
		m.node = index;
		m.match_start = utf8_length(std::string_view(text).substr(0, pos));
		m.match_end = m.match_start + utf8_length(query);
		match = std::move(m);
		return false;
	});
	if (!match) {
		return std::nullopt;
	}
	const size_t root = tree.root_element();
	for (const size_t ancestor : tree.ancestors(match->node)) {
		const size_t ordinal = tree.sibling_ordinal(ancestor);
		match->element_path.push_back({tree.node(ancestor).name, ordinal});
		if (ancestor != root) {
			match->index_path.push_back(ordinal);
		}
	}
	match->element_path.push_back({DOCUMENT_STEP_NAME, 1});
	match->index_path.push_back(1);
	std::reverse(match->element_path.begin(), match->element_path.end());
	std::reverse(match->index_path.begin(), match->index_path.end());
	return match;
}

std::optional<structural_address> locate_text(const std::vector<spine_document>& documents, std::string_view query, document_dialect dialect) {
	if (query.empty()) {
		throw locate_exception(locate_error_code::invalid_query, "Query must not be empty");
	}
	for (size_t i = 0; i < documents.size(); ++i) {
		const auto& document = documents[i];
		wxLogVerbose("Scanning spine item %zu/%zu: %s", i + 1, documents.size(), wxString::FromUTF8(document.path));
		const markup_tree tree = load_document(document, dialect);
		auto match = find_in_tree(tree, query);
		if (!match) {
			continue;
		}
		structural_address address;
		address.spine_index = i + 1;
		address.spine_total = documents.size();
		address.matched_file = document.path;
		address.element_path = std::move(match->element_path);
		address.index_path = std::move(match->index_path);
		address.match_start = match->match_start;
		address.match_end = match->match_end;
		return address;
	}
	return std::nullopt;
}
