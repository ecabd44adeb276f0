/* epub_package.cpp - reading order recovery for Epub 2/3 packages.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_package.hpp"
#include "constants.hpp"
#include "locate_exception.hpp"
#include "utils.hpp"
#include "xml_to_tree.hpp"
#include <Poco/Path.h>
#include <string>
#include <utility>
#include <vector>
#include <wx/log.h>

std::string join_path(const std::string& base_dir, const std::string& relative) {
	Poco::Path result(base_dir);
	result.makeDirectory();
	result.resolve(Poco::Path(relative, Poco::Path::PATH_UNIX));
	return result.toString();
}

bool is_within(const std::string& path, const std::string& root_dir) {
	Poco::Path root(root_dir);
	root.makeDirectory();
	const std::string prefix = root.toString();
	return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0;
}

std::string resolve_package_path(const wxString& staging_root) {
	const std::string container_path = join_path(staging_root.utf8_string(), CONTAINER_PATH);
	const wxString container_file = wxString::FromUTF8(container_path);
	std::string content;
	if (!read_file(container_file, content)) {
		throw locate_exception(locate_error_code::missing_container, "Container descriptor not found", container_file);
	}
	xml_to_tree converter;
	if (!converter.convert(content)) {
		throw locate_exception(locate_error_code::malformed_container, "Container descriptor is not valid XML", container_file, wxString::FromUTF8(converter.get_error()));
	}
	const auto& tree = converter.get_tree();
	for (const size_t rootfile : tree.descendants(0, "rootfile")) {
		const auto full_path = tree.attribute(rootfile, "full-path");
		if (full_path && !full_path->empty()) {
			const std::string package_path = join_path(staging_root.utf8_string(), url_decode(*full_path));
			if (!is_within(package_path, staging_root.utf8_string())) {
				throw locate_exception(locate_error_code::malformed_container, "Rootfile points outside the publication", container_file, wxString::FromUTF8(*full_path));
			}
			wxLogVerbose("Package descriptor: %s", wxString::FromUTF8(package_path));
			return package_path;
		}
	}
	throw locate_exception(locate_error_code::malformed_container, "No rootfile with a full-path attribute", container_file, "rootfile");
}

package_document parse_package(const std::string& package_path) {
	std::string content;
	if (!read_file(wxString::FromUTF8(package_path), content)) {
		throw locate_exception(locate_error_code::malformed_package, "Package descriptor not found", wxString::FromUTF8(package_path));
	}
	return parse_package_content(content, package_path);
}

package_document parse_package_content(const std::string& content, const std::string& package_path) {
	const wxString file = wxString::FromUTF8(package_path);
	xml_to_tree converter;
	if (!converter.convert(content)) {
		throw locate_exception(locate_error_code::malformed_package, "Package descriptor is not valid XML", file, wxString::FromUTF8(converter.get_error()));
	}
	const auto& tree = converter.get_tree();
	const size_t package = tree.root_element();
	if (package == markup_tree::npos || tree.node(package).name != "package") {
		throw locate_exception(locate_error_code::malformed_package, "Root element is not package", file, package == markup_tree::npos ? wxString() : wxString::FromUTF8(tree.node(package).name));
	}
	package_document doc;
	doc.path = package_path;
	doc.base_dir = Poco::Path(package_path).makeParent().toString();
	for (const size_t manifest : tree.element_children(package, "manifest")) {
		for (const size_t item : tree.element_children(manifest, "item")) {
			const auto id = tree.attribute(item, "id");
			const auto href = tree.attribute(item, "href");
			if (!id || !href) {
				throw locate_exception(locate_error_code::malformed_package, "Manifest item is missing id or href", file, wxString::FromUTF8(id.value_or(href.value_or("item"))));
			}
			manifest_item entry;
			entry.href = *href;
			entry.media_type = tree.attribute(item, "media-type").value_or("");
			// Later declarations replace earlier ones with the same id.
			if (!doc.manifest.insert_or_assign(*id, std::move(entry)).second) {
				wxLogWarning("Duplicate manifest id '%s' in %s; using the last declaration", wxString::FromUTF8(*id), file);
			}
		}
	}
	const auto spines = tree.element_children(package, "spine");
	if (spines.empty()) {
		wxLogWarning("No spine in %s", file);
	} else {
		for (const size_t itemref : tree.element_children(spines.front(), "itemref")) {
			const auto idref = tree.attribute(itemref, "idref");
			if (!idref) {
				throw locate_exception(locate_error_code::malformed_package, "Spine itemref is missing idref", file, "itemref");
			}
			doc.spine.push_back(*idref);
		}
	}
	doc.spine_position = find_spine_position(tree);
	wxLogVerbose("Manifest has %zu items, spine has %zu entries, spine is child %d of %zu", doc.manifest.size(), doc.spine.size(), doc.spine_position.ordinal, doc.spine_position.total);
	return doc;
}

spine_xml_position find_spine_position(const markup_tree& tree) {
	spine_xml_position position;
	const size_t package = tree.root_element();
	if (package == markup_tree::npos) {
		return position;
	}
	const auto children = tree.element_children(package);
	position.total = children.size();
	for (size_t i = 0; i < children.size(); ++i) {
		if (tree.node(children[i]).name == "spine") {
			position.ordinal = static_cast<int>(i + 1);
			break;
		}
	}
	return position;
}

std::vector<spine_document> resolve_spine(const package_document& package, const std::string& root_dir) {
	std::vector<spine_document> documents;
	documents.reserve(package.spine.size());
	for (const auto& id : package.spine) {
		auto it = package.manifest.find(id);
		if (it == package.manifest.end()) {
			throw locate_exception(locate_error_code::unresolved_spine_item, "Spine references an id missing from the manifest", wxString::FromUTF8(package.path), wxString::FromUTF8(id));
		}
		const std::string href = url_decode(strip_fragment(it->second.href));
		std::string path = join_path(package.base_dir, href);
		if (!is_within(path, root_dir)) {
			throw locate_exception(locate_error_code::unresolved_spine_item, "Spine item resolves outside the publication", wxString::FromUTF8(package.path), wxString::FromUTF8(id));
		}
		documents.push_back({id, std::move(path), it->second.media_type});
	}
	return documents;
}
