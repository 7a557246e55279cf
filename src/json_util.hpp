#pragma once

#include <string>
#include <map>
#include <vector>

namespace projsync {
namespace json {

using FlatObject = std::map<std::string, std::string>;

/**
 * Escape a string for embedding between double quotes in a JSON document
 */
std::string escape(const std::string& value);

/**
 * Parse a document of the form {"key": scalar, ...}.
 * String values are unescaped, numbers and booleans are kept as written.
 * Returns false on any syntax error or nested value.
 */
bool parse_flat_object(const std::string& text, FlatObject& out);

/**
 * Parse a document of the form {"<array_key>": [ {flat object}, ... ], ...}.
 * Other top-level members must be scalars and are ignored.
 * Returns false on any syntax error, when the array is missing,
 * or when an element is not a flat object.
 */
bool parse_object_array(const std::string& text, const std::string& array_key,
                        std::vector<FlatObject>& out);

} // namespace json
} // namespace projsync
