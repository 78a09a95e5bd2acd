#pragma once

#include <tprefix/prefix.hpp>
#include <tprefix/result.hpp>
#include <toml++/toml.hpp>
#include <string>
#include <vector>

namespace tprefix {

// A prefix is stored in TOML as a plain string holding its characters.
toml::value<std::string> to_toml(const TypeIdPrefix& prefix);

// Reads a prefix back from a string node. Non-string nodes are Parse errors;
// strings go through TypeIdPrefix::parse, so "" yields the empty prefix and
// anything else invalid is a Validation error.
Result<TypeIdPrefix> from_toml(const toml::node& node);

// Reads `key = ["user", "order_item", ...]` from a table
Result<std::vector<TypeIdPrefix>> read_prefixes(const toml::table& table,
                                                const std::string& key);

} // namespace tprefix
