#include <tprefix/toml_codec.hpp>

namespace tprefix {

static const char* node_type_name(toml::node_type t) {
    switch (t) {
        case toml::node_type::none:           return "nothing";
        case toml::node_type::table:          return "table";
        case toml::node_type::array:          return "array";
        case toml::node_type::string:         return "string";
        case toml::node_type::integer:        return "integer";
        case toml::node_type::floating_point: return "float";
        case toml::node_type::boolean:        return "boolean";
        case toml::node_type::date:           return "date";
        case toml::node_type::time:           return "time";
        case toml::node_type::date_time:      return "date-time";
    }
    return "unknown";
}

// Attach the node's source position, when it came from a parsed document
static Error located(Error err, const toml::node& node) {
    const auto& src = node.source();
    if (src.path) err.file = *src.path;
    err.line = static_cast<int>(src.begin.line);
    return err;
}

toml::value<std::string> to_toml(const TypeIdPrefix& prefix) {
    return toml::value<std::string>(prefix.str());
}

Result<TypeIdPrefix> from_toml(const toml::node& node) {
    const auto* str = node.as_string();
    if (!str) {
        return located(Error{Error::Parse,
            std::string("expected a string for a prefix, found ") +
                node_type_name(node.type())}, node);
    }

    auto parsed = TypeIdPrefix::parse(str->get());
    if (parsed.is_err()) {
        return located(Error::from_validation(parsed.error(), str->get()), node);
    }
    return Result<TypeIdPrefix>::ok(std::move(parsed).value());
}

Result<std::vector<TypeIdPrefix>> read_prefixes(const toml::table& table,
                                                const std::string& key) {
    const toml::node* node = table.get(key);
    if (!node) {
        return Error{Error::Parse, "missing key '" + key + "'",
            "expected: " + key + " = [\"prefix\", ...]"};
    }
    const auto* arr = node->as_array();
    if (!arr) {
        return located(Error{Error::Parse,
            "key '" + key + "' must be an array of strings, found " +
                node_type_name(node->type())}, *node);
    }

    std::vector<TypeIdPrefix> out;
    out.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        auto r = from_toml(*arr->get(i));
        if (r.is_err()) {
            auto err = std::move(r).error();
            err.message = key + "[" + std::to_string(i) + "]: " + err.message;
            return err;
        }
        out.push_back(std::move(r).value());
    }
    return Result<std::vector<TypeIdPrefix>>::ok(std::move(out));
}

} // namespace tprefix
