#include <esgate/elasticsearch/schema.h>

#include <boost/algorithm/string.hpp>

namespace esgate {

using nlohmann::json;

static json
find_properties(json const& mappings)
{
    if (!mappings.is_object())
        return json::object();
    auto properties = mappings.find("properties");
    if (properties != mappings.end())
        return *properties;
    // Older clusters put a type name level between the mappings and the
    // properties.
    for (auto const& type_mapping : mappings)
    {
        if (type_mapping.is_object())
        {
            auto typed_properties = type_mapping.find("properties");
            if (typed_properties != type_mapping.end())
                return *typed_properties;
        }
    }
    return json::object();
}

mapping_schema::mapping_schema(json const& mappings)
    : properties_(find_properties(mappings))
{
}

bool
mapping_schema::is_nested_path(string const& path) const
{
    if (path.empty())
        return false;

    std::vector<string> segments;
    boost::algorithm::split(segments, path, boost::algorithm::is_any_of("."));

    json const* properties = &properties_;
    for (std::size_t i = 0; i != segments.size(); ++i)
    {
        if (!properties->is_object())
            return false;
        auto field = properties->find(segments[i]);
        if (field == properties->end() || !field->is_object())
            return false;
        if (i + 1 == segments.size())
        {
            auto type = field->find("type");
            return type != field->end() && type->is_string()
                   && type->get<string>() == "nested";
        }
        auto children = field->find("properties");
        if (children == field->end())
            return false;
        properties = &*children;
    }
    return false;
}

mapping_schema
make_mapping_schema(json const& get_mapping_response, string const& index_name)
{
    if (!get_mapping_response.is_object() || get_mapping_response.empty())
        return mapping_schema(json::object());
    auto index = get_mapping_response.find(index_name);
    json const& index_mapping = index != get_mapping_response.end()
                                    ? *index
                                    : *get_mapping_response.begin();
    auto mappings = index_mapping.find("mappings");
    return mapping_schema(
        mappings != index_mapping.end() ? *mappings : json::object());
}

} // namespace esgate
