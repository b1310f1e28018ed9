#include <esgate/elasticsearch/prepared_query.h>

namespace esgate {

using nlohmann::json;

static json
make_match_all_query()
{
    return json{{"match_all", json::object()}};
}

prepared_query::prepared_query() : query_dsl_(make_match_all_query())
{
}

prepared_query::prepared_query(json query_dsl)
    : query_dsl_(std::move(query_dsl))
{
}

// Is :node a nested query on :path?
static bool
is_nested_query_on(json const& node, string const& path)
{
    if (!node.is_object())
        return false;
    auto nested = node.find("nested");
    if (nested == node.end() || !nested->is_object())
        return false;
    auto nested_path = nested->find("path");
    return nested_path != nested->end() && nested_path->is_string()
           && nested_path->get<string>() == path
           && nested->find("query") != nested->end();
}

static json
extract_inner_query(json& nested_query)
{
    return std::move(nested_query["nested"]["query"]);
}

// Search the descendants of :node (depth first) for a nested query on :path.
// If one is found, its inner query is returned and the nested query is taken
// out of the tree. Array elements and the clauses of a bool query (:node is
// the body of a bool query if :is_bool_body is set) are simply removed. Any
// other place requires a query, so the nested query is replaced with a
// match_all query there.
static optional<json>
take_nested_filter_from_children(
    json& node, string const& path, bool is_bool_body)
{
    if (node.is_object())
    {
        for (auto i = node.begin(); i != node.end(); ++i)
        {
            if (is_nested_query_on(*i, path))
            {
                auto filter = extract_inner_query(*i);
                if (is_bool_body)
                    node.erase(i);
                else
                    *i = make_match_all_query();
                return filter;
            }
            if (auto filter = take_nested_filter_from_children(
                    *i, path, i.key() == "bool"))
            {
                return filter;
            }
        }
    }
    else if (node.is_array())
    {
        for (std::size_t i = 0; i != node.size(); ++i)
        {
            if (is_nested_query_on(node[i], path))
            {
                auto filter = extract_inner_query(node[i]);
                node.erase(i);
                return filter;
            }
            if (auto filter
                = take_nested_filter_from_children(node[i], path, false))
            {
                return filter;
            }
        }
    }
    return none;
}

optional<json>
prepared_query::take_nested_filter(string const& path)
{
    if (is_nested_query_on(query_dsl_, path))
    {
        auto filter = extract_inner_query(query_dsl_);
        query_dsl_ = make_match_all_query();
        return filter;
    }
    return take_nested_filter_from_children(query_dsl_, path, false);
}

bool
operator==(prepared_query const& a, prepared_query const& b)
{
    return a.query_dsl() == b.query_dsl() && a.limit == b.limit
           && a.offset == b.offset && a.min_score == b.min_score
           && a.row_estimate == b.row_estimate;
}

prepared_query
make_query_string_query(string const& text)
{
    return prepared_query(json{{"query_string", {{"query", text}}}});
}

void
to_json(json& j, prepared_query const& query)
{
    j = json::object();
    if (query.limit)
        j["limit"] = *query.limit;
    if (query.offset)
        j["offset"] = *query.offset;
    if (query.min_score)
        j["min_score"] = *query.min_score;
    if (query.row_estimate)
        j["row_estimate"] = *query.row_estimate;
    j["query_dsl"] = query.query_dsl();
}

template<class T>
static optional<T>
read_optional_member(json const& j, char const* name)
{
    auto i = j.find(name);
    if (i == j.end() || i->is_null())
        return none;
    return i->get<T>();
}

void
from_json(json const& j, prepared_query& query)
{
    auto query_dsl = j.find("query_dsl");
    query = query_dsl != j.end() ? prepared_query(*query_dsl)
                                 : prepared_query();
    query.limit = read_optional_member<integer>(j, "limit");
    query.offset = read_optional_member<integer>(j, "offset");
    query.min_score = read_optional_member<double>(j, "min_score");
    query.row_estimate = read_optional_member<integer>(j, "row_estimate");
}

} // namespace esgate
