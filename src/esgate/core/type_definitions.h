#ifndef ESGATE_CORE_TYPE_DEFINITIONS_H
#define ESGATE_CORE_TYPE_DEFINITIONS_H

#include <any>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>

namespace esgate {

using std::string;

using boost::none;
using boost::optional;

using boost::noncopyable;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// ownership_holder is meant to express polymorphic ownership of a resource.
// The idea is that the resource may be owned in many different ways, and we
// don't care what way. We only want an object that will provide ownership of
// the resource until it's destructed.
typedef std::any ownership_holder;

struct blob
{
    ownership_holder ownership;
    char const* data = nullptr;
    std::size_t size = 0;
};

// Blobs compare by content, not by ownership.
bool
operator==(blob const& a, blob const& b);
bool
operator!=(blob const& a, blob const& b);

// Make a blob that holds the contents of the given string.
blob
make_string_blob(string s);

// Copy the contents of a blob into a string.
string
to_string(blob const& b);

} // namespace esgate

#endif
