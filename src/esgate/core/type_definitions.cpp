#include <esgate/core/type_definitions.h>

#include <cstring>
#include <memory>

namespace esgate {

bool
operator==(blob const& a, blob const& b)
{
    return a.size == b.size
           && (a.size == 0 || a.data == b.data
               || std::memcmp(a.data, b.data, a.size) == 0);
}

bool
operator!=(blob const& a, blob const& b)
{
    return !(a == b);
}

blob
make_string_blob(string s)
{
    blob b;
    // The string is held through a shared_ptr so that its contents don't
    // move when the blob is moved.
    b.ownership = std::make_shared<string>(std::move(s));
    string const& owned_string
        = *std::any_cast<std::shared_ptr<string> const&>(b.ownership);
    b.data = owned_string.c_str();
    b.size = owned_string.length();
    return b;
}

string
to_string(blob const& b)
{
    return b.size == 0 ? string() : string(b.data, b.data + b.size);
}

} // namespace esgate
