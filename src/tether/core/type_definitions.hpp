#ifndef TETHER_CORE_TYPE_DEFINITIONS_HPP
#define TETHER_CORE_TYPE_DEFINITIONS_HPP

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/core/noncopyable.hpp>
#include <boost/optional.hpp>

namespace tether {

using std::string;

using boost::none;
using boost::noncopyable;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_reference_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

inline bool
operator==(nil_t, nil_t)
{
    return true;
}
inline bool
operator!=(nil_t, nil_t)
{
    return false;
}
inline bool
operator<(nil_t, nil_t)
{
    return false;
}

} // namespace tether

#endif
