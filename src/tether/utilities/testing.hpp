#ifndef TETHER_UTILITIES_TESTING_HPP
#define TETHER_UTILITIES_TESTING_HPP

#define CATCH_CONFIG_CPP11_NO_NULLPTR
#include <catch2/catch.hpp>

#include <tether/core/errors.hpp>

namespace tether {

// Get the message attached to an exception via internal_error_message_info.
template<class Exception>
string
get_error_message(Exception const& e)
{
    return get_required_error_info<internal_error_message_info>(e);
}

} // namespace tether

#endif
