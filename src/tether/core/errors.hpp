#ifndef TETHER_CORE_ERRORS_HPP
#define TETHER_CORE_ERRORS_HPP

#include <tether/core/exception.hpp>

namespace tether {

// This conveys a human-readable description of what went wrong.
TETHER_DEFINE_ERROR_INFO(string, internal_error_message)

// This can be used to flag errors that represent failed checks on conditions
// that should be guaranteed internally. These indicate a bug in the calling
// code and are never handled within the library.
TETHER_DEFINE_EXCEPTION(internal_check_failed)

// This is thrown when the caller asks for something that the current
// configuration can't provide. Retrying won't help; the caller has to
// reconfigure.
TETHER_DEFINE_EXCEPTION(failed_precondition)

} // namespace tether

#endif
