#include <tether/local/persistence.hpp>

namespace tether {

char const*
get_transaction_mode_name(transaction_mode mode)
{
    switch (mode)
    {
        case transaction_mode::READ_ONLY:
            return "readonly";
        case transaction_mode::READ_WRITE:
            return "readwrite";
        case transaction_mode::READ_WRITE_PRIMARY:
        default:
            return "readwrite-primary";
    }
}

} // namespace tether
