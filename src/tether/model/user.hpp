#ifndef TETHER_MODEL_USER_HPP
#define TETHER_MODEL_USER_HPP

#include <tether/core/type_definitions.hpp>

namespace tether {

// the user on whose behalf local writes are made
struct user
{
    // the user's ID - none for unauthenticated users
    optional<string> uid;

    bool
    is_authenticated() const
    {
        return uid ? true : false;
    }

    // a string that uniquely identifies this user among all users
    // Authenticated keys are prefixed so that no uid can collide with the
    // key of the unauthenticated user.
    string
    to_key() const
    {
        return uid ? "uid:" + *uid : "anonymous-user";
    }
};

inline user
unauthenticated_user()
{
    return user{none};
}

inline user
make_user(string uid)
{
    return user{some(std::move(uid))};
}

inline bool
operator==(user const& a, user const& b)
{
    return a.uid == b.uid;
}
inline bool
operator!=(user const& a, user const& b)
{
    return !(a == b);
}

} // namespace tether

#endif
