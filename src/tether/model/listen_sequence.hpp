#ifndef TETHER_MODEL_LISTEN_SEQUENCE_HPP
#define TETHER_MODEL_LISTEN_SEQUENCE_HPP

#include <tether/model/types.hpp>

namespace tether {

// a sequence number that's never handed out
static listen_sequence_number const invalid_listen_sequence_number = -1;

// listen_sequence generates the listen sequence numbers that serve as the
// logical clock for garbage collection. Each call to next() returns a value
// strictly greater than any value it has returned before.
struct listen_sequence
{
    explicit listen_sequence(listen_sequence_number previous)
        : previous_(previous)
    {
    }

    listen_sequence_number
    next()
    {
        return ++previous_;
    }

    listen_sequence_number
    previous() const
    {
        return previous_;
    }

 private:
    listen_sequence_number previous_;
};

} // namespace tether

#endif
