#ifndef TETHER_MODEL_TARGET_DATA_HPP
#define TETHER_MODEL_TARGET_DATA_HPP

#include <tether/core/type_definitions.hpp>
#include <tether/model/types.hpp>

namespace tether {

// why a target is being listened to
enum class target_purpose
{
    // a regular, user-initiated listen
    LISTEN,
    // a listen that was reissued after the server reported an existence
    // filter mismatch
    EXISTENCE_FILTER_MISMATCH,
    // an internal listen used to resolve a document in limbo
    LIMBO_RESOLUTION
};

// the metadata that the target cache keeps for an active target
struct target_data
{
    target_id id = 0;

    // the sequence number of the last transaction that used this target
    listen_sequence_number sequence_number = 0;

    target_purpose purpose = target_purpose::LISTEN;

    // the latest snapshot version seen for this target
    snapshot_version version = 0;

    // an opaque token that lets the server resume the target
    string resume_token;

    target_data
    with_sequence_number(listen_sequence_number n) const
    {
        target_data updated = *this;
        updated.sequence_number = n;
        return updated;
    }
};

inline bool
operator==(target_data const& a, target_data const& b)
{
    return a.id == b.id && a.sequence_number == b.sequence_number
           && a.purpose == b.purpose && a.version == b.version
           && a.resume_token == b.resume_token;
}
inline bool
operator!=(target_data const& a, target_data const& b)
{
    return !(a == b);
}

} // namespace tether

#endif
