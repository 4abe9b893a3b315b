#ifndef TETHER_LOCAL_TARGET_CACHE_HPP
#define TETHER_LOCAL_TARGET_CACHE_HPP

#include <tether/local/lru_delegate.hpp>
#include <tether/local/persistence.hpp>

namespace tether {

// A target_cache stores the metadata for active targets along with the set
// of document keys that each target currently matches.
struct target_cache
{
    virtual ~target_cache()
    {
    }

    // Add a new target. Its ID must not already be in the cache.
    virtual void
    add_target_data(persistence_transaction& txn, target_data const& target)
        = 0;

    // Replace the stored metadata for an existing target.
    virtual void
    update_target_data(persistence_transaction& txn, target_data const& target)
        = 0;

    // Remove a target along with its matching keys.
    // Note that this doesn't notify the reference delegate about the keys.
    virtual void
    remove_target_data(persistence_transaction& txn, target_data const& target)
        = 0;

    virtual optional<target_data>
    get_target_data(persistence_transaction& txn, target_id id) = 0;

    virtual size_t
    get_target_count(persistence_transaction& txn) = 0;

    virtual void
    for_each_target(
        persistence_transaction& txn,
        function_view<void(target_data const&)> const& visitor)
        = 0;

    // Remove every target whose sequence number is at most :upper_bound,
    // except those listed in :active_ids. Returns the number removed.
    virtual size_t
    remove_targets(
        persistence_transaction& txn,
        listen_sequence_number upper_bound,
        active_target_ids const& active_ids)
        = 0;

    virtual void
    add_matching_keys(
        persistence_transaction& txn,
        std::vector<document_key> const& keys,
        target_id id)
        = 0;

    virtual void
    remove_matching_keys(
        persistence_transaction& txn,
        std::vector<document_key> const& keys,
        target_id id)
        = 0;

    virtual void
    remove_matching_keys_for_target_id(
        persistence_transaction& txn, target_id id)
        = 0;

    virtual std::vector<document_key>
    get_matching_keys_for_target_id(persistence_transaction& txn, target_id id)
        = 0;

    // Does any target match :key?
    virtual bool
    contains_key(persistence_transaction& txn, document_key const& key) = 0;

    virtual listen_sequence_number
    highest_sequence_number() const = 0;

    virtual target_id
    highest_target_id() const = 0;
};

} // namespace tether

#endif
