#ifndef TETHER_LOCAL_LRU_DELEGATE_HPP
#define TETHER_LOCAL_LRU_DELEGATE_HPP

#include <set>

#include <tether/local/persistence.hpp>
#include <tether/utilities/functional.hpp>

// This is the protocol that an LRU garbage collector uses to inspect and
// trim the local caches. The collector itself (which decides how far back to
// collect) lives outside this library.

namespace tether {

// the IDs of targets that are currently being listened to and so must never
// be collected, regardless of their sequence numbers
typedef std::set<target_id> active_target_ids;

struct lru_delegate
{
    virtual ~lru_delegate()
    {
    }

    // Visit every target in the target cache.
    virtual void
    for_each_target(
        persistence_transaction& txn,
        function_view<void(target_data const&)> const& visitor)
        = 0;

    // Count the number of sequence numbers that a collection could consider:
    // one for each target plus one for each orphaned, unpinned document.
    virtual size_t
    get_sequence_number_count(persistence_transaction& txn) = 0;

    // Visit the orphan timestamp of each orphaned document that isn't
    // currently pinned.
    virtual void
    for_each_orphaned_document_sequence_number(
        persistence_transaction& txn,
        function_view<void(listen_sequence_number)> const& visitor)
        = 0;

    // Remove all targets with a sequence number of at most :upper_bound that
    // aren't in :active_ids. Returns the number removed.
    virtual size_t
    remove_targets(
        persistence_transaction& txn,
        listen_sequence_number upper_bound,
        active_target_ids const& active_ids)
        = 0;

    // Remove all documents that aren't pinned as of :upper_bound.
    // Returns the number removed.
    virtual size_t
    remove_orphaned_documents(
        persistence_transaction& txn, listen_sequence_number upper_bound)
        = 0;

    // the total estimated size of the document cache, in bytes
    virtual size_t
    get_cache_size(persistence_transaction& txn) = 0;
};

} // namespace tether

#endif
