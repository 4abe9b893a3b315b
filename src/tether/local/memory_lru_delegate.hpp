#ifndef TETHER_LOCAL_MEMORY_LRU_DELEGATE_HPP
#define TETHER_LOCAL_MEMORY_LRU_DELEGATE_HPP

#include <unordered_map>

#include <tether/local/lru_delegate.hpp>
#include <tether/local/persistence.hpp>

namespace tether {

struct memory_persistence;

// The LRU delegate never deletes anything on its own. Instead, whenever a
// document's references change, it records the sequence number of the
// transaction in which that happened. An external LRU collector later uses
// the lru_delegate protocol to remove whatever is no longer pinned as of
// some cutoff sequence number.
//
// Note that having an orphan timestamp doesn't by itself mean that a
// document is unreferenced. Whether a document can be removed is always
// decided at sweep time (see is_pinned()).
//
struct memory_lru_delegate : memory_reference_delegate, lru_delegate
{
    explicit memory_lru_delegate(memory_persistence& persistence)
        : persistence_(persistence)
    {
    }

    // reference_delegate

    void
    set_in_memory_pins(reference_set* pins) override
    {
        in_memory_pins_ = pins;
    }

    void
    add_reference(
        persistence_transaction& txn, document_key const& key) override;

    void
    remove_reference(
        persistence_transaction& txn, document_key const& key) override;

    void
    remove_mutation_reference(
        persistence_transaction& txn, document_key const& key) override;

    // This only updates the target's sequence number. Its documents are
    // checked when the collector sweeps.
    void
    remove_target(
        persistence_transaction& txn, target_data const& target) override;

    void
    update_limbo_document(
        persistence_transaction& txn, document_key const& key) override;

    // memory_reference_delegate

    // the length of the key plus the estimated size of the document's data
    size_t
    document_size(maybe_document const& doc) const override;

    // No-ops. These are here so that memory_persistence doesn't need to know
    // which kind of delegate it has.
    void
    on_transaction_started(persistence_transaction& txn) override
    {
    }
    cppcoro::task<>
    on_transaction_committed(persistence_transaction& txn) override;

    // lru_delegate

    void
    for_each_target(
        persistence_transaction& txn,
        function_view<void(target_data const&)> const& visitor) override;

    size_t
    get_sequence_number_count(persistence_transaction& txn) override;

    void
    for_each_orphaned_document_sequence_number(
        persistence_transaction& txn,
        function_view<void(listen_sequence_number)> const& visitor) override;

    size_t
    remove_targets(
        persistence_transaction& txn,
        listen_sequence_number upper_bound,
        active_target_ids const& active_ids) override;

    // This also drops the orphan timestamps of uncached keys that aren't
    // pinned as of :upper_bound. Only removed documents are counted.
    size_t
    remove_orphaned_documents(
        persistence_transaction& txn,
        listen_sequence_number upper_bound) override;

    size_t
    get_cache_size(persistence_transaction& txn) override;

    // Get the sequence number at which :key last had its references
    // changed, if any.
    optional<listen_sequence_number>
    get_orphaned_sequence_number(document_key const& key) const;

 private:
    void
    record_sequence_number(
        persistence_transaction const& txn, document_key const& key);

    // Is :key still needed as far as a collection up to :upper_bound is
    // concerned? This checks (in order) the mutation queues, the in-memory
    // pins, the target cache, and whether the key was orphaned after
    // :upper_bound.
    bool
    is_pinned(
        persistence_transaction& txn,
        document_key const& key,
        listen_sequence_number upper_bound);

    memory_persistence& persistence_;

    reference_set* in_memory_pins_ = nullptr;

    // the sequence number of the most recent reference change for each key
    std::unordered_map<document_key, listen_sequence_number>
        orphaned_sequence_numbers_;
};

} // namespace tether

#endif
