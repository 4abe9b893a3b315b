#ifndef TETHER_LOCAL_MEMORY_EAGER_DELEGATE_HPP
#define TETHER_LOCAL_MEMORY_EAGER_DELEGATE_HPP

#include <memory>
#include <set>

#include <tether/local/persistence.hpp>

namespace tether {

struct memory_persistence;

// The eager delegate removes documents from the remote document cache as
// soon as nothing references them anymore.
//
// While a transaction is open, it collects the keys that lost a reference
// (the "orphan candidates"). An add_reference() within the same transaction
// cancels an earlier removal. When the transaction commits, each candidate
// that's no longer matched by a target, written by a pending mutation, or
// pinned in memory is removed from the document cache.
//
// The candidate set only exists between on_transaction_started() and
// on_transaction_committed(). Touching it at any other time (or from a
// different transaction) is a bug in the caller and throws
// internal_check_failed.
//
struct memory_eager_delegate : memory_reference_delegate
{
    explicit memory_eager_delegate(memory_persistence& persistence)
        : persistence_(persistence)
    {
    }

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

    void
    remove_target(
        persistence_transaction& txn, target_data const& target) override;

    void
    update_limbo_document(
        persistence_transaction& txn, document_key const& key) override;

    // There are no size thresholds for eager collection, so this is always 0.
    size_t
    document_size(maybe_document const& doc) const override
    {
        return 0;
    }

    void
    on_transaction_started(persistence_transaction& txn) override;

    cppcoro::task<>
    on_transaction_committed(persistence_transaction& txn) override;

 private:
    // the bookkeeping for the transaction that's currently open
    struct orphan_scope
    {
        listen_sequence_number sequence_number;
        std::set<document_key> orphaned_documents;
    };

    // Throw internal_check_failed unless :txn is the open transaction.
    void
    check_scope(persistence_transaction const& txn) const;

    // Get the orphan candidates for :txn.
    std::set<document_key>&
    orphaned_documents(persistence_transaction const& txn);

    // Take ownership of the scope for :txn, closing it.
    std::unique_ptr<orphan_scope>
    close_scope(persistence_transaction const& txn);

    bool
    is_referenced(persistence_transaction& txn, document_key const& key);

    memory_persistence& persistence_;

    reference_set* in_memory_pins_ = nullptr;

    std::unique_ptr<orphan_scope> scope_;
};

} // namespace tether

#endif
