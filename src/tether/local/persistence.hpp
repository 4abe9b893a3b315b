#ifndef TETHER_LOCAL_PERSISTENCE_HPP
#define TETHER_LOCAL_PERSISTENCE_HPP

#include <functional>
#include <vector>

#include <cppcoro/task.hpp>

#include <tether/model/document.hpp>
#include <tether/model/target_data.hpp>

// This file defines the interfaces that tie the local caches to the garbage
// collection policy. The caches call into a reference_delegate whenever a
// document gains or loses a reference, and the persistence layer brackets
// every transaction with calls to the delegate so that it can do its
// bookkeeping.

namespace tether {

struct reference_set;

// The mode that a transaction is requested in. Memory persistence accepts
// all modes and treats them identically.
enum class transaction_mode
{
    READ_ONLY,
    READ_WRITE,
    READ_WRITE_PRIMARY
};

char const*
get_transaction_mode_name(transaction_mode mode);

// A persistence_transaction is handed to every operation that runs as part of
// a transaction. It carries the sequence number assigned to the transaction.
// Note that there's no rollback. The transaction is just a tag plus a place
// to register work that should happen once the transaction has committed.
struct persistence_transaction : noncopyable
{
    virtual ~persistence_transaction()
    {
    }

    virtual listen_sequence_number
    current_sequence_number() const = 0;

    // Register a listener to be called once the transaction has committed
    // and its result is available.
    void
    add_on_committed_listener(std::function<void()> listener)
    {
        on_committed_listeners_.push_back(std::move(listener));
    }

    // Invoke (and clear) all registered listeners, in registration order.
    void
    raise_on_committed_event()
    {
        auto listeners = std::move(on_committed_listeners_);
        on_committed_listeners_.clear();
        for (auto const& listener : listeners)
            listener();
    }

 private:
    std::vector<std::function<void()>> on_committed_listeners_;
};

// A reference_delegate is notified whenever a document gains or loses a
// reference from one of the sources that keep documents resident.
struct reference_delegate
{
    virtual ~reference_delegate()
    {
    }

    // Set the pins held by in-memory listeners.
    // The set is borrowed. It must outlive the delegate (or be replaced).
    virtual void
    set_in_memory_pins(reference_set* pins)
        = 0;

    // A target or pin started referencing :key.
    virtual void
    add_reference(persistence_transaction& txn, document_key const& key)
        = 0;

    // A target or pin stopped referencing :key.
    virtual void
    remove_reference(persistence_transaction& txn, document_key const& key)
        = 0;

    // A pending write to :key was acknowledged or rejected.
    virtual void
    remove_mutation_reference(
        persistence_transaction& txn, document_key const& key)
        = 0;

    // The target described by :target is being torn down.
    virtual void
    remove_target(persistence_transaction& txn, target_data const& target)
        = 0;

    // :key is involved in limbo resolution, so its status needs to be
    // recomputed.
    virtual void
    update_limbo_document(
        persistence_transaction& txn, document_key const& key)
        = 0;
};

// the extra hooks that memory persistence requires of its delegate
struct memory_reference_delegate : reference_delegate
{
    // the estimated footprint of :doc, in bytes
    virtual size_t
    document_size(maybe_document const& doc) const = 0;

    virtual void
    on_transaction_started(persistence_transaction& txn)
        = 0;

    // This may perform additional cache writes, which are complete by the
    // time the returned task finishes.
    virtual cppcoro::task<>
    on_transaction_committed(persistence_transaction& txn) = 0;
};

// A garbage_collection_scheduler periodically drives collection.
struct garbage_collection_scheduler
{
    virtual ~garbage_collection_scheduler()
    {
    }

    virtual bool
    started() const = 0;

    virtual void
    start() = 0;

    virtual void
    stop() = 0;
};

} // namespace tether

#endif
