#ifndef TETHER_LOCAL_MUTATION_QUEUE_HPP
#define TETHER_LOCAL_MUTATION_QUEUE_HPP

#include <vector>

#include <tether/local/persistence.hpp>

namespace tether {

// a batch of local writes that hasn't been acknowledged by the server yet
struct mutation_batch
{
    batch_id id = 0;

    // the documents written by this batch
    std::vector<document_key> keys;
};

inline bool
operator==(mutation_batch const& a, mutation_batch const& b)
{
    return a.id == b.id && a.keys == b.keys;
}
inline bool
operator!=(mutation_batch const& a, mutation_batch const& b)
{
    return !(a == b);
}

// A mutation_queue holds one user's pending writes, in the order in which
// they were made.
struct mutation_queue
{
    virtual ~mutation_queue()
    {
    }

    // Add a new batch writing :keys and return its ID.
    virtual batch_id
    add_mutation_batch(
        persistence_transaction& txn, std::vector<document_key> const& keys)
        = 0;

    virtual optional<mutation_batch>
    lookup_mutation_batch(persistence_transaction& txn, batch_id id) = 0;

    virtual std::vector<mutation_batch>
    all_mutation_batches_affecting_document_key(
        persistence_transaction& txn, document_key const& key)
        = 0;

    // Remove a batch that has been acknowledged or rejected.
    virtual void
    remove_mutation_batch(persistence_transaction& txn, batch_id id) = 0;

    // Does any pending batch write to :key?
    virtual bool
    contains_key(persistence_transaction& txn, document_key const& key) = 0;

    virtual bool
    is_empty(persistence_transaction& txn) = 0;
};

// Does any of :queues contain a pending write to :key?
// The queues are checked in the order given, and no queue is consulted after
// one has answered yes.
bool
any_mutation_queue_contains_key(
    std::vector<mutation_queue*> const& queues,
    persistence_transaction& txn,
    document_key const& key);

} // namespace tether

#endif
