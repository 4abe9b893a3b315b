#ifndef TETHER_LOCAL_MEMORY_MUTATION_QUEUE_HPP
#define TETHER_LOCAL_MEMORY_MUTATION_QUEUE_HPP

#include <deque>
#include <set>

#include <tether/local/mutation_queue.hpp>

namespace tether {

struct memory_mutation_queue : mutation_queue
{
    // :delegate is told whenever a batch's writes stop being pending.
    explicit memory_mutation_queue(reference_delegate& delegate)
        : delegate_(delegate)
    {
    }

    batch_id
    add_mutation_batch(
        persistence_transaction& txn,
        std::vector<document_key> const& keys) override;

    optional<mutation_batch>
    lookup_mutation_batch(persistence_transaction& txn, batch_id id) override;

    std::vector<mutation_batch>
    all_mutation_batches_affecting_document_key(
        persistence_transaction& txn, document_key const& key) override;

    void
    remove_mutation_batch(persistence_transaction& txn, batch_id id) override;

    bool
    contains_key(
        persistence_transaction& txn, document_key const& key) override;

    bool
    is_empty(persistence_transaction& txn) override
    {
        return queue_.empty();
    }

    size_t
    batch_count() const
    {
        return queue_.size();
    }

 private:
    reference_delegate& delegate_;

    // pending batches, in increasing ID order
    std::deque<mutation_batch> queue_;

    batch_id next_batch_id_ = 1;

    // an index of the batches that write each key
    std::set<std::pair<document_key, batch_id>> batches_by_key_;
};

} // namespace tether

#endif
