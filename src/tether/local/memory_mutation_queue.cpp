#include <tether/local/memory_mutation_queue.hpp>

#include <algorithm>
#include <limits>

#include <tether/core/errors.hpp>

namespace tether {

batch_id
memory_mutation_queue::add_mutation_batch(
    persistence_transaction& txn, std::vector<document_key> const& keys)
{
    batch_id id = next_batch_id_++;
    queue_.push_back(mutation_batch{id, keys});
    for (auto const& key : keys)
        batches_by_key_.emplace(key, id);
    return id;
}

optional<mutation_batch>
memory_mutation_queue::lookup_mutation_batch(
    persistence_transaction& txn, batch_id id)
{
    auto i = std::find_if(
        queue_.begin(), queue_.end(), [id](mutation_batch const& batch) {
            return batch.id == id;
        });
    if (i == queue_.end())
        return none;
    return *i;
}

std::vector<mutation_batch>
memory_mutation_queue::all_mutation_batches_affecting_document_key(
    persistence_transaction& txn, document_key const& key)
{
    std::vector<mutation_batch> batches;
    for (auto i = batches_by_key_.lower_bound(
             std::make_pair(key, std::numeric_limits<batch_id>::min()));
         i != batches_by_key_.end() && i->first == key;
         ++i)
    {
        auto batch = lookup_mutation_batch(txn, i->second);
        if (batch)
            batches.push_back(std::move(*batch));
    }
    return batches;
}

void
memory_mutation_queue::remove_mutation_batch(
    persistence_transaction& txn, batch_id id)
{
    auto i = std::find_if(
        queue_.begin(), queue_.end(), [id](mutation_batch const& batch) {
            return batch.id == id;
        });
    if (i == queue_.end())
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "removing a mutation batch that isn't in the queue: "
                + std::to_string(id)));
    }
    mutation_batch batch = std::move(*i);
    queue_.erase(i);
    for (auto const& key : batch.keys)
    {
        batches_by_key_.erase(std::make_pair(key, id));
        delegate_.remove_mutation_reference(txn, key);
    }
}

bool
memory_mutation_queue::contains_key(
    persistence_transaction& txn, document_key const& key)
{
    auto i = batches_by_key_.lower_bound(
        std::make_pair(key, std::numeric_limits<batch_id>::min()));
    return i != batches_by_key_.end() && i->first == key;
}

} // namespace tether
