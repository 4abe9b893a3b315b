#include <tether/local/mutation_queue.hpp>

namespace tether {

bool
any_mutation_queue_contains_key(
    std::vector<mutation_queue*> const& queues,
    persistence_transaction& txn,
    document_key const& key)
{
    for (mutation_queue* queue : queues)
    {
        if (queue->contains_key(txn, key))
            return true;
    }
    return false;
}

} // namespace tether
