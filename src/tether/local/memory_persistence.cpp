#include <tether/local/memory_persistence.hpp>

#include <tether/core/errors.hpp>
#include <tether/core/logging.hpp>
#include <tether/local/memory_eager_delegate.hpp>
#include <tether/local/memory_lru_delegate.hpp>

namespace tether {

memory_persistence::memory_persistence(delegate_factory const& make_delegate)
{
    started_ = true;
    reference_delegate_ = make_delegate(*this);
    target_cache_ = std::make_unique<memory_target_cache>(*reference_delegate_);
    remote_document_cache_ = std::make_unique<memory_remote_document_cache>(
        [this](maybe_document const& doc) {
            return reference_delegate_->document_size(doc);
        });
}

memory_persistence::~memory_persistence()
{
}

void
memory_persistence::shutdown()
{
    started_ = false;
}

memory_mutation_queue&
memory_persistence::get_mutation_queue(user const& u)
{
    auto& queue = mutation_queues_[u.to_key()];
    if (!queue)
    {
        queue = std::make_unique<memory_mutation_queue>(*reference_delegate_);
        mutation_queue_order_.push_back(queue.get());
    }
    return *queue;
}

bool
memory_persistence::mutation_queues_contain_key(
    persistence_transaction& txn, document_key const& key)
{
    return any_mutation_queue_contains_key(mutation_queue_order_, txn, key);
}

listen_sequence_number
memory_persistence::begin_transaction(
    string const& action, transaction_mode mode)
{
    if (!started_)
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "transaction '" + action
                + "' started after persistence was shut down"));
    }
    get_logger()->debug(
        "[memory_persistence] Starting transaction: {} ({})",
        action,
        get_transaction_mode_name(mode));
    return sequence_.next();
}

std::unique_ptr<memory_persistence>
make_eager_memory_persistence()
{
    return std::make_unique<memory_persistence>([](memory_persistence& p) {
        return std::make_unique<memory_eager_delegate>(p);
    });
}

std::unique_ptr<memory_persistence>
make_lru_memory_persistence()
{
    return std::make_unique<memory_persistence>([](memory_persistence& p) {
        return std::make_unique<memory_lru_delegate>(p);
    });
}

} // namespace tether
