#include <tether/local/memory_eager_delegate.hpp>

#include <tether/core/errors.hpp>
#include <tether/core/logging.hpp>
#include <tether/local/memory_persistence.hpp>
#include <tether/local/reference_set.hpp>
#include <tether/utilities/functional.hpp>

namespace tether {

void
memory_eager_delegate::check_scope(persistence_transaction const& txn) const
{
    if (!scope_)
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "orphaned documents are only valid during a transaction"));
    }
    if (scope_->sequence_number != txn.current_sequence_number())
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "orphaned documents accessed from transaction "
                + std::to_string(txn.current_sequence_number())
                + " while transaction "
                + std::to_string(scope_->sequence_number) + " is open"));
    }
}

std::set<document_key>&
memory_eager_delegate::orphaned_documents(persistence_transaction const& txn)
{
    check_scope(txn);
    return scope_->orphaned_documents;
}

std::unique_ptr<memory_eager_delegate::orphan_scope>
memory_eager_delegate::close_scope(persistence_transaction const& txn)
{
    check_scope(txn);
    return std::move(scope_);
}

void
memory_eager_delegate::add_reference(
    persistence_transaction& txn, document_key const& key)
{
    orphaned_documents(txn).erase(key);
}

void
memory_eager_delegate::remove_reference(
    persistence_transaction& txn, document_key const& key)
{
    orphaned_documents(txn).insert(key);
}

void
memory_eager_delegate::remove_mutation_reference(
    persistence_transaction& txn, document_key const& key)
{
    orphaned_documents(txn).insert(key);
}

void
memory_eager_delegate::remove_target(
    persistence_transaction& txn, target_data const& target)
{
    auto& orphaned = orphaned_documents(txn);
    auto& cache = persistence_.get_target_cache();
    for (auto const& key :
         cache.get_matching_keys_for_target_id(txn, target.id))
    {
        orphaned.insert(key);
    }
    cache.remove_target_data(txn, target);
}

void
memory_eager_delegate::update_limbo_document(
    persistence_transaction& txn, document_key const& key)
{
    auto& orphaned = orphaned_documents(txn);
    if (is_referenced(txn, key))
        orphaned.erase(key);
    else
        orphaned.insert(key);
}

void
memory_eager_delegate::on_transaction_started(persistence_transaction& txn)
{
    // A scope left over from a transaction that failed before committing is
    // simply discarded.
    scope_.reset(new orphan_scope{txn.current_sequence_number(), {}});
}

cppcoro::task<>
memory_eager_delegate::on_transaction_committed(persistence_transaction& txn)
{
    std::unique_ptr<orphan_scope> scope = close_scope(txn);

    auto& cache = persistence_.get_remote_document_cache();
    auto changes = cache.new_change_buffer();
    for (auto const& key : scope->orphaned_documents)
    {
        if (!is_referenced(txn, key))
            changes->remove_entry(key);
    }
    if (changes->staged_change_count() != 0)
    {
        get_logger()->debug(
            "[eager_gc] removing {} orphaned document(s) in transaction {}",
            changes->staged_change_count(),
            txn.current_sequence_number());
    }
    changes->apply(txn);
    co_return;
}

bool
memory_eager_delegate::is_referenced(
    persistence_transaction& txn, document_key const& key)
{
    if (!in_memory_pins_)
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "in-memory pins haven't been set"));
    }
    return any_of_lazily(
        [&] { return persistence_.get_target_cache().contains_key(txn, key); },
        [&] { return persistence_.mutation_queues_contain_key(txn, key); },
        [&] { return in_memory_pins_->contains_key(key); });
}

} // namespace tether
