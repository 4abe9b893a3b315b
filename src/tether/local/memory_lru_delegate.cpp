#include <tether/local/memory_lru_delegate.hpp>

#include <tether/core/errors.hpp>
#include <tether/core/logging.hpp>
#include <tether/local/memory_persistence.hpp>
#include <tether/local/reference_set.hpp>

namespace tether {

void
memory_lru_delegate::record_sequence_number(
    persistence_transaction const& txn, document_key const& key)
{
    orphaned_sequence_numbers_[key] = txn.current_sequence_number();
}

void
memory_lru_delegate::add_reference(
    persistence_transaction& txn, document_key const& key)
{
    record_sequence_number(txn, key);
}

void
memory_lru_delegate::remove_reference(
    persistence_transaction& txn, document_key const& key)
{
    record_sequence_number(txn, key);
}

void
memory_lru_delegate::remove_mutation_reference(
    persistence_transaction& txn, document_key const& key)
{
    record_sequence_number(txn, key);
}

void
memory_lru_delegate::remove_target(
    persistence_transaction& txn, target_data const& target)
{
    persistence_.get_target_cache().update_target_data(
        txn, target.with_sequence_number(txn.current_sequence_number()));
}

void
memory_lru_delegate::update_limbo_document(
    persistence_transaction& txn, document_key const& key)
{
    record_sequence_number(txn, key);
}

size_t
memory_lru_delegate::document_size(maybe_document const& doc) const
{
    size_t size = doc.key.to_string().size();
    if (doc.is_document())
        size += estimate_byte_size(*doc.data);
    return size;
}

cppcoro::task<>
memory_lru_delegate::on_transaction_committed(persistence_transaction& txn)
{
    co_return;
}

void
memory_lru_delegate::for_each_target(
    persistence_transaction& txn,
    function_view<void(target_data const&)> const& visitor)
{
    persistence_.get_target_cache().for_each_target(txn, visitor);
}

size_t
memory_lru_delegate::get_sequence_number_count(persistence_transaction& txn)
{
    size_t orphaned_count = 0;
    for_each_orphaned_document_sequence_number(
        txn, [&](listen_sequence_number) { ++orphaned_count; });
    return persistence_.get_target_cache().get_target_count(txn)
           + orphaned_count;
}

void
memory_lru_delegate::for_each_orphaned_document_sequence_number(
    persistence_transaction& txn,
    function_view<void(listen_sequence_number)> const& visitor)
{
    for (auto const& [key, sequence_number] : orphaned_sequence_numbers_)
    {
        // Using the key's own sequence number as the upper bound means that
        // it can't be pinned just for being too recent.
        if (!is_pinned(txn, key, sequence_number))
            visitor(sequence_number);
    }
}

size_t
memory_lru_delegate::remove_targets(
    persistence_transaction& txn,
    listen_sequence_number upper_bound,
    active_target_ids const& active_ids)
{
    size_t removed = persistence_.get_target_cache().remove_targets(
        txn, upper_bound, active_ids);
    get_logger()->debug(
        "[lru_gc] removed {} target(s) up to sequence number {}",
        removed,
        upper_bound);
    return removed;
}

size_t
memory_lru_delegate::remove_orphaned_documents(
    persistence_transaction& txn, listen_sequence_number upper_bound)
{
    size_t count = 0;
    auto& cache = persistence_.get_remote_document_cache();
    auto changes = cache.new_change_buffer();
    cache.for_each_document_key(txn, [&](document_key const& key) {
        if (!is_pinned(txn, key, upper_bound))
        {
            ++count;
            changes->remove_entry(key);
            orphaned_sequence_numbers_.erase(key);
        }
    });
    changes->apply(txn);

    // Timestamps can also be held for keys that never made it into the
    // document cache. Those are dropped on the same terms.
    for (auto i = orphaned_sequence_numbers_.begin();
         i != orphaned_sequence_numbers_.end();)
    {
        if (is_pinned(txn, i->first, upper_bound))
            ++i;
        else
            i = orphaned_sequence_numbers_.erase(i);
    }

    get_logger()->debug(
        "[lru_gc] removed {} document(s) up to sequence number {}",
        count,
        upper_bound);
    return count;
}

size_t
memory_lru_delegate::get_cache_size(persistence_transaction& txn)
{
    return persistence_.get_remote_document_cache().get_size(txn);
}

optional<listen_sequence_number>
memory_lru_delegate::get_orphaned_sequence_number(document_key const& key) const
{
    auto i = orphaned_sequence_numbers_.find(key);
    if (i == orphaned_sequence_numbers_.end())
        return none;
    return i->second;
}

bool
memory_lru_delegate::is_pinned(
    persistence_transaction& txn,
    document_key const& key,
    listen_sequence_number upper_bound)
{
    if (!in_memory_pins_)
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "in-memory pins haven't been set"));
    }
    return any_of_lazily(
        [&] { return persistence_.mutation_queues_contain_key(txn, key); },
        [&] { return in_memory_pins_->contains_key(key); },
        [&] { return persistence_.get_target_cache().contains_key(txn, key); },
        [&] {
            auto orphaned_at = get_orphaned_sequence_number(key);
            return orphaned_at && *orphaned_at > upper_bound;
        });
}

} // namespace tether
