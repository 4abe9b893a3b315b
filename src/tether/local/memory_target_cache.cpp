#include <tether/local/memory_target_cache.hpp>

#include <algorithm>

#include <tether/core/errors.hpp>

namespace tether {

void
memory_target_cache::save_target_data(target_data const& target)
{
    targets_[target.id] = target;
    highest_target_id_ = std::max(highest_target_id_, target.id);
    highest_sequence_number_
        = std::max(highest_sequence_number_, target.sequence_number);
}

void
memory_target_cache::add_target_data(
    persistence_transaction& txn, target_data const& target)
{
    if (targets_.find(target.id) != targets_.end())
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "adding a target that already exists: "
                + std::to_string(target.id)));
    }
    save_target_data(target);
}

void
memory_target_cache::update_target_data(
    persistence_transaction& txn, target_data const& target)
{
    if (targets_.find(target.id) == targets_.end())
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "updating a target that doesn't exist: "
                + std::to_string(target.id)));
    }
    save_target_data(target);
}

void
memory_target_cache::remove_target_data(
    persistence_transaction& txn, target_data const& target)
{
    targets_.erase(target.id);
    references_.remove_references_for_id(target.id);
}

optional<target_data>
memory_target_cache::get_target_data(
    persistence_transaction& txn, target_id id)
{
    auto i = targets_.find(id);
    if (i == targets_.end())
        return none;
    return i->second;
}

size_t
memory_target_cache::get_target_count(persistence_transaction& txn)
{
    return targets_.size();
}

void
memory_target_cache::for_each_target(
    persistence_transaction& txn,
    function_view<void(target_data const&)> const& visitor)
{
    for (auto const& [id, target] : targets_)
        visitor(target);
}

size_t
memory_target_cache::remove_targets(
    persistence_transaction& txn,
    listen_sequence_number upper_bound,
    active_target_ids const& active_ids)
{
    size_t count = 0;
    for (auto i = targets_.begin(); i != targets_.end();)
    {
        target_data const& target = i->second;
        if (target.sequence_number <= upper_bound
            && active_ids.find(target.id) == active_ids.end())
        {
            references_.remove_references_for_id(target.id);
            i = targets_.erase(i);
            ++count;
        }
        else
        {
            ++i;
        }
    }
    return count;
}

void
memory_target_cache::add_matching_keys(
    persistence_transaction& txn,
    std::vector<document_key> const& keys,
    target_id id)
{
    references_.add_references(keys, id);
    for (auto const& key : keys)
        delegate_.add_reference(txn, key);
}

void
memory_target_cache::remove_matching_keys(
    persistence_transaction& txn,
    std::vector<document_key> const& keys,
    target_id id)
{
    references_.remove_references(keys, id);
    for (auto const& key : keys)
        delegate_.remove_reference(txn, key);
}

void
memory_target_cache::remove_matching_keys_for_target_id(
    persistence_transaction& txn, target_id id)
{
    references_.remove_references_for_id(id);
}

std::vector<document_key>
memory_target_cache::get_matching_keys_for_target_id(
    persistence_transaction& txn, target_id id)
{
    return references_.references_for_id(id);
}

bool
memory_target_cache::contains_key(
    persistence_transaction& txn, document_key const& key)
{
    return references_.contains_key(key);
}

} // namespace tether
