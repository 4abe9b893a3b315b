#include <tether/local/reference_set.hpp>

#include <limits>

namespace tether {

void
reference_set::add_reference(document_key const& key, target_id id)
{
    by_key_.emplace(key, id);
    by_id_.emplace(id, key);
}

void
reference_set::add_references(
    std::vector<document_key> const& keys, target_id id)
{
    for (auto const& key : keys)
        add_reference(key, id);
}

void
reference_set::remove_reference(document_key const& key, target_id id)
{
    by_key_.erase(std::make_pair(key, id));
    by_id_.erase(std::make_pair(id, key));
}

void
reference_set::remove_references(
    std::vector<document_key> const& keys, target_id id)
{
    for (auto const& key : keys)
        remove_reference(key, id);
}

std::vector<document_key>
reference_set::remove_references_for_id(target_id id)
{
    std::vector<document_key> keys = references_for_id(id);
    for (auto const& key : keys)
        remove_reference(key, id);
    return keys;
}

void
reference_set::remove_all_references()
{
    by_key_.clear();
    by_id_.clear();
}

std::vector<document_key>
reference_set::references_for_id(target_id id) const
{
    std::vector<document_key> keys;
    // The empty key sorts before every other key, so this finds the first
    // entry for :id.
    for (auto i = by_id_.lower_bound(std::make_pair(id, document_key()));
         i != by_id_.end() && i->first == id;
         ++i)
    {
        keys.push_back(i->second);
    }
    return keys;
}

bool
reference_set::contains_key(document_key const& key) const
{
    auto i = by_key_.lower_bound(
        std::make_pair(key, std::numeric_limits<target_id>::min()));
    return i != by_key_.end() && i->first == key;
}

} // namespace tether
