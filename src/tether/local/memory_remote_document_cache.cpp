#include <tether/local/memory_remote_document_cache.hpp>

#include <vector>

namespace tether {

void
memory_remote_document_cache::add_entry(
    persistence_transaction& txn, maybe_document const& doc)
{
    size_t const size = sizer_(doc);
    auto i = entries_.find(doc.key);
    if (i != entries_.end())
    {
        size_ -= i->second.size;
        i->second = entry{doc, size};
    }
    else
    {
        entries_.emplace(doc.key, entry{doc, size});
    }
    size_ += size;
}

void
memory_remote_document_cache::remove_entry(
    persistence_transaction& txn, document_key const& key)
{
    auto i = entries_.find(key);
    if (i != entries_.end())
    {
        size_ -= i->second.size;
        entries_.erase(i);
    }
}

optional<maybe_document>
memory_remote_document_cache::get_entry(
    persistence_transaction& txn, document_key const& key)
{
    auto i = entries_.find(key);
    if (i == entries_.end())
        return none;
    return i->second.doc;
}

void
memory_remote_document_cache::for_each_document_key(
    persistence_transaction& txn,
    function_view<void(document_key const&)> const& visitor)
{
    // The visitor may stage removals against this cache, so iterate over a
    // snapshot of the keys.
    std::vector<document_key> keys;
    keys.reserve(entries_.size());
    for (auto const& [key, entry] : entries_)
        keys.push_back(key);
    for (auto const& key : keys)
        visitor(key);
}

} // namespace tether
