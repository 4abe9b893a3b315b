#include <tether/local/remote_document_cache.hpp>

#include <tether/core/errors.hpp>

namespace tether {

void
remote_document_change_buffer::assert_not_applied() const
{
    if (applied_)
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                "change buffer has already been applied"));
    }
}

void
remote_document_change_buffer::add_entry(maybe_document const& doc)
{
    assert_not_applied();
    changes_[doc.key] = doc;
}

void
remote_document_change_buffer::remove_entry(document_key const& key)
{
    assert_not_applied();
    changes_[key] = none;
}

optional<maybe_document>
remote_document_change_buffer::get_entry(
    persistence_transaction& txn, document_key const& key)
{
    assert_not_applied();
    auto i = changes_.find(key);
    if (i != changes_.end())
        return i->second;
    return cache_.get_entry(txn, key);
}

void
remote_document_change_buffer::apply(persistence_transaction& txn)
{
    assert_not_applied();
    applied_ = true;
    for (auto const& [key, change] : changes_)
    {
        if (change)
            cache_.add_entry(txn, *change);
        else
            cache_.remove_entry(txn, key);
    }
    changes_.clear();
}

} // namespace tether
