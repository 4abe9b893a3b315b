#ifndef TETHER_LOCAL_MEMORY_REMOTE_DOCUMENT_CACHE_HPP
#define TETHER_LOCAL_MEMORY_REMOTE_DOCUMENT_CACHE_HPP

#include <functional>
#include <memory>

#include <tether/local/remote_document_cache.hpp>

namespace tether {

// computes the footprint of a document, in bytes
typedef std::function<size_t(maybe_document const&)> document_sizer;

struct memory_remote_document_cache : remote_document_cache
{
    explicit memory_remote_document_cache(document_sizer sizer)
        : sizer_(std::move(sizer))
    {
    }

    void
    add_entry(persistence_transaction& txn, maybe_document const& doc) override;

    void
    remove_entry(
        persistence_transaction& txn, document_key const& key) override;

    optional<maybe_document>
    get_entry(persistence_transaction& txn, document_key const& key) override;

    void
    for_each_document_key(
        persistence_transaction& txn,
        function_view<void(document_key const&)> const& visitor) override;

    size_t
    get_size(persistence_transaction& txn) override
    {
        return size_;
    }

    size_t
    entry_count() const
    {
        return entries_.size();
    }

    std::unique_ptr<remote_document_change_buffer>
    new_change_buffer()
    {
        return std::make_unique<remote_document_change_buffer>(*this);
    }

 private:
    struct entry
    {
        maybe_document doc;
        size_t size;
    };

    document_sizer sizer_;

    std::map<document_key, entry> entries_;

    // the sum of the sizes of all entries
    size_t size_ = 0;
};

} // namespace tether

#endif
