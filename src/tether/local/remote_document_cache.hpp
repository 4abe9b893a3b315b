#ifndef TETHER_LOCAL_REMOTE_DOCUMENT_CACHE_HPP
#define TETHER_LOCAL_REMOTE_DOCUMENT_CACHE_HPP

#include <map>

#include <tether/local/persistence.hpp>
#include <tether/utilities/functional.hpp>

namespace tether {

// The remote_document_cache is the local mirror of documents as the server
// last reported them.
struct remote_document_cache
{
    virtual ~remote_document_cache()
    {
    }

    // Add or replace the entry for :doc.key.
    virtual void
    add_entry(persistence_transaction& txn, maybe_document const& doc) = 0;

    virtual void
    remove_entry(persistence_transaction& txn, document_key const& key) = 0;

    virtual optional<maybe_document>
    get_entry(persistence_transaction& txn, document_key const& key) = 0;

    virtual void
    for_each_document_key(
        persistence_transaction& txn,
        function_view<void(document_key const&)> const& visitor)
        = 0;

    // the total estimated size of all entries, in bytes
    virtual size_t
    get_size(persistence_transaction& txn) = 0;
};

// A remote_document_change_buffer stages writes to a remote_document_cache
// so that they can be applied all at once. If the same key is written more
// than once, the last write wins.
struct remote_document_change_buffer : noncopyable
{
    explicit remote_document_change_buffer(remote_document_cache& cache)
        : cache_(cache)
    {
    }

    void
    add_entry(maybe_document const& doc);

    void
    remove_entry(document_key const& key);

    // Get the staged state of :key, falling back to the underlying cache.
    optional<maybe_document>
    get_entry(persistence_transaction& txn, document_key const& key);

    size_t
    staged_change_count() const
    {
        return changes_.size();
    }

    // Write all staged changes to the cache.
    // A buffer can only be applied once.
    void
    apply(persistence_transaction& txn);

 private:
    void
    assert_not_applied() const;

    remote_document_cache& cache_;

    // none means the key is staged for removal
    std::map<document_key, optional<maybe_document>> changes_;

    bool applied_ = false;
};

} // namespace tether

#endif
