#ifndef TETHER_LOCAL_REFERENCE_SET_HPP
#define TETHER_LOCAL_REFERENCE_SET_HPP

#include <set>
#include <utility>
#include <vector>

#include <tether/model/document_key.hpp>
#include <tether/model/types.hpp>

namespace tether {

// A reference_set is a collection of (document key, ID) references, where
// the ID is typically a target ID (or some other ID that identifies the
// holder of the reference).
//
// It's indexed both ways so that it can efficiently answer "Is this key
// referenced at all?" and "Which keys does this ID reference?".
//
// In-memory listeners use a reference_set to pin the documents they're
// looking at. The persistence layer only borrows the set, so it must never
// assume that the contents remain the same between transactions.
//
struct reference_set
{
    bool
    is_empty() const
    {
        return by_key_.empty();
    }

    void
    add_reference(document_key const& key, target_id id);

    void
    add_references(std::vector<document_key> const& keys, target_id id);

    void
    remove_reference(document_key const& key, target_id id);

    void
    remove_references(std::vector<document_key> const& keys, target_id id);

    // Remove all references held by :id and return the affected keys.
    std::vector<document_key>
    remove_references_for_id(target_id id);

    void
    remove_all_references();

    // Get all keys referenced by :id, in key order.
    std::vector<document_key>
    references_for_id(target_id id) const;

    // Is :key referenced by anyone?
    bool
    contains_key(document_key const& key) const;

 private:
    // sorted by key, then ID
    std::set<std::pair<document_key, target_id>> by_key_;
    // sorted by ID, then key
    std::set<std::pair<target_id, document_key>> by_id_;
};

} // namespace tether

#endif
