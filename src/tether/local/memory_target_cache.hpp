#ifndef TETHER_LOCAL_MEMORY_TARGET_CACHE_HPP
#define TETHER_LOCAL_MEMORY_TARGET_CACHE_HPP

#include <map>

#include <tether/local/reference_set.hpp>
#include <tether/local/target_cache.hpp>

namespace tether {

struct memory_target_cache : target_cache
{
    // :delegate is notified as keys are added to and removed from targets.
    explicit memory_target_cache(reference_delegate& delegate)
        : delegate_(delegate)
    {
    }

    void
    add_target_data(
        persistence_transaction& txn, target_data const& target) override;

    void
    update_target_data(
        persistence_transaction& txn, target_data const& target) override;

    void
    remove_target_data(
        persistence_transaction& txn, target_data const& target) override;

    optional<target_data>
    get_target_data(persistence_transaction& txn, target_id id) override;

    size_t
    get_target_count(persistence_transaction& txn) override;

    void
    for_each_target(
        persistence_transaction& txn,
        function_view<void(target_data const&)> const& visitor) override;

    size_t
    remove_targets(
        persistence_transaction& txn,
        listen_sequence_number upper_bound,
        active_target_ids const& active_ids) override;

    void
    add_matching_keys(
        persistence_transaction& txn,
        std::vector<document_key> const& keys,
        target_id id) override;

    void
    remove_matching_keys(
        persistence_transaction& txn,
        std::vector<document_key> const& keys,
        target_id id) override;

    void
    remove_matching_keys_for_target_id(
        persistence_transaction& txn, target_id id) override;

    std::vector<document_key>
    get_matching_keys_for_target_id(
        persistence_transaction& txn, target_id id) override;

    bool
    contains_key(
        persistence_transaction& txn, document_key const& key) override;

    listen_sequence_number
    highest_sequence_number() const override
    {
        return highest_sequence_number_;
    }

    target_id
    highest_target_id() const override
    {
        return highest_target_id_;
    }

 private:
    void
    save_target_data(target_data const& target);

    reference_delegate& delegate_;

    std::map<target_id, target_data> targets_;

    // the keys matched by each target
    reference_set references_;

    listen_sequence_number highest_sequence_number_ = 0;
    target_id highest_target_id_ = 0;
};

} // namespace tether

#endif
