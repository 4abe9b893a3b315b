#ifndef TETHER_TESTS_LOCAL_PERSISTENCE_TESTING_HPP
#define TETHER_TESTS_LOCAL_PERSISTENCE_TESTING_HPP

#include <cppcoro/sync_wait.hpp>

#include <tether/local/memory_persistence.hpp>

namespace tether {

inline document_key
make_key(string const& path)
{
    return document_key::from_path_string(path);
}

inline maybe_document
make_test_document(string const& path)
{
    return make_document(
        make_key(path),
        1,
        document_data{{"path", path}, {"count", integer(1)}});
}

inline target_data
make_target(target_id id, listen_sequence_number sequence_number)
{
    target_data target;
    target.id = id;
    target.sequence_number = sequence_number;
    return target;
}

// Run :fn synchronously as a transaction on :persistence and return
// whatever it returns.
template<class Fn>
auto
run_sync(memory_persistence& persistence, string const& action, Fn fn)
{
    typedef decltype(fn(std::declval<persistence_transaction&>())) result_type;
    return cppcoro::sync_wait(persistence.run_transaction<result_type>(
        action,
        transaction_mode::READ_WRITE_PRIMARY,
        [&fn](persistence_transaction& txn) -> cppcoro::task<result_type> {
            co_return fn(txn);
        }));
}

// Is :key currently in the remote document cache?
// This reads the cache directly, outside of any transaction, so it doesn't
// consume a sequence number.
inline bool
document_cache_contains(
    memory_persistence& persistence, document_key const& key)
{
    memory_transaction probe(invalid_listen_sequence_number);
    return persistence.get_remote_document_cache()
        .get_entry(probe, key)
        .has_value();
}

} // namespace tether

#endif
