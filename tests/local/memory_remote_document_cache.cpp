#include <tether/local/memory_remote_document_cache.hpp>

#include <local/persistence_testing.hpp>
#include <tether/utilities/testing.hpp>

using namespace tether;

namespace {

// Size documents by their version, which makes the arithmetic easy to follow.
size_t
version_sizer(maybe_document const& doc)
{
    return size_t(doc.version);
}

} // namespace

TEST_CASE("document cache entries", "[local][remote_document_cache]")
{
    memory_remote_document_cache cache(version_sizer);
    memory_transaction txn(1);
    auto a = make_key("rooms/a");
    auto b = make_key("rooms/b");

    REQUIRE(cache.get_size(txn) == 0);
    REQUIRE(!cache.get_entry(txn, a));

    cache.add_entry(txn, make_document(a, 10, {{"open", true}}));
    cache.add_entry(txn, make_no_document(b, 5));
    REQUIRE(cache.entry_count() == 2);
    REQUIRE(cache.get_size(txn) == 15);
    REQUIRE(cache.get_entry(txn, a)->is_document());
    REQUIRE(!cache.get_entry(txn, b)->is_document());

    {
        INFO("Replacing an entry replaces its size.");
        cache.add_entry(txn, make_document(a, 3, {{"open", false}}));
        REQUIRE(cache.get_size(txn) == 8);
        REQUIRE(cache.get_entry(txn, a)->version == 3);
    }

    std::vector<document_key> keys;
    cache.for_each_document_key(
        txn, [&](document_key const& key) { keys.push_back(key); });
    REQUIRE(keys == (std::vector<document_key>{a, b}));

    cache.remove_entry(txn, a);
    REQUIRE(!cache.get_entry(txn, a));
    REQUIRE(cache.get_size(txn) == 5);

    {
        INFO("Removing a missing entry is harmless.");
        cache.remove_entry(txn, a);
        REQUIRE(cache.get_size(txn) == 5);
    }
}

TEST_CASE("document change buffers", "[local][remote_document_cache]")
{
    memory_remote_document_cache cache(version_sizer);
    memory_transaction txn(1);
    auto a = make_key("rooms/a");
    auto b = make_key("rooms/b");
    auto c = make_key("rooms/c");
    cache.add_entry(txn, make_no_document(a, 1));
    cache.add_entry(txn, make_no_document(b, 1));

    auto changes = cache.new_change_buffer();
    changes->remove_entry(a);
    changes->add_entry(make_no_document(c, 2));
    changes->add_entry(make_no_document(b, 4));
    changes->remove_entry(b);
    changes->add_entry(make_no_document(b, 7));
    REQUIRE(changes->staged_change_count() == 3);

    {
        INFO("Nothing reaches the cache until the buffer is applied.");
        REQUIRE(cache.get_entry(txn, a).has_value());
        REQUIRE(!cache.get_entry(txn, c));
        REQUIRE(!changes->get_entry(txn, a));
        REQUIRE(changes->get_entry(txn, c)->version == 2);
    }

    changes->apply(txn);
    REQUIRE(!cache.get_entry(txn, a));
    REQUIRE(cache.get_entry(txn, b)->version == 7);
    REQUIRE(cache.get_entry(txn, c)->version == 2);
    REQUIRE(cache.get_size(txn) == 9);

    {
        INFO("A buffer can only be applied once.");
        REQUIRE_THROWS_AS(changes->apply(txn), internal_check_failed);
        REQUIRE_THROWS_AS(changes->remove_entry(b), internal_check_failed);
    }
}
