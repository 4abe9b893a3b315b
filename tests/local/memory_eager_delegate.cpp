#include <tether/local/memory_eager_delegate.hpp>

#include <fakeit.hpp>

#include <local/persistence_testing.hpp>
#include <tether/local/reference_set.hpp>
#include <tether/utilities/testing.hpp>

using namespace tether;
using namespace fakeit;

namespace {

struct eager_fixture
{
    eager_fixture() : persistence(make_eager_memory_persistence())
    {
        persistence->get_reference_delegate().set_in_memory_pins(&pins);
    }

    // Add the documents at :paths to the remote document cache.
    void
    add_documents(std::vector<string> const& paths)
    {
        run_sync(*persistence, "add documents", [&](auto& txn) {
            for (auto const& path : paths)
            {
                persistence->get_remote_document_cache().add_entry(
                    txn, make_test_document(path));
            }
        });
    }

    bool
    contains(string const& path)
    {
        return document_cache_contains(*persistence, make_key(path));
    }

    reference_set pins;
    std::unique_ptr<memory_persistence> persistence;
};

} // namespace

TEST_CASE("eager collection of acknowledged writes", "[local][eager_gc]")
{
    eager_fixture f;
    f.add_documents({"rooms/a", "rooms/b"});
    auto& queue = f.persistence->get_mutation_queue(make_user("alice"));

    auto batch = run_sync(*f.persistence, "write", [&](auto& txn) {
        return queue.add_mutation_batch(
            txn, {make_key("rooms/a"), make_key("rooms/b")});
    });
    REQUIRE(f.contains("rooms/a"));

    run_sync(*f.persistence, "acknowledge", [&](auto& txn) {
        queue.remove_mutation_batch(txn, batch);
        // Nothing is removed until the transaction commits.
        REQUIRE(f.persistence->get_remote_document_cache()
                    .get_entry(txn, make_key("rooms/a"))
                    .has_value());
    });
    REQUIRE(!f.contains("rooms/a"));
    REQUIRE(!f.contains("rooms/b"));
}

TEST_CASE("eager collection keeps referenced documents", "[local][eager_gc]")
{
    eager_fixture f;
    f.add_documents({"rooms/a", "rooms/b", "rooms/c", "rooms/d"});
    auto& targets = f.persistence->get_target_cache();
    auto& queue = f.persistence->get_mutation_queue(unauthenticated_user());

    auto batch = run_sync(*f.persistence, "setup", [&](auto& txn) {
        targets.add_target_data(
            txn, make_target(1, txn.current_sequence_number()));
        targets.add_matching_keys(txn, {make_key("rooms/a")}, 1);
        f.pins.add_reference(make_key("rooms/b"), 7);
        queue.add_mutation_batch(txn, {make_key("rooms/c")});
        return queue.add_mutation_batch(
            txn,
            {make_key("rooms/a"),
             make_key("rooms/b"),
             make_key("rooms/c"),
             make_key("rooms/d")});
    });

    run_sync(*f.persistence, "acknowledge", [&](auto& txn) {
        queue.remove_mutation_batch(txn, batch);
    });
    {
        INFO("Only the document with no remaining references is removed.");
        REQUIRE(f.contains("rooms/a"));
        REQUIRE(f.contains("rooms/b"));
        REQUIRE(f.contains("rooms/c"));
        REQUIRE(!f.contains("rooms/d"));
    }
}

TEST_CASE("eager removals can be cancelled", "[local][eager_gc]")
{
    eager_fixture f;
    f.add_documents({"rooms/a"});
    auto& targets = f.persistence->get_target_cache();
    auto key = make_key("rooms/a");

    run_sync(*f.persistence, "listen", [&](auto& txn) {
        targets.add_target_data(
            txn, make_target(1, txn.current_sequence_number()));
        targets.add_matching_keys(txn, {key}, 1);
    });

    {
        INFO("Moving a document between targets keeps it.");
        run_sync(*f.persistence, "move", [&](auto& txn) {
            targets.add_target_data(
                txn, make_target(2, txn.current_sequence_number()));
            targets.remove_matching_keys(txn, {key}, 1);
            targets.add_matching_keys(txn, {key}, 2);
        });
        REQUIRE(f.contains("rooms/a"));
    }

    {
        INFO("A remove followed by an add in the same transaction cancels.");
        run_sync(*f.persistence, "flap", [&](auto& txn) {
            f.persistence->get_reference_delegate().remove_reference(txn, key);
            f.persistence->get_reference_delegate().add_reference(txn, key);
        });
        REQUIRE(f.contains("rooms/a"));
    }

    {
        INFO("Candidates are rechecked at commit time.");
        run_sync(*f.persistence, "unlisten", [&](auto& txn) {
            targets.remove_matching_keys(txn, {key}, 2);
            f.pins.add_reference(key, 5);
        });
        REQUIRE(f.contains("rooms/a"));
    }
}

TEST_CASE("eager collection of removed targets", "[local][eager_gc]")
{
    eager_fixture f;
    f.add_documents({"rooms/a", "rooms/b"});
    auto& targets = f.persistence->get_target_cache();
    auto target = run_sync(*f.persistence, "listen", [&](auto& txn) {
        auto listened = make_target(1, txn.current_sequence_number());
        targets.add_target_data(txn, listened);
        targets.add_matching_keys(
            txn, {make_key("rooms/a"), make_key("rooms/b")}, 1);
        f.pins.add_reference(make_key("rooms/b"), 3);
        return listened;
    });

    run_sync(*f.persistence, "unlisten", [&](auto& txn) {
        f.persistence->get_reference_delegate().remove_target(txn, target);
        REQUIRE(targets.get_target_count(txn) == 0);
    });
    REQUIRE(!f.contains("rooms/a"));
    REQUIRE(f.contains("rooms/b"));

    {
        INFO("Dropping the pin lets the next transaction collect it.");
        f.pins.remove_reference(make_key("rooms/b"), 3);
        run_sync(*f.persistence, "release", [&](auto& txn) {
            f.persistence->get_reference_delegate().remove_reference(
                txn, make_key("rooms/b"));
        });
        REQUIRE(!f.contains("rooms/b"));
    }
}

TEST_CASE("eager collection of limbo documents", "[local][eager_gc]")
{
    eager_fixture f;
    f.add_documents({"rooms/a", "rooms/b"});
    f.pins.add_reference(make_key("rooms/b"), 1);

    run_sync(*f.persistence, "resolve limbo", [&](auto& txn) {
        auto& delegate = f.persistence->get_reference_delegate();
        delegate.update_limbo_document(txn, make_key("rooms/a"));
        delegate.update_limbo_document(txn, make_key("rooms/b"));
    });
    REQUIRE(!f.contains("rooms/a"));
    REQUIRE(f.contains("rooms/b"));
}

TEST_CASE("eager delegate transaction scoping", "[local][eager_gc]")
{
    eager_fixture f;
    auto& delegate = f.persistence->get_reference_delegate();
    auto key = make_key("rooms/a");

    {
        INFO("Orphans can't be recorded outside of a transaction.");
        memory_transaction stray(42);
        REQUIRE_THROWS_AS(
            delegate.remove_reference(stray, key), internal_check_failed);
    }

    {
        INFO("Orphans can't be recorded from the wrong transaction.");
        memory_transaction stray(42);
        REQUIRE_THROWS_AS(
            run_sync(
                *f.persistence,
                "mixed",
                [&](auto& txn) { delegate.add_reference(stray, key); }),
            internal_check_failed);
    }

    {
        INFO("Collection requires the in-memory pins.");
        auto persistence = make_eager_memory_persistence();
        REQUIRE_THROWS_AS(
            run_sync(
                *persistence,
                "no pins",
                [&](auto& txn) {
                    persistence->get_reference_delegate().remove_reference(
                        txn, key);
                }),
            internal_check_failed);
    }
}

TEST_CASE("eager reachability check order", "[local][eager_gc]")
{
    eager_fixture f;
    f.add_documents({"rooms/a"});
    auto key = make_key("rooms/a");
    auto& targets = f.persistence->get_target_cache();
    auto& queue = f.persistence->get_mutation_queue(make_user("alice"));

    run_sync(*f.persistence, "listen", [&](auto& txn) {
        targets.add_target_data(
            txn, make_target(1, txn.current_sequence_number()));
        targets.add_matching_keys(txn, {key}, 1);
    });

    Mock<memory_mutation_queue> spy(queue);
    Spy(Method(spy, contains_key));

    {
        INFO("A document matched by a target never reaches the queues.");
        run_sync(*f.persistence, "touch", [&](auto& txn) {
            f.persistence->get_reference_delegate().remove_reference(txn, key);
        });
        REQUIRE(f.contains("rooms/a"));
        Verify(Method(spy, contains_key)).Never();
    }

    spy.ClearInvocationHistory();

    {
        INFO("The queues are asked before the in-memory pins.");
        f.pins.add_reference(key, 9);
        run_sync(*f.persistence, "unlisten", [&](auto& txn) {
            targets.remove_matching_keys(txn, {key}, 1);
        });
        REQUIRE(f.contains("rooms/a"));
        Verify(Method(spy, contains_key)).Once();
    }
}
