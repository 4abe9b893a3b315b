#ifndef TETHER_LOCAL_MEMORY_PERSISTENCE_PROVIDER_HPP
#define TETHER_LOCAL_MEMORY_PERSISTENCE_PROVIDER_HPP

#include <memory>

#include <tether/local/memory_persistence.hpp>
#include <tether/local/reference_set.hpp>

namespace tether {

struct persistence_settings
{
    // Should local data be stored durably (on disk)?
    // This build only supports memory persistence, so this must be false.
    bool durable = false;

    // the size that the cache should be kept under, in bytes - Only
    // meaningful for durable persistence, where an LRU collector runs.
    optional<integer> cache_size_bytes;
};

// the message that accompanies requests for durable persistence
extern char const* const memory_only_persistence_error_message;

// The memory_persistence_provider sets up memory persistence (with eager
// garbage collection) for a client.
//
// The default constructor creates an uninitialized provider. Until
// initialize() has been called successfully, asking it for the persistence
// layer or its pins is a bug and throws internal_check_failed.
//
struct memory_persistence_provider : noncopyable
{
    memory_persistence_provider();
    ~memory_persistence_provider();

    // Set up the persistence layer.
    // If :settings asks for durable persistence, this throws
    // failed_precondition (with memory_only_persistence_error_message)
    // before anything is created.
    void
    initialize(persistence_settings const& settings);

    bool
    is_initialized() const
    {
        return persistence_ ? true : false;
    }

    memory_persistence&
    get_persistence();

    // the pins held by in-memory listeners, which the persistence layer's
    // delegate borrows
    reference_set&
    get_in_memory_pins();

    // Eager collection happens synchronously at the end of each transaction,
    // so there's nothing to schedule. The returned scheduler only tracks
    // whether it has been started.
    garbage_collection_scheduler&
    get_garbage_collection_scheduler();

    // Clearing persisted data isn't supported by memory persistence.
    // This always throws failed_precondition.
    [[noreturn]] void
    clear_persistence();

    void
    shutdown();

 private:
    void
    check_initialized(char const* caller) const;

    std::unique_ptr<reference_set> in_memory_pins_;
    std::unique_ptr<memory_persistence> persistence_;
    std::unique_ptr<garbage_collection_scheduler> scheduler_;
};

} // namespace tether

#endif
