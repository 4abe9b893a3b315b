#include <tether/local/memory_persistence_provider.hpp>

#include <tether/core/errors.hpp>
#include <tether/core/logging.hpp>

namespace tether {

char const* const memory_only_persistence_error_message
    = "You are using the memory-only build of TETHER. Persistence support is "
      "only available in builds that include a durable storage backend.";

namespace {

struct null_garbage_collection_scheduler : garbage_collection_scheduler
{
    bool
    started() const override
    {
        return started_;
    }

    void
    start() override
    {
        started_ = true;
    }

    void
    stop() override
    {
        started_ = false;
    }

 private:
    bool started_ = false;
};

[[noreturn]] void
throw_memory_only_error()
{
    TETHER_THROW(
        failed_precondition() << internal_error_message_info(
            memory_only_persistence_error_message));
}

} // namespace

memory_persistence_provider::memory_persistence_provider()
    : scheduler_(new null_garbage_collection_scheduler)
{
}

memory_persistence_provider::~memory_persistence_provider()
{
}

void
memory_persistence_provider::initialize(persistence_settings const& settings)
{
    if (settings.durable)
        throw_memory_only_error();

    auto pins = std::make_unique<reference_set>();
    auto persistence = make_eager_memory_persistence();
    persistence->get_reference_delegate().set_in_memory_pins(pins.get());

    // The old persistence layer (if any) has to go before the pins it
    // borrows.
    persistence_ = std::move(persistence);
    in_memory_pins_ = std::move(pins);

    get_logger()->info("[memory_persistence] initialized (eager collection)");
}

void
memory_persistence_provider::check_initialized(char const* caller) const
{
    if (!persistence_)
    {
        TETHER_THROW(
            internal_check_failed() << internal_error_message_info(
                string(caller) + " called before initialize()"));
    }
}

memory_persistence&
memory_persistence_provider::get_persistence()
{
    check_initialized("get_persistence()");
    return *persistence_;
}

reference_set&
memory_persistence_provider::get_in_memory_pins()
{
    check_initialized("get_in_memory_pins()");
    return *in_memory_pins_;
}

garbage_collection_scheduler&
memory_persistence_provider::get_garbage_collection_scheduler()
{
    return *scheduler_;
}

void
memory_persistence_provider::clear_persistence()
{
    throw_memory_only_error();
}

void
memory_persistence_provider::shutdown()
{
    scheduler_->stop();
    if (persistence_)
        persistence_->shutdown();
}

} // namespace tether
