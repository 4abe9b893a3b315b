#ifndef TETHER_LOCAL_MEMORY_PERSISTENCE_HPP
#define TETHER_LOCAL_MEMORY_PERSISTENCE_HPP

#include <functional>
#include <map>
#include <memory>
#include <type_traits>

#include <cppcoro/task.hpp>

#include <tether/model/listen_sequence.hpp>
#include <tether/local/memory_mutation_queue.hpp>
#include <tether/local/memory_remote_document_cache.hpp>
#include <tether/local/memory_target_cache.hpp>
#include <tether/local/persistence.hpp>
#include <tether/model/user.hpp>

// Memory persistence keeps all local state in RAM. Nothing survives the
// process, and transactions are only a bracketing mechanism (there's no
// rollback), but the persistence layer still drives the reference delegate
// through the same lifecycle that a durable implementation would, so
// garbage collection behaves the same way.

namespace tether {

// Memory transactions aren't actually transactional. They just carry the
// sequence number that was assigned to them.
struct memory_transaction : persistence_transaction
{
    explicit memory_transaction(listen_sequence_number sequence_number)
        : sequence_number_(sequence_number)
    {
    }

    listen_sequence_number
    current_sequence_number() const override
    {
        return sequence_number_;
    }

 private:
    listen_sequence_number sequence_number_;
};

struct memory_persistence : noncopyable
{
    typedef std::function<std::unique_ptr<memory_reference_delegate>(
        memory_persistence&)>
        delegate_factory;

    // The delegate is created (via :make_delegate) before any of the caches,
    // so the delegate and the persistence layer can hold references to each
    // other without either ever being unset. The delegate must not call back
    // into the persistence layer from its constructor.
    explicit memory_persistence(delegate_factory const& make_delegate);

    ~memory_persistence();

    bool
    started() const
    {
        return started_;
    }

    // There's no durable state to close, so this just marks the persistence
    // layer as stopped.
    void
    shutdown();

    memory_reference_delegate&
    get_reference_delegate()
    {
        return *reference_delegate_;
    }

    memory_target_cache&
    get_target_cache()
    {
        return *target_cache_;
    }

    memory_remote_document_cache&
    get_remote_document_cache()
    {
        return *remote_document_cache_;
    }

    // Get the mutation queue for :u, creating it if necessary.
    // Queues are never removed once created.
    memory_mutation_queue&
    get_mutation_queue(user const& u);

    size_t
    mutation_queue_count() const
    {
        return mutation_queues_.size();
    }

    // Does the mutation queue of any user contain a pending write to :key?
    // Queues are consulted in the order they were created, stopping at the
    // first one that does.
    bool
    mutation_queues_contain_key(
        persistence_transaction& txn, document_key const& key);

    // Run :operation as a transaction.
    //
    // :operation is invoked with the transaction and must return a
    // cppcoro::task<Result>. Once it completes, the delegate's commit hook
    // runs to completion, and then the transaction's committed listeners are
    // invoked before the result is returned.
    //
    // If :operation throws, the exception propagates and the commit hook
    // doesn't run. Since memory persistence can't roll back, any writes that
    // the operation already made remain.
    //
    // Transactions must not be started from within another transaction's
    // commit hook.
    //
    template<class Result, class Operation>
    cppcoro::task<Result>
    run_transaction(string action, transaction_mode mode, Operation operation)
    {
        memory_transaction txn(begin_transaction(action, mode));
        reference_delegate_->on_transaction_started(txn);
        if constexpr (std::is_void_v<Result>)
        {
            co_await operation(txn);
            co_await reference_delegate_->on_transaction_committed(txn);
            txn.raise_on_committed_event();
        }
        else
        {
            Result result = co_await operation(txn);
            co_await reference_delegate_->on_transaction_committed(txn);
            txn.raise_on_committed_event();
            co_return result;
        }
    }

 private:
    // Log the start of a transaction and allocate its sequence number.
    // Throws internal_check_failed if the persistence layer has been shut
    // down.
    listen_sequence_number
    begin_transaction(string const& action, transaction_mode mode);

    bool started_ = false;

    listen_sequence sequence_{0};

    // This has to be declared before (and thus destroyed after) the caches,
    // since they hold references to it.
    std::unique_ptr<memory_reference_delegate> reference_delegate_;

    std::unique_ptr<memory_target_cache> target_cache_;

    std::unique_ptr<memory_remote_document_cache> remote_document_cache_;

    // mutation queues by user key
    std::map<string, std::unique_ptr<memory_mutation_queue>> mutation_queues_;
    // the same queues, in creation order
    std::vector<mutation_queue*> mutation_queue_order_;
};

// Create a memory persistence layer that deletes documents as soon as they
// lose their last reference.
std::unique_ptr<memory_persistence>
make_eager_memory_persistence();

// Create a memory persistence layer that records when documents lose their
// references and leaves their removal to an LRU collector.
std::unique_ptr<memory_persistence>
make_lru_memory_persistence();

} // namespace tether

#endif
