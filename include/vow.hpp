// Copyright (c) 2022 Mohammad Nejati, Klemens D. Morgenstern, Ricahrd Hodges
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#ifdef VOW_ASIO_STANDALONE
#include <asio/any_io_executor.hpp>
#include <asio/basic_waitable_timer.hpp>
#include <asio/execution_context.hpp>
#include <asio/post.hpp>
namespace vow
{
namespace net    = asio;
using error_code = std::error_code;
} // namespace vow
#else
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/basic_waitable_timer.hpp>
#include <boost/asio/execution_context.hpp>
#include <boost/asio/post.hpp>
namespace vow
{
namespace net    = boost::asio;
using error_code = boost::system::error_code;
} // namespace vow
#endif

namespace vow
{
enum class errc
{
    no_state = 1,
    no_sources,
    bad_result_access,
    timeout,
};
} // namespace vow

namespace std
{
template<>
struct is_error_code_enum<vow::errc> : true_type
{
};
} // namespace std

namespace vow
{
inline const std::error_category& vow_category()
{
    static const struct : std::error_category
    {
        const char* name() const noexcept override
        {
            return "vow";
        }

        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
                case errc::no_state:
                    return "No associated state";
                case errc::no_sources:
                    return "No source promises";
                case errc::bad_result_access:
                    return "Bad result access";
                case errc::timeout:
                    return "Timeout";
                default:
                    return "Unknown error";
            }
        }
    } category;

    return category;
}

inline std::error_code make_error_code(errc e)
{
    return { static_cast<int>(e), vow_category() };
}

class promise_error : public std::system_error
{
  public:
    using std::system_error::system_error;
};

/// Result of a bounded wait on a promise.
enum class wait_status
{
    ready,
    timeout,
};

template<typename T>
struct success_value
{
    T value;
};

template<typename E>
struct failure_value
{
    E error;
};

/// Creates a success tag convertible to any compatible result.
template<typename T>
success_value<std::decay_t<T>> ok(T&& value)
{
    return { std::forward<T>(value) };
}

/// Creates a failure tag convertible to any compatible result.
template<typename E>
failure_value<std::decay_t<E>> fail(E&& error)
{
    return { std::forward<E>(error) };
}

/// Holds either a value or an error
/**
 * The class template result is the payload of a resolved promise, it holds
 * either a value of type T (success) or an error of type E (failure).
 *
 * A result is built from the tags returned by ok() and fail():
 * @code
 * vow::result<int> r = vow::ok(42);
 * vow::result<int> e = vow::fail(vow::errc::timeout);
 * @endcode
 *
 * @tparam T The type of the value.
 *
 * @tparam E The type of the error.
 */
template<typename T, typename E = std::error_code>
class result
{
    std::variant<T, E> storage_;

  public:
    using value_type = T;
    using error_type = E;

    template<
        typename U,
        typename std::enable_if_t<std::is_constructible_v<T, U&&>>* = nullptr>
    result(success_value<U> success)
        : storage_{ std::in_place_index<0>, std::move(success.value) }
    {
    }

    template<
        typename G,
        typename std::enable_if_t<std::is_constructible_v<E, G&&>>* = nullptr>
    result(failure_value<G> failure)
        : storage_{ std::in_place_index<1>, std::move(failure.error) }
    {
    }

    [[nodiscard]] bool is_success() const noexcept
    {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool is_failure() const noexcept
    {
        return storage_.index() == 1;
    }

    /// Returns the value.
    /**
     * @throws `promise_error{ errc::bad_result_access }` Thrown if the result
     * holds an error.
     */
    const T& value() const&
    {
        if (!is_success())
            throw promise_error{ errc::bad_result_access };

        return std::get<0>(storage_);
    }

    T& value() &
    {
        if (!is_success())
            throw promise_error{ errc::bad_result_access };

        return std::get<0>(storage_);
    }

    T&& value() &&
    {
        if (!is_success())
            throw promise_error{ errc::bad_result_access };

        return std::get<0>(std::move(storage_));
    }

    /// Returns the error.
    /**
     * @throws `promise_error{ errc::bad_result_access }` Thrown if the result
     * holds a value.
     */
    const E& error() const
    {
        if (!is_failure())
            throw promise_error{ errc::bad_result_access };

        return std::get<1>(storage_);
    }

    template<typename Handler>
    const result& on_success(Handler&& handler) const
    {
        if (is_success())
            std::forward<Handler>(handler)(std::get<0>(storage_));

        return *this;
    }

    template<typename Handler>
    const result& on_failure(Handler&& handler) const
    {
        if (is_failure())
            std::forward<Handler>(handler)(std::get<1>(storage_));

        return *this;
    }

    friend bool operator==(const result& lhs, const result& rhs)
    {
        return lhs.storage_ == rhs.storage_;
    }

    friend bool operator!=(const result& lhs, const result& rhs)
    {
        return !(lhs == rhs);
    }
};

/// An immutable duration used for scheduling delays and bounded waits.
/**
 * Any std::chrono::duration converts to a timeout. Fractions of a millisecond
 * round up, negative durations clamp to zero and durations beyond
 * `std::chrono::milliseconds::max()` saturate to it.
 */
class timeout
{
    std::chrono::milliseconds duration_;

    template<typename Rep, typename Period>
    static constexpr std::chrono::milliseconds saturate(
        std::chrono::duration<Rep, Period> value) noexcept
    {
        using bound_type = std::chrono::duration<long double, std::milli>;

        if (value <= value.zero())
            return std::chrono::milliseconds::zero();

        if (std::chrono::duration_cast<bound_type>(value) >=
            bound_type{ std::chrono::milliseconds::max() })
            return std::chrono::milliseconds::max();

        return std::chrono::ceil<std::chrono::milliseconds>(value);
    }

  public:
    template<typename Rep, typename Period>
    constexpr timeout(std::chrono::duration<Rep, Period> value) noexcept
        : duration_{ saturate(value) }
    {
    }

    [[nodiscard]] constexpr std::chrono::milliseconds duration() const noexcept
    {
        return duration_;
    }

    [[nodiscard]] constexpr std::int64_t millis() const noexcept
    {
        return duration_.count();
    }

    friend constexpr bool operator==(timeout lhs, timeout rhs) noexcept
    {
        return lhs.duration_ == rhs.duration_;
    }

    friend constexpr bool operator!=(timeout lhs, timeout rhs) noexcept
    {
        return lhs.duration_ != rhs.duration_;
    }

    friend constexpr bool operator<(timeout lhs, timeout rhs) noexcept
    {
        return lhs.duration_ < rhs.duration_;
    }

    friend constexpr bool operator>(timeout lhs, timeout rhs) noexcept
    {
        return rhs < lhs;
    }

    friend constexpr bool operator<=(timeout lhs, timeout rhs) noexcept
    {
        return !(rhs < lhs);
    }

    friend constexpr bool operator>=(timeout lhs, timeout rhs) noexcept
    {
        return !(lhs < rhs);
    }
};

/// Runs tasks off the caller's thread on an executor
/**
 * A task_scheduler submits zero-argument tasks to its executor, either right
 * away or after a minimum delay. It provides no ordering between independent
 * submissions and no cancellation handle.
 *
 * @tparam Executor The type of executor the tasks run on.
 */
template<typename Executor = net::any_io_executor>
class task_scheduler
{
    using timer_type = net::basic_waitable_timer<
        std::chrono::steady_clock,
        net::wait_traits<std::chrono::steady_clock>,
        Executor>;

    Executor executor_;

  public:
    explicit task_scheduler(Executor executor)
        : executor_{ std::move(executor) }
    {
    }

    [[nodiscard]] Executor get_executor() const
    {
        return executor_;
    }

    /// Submits a task for execution on the executor.
    template<typename Task>
    void submit(Task&& task) const
    {
        net::post(executor_, std::forward<Task>(task));
    }

    /// Submits a task that runs no earlier than delay from now.
    /**
     * The task is dropped if the timer completes with an error, which only
     * happens when the execution context shuts down before the delay elapses.
     */
    template<typename Task>
    void submit(timeout delay, Task&& task) const
    {
        auto timer = std::make_shared<timer_type>(executor_, delay.duration());
        timer->async_wait(
            [timer, task = std::forward<Task>(task)](const error_code& ec) mutable
            {
                if (!ec)
                    task();
            });
    }
};

template<typename T, typename E, typename Executor>
class promise;

namespace detail
{
template<typename T>
struct type_identity
{
    using type = T;
};

template<typename T>
using type_identity_t = typename type_identity<T>::type;

template<typename T>
struct is_promise : std::false_type
{
};

template<typename T, typename E, typename Executor>
struct is_promise<promise<T, E, Executor>> : std::true_type
{
};

struct continuation_link
{
    continuation_link* next_{ nullptr };
};

template<typename Result>
struct continuation : continuation_link
{
    virtual void invoke(const Result& result) = 0;
    virtual ~continuation()                   = default;
};

template<typename Result, typename Handler>
class continuation_model final : public continuation<Result>
{
    Handler handler_;

  public:
    explicit continuation_model(Handler handler)
        : handler_(std::move(handler))
    {
    }

    void invoke(const Result& result) override
    {
        handler_(result);
    }
};

struct wait_latch
{
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_{ false };
};

template<typename T, typename E, typename Executor>
class shared_state final
{
  public:
    using result_type = result<T, E>;

  private:
    enum class phase : unsigned char
    {
        pending,
        resolving,
        resolved,
    };

    using node_type = continuation<result_type>;

    task_scheduler<Executor> scheduler_;
    std::atomic<phase> phase_{ phase::pending };
    std::optional<result_type> value_;
    // Once head_ points at closed_ the value is published and the list is
    // owned by the resolving thread.
    continuation_link closed_;
    std::atomic<continuation_link*> head_{ nullptr };

  public:
    explicit shared_state(Executor executor)
        : scheduler_{ std::move(executor) }
    {
    }

    shared_state(const shared_state&)            = delete;
    shared_state& operator=(const shared_state&) = delete;

    shared_state(shared_state&&)            = delete;
    shared_state& operator=(shared_state&&) = delete;

    [[nodiscard]] const task_scheduler<Executor>& scheduler() const noexcept
    {
        return scheduler_;
    }

    [[nodiscard]] bool is_resolved() const noexcept
    {
        return phase_.load(std::memory_order_acquire) == phase::resolved;
    }

    [[nodiscard]] std::optional<result_type> value() const
    {
        if (!is_resolved())
            return std::nullopt;

        return value_;
    }

    bool resolve(result_type result)
    {
        auto expected = phase::pending;
        if (!phase_.compare_exchange_strong(
                expected,
                phase::resolving,
                std::memory_order_acq_rel,
                std::memory_order_relaxed))
            return false;

        value_.emplace(std::move(result));
        phase_.store(phase::resolved, std::memory_order_release);

        complete_all(head_.exchange(&closed_, std::memory_order_acq_rel));
        return true;
    }

    template<typename Handler>
    void subscribe(Handler&& handler)
    {
        if (is_resolved())
        {
            handler(*value_);
            return;
        }

        using model_type =
            continuation_model<result_type, std::decay_t<Handler>>;
        auto model =
            std::make_unique<model_type>(std::forward<Handler>(handler));

        auto* head = head_.load(std::memory_order_acquire);
        do
        {
            if (head == &closed_)
            {
                model->invoke(*value_);
                return;
            }
            model->next_ = head;
        } while (!head_.compare_exchange_weak(
            head,
            model.get(),
            std::memory_order_release,
            std::memory_order_acquire));

        model.release();
    }

    bool wait(const std::optional<timeout>& limit)
    {
        if (is_resolved())
            return true;

        auto latch = std::make_shared<wait_latch>();
        subscribe(
            [latch](const result_type&)
            {
                {
                    auto lg      = std::lock_guard{ latch->mutex_ };
                    latch->done_ = true;
                }
                latch->cv_.notify_all();
            });

        auto lk = std::unique_lock{ latch->mutex_ };
        if (!limit)
        {
            latch->cv_.wait(lk, [&] { return latch->done_; });
            return true;
        }

        // Limits past the end of the steady clock wait unbounded.
        auto now       = std::chrono::steady_clock::now();
        auto remaining = std::chrono::floor<std::chrono::milliseconds>(
            std::chrono::steady_clock::time_point::max() - now);
        if (limit->duration() >= remaining)
        {
            latch->cv_.wait(lk, [&] { return latch->done_; });
            return true;
        }

        return latch->cv_.wait_until(
            lk, now + limit->duration(), [&] { return latch->done_; });
    }

    ~shared_state()
    {
        auto* nx = head_.load(std::memory_order_acquire);
        if (nx == &closed_)
            return;

        while (nx)
        {
            auto* nnx = nx->next_;
            delete static_cast<node_type*>(nx);
            nx = nnx;
        }
    }

  private:
    void complete_all(continuation_link* list)
    {
        // The list was pushed front-first, reverse it into registration order.
        continuation_link* ordered = nullptr;
        while (list)
        {
            auto* nx    = list->next_;
            list->next_ = ordered;
            ordered     = list;
            list        = nx;
        }

        auto first_exception = std::exception_ptr{};
        while (ordered)
        {
            auto node = std::unique_ptr<node_type>{
                static_cast<node_type*>(ordered)
            };
            ordered = node->next_;

            try
            {
                node->invoke(*value_);
            }
            catch (...)
            {
                if (!first_exception)
                    first_exception = std::current_exception();
            }
        }

        if (first_exception)
            std::rethrow_exception(first_exception);
    }
};
} // namespace detail

/// A single-resolution value cell with continuation support
/**
 * The class template promise holds a shared state that is resolved at most
 * once with a result<T, E>. The first call to resolve(), ok() or fail()
 * wins; every later call, from any thread, is a no-op.
 *
 * Continuations registered with then(), on_success() or on_failure() run
 * exactly once. Those registered while the promise is pending run on the
 * thread that resolves it, in registration order; those registered after
 * resolution run immediately on the registering thread.
 *
 * A promise is a cheap handle, copies refer to the same shared state.
 *
 * @tparam T The type of the value.
 *
 * @tparam E The type of the error.
 *
 * @tparam Executor The type of executor used for asynchronous tasks and
 * timeouts.
 */
template<
    typename T,
    typename E        = std::error_code,
    typename Executor = net::any_io_executor>
class promise
{
    std::shared_ptr<detail::shared_state<T, E, Executor>> shared_state_;

  public:
    using value_type    = T;
    using error_type    = E;
    using executor_type = Executor;
    using result_type   = result<T, E>;

    /// Default constructor.
    /**
     * This constructor creates a promise with an empty shared state.
     */
    promise() = default;

    /// Constructor.
    /**
     * @param executor The executor that asynchronous tasks and timeouts of
     * this promise are submitted to.
     */
    explicit promise(Executor executor)
        : shared_state_{
            std::make_shared<detail::shared_state<T, E, Executor>>(
                std::move(executor))
        }
    {
    }

    /// Constructor.
    /**
     * @param context An execution context that provides the executor that
     * asynchronous tasks and timeouts of this promise are submitted to.
     */
    template<
        typename ExecutionContext,
        typename std::enable_if_t<std::is_convertible_v<
            ExecutionContext&,
            net::execution_context&>>* = nullptr>
    explicit promise(ExecutionContext& context)
        : promise{ Executor{ context.get_executor() } }
    {
    }

    /// Constructor.
    /**
     * This constructor creates an already resolved promise, continuations
     * registered on it run immediately.
     *
     * @param executor The executor that asynchronous tasks and timeouts of
     * this promise are submitted to.
     *
     * @param result The result the promise is resolved with.
     */
    promise(Executor executor, result_type result)
        : promise{ std::move(executor) }
    {
        shared_state_->resolve(std::move(result));
    }

    /// Constructor.
    /**
     * @param context An execution context that provides the executor.
     *
     * @param result The result the promise is resolved with.
     */
    template<
        typename ExecutionContext,
        typename std::enable_if_t<std::is_convertible_v<
            ExecutionContext&,
            net::execution_context&>>* = nullptr>
    promise(ExecutionContext& context, result_type result)
        : promise{ Executor{ context.get_executor() }, std::move(result) }
    {
    }

    /// Gets the executor associated with the object.
    /**
     * @throws `promise_error{ errc::no_state }` Thrown if the promise does not
     * contain a shared state.
     */
    [[nodiscard]] Executor get_executor() const
    {
        return state().scheduler().get_executor();
    }

    /// Checks if the promise contains a shared state.
    [[nodiscard]] bool is_valid() const noexcept
    {
        return !!shared_state_;
    }

    /// Checks if the promise is resolved, never blocks.
    /**
     * @throws `promise_error{ errc::no_state }` Thrown if the promise does not
     * contain a shared state.
     */
    [[nodiscard]] bool is_resolved() const
    {
        return state().is_resolved();
    }

    /// Returns the result if the promise is resolved, never blocks.
    /**
     * @returns an empty optional while the promise is pending, the result it
     * was resolved with otherwise.
     *
     * @throws `promise_error{ errc::no_state }` Thrown if the promise does not
     * contain a shared state.
     */
    [[nodiscard]] std::optional<result_type> value() const
    {
        return state().value();
    }

    /// Resolves the promise.
    /**
     * Only the first call resolves the promise and runs the pending
     * continuations on the calling thread. Later calls have no effect.
     *
     * @throws `promise_error{ errc::no_state }` Thrown if the promise does not
     * contain a shared state.
     *
     * @throws the first exception thrown by a pending continuation, after all
     * pending continuations have run. A promise derived by map() or
     * chain_map() whose transform or bind threw stays pending.
     */
    promise& resolve(result_type result)
    {
        state().resolve(std::move(result));
        return *this;
    }

    /// Resolves the promise with a value, see resolve().
    promise& ok(T value)
    {
        return resolve(vow::ok(std::move(value)));
    }

    /// Resolves the promise with an error, see resolve().
    promise& fail(E error)
    {
        return resolve(vow::fail(std::move(error)));
    }

    /// Registers a continuation.
    /**
     * The handler is invoked exactly once with the result. If the promise is
     * resolved it runs immediately on the calling thread, otherwise it runs on
     * the thread that resolves the promise after every continuation
     * registered before it.
     *
     * @param handler A callable with the signature `void(const result<T, E>&)`.
     *
     * @throws `promise_error{ errc::no_state }` Thrown if the promise does not
     * contain a shared state.
     */
    template<typename Handler>
    promise& then(Handler&& handler)
    {
        state().subscribe(std::forward<Handler>(handler));
        return *this;
    }

    /// Registers a continuation invoked only with the value of a success.
    template<typename Handler>
    promise& on_success(Handler&& handler)
    {
        return then(
            [handler = std::forward<Handler>(handler)](
                const result_type& result) mutable
            {
                if (result.is_success())
                    handler(result.value());
            });
    }

    /// Registers a continuation invoked only with the error of a failure.
    template<typename Handler>
    promise& on_failure(Handler&& handler)
    {
        return then(
            [handler = std::forward<Handler>(handler)](
                const result_type& result) mutable
            {
                if (result.is_failure())
                    handler(result.error());
            });
    }

    /// Creates a promise resolved with the transformed value.
    /**
     * On success the returned promise resolves with `transform(value)`. On
     * failure it resolves with the same error and transform is never invoked.
     * If transform throws, the exception propagates to the thread resolving
     * this promise and the returned promise is never resolved.
     *
     * @param transform A callable with the signature `U(const T&)`.
     */
    template<typename Transform>
    auto map(Transform&& transform)
    {
        using mapped_type =
            std::decay_t<std::invoke_result_t<Transform&, const T&>>;
        static_assert(
            !std::is_void_v<mapped_type>, "map requires a value returning transform");

        auto derived = promise<mapped_type, E, Executor>{ get_executor() };
        then(
            [derived, transform = std::forward<Transform>(transform)](
                const result_type& result) mutable
            {
                if (result.is_success())
                    derived.resolve(vow::ok(transform(result.value())));
                else
                    derived.resolve(vow::fail(result.error()));
            });

        return derived;
    }

    /// Creates a promise resolved by a promise produced from the value.
    /**
     * On success `bind(value)` is invoked and the returned promise resolves
     * with whatever the produced promise resolves with. On failure bind is
     * never invoked and the returned promise resolves with the same error.
     * If bind throws, the exception propagates to the thread resolving this
     * promise and the returned promise is never resolved.
     *
     * @param bind A callable with the signature
     * `promise<U, E, Ex>(const T&)`.
     */
    template<typename Bind>
    auto chain_map(Bind&& bind)
    {
        using bound_type = std::decay_t<std::invoke_result_t<Bind&, const T&>>;
        static_assert(
            detail::is_promise<bound_type>::value,
            "chain_map requires a promise returning function");
        static_assert(
            std::is_same_v<typename bound_type::error_type, E>,
            "chain_map requires a promise with the same error type");
        using chained_type = typename bound_type::value_type;

        auto derived = promise<chained_type, E, Executor>{ get_executor() };
        then(
            [derived, bind = std::forward<Bind>(bind)](
                const result_type& result) mutable
            {
                if (result.is_failure())
                {
                    derived.resolve(vow::fail(result.error()));
                    return;
                }

                auto bound = bind(result.value());
                bound.then([derived](const auto& chained) mutable
                           { derived.resolve(chained); });
            });

        return derived;
    }

    /// Runs a task on the executor.
    /**
     * This function submits `task(promise&)` to the executor and returns
     * immediately, the task typically resolves the promise.
     */
    template<typename Task>
    promise& async(Task&& task)
    {
        state().scheduler().submit(
            [self = *this, task = std::forward<Task>(task)]() mutable
            { task(self); });
        return *this;
    }

    /// Runs a task on the executor no earlier than delay from now.
    template<typename Task>
    promise& async(timeout delay, Task&& task)
    {
        state().scheduler().submit(
            delay,
            [self = *this, task = std::forward<Task>(task)]() mutable
            { task(self); });
        return *this;
    }

    /// Resolves the promise from the executor, see resolve().
    promise& resolve_async(result_type result)
    {
        return async(
            [result = std::move(result)](promise& self) mutable
            { self.resolve(std::move(result)); });
    }

    promise& async_ok(T value)
    {
        return resolve_async(vow::ok(std::move(value)));
    }

    promise& async_fail(E error)
    {
        return resolve_async(vow::fail(std::move(error)));
    }

    /// Resolves the promise with a fallback once delay elapses.
    /**
     * If the promise is resolved before the delay elapses the fallback has no
     * effect. The scheduled task is not cancelled either way.
     */
    promise& when(timeout delay, result_type fallback)
    {
        return async(
            delay,
            [fallback = std::move(fallback)](promise& self) mutable
            { self.resolve(std::move(fallback)); });
    }

    /// Blocks until the promise is resolved.
    promise& sync_wait()
    {
        state().wait(std::nullopt);
        return *this;
    }

    /// Blocks until the promise is resolved or the limit elapses.
    /**
     * The wait does not affect the promise, callers check is_resolved() or
     * value() afterwards.
     */
    promise& sync_wait(timeout limit)
    {
        wait_for(limit);
        return *this;
    }

    /// Blocks until the promise is resolved or the limit elapses.
    /**
     * Every wait that times out leaves a small continuation queued on the
     * promise until it is resolved, so polling a long pending promise in a
     * loop grows its queue with each iteration.
     *
     * @returns `wait_status::ready` if the promise was resolved within the
     * limit, `wait_status::timeout` otherwise.
     */
    wait_status wait_for(timeout limit)
    {
        return state().wait(limit) ? wait_status::ready : wait_status::timeout;
    }

  private:
    detail::shared_state<T, E, Executor>& state() const
    {
        if (!shared_state_)
            throw promise_error{ errc::no_state };

        return *shared_state_;
    }
};

namespace detail
{
template<typename E, typename Executor, typename... Ts>
struct all_state
{
    promise<std::tuple<Ts...>, E, Executor> derived_;
    std::tuple<std::optional<Ts>...> values_;
    std::atomic<std::size_t> remaining_{ sizeof...(Ts) };

    explicit all_state(Executor executor)
        : derived_{ std::move(executor) }
    {
    }

    template<std::size_t... I>
    std::tuple<Ts...> take(std::index_sequence<I...>)
    {
        return std::tuple<Ts...>{ std::move(*std::get<I>(values_))... };
    }
};

template<std::size_t I, typename State, typename Source>
void subscribe_slot(const std::shared_ptr<State>& state, Source& source)
{
    source.then(
        [state](const typename Source::result_type& result)
        {
            if (result.is_failure())
            {
                state->derived_.resolve(vow::fail(result.error()));
                return;
            }

            std::get<I>(state->values_).emplace(result.value());
            if (state->remaining_.fetch_sub(1, std::memory_order_acq_rel) == 1)
                state->derived_.resolve(vow::ok(state->take(
                    std::make_index_sequence<
                        std::tuple_size_v<decltype(state->values_)>>{})));
        });
}

template<typename State, std::size_t... I, typename... Sources>
void subscribe_all(
    const std::shared_ptr<State>& state,
    std::index_sequence<I...>,
    Sources&... sources)
{
    (subscribe_slot<I>(state, sources), ...);
}

template<typename T, typename E, typename Executor>
struct all_range_state
{
    promise<std::vector<T>, E, Executor> derived_;
    std::vector<std::optional<T>> values_;
    std::atomic<std::size_t> remaining_;

    all_range_state(Executor executor, std::size_t size)
        : derived_{ std::move(executor) }
        , values_(size)
        , remaining_{ size }
    {
    }

    std::vector<T> take()
    {
        auto values = std::vector<T>{};
        values.reserve(values_.size());
        for (auto& v : values_)
            values.push_back(std::move(*v));
        return values;
    }
};

template<typename T, typename E, typename Executor>
struct any_success_state
{
    promise<T, E, Executor> derived_;
    std::atomic<std::size_t> remaining_;

    any_success_state(Executor executor, std::size_t size)
        : derived_{ std::move(executor) }
        , remaining_{ size }
    {
    }
};
} // namespace detail

/// Combines promises into a promise of all their values
/**
 * The returned promise resolves with a tuple of the values, in argument
 * order, once every source succeeds. It fails with the first error observed
 * without waiting on the remaining sources.
 *
 * The returned promise uses the executor of the first source.
 */
template<typename T, typename E, typename Executor, typename... Ts>
promise<std::tuple<T, Ts...>, E, Executor> all(
    promise<T, E, Executor> first,
    promise<Ts, E, Executor>... rest)
{
    using state_type = detail::all_state<E, Executor, T, Ts...>;

    auto state = std::make_shared<state_type>(first.get_executor());
    auto derived = state->derived_;
    detail::subscribe_all(
        state, std::index_sequence_for<T, Ts...>{}, first, rest...);

    return derived;
}

/// Combines a range of promises into a promise of all their values
/**
 * Like the variadic overload, an empty range resolves immediately with an
 * empty vector.
 *
 * @param executor The executor of the returned promise.
 *
 * @param sources The promises to combine.
 */
template<typename T, typename E, typename Executor>
promise<std::vector<T>, E, Executor> all(
    detail::type_identity_t<Executor> executor,
    const std::vector<promise<T, E, Executor>>& sources)
{
    using state_type = detail::all_range_state<T, E, Executor>;

    auto state =
        std::make_shared<state_type>(std::move(executor), sources.size());
    auto derived = state->derived_;

    if (sources.empty())
    {
        derived.ok({});
        return derived;
    }

    for (auto i = std::size_t{}; i < sources.size(); i++)
    {
        auto source = sources[i];
        source.then(
            [state, i](const result<T, E>& result)
            {
                if (result.is_failure())
                {
                    state->derived_.resolve(vow::fail(result.error()));
                    return;
                }

                state->values_[i].emplace(result.value());
                if (state->remaining_.fetch_sub(1, std::memory_order_acq_rel) ==
                    1)
                    state->derived_.resolve(vow::ok(state->take()));
            });
    }

    return derived;
}

/// Creates a promise resolved with the first result of a range of promises
/**
 * The returned promise resolves with whatever the first source to resolve is
 * resolved with, success or failure. Later results are ignored.
 *
 * @throws `promise_error{ errc::no_sources }` Thrown if sources is empty.
 */
template<typename T, typename E, typename Executor>
promise<T, E, Executor> any(
    detail::type_identity_t<Executor> executor,
    const std::vector<promise<T, E, Executor>>& sources)
{
    if (sources.empty())
        throw promise_error{ errc::no_sources };

    auto derived = promise<T, E, Executor>{ std::move(executor) };
    for (auto source : sources)
        source.then([derived](const result<T, E>& result) mutable
                    { derived.resolve(result); });

    return derived;
}

/// Creates a promise resolved with the first result of its sources.
template<typename T, typename E, typename Executor, typename... Rest>
promise<T, E, Executor> any(promise<T, E, Executor> first, Rest... rest)
{
    static_assert(
        (std::is_same_v<Rest, promise<T, E, Executor>> && ...),
        "any requires promises of the same type");

    auto executor = first.get_executor();
    return any(
        std::move(executor),
        std::vector<promise<T, E, Executor>>{ std::move(first), rest... });
}

/// Creates a promise resolved with the first success of a range of promises
/**
 * Failures of individual sources are ignored while another source may still
 * succeed. If every source fails the returned promise resolves with the
 * failure of the last source to fail.
 *
 * @throws `promise_error{ errc::no_sources }` Thrown if sources is empty.
 */
template<typename T, typename E, typename Executor>
promise<T, E, Executor> any_success(
    detail::type_identity_t<Executor> executor,
    const std::vector<promise<T, E, Executor>>& sources)
{
    using state_type = detail::any_success_state<T, E, Executor>;

    if (sources.empty())
        throw promise_error{ errc::no_sources };

    auto state =
        std::make_shared<state_type>(std::move(executor), sources.size());
    auto derived = state->derived_;

    for (auto source : sources)
    {
        source.then(
            [state](const result<T, E>& result)
            {
                if (result.is_success() ||
                    state->remaining_.fetch_sub(1, std::memory_order_acq_rel) ==
                        1)
                    state->derived_.resolve(result);
            });
    }

    return derived;
}

/// Creates a promise resolved with the first success of its sources.
template<typename T, typename E, typename Executor, typename... Rest>
promise<T, E, Executor> any_success(promise<T, E, Executor> first, Rest... rest)
{
    static_assert(
        (std::is_same_v<Rest, promise<T, E, Executor>> && ...),
        "any_success requires promises of the same type");

    auto executor = first.get_executor();
    return any_success(
        std::move(executor),
        std::vector<promise<T, E, Executor>>{ std::move(first), rest... });
}
} // namespace vow
