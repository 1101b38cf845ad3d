/**
 * ipcwire - Cooperative jobs built on C++20 coroutines.
 *
 * A Job is a lazily started coroutine. `co_yield checkpoint;` marks a point where
 * the driver may interleave other work. `co_await child` runs a nested job whose
 * checkpoints surface to whoever drives the outermost job, so a deep serializer
 * tree still suspends at every unit it processes.
 */
#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace ipcwire
{

    struct Checkpoint
    {
    };

    inline constexpr Checkpoint checkpoint{};

    template <typename T = void>
    class Job;

    namespace detail
    {

        struct PromiseBase
        {
            // Outermost promise of the await chain; only its `leaf` is meaningful.
            PromiseBase *root{this};
            std::coroutine_handle<> leaf{};
            std::coroutine_handle<> continuation{};
            std::exception_ptr exception{};

            std::suspend_always initial_suspend() noexcept { return {}; }

            struct FinalAwaiter
            {
                bool await_ready() noexcept { return false; }

                template <typename Promise>
                std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept
                {
                    auto &promise = handle.promise();
                    if (promise.continuation)
                    {
                        promise.root->leaf = promise.continuation;
                        return promise.continuation;
                    }
                    return std::noop_coroutine();
                }

                void await_resume() noexcept {}
            };

            FinalAwaiter final_suspend() noexcept { return {}; }

            std::suspend_always yield_value(Checkpoint) noexcept { return {}; }

            void unhandled_exception() noexcept { exception = std::current_exception(); }
        };

        template <typename T>
        struct Promise : PromiseBase
        {
            std::optional<T> value;

            Job<T> get_return_object() noexcept;

            void return_value(T result) { value.emplace(std::move(result)); }
        };

        template <>
        struct Promise<void> : PromiseBase
        {
            Job<void> get_return_object() noexcept;

            void return_void() noexcept {}
        };

    } // namespace detail

    template <typename T>
    class [[nodiscard]] Job
    {
    public:
        using promise_type = detail::Promise<T>;
        using handle_type = std::coroutine_handle<promise_type>;

        explicit Job(handle_type handle) noexcept : handle_(handle) {}

        Job(Job &&other) noexcept : handle_(std::exchange(other.handle_, {})) {}

        Job &operator=(Job &&other) noexcept
        {
            if (this != &other)
            {
                reset();
                handle_ = std::exchange(other.handle_, {});
            }
            return *this;
        }

        Job(const Job &) = delete;
        Job &operator=(const Job &) = delete;

        ~Job() { reset(); }

        bool done() const noexcept { return !handle_ || handle_.done(); }

        /// Runs until the next checkpoint. Returns true while work remains.
        bool step()
        {
            if (done())
            {
                return false;
            }
            auto &promise = handle_.promise();
            if (!promise.leaf)
            {
                promise.leaf = handle_;
            }
            promise.leaf.resume();
            if (!handle_.done())
            {
                return true;
            }
            if (promise.exception)
            {
                std::rethrow_exception(promise.exception);
            }
            return false;
        }

        /// Drives the job to completion on the calling thread.
        T run()
        {
            while (step())
            {
            }
            if constexpr (!std::is_void_v<T>)
            {
                return std::move(*handle_.promise().value);
            }
        }

        struct Awaiter
        {
            handle_type child;

            bool await_ready() const noexcept { return child.done(); }

            template <typename ParentPromise>
            std::coroutine_handle<> await_suspend(std::coroutine_handle<ParentPromise> parent) noexcept
            {
                auto &child_promise = child.promise();
                auto &parent_promise = parent.promise();
                child_promise.continuation = parent;
                child_promise.root = parent_promise.root;
                parent_promise.root->leaf = child;
                return child;
            }

            T await_resume()
            {
                auto &promise = child.promise();
                if (promise.exception)
                {
                    std::rethrow_exception(promise.exception);
                }
                if constexpr (!std::is_void_v<T>)
                {
                    return std::move(*promise.value);
                }
            }
        };

        Awaiter operator co_await() && noexcept { return Awaiter{handle_}; }

    private:
        void reset() noexcept
        {
            if (handle_)
            {
                handle_.destroy();
                handle_ = {};
            }
        }

        handle_type handle_;
    };

    namespace detail
    {

        template <typename T>
        Job<T> Promise<T>::get_return_object() noexcept
        {
            return Job<T>(std::coroutine_handle<Promise<T>>::from_promise(*this));
        }

        inline Job<void> Promise<void>::get_return_object() noexcept
        {
            return Job<void>(std::coroutine_handle<Promise<void>>::from_promise(*this));
        }

    } // namespace detail

} // namespace ipcwire
