/**
 * ipcwire - Cooperative job runner on top of an asio::io_context.
 */
#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>

#include <asio/io_context.hpp>

#include "ipcwire/job.hpp"

namespace ipcwire
{

    /// Resumes each spawned job one checkpoint per posted handler, so jobs
    /// interleave on the io_context while each job's own steps stay ordered.
    /// Single-threaded: run the io_context from one thread only.
    class Scheduler
    {
    public:
        using FailureHandler = std::function<void(const std::string &name, std::exception_ptr error)>;

        explicit Scheduler(asio::io_context &io_context);

        void spawn(Job<void> job, std::string name = "job");

        void set_failure_handler(FailureHandler handler);

        std::size_t active_jobs() const noexcept { return active_; }

        asio::io_context &context() noexcept { return io_context_; }

    private:
        struct Task
        {
            Job<void> job;
            std::string name;
        };

        void resume(std::shared_ptr<Task> task);
        void fail(const Task &task, const char *what, std::exception_ptr error);

        asio::io_context &io_context_;
        FailureHandler on_failure_;
        std::size_t active_{0};
    };

} // namespace ipcwire
