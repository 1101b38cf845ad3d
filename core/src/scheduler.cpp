#include "ipcwire/scheduler.hpp"

#include <utility>

#include <asio/post.hpp>
#include <spdlog/spdlog.h>

namespace ipcwire
{

    Scheduler::Scheduler(asio::io_context &io_context)
        : io_context_(io_context)
    {
    }

    void Scheduler::spawn(Job<void> job, std::string name)
    {
        auto task = std::make_shared<Task>(Task{std::move(job), std::move(name)});
        ++active_;
        spdlog::trace("Spawned job '{}' ({} active)", task->name, active_);
        asio::post(io_context_, [this, task]
                   { resume(task); });
    }

    void Scheduler::set_failure_handler(FailureHandler handler)
    {
        on_failure_ = std::move(handler);
    }

    void Scheduler::resume(std::shared_ptr<Task> task)
    {
        bool pending = false;
        try
        {
            pending = task->job.step();
        }
        catch (const std::exception &ex)
        {
            fail(*task, ex.what(), std::current_exception());
            return;
        }
        catch (...)
        {
            fail(*task, "non-standard exception", std::current_exception());
            return;
        }

        if (pending)
        {
            asio::post(io_context_, [this, task = std::move(task)]
                       { resume(task); });
            return;
        }
        --active_;
        spdlog::trace("Job '{}' finished ({} active)", task->name, active_);
    }

    void Scheduler::fail(const Task &task, const char *what, std::exception_ptr error)
    {
        --active_;
        spdlog::error("Job '{}' failed: {}", task.name, what);
        if (on_failure_)
        {
            on_failure_(task.name, std::move(error));
        }
    }

} // namespace ipcwire
