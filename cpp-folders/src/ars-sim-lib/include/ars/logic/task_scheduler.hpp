#pragma once

/*
    ARS SIM LIB

    FILE: task_scheduler.hpp
    MODULE: logic
    PURPOSE: Cancelable scheduled tasks driven by the simulation clock: one-shot timers and
            per-frame continuations. Replaces "call myself again later" recursion so a
            reset can drop every pending continuation deterministically.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace ars
{
    struct TaskHandle
    {
        uint64_t id = 0; // 0 = invalid
        constexpr bool valid() const { return id != 0; }
    };

    enum class TaskStatus : uint8_t
    {
        Done = 0,
        Continue = 1
    };

    // Due times are sums of fractional tick lengths; a timer landing on a tick
    // boundary still fires on that tick.
    inline constexpr double kTaskDueToleranceMs = 1e-6;

    class TaskScheduler
    {
    public:
        // Runs fn once, on the first advance() that reaches now + delay_ms.
        TaskHandle schedule_after(std::string name, double delay_ms, std::function<void()> fn)
        {
            if (!fn) return {};
            Task t{};
            t.id = next_id_++;
            t.name = std::move(name);
            t.per_frame = false;
            t.due_ms = now_ms_ + std::max(0.0, delay_ms);
            t.once = std::move(fn);
            tasks_.push_back(std::move(t));
            return TaskHandle{tasks_.back().id};
        }

        // Runs fn on every advance() starting with the next one, until it returns Done
        // or is cancelled.
        TaskHandle schedule_per_frame(std::string name, std::function<TaskStatus()> fn)
        {
            if (!fn) return {};
            Task t{};
            t.id = next_id_++;
            t.name = std::move(name);
            t.per_frame = true;
            t.due_ms = now_ms_;
            t.frame = std::move(fn);
            tasks_.push_back(std::move(t));
            return TaskHandle{tasks_.back().id};
        }

        // Cancels and clears the handle. Cancelling an unknown, finished or already
        // cancelled handle is a no-op that returns false.
        bool cancel(TaskHandle& h)
        {
            const TaskHandle target = h;
            h = TaskHandle{};
            if (!target.valid()) return false;
            const auto it = find(target.id);
            if (it == tasks_.end()) return false;
            tasks_.erase(it);
            return true;
        }

        void cancel_all()
        {
            tasks_.clear();
        }

        bool pending(TaskHandle h) const
        {
            if (!h.valid()) return false;
            return std::any_of(tasks_.begin(), tasks_.end(), [&](const Task& t) { return t.id == h.id; });
        }

        std::size_t pending_count() const
        {
            return tasks_.size();
        }

        std::vector<std::string> pending_names() const
        {
            std::vector<std::string> out{};
            out.reserve(tasks_.size());
            for (const Task& t : tasks_) out.push_back(t.name);
            return out;
        }

        double now_ms() const { return now_ms_; }

        // Moves the clock forward and runs every task that is due. Tasks scheduled
        // while advancing wait for the next call; tasks cancelled by an earlier
        // task in the same advance do not run.
        void advance(double dt_ms)
        {
            now_ms_ += std::max(0.0, dt_ms);

            std::vector<std::pair<double, uint64_t>> due{};
            for (const Task& t : tasks_)
            {
                if (t.per_frame || t.due_ms <= now_ms_ + kTaskDueToleranceMs) due.emplace_back(t.per_frame ? -1.0 : t.due_ms, t.id);
            }
            std::sort(due.begin(), due.end());

            for (const auto& [when, id] : due)
            {
                (void)when;
                auto it = find(id);
                if (it == tasks_.end()) continue;

                if (!it->per_frame)
                {
                    std::function<void()> fn = std::move(it->once);
                    tasks_.erase(it);
                    fn();
                    continue;
                }

                std::function<TaskStatus()> fn = it->frame;
                const TaskStatus status = fn();
                if (status == TaskStatus::Done)
                {
                    auto done = find(id);
                    if (done != tasks_.end()) tasks_.erase(done);
                }
            }
        }

    private:
        struct Task
        {
            uint64_t id = 0;
            std::string name{};
            bool per_frame = false;
            double due_ms = 0.0;
            std::function<void()> once{};
            std::function<TaskStatus()> frame{};
        };

        std::vector<Task>::iterator find(uint64_t id)
        {
            return std::find_if(tasks_.begin(), tasks_.end(), [id](const Task& t) { return t.id == id; });
        }

        std::vector<Task> tasks_{};
        uint64_t next_id_ = 1;
        double now_ms_ = 0.0;
    };
}
