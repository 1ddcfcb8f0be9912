#pragma once

/*
    ARS SIM LIB

    FILE: state_machine.hpp
    MODULE: logic
    PURPOSE: Finite state machine with enum-identified states, enter/update/exit callbacks
            and predicate-driven transitions. The session uses it to mirror the
            Playing -> Dying -> GameOver lifecycle.
*/


#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <utility>
#include <vector>

namespace ars
{
    template <typename TStateId, typename TContext>
    class StateMachine
    {
    public:
        using StateId = TStateId;

        struct StateCallbacks
        {
            std::function<void(TContext&)> on_enter{};
            std::function<void(TContext&, float dt)> on_update{};
            std::function<void(TContext&)> on_exit{};
        };

        struct TransitionRule
        {
            StateId from{};
            StateId to{};
            std::function<bool(const TContext&)> predicate{};
            int priority = 0;
        };

        using TransitionObserver = std::function<void(StateId from, StateId to)>;

        bool add_state(StateId id, StateCallbacks callbacks = {})
        {
            if (find_state(id)) return false;
            states_.push_back(StateEntry{id, std::move(callbacks)});
            return true;
        }

        bool has_state(StateId id) const
        {
            return find_state(id) != nullptr;
        }

        bool add_transition(StateId from, StateId to, std::function<bool(const TContext&)> predicate, int priority = 0)
        {
            if (!predicate || !has_state(from) || !has_state(to)) return false;
            rules_.push_back(TransitionRule{from, to, std::move(predicate), priority});
            return true;
        }

        void set_observer(TransitionObserver observer)
        {
            observer_ = std::move(observer);
        }

        // (Re)enters initial_state without running the exit callback of the
        // state being abandoned; used for session resets.
        bool start(StateId initial_state, TContext& ctx)
        {
            if (!has_state(initial_state)) return false;
            started_ = true;
            current_ = initial_state;
            previous_ = initial_state;
            state_time_ = 0.0f;
            transitions_ = 0;
            enter(ctx, current_);
            return true;
        }

        bool started() const { return started_; }
        StateId current_state() const { return current_; }
        StateId previous_state() const { return previous_; }
        float state_time() const { return state_time_; }
        uint64_t transition_count() const { return transitions_; }

        bool is(StateId id) const
        {
            return started_ && current_ == id;
        }

        bool transition_to(StateId to, TContext& ctx)
        {
            if (!started_ || !has_state(to)) return false;
            if (current_ == to) return true;

            const StateId from = current_;
            exit(ctx, from);
            previous_ = from;
            current_ = to;
            state_time_ = 0.0f;
            ++transitions_;
            if (observer_) observer_(from, to);
            enter(ctx, to);
            return true;
        }

        // Runs the current state's update, then follows every rule that fires.
        // Chains are bounded by the state count so a cyclic rule set cannot hang.
        void tick(TContext& ctx, float dt)
        {
            if (!started_) return;
            if (dt < 0.0f) dt = 0.0f;

            if (const StateEntry* s = find_state(current_); s && s->callbacks.on_update)
            {
                s->callbacks.on_update(ctx, dt);
            }
            state_time_ += dt;

            for (std::size_t hop = 0; hop < states_.size(); ++hop)
            {
                const TransitionRule* rule = select_rule(ctx);
                if (!rule) break;
                transition_to(rule->to, ctx);
            }
        }

    private:
        struct StateEntry
        {
            StateId id{};
            StateCallbacks callbacks{};
        };

        const StateEntry* find_state(StateId id) const
        {
            for (const StateEntry& s : states_)
            {
                if (s.id == id) return &s;
            }
            return nullptr;
        }

        void enter(TContext& ctx, StateId id)
        {
            const StateEntry* s = find_state(id);
            if (s && s->callbacks.on_enter) s->callbacks.on_enter(ctx);
        }

        void exit(TContext& ctx, StateId id)
        {
            const StateEntry* s = find_state(id);
            if (s && s->callbacks.on_exit) s->callbacks.on_exit(ctx);
        }

        const TransitionRule* select_rule(const TContext& ctx) const
        {
            const TransitionRule* selected = nullptr;
            int best = std::numeric_limits<int>::min();
            for (const TransitionRule& r : rules_)
            {
                if (r.from != current_) continue;
                if (!r.predicate(ctx)) continue;
                if (!selected || r.priority > best)
                {
                    selected = &r;
                    best = r.priority;
                }
            }
            return selected;
        }

        std::vector<StateEntry> states_{};
        std::vector<TransitionRule> rules_{};
        TransitionObserver observer_{};
        bool started_ = false;
        StateId current_{};
        StateId previous_{};
        float state_time_ = 0.0f;
        uint64_t transitions_ = 0;
    };
}
