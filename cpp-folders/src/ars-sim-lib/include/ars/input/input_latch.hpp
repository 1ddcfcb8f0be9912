#pragma once

/*
    ARS SIM LIB

    FILE: input_latch.hpp
    MODULE: input
    PURPOSE: Discrete input intents (move begin/end, fire, view select, session commands)
            and the value reducer that folds them into the held-input latch.
*/


#include <cstdint>
#include <span>
#include <vector>

#include "ars/camera/view_presets.hpp"

namespace ars
{
    enum class MoveDirection : uint8_t
    {
        Left = 0,
        Right = 1,
        Up = 2,
        Down = 3
    };

    enum class InputEventType : uint8_t
    {
        MoveBegin = 0,
        MoveEnd = 1,
        FireBegin = 2,
        FireEnd = 3,
        SelectView = 4,
        Reset = 5,
        ToggleShield = 6,
        ToggleRapidFire = 7
    };

    struct InputEvent
    {
        InputEventType type = InputEventType::MoveBegin;
        MoveDirection direction = MoveDirection::Left;
        ViewId view = ViewId::Default;
    };

    // Axis values are -1, 0 or +1. The two directions of an axis are mutually
    // exclusive: the latest begin wins, and ending either direction releases
    // the axis.
    struct InputLatch
    {
        int8_t axis_x = 0;
        int8_t axis_y = 0;
        bool fire_held = false;
    };

    inline InputEvent make_move_event(MoveDirection dir, bool begin)
    {
        InputEvent out{};
        out.type = begin ? InputEventType::MoveBegin : InputEventType::MoveEnd;
        out.direction = dir;
        return out;
    }

    inline InputEvent make_fire_event(bool begin)
    {
        InputEvent out{};
        out.type = begin ? InputEventType::FireBegin : InputEventType::FireEnd;
        return out;
    }

    inline InputEvent make_select_view_event(ViewId view)
    {
        InputEvent out{};
        out.type = InputEventType::SelectView;
        out.view = view;
        return out;
    }

    inline InputEvent make_command_event(InputEventType type)
    {
        InputEvent out{};
        out.type = type;
        return out;
    }

    inline bool is_horizontal(MoveDirection dir)
    {
        return dir == MoveDirection::Left || dir == MoveDirection::Right;
    }

    inline int8_t direction_sign(MoveDirection dir)
    {
        return (dir == MoveDirection::Right || dir == MoveDirection::Up) ? int8_t{1} : int8_t{-1};
    }

    inline InputLatch reduce_input_latch(InputLatch state, std::span<const InputEvent> events)
    {
        for (const InputEvent& e : events)
        {
            switch (e.type)
            {
                case InputEventType::MoveBegin:
                    if (is_horizontal(e.direction)) state.axis_x = direction_sign(e.direction);
                    else state.axis_y = direction_sign(e.direction);
                    break;
                case InputEventType::MoveEnd:
                    if (is_horizontal(e.direction)) state.axis_x = 0;
                    else state.axis_y = 0;
                    break;
                case InputEventType::FireBegin:
                    state.fire_held = true;
                    break;
                case InputEventType::FireEnd:
                    state.fire_held = false;
                    break;
                case InputEventType::SelectView:
                case InputEventType::Reset:
                case InputEventType::ToggleShield:
                case InputEventType::ToggleRapidFire:
                    break;
            }
        }
        return state;
    }

    inline void append_move_event(std::vector<InputEvent>& out, MoveDirection dir, bool begin)
    {
        out.push_back(make_move_event(dir, begin));
    }
}
