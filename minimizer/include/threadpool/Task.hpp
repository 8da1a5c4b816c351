// Task.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <string>

struct Task {
    std::size_t id{};
    std::string label;

    std::function<void()> fn;

    Task() = default;

    Task(std::size_t id_, std::string label_, std::function<void()> fn_)
        : id(id_), label(std::move(label_)), fn(std::move(fn_)) {}
};
