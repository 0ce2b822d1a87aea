#pragma once

#include <system_error>
#include <utility>
#include <variant>

template <typename E>
struct ErrorWrapper {
    E value;
};

template <typename E>
ErrorWrapper<E> error(E&& e)
{
    return ErrorWrapper<E> { std::forward<E>(e) };
}

template <typename T, typename E = std::error_code>
class Result {
public:
    Result(const T& t)
        : value_(std::in_place_index<0>, t)
    {
    }

    Result(T&& t)
        : value_(std::in_place_index<0>, std::move(t))
    {
    }

    template <typename U>
    Result(ErrorWrapper<U>&& e)
        : value_(std::in_place_index<1>, E { e.value })
    {
    }

    bool hasValue() const { return value_.index() == 0; }
    explicit operator bool() const { return hasValue(); }

    const T& value() const { return std::get<0>(value_); }
    T& value() { return std::get<0>(value_); }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const E& error() const { return std::get<1>(value_); }

private:
    std::variant<T, E> value_;
};
