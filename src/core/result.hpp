#pragma once

#include "core/errors.hpp"
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace muxcache {

/**
 * Outcome of an asynchronous operation: either a value or an error.
 *
 * Errors are carried as std::exception_ptr so that the original exception
 * type reaches every caller unchanged and can be rethrown with value().
 */
template <typename T>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(std::exception_ptr error) {
        if (!error) {
            throw std::invalid_argument("Result::failure requires a non-null error");
        }
        return Result(std::in_place_index<1>, std::move(error));
    }

    template <typename E>
    static Result failure(const E& error) {
        return failure(std::make_exception_ptr(error));
    }

    bool ok() const { return state_.index() == 0; }
    explicit operator bool() const { return ok(); }

    /**
     * Access the value
     * @throws the stored exception if this is a failure
     */
    const T& value() const {
        if (!ok()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::get<0>(state_);
    }

    T& value() {
        if (!ok()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::get<0>(state_);
    }

    std::exception_ptr error() const {
        return ok() ? nullptr : std::get<1>(state_);
    }

    std::string error_message() const {
        return muxcache::error_message(error());
    }

    /**
     * Transform the value, passing failures through
     */
    template <typename U, typename F>
    Result<U> map(F&& fn) const {
        if (!ok()) {
            return Result<U>::failure(std::get<1>(state_));
        }
        return Result<U>::success(fn(std::get<0>(state_)));
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v)
        : state_(tag, std::forward<V>(v)) {}

    std::variant<T, std::exception_ptr> state_;
};

template <typename T>
using Completion = std::function<void(const Result<T>&)>;

} // namespace muxcache
