#pragma once

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace file_editor {

// ---------------------------------------------------------------------------
// Result<T, E>: value or error. Every expected failure that crosses a
// module boundary travels as a Result; exceptions stay inside the module
// that called the throwing library.
//
//   auto bytes = ReadWholeFile(path).MapError(ToDetail);
//   if (bytes.IsErr()) return R::Err(std::move(bytes).Error());
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::in_place_index<kValue>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<kError>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == kError; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() on an error Result");
        return std::get<kValue>(state_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() on an error Result");
        return std::get<kValue>(std::move(state_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on a value Result");
        return std::get<kError>(state_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on a value Result");
        return std::get<kError>(std::move(state_));
    }

    // fn: T -> U. The error passes through unchanged.
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using Next = Result<std::invoke_result_t<Fn, T&&>, E>;
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(state_)));
        }
        return Next::Ok(std::forward<Fn>(fn)(std::get<kValue>(std::move(state_))));
    }

    // fn: E -> F. Used to lift low-level errors (errno, decode reasons)
    // into the caller's error type.
    template <typename Fn>
    auto MapError(Fn&& fn) && -> Result<T, std::invoke_result_t<Fn, E&&>> {
        using Next = Result<T, std::invoke_result_t<Fn, E&&>>;
        if (IsOk()) {
            return Next::Ok(std::get<kValue>(std::move(state_)));
        }
        return Next::Err(std::forward<Fn>(fn)(std::get<kError>(std::move(state_))));
    }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> which, V&& v) : state_(which, std::forward<V>(v)) {}

    std::variant<T, E> state_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: success carries nothing.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on a value Result");
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on a value Result");
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace file_editor
