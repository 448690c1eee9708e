#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace azmcp {

// ---------------------------------------------------------------------------
// Result<T, E> — value or error, returned by every fallible operation.
//
//   auto fetched = fetcher.FetchJson(path, query);
//   if (fetched.IsErr()) return Result<X, Error>::Err(std::move(fetched).Error());
//
// Errors cross layer boundaries with MapErr:
//   catalog.Search(q).MapErr([](const Error& e) { return ToolError::Failed(e.ToString()); });
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() on an Err Result");
        return std::get<0>(storage_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an Ok Result");
        return std::get<1>(storage_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

    // fn: const E& -> F. The value passes through untouched.
    template <typename Fn>
    [[nodiscard]] auto MapErr(Fn&& fn) const& -> Result<T, std::invoke_result_t<Fn, const E&>> {
        using Mapped = Result<T, std::invoke_result_t<Fn, const E&>>;
        if (IsOk()) return Mapped::Ok(std::get<0>(storage_));
        return Mapped::Err(std::forward<Fn>(fn)(std::get<1>(storage_)));
    }

private:
    template <size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : storage_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> storage_;
};

// Success carries no value.
template <typename E>
class Result<void, E> {
public:
    using error_type = E;

    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an Ok Result");
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on an Ok Result");
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace azmcp
