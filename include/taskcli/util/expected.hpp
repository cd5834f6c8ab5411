#pragma once

// Result type for operations that fail with an Error.
// Uses std::expected when the standard library ships it (C++23).

#if defined(TASKCLI_HAS_STD_EXPECTED) || __cpp_lib_expected >= 202202L

#include <expected>

namespace taskcli {
    using std::expected;
    using std::unexpected;
}

#else

#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace taskcli {

template<typename E>
class unexpected {
    E error_;

public:
    template<typename Err = E>
        requires std::is_constructible_v<E, Err>
    constexpr explicit unexpected(Err&& e)
        : error_(std::forward<Err>(e)) {}

    constexpr const E& error() const& noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }
};

template<typename E>
unexpected(E) -> unexpected<E>;

// Holds either a T or the E explaining why there is none.
// Reading the value of an error result (or the error of a value) is undefined.
template<typename T, typename E>
class expected {
    std::variant<T, E> data_;

public:
    template<typename U = T>
        requires std::is_constructible_v<T, U> &&
                 (!std::is_same_v<std::remove_cvref_t<U>, expected>)
    constexpr expected(U&& v)
        : data_(std::in_place_index<0>, std::forward<U>(v)) {}

    template<typename G>
    constexpr expected(const unexpected<G>& e)
        : data_(std::in_place_index<1>, e.error()) {}

    template<typename G>
    constexpr expected(unexpected<G>&& e)
        : data_(std::in_place_index<1>, std::move(e).error()) {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }
    constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr const T* operator->() const noexcept { return std::addressof(std::get<0>(data_)); }
    constexpr T* operator->() noexcept { return std::addressof(std::get<0>(data_)); }

    constexpr const T& operator*() const& noexcept { return std::get<0>(data_); }
    constexpr T& operator*() & noexcept { return std::get<0>(data_); }
    constexpr T&& operator*() && noexcept { return std::move(std::get<0>(data_)); }

    constexpr const E& error() const& noexcept { return std::get<1>(data_); }
};

template<typename E>
class expected<void, E> {
    std::variant<std::monostate, E> data_;

public:
    constexpr expected() noexcept = default;

    template<typename G>
    constexpr expected(const unexpected<G>& e)
        : data_(std::in_place_index<1>, e.error()) {}

    template<typename G>
    constexpr expected(unexpected<G>&& e)
        : data_(std::in_place_index<1>, std::move(e).error()) {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }
    constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr const E& error() const& noexcept { return std::get<1>(data_); }
};

} // namespace taskcli

#endif
