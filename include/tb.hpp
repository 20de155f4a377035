#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace labelcheck
{

// Making up for lack of C++23 std::expected
namespace tb
{

struct ok_t {};

constexpr ok_t ok {};

template<typename R, typename E>
class [[nodiscard]] result
{
public:
    // ok_t stands in for the value of a result<void, E>
    using value_type = std::conditional_t<std::is_void_v<R>, ok_t, R>;

    result() = delete;

    // Success/value initialisation
    result(value_type value) : members { std::in_place_index<0>, std::move(value) } {}

    // Error initialisation
    result(E err) : members { std::in_place_index<1>, std::move(err) } {}

    bool is_error() const { return members.index() == 1; }
    bool is_ok() const { return members.index() == 0; }

    template<typename T = R> requires (!std::is_void_v<T>)
    const T& get_unchecked() const { return std::get<0>(members); }

    template<typename T = R> requires (!std::is_void_v<T>)
    T& get_mut_unchecked() { return std::get<0>(members); }

    const E& get_error() const { return std::get<1>(members); }
private:
    std::variant<value_type, E> members;
};

template<typename E>
using error = result<void, E>;

} // namespace tb

} // namespace labelcheck
