#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace DashSim {

/**
 * Value-or-error return type.
 *
 * Used wherever a failure is expected and recoverable (bad configuration, missing files).
 * Bugs use DASHSIM_ASSERT instead.
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& text);
 *   auto result = parse("42");
 *   if (result.isError()) {
 *       SLOG_ERROR("{}", result.errorValue());
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value)
    {
        return Result(std::in_place_index<kValueIndex>, std::move(value));
    }

    static Result error(E error)
    {
        return Result(std::in_place_index<kErrorIndex>, std::move(error));
    }

    bool isValue() const { return data_.index() == kValueIndex; }
    bool isError() const { return data_.index() == kErrorIndex; }

    T& value() { return std::get<kValueIndex>(data_); }
    const T& value() const { return std::get<kValueIndex>(data_); }

    E& errorValue() { return std::get<kErrorIndex>(data_); }
    const E& errorValue() const { return std::get<kErrorIndex>(data_); }

private:
    static constexpr std::size_t kValueIndex = 0;
    static constexpr std::size_t kErrorIndex = 1;

    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace DashSim
