#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace stratus {

// Wrapper types keep Result<T, E> unambiguous when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

/**
 * @brief Value-or-error return type used across every module
 *
 * Operations that talk to the control plane, the remote agent or the local
 * filesystem return Result instead of throwing. The error side carries the
 * last known diagnostic message.
 */
template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }

    // Moves the value out; only valid when is_ok()
    T take() { return std::move(std::get<0>(data_)); }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = std::string>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(const char* error) { return Result<T>(ErrValue<std::string>(std::string(error))); }

/**
 * @brief Re-wraps the error of a failed Result as a Result of another type
 *
 * @param context Prefix prepended to the original message ("" keeps it as is)
 */
template<typename T, typename U>
Result<T> Forward(const Result<U>& failed, const std::string& context = {}) {
    if (context.empty()) {
        return Result<T>(ErrValue<std::string>(failed.error()));
    }
    return Result<T>(ErrValue<std::string>(context + ": " + failed.error()));
}

} // namespace stratus
