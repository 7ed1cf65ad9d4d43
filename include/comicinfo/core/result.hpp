#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace comicinfo {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access -------------------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

    // -- Monadic: MapError --------------------------------------------------
    // fn: E -> E

    template <typename Fn>
    Result MapError(Fn&& fn) && {
        if (IsErr()) {
            return Result::Err(std::forward<Fn>(fn)(std::get<1>(std::move(storage_))));
        }
        return std::move(*this);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorKind — the closed set of failure classes raised by the library.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    Parse,         // malformed/empty input, wrong root, unrenderable output
    File,          // I/O failure reading a path or URL
    InvalidEnum,   // enum-valued field outside its closed set
    Range,         // coerced numeric value outside its bounds
    TypeCoercion,  // text not convertible to the field's scalar type
    Schema,        // structural violation (e.g. Page without Image)
};

// ---------------------------------------------------------------------------
// Error — structured error value. Which members are meaningful depends on
// `kind`; the factories below fill exactly those members.
// ---------------------------------------------------------------------------
struct Error {
    ErrorKind kind = ErrorKind::Parse;
    std::string message;
    std::string field;
    std::string value;
    std::vector<std::string> valid_values;
    std::string min;
    std::string max;
    std::string expected_type;

    static Error Parse(std::string message);
    static Error File(std::string message);
    static Error InvalidEnum(std::string field, std::string value,
                             std::vector<std::string> valid_values);
    static Error Range(std::string field, std::string value,
                       std::string min, std::string max);
    static Error TypeCoercion(std::string field, std::string value,
                              std::string expected_type);
    static Error Schema(std::string message);

    [[nodiscard]] bool Is(ErrorKind k) const noexcept { return kind == k; }

    /// Stable snake_case name of the kind ("parse", "invalid_enum", ...).
    [[nodiscard]] std::string KindName() const;

    /// Human-readable description, e.g.
    /// "Value '999' for field 'Year' is out of range (1000..9999)".
    [[nodiscard]] std::string ToString() const;

    /// {"error":{"kind":...,"message":...,"field":...}} with only the
    /// members relevant to the kind.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return kind == other.kind &&
               message == other.message &&
               field == other.field &&
               value == other.value &&
               valid_values == other.valid_values &&
               min == other.min &&
               max == other.max &&
               expected_type == other.expected_type;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace comicinfo
