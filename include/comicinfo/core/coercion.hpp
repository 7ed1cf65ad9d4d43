#pragma once

#include <comicinfo/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace comicinfo {

// ---------------------------------------------------------------------------
// Scalar coercion for schema fields.
//
// `raw` is the already-trimmed field text. `field` is the schema name used
// in errors ("Year", "Page.Image", ...). Coercion failures produce
// TypeCoercionError(field, raw, "Int"|"Double"); range checks run only after
// a successful coercion and produce RangeError(field, raw, min, max).
// ---------------------------------------------------------------------------

[[nodiscard]] Result<int, Error> CoerceInt(std::string_view field,
                                           std::string_view raw);

[[nodiscard]] Result<int, Error> CoerceIntInRange(std::string_view field,
                                                  std::string_view raw,
                                                  int min, int max);

[[nodiscard]] Result<double, Error> CoerceDouble(std::string_view field,
                                                 std::string_view raw);

[[nodiscard]] Result<double, Error> CoerceDoubleInRange(std::string_view field,
                                                        std::string_view raw,
                                                        double min, double max);

// Absent input stays absent (no error).
[[nodiscard]] Result<std::optional<int>, Error> CoerceOptionalInt(
    std::string_view field, const std::optional<std::string>& raw);

[[nodiscard]] Result<std::optional<int>, Error> CoerceOptionalIntInRange(
    std::string_view field, const std::optional<std::string>& raw,
    int min, int max);

[[nodiscard]] Result<std::optional<double>, Error> CoerceOptionalDoubleInRange(
    std::string_view field, const std::optional<std::string>& raw,
    double min, double max);

// Lenient integer parse: whole-string base-10 or nullopt. No errors.
[[nodiscard]] std::optional<int> TryParseInt(std::string_view raw);
[[nodiscard]] std::optional<long long> TryParseInt64(std::string_view raw);

/// Shortest decimal text that parses back to `value`, always with a
/// fractional part ("5.0", "4.25", "0.1").
[[nodiscard]] std::string FormatDecimal(double value);

} // namespace comicinfo
