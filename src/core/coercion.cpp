#include <comicinfo/core/coercion.hpp>

#include <charconv>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace comicinfo {

namespace {

std::string ToText(std::string_view s) {
    return std::string(s);
}

template <typename Int>
std::optional<Int> ParseWholeInteger(std::string_view raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    // from_chars does not accept an explicit '+'.
    if (raw.front() == '+') {
        raw.remove_prefix(1);
        if (raw.empty() || raw.front() == '-' || raw.front() == '+') {
            return std::nullopt;
        }
    }
    Int value = 0;
    const auto* first = raw.data();
    const auto* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

std::optional<int> TryParseInt(std::string_view raw) {
    return ParseWholeInteger<int>(raw);
}

std::optional<long long> TryParseInt64(std::string_view raw) {
    return ParseWholeInteger<long long>(raw);
}

Result<int, Error> CoerceInt(std::string_view field, std::string_view raw) {
    auto value = TryParseInt(raw);
    if (!value.has_value()) {
        return Result<int, Error>::Err(
            Error::TypeCoercion(ToText(field), ToText(raw), "Int"));
    }
    return Result<int, Error>::Ok(*value);
}

Result<int, Error> CoerceIntInRange(std::string_view field,
                                    std::string_view raw,
                                    int min, int max) {
    // Wide parse so "10000000000" is out of range rather than unconvertible.
    auto wide = TryParseInt64(raw);
    if (!wide.has_value()) {
        return Result<int, Error>::Err(
            Error::TypeCoercion(ToText(field), ToText(raw), "Int"));
    }
    if (*wide < min || *wide > max) {
        return Result<int, Error>::Err(Error::Range(
            ToText(field), ToText(raw), std::to_string(min), std::to_string(max)));
    }
    return Result<int, Error>::Ok(static_cast<int>(*wide));
}

Result<double, Error> CoerceDouble(std::string_view field, std::string_view raw) {
    const std::string text(raw);
    if (text.empty()) {
        return Result<double, Error>::Err(
            Error::TypeCoercion(ToText(field), text, "Double"));
    }
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    // The whole text must be consumed: "4.5abc" is not a decimal.
    if (in.fail() || !in.eof() || !std::isfinite(value)) {
        return Result<double, Error>::Err(
            Error::TypeCoercion(ToText(field), text, "Double"));
    }
    return Result<double, Error>::Ok(value);
}

Result<double, Error> CoerceDoubleInRange(std::string_view field,
                                          std::string_view raw,
                                          double min, double max) {
    auto coerced = CoerceDouble(field, raw);
    if (coerced.IsErr()) {
        return coerced;
    }
    const double value = coerced.Value();
    if (value < min || value > max) {
        return Result<double, Error>::Err(Error::Range(
            ToText(field), ToText(raw), FormatDecimal(min), FormatDecimal(max)));
    }
    return coerced;
}

Result<std::optional<int>, Error> CoerceOptionalInt(
    std::string_view field, const std::optional<std::string>& raw) {
    using R = Result<std::optional<int>, Error>;
    if (!raw.has_value()) {
        return R::Ok(std::nullopt);
    }
    auto coerced = CoerceInt(field, *raw);
    if (coerced.IsErr()) {
        return R::Err(std::move(coerced).Error());
    }
    return R::Ok(coerced.Value());
}

Result<std::optional<int>, Error> CoerceOptionalIntInRange(
    std::string_view field, const std::optional<std::string>& raw,
    int min, int max) {
    using R = Result<std::optional<int>, Error>;
    if (!raw.has_value()) {
        return R::Ok(std::nullopt);
    }
    auto coerced = CoerceIntInRange(field, *raw, min, max);
    if (coerced.IsErr()) {
        return R::Err(std::move(coerced).Error());
    }
    return R::Ok(coerced.Value());
}

Result<std::optional<double>, Error> CoerceOptionalDoubleInRange(
    std::string_view field, const std::optional<std::string>& raw,
    double min, double max) {
    using R = Result<std::optional<double>, Error>;
    if (!raw.has_value()) {
        return R::Ok(std::nullopt);
    }
    auto coerced = CoerceDoubleInRange(field, *raw, min, max);
    if (coerced.IsErr()) {
        return R::Err(std::move(coerced).Error());
    }
    return R::Ok(coerced.Value());
}

std::string FormatDecimal(double value) {
    std::string text;
    for (int precision = 1; precision <= 17; ++precision) {
        std::ostringstream out;
        out.imbue(std::locale::classic());
        out << std::setprecision(precision) << value;
        text = out.str();
        std::istringstream back(text);
        back.imbue(std::locale::classic());
        double round_trip = 0.0;
        back >> round_trip;
        if (!back.fail() && round_trip == value) {
            break;
        }
    }
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace comicinfo
