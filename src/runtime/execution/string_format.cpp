#include "string_format.h"
#include "script_error.h"
#include "value_ops.h"
#include <signal_lambda/core/sandbox_error.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <optional>

namespace signal_lambda::runtime {

namespace {

struct FormatSpec {
    char fill{' '};
    char align{'\0'};  // < > ^ =
    char sign{'-'};
    std::size_t width{0};
    bool thousands{false};
    std::optional<int> precision;
    char type{'\0'};
};

bool IsAlign(char c) {
    return c == '<' || c == '>' || c == '^' || c == '=';
}

std::size_t ParseNumber(std::string_view spec, std::size_t& pos) {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(spec.data() + pos, spec.data() + spec.size(), value);
    if (ec == std::errc::result_out_of_range || value > 1000) {
        throw ValueError("Too many decimal digits in format string");
    }
    pos = static_cast<std::size_t>(ptr - spec.data());
    return value;
}

FormatSpec ParseSpec(std::string_view spec) {
    FormatSpec result;
    std::size_t pos = 0;

    if (spec.size() >= 2 && IsAlign(spec[1])) {
        result.fill = spec[0];
        result.align = spec[1];
        pos = 2;
    } else if (!spec.empty() && IsAlign(spec[0])) {
        result.align = spec[0];
        pos = 1;
    }

    if (pos < spec.size() && (spec[pos] == '+' || spec[pos] == '-' || spec[pos] == ' ')) {
        result.sign = spec[pos++];
    }
    if (pos < spec.size() && spec[pos] == '0') {
        if (result.align == '\0') {
            result.fill = '0';
            result.align = '=';
        }
        ++pos;
    }
    if (pos < spec.size() && std::isdigit(static_cast<unsigned char>(spec[pos]))) {
        result.width = ParseNumber(spec, pos);
    }
    if (pos < spec.size() && spec[pos] == ',') {
        result.thousands = true;
        ++pos;
    }
    if (pos < spec.size() && spec[pos] == '.') {
        ++pos;
        if (pos >= spec.size() || !std::isdigit(static_cast<unsigned char>(spec[pos]))) {
            throw ValueError("Format specifier missing precision");
        }
        result.precision = static_cast<int>(ParseNumber(spec, pos));
    }
    if (pos < spec.size()) {
        result.type = spec[pos++];
    }
    if (pos != spec.size()) {
        throw ValueError("Invalid format specifier");
    }
    return result;
}

std::string InsertThousands(const std::string& digits) {
    // digits holds the integer part only
    std::string out;
    std::size_t count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(*it);
        ++count;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

// Formats |value| without sign, applying type and precision
std::string FormatMagnitude(double magnitude, const FormatSpec& spec) {
    switch (spec.type) {
        case 'f':
        case 'F':
            return std::format("{:.{}f}", magnitude, spec.precision.value_or(6));
        case 'e':
            return std::format("{:.{}e}", magnitude, spec.precision.value_or(6));
        case 'E':
            return std::format("{:.{}E}", magnitude, spec.precision.value_or(6));
        case 'g':
            return std::format("{:.{}g}", magnitude, std::max(spec.precision.value_or(6), 1));
        case 'G':
            return std::format("{:.{}G}", magnitude, std::max(spec.precision.value_or(6), 1));
        case '%':
            return std::format("{:.{}f}", magnitude * 100.0, spec.precision.value_or(6)) + "%";
        case '\0':
            if (spec.precision) {
                return std::format("{:.{}g}", magnitude, std::max(*spec.precision, 1));
            }
            return FormatFloat(magnitude);
        default:
            throw ValueError(std::format("Unknown format code '{}' for object of type 'float'", spec.type));
    }
}

std::string Pad(const std::string& sign, const std::string& body, const FormatSpec& spec, char defaultAlign) {
    const std::size_t length = sign.size() + body.size();
    if (length >= spec.width) {
        return sign + body;
    }

    const std::size_t padding = spec.width - length;
    const char align = spec.align == '\0' ? defaultAlign : spec.align;
    switch (align) {
        case '<': return sign + body + std::string(padding, spec.fill);
        case '^': return std::string(padding / 2, spec.fill) + sign + body + std::string(padding - padding / 2, spec.fill);
        case '=': return sign + std::string(padding, spec.fill) + body;
        default: return std::string(padding, spec.fill) + sign + body;
    }
}

std::string FormatNumber(const Value& value, const FormatSpec& spec) {
    bool negative = false;
    std::string body;

    if (value.IsIntegral() && (spec.type == '\0' || spec.type == 'd')) {
        if (spec.precision) {
            throw ValueError("Precision not allowed in integer format specifier");
        }
        std::int64_t number = value.ToInteger();
        negative = number < 0;
        body = negative ? std::to_string(number).substr(1) : std::to_string(number);
        if (spec.thousands) {
            body = InsertThousands(body);
        }
    } else {
        if (spec.type == 'd') {
            throw ValueError("Unknown format code 'd' for object of type 'float'");
        }
        double number = value.ToDouble();
        negative = std::signbit(number) && !std::isnan(number);
        body = std::isfinite(number) ? FormatMagnitude(std::fabs(number), spec)
                                     : (std::isnan(number) ? "nan" : "inf");
        if (spec.thousands && std::isfinite(number)) {
            std::size_t end = body.find_first_not_of("0123456789");
            body = InsertThousands(body.substr(0, end)) + (end == std::string::npos ? "" : body.substr(end));
        }
    }

    std::string sign;
    if (negative) {
        sign = "-";
    } else if (spec.sign == '+') {
        sign = "+";
    } else if (spec.sign == ' ') {
        sign = " ";
    }
    return Pad(sign, body, spec, '>');
}

} // namespace

std::string FormatValue(const Value& value, std::string_view specText, std::size_t maxLength) {
    FormatSpec spec = ParseSpec(specText);

    if (value.IsNumber() && !(value.IsBool() && spec.type == '\0')) {
        if (spec.type == 's') {
            throw ValueError(std::format("Unknown format code 's' for object of type '{}'", value.TypeName()));
        }
        return FormatNumber(value, spec);
    }

    if (spec.type != '\0' && spec.type != 's') {
        throw ValueError(std::format("Unknown format code '{}' for object of type '{}'", spec.type, value.TypeName()));
    }
    if (spec.align == '=' || spec.sign != '-' || spec.thousands) {
        throw ValueError("Invalid format specifier for a non-numeric value");
    }

    std::string text = ToStr(value, maxLength);
    if (spec.precision && static_cast<std::size_t>(*spec.precision) < text.size()) {
        text.resize(static_cast<std::size_t>(*spec.precision));
    }
    return Pad("", text, spec, '<');
}

std::string FormatString(std::string_view pattern, const std::vector<Value>& args,
                         const std::vector<std::pair<std::string, Value>>& kwargs, std::size_t maxLength) {
    std::string out;
    std::size_t autoIndex = 0;
    bool usedAuto = false;
    bool usedManual = false;

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '}') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
                out.push_back('}');
                ++i;
                continue;
            }
            throw ValueError("Single '}' encountered in format string");
        }
        if (c != '{') {
            out.push_back(c);
            continue;
        }
        if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
            out.push_back('{');
            ++i;
            continue;
        }

        std::size_t close = pattern.find('}', i + 1);
        if (close == std::string_view::npos) {
            throw ValueError("Single '{' encountered in format string");
        }
        std::string_view field = pattern.substr(i + 1, close - i - 1);
        i = close;

        std::size_t colon = field.find(':');
        std::string_view name = field.substr(0, colon);
        std::string_view spec = colon == std::string_view::npos ? std::string_view{} : field.substr(colon + 1);
        if (name.find_first_of("!.[") != std::string_view::npos) {
            throw ValueError("Conversions, attributes and indexing are not supported in format fields");
        }

        const Value* argument = nullptr;
        if (name.empty()) {
            if (usedManual) {
                throw ValueError("cannot switch from manual field specification to automatic field numbering");
            }
            usedAuto = true;
            if (autoIndex >= args.size()) {
                throw IndexError(std::format("Replacement index {} out of range for positional args tuple", autoIndex));
            }
            argument = &args[autoIndex++];
        } else if (std::isdigit(static_cast<unsigned char>(name.front()))) {
            if (usedAuto) {
                throw ValueError("cannot switch from automatic field numbering to manual field specification");
            }
            usedManual = true;
            std::size_t index = 0;
            auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
            if (ec != std::errc{} || ptr != name.data() + name.size()) {
                throw ValueError(std::format("Invalid format field '{}'", name));
            }
            if (index >= args.size()) {
                throw IndexError(std::format("Replacement index {} out of range for positional args tuple", index));
            }
            argument = &args[index];
        } else {
            auto it = std::ranges::find_if(kwargs, [name](const auto& kw) { return kw.first == name; });
            if (it == kwargs.end()) {
                throw KeyError(std::format("'{}'", name));
            }
            argument = &it->second;
        }

        out += FormatValue(*argument, spec, maxLength);
        if (out.size() > maxLength) {
            throw ResourceLimitExceeded(std::format("String too long (more than {} characters)", maxLength));
        }
    }
    return out;
}

} // namespace signal_lambda::runtime
