#include "notwords/parsing.hpp"
#include "notwords/error.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace notwords {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// [+-] digits [. digits] [(e|E) [+-] digits], with at least one mantissa digit
bool is_decimal(std::string_view s) {
    size_t i = 0;
    auto digits = [&]() {
        const size_t start = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        return i - start;
    };

    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    size_t mantissa = digits();
    if (i < s.size() && s[i] == '.') {
        ++i;
        mantissa += digits();
    }
    if (mantissa == 0) return false;

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        if (digits() == 0) return false;
    }
    return i == s.size();
}

double parse_component(std::string_view token, std::string_view text) {
    const std::string str(trim(token));
    const std::string quoted = "'" + std::string(text) + "'";

    // stod alone would also take hex, "nan" and "inf"
    if (!is_decimal(str)) {
        throw MalformedCoordinateError("Not a decimal number: '" + str + "' in " + quoted, "parse_coordinate",
                                       "Use \"<lat> <lon>\", \"<lat>,<lon>\" or \"<lat>, <lon>\"");
    }

    double value = 0.0;
    try {
        value = std::stod(str);
    } catch (const std::out_of_range&) {
        throw MalformedCoordinateError("Value out of double range in " + quoted, "parse_coordinate");
    }
    if (!std::isfinite(value)) {
        throw MalformedCoordinateError("Non-finite value in " + quoted, "parse_coordinate");
    }
    return value;
}

} // anonymous namespace

Coordinate parse_coordinate(std::string_view text) {
    const std::string_view body = trim(text);
    std::vector<std::string_view> parts;

    const size_t comma = body.find(',');
    if (comma != std::string_view::npos) {
        parts.push_back(body.substr(0, comma));
        parts.push_back(body.substr(comma + 1));
        if (parts[1].find(',') != std::string_view::npos) {
            throw MalformedCoordinateError("Expected exactly two numbers in '" + std::string(text) + "'",
                                           __func__);
        }
    } else {
        size_t pos = 0;
        while (pos < body.size()) {
            while (pos < body.size() && is_space(body[pos])) ++pos;
            size_t start = pos;
            while (pos < body.size() && !is_space(body[pos])) ++pos;
            if (pos > start) parts.push_back(body.substr(start, pos - start));
        }
    }

    if (parts.size() != 2) {
        throw MalformedCoordinateError("Expected exactly two numbers in '" + std::string(text) + "'",
                                       __func__,
                                       "Use \"<lat> <lon>\", \"<lat>,<lon>\" or \"<lat>, <lon>\"");
    }

    return Coordinate(parse_component(parts[0], text), parse_component(parts[1], text));
}

std::string format_coordinate(const Coordinate& coord) {
    std::ostringstream ss;
    ss << std::setprecision(12) << coord.latitude << ", " << coord.longitude;
    return ss.str();
}

WordSequence split_words(std::string_view text) {
    const std::string_view body = trim(text);
    if (body.empty()) {
        NOTWORDS_THROW(ErrorCode::WRONG_WORD_COUNT, "Empty word address");
    }

    WordSequence words;
    size_t start = 0;
    while (true) {
        size_t end = body.find_first_of("-.", start);
        std::string_view token = trim(body.substr(start, end == std::string_view::npos ? end : end - start));
        if (token.empty()) {
            NOTWORDS_THROW(ErrorCode::WRONG_WORD_COUNT,
                           "Empty word in address '" + std::string(body) + "'");
        }

        std::string word(token);
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        words.push_back(std::move(word));

        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return words;
}

std::string join_words(const WordSequence& words) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) result += WORD_SEPARATOR;
        result += words[i];
    }
    return result;
}

} // namespace notwords
