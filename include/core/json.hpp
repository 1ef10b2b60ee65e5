#pragma once

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace piiredact {

/**
 * @brief Thin wrapper around glz::json_t used as the record DOM
 *
 * Stores json_t by value. Const operator[] returns copies. Records read
 * from batch files, the redaction metadata block and remote detector
 * responses all go through this type.
 *
 * json_t holds numbers as double, which cannot represent every integer
 * above 2^53. Integer literals longer than kMaxExactDigits are kept as
 * their literal text instead: stored as a string tagged with a leading
 * 0xFF byte (never valid in UTF-8, so parse() rejects it in input) and
 * written back as a bare number by dump().
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    static constexpr size_t kMaxExactDigits = 15;
    static constexpr char kNumberTag = '\xFF';

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(long long v) { set_integer(v); }
    JsonValue(size_t v) { set_integer(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(std::string_view v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string() && !is_literal_number(); }
    [[nodiscard]] bool is_number() const { return data_.is_number() || is_literal_number(); }

    [[nodiscard]] bool is_number_integer() const {
        if (is_literal_number()) return true;
        if (!data_.is_number()) return false;
        double d = data_.get<double>();
        return d == std::floor(d) && std::isfinite(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            if (is_literal_number()) {
                return std::stod(literal_digits());
            }
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            if (is_literal_number()) {
                const std::string digits = literal_digits();
                T value{};
                const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
                if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
                    throw std::out_of_range("JSON integer " + digits + " does not fit the requested type");
                }
                return value;
            }
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /// Borrow the string payload without copying (caller checks is_string())
    [[nodiscard]] const std::string& string_ref() const {
        return data_.get<std::string>();
    }

    // ===== Mutation =====

    /// Insert or overwrite a key (converts null to an empty object first)
    void set(std::string_view key, JsonValue val) {
        if (data_.is_null()) data_ = object_t{};
        if (!data_.is_object()) {
            throw std::logic_error("JsonValue::set on non-object value");
        }
        data_.get_object()[std::string(key)] = std::move(val.data_);
    }

    /// Append to an array (converts null to an empty array first)
    void push_back(JsonValue val) {
        if (data_.is_null()) data_ = array_t{};
        if (!data_.is_array()) {
            throw std::logic_error("JsonValue::push_back on non-array value");
        }
        data_.get_array().push_back(std::move(val.data_));
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue object() {
        glz::json_t j;
        j = object_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue array() {
        glz::json_t j;
        j = array_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        if (json_str.find(kNumberTag) != std::string_view::npos) {
            throw parse_error("JSON parse error: invalid UTF-8 byte 0xFF");
        }
        const std::string tagged = tag_long_integers(json_str);
        glz::json_t result;
        auto ec = glz::read_json(result, tagged);
        if (ec) {
            throw parse_error(std::string("JSON parse error: ") +
                              glz::format_error(ec, tagged));
        }
        return JsonValue(std::move(result));
    }

    // ===== Serialization =====

    [[nodiscard]] std::string dump(bool pretty = false) const {
        std::string buffer;
        if (pretty) {
            auto ec = glz::write<glz::opts{.prettify = true}>(data_, buffer);
            if (ec) throw std::runtime_error("JSON serialization failed");
        } else {
            auto ec = glz::write_json(data_, buffer);
            if (ec) throw std::runtime_error("JSON serialization failed");
        }
        return untag_long_integers(buffer);
    }

private:
    [[nodiscard]] bool is_literal_number() const {
        if (!data_.is_string()) return false;
        const auto& s = data_.get<std::string>();
        return !s.empty() && s.front() == kNumberTag;
    }

    [[nodiscard]] std::string literal_digits() const {
        return data_.get<std::string>().substr(1);
    }

    template <typename Int>
    void set_integer(Int v) {
        char buf[24];
        const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        const std::string_view digits(buf, static_cast<size_t>(ptr - buf));
        const size_t count = digits.size() - (digits.front() == '-' ? 1 : 0);
        if (ec == std::errc{} && count > kMaxExactDigits) {
            data_ = kNumberTag + std::string(digits);
        } else {
            data_ = static_cast<double>(v);
        }
    }

    /// Wrap integer literals with more than kMaxExactDigits digits as tagged strings
    [[nodiscard]] static std::string tag_long_integers(std::string_view in) {
        std::string out;
        out.reserve(in.size());
        size_t i = 0;
        while (i < in.size()) {
            const char c = in[i];
            if (c == '"') {
                // Copy the string token verbatim, honouring escapes
                const size_t start = i++;
                while (i < in.size() && in[i] != '"') {
                    i += in[i] == '\\' ? 2 : 1;
                }
                i = std::min(i + 1, in.size());
                out.append(in.substr(start, i - start));
            } else if (c == '-' || (c >= '0' && c <= '9')) {
                const size_t start = i++;
                bool integral = true;
                while (i < in.size() && (std::isdigit(static_cast<unsigned char>(in[i])) ||
                                         in[i] == '.' || in[i] == 'e' || in[i] == 'E' ||
                                         in[i] == '+' || in[i] == '-')) {
                    if (!std::isdigit(static_cast<unsigned char>(in[i]))) integral = false;
                    ++i;
                }
                const auto token = in.substr(start, i - start);
                const size_t digits = token.size() - (c == '-' ? 1 : 0);
                if (integral && digits > kMaxExactDigits) {
                    out += '"';
                    out += kNumberTag;
                    out.append(token);
                    out += '"';
                } else {
                    out.append(token);
                }
            } else {
                out += c;
                ++i;
            }
        }
        return out;
    }

    /// Replace tagged strings in serialized output with their bare digits
    [[nodiscard]] static std::string untag_long_integers(const std::string& in) {
        const std::string marker = std::string("\"") + kNumberTag;
        if (in.find(marker) == std::string::npos) {
            return in;
        }
        std::string out;
        out.reserve(in.size());
        size_t pos = 0;
        for (size_t hit; (hit = in.find(marker, pos)) != std::string::npos;) {
            out.append(in, pos, hit - pos);
            const size_t digits_start = hit + marker.size();
            const size_t close = in.find('"', digits_start);
            if (close == std::string::npos) {
                throw std::runtime_error("JSON serialization failed: unterminated integer literal");
            }
            out.append(in, digits_start, close - digits_start);
            pos = close + 1;
        }
        out.append(in, pos, std::string::npos);
        return out;
    }

    glz::json_t data_{};
};

} // namespace piiredact
