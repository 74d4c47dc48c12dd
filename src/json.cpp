#include "json.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <fmt/format.h>

namespace ztgate::json {

namespace {

constexpr int kMaxDepth = 128;

class Parser {
public:
    explicit Parser(std::string_view input) : in_(input) {}

    std::expected<Value, ParseError> run() {
        auto v = parse_value(0);
        if (!v) return v;
        skip_ws();
        if (pos_ != in_.size()) return fail("trailing characters after document");
        return v;
    }

private:
    std::string_view in_;
    size_t pos_ = 0;

    std::unexpected<ParseError> fail(std::string msg) const {
        return std::unexpected(ParseError{std::move(msg), pos_});
    }

    void skip_ws() {
        while (pos_ < in_.size() && (in_[pos_] == ' ' || in_[pos_] == '\t' ||
                                     in_[pos_] == '\n' || in_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume_literal(std::string_view lit) {
        if (in_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    std::expected<Value, ParseError> parse_value(int depth) {
        if (depth > kMaxDepth) return fail("nesting too deep");
        skip_ws();
        if (pos_ >= in_.size()) return fail("unexpected end of input");

        char c = in_[pos_];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') {
            auto s = parse_string();
            if (!s) return std::unexpected(s.error());
            return Value(std::move(*s));
        }
        if (consume_literal("true")) return Value(true);
        if (consume_literal("false")) return Value(false);
        if (consume_literal("null")) return Value();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        return fail(fmt::format("unexpected character '{}'", c));
    }

    std::expected<Value, ParseError> parse_object(int depth) {
        ++pos_; // '{'
        Object obj;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == '}') {
            ++pos_;
            return Value(std::move(obj));
        }
        while (true) {
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != '"') return fail("expected object key");
            auto key = parse_string();
            if (!key) return std::unexpected(key.error());
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != ':') return fail("expected ':'");
            ++pos_;
            auto val = parse_value(depth + 1);
            if (!val) return val;
            obj.insert_or_assign(std::move(*key), std::move(*val));
            skip_ws();
            if (pos_ >= in_.size()) return fail("unterminated object");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == '}') { ++pos_; break; }
            return fail("expected ',' or '}'");
        }
        return Value(std::move(obj));
    }

    std::expected<Value, ParseError> parse_array(int depth) {
        ++pos_; // '['
        Array arr;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == ']') {
            ++pos_;
            return Value(std::move(arr));
        }
        while (true) {
            auto val = parse_value(depth + 1);
            if (!val) return val;
            arr.push_back(std::move(*val));
            skip_ws();
            if (pos_ >= in_.size()) return fail("unterminated array");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == ']') { ++pos_; break; }
            return fail("expected ',' or ']'");
        }
        return Value(std::move(arr));
    }

    std::expected<Value, ParseError> parse_number() {
        size_t start = pos_;
        if (in_[pos_] == '-') ++pos_;
        while (pos_ < in_.size()) {
            char c = in_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' ||
                c == 'E' || c == '+' || c == '-') {
                ++pos_;
            } else {
                break;
            }
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(in_.data() + start, in_.data() + pos_, d);
        if (ec != std::errc() || ptr != in_.data() + pos_) {
            pos_ = start;
            return fail("malformed number");
        }
        return Value(d);
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::expected<uint32_t, ParseError> parse_hex4() {
        if (pos_ + 4 > in_.size()) return fail("truncated \\u escape");
        uint32_t v = 0;
        auto [ptr, ec] = std::from_chars(in_.data() + pos_, in_.data() + pos_ + 4, v, 16);
        if (ec != std::errc() || ptr != in_.data() + pos_ + 4) return fail("invalid \\u escape");
        pos_ += 4;
        return v;
    }

    std::expected<std::string, ParseError> parse_string() {
        ++pos_; // opening quote
        std::string out;
        while (pos_ < in_.size()) {
            char c = in_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= in_.size()) break;
            char e = in_[pos_++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) return std::unexpected(cp.error());
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF && consume_literal("\\u")) {
                        auto lo = parse_hex4();
                        if (!lo) return std::unexpected(lo.error());
                        if (*lo >= 0xDC00 && *lo <= 0xDFFF) {
                            code = 0x10000 + ((code - 0xD800) << 10) + (*lo - 0xDC00);
                        } else {
                            return fail("unpaired surrogate");
                        }
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return fail(fmt::format("invalid escape '\\{}'", e));
            }
        }
        return fail("unterminated string");
    }
};

void dump_to(std::string& out, const Value& v) {
    if (v.is_null()) {
        out += "null";
    } else if (v.is_bool()) {
        out += v.as_bool() ? "true" : "false";
    } else if (v.is_number()) {
        double d = v.as_number();
        if (!std::isfinite(d)) {
            out += "null";
        } else if (d == std::trunc(d) && std::fabs(d) < 9007199254740992.0) {
            out += fmt::format("{}", static_cast<int64_t>(d));
        } else {
            out += fmt::format("{}", d);
        }
    } else if (v.is_string()) {
        out += '"';
        append_escaped(out, v.as_string());
        out += '"';
    } else if (v.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : v.as_array()) {
            if (!first) out += ',';
            first = false;
            dump_to(out, item);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : v.as_object()) {
            if (!first) out += ',';
            first = false;
            out += '"';
            append_escaped(out, key);
            out += "\":";
            dump_to(out, item);
        }
        out += '}';
    }
}

} // namespace

void append_escaped(std::string& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                } else {
                    out += c;
                }
        }
    }
}

std::expected<Value, ParseError> parse(std::string_view input) {
    return Parser(input).run();
}

std::string dump(const Value& value) {
    std::string out;
    dump_to(out, value);
    return out;
}

} // namespace ztgate::json
