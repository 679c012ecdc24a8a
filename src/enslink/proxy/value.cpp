#include <enslink/proxy/value.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace enslink::proxy {

    Value::Value(bool b) : data(b) {}
    Value::Value(int64_t i) : data(i) {}
    Value::Value(double d) : data(d) {}
    Value::Value(const char *s) : data(std::string(s)) {}
    Value::Value(std::string s) : data(std::move(s)) {}
    Value::Value(ProxyPtr p) : data(std::move(p)) {}
    Value::Value(List l) : data(std::move(l)) {}
    Value::Value(Dict d) : data(std::move(d)) {}
    Value::Value(RawText r) : data(std::move(r)) {}

    const Value *Value::get(std::string_view key) const {
        const auto *dict = std::get_if<Dict>(&data);
        if (!dict) {
            return nullptr;
        }
        for (const auto &entry : *dict) {
            if (entry.key.is_string() && entry.key.as_string() == key) {
                return &entry.value;
            }
        }
        return nullptr;
    }

    namespace {

        std::string quote(const std::string &text) {
            std::string out = "'";
            for (char c : text) {
                switch (c) {
                case '\\':
                    out += "\\\\";
                    break;
                case '\'':
                    out += "\\'";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    out.push_back(c);
                }
            }
            out.push_back('\'');
            return out;
        }

        template <class... Ts> struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    } // namespace

    std::string Value::repr() const {
        return std::visit(
            overloaded{
                [](std::monostate) -> std::string { return "None"; },
                [](bool b) -> std::string { return b ? "True" : "False"; },
                [](int64_t i) -> std::string { return std::to_string(i); },
                [](double d) -> std::string {
                    if (std::isnan(d)) {
                        return "nan";
                    }
                    if (std::isinf(d)) {
                        return d < 0 ? "-inf" : "inf";
                    }
                    char buffer[64];
                    auto converted = std::to_chars(buffer, buffer + sizeof(buffer), d);
                    std::string text(buffer, converted.ptr);
                    if (text.find_first_of(".e") == std::string::npos) {
                        text += ".0";
                    }
                    return text;
                },
                [](const std::string &s) -> std::string { return quote(s); },
                [](const ProxyPtr &p) -> std::string { return p ? p->remote_expression() : "None"; },
                [](const List &l) -> std::string {
                    std::string out = "[";
                    for (size_t i = 0; i < l.size(); ++i) {
                        if (i > 0) {
                            out += ", ";
                        }
                        out += l[i].repr();
                    }
                    return out + "]";
                },
                [](const Dict &d) -> std::string {
                    std::string out = "{";
                    for (size_t i = 0; i < d.size(); ++i) {
                        if (i > 0) {
                            out += ", ";
                        }
                        out += d[i].key.repr() + ": " + d[i].value.repr();
                    }
                    return out + "}";
                },
                [](const RawText &r) -> std::string { return r.text; },
            },
            data);
    }

    namespace {

        // Walks literal text across pieces; object pieces are single atoms
        class Cursor {
          public:
            explicit Cursor(const std::vector<ValuePiece> &pieces) : pieces_(pieces) { settle(); }

            bool at_end() const { return piece_ >= pieces_.size(); }
            bool at_object() const { return !at_end() && pieces_[piece_].object != nullptr; }

            // '\0' at the end or on an object atom
            char peek() const {
                if (at_end() || at_object()) {
                    return '\0';
                }
                return pieces_[piece_].text[offset_];
            }

            // Characters left in the current literal piece
            std::string_view rest() const {
                if (at_end() || at_object()) {
                    return {};
                }
                return std::string_view(pieces_[piece_].text).substr(offset_);
            }

            void advance(size_t count = 1) {
                if (at_object()) {
                    ++piece_;
                    offset_ = 0;
                } else {
                    offset_ += count;
                }
                settle();
            }

            const ProxyPtr &object() const { return pieces_[piece_].object; }

            void skip_whitespace() {
                while (!at_end() && !at_object()) {
                    char c = peek();
                    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                        break;
                    }
                    advance();
                }
            }

          private:
            // Step over exhausted literal pieces
            void settle() {
                while (piece_ < pieces_.size() && !pieces_[piece_].object && offset_ >= pieces_[piece_].text.size()) {
                    ++piece_;
                    offset_ = 0;
                }
            }

            const std::vector<ValuePiece> &pieces_;
            size_t piece_{0};
            size_t offset_{0};
        };

        constexpr int MAX_DEPTH = 256;

        class Parser {
          public:
            explicit Parser(const std::vector<ValuePiece> &pieces) : cursor_(pieces) {}

            bool parse_document(Value &out) {
                cursor_.skip_whitespace();
                if (!parse(out, 0)) {
                    return false;
                }
                cursor_.skip_whitespace();
                return cursor_.at_end();
            }

          private:
            bool parse(Value &out, int depth) {
                if (depth > MAX_DEPTH) {
                    return false;
                }
                cursor_.skip_whitespace();
                if (cursor_.at_end()) {
                    return false;
                }
                if (cursor_.at_object()) {
                    out = Value(cursor_.object());
                    cursor_.advance();
                    return true;
                }

                char c = cursor_.peek();
                switch (c) {
                case '[':
                    return parse_sequence(out, ']', depth);
                case '(':
                    return parse_sequence(out, ')', depth);
                case '{':
                    return parse_braces(out, depth);
                case '\'':
                case '"':
                    return parse_string(out);
                default:
                    break;
                }

                if ((c == 'b' || c == 'u' || c == 'r') && cursor_.rest().size() > 1 &&
                    (cursor_.rest()[1] == '\'' || cursor_.rest()[1] == '"')) {
                    bool raw = c == 'r';
                    cursor_.advance();
                    return parse_string(out, raw);
                }
                return parse_word(out);
            }

            bool parse_sequence(Value &out, char close, int depth) {
                cursor_.advance(); // opening bracket
                List items;
                cursor_.skip_whitespace();
                if (cursor_.peek() == close) {
                    cursor_.advance();
                    out = Value(std::move(items));
                    return true;
                }
                while (true) {
                    Value item;
                    if (!parse(item, depth + 1)) {
                        return false;
                    }
                    items.push_back(std::move(item));
                    cursor_.skip_whitespace();
                    char c = cursor_.peek();
                    if (c == ',') {
                        cursor_.advance();
                        cursor_.skip_whitespace();
                        if (cursor_.peek() == close) {
                            cursor_.advance();
                            break;
                        }
                        continue;
                    }
                    if (c == close) {
                        cursor_.advance();
                        break;
                    }
                    return false;
                }
                out = Value(std::move(items));
                return true;
            }

            // dict, or set (kept as a list)
            bool parse_braces(Value &out, int depth) {
                cursor_.advance();
                cursor_.skip_whitespace();
                if (cursor_.peek() == '}') {
                    cursor_.advance();
                    out = Value(Dict{});
                    return true;
                }

                Value first;
                if (!parse(first, depth + 1)) {
                    return false;
                }
                cursor_.skip_whitespace();
                if (cursor_.peek() != ':') {
                    List items;
                    items.push_back(std::move(first));
                    while (cursor_.peek() == ',') {
                        cursor_.advance();
                        cursor_.skip_whitespace();
                        if (cursor_.peek() == '}') {
                            break;
                        }
                        Value item;
                        if (!parse(item, depth + 1)) {
                            return false;
                        }
                        items.push_back(std::move(item));
                        cursor_.skip_whitespace();
                    }
                    if (cursor_.peek() != '}') {
                        return false;
                    }
                    cursor_.advance();
                    out = Value(std::move(items));
                    return true;
                }

                Dict entries;
                Value key = std::move(first);
                while (true) {
                    cursor_.advance(); // ':'
                    Value value;
                    if (!parse(value, depth + 1)) {
                        return false;
                    }
                    entries.push_back(DictEntry{std::move(key), std::move(value)});
                    cursor_.skip_whitespace();
                    char c = cursor_.peek();
                    if (c == '}') {
                        cursor_.advance();
                        break;
                    }
                    if (c != ',') {
                        return false;
                    }
                    cursor_.advance();
                    cursor_.skip_whitespace();
                    if (cursor_.peek() == '}') {
                        cursor_.advance();
                        break;
                    }
                    key = Value();
                    if (!parse(key, depth + 1)) {
                        return false;
                    }
                    cursor_.skip_whitespace();
                    if (cursor_.peek() != ':') {
                        return false;
                    }
                }
                out = Value(std::move(entries));
                return true;
            }

            static void append_utf8(std::string &out, uint32_t cp) {
                if (cp < 0x80) {
                    out.push_back(static_cast<char>(cp));
                } else if (cp < 0x800) {
                    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else if (cp < 0x10000) {
                    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else {
                    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
            }

            bool read_hex(size_t digits, uint32_t &value) {
                auto rest = cursor_.rest();
                if (rest.size() < digits) {
                    return false;
                }
                auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + digits, value, 16);
                if (ec != std::errc() || ptr != rest.data() + digits) {
                    return false;
                }
                cursor_.advance(digits);
                return true;
            }

            // Strings never span an object atom
            bool parse_string(Value &out, bool raw = false) {
                const char quote_char = cursor_.peek();
                cursor_.advance();
                std::string text;
                while (true) {
                    if (cursor_.at_end() || cursor_.at_object()) {
                        return false;
                    }
                    char c = cursor_.peek();
                    cursor_.advance();
                    if (c == quote_char) {
                        break;
                    }
                    if (c != '\\') {
                        text.push_back(c);
                        continue;
                    }
                    if (cursor_.at_end() || cursor_.at_object()) {
                        return false;
                    }
                    char e = cursor_.peek();
                    if (raw) {
                        text.push_back('\\');
                        text.push_back(e);
                        cursor_.advance();
                        continue;
                    }
                    cursor_.advance();
                    uint32_t cp = 0;
                    switch (e) {
                    case 'n':
                        text.push_back('\n');
                        break;
                    case 't':
                        text.push_back('\t');
                        break;
                    case 'r':
                        text.push_back('\r');
                        break;
                    case '0':
                        text.push_back('\0');
                        break;
                    case 'x':
                        if (!read_hex(2, cp)) {
                            return false;
                        }
                        text.push_back(static_cast<char>(cp));
                        break;
                    case 'u':
                        if (!read_hex(4, cp)) {
                            return false;
                        }
                        append_utf8(text, cp);
                        break;
                    case 'U':
                        if (!read_hex(8, cp)) {
                            return false;
                        }
                        append_utf8(text, cp);
                        break;
                    default:
                        text.push_back(e);
                    }
                }
                out = Value(std::move(text));
                return true;
            }

            // None, True, False, numbers
            bool parse_word(Value &out) {
                auto rest = cursor_.rest();
                size_t length = 0;
                while (length < rest.size()) {
                    char c = rest[length];
                    bool word_char = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                     c == '_' || c == '.' || c == '+' || c == '-';
                    if (!word_char) {
                        break;
                    }
                    ++length;
                }
                if (length == 0) {
                    return false;
                }
                std::string_view word = rest.substr(0, length);

                if (word == "None") {
                    out = Value();
                } else if (word == "True") {
                    out = Value(true);
                } else if (word == "False") {
                    out = Value(false);
                } else if (word == "inf" || word == "+inf") {
                    out = Value(std::numeric_limits<double>::infinity());
                } else if (word == "-inf") {
                    out = Value(-std::numeric_limits<double>::infinity());
                } else if (word == "nan") {
                    out = Value(std::numeric_limits<double>::quiet_NaN());
                } else if (!parse_number(word, out)) {
                    return false;
                }
                cursor_.advance(length);
                return true;
            }

            static bool parse_number(std::string_view word, Value &out) {
                const char *begin = word.data();
                const char *end = word.data() + word.size();
                if (*begin == '+') {
                    ++begin;
                }
                if (begin == end) {
                    return false;
                }

                if (word.find_first_of(".eE") == std::string_view::npos) {
                    int64_t integer = 0;
                    auto [ptr, ec] = std::from_chars(begin, end, integer);
                    if (ec == std::errc() && ptr == end) {
                        out = Value(integer);
                        return true;
                    }
                    if (ec != std::errc::result_out_of_range) {
                        return false;
                    }
                    // Out of int64 range: keep the magnitude as a float
                }

                std::string copy(begin, end);
                char *parsed_end = nullptr;
                double number = std::strtod(copy.c_str(), &parsed_end);
                if (parsed_end != copy.c_str() + copy.size()) {
                    return false;
                }
                out = Value(number);
                return true;
            }

            Cursor cursor_;
        };

    } // namespace

    Result<Value> parse_value(const std::vector<ValuePiece> &pieces) {
        Value value;
        Parser parser(pieces);
        if (!parser.parse_document(value)) {
            return Result<Value>::precondition("Result text is not a literal");
        }
        return Result<Value>::ok(std::move(value));
    }

    Result<Value> parse_value(std::string_view text) {
        std::vector<ValuePiece> pieces;
        pieces.push_back(ValuePiece{std::string(text), nullptr});
        return parse_value(pieces);
    }

} // namespace enslink::proxy
