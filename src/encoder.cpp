#include <jsonpatch-cpp/encoder.hpp>

namespace jsonpatch_cpp {

namespace {

void append_unicode_escape(std::string& out, unsigned int code) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    out += "\\u";
    out.push_back(hex_chars[(code >> 12) & 0x0F]);
    out.push_back(hex_chars[(code >> 8) & 0x0F]);
    out.push_back(hex_chars[(code >> 4) & 0x0F]);
    out.push_back(hex_chars[code & 0x0F]);
}

// In compact JSON text '<', '>', '&' and the line/paragraph separators can
// only occur inside strings, so a plain byte scan is enough.
auto escape_special_characters(const std::string& text, bool escape_html) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (escape_html && (c == '<' || c == '>' || c == '&')) {
            append_unicode_escape(out, c);
            continue;
        }
        // U+2028 / U+2029 are E2 80 A8 / E2 80 A9 in UTF-8.
        if (c == 0xE2 && i + 2 < text.size() &&
            static_cast<unsigned char>(text[i + 1]) == 0x80) {
            const auto last = static_cast<unsigned char>(text[i + 2]);
            if (last == 0xA8 || last == 0xA9) {
                append_unicode_escape(out, 0x2000u | 0x28u | (last - 0xA8u));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

}  // anonymous namespace

auto encode(const Value& value, const OutputFormat& format) -> std::string {
    auto text = escape_special_characters(
        value.dump(-1, ' ', false, Value::error_handler_t::replace), format.escape_html);
    if (!format.prefix.empty() || !format.indent.empty()) {
        text = indent_json(text, format.prefix, format.indent);
    }
    text.push_back('\n');
    return text;
}

auto indent_json(std::string_view compact, std::string_view prefix,
                 std::string_view indent) -> std::string {
    auto out = std::string{};
    out.reserve(compact.size() * 2);
    auto depth = std::size_t{0};
    auto need_indent = false;
    auto in_string = false;
    auto escaped = false;

    auto newline = [&] {
        out.push_back('\n');
        out.append(prefix);
        for (std::size_t i = 0; i < depth; ++i) out.append(indent);
    };

    for (char c : compact) {
        if (in_string) {
            out.push_back(c);
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') continue;

        // Defer the line break after an opening bracket so that empty
        // containers stay "{}" and "[]".
        if (need_indent && c != '}' && c != ']') {
            need_indent = false;
            ++depth;
            newline();
        }
        switch (c) {
            case '"':
                in_string = true;
                out.push_back(c);
                break;
            case '{':
            case '[':
                need_indent = true;
                out.push_back(c);
                break;
            case ',':
                out.push_back(c);
                newline();
                break;
            case ':':
                out.push_back(c);
                out.push_back(' ');
                break;
            case '}':
            case ']':
                if (need_indent) {
                    need_indent = false;
                } else {
                    if (depth > 0) --depth;
                    newline();
                }
                out.push_back(c);
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

}  // namespace jsonpatch_cpp
