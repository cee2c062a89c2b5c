#include "regwire/core/type_ref.hpp"

#include "regwire/core/serde.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace regwire {

namespace {

constexpr int kMaxTypeDepth = 32;

constexpr std::array<std::string_view, 14> kFundamentalWords = {
    "void",
    "bool",
    "char",
    "char8_t",
    "char16_t",
    "char32_t",
    "wchar_t",
    "short",
    "int",
    "long",
    "signed",
    "unsigned",
    "float",
    "double",
};

bool is_fundamental_word(std::string_view word) noexcept {
    return std::find(kFundamentalWords.begin(), kFundamentalWords.end(), word) !=
           kFundamentalWords.end();
}

// Non-ASCII bytes are accepted so UTF-8 identifiers pass through untouched.
bool is_ident_start(unsigned char c) noexcept {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool is_ident_char(unsigned char c) noexcept {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

class type_parser {
public:
    explicit type_parser(std::string_view text) : text_(text) {}

    std::optional<type_ref> parse() {
        auto ref = parse_type(0);
        skip_ws();
        if (!ref || pos_ != text_.size()) {
            return std::nullopt;
        }
        return ref;
    }

private:
    std::optional<type_ref> parse_type(int depth) {
        if (depth > kMaxTypeDepth) {
            return std::nullopt;
        }
        skip_ws();
        bool global = consume("::");
        auto word = identifier();
        if (word.empty()) {
            return std::nullopt;
        }

        type_ref ref;
        if (!global && is_fundamental_word(word)) {
            ref.name = std::string(word);
            ref.is_fundamental = true;
            while (true) {
                size_t save = pos_;
                skip_ws();
                auto next = identifier();
                if (next.empty() || !is_fundamental_word(next)) {
                    pos_ = save;
                    break;
                }
                ref.name += ' ';
                ref.name += next;
            }
        } else {
            ref.name = std::string(word);
            while (consume("::")) {
                auto part = identifier();
                if (part.empty()) {
                    return std::nullopt;
                }
                ref.name += "::";
                ref.name += part;
            }
            if (consume("<")) {
                do {
                    auto arg = parse_type(depth + 1);
                    if (!arg) {
                        return std::nullopt;
                    }
                    ref.args.push_back(std::move(*arg));
                } while (consume(","));
                if (!consume(">")) {
                    return std::nullopt;
                }
            }
        }

        if (!parse_suffix(ref.suffix)) {
            return std::nullopt;
        }
        return ref;
    }

    bool parse_suffix(std::string& suffix) {
        while (true) {
            skip_ws();
            if (pos_ >= text_.size()) {
                return true;
            }
            char c = text_[pos_];
            if (c == '*' || c == '&') {
                suffix.push_back(c);
                ++pos_;
            } else if (c == '[') {
                size_t close = text_.find(']', pos_);
                if (close == std::string_view::npos) {
                    return false;
                }
                auto extent = text_.substr(pos_ + 1, close - pos_ - 1);
                if (!std::all_of(extent.begin(), extent.end(), [](char d) {
                        return std::isdigit(static_cast<unsigned char>(d));
                    })) {
                    return false;
                }
                suffix.append(text_.substr(pos_, close - pos_ + 1));
                pos_ = close + 1;
            } else {
                return true;
            }
        }
    }

    std::string_view identifier() {
        if (pos_ >= text_.size() || !is_ident_start(static_cast<unsigned char>(text_[pos_]))) {
            return {};
        }
        size_t begin = pos_;
        while (pos_ < text_.size() && is_ident_char(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        return text_.substr(begin, pos_ - begin);
    }

    bool consume(std::string_view token) {
        skip_ws();
        if (text_.substr(pos_).starts_with(token)) {
            pos_ += token.size();
            return true;
        }
        return false;
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    std::string_view text_;
    size_t pos_ = 0;
};

void append_name(std::string& out, const type_ref& ref, bool qualified) {
    if (qualified && !ref.is_fundamental && !ref.is_type_parameter) {
        out += "::";
    }
    out += ref.name;
    if (!ref.args.empty()) {
        out += '<';
        for (size_t i = 0; i < ref.args.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            append_name(out, ref.args[i], qualified);
        }
        out += '>';
    }
    out += ref.suffix;
}

} // namespace

bool is_fundamental_type_name(std::string_view name) {
    auto ref = type_parser(name).parse();
    return ref && ref->is_fundamental && ref->suffix.empty();
}

bool is_qualified_name(std::string_view text) {
    auto ref = type_parser(text).parse();
    return ref && !ref->is_fundamental && !ref->is_generic() && ref->suffix.empty();
}

std::string_view normalize_qualified_name(std::string_view text) noexcept {
    text = serde::trim_view(text);
    if (text.starts_with("::")) {
        text.remove_prefix(2);
    }
    return text;
}

std::optional<type_ref> parse_type_ref(std::string_view text) {
    return type_parser(text).parse();
}

std::optional<type_ref> parse_type_ref(std::string_view text,
                                       const std::vector<std::string>& type_parameters) {
    auto ref = parse_type_ref(text);
    if (ref) {
        mark_type_parameters(*ref, type_parameters);
    }
    return ref;
}

void mark_type_parameters(type_ref& ref, const std::vector<std::string>& type_parameters) {
    if (!ref.is_fundamental && ref.args.empty() && ref.name.find("::") == std::string::npos &&
        std::find(type_parameters.begin(), type_parameters.end(), ref.name) !=
            type_parameters.end()) {
        ref.is_type_parameter = true;
    }
    for (auto& arg : ref.args) {
        mark_type_parameters(arg, type_parameters);
    }
}

bool contains_type_parameter(const type_ref& ref) noexcept {
    if (ref.is_type_parameter) {
        return true;
    }
    return std::any_of(ref.args.begin(), ref.args.end(), [](const type_ref& arg) {
        return contains_type_parameter(arg);
    });
}

type_ref substitute(const type_ref& ref,
                    const std::vector<std::string>& params,
                    const std::vector<type_ref>& args) {
    if (ref.is_type_parameter) {
        auto it = std::find(params.begin(), params.end(), ref.name);
        auto idx = static_cast<size_t>(it - params.begin());
        if (it != params.end() && idx < args.size()) {
            type_ref bound = args[idx];
            bound.suffix += ref.suffix;
            return bound;
        }
        return ref;
    }
    type_ref out = ref;
    for (auto& arg : out.args) {
        arg = substitute(arg, params, args);
    }
    return out;
}

std::string display_name(const type_ref& ref) {
    std::string out;
    append_name(out, ref, true);
    return out;
}

std::string written_name(const type_ref& ref) {
    std::string out;
    append_name(out, ref, false);
    return out;
}

} // namespace regwire
