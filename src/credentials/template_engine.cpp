#include "credentials/template_engine.hpp"

#include <cctype>
#include <stdexcept>
#include <vector>

#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace playrun::credentials {
namespace {

enum class TokenKind {
    kName,
    kString,
    kInteger,
    kDot,
    kLParen,
    kRParen,
    kPipe,
    kEnd
};

struct Token {
    TokenKind kind;
    std::string text;
};

std::vector<Token> Tokenize(const std::string& expr) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < expr.size()) {
        const char c = expr[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::size_t j = i;
            while (j < expr.size() && (std::isalnum(static_cast<unsigned char>(expr[j])) || expr[j] == '_')) {
                ++j;
            }
            tokens.push_back({TokenKind::kName, expr.substr(i, j - i)});
            i = j;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            std::size_t j = i;
            while (j < expr.size() && std::isdigit(static_cast<unsigned char>(expr[j]))) {
                ++j;
            }
            tokens.push_back({TokenKind::kInteger, expr.substr(i, j - i)});
            i = j;
            continue;
        }
        if (c == '\'' || c == '"') {
            const auto close = expr.find(c, i + 1);
            if (close == std::string::npos) {
                throw TemplateError("unterminated string literal in '" + expr + "'");
            }
            tokens.push_back({TokenKind::kString, expr.substr(i + 1, close - i - 1)});
            i = close + 1;
            continue;
        }
        switch (c) {
            case '.':
                tokens.push_back({TokenKind::kDot, "."});
                break;
            case '(':
                tokens.push_back({TokenKind::kLParen, "("});
                break;
            case ')':
                tokens.push_back({TokenKind::kRParen, ")"});
                break;
            case '|':
                tokens.push_back({TokenKind::kPipe, "|"});
                break;
            default:
                throw TemplateError(std::string("unexpected character '") + c + "' in '" + expr + "'");
        }
        ++i;
    }
    tokens.push_back({TokenKind::kEnd, ""});
    return tokens;
}

std::string TypeName(const nlohmann::json& value) {
    if (value.is_string()) {
        return "str";
    }
    if (value.is_boolean()) {
        return "bool";
    }
    if (value.is_number_integer()) {
        return "int";
    }
    if (value.is_number()) {
        return "float";
    }
    if (value.is_object()) {
        return "dict";
    }
    if (value.is_array()) {
        return "list";
    }
    return "NoneType";
}

std::string TitleCase(const std::string& value) {
    std::string out = value;
    bool start = true;
    for (auto& ch : out) {
        const auto uc = static_cast<unsigned char>(ch);
        if (std::isalpha(uc)) {
            ch = static_cast<char>(start ? std::toupper(uc) : std::tolower(uc));
            start = false;
        } else {
            start = true;
        }
    }
    return out;
}

nlohmann::json ApplyStringFunction(const std::string& name, const nlohmann::json& value, bool as_filter) {
    if (!value.is_string()) {
        throw TemplateError("'" + TypeName(value) + "' object has no attribute '" + name + "'");
    }
    const auto text = value.get<std::string>();
    if (name == "upper") {
        return utils::ToUpper(text);
    }
    if (name == "lower") {
        return utils::ToLower(text);
    }
    if (name == "title") {
        return TitleCase(text);
    }
    if ((as_filter && name == "trim") || (!as_filter && name == "strip")) {
        return utils::Trim(text);
    }
    if (as_filter) {
        throw TemplateError("no filter named '" + name + "'");
    }
    throw TemplateError("'str' object has no attribute '" + name + "'");
}

class ExpressionEvaluator {
public:
    ExpressionEvaluator(const std::string& expr, const nlohmann::json& context, std::set<std::string>& referenced)
        : expr_(expr), tokens_(Tokenize(expr)), context_(context), referenced_(referenced) {}

    nlohmann::json Evaluate() {
        auto value = Primary();
        value = Postfix(std::move(value));
        while (Peek().kind == TokenKind::kPipe) {
            Next();
            const auto filter = Expect(TokenKind::kName, "filter name");
            if (Peek().kind == TokenKind::kLParen) {
                Next();
                Expect(TokenKind::kRParen, "')'");
            }
            value = ApplyStringFunction(filter.text, value, true);
        }
        if (Peek().kind != TokenKind::kEnd) {
            throw TemplateError("unexpected '" + Peek().text + "' in '" + expr_ + "'");
        }
        return value;
    }

private:
    const Token& Peek() const { return tokens_[pos_]; }

    Token Next() { return tokens_[pos_++]; }

    Token Expect(TokenKind kind, const std::string& what) {
        if (Peek().kind != kind) {
            throw TemplateError("expected " + what + " in '" + expr_ + "'");
        }
        return Next();
    }

    nlohmann::json Primary() {
        const auto token = Next();
        switch (token.kind) {
            case TokenKind::kName: {
                referenced_.insert(token.text);
                if (!context_.is_object() || !context_.contains(token.text)) {
                    throw TemplateError("'" + token.text + "' is undefined");
                }
                return context_[token.text];
            }
            case TokenKind::kString:
                return token.text;
            case TokenKind::kInteger:
                try {
                    return std::stoll(token.text);
                } catch (const std::out_of_range&) {
                    throw TemplateError("integer literal out of range in '" + expr_ + "'");
                }
            default:
                throw TemplateError("expected a name or literal in '" + expr_ + "'");
        }
    }

    nlohmann::json Postfix(nlohmann::json value) {
        while (true) {
            if (Peek().kind == TokenKind::kLParen) {
                throw TemplateError("'" + TypeName(value) + "' object is not callable");
            }
            if (Peek().kind != TokenKind::kDot) {
                return value;
            }
            Next();
            const auto name = Expect(TokenKind::kName, "attribute name");
            if (Peek().kind == TokenKind::kLParen) {
                Next();
                Expect(TokenKind::kRParen, "')'");
                value = ApplyStringFunction(name.text, value, false);
                continue;
            }
            if (!value.is_object() || !value.contains(name.text) || value[name.text].is_null()) {
                throw TemplateError("'" + TypeName(value) + "' object has no attribute '" + name.text + "'");
            }
            value = value[name.text];
        }
    }

    const std::string& expr_;
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    const nlohmann::json& context_;
    std::set<std::string>& referenced_;
};

std::string ToText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "True" : "False";
    }
    if (value.is_null()) {
        return "None";
    }
    return value.dump();
}

}  // namespace

RenderResult RenderTemplate(const std::string& source, const nlohmann::json& context) {
    RenderResult result{};
    std::size_t pos = 0;
    while (pos < source.size()) {
        const auto open = source.find('{', pos);
        if (open == std::string::npos || open + 1 >= source.size()) {
            result.text.append(source, pos, std::string::npos);
            break;
        }
        const char marker = source[open + 1];
        if (marker == '%' || marker == '#') {
            throw TemplateError(std::string("unsupported template tag '{") + marker + "'");
        }
        if (marker != '{') {
            result.text.append(source, pos, open + 1 - pos);
            pos = open + 1;
            continue;
        }
        result.text.append(source, pos, open - pos);
        const auto close = source.find("}}", open + 2);
        if (close == std::string::npos) {
            throw TemplateError("unexpected end of template, expected '}}'");
        }
        const auto expr = utils::Trim(source.substr(open + 2, close - open - 2));
        if (expr.empty()) {
            throw TemplateError("empty expression in template");
        }
        ExpressionEvaluator evaluator(expr, context, result.referenced);
        result.text += ToText(evaluator.Evaluate());
        pos = close + 2;
    }
    return result;
}

}  // namespace playrun::credentials
