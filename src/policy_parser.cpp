#include "policy_ast.hpp"
#include "authorizer/constants.hpp"
#include "authorizer/errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace authorizer::internal {

namespace {
    enum class TokenType {
        Int,
        Double,
        String,
        Ident,
        Op,
        End
    };

    struct Token {
        TokenType type;
        std::string text;
        nlohmann::json value;
        std::size_t position;
    };

    [[noreturn]] void fail(const std::string& msg, std::size_t position) {
        throw PolicyCompileError("Policy syntax error at offset " + std::to_string(position) + ": " + msg);
    }

    void appendUtf8(std::string& out, std::uint32_t cp, std::size_t position) {
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            fail("invalid code point in escape sequence", position);
        }
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

    class Lexer {
    public:
        explicit Lexer(std::string_view text) : text_(text) {}

        std::vector<Token> tokenize() {
            std::vector<Token> tokens;
            while (true) {
                skipWhitespace();
                if (pos_ >= text_.size()) {
                    tokens.push_back(Token{TokenType::End, "", nullptr, pos_});
                    return tokens;
                }
                tokens.push_back(next());
            }
        }

    private:
        void skipWhitespace() {
            while (pos_ < text_.size()) {
                char c = text_[pos_];
                if (std::isspace(static_cast<unsigned char>(c))) {
                    ++pos_;
                } else if (c == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '/') {
                    // Line comment
                    while (pos_ < text_.size() && text_[pos_] != '\n') ++pos_;
                } else {
                    return;
                }
            }
        }

        Token next() {
            std::size_t start = pos_;
            char c = text_[pos_];

            if (std::isdigit(static_cast<unsigned char>(c))) {
                return number();
            }

            if (c == '"' || c == '\'') {
                return string(false);
            }

            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                // Raw string prefix
                if ((c == 'r' || c == 'R') && pos_ + 1 < text_.size() &&
                    (text_[pos_ + 1] == '"' || text_[pos_ + 1] == '\'')) {
                    ++pos_;
                    Token token = string(true);
                    token.position = start;
                    return token;
                }
                while (pos_ < text_.size() &&
                       (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
                    ++pos_;
                }
                std::string word(text_.substr(start, pos_ - start));
                if (word == "in") {
                    return Token{TokenType::Op, word, nullptr, start};
                }
                return Token{TokenType::Ident, word, nullptr, start};
            }

            static constexpr std::string_view two_char_ops[] = {"<=", ">=", "==", "!=", "&&", "||"};
            for (auto op : two_char_ops) {
                if (text_.substr(pos_, 2) == op) {
                    pos_ += 2;
                    return Token{TokenType::Op, std::string(op), nullptr, start};
                }
            }

            static constexpr std::string_view single_char_ops = "()[]{}.,?:!-+*/%<>";
            if (single_char_ops.find(c) != std::string_view::npos) {
                ++pos_;
                return Token{TokenType::Op, std::string(1, c), nullptr, start};
            }

            fail(std::string("unexpected character '") + c + "'", start);
        }

        Token number() {
            std::size_t start = pos_;

            if (text_.substr(pos_, 2) == "0x" || text_.substr(pos_, 2) == "0X") {
                pos_ += 2;
                std::size_t digits = pos_;
                while (pos_ < text_.size() && std::isxdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
                return integer(text_.substr(digits, pos_ - digits), 16, start);
            }

            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;

            bool is_double = false;
            if (pos_ + 1 < text_.size() && text_[pos_] == '.' &&
                std::isdigit(static_cast<unsigned char>(text_[pos_ + 1]))) {
                is_double = true;
                ++pos_;
                while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            }
            if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
                std::size_t exp = pos_ + 1;
                if (exp < text_.size() && (text_[exp] == '+' || text_[exp] == '-')) ++exp;
                if (exp < text_.size() && std::isdigit(static_cast<unsigned char>(text_[exp]))) {
                    is_double = true;
                    pos_ = exp;
                    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
                }
            }

            std::string_view literal = text_.substr(start, pos_ - start);
            if (is_double) {
                std::string copy(literal);
                double value = std::strtod(copy.c_str(), nullptr);
                return Token{TokenType::Double, copy, value, start};
            }
            return integer(literal, 10, start);
        }

        Token integer(std::string_view digits, int base, std::size_t start) {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
            if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
                fail("invalid or out of range integer literal", start);
            }
            // Unsigned suffix is accepted and ignored
            if (pos_ < text_.size() && (text_[pos_] == 'u' || text_[pos_] == 'U')) ++pos_;
            return Token{TokenType::Int, std::string(text_.substr(start, pos_ - start)), value, start};
        }

        Token string(bool raw) {
            std::size_t start = pos_;
            char quote = text_[pos_];
            bool triple = text_.substr(pos_, 3) == std::string(3, quote);
            pos_ += triple ? 3 : 1;

            std::string value;
            while (true) {
                if (pos_ >= text_.size()) {
                    fail("unterminated string literal", start);
                }
                char c = text_[pos_];
                if (triple ? text_.substr(pos_, 3) == std::string(3, quote) : c == quote) {
                    pos_ += triple ? 3 : 1;
                    break;
                }
                if (!triple && c == '\n') {
                    fail("newline in string literal", start);
                }
                if (c == '\\' && !raw) {
                    escape(value);
                    continue;
                }
                value.push_back(c);
                ++pos_;
            }
            return Token{TokenType::String, value, value, start};
        }

        std::uint32_t hexDigits(std::size_t count) {
            if (pos_ + count > text_.size()) {
                fail("truncated escape sequence", pos_);
            }
            std::uint32_t cp = 0;
            auto digits = text_.substr(pos_, count);
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + count, cp, 16);
            if (ec != std::errc() || ptr != digits.data() + count) {
                fail("invalid hex escape sequence", pos_);
            }
            pos_ += count;
            return cp;
        }

        void escape(std::string& out) {
            std::size_t start = pos_;
            ++pos_;  // backslash
            if (pos_ >= text_.size()) {
                fail("truncated escape sequence", start);
            }
            char c = text_[pos_++];
            switch (c) {
                case '\\': out.push_back('\\'); break;
                case '"': out.push_back('"'); break;
                case '\'': out.push_back('\''); break;
                case '`': out.push_back('`'); break;
                case '?': out.push_back('?'); break;
                case 'a': out.push_back('\a'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'v': out.push_back('\v'); break;
                case 'x': case 'X': appendUtf8(out, hexDigits(2), start); break;
                case 'u': appendUtf8(out, hexDigits(4), start); break;
                case 'U': appendUtf8(out, hexDigits(8), start); break;
                default:
                    if (c >= '0' && c <= '3' && pos_ + 1 < text_.size() &&
                        text_[pos_] >= '0' && text_[pos_] <= '7' &&
                        text_[pos_ + 1] >= '0' && text_[pos_ + 1] <= '7') {
                        std::uint32_t cp = static_cast<std::uint32_t>((c - '0') * 64 + (text_[pos_] - '0') * 8 + (text_[pos_ + 1] - '0'));
                        pos_ += 2;
                        appendUtf8(out, cp, start);
                        break;
                    }
                    fail(std::string("invalid escape sequence '\\") + c + "'", start);
            }
        }

        std::string_view text_;
        std::size_t pos_ = 0;
    };

    class Parser {
    public:
        explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

        std::unique_ptr<Node> parse() {
            auto root = parseExpr();
            if (peek().type != TokenType::End) {
                fail("unexpected '" + peek().text + "'", peek().position);
            }
            return root;
        }

    private:
        // Bounds parser recursion on nested parentheses, lists and unary chains
        struct NestingGuard {
            explicit NestingGuard(Parser& parser) : parser_(parser) {
                if (++parser_.nesting_ > MAX_POLICY_DEPTH) {
                    fail("expression is nested too deeply", parser_.peek().position);
                }
            }
            ~NestingGuard() { --parser_.nesting_; }
            NestingGuard(const NestingGuard&) = delete;
            NestingGuard& operator=(const NestingGuard&) = delete;

            Parser& parser_;
        };

        [[nodiscard]] const Token& peek() const { return tokens_[pos_]; }

        [[nodiscard]] bool isOp(std::string_view op) const {
            return peek().type == TokenType::Op && peek().text == op;
        }

        Token advance() {
            Token token = tokens_[pos_];
            if (token.type != TokenType::End) ++pos_;
            return token;
        }

        bool accept(std::string_view op) {
            if (isOp(op)) {
                ++pos_;
                return true;
            }
            return false;
        }

        void expect(std::string_view op) {
            if (!accept(op)) {
                const auto& token = peek();
                fail("expected '" + std::string(op) + "' but found " +
                     (token.type == TokenType::End ? std::string("end of expression") : "'" + token.text + "'"),
                     token.position);
            }
        }

        std::string expectIdent(const char* what) {
            if (peek().type != TokenType::Ident) {
                fail(std::string("expected ") + what, peek().position);
            }
            return advance().text;
        }

        std::unique_ptr<Node> make(NodeKind kind, std::size_t position,
                                   std::vector<std::unique_ptr<Node>> args = {}) {
            auto node = std::make_unique<Node>();
            node->kind = kind;
            node->position = position;
            for (const auto& arg : args) {
                node->depth = std::max(node->depth, arg->depth + 1);
            }
            if (node->depth > MAX_POLICY_DEPTH) {
                fail("expression is nested too deeply", position);
            }
            node->args = std::move(args);
            return node;
        }

        template <typename... Args>
        static std::vector<std::unique_ptr<Node>> children(Args&&... args) {
            std::vector<std::unique_ptr<Node>> result;
            (result.push_back(std::forward<Args>(args)), ...);
            return result;
        }

        std::unique_ptr<Node> parseExpr() {
            NestingGuard guard(*this);
            auto condition = parseOr();
            if (isOp("?")) {
                auto position = advance().position;
                auto when_true = parseOr();
                expect(":");
                auto when_false = parseExpr();
                return make(NodeKind::Conditional, position,
                            children(std::move(condition), std::move(when_true), std::move(when_false)));
            }
            return condition;
        }

        std::unique_ptr<Node> parseOr() {
            auto left = parseAnd();
            while (isOp("||")) {
                auto position = advance().position;
                left = make(NodeKind::Or, position, children(std::move(left), parseAnd()));
            }
            return left;
        }

        std::unique_ptr<Node> parseAnd() {
            auto left = parseRelation();
            while (isOp("&&")) {
                auto position = advance().position;
                left = make(NodeKind::And, position, children(std::move(left), parseRelation()));
            }
            return left;
        }

        std::unique_ptr<Node> parseRelation() {
            static constexpr std::string_view relations[] = {"<", "<=", ">", ">=", "==", "!=", "in"};
            auto left = parseAddition();
            while (peek().type == TokenType::Op &&
                   std::find(std::begin(relations), std::end(relations), peek().text) != std::end(relations)) {
                auto op = advance();
                left = binary(op, std::move(left), parseAddition());
            }
            return left;
        }

        std::unique_ptr<Node> parseAddition() {
            auto left = parseMultiplication();
            while (isOp("+") || isOp("-")) {
                auto op = advance();
                left = binary(op, std::move(left), parseMultiplication());
            }
            return left;
        }

        std::unique_ptr<Node> parseMultiplication() {
            auto left = parseUnary();
            while (isOp("*") || isOp("/") || isOp("%")) {
                auto op = advance();
                left = binary(op, std::move(left), parseUnary());
            }
            return left;
        }

        std::unique_ptr<Node> binary(const Token& op, std::unique_ptr<Node> left, std::unique_ptr<Node> right) {
            auto node = make(NodeKind::Binary, op.position, children(std::move(left), std::move(right)));
            node->name = op.text;
            return node;
        }

        std::unique_ptr<Node> parseUnary() {
            if (isOp("!") || isOp("-")) {
                NestingGuard guard(*this);
                auto op = advance();
                auto operand = parseUnary();
                return make(op.text == "!" ? NodeKind::Not : NodeKind::Negate, op.position,
                            children(std::move(operand)));
            }
            return parseMember();
        }

        std::unique_ptr<Node> parseMember() {
            auto node = parsePrimary();
            while (true) {
                if (isOp(".")) {
                    auto position = advance().position;
                    auto name = expectIdent("field or method name after '.'");
                    if (isOp("(")) {
                        node = memberCall(std::move(node), name, position);
                    } else {
                        auto select = make(NodeKind::Select, position, children(std::move(node)));
                        select->name = std::move(name);
                        node = std::move(select);
                    }
                } else if (isOp("[")) {
                    auto position = advance().position;
                    auto index = parseExpr();
                    expect("]");
                    node = make(NodeKind::Index, position, children(std::move(node), std::move(index)));
                } else {
                    return node;
                }
            }
        }

        std::vector<std::unique_ptr<Node>> arguments() {
            std::vector<std::unique_ptr<Node>> args;
            expect("(");
            if (accept(")")) {
                return args;
            }
            do {
                args.push_back(parseExpr());
            } while (accept(","));
            expect(")");
            return args;
        }

        std::unique_ptr<Node> memberCall(std::unique_ptr<Node> receiver, const std::string& name, std::size_t position) {
            if (name == "exists" || name == "all" || name == "exists_one") {
                expect("(");
                auto variable = expectIdent("iteration variable name");
                expect(",");
                bound_.push_back(variable);
                auto predicate = parseExpr();
                bound_.pop_back();
                expect(")");

                auto node = make(NodeKind::Comprehension, position, children(std::move(receiver), std::move(predicate)));
                node->name = name;
                node->variable = std::move(variable);
                return node;
            }

            auto args = arguments();
            std::size_t arity = 0;
            if (name == "size") {
                arity = 0;
            } else if (name == "startsWith" || name == "endsWith" || name == "contains" || name == "matches") {
                arity = 1;
            } else {
                fail("unknown method '" + name + "'", position);
            }
            if (args.size() != arity) {
                fail("method '" + name + "' takes " + std::to_string(arity) + " argument(s)", position);
            }

            std::shared_ptr<const std::regex> pattern;
            if (name == "matches" && args[0]->kind == NodeKind::Literal && args[0]->value.is_string()) {
                try {
                    pattern = std::make_shared<const std::regex>(args[0]->value.get<std::string>(),
                                                                 std::regex::ECMAScript);
                } catch (const std::regex_error& e) {
                    fail(std::string("invalid regular expression: ") + e.what(), args[0]->position);
                }
            }

            args.insert(args.begin(), std::move(receiver));
            auto node = make(NodeKind::Call, position, std::move(args));
            node->name = name;
            node->hasReceiver = true;
            node->pattern = std::move(pattern);
            return node;
        }

        std::unique_ptr<Node> globalCall(const Token& ident) {
            const std::string& name = ident.text;
            auto args = arguments();

            if (name == "has") {
                if (args.size() != 1 || args[0]->kind != NodeKind::Select) {
                    fail("has() requires a field selection such as has(claims.email)", ident.position);
                }
                auto select = std::move(args[0]);
                auto node = make(NodeKind::Has, ident.position, std::move(select->args));
                node->name = std::move(select->name);
                return node;
            }

            if (name != "size" && name != "int" && name != "string") {
                fail("unknown function '" + name + "'", ident.position);
            }
            if (args.size() != 1) {
                fail("function '" + name + "' takes 1 argument", ident.position);
            }
            auto node = make(NodeKind::Call, ident.position, std::move(args));
            node->name = name;
            return node;
        }

        std::unique_ptr<Node> parsePrimary() {
            const Token& token = peek();
            switch (token.type) {
                case TokenType::Int:
                case TokenType::Double:
                case TokenType::String: {
                    auto literal = advance();
                    auto node = make(NodeKind::Literal, literal.position);
                    node->value = std::move(literal.value);
                    return node;
                }
                case TokenType::Ident: {
                    auto ident = advance();
                    if (isOp("(")) {
                        return globalCall(ident);
                    }
                    if (ident.text == "true" || ident.text == "false" || ident.text == "null") {
                        auto node = make(NodeKind::Literal, ident.position);
                        node->value = ident.text == "null" ? nlohmann::json(nullptr) : nlohmann::json(ident.text == "true");
                        return node;
                    }
                    if (ident.text != "header" && ident.text != "claims" &&
                        std::find(bound_.begin(), bound_.end(), ident.text) == bound_.end()) {
                        fail("undeclared reference to '" + ident.text + "'", ident.position);
                    }
                    auto node = make(NodeKind::Ident, ident.position);
                    node->name = ident.text;
                    return node;
                }
                case TokenType::Op:
                    if (token.text == "(") {
                        advance();
                        auto inner = parseExpr();
                        expect(")");
                        return inner;
                    }
                    if (token.text == "[") {
                        auto position = advance().position;
                        std::vector<std::unique_ptr<Node>> elements;
                        while (!isOp("]")) {
                            elements.push_back(parseExpr());
                            if (!accept(",")) break;
                        }
                        expect("]");
                        return make(NodeKind::List, position, std::move(elements));
                    }
                    fail("unexpected '" + token.text + "'", token.position);
                case TokenType::End:
                    fail("unexpected end of expression", token.position);
            }
            fail("unexpected token", token.position);
        }

        std::vector<Token> tokens_;
        std::size_t pos_ = 0;
        std::size_t nesting_ = 0;
        std::vector<std::string> bound_;
    };
}

std::unique_ptr<Node> parsePolicy(std::string_view text) {
    Lexer lexer(text);
    Parser parser(lexer.tokenize());
    return parser.parse();
}

}
