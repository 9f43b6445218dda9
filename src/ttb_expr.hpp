/*
 * File: src/ttb_expr.hpp
 * Project: TTB Broker Proxy
 * Purpose: Boolean selection expressions over a keyword map
 * Notes:
 *  - See DESIGN.md
 *  - Parse once, evaluate per target (and per BSP)
 *  - Comparing against a keyword the target does not have is false
 * Last updated: 2026-10-18
 *
 * Grammar:
 *   expr    := and ("or" and)*
 *   and     := unary ("and" unary)*
 *   unary   := "not" unary | primary
 *   primary := "(" expr ")" | "true" | "false"
 *            | SYMBOL [ ("=="|"!="|"<"|"<="|">"|">=") value
 *                     | ":" STRING
 *                     | "in" "[" value ("," value)* "]" ]
 *            | STRING "in" SYMBOL
 *   value   := STRING | NUMBER | "true" | "false"
 */

#pragma once
#include <cctype>
#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "common/keywords.hpp"
#include "common/target.hpp"

class Expression
{
public:
    enum class Kind
    {
        constant, // true / false
        symbol,   // truthiness of a keyword
        compare,  // SYMBOL op value
        match,    // SYMBOL : 'regex'
        in_list,  // SYMBOL in [ ... ]
        contains, // 'substring' in SYMBOL
        and_,
        or_,
        not_
    };
    enum class Op
    {
        eq,
        ne,
        lt,
        le,
        gt,
        ge
    };

    // Throws BrokerError(invalid_spec) naming the expression and where it came from
    static Expression parse(const std::string &text, const std::string &origin = "cmdline");

    bool evaluate(const KeywordMap &kws) const
    {
        switch (kind_)
        {
        case Kind::constant:
            return constant_;
        case Kind::symbol:
        {
            auto it = kws.find(symbol_);
            return it != kws.end() && keyword_truthy(it->second);
        }
        case Kind::compare:
        {
            auto it = kws.find(symbol_);
            return it != kws.end() && compare(it->second, op_, values_.front());
        }
        case Kind::match:
        {
            auto it = kws.find(symbol_);
            return it != kws.end() &&
                   std::regex_search(keyword_to_string(it->second), *regex_, std::regex_constants::match_continuous);
        }
        case Kind::in_list:
        {
            auto it = kws.find(symbol_);
            if (it == kws.end())
                return false;
            for (const auto &v : values_)
                if (compare(it->second, Op::eq, v))
                    return true;
            return false;
        }
        case Kind::contains:
        {
            auto it = kws.find(symbol_);
            return it != kws.end() &&
                   keyword_to_string(it->second).find(keyword_to_string(values_.front())) != std::string::npos;
        }
        case Kind::and_:
            for (const auto &c : children_)
                if (!c.evaluate(kws))
                    return false;
            return true;
        case Kind::or_:
            for (const auto &c : children_)
                if (c.evaluate(kws))
                    return true;
            return false;
        case Kind::not_:
            return !children_.front().evaluate(kws);
        }
        return false;
    }

    Kind kind() const { return kind_; }

    static Expression constant(bool v)
    {
        Expression e;
        e.kind_ = Kind::constant;
        e.constant_ = v;
        return e;
    }

private:
    struct Parser;

    Kind kind_ = Kind::constant;
    bool constant_ = true;
    Op op_ = Op::eq;
    std::string symbol_;
    std::vector<KeywordValue> values_;
    std::shared_ptr<const std::regex> regex_;
    std::vector<Expression> children_;

    static bool parse_int(const std::string &s, std::int64_t &out)
    {
        if (s.empty())
            return false;
        size_t pos = 0;
        try
        {
            out = std::stoll(s, &pos, 0);
        }
        catch (const std::logic_error &)
        {
            return false;
        }
        return pos == s.size();
    }

    template <class T>
    static bool ordered(const T &a, Op op, const T &b)
    {
        switch (op)
        {
        case Op::eq:
            return a == b;
        case Op::ne:
            return a != b;
        case Op::lt:
            return a < b;
        case Op::le:
            return a <= b;
        case Op::gt:
            return a > b;
        case Op::ge:
            return a >= b;
        }
        return false;
    }

    // integers compare numerically (also against numeric strings),
    // everything else by its text form
    static bool compare(const KeywordValue &lhs, Op op, const KeywordValue &rhs)
    {
        std::int64_t a, b;
        bool a_num = std::holds_alternative<std::int64_t>(lhs);
        bool b_num = std::holds_alternative<std::int64_t>(rhs);
        if (a_num || b_num)
        {
            bool ok_a = a_num ? (a = std::get<std::int64_t>(lhs), true) : parse_int(keyword_to_string(lhs), a);
            bool ok_b = b_num ? (b = std::get<std::int64_t>(rhs), true) : parse_int(keyword_to_string(rhs), b);
            if (ok_a && ok_b)
                return ordered(a, op, b);
        }
        return ordered(keyword_to_string(lhs), op, keyword_to_string(rhs));
    }
};

struct Expression::Parser
{
    static constexpr int kMaxNesting = 256;

    enum class Tok
    {
        end,
        lparen,
        rparen,
        lbracket,
        rbracket,
        comma,
        colon,
        op,
        string,
        number,
        word
    };
    struct Token
    {
        Tok type = Tok::end;
        std::string text;
        size_t column = 0;
    };

    const std::string &text;
    const std::string &origin;
    std::vector<Token> tokens;
    size_t pos = 0;
    int depth = 0; // open parentheses plus stacked `not`

    Parser(const std::string &t, const std::string &o) : text(t), origin(o) { tokenize(); }

    [[noreturn]] void fail(const std::string &what, size_t column) const
    {
        throw BrokerError(ErrorKind::invalid_spec,
                          "error evaluating target selection specification '" + text + "' from '" + origin +
                              "': " + what + " at column " + std::to_string(column + 1));
    }

    static bool symbol_char(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-' || c == '/';
    }

    void tokenize()
    {
        size_t i = 0;
        while (i < text.size())
        {
            char c = text[i];
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                ++i;
                continue;
            }
            Token t;
            t.column = i;
            if (c == '(' || c == ')' || c == '[' || c == ']' || c == ',' || c == ':')
            {
                t.type = c == '(' ? Tok::lparen : c == ')' ? Tok::rparen : c == '[' ? Tok::lbracket
                                                                  : c == ']' ? Tok::rbracket
                                                                  : c == ',' ? Tok::comma
                                                                             : Tok::colon;
                t.text = std::string(1, c);
                ++i;
            }
            else if (c == '=' || c == '!' || c == '<' || c == '>')
            {
                t.type = Tok::op;
                if (i + 1 < text.size() && text[i + 1] == '=')
                {
                    t.text = text.substr(i, 2);
                    i += 2;
                }
                else if (c == '<' || c == '>')
                {
                    t.text = std::string(1, c);
                    ++i;
                }
                else
                    fail(std::string("stray '") + c + "'", i);
            }
            else if (c == '"' || c == '\'')
            {
                t.type = Tok::string;
                ++i;
                bool closed = false;
                while (i < text.size())
                {
                    char d = text[i++];
                    if (d == c)
                    {
                        closed = true;
                        break;
                    }
                    if (d == '\\' && i < text.size())
                        d = text[i++];
                    t.text += d;
                }
                if (!closed)
                    fail("unterminated string", t.column);
            }
            else if (symbol_char(c))
            {
                while (i < text.size() && symbol_char(text[i]))
                    t.text += text[i++];
                std::int64_t n;
                t.type = Expression::parse_int(t.text, n) ? Tok::number : Tok::word;
            }
            else
                fail(std::string("unexpected character '") + c + "'", i);
            tokens.push_back(std::move(t));
        }
        Token e;
        e.column = text.size();
        tokens.push_back(e);
    }

    void enter(size_t column)
    {
        if (++depth > kMaxNesting)
            fail("nested deeper than " + std::to_string(kMaxNesting) + " levels", column);
    }

    const Token &peek() const { return tokens[pos]; }
    bool at_word(const char *w) const { return peek().type == Tok::word && peek().text == w; }
    const Token &next() { return tokens[pos < tokens.size() - 1 ? pos++ : pos]; }

    static bool keyword(const std::string &w)
    {
        return w == "and" || w == "or" || w == "not" || w == "in" || w == "true" || w == "false" || w == "True" ||
               w == "False";
    }

    void expect(Tok type, const char *what)
    {
        if (peek().type != type)
            fail(std::string("expected ") + what, peek().column);
        next();
    }

    Expression parse_all()
    {
        if (peek().type == Tok::end)
            fail("empty expression", 0);
        Expression e = parse_or();
        if (peek().type != Tok::end)
            fail("unexpected '" + peek().text + "'", peek().column);
        return e;
    }

    Expression parse_or()
    {
        Expression first = parse_and();
        if (!at_word("or"))
            return first;
        Expression e;
        e.kind_ = Kind::or_;
        e.children_.push_back(std::move(first));
        while (at_word("or"))
        {
            next();
            e.children_.push_back(parse_and());
        }
        return e;
    }

    Expression parse_and()
    {
        Expression first = parse_unary();
        if (!at_word("and"))
            return first;
        Expression e;
        e.kind_ = Kind::and_;
        e.children_.push_back(std::move(first));
        while (at_word("and"))
        {
            next();
            e.children_.push_back(parse_unary());
        }
        return e;
    }

    Expression parse_unary()
    {
        if (!at_word("not"))
            return parse_primary();
        enter(peek().column);
        next();
        Expression e;
        e.kind_ = Kind::not_;
        e.children_.push_back(parse_unary());
        --depth;
        return e;
    }

    KeywordValue parse_value()
    {
        const Token &t = next();
        switch (t.type)
        {
        case Tok::string:
            return t.text;
        case Tok::number:
        {
            std::int64_t n = 0;
            Expression::parse_int(t.text, n);
            return n;
        }
        case Tok::word:
            if (t.text == "true" || t.text == "True")
                return true;
            if (t.text == "false" || t.text == "False")
                return false;
            fail("expected a quoted string or number, got '" + t.text + "'", t.column);
        default:
            fail("expected a value", t.column);
        }
    }

    static Op op_from(const std::string &s)
    {
        if (s == "==")
            return Op::eq;
        if (s == "!=")
            return Op::ne;
        if (s == "<")
            return Op::lt;
        if (s == "<=")
            return Op::le;
        if (s == ">")
            return Op::gt;
        return Op::ge;
    }

    Expression parse_primary()
    {
        const Token &t = peek();
        if (t.type == Tok::lparen)
        {
            enter(t.column);
            next();
            Expression e = parse_or();
            expect(Tok::rparen, "')'");
            --depth;
            return e;
        }
        if (t.type == Tok::word && (t.text == "true" || t.text == "True"))
        {
            next();
            return Expression::constant(true);
        }
        if (t.type == Tok::word && (t.text == "false" || t.text == "False"))
        {
            next();
            return Expression::constant(false);
        }
        if (t.type == Tok::string)
        {
            Expression e;
            e.kind_ = Kind::contains;
            e.values_.push_back(next().text);
            if (!at_word("in"))
                fail("expected 'in' after string", peek().column);
            next();
            if (peek().type != Tok::word || keyword(peek().text))
                fail("expected a symbol after 'in'", peek().column);
            e.symbol_ = next().text;
            return e;
        }
        if (t.type != Tok::word && t.type != Tok::number)
            fail("expected a symbol", t.column);
        if (t.type == Tok::word && keyword(t.text))
            fail("unexpected '" + t.text + "'", t.column);

        Expression e;
        e.symbol_ = next().text;
        const Token &o = peek();
        if (o.type == Tok::op)
        {
            e.kind_ = Kind::compare;
            e.op_ = op_from(next().text);
            e.values_.push_back(parse_value());
        }
        else if (o.type == Tok::colon)
        {
            next();
            const Token &r = peek();
            if (r.type != Tok::string)
                fail("expected a quoted regular expression", r.column);
            e.kind_ = Kind::match;
            try
            {
                e.regex_ = std::make_shared<const std::regex>(r.text);
            }
            catch (const std::regex_error &err)
            {
                fail(std::string("bad regular expression: ") + err.what(), r.column);
            }
            next();
        }
        else if (at_word("in"))
        {
            next();
            expect(Tok::lbracket, "'['");
            e.kind_ = Kind::in_list;
            e.values_.push_back(parse_value());
            while (peek().type == Tok::comma)
            {
                next();
                e.values_.push_back(parse_value());
            }
            expect(Tok::rbracket, "']'");
        }
        else
            e.kind_ = Kind::symbol;
        return e;
    }
};

inline Expression Expression::parse(const std::string &text, const std::string &origin)
{
    Parser p(text, origin);
    return p.parse_all();
}
