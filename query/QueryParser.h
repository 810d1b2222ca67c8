// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_QUERYPARSER_H
#define FSINDEX_QUERY_QUERYPARSER_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "QueryExpression.h"

namespace FsIndex {
    /**
     * Recursive-descent parser for the search box syntax.
     *
     *   and     := or+             (juxtaposition or AND)
     *   or      := not ('|' not)*  ('|' or OR)
     *   not     := ('!' | NOT)* primary
     *   primary := '(' and ')' | '<' and '>' | word | "phrase"
     *
     * Words of the form key:value become filters when the key is known, text otherwise.
     */
    class QueryParser {
    public:
        // Throws QueryParseError. An empty input yields an empty And.
        [[nodiscard]] static QueryExpression parse(std::string_view input);

    private:
        enum class TokenKind {
            Word,
            Phrase,
            LParen,
            RParen,
            LAngle,
            RAngle,
            Pipe,
            Bang,
            And,
            Or,
            Not
        };

        struct Token {
            TokenKind kind;
            std::string text;
            std::size_t position;
        };

        explicit QueryParser(std::vector<Token> tokens) : m_tokens(std::move(tokens)) {}

        static std::vector<Token> tokenize(std::string_view input);
        static QueryTerm parseTerm(const Token& token);

        QueryExpression parseAnd(std::optional<TokenKind> closing);
        QueryExpression parseOr(std::optional<TokenKind> closing);
        QueryExpression parseNot();
        QueryExpression parsePrimary();
        QueryExpression parseGroup(TokenKind closing);

        [[nodiscard]] const Token* peek() const;
        [[nodiscard]] bool peekIs(TokenKind kind) const;
        bool consume(TokenKind kind);
        [[nodiscard]] bool atEnd() const { return m_index >= m_tokens.size(); }
        [[nodiscard]] bool nextStartsOperand() const;
        [[nodiscard]] bool nextIsOrSeparator() const;

        std::vector<Token> m_tokens;
        std::size_t m_index = 0;
    };
}

#endif //FSINDEX_QUERY_QUERYPARSER_H
