// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "QueryParser.h"
#include "QueryError.h"
#include "QueryPath.h"
#include "TextMatch.h"

#include <utility>

namespace FsIndex {
    namespace {
        bool isSpace(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
            while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
            return s;
        }

        std::optional<std::string> optionalArgument(std::string_view argument) {
            if (argument.empty()) return std::nullopt;
            return std::string(argument);
        }

        // Splits on ';', trimming each piece and dropping empty ones.
        std::vector<std::string> splitList(std::string_view argument) {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (start <= argument.size()) {
                std::size_t semi = argument.find(';', start);
                if (semi == std::string_view::npos) semi = argument.size();
                const std::string_view piece = trim(argument.substr(start, semi - start));
                if (!piece.empty()) out.emplace_back(piece);
                start = semi + 1;
            }
            return out;
        }

        std::string positionSuffix(std::size_t position) {
            return " near byte " + std::to_string(position);
        }
    }

    QueryExpression QueryParser::parse(std::string_view input) {
        std::vector<Token> tokens = tokenize(input);
        if (tokens.empty()) return QueryExpression::makeAnd({});

        QueryParser parser(std::move(tokens));
        QueryExpression expression = parser.parseAnd(std::nullopt);
        if (const Token* token = parser.peek())
            throw QueryParseError("unexpected token" + positionSuffix(token->position));
        if (!queryExpressionHasTerms(expression))
            throw QueryParseError("query must contain at least one term");
        return expression;
    }

    QueryExpression QueryParser::parseAnd(std::optional<TokenKind> closing) {
        std::vector<QueryExpression> parts;

        while (!atEnd() && !(closing && peekIs(*closing))) {
            if (consume(TokenKind::And)) continue;

            parts.push_back(parseOr(closing));

            if (consume(TokenKind::And)) continue;
            if (nextStartsOperand()) continue;
            break;
        }

        if (parts.size() == 1) return std::move(parts.front());
        return QueryExpression::makeAnd(std::move(parts));
    }

    QueryExpression QueryParser::parseOr(std::optional<TokenKind> closing) {
        std::vector<QueryExpression> parts;
        parts.push_back(parseNot());

        while (consume(TokenKind::Pipe) || consume(TokenKind::Or)) {
            if (atEnd() || (closing && peekIs(*closing))) break;
            if (nextIsOrSeparator()) continue;
            parts.push_back(parseNot());
        }

        if (parts.size() == 1) return std::move(parts.front());
        return QueryExpression::makeOr(std::move(parts));
    }

    QueryExpression QueryParser::parseNot() {
        bool negate = false;
        while (consume(TokenKind::Bang) || consume(TokenKind::Not)) {
            negate = !negate;
        }

        QueryExpression expression = parsePrimary();
        if (negate) return QueryExpression::makeNot(std::move(expression));
        return expression;
    }

    QueryExpression QueryParser::parsePrimary() {
        if (consume(TokenKind::LParen)) return parseGroup(TokenKind::RParen);
        if (consume(TokenKind::LAngle)) return parseGroup(TokenKind::RAngle);

        const Token* token = peek();
        if (!token) throw QueryParseError("expected query term but reached end of query");

        switch (token->kind) {
            case TokenKind::RParen:
            case TokenKind::RAngle:
                throw QueryParseError(std::string("unexpected '") + (token->kind == TokenKind::RParen ? ")" : ">")
                                      + "'" + positionSuffix(token->position));
            case TokenKind::Word:
            case TokenKind::Phrase: {
                ++m_index;
                return QueryExpression::makeTerm(parseTerm(*token));
            }
            default:
                throw QueryParseError("expected query term" + positionSuffix(token->position));
        }
    }

    QueryExpression QueryParser::parseGroup(TokenKind closing) {
        QueryExpression expression = parseAnd(closing);
        if (consume(closing)) return expression;

        const std::size_t position = peek() ? peek()->position : m_tokens.back().position;
        throw QueryParseError(std::string("missing closing '") + (closing == TokenKind::RParen ? ")" : ">") + "'"
                              + positionSuffix(position));
    }

    const QueryParser::Token* QueryParser::peek() const {
        if (atEnd()) return nullptr;
        return &m_tokens[m_index];
    }

    bool QueryParser::peekIs(TokenKind kind) const {
        const Token* token = peek();
        return token && token->kind == kind;
    }

    bool QueryParser::consume(TokenKind kind) {
        if (!peekIs(kind)) return false;
        ++m_index;
        return true;
    }

    bool QueryParser::nextStartsOperand() const {
        const Token* token = peek();
        if (!token) return false;
        switch (token->kind) {
            case TokenKind::Word:
            case TokenKind::Phrase:
            case TokenKind::LParen:
            case TokenKind::LAngle:
            case TokenKind::Bang:
            case TokenKind::Not:
                return true;
            default:
                return false;
        }
    }

    bool QueryParser::nextIsOrSeparator() const {
        return peekIs(TokenKind::Pipe) || peekIs(TokenKind::Or);
    }

    QueryTerm QueryParser::parseTerm(const Token& token) {
        if (token.kind == TokenKind::Phrase) return QueryTerm::text(token.text);

        const std::string& raw = token.text;
        const std::size_t split = raw.find(':');
        if (split == std::string::npos || split == 0) return QueryTerm::text(raw);

        const std::string name = asciiLower(std::string_view(raw).substr(0, split));
        const std::string_view argument = trim(std::string_view(raw).substr(split + 1));

        if (name == "ext") {
            if (argument.empty()) throw QueryParseError("ext: requires at least one extension");
            std::vector<std::string> values;
            for (const std::string& piece : splitList(argument)) {
                std::string_view ext = piece;
                while (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
                if (!ext.empty()) values.push_back(asciiLower(ext));
            }
            if (values.empty()) throw QueryParseError("ext: requires non-empty extensions");
            return QueryTerm::filter(ExtensionFilter{std::move(values)});
        }

        if (name == "type") {
            if (argument.empty()) throw QueryParseError("type: requires a category");
            const auto target = lookupTypeFilterTarget(asciiLower(argument));
            if (!target) throw QueryParseError("unknown type category: " + std::string(argument));
            return QueryTerm::filter(TypeFilter{*target});
        }

        if (name == "size") return QueryTerm::filter(SizeFilter{SizePredicate::parse(argument)});

        if (name == "audio" || name == "video" || name == "doc" || name == "exe") {
            const auto target = lookupTypeFilterTarget(name);
            if (!target) throw QueryParseError("missing built-in type macro mapping: " + name);
            return QueryTerm::filter(TypeMacroFilter{*target, optionalArgument(argument)});
        }

        if (name == "file") return QueryTerm::filter(FileFilter{optionalArgument(argument)});
        if (name == "folder") return QueryTerm::filter(FolderFilter{optionalArgument(argument)});

        if (name == "parent")
            return QueryTerm::filter(ParentFilter{normalizeScopeFilterPath(argument, name)});
        if (name == "in" || name == "infolder")
            return QueryTerm::filter(InFolderFilter{normalizeScopeFilterPath(argument, name)});
        if (name == "nosubfolders")
            return QueryTerm::filter(NoSubfoldersFilter{normalizeScopeFilterPath(argument, name)});

        if (name == "content") {
            if (argument.empty()) throw QueryParseError("content: requires a search value");
            return QueryTerm::filter(ContentFilter{std::string(argument)});
        }

        if (name == "tag" || name == "tags") {
            if (argument.empty()) throw QueryParseError("tag: requires at least one tag name");
            std::vector<std::string> tags = splitList(argument);
            if (tags.empty()) throw QueryParseError("tag: requires non-empty tag names");
            return QueryTerm::filter(TagFilter{std::move(tags)});
        }

        if (name == "dm" || name == "datemodified")
            return QueryTerm::filter(DateModifiedFilter{DatePredicate::parse(argument)});
        if (name == "dc" || name == "datecreated")
            return QueryTerm::filter(DateCreatedFilter{DatePredicate::parse(argument)});

        return QueryTerm::text(raw);
    }

    std::vector<QueryParser::Token> QueryParser::tokenize(std::string_view input) {
        std::vector<Token> tokens;
        std::size_t cursor = 0;

        while (cursor < input.size()) {
            const char ch = input[cursor];
            if (isSpace(ch)) {
                ++cursor;
                continue;
            }

            const std::size_t position = cursor;
            switch (ch) {
                case '(': tokens.push_back({TokenKind::LParen, {}, position}); ++cursor; continue;
                case ')': tokens.push_back({TokenKind::RParen, {}, position}); ++cursor; continue;
                case '<': tokens.push_back({TokenKind::LAngle, {}, position}); ++cursor; continue;
                case '>': tokens.push_back({TokenKind::RAngle, {}, position}); ++cursor; continue;
                case '|': tokens.push_back({TokenKind::Pipe, {}, position}); ++cursor; continue;
                case '!': tokens.push_back({TokenKind::Bang, {}, position}); ++cursor; continue;
                default: break;
            }

            if (ch == '"') {
                std::string phrase;
                bool escaped = false;
                bool closed = false;
                ++cursor;
                while (cursor < input.size()) {
                    const char c = input[cursor++];
                    if (escaped) {
                        phrase.push_back(c);
                        escaped = false;
                    } else if (c == '\\') {
                        escaped = true;
                    } else if (c == '"') {
                        closed = true;
                        break;
                    } else {
                        phrase.push_back(c);
                    }
                }
                if (!closed) throw QueryParseError("missing closing quote" + positionSuffix(position));
                tokens.push_back({TokenKind::Phrase, std::move(phrase), position});
                continue;
            }

            // '<' and '>' only end a word before its first ':' so "size:>5kb" stays whole.
            std::size_t end = cursor;
            bool seenColon = false;
            while (end < input.size()) {
                const char c = input[end];
                if (c == ':') seenColon = true;
                if (isSpace(c) || c == '(' || c == ')' || c == '|' || c == '!') break;
                if (!seenColon && (c == '<' || c == '>')) break;
                ++end;
            }

            std::string raw(input.substr(cursor, end - cursor));
            const std::string lower = asciiLower(raw);
            if (lower == "and") tokens.push_back({TokenKind::And, {}, position});
            else if (lower == "or") tokens.push_back({TokenKind::Or, {}, position});
            else if (lower == "not") tokens.push_back({TokenKind::Not, {}, position});
            else tokens.push_back({TokenKind::Word, std::move(raw), position});
            cursor = end;
        }

        return tokens;
    }
}
