//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.cpp
// Purpose: Parser for HTTP WWW-Authenticate Bearer challenges used to classify rejected credentials
//==========================================================================================================

#include "tokenkeeper/auth/WwwAuthenticate.hpp"

#include <cctype>

namespace tokenkeeper::auth {

namespace {

class ChallengeScanner {
public:
    explicit ChallengeScanner(const std::string& s) : text(s) {}

    bool atEnd() const { return pos >= text.size(); }
    char peek() const { return text[pos]; }
    void advance() { ++pos; }

    void skipBlanks() {
        while (!atEnd() && (peek() == ' ' || peek() == '\t')) {
            ++pos;
        }
    }

    // Reads a token up to a blank, '=', ',' or '"'. Returns an empty string when none is present.
    std::string readToken() {
        std::size_t start = pos;
        while (!atEnd()) {
            char ch = peek();
            if (ch == ' ' || ch == '\t' || ch == '=' || ch == ',' || ch == '"') {
                break;
            }
            ++pos;
        }
        return text.substr(start, pos - start);
    }

    // Reads a quoted-string starting at '"', resolving backslash escapes.
    bool readQuoted(std::string& out) {
        out.clear();
        ++pos;
        while (!atEnd()) {
            char ch = peek();
            if (ch == '\\') {
                if (pos + 1 >= text.size()) {
                    return false;
                }
                out.push_back(text[pos + 1]);
                pos += 2;
                continue;
            }
            ++pos;
            if (ch == '"') {
                return true;
            }
            out.push_back(ch);
        }
        return false;
    }

    // Reads an unquoted value up to the next ',' with surrounding blanks removed.
    std::string readBareValue() {
        std::size_t start = pos;
        while (!atEnd() && peek() != ',') {
            ++pos;
        }
        std::size_t end = pos;
        while (end > start && (text[end - 1] == ' ' || text[end - 1] == '\t')) {
            --end;
        }
        while (start < end && (text[start] == ' ' || text[start] == '\t')) {
            ++start;
        }
        return text.substr(start, end - start);
    }

private:
    const std::string& text;
    std::size_t pos{0};
};

std::string lowerCase(std::string s) {
    for (auto& ch : s) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

} // namespace

bool parseWwwAuthenticate(const std::string& header, WwwAuthChallenge& out) {
    out.scheme.clear();
    out.params.clear();

    ChallengeScanner sc(header);
    sc.skipBlanks();
    std::string scheme = lowerCase(sc.readToken());
    if (scheme != "bearer") {
        return false;
    }
    out.scheme = scheme;

    while (true) {
        sc.skipBlanks();
        while (!sc.atEnd() && sc.peek() == ',') {
            sc.advance();
            sc.skipBlanks();
        }
        if (sc.atEnd()) {
            break;
        }
        std::string key = lowerCase(sc.readToken());
        if (key.empty()) {
            break;
        }
        sc.skipBlanks();
        if (sc.atEnd() || sc.peek() != '=') {
            out.params[key] = std::string();
            continue;
        }
        sc.advance();
        sc.skipBlanks();

        std::string value;
        if (!sc.atEnd() && sc.peek() == '"') {
            if (!sc.readQuoted(value)) {
                return false;
            }
        } else {
            value = sc.readBareValue();
        }
        out.params[key] = value;
    }
    return true;
}

bool isInvalidTokenChallenge(const std::string& header) {
    if (header.empty()) {
        return false;
    }
    WwwAuthChallenge ch;
    if (!parseWwwAuthenticate(header, ch)) {
        return false;
    }
    auto it = ch.params.find("error");
    return it != ch.params.end() && it->second == "invalid_token";
}

} // namespace tokenkeeper::auth
