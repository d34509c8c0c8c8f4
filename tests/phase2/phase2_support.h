#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tacit/parser.h"

namespace phase2_test {

std::vector<tacit::Token> lex(std::string_view source);

// Compares token types, ignoring the trailing End token.
void expect_token_types(std::string_view source, const std::vector<tacit::Token::Type>& expected);
void expect_lex_error(std::string_view source, const std::string& reason_fragment);

void expect_snapshot(std::string_view source, const std::string& expected_source);
void expect_parse_error(std::string_view source, const std::string& expected);

void run_lexer_tests();
void run_parser_tests();

}  // namespace phase2_test
