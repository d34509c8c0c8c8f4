StmtList Parser::parse_lines(Token::Type closing) {
  StmtList lines;
  while (true) {
    skip_newlines();
    if (at(closing) || at(Token::Type::End)) {
      break;
    }
    lines.push_back(parse_line());
    if (!at(Token::Type::Newline) && !at(closing) && !at(Token::Type::End)) {
      fail("a term or end of line");
    }
  }
  return lines;
}

StmtPtr Parser::parse_line() {
  const auto& first = peek();
  const bool binding =
      first.type == Token::Type::Identifier && pos + 1 < tokens.size() &&
      (tokens[pos + 1].type == Token::Type::Arrow ||
       (tokens[pos + 1].type == Token::Type::Primitive && tokens[pos + 1].primitive == Primitive::Equal));
  if (binding) {
    const auto name_token = advance();
    const auto arrow = advance();
    if (!starts_term()) {
      fail("an expression after '" + arrow.text + "'");
    }
    auto terms = parse_terms();
    auto stmt = std::make_unique<BindingStmt>(name_token.text, std::move(terms));
    stmt->name_span = name_token.span;
    stmt->span = join_spans(name_token.span, stmt->terms.back()->span);
    return stmt;
  }

  auto terms = parse_terms();
  if (terms.empty()) {
    fail("a term");
  }
  auto stmt = std::make_unique<LineStmt>(std::move(terms));
  stmt->span = join_spans(stmt->terms.front()->span, stmt->terms.back()->span);
  return stmt;
}
