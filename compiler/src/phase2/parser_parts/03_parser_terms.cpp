TermList Parser::parse_terms() {
  TermList terms;
  while (starts_term()) {
    terms.push_back(parse_term());
  }
  return terms;
}

bool Parser::starts_term() const {
  switch (peek().type) {
    case Token::Type::Number:
    case Token::Type::Char:
    case Token::Type::String:
    case Token::Type::Identifier:
    case Token::Type::Primitive:
    case Token::Type::Modifier:
    case Token::Type::LParen:
    case Token::Type::LBracket:
    case Token::Type::LBrace:
      return true;
    default:
      return false;
  }
}

TermPtr Parser::parse_term() {
  auto first = parse_primary();
  if (!at(Token::Type::Underscore)) {
    return first;
  }
  const auto start = first->span;
  TermList items;
  items.push_back(std::move(first));
  while (at(Token::Type::Underscore)) {
    advance();
    if (!starts_term()) {
      fail("a strand item after '_'");
    }
    items.push_back(parse_primary());
  }
  auto strand = std::make_unique<StrandTerm>(std::move(items));
  strand->span = join_spans(start, strand->items.back()->span);
  return strand;
}

TermPtr Parser::parse_primary() {
  const auto& token = peek();
  TermPtr term;
  switch (token.type) {
    case Token::Type::Number:
      term = std::make_unique<NumberTerm>(token.number, token.text);
      break;
    case Token::Type::Char:
      term = std::make_unique<CharTerm>(token.character);
      break;
    case Token::Type::String:
      term = std::make_unique<StringTerm>(token.string);
      break;
    case Token::Type::Identifier:
      term = std::make_unique<IdentifierTerm>(token.text);
      break;
    case Token::Type::Primitive:
      term = std::make_unique<PrimitiveTerm>(token.primitive);
      break;
    case Token::Type::Modifier:
      return parse_modifier();
    case Token::Type::LParen:
      return parse_group(Token::Type::RParen, Term::Kind::Function, false);
    case Token::Type::LBracket:
      return parse_group(Token::Type::RBracket, Term::Kind::Array, false);
    case Token::Type::LBrace:
      return parse_group(Token::Type::RBrace, Term::Kind::Array, true);
    default:
      fail("a term");
  }
  term->span = token.span;
  advance();
  return term;
}

TermPtr Parser::parse_modifier() {
  const auto token = advance();
  const auto& info = primitive_info(token.primitive);
  TermList operands;
  for (std::size_t i = 0; i < info.modifier_args; ++i) {
    if (!starts_term()) {
      fail(std::string("a function for ") + primitive_display(token.primitive));
    }
    operands.push_back(parse_primary());
  }
  auto term = std::make_unique<ModifierTerm>(token.primitive, std::move(operands));
  term->span = join_spans(token.span, term->operands.back()->span);
  return term;
}

TermPtr Parser::parse_group(Token::Type closing, Term::Kind kind, bool boxed) {
  const auto open = advance();
  auto lines = parse_lines(closing);
  if (!at(closing)) {
    fail(token_type_name(closing));
  }
  const auto close = advance();
  TermPtr term;
  if (kind == Term::Kind::Function) {
    term = std::make_unique<FunctionTerm>(std::move(lines));
  } else {
    term = std::make_unique<ArrayTerm>(std::move(lines), boxed);
  }
  term->span = join_spans(open.span, close.span);
  return term;
}

}  // namespace tacit
