// Parser parts:
// - 01: token cursor, errors, entry points
// - 02: lines and bindings
// - 03: terms, strands, groups and modifier operands

#include "parser_parts/01_parser_core.cpp"
#include "parser_parts/02_parser_lines.cpp"
#include "parser_parts/03_parser_terms.cpp"
