#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tacit/ast.h"
#include "tacit/bytecode.h"

namespace tacit {

class Compiler {
 public:
  Program compile(const Module& module);

 private:
  struct BindingInfo {
    enum class Kind {
      Value,
      Function,
    };

    Kind kind = Kind::Value;
    std::uint32_t name = 0;
    std::optional<Signature> signature;
  };

  struct Scope {
    std::unordered_map<std::string, BindingInfo> bindings;
  };

  // Running stack effect of a code sequence: net depth change and the
  // deepest point reached, in evaluation order.
  struct Effect {
    long depth = 0;
    long lowest = 0;
    bool dynamic = false;

    void apply(const std::optional<Signature>& signature);
    std::optional<Signature> signature() const;
  };

  std::uint32_t intern(const std::string& name);
  std::uint32_t add_constant(Array value);
  const BindingInfo* resolve(const std::string& name) const;

  void compile_lines(const StmtList& lines, Code& code, Effect& effect);
  void compile_binding(const BindingStmt& binding, Code& code, Effect& effect);
  void compile_terms(const TermList& terms, Code& code, Effect& effect);
  void compile_term(const Term& term, Code& code, Effect& effect);
  void compile_array(const ArrayTerm& array, Code& code, Effect& effect);
  void compile_strand(const StrandTerm& strand, Code& code, Effect& effect);
  void emit_array(Code& inner, const Effect& inner_effect, bool boxed, const Span& span, Code& code,
                  Effect& effect);
  void compile_modifier(const ModifierTerm& modifier, Code& code, Effect& effect);
  void compile_if(const ModifierTerm& modifier, Code& code, Effect& effect);

  std::uint32_t compile_function(const StmtList& lines, const std::string& name, const Span& span);
  std::uint32_t compile_operand(const Term& term);
  std::uint32_t add_function(Function function);

  std::optional<Signature> modifier_signature(const ModifierTerm& modifier,
                                              const std::vector<std::uint32_t>& operands) const;
  [[noreturn]] void arity_error(const ModifierTerm& modifier, const std::string& message) const;

  Program program_;
  std::vector<Scope> scopes_;
  std::unordered_map<std::string, std::uint32_t> name_ids_;
};

Program compile(const Module& module);
Program compile(std::string_view source);

}  // namespace tacit
