#pragma once

#include <ostream>

#include "staticss/lowering/lower.hpp"
#include "staticss/lowering/style_value.hpp"
#include "staticss/lowering/styled_decl.hpp"

namespace staticss::lowering {

// Stable, indented text form of lowering results.
class Dumper {
 public:
  explicit Dumper(std::ostream* out);

  void Dump(const FileResult& result);
  void Dump(const StyledDecl& decl);

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  void DumpObject(const StyleObject& object);

  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace staticss::lowering
