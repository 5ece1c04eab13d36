#include "staticss/lowering/dumper.hpp"

#include <string>

#include <fmt/core.h>

#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/common/internal_error.hpp"

namespace staticss::lowering {

Dumper::Dumper(std::ostream* out) : out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  if (indent_ == 0) {
    common::ThrowInternalError("Dumper::Dedent", "unbalanced indentation");
  }
  --indent_;
}

void Dumper::DumpObject(const StyleObject& object) {
  for (const auto& entry : object.Entries()) {
    PrintIndent();
    *out_ << fmt::format("{}: {}\n", entry.key, ToString(entry.value));
  }
}

void Dumper::Dump(const FileResult& result) {
  for (const auto& decl : result.components) {
    Dump(decl);
  }
}

void Dumper::Dump(const StyledDecl& decl) {
  PrintIndent();
  *out_ << fmt::format(
      "Component {} ({}{})", decl.local_name,
      decl.wraps_component ? "wraps " : "", decl.tag);
  if (decl.location) {
    *out_ << fmt::format(
        " at {}:{}", decl.location->line, decl.location->column);
  }
  *out_ << " {\n";
  Indent();

  PrintIndent();
  *out_ << fmt::format("base {} {{\n", decl.style_key);
  Indent();
  DumpObject(decl.style_obj);
  Dedent();
  PrintIndent();
  *out_ << "}\n";

  for (const auto& bucket : decl.variant_buckets) {
    PrintIndent();
    *out_ << fmt::format(
        "bucket {} -> {} {{\n", bucket.when,
        decl.KeyFor(bucket.when).value_or("<none>"));
    Indent();
    DumpObject(bucket.style);
    Dedent();
    PrintIndent();
    *out_ << "}\n";
  }

  for (const auto& compound : decl.compound_variants) {
    PrintIndent();
    *out_ << fmt::format(
        "compound {} / {} -> {}, {}, {}\n", compound.outer_prop,
        compound.inner_prop, compound.outer_key, compound.inner_true_key,
        compound.inner_false_key);
  }

  for (const auto& spec : decl.style_fn_specs) {
    PrintIndent();
    *out_ << fmt::format(
        "fn {}({}) -> {}: `{}`", spec.name, spec.param_name, spec.style_prop,
        spec.value_template);
    if (spec.fallback) {
      *out_ << fmt::format(" fallback \"{}\"", *spec.fallback);
    }
    if (!spec.scope.IsBase()) {
      // Outermost first: at-rules, pseudo-classes, pseudo-element.
      *out_ << " in";
      for (const auto& at_rule : spec.scope.at_rules) {
        *out_ << " " << at_rule;
      }
      for (const auto& pseudo : spec.scope.pseudos) {
        *out_ << " " << pseudo;
      }
      if (spec.scope.pseudo_element) {
        *out_ << " " << *spec.scope.pseudo_element;
      }
    }
    *out_ << "\n";
  }

  for (const auto& entry : decl.variant_entries) {
    PrintIndent();
    *out_ << "entry " << ToString(entry) << "\n";
  }

  for (const auto& mixin : decl.mixins) {
    PrintIndent();
    *out_ << "mixin " << mixin << "\n";
  }

  for (const auto& spec : decl.imports) {
    PrintIndent();
    std::string names;
    for (const auto& name : spec.names) {
      names += names.empty() ? name : ", " + name;
    }
    *out_ << fmt::format("import {{ {} }} from \"{}\"\n", names, spec.from);
  }

  for (const auto& warning : decl.warnings) {
    PrintIndent();
    *out_ << fmt::format(
        "{}[{}] {}\n", ToString(warning.severity), warning.category,
        warning.message);
  }

  if (decl.bailed) {
    PrintIndent();
    *out_ << "bailed\n";
  }

  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

}  // namespace staticss::lowering
