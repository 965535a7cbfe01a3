#include <gtest/gtest.h>

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <variant>
#include <vector>

#include "tests/common/module_builder.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/ir/instruction.hpp"
#include "weft/ir/resolver.hpp"
#include "weft/ir/verify.hpp"
#include "weft/weaver/marker_scanner.hpp"

namespace weft::weaver {
namespace {

using ir::Opcode;
using test::ModuleBuilder;

// Every type lives in the woven module itself.
class LocalResolver : public ir::TypeResolver {
 public:
  auto Resolve(const ir::Module& from, const ir::TypeRef& ref)
      -> Result<const ir::TypeDef*> override {
    if (const ir::TypeDef* type = from.FindType(ref.full_name)) {
      return type;
    }
    return std::unexpected(
        Diagnostic::HostError(
            std::format("type '{}' not found", ref.ToString())));
  }
};

auto CallCount(const ir::PropertyDef& property) -> int64_t {
  return test::CountOpcode(*property.setter->body, Opcode::kCall);
}

class MarkerScannerTest : public ::testing::Test {
 protected:
  auto Weave() -> WeaveStats {
    return WeaveModule(builder_.Get(), resolver_, builder_.Markers());
  }

  // Notifier type with a notify target, in the given mode.
  auto AddNotifier(const std::string& name, int64_t mode) -> ir::TypeDef& {
    auto& type = builder_.AddType("App", name);
    builder_.MarkNotifier(type, ir::AnnotationArg::Int(mode));
    builder_.AddNotifyTarget(type);
    return type;
  }

  ModuleBuilder builder_{"App"};
  LocalResolver resolver_;
};

TEST_F(MarkerScannerTest, ImplicitWeavesPublicSetters) {
  auto& person = AddNotifier("Person", 1);
  auto& name = builder_.AddAutoProperty(person, "Name");
  auto& age = builder_.AddAutoProperty(person, "Age");

  auto stats = Weave();
  EXPECT_EQ(stats.notifier_types, 1U);
  EXPECT_EQ(stats.properties_woven, 2U);
  EXPECT_EQ(stats.calls_injected, 2U);
  EXPECT_EQ(CallCount(name), 1);
  EXPECT_EQ(CallCount(age), 1);
  EXPECT_EQ(
      test::LoadedStrings(*name.setter->body),
      std::vector<std::string>{"Name"});
  EXPECT_EQ(
      stats.woven_properties,
      (std::vector<std::string>{"App.Person::Name", "App.Person::Age"}));
}

TEST_F(MarkerScannerTest, ImplicitSkipsNonPublicSetter) {
  auto& person = AddNotifier("Person", 1);
  auto& hidden =
      builder_.AddAutoProperty(person, "Secret", ir::Visibility::kPrivate);
  auto& family =
      builder_.AddAutoProperty(person, "Shared", ir::Visibility::kFamily);

  auto stats = Weave();
  EXPECT_EQ(stats.properties_woven, 0U);
  EXPECT_EQ(CallCount(hidden), 0);
  EXPECT_EQ(CallCount(family), 0);
}

TEST_F(MarkerScannerTest, ImplicitSkipsStaticSetter) {
  auto& person = AddNotifier("Person", 1);
  auto& count = builder_.AddAutoProperty(person, "Count");
  count.setter->is_static = true;
  count.setter->body->instructions = {
      ir::Instruction::Create(Opcode::kRet),
  };

  auto stats = Weave();
  EXPECT_EQ(stats.properties_woven, 0U);
  EXPECT_EQ(
      test::Opcodes(*count.setter->body), std::vector<Opcode>{Opcode::kRet});
}

TEST_F(MarkerScannerTest, MarkedStaticPropertyIsFatal) {
  auto& person = AddNotifier("Person", 0);
  auto& count = builder_.AddAutoProperty(person, "Count");
  count.setter->is_static = true;
  count.setter->body->instructions = {
      ir::Instruction::Create(Opcode::kRet),
  };
  builder_.MarkNotify(count);

  try {
    Weave();
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    EXPECT_EQ(e.GetDiagnostic().primary.kind, DiagKind::kError);
    EXPECT_EQ(
        e.GetDiagnostic().primary.span,
        DiagSpan(DeclSpan{.decl = "App.Person::set_Count"}));
    EXPECT_NE(
        e.GetDiagnostic().primary.message.find("static property"),
        std::string::npos);
  }
  EXPECT_EQ(
      test::Opcodes(*count.setter->body), std::vector<Opcode>{Opcode::kRet});
}

TEST_F(MarkerScannerTest, ExplicitMarkerOverridesVisibility) {
  auto& person = AddNotifier("Person", 1);
  auto& hidden =
      builder_.AddAutoProperty(person, "Secret", ir::Visibility::kPrivate);
  builder_.MarkNotify(hidden);

  auto stats = Weave();
  EXPECT_EQ(stats.properties_woven, 1U);
  EXPECT_EQ(CallCount(hidden), 1);
}

TEST_F(MarkerScannerTest, ExplicitModeOnlyWeavesMarked) {
  auto& person = AddNotifier("Person", 0);
  auto& plain = builder_.AddAutoProperty(person, "Plain");
  auto& marked = builder_.AddAutoProperty(person, "Marked");
  builder_.MarkNotify(marked);

  auto stats = Weave();
  EXPECT_EQ(stats.properties_woven, 1U);
  EXPECT_EQ(CallCount(plain), 0);
  EXPECT_EQ(CallCount(marked), 1);
}

TEST_F(MarkerScannerTest, MissingModeArgumentMeansExplicit) {
  auto& person = builder_.AddType("App", "Person");
  builder_.MarkNotifier(person);
  builder_.AddNotifyTarget(person);
  auto& plain = builder_.AddAutoProperty(person, "Plain");

  Weave();
  EXPECT_EQ(CallCount(plain), 0);
}

TEST_F(MarkerScannerTest, ModeByName) {
  auto& person = builder_.AddType("App", "Person");
  builder_.MarkNotifier(person, ir::AnnotationArg::String("Implicit"));
  builder_.AddNotifyTarget(person);
  auto& name = builder_.AddAutoProperty(person, "Name");

  Weave();
  EXPECT_EQ(CallCount(name), 1);
}

TEST_F(MarkerScannerTest, InvalidModeIsFatal) {
  auto& person = builder_.AddType("App", "Person");
  builder_.MarkNotifier(person, ir::AnnotationArg::Int(7));
  builder_.AddNotifyTarget(person);

  EXPECT_THROW(Weave(), DiagnosticException);
}

TEST_F(MarkerScannerTest, SuppressWinsOverNotify) {
  auto& person = AddNotifier("Person", 1);
  auto& first = builder_.AddAutoProperty(person, "First");
  builder_.MarkSuppress(first);
  builder_.MarkNotify(first);
  auto& second = builder_.AddAutoProperty(person, "Second");
  builder_.MarkNotify(second);
  builder_.MarkSuppress(second);

  auto stats = Weave();
  EXPECT_EQ(stats.properties_woven, 0U);
  EXPECT_EQ(CallCount(first), 0);
  EXPECT_EQ(CallCount(second), 0);
}

TEST_F(MarkerScannerTest, DependentNamesReplaceOwnName) {
  auto& person = AddNotifier("Person", 1);
  auto& first = builder_.AddAutoProperty(person, "FirstName");
  builder_.MarkNotify(first, {test::NameList({"FirstName", "FullName"})});

  auto stats = Weave();
  EXPECT_EQ(stats.calls_injected, 2U);
  EXPECT_EQ(
      test::LoadedStrings(*first.setter->body),
      (std::vector<std::string>{"FirstName", "FullName"}));
}

TEST_F(MarkerScannerTest, ReadOnlyPropertyIsSkipped) {
  auto& person = AddNotifier("Person", 1);
  auto& computed = builder_.AddReadOnlyProperty(person, "FullName");
  builder_.MarkNotify(computed);

  auto stats = Weave();
  EXPECT_EQ(stats.properties_woven, 0U);
}

TEST_F(MarkerScannerTest, AbstractMarkedPropertyIsFatal) {
  auto& person = AddNotifier("Person", 0);
  auto& property = builder_.AddAbstractProperty(person, "Name");
  builder_.MarkNotify(property);

  try {
    Weave();
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    EXPECT_EQ(
        e.GetDiagnostic().primary.span,
        DiagSpan(DeclSpan{.decl = "App.Person::set_Name"}));
  }
}

TEST_F(MarkerScannerTest, AbstractUnmarkedPropertyInExplicitModeIsIgnored) {
  auto& person = AddNotifier("Person", 0);
  builder_.AddAbstractProperty(person, "Name");

  auto stats = Weave();
  EXPECT_EQ(stats.properties_woven, 0U);
}

TEST_F(MarkerScannerTest, MissingTargetIsFatal) {
  auto& person = builder_.AddType("App", "Person");
  builder_.MarkNotifier(person, ir::AnnotationArg::Int(1));
  builder_.AddAutoProperty(person, "Name");

  try {
    Weave();
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    EXPECT_NE(
        e.GetDiagnostic().primary.message.find("App.Person"),
        std::string::npos);
    EXPECT_FALSE(e.GetDiagnostic().notes.empty());
  }
}

TEST_F(MarkerScannerTest, MissingTargetOnNotifierWithoutPropertiesIsFatal) {
  auto& person = builder_.AddType("App", "Person");
  builder_.MarkNotifier(person);

  EXPECT_THROW(Weave(), DiagnosticException);
}

TEST_F(MarkerScannerTest, NonNotifierTypesAreUntouched) {
  auto& plain = builder_.AddType("App", "Plain");
  builder_.AddNotifyTarget(plain);
  auto& name = builder_.AddAutoProperty(plain, "Name");
  builder_.MarkNotify(name);

  auto stats = Weave();
  EXPECT_EQ(stats.types_scanned, 1U);
  EXPECT_EQ(stats.notifier_types, 0U);
  EXPECT_EQ(CallCount(name), 0);
}

TEST_F(MarkerScannerTest, NestedTypesAreScannedIndependently) {
  auto& outer = builder_.AddType("App", "Outer");
  auto& inner = builder_.AddNestedType(outer, "Inner");
  builder_.MarkNotifier(inner, ir::AnnotationArg::Int(1));
  builder_.AddNotifyTarget(inner);
  auto& name = builder_.AddAutoProperty(inner, "Name");
  auto& deeper = builder_.AddNestedType(inner, "Deeper");
  auto& untouched = builder_.AddAutoProperty(deeper, "Other");

  MarkerScanner scanner(builder_.Get(), resolver_, builder_.Markers());
  // The outer type itself has nothing woven.
  EXPECT_FALSE(scanner.ProcessType(outer));

  const auto& stats = scanner.Stats();
  EXPECT_EQ(stats.types_scanned, 3U);
  EXPECT_EQ(stats.notifier_types, 1U);
  EXPECT_EQ(stats.properties_woven, 1U);
  EXPECT_EQ(stats.woven_properties.front(), "App.Outer/Inner::Name");
  EXPECT_EQ(CallCount(name), 1);
  EXPECT_EQ(CallCount(untouched), 0);
}

TEST_F(MarkerScannerTest, ProcessTypeReportsOwnWeaving) {
  auto& person = AddNotifier("Person", 1);
  builder_.AddAutoProperty(person, "Name");

  MarkerScanner scanner(builder_.Get(), resolver_, builder_.Markers());
  EXPECT_TRUE(scanner.ProcessType(person));
}

TEST_F(MarkerScannerTest, InheritedTargetIsUsed) {
  auto& base = builder_.AddType("App", "ViewModelBase");
  builder_.AddNotifyTarget(base, "RaisePropertyChanged");
  auto& person = builder_.AddType("App", "Person");
  person.base = ir::TypeRef{.scope = "", .full_name = "App.ViewModelBase"};
  builder_.MarkNotifier(person, ir::AnnotationArg::Int(1));
  auto& name = builder_.AddAutoProperty(person, "Name");

  Weave();
  for (const auto& instr : name.setter->body->instructions) {
    if (instr.opcode == Opcode::kCall) {
      EXPECT_EQ(std::get<ir::MethodRef>(instr.operand).name,
                "RaisePropertyChanged");
    }
  }
  EXPECT_EQ(CallCount(name), 1);
}

TEST_F(MarkerScannerTest, MalformedSetterBodyIsReportedAsUserError) {
  auto& person = AddNotifier("Person", 1);
  auto& name = builder_.AddAutoProperty(person, "Name");
  name.setter->body->instructions.pop_back();  // drop ret

  try {
    Weave();
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    EXPECT_EQ(e.GetDiagnostic().primary.kind, DiagKind::kError);
  }
}

TEST_F(MarkerScannerTest, WovenSettersVerify) {
  auto& person = AddNotifier("Person", 1);
  auto& name = builder_.AddAutoProperty(person, "Name");
  builder_.MarkNotify(
      name, {ir::AnnotationArg::String("A"), ir::AnnotationArg::Null()});
  builder_.AddAutoProperty(person, "Age");

  Weave();
  EXPECT_NO_THROW(ir::VerifyType(person));
}

TEST(NotificationModeTest, Names) {
  EXPECT_EQ(ToString(NotificationMode::kExplicit), "Explicit");
  EXPECT_EQ(ToString(NotificationMode::kImplicit), "Implicit");
}

}  // namespace
}  // namespace weft::weaver
