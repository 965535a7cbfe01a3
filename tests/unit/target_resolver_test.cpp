#include <gtest/gtest.h>

#include <expected>
#include <format>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "tests/common/module_builder.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/ir/resolver.hpp"
#include "weft/weaver/target_resolver.hpp"

namespace weft::weaver {
namespace {

using test::ModuleBuilder;

// Resolves against a fixed set of in-memory modules.
class MapResolver : public ir::TypeResolver {
 public:
  void Add(std::unique_ptr<ir::Module> module) {
    std::string name = module->Name();
    modules_.emplace(std::move(name), std::move(module));
  }

  auto Resolve(const ir::Module& from, const ir::TypeRef& ref)
      -> Result<const ir::TypeDef*> override {
    ++lookups_;
    const ir::Module* target = &from;
    if (!ref.scope.empty()) {
      auto it = modules_.find(ref.scope);
      if (it == modules_.end()) {
        return std::unexpected(
            Diagnostic::HostError(
                std::format("cannot locate module '{}'", ref.scope)));
      }
      target = it->second.get();
    }
    const ir::TypeDef* type = target->FindType(ref.full_name);
    if (type == nullptr) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format("type '{}' not found", ref.full_name)));
    }
    return type;
  }

  [[nodiscard]] auto Lookups() const -> int {
    return lookups_;
  }

 private:
  std::map<std::string, std::unique_ptr<ir::Module>> modules_;
  int lookups_ = 0;
};

class TargetResolverTest : public ::testing::Test {
 protected:
  auto MakeResolver() -> TargetResolver {
    return TargetResolver(builder_.Get(), types_, builder_.Markers());
  }

  ModuleBuilder builder_{"App"};
  MapResolver types_;
};

TEST_F(TargetResolverTest, FindsTargetOnTypeItself) {
  auto& person = builder_.AddType("App", "Person");
  builder_.AddMethod(person, "Unrelated");
  builder_.AddNotifyTarget(person, "Raise");

  auto resolver = MakeResolver();
  auto target = resolver.Resolve(person);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->name, "Raise");
  EXPECT_EQ(target->declaring_type.full_name, "App.Person");
  EXPECT_TRUE(target->declaring_type.scope.empty());
  EXPECT_EQ(target->param_types, std::vector<std::string>{"string"});
  EXPECT_TRUE(target->has_this);
}

TEST_F(TargetResolverTest, NoTargetAnywhere) {
  auto& person = builder_.AddType("App", "Person");
  builder_.AddMethod(person, "Unrelated");

  auto resolver = MakeResolver();
  EXPECT_FALSE(resolver.Resolve(person).has_value());
}

TEST_F(TargetResolverTest, InheritsTargetFromBaseInSameModule) {
  auto& base = builder_.AddType("App", "ViewModelBase");
  builder_.AddNotifyTarget(base);
  auto& person = builder_.AddType("App", "Person");
  person.base = ir::TypeRef{.scope = "", .full_name = "App.ViewModelBase"};

  auto resolver = MakeResolver();
  auto target = resolver.Resolve(person);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->declaring_type.full_name, "App.ViewModelBase");
  EXPECT_TRUE(builder_.Get().References().empty());
}

TEST_F(TargetResolverTest, NearestLevelWins) {
  auto& root = builder_.AddType("App", "Root");
  builder_.AddNotifyTarget(root, "RootChanged");
  auto& middle = builder_.AddType("App", "Middle");
  middle.base = ir::TypeRef{.scope = "", .full_name = "App.Root"};
  builder_.AddNotifyTarget(middle, "MiddleChanged");
  auto& leaf = builder_.AddType("App", "Leaf");
  leaf.base = ir::TypeRef{.scope = "", .full_name = "App.Middle"};

  auto resolver = MakeResolver();
  auto target = resolver.Resolve(leaf);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->name, "MiddleChanged");
}

TEST_F(TargetResolverTest, ImportsTargetFromReferencedModule) {
  ModuleBuilder core("Core");
  auto& base = core.AddType("Core", "ObservableObject");
  core.AddNotifyTarget(base, "OnPropertyChanged");
  types_.Add(core.Release());

  auto& person = builder_.AddType("App", "Person");
  person.base = test::ExternalType("Core", "Core.ObservableObject");

  auto resolver = MakeResolver();
  auto target = resolver.Resolve(person);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->declaring_type.scope, "Core");
  EXPECT_EQ(target->declaring_type.full_name, "Core.ObservableObject");
  EXPECT_EQ(builder_.Get().References(), std::vector<std::string>{"Core"});
}

TEST_F(TargetResolverTest, BaseChainCrossesSeveralModules) {
  ModuleBuilder core("Core");
  auto& root = core.AddType("Core", "Root");
  core.AddNotifyTarget(root);
  types_.Add(core.Release());

  ModuleBuilder mid("Mid");
  auto& middle = mid.AddType("Mid", "Middle");
  // Scope is relative to the declaring module, not to the woven one.
  middle.base = test::ExternalType("Core", "Core.Root");
  types_.Add(mid.Release());

  auto& leaf = builder_.AddType("App", "Leaf");
  leaf.base = test::ExternalType("Mid", "Mid.Middle");

  auto resolver = MakeResolver();
  auto target = resolver.Resolve(leaf);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->declaring_type.scope, "Core");
  EXPECT_EQ(builder_.Get().References(), std::vector<std::string>{"Core"});
}

TEST_F(TargetResolverTest, WrongParameterCountIsFatal) {
  auto& person = builder_.AddType("App", "Person");
  auto& target = builder_.AddNotifyTarget(person);
  target.params.push_back({.name = "extra", .type = "string"});

  auto resolver = MakeResolver();
  try {
    resolver.Resolve(person);
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    EXPECT_EQ(e.GetDiagnostic().primary.kind, DiagKind::kError);
    EXPECT_EQ(
        e.GetDiagnostic().primary.span,
        DiagSpan(DeclSpan{.decl = "App.Person::OnPropertyChanged"}));
  }
}

TEST_F(TargetResolverTest, WrongParameterTypeIsFatal) {
  auto& person = builder_.AddType("App", "Person");
  auto& target = builder_.AddNotifyTarget(person);
  target.params.front().type = "int32";

  auto resolver = MakeResolver();
  EXPECT_THROW(resolver.Resolve(person), DiagnosticException);
}

TEST_F(TargetResolverTest, StaticTargetIsFatal) {
  auto& person = builder_.AddType("App", "Person");
  auto& target = builder_.AddNotifyTarget(person);
  target.is_static = true;

  auto resolver = MakeResolver();
  EXPECT_THROW(resolver.Resolve(person), DiagnosticException);
}

TEST_F(TargetResolverTest, WrongShapeOnBaseIsFatalEvenIfUnused) {
  auto& base = builder_.AddType("App", "Base");
  auto& bad = builder_.AddNotifyTarget(base);
  bad.params.clear();
  auto& person = builder_.AddType("App", "Person");
  person.base = ir::TypeRef{.scope = "", .full_name = "App.Base"};

  auto resolver = MakeResolver();
  EXPECT_THROW(resolver.Resolve(person), DiagnosticException);
}

TEST_F(TargetResolverTest, UnresolvableBaseIsFatal) {
  auto& person = builder_.AddType("App", "Person");
  person.base = test::ExternalType("Missing", "Missing.Base");

  auto resolver = MakeResolver();
  try {
    resolver.Resolve(person);
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    const auto& diag = e.GetDiagnostic();
    EXPECT_EQ(diag.primary.kind, DiagKind::kHostError);
    ASSERT_FALSE(diag.notes.empty());
    EXPECT_NE(
        diag.notes.back().message.find("[Missing]Missing.Base"),
        std::string::npos);
  }
}

TEST_F(TargetResolverTest, CircularBaseChainIsFatal) {
  auto& a = builder_.AddType("App", "A");
  auto& b = builder_.AddType("App", "B");
  a.base = ir::TypeRef{.scope = "", .full_name = "App.B"};
  b.base = ir::TypeRef{.scope = "", .full_name = "App.A"};

  auto resolver = MakeResolver();
  EXPECT_THROW(resolver.Resolve(a), DiagnosticException);
}

TEST_F(TargetResolverTest, RepeatedLookupsAreMemoized) {
  auto& base = builder_.AddType("App", "Base");
  builder_.AddNotifyTarget(base);
  auto& first = builder_.AddType("App", "First");
  first.base = ir::TypeRef{.scope = "", .full_name = "App.Base"};
  auto& second = builder_.AddType("App", "Second");
  second.base = ir::TypeRef{.scope = "", .full_name = "App.Base"};

  auto resolver = MakeResolver();
  ASSERT_TRUE(resolver.Resolve(first).has_value());
  ASSERT_TRUE(resolver.Resolve(first).has_value());
  ASSERT_TRUE(resolver.Resolve(second).has_value());
  EXPECT_EQ(types_.Lookups(), 2);
}

TEST(NotifyTargetShapeTest, AcceptsInstanceStringMethod) {
  ir::MethodDef method;
  method.name = "Raise";
  method.params.push_back({.name = "name", .type = "string"});
  EXPECT_TRUE(IsNotifyTargetShape(method));

  method.return_type = "bool";
  EXPECT_TRUE(IsNotifyTargetShape(method));

  method.is_static = true;
  EXPECT_FALSE(IsNotifyTargetShape(method));
}

}  // namespace
}  // namespace weft::weaver
