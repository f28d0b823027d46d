#include "render/cxx_renderer.hpp"
#include "engine/converter.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using convgen::engine::Converter;
using convgen::engine::ConverterOptions;
using convgen::engine::Expr;
using convgen::engine::Universe;
using convgen::render::CxxRenderer;
using convgen::render::RenderOptions;

namespace {

const char* kModel = R"JSON(
{
  "packages": [
    {
      "path": "app/v1",
      "header": "app/v1/types.hpp",
      "comments": ["+conversion-gen:peer-packages=app/internal",
                   "+conversion-gen:extra-imports=<app/v1/conversion.hpp>"],
      "types": [
        { "name": "Item", "kind": "record", "members": [
            { "name": "Name", "type": "string" }, { "name": "Count", "type": "int32" } ] },
        { "name": "Bag", "kind": "record", "members": [
            { "name": "Items", "type": "seq<app/v1.Item>" },
            { "name": "Labels", "type": "map<string, int32>" },
            { "name": "First", "type": "ptr<app/v1.Item>" } ] },
        { "name": "Scope", "kind": "record" }
      ]
    },
    {
      "path": "app/internal",
      "header": "app/internal/types.hpp",
      "types": [
        { "name": "Item", "kind": "record", "members": [
            { "name": "Name", "type": "string" }, { "name": "Count", "type": "int64" } ] },
        { "name": "Bag", "kind": "record", "members": [
            { "name": "Items", "type": "seq<app/internal.Item>" },
            { "name": "Labels", "type": "map<string, int32>" },
            { "name": "First", "type": "ptr<app/internal.Item>" } ] }
      ]
    }
  ]
}
)JSON";

auto contains(const std::string& text, std::string_view needle) -> bool {
  return text.find(needle) != std::string::npos;
}

class CxxRendererTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto loaded = load_packages(universe_, kModel);
    ASSERT_TRUE(loaded) << loaded.error().message;
  }

  auto generate(ConverterOptions options = {}) -> convgen::engine::GeneratedFile {
    Converter converter(std::move(options));
    const std::vector<std::string> inputs = {"app/v1"};
    auto files = converter.run(universe_, inputs);
    EXPECT_TRUE(files) << files.error().message;
    if (!files || files->empty()) {
      return {};
    }
    return std::move(files->front());
  }

  Universe universe_;
};

}  // namespace

TEST_F(CxxRendererTest, RendersTypes) {
  CxxRenderer renderer(universe_);
  auto* item = universe_.named("app/v1", "Item");
  auto* type = universe_.map_of(universe_.builtin("string"),
                                universe_.sequence_of(universe_.pointer_to(item)));
  EXPECT_EQ(renderer.render_type(type), "std::map<std::string, std::vector<std::shared_ptr<::app::v1::Item>>>");
  EXPECT_EQ(renderer.render_type(universe_.builtin("uint8")), "std::uint8_t");
  EXPECT_EQ(renderer.render_type(universe_.builtin("error")), "std::error_code");
}

TEST_F(CxxRendererTest, RendersExpressions) {
  CxxRenderer renderer(universe_);
  auto in = Expr::var("in").deref();
  EXPECT_EQ(renderer.render_expr(in.field("X").address_of()), "&in->X");
  EXPECT_EQ(renderer.render_expr(in.at(Expr::var("i")).address_of()), "&(*in)[i]");
  EXPECT_EQ(renderer.render_expr(in.deref().address_of()), "&**in");
  EXPECT_EQ(renderer.render_expr(Expr::var("v").address_of().deref()), "v");
  EXPECT_EQ(renderer.render_expr(in.field("N").cast_to(universe_.builtin("int64"))),
            "static_cast<std::int64_t>(in->N)");
}

TEST_F(CxxRendererTest, RendersFileLayout) {
  auto file = generate();
  CxxRenderer renderer(universe_);
  auto source = renderer.render(file);
  ASSERT_TRUE(source) << source.error().message;
  const auto& text = *source;

  EXPECT_TRUE(text.starts_with("// Code generated by convgen. DO NOT EDIT."));
  EXPECT_TRUE(contains(text, "#include <system_error>"));
  EXPECT_TRUE(contains(text, "#include \"app/internal/types.hpp\""));
  EXPECT_TRUE(contains(text, "#include \"app/v1/types.hpp\""));
  EXPECT_TRUE(contains(text, "#include <app/v1/conversion.hpp>"));
  EXPECT_TRUE(contains(text, "namespace app::v1 {"));
  EXPECT_TRUE(contains(text, "}  // namespace app::v1"));
  EXPECT_EQ(CxxRenderer::file_name(file), "conversion_generated.cpp");

  for (const auto& function : file.functions) {
    EXPECT_TRUE(contains(text, function.private_name + "(")) << function.private_name;
    EXPECT_TRUE(contains(text, function.public_name + "(")) << function.public_name;
  }
  EXPECT_TRUE(contains(text, "auto Convert_v1_Item_To_internal_Item(const ::app::v1::Item* in, "
                             "::app::internal::Item* out) -> std::error_code;"));
  EXPECT_TRUE(contains(text, "return autoConvert_v1_Item_To_internal_Item(in, out);"));
}

TEST_F(CxxRendererTest, RendersMemberConversions) {
  auto file = generate();
  CxxRenderer renderer(universe_);
  auto source = renderer.render(file);
  ASSERT_TRUE(source) << source.error().message;
  const auto& text = *source;

  EXPECT_TRUE(contains(text, "out->Name = in->Name;"));
  EXPECT_TRUE(contains(text, "out->Count = static_cast<std::int64_t>(in->Count);"));
  EXPECT_TRUE(contains(text, "out->Count = static_cast<std::int32_t>(in->Count);"));

  EXPECT_TRUE(contains(text, "if (!in->Items.empty()) {"));
  EXPECT_TRUE(contains(text, "if (auto err = [&](const std::vector<::app::v1::Item>* in, "
                             "std::vector<::app::internal::Item>* out) -> std::error_code {"));
  EXPECT_TRUE(contains(text, "*out = std::vector<::app::internal::Item>((*in).size());"));
  EXPECT_TRUE(contains(text, "for (std::size_t i = 0; i < (*in).size(); ++i) {"));
  EXPECT_TRUE(contains(text, "if (auto err = ::app::v1::Convert_v1_Item_To_internal_Item(&(*in)[i], &(*out)[i]); "
                             "err) {"));
  EXPECT_TRUE(contains(text, "}(&in->Items, &out->Items); err) {"));
  EXPECT_TRUE(contains(text, "} else {"));
  EXPECT_TRUE(contains(text, "out->Items.clear();"));

  EXPECT_TRUE(contains(text, "*out = std::map<std::string, std::int32_t>((*in).begin(), (*in).end());"));

  EXPECT_TRUE(contains(text, "if (in->First) {"));
  EXPECT_TRUE(contains(text, "*out = std::make_shared<::app::internal::Item>();"));
  EXPECT_TRUE(contains(text, "::app::v1::Convert_v1_Item_To_internal_Item(&**in, &**out)"));
  EXPECT_TRUE(contains(text, "out->First = nullptr;"));
}

TEST_F(CxxRendererTest, AppendsExtraParams) {
  ConverterOptions options;
  options.generator.extra_params = {{"scope", universe_.pointer_to(universe_.named("app/v1", "Scope"))}};
  auto file = generate(std::move(options));
  CxxRenderer renderer(universe_);
  auto source = renderer.render(file);
  ASSERT_TRUE(source) << source.error().message;
  const auto& text = *source;

  EXPECT_TRUE(contains(text, "auto Convert_v1_Item_To_internal_Item(const ::app::v1::Item* in, "
                             "::app::internal::Item* out, ::app::v1::Scope* scope) -> std::error_code;"));
  EXPECT_TRUE(contains(text, "Convert_v1_Item_To_internal_Item(&(*in)[i], &(*out)[i], scope); err) {"));
  EXPECT_TRUE(contains(text, "return autoConvert_v1_Item_To_internal_Item(in, out, scope);"));
  EXPECT_TRUE(contains(text, "}(&in->Items, &out->Items); err) {"));
}

TEST_F(CxxRendererTest, CustomErrorType) {
  auto file = generate();
  CxxRenderer renderer(universe_, RenderOptions{.error_type = "absl::Status",
                                                .error_include = "absl/status/status.h",
                                                .failure_test = "!err.ok()"});
  auto source = renderer.render(file);
  ASSERT_TRUE(source) << source.error().message;
  EXPECT_TRUE(contains(*source, "#include \"absl/status/status.h\""));
  EXPECT_TRUE(contains(*source, "-> absl::Status;"));
  EXPECT_TRUE(contains(*source, "; !err.ok()) {"));
  EXPECT_FALSE(contains(*source, "std::error_code"));
}

TEST_F(CxxRendererTest, SuppressedPairsHaveNoPublicWrapper) {
  auto file = generate();
  ASSERT_FALSE(file.functions.empty());
  file.functions[0].visibility = convgen::engine::Visibility::PublicSuppressed;
  const auto public_name = file.functions[0].public_name;
  const auto private_name = file.functions[0].private_name;
  CxxRenderer renderer(universe_);
  auto source = renderer.render(file);
  ASSERT_TRUE(source) << source.error().message;
  EXPECT_TRUE(contains(*source, "auto " + private_name + "("));
  EXPECT_FALSE(contains(*source, "auto " + public_name + "("));
}

TEST_F(CxxRendererTest, RejectsUnbalancedBlocks) {
  convgen::engine::GeneratedFile file;
  file.package = "app/v1";
  file.base_name = "broken";
  convgen::engine::GeneratedFunction function;
  function.pair = {universe_.named("app/v1", "Item"), universe_.named("app/internal", "Item")};
  function.private_name = "autoBroken";
  function.public_name = "Broken";
  function.body.for_each_index(Expr::var("in").deref(), "i");
  file.functions.push_back(std::move(function));

  CxxRenderer renderer(universe_);
  auto source = renderer.render(file);
  ASSERT_FALSE(source);
  EXPECT_NE(source.error().message.find("autoBroken: 1 unclosed block(s)"), std::string::npos);

  file.functions.front().body = {};
  file.functions.front().body.end_block();
  auto extra_end = renderer.render(file);
  ASSERT_FALSE(extra_end);
  EXPECT_NE(extra_end.error().message.find("unbalanced end of block"), std::string::npos);
}

TEST_F(CxxRendererTest, ReinterpretsRecordValuesAndPointers) {
  auto* in_item = universe_.named("app/v1", "Item");
  auto* out_item = universe_.named("app/internal", "Item");
  convgen::engine::GeneratedFile file;
  file.package = "app/v1";
  file.base_name = "layout";
  convgen::engine::GeneratedFunction function;
  function.pair = {universe_.named("app/v1", "Bag"), universe_.named("app/internal", "Bag")};
  function.private_name = "autoLayout";
  function.public_name = "Layout";
  function.visibility = convgen::engine::Visibility::PublicEligible;
  auto in = Expr::var("in").deref();
  auto out = Expr::var("out").deref();
  function.body.reinterpret_assign(out.field("Value"), in.field("Value"), in_item, out_item);
  function.body.reinterpret_assign(out.field("First"), in.field("First"), universe_.pointer_to(in_item),
                                   universe_.pointer_to(out_item));
  file.functions.push_back(std::move(function));

  CxxRenderer renderer(universe_);
  auto source = renderer.render(file);
  ASSERT_TRUE(source) << source.error().message;
  EXPECT_TRUE(contains(*source, "out->Value = *reinterpret_cast<const ::app::internal::Item*>(&in->Value);"));
  EXPECT_TRUE(contains(*source, "out->First = std::reinterpret_pointer_cast<::app::internal::Item>(in->First);"));
}
