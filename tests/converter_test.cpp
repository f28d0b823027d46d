#include "engine/converter.hpp"
#include "engine/manual_conversions.hpp"
#include "engine/model_json.hpp"
#include "render/cxx_renderer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using convgen::engine::Converter;
using convgen::engine::ConverterOptions;
using convgen::engine::Universe;
using convgen::engine::Visibility;

namespace {

const char* kModel = R"JSON(
{
  "packages": [
    {
      "path": "app/v1",
      "header": "app/v1/types.hpp",
      "comments": ["+conversion-gen:peer-packages=app/internal",
                   "+conversion-gen:extra-imports=app/v1/conversion.hpp"],
      "types": [
        { "name": "Item", "kind": "record", "members": [
            { "name": "Name", "type": "string" }, { "name": "Count", "type": "int32" } ] },
        { "name": "Bag", "kind": "record", "members": [
            { "name": "Items", "type": "seq<app/v1.Item>" },
            { "name": "Labels", "type": "map<string, int32>" } ] },
        { "name": "Alone", "kind": "record" }
      ]
    },
    {
      "path": "app/v2",
      "header": "app/v2/types.hpp",
      "comments": ["+conversion-gen:peer-packages=app/internal"],
      "types": [
        { "name": "Item", "kind": "record", "members": [
            { "name": "Name", "type": "string" }, { "name": "Count", "type": "int64" } ] }
      ],
      "functions": [
        { "name": "Convert_v2_Item_To_internal_Item", "results": ["error"], "params": [
            { "name": "in", "type": "ptr<app/v2.Item>" }, { "name": "out", "type": "ptr<app/internal.Item>" } ] }
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
            { "name": "Labels", "type": "map<string, int32>" } ] }
      ]
    },
    {
      "path": "app/broken",
      "comments": ["+conversion-gen:peer-packages=app/internal"],
      "functions": [ { "name": "Convert_broken", "params": [], "results": [] } ]
    }
  ]
}
)JSON";

auto public_names(const convgen::engine::GeneratedFile& file) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& function : file.functions) {
    names.push_back(function.public_name);
  }
  return names;
}

}  // namespace

TEST(Converter, GeneratesFilteredTypesInSortedOrder) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  Converter converter(ConverterOptions{});
  const std::vector<std::string> inputs = {"app/v1"};
  auto files = converter.run(universe, inputs);
  ASSERT_TRUE(files) << files.error().message;
  ASSERT_EQ(files->size(), 1u);

  const auto& file = files->front();
  EXPECT_EQ(file.package, "app/v1");
  EXPECT_EQ(file.base_name, "conversion_generated");
  EXPECT_EQ(file.extra_imports, std::vector<std::string>{"app/v1/conversion.hpp"});
  EXPECT_EQ(public_names(file), (std::vector<std::string>{
                                  "Convert_v1_Bag_To_internal_Bag",
                                  "Convert_internal_Bag_To_v1_Bag",
                                  "Convert_v1_Item_To_internal_Item",
                                  "Convert_internal_Item_To_v1_Item",
                                }));
  for (const auto& function : file.functions) {
    EXPECT_EQ(function.visibility, Visibility::PublicEligible) << function.public_name;
  }
}

TEST(Converter, DedupesInputsAndSkipsUnknownPackages) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  Converter converter(ConverterOptions{});
  const std::vector<std::string> inputs = {"app/v1", "app/missing", "app/v1"};
  auto files = converter.run(universe, inputs);
  ASSERT_TRUE(files) << files.error().message;
  ASSERT_EQ(files->size(), 1u);
  EXPECT_EQ(files->front().package, "app/v1");
}

TEST(Converter, MalformedModelAbortsTheRun) {
  TempDir dir("convgen-converter");
  ASSERT_TRUE(write_text_file(dir.path() / "app/bad/package.json", R"JSON(
    { "path": "app/bad", "types": [ { "name": "A", "kind": "record", "members": [ { "name": "X" } ] } ] }
  )JSON"));
  Universe universe(std::make_unique<convgen::engine::JsonPackageSource>(dir.path()));
  Converter converter(ConverterOptions{});

  const std::vector<std::string> missing = {"app/nothing"};
  auto skipped = converter.run(universe, missing);
  ASSERT_TRUE(skipped) << skipped.error().message;
  EXPECT_TRUE(skipped->empty());

  const std::vector<std::string> inputs = {"app/bad"};
  auto files = converter.run(universe, inputs);
  ASSERT_FALSE(files);
  EXPECT_NE(files.error().message.find("unable to load package \"app/bad\""), std::string::npos);
  EXPECT_NE(files.error().message.find("missing or invalid field 'type'"), std::string::npos);
}

TEST(Converter, SharesOneTracker) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  auto tracker = convgen::engine::ManualConversionTracker::create();
  ASSERT_TRUE(tracker);
  ConverterOptions options;
  options.generator.tracker = *tracker;
  Converter converter(std::move(options));
  const std::vector<std::string> inputs = {"app/v1", "app/v2"};
  auto files = converter.run(universe, inputs);
  ASSERT_TRUE(files) << files.error().message;
  ASSERT_EQ(files->size(), 2u);
  EXPECT_EQ((*tracker)->size(), 1u);

  const auto& v2 = (*files)[1];
  ASSERT_EQ(v2.functions.size(), 2u);
  EXPECT_EQ(v2.functions[0].public_name, "Convert_v2_Item_To_internal_Item");
  EXPECT_EQ(v2.functions[0].visibility, Visibility::PublicSuppressed);
  EXPECT_EQ(v2.functions[1].visibility, Visibility::PublicEligible);
}

TEST(Converter, ConstructionErrorsAbortTheRun) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  Converter converter(ConverterOptions{});
  const std::vector<std::string> inputs = {"app/v1", "app/broken"};
  auto files = converter.run(universe, inputs);
  ASSERT_FALSE(files);
  EXPECT_NE(files.error().message.find("unable to create generator for package app/broken"), std::string::npos);
  EXPECT_NE(files.error().message.find("errors when looking for manual conversion functions in app/broken"),
            std::string::npos);
}

TEST(Converter, RejectsInvalidExtraParams) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  ConverterOptions options;
  options.generator.extra_params = {{"out", universe.builtin("string")}};
  Converter converter(std::move(options));
  const std::vector<std::string> inputs = {"app/v1"};
  EXPECT_FALSE(converter.run(universe, inputs));
}

TEST(Converter, OutputIsDeterministic) {
  auto generate = []() -> std::string {
    Universe universe;
    EXPECT_TRUE(load_packages(universe, kModel));
    Converter converter(ConverterOptions{});
    const std::vector<std::string> inputs = {"app/v2", "app/v1"};
    auto files = converter.run(universe, inputs);
    EXPECT_TRUE(files);
    if (!files) {
      return {};
    }
    convgen::render::CxxRenderer renderer(universe);
    std::string all;
    for (const auto& file : *files) {
      auto source = renderer.render(file);
      EXPECT_TRUE(source);
      if (source) {
        all += *source;
      }
    }
    return all;
  };
  auto first = generate();
  EXPECT_FALSE(first.empty());
  EXPECT_EQ(first, generate());
}
