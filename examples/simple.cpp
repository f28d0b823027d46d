#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "common/logging/log.hpp"
#include "engine/converter.hpp"
#include "engine/model_json.hpp"
#include "engine/universe.hpp"
#include "render/cxx_renderer.hpp"

int main() {
  convgen::log::init();

  const char* model = R"JSON(
  {
    "packages": [
      {
        "path": "demo/v1",
        "header": "demo/v1/types.hpp",
        "comments": ["+conversion-gen:peer-packages=demo/internal"],
        "types": [
          { "name": "Port", "kind": "alias", "underlying": "int32" },
          { "name": "Endpoint", "kind": "record", "members": [
              { "name": "Host", "type": "string" },
              { "name": "Port", "type": "demo/v1.Port" }
          ]},
          { "name": "Service", "kind": "record", "members": [
              { "name": "Name", "type": "string" },
              { "name": "Endpoints", "type": "seq<demo/v1.Endpoint>" },
              { "name": "Labels", "type": "map<string, string>" },
              { "name": "Primary", "type": "ptr<demo/v1.Endpoint>" },
              { "name": "Internal", "type": "string", "comments": ["+conversion-gen=false"] }
          ]}
        ]
      },
      {
        "path": "demo/internal",
        "header": "demo/internal/types.hpp",
        "types": [
          { "name": "Endpoint", "kind": "record", "members": [
              { "name": "Host", "type": "string" },
              { "name": "Port", "type": "int64" }
          ]},
          { "name": "Service", "kind": "record", "members": [
              { "name": "Name", "type": "string" },
              { "name": "Endpoints", "type": "seq<demo/internal.Endpoint>" },
              { "name": "Labels", "type": "map<string, string>" },
              { "name": "Primary", "type": "ptr<demo/internal.Endpoint>" }
          ]}
        ]
      }
    ]
  }
  )JSON";

  convgen::engine::Universe universe;
  convgen::engine::Json json;
  try {
    json = convgen::engine::Json::parse(model);
  } catch (const std::exception& ex) {
    std::cerr << std::format("invalid model: {}\n", ex.what());
    return 1;
  }
  for (const auto& package : json["packages"]) {
    if (auto parsed = convgen::engine::parse_package_json(package, universe); !parsed) {
      std::cerr << std::format("model error: {}\n", parsed.error().message);
      return 1;
    }
  }

  convgen::engine::Converter converter({});
  const std::vector<std::string> inputs = {"demo/v1"};
  auto files = converter.run(universe, inputs);
  if (!files) {
    std::cerr << std::format("generation failed: {}\n", files.error().message);
    return 1;
  }

  convgen::render::CxxRenderer renderer(universe);
  for (const auto& file : *files) {
    auto source = renderer.render(file);
    if (!source) {
      std::cerr << std::format("render failed: {}\n", source.error().message);
      return 1;
    }
    std::cout << "=== " << file.package << "/" << convgen::render::CxxRenderer::file_name(file) << " ===\n";
    std::cout << *source;
  }

  convgen::log::shutdown();
  return 0;
}
