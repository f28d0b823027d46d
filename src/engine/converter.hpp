#pragma once

#include <span>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/generator.hpp"
#include "engine/options.hpp"
#include "engine/universe.hpp"

namespace convgen::engine {

inline constexpr const char* kDefaultOutputBaseName = "conversion_generated";

struct ConverterOptions {
  GeneratorOptions generator;
  /// Peer packages consulted for every input, after its own peer-packages tag.
  std::vector<std::string> base_peer_packages;
  std::string output_base_name = kDefaultOutputBaseName;
};

/// Conversions generated for one input package. The generated code lives in
/// the input package itself.
struct GeneratedFile {
  std::string package;
  std::string base_name;
  std::vector<std::string> extra_imports;
  std::vector<ExtraParam> extra_params;
  std::vector<GeneratedFunction> functions;
};

/// Runs one generator per input package. All generators of a run share one
/// manual conversion tracker.
class Converter {
 public:
  explicit Converter(ConverterOptions options);

  auto run(Universe& universe, std::span<const std::string> inputs) -> Expected<std::vector<GeneratedFile>>;

  auto options() const -> const ConverterOptions& { return options_; }

 private:
  ConverterOptions options_;
};

/// Missing-field handler that marks the spot and fails the conversion, so the
/// pair gets no public wrapper.
auto error_missing_field_handler(const NamedVariable& in, const NamedVariable& out, const Member& member,
                                 EmitBuffer& buffer) -> Expected<void>;

/// Inconvertible-fields handler with the same policy.
auto error_inconvertible_fields_handler(const NamedVariable& in, const NamedVariable& out,
                                        const Member& in_member, const Member& out_member, EmitBuffer& buffer)
  -> Expected<void>;

}  // namespace convgen::engine
