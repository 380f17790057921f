#pragma once
#include <epoch_pipeline/graph/graph_builder.h>
#include <string>

namespace epoch_pipeline::runtime {

// Named, ordered collection of output terms plus an optional screen. Output
// order is the column order of the evaluated table.
class Pipeline {
public:
  Pipeline() = default;
  // Throws DuplicateOutputName for repeated names and UnsupportedDType when
  // the screen is not a Filter.
  explicit Pipeline(graph::NamedTerms outputs, term::TermPtr screen = nullptr);

  // Replaces an existing output of the same name only when `overwrite` is
  // set, otherwise throws DuplicateOutputName.
  void Add(std::string name, term::TermPtr term, bool overwrite = false);
  // Returns the removed term; throws std::out_of_range for unknown names.
  term::TermPtr Remove(std::string const &name);

  // Throws PipelineDefinitionError when a screen is already set and
  // `overwrite` is false.
  void SetScreen(term::TermPtr screen, bool overwrite = false);

  [[nodiscard]] const graph::NamedTerms &GetOutputs() const noexcept {
    return m_outputs;
  }
  [[nodiscard]] const term::TermPtr &GetScreen() const noexcept { return m_screen; }
  [[nodiscard]] bool empty() const noexcept { return m_outputs.empty(); }

  [[nodiscard]] graph::ExecutionPlan ToExecutionPlan() const;

private:
  graph::NamedTerms m_outputs;
  term::TermPtr m_screen;
};

} // namespace epoch_pipeline::runtime
