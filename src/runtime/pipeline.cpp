#include <epoch_pipeline/runtime/pipeline.h>

#include <algorithm>
#include <epoch_pipeline/core/errors.h>
#include <fmt/format.h>

namespace epoch_pipeline::runtime {

namespace {
void ValidateScreen(term::TermPtr const &screen) {
  if (screen && !screen->IsFilter()) {
    throw UnsupportedDType(fmt::format("pipeline screen must be a Filter, got {} ({})",
                                       epoch_core::TermKindWrapper::ToString(screen->GetKind()),
                                       screen->ToString()));
  }
}
} // namespace

Pipeline::Pipeline(graph::NamedTerms outputs, term::TermPtr screen) {
  for (auto &[name, term] : outputs) {
    Add(std::move(name), std::move(term));
  }
  SetScreen(std::move(screen));
}

void Pipeline::Add(std::string name, term::TermPtr term, bool overwrite) {
  if (!term) {
    throw PipelineDefinitionError(fmt::format("output '{}' has no term", name));
  }
  auto it = std::ranges::find(m_outputs, name, &graph::NamedTerms::value_type::first);
  if (it == m_outputs.end()) {
    m_outputs.emplace_back(std::move(name), std::move(term));
    return;
  }
  if (!overwrite) {
    throw DuplicateOutputName(name);
  }
  it->second = std::move(term);
}

term::TermPtr Pipeline::Remove(std::string const &name) {
  auto it = std::ranges::find(m_outputs, name, &graph::NamedTerms::value_type::first);
  if (it == m_outputs.end()) {
    throw std::out_of_range(fmt::format("pipeline has no output named '{}'", name));
  }
  auto term = std::move(it->second);
  m_outputs.erase(it);
  return term;
}

void Pipeline::SetScreen(term::TermPtr screen, bool overwrite) {
  ValidateScreen(screen);
  if (m_screen && screen && !overwrite) {
    throw PipelineDefinitionError(
        fmt::format("pipeline already has a screen {}", m_screen->ToString()));
  }
  m_screen = std::move(screen);
}

graph::ExecutionPlan Pipeline::ToExecutionPlan() const {
  return graph::GraphBuilder{}.Build(m_outputs, m_screen);
}

} // namespace epoch_pipeline::runtime
