#pragma once

namespace epoch_pipeline::term {
class ComputeRegistry;
}

namespace epoch_pipeline::term::components {
void RegisterBuiltins(ComputeRegistry &registry);
}
