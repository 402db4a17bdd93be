#include "relay/exec/executor.hpp"

namespace relay {

namespace {
const std::shared_ptr<DirectExecutor> &direct_instance() {
  static const auto instance = std::make_shared<DirectExecutor>();
  return instance;
}
} // namespace

auto direct_executor() -> std::shared_ptr<IExecutor> {
  return direct_instance();
}

auto is_direct(const IExecutor *executor) noexcept -> bool {
  return executor == nullptr ||
         dynamic_cast<const DirectExecutor *>(executor) != nullptr;
}

} // namespace relay
