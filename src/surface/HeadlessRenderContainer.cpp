#include "decksync/surface/HeadlessRenderContainer.hpp"

namespace decksync::surface {

void HeadlessRenderContainer::Mount(IMediaInstance* instance) {
  if (instance == mounted_) {
    return;
  }
  if (instance == nullptr) {
    Unmount();
    return;
  }
  mounted_ = instance;
  ++mount_count_;
  history_.push_back(instance->Id());
}

void HeadlessRenderContainer::Unmount() {
  if (mounted_ == nullptr) {
    return;
  }
  mounted_ = nullptr;
  ++blank_transitions_;
  history_.push_back(0);
}

}  // namespace decksync::surface
