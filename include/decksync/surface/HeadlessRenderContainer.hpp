// Repository: DeckSync
// Component: Headless Render Container
// Purpose: IRenderContainer without a display; records what was shown for diagnostics.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SURFACE_HEADLESS_RENDER_CONTAINER_HPP_
#define DECKSYNC_SURFACE_HEADLESS_RENDER_CONTAINER_HPP_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "decksync/surface/MediaTypes.hpp"

namespace decksync::surface {

class HeadlessRenderContainer : public IRenderContainer {
 public:
  explicit HeadlessRenderContainer(std::string id) : id_(std::move(id)) {}

  [[nodiscard]] const std::string& Id() const override { return id_; }

  void Mount(IMediaInstance* instance) override;
  void Unmount() override;

  [[nodiscard]] IMediaInstance* Mounted() const override { return mounted_; }
  [[nodiscard]] bool IsBound() const override { return bound_; }

  // Simulates the host detaching / re-attaching the container.
  void SetBound(bool bound) { bound_ = bound; }

  // Instance ids in display order; 0 marks a blank container.
  [[nodiscard]] const std::vector<InstanceId>& history() const {
    return history_;
  }
  // Times the container went from showing content to showing nothing.
  [[nodiscard]] uint64_t blank_transitions() const {
    return blank_transitions_;
  }
  [[nodiscard]] uint64_t mount_count() const { return mount_count_; }

 private:
  std::string id_;
  IMediaInstance* mounted_ = nullptr;
  bool bound_ = true;
  std::vector<InstanceId> history_;
  uint64_t blank_transitions_ = 0;
  uint64_t mount_count_ = 0;
};

}  // namespace decksync::surface

#endif  // DECKSYNC_SURFACE_HEADLESS_RENDER_CONTAINER_HPP_
