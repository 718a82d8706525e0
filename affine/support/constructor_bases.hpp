#pragma once

namespace affine::support {

struct NonCopyableBase {
  NonCopyableBase() = default;

  NonCopyableBase(const NonCopyableBase&) = delete;
  NonCopyableBase& operator=(const NonCopyableBase&) = delete;

  NonCopyableBase(NonCopyableBase&&) = default;
  NonCopyableBase& operator=(NonCopyableBase&&) = default;
};

struct PinnedBase {
  PinnedBase() = default;

  PinnedBase(const PinnedBase&) = delete;
  PinnedBase& operator=(const PinnedBase&) = delete;

  PinnedBase(PinnedBase&&) = delete;
  PinnedBase& operator=(PinnedBase&&) = delete;
};

}  // namespace affine::support
