// Repository: MirrorCast
// Component: Broadcast Flag
// Purpose: Injected on/off switch for whether the host is broadcasting.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_RUNTIME_BROADCAST_FLAG_H_
#define MIRRORCAST_RUNTIME_BROADCAST_FLAG_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace mirrorcast::runtime {

// BroadcastFlag is owned outside the core. The host polls it and pushes the
// value to paired viewers; nothing in the core stores it globally.
class BroadcastFlag {
 public:
  virtual ~BroadcastFlag() = default;

  virtual bool IsBroadcastOn() const = 0;
  virtual void SetBroadcastOn(bool on) = 0;
};

class InMemoryBroadcastFlag : public BroadcastFlag {
 public:
  explicit InMemoryBroadcastFlag(bool initial = false) : on_(initial) {}

  bool IsBroadcastOn() const override { return on_.load(std::memory_order_acquire); }
  void SetBroadcastOn(bool on) override { on_.store(on, std::memory_order_release); }

 private:
  std::atomic<bool> on_;
};

// FileBroadcastFlag stores the flag as a single '0'/'1' byte so a separate
// capture process can flip it. A missing or unreadable file reads as off.
class FileBroadcastFlag : public BroadcastFlag {
 public:
  explicit FileBroadcastFlag(std::string path);

  bool IsBroadcastOn() const override;
  void SetBroadcastOn(bool on) override;

  const std::string& path() const { return path_; }

 private:
  const std::string path_;
  mutable std::mutex mutex_;
};

std::unique_ptr<BroadcastFlag> MakeBroadcastFlag(const std::string& path, bool initial);

}  // namespace mirrorcast::runtime

#endif  // MIRRORCAST_RUNTIME_BROADCAST_FLAG_H_
