// Repository: MirrorCast
// Component: Broadcast Flag
// Purpose: Injected on/off switch for whether the host is broadcasting.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/runtime/BroadcastFlag.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <utility>

namespace mirrorcast::runtime {

FileBroadcastFlag::FileBroadcastFlag(std::string path) : path_(std::move(path)) {}

bool FileBroadcastFlag::IsBroadcastOn() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(path_, std::ios::binary);
  char value = '0';
  if (!in.get(value)) {
    return false;
  }
  return value == '1';
}

void FileBroadcastFlag::SetBroadcastOn(bool on) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Write-then-rename so a concurrent reader never sees an empty file.
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << "[BroadcastFlag] Cannot write " << tmp << std::endl;
      return;
    }
    out.put(on ? '1' : '0');
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    std::cerr << "[BroadcastFlag] Cannot replace " << path_ << std::endl;
  }
}

std::unique_ptr<BroadcastFlag> MakeBroadcastFlag(const std::string& path, bool initial) {
  if (path.empty()) {
    return std::make_unique<InMemoryBroadcastFlag>(initial);
  }
  auto flag = std::make_unique<FileBroadcastFlag>(path);
  flag->SetBroadcastOn(initial);
  return flag;
}

}  // namespace mirrorcast::runtime
