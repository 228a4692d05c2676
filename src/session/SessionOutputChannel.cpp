// Repository: Gamecast-commentary
// Component: SessionOutputChannel Implementation
// Copyright (c) 2025 RetroVue

#include "gamecast/session/SessionOutputChannel.hpp"

#include <algorithm>
#include <chrono>

namespace gamecast::session {

SessionOutputChannel::SessionOutputChannel(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

bool SessionOutputChannel::IsConnectedLocked() const {
  return voice_link_up_ && subscriber_attached_ && !closed_;
}

bool SessionOutputChannel::IsConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return IsConnectedLocked();
}

bool SessionOutputChannel::EvictOldestAudioLocked() {
  auto it = std::find_if(queue_.begin(), queue_.end(), [](const SessionOutputItem& item) {
    return item.kind == SessionOutputItem::Kind::kAudio;
  });
  if (it == queue_.end()) {
    return false;
  }
  queue_.erase(it);
  stats_.audio_dropped++;
  return true;
}

bool SessionOutputChannel::SendAudio(const audio::AudioChunk& chunk,
                                     const std::string& mime_type) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsConnectedLocked()) {
      return false;
    }
    if (queue_.size() >= capacity_ && !EvictOldestAudioLocked()) {
      stats_.audio_dropped++;
      return false;
    }

    SessionOutputItem item;
    item.kind = SessionOutputItem::Kind::kAudio;
    item.chunk = chunk;
    item.mime_type = mime_type;
    queue_.push_back(std::move(item));
    stats_.audio_queued++;
  }
  cv_.notify_one();
  return true;
}

bool SessionOutputChannel::SendPrompt(const std::string& text) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsConnectedLocked()) {
      return false;
    }
    if (queue_.size() >= capacity_ && !EvictOldestAudioLocked()) {
      queue_.pop_front();  // Queue holds prompts only
      stats_.prompts_dropped++;
    }

    SessionOutputItem item;
    item.kind = SessionOutputItem::Kind::kPrompt;
    item.text = text;
    queue_.push_back(std::move(item));
    stats_.prompts_queued++;
  }
  cv_.notify_one();
  return true;
}

void SessionOutputChannel::SetVoiceLink(bool connected) {
  std::lock_guard<std::mutex> lock(mutex_);
  voice_link_up_ = connected;
}

bool SessionOutputChannel::AttachSubscriber() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || subscriber_attached_) {
    return false;
  }
  subscriber_attached_ = true;
  return true;
}

void SessionOutputChannel::DetachSubscriber() {
  std::lock_guard<std::mutex> lock(mutex_);
  subscriber_attached_ = false;
  // Items queued for a departed subscriber are stale by the time another one
  // attaches.
  queue_.clear();
}

PopResult SessionOutputChannel::Pop(SessionOutputItem* out, int64_t timeout_ms) {
  if (!out) {
    return PopResult::kTimeout;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, std::chrono::milliseconds(std::max<int64_t>(timeout_ms, 0)),
               [this] { return !queue_.empty() || closed_; });
  if (!queue_.empty()) {
    *out = std::move(queue_.front());
    queue_.pop_front();
    return PopResult::kItem;
  }
  return closed_ ? PopResult::kClosed : PopResult::kTimeout;
}

void SessionOutputChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool SessionOutputChannel::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t SessionOutputChannel::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

OutputChannelStats SessionOutputChannel::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace gamecast::session
