// Repository: Gamecast-commentary
// Component: CommentaryControl gRPC Service Implementation
// Purpose: Implements the CommentaryControl service interface for commentary
//          session lifecycle management.
// Copyright (c) 2025 RetroVue

#include "commentary_service.h"

#include <utility>

#include "gamecast/commentary/CommentaryTypes.hpp"
#include "gamecast/config/InstructionTemplate.hpp"
#include "gamecast/util/Logger.hpp"

namespace gamecast {
namespace control {

using gamecast::util::Logger;

namespace {

constexpr char kApiVersion[] = "1.0.0";

// Poll period of the output stream; bounds how long a cancelled client
// keeps the handler thread.
constexpr int64_t kOutputPollMs = 100;

bool LevelFromProto(KnowledgeLevel level, commentary::KnowledgeLevel* out) {
  switch (level) {
    case KNOWLEDGE_LEVEL_UNSPECIFIED: return true;
    case KNOWLEDGE_LEVEL_BEGINNER: *out = commentary::KnowledgeLevel::kBeginner; return true;
    case KNOWLEDGE_LEVEL_INTERMEDIATE: *out = commentary::KnowledgeLevel::kIntermediate; return true;
    case KNOWLEDGE_LEVEL_EXPERT: *out = commentary::KnowledgeLevel::kExpert; return true;
    default: return false;
  }
}

bool StyleFromProto(CommentaryStyle style, commentary::CommentaryStyle* out) {
  switch (style) {
    case COMMENTARY_STYLE_UNSPECIFIED: return true;
    case COMMENTARY_STYLE_ENTHUSIASTIC: *out = commentary::CommentaryStyle::kEnthusiastic; return true;
    case COMMENTARY_STYLE_ANALYTICAL: *out = commentary::CommentaryStyle::kAnalytical; return true;
    case COMMENTARY_STYLE_CASUAL: *out = commentary::CommentaryStyle::kCasual; return true;
    case COMMENTARY_STYLE_ROASTING: *out = commentary::CommentaryStyle::kRoasting; return true;
    default: return false;
  }
}

bool StrategyFromProto(StrategyKind kind, config::StrategyKind* out) {
  switch (kind) {
    case STRATEGY_KIND_UNSPECIFIED: return true;
    case STRATEGY_KIND_PERIODIC: *out = config::StrategyKind::kPeriodic; return true;
    case STRATEGY_KIND_EVENT_TRIGGERED: *out = config::StrategyKind::kEventTriggered; return true;
    default: return false;
  }
}

void SetIfNonEmpty(const std::string& value, std::string* field) {
  if (!value.empty()) {
    *field = value;
  }
}

// Zero keeps the default; a negative duration is a client error.
bool SetDuration(const char* name, int64_t value, int64_t* field, std::string* error) {
  if (value < 0) {
    *error = std::string(name) + " must not be negative, got " + std::to_string(value);
    return false;
  }
  if (value > 0) {
    *field = value;
  }
  return true;
}

}  // namespace

bool ConfigFromProto(const SessionConfig& proto, config::SessionConfig* out,
                     std::string* error) {
  config::SessionConfig cfg;

  SetIfNonEmpty(proto.team1(), &cfg.team1);
  SetIfNonEmpty(proto.team2(), &cfg.team2);
  SetIfNonEmpty(proto.team1_color(), &cfg.team1_color);
  SetIfNonEmpty(proto.team2_color(), &cfg.team2_color);
  cfg.favorite_team = proto.favorite_team();

  if (!LevelFromProto(proto.level(), &cfg.level)) {
    *error = "unknown knowledge level " + std::to_string(proto.level());
    return false;
  }
  if (!StyleFromProto(proto.style(), &cfg.style)) {
    *error = "unknown commentary style " + std::to_string(proto.style());
    return false;
  }
  if (!StrategyFromProto(proto.strategy(), &cfg.strategy)) {
    *error = "unknown strategy " + std::to_string(proto.strategy());
    return false;
  }

  if (proto.has_periodic()) {
    const auto& p = proto.periodic();
    if (!SetDuration("periodic.startup_delay_ms", p.startup_delay_ms(),
                     &cfg.periodic.startup_delay_ms, error) ||
        !SetDuration("periodic.settle_delay_ms", p.settle_delay_ms(),
                     &cfg.periodic.settle_delay_ms, error) ||
        !SetDuration("periodic.interval_ms", p.interval_ms(),
                     &cfg.periodic.interval_ms, error) ||
        !SetDuration("periodic.fault_backoff_ms", p.fault_backoff_ms(),
                     &cfg.periodic.fault_backoff_ms, error)) {
      return false;
    }
  }
  if (proto.has_event()) {
    const auto& e = proto.event();
    if (!SetDuration("event.cooldown_ms", e.cooldown_ms(), &cfg.event.cooldown_ms, error) ||
        !SetDuration("event.debounce_ms", e.debounce_ms(), &cfg.event.debounce_ms, error)) {
      return false;
    }
    SetIfNonEmpty(e.qualifying_label(), &cfg.event.qualifying_label);
    // Zero keeps the default; anything else goes through range validation.
    if (e.min_confidence() != 0.0) {
      cfg.event.min_confidence = e.min_confidence();
    }
  }

  cfg.feed.source_uri = proto.source_uri();
  if (!SetDuration("feed_fault_backoff_ms", proto.feed_fault_backoff_ms(),
                   &cfg.feed.fault_backoff_ms, error)) {
    return false;
  }
  cfg.feed.pace_realtime = !proto.disable_realtime_pacing();
  cfg.prompt_seed = proto.prompt_seed();

  config::ConfigValidation validation = config::ValidateSessionConfig(cfg);
  if (!validation.valid) {
    *error = validation.detail;
    return false;
  }
  *out = std::move(cfg);
  return true;
}

CommentaryControlImpl::CommentaryControlImpl(session::SessionDependencies deps)
    : deps_(std::move(deps)) {}

CommentaryControlImpl::~CommentaryControlImpl() {
  EndAllSessions();
}

std::shared_ptr<CommentaryControlImpl::SessionEntry> CommentaryControlImpl::FindSession(
    const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

size_t CommentaryControlImpl::SessionCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

grpc::Status CommentaryControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                               const ApiVersionRequest* /*request*/,
                                               ApiVersion* response) {
  response->set_version(kApiVersion);
  Logger::Debug(std::string("[GetVersion] Returning version: ") + kApiVersion);
  return grpc::Status::OK;
}

grpc::Status CommentaryControlImpl::StartSession(grpc::ServerContext* /*context*/,
                                                 const StartSessionRequest* request,
                                                 StartSessionResponse* response) {
  const std::string& session_id = request->session_id();
  Logger::Info("[StartSession] Request received: session_id=" + session_id);

  if (session_id.empty()) {
    response->set_success(false);
    response->set_message("session_id is required");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, response->message());
  }

  config::SessionConfig cfg;
  std::string error;
  if (!ConfigFromProto(request->config(), &cfg, &error)) {
    response->set_success(false);
    response->set_message("invalid config: " + error);
    Logger::Warn("[StartSession] " + session_id + " rejected: " + error);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, response->message());
  }

  std::string instructions = config::RenderInstructions(request->instructions_template(), cfg);

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.count(session_id) != 0) {
      response->set_success(false);
      response->set_message("session " + session_id + " already exists");
      return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, response->message());
    }

    auto entry = std::make_shared<SessionEntry>();
    entry->output = std::make_shared<session::SessionOutputChannel>();
    entry->session = std::make_unique<session::CommentarySession>(
        session_id, std::move(cfg), entry->output, deps_);
    sessions_.emplace(session_id, std::move(entry));
  }

  response->set_success(true);
  response->set_message("session created");
  response->set_instructions(std::move(instructions));
  Logger::Info("[StartSession] Session " + session_id + " created");
  return grpc::Status::OK;
}

grpc::Status CommentaryControlImpl::SignalTrack(grpc::ServerContext* /*context*/,
                                                const SignalTrackRequest* request,
                                                SignalTrackResponse* response) {
  auto entry = FindSession(request->session_id());
  if (!entry) {
    response->set_success(false);
    response->set_message("session not found");
    return grpc::Status(grpc::StatusCode::NOT_FOUND, response->message());
  }

  session::TrackKind kind;
  switch (request->track_type()) {
    case TRACK_TYPE_AUDIO: kind = session::TrackKind::kAudio; break;
    case TRACK_TYPE_VIDEO: kind = session::TrackKind::kVideo; break;
    default:
      response->set_success(false);
      response->set_message("track_type is required");
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, response->message());
  }

  session::SessionResult result = entry->session->SignalTrack(kind);
  response->set_success(result.ok);
  response->set_message(result.message);
  if (!result.ok) {
    grpc::StatusCode code = grpc::StatusCode::FAILED_PRECONDITION;
    if (entry->session->Ended()) {
      code = grpc::StatusCode::NOT_FOUND;
    }
    return grpc::Status(code, result.message);
  }
  return grpc::Status::OK;
}

grpc::Status CommentaryControlImpl::ReportDetections(grpc::ServerContext* /*context*/,
                                                     const ReportDetectionsRequest* request,
                                                     ReportDetectionsResponse* response) {
  auto entry = FindSession(request->session_id());
  if (!entry) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "session not found");
  }

  commentary::DetectionEvent event;
  event.objects.reserve(static_cast<size_t>(request->objects_size()));
  for (const auto& object : request->objects()) {
    event.objects.push_back(commentary::DetectedObject{object.label(), object.confidence()});
  }

  session::SessionResult result = entry->session->ReportDetections(event);
  if (!result.ok) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, result.message);
  }
  response->set_prompt_issued(result.prompt_delivered);
  return grpc::Status::OK;
}

grpc::Status CommentaryControlImpl::UpdateVoiceLink(grpc::ServerContext* /*context*/,
                                                    const UpdateVoiceLinkRequest* request,
                                                    UpdateVoiceLinkResponse* response) {
  auto entry = FindSession(request->session_id());
  if (!entry) {
    response->set_success(false);
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "session not found");
  }
  entry->output->SetVoiceLink(request->connected());
  Logger::Info("[UpdateVoiceLink] " + request->session_id() +
               (request->connected() ? " connected" : " disconnected"));
  response->set_success(true);
  return grpc::Status::OK;
}

grpc::Status CommentaryControlImpl::SubscribeSessionOutput(
    grpc::ServerContext* context,
    const SubscribeSessionOutputRequest* request,
    grpc::ServerWriter<SessionOutput>* writer) {
  const std::string& session_id = request->session_id();
  auto entry = FindSession(session_id);
  if (!entry) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "session not found");
  }
  if (!entry->output->AttachSubscriber()) {
    return grpc::Status(grpc::StatusCode::ALREADY_EXISTS,
                        "session output already has a subscriber");
  }
  Logger::Info("[SubscribeSessionOutput] Subscriber attached to " + session_id);

  uint64_t written = 0;
  session::SessionOutputItem item;
  while (!context->IsCancelled()) {
    session::PopResult popped = entry->output->Pop(&item, kOutputPollMs);
    if (popped == session::PopResult::kClosed) {
      break;
    }
    if (popped == session::PopResult::kTimeout) {
      continue;
    }

    SessionOutput out;
    if (item.kind == session::SessionOutputItem::Kind::kAudio) {
      auto* audio = out.mutable_audio();
      audio->set_pcm(item.chunk.data.data(), item.chunk.data.size());
      audio->set_mime_type(item.mime_type);
      audio->set_sample_rate(item.chunk.sample_rate);
      audio->set_channels(item.chunk.channels);
      audio->set_pts_us(item.chunk.pts_us);
    } else {
      out.mutable_prompt()->set_text(item.text);
    }
    if (!writer->Write(out)) {
      break;
    }
    ++written;
  }

  entry->output->DetachSubscriber();
  Logger::Info("[SubscribeSessionOutput] Subscriber detached from " + session_id +
               " written=" + std::to_string(written));
  return grpc::Status::OK;
}

grpc::Status CommentaryControlImpl::EndSession(grpc::ServerContext* /*context*/,
                                               const EndSessionRequest* request,
                                               EndSessionResponse* response) {
  const std::string& session_id = request->session_id();
  std::shared_ptr<SessionEntry> entry;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
      entry = std::move(it->second);
      sessions_.erase(it);
    }
  }
  if (!entry) {
    response->set_success(false);
    response->set_message("session not found");
    return grpc::Status(grpc::StatusCode::NOT_FOUND, response->message());
  }

  entry->session->End();
  entry->output->Close();
  response->set_success(true);
  response->set_message("session ended");
  Logger::Info("[EndSession] Session " + session_id + " ended");
  return grpc::Status::OK;
}

void CommentaryControlImpl::EndAllSessions() {
  std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& kv : sessions) {
    kv.second->session->End();
    kv.second->output->Close();
  }
}

}  // namespace control
}  // namespace gamecast
