// Repository: Gamecast-commentary
// Component: CommentaryControl gRPC Service Implementation
// Purpose: Implements the CommentaryControl service interface for commentary
//          session lifecycle management.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_SERVICE_H_
#define GAMECAST_COMMENTARY_SERVICE_H_

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <grpcpp/grpcpp.h>

#include "commentary_control.grpc.pb.h"
#include "commentary_control.pb.h"
#include "gamecast/config/SessionConfig.hpp"
#include "gamecast/session/CommentarySession.hpp"
#include "gamecast/session/SessionOutputChannel.hpp"

namespace gamecast {
namespace control {

// Converts the wire config onto the engine defaults. Zero or unspecified
// fields keep the default. Returns false with *error set on an invalid
// config.
bool ConfigFromProto(const SessionConfig& proto, config::SessionConfig* out,
                     std::string* error);

// CommentaryControlImpl implements the gRPC service defined in
// commentary_control.proto. This is a thin adapter over CommentarySession;
// each session owns a SessionOutputChannel that the subscriber stream drains.
class CommentaryControlImpl final : public CommentaryControl::Service {
 public:
  explicit CommentaryControlImpl(session::SessionDependencies deps);
  ~CommentaryControlImpl() override;

  // Disable copy and move
  CommentaryControlImpl(const CommentaryControlImpl&) = delete;
  CommentaryControlImpl& operator=(const CommentaryControlImpl&) = delete;

  // RPC implementations
  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

  grpc::Status StartSession(grpc::ServerContext* context,
                            const StartSessionRequest* request,
                            StartSessionResponse* response) override;

  grpc::Status SignalTrack(grpc::ServerContext* context,
                           const SignalTrackRequest* request,
                           SignalTrackResponse* response) override;

  grpc::Status ReportDetections(grpc::ServerContext* context,
                                const ReportDetectionsRequest* request,
                                ReportDetectionsResponse* response) override;

  grpc::Status UpdateVoiceLink(grpc::ServerContext* context,
                               const UpdateVoiceLinkRequest* request,
                               UpdateVoiceLinkResponse* response) override;

  // Server-streaming RPC. One subscriber per session at a time.
  grpc::Status SubscribeSessionOutput(grpc::ServerContext* context,
                                      const SubscribeSessionOutputRequest* request,
                                      grpc::ServerWriter<SessionOutput>* writer) override;

  grpc::Status EndSession(grpc::ServerContext* context,
                          const EndSessionRequest* request,
                          EndSessionResponse* response) override;

  // Ends every session and closes every output stream (server shutdown).
  void EndAllSessions();

  size_t SessionCount() const;

 private:
  struct SessionEntry {
    std::shared_ptr<session::SessionOutputChannel> output;
    std::unique_ptr<session::CommentarySession> session;
  };

  std::shared_ptr<SessionEntry> FindSession(const std::string& session_id) const;

  session::SessionDependencies deps_;

  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions_;
};

}  // namespace control
}  // namespace gamecast

#endif  // GAMECAST_COMMENTARY_SERVICE_H_
