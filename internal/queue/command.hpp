#pragma once

#include <string>
#include <variant>

#include "internal/model/transfer_job.hpp"

namespace streamlift::queue {

constexpr const char* kUploadMediaCommand = "upload-media";

struct UploadMediaCommand {
  std::string      media_id;
  model::MediaKind kind = model::MediaKind::kMovie;
};

// Well-formed message naming a command this worker does not handle.
struct UnknownCommand {
  std::string command;
};

// Body that is not JSON or lacks required fields.
struct MalformedCommand {
  std::string reason;
};

using Command = std::variant<UploadMediaCommand, UnknownCommand, MalformedCommand>;

/*
  {"command": "upload-media", "mediaId": "...", "mediaType": "movie" | "episode"}
*/
Command ParseCommand(const std::string& body);

std::string EncodeUploadMedia(const std::string& media_id, model::MediaKind kind);

} // namespace streamlift::queue
