#include "command.hpp"

#include <google/protobuf/util/json_util.h>

#include "streamlift/v1/media_api.pb.h"

namespace streamlift::queue {

Command ParseCommand(const std::string& body) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  streamlift::v1::QueueMessage message;
  auto                         status = google::protobuf::util::JsonStringToMessage(body, &message, options);
  if (!status.ok()) {
    return MalformedCommand{"invalid JSON: " + std::string(status.message())};
  }

  if (message.command().empty()) {
    return MalformedCommand{"missing command"};
  }
  if (message.command() != kUploadMediaCommand) {
    return UnknownCommand{message.command()};
  }

  if (message.media_id().empty()) {
    return MalformedCommand{"upload-media without mediaId"};
  }
  if (message.media_id().find('/') != std::string::npos || message.media_id() == "." || message.media_id() == "..") {
    return MalformedCommand{"invalid mediaId: " + message.media_id()};
  }

  auto kind = model::ParseMediaKind(message.media_type());
  if (!kind) {
    return MalformedCommand{"invalid mediaType: '" + message.media_type() + "'"};
  }
  return UploadMediaCommand{message.media_id(), *kind};
}

std::string EncodeUploadMedia(const std::string& media_id, model::MediaKind kind) {
  streamlift::v1::QueueMessage message;
  message.set_command(kUploadMediaCommand);
  message.set_media_id(media_id);
  message.set_media_type(std::string(model::ToString(kind)));

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode queue message: " + std::string(status.message()));
  }
  return json;
}

} // namespace streamlift::queue
