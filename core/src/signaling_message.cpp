/**
 * @file signaling_message.cpp
 * @brief Signaling message codec (jsoncpp)
 */

#include "tankrtc/signaling_message.h"

#include <array>
#include <cstring>
#include <memory>
#include <utility>

#include <json/json.h>

namespace tankrtc
{

namespace
{

struct TypeName
{
  SignalingType type;
  const char* name;
};

constexpr std::array<TypeName, 8> kTypeNames = {{
    {SignalingType::OFFER, "offer"},
    {SignalingType::ANSWER, "answer"},
    {SignalingType::ICE_CANDIDATE, "ice-candidate"},
    {SignalingType::STOP_SENDING, "stop-sending"},
    {SignalingType::STOP_VIDEO, "stop-video"},
    {SignalingType::VIDEO_ADD, "video-add"},
    {SignalingType::VIDEO_REMOVE, "video-remove"},
    {SignalingType::ERROR, "error"},
}};

SignalingType type_from_name(const std::string& name)
{
  for (const auto& entry : kTypeNames)
  {
    if (name == entry.name)
    {
      return entry.type;
    }
  }
  return SignalingType::UNKNOWN;
}

std::string string_field(const Json::Value& root, const char* key)
{
  const auto& value = root[key];
  if (value.isString())
  {
    return value.asString();
  }
  // Some servers send the candidate as an object rather than a string
  if (value.isObject())
  {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
  }
  return {};
}

}  // namespace

SignalingMessage SignalingMessage::offer(std::string client_id, std::string sdp)
{
  SignalingMessage msg;
  msg.type = SignalingType::OFFER;
  msg.client_id = std::move(client_id);
  msg.sdp = std::move(sdp);
  return msg;
}

SignalingMessage SignalingMessage::ice_candidate(std::string client_id, std::string candidate)
{
  SignalingMessage msg;
  msg.type = SignalingType::ICE_CANDIDATE;
  msg.client_id = std::move(client_id);
  msg.candidate = std::move(candidate);
  return msg;
}

SignalingMessage SignalingMessage::stop_sending(std::string client_id)
{
  SignalingMessage msg;
  msg.type = SignalingType::STOP_SENDING;
  msg.client_id = std::move(client_id);
  return msg;
}

SignalingMessage SignalingMessage::stop_video()
{
  SignalingMessage msg;
  msg.type = SignalingType::STOP_VIDEO;
  return msg;
}

const char* to_string(SignalingType type)
{
  for (const auto& entry : kTypeNames)
  {
    if (entry.type == type)
    {
      return entry.name;
    }
  }
  return "";
}

std::optional<SignalingMessage> parse_signaling_message(std::string_view text)
{
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
  {
    return std::nullopt;
  }

  if (!root.isObject() || !root["type"].isString())
  {
    return std::nullopt;
  }

  SignalingMessage msg;
  msg.type_name = root["type"].asString();
  msg.type = type_from_name(msg.type_name);
  msg.client_id = string_field(root, "clientId");
  msg.sdp = string_field(root, "sdp");
  msg.candidate = string_field(root, "candidate");
  msg.message = string_field(root, "message");
  return msg;
}

std::string serialize_signaling_message(const SignalingMessage& message)
{
  Json::Value root(Json::objectValue);

  const char* name = to_string(message.type);
  root["type"] = std::strlen(name) > 0 ? std::string(name) : message.type_name;

  switch (message.type)
  {
    case SignalingType::OFFER:
      root["clientId"] = message.client_id;
      root["sdp"] = message.sdp;
      break;
    case SignalingType::ANSWER:
      root["sdp"] = message.sdp;
      break;
    case SignalingType::ICE_CANDIDATE:
      root["clientId"] = message.client_id;
      root["candidate"] = message.candidate;
      break;
    case SignalingType::STOP_SENDING:
    case SignalingType::VIDEO_ADD:
    case SignalingType::VIDEO_REMOVE:
      root["clientId"] = message.client_id;
      break;
    case SignalingType::ERROR:
      root["message"] = message.message;
      break;
    case SignalingType::STOP_VIDEO:
    case SignalingType::UNKNOWN:
      break;
  }

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, root);
}

}  // namespace tankrtc
