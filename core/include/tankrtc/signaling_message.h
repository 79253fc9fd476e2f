#pragma once

/**
 * @file signaling_message.h
 * @brief JSON signaling messages exchanged on the audio and video channels
 */

#include <optional>
#include <string>
#include <string_view>

namespace tankrtc
{

/**
 * @brief Message type tag ("type" field)
 */
enum class SignalingType
{
  OFFER,          // "offer"          {clientId, sdp}
  ANSWER,         // "answer"         {sdp}
  ICE_CANDIDATE,  // "ice-candidate"  {clientId, candidate}
  STOP_SENDING,   // "stop-sending"   {clientId}
  STOP_VIDEO,     // "stop-video"     {}
  VIDEO_ADD,      // "video-add"      {clientId}
  VIDEO_REMOVE,   // "video-remove"   {clientId}
  ERROR,          // "error"          {message}
  UNKNOWN,
};

/**
 * @brief Decoded signaling message
 *
 * Fields not carried by a given type are left empty.
 */
struct SignalingMessage
{
  SignalingType type = SignalingType::UNKNOWN;
  std::string type_name;  // Raw "type" value as received
  std::string client_id;
  std::string sdp;
  std::string candidate;  // Opaque, itself JSON text
  std::string message;

  static SignalingMessage offer(std::string client_id, std::string sdp);
  static SignalingMessage ice_candidate(std::string client_id, std::string candidate);
  static SignalingMessage stop_sending(std::string client_id);
  static SignalingMessage stop_video();
};

/**
 * @brief Wire name of a type ("" for UNKNOWN)
 */
[[nodiscard]] const char* to_string(SignalingType type);

/**
 * @brief Parse a text message
 * @return Message, or nullopt if the text is not a JSON object with a string "type"
 */
[[nodiscard]] std::optional<SignalingMessage> parse_signaling_message(std::string_view text);

/**
 * @brief Serialize a message to compact JSON
 */
[[nodiscard]] std::string serialize_signaling_message(const SignalingMessage& message);

}  // namespace tankrtc
