/**
 * @file session_config.cpp
 * @brief Session configuration loader
 */

#include "tankrtc/session_config.h"

#include <fstream>
#include <memory>
#include <sstream>

#include <json/json.h>

namespace tankrtc
{

namespace
{

constexpr int kMaxDimension = 65535;

void set_error(std::string* error, std::string message)
{
  if (error)
  {
    *error = std::move(message);
  }
}

bool read_string(const Json::Value& root, const char* key, std::string& out, std::string* error)
{
  if (!root.isMember(key)) return true;
  if (!root[key].isString())
  {
    set_error(error, std::string(key) + " must be a string");
    return false;
  }
  out = root[key].asString();
  return true;
}

bool read_int(const Json::Value& root, const char* key, int& out, std::string* error)
{
  if (!root.isMember(key)) return true;
  if (!root[key].isInt())
  {
    set_error(error, std::string(key) + " must be an integer");
    return false;
  }
  out = root[key].asInt();
  return true;
}

bool read_float(const Json::Value& root, const char* key, float& out, std::string* error)
{
  if (!root.isMember(key)) return true;
  if (!root[key].isNumeric())
  {
    set_error(error, std::string(key) + " must be a number");
    return false;
  }
  out = root[key].asFloat();
  return true;
}

bool read_bool(const Json::Value& root, const char* key, bool& out, std::string* error)
{
  if (!root.isMember(key)) return true;
  if (!root[key].isBool())
  {
    set_error(error, std::string(key) + " must be a boolean");
    return false;
  }
  out = root[key].asBool();
  return true;
}

bool read_millis(const Json::Value& root, const char* key, std::chrono::milliseconds& out,
                 std::string* error)
{
  if (!root.isMember(key)) return true;
  if (!root[key].isInt64())
  {
    set_error(error, std::string(key) + " must be an integer");
    return false;
  }
  out = std::chrono::milliseconds(root[key].asInt64());
  return true;
}

// Accepts {urls: "stun:..."} and {urls: ["stun:...", ...]}; an array expands
// to one IceServer per url.
bool read_ice_servers(const Json::Value& root, std::vector<IceServer>& out, std::string* error)
{
  if (!root.isMember("iceServers")) return true;
  const auto& servers = root["iceServers"];
  if (!servers.isArray())
  {
    set_error(error, "iceServers must be an array");
    return false;
  }

  std::vector<IceServer> parsed;
  for (const auto& entry : servers)
  {
    if (!entry.isObject() || !entry.isMember("urls"))
    {
      set_error(error, "iceServers entries need a urls field");
      return false;
    }

    IceServer base;
    base.username = entry.get("username", "").asString();
    base.credential = entry.get("credential", "").asString();

    const auto& urls = entry["urls"];
    if (urls.isString())
    {
      base.urls = urls.asString();
      parsed.push_back(base);
    }
    else if (urls.isArray())
    {
      for (const auto& url : urls)
      {
        if (!url.isString())
        {
          set_error(error, "iceServers urls must be strings");
          return false;
        }
        IceServer server = base;
        server.urls = url.asString();
        parsed.push_back(std::move(server));
      }
    }
    else
    {
      set_error(error, "iceServers urls must be a string or array");
      return false;
    }
  }

  out = std::move(parsed);
  return true;
}

}  // namespace

std::optional<SessionConfig> parse_session_config(std::string_view json, std::string* error)
{
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string parse_errors;
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &parse_errors))
  {
    set_error(error, "malformed JSON: " + parse_errors);
    return std::nullopt;
  }

  if (!root.isObject())
  {
    set_error(error, "configuration must be a JSON object");
    return std::nullopt;
  }

  SessionConfig config;
  bool ok = read_string(root, "serverUrl", config.server_url, error) &&
            read_int(root, "videoFrameRate", config.video_frame_rate, error) &&
            read_int(root, "videoWidth", config.video_width, error) &&
            read_int(root, "videoHeight", config.video_height, error) &&
            read_float(root, "videoQuality", config.video_quality, error) &&
            read_float(root, "audioVolume", config.audio_volume, error) &&
            read_float(root, "maxHearingRange", config.max_hearing_range, error) &&
            read_bool(root, "debug", config.debug, error) &&
            read_millis(root, "staleFrameThresholdMs", config.stale_frame_threshold, error) &&
            read_millis(root, "evictionSweepIntervalMs", config.eviction_sweep_interval, error) &&
            read_millis(root, "evictionAgeMs", config.eviction_age, error) &&
            read_millis(root, "dataChannelOpenTimeoutMs", config.data_channel_open_timeout,
                        error) &&
            read_millis(root, "channelPollIntervalMs", config.channel_poll_interval, error) &&
            read_ice_servers(root, config.ice_servers, error);

  if (!ok) return std::nullopt;
  return config;
}

std::optional<SessionConfig> load_session_config(const std::string& path, std::string* error)
{
  std::ifstream file(path);
  if (!file)
  {
    set_error(error, "cannot open " + path);
    return std::nullopt;
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  return parse_session_config(contents.str(), error);
}

std::vector<std::string> validate_config(const SessionConfig& config)
{
  std::vector<std::string> problems;

  if (config.server_url.empty())
  {
    problems.emplace_back("serverUrl is empty");
  }
  if (config.video_frame_rate <= 0)
  {
    problems.emplace_back("videoFrameRate must be positive");
  }
  if (config.video_width <= 0 || config.video_height <= 0)
  {
    problems.emplace_back("video dimensions must be positive");
  }
  if (config.video_width > kMaxDimension || config.video_height > kMaxDimension)
  {
    problems.emplace_back("video dimensions must fit a JPEG frame header");
  }
  if (config.video_quality <= 0.0f || config.video_quality > 1.0f)
  {
    problems.emplace_back("videoQuality must be in (0, 1]");
  }
  if (config.audio_volume < 0.0f)
  {
    problems.emplace_back("audioVolume must not be negative");
  }
  if (config.max_hearing_range <= 0.0f)
  {
    problems.emplace_back("maxHearingRange must be positive");
  }
  if (config.stale_frame_threshold.count() <= 0 || config.eviction_sweep_interval.count() <= 0 ||
      config.eviction_age.count() <= 0 || config.data_channel_open_timeout.count() <= 0 ||
      config.channel_poll_interval.count() <= 0)
  {
    problems.emplace_back("timing values must be positive");
  }

  return problems;
}

}  // namespace tankrtc
