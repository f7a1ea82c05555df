#include "sl/config/ChartConfig.hpp"
#include "sl/data/MarketDataClient.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace sl {

std::string serializeChartConfig(const ChartConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("apiBaseUrl", rapidjson::Value(config.apiBaseUrl.c_str(), alloc), alloc);
  doc.AddMember("ticker", rapidjson::Value(config.ticker.c_str(), alloc), alloc);
  doc.AddMember("period", rapidjson::Value(config.period.c_str(), alloc), alloc);

  rapidjson::Value windows(rapidjson::kArrayType);
  for (int w : config.maWindows) windows.PushBack(w, alloc);
  doc.AddMember("maWindows", windows, alloc);

  rapidjson::Value margins(rapidjson::kObjectType);
  margins.AddMember("top", config.viewport.margins.top, alloc);
  margins.AddMember("right", config.viewport.margins.right, alloc);
  margins.AddMember("bottom", config.viewport.margins.bottom, alloc);
  margins.AddMember("left", config.viewport.margins.left, alloc);

  rapidjson::Value vp(rapidjson::kObjectType);
  vp.AddMember("width", config.viewport.width, alloc);
  vp.AddMember("height", config.viewport.height, alloc);
  vp.AddMember("margins", margins, alloc);
  doc.AddMember("viewport", vp, alloc);

  doc.AddMember("volumeFraction", config.volumeFraction, alloc);
  doc.AddMember("theme", rapidjson::Value(config.theme.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

namespace {

bool readString(const rapidjson::Value& obj, const char* key, std::string& out,
                std::string& error) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsString()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = it->value.GetString();
  return true;
}

bool readNumber(const rapidjson::Value& obj, const char* key, double& out,
                std::string& error) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber()) {
    error = std::string("'") + key + "' must be a number";
    return false;
  }
  out = it->value.GetDouble();
  return true;
}

} // namespace

bool loadChartConfig(const std::string& json, ChartConfig& out, std::string& error) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    error = "config is not a JSON object";
    return false;
  }

  ChartConfig cfg = out;

  if (!readString(doc, "apiBaseUrl", cfg.apiBaseUrl, error)) return false;
  if (!readString(doc, "ticker", cfg.ticker, error)) return false;
  if (!readString(doc, "period", cfg.period, error)) return false;
  if (!readString(doc, "theme", cfg.theme, error)) return false;
  if (!readNumber(doc, "volumeFraction", cfg.volumeFraction, error)) return false;

  if (!isValidPeriod(cfg.period)) {
    error = "unsupported period '" + cfg.period + "'";
    return false;
  }
  if (cfg.volumeFraction <= 0.0 || cfg.volumeFraction >= 0.9) {
    error = "'volumeFraction' must be in (0, 0.9)";
    return false;
  }

  if (doc.HasMember("maWindows")) {
    const auto& arr = doc["maWindows"];
    if (!arr.IsArray()) {
      error = "'maWindows' must be an array";
      return false;
    }
    MaWindows windows;
    for (const auto& v : arr.GetArray()) {
      if (!v.IsInt() || v.GetInt() <= 0) {
        error = "'maWindows' entries must be positive integers";
        return false;
      }
      windows.push_back(v.GetInt());
    }
    cfg.maWindows = std::move(windows);
  }

  if (doc.HasMember("viewport")) {
    const auto& vp = doc["viewport"];
    if (!vp.IsObject()) {
      error = "'viewport' must be an object";
      return false;
    }
    if (!readNumber(vp, "width", cfg.viewport.width, error)) return false;
    if (!readNumber(vp, "height", cfg.viewport.height, error)) return false;
    if (cfg.viewport.width <= 0.0 || cfg.viewport.height <= 0.0) {
      error = "viewport size must be positive";
      return false;
    }

    if (vp.HasMember("margins")) {
      const auto& m = vp["margins"];
      if (!m.IsObject()) {
        error = "'margins' must be an object";
        return false;
      }
      if (!readNumber(m, "top", cfg.viewport.margins.top, error)) return false;
      if (!readNumber(m, "right", cfg.viewport.margins.right, error)) return false;
      if (!readNumber(m, "bottom", cfg.viewport.margins.bottom, error)) return false;
      if (!readNumber(m, "left", cfg.viewport.margins.left, error)) return false;
    }
  }

  out = std::move(cfg);
  return true;
}

bool loadChartConfigFile(const std::string& path, ChartConfig& out, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return loadChartConfig(ss.str(), out, error);
}

} // namespace sl
