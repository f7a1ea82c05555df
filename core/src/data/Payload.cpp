#include "sl/data/Payload.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <string>
#include <utility>

namespace sl {

namespace {

const rapidjson::Value* member(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  return it == obj.MemberEnd() ? nullptr : &it->value;
}

std::string stringOr(const rapidjson::Value& obj, const char* key, const std::string& def = {}) {
  const auto* v = member(obj, key);
  return (v && v->IsString()) ? std::string(v->GetString(), v->GetStringLength()) : def;
}

bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = member(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = v->GetDouble();
  return true;
}

std::optional<double> optionalNumber(const rapidjson::Value& obj, const std::string& key) {
  const auto* v = member(obj, key.c_str());
  if (!v || !v->IsNumber()) return std::nullopt;
  return v->GetDouble();
}

bool parseDocument(rapidjson::Document& doc, const std::string& json, DataError& err) {
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    err = {"BAD_PAYLOAD", std::string("invalid JSON: ") +
                          rapidjson::GetParseError_En(doc.GetParseError()) +
                          " at offset " + std::to_string(doc.GetErrorOffset())};
    return false;
  }
  if (!doc.IsObject()) {
    err = {"BAD_PAYLOAD", "response is not a JSON object"};
    return false;
  }
  if (const auto* s = member(doc, "success"); s && s->IsBool() && !s->GetBool()) {
    std::string msg = stringOr(doc, "error", "request failed");
    err = {"FETCH_FAILED", msg};
    return false;
  }
  return true;
}

bool parseNewsArray(const rapidjson::Value& arr, std::vector<NewsItem>& out, DataError& err) {
  if (!arr.IsArray()) {
    err = {"BAD_PAYLOAD", "news is not an array"};
    return false;
  }
  for (const auto& v : arr.GetArray()) {
    if (!v.IsObject()) {
      err = {"BAD_PAYLOAD", "news entry is not an object"};
      return false;
    }
    NewsItem item;
    item.title = stringOr(v, "title");
    item.summary = stringOr(v, "summary");
    if (const auto* u = member(v, "url"); u && u->IsString() && u->GetStringLength() > 0) {
      item.url = std::string(u->GetString(), u->GetStringLength());
    }
    item.source = stringOr(v, "source");
    item.pubDate = stringOr(v, "pubDate");
    out.push_back(std::move(item));
  }
  return true;
}

} // namespace

BarsPayload parseBarsPayload(const std::string& json, const MaWindows& windows) {
  BarsPayload p;
  rapidjson::Document doc;
  if (!parseDocument(doc, json, p.err)) return p;

  p.ticker = stringOr(doc, "ticker");
  p.period = stringOr(doc, "period");

  const rapidjson::Value* data = member(doc, "data");
  if (!data) data = member(doc, "bars");
  if (!data || !data->IsArray()) {
    p.err = {"BAD_PAYLOAD", "missing bar array (data/bars)"};
    return p;
  }

  p.bars.reserve(data->Size());
  for (rapidjson::SizeType i = 0; i < data->Size(); i++) {
    const auto& v = (*data)[i];
    const std::string where = " (bar " + std::to_string(i) + ")";
    if (!v.IsObject()) {
      p.err = {"MALFORMED_BAR", "bar entry is not an object" + where};
      return p;
    }

    Bar b;
    auto key = toDayKey(stringOr(v, "time"));
    if (!key) {
      p.err = {"BAD_DAY_KEY", "bar time is not a calendar day" + where};
      return p;
    }
    b.time = *key;

    if (!readNumber(v, "open", b.open) || !readNumber(v, "high", b.high) ||
        !readNumber(v, "low", b.low) || !readNumber(v, "close", b.close) ||
        !readNumber(v, "volume", b.volume)) {
      p.err = {"MALFORMED_BAR", "missing or non-numeric OHLCV field" + where};
      return p;
    }

    b.ma.reserve(windows.size());
    b.volMa.reserve(windows.size());
    for (int w : windows) {
      b.ma.push_back(optionalNumber(v, "ma" + std::to_string(w)));
      b.volMa.push_back(optionalNumber(v, "vol_ma" + std::to_string(w)));
    }
    b.closeChangePct = optionalNumber(v, "close_change_pct");
    b.volumeChangePct = optionalNumber(v, "volume_change_pct");
    p.bars.push_back(std::move(b));
  }

  if (const auto* news = member(doc, "news"); news && !news->IsNull()) {
    if (!parseNewsArray(*news, p.news, p.err)) return p;
  }

  p.ok = true;
  return p;
}

NewsPayload parseNewsPayload(const std::string& json) {
  NewsPayload p;
  rapidjson::Document doc;
  if (!parseDocument(doc, json, p.err)) return p;

  p.source = stringOr(doc, "source");
  const auto* news = member(doc, "news");
  if (!news) {
    p.err = {"BAD_PAYLOAD", "missing news array"};
    return p;
  }
  if (!news->IsNull() && !parseNewsArray(*news, p.news, p.err)) return p;

  p.ok = true;
  return p;
}

} // namespace sl
