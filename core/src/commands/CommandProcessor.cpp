#include "sl/commands/CommandProcessor.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sl {

CommandProcessor::CommandProcessor(Scene& scene, ResourceRegistry& registry)
  : scene_(scene), reg_(registry) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

CmdResult CommandProcessor::okResult(Id createdId) {
  CmdResult r;
  r.ok = true;
  r.createdId = createdId;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (v && v->IsString()) return v->GetString();
  return {};
}

Id CommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  // Ids are JSON unsigned integers; anything else reads as missing.
  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  return 0;
}

Id CommandProcessor::claimId(const rapidjson::Value& obj, ResourceKind kind, bool& taken) {
  taken = false;
  Id id = getIdOrZero(obj, "id");
  if (id != 0) {
    if (!reg_.reserve(id, kind)) {
      taken = true;
      return 0;
    }
    return id;
  }
  return reg_.allocate(kind);
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "beginFrame") return cmdBeginFrame(obj);
  if (cmd == "commitFrame") return cmdCommitFrame(obj);

  if (cmd == "createPane") return cmdCreatePane(obj);
  if (cmd == "createLayer") return cmdCreateLayer(obj);
  if (cmd == "createDrawItem") return cmdCreateDrawItem(obj);
  if (cmd == "delete") return cmdDelete(obj);

  if (cmd == "createBuffer") return cmdCreateBuffer(obj);
  if (cmd == "createGeometry") return cmdCreateGeometry(obj);
  if (cmd == "bindDrawItem") return cmdBindDrawItem(obj);
  if (cmd == "setGeometryVertexCount") return cmdSetGeometryVertexCount(obj);
  if (cmd == "setDrawItemColor") return cmdSetDrawItemColor(obj);
  if (cmd == "setDrawItemStyle") return cmdSetDrawItemStyle(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- frames --------------------

CmdResult CommandProcessor::cmdBeginFrame(const rapidjson::Value&) {
  if (inFrame_) {
    return fail("BAD_COMMAND", "beginFrame: already in frame");
  }
  inFrame_ = true;
  frameCounter_++;
  return okResult();
}

CmdResult CommandProcessor::cmdCommitFrame(const rapidjson::Value&) {
  if (!inFrame_) {
    return fail("BAD_COMMAND", "commitFrame: not in frame");
  }
  inFrame_ = false;
  return okResult();
}

// -------------------- graph --------------------

CmdResult CommandProcessor::cmdCreatePane(const rapidjson::Value& obj) {
  bool taken = false;
  const Id id = claimId(obj, ResourceKind::Pane, taken);
  if (taken) return fail("ID_TAKEN", "createPane: id already exists");

  Pane p;
  p.id = id;
  p.name = getStringOrEmpty(obj, "name");
  scene_.addPane(std::move(p));
  return okResult(id);
}

CmdResult CommandProcessor::cmdCreateLayer(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !scene_.hasPane(paneId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createLayer: invalid paneId",
                std::string(R"({"field":"paneId","paneId":)") + idStr(paneId) + "}");
  }

  bool taken = false;
  const Id id = claimId(obj, ResourceKind::Layer, taken);
  if (taken) return fail("ID_TAKEN", "createLayer: id already exists");

  Layer l;
  l.id = id;
  l.paneId = paneId;
  l.name = getStringOrEmpty(obj, "name");
  scene_.addLayer(std::move(l));
  return okResult(id);
}

CmdResult CommandProcessor::cmdCreateDrawItem(const rapidjson::Value& obj) {
  const Id layerId = getIdOrZero(obj, "layerId");
  if (layerId == 0 || !scene_.hasLayer(layerId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createDrawItem: invalid layerId",
                std::string(R"({"field":"layerId","layerId":)") + idStr(layerId) + "}");
  }

  bool taken = false;
  const Id id = claimId(obj, ResourceKind::DrawItem, taken);
  if (taken) return fail("ID_TAKEN", "createDrawItem: id already exists");

  DrawItem d;
  d.id = id;
  d.layerId = layerId;
  d.name = getStringOrEmpty(obj, "name");
  scene_.addDrawItem(std::move(d));
  return okResult(id);
}

CmdResult CommandProcessor::cmdDelete(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0) {
    return fail("BAD_COMMAND", "delete: missing/invalid id");
  }

  const std::optional<ResourceKind> kind = reg_.kindOf(id);
  if (!kind) {
    return fail("NOT_FOUND",
                "delete: id does not exist",
                std::string(R"({"id":)") + idStr(id) + "}");
  }

  std::vector<Id> deleted;
  switch (*kind) {
    case ResourceKind::Pane:     deleted = scene_.deletePane(id); break;
    case ResourceKind::Layer:    deleted = scene_.deleteLayer(id); break;
    case ResourceKind::DrawItem: deleted = scene_.deleteDrawItem(id); break;
    case ResourceKind::Buffer:   deleted = scene_.deleteBuffer(id); break;
    case ResourceKind::Geometry: deleted = scene_.deleteGeometry(id); break;
  }

  if (deleted.empty()) {
    return fail("DELETE_FAILED",
                "delete: failed",
                std::string(R"({"id":)") + idStr(id) + R"(,"kind":")" + toString(*kind) + R"("})");
  }

  for (Id did : deleted) {
    reg_.release(did);
  }
  return okResult();
}

// -------------------- data bindings --------------------

CmdResult CommandProcessor::cmdCreateBuffer(const rapidjson::Value& obj) {
  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "createBuffer: missing uint byteLength");
  }

  bool taken = false;
  const Id id = claimId(obj, ResourceKind::Buffer, taken);
  if (taken) return fail("ID_TAKEN", "createBuffer: id already exists");

  Buffer b;
  b.id = id;
  b.byteLength = bl->GetUint();
  scene_.addBuffer(std::move(b));
  return okResult(id);
}

CmdResult CommandProcessor::cmdCreateGeometry(const rapidjson::Value& obj) {
  const Id vb = getIdOrZero(obj, "vertexBufferId");
  if (vb == 0 || !scene_.hasBuffer(vb)) {
    return fail("MISSING_BUFFER",
                "createGeometry: invalid vertexBufferId",
                std::string(R"({"field":"vertexBufferId","vertexBufferId":)") + idStr(vb) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "createGeometry: missing uint vertexCount");
  }

  VertexFormat fmt = VertexFormat::Pos2;
  if (const auto* f = getMember(obj, "format"); f && f->IsString()) {
    if (!parseVertexFormat(f->GetString(), fmt)) {
      return fail("UNSUPPORTED_VERTEX_FORMAT",
                  "createGeometry: unknown format",
                  R"({"supported":["pos2","rect4","label"]})");
    }
  }

  bool taken = false;
  const Id id = claimId(obj, ResourceKind::Geometry, taken);
  if (taken) return fail("ID_TAKEN", "createGeometry: id already exists");

  Geometry g;
  g.id = id;
  g.vertexBufferId = vb;
  g.format = fmt;
  g.vertexCount = vc->GetUint();
  scene_.addGeometry(std::move(g));
  return okResult(id);
}

CmdResult CommandProcessor::cmdBindDrawItem(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  if (drawItemId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing/invalid drawItemId");
  }

  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "bindDrawItem: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + idStr(drawItemId) + "}");
  }

  const std::string pipeline = getStringOrEmpty(obj, "pipeline");
  if (pipeline.empty()) {
    return fail("BAD_COMMAND", "bindDrawItem: missing pipeline");
  }

  const Id geomId = getIdOrZero(obj, "geometryId");
  if (geomId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing geometryId");
  }

  DrawItem candidate = *di;
  candidate.pipeline = pipeline;
  candidate.geometryId = geomId;

  CmdResult r = validateDrawItem(candidate);
  if (!r.ok) return r;

  *di = std::move(candidate);
  return r;
}

CmdResult CommandProcessor::cmdSetGeometryVertexCount(const rapidjson::Value& obj) {
  const Id geomId = getIdOrZero(obj, "geometryId");
  Geometry* g = scene_.getGeometryMutable(geomId);
  if (!g) {
    return fail("NOT_FOUND",
                "setGeometryVertexCount: geometry does not exist",
                std::string(R"({"geometryId":)") + idStr(geomId) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "setGeometryVertexCount: missing uint vertexCount");
  }

  const std::uint32_t count = vc->GetUint();
  if (g->format == VertexFormat::Pos2 && (count % 2u) != 0u) {
    return fail("VALIDATION_BAD_VERTEX_COUNT",
                "pos2 segment geometry requires an even vertexCount",
                std::string(R"({"vertexCount":)") + std::to_string(count) + "}");
  }

  g->vertexCount = count;
  return okResult();
}

static bool readColor(const rapidjson::Value& obj, float out[4]) {
  static const char* keys[4] = {"r", "g", "b", "a"};
  float tmp[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  for (int i = 0; i < 4; i++) {
    auto it = obj.FindMember(keys[i]);
    if (it == obj.MemberEnd()) {
      if (i == 3) continue;
      return false;
    }
    if (!it->value.IsNumber()) return false;
    tmp[i] = static_cast<float>(it->value.GetDouble());
  }
  for (int i = 0; i < 4; i++) out[i] = tmp[i];
  return true;
}

CmdResult CommandProcessor::cmdSetDrawItemColor(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemColor: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + idStr(drawItemId) + "}");
  }
  if (!readColor(obj, di->color)) {
    return fail("BAD_COMMAND", "setDrawItemColor: r,g,b must be numbers");
  }
  return okResult();
}

CmdResult CommandProcessor::cmdSetDrawItemStyle(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemStyle: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + idStr(drawItemId) + "}");
  }

  if (const auto* lw = getMember(obj, "lineWidth")) {
    if (!lw->IsNumber() || lw->GetDouble() <= 0.0) {
      return fail("BAD_COMMAND", "setDrawItemStyle: lineWidth must be positive");
    }
    di->lineWidth = static_cast<float>(lw->GetDouble());
  }
  if (const auto* fs = getMember(obj, "fontSize")) {
    if (!fs->IsNumber() || fs->GetDouble() <= 0.0) {
      return fail("BAD_COMMAND", "setDrawItemStyle: fontSize must be positive");
    }
    di->fontSize = static_cast<float>(fs->GetDouble());
  }
  return okResult();
}

CmdResult CommandProcessor::validateDrawItem(const DrawItem& di) const {
  const PipelineSpec* spec = findPipeline(di.pipeline);
  if (!spec) {
    return fail("UNKNOWN_PIPELINE",
                "drawItem pipeline not found",
                std::string(R"({"pipeline":")") + di.pipeline + R"("})");
  }

  const Geometry* g = scene_.getGeometry(di.geometryId);
  if (!g) {
    return fail("VALIDATION_BAD_GEOMETRY",
                "drawItem geometryId does not exist",
                std::string(R"({"geometryId":)") + idStr(di.geometryId) + "}");
  }

  if (!scene_.hasBuffer(g->vertexBufferId)) {
    return fail("VALIDATION_MISSING_BUFFER",
                "geometry must reference an existing vertexBufferId",
                std::string(R"({"vertexBufferId":)") + idStr(g->vertexBufferId) + "}");
  }

  if (g->format != spec->requiredVertexFormat) {
    return fail("VALIDATION_VERTEX_FORMAT_MISMATCH",
                "geometry vertex format does not match pipeline requirement",
                std::string(R"({"pipeline":")") + di.pipeline +
                  R"(","required":")" + toString(spec->requiredVertexFormat) +
                  R"(","got":")" + toString(g->format) + R"("})");
  }

  if ((g->vertexCount % spec->vertexMultiple) != 0u) {
    return fail("VALIDATION_BAD_VERTEX_COUNT",
                "vertexCount is not a multiple of the pipeline's primitive size",
                std::string(R"({"vertexCount":)") + std::to_string(g->vertexCount) + "}");
  }

  return okResult();
}

// -------------------- Query --------------------

std::string CommandProcessor::listResourcesJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto writeKind = [&](const char* key, ResourceKind kind) {
    w.Key(key);
    w.StartArray();
    for (Id id : reg_.list(kind)) w.Uint64(id);
    w.EndArray();
  };

  w.StartObject();
  writeKind("panes", ResourceKind::Pane);
  writeKind("layers", ResourceKind::Layer);
  writeKind("drawItems", ResourceKind::DrawItem);
  writeKind("buffers", ResourceKind::Buffer);
  writeKind("geometries", ResourceKind::Geometry);

  w.Key("frame");
  w.Uint64(frameCounter_);
  w.Key("inFrame");
  w.Bool(inFrame_);
  w.EndObject();

  return sb.GetString();
}

} // namespace sl
