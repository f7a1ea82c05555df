#pragma once
#include "sl/scene/Scene.hpp"
#include "sl/scene/ResourceRegistry.hpp"
#include "sl/ids/Id.hpp"
#include "sl/pipelines/PipelineCatalog.hpp"

#include <string>

#include <rapidjson/document.h>

namespace sl {

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_GEOMETRY"
  std::string message;
  std::string details;  // small JSON object
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

// Applies JSON commands to a Scene. The only path by which recipes mutate
// the drawing graph.
class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

  std::string listResourcesJson() const;

  bool inFrame() const { return inFrame_; }
  std::uint64_t frameCount() const { return frameCounter_; }

private:
  Scene& scene_;
  ResourceRegistry& reg_;

  bool inFrame_{false};
  std::uint64_t frameCounter_{0};

  CmdResult cmdBeginFrame(const rapidjson::Value& obj);
  CmdResult cmdCommitFrame(const rapidjson::Value& obj);

  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);
  CmdResult cmdDelete(const rapidjson::Value& obj);

  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);
  CmdResult cmdSetGeometryVertexCount(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemColor(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemStyle(const rapidjson::Value& obj);

  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult okResult(Id createdId = 0);

  Id claimId(const rapidjson::Value& obj, ResourceKind kind, bool& taken);
  CmdResult validateDrawItem(const DrawItem& di) const;
};

} // namespace sl
