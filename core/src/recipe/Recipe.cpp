#include "sl/recipe/Recipe.hpp"
#include "sl/style/Theme.hpp"

#include <cstdio>

namespace sl {

void appendPrimitive(RecipeBuildResult& out, const PrimitiveSpec& spec) {
  auto& c = out.createCommands;

  c.push_back(R"({"cmd":"createBuffer","id":)" + idStr(spec.bufferId) + R"(,"byteLength":0})");

  c.push_back(R"({"cmd":"createGeometry","id":)" + idStr(spec.geometryId) +
              R"(,"vertexBufferId":)" + idStr(spec.bufferId) +
              R"(,"format":")" + toString(spec.format) + R"(","vertexCount":0})");

  c.push_back(R"({"cmd":"createDrawItem","id":)" + idStr(spec.drawItemId) +
              R"(,"layerId":)" + idStr(spec.layerId) +
              R"(,"name":")" + spec.name + R"("})");

  c.push_back(R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(spec.drawItemId) +
              R"(,"pipeline":")" + spec.pipeline +
              R"(","geometryId":)" + idStr(spec.geometryId) + "}");

  c.push_back(colorCommand(spec.drawItemId, spec.color));

  char styleBuf[160];
  if (spec.fontSize > 0.0f) {
    std::snprintf(styleBuf, sizeof(styleBuf),
      R"({"cmd":"setDrawItemStyle","drawItemId":%s,"lineWidth":%.9g,"fontSize":%.9g})",
      idStr(spec.drawItemId).c_str(),
      static_cast<double>(spec.lineWidth), static_cast<double>(spec.fontSize));
  } else {
    std::snprintf(styleBuf, sizeof(styleBuf),
      R"({"cmd":"setDrawItemStyle","drawItemId":%s,"lineWidth":%.9g})",
      idStr(spec.drawItemId).c_str(), static_cast<double>(spec.lineWidth));
  }
  c.push_back(styleBuf);

  auto& d = out.disposeCommands;
  d.push_back(R"({"cmd":"delete","id":)" + idStr(spec.drawItemId) + "}");
  d.push_back(R"({"cmd":"delete","id":)" + idStr(spec.geometryId) + "}");
  d.push_back(R"({"cmd":"delete","id":)" + idStr(spec.bufferId) + "}");
}

} // namespace sl
