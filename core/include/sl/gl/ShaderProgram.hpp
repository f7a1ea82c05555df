#pragma once
#include <glad/gl.h>
#include <string>
#include <unordered_map>

namespace sl {

// A linked program plus the locations of its active uniforms and
// attributes, looked up once at link time. Every chart frame sets the same
// transform and color uniforms for each draw item.
class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compiles and links; errors are logged with `name`. A program that is
  // already built is replaced.
  bool build(const char* name, const char* vertSrc, const char* fragSrc);

  void use() const { glUseProgram(program_); }
  bool valid() const { return program_ != 0; }
  const std::string& name() const { return name_; }

  // -1 when the name is not an active input of the program.
  GLint uniform(const char* name) const;
  GLint attrib(const char* name) const;

  void setMat3(const char* name, const float* data) const;
  void setVec2(const char* name, float x, float y) const;
  void setVec4(const char* name, const float* rgba) const;
  void setInt(const char* name, int v) const;

private:
  void destroy();
  void cacheLocations();

  GLuint program_{0};
  std::string name_;
  std::unordered_map<std::string, GLint> uniforms_;
  std::unordered_map<std::string, GLint> attribs_;
};

} // namespace sl
