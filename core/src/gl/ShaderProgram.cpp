#include "sl/gl/ShaderProgram.hpp"
#include <cstddef>
#include <cstdio>
#include <vector>

namespace sl {

namespace {

std::string shaderLog(GLuint shader) {
  GLint len = 0;
  glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  glGetShaderInfoLog(shader, static_cast<GLsizei>(log.size()), nullptr, log.data());
  return log.data();
}

std::string programLog(GLuint program) {
  GLint len = 0;
  glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  glGetProgramInfoLog(program, static_cast<GLsizei>(log.size()), nullptr, log.data());
  return log.data();
}

GLuint compile(const std::string& program, GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (ok) return s;

  std::fprintf(stderr, "ShaderProgram '%s': %s stage failed to compile:\n%s\n",
               program.c_str(), type == GL_VERTEX_SHADER ? "vertex" : "fragment",
               shaderLog(s).c_str());
  glDeleteShader(s);
  return 0;
}

} // namespace

ShaderProgram::~ShaderProgram() {
  destroy();
}

void ShaderProgram::destroy() {
  if (program_) glDeleteProgram(program_);
  program_ = 0;
  uniforms_.clear();
  attribs_.clear();
}

bool ShaderProgram::build(const char* name, const char* vertSrc, const char* fragSrc) {
  destroy();
  name_ = name;

  const GLuint vs = compile(name_, GL_VERTEX_SHADER, vertSrc);
  const GLuint fs = vs ? compile(name_, GL_FRAGMENT_SHADER, fragSrc) : 0;
  if (!fs) {
    if (vs) glDeleteShader(vs);
    return false;
  }

  const GLuint prog = glCreateProgram();
  glAttachShader(prog, vs);
  glAttachShader(prog, fs);
  glLinkProgram(prog);
  glDetachShader(prog, vs);
  glDetachShader(prog, fs);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint linked = 0;
  glGetProgramiv(prog, GL_LINK_STATUS, &linked);
  if (!linked) {
    std::fprintf(stderr, "ShaderProgram '%s': link failed:\n%s\n",
                 name_.c_str(), programLog(prog).c_str());
    glDeleteProgram(prog);
    return false;
  }

  program_ = prog;
  cacheLocations();
  return true;
}

void ShaderProgram::cacheLocations() {
  GLint count = 0;
  char buf[128];

  glGetProgramiv(program_, GL_ACTIVE_UNIFORMS, &count);
  for (GLint i = 0; i < count; i++) {
    GLint size = 0;
    GLenum type = 0;
    glGetActiveUniform(program_, static_cast<GLuint>(i), sizeof(buf), nullptr, &size, &type, buf);
    uniforms_[buf] = glGetUniformLocation(program_, buf);
  }

  glGetProgramiv(program_, GL_ACTIVE_ATTRIBUTES, &count);
  for (GLint i = 0; i < count; i++) {
    GLint size = 0;
    GLenum type = 0;
    glGetActiveAttrib(program_, static_cast<GLuint>(i), sizeof(buf), nullptr, &size, &type, buf);
    attribs_[buf] = glGetAttribLocation(program_, buf);
  }
}

GLint ShaderProgram::uniform(const char* name) const {
  auto it = uniforms_.find(name);
  return it == uniforms_.end() ? -1 : it->second;
}

GLint ShaderProgram::attrib(const char* name) const {
  auto it = attribs_.find(name);
  return it == attribs_.end() ? -1 : it->second;
}

void ShaderProgram::setMat3(const char* name, const float* data) const {
  glUniformMatrix3fv(uniform(name), 1, GL_FALSE, data);
}

void ShaderProgram::setVec2(const char* name, float x, float y) const {
  glUniform2f(uniform(name), x, y);
}

void ShaderProgram::setVec4(const char* name, const float* rgba) const {
  glUniform4f(uniform(name), rgba[0], rgba[1], rgba[2], rgba[3]);
}

void ShaderProgram::setInt(const char* name, int v) const {
  glUniform1i(uniform(name), v);
}

} // namespace sl
