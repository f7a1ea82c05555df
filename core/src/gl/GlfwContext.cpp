#ifdef SL_HAS_GLFW

#include "sl/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cmath>
#include <cstdio>
#include <utility>

namespace sl {

// Presses that travel further than this are drags, not clicks.
static constexpr double kClickSlop = 4.0;

GlfwContext::GlfwContext(std::string title) : title_(std::move(title)) {}

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, title_.c_str(), nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  if (!gladLoadGL((GLADloadfunc)glfwGetProcAddress)) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  glfwSetWindowUserPointer(window_, this);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetCursorEnterCallback(window_, cursorEnterCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetKeyCallback(window_, keyCallback);

  glfwGetCursorPos(window_, &cursorX_, &cursorY_);
  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  flipRows(pixels, width_, height_);
  return pixels;
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

void GlfwContext::setTitle(const std::string& title) {
  title_ = title;
  if (window_) glfwSetWindowTitle(window_, title_.c_str());
}

WindowInput GlfwContext::pollInput() {
  glfwPollEvents();

  WindowInput in;
  if (window_) {
    int w = width_, h = height_;
    glfwGetFramebufferSize(window_, &w, &h);
    in.resized = (w != width_ || h != height_);
    width_ = w;
    height_ = h;
  }

  in.shouldClose = shouldClose();
  in.cursorX = cursorX_;
  in.cursorY = cursorY_;
  in.cursorInside = inside_;
  in.cursorMoved = moved_;
  in.cursorLeft = left_;
  in.clicked = clicked_;
  in.clickX = pressX_;
  in.clickY = pressY_;
  in.periodKey = periodKey_;

  moved_ = false;
  left_ = false;
  clicked_ = false;
  periodKey_ = 0;
  return in;
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->cursorX_ = x;
  self->cursorY_ = y;
  self->inside_ = true;
  self->moved_ = true;
}

void GlfwContext::cursorEnterCallback(GLFWwindow* w, int entered) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->inside_ = (entered == GLFW_TRUE);
  if (!self->inside_) self->left_ = true;
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || button != GLFW_MOUSE_BUTTON_LEFT) return;

  if (action == GLFW_PRESS) {
    self->pressed_ = true;
    self->pressX_ = self->cursorX_;
    self->pressY_ = self->cursorY_;
  } else if (action == GLFW_RELEASE && self->pressed_) {
    self->pressed_ = false;
    const double dx = self->cursorX_ - self->pressX_;
    const double dy = self->cursorY_ - self->pressY_;
    if (std::sqrt(dx * dx + dy * dy) <= kClickSlop) self->clicked_ = true;
  }
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || action != GLFW_PRESS) return;

  if (key >= GLFW_KEY_1 && key <= GLFW_KEY_5) {
    self->periodKey_ = key - GLFW_KEY_1 + 1;
  } else if (key == GLFW_KEY_ESCAPE) {
    glfwSetWindowShouldClose(w, GLFW_TRUE);
  }
}

} // namespace sl

#endif // SL_HAS_GLFW
