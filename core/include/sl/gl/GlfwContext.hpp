#pragma once
#include "sl/gl/GlContext.hpp"

#ifdef SL_HAS_GLFW

#include <string>

struct GLFWwindow;

namespace sl {

// Input gathered since the previous pollInput(), in window pixels.
struct WindowInput {
  double cursorX{0};
  double cursorY{0};
  bool cursorInside{false};
  bool cursorMoved{false};
  bool cursorLeft{false};
  bool clicked{false};      // primary button released without dragging
  double clickX{0};
  double clickY{0};
  int periodKey{0};         // 1..5 when a digit key was pressed
  bool resized{false};
  bool shouldClose{false};
};

class GlfwContext : public GlContext {
public:
  explicit GlfwContext(std::string title = "StockLens");
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  WindowInput pollInput();
  bool shouldClose() const;
  void setTitle(const std::string& title);

private:
  GLFWwindow* window_{nullptr};
  std::string title_;
  int width_{0};
  int height_{0};

  double cursorX_{0};
  double cursorY_{0};
  double pressX_{0};
  double pressY_{0};
  bool pressed_{false};
  bool inside_{false};
  bool moved_{false};
  bool left_{false};
  bool clicked_{false};
  int periodKey_{0};

  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void cursorEnterCallback(GLFWwindow* w, int entered);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
};

} // namespace sl

#endif // SL_HAS_GLFW
