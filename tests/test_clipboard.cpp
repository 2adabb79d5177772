#include "hotlaunch/clipboard_manager.hpp"

#include "test_support.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <poll.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

/// Отдаёт CLIPBOARD только по INCR, порциями по kChunk байт
class IncrOwner {
public:
  static constexpr std::size_t kChunk = 64 * 1024;

  explicit IncrOwner(std::string text) : text_{std::move(text)} {}

  ~IncrOwner() {
    thread_ = {};
    if (display_) {
      XDestroyWindow(display_, window_);
      XCloseDisplay(display_);
    }
  }

  IncrOwner(const IncrOwner &) = delete;
  IncrOwner &operator=(const IncrOwner &) = delete;

  bool start() {
    display_ = XOpenDisplay(nullptr);
    if (!display_) {
      return false;
    }
    window_ = XCreateSimpleWindow(display_, DefaultRootWindow(display_), 0, 0,
                                  1, 1, 0, 0, 0);
    clipboard_ = XInternAtom(display_, "CLIPBOARD", False);
    utf8_ = XInternAtom(display_, "UTF8_STRING", False);
    incr_ = XInternAtom(display_, "INCR", False);

    XSetSelectionOwner(display_, clipboard_, window_, CurrentTime);
    XSync(display_, False);
    if (XGetSelectionOwner(display_, clipboard_) != window_) {
      return false;
    }

    thread_ = std::jthread([this](std::stop_token stop) { serve(stop); });
    return true;
  }

  bool finished() const { return finished_.load(); }

private:
  void serve(std::stop_token stop) {
    pollfd pfd{ConnectionNumber(display_), POLLIN, 0};
    while (!stop.stop_requested()) {
      while (XPending(display_) > 0) {
        XEvent event;
        XNextEvent(display_, &event);
        if (event.type == SelectionRequest) {
          begin(event.xselectionrequest);
        } else if (event.type == PropertyNotify &&
                   event.xproperty.window == requestor_ &&
                   event.xproperty.atom == property_ &&
                   event.xproperty.state == PropertyDelete) {
          send_next_chunk();
        }
      }
      pfd.revents = 0;
      (void)::poll(&pfd, 1, 50);
    }
  }

  void begin(const XSelectionRequestEvent &req) {
    requestor_ = req.requestor;
    property_ = req.property;
    offset_ = 0;
    sending_ = true;

    XSelectInput(display_, requestor_, PropertyChangeMask);
    long size = static_cast<long>(text_.size());
    XChangeProperty(display_, requestor_, property_, incr_, 32,
                    PropModeReplace, reinterpret_cast<unsigned char *>(&size),
                    1);

    XEvent reply{};
    reply.xselection.type = SelectionNotify;
    reply.xselection.display = display_;
    reply.xselection.requestor = req.requestor;
    reply.xselection.selection = req.selection;
    reply.xselection.target = req.target;
    reply.xselection.property = req.property;
    reply.xselection.time = req.time;
    XSendEvent(display_, req.requestor, False, NoEventMask, &reply);
    XFlush(display_);
  }

  void send_next_chunk() {
    if (!sending_) {
      return;
    }
    const auto n = std::min(kChunk, text_.size() - offset_);

    // Пустая порция завершает передачу
    if (n == 0) {
      sending_ = false;
      finished_ = true;
    }

    XChangeProperty(
        display_, requestor_, property_, utf8_, 8, PropModeReplace,
        reinterpret_cast<const unsigned char *>(text_.data() + offset_),
        static_cast<int>(n));
    XFlush(display_);
    offset_ += n;
  }

  std::string text_;
  Display *display_ = nullptr;
  Window window_ = None;
  Atom clipboard_ = None;
  Atom utf8_ = None;
  Atom incr_ = None;

  Window requestor_ = None;
  Atom property_ = None;
  std::size_t offset_ = 0;
  bool sending_ = false;
  std::atomic<bool> finished_{false};

  std::jthread thread_;
};

std::string make_text(std::size_t size) {
  std::string text;
  text.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    text.push_back(static_cast<char>('a' + i % 26));
  }
  return text;
}

void test_incremental_read() {
  const std::string text = make_text(300 * 1000);

  IncrOwner owner{text};
  CHECK(owner.start());

  hotlaunch::ClipboardManager clipboard{std::chrono::milliseconds{2000}};
  auto got = clipboard.read_text();
  CHECK(got.has_value());
  CHECK(got->size() == text.size());
  CHECK(*got == text);
  CHECK(owner.finished());
}

} // namespace

int main() {
  XInitThreads();

  // Без X сервера проверять нечего
  if (std::getenv("DISPLAY") == nullptr) {
    std::cout << "SKIP: DISPLAY is not set\n";
    return 0;
  }
  Display *check = XOpenDisplay(nullptr);
  if (!check) {
    std::cout << "SKIP: cannot open X display\n";
    return 0;
  }
  XCloseDisplay(check);

  test_incremental_read();

  std::cout << "OK\n";
  return 0;
}
