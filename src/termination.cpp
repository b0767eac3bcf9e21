#include "termination.h"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <tuple>

namespace {

std::atomic<strata::cancellation_token *> g_token{ nullptr };
std::atomic<bool> g_interrupted{ false };

void exit_now(int sig) {
  // Restore cursor visibility and auto-wrap before exit
  std::ignore = write(STDERR_FILENO, "\x1b[?25h\x1b[?7h", 12);
  _exit(128 + sig);
}

void signal_handler(int sig) {
  auto *const token{ g_token.load() };
  if (sig != SIGINT || !token || g_interrupted.exchange(true)) { exit_now(sig); }

  token->request();
  constexpr char kMsg[]{ "\nCancelling; press Ctrl-C again to exit immediately\n" };
  std::ignore = write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
}

}  // namespace

namespace strata {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

termination_scope::termination_scope(std::shared_ptr<cancellation_token> token)
    : token_{ std::move(token) } {
  g_interrupted.store(false);
  g_token.store(token_.get());
}

termination_scope::~termination_scope() { g_token.store(nullptr); }

}  // namespace strata
