#include "terminal.hpp"

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#  include <csignal>
#else
#  include <sys/ioctl.h>
#  include <unistd.h>
#  include <signal.h>
#endif

namespace platform {

// ── Terminal queries ─────────────────────────────────────────

int term_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
#endif
}

bool stdin_is_terminal() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

bool stdout_is_terminal() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

// ── Interrupt flag ───────────────────────────────────────────

static volatile sig_atomic_t g_interrupt_flag = 0;

static void sigint_handler(int) {
    g_interrupt_flag = 1;
}

#ifdef _WIN32

void install_interrupt_handler() {
    g_interrupt_flag = 0;
    std::signal(SIGINT, sigint_handler);
}

void remove_interrupt_handler() {
    std::signal(SIGINT, SIG_DFL);
}

#else

static struct sigaction g_old_sa;

void install_interrupt_handler() {
    g_interrupt_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_sa);
}

void remove_interrupt_handler() {
    sigaction(SIGINT, &g_old_sa, nullptr);
}

#endif

bool interrupted() {
    return g_interrupt_flag != 0;
}

void clear_interrupted() {
    g_interrupt_flag = 0;
}

} // namespace platform
