#include "prompt.hpp"
#include <csignal>
#include <iostream>
#include <termios.h>
#include <unistd.h>

static std::string read_line(){
    std::string out;
    if (!std::getline(std::cin, out)) return {};
    if (!out.empty() && out.back()=='\r') out.pop_back();
    return out;
}

std::string ConsolePrompter::ask(const std::string& prompt){
    std::cout << prompt << std::flush;
    return read_line();
}

std::string ConsolePrompter::ask_secret(const std::string& prompt){
    std::cout << prompt << std::flush;
    std::string out;
    {
        EchoOff quiet(STDIN_FILENO);
        out = read_line();
    }
    std::cout << "\n";
    return out;
}

// Shared with the signal handler, so it cannot live in the object.
static const int kSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};
static constexpr int kNumSignals = sizeof(kSignals) / sizeof(kSignals[0]);
static volatile sig_atomic_t g_echo_fd = -1;
static termios g_saved;
static struct sigaction g_prev[kNumSignals];
static bool g_installed[kNumSignals];

static void restore_and_reraise(int sig){
    if (g_echo_fd >= 0) tcsetattr(g_echo_fd, TCSANOW, &g_saved);
    for (int i = 0; i < kNumSignals; i++)
        if (kSignals[i] == sig) sigaction(sig, &g_prev[i], nullptr);
    raise(sig);
}

static void restore_handlers(){
    for (int i = 0; i < kNumSignals; i++){
        if (g_installed[i]) sigaction(kSignals[i], &g_prev[i], nullptr);
        g_installed[i] = false;
    }
}

EchoOff::EchoOff(int fd): fd_(fd) {
    if (!isatty(fd_) || tcgetattr(fd_, &g_saved) != 0) return;

    struct sigaction sa{};
    sa.sa_handler = restore_and_reraise;
    sigemptyset(&sa.sa_mask);
    for (int i = 0; i < kNumSignals; i++){
        if (sigaction(kSignals[i], &sa, &g_prev[i]) != 0) continue;
        g_installed[i] = true;
        // leave ignored signals ignored
        if (g_prev[i].sa_handler == SIG_IGN) {
            sigaction(kSignals[i], &g_prev[i], nullptr);
            g_installed[i] = false;
        }
    }
    g_echo_fd = fd_;

    termios quiet = g_saved;
    quiet.c_lflag &= ~ECHO;
    if (tcsetattr(fd_, TCSANOW, &quiet) != 0) {
        g_echo_fd = -1;
        restore_handlers();
        return;
    }
    active_ = true;
}

EchoOff::~EchoOff(){
    if (!active_) return;
    tcsetattr(fd_, TCSANOW, &g_saved);
    g_echo_fd = -1;
    restore_handlers();
}
