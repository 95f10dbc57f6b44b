#pragma once
#include <string>

// Source of interactively entered values.
class Prompter {
public:
    virtual ~Prompter() = default;
    virtual std::string ask(const std::string& prompt) = 0;
    // Same, without echoing the answer.
    virtual std::string ask_secret(const std::string& prompt) = 0;
};

class ConsolePrompter : public Prompter {
public:
    std::string ask(const std::string& prompt) override;
    std::string ask_secret(const std::string& prompt) override;
};

// Turns terminal echo off on fd for its lifetime. The saved settings are
// also put back if SIGINT, SIGTERM, SIGHUP or SIGQUIT arrives meanwhile,
// before the signal is passed on to whatever handled it before. Does
// nothing when fd is not a terminal. One instance at a time.
class EchoOff {
public:
    explicit EchoOff(int fd);
    ~EchoOff();
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    bool active_ = false;
};
