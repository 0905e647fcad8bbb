#pragma once

#include <string>

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& title, const std::string& message) = 0;
};

// Desktop notification through notify-send (Linux) or osascript (macOS).
// Falls back to the error log when neither is usable.
class DesktopNotifier : public Notifier {
public:
    void notify(const std::string& title, const std::string& message) override;

    static std::string shellQuote(const std::string& value);

private:
    static int run(const std::string& cmd);
};
