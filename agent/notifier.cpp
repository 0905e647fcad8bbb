#include "notifier.h"
#include "logger.h"
#include <cstdlib>
#include <sys/wait.h>

std::string DesktopNotifier::shellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

int DesktopNotifier::run(const std::string& cmd) {
    int status = std::system((cmd + " >/dev/null 2>&1").c_str());
    if (status == -1 || !WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
}

void DesktopNotifier::notify(const std::string& title, const std::string& message) {
#ifdef __APPLE__
    auto escape = [](const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        return out;
    };
    std::string script = "display notification \"" + escape(message) + "\" with title \"" + escape(title) + "\"";
    if (run("osascript -e " + shellQuote(script)) == 0) {
        return;
    }
#else
    if (run("command -v notify-send") == 0 &&
        run("notify-send " + shellQuote(title) + " " + shellQuote(message)) == 0) {
        return;
    }
#endif
    logError("[NOTIFICATION] " + title + ": " + message);
}
