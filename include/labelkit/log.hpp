#pragma once

#include <string>
#include <cstdarg>
#include <cstdio>

namespace labelkit::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Process-wide stderr logging, used by the demo tools.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Destination for messages emitted through a Logger.
class Sink {
public:
    virtual ~Sink() = default;
    virtual bool accepts(Level lvl) const { (void)lvl; return true; }
    virtual void write(Level lvl, const std::string& message) = 0;
};

// Sink forwarding to the process-wide stderr logger (honours set_level).
Sink& stderr_sink();

// Handle passed into the rendering path. A default-constructed Logger has
// no sink and drops everything without formatting it.
class Logger {
public:
    Logger() = default;
    explicit Logger(Sink& sink) : sink_(&sink) {}

    bool enabled() const { return sink_ != nullptr; }

    void trace(const char* fmt, ...) const;
    void debug(const char* fmt, ...) const;
    void info(const char* fmt, ...) const;
    void warn(const char* fmt, ...) const;
    void error(const char* fmt, ...) const;

private:
    void emit(Level lvl, const char* fmt, va_list args) const;

    Sink* sink_ = nullptr;
};

} // namespace labelkit::log
