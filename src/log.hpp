#ifndef PNET_LOG_HPP
#define PNET_LOG_HPP
/**
 * Level gated logger writing timestamped lines to stderr.
 * The level defaults to Warn and honors LOG_LEVEL (debug, info, warn, error, none).
 */
#include <exception>
#include <string>

class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    // Reads LOG_LEVEL once; later calls are no-ops.
    static void initFromEnv();

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    static void logException(const std::string& where, const std::exception& e);

    static void setLevel(Level lvl);
    static bool enabled(Level lvl);

    // Parses a level name; returns false and leaves out untouched if unknown.
    static bool parseLevel(const std::string& name, Level& out);

private:
    static void logImpl(Level lvl, const std::string& msg);
};
#endif
