#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

class Logger {
public:
    enum class Level {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3
    };

    /**
     * @brief Attiva il log su file in aggiunta alla console.
     * @param logsFolder Cartella dei file di log, creata se mancante.
     */
    static void init(const std::string &logsFolder = "logs");

    static void shutdown();

    static void setLevel(Level level);

    static Level level();

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static std::string logsFolder_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<int> minLevel_;

    static void log(Level level, const std::string &message);

    static void rotateLogFile();

    static void cleanupOldLogs();

    static std::string levelName(Level level);

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
