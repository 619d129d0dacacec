#include "common/Logging.h"

#include "common/Loggable.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMessageLogContext>
#include <QtGlobal>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

using CartLink::Common::LevelName;
using CartLink::Common::LogEntry;
using CartLink::Common::Logger;
using CartLink::Common::LogLevel;

static std::unique_ptr<std::ofstream> g_logFile;
static bool g_mirrorEnabled = false;
static bool g_initialized = false;

static LogLevel parseLevel(const QString &s) {
  const QString v = s.trimmed().toLower();
  if (v == "debug")
    return LogLevel::Debug;
  if (v == "warn" || v == "warning")
    return LogLevel::Warning;
  if (v == "error")
    return LogLevel::Error;
  if (v == "fatal")
    return LogLevel::Fatal;
  return LogLevel::Info;
}

static std::string formatEntry(const LogEntry &e) {
  const QDateTime dt =
      QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(e.timestamp));

  // Single-line, grep-friendly format.
  // Example: 2026-03-02T09:41:07.512 [DEBUG] [Channel] >>> ADDR: B;16;4000
  const QString line = QString("%1 [%2] [%3] %4")
                           .arg(dt.toString(Qt::ISODateWithMs))
                           .arg(LevelName(e.level))
                           .arg(QString::fromStdString(e.category))
                           .arg(QString::fromStdString(e.message));
  return line.toStdString();
}

static void writeLineToSinks(const std::string &line, LogLevel level) {
  if (g_logFile && g_logFile->is_open()) {
    (*g_logFile) << line << '\n';
    g_logFile->flush();
  }

  if (g_mirrorEnabled) {
    std::ostream &out = (level >= LogLevel::Error) ? std::cerr : std::cout;
    out << line << std::endl;
  }
}

static LogLevel levelForQt(QtMsgType type) {
  switch (type) {
  case QtDebugMsg:
    return LogLevel::Debug;
  case QtWarningMsg:
    return LogLevel::Warning;
  case QtCriticalMsg:
    return LogLevel::Error;
  case QtFatalMsg:
    return LogLevel::Fatal;
  default:
    return LogLevel::Info;
  }
}

// QSerialPort reports driver and permission problems through qWarning.
static void qtMessageHandler(QtMsgType type, const QMessageLogContext &ctx,
                             const QString &msg) {
  std::string text = msg.toStdString();
  if (ctx.category && std::string(ctx.category) != "default") {
    text = std::string(ctx.category) + ": " + text;
  }
  Logger::Instance().Log(levelForQt(type), "Qt", text);
}

} // namespace

namespace CartLink::Common {

void InitAppLogging(const QString &logFilePath, bool forceMirror) {
  if (g_initialized)
    return;
  g_initialized = true;

  const bool append = (qEnvironmentVariableIntValue("CARTLINK_LOG_APPEND") != 0);
  g_mirrorEnabled =
      forceMirror || (qEnvironmentVariableIntValue("CARTLINK_LOG_MIRROR") != 0);

  if (!logFilePath.isEmpty()) {
    const QFileInfo fi(logFilePath);
    if (!fi.dir().exists() && !fi.path().isEmpty() && fi.path() != ".") {
      fi.dir().mkpath(".");
    }

    g_logFile = std::make_unique<std::ofstream>(
        logFilePath.toStdString(), append ? (std::ios::out | std::ios::app)
                                          : (std::ios::out | std::ios::trunc));
    Logger::Instance().SetLogFile(logFilePath.toStdString() + ".failure");
  }

  Logger::Instance().SetLevel(
      parseLevel(qEnvironmentVariable("CARTLINK_LOG_LEVEL")));

  Logger::Instance().SetCallback([](const LogEntry &e) {
    writeLineToSinks(formatEntry(e), e.level);
  });

  qInstallMessageHandler(qtMessageHandler);

  Logger::Instance().Log(LogLevel::Info, CartLink::Common::LogCategory::Main,
                         "Logging initialized: " + logFilePath.toStdString());
}

void ShutdownAppLogging() {
  if (!g_initialized)
    return;
  g_initialized = false;

  Logger::Instance().SetCallback(nullptr);
  qInstallMessageHandler(nullptr);

  if (g_logFile && g_logFile->is_open()) {
    g_logFile->flush();
    g_logFile->close();
  }
  g_logFile.reset();
}

} // namespace CartLink::Common
