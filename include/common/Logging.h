#pragma once

#include <QString>

namespace CartLink::Common {

/**
 * @brief Initializes application-wide logging for the reader tool.
 *
 * Routes two log sources into a single sink:
 *
 * - `CartLink::Common::Logger` entries (channel, reader, queue, serial)
 * - Qt message output (QtSerialPort warnings, qWarning/qCritical) via
 *   `qInstallMessageHandler`
 *
 * Logs are written to one file and can be mirrored to the console.
 *
 * Configuration (environment variables):
 * - `CARTLINK_LOG_MIRROR=1` mirrors output to stdout/stderr.
 * - `CARTLINK_LOG_APPEND=1` appends to the log file instead of truncating.
 * - `CARTLINK_LOG_LEVEL=debug|info|warn|error|fatal` sets minimum log level.
 *
 * @param logFilePath Destination file. An empty path disables the file sink.
 * @param forceMirror Mirror to the console regardless of `CARTLINK_LOG_MIRROR`.
 */
void InitAppLogging(const QString& logFilePath, bool forceMirror = false);

/**
 * @brief Flushes and closes the file sink.
 *
 * Safe to call multiple times.
 */
void ShutdownAppLogging();

} // namespace CartLink::Common
