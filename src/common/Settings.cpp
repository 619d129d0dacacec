#include "common/Settings.h"

#include "common/Loggable.h"

#include <QSettings>
#include <QString>
#include <QtGlobal>

namespace CartLink::Common {

namespace {

const char* kOrganization = "CartLink";
const char* kApplication = "Reader";

bool envFlag(const char* name, bool fallback) {
    if (!qEnvironmentVariableIsSet(name)) return fallback;
    return qEnvironmentVariableIntValue(name) != 0;
}

} // namespace

ReaderSettings ReaderSettings::Load() {
    ReaderSettings s;

    QSettings settings(kOrganization, kApplication);
    settings.beginGroup("Reader");
    s.portName = settings.value("Port", QString()).toString().toStdString();
    s.baudRate = settings.value("Baud", s.baudRate).toInt();
    const std::string storedChip =
        settings.value("FlashChip", QString(Cart::ToString(s.flashChip))).toString().toStdString();
    if (auto chip = Cart::ParseFlashChip(storedChip)) {
        s.flashChip = *chip;
    }
    s.traceCommands = settings.value("TraceCommands", false).toBool();
    s.traceProgress = settings.value("TraceProgress", false).toBool();
    settings.endGroup();

    if (qEnvironmentVariableIsSet("CARTLINK_PORT")) {
        s.portName = qEnvironmentVariable("CARTLINK_PORT").toStdString();
    }

    if (qEnvironmentVariableIsSet("CARTLINK_BAUD")) {
        bool ok = false;
        const int baud = qEnvironmentVariableIntValue("CARTLINK_BAUD", &ok);
        if (ok && baud > 0) {
            s.baudRate = baud;
        } else {
            Logger::Instance().Log(LogLevel::Warning, LogCategory::Main,
                                   "Ignoring invalid CARTLINK_BAUD value");
        }
    }

    if (qEnvironmentVariableIsSet("CARTLINK_FLASH_CHIP")) {
        const std::string name = qEnvironmentVariable("CARTLINK_FLASH_CHIP").toStdString();
        if (auto chip = Cart::ParseFlashChip(name)) {
            s.flashChip = *chip;
        } else {
            Logger::Instance().LogFmt(LogLevel::Warning, LogCategory::Main,
                                      "Unknown flash chip '%s', keeping %s",
                                      name.c_str(), Cart::ToString(s.flashChip));
        }
    }

    s.traceCommands = envFlag("CARTLINK_TRACE_COMMANDS", s.traceCommands);
    s.traceProgress = envFlag("CARTLINK_TRACE_PROGRESS", s.traceProgress);
    return s;
}

void ReaderSettings::Save() const {
    QSettings settings(kOrganization, kApplication);
    settings.beginGroup("Reader");
    settings.setValue("Port", QString::fromStdString(portName));
    settings.setValue("Baud", baudRate);
    settings.setValue("FlashChip", QString(Cart::ToString(flashChip)));
    settings.setValue("TraceCommands", traceCommands);
    settings.setValue("TraceProgress", traceProgress);
    settings.endGroup();
}

} // namespace CartLink::Common
