#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTimer>

#include <signal.h>

#include <iostream>
#include <string>

#include "cart/FlashChip.h"
#include "common/Loggable.h"
#include "common/Logging.h"
#include "common/Settings.h"
#include "io/SerialPortTransport.h"
#include "reader/ReaderController.h"

using CartLink::Common::Logger;
using CartLink::Common::LogLevel;
namespace LogCategory = CartLink::Common::LogCategory;
using namespace CartLink::Reader;

static volatile sig_atomic_t g_cancelRequested = 0;

static void HandleSignal(int) {
    g_cancelRequested = 1;
}

static bool ReadFile(const QString& path, ByteBuffer& out) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        std::cerr << "Cannot open " << path.toStdString() << ": " << file.errorString().toStdString() << std::endl;
        return false;
    }
    const QByteArray data = file.readAll();
    out.assign(data.begin(), data.end());
    return true;
}

static bool WriteFile(const QString& path, const ByteBuffer& data) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        std::cerr << "Cannot write " << path.toStdString() << ": " << file.errorString().toStdString() << std::endl;
        return false;
    }
    const qint64 written = file.write(reinterpret_cast<const char*>(data.data()), static_cast<qint64>(data.size()));
    return written == static_cast<qint64>(data.size());
}

static void PrintHeader(const CartLink::Cart::CartridgeHeader& header) {
    std::cout << "Title:      " << header.Title() << "\n"
              << "Controller: " << CartLink::Cart::ToString(header.Configuration()) << "\n"
              << "ROM:        " << header.RomSize() << " bytes (" << header.RomBankCount() << " banks)\n"
              << "RAM:        " << header.RamSize() << " bytes (" << header.RamBankCount() << " banks)\n"
              << "Checksum:   " << (header.IsChecksumValid() ? "ok" : "MISMATCH") << std::endl;
}

// Ends the event loop with 0 on success; failures also go to the failure log.
template <typename T>
static bool Finish(const std::string& command, const Result<T>& result) {
    if (result) return true;

    if (result.Cancelled()) {
        std::cerr << command << ": cancelled" << std::endl;
    } else {
        std::cerr << command << ": " << ToString(result.Error()) << std::endl;
        Logger::Instance().WriteFailureLog(command + ": " + ToString(result.Error()));
    }
    QCoreApplication::exit(1);
    return false;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("cartlink");
    app.setApplicationVersion("1.0");

    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    QCommandLineParser parser;
    parser.setApplicationDescription("Game Boy cartridge reader/writer for GBxCart-style serial adapters");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "header | dump-rom | dump-save | restore-save | flash");
    parser.addPositionalArgument("file", "Output file (dump-rom, dump-save) or input file (restore-save, flash)",
                                 "[file]");

    QCommandLineOption portOption(QStringList() << "p" << "port",
                                  "Serial device. Default: first port with the adapter's USB id.", "device");
    parser.addOption(portOption);

    QCommandLineOption baudOption(QStringList() << "b" << "baud", "Line speed.", "rate");
    parser.addOption(baudOption);

    QCommandLineOption flashOption(QStringList() << "flash-chip",
                                   "Flash chip on the cartridge for 'flash' (none, AM29F016B).", "chip");
    parser.addOption(flashOption);

    QCommandLineOption logOption(QStringList() << "l" << "log-file", "Log file path.", "path", "cartlink.log");
    parser.addOption(logOption);

    QCommandLineOption traceOption(QStringList() << "t" << "trace",
                                   "Log every wire command and transfer progress.");
    parser.addOption(traceOption);

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.at(0);
    const QString path = args.size() > 1 ? args.at(1) : QString();

    const bool needsFile = command != "header";
    if (needsFile && path.isEmpty()) {
        std::cerr << command.toStdString() << ": missing file argument" << std::endl;
        return 1;
    }

    CartLink::Common::InitAppLogging(parser.value(logOption));

    CartLink::Common::ReaderSettings settings = CartLink::Common::ReaderSettings::Load();
    if (parser.isSet(portOption)) settings.portName = parser.value(portOption).toStdString();
    if (parser.isSet(baudOption)) {
        bool ok = false;
        const int baud = parser.value(baudOption).toInt(&ok);
        if (!ok || baud <= 0) {
            std::cerr << "Invalid baud rate: " << parser.value(baudOption).toStdString() << std::endl;
            CartLink::Common::ShutdownAppLogging();
            return 1;
        }
        settings.baudRate = baud;
    }
    if (parser.isSet(flashOption)) {
        const auto chip = CartLink::Cart::ParseFlashChip(parser.value(flashOption).toStdString());
        if (!chip) {
            std::cerr << "Unknown flash chip: " << parser.value(flashOption).toStdString() << std::endl;
            CartLink::Common::ShutdownAppLogging();
            return 1;
        }
        settings.flashChip = *chip;
    }
    if (parser.isSet(traceOption)) {
        settings.traceCommands = true;
        settings.traceProgress = true;
        Logger::Instance().SetLevel(LogLevel::Debug);
    }

    Logger::Instance().LogFmt(LogLevel::Info, LogCategory::Main, "%s (port '%s', %d baud, flash chip %s)",
                              command.toStdString().c_str(), settings.portName.c_str(), settings.baudRate,
                              CartLink::Cart::ToString(settings.flashChip));

    CartLink::IO::SerialPortTransport transport(QString::fromStdString(settings.portName), settings.baudRate);
    ReaderController controller(transport, settings);

    const std::string name = command.toStdString();
    int lastPercent = -1;
    controller.SetProgressHandler([&lastPercent](OperationId, uint64_t done, uint64_t total) {
        if (total == 0) return;
        const int percent = static_cast<int>(done * 100 / total);
        if (percent != lastPercent) {
            lastPercent = percent;
            std::cerr << "\r" << percent << "%" << std::flush;
            if (done == total) std::cerr << std::endl;
        }
    });

    QTimer cancelPoll;
    QObject::connect(&cancelPoll, &QTimer::timeout, [&controller]() {
        if (g_cancelRequested) {
            g_cancelRequested = 0;
            controller.CancelAll();
        }
    });
    cancelPoll.start(100);

    // Started from the event loop so a synchronous failure can still exit it.
    QTimer::singleShot(0, [&]() {
        if (command == "header") {
            controller.ReadHeader([name](Result<CartLink::Cart::CartridgeHeader> result) {
                if (!Finish(name, result)) return;
                PrintHeader(result.Value());
                QCoreApplication::exit(0);
            });
        } else if (command == "dump-rom") {
            controller.ReadCartridge([name, path](Result<CartridgeDump> result) {
                if (!Finish(name, result)) return;
                PrintHeader(result.Value().header);
                QCoreApplication::exit(WriteFile(path, result.Value().rom) ? 0 : 1);
            });
        } else if (command == "dump-save") {
            controller.ReadSaveFile([name, path](Result<ByteBuffer> result) {
                if (!Finish(name, result)) return;
                QCoreApplication::exit(WriteFile(path, result.Value()) ? 0 : 1);
            });
        } else if (command == "restore-save" || command == "flash") {
            ByteBuffer data;
            if (!ReadFile(path, data)) {
                QCoreApplication::exit(1);
                return;
            }
            auto done = [name](Result<uint64_t> result) {
                if (!Finish(name, result)) return;
                std::cout << result.Value() << " bytes written" << std::endl;
                QCoreApplication::exit(0);
            };
            if (command == "flash") {
                controller.WriteFlashImage(std::move(data), done);
            } else {
                controller.WriteSaveFile(std::move(data), done);
            }
        } else {
            std::cerr << "Unknown command: " << name << std::endl;
            QCoreApplication::exit(1);
        }
    });

    const int rc = app.exec();
    controller.CancelAll();

    CartLink::Common::ShutdownAppLogging();
    return rc;
}
