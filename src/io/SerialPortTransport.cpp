#include "io/SerialPortTransport.h"

#include "common/Loggable.h"

#include <QSerialPortInfo>

namespace CartLink::IO {

using Common::Logger;
using Common::LogLevel;
namespace LogCategory = Common::LogCategory;

SerialPortTransport::SerialPortTransport(const QString& portName, qint32 baudRate, QObject* parent)
    : QObject(parent), requestedName_(portName), baudRate_(baudRate) {
    QObject::connect(&port_, &QSerialPort::readyRead, this, &SerialPortTransport::onReadyRead);
    QObject::connect(&port_, &QSerialPort::errorOccurred, this, &SerialPortTransport::onErrorOccurred);
}

SerialPortTransport::~SerialPortTransport() {
    Close();
}

QString SerialPortTransport::FindAdapterPort() {
    const auto ports = QSerialPortInfo::availablePorts();
    for (const QSerialPortInfo& info : ports) {
        if (info.hasVendorIdentifier() && info.hasProductIdentifier() &&
            info.vendorIdentifier() == kVendorId && info.productIdentifier() == kProductId) {
            return info.portName();
        }
    }
    return QString();
}

bool SerialPortTransport::Open() {
    if (port_.isOpen()) return true;

    QString name = requestedName_;
    if (name.isEmpty()) {
        name = FindAdapterPort();
        if (name.isEmpty()) {
            Logger::Instance().Log(LogLevel::Error, LogCategory::Serial, "No adapter found (USB 1A86:7523)");
            return false;
        }
    }

    port_.setPortName(name);
    port_.setBaudRate(baudRate_);
    port_.setDataBits(QSerialPort::Data8);
    port_.setParity(QSerialPort::NoParity);
    port_.setStopBits(QSerialPort::OneStop);
    port_.setFlowControl(QSerialPort::NoFlowControl);

    if (!port_.open(QIODevice::ReadWrite)) {
        Logger::Instance().LogFmt(LogLevel::Error, LogCategory::Serial, "Failed to open %s: %s",
                                  name.toStdString().c_str(),
                                  port_.errorString().toStdString().c_str());
        return false;
    }

    Logger::Instance().LogFmt(LogLevel::Debug, LogCategory::Serial, "Opened %s at %d baud",
                              name.toStdString().c_str(), baudRate_);
    return true;
}

void SerialPortTransport::Close() {
    if (!port_.isOpen()) return;
    port_.clear();
    port_.close();
    Logger::Instance().Log(LogLevel::Debug, LogCategory::Serial, "Closed " + port_.portName().toStdString());
}

bool SerialPortTransport::IsOpen() const {
    return port_.isOpen();
}

bool SerialPortTransport::Send(const std::vector<uint8_t>& bytes) {
    if (!port_.isOpen()) return false;
    if (bytes.empty()) return true;

    const qint64 written = port_.write(reinterpret_cast<const char*>(bytes.data()),
                                       static_cast<qint64>(bytes.size()));
    if (written != static_cast<qint64>(bytes.size())) {
        Logger::Instance().LogFmt(LogLevel::Error, LogCategory::Serial, "Short write (%lld of %zu bytes)",
                                  static_cast<long long>(written), bytes.size());
        return false;
    }
    // Settling delays between commands are measured from the wire, so push now.
    port_.flush();
    return true;
}

void SerialPortTransport::onReadyRead() {
    const QByteArray data = port_.readAll();
    if (data.isEmpty()) return;
    DeliverBytes(std::vector<uint8_t>(data.begin(), data.end()));
}

void SerialPortTransport::onErrorOccurred(QSerialPort::SerialPortError error) {
    if (error == QSerialPort::NoError) return;
    Logger::Instance().LogFmt(LogLevel::Warning, LogCategory::Serial, "Port error %d: %s",
                              static_cast<int>(error),
                              port_.errorString().toStdString().c_str());
}

} // namespace CartLink::IO
