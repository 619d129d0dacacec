#pragma once

#include "io/Transport.h"

#include <QObject>
#include <QSerialPort>
#include <QString>

namespace CartLink::IO {

/**
 * @brief Transport over a QSerialPort (8N1, no flow control).
 *
 * Bytes are delivered from `readyRead`, i.e. on the thread that owns this
 * object, which must run a Qt event loop.
 */
class SerialPortTransport final : public QObject, public Transport {
    Q_OBJECT

  public:
    // USB id of the adapter's CH340 bridge
    static constexpr quint16 kVendorId = 0x1A86;
    static constexpr quint16 kProductId = 0x7523;

    /**
     * @param portName Device name (e.g. "ttyUSB0"); empty selects FindAdapterPort().
     * @param baudRate Line speed.
     */
    SerialPortTransport(const QString& portName, qint32 baudRate, QObject* parent = nullptr);
    ~SerialPortTransport() override;

    /** @brief First port whose USB id matches the adapter; empty if none. */
    static QString FindAdapterPort();

    bool Open() override;
    void Close() override;
    bool IsOpen() const override;
    bool Send(const std::vector<uint8_t>& bytes) override;

    [[nodiscard]] QString PortName() const { return port_.portName(); }

  private slots:
    void onReadyRead();
    void onErrorOccurred(QSerialPort::SerialPortError error);

  private:
    QSerialPort port_;
    QString requestedName_;
    qint32 baudRate_;
};

} // namespace CartLink::IO
