#include "roon_mpris/services/roon/sood_discovery.hpp"
#include "roon_mpris/utils/logger.hpp"
#include "roon_mpris/utils/uuid.hpp"
#include <QHostAddress>
#include <QNetworkDatagram>
#include <QTimer>
#include <QUdpSocket>

namespace roon_mpris::services {

namespace {
    constexpr std::string_view COMPONENT = "SoodDiscovery";
}

SoodDiscovery::SoodDiscovery(std::chrono::milliseconds interval)
    : m_interval(interval) {
}

SoodDiscovery::~SoodDiscovery() {
    m_timer.reset();
    m_socket.reset();
}

void SoodDiscovery::set_core_found_callback(CoreFoundCallback callback) {
    m_on_core_found = std::move(callback);
}

bool SoodDiscovery::start() {
    if (is_running()) {
        return true;
    }

    m_socket = std::make_unique<QUdpSocket>();
    if (!m_socket->bind(QHostAddress(QHostAddress::AnyIPv4), 0)) {
        LOG_ERROR(COMPONENT, "Failed to bind discovery socket: " + m_socket->errorString().toStdString());
        m_socket.reset();
        return false;
    }
    m_socket->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    QObject::connect(m_socket.get(), &QUdpSocket::readyRead, [this]() { read_datagrams(); });

    m_timer = std::make_unique<QTimer>();
    m_timer->setInterval(static_cast<int>(m_interval.count()));
    QObject::connect(m_timer.get(), &QTimer::timeout, [this]() { send_query(); });
    m_timer->start();

    LOG_INFO(COMPONENT, "Searching for Roon cores");
    send_query();
    return true;
}

void SoodDiscovery::stop() {
    if (!is_running()) {
        return;
    }

    // May run from inside readyRead, so the socket is released to the event loop
    m_timer->stop();
    m_timer.release()->deleteLater();
    m_socket->close();
    m_socket.release()->deleteLater();
    LOG_DEBUG(COMPONENT, "Discovery stopped");
}

bool SoodDiscovery::is_running() const {
    return m_socket != nullptr;
}

void SoodDiscovery::send_query() {
    m_transaction_id = utils::Uuid::generate_v4().to_string();
    auto packet = sood::encode_query(m_transaction_id);
    QByteArray datagram(reinterpret_cast<const char*>(packet.data()), static_cast<qsizetype>(packet.size()));

    const QHostAddress targets[] = {
        QHostAddress(QString::fromStdString(std::string(sood::MULTICAST_ADDRESS))),
        QHostAddress(QHostAddress::Broadcast)
    };
    for (const auto& target : targets) {
        if (m_socket->writeDatagram(datagram, target, sood::PORT) < 0) {
            LOG_DEBUG(COMPONENT, "Query to " + target.toString().toStdString() + " failed: " +
                      m_socket->errorString().toStdString());
        }
    }
}

void SoodDiscovery::read_datagrams() {
    while (m_socket && m_socket->hasPendingDatagrams()) {
        QNetworkDatagram datagram = m_socket->receiveDatagram();
        const QByteArray data = datagram.data();

        auto packet = sood::decode(reinterpret_cast<const std::uint8_t*>(data.constData()),
                                   static_cast<std::size_t>(data.size()));
        if (!packet) {
            continue;
        }

        QHostAddress sender = datagram.senderAddress();
        bool is_ipv4 = false;
        quint32 ipv4 = sender.toIPv4Address(&is_ipv4);
        std::string host = is_ipv4 ? QHostAddress(ipv4).toString().toStdString()
                                   : sender.toString().toStdString();

        auto endpoint = sood::endpoint_from_reply(*packet, host);
        if (!endpoint) {
            continue;
        }

        LOG_INFO(COMPONENT, "Found core " + endpoint->display_name + " at " + endpoint->host + ":" +
                 std::to_string(endpoint->http_port));
        if (m_on_core_found) {
            m_on_core_found(*endpoint);
        }
    }
}

} // namespace roon_mpris::services
