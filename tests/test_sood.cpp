#include <QTest>
#include "roon_mpris/services/roon/sood.hpp"

using namespace roon_mpris::services;

namespace {

sood::Packet reply(const std::string& port) {
    sood::Packet packet;
    packet.type = sood::PacketType::Reply;
    packet.properties["service_id"] = std::string(sood::ROON_SERVICE_ID);
    packet.properties["http_port"] = port;
    packet.properties["unique_id"] = std::string("core-uuid");
    packet.properties["name"] = std::string("Study");
    return packet;
}

} // namespace

class TestSood : public QObject {
    Q_OBJECT
private slots:
    void testQueryWireFormat() {
        auto bytes = sood::encode_query("tid-1");

        QVERIFY(bytes.size() > 6);
        QCOMPARE(std::string(bytes.begin(), bytes.begin() + 4), std::string("SOOD"));
        QCOMPARE(bytes[4], std::uint8_t{2});
        QCOMPARE(bytes[5], std::uint8_t{'Q'});

        auto packet = sood::decode(bytes.data(), bytes.size());
        QVERIFY(packet.has_value());
        QCOMPARE(packet->type, sood::PacketType::Query);
        QCOMPARE(*packet->properties.at("query_service_id"), std::string(sood::ROON_SERVICE_ID));
        QCOMPARE(*packet->properties.at("_tid"), std::string("tid-1"));
    }

    void testPropertyEncoding() {
        sood::Packet packet;
        packet.type = sood::PacketType::Reply;
        packet.properties["ab"] = std::string("xyz");

        auto bytes = sood::encode(packet);
        const std::vector<std::uint8_t> expected = {
            'S', 'O', 'O', 'D', 2, 'R', 2, 'a', 'b', 0x00, 0x03, 'x', 'y', 'z'};
        QCOMPARE(bytes, expected);
    }

    void testNullValue() {
        sood::Packet packet;
        packet.type = sood::PacketType::Reply;
        packet.properties["k"] = std::nullopt;

        auto bytes = sood::encode(packet);
        QCOMPARE(bytes.size(), std::size_t{6 + 1 + 1 + 2});
        QCOMPARE(bytes[8], std::uint8_t{0xFF});
        QCOMPARE(bytes[9], std::uint8_t{0xFF});

        auto decoded = sood::decode(bytes.data(), bytes.size());
        QVERIFY(decoded.has_value());
        QVERIFY(decoded->properties.contains("k"));
        QVERIFY(!decoded->properties.at("k").has_value());
    }

    void testDecodeRejectsGarbage() {
        const std::vector<std::uint8_t> bad_magic = {'S', 'O', 'D', 'O', 2, 'R'};
        const std::vector<std::uint8_t> bad_version = {'S', 'O', 'O', 'D', 1, 'R'};
        const std::vector<std::uint8_t> bad_type = {'S', 'O', 'O', 'D', 2, 'X'};
        const std::vector<std::uint8_t> truncated = {'S', 'O', 'O', 'D', 2, 'R', 4, 'a', 'b'};
        const std::vector<std::uint8_t> short_value = {'S', 'O', 'O', 'D', 2, 'R', 1, 'a', 0x00, 0x05, 'x'};

        QVERIFY(!sood::decode(bad_magic.data(), bad_magic.size()));
        QVERIFY(!sood::decode(bad_version.data(), bad_version.size()));
        QVERIFY(!sood::decode(bad_type.data(), bad_type.size()));
        QVERIFY(!sood::decode(truncated.data(), truncated.size()));
        QVERIFY(!sood::decode(short_value.data(), short_value.size()));
        QVERIFY(!sood::decode(bad_magic.data(), 3));
    }

    void testEndpointFromReply() {
        auto endpoint = sood::endpoint_from_reply(reply("9330"), "192.168.1.20");

        QVERIFY(endpoint.has_value());
        QCOMPARE(endpoint->host, std::string("192.168.1.20"));
        QCOMPARE(endpoint->http_port, std::uint16_t{9330});
        QCOMPARE(endpoint->unique_id, std::string("core-uuid"));
        QCOMPARE(endpoint->display_name, std::string("Study"));
    }

    void testEndpointRejectsOtherServices() {
        auto packet = reply("9330");
        packet.properties["service_id"] = std::string("something-else");
        QVERIFY(!sood::endpoint_from_reply(packet, "h"));

        auto query = reply("9330");
        query.type = sood::PacketType::Query;
        QVERIFY(!sood::endpoint_from_reply(query, "h"));
    }

    void testEndpointRejectsBadPort() {
        QVERIFY(!sood::endpoint_from_reply(reply("0"), "h"));
        QVERIFY(!sood::endpoint_from_reply(reply("70000"), "h"));
        QVERIFY(!sood::endpoint_from_reply(reply("93x"), "h"));

        auto missing = reply("9330");
        missing.properties.erase("http_port");
        QVERIFY(!sood::endpoint_from_reply(missing, "h"));
    }
};

QTEST_MAIN(TestSood)
#include "test_sood.moc"
