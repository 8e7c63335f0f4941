#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>

#include "ferry/core/events.hpp"
#include "ferry/db/session_store.hpp"
#include "ferry/net/router.hpp"
#include "ferry/net/server.hpp"
#include "ferry/protocol/engine.hpp"
#include "ferry/security/access_gate.hpp"
#include "ferry/storage/fs_backend.hpp"
#include "test_support.hpp"

using namespace ferry::core;
using namespace ferry::net;
namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {
    constexpr const char* kLoopback = "127.0.0.1";
    constexpr const char* kClipMetadata = "filename Y2xpcC5tcDQ=,filetype dmlkZW8vbXA0";

    // Holds a loopback port for the lifetime of the object.
    class PortHolder {
    public:
        PortHolder() : acceptor_(ioc_, tcp::endpoint{asio::ip::make_address(kLoopback), 0}) {}
        [[nodiscard]] u16 port() const { return acceptor_.local_endpoint().port(); }

    private:
        asio::io_context ioc_;
        tcp::acceptor acceptor_;
    };

    class ServerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ASSERT_TRUE(is_ok(store_.open(":memory:")));
            ferry::storage::FsBackendConfig bcfg;
            bcfg.root = dir_.path();
            fs_ = std::make_unique<ferry::storage::FsStorageBackend>(bcfg);
            ASSERT_TRUE(is_ok(fs_->init()));
            ferry::protocol::EngineConfig cfg;
            cfg.single_active_upload = false;
            engine_ = std::make_unique<ferry::protocol::ProtocolEngine>(store_, *fs_, events_, cfg);
            RouterDeps deps;
            deps.engine = engine_.get();
            deps.gate = &gate_;
            deps.backend = fs_.get();
            router_ = std::make_unique<RequestRouter>(deps);
        }

        ServerConfig config(std::vector<u16> ports) const {
            ServerConfig cfg;
            cfg.bind_address = kLoopback;
            cfg.ports = std::move(ports);
            cfg.worker_threads = 2;
            cfg.chunk_buffer_bytes = 4096;
            return cfg;
        }

        ferry::test::TempDir dir_;
        EventBus events_;
        ferry::db::SessionStore store_;
        ferry::security::AccessGate gate_;
        std::unique_ptr<ferry::storage::FsStorageBackend> fs_;
        std::unique_ptr<ferry::protocol::ProtocolEngine> engine_;
        std::unique_ptr<RequestRouter> router_;
    };

    // Blocking client for one request per connection.
    class Client {
    public:
        explicit Client(u16 port) : socket_(ioc_) {
            socket_.connect(tcp::endpoint{asio::ip::make_address(kLoopback), port});
        }

        Response send(Request req) {
            req.set(http::field::host, kLoopback);
            req.prepare_payload();
            http::write(socket_, req);
            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            parser.skip(req.method() == http::verb::head);
            http::read(socket_, buffer, parser);
            return parser.release();
        }

        tcp::socket& socket() { return socket_; }

    private:
        asio::io_context ioc_;
        tcp::socket socket_;
    };

    Request make_request(http::verb verb, const std::string& target) {
        Request req{verb, target, 11};
        req.set("Tus-Resumable", "1.0.0");
        return req;
    }

    std::string header(const Response& res, const char* name) {
        auto it = res.find(name);
        return it == res.end() ? std::string{} : std::string(it->value().data(), it->value().size());
    }

    std::string create_upload(u16 port, u64 length) {
        Request req = make_request(http::verb::post, "/files");
        req.set("Upload-Length", std::to_string(length));
        req.set("Upload-Metadata", kClipMetadata);
        Client client(port);
        const Response res = client.send(std::move(req));
        EXPECT_EQ(res.result(), http::status::created) << res.body();
        return header(res, "Location");
    }

    std::string query_offset(u16 port, const std::string& location) {
        Client client(port);
        const Response res = client.send(make_request(http::verb::head, location));
        return header(res, "Upload-Offset");
    }
} // namespace

TEST_F(ServerTest, FallsBackToNextFreePort) {
    PortHolder busy;
    TransferServer server(config({busy.port(), 0}), *router_);
    u16 bound = 0;
    ASSERT_TRUE(is_ok(server.start(&bound)));
    EXPECT_NE(bound, busy.port());
    EXPECT_NE(bound, 0);
    EXPECT_EQ(server.port(), bound);
    EXPECT_TRUE(server.running());
    server.stop();
    EXPECT_FALSE(server.running());
}

TEST_F(ServerTest, FailsWhenEveryPortIsTaken) {
    PortHolder a;
    PortHolder b;
    TransferServer server(config({a.port(), b.port()}), *router_);
    u16 bound = 0;
    const Status s = server.start(&bound);
    EXPECT_EQ(s.code, StatusCode::AddressInUse);
    EXPECT_EQ(s.domain, StatusDomain::Net);
    EXPECT_FALSE(server.running());
}

TEST_F(ServerTest, StreamsUploadOverSocket) {
    TransferServer server(config({0}), *router_);
    u16 port = 0;
    ASSERT_TRUE(is_ok(server.start(&port)));

    const auto data = ferry::test::pattern_bytes(20000, 5);
    const std::string location = create_upload(port, data.size());
    ASSERT_FALSE(location.empty());

    Request req = make_request(http::verb::patch, location);
    req.set("Upload-Offset", "0");
    req.set(http::field::content_type, "application/offset+octet-stream");
    req.body().assign(reinterpret_cast<const char*>(data.data()), data.size());
    Client client(port);
    const Response res = client.send(std::move(req));
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_EQ(header(res, "Upload-Offset"), "20000");

    const std::string committed = ferry::test::read_file(fs_->media_root() + "/clip.mp4");
    ASSERT_EQ(committed.size(), data.size());
    EXPECT_EQ(0, std::memcmp(committed.data(), data.data(), data.size()));

    Client status(port);
    const Response st = status.send(make_request(http::verb::get, "/api/status"));
    EXPECT_EQ(st.result(), http::status::ok);
    EXPECT_NE(st.body().find("\"port\":" + std::to_string(port)), std::string::npos);
    server.stop();
}

TEST_F(ServerTest, DroppedConnectionKeepsReceivedBytes) {
    TransferServer server(config({0}), *router_);
    u16 port = 0;
    ASSERT_TRUE(is_ok(server.start(&port)));

    const auto data = ferry::test::pattern_bytes(10000, 6);
    const std::string location = create_upload(port, data.size());

    {
        Client client(port);
        std::string head = "PATCH " + location + " HTTP/1.1\r\n"
                           "Host: 127.0.0.1\r\n"
                           "Tus-Resumable: 1.0.0\r\n"
                           "Upload-Offset: 0\r\n"
                           "Content-Type: application/offset+octet-stream\r\n"
                           "Content-Length: 10000\r\n\r\n";
        asio::write(client.socket(), asio::buffer(head));
        asio::write(client.socket(), asio::buffer(data.data(), 3000));
        // Give the server a moment to read before the connection drops.
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        beast::error_code ec;
        client.socket().shutdown(tcp::socket::shutdown_both, ec);
        client.socket().close(ec);
    }

    std::string offset;
    for (int i = 0; i < 100; ++i) {
        offset = query_offset(port, location);
        if (offset == "3000") {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(offset, "3000");

    // Resume from where the server says it stopped.
    Request req = make_request(http::verb::patch, location);
    req.set("Upload-Offset", "3000");
    req.set(http::field::content_type, "application/offset+octet-stream");
    req.body().assign(reinterpret_cast<const char*>(data.data()) + 3000, data.size() - 3000);
    Client client(port);
    const Response res = client.send(std::move(req));
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_EQ(header(res, "Upload-Offset"), "10000");
    EXPECT_EQ(ferry::test::read_file(fs_->media_root() + "/clip.mp4").size(), data.size());
    server.stop();
}

TEST_F(ServerTest, RejectsMismatchedOffsetBeforeReadingBody) {
    TransferServer server(config({0}), *router_);
    u16 port = 0;
    ASSERT_TRUE(is_ok(server.start(&port)));
    const std::string location = create_upload(port, 100);

    Request req = make_request(http::verb::patch, location);
    req.set("Upload-Offset", "50");
    req.set(http::field::content_type, "application/offset+octet-stream");
    req.body() = std::string(50, 'x');
    Client client(port);
    const Response res = client.send(std::move(req));
    EXPECT_EQ(res.result(), http::status::conflict);
    EXPECT_EQ(header(res, "Upload-Offset"), "0");
    server.stop();
}
